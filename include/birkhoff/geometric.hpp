#pragma once

/// @file include/birkhoff/geometric.hpp
/// @brief Discrete geometry of a curve under the Maupertuis metric.
///
/// # Module: Geometric
///
/// ## Responsibility
/// Given node positions x₀…x_{N−1} and metric samples, compute:
///   - segment lengths ℓ_i = ‖x_{i+1} − x_i‖_M
///   - the discretised action L = Σ_i ā_i ℓ_i, where ā_i is the quadrature
///     estimate of a = √(2(E − V)) on segment i
///   - ∂L/∂x_i for every interior node
///   - discrete curvature and the arc-length reparametrisation that keeps
///     nodes from clustering.
///
/// ## Sample layout
/// | Rule        | `samples` holds                                  |
/// |-------------|--------------------------------------------------|
/// | Trapezoidal | one sample per node (size N)                      |
/// | Midpoint    | one sample per segment midpoint (size N − 1)      |
///
/// All functions are pure; sizes are checked and mismatches throw
/// `ShapeError`.

#include "birkhoff/types.hpp"

#include <cstddef>
#include <span>
#include <vector>

namespace birkhoff::geometric {

using NodeList = std::vector<Configuration>;

/// ‖b − a‖_M
[[nodiscard]] double segment_length(const Configuration& a, const Configuration& b,
                                    const MassWeights& masses);

/// ℓ_i for every segment (size N − 1).
[[nodiscard]] std::vector<double> segment_lengths(std::span<const Configuration> nodes,
                                                  const MassWeights& masses);

/// Midpoints ½(x_i + x_{i+1}) of every segment.
[[nodiscard]] NodeList segment_midpoints(std::span<const Configuration> nodes);

/// Number of samples a rule needs for a curve of `node_count` nodes.
[[nodiscard]] std::size_t sample_count(QuadratureRule rule, std::size_t node_count) noexcept;

/// Action contributed by segment i under the given rule.
[[nodiscard]] double segment_action(std::span<const Configuration> nodes,
                                    std::span<const MetricSample> samples,
                                    std::size_t segment, QuadratureRule rule,
                                    const MassWeights& masses);

/// Discretised Maupertuis action L = Σ segment_action(i).
[[nodiscard]] double functional(std::span<const Configuration> nodes,
                                std::span<const MetricSample> samples,
                                QuadratureRule rule, const MassWeights& masses);

/// ∂L/∂x_i for the interior nodes i = 1 … N − 2 (result size N − 2).
///
/// Degenerate segments (ℓ below `MIN_SEGMENT_LENGTH`) contribute no
/// direction term.
[[nodiscard]] std::vector<Displacement>
functional_gradient(std::span<const Configuration> nodes,
                    std::span<const MetricSample> samples,
                    QuadratureRule rule, const MassWeights& masses);

/// Turning of the unit tangent per unit length at interior node i:
///   κ_i = ‖t_i − t_{i−1}‖_M / (½(ℓ_{i−1} + ℓ_i)),  t_j = (x_{j+1} − x_j)/ℓ_j.
///
/// Returns 0 when either adjacent segment is degenerate.
[[nodiscard]] double curvature(std::span<const Configuration> nodes, std::size_t i,
                               const MassWeights& masses);

/// Interior node with the largest curvature; ties resolve to the lowest
/// index. Requires at least one interior node.
[[nodiscard]] std::size_t max_curvature_node(std::span<const Configuration> nodes,
                                             const MassWeights& masses);

/// Interior node with the smallest curvature; ties resolve to the lowest
/// index. Requires at least one interior node.
[[nodiscard]] std::size_t min_curvature_node(std::span<const Configuration> nodes,
                                             const MassWeights& masses);

/// max ℓ_i / min ℓ_i. Infinity if any segment is degenerate.
[[nodiscard]] double spacing_ratio(std::span<const Configuration> nodes,
                                   const MassWeights& masses);

/// Redistribute the interior nodes at equal mass-weighted arc length along
/// the current polyline. The node count is unchanged and the first and last
/// nodes are copied bit for bit.
[[nodiscard]] NodeList reparametrize(std::span<const Configuration> nodes,
                                     const MassWeights& masses);

} // namespace birkhoff::geometric
