#pragma once

/// @file include/birkhoff/types.hpp
/// @brief Shared primitive types for the Birkhoff geodesic engine.
///
/// Every module includes this file. It defines the Eigen-based configuration
/// vectors and the value types exchanged between the potential oracle, the
/// metric layer and the curve.

#include <Eigen/Dense>
#include <cstddef>
#include <cstdint>
#include <vector>

namespace birkhoff {

// ─── Linear Algebra Aliases ───────────────────────────────────────────────────

/// A point in configuration space ℝ^d (all atomic coordinates, flattened).
using Configuration = Eigen::VectorXd;

/// A tangent or gradient vector in configuration space.
using Displacement = Eigen::VectorXd;

/// Diagonal of the mass matrix, one entry per configuration coordinate.
using MassWeights = Eigen::VectorXd;

/// Stable identity of a curve node. Survives insertion and removal of others.
using NodeId = std::uint64_t;

// ─── Oracle Output ────────────────────────────────────────────────────────────

/// Result of one potential evaluation: V(x) and ∇V(x).
struct PotentialValue {
    double        energy;    ///< V(x)
    Displacement  gradient;  ///< ∇V(x), same size as x
};

// ─── MetricSample ─────────────────────────────────────────────────────────────

/// Metric data cached on a curve node.
///
/// The conformal factor g(x) = 2(E − V(x)) multiplies the mass matrix; the
/// line element is a(x)·‖dx‖_M with a = √g.
struct MetricSample {
    Configuration position;   ///< x at which the sample was taken
    double        potential;  ///< V(x)
    Displacement  grad_potential; ///< ∇V(x)
    double        metric;     ///< g(x) = 2(E − V(x))
    Displacement  grad_metric;    ///< ∇g(x) = −2∇V(x)
    double        speed;      ///< a(x) = √g(x)
    Displacement  grad_speed; ///< ∇a(x) = −∇V(x) / a(x)
};

/// Quadrature used to integrate a(x)·‖dx‖ over one segment.
enum class QuadratureRule {
    Trapezoidal,  ///< ½(a(x_i) + a(x_{i+1}))·ℓ_i
    Midpoint,     ///< a((x_i + x_{i+1})/2)·ℓ_i
};

/// Degrees of freedom the optimizer moves each interior node along.
enum class SearchSpace {
    Full,        ///< all d coordinates
    Orthogonal,  ///< the d − 1 directions orthogonal to the chord
};

[[nodiscard]] const char* to_string(QuadratureRule rule) noexcept;
[[nodiscard]] const char* to_string(SearchSpace space) noexcept;

} // namespace birkhoff
