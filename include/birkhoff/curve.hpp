#pragma once

/// @file include/birkhoff/curve.hpp
/// @brief The discretised curve: ordered nodes with fixed endpoints and
///        per-node cached metric samples.
///
/// # Module: Curve
///
/// ## Invariants
/// - Node 0 and node N − 1 never move. Every mutation entry point rejects
///   them with `BoundaryViolationError`.
/// - The dimension d is fixed at construction.
/// - A cached sample always belongs to the node's current position. Moving a
///   node drops its sample and the samples of both adjacent segments;
///   attaching a sample taken elsewhere is refused.
///
/// ## Example
/// ```cpp
/// auto curve = Curve::initialize(a, b, 5);
/// curve.perturb(2, delta);              // drops node 2's sample
/// for (const auto& req : curve.missing_samples(QuadratureRule::Trapezoidal))
///     ...                                // evaluate, then attach
/// auto L = curve.functional_value(QuadratureRule::Trapezoidal, masses);
/// ```

#include "birkhoff/types.hpp"

#include <cstddef>
#include <optional>
#include <vector>

namespace birkhoff {

/// One node of the curve.
struct CurveNode {
    NodeId                      id;
    Configuration               position;
    std::optional<MetricSample> sample;
};

/// A point at which the curve needs a metric sample.
struct SampleRequest {
    enum class Site { Node, SegmentMidpoint };

    Site          site;
    std::size_t   index;     ///< node index or segment index
    Configuration position;
    bool          boundary;  ///< true for the fixed endpoints
};

class Curve {
public:
    /// Evenly spaced straight line from `a` to `b` with `n_nodes` nodes
    /// including both endpoints.
    ///
    /// # Errors
    /// `ShapeError` if `a` and `b` differ in size, `std::invalid_argument` if
    /// `n_nodes < 2` or the dimension is zero.
    [[nodiscard]] static Curve initialize(const Configuration& a, const Configuration& b,
                                          std::size_t n_nodes);

    /// Curve through the given nodes, e.g. a previous solution.
    [[nodiscard]] static Curve from_nodes(const std::vector<Configuration>& nodes);

    // ── Queries ──────────────────────────────────────────────────────────────

    [[nodiscard]] std::size_t size() const noexcept { return nodes_.size(); }
    [[nodiscard]] std::size_t interior_count() const noexcept { return nodes_.size() - 2; }
    [[nodiscard]] Eigen::Index dimension() const noexcept { return dimension_; }
    [[nodiscard]] bool is_endpoint(std::size_t i) const noexcept {
        return i == 0 || i + 1 == nodes_.size();
    }

    [[nodiscard]] const CurveNode& node(std::size_t i) const;
    [[nodiscard]] const Configuration& position(std::size_t i) const;
    [[nodiscard]] std::vector<Configuration> positions() const;

    [[nodiscard]] const std::optional<MetricSample>& sample(std::size_t i) const;
    [[nodiscard]] const std::optional<MetricSample>& segment_sample(std::size_t j) const;

    // ── Mutation ─────────────────────────────────────────────────────────────

    /// x_i ← x_i + delta.
    ///
    /// # Errors
    /// `BoundaryViolationError` for an endpoint, `std::out_of_range` for a bad
    /// index, `ShapeError` if `delta` has the wrong size.
    void perturb(std::size_t i, const Displacement& delta);

    /// x_i ← x. Same errors as `perturb`. Setting the current position keeps
    /// the cached sample.
    void set_position(std::size_t i, const Configuration& x);

    /// Insert the midpoints of both segments adjacent to the interior node of
    /// largest curvature (lowest index on ties).
    ///
    /// # Returns
    /// Index of the refined node before insertion.
    std::size_t refine(const MassWeights& masses);

    /// Insert a midpoint into every segment (N → 2N − 1 nodes).
    void refine_uniform();

    /// Remove the interior node of smallest curvature (lowest index on ties).
    ///
    /// # Returns
    /// Index of the removed node, or `nullopt` if the curve has at most one
    /// interior node.
    std::optional<std::size_t> coarsen(const MassWeights& masses);

    // ── Samples ──────────────────────────────────────────────────────────────

    /// Points lacking a sample for the given rule, in node/segment order.
    [[nodiscard]] std::vector<SampleRequest> missing_samples(QuadratureRule rule) const;

    /// Cache a node sample. Refused (`std::invalid_argument`) unless
    /// `sample.position` equals the node's position exactly.
    void attach_sample(std::size_t i, MetricSample sample);

    /// Cache a segment-midpoint sample. Refused unless the position equals
    /// ½(x_j + x_{j+1}) exactly.
    void attach_segment_sample(std::size_t j, MetricSample sample);

    void attach(const SampleRequest& request, MetricSample sample);

    /// Drop every cached sample.
    void invalidate_samples() noexcept;

    /// Samples in the layout `geometric::functional` expects, or `nullopt` if
    /// any is missing.
    [[nodiscard]] std::optional<std::vector<MetricSample>>
    samples_for(QuadratureRule rule) const;

    /// Discretised Maupertuis action, or `nullopt` if samples are missing.
    [[nodiscard]] std::optional<double>
    functional_value(QuadratureRule rule, const MassWeights& masses) const;

    /// ∂L/∂x_i for the interior nodes, or `nullopt` if samples are missing.
    [[nodiscard]] std::optional<std::vector<Displacement>>
    functional_gradient(QuadratureRule rule, const MassWeights& masses) const;

private:
    Curve() = default;

    void check_interior(std::size_t i, const char* where) const;
    void insert_after(std::size_t i, Configuration x);
    void reset_segment_samples();

    std::vector<CurveNode>                   nodes_;
    std::vector<std::optional<MetricSample>> segment_samples_;
    Eigen::Index                             dimension_ = 0;
    NodeId                                   next_id_   = 0;
};

} // namespace birkhoff
