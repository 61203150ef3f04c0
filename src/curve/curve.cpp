/// @file src/curve/curve.cpp
/// @brief Node storage, endpoint protection and sample cache of the curve.

#include "birkhoff/curve.hpp"
#include "birkhoff/errors.hpp"
#include "birkhoff/geometric.hpp"
#include "birkhoff/linalg.hpp"

#include <fmt/format.h>

#include <stdexcept>

namespace birkhoff {

namespace {

bool same_position(const Configuration& a, const Configuration& b) {
    return a.size() == b.size() && (a.array() == b.array()).all();
}

} // namespace

// ─── Construction ─────────────────────────────────────────────────────────────

Curve Curve::initialize(const Configuration& a, const Configuration& b,
                        std::size_t n_nodes) {
    linalg::require_size("Curve::initialize", a.size(), b.size());
    if (n_nodes < 2) {
        throw std::invalid_argument("Curve::initialize: need at least two nodes");
    }

    std::vector<Configuration> nodes;
    nodes.reserve(n_nodes);
    nodes.push_back(a);
    const double segments = static_cast<double>(n_nodes - 1);
    for (std::size_t i = 1; i + 1 < n_nodes; ++i) {
        const double t = static_cast<double>(i) / segments;
        nodes.push_back(a + t * (b - a));
    }
    nodes.push_back(b);
    return from_nodes(nodes);
}

Curve Curve::from_nodes(const std::vector<Configuration>& nodes) {
    if (nodes.size() < 2) {
        throw std::invalid_argument("Curve::from_nodes: need at least two nodes");
    }
    if (nodes.front().size() == 0) {
        throw std::invalid_argument("Curve::from_nodes: dimension must be positive");
    }

    Curve c;
    c.dimension_ = nodes.front().size();
    c.nodes_.reserve(nodes.size());
    for (const auto& x : nodes) {
        linalg::require_size("Curve::from_nodes", c.dimension_, x.size());
        c.nodes_.push_back(CurveNode{c.next_id_++, x, std::nullopt});
    }
    c.reset_segment_samples();
    return c;
}

// ─── Queries ──────────────────────────────────────────────────────────────────

const CurveNode& Curve::node(std::size_t i) const {
    if (i >= nodes_.size()) {
        throw std::out_of_range(fmt::format("Curve: node {} out of range", i));
    }
    return nodes_[i];
}

const Configuration& Curve::position(std::size_t i) const {
    return node(i).position;
}

std::vector<Configuration> Curve::positions() const {
    std::vector<Configuration> out;
    out.reserve(nodes_.size());
    for (const auto& n : nodes_) {
        out.push_back(n.position);
    }
    return out;
}

const std::optional<MetricSample>& Curve::sample(std::size_t i) const {
    return node(i).sample;
}

const std::optional<MetricSample>& Curve::segment_sample(std::size_t j) const {
    if (j >= segment_samples_.size()) {
        throw std::out_of_range(fmt::format("Curve: segment {} out of range", j));
    }
    return segment_samples_[j];
}

// ─── Mutation ─────────────────────────────────────────────────────────────────

void Curve::check_interior(std::size_t i, const char* where) const {
    if (i >= nodes_.size()) {
        throw std::out_of_range(fmt::format("{}: node {} out of range", where, i));
    }
    if (is_endpoint(i)) {
        throw BoundaryViolationError(i);
    }
}

void Curve::perturb(std::size_t i, const Displacement& delta) {
    check_interior(i, "Curve::perturb");
    linalg::require_size("Curve::perturb", dimension_, delta.size());
    set_position(i, nodes_[i].position + delta);
}

void Curve::set_position(std::size_t i, const Configuration& x) {
    check_interior(i, "Curve::set_position");
    linalg::require_size("Curve::set_position", dimension_, x.size());
    if (same_position(nodes_[i].position, x)) {
        return;
    }
    nodes_[i].position = x;
    nodes_[i].sample.reset();
    segment_samples_[i - 1].reset();
    segment_samples_[i].reset();
}

void Curve::insert_after(std::size_t i, Configuration x) {
    nodes_.insert(nodes_.begin() + static_cast<std::ptrdiff_t>(i + 1),
                  CurveNode{next_id_++, std::move(x), std::nullopt});
}

void Curve::reset_segment_samples() {
    segment_samples_.assign(nodes_.size() - 1, std::nullopt);
}

std::size_t Curve::refine(const MassWeights& masses) {
    const auto pos = positions();
    const std::size_t i = geometric::max_curvature_node(pos, masses);

    // Right segment first so index i − 1 stays valid for the left insertion.
    insert_after(i, 0.5 * (pos[i] + pos[i + 1]));
    insert_after(i - 1, 0.5 * (pos[i - 1] + pos[i]));
    reset_segment_samples();
    return i;
}

void Curve::refine_uniform() {
    const auto pos = positions();
    for (std::size_t j = pos.size() - 1; j-- > 0;) {
        insert_after(j, 0.5 * (pos[j] + pos[j + 1]));
    }
    reset_segment_samples();
}

std::optional<std::size_t> Curve::coarsen(const MassWeights& masses) {
    if (nodes_.size() < 4) {
        return std::nullopt;
    }
    const std::size_t i = geometric::min_curvature_node(positions(), masses);
    nodes_.erase(nodes_.begin() + static_cast<std::ptrdiff_t>(i));
    reset_segment_samples();
    return i;
}

// ─── Samples ──────────────────────────────────────────────────────────────────

std::vector<SampleRequest> Curve::missing_samples(QuadratureRule rule) const {
    std::vector<SampleRequest> out;
    if (rule == QuadratureRule::Trapezoidal) {
        for (std::size_t i = 0; i < nodes_.size(); ++i) {
            if (!nodes_[i].sample) {
                out.push_back(SampleRequest{SampleRequest::Site::Node, i,
                                            nodes_[i].position, is_endpoint(i)});
            }
        }
    } else {
        for (std::size_t j = 0; j < segment_samples_.size(); ++j) {
            if (!segment_samples_[j]) {
                out.push_back(SampleRequest{
                    SampleRequest::Site::SegmentMidpoint, j,
                    0.5 * (nodes_[j].position + nodes_[j + 1].position), false});
            }
        }
    }
    return out;
}

void Curve::attach_sample(std::size_t i, MetricSample sample) {
    if (i >= nodes_.size()) {
        throw std::out_of_range(fmt::format("Curve::attach_sample: node {} out of range", i));
    }
    if (!same_position(nodes_[i].position, sample.position)) {
        throw std::invalid_argument(fmt::format(
            "Curve::attach_sample: sample was taken away from node {}", i));
    }
    nodes_[i].sample = std::move(sample);
}

void Curve::attach_segment_sample(std::size_t j, MetricSample sample) {
    if (j >= segment_samples_.size()) {
        throw std::out_of_range(
            fmt::format("Curve::attach_segment_sample: segment {} out of range", j));
    }
    const Configuration mid = 0.5 * (nodes_[j].position + nodes_[j + 1].position);
    if (!same_position(mid, sample.position)) {
        throw std::invalid_argument(fmt::format(
            "Curve::attach_segment_sample: sample was taken away from segment {}", j));
    }
    segment_samples_[j] = std::move(sample);
}

void Curve::attach(const SampleRequest& request, MetricSample sample) {
    if (request.site == SampleRequest::Site::Node) {
        attach_sample(request.index, std::move(sample));
    } else {
        attach_segment_sample(request.index, std::move(sample));
    }
}

void Curve::invalidate_samples() noexcept {
    for (auto& n : nodes_) {
        n.sample.reset();
    }
    for (auto& s : segment_samples_) {
        s.reset();
    }
}

std::optional<std::vector<MetricSample>> Curve::samples_for(QuadratureRule rule) const {
    std::vector<MetricSample> out;
    if (rule == QuadratureRule::Trapezoidal) {
        out.reserve(nodes_.size());
        for (const auto& n : nodes_) {
            if (!n.sample) return std::nullopt;
            out.push_back(*n.sample);
        }
    } else {
        out.reserve(segment_samples_.size());
        for (const auto& s : segment_samples_) {
            if (!s) return std::nullopt;
            out.push_back(*s);
        }
    }
    return out;
}

std::optional<double> Curve::functional_value(QuadratureRule rule,
                                              const MassWeights& masses) const {
    const auto samples = samples_for(rule);
    if (!samples) return std::nullopt;
    return geometric::functional(positions(), *samples, rule, masses);
}

std::optional<std::vector<Displacement>>
Curve::functional_gradient(QuadratureRule rule, const MassWeights& masses) const {
    const auto samples = samples_for(rule);
    if (!samples) return std::nullopt;
    return geometric::functional_gradient(positions(), *samples, rule, masses);
}

} // namespace birkhoff
