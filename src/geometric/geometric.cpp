/// @file src/geometric/geometric.cpp
/// @brief Segment lengths, discretised action, its gradient, curvature and
///        arc-length reparametrisation.

#include "birkhoff/geometric.hpp"
#include "birkhoff/constants.hpp"
#include "birkhoff/errors.hpp"
#include "birkhoff/linalg.hpp"

#include <algorithm>
#include <cmath>
#include <limits>
#include <stdexcept>

namespace birkhoff::geometric {

namespace {

void require_samples(const char* where, std::span<const Configuration> nodes,
                     std::span<const MetricSample> samples, QuadratureRule rule) {
    linalg::require_size(where,
                         static_cast<Eigen::Index>(sample_count(rule, nodes.size())),
                         static_cast<Eigen::Index>(samples.size()));
}

/// ∂‖d‖_M/∂d = M d / ‖d‖_M, or zero for a degenerate segment.
Displacement length_gradient(const Displacement& d, double length,
                             const MassWeights& masses) {
    if (length < constants::MIN_SEGMENT_LENGTH) {
        return Displacement::Zero(d.size());
    }
    return linalg::mass_apply(d, masses) / length;
}

std::size_t extreme_curvature_node(std::span<const Configuration> nodes,
                                   const MassWeights& masses, bool largest) {
    if (nodes.size() < 3) {
        throw std::invalid_argument("curvature selection needs an interior node");
    }
    std::size_t best = 1;
    double best_k = curvature(nodes, 1, masses);
    for (std::size_t i = 2; i + 1 < nodes.size(); ++i) {
        const double k = curvature(nodes, i, masses);
        // Strict comparison keeps the lowest index on ties.
        if (largest ? (k > best_k) : (k < best_k)) {
            best   = i;
            best_k = k;
        }
    }
    return best;
}

} // namespace

// ─── Lengths ──────────────────────────────────────────────────────────────────

double segment_length(const Configuration& a, const Configuration& b,
                      const MassWeights& masses) {
    linalg::require_size("geometric::segment_length", a.size(), b.size());
    return linalg::mass_norm(b - a, masses);
}

std::vector<double> segment_lengths(std::span<const Configuration> nodes,
                                    const MassWeights& masses) {
    std::vector<double> out;
    if (nodes.size() < 2) return out;
    out.reserve(nodes.size() - 1);
    for (std::size_t i = 0; i + 1 < nodes.size(); ++i) {
        out.push_back(segment_length(nodes[i], nodes[i + 1], masses));
    }
    return out;
}

NodeList segment_midpoints(std::span<const Configuration> nodes) {
    NodeList out;
    if (nodes.size() < 2) return out;
    out.reserve(nodes.size() - 1);
    for (std::size_t i = 0; i + 1 < nodes.size(); ++i) {
        out.push_back(0.5 * (nodes[i] + nodes[i + 1]));
    }
    return out;
}

std::size_t sample_count(QuadratureRule rule, std::size_t node_count) noexcept {
    switch (rule) {
        case QuadratureRule::Trapezoidal: return node_count;
        case QuadratureRule::Midpoint:    return node_count == 0 ? 0 : node_count - 1;
    }
    return node_count;
}

// ─── Action ───────────────────────────────────────────────────────────────────

double segment_action(std::span<const Configuration> nodes,
                      std::span<const MetricSample> samples,
                      std::size_t segment, QuadratureRule rule,
                      const MassWeights& masses) {
    require_samples("geometric::segment_action", nodes, samples, rule);
    if (segment + 1 >= nodes.size()) {
        throw std::out_of_range("geometric::segment_action: segment index");
    }

    const double len = segment_length(nodes[segment], nodes[segment + 1], masses);
    if (rule == QuadratureRule::Trapezoidal) {
        return 0.5 * (samples[segment].speed + samples[segment + 1].speed) * len;
    }
    return samples[segment].speed * len;
}

double functional(std::span<const Configuration> nodes,
                  std::span<const MetricSample> samples,
                  QuadratureRule rule, const MassWeights& masses) {
    require_samples("geometric::functional", nodes, samples, rule);
    double total = 0.0;
    for (std::size_t i = 0; i + 1 < nodes.size(); ++i) {
        total += segment_action(nodes, samples, i, rule, masses);
    }
    return total;
}

std::vector<Displacement>
functional_gradient(std::span<const Configuration> nodes,
                    std::span<const MetricSample> samples,
                    QuadratureRule rule, const MassWeights& masses) {
    require_samples("geometric::functional_gradient", nodes, samples, rule);

    std::vector<Displacement> grad;
    if (nodes.size() < 3) return grad;
    grad.reserve(nodes.size() - 2);

    for (std::size_t i = 1; i + 1 < nodes.size(); ++i) {
        const Displacement d_prev = nodes[i] - nodes[i - 1];
        const Displacement d_next = nodes[i + 1] - nodes[i];
        const double l_prev = linalg::mass_norm(d_prev, masses);
        const double l_next = linalg::mass_norm(d_next, masses);
        const Displacement u_prev = length_gradient(d_prev, l_prev, masses);
        const Displacement u_next = length_gradient(d_next, l_next, masses);

        if (rule == QuadratureRule::Trapezoidal) {
            const MetricSample& s_prev = samples[i - 1];
            const MetricSample& s      = samples[i];
            const MetricSample& s_next = samples[i + 1];
            grad.push_back(0.5 * (l_prev + l_next) * s.grad_speed
                           + 0.5 * (s_prev.speed + s.speed) * u_prev
                           - 0.5 * (s.speed + s_next.speed) * u_next);
        } else {
            // x_i is the right end of segment i−1 and the left end of segment i;
            // each midpoint moves by half of x_i's displacement.
            const MetricSample& m_prev = samples[i - 1];
            const MetricSample& m_next = samples[i];
            grad.push_back(0.5 * l_prev * m_prev.grad_speed + m_prev.speed * u_prev
                           + 0.5 * l_next * m_next.grad_speed - m_next.speed * u_next);
        }
    }
    return grad;
}

// ─── Curvature ────────────────────────────────────────────────────────────────

double curvature(std::span<const Configuration> nodes, std::size_t i,
                 const MassWeights& masses) {
    if (i == 0 || i + 1 >= nodes.size()) {
        throw std::out_of_range("geometric::curvature: node is not interior");
    }
    const Displacement d_prev = nodes[i] - nodes[i - 1];
    const Displacement d_next = nodes[i + 1] - nodes[i];
    const double l_prev = linalg::mass_norm(d_prev, masses);
    const double l_next = linalg::mass_norm(d_next, masses);
    if (l_prev < constants::MIN_SEGMENT_LENGTH || l_next < constants::MIN_SEGMENT_LENGTH) {
        return 0.0;
    }
    const Displacement turn = d_next / l_next - d_prev / l_prev;
    return linalg::mass_norm(turn, masses) / (0.5 * (l_prev + l_next));
}

std::size_t max_curvature_node(std::span<const Configuration> nodes,
                               const MassWeights& masses) {
    return extreme_curvature_node(nodes, masses, /*largest=*/true);
}

std::size_t min_curvature_node(std::span<const Configuration> nodes,
                               const MassWeights& masses) {
    return extreme_curvature_node(nodes, masses, /*largest=*/false);
}

// ─── Spacing ──────────────────────────────────────────────────────────────────

double spacing_ratio(std::span<const Configuration> nodes, const MassWeights& masses) {
    const auto lengths = segment_lengths(nodes, masses);
    if (lengths.empty()) return 1.0;
    const auto [lo, hi] = std::minmax_element(lengths.begin(), lengths.end());
    if (*lo < constants::MIN_SEGMENT_LENGTH) {
        return std::numeric_limits<double>::infinity();
    }
    return *hi / *lo;
}

NodeList reparametrize(std::span<const Configuration> nodes, const MassWeights& masses) {
    NodeList out(nodes.begin(), nodes.end());
    if (nodes.size() < 3) return out;

    const auto lengths = segment_lengths(nodes, masses);
    std::vector<double> cumulative(nodes.size(), 0.0);
    for (std::size_t i = 0; i < lengths.size(); ++i) {
        cumulative[i + 1] = cumulative[i] + lengths[i];
    }
    const double total = cumulative.back();
    if (total < constants::MIN_SEGMENT_LENGTH) return out;

    const std::size_t segments = nodes.size() - 1;
    std::size_t seg = 0;
    for (std::size_t k = 1; k < segments; ++k) {
        const double target = total * static_cast<double>(k) / static_cast<double>(segments);
        while (seg + 1 < segments && cumulative[seg + 1] < target) {
            ++seg;
        }
        const double len = lengths[seg];
        const double t = len < constants::MIN_SEGMENT_LENGTH
                             ? 0.0
                             : std::clamp((target - cumulative[seg]) / len, 0.0, 1.0);
        out[k] = nodes[seg] + t * (nodes[seg + 1] - nodes[seg]);
    }
    return out;
}

} // namespace birkhoff::geometric
