/// @file src/client/birkhoff_driver.cpp
/// @brief Global curve shortening by repeated local geodesic solves.

#include "birkhoff/simulation.hpp"
#include "birkhoff/curve.hpp"
#include "birkhoff/errors.hpp"
#include "birkhoff/geometric.hpp"
#include "birkhoff/linalg.hpp"
#include "birkhoff/log.hpp"
#include "birkhoff/sampling.hpp"

#include <fmt/format.h>

#include <limits>
#include <stdexcept>

namespace birkhoff {

BirkhoffDriver::BirkhoffDriver(const GeodesicConfig& config, const MetricValues& metric,
                               comm::Dispatcher& dispatcher)
    : config_(config)
    , metric_(metric)
    , dispatcher_(dispatcher)
    , local_options_(config.bfgs_options()) {
    local_options_.search_space     = SearchSpace::Orthogonal;
    local_options_.refine_interval  = 0;
    local_options_.history_capacity = 0;
    masses_ = config.masses.size() == 0
                  ? MassWeights::Ones(static_cast<Eigen::Index>(config.dimension()))
                  : config.masses;
}

std::optional<Configuration>
BirkhoffDriver::local_midpoint(const std::vector<Configuration>& nodes, std::size_t i) {
    auto logger = log::get();
    const Configuration& left  = nodes[i - 1];
    const Configuration& mid   = nodes[i];
    const Configuration& right = nodes[i + 1];
    if (linalg::mass_norm(right - left, masses_) < constants::MIN_SEGMENT_LENGTH) {
        return std::nullopt;
    }

    // Polyline left → mid → right with the old node in the middle.
    const std::size_t half = config_.local_nodes / 2;
    std::vector<Configuration> start;
    start.reserve(config_.local_nodes);
    for (std::size_t k = 0; k < half; ++k) {
        const double t = static_cast<double>(k) / static_cast<double>(half);
        start.push_back(left + t * (mid - left));
    }
    for (std::size_t k = 0; k <= half; ++k) {
        const double t = static_cast<double>(k) / static_cast<double>(half);
        start.push_back(mid + t * (right - mid));
    }
    start.front() = left;
    start.back()  = right;

    Curve local = Curve::from_nodes(start);
    CustomBFGS optimizer(local, metric_, dispatcher_, local_options_);
    optimizer.set_cancel_flag(external_cancel_);
    const OptimizationResult r = optimizer.run();
    if (r.status == RunStatus::Failed && r.iterations == 0) {
        SPDLOG_LOGGER_WARN(logger, "local solve at node {} failed: {}", i, r.reason);
        return std::nullopt;
    }
    if (r.status == RunStatus::Failed) {
        SPDLOG_LOGGER_DEBUG(logger, "local solve at node {} stopped early ({}); using its last curve",
                            i, r.reason);
    }

    const auto even = geometric::reparametrize(local.positions(), masses_);
    return even[half];
}

double BirkhoffDriver::global_functional(const std::vector<Configuration>& nodes) {
    Curve curve = Curve::from_nodes(nodes);
    try {
        attach_missing_samples(curve, config_.quadrature, metric_, dispatcher_);
    } catch (const DomainError& e) {
        auto logger = log::get();
        SPDLOG_LOGGER_WARN(logger, "global curve leaves the allowed region: {}", e.what());
        return std::numeric_limits<double>::quiet_NaN();
    }
    return curve.functional_value(config_.quadrature, masses_).value();
}

BirkhoffResult BirkhoffDriver::run(std::vector<Configuration> nodes) {
    if (nodes.size() < 3) {
        throw std::invalid_argument("BirkhoffDriver::run: need at least one interior node");
    }
    for (const auto& x : nodes) {
        linalg::require_size("BirkhoffDriver::run", masses_.size(), x.size());
    }

    auto logger = log::get();
    BirkhoffResult result;

    auto finish = [&](RunStatus status, std::string reason) {
        result.status = status;
        result.reason = std::move(reason);
        try {
            result.functional_value = global_functional(nodes);
        } catch (const WorkerFailure& e) {
            SPDLOG_LOGGER_WARN(logger, "final functional unavailable: {}", e.what());
            result.functional_value = std::numeric_limits<double>::quiet_NaN();
        }
        result.nodes = std::move(nodes);
        SPDLOG_LOGGER_INFO(logger, "birkhoff {} after {} sweeps: {} (L = {:.10g})",
                           to_string(status), result.sweeps, result.reason,
                           result.functional_value);
        return result;
    };

    try {
        for (;;) {
            if (cancel_requested()) return finish(RunStatus::Cancelled, "cancel requested");
            if (result.sweeps >= config_.max_sweeps) {
                return finish(RunStatus::Failed,
                              fmt::format("sweep limit {} reached", config_.max_sweeps));
            }

            double movement = 0.0;
            for (std::size_t i = 1; i + 1 < nodes.size(); ++i) {
                const auto moved = local_midpoint(nodes, i);
                if (!moved) {
                    ++result.local_failures;
                    continue;
                }
                movement += linalg::mass_norm(*moved - nodes[i], masses_);
                nodes[i] = *moved;
            }
            ++result.sweeps;
            result.movement = movement;
            SPDLOG_LOGGER_DEBUG(logger, "sweep {}: movement {:.3e}", result.sweeps, movement);
            if (observer_) observer_(result.sweeps, movement, nodes);

            if (movement < config_.movement_tolerance) {
                return finish(RunStatus::Converged,
                              fmt::format("movement {:.3e} below tolerance", movement));
            }
        }
    } catch (const WorkerFailure& e) {
        return finish(RunStatus::Failed, fmt::format("worker failure: {}", e.what()));
    }
}

} // namespace birkhoff
