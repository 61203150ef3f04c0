/// @file src/client/simulation_client.cpp
/// @brief Pool lifecycle and local geodesic runs.

#include "birkhoff/simulation.hpp"
#include "birkhoff/curve.hpp"
#include "birkhoff/errors.hpp"
#include "birkhoff/log.hpp"

#include <stdexcept>

namespace birkhoff {

SimulationClient::SimulationClient(GeodesicConfig config,
                                   std::shared_ptr<const PotentialOracle> oracle)
    : config_(std::move(config))
    , oracle_(std::move(oracle))
    , metric_(config_.total_energy, config_.metric_floor) {
    config_.require_valid();
    if (!oracle_) throw std::invalid_argument("SimulationClient: oracle must not be null");
}

SimulationClient::~SimulationClient() {
    try {
        shutdown();
    } catch (const std::exception& e) {
        auto logger = log::get();
        SPDLOG_LOGGER_ERROR(logger, "pool shutdown failed: {}", e.what());
    }
}

void SimulationClient::start() {
    if (config_.worker_pool_size == 0) {
        if (!inline_) inline_ = std::make_unique<comm::InlineDispatcher>(oracle_);
        return;
    }
    // A drained pool cannot be restarted; a new one replaces it.
    if (!pool_ || !pool_->running()) {
        pool_ = std::make_unique<comm::WorkerPool>(oracle_, config_.worker_pool_size,
                                                   config_.pool_options());
        pool_->start();
    }
}

void SimulationClient::shutdown() {
    if (pool_ && pool_->running()) {
        const std::size_t acks = pool_->shutdown();
        auto logger = log::get();
        SPDLOG_LOGGER_DEBUG(logger, "pool drained: {}/{} workers acknowledged", acks,
                            pool_->worker_count());
    }
}

const comm::PoolStats* SimulationClient::pool_stats() const noexcept {
    return pool_ ? &pool_->stats() : nullptr;
}

comm::Dispatcher& SimulationClient::dispatcher() {
    if (config_.worker_pool_size == 0) {
        start();
        return *inline_;
    }
    start();
    return *pool_;
}

RunResult SimulationClient::run() {
    return run_from(Curve::initialize(config_.endpoint_a, config_.endpoint_b, config_.n_nodes)
                        .positions());
}

RunResult SimulationClient::run_from(const std::vector<Configuration>& initial) {
    auto logger = log::get();
    Curve curve = Curve::from_nodes(initial);
    if (static_cast<std::size_t>(curve.dimension()) != config_.dimension()) {
        throw ShapeError("SimulationClient::run_from", config_.dimension(),
                         static_cast<std::size_t>(curve.dimension()));
    }

    CustomBFGS optimizer(curve, metric_, dispatcher(), config_.bfgs_options());
    optimizer.set_cancel_flag(&cancel_);
    if (observer_) optimizer.set_observer(observer_);

    SPDLOG_LOGGER_INFO(logger, "local geodesic: {} nodes, d = {}, E = {}", curve.size(),
                       curve.dimension(), config_.total_energy);
    OptimizationResult opt = optimizer.run();

    RunResult r;
    r.nodes            = curve.positions();
    r.functional_value = opt.functional;
    r.iterations       = opt.iterations;
    r.status           = opt.status;
    r.reason           = std::move(opt.reason);
    r.history          = std::move(opt.history);
    return r;
}

BirkhoffResult SimulationClient::run_birkhoff() {
    BirkhoffDriver driver(config_, metric_, dispatcher());
    driver.set_cancel_flag(&cancel_);
    return driver.run(
        Curve::initialize(config_.endpoint_a, config_.endpoint_b, config_.global_nodes)
            .positions());
}

} // namespace birkhoff
