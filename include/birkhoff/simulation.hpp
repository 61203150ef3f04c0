#pragma once

/// @file include/birkhoff/simulation.hpp
/// @brief Run orchestration: the SimulationClient (local geodesic between two
///        endpoints) and the global Birkhoff driver built on it.
///
/// # Module: SimulationClient
///
/// ## Lifecycle
/// ```
///   SimulationClient client(cfg, oracle);
///   client.start();              // spawns worker_pool_size workers
///   RunResult r = client.run();  // any number of runs
///   client.shutdown();           // drains the pool (also done by the destructor)
/// ```
/// With `worker_pool_size = 0` evaluations run on the calling thread.

#include "birkhoff/config.hpp"
#include "birkhoff/metric.hpp"
#include "birkhoff/optimizer.hpp"
#include "birkhoff/potential.hpp"
#include "birkhoff/types.hpp"
#include "birkhoff/worker_pool.hpp"

#include <atomic>
#include <cstddef>
#include <functional>
#include <memory>
#include <string>
#include <vector>

namespace birkhoff {

// ─── Results ──────────────────────────────────────────────────────────────────

/// Outcome of one local geodesic run. `nodes` is the last accepted curve,
/// whatever the status.
struct RunResult {
    std::vector<Configuration>   nodes;
    double                       functional_value = 0.0;
    std::size_t                  iterations       = 0;
    RunStatus                    status           = RunStatus::Failed;
    std::string                  reason;
    std::vector<IterationRecord> history;
};

/// Outcome of a global Birkhoff run.
struct BirkhoffResult {
    std::vector<Configuration> nodes;
    double                     functional_value = 0.0;
    std::size_t                sweeps           = 0;
    double                     movement         = 0.0;  ///< of the last sweep
    std::size_t                local_failures   = 0;    ///< local solves whose node was kept
    RunStatus                  status           = RunStatus::Failed;
    std::string                reason;
};

// ─── SimulationClient ─────────────────────────────────────────────────────────

class SimulationClient {
public:
    /// # Errors
    /// `ConfigError` if `config.validate()` reports a problem.
    SimulationClient(GeodesicConfig config, std::shared_ptr<const PotentialOracle> oracle);

    ~SimulationClient();

    SimulationClient(const SimulationClient&)            = delete;
    SimulationClient& operator=(const SimulationClient&) = delete;

    /// Start the worker pool, replacing a drained one. Idempotent while running.
    void start();

    /// Local geodesic from the evenly spaced straight line between the
    /// configured endpoints.
    RunResult run();

    /// Local geodesic from a given initial curve (e.g. a previous solution).
    RunResult run_from(const std::vector<Configuration>& initial);

    /// Global Birkhoff curve shortening from an evenly spaced straight line
    /// with `global_nodes` nodes.
    BirkhoffResult run_birkhoff();

    /// Stop the current run at the next iteration check. Only touches an
    /// atomic flag, so it may be called from a signal handler.
    void cancel() noexcept { cancel_.store(true); }

    /// Clear a previous cancellation.
    void reset_cancel() noexcept { cancel_.store(false); }

    /// Drain and join the workers. Idempotent.
    void shutdown();

    void set_observer(IterationObserver observer) { observer_ = std::move(observer); }

    [[nodiscard]] const GeodesicConfig& config() const noexcept { return config_; }
    [[nodiscard]] const MetricValues& metric() const noexcept { return metric_; }

    /// Pool counters, or `nullptr` when evaluating inline.
    [[nodiscard]] const comm::PoolStats* pool_stats() const noexcept;

private:
    [[nodiscard]] comm::Dispatcher& dispatcher();

    GeodesicConfig                           config_;
    std::shared_ptr<const PotentialOracle>   oracle_;
    MetricValues                             metric_;
    std::unique_ptr<comm::WorkerPool>        pool_;
    std::unique_ptr<comm::InlineDispatcher>  inline_;
    IterationObserver                        observer_;
    std::atomic<bool>                        cancel_{false};
};

// ─── BirkhoffDriver ───────────────────────────────────────────────────────────

/// Global curve shortening by local geodesic replacement.
///
/// Each sweep visits the interior global nodes in order. Node i is replaced
/// by the arc-length midpoint of a local geodesic between nodes i − 1 and
/// i + 1, found by CustomBFGS in the orthogonal search space and started
/// from the polyline x_{i−1} → x_i → x_{i+1}. Updates are applied in place,
/// so later nodes of the same sweep see the moved neighbours. The run
/// converges once the summed mass-norm movement of a sweep drops below
/// `movement_tolerance`.
class BirkhoffDriver {
public:
    using SweepObserver =
        std::function<void(std::size_t sweep, double movement,
                           const std::vector<Configuration>& nodes)>;

    BirkhoffDriver(const GeodesicConfig& config, const MetricValues& metric,
                   comm::Dispatcher& dispatcher);

    /// # Errors
    /// `std::invalid_argument` for fewer than three nodes.
    BirkhoffResult run(std::vector<Configuration> nodes);

    void cancel() noexcept { cancel_.store(true); }

    /// Also stop when `flag` becomes true. The flag must outlive the run.
    void set_cancel_flag(const std::atomic<bool>* flag) noexcept { external_cancel_ = flag; }

    void set_observer(SweepObserver observer) { observer_ = std::move(observer); }

private:
    [[nodiscard]] bool cancel_requested() const noexcept {
        return cancel_.load() || (external_cancel_ && external_cancel_->load());
    }

    /// New position for node i, or `nullopt` if the local solve failed.
    [[nodiscard]] std::optional<Configuration>
    local_midpoint(const std::vector<Configuration>& nodes, std::size_t i);

    [[nodiscard]] double global_functional(const std::vector<Configuration>& nodes);

    const GeodesicConfig&    config_;
    const MetricValues&      metric_;
    comm::Dispatcher&        dispatcher_;
    BfgsOptions              local_options_;
    MassWeights              masses_;
    SweepObserver            observer_;
    std::atomic<bool>        cancel_{false};
    const std::atomic<bool>* external_cancel_ = nullptr;
};

} // namespace birkhoff
