#pragma once

/// @file include/birkhoff/optimizer.hpp
/// @brief Curve-shortening quasi-Newton iteration (limited-memory BFGS in
///        the mass metric) with a domain-aware backtracking line search.
///
/// # Module: CustomBFGS
///
/// ## State machine
/// ```
///   Initializing ─► Evaluating ─► StepComputing ─► LineSearching ─┐
///                       ▲                                          │
///                       └──────────── accepted step ◄──────────────┘
///   Evaluating ─► Converged   (gradient or relative-decrease test)
///   any state  ─► Failed      (iteration budget, shrink budget, worker failure)
/// ```
///
/// ## Variables
/// The optimisation variables are displacements of the interior nodes in
/// mass-weighted coordinates w = M^{1/2} x, so the Euclidean norm of a
/// reduced step is its mass norm. In the `Full` search space each node moves
/// in all d coordinates except along its local tangent x_{i+1} − x_{i−1},
/// whose component is removed from the gradient; spacing along the curve is
/// left to reparametrization. In the `Orthogonal` space a node moves in the
/// d − 1 directions M-orthogonal to the chord x_{N−1} − x₀.
///
/// ## Maintenance
/// Refinement and reparametrization change the discretisation. The functional
/// they produce is the new baseline even if it is larger than before, and the
/// quasi-Newton memory is cleared. A worker failure during maintenance puts
/// the curve back to the last accepted step before the run fails.
///
/// ## Line search
/// Starting from α = 1 (capped so no node moves more than `max_step_size`),
/// α is multiplied by `line_search_shrink_factor` whenever a trial point
/// fails the Armijo test or leaves the region E − V > 0. Trial points are
/// evaluated off the curve; only the accepted step is written back, through
/// `Curve::perturb`, together with the samples that were computed for it.
///
/// ## Guarantees
/// - The functional never increases across accepted steps between
///   maintenance events.
/// - Endpoints are never touched.
/// - A run ends in exactly one of Converged, Failed(reason) or Cancelled,
///   and the curve always holds the last accepted state.

#include "birkhoff/constants.hpp"
#include "birkhoff/curve.hpp"
#include "birkhoff/metric.hpp"
#include "birkhoff/types.hpp"
#include "birkhoff/worker_pool.hpp"

#include <Eigen/Dense>
#include <atomic>
#include <cstddef>
#include <deque>
#include <functional>
#include <optional>
#include <string>
#include <vector>

namespace birkhoff {

// ─── Enums ────────────────────────────────────────────────────────────────────

enum class OptimizerState {
    Initializing,
    Evaluating,
    StepComputing,
    LineSearching,
    Converged,
    Failed,
};

enum class RunStatus {
    Converged,
    Failed,
    Cancelled,
};

[[nodiscard]] const char* to_string(OptimizerState s) noexcept;
[[nodiscard]] const char* to_string(RunStatus s) noexcept;

// ─── Options ──────────────────────────────────────────────────────────────────

struct BfgsOptions {
    QuadratureRule quadrature   = QuadratureRule::Trapezoidal;
    SearchSpace    search_space = SearchSpace::Full;

    /// Diagonal mass matrix; empty means all ones.
    MassWeights masses;

    double      gradient_tolerance        = constants::DEFAULT_GRADIENT_TOLERANCE;
    double      functional_tolerance      = constants::DEFAULT_FUNCTIONAL_TOLERANCE;
    std::size_t max_iterations            = constants::DEFAULT_MAX_ITERATIONS;
    std::size_t bfgs_memory               = constants::DEFAULT_BFGS_MEMORY;
    std::size_t line_search_max_shrink    = constants::DEFAULT_LINE_SEARCH_MAX_SHRINK;
    double      line_search_shrink_factor = constants::DEFAULT_LINE_SEARCH_SHRINK_FACTOR;
    double      max_step_size             = constants::DEFAULT_MAX_STEP_SIZE;

    /// Reparametrise when max/min segment length exceeds this; ≤ 0 disables.
    double reparam_ratio_threshold = constants::DEFAULT_REPARAM_RATIO_THRESHOLD;

    /// Refine the most curved node every this many iterations; 0 disables.
    std::size_t refine_interval = 0;

    /// Refinement stops once the curve has this many nodes.
    std::size_t max_nodes = 0;

    /// Most recent iteration records kept.
    std::size_t history_capacity = constants::DEFAULT_HISTORY_CAPACITY;
};

// ─── Records ──────────────────────────────────────────────────────────────────

/// One accepted step.
struct IterationRecord {
    std::size_t iteration;       ///< 1-based count of accepted steps
    double      functional;      ///< L after the step, before any refinement
    double      gradient_norm;   ///< mass norm of the search gradient after the step
    double      naive_step;      ///< α proposed before any shrinking
    double      accepted_step;   ///< α accepted by the line search
    std::size_t domain_shrinks;  ///< shrinks caused by E − V ≤ 0
    std::size_t armijo_shrinks;  ///< shrinks caused by insufficient decrease
    std::size_t node_count;      ///< nodes after any refinement
    bool        reparametrized;
};

struct OptimizationResult {
    RunStatus                    status;
    std::string                  reason;
    std::size_t                  iterations    = 0;
    double                       functional    = 0.0;
    double                       gradient_norm = 0.0;
    std::size_t                  evaluations   = 0;  ///< oracle calls requested
    std::vector<IterationRecord> history;
};

using IterationObserver = std::function<void(const IterationRecord&, const Curve&)>;

// ─── Two-loop recursion ───────────────────────────────────────────────────────

/// Limited-memory inverse-Hessian approximation built from the last k
/// (s, y) pairs.
class LbfgsMemory {
public:
    explicit LbfgsMemory(std::size_t capacity);

    /// Store a pair. Pairs violating the curvature condition sᵀy > ε‖s‖‖y‖
    /// are skipped.
    ///
    /// # Returns
    /// true if the pair was stored.
    bool push(const Eigen::VectorXd& s, const Eigen::VectorXd& y);

    /// H·g by the two-loop recursion, with H₀ = (sᵀy / yᵀy)·I from the most
    /// recent pair (H₀ = I while empty).
    [[nodiscard]] Eigen::VectorXd apply(const Eigen::VectorXd& g) const;

    void clear() noexcept;
    [[nodiscard]] std::size_t size() const noexcept { return pairs_.size(); }
    [[nodiscard]] std::size_t capacity() const noexcept { return capacity_; }

private:
    struct Pair {
        Eigen::VectorXd s;
        Eigen::VectorXd y;
        double          rho;  ///< 1 / (yᵀs)
    };

    std::size_t      capacity_;
    std::deque<Pair> pairs_;
};

// ─── Line search ──────────────────────────────────────────────────────────────

struct LineSearchOptions {
    double      c1            = constants::ARMIJO_C1;
    double      shrink_factor = constants::DEFAULT_LINE_SEARCH_SHRINK_FACTOR;
    std::size_t max_shrink    = constants::DEFAULT_LINE_SEARCH_MAX_SHRINK;
};

struct LineSearchResult {
    bool        accepted;
    double      naive_step;
    double      step;
    double      value;
    std::size_t domain_shrinks;  ///< trials rejected for leaving the region
    std::size_t armijo_shrinks;  ///< trials rejected for insufficient decrease
};

/// Backtracking search for φ(α) ≤ φ(0) + c₁ α φ′(0).
///
/// `phi` returns `nullopt` when the trial point leaves the allowed region;
/// that counts as a domain shrink. At most `max_shrink` shrinks are made, so
/// φ is called at most `max_shrink + 1` times.
///
/// # Arguments
/// * `phi`   : trial function
/// * `phi0`  : φ(0)
/// * `slope` : φ′(0), must be negative
/// * `alpha0`: first trial step
[[nodiscard]] LineSearchResult
backtracking_line_search(const std::function<std::optional<double>(double)>& phi,
                         double phi0, double slope, double alpha0,
                         const LineSearchOptions& options);

// ─── CustomBFGS ───────────────────────────────────────────────────────────────

class CustomBFGS {
public:
    /// The optimizer mutates `curve` in place and evaluates through
    /// `dispatcher`; both must outlive it.
    CustomBFGS(Curve& curve, const MetricValues& metric, comm::Dispatcher& dispatcher,
               BfgsOptions options);

    /// Drive the curve to a local geodesic.
    ///
    /// Never throws for run-level failures (domain exhaustion, worker
    /// failure); those end in `RunStatus::Failed` with a reason.
    OptimizationResult run();

    /// Ask a running `run()` to stop after the current step. Thread-safe.
    void cancel() noexcept { cancel_requested_.store(true); }

    /// Also stop when `flag` becomes true. The flag must outlive the run.
    void set_cancel_flag(const std::atomic<bool>* flag) noexcept { external_cancel_ = flag; }

    void set_observer(IterationObserver observer) { observer_ = std::move(observer); }

    [[nodiscard]] OptimizerState state() const noexcept { return state_; }
    [[nodiscard]] const std::deque<IterationRecord>& history() const noexcept { return history_; }
    [[nodiscard]] const BfgsOptions& options() const noexcept { return options_; }

private:
    struct TrialPoint {
        std::vector<Configuration> nodes;
        std::vector<MetricSample>  samples;
        std::vector<Displacement>  deltas;
    };

    [[nodiscard]] bool cancel_requested() const noexcept {
        return cancel_requested_.load() || (external_cancel_ && external_cancel_->load());
    }
    void build_basis();
    [[nodiscard]] std::vector<MetricSample> sample_points(const std::vector<SampleRequest>& points);
    void ensure_samples();
    [[nodiscard]] Eigen::VectorXd reduce(const std::vector<Displacement>& grad) const;
    [[nodiscard]] std::vector<Displacement> expand(const Eigen::VectorXd& z) const;
    [[nodiscard]] Eigen::VectorXd current_gradient() const;
    [[nodiscard]] Eigen::VectorXd search_gradient(const Eigen::VectorXd& g) const;
    void project_tangents(Eigen::VectorXd& z) const;
    [[nodiscard]] double largest_node_step(const Eigen::VectorXd& z) const;
    [[nodiscard]] std::optional<double> try_trial(const Eigen::VectorXd& direction, double alpha,
                                                  TrialPoint& out);
    void apply_trial(const TrialPoint& trial);
    bool maintain(std::size_t iteration, double& functional, IterationRecord& rec);
    void record(const IterationRecord& rec);
    OptimizationResult finish(RunStatus status, std::string reason, std::size_t iterations,
                              double functional, double gnorm);

    Curve&               curve_;
    const MetricValues&  metric_;
    comm::Dispatcher&    dispatcher_;
    BfgsOptions          options_;
    MassWeights          masses_;
    Eigen::MatrixXd      basis_;  ///< d×k map from reduced to configuration coordinates
    LbfgsMemory          memory_;
    std::deque<IterationRecord> history_;
    IterationObserver    observer_;
    OptimizerState       state_       = OptimizerState::Initializing;
    std::size_t          evaluations_ = 0;
    std::atomic<bool>    cancel_requested_{false};
    const std::atomic<bool>* external_cancel_ = nullptr;
};

} // namespace birkhoff
