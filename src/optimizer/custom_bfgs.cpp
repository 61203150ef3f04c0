/// @file src/optimizer/custom_bfgs.cpp
/// @brief CustomBFGS state machine.

#include "birkhoff/optimizer.hpp"
#include "birkhoff/errors.hpp"
#include "birkhoff/geometric.hpp"
#include "birkhoff/linalg.hpp"
#include "birkhoff/log.hpp"
#include "birkhoff/sampling.hpp"

#include <fmt/format.h>

#include <algorithm>
#include <cmath>
#include <limits>
#include <stdexcept>

namespace birkhoff {

const char* to_string(OptimizerState s) noexcept {
    switch (s) {
        case OptimizerState::Initializing:  return "initializing";
        case OptimizerState::Evaluating:    return "evaluating";
        case OptimizerState::StepComputing: return "step-computing";
        case OptimizerState::LineSearching: return "line-searching";
        case OptimizerState::Converged:     return "converged";
        case OptimizerState::Failed:        return "failed";
    }
    return "unknown";
}

const char* to_string(RunStatus s) noexcept {
    switch (s) {
        case RunStatus::Converged: return "converged";
        case RunStatus::Failed:    return "failed";
        case RunStatus::Cancelled: return "cancelled";
    }
    return "unknown";
}

// ─── Construction ─────────────────────────────────────────────────────────────

CustomBFGS::CustomBFGS(Curve& curve, const MetricValues& metric,
                       comm::Dispatcher& dispatcher, BfgsOptions options)
    : curve_(curve)
    , metric_(metric)
    , dispatcher_(dispatcher)
    , options_(std::move(options))
    , memory_(options_.bfgs_memory) {
    const Eigen::Index d = curve_.dimension();
    masses_ = options_.masses.size() == 0 ? MassWeights::Ones(d) : options_.masses;
    linalg::require_size("CustomBFGS: masses", d, masses_.size());
    if (!(masses_.array() > 0.0).all()) {
        throw std::invalid_argument("CustomBFGS: masses must be positive");
    }
    if (!(options_.max_step_size > 0.0)) {
        throw std::invalid_argument("CustomBFGS: max_step_size must be positive");
    }
    build_basis();
}

void CustomBFGS::build_basis() {
    const Eigen::Index d = curve_.dimension();
    const Eigen::VectorXd inv_sqrt = masses_.array().sqrt().inverse().matrix();

    if (options_.search_space == SearchSpace::Orthogonal) {
        const Eigen::VectorXd chord =
            masses_.array().sqrt().matrix().cwiseProduct(curve_.position(curve_.size() - 1)
                                                         - curve_.position(0));
        if (d > 1 && chord.norm() > constants::FLOAT_EPSILON) {
            const Eigen::MatrixXd q = linalg::orthonormal_tangent_basis(chord);
            basis_ = inv_sqrt.asDiagonal() * q.rightCols(d - 1);
            return;
        }
        auto logger = log::get();
        SPDLOG_LOGGER_WARN(logger, "orthogonal search space needs d > 1 and distinct "
                                   "endpoints; searching the full space");
    }
    basis_ = inv_sqrt.asDiagonal() * Eigen::MatrixXd::Identity(d, d);
}

void CustomBFGS::project_tangents(Eigen::VectorXd& z) const {
    const Eigen::Index d = curve_.dimension();
    if (basis_.cols() != d || d < 2) return;

    // In the full space the reduced coordinates are w = M^{1/2} x, so the
    // local tangent is measured there too.
    const Eigen::VectorXd sqrt_m = masses_.array().sqrt().matrix();
    for (std::size_t i = 1; i + 1 < curve_.size(); ++i) {
        Eigen::VectorXd tangent =
            sqrt_m.cwiseProduct(curve_.position(i + 1) - curve_.position(i - 1));
        const double len = tangent.norm();
        if (!(len > constants::FLOAT_EPSILON)) continue;
        tangent /= len;
        auto zi = z.segment(static_cast<Eigen::Index>(i - 1) * d, d);
        zi -= tangent.dot(zi) * tangent;
    }
}

// ─── Reduced Coordinates ──────────────────────────────────────────────────────

Eigen::VectorXd CustomBFGS::reduce(const std::vector<Displacement>& grad) const {
    const Eigen::Index k = basis_.cols();
    Eigen::VectorXd z(static_cast<Eigen::Index>(grad.size()) * k);
    for (std::size_t i = 0; i < grad.size(); ++i) {
        z.segment(static_cast<Eigen::Index>(i) * k, k) = basis_.transpose() * grad[i];
    }
    return z;
}

std::vector<Displacement> CustomBFGS::expand(const Eigen::VectorXd& z) const {
    const Eigen::Index k = basis_.cols();
    std::vector<Displacement> out;
    out.reserve(static_cast<std::size_t>(z.size() / std::max<Eigen::Index>(k, 1)));
    for (Eigen::Index off = 0; off + k <= z.size() && k > 0; off += k) {
        out.push_back(basis_ * z.segment(off, k));
    }
    return out;
}

Eigen::VectorXd CustomBFGS::current_gradient() const {
    return reduce(curve_.functional_gradient(options_.quadrature, masses_).value());
}

Eigen::VectorXd CustomBFGS::search_gradient(const Eigen::VectorXd& g) const {
    Eigen::VectorXd r = g;
    project_tangents(r);
    return r;
}

double CustomBFGS::largest_node_step(const Eigen::VectorXd& z) const {
    const Eigen::Index k = basis_.cols();
    double longest = 0.0;
    for (Eigen::Index off = 0; off + k <= z.size() && k > 0; off += k) {
        longest = std::max(longest, z.segment(off, k).norm());
    }
    return longest;
}

// ─── Sampling ─────────────────────────────────────────────────────────────────

std::vector<MetricSample> CustomBFGS::sample_points(const std::vector<SampleRequest>& points) {
    evaluations_ += points.size();
    return evaluate_requests(points, metric_, dispatcher_);
}

void CustomBFGS::ensure_samples() {
    evaluations_ += attach_missing_samples(curve_, options_.quadrature, metric_, dispatcher_);
}

// ─── Line Search Trials ───────────────────────────────────────────────────────

std::optional<double> CustomBFGS::try_trial(const Eigen::VectorXd& direction, double alpha,
                                            TrialPoint& out) {
    const std::size_t n = curve_.size();
    out.nodes  = curve_.positions();
    out.deltas = expand(alpha * direction);
    for (std::size_t i = 1; i + 1 < n; ++i) {
        // Same expression Curve::perturb evaluates, so attached samples match.
        Configuration moved = out.nodes[i] + out.deltas[i - 1];
        out.nodes[i] = std::move(moved);
    }

    std::vector<SampleRequest> requests;
    if (options_.quadrature == QuadratureRule::Trapezoidal) {
        for (std::size_t i = 1; i + 1 < n; ++i) {
            requests.push_back(SampleRequest{SampleRequest::Site::Node, i, out.nodes[i], false});
        }
    } else {
        const auto mids = geometric::segment_midpoints(out.nodes);
        for (std::size_t j = 0; j < mids.size(); ++j) {
            requests.push_back(SampleRequest{SampleRequest::Site::SegmentMidpoint, j, mids[j], false});
        }
    }

    std::vector<MetricSample> fresh;
    try {
        fresh = sample_points(requests);
    } catch (const DomainError& e) {
        auto logger = log::get();
        SPDLOG_LOGGER_DEBUG(logger, "trial step {:.3e} rejected: {}", alpha, e.what());
        return std::nullopt;
    }

    if (options_.quadrature == QuadratureRule::Trapezoidal) {
        out.samples.clear();
        out.samples.reserve(n);
        out.samples.push_back(curve_.sample(0).value());
        for (auto& s : fresh) out.samples.push_back(std::move(s));
        out.samples.push_back(curve_.sample(n - 1).value());
    } else {
        out.samples = std::move(fresh);
    }
    return geometric::functional(out.nodes, out.samples, options_.quadrature, masses_);
}

void CustomBFGS::apply_trial(const TrialPoint& trial) {
    const std::size_t n = curve_.size();
    for (std::size_t i = 1; i + 1 < n; ++i) curve_.perturb(i, trial.deltas[i - 1]);

    if (options_.quadrature == QuadratureRule::Trapezoidal) {
        for (std::size_t i = 1; i + 1 < n; ++i) curve_.attach_sample(i, trial.samples[i]);
    } else {
        for (std::size_t j = 0; j + 1 < n; ++j) curve_.attach_segment_sample(j, trial.samples[j]);
    }
}

// ─── Maintenance ──────────────────────────────────────────────────────────────

bool CustomBFGS::maintain(std::size_t iteration, double& functional, IterationRecord& rec) {
    auto logger = log::get();
    bool refined = false;

    // Both operations change the discretisation, so the functional they
    // leave behind becomes the new baseline even when it is larger.
    const bool room = options_.max_nodes == 0 || curve_.size() + 2 <= options_.max_nodes;
    if (options_.refine_interval > 0 && iteration % options_.refine_interval == 0
        && curve_.interior_count() > 0 && room) {
        const Curve before = curve_;
        const std::size_t at = curve_.refine(masses_);
        try {
            ensure_samples();
            functional = curve_.functional_value(options_.quadrature, masses_).value();
            refined = true;
            SPDLOG_LOGGER_DEBUG(logger, "refined around node {}; {} nodes, L = {:.10g}", at,
                                curve_.size(), functional);
        } catch (const DomainError& e) {
            curve_ = before;
            SPDLOG_LOGGER_DEBUG(logger, "refinement around node {} discarded: {}", at, e.what());
        } catch (const WorkerFailure&) {
            curve_ = before;
            throw;
        }
    }

    const bool uneven = options_.reparam_ratio_threshold > 0.0
                        && geometric::spacing_ratio(curve_.positions(), masses_)
                               > options_.reparam_ratio_threshold;
    if (curve_.interior_count() > 0 && (refined || uneven)) {
        const Curve before = curve_;
        const auto nodes = geometric::reparametrize(curve_.positions(), masses_);
        for (std::size_t i = 1; i + 1 < nodes.size(); ++i) curve_.set_position(i, nodes[i]);
        try {
            ensure_samples();
            functional = curve_.functional_value(options_.quadrature, masses_).value();
            rec.reparametrized = true;
            SPDLOG_LOGGER_DEBUG(logger, "reparametrized; L = {:.10g}", functional);
        } catch (const DomainError& e) {
            curve_ = before;
            SPDLOG_LOGGER_DEBUG(logger, "reparametrization discarded: {}", e.what());
        } catch (const WorkerFailure&) {
            curve_ = before;
            throw;
        }
    }

    rec.node_count = curve_.size();
    return refined || rec.reparametrized;
}

void CustomBFGS::record(const IterationRecord& rec) {
    if (options_.history_capacity > 0) {
        if (history_.size() == options_.history_capacity) history_.pop_front();
        history_.push_back(rec);
    }
    if (observer_) observer_(rec, curve_);
}

OptimizationResult CustomBFGS::finish(RunStatus status, std::string reason,
                                      std::size_t iterations, double functional, double gnorm) {
    if (status == RunStatus::Converged) state_ = OptimizerState::Converged;
    if (status == RunStatus::Failed) state_ = OptimizerState::Failed;

    auto logger = log::get();
    SPDLOG_LOGGER_INFO(logger, "optimizer {} after {} iterations: {} (L = {:.10g}, |g| = {:.3e})",
                       to_string(status), iterations, reason, functional, gnorm);

    OptimizationResult r{status, std::move(reason), iterations, functional, gnorm,
                         evaluations_, {}};
    r.history.assign(history_.begin(), history_.end());
    return r;
}

// ─── Main Loop ────────────────────────────────────────────────────────────────

OptimizationResult CustomBFGS::run() {
    constexpr double NaN = std::numeric_limits<double>::quiet_NaN();
    auto logger = log::get();

    state_ = OptimizerState::Initializing;
    history_.clear();
    memory_.clear();
    evaluations_ = 0;
    build_basis();

    std::size_t iteration = 0;
    double f     = NaN;
    double gnorm = NaN;
    try {
        state_ = OptimizerState::Evaluating;
        try {
            ensure_samples();
        } catch (const DomainError& e) {
            return finish(RunStatus::Failed,
                          fmt::format("initial curve leaves the allowed region: {}", e.what()),
                          0, NaN, NaN);
        }
        f = curve_.functional_value(options_.quadrature, masses_).value();
        Eigen::VectorXd g = current_gradient();
        Eigen::VectorXd r = search_gradient(g);

        SPDLOG_LOGGER_DEBUG(logger, "start: {} nodes, d = {}, {} quadrature, {} search, L = {:.10g}",
                            curve_.size(), curve_.dimension(), to_string(options_.quadrature),
                            to_string(options_.search_space), f);

        const LineSearchOptions ls_options{constants::ARMIJO_C1,
                                           options_.line_search_shrink_factor,
                                           options_.line_search_max_shrink};
        for (;;) {
            state_ = OptimizerState::Evaluating;
            gnorm = r.norm();
            if (cancel_requested()) {
                return finish(RunStatus::Cancelled, "cancel requested", iteration, f, gnorm);
            }
            if (gnorm < options_.gradient_tolerance) {
                return finish(RunStatus::Converged,
                              fmt::format("gradient norm {:.3e} below tolerance", gnorm),
                              iteration, f, gnorm);
            }
            if (iteration >= options_.max_iterations) {
                return finish(RunStatus::Failed,
                              fmt::format("iteration limit {} reached", options_.max_iterations),
                              iteration, f, gnorm);
            }

            state_ = OptimizerState::StepComputing;
            Eigen::VectorXd p = -memory_.apply(r);
            project_tangents(p);
            double slope = g.dot(p);
            if (!(slope < 0.0)) {
                SPDLOG_LOGGER_DEBUG(logger, "iteration {}: not a descent direction; "
                                            "falling back to steepest descent", iteration + 1);
                memory_.clear();
                p     = -r;
                slope = -r.squaredNorm();
            }

            const double longest = largest_node_step(p);
            const double alpha0 =
                longest > options_.max_step_size ? options_.max_step_size / longest : 1.0;

            state_ = OptimizerState::LineSearching;
            TrialPoint trial;
            const LineSearchResult ls = backtracking_line_search(
                [&](double alpha) { return try_trial(p, alpha, trial); }, f, slope, alpha0,
                ls_options);
            if (!ls.accepted) {
                return finish(RunStatus::Failed,
                              fmt::format("line search exhausted ({} domain, {} Armijo rejections)",
                                          ls.domain_shrinks, ls.armijo_shrinks),
                              iteration, f, gnorm);
            }

            apply_trial(trial);
            ++iteration;
            const double f_prev = f;
            f = ls.value;

            g = current_gradient();
            Eigen::VectorXd r_new = search_gradient(g);
            memory_.push(ls.step * p, r_new - r);
            r = std::move(r_new);

            IterationRecord rec{iteration,        f,  r.norm(),          ls.naive_step,
                                ls.step,          ls.domain_shrinks, ls.armijo_shrinks,
                                curve_.size(),    false};
            SPDLOG_LOGGER_DEBUG(logger, "iteration {}: L = {:.12g}, |g| = {:.3e}, step {:.3e}/{:.3e}",
                                iteration, f, rec.gradient_norm, ls.step, ls.naive_step);

            const bool maintained = maintain(iteration, f, rec);
            if (maintained) {
                memory_.clear();
                g = current_gradient();
                r = search_gradient(g);
            }
            record(rec);

            // A step taken just before maintenance says nothing about the
            // new discretisation.
            const double decrease = (f_prev - ls.value) / std::max(std::abs(f_prev), 1.0);
            if (!maintained && decrease < options_.functional_tolerance) {
                gnorm = r.norm();
                return finish(RunStatus::Converged,
                              fmt::format("relative decrease {:.3e} below tolerance", decrease),
                              iteration, f, gnorm);
            }
        }
    } catch (const WorkerFailure& e) {
        return finish(RunStatus::Failed, fmt::format("worker failure: {}", e.what()), iteration, f,
                      gnorm);
    }
}

} // namespace birkhoff
