#pragma once

#include <cstddef>

/// @file include/birkhoff/constants.hpp
/// @brief Numerical defaults for the Birkhoff geodesic engine.

namespace birkhoff::constants {

// ─── Metric ───────────────────────────────────────────────────────────────────

/// Smallest metric value used at fixed endpoints where E − V may vanish.
static constexpr double DEFAULT_METRIC_FLOOR = 1e-12;

// ─── Optimizer ────────────────────────────────────────────────────────────────

/// Default gradient tolerance (dual mass-weighted norm).
static constexpr double DEFAULT_GRADIENT_TOLERANCE = 1e-5;

/// Default relative decrease of the functional below which a run converges.
static constexpr double DEFAULT_FUNCTIONAL_TOLERANCE = 1e-10;

static constexpr std::size_t DEFAULT_MAX_ITERATIONS = 1000;

/// Number of (s, y) pairs kept by the two-loop recursion.
static constexpr std::size_t DEFAULT_BFGS_MEMORY = 10;

/// Armijo sufficient-decrease constant c₁.
static constexpr double ARMIJO_C1 = 1e-4;

static constexpr std::size_t DEFAULT_LINE_SEARCH_MAX_SHRINK = 30;

static constexpr double DEFAULT_LINE_SEARCH_SHRINK_FACTOR = 0.5;

/// Largest displacement of a single node in one step (mass-weighted norm).
static constexpr double DEFAULT_MAX_STEP_SIZE = 0.2;

/// Curvature pairs with sᵀy below this are not stored.
static constexpr double CURVATURE_PAIR_EPSILON = 1e-14;

/// Max/min segment length ratio that triggers reparametrization.
static constexpr double DEFAULT_REPARAM_RATIO_THRESHOLD = 4.0;

static constexpr std::size_t DEFAULT_HISTORY_CAPACITY = 256;

// ─── Worker Pool ──────────────────────────────────────────────────────────────

static constexpr std::size_t DEFAULT_WORKER_POOL_SIZE = 2;

static constexpr double DEFAULT_EVAL_TIMEOUT_SECONDS = 30.0;

static constexpr std::size_t DEFAULT_EVAL_RETRY_COUNT = 2;

// ─── Birkhoff Sweeps ──────────────────────────────────────────────────────────

static constexpr std::size_t DEFAULT_LOCAL_NODES = 5;

static constexpr std::size_t DEFAULT_MAX_SWEEPS = 200;

static constexpr double DEFAULT_MOVEMENT_TOLERANCE = 1e-6;

// ─── Numerical Tolerances ─────────────────────────────────────────────────────

/// General floating-point comparison epsilon.
static constexpr double FLOAT_EPSILON = 1e-12;

/// Segments shorter than this are treated as degenerate.
static constexpr double MIN_SEGMENT_LENGTH = 1e-14;

} // namespace birkhoff::constants
