#pragma once

/// @file include/birkhoff/config.hpp
/// @brief Run configuration and its `key = value` file loader.
///
/// # File format
/// ```
/// # harmonic well, 2 dof
/// total_energy = 2.0
/// endpoint_a   = -1.0, 0.3
/// endpoint_b   =  1.0, 0.3
/// n_nodes      = 9
/// quadrature   = trapezoidal
/// potential    = harmonic
/// potential_params = 1.0
/// ```
/// Blank lines and lines starting with `#` are ignored. Vectors are
/// comma-separated numbers. Unknown keys are an error.

#include "birkhoff/constants.hpp"
#include "birkhoff/optimizer.hpp"
#include "birkhoff/types.hpp"
#include "birkhoff/worker_pool.hpp"

#include <cstddef>
#include <optional>
#include <string>
#include <vector>

namespace birkhoff {

// ─── GeodesicConfig ───────────────────────────────────────────────────────────

struct GeodesicConfig {
    /// E of the Maupertuis principle.
    double total_energy = 0.0;

    /// Fixed endpoints; both must have the same dimension d.
    Configuration endpoint_a;
    Configuration endpoint_b;

    /// Nodes of the local curve, endpoints included.
    std::size_t n_nodes = 11;

    double      gradient_tolerance        = constants::DEFAULT_GRADIENT_TOLERANCE;
    double      functional_tolerance      = constants::DEFAULT_FUNCTIONAL_TOLERANCE;
    std::size_t max_iterations            = constants::DEFAULT_MAX_ITERATIONS;
    std::size_t bfgs_memory               = constants::DEFAULT_BFGS_MEMORY;
    std::size_t line_search_max_shrink    = constants::DEFAULT_LINE_SEARCH_MAX_SHRINK;
    double      line_search_shrink_factor = constants::DEFAULT_LINE_SEARCH_SHRINK_FACTOR;
    double      max_step_size             = constants::DEFAULT_MAX_STEP_SIZE;

    /// 0 evaluates on the coordinator thread.
    std::size_t worker_pool_size     = constants::DEFAULT_WORKER_POOL_SIZE;
    double      eval_timeout_seconds = constants::DEFAULT_EVAL_TIMEOUT_SECONDS;
    std::size_t eval_retry_count     = constants::DEFAULT_EVAL_RETRY_COUNT;

    QuadratureRule quadrature   = QuadratureRule::Trapezoidal;
    SearchSpace    search_space = SearchSpace::Full;

    double      reparam_ratio_threshold = constants::DEFAULT_REPARAM_RATIO_THRESHOLD;
    std::size_t refine_interval         = 0;
    std::size_t max_nodes               = 0;
    std::size_t history_capacity        = constants::DEFAULT_HISTORY_CAPACITY;
    double      metric_floor            = constants::DEFAULT_METRIC_FLOOR;

    /// Diagonal mass matrix; empty means all ones.
    MassWeights masses;

    // Global Birkhoff driver.
    std::size_t global_nodes       = 9;
    std::size_t local_nodes        = constants::DEFAULT_LOCAL_NODES;
    double      movement_tolerance = constants::DEFAULT_MOVEMENT_TOLERANCE;
    std::size_t max_sweeps         = constants::DEFAULT_MAX_SWEEPS;

    /// Built-in oracle for the CLI: "flat", "harmonic" or "gaussian_wells".
    std::string         potential = "harmonic";
    std::vector<double> potential_params;

    std::string log_level = "info";

    /// CSV destination for the final curve; empty writes nothing.
    std::string output;

    /// Dimension d of the endpoints.
    [[nodiscard]] std::size_t dimension() const noexcept {
        return static_cast<std::size_t>(endpoint_a.size());
    }

    /// First problem found, or `nullopt` if the configuration is usable.
    [[nodiscard]] std::optional<std::string> validate() const;

    /// Throws `ConfigError` with the message of `validate()`.
    void require_valid() const;

    [[nodiscard]] BfgsOptions bfgs_options() const;
    [[nodiscard]] comm::PoolOptions pool_options() const;
};

// ─── ConfigLoader ─────────────────────────────────────────────────────────────

class ConfigLoader {
public:
    /// Parse configuration text.
    ///
    /// # Returns
    /// `nullopt` on an unknown key, a malformed value or a failed
    /// `validate()`. When `error` is non-null it receives the reason, prefixed
    /// with the line number for syntax problems.
    [[nodiscard]] static std::optional<GeodesicConfig>
    parse_string(const std::string& text, std::string* error = nullptr);

    /// Read and parse a file. A file that cannot be opened yields `nullopt`.
    [[nodiscard]] static std::optional<GeodesicConfig>
    load_file(const std::string& path, std::string* error = nullptr);

    /// Comma-separated finite numbers, or `nullopt` if any token is malformed.
    [[nodiscard]] static std::optional<std::vector<double>>
    parse_vector(const std::string& value) noexcept;
};

} // namespace birkhoff
