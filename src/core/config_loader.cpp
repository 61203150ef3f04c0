/// @file src/core/config_loader.cpp
/// @brief GeodesicConfig validation and the `key = value` loader.

#include "birkhoff/config.hpp"
#include "birkhoff/errors.hpp"

#include <fmt/format.h>

#include <cmath>
#include <fstream>
#include <functional>
#include <map>
#include <sstream>

namespace birkhoff {

namespace {

std::string trim(const std::string& s) {
    const auto first = s.find_first_not_of(" \t\r\n");
    if (first == std::string::npos) return {};
    const auto last = s.find_last_not_of(" \t\r\n");
    return s.substr(first, last - first + 1);
}

std::optional<double> parse_double(const std::string& token) noexcept {
    const std::string t = trim(token);
    if (t.empty()) return std::nullopt;
    try {
        std::size_t pos = 0;
        const double v = std::stod(t, &pos);
        if (pos != t.size() || !std::isfinite(v)) return std::nullopt;
        return v;
    } catch (const std::exception&) {
        return std::nullopt;
    }
}

std::optional<std::size_t> parse_count(const std::string& token) noexcept {
    const std::string t = trim(token);
    if (t.empty() || t.find_first_not_of("0123456789") != std::string::npos) {
        return std::nullopt;
    }
    try {
        return static_cast<std::size_t>(std::stoull(t));
    } catch (const std::exception&) {
        return std::nullopt;
    }
}

using Setter = std::function<bool(GeodesicConfig&, const std::string&)>;

Setter real(double GeodesicConfig::*field) {
    return [field](GeodesicConfig& c, const std::string& v) {
        const auto d = parse_double(v);
        if (!d) return false;
        c.*field = *d;
        return true;
    };
}

Setter count(std::size_t GeodesicConfig::*field) {
    return [field](GeodesicConfig& c, const std::string& v) {
        const auto n = parse_count(v);
        if (!n) return false;
        c.*field = *n;
        return true;
    };
}

Setter vec(Eigen::VectorXd GeodesicConfig::*field) {
    return [field](GeodesicConfig& c, const std::string& v) {
        const auto values = ConfigLoader::parse_vector(v);
        if (!values) return false;
        c.*field = Eigen::Map<const Eigen::VectorXd>(values->data(),
                                                      static_cast<Eigen::Index>(values->size()));
        return true;
    };
}

Setter text(std::string GeodesicConfig::*field) {
    return [field](GeodesicConfig& c, const std::string& v) {
        c.*field = v;
        return !v.empty();
    };
}

const std::map<std::string, Setter>& setters() {
    static const std::map<std::string, Setter> table = {
        {"total_energy",              real(&GeodesicConfig::total_energy)},
        {"endpoint_a",                vec(&GeodesicConfig::endpoint_a)},
        {"endpoint_b",                vec(&GeodesicConfig::endpoint_b)},
        {"n_nodes",                   count(&GeodesicConfig::n_nodes)},
        {"gradient_tolerance",        real(&GeodesicConfig::gradient_tolerance)},
        {"functional_tolerance",      real(&GeodesicConfig::functional_tolerance)},
        {"max_iterations",            count(&GeodesicConfig::max_iterations)},
        {"bfgs_memory",               count(&GeodesicConfig::bfgs_memory)},
        {"line_search_max_shrink",    count(&GeodesicConfig::line_search_max_shrink)},
        {"line_search_shrink_factor", real(&GeodesicConfig::line_search_shrink_factor)},
        {"max_step_size",             real(&GeodesicConfig::max_step_size)},
        {"worker_pool_size",          count(&GeodesicConfig::worker_pool_size)},
        {"eval_timeout_seconds",      real(&GeodesicConfig::eval_timeout_seconds)},
        {"eval_retry_count",          count(&GeodesicConfig::eval_retry_count)},
        {"reparam_ratio_threshold",   real(&GeodesicConfig::reparam_ratio_threshold)},
        {"refine_interval",           count(&GeodesicConfig::refine_interval)},
        {"max_nodes",                 count(&GeodesicConfig::max_nodes)},
        {"history_capacity",          count(&GeodesicConfig::history_capacity)},
        {"metric_floor",              real(&GeodesicConfig::metric_floor)},
        {"masses",                    vec(&GeodesicConfig::masses)},
        {"global_nodes",              count(&GeodesicConfig::global_nodes)},
        {"local_nodes",               count(&GeodesicConfig::local_nodes)},
        {"movement_tolerance",        real(&GeodesicConfig::movement_tolerance)},
        {"max_sweeps",                count(&GeodesicConfig::max_sweeps)},
        {"potential",                 text(&GeodesicConfig::potential)},
        {"log_level",                 text(&GeodesicConfig::log_level)},
        {"output",                    text(&GeodesicConfig::output)},
        {"potential_params",
         [](GeodesicConfig& c, const std::string& v) {
             auto values = ConfigLoader::parse_vector(v);
             if (!values) return false;
             c.potential_params = std::move(*values);
             return true;
         }},
        {"quadrature",
         [](GeodesicConfig& c, const std::string& v) {
             if (v == "trapezoidal") c.quadrature = QuadratureRule::Trapezoidal;
             else if (v == "midpoint") c.quadrature = QuadratureRule::Midpoint;
             else return false;
             return true;
         }},
        {"search_space",
         [](GeodesicConfig& c, const std::string& v) {
             if (v == "full") c.search_space = SearchSpace::Full;
             else if (v == "orthogonal") c.search_space = SearchSpace::Orthogonal;
             else return false;
             return true;
         }},
    };
    return table;
}

void set_error(std::string* error, std::string message) {
    if (error) *error = std::move(message);
}

} // namespace

// ─── GeodesicConfig ───────────────────────────────────────────────────────────

std::optional<std::string> GeodesicConfig::validate() const {
    if (!std::isfinite(total_energy)) return "total_energy must be finite";
    if (endpoint_a.size() == 0) return "endpoint_a is missing";
    if (endpoint_b.size() != endpoint_a.size()) {
        return fmt::format("endpoint_b has {} coordinates, endpoint_a has {}",
                           endpoint_b.size(), endpoint_a.size());
    }
    if (masses.size() != 0) {
        if (masses.size() != endpoint_a.size()) {
            return fmt::format("masses has {} entries, expected {}", masses.size(),
                               endpoint_a.size());
        }
        if (!(masses.array() > 0.0).all()) return "masses must be positive";
    }
    if (n_nodes < 2) return "n_nodes must be at least 2";
    if (max_nodes != 0 && max_nodes < n_nodes) return "max_nodes must be 0 or at least n_nodes";
    if (!(gradient_tolerance >= 0.0)) return "gradient_tolerance must be non-negative";
    if (!(functional_tolerance >= 0.0)) return "functional_tolerance must be non-negative";
    if (!(line_search_shrink_factor > 0.0 && line_search_shrink_factor < 1.0)) {
        return "line_search_shrink_factor must lie in (0, 1)";
    }
    if (!(max_step_size > 0.0)) return "max_step_size must be positive";
    if (!(eval_timeout_seconds > 0.0)) return "eval_timeout_seconds must be positive";
    if (!(metric_floor > 0.0)) return "metric_floor must be positive";
    if (global_nodes < 3) return "global_nodes must be at least 3";
    if (local_nodes < 3 || local_nodes % 2 == 0) return "local_nodes must be odd and at least 3";
    if (!(movement_tolerance >= 0.0)) return "movement_tolerance must be non-negative";
    return std::nullopt;
}

void GeodesicConfig::require_valid() const {
    if (const auto problem = validate()) throw ConfigError(*problem);
}

BfgsOptions GeodesicConfig::bfgs_options() const {
    BfgsOptions o;
    o.quadrature                = quadrature;
    o.search_space              = search_space;
    o.masses                    = masses;
    o.gradient_tolerance        = gradient_tolerance;
    o.functional_tolerance      = functional_tolerance;
    o.max_iterations            = max_iterations;
    o.bfgs_memory               = bfgs_memory;
    o.line_search_max_shrink    = line_search_max_shrink;
    o.line_search_shrink_factor = line_search_shrink_factor;
    o.max_step_size             = max_step_size;
    o.reparam_ratio_threshold   = reparam_ratio_threshold;
    o.refine_interval           = refine_interval;
    o.max_nodes                 = max_nodes;
    o.history_capacity          = history_capacity;
    return o;
}

comm::PoolOptions GeodesicConfig::pool_options() const {
    comm::PoolOptions o;
    o.eval_timeout = std::chrono::duration<double>(eval_timeout_seconds);
    o.retry_count  = eval_retry_count;
    return o;
}

// ─── ConfigLoader ─────────────────────────────────────────────────────────────

std::optional<std::vector<double>> ConfigLoader::parse_vector(const std::string& value) noexcept {
    std::vector<double> out;
    std::string token;
    std::istringstream ss(value);
    while (std::getline(ss, token, ',')) {
        const auto v = parse_double(token);
        if (!v) return std::nullopt;
        out.push_back(*v);
    }
    if (out.empty()) return std::nullopt;
    // A trailing comma leaves an empty final token that getline drops.
    if (!value.empty() && trim(value).back() == ',') return std::nullopt;
    return out;
}

std::optional<GeodesicConfig> ConfigLoader::parse_string(const std::string& text,
                                                         std::string* error) {
    GeodesicConfig cfg;
    std::istringstream in(text);
    std::string line;
    std::size_t line_no = 0;
    while (std::getline(in, line)) {
        ++line_no;
        const std::string content = trim(line);
        if (content.empty() || content[0] == '#') continue;

        const auto eq = content.find('=');
        if (eq == std::string::npos) {
            set_error(error, fmt::format("line {}: expected key = value", line_no));
            return std::nullopt;
        }
        const std::string key   = trim(content.substr(0, eq));
        const std::string value = trim(content.substr(eq + 1));

        const auto it = setters().find(key);
        if (it == setters().end()) {
            set_error(error, fmt::format("line {}: unknown key '{}'", line_no, key));
            return std::nullopt;
        }
        if (!it->second(cfg, value)) {
            set_error(error, fmt::format("line {}: bad value '{}' for {}", line_no, value, key));
            return std::nullopt;
        }
    }

    if (const auto problem = cfg.validate()) {
        set_error(error, *problem);
        return std::nullopt;
    }
    return cfg;
}

std::optional<GeodesicConfig> ConfigLoader::load_file(const std::string& path,
                                                      std::string* error) {
    std::ifstream file(path);
    if (!file.is_open()) {
        set_error(error, fmt::format("cannot open '{}'", path));
        return std::nullopt;
    }
    std::ostringstream buf;
    buf << file.rdbuf();
    return parse_string(buf.str(), error);
}

} // namespace birkhoff
