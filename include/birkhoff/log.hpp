#pragma once

/// @file include/birkhoff/log.hpp
/// @brief Named spdlog logger shared by every module.
///
/// Modules fetch the logger once per call site and log through the
/// `SPDLOG_LOGGER_*` macros:
/// ```cpp
/// auto logger = birkhoff::log::get();
/// SPDLOG_LOGGER_INFO(logger, "converged after {} iterations", n);
/// ```

#include <spdlog/spdlog.h>

#include <memory>
#include <string>

namespace birkhoff::log {

/// Name under which the logger is registered with spdlog.
inline constexpr const char* LOGGER_NAME = "birkhoff";

/// The engine logger, created on first use with a stderr sink at `info`.
[[nodiscard]] std::shared_ptr<spdlog::logger> get();

/// Set the level from a name ("trace", "debug", "info", "warn", "error",
/// "critical", "off").
///
/// # Returns
/// false if the name is not recognised; the level is then unchanged.
bool set_level(const std::string& level);

} // namespace birkhoff::log
