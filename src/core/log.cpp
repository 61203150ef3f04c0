/// @file src/core/log.cpp
/// @brief Creation and level control of the engine logger.

#include "birkhoff/log.hpp"

#include <spdlog/sinks/stdout_color_sinks.h>

namespace birkhoff::log {

std::shared_ptr<spdlog::logger> get() {
    static const std::shared_ptr<spdlog::logger> logger = [] {
        if (auto existing = spdlog::get(LOGGER_NAME)) {
            return existing;
        }
        auto created = spdlog::stderr_color_mt(LOGGER_NAME);
        created->set_level(spdlog::level::info);
        created->set_pattern("[%H:%M:%S.%e] [%^%l%$] %v");
        return created;
    }();
    return logger;
}

bool set_level(const std::string& level) {
    const auto parsed = spdlog::level::from_str(level);
    // from_str maps unknown names to `off`; only accept `off` when asked for.
    if (parsed == spdlog::level::off && level != "off") {
        return false;
    }
    get()->set_level(parsed);
    return true;
}

} // namespace birkhoff::log
