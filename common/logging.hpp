#pragma once

#include <spdlog/spdlog.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <cstdlib>
#include <memory>
#include <optional>
#include <string>

namespace washiwrap {
namespace logging {

// "trace", "debug", "info", "warn", "error", "off"
inline std::optional<spdlog::level::level_enum> level_from_name(const std::string& name) {
    if (name == "trace") return spdlog::level::trace;
    if (name == "debug") return spdlog::level::debug;
    if (name == "info") return spdlog::level::info;
    if (name == "warn") return spdlog::level::warn;
    if (name == "error") return spdlog::level::err;
    if (name == "off") return spdlog::level::off;
    return std::nullopt;
}

// Shared stderr logger; level from WASHIWRAP_LOG_LEVEL, info by default
inline std::shared_ptr<spdlog::logger> get_logger() {
    static std::shared_ptr<spdlog::logger> logger = []() {
        auto log = spdlog::stderr_color_mt("washiwrap");
        log->set_pattern("[%H:%M:%S.%e] [%^%l%$] %v");
        log->set_level(spdlog::level::info);

        const char* level_env = std::getenv("WASHIWRAP_LOG_LEVEL");
        if (level_env) {
            if (auto level = level_from_name(level_env)) {
                log->set_level(*level);
            } else {
                log->warn("Ignoring unknown WASHIWRAP_LOG_LEVEL '{}'", level_env);
            }
        }
        return log;
    }();
    return logger;
}

// Raise verbosity to debug unless the environment already asked for more
inline void enable_verbose() {
    auto log = get_logger();
    if (log->level() > spdlog::level::debug) {
        log->set_level(spdlog::level::debug);
    }
}

}  // namespace logging
}  // namespace washiwrap
