#pragma once

#include <spdlog/spdlog.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <cstdlib>
#include <memory>
#include <string>

namespace traitgalaxy {
namespace logging {

// Map a level name to an spdlog level; unknown names fall back to info
inline spdlog::level::level_enum parse_level(const std::string& level) {
    if (level == "trace") return spdlog::level::trace;
    if (level == "debug") return spdlog::level::debug;
    if (level == "info") return spdlog::level::info;
    if (level == "warn") return spdlog::level::warn;
    if (level == "error") return spdlog::level::err;
    if (level == "off") return spdlog::level::off;
    return spdlog::level::info;
}

// Shared logger for the simulation core and the CLI.
// Level comes from TRAITGALAXY_LOG_LEVEL (default: info).
inline std::shared_ptr<spdlog::logger> get_logger() {
    static std::shared_ptr<spdlog::logger> logger = []() {
        auto log = spdlog::stderr_color_mt("traitgalaxy");
        log->set_pattern("[%H:%M:%S.%e] [%^%l%$] %v");

        const char* level_env = std::getenv("TRAITGALAXY_LOG_LEVEL");
        log->set_level(level_env ? parse_level(level_env) : spdlog::level::info);

        return log;
    }();
    return logger;
}

}  // namespace logging
}  // namespace traitgalaxy
