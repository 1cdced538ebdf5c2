#pragma once

#include <spdlog/spdlog.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <cstdlib>
#include <memory>
#include <optional>
#include <string>

namespace kgviz {
namespace logging {

// Map a level name (trace, debug, info, warn, error, off) to spdlog
inline std::optional<spdlog::level::level_enum> parse_level(const std::string& name) {
    if (name == "trace") return spdlog::level::trace;
    if (name == "debug") return spdlog::level::debug;
    if (name == "info") return spdlog::level::info;
    if (name == "warn" || name == "warning") return spdlog::level::warn;
    if (name == "error") return spdlog::level::err;
    if (name == "off") return spdlog::level::off;
    return std::nullopt;
}

// Shared stderr logger. KGVIZ_LOG_LEVEL selects the initial level,
// info when unset or unrecognized.
inline std::shared_ptr<spdlog::logger> get_logger() {
    static std::shared_ptr<spdlog::logger> logger = []() {
        auto log = spdlog::stderr_color_mt("kgviz");
        log->set_pattern("[%H:%M:%S.%e] [%^%l%$] %v");
        log->set_level(spdlog::level::info);

        if (const char* level_env = std::getenv("KGVIZ_LOG_LEVEL")) {
            if (auto level = parse_level(level_env)) {
                log->set_level(*level);
            } else {
                log->warn("Ignoring unknown KGVIZ_LOG_LEVEL '{}'", level_env);
            }
        }
        return log;
    }();
    return logger;
}

// Change the level at runtime; returns false for an unknown name
inline bool set_level(const std::string& name) {
    auto level = parse_level(name);
    if (!level) {
        return false;
    }
    get_logger()->set_level(*level);
    return true;
}

}  // namespace logging
}  // namespace kgviz
