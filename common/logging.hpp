#pragma once

#include <spdlog/spdlog.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <cstdlib>
#include <memory>
#include <string>

namespace sectionpath {
namespace logging {

// Maps a SECTIONPATH_LOG_LEVEL value onto an spdlog level; unknown values fall back to info
inline spdlog::level::level_enum level_from_string(const std::string& level) {
    if (level == "trace") return spdlog::level::trace;
    if (level == "debug") return spdlog::level::debug;
    if (level == "warn") return spdlog::level::warn;
    if (level == "error") return spdlog::level::err;
    if (level == "off") return spdlog::level::off;
    return spdlog::level::info;
}

inline std::shared_ptr<spdlog::logger> get_logger() {
    static std::shared_ptr<spdlog::logger> logger = []() {
        auto existing = spdlog::get("sectionpath");
        if (existing) {
            return existing;
        }

        auto log = spdlog::stderr_color_mt("sectionpath");
        log->set_pattern("[%H:%M:%S.%e] [%^%l%$] %v");

        const char* level_env = std::getenv("SECTIONPATH_LOG_LEVEL");
        log->set_level(level_env ? level_from_string(level_env) : spdlog::level::info);

        return log;
    }();
    return logger;
}

}  // namespace logging
}  // namespace sectionpath
