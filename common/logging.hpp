#pragma once

#include <spdlog/spdlog.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <cstdlib>
#include <memory>
#include <optional>
#include <string>

namespace envelopekit {
namespace logging {

// Level for a name in {trace, debug, info, warn, error, off}
inline std::optional<spdlog::level::level_enum> level_from_name(const std::string& name) {
    if (name == "trace") return spdlog::level::trace;
    if (name == "debug") return spdlog::level::debug;
    if (name == "info") return spdlog::level::info;
    if (name == "warn") return spdlog::level::warn;
    if (name == "error") return spdlog::level::err;
    if (name == "off") return spdlog::level::off;
    return std::nullopt;
}

// Process-wide logger on stderr, so stdout stays free for reports.
// Level comes from ENVELOPEKIT_LOG_LEVEL, default info.
inline std::shared_ptr<spdlog::logger> get_logger() {
    static std::shared_ptr<spdlog::logger> logger = []() {
        auto log = spdlog::stderr_color_mt("envelopekit");
        log->set_pattern("[%H:%M:%S.%e] [%^%l%$] %v");

        log->set_level(spdlog::level::info);
        if (const char* level_env = std::getenv("ENVELOPEKIT_LOG_LEVEL")) {
            if (auto level = level_from_name(level_env)) {
                log->set_level(*level);
            }
        }
        return log;
    }();
    return logger;
}

// CLI -v: at least debug, never less verbose than the environment asked for
inline void set_verbose(bool verbose) {
    auto log = get_logger();
    if (verbose && log->level() > spdlog::level::debug) {
        log->set_level(spdlog::level::debug);
    }
}

}  // namespace logging
}  // namespace envelopekit
