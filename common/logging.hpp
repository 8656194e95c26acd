#ifndef BIKECALC_COMMON_LOGGING_HPP
#define BIKECALC_COMMON_LOGGING_HPP

#include <spdlog/spdlog.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <cstdlib>
#include <memory>
#include <optional>
#include <string>

namespace bikecalc {
namespace logging {

// Map a level name (trace, debug, info, warn, error, off) to an spdlog level
inline std::optional<spdlog::level::level_enum> parse_level(const std::string& level) {
    if (level == "trace") return spdlog::level::trace;
    if (level == "debug") return spdlog::level::debug;
    if (level == "info") return spdlog::level::info;
    if (level == "warn") return spdlog::level::warn;
    if (level == "error") return spdlog::level::err;
    if (level == "off") return spdlog::level::off;
    return std::nullopt;
}

inline std::shared_ptr<spdlog::logger> get_logger() {
    static std::shared_ptr<spdlog::logger> logger = []() {
        auto log = spdlog::stderr_color_mt("bikecalc");
        log->set_pattern("[%H:%M:%S.%e] [%^%l%$] %v");

        // Set log level from environment variable
        log->set_level(spdlog::level::info);
        const char* level_env = std::getenv("BIKECALC_LOG_LEVEL");
        if (level_env) {
            if (auto level = parse_level(level_env)) {
                log->set_level(*level);
            }
        }

        return log;
    }();
    return logger;
}

}  // namespace logging
}  // namespace bikecalc

#endif // BIKECALC_COMMON_LOGGING_HPP
