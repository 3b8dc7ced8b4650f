#pragma once

#include <spdlog/spdlog.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <cstdlib>
#include <memory>
#include <optional>
#include <string>

namespace funnel {
namespace logging {

constexpr const char* LOGGER_NAME = "funnel";
constexpr const char* LEVEL_VARIABLE = "FUNNEL_LOG_LEVEL";

// Threshold for a level name ("trace" ... "critical", "off"; spdlog also
// accepts "warning" and "err"). Unknown names give nullopt.
inline std::optional<spdlog::level::level_enum> parse_level(const std::string& name) {
    spdlog::level::level_enum level = spdlog::level::from_str(name);
    // from_str maps every unknown name to off
    if (level == spdlog::level::off && name != "off") {
        return std::nullopt;
    }
    return level;
}

inline std::shared_ptr<spdlog::logger> get_logger() {
    static std::shared_ptr<spdlog::logger> logger = []() {
        auto log = spdlog::stderr_color_mt(LOGGER_NAME);
        log->set_pattern("[%H:%M:%S.%e] [%^%l%$] %v");
        log->set_level(spdlog::level::info);

        if (const char* level_env = std::getenv(LEVEL_VARIABLE)) {
            if (auto level = parse_level(level_env)) {
                log->set_level(*level);
            } else {
                log->warn("Ignoring {}={}: not a log level", LEVEL_VARIABLE, level_env);
            }
        }

        return log;
    }();
    return logger;
}

// Set the threshold by name; returns false and leaves it unchanged when the
// name is unknown.
inline bool set_level(const std::string& name) {
    auto level = parse_level(name);
    if (!level) {
        return false;
    }
    get_logger()->set_level(*level);
    return true;
}

// Lower the threshold to debug unless the environment asked for trace
inline void enable_verbose() {
    auto log = get_logger();
    if (log->level() > spdlog::level::debug) {
        log->set_level(spdlog::level::debug);
    }
}

}  // namespace logging
}  // namespace funnel
