//! # Log Initialization from the Environment
//!
//! Turns the `DEEPCLONE_LOG` and `DEEPCLONE_LOG_FILE` environment variables
//! into a LogConfig.

#include "log/log.hpp"

#include <cstdlib>

namespace deepclone::log {

LogConfig parse_log_spec(std::string_view spec) {
    LogConfig config;
    config.level = LogLevel::Warn; // Default: only warnings and above

    if (spec.empty()) {
        return config;
    }

    // '=' or ',' means a module filter spec, otherwise a single level name
    if (spec.find('=') != std::string_view::npos || spec.find(',') != std::string_view::npos) {
        config.filter_spec = std::string(spec);
    } else {
        config.level = parse_level(spec);
    }

    return config;
}

LogConfig config_from_env() {
    const char* env_log = std::getenv("DEEPCLONE_LOG");
    LogConfig config = parse_log_spec(env_log ? std::string_view(env_log) : std::string_view{});

    if (const char* env_file = std::getenv("DEEPCLONE_LOG_FILE")) {
        config.log_file = env_file;
    }

    return config;
}

} // namespace deepclone::log
