//! # Log Initialization from CLI
//!
//! Turns logging flags and the MAPLINT_LOG environment variable into a
//! LogConfig.

#include "maplint/log/log.hpp"

#include <algorithm>
#include <cstdlib>
#include <string>

namespace maplint::log {

/// Returns N for "-v", "-vv", ... and 0 for anything else.
static int verbosity_count(std::string_view arg) {
    if (arg.size() < 2 || arg[0] != '-' || arg[1] == '-')
        return 0;
    for (size_t j = 1; j < arg.size(); ++j) {
        if (arg[j] != 'v')
            return 0;
    }
    return static_cast<int>(arg.size() - 1);
}

bool is_log_option(std::string_view arg) {
    return arg.starts_with("--log-level=") || arg.starts_with("--log-filter=") ||
           arg.starts_with("--log-file=") || arg.starts_with("--log-format=") || arg == "-q" ||
           arg == "--verbose" || verbosity_count(arg) > 0;
}

LogConfig parse_log_options(int argc, char* argv[]) {
    LogConfig config;
    config.level = LogLevel::Warn;

    bool has_cli_level = false;
    bool has_cli_filter = false;
    int v_count = 0;

    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];

        if (arg.starts_with("--log-level=")) {
            config.level = parse_level(arg.substr(12));
            has_cli_level = true;
        } else if (arg.starts_with("--log-filter=")) {
            config.filter_spec = arg.substr(13);
            has_cli_filter = true;
        } else if (arg.starts_with("--log-file=")) {
            config.log_file = arg.substr(11);
        } else if (arg.starts_with("--log-format=")) {
            std::string fmt = arg.substr(13);
            config.format = (fmt == "json" || fmt == "JSON") ? LogFormat::JSON : LogFormat::Text;
        } else if (arg == "-q") {
            config.level = LogLevel::Error;
            has_cli_level = true;
        } else if (arg == "--verbose") {
            v_count = std::max(v_count, 1);
        } else {
            v_count = std::max(v_count, verbosity_count(arg));
        }
    }

    if (!has_cli_level && v_count > 0) {
        config.level = v_count >= 3 ? LogLevel::Trace
                                    : (v_count == 2 ? LogLevel::Debug : LogLevel::Info);
        has_cli_level = true;
    }

    if (!has_cli_level && !has_cli_filter) {
        const char* env_log = std::getenv("MAPLINT_LOG");
        std::string env_str = env_log ? env_log : "";
        if (!env_str.empty()) {
            // "module=level" specs and bare module lists are filters; anything else is a level.
            if (env_str.find('=') != std::string::npos || env_str.find(',') != std::string::npos) {
                config.filter_spec = env_str;
            } else {
                config.level = parse_level(env_str);
            }
        }
    }

    return config;
}

} // namespace maplint::log
