//! # Log Initialization from CLI
//!
//! Parses logging-related command-line arguments and the CANNYUP_LOG
//! environment variable into a LogConfig.

#include "log/log.hpp"

#include <string>

namespace cannyup::log {

/// Counts the `v`s of a -v / -vv / -vvv flag; 0 for anything else.
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
           arg.starts_with("--log-file=") || arg.starts_with("--log-format=") ||
           arg == "--verbose" || arg == "-q" || arg == "--quiet" || arg == "--no-color" ||
           verbosity_count(arg) > 0;
}

LogConfig parse_log_options(int argc, char* argv[], std::string_view env_value) {
    LogConfig config;

    bool has_cli_level = false;
    bool has_cli_filter = false;
    int v_count = 0;

    for (int i = 1; i < argc; ++i) {
        std::string_view arg = argv[i];

        if (arg.starts_with("--log-level=")) {
            config.level = parse_level(arg.substr(12));
            has_cli_level = true;
        } else if (arg.starts_with("--log-filter=")) {
            config.filter_spec = std::string(arg.substr(13));
            has_cli_filter = true;
        } else if (arg.starts_with("--log-file=")) {
            config.log_file = std::string(arg.substr(11));
        } else if (arg.starts_with("--log-format=")) {
            auto fmt = arg.substr(13);
            config.format = (fmt == "json" || fmt == "JSON") ? LogFormat::JSON : LogFormat::Text;
        } else if (arg == "-q" || arg == "--quiet") {
            config.level = LogLevel::Error;
            has_cli_level = true;
        } else if (arg == "--no-color") {
            config.colors = false;
        } else if (arg == "--verbose") {
            if (v_count == 0)
                v_count = 1;
        } else if (int count = verbosity_count(arg); count > v_count) {
            v_count = count;
        }
    }

    // -v = Info, -vv = Debug, -vvv = Trace (unless --log-level was given)
    if (!has_cli_level && v_count > 0) {
        if (v_count >= 3) {
            config.level = LogLevel::Trace;
        } else if (v_count == 2) {
            config.level = LogLevel::Debug;
        } else {
            config.level = LogLevel::Info;
        }
        has_cli_level = true;
    }

    if (!has_cli_level && !has_cli_filter && !env_value.empty()) {
        // "install=debug" or "probe,build" is a filter; anything else a level
        if (env_value.find('=') != std::string_view::npos ||
            env_value.find(',') != std::string_view::npos) {
            config.filter_spec = std::string(env_value);
        } else {
            config.level = parse_level(env_value);
        }
    }

    return config;
}

} // namespace cannyup::log
