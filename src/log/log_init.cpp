//! # Logging Options
//!
//! Turns the logging flags of any `fwtest` command line into a `LogConfig`.
//!
//! | Flag                 | Effect                                   |
//! |----------------------|------------------------------------------|
//! | `--log-level=<lvl>`  | Default threshold                        |
//! | `--log-filter=<f>`   | Module rules, e.g. `process=trace`       |
//! | `--log-file=<path>`  | Also append records to a file            |
//! | `--log-format=json`  | JSON lines instead of text               |
//! | `-v`, `-vv`, `-vvv`  | Info, Debug, Trace                       |
//! | `-q`, `--quiet`      | Errors only                              |
//! | `--no-color`         | Plain console output                     |

#include "log/log.hpp"

#include <algorithm>
#include <cstdlib>
#include <iostream>
#include <string>

namespace fwtest::log {

namespace {

/// Threshold for a run of `v`s after the dash (`-vv` is 2).
std::optional<LogLevel> verbosity_level(std::string_view arg) {
    if (arg.size() < 2 || arg[0] != '-' || arg.find_first_not_of('v', 1) != std::string_view::npos) {
        return std::nullopt;
    }
    switch (arg.size() - 1) {
    case 1:
        return LogLevel::Info;
    case 2:
        return LogLevel::Debug;
    default:
        return LogLevel::Trace;
    }
}

std::optional<std::string_view> flag_value(std::string_view arg, std::string_view flag) {
    if (arg.size() > flag.size() && arg.substr(0, flag.size()) == flag && arg[flag.size()] == '=') {
        return arg.substr(flag.size() + 1);
    }
    return std::nullopt;
}

} // namespace

LogConfig parse_log_options(int argc, char* argv[]) {
    LogConfig config;
    std::optional<LogLevel> explicit_level;
    std::optional<LogLevel> verbose_level;
    bool has_filter = false;

    for (int i = 1; i < argc; ++i) {
        std::string_view arg = argv[i];

        if (auto value = flag_value(arg, "--log-level")) {
            explicit_level = parse_level(*value);
            if (!explicit_level) {
                std::cerr << "warning: unknown log level '" << *value << "'\n";
            }
        } else if (auto value = flag_value(arg, "--log-filter")) {
            config.filter = std::string(*value);
            has_filter = true;
        } else if (auto value = flag_value(arg, "--log-file")) {
            config.log_file = std::string(*value);
        } else if (auto value = flag_value(arg, "--log-format")) {
            config.format = (*value == "json" || *value == "JSON") ? LogFormat::JSON : LogFormat::Text;
        } else if (arg == "--no-color") {
            config.colors = false;
        } else if (arg == "-q" || arg == "--quiet") {
            explicit_level = LogLevel::Error;
        } else if (arg == "--verbose") {
            verbose_level = std::min(verbose_level.value_or(LogLevel::Info), LogLevel::Info);
        } else if (auto level = verbosity_level(arg)) {
            verbose_level = std::min(verbose_level.value_or(*level), *level);
        }
    }

    if (explicit_level) {
        config.level = *explicit_level;
    } else if (verbose_level) {
        config.level = *verbose_level;
    } else if (!has_filter) {
        const char* env = std::getenv("FWTEST_LOG");
        std::string_view value = env ? env : "";
        if (value.find_first_of("=,") != std::string_view::npos) {
            config.filter = std::string(value);
        } else if (auto level = parse_level(value)) {
            config.level = *level;
        }
    }

    return config;
}

} // namespace fwtest::log
