//! # CLI Utilities Interface
//!
//! This header defines shared utility functions for the CLI.
//!
//! ## Functions
//!
//! | Function              | Description                        |
//! |-----------------------|------------------------------------|
//! | `option_value()`      | Value of a `--name=value` option   |
//! | `option_values()`     | Every value of a repeated option   |
//! | `print_usage()`       | Print CLI help text                |
//! | `print_version()`     | Print harness version              |

#pragma once
#include <optional>
#include <string>
#include <vector>

namespace fwtest::cli {

// ANSI color codes
namespace colors {
inline const char* reset = "\033[0m";
inline const char* bold = "\033[1m";
inline const char* dim = "\033[2m";
inline const char* red = "\033[31m";
inline const char* green = "\033[32m";
inline const char* yellow = "\033[33m";
inline const char* cyan = "\033[36m";
} // namespace colors

struct ColorOutput {
    bool enabled;

    ColorOutput(bool use_color) : enabled(use_color) {}

    const char* reset() const {
        return enabled ? colors::reset : "";
    }
    const char* bold() const {
        return enabled ? colors::bold : "";
    }
    const char* dim() const {
        return enabled ? colors::dim : "";
    }
    const char* red() const {
        return enabled ? colors::red : "";
    }
    const char* green() const {
        return enabled ? colors::green : "";
    }
    const char* yellow() const {
        return enabled ? colors::yellow : "";
    }
    const char* cyan() const {
        return enabled ? colors::cyan : "";
    }
};

// Option parsing
std::optional<std::string> option_value(int argc, char* argv[], const std::string& name);
std::vector<std::string> option_values(int argc, char* argv[], const std::string& name);

/// Positional arguments after the command, skipping options.
std::vector<std::string> positional_args(int argc, char* argv[]);

// Help text
void print_usage();
void print_version();

} // namespace fwtest::cli
