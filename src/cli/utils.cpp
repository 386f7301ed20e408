//! # CLI Utilities
//!
//! Option lookup and help text shared by all commands.

#include "utils.hpp"

#include "common.hpp"

#include <iostream>

namespace fwtest::cli {

std::optional<std::string> option_value(int argc, char* argv[], const std::string& name) {
    std::string prefix = name + "=";
    std::optional<std::string> value;
    for (int i = 2; i < argc; ++i) {
        std::string arg = argv[i];
        if (arg.starts_with(prefix)) {
            value = arg.substr(prefix.size()); // last one wins
        }
    }
    return value;
}

std::vector<std::string> option_values(int argc, char* argv[], const std::string& name) {
    std::string prefix = name + "=";
    std::vector<std::string> values;
    for (int i = 2; i < argc; ++i) {
        std::string arg = argv[i];
        if (arg.starts_with(prefix)) {
            values.push_back(arg.substr(prefix.size()));
        }
    }
    return values;
}

std::vector<std::string> positional_args(int argc, char* argv[]) {
    std::vector<std::string> args;
    for (int i = 2; i < argc; ++i) {
        std::string arg = argv[i];
        if (!arg.starts_with("-")) {
            args.push_back(arg);
        }
    }
    return args;
}

void print_usage() {
    std::cout << "fwtest " << VERSION << "\n\n";
    std::cout << "Usage: fwtest <command> [options] [args]\n\n";
    std::cout << "Commands:\n";
    std::cout << "  run       Build and run the tests of a manifest\n";
    std::cout << "  list      List the tests of a manifest\n";
    std::cout << "  stub      Print the provider stub for test sources\n";
    std::cout << "  resolve   Print the platform metadata of a target\n";
    std::cout << "  inspect   Report embedded bitcode sections of a binary\n";
    std::cout << "\nOptions:\n";
    std::cout << "  --help, -h            Show this help\n";
    std::cout << "  --version, -V         Show version\n";
    std::cout << "  --manifest=<file>     Manifest to load (default: fwtest.toml)\n";
    std::cout << "  --test=<name>         Run only this test (repeatable)\n";
    std::cout << "  --jobs=<n>            Run up to n tests in parallel\n";
    std::cout << "  --no-color            Disable colored output\n";
    std::cout << "  --log-level=<level>   trace, debug, info, warn, error, off\n";
    std::cout << "  --log-filter=<spec>   Per-module levels (e.g. driver=debug,*=warn)\n";
    std::cout << "  --log-file=<path>     Also write logs to a file\n";
    std::cout << "  --log-format=json     Emit JSON log lines\n";
    std::cout << "  -v, -vv, -vvv, -q     Raise or lower verbosity\n";
}

void print_version() {
    std::cout << "fwtest " << VERSION << "\n";
}

} // namespace fwtest::cli
