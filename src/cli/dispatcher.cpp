//! # CLI Command Dispatcher
//!
//! This file implements the main entry point for the fwtest CLI.
//! It configures logging, loads the manifest when the command needs one, and
//! routes to the command handler.
//!
//! ## Architecture
//!
//! ```text
//! fwtest_main()
//!   ├─ --help, -h     → print_usage()
//!   ├─ --version, -V  → print_version()
//!   ├─ run            → run_tests()
//!   ├─ list           → run_list()
//!   ├─ stub           → run_stub()
//!   ├─ resolve        → run_resolve()
//!   └─ inspect        → run_inspect()
//! ```
//!
//! ## Global Flags
//!
//! Logging flags (`--log-level=`, `-v`, `-q`, ...) are accepted by every command.

#include "commands.hpp"
#include "common.hpp"
#include "driver.hpp"
#include "log/log.hpp"
#include "manifest.hpp"
#include "utils.hpp"

#include <iostream>
#include <memory>
#include <string>
#include <unistd.h>
#include <vector>

using namespace fwtest;
using namespace fwtest::cli;

static Result<Manifest, HarnessError> load_manifest(int argc, char* argv[]) {
    fs::path path = option_value(argc, argv, "--manifest").value_or(MANIFEST_FILE);
    return Manifest::load(path);
}

/// Main entry point for the fwtest CLI.
///
/// ## Return Codes
///
/// | Code | Meaning                                      |
/// |------|----------------------------------------------|
/// | 0    | Success (for `run`: every selected test passed) |
/// | 1    | Test failure, configuration or tool error    |
///
/// ## Examples
///
/// ```bash
/// fwtest run                          # Run every test in ./fwtest.toml
/// fwtest run --test=values --jobs=4   # Run one test
/// fwtest resolve ios_arm64            # Show toolchain facts for a target
/// ```
int fwtest_main(int argc, char* argv[]) {
    auto log_config = fwtest::log::parse_log_options(argc, argv);
    fwtest::log::Logger::instance().configure(log_config);

    if (argc < 2) {
        print_usage();
        return 0;
    }

    std::string command = argv[1];
    bool no_color = false;
    for (int i = 2; i < argc; ++i) {
        if (std::string(argv[i]) == "--no-color") {
            no_color = true;
        }
    }
    ColorOutput c(!no_color && ::isatty(STDOUT_FILENO));

    if (command == "--help" || command == "-h") {
        print_usage();
        return 0;
    }

    if (command == "--version" || command == "-V") {
        print_version();
        return 0;
    }

    if (command == "run") {
        auto manifest = load_manifest(argc, argv);
        if (is_err(manifest)) {
            std::cerr << unwrap_err(manifest).to_string() << "\n";
            return 1;
        }
        auto configs = unwrap(manifest).test_configs(option_values(argc, argv, "--test"));
        if (is_err(configs)) {
            std::cerr << unwrap_err(configs).to_string() << "\n";
            return 1;
        }

        unsigned int jobs = 1;
        if (auto value = option_value(argc, argv, "--jobs")) {
            try {
                jobs = static_cast<unsigned int>(std::stoul(*value));
            } catch (const std::exception&) {
                std::cerr << "Invalid --jobs value: " << *value << "\n";
                return 1;
            }
        }
        return run_tests(unwrap(manifest), unwrap(configs), jobs, c,
                         [] { return std::make_unique<harness::SubprocessRunner>(); });
    }

    if (command == "list") {
        auto manifest = load_manifest(argc, argv);
        if (is_err(manifest)) {
            std::cerr << unwrap_err(manifest).to_string() << "\n";
            return 1;
        }
        return run_list(unwrap(manifest), c);
    }

    if (command == "stub") {
        return run_stub(positional_args(argc, argv));
    }

    if (command == "resolve") {
        auto args = positional_args(argc, argv);
        if (args.size() != 1) {
            std::cerr << "Usage: fwtest resolve <target> [--manifest=<file>]\n";
            return 1;
        }
        // Toolchain overrides come from the manifest when one is named or present
        harness::ToolchainSettings toolchain;
        auto manifest_path = option_value(argc, argv, "--manifest");
        if (manifest_path || fs::exists(MANIFEST_FILE)) {
            auto manifest = load_manifest(argc, argv);
            if (is_err(manifest)) {
                std::cerr << unwrap_err(manifest).to_string() << "\n";
                return 1;
            }
            toolchain = unwrap(manifest).toolchain;
        }
        return run_resolve(args[0], toolchain);
    }

    if (command == "inspect") {
        auto args = positional_args(argc, argv);
        if (args.size() != 1) {
            std::cerr << "Usage: fwtest inspect <binary>\n";
            return 1;
        }
        return run_inspect(args[0]);
    }

    std::cerr << "Unknown command: " << command << "\n";
    std::cerr << "Run 'fwtest --help' for usage information.\n";
    return 1;
}
