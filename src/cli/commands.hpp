//! # CLI Commands
//!
//! | Command   | Handler         | Needs manifest |
//! |-----------|-----------------|----------------|
//! | `run`     | `run_tests()`   | yes            |
//! | `list`    | `run_list()`    | yes            |
//! | `stub`    | `run_stub()`    | no             |
//! | `resolve` | `run_resolve()` | optional       |
//! | `inspect` | `run_inspect()` | no             |
//!
//! Every handler returns the process exit code.

#pragma once

#include "harness/error.hpp"
#include "harness/process.hpp"
#include "harness/test_driver.hpp"
#include "manifest.hpp"
#include "utils.hpp"

#include <cstdint>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace fwtest::cli {

/// Result of one test as reported by `run`.
struct TestOutcome {
    std::string name;
    harness::RunState state = harness::RunState::NotBuilt;
    std::optional<HarnessError> error;
    int64_t duration_ms = 0;
};

/// Builds the harness stack for `manifest` on top of `runner` and runs one test.
TestOutcome run_one(const Manifest& manifest, const harness::TestRunConfig& config,
                    harness::ProcessRunner& runner);

/// Makes the process runner for one worker thread.
using RunnerFactory = std::function<std::unique_ptr<harness::ProcessRunner>()>;

/// Runs `configs` on up to `jobs` worker threads (0 = half the hardware
/// threads), each with its own runner from `make_runner`. Exit code 0 iff all
/// passed.
int run_tests(const Manifest& manifest, const std::vector<harness::TestRunConfig>& configs,
              unsigned int jobs, const ColorOutput& c, const RunnerFactory& make_runner);

int run_list(const Manifest& manifest, const ColorOutput& c);
int run_stub(const std::vector<std::string>& files);
int run_resolve(const std::string& target, const harness::ToolchainSettings& toolchain);
int run_inspect(const std::string& binary);

} // namespace fwtest::cli
