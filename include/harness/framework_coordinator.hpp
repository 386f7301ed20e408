//! # Framework Build Coordinator
//!
//! Prepares the prebuilt framework bundles of a test for linking. For each
//! framework, in link order:
//!
//! 1. locate `{outputRoot}/{testName}/{targetName}/{artifact}.framework`
//! 2. validate its embedded bitcode
//! 3. ad-hoc sign the bundle (`codesign --verbose -s - <bundle>`) when enabled
//!
//! The first failure aborts the loop. Bundles are never built here.

#pragma once

#include "common.hpp"
#include "harness/bitcode.hpp"
#include "harness/error.hpp"
#include "harness/process.hpp"
#include "harness/run_config.hpp"

namespace fwtest::harness {

class FrameworkCoordinator {
public:
    FrameworkCoordinator(const HarnessSettings& settings, BitcodeValidator& validator,
                         ProcessRunner& runner)
        : settings_(settings), validator_(validator), runner_(runner) {}

    Result<bool, HarnessError> prepare(const TestRunConfig& config);

private:
    Result<bool, HarnessError> codesign(const fs::path& bundle_dir);

    const HarnessSettings& settings_;
    BitcodeValidator& validator_;
    ProcessRunner& runner_;
};

} // namespace fwtest::harness
