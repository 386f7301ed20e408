//! # Test Targets
//!
//! The closed set of platform targets the harness knows by name. Every mapping
//! over `Target` is an exhaustive `switch` without a `default:` label, and the
//! build turns `-Wswitch` into an error, so adding a target forces every mapping
//! site to be updated.
//!
//! `LinuxX64` and `MingwX64` are recognised names that the resolver rejects with
//! an `UnsupportedTarget` error: framework tests only exist for Apple platforms.

#pragma once

#include "common.hpp"
#include "harness/error.hpp"

#include <array>
#include <string_view>

namespace fwtest::harness {

enum class Target {
    IosX64,
    IosArm32,
    IosArm64,
    TvosX64,
    TvosArm64,
    MacosX64,
    WatchosArm32,
    WatchosArm64,
    WatchosX86,
    WatchosX64,
    LinuxX64,
    MingwX64,
};

inline constexpr std::array<Target, 12> ALL_TARGETS = {
    Target::IosX64,     Target::IosArm32,     Target::IosArm64,     Target::TvosX64,
    Target::TvosArm64,  Target::MacosX64,     Target::WatchosArm32, Target::WatchosArm64,
    Target::WatchosX86, Target::WatchosX64,   Target::LinuxX64,     Target::MingwX64,
};

/// Configuration name of a target (e.g., "ios_x64"). Also the directory name
/// under which framework bundles are produced.
const char* target_name(Target target);

/// Parses a configuration name; unknown names are an `UnsupportedTarget` error.
Result<Target, HarnessError> parse_target(std::string_view name);

} // namespace fwtest::harness
