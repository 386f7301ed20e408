//! # Run Configuration
//!
//! Declarative inputs of one test run and the on-disk layout derived from them.
//!
//! ## Layout
//!
//! ```text
//! {outputRoot}/{testName}/
//! ├── {targetName}/{artifact}.framework/{artifact}   framework binaries (prebuilt)
//! ├── provider.swift                                 generated stub
//! └── swiftTestExecutable                            linked test binary
//! ```
//!
//! A `TestRunConfig` is only obtainable through `TestRunConfigBuilder::build()`,
//! which rejects incomplete configurations with a named error.

#pragma once

#include "common.hpp"
#include "harness/error.hpp"
#include "harness/target.hpp"

#include <filesystem>
#include <string>
#include <string_view>
#include <vector>

namespace fs = std::filesystem;

namespace fwtest::harness {

// ============================================================================
// Declarations
// ============================================================================

struct FrameworkDescriptor {
    std::string name;
    std::vector<fs::path> sources;
    bool embed_bitcode = false;
    std::string artifact;            ///< Bundle/binary name; empty means `name`
    std::string library;             ///< Optional library the framework depends on
    std::vector<std::string> opts;   ///< Extra compiler options, in order

    [[nodiscard]] const std::string& artifact_name() const {
        return artifact.empty() ? name : artifact;
    }
};

struct TestRunConfig {
    std::string test_name;
    std::vector<fs::path> sources;              ///< Declared entries (files or directories)
    std::vector<FrameworkDescriptor> frameworks; ///< Link order
    bool full_bitcode = false;
    bool codesign = true;
};

class TestRunConfigBuilder {
public:
    TestRunConfigBuilder() = default;
    explicit TestRunConfigBuilder(std::string test_name) { config_.test_name = std::move(test_name); }

    TestRunConfigBuilder& name(std::string test_name);
    TestRunConfigBuilder& source(fs::path entry);
    TestRunConfigBuilder& sources(const std::vector<fs::path>& entries);
    TestRunConfigBuilder& framework(FrameworkDescriptor framework);
    TestRunConfigBuilder& full_bitcode(bool enabled);
    TestRunConfigBuilder& codesign(bool enabled);

    /// Validates and returns the configuration.
    ///
    /// | Condition               | Error message                          |
    /// |-------------------------|----------------------------------------|
    /// | no test name            | `Test name should be set`              |
    /// | no framework            | `Frameworks should be set`             |
    /// | framework without name  | `Framework name should be set`         |
    /// | no test source          | `Test sources should be set`           |
    Result<TestRunConfig, HarnessError> build() const;

private:
    TestRunConfig config_;
};

// ============================================================================
// Harness Settings
// ============================================================================

/// Process-level settings shared by every test of a manifest.
struct HarnessSettings {
    fs::path output_root = "build/testOutputFramework";
    fs::path harness_main = "main.swift";
    Target target = Target::IosX64;
    std::string codesign_tool = "/usr/bin/codesign";
    std::vector<std::string> interpreters = {"/usr/bin/python3", "/usr/local/bin/python3"};

    /// Desktop hosts at or above this OS version ship the runtime libraries
    /// themselves, so no library-path override is set. Empty disables it.
    std::string system_runtime_since = "10.14.4";

    /// When set, simulator binaries run through `xcrun simctl spawn <device>`.
    std::string simulator_device;
};

// ============================================================================
// Artifact Paths
// ============================================================================

struct BuildArtifactPaths {
    fs::path test_dir;      ///< `{outputRoot}/{testName}`
    fs::path framework_dir; ///< `{outputRoot}/{testName}/{targetName}`
    fs::path stub;
    fs::path executable;

    static BuildArtifactPaths compute(const fs::path& output_root, const std::string& test_name,
                                      Target target);
};

inline constexpr const char* TEST_EXECUTABLE_NAME = "swiftTestExecutable";

struct FrameworkPaths {
    fs::path bundle_dir; ///< `{frameworkDir}/{artifact}.framework`
    fs::path binary;     ///< `{bundleDir}/{artifact}`

    static FrameworkPaths compute(const fs::path& framework_dir, const std::string& artifact);
};

// ============================================================================
// Source Discovery
// ============================================================================

/// Expands `entries` into files with `extension` (e.g. ".swift"). Files are
/// kept as given; directories are scanned recursively and sorted. Entries keep
/// their declaration order. A missing entry is an `InvalidConfiguration` error.
Result<std::vector<fs::path>, HarnessError> expand_sources(const std::vector<fs::path>& entries,
                                                          std::string_view extension);

} // namespace fwtest::harness
