//! # Toolchain Discovery
//!
//! Process-wide facts about the installed toolchain: where it lives, where the
//! SDKs are, which simulator runtimes are installed, and the host OS version.
//! The resolver and the bitcode validator only see the abstract
//! `ToolchainProvider`, so tests run against a fake instead of an Xcode install.
//!
//! `XcodeToolchain` answers from configuration first and falls back to asking
//! `xcode-select`, `xcrun` and `sw_vers` through a `ProcessRunner`. An instance
//! memoizes what it discovered and must not be shared between threads.

#pragma once

#include "common.hpp"
#include "harness/error.hpp"
#include "harness/process.hpp"

#include <optional>
#include <string>
#include <vector>

namespace fwtest::harness {

/// An installed simulator runtime bundle.
struct SimulatorRuntime {
    std::string identifier; ///< e.g. "com.apple.CoreSimulator.SimRuntime.iOS-17-0"
    std::string version;    ///< e.g. "17.0"
    fs::path bundle_path;   ///< The `.simruntime` directory
};

class ToolchainProvider {
public:
    virtual ~ToolchainProvider() = default;

    /// Absolute root of the target toolchain (contains `usr/bin/swiftc`).
    virtual Result<fs::path, HarnessError> target_toolchain() = 0;

    /// Directory holding auxiliary tools such as `bin/bitcode-build-tool`.
    virtual Result<fs::path, HarnessError> additional_tools_dir() = 0;

    /// Absolute path of the SDK named `sdk_name` (e.g. "iphoneos").
    virtual Result<std::string, HarnessError> sdk_path(const std::string& sdk_name) = 0;

    /// Newest installed runtime for `runtime_family` ("iOS", "tvOS", "watchOS")
    /// whose version is at least `os_version_min`. Older installs expose none.
    virtual std::optional<SimulatorRuntime>
    latest_simulator_runtime(const std::string& runtime_family,
                             const std::string& os_version_min) = 0;

    /// Host OS product version (e.g. "10.14.4"); empty when unknown.
    virtual std::string host_os_version() = 0;
};

/// Explicit toolchain locations; empty fields are discovered.
struct ToolchainSettings {
    std::string target_toolchain;
    std::string additional_tools_dir;
    std::vector<std::string> runtime_search_dirs = {
        "/Library/Developer/CoreSimulator/Profiles/Runtimes"};
};

class XcodeToolchain : public ToolchainProvider {
public:
    XcodeToolchain(ToolchainSettings settings, ProcessRunner& runner);

    Result<fs::path, HarnessError> target_toolchain() override;
    Result<fs::path, HarnessError> additional_tools_dir() override;
    Result<std::string, HarnessError> sdk_path(const std::string& sdk_name) override;
    std::optional<SimulatorRuntime> latest_simulator_runtime(const std::string& runtime_family,
                                                             const std::string& os_version_min) override;
    std::string host_os_version() override;

private:
    Result<fs::path, HarnessError> developer_dir();
    Result<std::string, HarnessError> query(const std::string& tool,
                                            const std::vector<std::string>& args);

    ToolchainSettings settings_;
    ProcessRunner& runner_;
    std::optional<fs::path> developer_dir_;
};

/// Compares dotted numeric versions component-wise ("10.14.4" > "10.9").
/// Missing components count as zero. Returns <0, 0 or >0.
int compare_versions(const std::string& a, const std::string& b);

/// Scans `dirs` for `<family> <version>.simruntime` bundles and returns the
/// newest one not older than `os_version_min`.
std::optional<SimulatorRuntime> find_simulator_runtime(const std::vector<fs::path>& dirs,
                                                       const std::string& runtime_family,
                                                       const std::string& os_version_min);

} // namespace fwtest::harness
