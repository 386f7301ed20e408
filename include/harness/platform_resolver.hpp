//! # Target Metadata Resolver
//!
//! Maps a `Target` to the concrete toolchain facts every later step needs.
//!
//! ## Platform Table
//!
//! | Target                        | SDK               | Simulator | Min OS |
//! |-------------------------------|-------------------|-----------|--------|
//! | ios_x64                       | iphonesimulator   | yes       | 9.0    |
//! | ios_arm32, ios_arm64          | iphoneos          | no        | 9.0    |
//! | tvos_x64                      | appletvsimulator  | yes       | 9.0    |
//! | tvos_arm64                    | appletvos         | no        | 9.0    |
//! | macos_x64                     | macosx            | no        | 10.11  |
//! | watchos_arm32, watchos_arm64  | watchos           | no        | 2.0    |
//! | watchos_x86, watchos_x64      | watchsimulator    | yes       | 2.0    |
//! | linux_x64, mingw_x64          | unsupported       |           |        |
//!
//! ## Runtime Library Directory
//!
//! Simulator targets use the newest installed simulator runtime bundle
//! (`<bundle>/Contents/Resources/RuntimeRoot/usr/lib/swift`). When the toolchain
//! exposes no runtime metadata, as older installs do, the resolver takes the
//! toolchain fallback `<toolchain>/usr/lib/swift-5.0/<sdk>`, which device and
//! desktop targets always use.

#pragma once

#include "common.hpp"
#include "harness/error.hpp"
#include "harness/target.hpp"
#include "harness/toolchain.hpp"

#include <optional>
#include <string>

namespace fwtest::harness {

enum class PlatformFamily { Ios, Tvos, Watchos, Macos };

/// Static facts about a supported target; no toolchain involved.
struct TargetTraits {
    PlatformFamily family;
    bool simulator;
    const char* arch;           ///< Triple architecture (e.g. "arm64_32")
    const char* os_name;        ///< Triple OS component (e.g. "watchos")
    const char* sdk_name;       ///< e.g. "iphonesimulator"
    const char* runtime_family; ///< Simulator runtime lookup key ("iOS", ...)
    const char* os_version_min; ///< e.g. "9.0"
};

/// Traits of `target`, or nullopt for targets this harness cannot test.
std::optional<TargetTraits> target_traits(Target target);

/// Whether `target` runs on a simulator. Unsupported targets are not simulators.
bool is_simulator(Target target);

/// Which runtime-library directory the resolver settled on.
enum class RuntimeLibrarySource {
    SimulatorRuntime, ///< Inside an installed simulator runtime bundle
    ToolchainDefault, ///< `<toolchain>/usr/lib/swift-5.0/<sdk>`
};

struct PlatformMetadata {
    Target target;
    PlatformFamily family;
    bool simulator = false;
    std::string sdk_name;
    std::string sdk_path;
    std::string runtime_family;
    std::string os_version_min;
    std::string triple; ///< e.g. "x86_64-apple-ios9.0-simulator"
    fs::path toolchain_root;
    fs::path toolchain_bin_dir; ///< `<toolchain>/usr/bin/`
    fs::path runtime_library_dir;
    RuntimeLibrarySource runtime_library_source = RuntimeLibrarySource::ToolchainDefault;
    std::optional<SimulatorRuntime> simulator_runtime;
};

class PlatformResolver {
public:
    explicit PlatformResolver(ToolchainProvider& toolchain) : toolchain_(toolchain) {}

    /// Resolves `target` against the installed toolchain. Unsupported targets
    /// fail with `UnsupportedTarget` before the toolchain is consulted.
    Result<PlatformMetadata, HarnessError> resolve(Target target);

private:
    ToolchainProvider& toolchain_;
};

} // namespace fwtest::harness
