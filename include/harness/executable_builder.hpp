//! # Test Executable Builder
//!
//! Links the test sources, the generated provider stub and the harness entry
//! point against the prepared frameworks into `swiftTestExecutable`.
//!
//! ## Compiler Invocation
//!
//! ```text
//! <toolchain>/usr/bin/swiftc -sdk <sdk> -target <triple> -g
//!     -Xlinker -rpath -Xlinker @executable_path/Frameworks
//!     -Xlinker -rpath -Xlinker <frameworkDir> -F <frameworkDir>
//!     -Xcc -Werror
//!     (-embed-bitcode -Xlinker -bitcode_verify | -embed-bitcode-marker)
//!     -o <exe> <sources...> <stub> <main>
//! ```

#pragma once

#include "common.hpp"
#include "harness/error.hpp"
#include "harness/framework_coordinator.hpp"
#include "harness/platform_resolver.hpp"
#include "harness/process.hpp"
#include "harness/run_config.hpp"

#include <string>
#include <vector>

namespace fwtest::harness {

/// Arguments passed to `swiftc` (without the program itself).
std::vector<std::string> compiler_arguments(const PlatformMetadata& platform,
                                            const BuildArtifactPaths& paths,
                                            const std::vector<fs::path>& sources,
                                            const fs::path& harness_main, bool full_bitcode);

class ExecutableBuilder {
public:
    ExecutableBuilder(const HarnessSettings& settings, PlatformResolver& resolver,
                      FrameworkCoordinator& coordinator, ProcessRunner& runner)
        : settings_(settings), resolver_(resolver), coordinator_(coordinator), runner_(runner) {}

    /// Prepares frameworks, writes the stub and compiles. On compiler failure
    /// nothing is executed and the error carries the compiler output.
    Result<BuildArtifactPaths, HarnessError> build(const TestRunConfig& config);

private:
    const HarnessSettings& settings_;
    PlatformResolver& resolver_;
    FrameworkCoordinator& coordinator_;
    ProcessRunner& runner_;
};

} // namespace fwtest::harness
