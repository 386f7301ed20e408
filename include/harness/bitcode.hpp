//! # Bitcode Validator
//!
//! Verifies that a device framework binary carries a complete embedded bitcode
//! payload by running the toolchain's `bitcode-build-tool` under Python:
//!
//! ```text
//! <interpreter> -B <tools>/bin/bitcode-build-tool --sdk <sdk> -v -t <toolchain>/usr/bin/ <binary>
//! ```
//!
//! The check is skipped when full bitcode was not requested and for simulator
//! targets, whose binaries never carry bitcode.
//!
//! Before invoking the tool, the binary is opened with the LLVM object library
//! and the presence of an `__LLVM,__bundle` / `__LLVM,__bitcode` section is
//! logged. That inspection is diagnostic only; the external tool decides.

#pragma once

#include "common.hpp"
#include "harness/error.hpp"
#include "harness/platform_resolver.hpp"
#include "harness/process.hpp"
#include "harness/toolchain.hpp"

#include <string>
#include <vector>

namespace fwtest::harness {

/// Python interpreters tried in order.
std::vector<std::string> default_interpreters();

/// What the in-process object inspection saw.
struct BitcodeInspection {
    std::string format;             ///< e.g. "Mach-O 64-bit"
    bool sections_scanned = false;  ///< False for archives and universal binaries
    bool has_bitcode = false;
    std::string section;            ///< Name of the bitcode section found
    std::vector<std::string> sections;
};

/// Opens `binary` with the LLVM object library and looks for an embedded
/// bitcode section. Unreadable or unrecognised files are an `IoError`.
Result<BitcodeInspection, HarnessError> inspect_embedded_bitcode(const fs::path& binary);

class BitcodeValidator {
public:
    BitcodeValidator(PlatformResolver& resolver, ToolchainProvider& toolchain,
                     ProcessRunner& runner,
                     std::vector<std::string> interpreters = default_interpreters());

    /// Validates `binary` built for `target`. Returns `true` both when the
    /// tool accepted the binary and when validation does not apply.
    Result<bool, HarnessError> validate(const fs::path& binary, Target target, bool full_bitcode);

    /// First existing interpreter candidate, or `MissingInterpreter`.
    Result<std::string, HarnessError> find_interpreter() const;

private:
    PlatformResolver& resolver_;
    ToolchainProvider& toolchain_;
    ProcessRunner& runner_;
    std::vector<std::string> interpreters_;
};

} // namespace fwtest::harness
