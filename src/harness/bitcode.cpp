#include "harness/bitcode.hpp"

#include "log/log.hpp"

#include <llvm-c/Core.h>
#include <llvm-c/Object.h>

namespace fwtest::harness {

// ============================================================================
// Helper Functions
// ============================================================================

/// Convert LLVM error message to string and dispose it.
static std::string consume_error_message(char* error) {
    if (error == nullptr) {
        return "";
    }
    std::string msg(error);
    LLVMDisposeMessage(error);
    return msg;
}

static const char* binary_format_name(LLVMBinaryType type) {
    switch (type) {
    case LLVMBinaryTypeArchive:
        return "archive";
    case LLVMBinaryTypeMachOUniversalBinary:
        return "Mach-O universal";
    case LLVMBinaryTypeCOFFImportFile:
        return "COFF import";
    case LLVMBinaryTypeIR:
        return "LLVM IR";
    case LLVMBinaryTypeWinRes:
        return "Windows resource";
    case LLVMBinaryTypeCOFF:
        return "COFF";
    case LLVMBinaryTypeELF32L:
    case LLVMBinaryTypeELF32B:
        return "ELF 32-bit";
    case LLVMBinaryTypeELF64L:
    case LLVMBinaryTypeELF64B:
        return "ELF 64-bit";
    case LLVMBinaryTypeMachO32L:
    case LLVMBinaryTypeMachO32B:
        return "Mach-O 32-bit";
    case LLVMBinaryTypeMachO64L:
    case LLVMBinaryTypeMachO64B:
        return "Mach-O 64-bit";
    case LLVMBinaryTypeWasm:
        return "WebAssembly";
    }
    return "unknown";
}

/// Only object files expose a section iterator.
static bool has_sections(LLVMBinaryType type) {
    switch (type) {
    case LLVMBinaryTypeCOFF:
    case LLVMBinaryTypeELF32L:
    case LLVMBinaryTypeELF32B:
    case LLVMBinaryTypeELF64L:
    case LLVMBinaryTypeELF64B:
    case LLVMBinaryTypeMachO32L:
    case LLVMBinaryTypeMachO32B:
    case LLVMBinaryTypeMachO64L:
    case LLVMBinaryTypeMachO64B:
    case LLVMBinaryTypeWasm:
        return true;
    case LLVMBinaryTypeArchive:
    case LLVMBinaryTypeMachOUniversalBinary:
    case LLVMBinaryTypeCOFFImportFile:
    case LLVMBinaryTypeIR:
    case LLVMBinaryTypeWinRes:
        return false;
    }
    return false;
}

// ============================================================================
// Object Inspection
// ============================================================================

Result<BitcodeInspection, HarnessError> inspect_embedded_bitcode(const fs::path& binary) {
    LLVMMemoryBufferRef buffer = nullptr;
    char* error = nullptr;
    if (LLVMCreateMemoryBufferWithContentsOfFile(binary.c_str(), &buffer, &error)) {
        return HarnessError::make(ErrorKind::IoError, "Cannot read " + binary.string() + ": " +
                                                          consume_error_message(error));
    }

    LLVMBinaryRef object = LLVMCreateBinary(buffer, nullptr, &error);
    if (object == nullptr) {
        LLVMDisposeMemoryBuffer(buffer);
        return HarnessError::make(ErrorKind::IoError, "Not an object file: " + binary.string() +
                                                          ": " + consume_error_message(error));
    }

    BitcodeInspection inspection;
    LLVMBinaryType type = LLVMBinaryGetType(object);
    inspection.format = binary_format_name(type);

    if (has_sections(type)) {
        inspection.sections_scanned = true;
        LLVMSectionIteratorRef it = LLVMObjectFileCopySectionIterator(object);
        for (; !LLVMObjectFileIsSectionIteratorAtEnd(object, it); LLVMMoveToNextSection(it)) {
            const char* name = LLVMGetSectionName(it);
            if (name == nullptr) {
                continue;
            }
            std::string section(name);
            inspection.sections.push_back(section);
            // Mach-O reports the section without its `__LLVM` segment
            if (!inspection.has_bitcode && (section == "__bundle" || section == "__bitcode" ||
                                            section == ".llvmbc")) {
                inspection.has_bitcode = true;
                inspection.section = section;
            }
        }
        LLVMDisposeSectionIterator(it);
    }

    LLVMDisposeBinary(object);
    LLVMDisposeMemoryBuffer(buffer);
    return inspection;
}

// ============================================================================
// BitcodeValidator
// ============================================================================

std::vector<std::string> default_interpreters() {
    return {"/usr/bin/python3", "/usr/local/bin/python3"};
}

BitcodeValidator::BitcodeValidator(PlatformResolver& resolver, ToolchainProvider& toolchain,
                                   ProcessRunner& runner, std::vector<std::string> interpreters)
    : resolver_(resolver), toolchain_(toolchain), runner_(runner),
      interpreters_(std::move(interpreters)) {}

Result<std::string, HarnessError> BitcodeValidator::find_interpreter() const {
    for (const auto& candidate : interpreters_) {
        std::error_code ec;
        if (fs::exists(candidate, ec)) {
            return candidate;
        }
    }
    std::string tried;
    for (const auto& candidate : interpreters_) {
        tried += tried.empty() ? candidate : ", " + candidate;
    }
    return HarnessError::make(ErrorKind::MissingInterpreter,
                              "No python interpreter found (tried: " + tried + ")");
}

Result<bool, HarnessError> BitcodeValidator::validate(const fs::path& binary, Target target,
                                                      bool full_bitcode) {
    if (!full_bitcode || is_simulator(target)) {
        FWTEST_LOG_DEBUG("bitcode", "Skipping " << binary.filename().string() << " for "
                                                << target_name(target));
        return true;
    }

    auto meta = resolver_.resolve(target);
    if (is_err(meta)) {
        return unwrap_err(meta);
    }
    auto tools = toolchain_.additional_tools_dir();
    if (is_err(tools)) {
        return unwrap_err(tools);
    }
    auto interpreter = find_interpreter();
    if (is_err(interpreter)) {
        return unwrap_err(interpreter);
    }

    auto inspection = inspect_embedded_bitcode(binary);
    if (is_ok(inspection)) {
        const auto& inspected = unwrap(inspection);
        if (inspected.has_bitcode) {
            FWTEST_LOG_DEBUG("bitcode", binary.filename().string()
                                            << ": " << inspected.format << ", section "
                                            << inspected.section);
        } else if (inspected.sections_scanned) {
            FWTEST_LOG_WARN("bitcode", binary.filename().string()
                                           << ": no embedded bitcode section found");
        }
    } else {
        FWTEST_LOG_DEBUG("bitcode", unwrap_err(inspection).message);
    }

    const auto& platform = unwrap(meta);
    fs::path tool = unwrap(tools) / "bin" / "bitcode-build-tool";
    std::vector<std::string> args = {"-B",
                                     tool.string(),
                                     "--sdk",
                                     platform.sdk_path,
                                     "-v",
                                     "-t",
                                     platform.toolchain_bin_dir.string(),
                                     binary.string()};

    const std::string& python = unwrap(interpreter);
    auto run = runner_.run(python, args, {}, inherited_environment());
    if (is_err(run)) {
        return unwrap_err(run);
    }
    auto& result = unwrap(run);
    if (result.exit_code != 0) {
        FWTEST_LOG_ERROR("bitcode", "Bitcode validation failed for " << binary.string());
        return HarnessError::from_process(ErrorKind::ExternalToolFailure,
                                          "Bitcode validation failed for " + binary.string() +
                                              " (exit code " + std::to_string(result.exit_code) +
                                              ")",
                                          result.stdout_text, result.stderr_text,
                                          result.exit_code);
    }
    FWTEST_LOG_INFO("bitcode", "Validated " << binary.filename().string());
    return true;
}

} // namespace fwtest::harness
