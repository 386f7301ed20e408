// Inspection commands: list, stub, resolve, inspect

#include "commands.hpp"

#include "harness/bitcode.hpp"
#include "harness/platform_resolver.hpp"
#include "harness/stub_gen.hpp"
#include "harness/toolchain.hpp"

#include <iostream>

namespace fwtest::cli {

// ============================================================================
// list
// ============================================================================

int run_list(const Manifest& manifest, const ColorOutput& c) {
    std::cout << c.dim() << "target: " << harness::target_name(manifest.harness.target)
              << c.reset() << "\n";
    for (const auto& test : manifest.tests) {
        std::cout << c.bold() << test.name << c.reset();
        if (test.full_bitcode) {
            std::cout << " " << c.yellow() << "[full-bitcode]" << c.reset();
        }
        if (!test.codesign) {
            std::cout << " " << c.dim() << "[unsigned]" << c.reset();
        }
        std::cout << "\n";
        for (const auto& framework : test.frameworks) {
            std::cout << "  " << framework.artifact_name() << ".framework";
            if (!framework.library.empty()) {
                std::cout << c.dim() << " (links " << framework.library << ")" << c.reset();
            }
            std::cout << "\n";
        }
    }
    return 0;
}

// ============================================================================
// stub
// ============================================================================

int run_stub(const std::vector<std::string>& files) {
    if (files.empty()) {
        std::cerr << "Usage: fwtest stub <file.swift>...\n";
        return 1;
    }
    std::vector<fs::path> sources(files.begin(), files.end());
    std::cout << harness::generate_provider_stub(sources);
    return 0;
}

// ============================================================================
// resolve
// ============================================================================

int run_resolve(const std::string& target, const harness::ToolchainSettings& toolchain_settings) {
    auto parsed = harness::parse_target(target);
    if (is_err(parsed)) {
        std::cerr << unwrap_err(parsed).to_string() << "\n";
        return 1;
    }

    harness::SubprocessRunner runner;
    harness::XcodeToolchain toolchain(toolchain_settings, runner);
    harness::PlatformResolver resolver(toolchain);
    auto meta = resolver.resolve(unwrap(parsed));
    if (is_err(meta)) {
        std::cerr << unwrap_err(meta).to_string() << "\n";
        return 1;
    }

    const auto& m = unwrap(meta);
    std::cout << "target:          " << harness::target_name(m.target) << "\n";
    std::cout << "simulator:       " << (m.simulator ? "yes" : "no") << "\n";
    std::cout << "sdk:             " << m.sdk_name << "\n";
    std::cout << "sdk path:        " << m.sdk_path << "\n";
    std::cout << "triple:          " << m.triple << "\n";
    std::cout << "min os:          " << m.os_version_min << "\n";
    std::cout << "toolchain:       " << m.toolchain_root.string() << "\n";
    if (m.simulator_runtime) {
        std::cout << "runtime:         " << m.simulator_runtime->identifier << "\n";
    }
    std::cout << "runtime libs:    " << m.runtime_library_dir.string()
              << (m.runtime_library_source == harness::RuntimeLibrarySource::ToolchainDefault
                      ? " (toolchain default)"
                      : "")
              << "\n";
    std::cout << "library env key: " << harness::library_path_env_key(m.target) << "\n";
    return 0;
}

// ============================================================================
// inspect
// ============================================================================

int run_inspect(const std::string& binary) {
    auto inspection = harness::inspect_embedded_bitcode(binary);
    if (is_err(inspection)) {
        std::cerr << unwrap_err(inspection).to_string() << "\n";
        return 1;
    }

    const auto& inspected = unwrap(inspection);
    std::cout << binary << ": " << inspected.format << "\n";
    if (!inspected.sections_scanned) {
        std::cout << "  sections not scanned for this file type\n";
        return 0;
    }
    for (const auto& section : inspected.sections) {
        std::cout << "  " << section << (section == inspected.section ? "  <- bitcode" : "") << "\n";
    }
    std::cout << (inspected.has_bitcode ? "embedded bitcode: yes\n" : "embedded bitcode: no\n");
    return 0;
}

} // namespace fwtest::cli
