#include "harness/platform_resolver.hpp"

#include "log/log.hpp"

namespace fwtest::harness {

std::optional<TargetTraits> target_traits(Target target) {
    switch (target) {
    case Target::IosX64:
        return TargetTraits{PlatformFamily::Ios, true, "x86_64", "ios", "iphonesimulator", "iOS",
                            "9.0"};
    case Target::IosArm32:
        return TargetTraits{PlatformFamily::Ios, false, "armv7", "ios", "iphoneos", "iOS", "9.0"};
    case Target::IosArm64:
        return TargetTraits{PlatformFamily::Ios, false, "arm64", "ios", "iphoneos", "iOS", "9.0"};
    case Target::TvosX64:
        return TargetTraits{PlatformFamily::Tvos, true, "x86_64", "tvos", "appletvsimulator",
                            "tvOS", "9.0"};
    case Target::TvosArm64:
        return TargetTraits{PlatformFamily::Tvos, false, "arm64", "tvos", "appletvos", "tvOS",
                            "9.0"};
    case Target::MacosX64:
        return TargetTraits{PlatformFamily::Macos, false, "x86_64", "macosx", "macosx", "macOS",
                            "10.11"};
    case Target::WatchosArm32:
        return TargetTraits{PlatformFamily::Watchos, false, "armv7k", "watchos", "watchos",
                            "watchOS", "2.0"};
    case Target::WatchosArm64:
        return TargetTraits{PlatformFamily::Watchos, false, "arm64_32", "watchos", "watchos",
                            "watchOS", "2.0"};
    case Target::WatchosX86:
        return TargetTraits{PlatformFamily::Watchos, true, "i386", "watchos", "watchsimulator",
                            "watchOS", "2.0"};
    case Target::WatchosX64:
        return TargetTraits{PlatformFamily::Watchos, true, "x86_64", "watchos", "watchsimulator",
                            "watchOS", "2.0"};
    case Target::LinuxX64:
    case Target::MingwX64:
        return std::nullopt;
    }
    return std::nullopt;
}

bool is_simulator(Target target) {
    auto traits = target_traits(target);
    return traits && traits->simulator;
}

Result<PlatformMetadata, HarnessError> PlatformResolver::resolve(Target target) {
    auto traits = target_traits(target);
    if (!traits) {
        return HarnessError::make(ErrorKind::UnsupportedTarget,
                                  std::string("Test target ") + target_name(target) +
                                      " is not supported");
    }

    auto toolchain = toolchain_.target_toolchain();
    if (is_err(toolchain)) {
        return unwrap_err(toolchain);
    }
    auto sdk = toolchain_.sdk_path(traits->sdk_name);
    if (is_err(sdk)) {
        return unwrap_err(sdk);
    }

    PlatformMetadata meta;
    meta.target = target;
    meta.family = traits->family;
    meta.simulator = traits->simulator;
    meta.sdk_name = traits->sdk_name;
    meta.sdk_path = unwrap(sdk);
    meta.runtime_family = traits->runtime_family;
    meta.os_version_min = traits->os_version_min;
    meta.triple = std::string(traits->arch) + "-apple-" + traits->os_name + traits->os_version_min;
    if (traits->simulator) {
        meta.triple += "-simulator";
    }
    meta.toolchain_root = unwrap(toolchain);
    meta.toolchain_bin_dir = meta.toolchain_root / "usr" / "bin" / "";

    if (meta.simulator) {
        meta.simulator_runtime =
            toolchain_.latest_simulator_runtime(meta.runtime_family, meta.os_version_min);
    }

    if (meta.simulator_runtime) {
        meta.runtime_library_source = RuntimeLibrarySource::SimulatorRuntime;
        meta.runtime_library_dir = meta.simulator_runtime->bundle_path / "Contents" / "Resources" /
                                   "RuntimeRoot" / "usr" / "lib" / "swift";
    } else {
        // No runtime metadata (device/desktop target, or an old toolchain install)
        meta.runtime_library_source = RuntimeLibrarySource::ToolchainDefault;
        meta.runtime_library_dir =
            meta.toolchain_root / "usr" / "lib" / "swift-5.0" / meta.sdk_name;
    }

    FWTEST_LOG_DEBUG("resolver", target_name(target)
                                     << ": sdk=" << meta.sdk_name << " triple=" << meta.triple
                                     << " runtime=" << meta.runtime_library_dir.string());
    return meta;
}

} // namespace fwtest::harness
