#include "harness/target.hpp"

#include <string>

namespace fwtest::harness {

const char* target_name(Target target) {
    switch (target) {
    case Target::IosX64:
        return "ios_x64";
    case Target::IosArm32:
        return "ios_arm32";
    case Target::IosArm64:
        return "ios_arm64";
    case Target::TvosX64:
        return "tvos_x64";
    case Target::TvosArm64:
        return "tvos_arm64";
    case Target::MacosX64:
        return "macos_x64";
    case Target::WatchosArm32:
        return "watchos_arm32";
    case Target::WatchosArm64:
        return "watchos_arm64";
    case Target::WatchosX86:
        return "watchos_x86";
    case Target::WatchosX64:
        return "watchos_x64";
    case Target::LinuxX64:
        return "linux_x64";
    case Target::MingwX64:
        return "mingw_x64";
    }
    return "unknown";
}

Result<Target, HarnessError> parse_target(std::string_view name) {
    for (Target target : ALL_TARGETS) {
        if (name == target_name(target)) {
            return target;
        }
    }
    return HarnessError::make(ErrorKind::UnsupportedTarget,
                              "Unknown test target '" + std::string(name) + "'");
}

} // namespace fwtest::harness
