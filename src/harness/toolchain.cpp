//! # Xcode Toolchain Discovery
//!
//! ## Discovery Order
//!
//! | Fact                 | Configured key          | Fallback                                   |
//! |----------------------|-------------------------|--------------------------------------------|
//! | target toolchain     | `target-toolchain`      | `<xcode-select -p>/Toolchains/XcodeDefault.xctoolchain` |
//! | additional tools dir | `additional-tools-dir`  | `<developer dir>/usr`                       |
//! | SDK path             | -                       | `xcrun --sdk <name> --show-sdk-path`        |
//! | simulator runtimes   | `runtime-search-dirs`   | `/Library/Developer/CoreSimulator/Profiles/Runtimes` |
//! | host OS version      | -                       | `sw_vers -productVersion`                   |

#include "harness/toolchain.hpp"

#include "log/log.hpp"

#include <algorithm>
#include <cctype>
#include <sstream>

namespace fwtest::harness {

// ============================================================================
// Version Helpers
// ============================================================================

static std::vector<long> split_version(const std::string& version) {
    std::vector<long> parts;
    std::istringstream stream(version);
    std::string part;
    while (std::getline(stream, part, '.')) {
        try {
            parts.push_back(part.empty() ? 0 : std::stol(part));
        } catch (const std::exception&) {
            parts.push_back(0);
        }
    }
    return parts;
}

int compare_versions(const std::string& a, const std::string& b) {
    auto lhs = split_version(a);
    auto rhs = split_version(b);
    size_t n = std::max(lhs.size(), rhs.size());
    for (size_t i = 0; i < n; ++i) {
        long l = i < lhs.size() ? lhs[i] : 0;
        long r = i < rhs.size() ? rhs[i] : 0;
        if (l != r) {
            return l < r ? -1 : 1;
        }
    }
    return 0;
}

static std::string trim(std::string s) {
    auto not_space = [](unsigned char c) { return !std::isspace(c); };
    s.erase(s.begin(), std::find_if(s.begin(), s.end(), not_space));
    s.erase(std::find_if(s.rbegin(), s.rend(), not_space).base(), s.end());
    return s;
}

// ============================================================================
// Simulator Runtime Scan
// ============================================================================

std::optional<SimulatorRuntime> find_simulator_runtime(const std::vector<fs::path>& dirs,
                                                       const std::string& runtime_family,
                                                       const std::string& os_version_min) {
    std::optional<SimulatorRuntime> best;
    const std::string prefix = runtime_family + " ";
    const std::string suffix = ".simruntime";

    for (const auto& dir : dirs) {
        std::error_code ec;
        if (!fs::is_directory(dir, ec)) {
            continue;
        }
        for (auto it = fs::directory_iterator(dir, ec); !ec && it != fs::directory_iterator();
             it.increment(ec)) {
            const fs::directory_entry& entry = *it;
            std::string name = entry.path().filename().string();
            if (!name.starts_with(prefix) || !name.ends_with(suffix)) {
                continue;
            }
            std::string version =
                name.substr(prefix.size(), name.size() - prefix.size() - suffix.size());
            if (version.empty() || compare_versions(version, os_version_min) < 0) {
                continue;
            }
            if (best && compare_versions(version, best->version) <= 0) {
                continue;
            }
            std::string dashed = version;
            std::replace(dashed.begin(), dashed.end(), '.', '-');
            best = SimulatorRuntime{"com.apple.CoreSimulator.SimRuntime." + runtime_family + "-" +
                                        dashed,
                                    version, entry.path()};
        }
    }
    return best;
}

// ============================================================================
// XcodeToolchain
// ============================================================================

XcodeToolchain::XcodeToolchain(ToolchainSettings settings, ProcessRunner& runner)
    : settings_(std::move(settings)), runner_(runner) {}

Result<std::string, HarnessError> XcodeToolchain::query(const std::string& tool,
                                                        const std::vector<std::string>& args) {
    auto run = runner_.run(tool, args, {}, inherited_environment());
    if (is_err(run)) {
        return unwrap_err(run);
    }
    auto& result = unwrap(run);
    if (result.exit_code != 0) {
        return HarnessError::from_process(ErrorKind::ExternalToolFailure,
                                          format_command(tool, args) + " failed with exit code " +
                                              std::to_string(result.exit_code),
                                          result.stdout_text, result.stderr_text,
                                          result.exit_code);
    }
    return trim(result.stdout_text);
}

Result<fs::path, HarnessError> XcodeToolchain::developer_dir() {
    if (developer_dir_) {
        return *developer_dir_;
    }
    auto dir = query("xcode-select", {"-p"});
    if (is_err(dir)) {
        return unwrap_err(dir);
    }
    developer_dir_ = fs::path(unwrap(dir));
    FWTEST_LOG_DEBUG("resolver", "Developer dir: " << developer_dir_->string());
    return *developer_dir_;
}

Result<fs::path, HarnessError> XcodeToolchain::target_toolchain() {
    if (!settings_.target_toolchain.empty()) {
        return fs::path(settings_.target_toolchain);
    }
    auto dev = developer_dir();
    if (is_err(dev)) {
        return unwrap_err(dev);
    }
    return unwrap(dev) / "Toolchains" / "XcodeDefault.xctoolchain";
}

Result<fs::path, HarnessError> XcodeToolchain::additional_tools_dir() {
    if (!settings_.additional_tools_dir.empty()) {
        return fs::path(settings_.additional_tools_dir);
    }
    auto dev = developer_dir();
    if (is_err(dev)) {
        return unwrap_err(dev);
    }
    return unwrap(dev) / "usr";
}

Result<std::string, HarnessError> XcodeToolchain::sdk_path(const std::string& sdk_name) {
    return query("xcrun", {"--sdk", sdk_name, "--show-sdk-path"});
}

std::optional<SimulatorRuntime>
XcodeToolchain::latest_simulator_runtime(const std::string& runtime_family,
                                         const std::string& os_version_min) {
    std::vector<fs::path> dirs(settings_.runtime_search_dirs.begin(),
                               settings_.runtime_search_dirs.end());
    return find_simulator_runtime(dirs, runtime_family, os_version_min);
}

std::string XcodeToolchain::host_os_version() {
    auto version = query("sw_vers", {"-productVersion"});
    if (is_err(version)) {
        FWTEST_LOG_DEBUG("resolver",
                         "Host OS version unknown: " << unwrap_err(version).message);
        return {};
    }
    return unwrap(version);
}

} // namespace fwtest::harness
