#include "harness/run_config.hpp"

#include "harness/stub_gen.hpp"
#include "log/log.hpp"

#include <algorithm>

namespace fwtest::harness {

// ============================================================================
// TestRunConfigBuilder
// ============================================================================

TestRunConfigBuilder& TestRunConfigBuilder::name(std::string test_name) {
    config_.test_name = std::move(test_name);
    return *this;
}

TestRunConfigBuilder& TestRunConfigBuilder::source(fs::path entry) {
    config_.sources.push_back(std::move(entry));
    return *this;
}

TestRunConfigBuilder& TestRunConfigBuilder::sources(const std::vector<fs::path>& entries) {
    config_.sources.insert(config_.sources.end(), entries.begin(), entries.end());
    return *this;
}

TestRunConfigBuilder& TestRunConfigBuilder::framework(FrameworkDescriptor framework) {
    config_.frameworks.push_back(std::move(framework));
    return *this;
}

TestRunConfigBuilder& TestRunConfigBuilder::full_bitcode(bool enabled) {
    config_.full_bitcode = enabled;
    return *this;
}

TestRunConfigBuilder& TestRunConfigBuilder::codesign(bool enabled) {
    config_.codesign = enabled;
    return *this;
}

Result<TestRunConfig, HarnessError> TestRunConfigBuilder::build() const {
    if (config_.test_name.empty()) {
        return HarnessError::make(ErrorKind::InvalidConfiguration, "Test name should be set");
    }
    if (config_.frameworks.empty()) {
        return HarnessError::make(ErrorKind::InvalidConfiguration,
                                  "Frameworks should be set for test " + config_.test_name);
    }
    for (const auto& framework : config_.frameworks) {
        if (framework.name.empty()) {
            return HarnessError::make(ErrorKind::InvalidConfiguration,
                                      "Framework name should be set for test " +
                                          config_.test_name);
        }
    }
    if (config_.sources.empty()) {
        return HarnessError::make(ErrorKind::InvalidConfiguration,
                                  "Test sources should be set for test " + config_.test_name);
    }
    return config_;
}

// ============================================================================
// Artifact Paths
// ============================================================================

BuildArtifactPaths BuildArtifactPaths::compute(const fs::path& output_root,
                                               const std::string& test_name, Target target) {
    BuildArtifactPaths paths;
    paths.test_dir = output_root / test_name;
    paths.framework_dir = paths.test_dir / target_name(target);
    paths.stub = paths.test_dir / PROVIDER_STUB_FILE;
    paths.executable = paths.test_dir / TEST_EXECUTABLE_NAME;
    return paths;
}

FrameworkPaths FrameworkPaths::compute(const fs::path& framework_dir, const std::string& artifact) {
    FrameworkPaths paths;
    paths.bundle_dir = framework_dir / (artifact + ".framework");
    paths.binary = paths.bundle_dir / artifact;
    return paths;
}

// ============================================================================
// Source Discovery
// ============================================================================

Result<std::vector<fs::path>, HarnessError> expand_sources(const std::vector<fs::path>& entries,
                                                          std::string_view extension) {
    std::vector<fs::path> files;
    for (const auto& entry : entries) {
        std::error_code ec;
        if (fs::is_regular_file(entry, ec)) {
            files.push_back(entry);
            continue;
        }
        if (!fs::is_directory(entry, ec)) {
            return HarnessError::make(ErrorKind::InvalidConfiguration,
                                      "Source not found: " + entry.string());
        }

        std::vector<fs::path> found;
        for (auto it = fs::recursive_directory_iterator(entry, ec);
             !ec && it != fs::recursive_directory_iterator(); it.increment(ec)) {
            std::error_code entry_ec;
            if (it->is_regular_file(entry_ec) && it->path().extension().string() == extension) {
                found.push_back(it->path());
            }
        }
        if (ec) {
            return HarnessError::make(ErrorKind::IoError,
                                      "Cannot scan " + entry.string() + ": " + ec.message());
        }
        std::sort(found.begin(), found.end());
        FWTEST_LOG_TRACE("stub", entry.string() << ": " << found.size() << " source(s)");
        files.insert(files.end(), found.begin(), found.end());
    }
    return files;
}

} // namespace fwtest::harness
