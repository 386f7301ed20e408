#include "harness/framework_coordinator.hpp"

#include "log/log.hpp"

namespace fwtest::harness {

Result<bool, HarnessError> FrameworkCoordinator::prepare(const TestRunConfig& config) {
    auto paths = BuildArtifactPaths::compute(settings_.output_root, config.test_name,
                                             settings_.target);

    for (const auto& framework : config.frameworks) {
        auto bundle = FrameworkPaths::compute(paths.framework_dir, framework.artifact_name());

        std::error_code ec;
        if (!fs::is_directory(bundle.bundle_dir, ec)) {
            return HarnessError::make(ErrorKind::MissingArtifact,
                                      "Framework " + framework.name + " was not built: " +
                                          bundle.bundle_dir.string() + " does not exist");
        }

        auto validated = validator_.validate(bundle.binary, settings_.target, config.full_bitcode);
        if (is_err(validated)) {
            return unwrap_err(validated);
        }

        if (config.codesign) {
            auto signed_ok = codesign(bundle.bundle_dir);
            if (is_err(signed_ok)) {
                return unwrap_err(signed_ok);
            }
        }
        FWTEST_LOG_DEBUG("coordinator", "Prepared " << bundle.bundle_dir.string());
    }
    return true;
}

Result<bool, HarnessError> FrameworkCoordinator::codesign(const fs::path& bundle_dir) {
    std::vector<std::string> args = {"--verbose", "-s", "-", bundle_dir.string()};
    auto run = runner_.run(settings_.codesign_tool, args, {}, inherited_environment());
    if (is_err(run)) {
        return unwrap_err(run);
    }
    auto& result = unwrap(run);
    if (result.exit_code != 0) {
        return HarnessError::from_process(ErrorKind::ExternalToolFailure,
                                          "Code signing failed for " + bundle_dir.string() +
                                              " (exit code " + std::to_string(result.exit_code) +
                                              ")",
                                          result.stdout_text, result.stderr_text,
                                          result.exit_code);
    }
    FWTEST_LOG_INFO("coordinator", "Signed " << bundle_dir.filename().string());
    return true;
}

} // namespace fwtest::harness
