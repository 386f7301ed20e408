#include "harness/executable_builder.hpp"

#include "harness/stub_gen.hpp"
#include "log/log.hpp"

namespace fwtest::harness {

std::vector<std::string> compiler_arguments(const PlatformMetadata& platform,
                                            const BuildArtifactPaths& paths,
                                            const std::vector<fs::path>& sources,
                                            const fs::path& harness_main, bool full_bitcode) {
    std::string framework_dir = paths.framework_dir.string();
    std::vector<std::string> args = {"-sdk",
                                     platform.sdk_path,
                                     "-target",
                                     platform.triple,
                                     "-g",
                                     "-Xlinker",
                                     "-rpath",
                                     "-Xlinker",
                                     "@executable_path/Frameworks",
                                     "-Xlinker",
                                     "-rpath",
                                     "-Xlinker",
                                     framework_dir,
                                     "-F",
                                     framework_dir,
                                     "-Xcc",
                                     "-Werror"};

    if (full_bitcode) {
        args.insert(args.end(), {"-embed-bitcode", "-Xlinker", "-bitcode_verify"});
    } else {
        args.push_back("-embed-bitcode-marker");
    }

    args.push_back("-o");
    args.push_back(paths.executable.string());
    for (const auto& source : sources) {
        args.push_back(source.string());
    }
    args.push_back(paths.stub.string());
    args.push_back(harness_main.string());
    return args;
}

Result<BuildArtifactPaths, HarnessError> ExecutableBuilder::build(const TestRunConfig& config) {
    auto paths = BuildArtifactPaths::compute(settings_.output_root, config.test_name,
                                             settings_.target);

    auto prepared = coordinator_.prepare(config);
    if (is_err(prepared)) {
        return unwrap_err(prepared);
    }

    auto sources = expand_sources(config.sources, ".swift");
    if (is_err(sources)) {
        return unwrap_err(sources);
    }
    auto written = write_provider_stub(paths.stub, generate_provider_stub(unwrap(sources)));
    if (is_err(written)) {
        return unwrap_err(written);
    }

    auto meta = resolver_.resolve(settings_.target);
    if (is_err(meta)) {
        return unwrap_err(meta);
    }
    const auto& platform = unwrap(meta);

    std::string swiftc = (platform.toolchain_bin_dir / "swiftc").string();
    auto args = compiler_arguments(platform, paths, unwrap(sources), settings_.harness_main,
                                   config.full_bitcode);
    FWTEST_LOG_INFO("builder", "Compiling " << config.test_name << " for "
                                            << target_name(settings_.target));
    FWTEST_LOG_DEBUG("builder", format_command(swiftc, args));

    auto run = runner_.run(swiftc, args, {}, inherited_environment());
    if (is_err(run)) {
        return unwrap_err(run);
    }
    auto& result = unwrap(run);
    if (result.exit_code != 0) {
        FWTEST_LOG_ERROR("builder", "Compilation of " << config.test_name << " failed");
        return HarnessError::from_process(ErrorKind::ExternalToolFailure,
                                          "Compilation of " + config.test_name +
                                              " failed with exit code " +
                                              std::to_string(result.exit_code),
                                          result.stdout_text, result.stderr_text,
                                          result.exit_code);
    }
    return paths;
}

} // namespace fwtest::harness
