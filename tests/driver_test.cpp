//! # Test Driver Tests
//!
//! End-to-end lifecycle through the real coordinator, builder and resolver,
//! with every external program answered by `FakeProcessRunner`.

#include "fakes.hpp"
#include "harness/test_driver.hpp"

#include <gtest/gtest.h>

using namespace fwtest;
using namespace fwtest::harness;
using fwtest::fakes::FakeProcessRunner;
using fwtest::fakes::FakeToolchain;
using fwtest::fakes::TempDir;

// ============================================================================
// Runtime Environment
// ============================================================================

namespace {

PlatformMetadata platform_for(Target target) {
    PlatformMetadata platform;
    platform.target = target;
    platform.simulator = is_simulator(target);
    platform.runtime_library_dir = "/runtime/lib/swift";
    return platform;
}

} // namespace

TEST(RuntimeEnvironmentTest, KeyBySimulatorOrDevice) {
    EXPECT_STREQ(library_path_env_key(Target::IosX64), "SIMCTL_CHILD_DYLD_LIBRARY_PATH");
    EXPECT_STREQ(library_path_env_key(Target::WatchosX86), "SIMCTL_CHILD_DYLD_LIBRARY_PATH");
    EXPECT_STREQ(library_path_env_key(Target::IosArm64), "DYLD_LIBRARY_PATH");
    EXPECT_STREQ(library_path_env_key(Target::MacosX64), "DYLD_LIBRARY_PATH");
}

TEST(RuntimeEnvironmentTest, SimulatorDelta) {
    auto delta = runtime_environment_delta(platform_for(Target::TvosX64), "", "10.14.4");
    ASSERT_EQ(delta.size(), 1u);
    EXPECT_EQ(delta.at("SIMCTL_CHILD_DYLD_LIBRARY_PATH"), "/runtime/lib/swift");
}

TEST(RuntimeEnvironmentTest, OldMacosHostGetsOverride) {
    auto delta = runtime_environment_delta(platform_for(Target::MacosX64), "10.13.6", "10.14.4");
    ASSERT_EQ(delta.size(), 1u);
    EXPECT_EQ(delta.at("DYLD_LIBRARY_PATH"), "/runtime/lib/swift");
}

TEST(RuntimeEnvironmentTest, NewMacosHostUsesSystemRuntime) {
    EXPECT_TRUE(
        runtime_environment_delta(platform_for(Target::MacosX64), "10.14.4", "10.14.4").empty());
    EXPECT_TRUE(
        runtime_environment_delta(platform_for(Target::MacosX64), "13.1", "10.14.4").empty());
}

TEST(RuntimeEnvironmentTest, ThresholdIgnoredWhenUnknownOrDisabled) {
    EXPECT_EQ(runtime_environment_delta(platform_for(Target::MacosX64), "", "10.14.4").size(), 1u);
    EXPECT_EQ(runtime_environment_delta(platform_for(Target::MacosX64), "13.1", "").size(), 1u);
    // Only the desktop target consults the host version
    EXPECT_EQ(runtime_environment_delta(platform_for(Target::IosArm64), "13.1", "10.14.4").size(),
              1u);
}

TEST(RunStateTest, Names) {
    EXPECT_STREQ(run_state_name(RunState::NotBuilt), "NotBuilt");
    EXPECT_STREQ(run_state_name(RunState::Passed), "Passed");
    EXPECT_STREQ(run_state_name(RunState::Failed), "Failed");
}

// ============================================================================
// TestDriver
// ============================================================================

class TestDriverTest : public ::testing::Test {
protected:
    void SetUp() override {
        settings.output_root = scratch.path() / "out";
        settings.harness_main = scratch.write("main.swift");
        settings.codesign_tool = "codesign";
        scratch.write("tests/values.swift");
    }

    void use_target(Target target) {
        settings.target = target;
        auto paths = BuildArtifactPaths::compute(settings.output_root, "Values", target);
        fs::create_directories(FrameworkPaths::compute(paths.framework_dir, "Values").bundle_dir);
    }

    TestRunConfig config() {
        FrameworkDescriptor framework;
        framework.name = "Values";
        return unwrap(TestRunConfigBuilder("Values")
                          .source(scratch.path() / "tests")
                          .framework(framework)
                          .build());
    }

    const fakes::Invocation* test_binary() const {
        return runner.find(TEST_EXECUTABLE_NAME);
    }

    TempDir scratch{"driver"};
    HarnessSettings settings;
    FakeToolchain toolchain;
    PlatformResolver resolver{toolchain};
    FakeProcessRunner runner;
    BitcodeValidator validator{resolver, toolchain, runner, {}};
    FrameworkCoordinator coordinator{settings, validator, runner};
    ExecutableBuilder builder{settings, resolver, coordinator, runner};
};

TEST_F(TestDriverTest, PassingRun) {
    use_target(Target::IosArm64);
    runner.on(TEST_EXECUTABLE_NAME, {"[ OK ] values\n", "", 0});
    TestDriver driver(settings, resolver, toolchain, builder, runner);
    EXPECT_EQ(driver.state(), RunState::NotBuilt);

    auto result = driver.run(config());
    ASSERT_TRUE(is_ok(result)) << unwrap_err(result).to_string();
    EXPECT_EQ(driver.state(), RunState::Passed);
    EXPECT_EQ(unwrap(result).state, RunState::Passed);
    EXPECT_EQ(unwrap(result).output.stdout_text, "[ OK ] values\n");

    const auto* run = test_binary();
    ASSERT_NE(run, nullptr);
    EXPECT_TRUE(fs::path(run->executable).is_absolute());
    EXPECT_TRUE(run->args.empty());
    EXPECT_EQ(run->working_dir, settings.output_root);
    EXPECT_EQ(run->env.at("DYLD_LIBRARY_PATH"),
              "/fake/Toolchains/XcodeDefault.xctoolchain/usr/lib/swift-5.0/iphoneos");
    EXPECT_EQ(run->env.count("SIMCTL_CHILD_DYLD_LIBRARY_PATH"), 0u);
}

TEST_F(TestDriverTest, SimulatorRunUsesSimctlKey) {
    use_target(Target::IosX64);
    toolchain.runtime = SimulatorRuntime{"com.apple.CoreSimulator.SimRuntime.iOS-17-0", "17.0",
                                         "/Runtimes/iOS 17.0.simruntime"};
    TestDriver driver(settings, resolver, toolchain, builder, runner);

    auto result = driver.run(config());
    ASSERT_TRUE(is_ok(result)) << unwrap_err(result).to_string();
    const auto* run = test_binary();
    ASSERT_NE(run, nullptr);
    EXPECT_EQ(run->env.at("SIMCTL_CHILD_DYLD_LIBRARY_PATH"),
              "/Runtimes/iOS 17.0.simruntime/Contents/Resources/RuntimeRoot/usr/lib/swift");
    EXPECT_EQ(run->env.count("DYLD_LIBRARY_PATH"), 0u);
}

TEST_F(TestDriverTest, SimulatorDeviceRunsThroughSimctl) {
    use_target(Target::IosX64);
    settings.simulator_device = "iPhone 15";
    TestDriver driver(settings, resolver, toolchain, builder, runner);

    auto result = driver.run(config());
    ASSERT_TRUE(is_ok(result)) << unwrap_err(result).to_string();
    const auto* spawn = runner.find("xcrun");
    ASSERT_NE(spawn, nullptr);
    ASSERT_EQ(spawn->args.size(), 4u);
    EXPECT_EQ(spawn->args[0], "simctl");
    EXPECT_EQ(spawn->args[1], "spawn");
    EXPECT_EQ(spawn->args[2], "iPhone 15");
    EXPECT_EQ(fs::path(spawn->args[3]).filename(), TEST_EXECUTABLE_NAME);
    EXPECT_EQ(test_binary(), nullptr);
}

TEST_F(TestDriverTest, MacosHostQueriedForDesktopTarget) {
    use_target(Target::MacosX64);
    toolchain.host_version = "12.6";
    TestDriver driver(settings, resolver, toolchain, builder, runner);

    auto result = driver.run(config());
    ASSERT_TRUE(is_ok(result));
    const auto* run = test_binary();
    ASSERT_NE(run, nullptr);
    EXPECT_EQ(run->env.count("DYLD_LIBRARY_PATH"), 0u);
}

TEST_F(TestDriverTest, FailingBinaryIsTestExecutionFailure) {
    use_target(Target::IosArm64);
    runner.on(TEST_EXECUTABLE_NAME, {"[ FAIL ] values\n", "assertion failed\n", 2});
    TestDriver driver(settings, resolver, toolchain, builder, runner);

    auto result = driver.run(config());
    ASSERT_TRUE(is_err(result));
    const auto& error = unwrap_err(result);
    EXPECT_EQ(error.kind, ErrorKind::TestExecutionFailure);
    EXPECT_EQ(error.message, "Test Values failed: swiftTestExecutable exited with code 2");
    EXPECT_EQ(error.stdout_text, "[ FAIL ] values\n");
    EXPECT_EQ(error.stderr_text, "assertion failed\n");
    EXPECT_EQ(error.exit_code, 2);
    EXPECT_EQ(driver.state(), RunState::Failed);
}

TEST_F(TestDriverTest, CompileFailureNeverRunsBinary) {
    use_target(Target::IosArm64);
    runner.on("swiftc", {"", "error: no such module 'Values'\n", 1});
    TestDriver driver(settings, resolver, toolchain, builder, runner);

    auto result = driver.run(config());
    ASSERT_TRUE(is_err(result));
    EXPECT_EQ(unwrap_err(result).kind, ErrorKind::ExternalToolFailure);
    EXPECT_EQ(driver.state(), RunState::Failed);
    EXPECT_EQ(test_binary(), nullptr);
}

TEST_F(TestDriverTest, UnsupportedTargetNeverCompiles) {
    use_target(Target::LinuxX64);
    TestDriver driver(settings, resolver, toolchain, builder, runner);

    auto result = driver.run(config());
    ASSERT_TRUE(is_err(result));
    EXPECT_EQ(unwrap_err(result).kind, ErrorKind::UnsupportedTarget);
    EXPECT_EQ(driver.state(), RunState::Failed);
    EXPECT_EQ(runner.count("swiftc"), 0u);
}

TEST_F(TestDriverTest, HooksObserveLifecycle) {
    use_target(Target::IosArm64);
    std::vector<std::string> events;
    RunHooks hooks;
    hooks.before_build = [&](const TestRunConfig& config) {
        events.push_back("build:" + config.test_name);
    };
    hooks.before_run = [&](const TestRunConfig& config, const fs::path& executable) {
        events.push_back("run:" + config.test_name + ":" + executable.filename().string());
        EXPECT_EQ(runner.count(TEST_EXECUTABLE_NAME), 0u);
    };
    TestDriver driver(settings, resolver, toolchain, builder, runner, hooks);

    auto result = driver.run(config());
    ASSERT_TRUE(is_ok(result));
    EXPECT_EQ(events, (std::vector<std::string>{"build:Values", "run:Values:swiftTestExecutable"}));
}

TEST_F(TestDriverTest, LaunchFailureLeavesFailedState) {
    use_target(Target::IosArm64);
    runner.fail_launch(TEST_EXECUTABLE_NAME);
    TestDriver driver(settings, resolver, toolchain, builder, runner);

    auto result = driver.run(config());
    ASSERT_TRUE(is_err(result));
    EXPECT_EQ(unwrap_err(result).kind, ErrorKind::ProcessLaunch);
    EXPECT_EQ(driver.state(), RunState::Failed);
}

TEST_F(TestDriverTest, UnsignedSingleFrameworkPasses) {
    use_target(Target::IosArm64);
    FrameworkDescriptor framework;
    framework.name = "Values";
    auto unsigned_config = unwrap(TestRunConfigBuilder("Values")
                                      .source(scratch.path() / "tests" / "values.swift")
                                      .framework(framework)
                                      .codesign(false)
                                      .build());
    TestDriver driver(settings, resolver, toolchain, builder, runner);

    auto result = driver.run(unsigned_config);
    ASSERT_TRUE(is_ok(result)) << unwrap_err(result).to_string();
    EXPECT_EQ(driver.state(), RunState::Passed);
    EXPECT_EQ(runner.count("codesign"), 0u);
    EXPECT_EQ(runner.count(TEST_EXECUTABLE_NAME), 1u);
}
