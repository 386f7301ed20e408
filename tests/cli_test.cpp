//! # CLI Tests

#include "cli/commands.hpp"
#include "cli/utils.hpp"
#include "fakes.hpp"

#include <gtest/gtest.h>

#include <algorithm>
#include <map>
#include <memory>
#include <mutex>

using namespace fwtest;
using namespace fwtest::cli;
using fwtest::fakes::FakeProcessRunner;
using fwtest::fakes::TempDir;

namespace {

/// Owns argv storage for option parsing tests.
struct Argv {
    explicit Argv(std::vector<std::string> args) : storage(std::move(args)) {
        for (auto& arg : storage) {
            pointers.push_back(arg.data());
        }
        pointers.push_back(nullptr);
    }

    int argc() const {
        return static_cast<int>(storage.size());
    }
    char** argv() {
        return pointers.data();
    }

    std::vector<std::string> storage;
    std::vector<char*> pointers;
};

} // namespace

// ============================================================================
// Option Parsing
// ============================================================================

TEST(CliOptionsTest, LastValueWins) {
    Argv args({"fwtest", "run", "--jobs=2", "--jobs=4"});
    auto jobs = option_value(args.argc(), args.argv(), "--jobs");
    ASSERT_TRUE(jobs.has_value());
    EXPECT_EQ(*jobs, "4");
    EXPECT_FALSE(option_value(args.argc(), args.argv(), "--manifest").has_value());
}

TEST(CliOptionsTest, RepeatedValuesInOrder) {
    Argv args({"fwtest", "run", "--test=Values", "--no-color", "--test=Stdlib"});
    EXPECT_EQ(option_values(args.argc(), args.argv(), "--test"),
              (std::vector<std::string>{"Values", "Stdlib"}));
}

TEST(CliOptionsTest, PositionalArgsSkipOptions) {
    Argv args({"fwtest", "stub", "a.swift", "-v", "--no-color", "b.swift"});
    EXPECT_EQ(positional_args(args.argc(), args.argv()),
              (std::vector<std::string>{"a.swift", "b.swift"}));
}

TEST(CliOptionsTest, CommandNameIsNotAnOption) {
    Argv args({"fwtest", "--jobs=3"});
    EXPECT_FALSE(option_value(args.argc(), args.argv(), "--jobs").has_value());
}

TEST(CliColorTest, DisabledColorsAreEmpty) {
    ColorOutput off(false);
    EXPECT_STREQ(off.red(), "");
    EXPECT_STREQ(off.reset(), "");
    ColorOutput on(true);
    EXPECT_STREQ(on.green(), colors::green);
}

// ============================================================================
// run_one
// ============================================================================

class RunOneTest : public ::testing::Test {
protected:
    void SetUp() override {
        manifest.base_dir = scratch.path();
        manifest.harness.output_root = scratch.path() / "out";
        manifest.harness.harness_main = scratch.write("main.swift");
        manifest.harness.target = harness::Target::IosArm64;
        manifest.harness.codesign_tool = "codesign";
        manifest.toolchain.target_toolchain = "/opt/toolchain";
        manifest.toolchain.additional_tools_dir = "/opt/tools";
        manifest.toolchain.runtime_search_dirs.clear();

        scratch.write("tests/values.swift");
        auto paths = harness::BuildArtifactPaths::compute(manifest.harness.output_root, "Values",
                                                          manifest.harness.target);
        fs::create_directories(
            harness::FrameworkPaths::compute(paths.framework_dir, "Values").bundle_dir);

        TestEntry entry;
        entry.name = "Values";
        entry.sources = {"tests"};
        harness::FrameworkDescriptor framework;
        framework.name = "Values";
        entry.frameworks.push_back(framework);
        manifest.tests.push_back(entry);

        runner.on("xcrun", {"/sdks/iPhoneOS.sdk\n", "", 0});
    }

    harness::TestRunConfig only_config() {
        auto configs = manifest.test_configs();
        EXPECT_TRUE(is_ok(configs));
        return unwrap(configs).at(0);
    }

    TempDir scratch{"cli"};
    Manifest manifest;
    FakeProcessRunner runner;
};

TEST_F(RunOneTest, PassingTest) {
    TestOutcome outcome = run_one(manifest, only_config(), runner);
    EXPECT_EQ(outcome.name, "Values");
    EXPECT_EQ(outcome.state, harness::RunState::Passed);
    EXPECT_FALSE(outcome.error.has_value());

    const auto* swiftc = runner.find("swiftc");
    ASSERT_NE(swiftc, nullptr);
    EXPECT_EQ(swiftc->executable, "/opt/toolchain/usr/bin/swiftc");
    EXPECT_EQ(runner.count("xcode-select"), 0u);
}

TEST_F(RunOneTest, FailingTestReportsError) {
    runner.on(harness::TEST_EXECUTABLE_NAME, {"", "fatal error\n", 1});
    TestOutcome outcome = run_one(manifest, only_config(), runner);
    EXPECT_EQ(outcome.state, harness::RunState::Failed);
    ASSERT_TRUE(outcome.error.has_value());
    EXPECT_EQ(outcome.error->kind, ErrorKind::TestExecutionFailure);
    EXPECT_EQ(outcome.error->stderr_text, "fatal error\n");
}

// ============================================================================
// run_tests
// ============================================================================

namespace {

/// Fake runner that also appends every executable it runs to a shared list.
class SharedLogRunner : public FakeProcessRunner {
public:
    SharedLogRunner(std::mutex& mutex, std::vector<std::string>& log) : mutex_(mutex), log_(log) {}

    Result<harness::ProcessResult, HarnessError> run(const std::string& executable,
                                                     const std::vector<std::string>& args,
                                                     const fs::path& working_dir,
                                                     const harness::Environment& env) override {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            log_.push_back(executable);
        }
        return FakeProcessRunner::run(executable, args, working_dir, env);
    }

private:
    std::mutex& mutex_;
    std::vector<std::string>& log_;
};

} // namespace

class RunTestsTest : public ::testing::Test {
protected:
    void SetUp() override {
        manifest.base_dir = scratch.path();
        manifest.harness.output_root = scratch.path() / "out";
        manifest.harness.harness_main = scratch.write("main.swift");
        manifest.harness.target = harness::Target::IosArm64;
        manifest.toolchain.target_toolchain = "/opt/toolchain";
        manifest.toolchain.additional_tools_dir = "/opt/tools";
        manifest.toolchain.runtime_search_dirs.clear();
    }

    void add_test(const std::string& name, const std::string& source) {
        scratch.write("tests/" + source);
        fs::create_directories(harness::FrameworkPaths::compute(paths(name).framework_dir, "Kit")
                                   .bundle_dir);

        TestEntry entry;
        entry.name = name;
        entry.sources = {"tests/" + source};
        harness::FrameworkDescriptor framework;
        framework.name = "Kit";
        entry.frameworks.push_back(framework);
        manifest.tests.push_back(entry);
    }

    harness::BuildArtifactPaths paths(const std::string& name) const {
        return harness::BuildArtifactPaths::compute(manifest.harness.output_root, name,
                                                    manifest.harness.target);
    }

    int run(unsigned int jobs) {
        auto configs = manifest.test_configs();
        EXPECT_TRUE(is_ok(configs));
        RunnerFactory factory = [this] {
            auto runner = std::make_unique<SharedLogRunner>(log_mutex, executed);
            runner->on("xcrun", {"/sdks/iPhoneOS.sdk\n", "", 0});
            for (const auto& [path, result] : scripted) {
                runner->on_path(path, result);
            }
            ++runners_made;
            return runner;
        };
        return run_tests(manifest, unwrap(configs), jobs, ColorOutput(false), factory);
    }

    size_t executions_of(const fs::path& executable) {
        std::lock_guard<std::mutex> lock(log_mutex);
        return static_cast<size_t>(
            std::count(executed.begin(), executed.end(), executable.string()));
    }

    TempDir scratch{"cli_run"};
    Manifest manifest;
    std::map<fs::path, harness::ProcessResult> scripted;
    std::mutex log_mutex;
    std::vector<std::string> executed;
    int runners_made = 0;
};

TEST_F(RunTestsTest, AllPassingExitsZero) {
    add_test("Alpha", "alpha.swift");
    add_test("Beta", "beta.swift");

    EXPECT_EQ(run(1), 0);
    EXPECT_EQ(runners_made, 1);
    EXPECT_EQ(executions_of(paths("Alpha").executable), 1u);
    EXPECT_EQ(executions_of(paths("Beta").executable), 1u);
}

TEST_F(RunTestsTest, OneFailingBinaryExitsOne) {
    add_test("Alpha", "alpha.swift");
    add_test("Beta", "beta.swift");
    scripted[paths("Beta").executable] = {"", "assertion failed\n", 1};

    EXPECT_EQ(run(1), 1);
    // A failure does not stop the remaining tests
    EXPECT_EQ(executions_of(paths("Alpha").executable), 1u);
    EXPECT_EQ(executions_of(paths("Beta").executable), 1u);
}

TEST_F(RunTestsTest, ParallelWorkersKeepTestsApart) {
    add_test("Alpha", "alpha.swift");
    add_test("Beta", "beta.swift");
    add_test("Gamma", "gamma.swift");

    EXPECT_EQ(run(2), 0);
    EXPECT_EQ(runners_made, 2);

    for (const auto& [name, provider] : std::vector<std::pair<std::string, std::string>>{
             {"Alpha", "AlphaTests()"}, {"Beta", "BetaTests()"}, {"Gamma", "GammaTests()"}}) {
        auto artifact = paths(name);
        EXPECT_EQ(artifact.stub.parent_path(), manifest.harness.output_root / name);
        ASSERT_TRUE(fs::exists(artifact.stub)) << name;
        std::string stub = fwtest::fakes::read_file(artifact.stub);
        EXPECT_NE(stub.find(provider), std::string::npos) << name;
        EXPECT_EQ(stub.find("Tests()"), stub.rfind("Tests()")) << name;
        EXPECT_EQ(executions_of(artifact.executable), 1u) << name;
    }
}

TEST_F(RunTestsTest, WorkersNeverExceedTests) {
    add_test("Alpha", "alpha.swift");
    scripted[paths("Alpha").executable] = {"", "", 2};

    EXPECT_EQ(run(8), 1);
    EXPECT_EQ(runners_made, 1);
}
