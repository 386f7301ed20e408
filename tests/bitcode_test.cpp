//! # Bitcode Validator Tests

#include "fakes.hpp"
#include "harness/bitcode.hpp"

#include <gtest/gtest.h>

using namespace fwtest;
using namespace fwtest::harness;
using fwtest::fakes::FakeProcessRunner;
using fwtest::fakes::FakeToolchain;
using fwtest::fakes::TempDir;

class BitcodeValidatorTest : public ::testing::Test {
protected:
    void SetUp() override {
        python = scratch.write("bin/python3", "#!/bin/sh\n");
    }

    BitcodeValidator make_validator(std::vector<std::string> interpreters) {
        return BitcodeValidator(resolver, toolchain, runner, std::move(interpreters));
    }

    TempDir scratch{"bitcode"};
    fs::path python;
    FakeToolchain toolchain;
    PlatformResolver resolver{toolchain};
    FakeProcessRunner runner;
};

// ============================================================================
// Skipped Validation
// ============================================================================

TEST_F(BitcodeValidatorTest, SkippedWithoutFullBitcode) {
    auto validator = make_validator({python.string()});
    auto result = validator.validate("/fw/Foo.framework/Foo", Target::IosArm64, false);
    ASSERT_TRUE(is_ok(result));
    EXPECT_TRUE(unwrap(result));
    EXPECT_TRUE(runner.calls.empty());
    EXPECT_EQ(toolchain.queries, 0);
}

TEST_F(BitcodeValidatorTest, SkippedForSimulatorTargets) {
    auto validator = make_validator({"/nonexistent/python3"});
    for (Target target : {Target::IosX64, Target::TvosX64, Target::WatchosX86, Target::WatchosX64}) {
        auto result = validator.validate("/fw/Foo.framework/Foo", target, true);
        ASSERT_TRUE(is_ok(result)) << target_name(target);
        EXPECT_TRUE(unwrap(result));
    }
    EXPECT_TRUE(runner.calls.empty());
}

// ============================================================================
// Interpreter Discovery
// ============================================================================

TEST_F(BitcodeValidatorTest, FirstExistingInterpreterWins) {
    fs::path second = scratch.write("other/python3");
    auto validator = make_validator({"/nonexistent/python3", python.string(), second.string()});
    auto found = validator.find_interpreter();
    ASSERT_TRUE(is_ok(found));
    EXPECT_EQ(unwrap(found), python.string());
}

TEST_F(BitcodeValidatorTest, MissingInterpreterIsReported) {
    auto validator = make_validator({"/nonexistent/a/python3", "/nonexistent/b/python3"});
    auto result = validator.validate("/fw/Foo.framework/Foo", Target::IosArm64, true);
    ASSERT_TRUE(is_err(result));
    EXPECT_EQ(unwrap_err(result).kind, ErrorKind::MissingInterpreter);
    EXPECT_NE(unwrap_err(result).message.find("/nonexistent/b/python3"), std::string::npos);
    EXPECT_TRUE(runner.calls.empty());
}

// ============================================================================
// Tool Invocation
// ============================================================================

TEST_F(BitcodeValidatorTest, InvokesBitcodeBuildTool) {
    auto validator = make_validator({python.string()});
    auto result = validator.validate("/fw/Foo.framework/Foo", Target::IosArm64, true);
    ASSERT_TRUE(is_ok(result)) << unwrap_err(result).to_string();
    EXPECT_TRUE(unwrap(result));

    ASSERT_EQ(runner.calls.size(), 1u);
    const auto& call = runner.calls[0];
    EXPECT_EQ(call.executable, python.string());
    EXPECT_EQ(call.args, (std::vector<std::string>{
                             "-B", "/fake/usr/bin/bitcode-build-tool", "--sdk",
                             "/fake/SDKs/iphoneos.sdk", "-v", "-t",
                             "/fake/Toolchains/XcodeDefault.xctoolchain/usr/bin/",
                             "/fw/Foo.framework/Foo"}));
    EXPECT_TRUE(call.working_dir.empty());
}

TEST_F(BitcodeValidatorTest, ToolFailureCarriesOutput) {
    runner.on("python3", {"checking Foo\n", "error: missing bitcode\n", 1});
    auto validator = make_validator({python.string()});
    auto result = validator.validate("/fw/Foo.framework/Foo", Target::WatchosArm64, true);

    ASSERT_TRUE(is_err(result));
    const auto& error = unwrap_err(result);
    EXPECT_EQ(error.kind, ErrorKind::ExternalToolFailure);
    EXPECT_EQ(error.stdout_text, "checking Foo\n");
    EXPECT_EQ(error.stderr_text, "error: missing bitcode\n");
    EXPECT_EQ(error.exit_code, 1);
}

TEST_F(BitcodeValidatorTest, UnsupportedTargetIsReported) {
    auto validator = make_validator({python.string()});
    auto result = validator.validate("/fw/Foo.framework/Foo", Target::LinuxX64, true);
    ASSERT_TRUE(is_err(result));
    EXPECT_EQ(unwrap_err(result).kind, ErrorKind::UnsupportedTarget);
    EXPECT_TRUE(runner.calls.empty());
}

// ============================================================================
// Object Inspection
// ============================================================================

TEST(InspectEmbeddedBitcodeTest, TextFileIsNotAnObject) {
    TempDir dir("inspect");
    fs::path file = dir.write("notes.txt", "plain text, not an object file\n");
    auto result = inspect_embedded_bitcode(file);
    ASSERT_TRUE(is_err(result));
    EXPECT_EQ(unwrap_err(result).kind, ErrorKind::IoError);
}

TEST(InspectEmbeddedBitcodeTest, MissingFileIsIoError) {
    auto result = inspect_embedded_bitcode("/nonexistent/fwtest/binary");
    ASSERT_TRUE(is_err(result));
    EXPECT_EQ(unwrap_err(result).kind, ErrorKind::IoError);
}

TEST(InspectEmbeddedBitcodeTest, ScansSectionsOfOwnExecutable) {
    auto result = inspect_embedded_bitcode(fs::canonical("/proc/self/exe"));
    ASSERT_TRUE(is_ok(result)) << unwrap_err(result).to_string();
    const auto& inspection = unwrap(result);
    EXPECT_TRUE(inspection.sections_scanned);
    EXPECT_EQ(inspection.format, "ELF 64-bit");
    EXPECT_FALSE(inspection.sections.empty());
}
