//! # Provider Stub Tests

#include "fakes.hpp"
#include "harness/stub_gen.hpp"

#include <gtest/gtest.h>

using namespace fwtest;
using namespace fwtest::harness;
using fwtest::fakes::read_file;
using fwtest::fakes::TempDir;

TEST(StubGenTest, ExactContent) {
    std::string stub = generate_provider_stub({"tests/foo.swift", "tests/bar.swift"});
    EXPECT_EQ(stub, "// THIS IS AUTOGENERATED FILE\n"
                    "// This method is invoked by the main routine to get a list of tests\n"
                    "func registerProviders() {\n"
                    "    FooTests()\n"
                    "    BarTests()\n"
                    "}\n");
}

TEST(StubGenTest, EmptySourceList) {
    std::string stub = generate_provider_stub({});
    EXPECT_NE(stub.find("func registerProviders() {\n}\n"), std::string::npos);
}

TEST(StubGenTest, Deterministic) {
    std::vector<fs::path> sources = {"a/values.swift", "b/kt-29.swift"};
    EXPECT_EQ(generate_provider_stub(sources), generate_provider_stub(sources));
}

TEST(StubGenTest, ProviderNames) {
    EXPECT_EQ(provider_name("values.swift"), "ValuesTests");
    EXPECT_EQ(provider_name("/abs/dir/FooTests.swift"), "FooTests");
    EXPECT_EQ(provider_name("dir/kt-29.swift"), "Kt-29Tests");
    EXPECT_EQ(provider_name("Already.swift"), "AlreadyTests");
}

TEST(StubGenTest, WriteCreatesParentsAndOverwrites) {
    TempDir dir("stub");
    fs::path stub = dir.path() / "out" / "MyTest" / PROVIDER_STUB_FILE;

    auto first = write_provider_stub(stub, "first version, longer than the second\n");
    ASSERT_TRUE(is_ok(first)) << unwrap_err(first).to_string();
    auto second = write_provider_stub(stub, "second\n");
    ASSERT_TRUE(is_ok(second));

    EXPECT_EQ(read_file(stub), "second\n");
}

TEST(StubGenTest, WriteUnderRegularFileFails) {
    TempDir dir("stub_blocked");
    fs::path blocker = dir.write("blocker", "not a directory");
    auto result = write_provider_stub(blocker / "sub" / PROVIDER_STUB_FILE, "x");
    ASSERT_TRUE(is_err(result));
    EXPECT_EQ(unwrap_err(result).kind, ErrorKind::IoError);
}

TEST(StubGenTest, LowercaseNamesAreCapitalizedInOrder) {
    std::string stub = generate_provider_stub({"FooTests.swift", "barTests.swift"});
    auto foo = stub.find("    FooTests()\n");
    auto bar = stub.find("    BarTests()\n");
    ASSERT_NE(foo, std::string::npos);
    ASSERT_NE(bar, std::string::npos);
    EXPECT_LT(foo, bar);
}
