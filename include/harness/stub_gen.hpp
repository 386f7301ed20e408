//! # Test Stub Generator
//!
//! Produces the `provider.swift` source that the harness entry point calls to
//! register every test provider of a run.
//!
//! ## Provider Names
//!
//! | Source file             | Provider       |
//! |-------------------------|----------------|
//! | `values.swift`          | `ValuesTests`  |
//! | `FooTests.swift`        | `FooTests`     |
//! | `dir/kt-29.swift`       | `Kt-29Tests`   |
//!
//! The file base name is capitalized and gets a `Tests` suffix unless it
//! already ends with one.
//!
//! Generation is a pure function of the ordered source list; writing replaces
//! any previous stub at the same path.

#pragma once

#include "common.hpp"
#include "harness/error.hpp"

#include <filesystem>
#include <string>
#include <vector>

namespace fs = std::filesystem;

namespace fwtest::harness {

/// File name of the generated stub inside `{outputRoot}/{testName}`.
inline constexpr const char* PROVIDER_STUB_FILE = "provider.swift";

/// Provider function name for one test source file.
std::string provider_name(const fs::path& source);

/// Stub source registering a provider for each of `sources`, in order.
std::string generate_provider_stub(const std::vector<fs::path>& sources);

/// Writes `content` to `path`, creating parent directories and overwriting
/// any previous file.
Result<bool, HarnessError> write_provider_stub(const fs::path& path, const std::string& content);

} // namespace fwtest::harness
