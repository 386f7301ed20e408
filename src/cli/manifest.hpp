//! # Harness Manifest
//!
//! This header defines `fwtest.toml` parsing.
//!
//! ## Manifest Sections
//!
//! | Section              | Type                  | Description                        |
//! |----------------------|-----------------------|------------------------------------|
//! | `[harness]`          | `HarnessSettings`     | Output root, target, tool paths    |
//! | `[toolchain]`        | `ToolchainSettings`   | Explicit toolchain locations       |
//! | `[[test]]`           | `TestEntry`           | One declared test                  |
//! | `[[test.framework]]` | `FrameworkDescriptor` | Framework of the preceding test    |
//!
//! Relative paths are resolved against the directory holding the manifest.
//!
//! ## TOML Parser
//!
//! `SimpleTomlParser` handles the subset of TOML the manifest needs: tables,
//! arrays of tables, strings, booleans, string arrays and `#` comments.

#ifndef FWTEST_CLI_MANIFEST_HPP
#define FWTEST_CLI_MANIFEST_HPP

#include "common.hpp"
#include "harness/error.hpp"
#include "harness/run_config.hpp"
#include "harness/toolchain.hpp"

#include <filesystem>
#include <optional>
#include <string>
#include <vector>

namespace fs = std::filesystem;

namespace fwtest::cli {

using harness::ErrorKind;
using harness::HarnessError;

/// Default manifest file name.
inline constexpr const char* MANIFEST_FILE = "fwtest.toml";

/**
 * One test from a [[test]] section
 */
struct TestEntry {
    std::string name;
    std::vector<std::string> sources;
    bool full_bitcode = false;
    bool codesign = true;
    std::vector<harness::FrameworkDescriptor> frameworks;
};

struct Manifest {
    harness::HarnessSettings harness;
    harness::ToolchainSettings toolchain;
    std::vector<TestEntry> tests;

    /// Directory relative paths are resolved against.
    fs::path base_dir;

    /**
     * Rejects duplicate test names and incomplete tests.
     */
    Result<bool, HarnessError> validate() const;

    /**
     * Run configurations for the tests named in `selected` (all when empty),
     * in manifest order. Unknown names are an `InvalidConfiguration` error.
     */
    Result<std::vector<harness::TestRunConfig>, HarnessError>
    test_configs(const std::vector<std::string>& selected = {}) const;

    /**
     * Load and validate a manifest file
     */
    static Result<Manifest, HarnessError> load(const fs::path& path);
};

class SimpleTomlParser {
public:
    explicit SimpleTomlParser(const std::string& content);

    /**
     * Parse TOML content into manifest
     */
    std::optional<Manifest> parse();

    /**
     * Get error message if parsing failed
     */
    std::string get_error() const {
        return error_message_;
    }

    ErrorKind get_error_kind() const {
        return error_kind_;
    }

private:
    std::string content_;
    std::string error_message_;
    ErrorKind error_kind_ = ErrorKind::InvalidConfiguration;
    size_t pos_ = 0;
    int line_ = 1;

    // Helper methods
    void skip_whitespace();
    void skip_comment();
    void skip_trivia();
    bool is_eof() const {
        return pos_ >= content_.size();
    }
    char peek() const {
        return is_eof() ? '\0' : content_[pos_];
    }
    char advance();

    std::string parse_identifier();
    std::string parse_string();
    bool parse_boolean();
    std::vector<std::string> parse_string_array();
    void skip_value();
    bool expect_assignment(std::string& key);

    bool parse_harness_section(harness::HarnessSettings& settings);
    bool parse_toolchain_section(harness::ToolchainSettings& settings);
    bool parse_test_section(TestEntry& test);
    bool parse_framework_section(harness::FrameworkDescriptor& framework);

    void set_error(const std::string& message, ErrorKind kind = ErrorKind::InvalidConfiguration);
};

} // namespace fwtest::cli

#endif // FWTEST_CLI_MANIFEST_HPP
