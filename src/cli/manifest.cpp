#include "manifest.hpp"

#include "log/log.hpp"

#include <algorithm>
#include <cctype>
#include <fstream>
#include <set>

namespace fwtest::cli {

// ============================================================================
// Manifest
// ============================================================================

Result<bool, HarnessError> Manifest::validate() const {
    std::set<std::string> seen;
    for (const auto& test : tests) {
        if (test.name.empty()) {
            return HarnessError::make(ErrorKind::InvalidConfiguration, "Test name should be set");
        }
        if (!seen.insert(test.name).second) {
            return HarnessError::make(ErrorKind::InvalidConfiguration,
                                      "Duplicate test name: " + test.name);
        }
        if (test.sources.empty()) {
            return HarnessError::make(ErrorKind::InvalidConfiguration,
                                      "Test sources should be set for test " + test.name);
        }
        if (test.frameworks.empty()) {
            return HarnessError::make(ErrorKind::InvalidConfiguration,
                                      "Frameworks should be set for test " + test.name);
        }
        for (const auto& framework : test.frameworks) {
            if (framework.name.empty()) {
                return HarnessError::make(ErrorKind::InvalidConfiguration,
                                          "Framework name should be set for test " + test.name);
            }
        }
    }
    return true;
}

Result<std::vector<harness::TestRunConfig>, HarnessError>
Manifest::test_configs(const std::vector<std::string>& selected) const {
    for (const auto& name : selected) {
        bool known = std::any_of(tests.begin(), tests.end(),
                                 [&](const TestEntry& test) { return test.name == name; });
        if (!known) {
            return HarnessError::make(ErrorKind::InvalidConfiguration, "Unknown test: " + name);
        }
    }

    std::vector<harness::TestRunConfig> configs;
    for (const auto& test : tests) {
        if (!selected.empty() &&
            std::find(selected.begin(), selected.end(), test.name) == selected.end()) {
            continue;
        }

        harness::TestRunConfigBuilder builder(test.name);
        for (const auto& source : test.sources) {
            builder.source(base_dir / source);
        }
        for (auto framework : test.frameworks) {
            for (auto& source : framework.sources) {
                source = base_dir / source;
            }
            builder.framework(std::move(framework));
        }
        builder.full_bitcode(test.full_bitcode).codesign(test.codesign);

        auto config = builder.build();
        if (is_err(config)) {
            return unwrap_err(config);
        }
        configs.push_back(std::move(unwrap(config)));
    }
    return configs;
}

Result<Manifest, HarnessError> Manifest::load(const fs::path& path) {
    std::ifstream file(path);
    if (!file) {
        return HarnessError::make(ErrorKind::InvalidConfiguration,
                                  "Cannot read manifest " + path.string());
    }

    std::string content((std::istreambuf_iterator<char>(file)), std::istreambuf_iterator<char>());

    SimpleTomlParser parser(content);
    auto manifest = parser.parse();
    if (!manifest) {
        return HarnessError::make(parser.get_error_kind(),
                                  path.string() + ": " + parser.get_error());
    }

    manifest->base_dir = path.parent_path();
    manifest->harness.output_root = manifest->base_dir / manifest->harness.output_root;
    manifest->harness.harness_main = manifest->base_dir / manifest->harness.harness_main;

    auto valid = manifest->validate();
    if (is_err(valid)) {
        auto error = unwrap_err(valid);
        error.message = path.string() + ": " + error.message;
        return error;
    }

    FWTEST_LOG_DEBUG("manifest", "Loaded " << path.string() << " (" << manifest->tests.size()
                                           << " test(s))");
    return *manifest;
}

// ============================================================================
// SimpleTomlParser
// ============================================================================

SimpleTomlParser::SimpleTomlParser(const std::string& content)
    : content_(content), pos_(0), line_(1) {}

void SimpleTomlParser::skip_whitespace() {
    while (!is_eof() && std::isspace(static_cast<unsigned char>(peek()))) {
        if (peek() == '\n')
            line_++;
        advance();
    }
}

void SimpleTomlParser::skip_comment() {
    if (peek() == '#') {
        while (!is_eof() && peek() != '\n') {
            advance();
        }
    }
}

void SimpleTomlParser::skip_trivia() {
    size_t before;
    do {
        before = pos_;
        skip_whitespace();
        skip_comment();
    } while (pos_ != before);
}

char SimpleTomlParser::advance() {
    if (is_eof())
        return '\0';
    return content_[pos_++];
}

std::string SimpleTomlParser::parse_identifier() {
    std::string result;
    while (!is_eof() &&
           (std::isalnum(static_cast<unsigned char>(peek())) || peek() == '_' || peek() == '-')) {
        result += advance();
    }
    return result;
}

std::string SimpleTomlParser::parse_string() {
    if (peek() != '"') {
        set_error("Expected string");
        return "";
    }
    advance(); // Skip opening quote

    std::string result;
    while (!is_eof() && peek() != '"' && peek() != '\n') {
        if (peek() == '\\') {
            advance();
            if (is_eof())
                break;
            char escaped = advance();
            switch (escaped) {
            case 'n':
                result += '\n';
                break;
            case 't':
                result += '\t';
                break;
            case '\\':
                result += '\\';
                break;
            case '"':
                result += '"';
                break;
            default:
                result += escaped;
                break;
            }
        } else {
            result += advance();
        }
    }

    if (peek() != '"') {
        set_error("Unterminated string");
        return "";
    }
    advance(); // Skip closing quote

    return result;
}

bool SimpleTomlParser::parse_boolean() {
    std::string value = parse_identifier();
    if (value != "true" && value != "false") {
        set_error("Expected boolean, found '" + value + "'");
    }
    return value == "true";
}

std::vector<std::string> SimpleTomlParser::parse_string_array() {
    std::vector<std::string> result;

    if (peek() != '[') {
        set_error("Expected array");
        return result;
    }
    advance(); // Skip '['

    skip_trivia();

    while (!is_eof() && peek() != ']') {
        if (peek() != '"') {
            set_error("Expected string in array");
            return result;
        }
        result.push_back(parse_string());

        skip_trivia();

        if (peek() == ',') {
            advance();
            skip_trivia();
        }
    }

    if (peek() != ']') {
        set_error("Expected closing bracket");
        return result;
    }
    advance(); // Skip ']'

    return result;
}

void SimpleTomlParser::skip_value() {
    if (peek() == '"') {
        parse_string();
    } else if (peek() == '[') {
        parse_string_array();
    } else {
        parse_identifier();
    }
}

/// Reads `key =` and leaves the cursor on the value.
bool SimpleTomlParser::expect_assignment(std::string& key) {
    key = parse_identifier();
    if (key.empty()) {
        set_error("Expected key");
        return false;
    }
    skip_whitespace();

    if (peek() != '=') {
        set_error("Expected '=' after key");
        return false;
    }
    advance();
    skip_whitespace();
    return true;
}

void SimpleTomlParser::set_error(const std::string& message, ErrorKind kind) {
    if (!error_message_.empty()) {
        return; // keep the first error
    }
    error_message_ = "Line " + std::to_string(line_) + ": " + message;
    error_kind_ = kind;
}

bool SimpleTomlParser::parse_harness_section(harness::HarnessSettings& settings) {
    skip_trivia();

    while (!is_eof() && peek() != '[' && error_message_.empty()) {
        std::string key;
        if (!expect_assignment(key))
            return false;

        if (key == "output-root") {
            settings.output_root = parse_string();
        } else if (key == "harness-main") {
            settings.harness_main = parse_string();
        } else if (key == "target") {
            std::string name = parse_string();
            auto target = harness::parse_target(name);
            if (is_err(target)) {
                set_error(unwrap_err(target).message, ErrorKind::UnsupportedTarget);
                return false;
            }
            settings.target = unwrap(target);
        } else if (key == "codesign-tool") {
            settings.codesign_tool = parse_string();
        } else if (key == "interpreters") {
            settings.interpreters = parse_string_array();
        } else if (key == "system-runtime-since") {
            settings.system_runtime_since = parse_string();
        } else if (key == "simulator-device") {
            settings.simulator_device = parse_string();
        } else {
            FWTEST_LOG_WARN("manifest", "Line " << line_ << ": unknown key '" << key
                                                << "' in [harness]");
            skip_value();
        }

        skip_trivia();
    }

    return error_message_.empty();
}

bool SimpleTomlParser::parse_toolchain_section(harness::ToolchainSettings& settings) {
    skip_trivia();

    while (!is_eof() && peek() != '[' && error_message_.empty()) {
        std::string key;
        if (!expect_assignment(key))
            return false;

        if (key == "target-toolchain") {
            settings.target_toolchain = parse_string();
        } else if (key == "additional-tools-dir") {
            settings.additional_tools_dir = parse_string();
        } else if (key == "runtime-search-dirs") {
            settings.runtime_search_dirs = parse_string_array();
        } else {
            FWTEST_LOG_WARN("manifest", "Line " << line_ << ": unknown key '" << key
                                                << "' in [toolchain]");
            skip_value();
        }

        skip_trivia();
    }

    return error_message_.empty();
}

bool SimpleTomlParser::parse_test_section(TestEntry& test) {
    skip_trivia();

    while (!is_eof() && peek() != '[' && error_message_.empty()) {
        std::string key;
        if (!expect_assignment(key))
            return false;

        if (key == "name") {
            test.name = parse_string();
        } else if (key == "sources") {
            test.sources = parse_string_array();
        } else if (key == "full-bitcode") {
            test.full_bitcode = parse_boolean();
        } else if (key == "codesign") {
            test.codesign = parse_boolean();
        } else {
            FWTEST_LOG_WARN("manifest", "Line " << line_ << ": unknown key '" << key
                                                << "' in [[test]]");
            skip_value();
        }

        skip_trivia();
    }

    return error_message_.empty();
}

bool SimpleTomlParser::parse_framework_section(harness::FrameworkDescriptor& framework) {
    skip_trivia();

    while (!is_eof() && peek() != '[' && error_message_.empty()) {
        std::string key;
        if (!expect_assignment(key))
            return false;

        if (key == "name") {
            framework.name = parse_string();
        } else if (key == "sources") {
            auto sources = parse_string_array();
            framework.sources.assign(sources.begin(), sources.end());
        } else if (key == "bitcode") {
            framework.embed_bitcode = parse_boolean();
        } else if (key == "artifact") {
            framework.artifact = parse_string();
        } else if (key == "library") {
            framework.library = parse_string();
        } else if (key == "opts") {
            framework.opts = parse_string_array();
        } else {
            FWTEST_LOG_WARN("manifest", "Line " << line_ << ": unknown key '" << key
                                                << "' in [[test.framework]]");
            skip_value();
        }

        skip_trivia();
    }

    return error_message_.empty();
}

std::optional<Manifest> SimpleTomlParser::parse() {
    Manifest manifest;

    while (!is_eof()) {
        skip_trivia();

        if (is_eof())
            break;

        if (peek() != '[') {
            set_error("Expected section header");
            return std::nullopt;
        }
        advance(); // Skip '['

        // Check for array section [[test]]
        bool is_array = false;
        if (peek() == '[') {
            is_array = true;
            advance();
        }

        std::string section = parse_identifier();

        // Handle test.framework
        std::string subsection;
        if (peek() == '.') {
            advance();
            subsection = parse_identifier();
        }

        if (is_array && peek() == ']') {
            advance(); // Skip second ']'
        }

        if (peek() != ']') {
            set_error("Expected ']' after section name");
            return std::nullopt;
        }
        advance(); // Skip ']'

        // Parse section content
        if (section == "harness" && !is_array) {
            if (!parse_harness_section(manifest.harness))
                return std::nullopt;
        } else if (section == "toolchain" && !is_array) {
            if (!parse_toolchain_section(manifest.toolchain))
                return std::nullopt;
        } else if (section == "test" && is_array && subsection.empty()) {
            TestEntry test;
            if (!parse_test_section(test))
                return std::nullopt;
            manifest.tests.push_back(std::move(test));
        } else if (section == "test" && is_array && subsection == "framework") {
            if (manifest.tests.empty()) {
                set_error("[[test.framework]] must follow a [[test]]");
                return std::nullopt;
            }
            harness::FrameworkDescriptor framework;
            if (!parse_framework_section(framework))
                return std::nullopt;
            manifest.tests.back().frameworks.push_back(std::move(framework));
        } else {
            set_error("Unknown section '" + section +
                      (subsection.empty() ? std::string() : "." + subsection) + "'");
            return std::nullopt;
        }
    }

    if (!error_message_.empty()) {
        return std::nullopt;
    }

    return manifest;
}

} // namespace fwtest::cli
