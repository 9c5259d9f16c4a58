//! # Configuration Tests
//!
//! `maplint.toml` parsing: sections, rule toggles, severities, hazard
//! patterns and the syntax errors that abort loading.

#include "maplint/config/config.hpp"

#include <gtest/gtest.h>

#include <filesystem>
#include <fstream>

using namespace maplint;
using namespace maplint::config;
using analysis::Rule;
using analysis::Severity;

class ConfigTest : public ::testing::Test {
protected:
    static auto parse(std::string_view text) -> Settings {
        auto result = parse_config(text);
        EXPECT_TRUE(is_ok(result)) << (is_err(result) ? unwrap_err(result).to_string() : "");
        return is_ok(result) ? std::move(unwrap(result)) : Settings{};
    }

    static auto parse_error(std::string_view text) -> ConfigError {
        auto result = parse_config(text, "maplint.toml");
        EXPECT_TRUE(is_err(result));
        return is_err(result) ? unwrap_err(result) : ConfigError{};
    }
};

// ============================================================================
// Defaults and [lint]
// ============================================================================

TEST_F(ConfigTest, EmptyTextGivesDefaults) {
    auto settings = parse("");
    ASSERT_TRUE(settings.fail_on.has_value());
    EXPECT_EQ(*settings.fail_on, Severity::Error);
    EXPECT_EQ(settings.analyzer.min_severity, Severity::Info);
    EXPECT_TRUE(settings.analyzer.check_duplicates);
    EXPECT_TRUE(settings.analyzer.check_missing_destination);
    EXPECT_TRUE(settings.analyzer.disabled_rules.empty());
    EXPECT_EQ(settings.max_fix_iterations, 50);
}

TEST_F(ConfigTest, LintSection) {
    auto settings = parse(R"(
# project settings
[lint]
fail-on = "warning"
min-severity = "warning"   # hide info findings
check-missing-destination = false
check-duplicates = false
)");
    ASSERT_TRUE(settings.fail_on.has_value());
    EXPECT_EQ(*settings.fail_on, Severity::Warning);
    EXPECT_EQ(settings.analyzer.min_severity, Severity::Warning);
    EXPECT_FALSE(settings.analyzer.check_missing_destination);
    EXPECT_FALSE(settings.analyzer.check_duplicates);
}

TEST_F(ConfigTest, FailOnNever) {
    auto settings = parse("[lint]\nfail-on = \"never\"\n");
    EXPECT_FALSE(settings.fail_on.has_value());
}

TEST_F(ConfigTest, InvalidValuesKeepDefaults) {
    auto settings = parse(R"(
[lint]
fail-on = "sometimes"
min-severity = 3
check-duplicates = "yes"
unknown-key = true
)");
    ASSERT_TRUE(settings.fail_on.has_value());
    EXPECT_EQ(*settings.fail_on, Severity::Error);
    EXPECT_EQ(settings.analyzer.min_severity, Severity::Info);
    EXPECT_TRUE(settings.analyzer.check_duplicates);
}

// ============================================================================
// [lint.rules]
// ============================================================================

TEST_F(ConfigTest, DisableByCodeSelectsEveryRuleSharingIt) {
    auto settings = parse("[lint.rules]\nAM031 = false\n");
    const auto& disabled = settings.analyzer.disabled_rules;
    EXPECT_EQ(disabled.size(), 4u);
    EXPECT_TRUE(disabled.contains(Rule::ExpensiveOperationInMapFrom));
    EXPECT_TRUE(disabled.contains(Rule::MultipleEnumeration));
    EXPECT_TRUE(disabled.contains(Rule::TaskResultSynchronousAccess));
    EXPECT_TRUE(disabled.contains(Rule::NonDeterministicOperation));
}

TEST_F(ConfigTest, DisableByNameAndOff) {
    auto settings = parse(R"(
[lint.rules]
MultipleEnumeration = "off"
redundantmapfrom = false
)");
    const auto& disabled = settings.analyzer.disabled_rules;
    EXPECT_EQ(disabled.size(), 2u);
    EXPECT_TRUE(disabled.contains(Rule::MultipleEnumeration));
    EXPECT_TRUE(disabled.contains(Rule::RedundantMapFrom));
}

TEST_F(ConfigTest, SeverityOverride) {
    auto settings = parse("[lint.rules]\nAM005 = \"error\"\nAM004 = \"info\"\n");
    const auto& overrides = settings.analyzer.severity_overrides;
    ASSERT_EQ(overrides.size(), 2u);
    EXPECT_EQ(overrides.at(Rule::CaseSensitivityMismatch), Severity::Error);
    EXPECT_EQ(overrides.at(Rule::MissingDestinationProperty), Severity::Info);
}

TEST_F(ConfigTest, LaterEntryReenablesRule) {
    auto settings = parse(R"(
[lint.rules]
AM050 = false
RedundantMapFrom = "on"
)");
    EXPECT_TRUE(settings.analyzer.is_enabled(Rule::RedundantMapFrom));
}

TEST_F(ConfigTest, UnknownRuleIsIgnored) {
    auto settings = parse("[lint.rules]\nAM999 = false\nNoSuchRule = \"off\"\n");
    EXPECT_TRUE(settings.analyzer.disabled_rules.empty());
}

TEST_F(ConfigTest, QuotedRuleKey) {
    auto settings = parse("[lint.rules]\n\"AM041\" = false\n");
    EXPECT_TRUE(settings.analyzer.disabled_rules.contains(Rule::DuplicateMapping));
}

// ============================================================================
// [lint.hazards] and [fix]
// ============================================================================

TEST_F(ConfigTest, HazardPatternsReplaceDefaults) {
    auto settings = parse(R"(
[lint.hazards]
data-access = ["Session", "Store"]
http = [
    "ApiClient",   # generated clients
    "RestClient",
]
)");
    const auto& patterns = settings.analyzer.patterns;
    EXPECT_EQ(patterns.data_access, (std::vector<std::string>{"Session", "Store"}));
    EXPECT_EQ(patterns.http, (std::vector<std::string>{"ApiClient", "RestClient"}));
}

TEST_F(ConfigTest, HazardPatternsRequireArrays) {
    auto settings = parse("[lint.hazards]\nhttp = \"ApiClient\"\n");
    EXPECT_EQ(settings.analyzer.patterns.http, expr::HazardPatterns{}.http);
}

TEST_F(ConfigTest, FixIterations) {
    EXPECT_EQ(parse("[fix]\nmax-iterations = 7\n").max_fix_iterations, 7);
    EXPECT_EQ(parse("[fix]\nmax-iterations = 0\n").max_fix_iterations, 50);
    EXPECT_EQ(parse("[fix]\nmax-iterations = 20000\n").max_fix_iterations, 50);
}

TEST_F(ConfigTest, UnknownSectionIsIgnored) {
    auto settings = parse("[report]\nstyle = \"short\"\n[lint]\nfail-on = \"info\"\n");
    ASSERT_TRUE(settings.fail_on.has_value());
    EXPECT_EQ(*settings.fail_on, Severity::Info);
}

TEST_F(ConfigTest, HashInsideStringIsNotAComment) {
    auto settings = parse("[lint.hazards]\nhttp = [\"Client#1\"] # trailing\n");
    EXPECT_EQ(settings.analyzer.patterns.http, (std::vector<std::string>{"Client#1"}));
}

// ============================================================================
// Syntax Errors
// ============================================================================

TEST_F(ConfigTest, MalformedSectionHeader) {
    auto error = parse_error("[lint]\nfail-on = \"error\"\n[lint.rules\n");
    EXPECT_EQ(error.message, "malformed section header");
    EXPECT_EQ(error.line, 3u);
    EXPECT_EQ(error.to_string(), "maplint.toml:3: malformed section header");
}

TEST_F(ConfigTest, MissingEquals) {
    auto error = parse_error("[lint]\nfail-on\n");
    EXPECT_EQ(error.message, "expected 'key = value'");
    EXPECT_EQ(error.line, 2u);
}

TEST_F(ConfigTest, MissingKey) {
    auto error = parse_error("= true\n");
    EXPECT_EQ(error.message, "missing key before '='");
    EXPECT_EQ(error.line, 1u);
}

TEST_F(ConfigTest, UnterminatedArrayReportsStartLine) {
    auto error = parse_error("[lint.hazards]\nhttp = [\n  \"A\",\n  \"B\"\n");
    EXPECT_EQ(error.message, "unterminated array");
    EXPECT_EQ(error.line, 2u);
}

// ============================================================================
// Files
// ============================================================================

class ConfigFileTest : public ::testing::Test {
protected:
    std::filesystem::path dir;

    void SetUp() override {
        dir = std::filesystem::temp_directory_path() /
              ("maplint_config_" +
               std::string(::testing::UnitTest::GetInstance()->current_test_info()->name()));
        std::filesystem::create_directories(dir);
    }

    void TearDown() override {
        std::error_code ec;
        std::filesystem::remove_all(dir, ec);
    }
};

TEST_F(ConfigFileTest, LoadAndFind) {
    EXPECT_FALSE(find_config(dir).has_value());

    auto path = dir / CONFIG_FILE_NAME;
    {
        std::ofstream out(path);
        out << "[lint]\nmin-severity = \"error\"\n";
    }
    auto found = find_config(dir);
    ASSERT_TRUE(found.has_value());
    EXPECT_EQ(*found, path);

    auto result = load_config(*found);
    ASSERT_TRUE(is_ok(result));
    EXPECT_EQ(unwrap(result).analyzer.min_severity, Severity::Error);
}

TEST_F(ConfigFileTest, MissingFile) {
    auto result = load_config(dir / "absent.toml");
    ASSERT_TRUE(is_err(result));
    const auto& error = unwrap_err(result);
    EXPECT_EQ(error.message, "cannot read configuration file");
    EXPECT_EQ(error.line, 0u);
    EXPECT_EQ(error.to_string(), (dir / "absent.toml").string() + ": cannot read configuration file");
}

TEST_F(ConfigFileTest, ErrorsNameTheFile) {
    auto path = dir / CONFIG_FILE_NAME;
    {
        std::ofstream out(path);
        out << "[lint\n";
    }
    auto result = load_config(path);
    ASSERT_TRUE(is_err(result));
    EXPECT_EQ(unwrap_err(result).path, path.string());
    EXPECT_EQ(unwrap_err(result).line, 1u);
}
