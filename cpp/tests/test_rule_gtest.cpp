// ==============================================================================
// test_rule_gtest.cpp - Тесты модели правила и базовой грамматики (GoogleTest)
// ==============================================================================

#include <algorithm>
#include <gtest/gtest.h>
#include <sigmaeval/rule.hpp>
#include <string>

namespace sigmaeval::rule::test {

namespace {

const char* VALID_RULE = R"(title: Suspicious Scheduled Task Creation
id: 5b4b5c1e-1f3a-4c8e-9d55-0f3c1a2b3c4d
description: Detects creation of scheduled tasks via schtasks.exe command line
status: experimental
author: analyst
level: high
tags:
  - attack.persistence
  - attack.t1053.005
logsource:
  category: process_creation
  product: windows
detection:
  selection:
    Image|endswith: '\schtasks.exe'
    CommandLine|contains: '/create'
  filter:
    User: SYSTEM
  condition: selection and not filter
)";

bool has_message(const std::vector<std::string>& messages, const std::string& needle) {
    return std::any_of(messages.begin(), messages.end(), [&](const std::string& m) {
        return m.find(needle) != std::string::npos;
    });
}

}  // namespace

// ==============================================================================
// parse
// ==============================================================================

TEST(RuleParseTest, ValidRule_PopulatesMetadataAndDetection) {
    auto result = parse(VALID_RULE);

    ASSERT_TRUE(result.ok) << result.error.format();
    const Rule& r = result.rule;
    EXPECT_EQ(r.title, "Suspicious Scheduled Task Creation");
    ASSERT_TRUE(r.id.has_value());
    EXPECT_EQ(*r.id, "5b4b5c1e-1f3a-4c8e-9d55-0f3c1a2b3c4d");
    ASSERT_TRUE(r.level.has_value());
    EXPECT_EQ(*r.level, "high");
    ASSERT_EQ(r.tags.size(), 2u);
    EXPECT_EQ(r.tags[1], "attack.t1053.005");

    ASSERT_TRUE(r.logsource.has_value());
    EXPECT_EQ(r.logsource->category.value_or(""), "process_creation");
    EXPECT_EQ(r.logsource->product.value_or(""), "windows");
    EXPECT_FALSE(r.logsource->service.has_value());

    EXPECT_EQ(r.detection.condition, "selection and not filter");
    EXPECT_EQ(r.detection.names(), (std::vector<std::string>{"selection", "filter"}));
    EXPECT_NE(r.detection.find("filter"), nullptr);
    EXPECT_EQ(r.detection.find("missing"), nullptr);
}

TEST(RuleParseTest, TimeframeIsNotASelection) {
    auto result = parse(R"(title: t
logsource: {product: windows}
detection:
  selection: {EventID: 4625}
  timeframe: 5m
  condition: selection
)");

    ASSERT_TRUE(result.ok);
    EXPECT_EQ(result.rule.detection.names(), (std::vector<std::string>{"selection"}));
    EXPECT_EQ(result.rule.detection.timeframe.value_or(""), "5m");
}

TEST(RuleParseTest, ListCondition_JoinedWithOr) {
    auto result = parse(R"(title: t
logsource: {product: windows}
detection:
  a: {EventID: 1}
  b: {EventID: 2}
  condition:
    - a
    - b
)");

    ASSERT_TRUE(result.ok);
    EXPECT_EQ(result.rule.detection.condition, "(a) or (b)");
}

TEST(RuleParseTest, NonMappingDocument_IsError) {
    auto result = parse("- just\n- a list\n");

    EXPECT_FALSE(result.ok);
    EXPECT_EQ(result.error.context, "invalid structure");
}

TEST(RuleParseTest, InvalidYaml_IsError) {
    auto result = parse("title: [unclosed\n");

    EXPECT_FALSE(result.ok);
    EXPECT_EQ(result.error.context, "invalid YAML");
    EXPECT_FALSE(result.error.format().empty());
}

TEST(RuleParseTest, LoadYaml_InvalidReturnsNullopt) {
    EXPECT_FALSE(load_yaml("key: [").has_value());
    EXPECT_TRUE(load_yaml("key: value").has_value());
}

// ==============================================================================
// parse_field_key
// ==============================================================================

TEST(FieldKeyTest, SplitsFieldAndModifiers) {
    auto fk = parse_field_key("CommandLine|contains|all");

    EXPECT_EQ(fk.field, "CommandLine");
    EXPECT_EQ(fk.modifiers, (std::vector<std::string>{"contains", "all"}));
    EXPECT_TRUE(fk.has_modifier("all"));
    EXPECT_FALSE(fk.has_modifier("re"));
}

TEST(FieldKeyTest, ModifiersAreLowercased) {
    auto fk = parse_field_key("Image|EndsWith");

    EXPECT_EQ(fk.field, "Image");
    EXPECT_TRUE(fk.has_modifier("endswith"));
}

TEST(FieldKeyTest, EqualsSignActsAsSeparator) {
    auto fk = parse_field_key("Image=endswith");

    EXPECT_EQ(fk.field, "Image");
    EXPECT_TRUE(fk.has_modifier("endswith"));
}

TEST(FieldKeyTest, BareField_HasNoModifiers) {
    auto fk = parse_field_key("User");

    EXPECT_EQ(fk.field, "User");
    EXPECT_TRUE(fk.modifiers.empty());
}

// ==============================================================================
// clean_rule_text
// ==============================================================================

TEST(CleanRuleTextTest, ExtractsFencedCodeBlock) {
    std::string raw = "Here is your rule:\n```yaml\ntitle: Test rule\nlevel: low\n```\nHope it helps";

    EXPECT_EQ(clean_rule_text(raw), "title: Test rule\nlevel: low");
}

TEST(CleanRuleTextTest, DropsLeadingProse) {
    std::string raw = "Sure! The rule follows.\nNote this carefully.\ntitle: Test rule\nlevel: low";

    EXPECT_EQ(clean_rule_text(raw), "title: Test rule\nlevel: low");
}

TEST(CleanRuleTextTest, StripsTrailingWhitespace) {
    EXPECT_EQ(clean_rule_text("title: Test   \nlevel: low\t\n\n"), "title: Test\nlevel: low");
}

TEST(CleanRuleTextTest, QuotesTitleWithColon) {
    std::string cleaned = clean_rule_text("title: Persistence: schtasks abuse\nlevel: low");

    EXPECT_EQ(cleaned, "title: \"Persistence: schtasks abuse\"\nlevel: low");
    auto result = parse(cleaned);
    ASSERT_TRUE(result.ok);
    EXPECT_EQ(result.rule.title, "Persistence: schtasks abuse");
}

TEST(CleanRuleTextTest, AlreadyCleanTextIsUnchanged) {
    std::string text = "title: Test rule\nlevel: low";

    EXPECT_EQ(clean_rule_text(text), text);
}

TEST(CleanRuleTextTest, FenceWithoutLanguageTagAndCrLf) {
    std::string raw = "Rule:\r\n```\r\ntitle: Test rule\r\nlevel: low\r\n```";

    EXPECT_EQ(clean_rule_text(raw), "title: Test rule\nlevel: low");
}

TEST(CleanRuleTextTest, InlineBackticksBeforeFenceAreSkipped) {
    std::string raw = "Use ```this``` format:\n```yml\ntitle: Test rule\n```";

    EXPECT_EQ(clean_rule_text(raw), "title: Test rule");
}

TEST(CleanRuleTextTest, HugeFencedResponse_ExtractsBody) {
    const std::string value(100000, 'A');
    std::string body = "title: Test rule\ndetection:\n  selection:\n    CommandLine|contains: '" +
                       value + "'\n  condition: selection";
    std::string raw = "Here is the rule:\n```yaml\n" + body + "\n```\nDone.";

    EXPECT_EQ(clean_rule_text(raw), body);
}

TEST(CleanRuleTextTest, HugeTitleLine_IsQuoted) {
    const std::string title = "Persistence: " + std::string(100000, 'x');

    EXPECT_EQ(clean_rule_text("title: " + title + "\nlevel: low"),
              "title: \"" + title + "\"\nlevel: low");
}

// ==============================================================================
// GrammarValidator
// ==============================================================================

TEST(GrammarValidatorTest, ValidRule_Passes) {
    GrammarValidator validator;

    auto result = validator.validate_base(VALID_RULE);

    EXPECT_TRUE(result.is_valid);
    EXPECT_TRUE(result.errors.empty());
}

TEST(GrammarValidatorTest, MissingRequiredField_Fails) {
    GrammarValidator validator;

    auto result = validator.validate_base("title: Something long enough\nlogsource: {product: windows}\n");

    EXPECT_FALSE(result.is_valid);
    EXPECT_TRUE(has_message(result.errors, "Missing required field: detection"));
}

TEST(GrammarValidatorTest, MissingCondition_Fails) {
    GrammarValidator validator;

    auto result = validator.validate_base(R"(title: Something long enough
logsource: {category: process_creation, product: windows}
detection:
  selection: {Image: 'a.exe'}
)");

    EXPECT_FALSE(result.is_valid);
    EXPECT_TRUE(has_message(result.errors, "'condition' key"));
}

TEST(GrammarValidatorTest, NoSelections_Fails) {
    GrammarValidator validator;

    auto result = validator.validate_base(R"(title: Something long enough
logsource: {category: process_creation, product: windows}
detection:
  condition: selection
)");

    EXPECT_FALSE(result.is_valid);
    EXPECT_TRUE(has_message(result.errors, "at least one selection"));
}

TEST(GrammarValidatorTest, UnknownCategoryAndLevel_Fail) {
    GrammarValidator validator;

    auto result = validator.validate_base(R"(title: Something long enough
level: severe
logsource: {category: quantum_events, product: windows}
detection:
  selection: {Image: 'a.exe'}
  condition: selection
)");

    EXPECT_FALSE(result.is_valid);
    EXPECT_TRUE(has_message(result.errors, "Invalid logsource category: quantum_events"));
    EXPECT_TRUE(has_message(result.errors, "Invalid level: severe"));
}

TEST(GrammarValidatorTest, MetadataGaps_AreWarningsOnly) {
    GrammarValidator validator;

    auto result = validator.validate_base(R"(title: Short
logsource: {category: process_creation, product: windows}
detection:
  selection: {Image: 'a.exe'}
  condition: selection
)");

    EXPECT_TRUE(result.is_valid);
    EXPECT_TRUE(has_message(result.warnings, "Title is short"));
    EXPECT_TRUE(has_message(result.warnings, "no description"));
    EXPECT_TRUE(has_message(result.warnings, "no tags"));
}

TEST(GrammarValidatorTest, InvalidYaml_ReportsSyntaxError) {
    GrammarValidator validator;

    auto result = validator.validate_base("title: [broken\n");

    EXPECT_FALSE(result.is_valid);
    EXPECT_TRUE(has_message(result.errors, "Invalid YAML syntax"));
}

TEST(GrammarValidatorTest, EmptyText_Fails) {
    GrammarValidator validator;

    auto result = validator.validate_base("");

    EXPECT_FALSE(result.is_valid);
    EXPECT_FALSE(result.errors.empty());
}

}  // namespace sigmaeval::rule::test
