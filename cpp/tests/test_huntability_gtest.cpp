// ==============================================================================
// test_huntability_gtest.cpp - Тесты оценки пригодности для охоты (GoogleTest)
// ==============================================================================

#include <gtest/gtest.h>
#include <sigmaeval/huntability.hpp>
#include <string>

namespace sigmaeval::huntability::test {

namespace {

const char* SCHTASKS_RULE = R"(title: T
logsource:
  category: process_creation
  product: windows
detection:
  selection:
    CommandLine|contains: 'schtasks'
    CommandLine|contains: '/create'
  condition: selection
)";

const char* WELL_DOCUMENTED_RULE = R"(title: Office application spawning PowerShell
description: Detects the technique of Office documents launching PowerShell with an encoded command
tags:
  - attack.execution
  - attack.t1059.001
logsource:
  category: process_creation
  product: windows
detection:
  selection:
    ParentImage|endswith: '\winword.exe'
    Image|endswith: '\powershell.exe'
    CommandLine|contains: '-EncodedCommand'
  condition: selection
)";

std::string rule_with_selection(const std::string& logsource, const std::string& selection) {
    return "title: Huntability fixture\n" + logsource + "detection:\n  selection:\n" + selection +
           "  condition: selection\n";
}

const char* WINDOWS_PROCESS = "logsource:\n  category: process_creation\n  product: windows\n";

}  // namespace

// ==============================================================================
// Составная оценка
// ==============================================================================

TEST(HuntabilityTest, SchtasksRule_ScoresAboveFive) {
    auto score = score_rule(SCHTASKS_RULE);

    EXPECT_NEAR(score.score, 8.25, 1e-9);
    EXPECT_GT(score.score, 5.0);
    EXPECT_EQ(score.false_positive_risk, FalsePositiveRisk::Low);
    EXPECT_EQ(score.coverage_notes, "Good coverage across all categories");
    EXPECT_DOUBLE_EQ(score.breakdown.at("commandline_specificity"), 10.0);
    EXPECT_DOUBLE_EQ(score.breakdown.at("ttp_clarity"), 5.0);
    EXPECT_DOUBLE_EQ(score.breakdown.at("parent_child"), 5.0);
    EXPECT_DOUBLE_EQ(score.breakdown.at("telemetry_feasibility"), 10.0);
    EXPECT_DOUBLE_EQ(score.breakdown.at("overfitting"), 10.0);
}

TEST(HuntabilityTest, WellDocumentedRule_ReachesMaximum) {
    auto score = score_rule(WELL_DOCUMENTED_RULE);

    EXPECT_NEAR(score.score, 10.0, 1e-9);
    EXPECT_EQ(score.breakdown.size(), 5u);
    EXPECT_DOUBLE_EQ(score.breakdown.at("ttp_clarity"), 10.0);
    EXPECT_DOUBLE_EQ(score.breakdown.at("parent_child"), 10.0);
}

TEST(HuntabilityTest, ParsedOverload_MatchesTextOverload) {
    auto parsed = rule::parse(WELL_DOCUMENTED_RULE);
    ASSERT_TRUE(parsed.ok);

    EXPECT_DOUBLE_EQ(score_rule(parsed.rule).score, score_rule(WELL_DOCUMENTED_RULE).score);
}

TEST(HuntabilityTest, ScoreStaysInRange) {
    for (const char* text : {SCHTASKS_RULE, WELL_DOCUMENTED_RULE, "title: x\ndetection: {}\n"}) {
        auto score = score_rule(text);
        EXPECT_GE(score.score, 0.0);
        EXPECT_LE(score.score, 10.0);
    }
}

// ==============================================================================
// Подоценки
// ==============================================================================

TEST(HuntabilityTest, ShortWildcardCommandLine_IsNotSpecific) {
    auto score = score_rule(
        rule_with_selection(WINDOWS_PROCESS, "    CommandLine|contains: '*ab*'\n"));

    EXPECT_DOUBLE_EQ(score.breakdown.at("commandline_specificity"), 0.0);
    EXPECT_NE(score.coverage_notes.find("Low command-line specificity"), std::string::npos);
}

TEST(HuntabilityTest, LongWildcardCommandLine_IsSpecific) {
    auto score = score_rule(rule_with_selection(
        WINDOWS_PROCESS, "    CommandLine|contains: '*vssadmin delete shadows*'\n"));

    EXPECT_DOUBLE_EQ(score.breakdown.at("commandline_specificity"), 10.0);
}

TEST(HuntabilityTest, NoCommandLine_GetsBaseline) {
    auto score = score_rule(
        rule_with_selection(WINDOWS_PROCESS, "    Image|endswith: '\\mshta.exe'\n"));

    EXPECT_DOUBLE_EQ(score.breakdown.at("commandline_specificity"), 3.0);
    EXPECT_DOUBLE_EQ(score.breakdown.at("parent_child"), 8.0);
}

TEST(HuntabilityTest, TelemetryLevels) {
    const std::string selection = "    CommandLine|contains: 'certutil -urlcache'\n";

    EXPECT_DOUBLE_EQ(
        score_rule(rule_with_selection("logsource:\n  category: file_access\n  product: windows\n",
                                       selection))
            .breakdown.at("telemetry_feasibility"),
        7.0);
    EXPECT_DOUBLE_EQ(
        score_rule(rule_with_selection("logsource:\n  product: windows\n", selection))
            .breakdown.at("telemetry_feasibility"),
        5.0);
    EXPECT_DOUBLE_EQ(score_rule(rule_with_selection("", selection)).breakdown.at("telemetry_feasibility"),
                     3.0);
}

TEST(HuntabilityTest, IpAddress_LowersOverfittingScore) {
    auto score = score_rule(
        rule_with_selection(WINDOWS_PROCESS, "    CommandLine|contains: 'ping 198.51.100.7'\n"));

    EXPECT_DOUBLE_EQ(score.breakdown.at("overfitting"), 6.0);
}

TEST(HuntabilityTest, SingleDomain_SlightlyLowersOverfittingScore) {
    auto score = score_rule(
        rule_with_selection(WINDOWS_PROCESS, "    CommandLine|contains: 'curl badhost.org'\n"));

    EXPECT_DOUBLE_EQ(score.breakdown.at("overfitting"), 8.0);
}

TEST(HuntabilityTest, ManyIndicators_HeavilyPenalized) {
    auto score = score_rule(rule_with_selection(WINDOWS_PROCESS,
                                                "    CommandLine|contains:\n"
                                                "      - '10.0.0.1'\n"
                                                "      - 'c2.badhost.org'\n"));

    EXPECT_DOUBLE_EQ(score.breakdown.at("overfitting"), 3.0);
}

// ==============================================================================
// Риск ложных срабатываний
// ==============================================================================

TEST(HuntabilityTest, BareWildcards_AreHighRisk) {
    auto score = score_rule(rule_with_selection(WINDOWS_PROCESS,
                                                "    Image: '*'\n"
                                                "    CommandLine|contains: '*'\n"));

    EXPECT_EQ(score.false_positive_risk, FalsePositiveRisk::High);
    EXPECT_NE(score.coverage_notes.find("High false-positive risk"), std::string::npos);
}

TEST(HuntabilityTest, ShortValue_IsMediumRisk) {
    auto score =
        score_rule(rule_with_selection(WINDOWS_PROCESS, "    CommandLine|contains: ' /c'\n"));

    EXPECT_EQ(score.false_positive_risk, FalsePositiveRisk::Medium);
}

// ==============================================================================
// Ошибки разбора
// ==============================================================================

TEST(HuntabilityTest, UnparsableRule_ScoresZeroHighRisk) {
    auto score = score_rule("title: [broken");

    EXPECT_DOUBLE_EQ(score.score, 0.0);
    EXPECT_EQ(score.false_positive_risk, FalsePositiveRisk::High);
    EXPECT_TRUE(score.breakdown.empty());
    EXPECT_EQ(score.coverage_notes, "Failed to parse rule");
}

TEST(HuntabilityTest, RiskToString) {
    EXPECT_EQ(risk_to_string(FalsePositiveRisk::Low), "low");
    EXPECT_EQ(risk_to_string(FalsePositiveRisk::Medium), "medium");
    EXPECT_EQ(risk_to_string(FalsePositiveRisk::High), "high");
}

}  // namespace sigmaeval::huntability::test
