// ==============================================================================
// test_report_gtest.cpp - Тесты JSON отчёта (GoogleTest)
// ==============================================================================

#include <gtest/gtest.h>
#include <memory>
#include <rapidjson/document.h>
#include <sigmaeval/report.hpp>
#include <string>
#include <vector>

namespace sigmaeval::report::test {

namespace {

const char* RULE = R"(title: Scheduled task creation
logsource:
  category: process_creation
  product: windows
detection:
  selection:
    CommandLine|contains: 'schtasks'
    CommandLine|contains: '/create'
  condition: selection
)";

/// Сериализовать и разобрать обратно для проверки ключей
rapidjson::Document round_trip(const rapidjson::Value& value) {
    rapidjson::Document doc;
    doc.Parse(to_string(value).c_str());
    return doc;
}

}  // namespace

// ==============================================================================
// RuleReport
// ==============================================================================

TEST(ReportTest, StructuralFailure_MissingStagesAreNull) {
    evaluate::RuleReport report;
    report.structural.errors.push_back("Logical tautology detected: condition always true");

    rapidjson::Document doc;
    auto value = to_json(report, doc.GetAllocator());
    auto parsed = round_trip(value);

    ASSERT_TRUE(parsed.IsObject());
    EXPECT_FALSE(parsed["structural"]["final_pass"].GetBool());
    EXPECT_STREQ(parsed["structural"]["errors"][0].GetString(),
                 "Logical tautology detected: condition always true");
    for (const char* key : {"behavioral_core", "semantic", "huntability", "stability", "novelty"}) {
        ASSERT_TRUE(parsed.HasMember(key)) << key;
        EXPECT_TRUE(parsed[key].IsNull()) << key;
    }
}

TEST(ReportTest, FullEvaluation_StagesSerialized) {
    evaluate::Evaluator evaluator(config::Config{}, nullptr,
                                  std::make_shared<capability::HashingEmbedder>());
    capability::MemoryCorpus corpus({{"known", "Known", RULE}});
    auto report = evaluator.evaluate_rule(RULE, std::string(RULE), &corpus);

    rapidjson::Document doc;
    auto parsed = round_trip(to_json(report, doc.GetAllocator()));

    EXPECT_TRUE(parsed["structural"]["final_pass"].GetBool());
    EXPECT_EQ(parsed["behavioral_core"]["selector_count"].GetUint64(), 2u);
    EXPECT_EQ(std::string(parsed["behavioral_core"]["core_hash"].GetString()).rfind("sha256:", 0),
              0u);
    EXPECT_STREQ(parsed["semantic"]["method"].GetString(), "embedding");
    EXPECT_FALSE(parsed["semantic"]["degraded"].GetBool());
    EXPECT_TRUE(parsed["semantic"]["explanation"].IsNull() ||
                parsed["semantic"]["explanation"].IsString());
    EXPECT_TRUE(parsed["huntability"]["breakdown"].IsObject());
    EXPECT_STREQ(parsed["huntability"]["false_positive_risk"].GetString(), "low");
    EXPECT_STREQ(parsed["novelty"]["novelty_status"].GetString(), "duplicate");
    EXPECT_EQ(parsed["novelty"]["novelty_score"].GetInt(), 0);
    EXPECT_STREQ(parsed["novelty"]["closest_match_id"].GetString(), "known");
    ASSERT_TRUE(parsed["novelty"]["closest_comparison"].IsObject());
    EXPECT_EQ(parsed["novelty"]["closest_comparison"]["common_selectors"].GetUint64(), 2u);
    EXPECT_TRUE(parsed["novelty"]["closest_comparison"]["hash_match"].GetBool());
    EXPECT_TRUE(parsed["stability"].IsNull());
}

// ==============================================================================
// ItemResult / DatasetResult
// ==============================================================================

TEST(ReportTest, ItemWithError) {
    evaluate::ItemResult item;
    item.input_id = "a7";
    item.error = "No rule provided";

    rapidjson::Document doc;
    auto parsed = round_trip(to_json(item, doc.GetAllocator()));

    EXPECT_STREQ(parsed["input_id"].GetString(), "a7");
    EXPECT_TRUE(parsed["generated_rule"].IsNull());
    EXPECT_TRUE(parsed["evaluation"].IsNull());
    EXPECT_STREQ(parsed["error"].GetString(), "No rule provided");
}

TEST(ReportTest, DatasetResult_ItemsAndMetrics) {
    evaluate::DatasetResult result;
    evaluate::ItemResult item;
    item.input_id = "a1";
    item.rule_text = RULE;
    item.report = evaluate::RuleReport{};
    result.items.push_back(item);
    result.metrics.total = 1;
    result.metrics.valid_results = 1;
    result.metrics.structural_pass_rate = 0.0;
    result.metrics.novelty_distribution = evaluate::NoveltyDistribution{0, 0, 1};

    rapidjson::Document doc;
    auto parsed = round_trip(to_json(result, doc.GetAllocator()));

    ASSERT_TRUE(parsed["items"].IsArray());
    ASSERT_EQ(parsed["items"].Size(), 1u);
    EXPECT_STREQ(parsed["items"][0]["generated_rule"].GetString(), RULE);
    EXPECT_TRUE(parsed["items"][0]["evaluation"].IsObject());

    const auto& metrics = parsed["metrics"];
    EXPECT_EQ(metrics["total"].GetUint64(), 1u);
    EXPECT_EQ(metrics["errors"].GetUint64(), 0u);
    EXPECT_TRUE(metrics["avg_huntability"].IsNull());
    EXPECT_TRUE(metrics["avg_stability"].IsNull());
    EXPECT_EQ(metrics["novelty_distribution"]["novel"].GetUint64(), 1u);
    EXPECT_EQ(metrics["novelty_distribution"]["duplicates"].GetUint64(), 0u);
}

TEST(ReportTest, MetricsWithoutNovelty_DistributionIsNull) {
    evaluate::CorpusMetrics metrics;
    metrics.avg_huntability = 7.5;

    rapidjson::Document doc;
    auto parsed = round_trip(to_json(metrics, doc.GetAllocator()));

    EXPECT_DOUBLE_EQ(parsed["avg_huntability"].GetDouble(), 7.5);
    EXPECT_TRUE(parsed["novelty_distribution"].IsNull());
}

// ==============================================================================
// Компоненты
// ==============================================================================

TEST(ReportTest, SemanticOptionalFields) {
    semantic::SemanticComparisonResult r;
    r.similarity_score = 0.8;
    r.missing_behaviors = 1;
    r.missing_behavior_details = {"parent process check"};
    r.method = semantic::Method::Judge;
    r.degraded = false;
    r.overfitting_detected = true;
    r.fp_risk = "medium";

    rapidjson::Document doc;
    auto parsed = round_trip(to_json(r, doc.GetAllocator()));

    EXPECT_DOUBLE_EQ(parsed["similarity_score"].GetDouble(), 0.8);
    EXPECT_EQ(parsed["missing_behaviors"].GetUint64(), 1u);
    EXPECT_STREQ(parsed["missing_behavior_details"][0].GetString(), "parent process check");
    EXPECT_STREQ(parsed["method"].GetString(), "judge");
    EXPECT_TRUE(parsed["overfitting_detected"].GetBool());
    EXPECT_STREQ(parsed["fp_risk"].GetString(), "medium");
    EXPECT_TRUE(parsed["explanation"].IsNull());
}

TEST(ReportTest, CoreComparisonKeys) {
    fingerprint::CoreComparison cmp;
    cmp.similarity = 0.5;
    cmp.common_selectors = 1;
    cmp.only_in_first = 1;

    rapidjson::Document doc;
    auto parsed = round_trip(to_json(cmp, doc.GetAllocator()));

    EXPECT_DOUBLE_EQ(parsed["similarity"].GetDouble(), 0.5);
    EXPECT_EQ(parsed["common_selectors"].GetUint64(), 1u);
    EXPECT_EQ(parsed["only_in_first"].GetUint64(), 1u);
    EXPECT_EQ(parsed["only_in_second"].GetUint64(), 0u);
    EXPECT_FALSE(parsed["hash_match"].GetBool());
}

TEST(ReportTest, NoveltyWithoutCorpus_ComparisonIsNull) {
    novelty::NoveltyResult r;

    rapidjson::Document doc;
    auto parsed = round_trip(to_json(r, doc.GetAllocator()));

    ASSERT_TRUE(parsed.HasMember("closest_comparison"));
    EXPECT_TRUE(parsed["closest_comparison"].IsNull());
}

// ==============================================================================
// Текстовые подробности структурной проверки
// ==============================================================================

TEST(ReportTest, StructuralDetails_GrammarErrorsPrintedOnce) {
    validate::StructuralValidator validator;
    auto r = validator.validate("title: only a title here\n");
    ASSERT_FALSE(r.base_grammar_passed);
    ASSERT_FALSE(r.base_errors.empty());

    auto lines = structural_details(r);

    ASSERT_EQ(lines.size(), r.base_errors.size() + r.warnings.size());
    for (size_t i = 0; i < r.base_errors.size(); ++i) {
        EXPECT_EQ(lines[i], "grammar: " + r.base_errors[i]);
    }
    for (const auto& line : lines) {
        EXPECT_NE(line.rfind("error: ", 0), 0u) << line;
    }
}

TEST(ReportTest, StructuralDetails_ExtendedErrorsAndWarnings) {
    validate::ExtendedValidationResult r;
    r.base_grammar_passed = true;
    r.errors = {"Logical tautology detected: condition always true"};
    r.warnings = {"sel: Case-sensitive regex - consider adding |i"};

    EXPECT_EQ(structural_details(r),
              (std::vector<std::string>{
                  "error: Logical tautology detected: condition always true",
                  "warning: sel: Case-sensitive regex - consider adding |i"}));
}

TEST(ReportTest, ToStringIsCompact) {
    rapidjson::Document doc;
    rapidjson::Value obj(rapidjson::kObjectType);
    obj.AddMember("a", 1, doc.GetAllocator());
    obj.AddMember("b", rapidjson::Value(rapidjson::kNullType), doc.GetAllocator());

    EXPECT_EQ(to_string(obj), R"({"a":1,"b":null})");
}

}  // namespace sigmaeval::report::test
