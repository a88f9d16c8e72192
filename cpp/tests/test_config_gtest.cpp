// ==============================================================================
// test_config_gtest.cpp - Тесты файла настроек (GoogleTest)
// ==============================================================================

#include <filesystem>
#include <fstream>
#include <gtest/gtest.h>
#include <sigmaeval/config.hpp>
#include <string>

#ifdef _WIN32
#include <windows.h>
#else
#include <unistd.h>
#endif

namespace sigmaeval::config::test {

namespace {

std::filesystem::path temp_config_path(const std::string& name) {
    return std::filesystem::temp_directory_path() /
           ("sigmaeval_config_" + name + "_" +
            std::to_string(
#ifdef _WIN32
                GetCurrentProcessId()
#else
                getpid()
#endif
                    ) +
            ".yml");
}

}  // namespace

// ==============================================================================
// parse
// ==============================================================================

TEST(ConfigParseTest, EmptyText_GivesDefaults) {
    auto result = parse("");

    ASSERT_TRUE(result.ok) << result.error.format();
    const Config& c = result.config;
    EXPECT_EQ(c.semantic.judge_timeout.count(), 60000);
    EXPECT_EQ(c.semantic.embed_timeout.count(), 30000);
    EXPECT_EQ(c.embedding_dimensions, 256u);
    EXPECT_EQ(c.stability_runs, 5u);
    EXPECT_DOUBLE_EQ(c.stable_threshold, 0.85);
    EXPECT_DOUBLE_EQ(c.novelty.duplicate_threshold, 0.95);
    EXPECT_DOUBLE_EQ(c.novelty.variant_threshold, 0.70);
    EXPECT_EQ(c.num_threads, 0u);
}

TEST(ConfigParseTest, FullFile) {
    auto result = parse(R"(semantic:
  judge_timeout_ms: 1500
  embed_timeout_ms: 250
  embedding_dimensions: 512
stability:
  runs: 3
  stable_threshold: 0.9
novelty:
  duplicate_threshold: 0.99
  variant_threshold: 0.6
dataset:
  num_threads: 8
)");

    ASSERT_TRUE(result.ok) << result.error.format();
    const Config& c = result.config;
    EXPECT_EQ(c.semantic.judge_timeout.count(), 1500);
    EXPECT_EQ(c.semantic.embed_timeout.count(), 250);
    EXPECT_EQ(c.embedding_dimensions, 512u);
    EXPECT_EQ(c.stability_runs, 3u);
    EXPECT_DOUBLE_EQ(c.stable_threshold, 0.9);
    EXPECT_DOUBLE_EQ(c.novelty.duplicate_threshold, 0.99);
    EXPECT_DOUBLE_EQ(c.novelty.variant_threshold, 0.6);
    EXPECT_EQ(c.num_threads, 8u);
}

TEST(ConfigParseTest, PartialFileAndUnknownKeys) {
    auto result = parse(R"(stability:
  runs: 10
  colour: blue
reporting:
  format: html
)");

    ASSERT_TRUE(result.ok) << result.error.format();
    EXPECT_EQ(result.config.stability_runs, 10u);
    EXPECT_EQ(result.config.embedding_dimensions, 256u);
}

TEST(ConfigParseTest, NullSectionUsesDefaults) {
    auto result = parse("semantic:\nnovelty: ~\n");

    ASSERT_TRUE(result.ok) << result.error.format();
    EXPECT_DOUBLE_EQ(result.config.novelty.duplicate_threshold, 0.95);
}

// ==============================================================================
// Ошибки
// ==============================================================================

TEST(ConfigParseTest, NonIntegerCount_IsError) {
    auto result = parse("stability:\n  runs: five\n");

    EXPECT_FALSE(result.ok);
    EXPECT_EQ(result.error.context, "stability.runs");
    EXPECT_EQ(result.error.format(), "stability.runs: must be an integer");
}

TEST(ConfigParseTest, FractionalCount_IsError) {
    auto result = parse("semantic:\n  judge_timeout_ms: 1.5\n");

    EXPECT_FALSE(result.ok);
    EXPECT_EQ(result.error.context, "semantic.judge_timeout_ms");
}

TEST(ConfigParseTest, NegativeCount_IsError) {
    auto result = parse("dataset:\n  num_threads: -2\n");

    EXPECT_FALSE(result.ok);
    EXPECT_EQ(result.error.format(), "dataset.num_threads: must not be negative");
}

TEST(ConfigParseTest, ZeroDimensions_IsError) {
    auto result = parse("semantic:\n  embedding_dimensions: 0\n");

    EXPECT_FALSE(result.ok);
    EXPECT_EQ(result.error.context, "semantic.embedding_dimensions");
}

TEST(ConfigParseTest, RatioOutOfRange_IsError) {
    auto result = parse("novelty:\n  duplicate_threshold: 1.5\n");

    EXPECT_FALSE(result.ok);
    EXPECT_EQ(result.error.format(), "novelty.duplicate_threshold: must be between 0 and 1");
}

TEST(ConfigParseTest, NonNumericRatio_IsError) {
    auto result = parse("stability:\n  stable_threshold: [0.5]\n");

    EXPECT_FALSE(result.ok);
    EXPECT_EQ(result.error.format(), "stability.stable_threshold: must be a number");
}

TEST(ConfigParseTest, VariantAboveDuplicate_IsError) {
    auto result = parse("novelty:\n  duplicate_threshold: 0.6\n  variant_threshold: 0.8\n");

    EXPECT_FALSE(result.ok);
    EXPECT_EQ(result.error.context, "novelty.variant_threshold");
}

TEST(ConfigParseTest, SectionNotMapping_IsError) {
    auto result = parse("semantic: 5\n");

    EXPECT_FALSE(result.ok);
    EXPECT_EQ(result.error.format(), "semantic: must be a mapping");
}

TEST(ConfigParseTest, InvalidYaml_IsError) {
    auto result = parse("stability: [unclosed\n");

    EXPECT_FALSE(result.ok);
    EXPECT_EQ(result.error.context, "invalid config YAML");
}

TEST(ConfigParseTest, NonMappingRoot_IsError) {
    auto result = parse("- a\n- b\n");

    EXPECT_FALSE(result.ok);
    EXPECT_EQ(result.error.context, "invalid config");
}

// ==============================================================================
// load
// ==============================================================================

TEST(ConfigLoadTest, LoadsFromFile) {
    auto path = temp_config_path("valid");
    {
        std::ofstream out(path);
        out << "stability:\n  runs: 2\n";
    }

    auto result = load(path);
    std::filesystem::remove(path);

    ASSERT_TRUE(result.ok) << result.error.format();
    EXPECT_EQ(result.config.stability_runs, 2u);
}

TEST(ConfigLoadTest, ErrorContextIncludesPath) {
    auto path = temp_config_path("invalid");
    {
        std::ofstream out(path);
        out << "dataset:\n  num_threads: many\n";
    }

    auto result = load(path);
    std::filesystem::remove(path);

    EXPECT_FALSE(result.ok);
    EXPECT_EQ(result.error.context, path.string() + ": dataset.num_threads");
}

TEST(ConfigLoadTest, MissingFile_IsError) {
    auto result = load(temp_config_path("absent"));

    EXPECT_FALSE(result.ok);
    EXPECT_EQ(result.error.context, "config");
    EXPECT_NE(result.error.message.find("failed to open file"), std::string::npos);
}

}  // namespace sigmaeval::config::test
