// ==============================================================================
// test_cli_gtest.cpp - Тесты CLI модуля (GoogleTest)
// ==============================================================================

#include "sigmaeval/cli.hpp"

#include <gtest/gtest.h>
#include <string>
#include <vector>

namespace sigmaeval::cli::test {

// ==============================================================================
// Вспомогательные функции
// ==============================================================================

// Конвертация вектора строк в argc/argv
struct Args {
    std::vector<std::string> strings;
    std::vector<char*> ptrs;

    explicit Args(std::initializer_list<std::string> args) : strings(args) {
        for (auto& s : strings) {
            ptrs.push_back(s.data());
        }
        ptrs.push_back(nullptr);
    }

    int argc() const { return static_cast<int>(strings.size()); }

    char** argv() { return ptrs.data(); }
};

// ==============================================================================
// Глобальные опции
// ==============================================================================

TEST(CliTest, Parse_NoArgs_PrintsHelpWithExitCode2) {
    // Arrange
    Args args{"sigmaeval"};

    // Act
    ParseResult result = parse(args.argc(), args.argv());

    // Assert
    EXPECT_FALSE(result.ok);
    EXPECT_EQ(result.diagnostic.exit_code, 2);
    EXPECT_NE(result.diagnostic.stderr_message.find("Usage: sigmaeval"), std::string::npos);
}

TEST(CliTest, Parse_Help_ReturnsHelpCommand) {
    Args args{"sigmaeval", "--help"};

    ParseResult result = parse(args.argc(), args.argv());

    EXPECT_TRUE(result.ok);
    ASSERT_TRUE(std::holds_alternative<HelpCommand>(result.command));
    EXPECT_FALSE(std::get<HelpCommand>(result.command).command.has_value());
}

TEST(CliTest, Parse_Version_ReturnsVersionCommand) {
    Args args{"sigmaeval", "-V"};

    ParseResult result = parse(args.argc(), args.argv());

    EXPECT_TRUE(result.ok);
    EXPECT_TRUE(std::holds_alternative<VersionCommand>(result.command));
    EXPECT_EQ(render_version(), std::string("sigmaeval ") + VERSION + "\n");
}

TEST(CliTest, Parse_GlobalFlagsBeforeCommand) {
    // Arrange
    Args args{"sigmaeval", "--no-banner", "-v", "-v", "-q", "--config=eval.yml", "score", "r.yml"};

    // Act
    ParseResult result = parse(args.argc(), args.argv());

    // Assert
    ASSERT_TRUE(result.ok) << result.diagnostic.stderr_message;
    EXPECT_TRUE(result.global.no_banner);
    EXPECT_EQ(result.global.verbose, 2);
    EXPECT_TRUE(result.global.quiet);
    ASSERT_TRUE(result.global.config.has_value());
    EXPECT_EQ(result.global.config->string(), "eval.yml");
}

TEST(CliTest, Parse_ConfigWithoutValue_IsError) {
    Args args{"sigmaeval", "--config"};

    ParseResult result = parse(args.argc(), args.argv());

    EXPECT_FALSE(result.ok);
    EXPECT_NE(result.diagnostic.stderr_message.find("a value is required for '--config <FILE>'"),
              std::string::npos);
}

TEST(CliTest, Parse_UnknownGlobalFlag_IsError) {
    Args args{"sigmaeval", "--colour", "validate", "r.yml"};

    ParseResult result = parse(args.argc(), args.argv());

    EXPECT_FALSE(result.ok);
    EXPECT_EQ(result.diagnostic.exit_code, 2);
    EXPECT_NE(result.diagnostic.stderr_message.find("error: unexpected argument '--colour' found"),
              std::string::npos);
    EXPECT_NE(result.diagnostic.stderr_message.find("For more information, try '--help'."),
              std::string::npos);
}

TEST(CliTest, Parse_UnknownCommand_IsError) {
    Args args{"sigmaeval", "hunt"};

    ParseResult result = parse(args.argc(), args.argv());

    EXPECT_FALSE(result.ok);
    EXPECT_NE(result.diagnostic.stderr_message.find("unrecognized subcommand 'hunt'"),
              std::string::npos);
}

// ==============================================================================
// validate
// ==============================================================================

TEST(CliTest, Validate_MultiplePathsAndFlags) {
    // Arrange
    Args args{"sigmaeval", "validate", "rules/", "extra.yml", "--skip-errors", "--jsonl",
              "-o",        "out.jsonl"};

    // Act
    ParseResult result = parse(args.argc(), args.argv());

    // Assert
    ASSERT_TRUE(result.ok) << result.diagnostic.stderr_message;
    ASSERT_TRUE(std::holds_alternative<ValidateCommand>(result.command));
    const auto& cmd = std::get<ValidateCommand>(result.command);
    ASSERT_EQ(cmd.paths.size(), 2u);
    EXPECT_EQ(cmd.paths[0].string(), "rules/");
    EXPECT_EQ(cmd.paths[1].string(), "extra.yml");
    EXPECT_TRUE(cmd.skip_errors);
    EXPECT_TRUE(cmd.out.jsonl);
    EXPECT_FALSE(cmd.out.json);
    EXPECT_EQ(cmd.out.output->string(), "out.jsonl");
}

TEST(CliTest, Validate_NoPaths_IsError) {
    Args args{"sigmaeval", "validate"};

    ParseResult result = parse(args.argc(), args.argv());

    EXPECT_FALSE(result.ok);
    EXPECT_NE(result.diagnostic.stderr_message.find("<PATH>..."), std::string::npos);
}

TEST(CliTest, Validate_JsonAndJsonl_AreExclusive) {
    Args args{"sigmaeval", "validate", "r.yml", "--json", "--jsonl"};

    ParseResult result = parse(args.argc(), args.argv());

    EXPECT_FALSE(result.ok);
    EXPECT_NE(result.diagnostic.stderr_message.find("'--json' cannot be used with '--jsonl'"),
              std::string::npos);
}

TEST(CliTest, Validate_SubcommandHelp) {
    Args args{"sigmaeval", "validate", "--help"};

    ParseResult result = parse(args.argc(), args.argv());

    EXPECT_TRUE(result.ok);
    ASSERT_TRUE(std::holds_alternative<HelpCommand>(result.command));
    EXPECT_EQ(std::get<HelpCommand>(result.command).command.value_or(""), "validate");
}

// ==============================================================================
// fingerprint / score / compare
// ==============================================================================

TEST(CliTest, Fingerprint_SingleRule) {
    Args args{"sigmaeval", "fingerprint", "rule.yml", "-j"};

    ParseResult result = parse(args.argc(), args.argv());

    ASSERT_TRUE(result.ok);
    ASSERT_TRUE(std::holds_alternative<FingerprintCommand>(result.command));
    const auto& cmd = std::get<FingerprintCommand>(result.command);
    EXPECT_EQ(cmd.rule.string(), "rule.yml");
    EXPECT_TRUE(cmd.out.json);
}

TEST(CliTest, Score_ExtraPositional_IsError) {
    Args args{"sigmaeval", "score", "a.yml", "b.yml"};

    ParseResult result = parse(args.argc(), args.argv());

    EXPECT_FALSE(result.ok);
    EXPECT_NE(result.diagnostic.stderr_message.find("unexpected argument 'b.yml' found"),
              std::string::npos);
}

TEST(CliTest, Score_UnknownFlag_IsError) {
    Args args{"sigmaeval", "score", "a.yml", "--corpus", "rules/"};

    ParseResult result = parse(args.argc(), args.argv());

    EXPECT_FALSE(result.ok);
    EXPECT_NE(result.diagnostic.stderr_message.find("unexpected argument '--corpus' found"),
              std::string::npos);
}

TEST(CliTest, Compare_TwoPositionals) {
    Args args{"sigmaeval", "compare", "gen.yml", "ref.yml"};

    ParseResult result = parse(args.argc(), args.argv());

    ASSERT_TRUE(result.ok);
    const auto& cmd = std::get<CompareCommand>(result.command);
    EXPECT_EQ(cmd.rule.string(), "gen.yml");
    EXPECT_EQ(cmd.reference.string(), "ref.yml");
}

TEST(CliTest, Compare_MissingReference_IsError) {
    Args args{"sigmaeval", "compare", "gen.yml"};

    ParseResult result = parse(args.argc(), args.argv());

    EXPECT_FALSE(result.ok);
    EXPECT_NE(result.diagnostic.stderr_message.find("<RULE> <REFERENCE>"), std::string::npos);
}

// ==============================================================================
// novelty / evaluate / dataset
// ==============================================================================

TEST(CliTest, Novelty_RequiresCorpus) {
    Args args{"sigmaeval", "novelty", "rule.yml"};

    ParseResult result = parse(args.argc(), args.argv());

    EXPECT_FALSE(result.ok);
    EXPECT_NE(result.diagnostic.stderr_message.find("--corpus <CORPUS>"), std::string::npos);
}

TEST(CliTest, Novelty_WithCorpus) {
    Args args{"sigmaeval", "novelty", "--corpus", "sigma/rules", "rule.yml"};

    ParseResult result = parse(args.argc(), args.argv());

    ASSERT_TRUE(result.ok) << result.diagnostic.stderr_message;
    const auto& cmd = std::get<NoveltyCommand>(result.command);
    EXPECT_EQ(cmd.rule.string(), "rule.yml");
    EXPECT_EQ(cmd.corpus.string(), "sigma/rules");
}

TEST(CliTest, Evaluate_OptionalReferenceAndCorpus) {
    // Arrange
    Args args{"sigmaeval", "evaluate", "rule.yml", "-r", "ref.yml", "--corpus=rules"};

    // Act
    ParseResult result = parse(args.argc(), args.argv());

    // Assert
    ASSERT_TRUE(result.ok) << result.diagnostic.stderr_message;
    const auto& cmd = std::get<EvaluateCommand>(result.command);
    EXPECT_EQ(cmd.rule.string(), "rule.yml");
    EXPECT_EQ(cmd.reference.value_or("").string(), "ref.yml");
    EXPECT_EQ(cmd.corpus.value_or("").string(), "rules");
}

TEST(CliTest, Evaluate_ReferenceWithoutValue_IsError) {
    Args args{"sigmaeval", "evaluate", "rule.yml", "--reference"};

    ParseResult result = parse(args.argc(), args.argv());

    EXPECT_FALSE(result.ok);
    EXPECT_NE(result.diagnostic.stderr_message.find("a value is required for '--reference'"),
              std::string::npos);
}

TEST(CliTest, Dataset_ThreadsAndCorpus) {
    Args args{"sigmaeval", "dataset", "items.json", "--num-threads", "4", "--corpus", "rules"};

    ParseResult result = parse(args.argc(), args.argv());

    ASSERT_TRUE(result.ok) << result.diagnostic.stderr_message;
    const auto& cmd = std::get<DatasetCommand>(result.command);
    EXPECT_EQ(cmd.dataset.string(), "items.json");
    EXPECT_EQ(cmd.num_threads.value_or(0), 4u);
    EXPECT_EQ(cmd.corpus.value_or("").string(), "rules");
}

TEST(CliTest, Dataset_InvalidThreadCount_IsError) {
    for (const char* value : {"four", "-1", "3x"}) {
        Args args{"sigmaeval", "dataset", "items.json", "--num-threads", value};

        ParseResult result = parse(args.argc(), args.argv());

        EXPECT_FALSE(result.ok) << value;
        EXPECT_NE(result.diagnostic.stderr_message.find("expected a non-negative integer"),
                  std::string::npos)
            << value;
    }
}

// ==============================================================================
// help
// ==============================================================================

TEST(CliTest, HelpSubcommand_Named) {
    Args args{"sigmaeval", "help", "dataset"};

    ParseResult result = parse(args.argc(), args.argv());

    ASSERT_TRUE(result.ok);
    EXPECT_EQ(std::get<HelpCommand>(result.command).command.value_or(""), "dataset");
}

TEST(CliTest, RenderHelp_ListsCommands) {
    std::string help = render_help();

    for (const char* cmd :
         {"validate", "fingerprint", "score", "compare", "novelty", "evaluate", "dataset"}) {
        EXPECT_NE(help.find(std::string("  ") + cmd), std::string::npos) << cmd;
    }
    EXPECT_EQ(help.rfind(ABOUT, 0), 0u);
}

TEST(CliTest, RenderHelp_SubcommandAndUnknown) {
    EXPECT_NE(render_help(std::string("novelty")).find("--corpus <CORPUS>"), std::string::npos);
    EXPECT_EQ(render_help(std::string("hunt")), "error: unrecognized subcommand 'hunt'\n");
}

}  // namespace sigmaeval::cli::test
