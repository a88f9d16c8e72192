// ==============================================================================
// cli.cpp - Разбор командной строки
// ==============================================================================
//
// Ошибки использования возвращаются в ParseResult с exit code 2 и текстом
// в формате:
//
//   error: <сообщение>
//
//   Usage: sigmaeval <command> ...
//
//   For more information, try '--help'.
//
// ==============================================================================

#include <cstring>
#include <sigmaeval/cli.hpp>
#include <stdexcept>
#include <string_view>

namespace sigmaeval::cli {

namespace {

constexpr const char* MAIN_USAGE = "sigmaeval [OPTIONS] <COMMAND>";

bool str_eq(const char* a, const char* b) {
    return std::strcmp(a, b) == 0;
}

bool starts_with(const char* str, const char* prefix) {
    return std::strncmp(str, prefix, std::strlen(prefix)) == 0;
}

std::string usage_error(const std::string& message, const std::string& usage) {
    return "error: " + message + "\n\nUsage: " + usage + "\n\nFor more information, try '--help'.\n";
}

enum class Match { No, Yes, Missing };

/// Опция со значением: "-o X", "--output X" или "--output=X".
/// short_flag может быть nullptr.
Match take_value(int argc, char** argv, int& i, const char* short_flag, const char* long_flag,
                 std::string& value) {
    const char* arg = argv[i];

    if ((short_flag && str_eq(arg, short_flag)) || str_eq(arg, long_flag)) {
        if (i + 1 >= argc) {
            return Match::Missing;
        }
        value = argv[++i];
        return Match::Yes;
    }

    const std::string prefix = std::string(long_flag) + "=";
    if (starts_with(arg, prefix.c_str())) {
        value = arg + prefix.size();
        if (value.empty()) {
            return Match::Missing;
        }
        return Match::Yes;
    }

    return Match::No;
}

/// Разбор одной подкоманды: общие опции вывода, -h, -v, -q и позиционные
/// аргументы; специфичные опции передаются в on_flag.
class SubcommandParser {
public:
    SubcommandParser(std::string name, std::string usage, ParseResult& result)
        : name_(std::move(name)), usage_(std::move(usage)), result_(result) {}

    /// on_flag(argv, i) -> Match; Match::No - опция не распознана
    template <typename OnFlag>
    bool run(int argc, char** argv, int start, OutputOptions* out, OnFlag on_flag) {
        for (int i = start; i < argc; ++i) {
            const char* arg = argv[i];

            if (str_eq(arg, "-h") || str_eq(arg, "--help")) {
                result_.ok = true;
                result_.command = HelpCommand{name_};
                return false;
            }
            if (str_eq(arg, "-v")) {
                result_.global.verbose++;
                continue;
            }
            if (str_eq(arg, "-q")) {
                result_.global.quiet = true;
                continue;
            }

            if (out != nullptr) {
                if (str_eq(arg, "-j") || str_eq(arg, "--json")) {
                    out->json = true;
                    continue;
                }
                if (str_eq(arg, "--jsonl")) {
                    out->jsonl = true;
                    continue;
                }
                std::string value;
                Match m = take_value(argc, argv, i, "-o", "--output", value);
                if (m == Match::Missing) {
                    return missing("--output <OUTPUT>");
                }
                if (m == Match::Yes) {
                    out->output = std::filesystem::path(value);
                    continue;
                }
            }

            Match m = on_flag(argc, argv, i);
            if (m == Match::Missing) {
                return missing(arg);
            }
            if (m == Match::Yes) {
                continue;
            }

            if (arg[0] == '-' && arg[1] != '\0') {
                return fail(std::string("unexpected argument '") + arg + "' found");
            }
            positional_.emplace_back(arg);
        }

        if (out != nullptr && out->json && out->jsonl) {
            return fail("the argument '--json' cannot be used with '--jsonl'");
        }
        return true;
    }

    const std::vector<std::string>& positional() const { return positional_; }

    bool fail(const std::string& message) {
        result_.ok = false;
        result_.diagnostic.exit_code = 2;
        result_.diagnostic.stderr_message = usage_error(message, usage_);
        return false;
    }

    bool missing(const std::string& flag) {
        return fail("a value is required for '" + flag + "' but none was supplied");
    }

    /// Ровно count позиционных аргументов
    bool require_positional(size_t count, const char* names) {
        if (positional_.size() < count) {
            return fail(std::string("the following required arguments were not provided:\n  ") +
                        names);
        }
        if (positional_.size() > count) {
            return fail("unexpected argument '" + positional_[count] + "' found");
        }
        return true;
    }

private:
    std::string name_;
    std::string usage_;
    ParseResult& result_;
    std::vector<std::string> positional_;
};

Match path_flag(int argc, char** argv, int& i, const char* short_flag, const char* long_flag,
                std::optional<std::filesystem::path>& target) {
    std::string value;
    Match m = take_value(argc, argv, i, short_flag, long_flag, value);
    if (m == Match::Yes) {
        target = std::filesystem::path(value);
    }
    return m;
}

Match no_flags(int, char**, int&) {
    return Match::No;
}

}  // namespace

// ----------------------------------------------------------------------------
// render_version / render_help
// ----------------------------------------------------------------------------

std::string render_version() {
    return std::string("sigmaeval ") + VERSION + "\n";
}

std::string render_help(const std::optional<std::string>& command) {
    static const char* OUTPUT_OPTIONS =
        "  -j, --json             Output as JSON\n"
        "      --jsonl            Output as JSON lines\n"
        "  -o, --output <OUTPUT>  Save output to a file\n"
        "  -h, --help             Print help\n";

    if (!command.has_value()) {
        return std::string(ABOUT) +
               "\n"
               "\n"
               "Usage: sigmaeval [OPTIONS] <COMMAND>\n"
               "\n"
               "Commands:\n"
               "  validate     Run extended structural validation on rules\n"
               "  fingerprint  Extract the behavioral core of a rule\n"
               "  score        Score the huntability of a rule\n"
               "  compare      Compare a rule against a reference rule\n"
               "  novelty      Classify a rule against a rule corpus\n"
               "  evaluate     Run the full evaluation pipeline on a rule\n"
               "  dataset      Evaluate a dataset of generated rules\n"
               "  help         Print this message or the help of the given subcommand(s)\n"
               "\n"
               "Options:\n"
               "      --no-banner      Hide the banner\n"
               "      --config <FILE>  Load evaluator settings from a YAML file\n"
               "  -v...                Print verbose output\n"
               "  -q                   Suppress informational output\n"
               "  -h, --help           Print help\n"
               "  -V, --version        Print version\n"
               "\n"
               "Examples:\n"
               "\n"
               "    Validate a directory of generated rules:\n"
               "        ./sigmaeval validate generated/\n"
               "\n"
               "    Evaluate a rule against a reference and a corpus:\n"
               "        ./sigmaeval evaluate rule.yml --reference ref.yml --corpus sigma/rules/\n"
               "\n"
               "    Evaluate a dataset and save the report as JSON:\n"
               "        ./sigmaeval dataset items.json --corpus sigma/rules/ --json -o report.json\n";
    }

    if (*command == "validate") {
        return std::string("Run extended structural validation on rules\n"
                           "\n"
                           "Usage: sigmaeval validate [OPTIONS] <PATH>...\n"
                           "\n"
                           "Arguments:\n"
                           "  <PATH>...  Rule files or directories of rules\n"
                           "\n"
                           "Options:\n"
                           "      --skip-errors      Skip unreadable paths and continue\n") +
               OUTPUT_OPTIONS;
    }
    if (*command == "fingerprint") {
        return std::string("Extract the behavioral core of a rule\n"
                           "\n"
                           "Usage: sigmaeval fingerprint [OPTIONS] <RULE>\n"
                           "\n"
                           "Arguments:\n"
                           "  <RULE>  Rule file\n"
                           "\n"
                           "Options:\n") +
               OUTPUT_OPTIONS;
    }
    if (*command == "score") {
        return std::string("Score the huntability of a rule\n"
                           "\n"
                           "Usage: sigmaeval score [OPTIONS] <RULE>\n"
                           "\n"
                           "Arguments:\n"
                           "  <RULE>  Rule file\n"
                           "\n"
                           "Options:\n") +
               OUTPUT_OPTIONS;
    }
    if (*command == "compare") {
        return std::string("Compare a rule against a reference rule\n"
                           "\n"
                           "Usage: sigmaeval compare [OPTIONS] <RULE> <REFERENCE>\n"
                           "\n"
                           "Arguments:\n"
                           "  <RULE>       Rule file\n"
                           "  <REFERENCE>  Reference rule file\n"
                           "\n"
                           "Options:\n") +
               OUTPUT_OPTIONS;
    }
    if (*command == "novelty") {
        return std::string("Classify a rule against a rule corpus\n"
                           "\n"
                           "Usage: sigmaeval novelty [OPTIONS] --corpus <CORPUS> <RULE>\n"
                           "\n"
                           "Arguments:\n"
                           "  <RULE>  Rule file\n"
                           "\n"
                           "Options:\n"
                           "      --corpus <CORPUS>  Directory of existing rules\n") +
               OUTPUT_OPTIONS;
    }
    if (*command == "evaluate") {
        return std::string("Run the full evaluation pipeline on a rule\n"
                           "\n"
                           "Usage: sigmaeval evaluate [OPTIONS] <RULE>\n"
                           "\n"
                           "Arguments:\n"
                           "  <RULE>  Rule file\n"
                           "\n"
                           "Options:\n"
                           "  -r, --reference <REFERENCE>  Reference rule file\n"
                           "      --corpus <CORPUS>        Directory of existing rules\n") +
               OUTPUT_OPTIONS;
    }
    if (*command == "dataset") {
        return std::string("Evaluate a dataset of generated rules\n"
                           "\n"
                           "Usage: sigmaeval dataset [OPTIONS] <DATASET>\n"
                           "\n"
                           "Arguments:\n"
                           "  <DATASET>  JSON array of {input_id, generated_rule, reference_rules}\n"
                           "\n"
                           "Options:\n"
                           "      --corpus <CORPUS>         Directory of existing rules\n"
                           "      --num-threads <THREADS>   Limit the worker count "
                           "(default: num of CPUs)\n") +
               OUTPUT_OPTIONS;
    }

    return "error: unrecognized subcommand '" + *command + "'\n";
}

// ----------------------------------------------------------------------------
// parse
// ----------------------------------------------------------------------------

ParseResult parse(int argc, char** argv) {
    ParseResult result;
    result.command = HelpCommand{};

    if (argc < 2) {
        result.diagnostic.exit_code = 2;
        result.diagnostic.stderr_message = render_help(std::nullopt);
        return result;
    }

    int cmd_idx = argc;
    for (int i = 1; i < argc; ++i) {
        const char* arg = argv[i];

        if (str_eq(arg, "--no-banner")) {
            result.global.no_banner = true;
        } else if (str_eq(arg, "-v")) {
            result.global.verbose++;
        } else if (str_eq(arg, "-q")) {
            result.global.quiet = true;
        } else if (str_eq(arg, "-h") || str_eq(arg, "--help")) {
            result.ok = true;
            result.command = HelpCommand{};
            return result;
        } else if (str_eq(arg, "-V") || str_eq(arg, "--version")) {
            result.ok = true;
            result.command = VersionCommand{};
            return result;
        } else if (arg[0] == '-') {
            std::string value;
            Match m = take_value(argc, argv, i, nullptr, "--config", value);
            if (m == Match::Yes) {
                result.global.config = std::filesystem::path(value);
                continue;
            }
            result.diagnostic.exit_code = 2;
            result.diagnostic.stderr_message =
                m == Match::Missing
                    ? usage_error("a value is required for '--config <FILE>' but none was supplied",
                                  MAIN_USAGE)
                    : usage_error(std::string("unexpected argument '") + arg + "' found",
                                  MAIN_USAGE);
            return result;
        } else {
            cmd_idx = i;
            break;
        }
    }

    if (cmd_idx >= argc) {
        result.ok = true;
        result.command = HelpCommand{};
        return result;
    }

    const char* cmd = argv[cmd_idx];
    const int start = cmd_idx + 1;

    if (str_eq(cmd, "validate")) {
        ValidateCommand c;
        SubcommandParser p("validate", "sigmaeval validate [OPTIONS] <PATH>...", result);
        auto flags = [&](int, char** av, int& i) {
            if (str_eq(av[i], "--skip-errors")) {
                c.skip_errors = true;
                return Match::Yes;
            }
            return Match::No;
        };
        if (!p.run(argc, argv, start, &c.out, flags)) {
            return result;
        }
        if (p.positional().empty()) {
            p.fail("the following required arguments were not provided:\n  <PATH>...");
            return result;
        }
        for (const auto& path : p.positional()) {
            c.paths.emplace_back(path);
        }
        result.ok = true;
        result.command = std::move(c);
    } else if (str_eq(cmd, "fingerprint") || str_eq(cmd, "score")) {
        const bool fingerprint = str_eq(cmd, "fingerprint");
        OutputOptions out;
        SubcommandParser p(cmd, std::string("sigmaeval ") + cmd + " [OPTIONS] <RULE>", result);
        if (!p.run(argc, argv, start, &out, no_flags) || !p.require_positional(1, "<RULE>")) {
            return result;
        }
        result.ok = true;
        if (fingerprint) {
            result.command = FingerprintCommand{p.positional()[0], out};
        } else {
            result.command = ScoreCommand{p.positional()[0], out};
        }
    } else if (str_eq(cmd, "compare")) {
        CompareCommand c;
        SubcommandParser p("compare", "sigmaeval compare [OPTIONS] <RULE> <REFERENCE>", result);
        if (!p.run(argc, argv, start, &c.out, no_flags) ||
            !p.require_positional(2, "<RULE> <REFERENCE>")) {
            return result;
        }
        c.rule = p.positional()[0];
        c.reference = p.positional()[1];
        result.ok = true;
        result.command = std::move(c);
    } else if (str_eq(cmd, "novelty")) {
        NoveltyCommand c;
        std::optional<std::filesystem::path> corpus;
        SubcommandParser p("novelty", "sigmaeval novelty [OPTIONS] --corpus <CORPUS> <RULE>",
                           result);
        auto flags = [&](int ac, char** av, int& i) {
            return path_flag(ac, av, i, nullptr, "--corpus", corpus);
        };
        if (!p.run(argc, argv, start, &c.out, flags) || !p.require_positional(1, "<RULE>")) {
            return result;
        }
        if (!corpus) {
            p.fail("the following required arguments were not provided:\n  --corpus <CORPUS>");
            return result;
        }
        c.rule = p.positional()[0];
        c.corpus = *corpus;
        result.ok = true;
        result.command = std::move(c);
    } else if (str_eq(cmd, "evaluate")) {
        EvaluateCommand c;
        SubcommandParser p("evaluate", "sigmaeval evaluate [OPTIONS] <RULE>", result);
        auto flags = [&](int ac, char** av, int& i) {
            Match m = path_flag(ac, av, i, "-r", "--reference", c.reference);
            if (m != Match::No) {
                return m;
            }
            return path_flag(ac, av, i, nullptr, "--corpus", c.corpus);
        };
        if (!p.run(argc, argv, start, &c.out, flags) || !p.require_positional(1, "<RULE>")) {
            return result;
        }
        c.rule = p.positional()[0];
        result.ok = true;
        result.command = std::move(c);
    } else if (str_eq(cmd, "dataset")) {
        DatasetCommand c;
        SubcommandParser p("dataset", "sigmaeval dataset [OPTIONS] <DATASET>", result);
        bool bad_threads = false;
        std::string threads_value;
        auto flags = [&](int ac, char** av, int& i) {
            Match m = path_flag(ac, av, i, nullptr, "--corpus", c.corpus);
            if (m != Match::No) {
                return m;
            }
            m = take_value(ac, av, i, nullptr, "--num-threads", threads_value);
            if (m == Match::Yes) {
                try {
                    size_t pos = 0;
                    const unsigned long n = std::stoul(threads_value, &pos);
                    if (pos != threads_value.size() || threads_value[0] == '-') {
                        bad_threads = true;
                    } else {
                        c.num_threads = static_cast<size_t>(n);
                    }
                } catch (const std::exception&) {
                    bad_threads = true;
                }
            }
            return m;
        };
        if (!p.run(argc, argv, start, &c.out, flags)) {
            return result;
        }
        if (bad_threads) {
            p.fail("invalid value '" + threads_value +
                   "' for '--num-threads <THREADS>': expected a non-negative integer");
            return result;
        }
        if (!p.require_positional(1, "<DATASET>")) {
            return result;
        }
        c.dataset = p.positional()[0];
        result.ok = true;
        result.command = std::move(c);
    } else if (str_eq(cmd, "help")) {
        result.ok = true;
        if (cmd_idx + 1 < argc) {
            result.command = HelpCommand{std::string(argv[cmd_idx + 1])};
        } else {
            result.command = HelpCommand{};
        }
    } else {
        result.diagnostic.exit_code = 2;
        result.diagnostic.stderr_message =
            usage_error(std::string("unrecognized subcommand '") + cmd + "'", MAIN_USAGE);
    }

    return result;
}

}  // namespace sigmaeval::cli
