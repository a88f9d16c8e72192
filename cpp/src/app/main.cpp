// ==============================================================================
// main.cpp - Точка входа sigmaeval
// ==============================================================================
//
// 1. Парсинг argv (cli)
// 2. Загрузка настроек (--config)
// 3. Создание Writer
// 4. Dispatch команды, возврат exit code:
//    0 - успех, 1 - ошибка выполнения или провал проверки, 2 - ошибка CLI
//
// ==============================================================================

#include <cstdio>
#include <exception>
#include <iostream>
#include <memory>
#include <rapidjson/document.h>
#include <sigmaeval/capability.hpp>
#include <sigmaeval/cli.hpp>
#include <sigmaeval/config.hpp>
#include <sigmaeval/discovery.hpp>
#include <sigmaeval/evaluator.hpp>
#include <sigmaeval/output.hpp>
#include <sigmaeval/report.hpp>

namespace {

using namespace sigmaeval;

constexpr const char* BANNER = R"(
     _                                    _
 ___(_) __ _ _ __ ___   __ _  _____   ____ _| |
/ __| |/ _` | '_ ` _ \ / _` |/ _ \ \ / / _` | |
\__ \ | (_| | | | | | | (_| |  __/\ V / (_| | |
|___/_|\__, |_| |_| |_|\__,_|\___| \_/ \__,_|_|
       |___/
)";

void print_banner(output::Writer& writer, bool no_banner, bool quiet) {
    if (no_banner || quiet) {
        return;
    }
    writer.write(output::Stream::Stderr, BANNER);
    writer.write_line(output::Stream::Stderr, "");
}

std::string fmt(double value) {
    char buf[32];
    std::snprintf(buf, sizeof(buf), "%.2f", value);
    return buf;
}

std::string fmt(const std::optional<double>& value) {
    return value ? fmt(*value) : "-";
}

/// Контекст выполнения команды
struct Context {
    output::Writer& writer;
    const config::Config& cfg;
    const cli::OutputOptions& out;
};

/// Вывести JSON результат в формате --json / --jsonl
void emit_json(const Context& ctx, const rapidjson::Value& value) {
    if (ctx.out.jsonl) {
        ctx.writer.write_json_line(value);
    } else {
        ctx.writer.write_json_pretty(value);
    }
}

bool json_output(const Context& ctx) {
    return ctx.out.json || ctx.out.jsonl;
}

std::optional<std::string> read_rule(const Context& ctx, const std::filesystem::path& path) {
    auto read = io::read_text_file(path);
    if (!read) {
        ctx.writer.error(read.error);
        return std::nullopt;
    }
    return read.content;
}

std::unique_ptr<capability::DirectoryCorpus> open_corpus(const Context& ctx,
                                                          const std::filesystem::path& path) {
    std::error_code ec;
    if (!std::filesystem::is_directory(path, ec)) {
        ctx.writer.error("Corpus directory not found: " + path.string());
        return nullptr;
    }
    auto corpus = std::make_unique<capability::DirectoryCorpus>(path, &ctx.writer);
    ctx.writer.info("Loaded " + std::to_string(corpus->rules().size()) + " corpus rules from " +
                    path.string());
    return corpus;
}

std::shared_ptr<capability::Embedder> make_embedder(const Context& ctx) {
    ctx.writer.debug("No judge configured, semantic scoring uses hashed embeddings (" +
                     std::to_string(ctx.cfg.embedding_dimensions) + " dimensions)");
    return std::make_shared<capability::HashingEmbedder>(ctx.cfg.embedding_dimensions);
}

void print_structural(const Context& ctx, const std::string& label,
                      const validate::ExtendedValidationResult& r) {
    if (r.final_pass) {
        ctx.writer.green_line("PASS " + label);
    } else {
        ctx.writer.red_line("FAIL " + label);
    }
    for (const auto& line : report::structural_details(r)) {
        ctx.writer.write_line(output::Stream::Stdout, "    " + line);
    }
}

// ----------------------------------------------------------------------------
// Команды
// ----------------------------------------------------------------------------

int run_validate(const cli::ValidateCommand& cmd, const Context& ctx) {
    io::DiscoveryOptions disc_opt;
    disc_opt.skip_errors = cmd.skip_errors;
    disc_opt.writer = &ctx.writer;

    std::vector<std::filesystem::path> files;
    try {
        files = io::discover_files(cmd.paths, disc_opt);
    } catch (const std::exception& e) {
        ctx.writer.error(e.what());
        return 1;
    }
    if (files.empty()) {
        ctx.writer.error("No rule files were found in the provided paths");
        return 1;
    }

    ctx.writer.info("Validating " + std::to_string(files.size()) + " rule(s)...");

    validate::StructuralValidator validator(&ctx.writer);
    rapidjson::Document doc;
    doc.SetArray();
    auto& alloc = doc.GetAllocator();

    size_t passed = 0;
    size_t unreadable = 0;
    for (const auto& file : files) {
        auto read = io::read_text_file(file);
        if (!read) {
            ++unreadable;
            ctx.writer.warn(read.error);
            continue;
        }

        const auto result = validator.validate(read.content);
        if (result.final_pass) {
            ++passed;
        }

        if (json_output(ctx)) {
            rapidjson::Value entry = report::to_json(result, alloc);
            entry.AddMember("path", rapidjson::Value(file.string().c_str(), alloc), alloc);
            if (ctx.out.jsonl) {
                ctx.writer.write_json_line(entry);
            } else {
                doc.PushBack(entry, alloc);
            }
        } else {
            print_structural(ctx, file.string(), result);
        }
    }

    if (ctx.out.json) {
        ctx.writer.write_json_pretty(doc);
    }

    const size_t total = files.size() - unreadable;
    ctx.writer.info("Validated " + std::to_string(total) + " rules, " + std::to_string(passed) +
                    " passed");
    return (passed == total && unreadable == 0) ? 0 : 1;
}

int run_fingerprint(const cli::FingerprintCommand& cmd, const Context& ctx) {
    auto text = read_rule(ctx, cmd.rule);
    if (!text) {
        return 1;
    }

    const auto core = fingerprint::extract_behavioral_core(rule::clean_rule_text(*text));
    if (core.core_hash.empty()) {
        ctx.writer.error("Rule could not be parsed: " + cmd.rule.string());
        return 1;
    }

    if (json_output(ctx)) {
        rapidjson::Document doc;
        emit_json(ctx, report::to_json(core, doc.GetAllocator()));
        return 0;
    }

    auto& w = ctx.writer;
    w.write_line(output::Stream::Stdout, "core_hash: " + core.core_hash);
    w.write_line(output::Stream::Stdout,
                 "selectors (" + std::to_string(core.selector_count) + "):");
    for (const auto& s : core.behavior_selectors) {
        w.write_line(output::Stream::Stdout, "    " + s);
    }
    if (!core.commandlines.empty()) {
        w.write_line(output::Stream::Stdout, "commandlines:");
        for (const auto& c : core.commandlines) {
            w.write_line(output::Stream::Stdout, "    " + c);
        }
    }
    if (!core.process_chains.empty()) {
        w.write_line(output::Stream::Stdout, "process chains:");
        for (const auto& c : core.process_chains) {
            w.write_line(output::Stream::Stdout, "    " + c);
        }
    }
    return 0;
}

int run_score(const cli::ScoreCommand& cmd, const Context& ctx) {
    auto text = read_rule(ctx, cmd.rule);
    if (!text) {
        return 1;
    }

    const auto score = huntability::score_rule(rule::clean_rule_text(*text));

    if (json_output(ctx)) {
        rapidjson::Document doc;
        emit_json(ctx, report::to_json(score, doc.GetAllocator()));
        return 0;
    }

    output::Table table;
    table.set_headers({"metric", "score"});
    for (const auto& [name, value] : score.breakdown) {
        table.add_row({name, fmt(value)});
    }
    table.print(ctx.writer);

    auto& w = ctx.writer;
    w.write_line(output::Stream::Stdout, "score: " + fmt(score.score) + " / 10");
    w.write_line(output::Stream::Stdout,
                 std::string("false positive risk: ") +
                     std::string(huntability::risk_to_string(score.false_positive_risk)));
    if (!score.coverage_notes.empty()) {
        w.write_line(output::Stream::Stdout, "notes: " + score.coverage_notes);
    }
    return 0;
}

int run_compare(const cli::CompareCommand& cmd, const Context& ctx) {
    auto text = read_rule(ctx, cmd.rule);
    auto reference = read_rule(ctx, cmd.reference);
    if (!text || !reference) {
        return 1;
    }

    const std::string generated = rule::clean_rule_text(*text);
    const std::string ref = rule::clean_rule_text(*reference);

    semantic::SemanticScorer scorer(nullptr, make_embedder(ctx), ctx.cfg.semantic, &ctx.writer);
    const auto sem = scorer.compare_rules(generated, ref);
    const auto cmp = fingerprint::compare_cores(fingerprint::extract_behavioral_core(generated),
                                                fingerprint::extract_behavioral_core(ref));

    if (json_output(ctx)) {
        rapidjson::Document doc;
        doc.SetObject();
        auto& alloc = doc.GetAllocator();
        doc.AddMember("semantic", report::to_json(sem, alloc), alloc);
        doc.AddMember("core_comparison", report::to_json(cmp, alloc), alloc);
        emit_json(ctx, doc);
        return 0;
    }

    if (sem.degraded) {
        ctx.writer.warn(std::string("Semantic score computed via fallback method: ") +
                        std::string(semantic::method_to_string(sem.method)));
    }

    auto& w = ctx.writer;
    w.write_line(output::Stream::Stdout, "similarity: " + fmt(sem.similarity_score) + " (" +
                                             std::string(semantic::method_to_string(sem.method)) +
                                             ")");
    w.write_line(output::Stream::Stdout,
                 "missing behaviors: " + std::to_string(sem.missing_behaviors));
    w.write_line(output::Stream::Stdout,
                 "extraneous behaviors: " + std::to_string(sem.extraneous_behaviors));
    w.write_line(output::Stream::Stdout,
                 "core similarity: " + fmt(cmp.similarity) + " (" +
                     std::to_string(cmp.common_selectors) + " common, " +
                     std::to_string(cmp.only_in_first) + " only in rule, " +
                     std::to_string(cmp.only_in_second) + " only in reference)");
    return 0;
}

int run_novelty(const cli::NoveltyCommand& cmd, const Context& ctx) {
    auto text = read_rule(ctx, cmd.rule);
    if (!text) {
        return 1;
    }
    auto corpus = open_corpus(ctx, cmd.corpus);
    if (!corpus) {
        return 1;
    }

    novelty::NoveltyDetector detector(ctx.cfg.novelty, &ctx.writer);
    const auto result = detector.detect_novelty(rule::clean_rule_text(*text), corpus.get());

    if (json_output(ctx)) {
        rapidjson::Document doc;
        emit_json(ctx, report::to_json(result, doc.GetAllocator()));
        return 0;
    }

    auto& w = ctx.writer;
    w.write_line(output::Stream::Stdout,
                 std::string("status: ") + std::string(novelty::status_to_string(result.novelty_status)));
    if (result.closest_match_id) {
        w.write_line(output::Stream::Stdout, "closest match: " + *result.closest_match_id + " (" +
                                                 result.closest_match_title.value_or("") + ")");
        w.write_line(output::Stream::Stdout, "similarity: " + fmt(result.similarity));
    }
    w.write_line(output::Stream::Stdout,
                 "compared: " + std::to_string(result.rules_compared) +
                     ", skipped: " + std::to_string(result.rules_skipped));
    return 0;
}

int run_evaluate(const cli::EvaluateCommand& cmd, const Context& ctx) {
    auto text = read_rule(ctx, cmd.rule);
    if (!text) {
        return 1;
    }

    std::optional<std::string> reference;
    if (cmd.reference) {
        reference = read_rule(ctx, *cmd.reference);
        if (!reference) {
            return 1;
        }
    }

    std::unique_ptr<capability::DirectoryCorpus> corpus;
    if (cmd.corpus) {
        corpus = open_corpus(ctx, *cmd.corpus);
        if (!corpus) {
            return 1;
        }
    }

    evaluate::Evaluator evaluator(ctx.cfg, nullptr, make_embedder(ctx), nullptr, &ctx.writer);
    const auto result = evaluator.evaluate_rule(*text, reference, corpus.get());

    if (json_output(ctx)) {
        rapidjson::Document doc;
        emit_json(ctx, report::to_json(result, doc.GetAllocator()));
        return result.structural.final_pass ? 0 : 1;
    }

    print_structural(ctx, cmd.rule.string(), result.structural);
    if (!result.structural.final_pass) {
        return 1;
    }

    auto& w = ctx.writer;
    if (result.core) {
        w.write_line(output::Stream::Stdout, "core_hash: " + result.core->core_hash);
    }
    if (result.huntability) {
        w.write_line(output::Stream::Stdout,
                     "huntability: " + fmt(result.huntability->score) + " / 10, risk " +
                         std::string(huntability::risk_to_string(
                             result.huntability->false_positive_risk)));
    }
    if (result.semantic) {
        if (result.semantic->degraded) {
            w.warn(std::string("Semantic score computed via fallback method: ") +
                   std::string(semantic::method_to_string(result.semantic->method)));
        }
        w.write_line(output::Stream::Stdout,
                     "semantic similarity: " + fmt(result.semantic->similarity_score));
    }
    if (result.novelty) {
        w.write_line(output::Stream::Stdout,
                     std::string("novelty: ") +
                         std::string(novelty::status_to_string(result.novelty->novelty_status)));
    }
    return 0;
}

int run_dataset(const cli::DatasetCommand& cmd, const Context& ctx) {
    auto loaded = evaluate::load_dataset(cmd.dataset, &ctx.writer);
    if (!loaded) {
        ctx.writer.error(loaded.error.format());
        return 1;
    }
    if (loaded.skipped > 0) {
        ctx.writer.warn("Skipped " + std::to_string(loaded.skipped) +
                        " dataset item(s) without input_id");
    }

    std::unique_ptr<capability::DirectoryCorpus> corpus;
    if (cmd.corpus) {
        corpus = open_corpus(ctx, *cmd.corpus);
        if (!corpus) {
            return 1;
        }
    }

    ctx.writer.info("Evaluating " + std::to_string(loaded.items.size()) + " dataset item(s)...");

    evaluate::DatasetOptions options;
    options.corpus = corpus.get();
    options.num_threads = cmd.num_threads.value_or(ctx.cfg.num_threads);

    evaluate::Evaluator evaluator(ctx.cfg, nullptr, make_embedder(ctx), nullptr, &ctx.writer);
    const auto result = evaluator.evaluate_dataset(loaded.items, options);

    if (ctx.out.jsonl) {
        rapidjson::Document doc;
        auto& alloc = doc.GetAllocator();
        for (const auto& item : result.items) {
            ctx.writer.write_json_line(report::to_json(item, alloc));
        }
        rapidjson::Value metrics(rapidjson::kObjectType);
        metrics.AddMember("metrics", report::to_json(result.metrics, alloc), alloc);
        ctx.writer.write_json_line(metrics);
        return 0;
    }
    if (ctx.out.json) {
        rapidjson::Document doc;
        ctx.writer.write_json_pretty(report::to_json(result, doc.GetAllocator()));
        return 0;
    }

    output::Table table;
    table.set_headers({"input", "structural", "huntability", "similarity", "novelty"});
    for (const auto& item : result.items) {
        if (item.error || !item.report) {
            table.add_row({item.input_id, "error: " + item.error.value_or("unknown"), "-", "-", "-"});
            continue;
        }
        const auto& r = *item.report;
        table.add_row(
            {item.input_id, r.structural.final_pass ? "pass" : "fail",
             r.huntability ? fmt(r.huntability->score) : "-",
             r.semantic ? fmt(r.semantic->similarity_score) : "-",
             r.novelty ? std::string(novelty::status_to_string(r.novelty->novelty_status)) : "-"});
    }
    table.print(ctx.writer);

    const auto& m = result.metrics;
    auto& w = ctx.writer;
    w.write_line(output::Stream::Stdout, "total: " + std::to_string(m.total) + ", valid: " +
                                             std::to_string(m.valid_results) +
                                             ", errors: " + std::to_string(m.errors));
    w.write_line(output::Stream::Stdout, "structural pass rate: " + fmt(m.structural_pass_rate));
    w.write_line(output::Stream::Stdout, "avg huntability: " + fmt(m.avg_huntability));
    w.write_line(output::Stream::Stdout,
                 "avg semantic similarity: " + fmt(m.avg_semantic_similarity));
    if (m.novelty_distribution) {
        w.write_line(output::Stream::Stdout,
                     "novelty: " + std::to_string(m.novelty_distribution->duplicates) +
                         " duplicates, " + std::to_string(m.novelty_distribution->variants) +
                         " variants, " + std::to_string(m.novelty_distribution->novel) + " novel");
    }
    return 0;
}

// ----------------------------------------------------------------------------
// run
// ----------------------------------------------------------------------------

/// Опции вывода выбранной команды (nullptr для help/version)
const cli::OutputOptions* output_options(const cli::Command& command) {
    return std::visit(
        [](const auto& cmd) -> const cli::OutputOptions* {
            using T = std::decay_t<decltype(cmd)>;
            if constexpr (std::is_same_v<T, cli::HelpCommand> ||
                          std::is_same_v<T, cli::VersionCommand>) {
                return nullptr;
            } else {
                return &cmd.out;
            }
        },
        command);
}

int run(int argc, char** argv) {
    cli::ParseResult parse_result = cli::parse(argc, argv);

    output::OutputConfig out_cfg;
    out_cfg.quiet = parse_result.global.quiet;
    out_cfg.verbose = parse_result.global.verbose;
    out_cfg.no_banner = parse_result.global.no_banner;

    if (!parse_result.ok) {
        output::Writer writer(out_cfg);
        writer.write(output::Stream::Stderr, parse_result.diagnostic.stderr_message);
        return parse_result.diagnostic.exit_code;
    }

    const cli::OutputOptions* out = output_options(parse_result.command);
    if (out != nullptr) {
        out_cfg.output_path = out->output;
        if (out->json) {
            out_cfg.format = output::Format::Json;
        } else if (out->jsonl) {
            out_cfg.format = output::Format::Jsonl;
        }
    }
    output::Writer writer(out_cfg);

    if (out != nullptr && out->output && !writer.has_output_file()) {
        writer.error("Unable to open output file: " + out->output->string());
        return 1;
    }

    if (const auto* help = std::get_if<cli::HelpCommand>(&parse_result.command)) {
        writer.write(output::Stream::Stdout, cli::render_help(help->command));
        return 0;
    }
    if (std::holds_alternative<cli::VersionCommand>(parse_result.command)) {
        writer.write(output::Stream::Stdout, cli::render_version());
        return 0;
    }

    print_banner(writer, out_cfg.no_banner, out_cfg.quiet);

    config::Config cfg;
    if (parse_result.global.config) {
        auto loaded = config::load(*parse_result.global.config);
        if (!loaded) {
            writer.error(loaded.error.format());
            return 1;
        }
        cfg = loaded.config;
        writer.debug("Loaded settings from " + parse_result.global.config->string());
    }

    const Context ctx{writer, cfg, *out};

    return std::visit(
        [&](auto&& cmd) -> int {
            using T = std::decay_t<decltype(cmd)>;

            if constexpr (std::is_same_v<T, cli::ValidateCommand>) {
                return run_validate(cmd, ctx);
            } else if constexpr (std::is_same_v<T, cli::FingerprintCommand>) {
                return run_fingerprint(cmd, ctx);
            } else if constexpr (std::is_same_v<T, cli::ScoreCommand>) {
                return run_score(cmd, ctx);
            } else if constexpr (std::is_same_v<T, cli::CompareCommand>) {
                return run_compare(cmd, ctx);
            } else if constexpr (std::is_same_v<T, cli::NoveltyCommand>) {
                return run_novelty(cmd, ctx);
            } else if constexpr (std::is_same_v<T, cli::EvaluateCommand>) {
                return run_evaluate(cmd, ctx);
            } else if constexpr (std::is_same_v<T, cli::DatasetCommand>) {
                return run_dataset(cmd, ctx);
            } else {
                return 1;
            }
        },
        parse_result.command);
}

}  // namespace

int main(int argc, char** argv) {
    try {
        return run(argc, argv);
    } catch (const std::exception& e) {
        std::cerr << "[x] " << e.what() << "\n";
        return 1;
    }
}
