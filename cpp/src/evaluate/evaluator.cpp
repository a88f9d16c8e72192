// ==============================================================================
// evaluator.cpp - Конвейер оценки правила и набора данных
// ==============================================================================
//
// evaluate_dataset() раздаёт элементы рабочим потокам через атомарный индекс.
// Каждый поток пишет только в свой слот результата, поэтому порядок
// элементов сохраняется без блокировок.
//
// ==============================================================================

#include <algorithm>
#include <atomic>
#include <rapidjson/document.h>
#include <rapidjson/error/en.h>
#include <sigmaeval/discovery.hpp>
#include <sigmaeval/evaluator.hpp>
#include <sigmaeval/output.hpp>
#include <thread>

namespace sigmaeval::evaluate {

namespace {

constexpr size_t MAX_WORKERS = 64;

size_t resolve_workers(size_t requested, size_t items) {
    size_t count = requested;
    if (count == 0) {
        count = std::thread::hardware_concurrency();
        if (count == 0) {
            count = 4;
        }
    }
    count = std::min(count, MAX_WORKERS);
    return std::max<size_t>(1, std::min(count, items));
}

std::optional<double> mean(const std::vector<double>& values) {
    if (values.empty()) {
        return std::nullopt;
    }
    double sum = 0.0;
    for (double v : values) {
        sum += v;
    }
    return sum / static_cast<double>(values.size());
}

std::optional<std::string> read_id(const rapidjson::Value& item, const char* key) {
    auto it = item.FindMember(key);
    if (it == item.MemberEnd()) {
        return std::nullopt;
    }
    const rapidjson::Value& v = it->value;
    if (v.IsString()) {
        std::string id(v.GetString(), v.GetStringLength());
        if (id.empty()) {
            return std::nullopt;
        }
        return id;
    }
    if (v.IsInt64()) {
        return std::to_string(v.GetInt64());
    }
    if (v.IsUint64()) {
        return std::to_string(v.GetUint64());
    }
    return std::nullopt;
}

}  // namespace

// ============================================================================
// Загрузка набора данных
// ============================================================================

DatasetLoadResult parse_dataset(const std::string& json, output::Writer* writer) {
    DatasetLoadResult result;

    rapidjson::Document doc;
    doc.Parse(json.c_str(), json.size());
    if (doc.HasParseError()) {
        result.error = rule::Error{
            std::string(rapidjson::GetParseError_En(doc.GetParseError())) + " at offset " +
                std::to_string(doc.GetErrorOffset()),
            "invalid dataset JSON"};
        return result;
    }
    if (!doc.IsArray()) {
        result.error = rule::Error{"dataset must be a JSON array", "invalid dataset"};
        return result;
    }

    size_t index = 0;
    for (const auto& entry : doc.GetArray()) {
        const std::string context = "item " + std::to_string(index++);
        if (!entry.IsObject()) {
            result.error = rule::Error{"item must be a JSON object", context};
            return result;
        }

        auto id = read_id(entry, "input_id");
        if (!id) {
            id = read_id(entry, "article_id");
        }
        if (!id) {
            ++result.skipped;
            if (writer) {
                writer->warn("Skipping dataset " + context + ": no input_id");
            }
            continue;
        }

        DatasetItem item;
        item.input_id = *id;

        auto rule_it = entry.FindMember("generated_rule");
        if (rule_it != entry.MemberEnd() && !rule_it->value.IsNull()) {
            if (!rule_it->value.IsString()) {
                result.error = rule::Error{"generated_rule must be a string", context};
                return result;
            }
            item.rule_text =
                std::string(rule_it->value.GetString(), rule_it->value.GetStringLength());
        }

        auto refs_it = entry.FindMember("reference_rules");
        if (refs_it != entry.MemberEnd() && !refs_it->value.IsNull()) {
            if (!refs_it->value.IsArray()) {
                result.error = rule::Error{"reference_rules must be an array", context};
                return result;
            }
            for (const auto& ref : refs_it->value.GetArray()) {
                if (!ref.IsString()) {
                    result.error = rule::Error{"reference_rules must contain strings", context};
                    return result;
                }
                item.reference_rules.emplace_back(ref.GetString(), ref.GetStringLength());
            }
        }

        result.items.push_back(std::move(item));
    }

    result.ok = true;
    return result;
}

DatasetLoadResult load_dataset(const std::filesystem::path& path, output::Writer* writer) {
    auto read = io::read_text_file(path);
    if (!read) {
        DatasetLoadResult result;
        result.error = rule::Error{read.error, "dataset"};
        return result;
    }

    auto result = parse_dataset(read.content, writer);
    if (!result) {
        result.error.context = path.string() + ": " + result.error.context;
    }
    return result;
}

// ============================================================================
// Метрики
// ============================================================================

CorpusMetrics compute_metrics(const std::vector<ItemResult>& items) {
    CorpusMetrics metrics;
    metrics.total = items.size();

    size_t passed = 0;
    std::vector<double> huntability;
    std::vector<double> semantic;
    std::vector<double> stability;
    NoveltyDistribution distribution;
    bool any_novelty = false;

    for (const auto& item : items) {
        if (item.error || !item.report) {
            ++metrics.errors;
            continue;
        }
        ++metrics.valid_results;

        const RuleReport& report = *item.report;
        if (report.structural.final_pass) {
            ++passed;
        }
        if (report.huntability) {
            huntability.push_back(report.huntability->score);
        }
        if (report.semantic) {
            semantic.push_back(report.semantic->similarity_score);
        }
        if (report.stability) {
            stability.push_back(report.stability->stability_score);
        }
        if (report.novelty) {
            any_novelty = true;
            switch (report.novelty->novelty_status) {
            case novelty::NoveltyStatus::Duplicate:
                ++distribution.duplicates;
                break;
            case novelty::NoveltyStatus::Variant:
                ++distribution.variants;
                break;
            case novelty::NoveltyStatus::Novel:
                ++distribution.novel;
                break;
            }
        }
    }

    if (metrics.valid_results > 0) {
        metrics.structural_pass_rate =
            static_cast<double>(passed) / static_cast<double>(metrics.valid_results);
    }
    metrics.avg_huntability = mean(huntability);
    metrics.avg_semantic_similarity = mean(semantic);
    metrics.avg_stability = mean(stability);
    if (any_novelty) {
        metrics.novelty_distribution = distribution;
    }

    return metrics;
}

// ============================================================================
// Evaluator
// ============================================================================

Evaluator::Evaluator(const config::Config& cfg, std::shared_ptr<capability::Judge> judge,
                     std::shared_ptr<capability::Embedder> embedder,
                     std::shared_ptr<const rule::BaseValidator> base, output::Writer* writer)
    : cfg_(cfg),
      writer_(writer),
      validator_(base ? std::move(base) : std::make_shared<rule::GrammarValidator>(), writer),
      semantic_(std::move(judge), std::move(embedder), cfg.semantic, writer),
      novelty_(cfg.novelty, writer),
      stability_(&semantic_, writer, cfg.stable_threshold) {}

RuleReport Evaluator::evaluate_rule(const std::string& rule_text,
                                    const std::optional<std::string>& reference_rule,
                                    const capability::Corpus* corpus) const {
    RuleReport report;
    report.structural = validator_.validate(rule_text);
    if (!report.structural.final_pass) {
        if (writer_) {
            writer_->debug("Structural validation failed with " +
                           std::to_string(report.structural.errors.size()) + " error(s)");
        }
        return report;
    }

    const std::string cleaned = rule::clean_rule_text(rule_text);
    report.core = fingerprint::extract_behavioral_core(cleaned);

    auto parsed = rule::parse(cleaned);
    if (parsed) {
        report.huntability = huntability::score_rule(parsed.rule);
    } else {
        report.huntability = huntability::score_rule(cleaned);
    }

    if (reference_rule) {
        report.semantic =
            semantic_.compare_rules(cleaned, rule::clean_rule_text(*reference_rule));
    }

    if (corpus) {
        report.novelty = novelty_.detect_novelty(*report.core, corpus);
    }

    return report;
}

ItemResult Evaluator::evaluate_item(const DatasetItem& item, const DatasetOptions& options) const {
    ItemResult result;
    result.input_id = item.input_id;

    if (item.rule_text) {
        result.rule_text = item.rule_text;
    } else if (options.generate) {
        try {
            result.rule_text = options.generate(item.input_id);
        } catch (const std::exception& e) {
            result.error = e.what();
            if (writer_) {
                writer_->warn("Generation failed for '" + item.input_id + "': " + e.what());
            }
            return result;
        }
    } else {
        result.error = "No rule provided";
        return result;
    }

    std::optional<std::string> reference;
    if (!item.reference_rules.empty()) {
        reference = item.reference_rules.front();
    }

    result.report = evaluate_rule(*result.rule_text, reference, options.corpus);

    const size_t runs = options.stability_runs.value_or(cfg_.stability_runs);
    if (options.generate && runs > 0 && result.report->structural.final_pass) {
        result.report->stability =
            stability_.test_stability(item.input_id, options.generate, reference, runs);
    }

    return result;
}

DatasetResult Evaluator::evaluate_dataset(const std::vector<DatasetItem>& items,
                                          const DatasetOptions& options) const {
    DatasetResult result;
    result.items.resize(items.size());

    if (!items.empty()) {
        const size_t workers = resolve_workers(options.num_threads, items.size());
        if (writer_) {
            writer_->debug("Evaluating " + std::to_string(items.size()) + " item(s) with " +
                           std::to_string(workers) + " worker(s)");
        }

        std::atomic<size_t> next{0};
        auto work = [&]() {
            for (size_t i = next.fetch_add(1); i < items.size(); i = next.fetch_add(1)) {
                result.items[i] = evaluate_item(items[i], options);
            }
        };

        if (workers == 1) {
            work();
        } else {
            std::vector<std::thread> pool;
            pool.reserve(workers);
            for (size_t i = 0; i < workers; ++i) {
                pool.emplace_back(work);
            }
            for (auto& t : pool) {
                t.join();
            }
        }
    }

    result.metrics = compute_metrics(result.items);
    return result;
}

}  // namespace sigmaeval::evaluate
