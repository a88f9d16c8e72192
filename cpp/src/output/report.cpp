// ==============================================================================
// report.cpp - JSON представление результатов оценки
// ==============================================================================

#include <algorithm>
#include <rapidjson/stringbuffer.h>
#include <rapidjson/writer.h>
#include <sigmaeval/report.hpp>

namespace sigmaeval::report {

namespace {

rapidjson::Value str(std::string_view s, Allocator& alloc) {
    return rapidjson::Value(s.data(), static_cast<rapidjson::SizeType>(s.size()), alloc);
}

rapidjson::Value strings(const std::vector<std::string>& values, Allocator& alloc) {
    rapidjson::Value arr(rapidjson::kArrayType);
    for (const auto& v : values) {
        arr.PushBack(str(v, alloc), alloc);
    }
    return arr;
}

template <typename T>
rapidjson::Value optional_json(const std::optional<T>& value, Allocator& alloc) {
    if (!value) {
        return rapidjson::Value(rapidjson::kNullType);
    }
    return to_json(*value, alloc);
}

rapidjson::Value optional_string(const std::optional<std::string>& value, Allocator& alloc) {
    if (!value) {
        return rapidjson::Value(rapidjson::kNullType);
    }
    return str(*value, alloc);
}

rapidjson::Value optional_double(const std::optional<double>& value) {
    if (!value) {
        return rapidjson::Value(rapidjson::kNullType);
    }
    return rapidjson::Value(*value);
}

rapidjson::Value size(size_t n) {
    return rapidjson::Value(static_cast<uint64_t>(n));
}

}  // namespace

rapidjson::Value to_json(const validate::ExtendedValidationResult& r, Allocator& alloc) {
    rapidjson::Value obj(rapidjson::kObjectType);
    obj.AddMember("base_grammar_passed", r.base_grammar_passed, alloc);
    obj.AddMember("base_errors", strings(r.base_errors, alloc), alloc);
    obj.AddMember("telemetry_feasible", r.telemetry_feasible, alloc);
    obj.AddMember("condition_valid", r.condition_valid, alloc);
    obj.AddMember("pattern_safe", r.pattern_safe, alloc);
    obj.AddMember("ioc_leakage", r.ioc_leakage, alloc);
    obj.AddMember("field_conformance", r.field_conformance, alloc);
    obj.AddMember("selection_feasible", r.selection_feasible, alloc);
    obj.AddMember("final_pass", r.final_pass, alloc);
    obj.AddMember("errors", strings(r.errors, alloc), alloc);
    obj.AddMember("warnings", strings(r.warnings, alloc), alloc);
    return obj;
}

rapidjson::Value to_json(const fingerprint::BehavioralCore& core, Allocator& alloc) {
    rapidjson::Value obj(rapidjson::kObjectType);
    obj.AddMember("behavior_selectors", strings(core.behavior_selectors, alloc), alloc);
    obj.AddMember("commandlines", strings(core.commandlines, alloc), alloc);
    obj.AddMember("process_chains", strings(core.process_chains, alloc), alloc);
    obj.AddMember("core_hash", str(core.core_hash, alloc), alloc);
    obj.AddMember("selector_count", size(core.selector_count), alloc);
    return obj;
}

rapidjson::Value to_json(const fingerprint::CoreComparison& cmp, Allocator& alloc) {
    rapidjson::Value obj(rapidjson::kObjectType);
    obj.AddMember("similarity", cmp.similarity, alloc);
    obj.AddMember("common_selectors", size(cmp.common_selectors), alloc);
    obj.AddMember("only_in_first", size(cmp.only_in_first), alloc);
    obj.AddMember("only_in_second", size(cmp.only_in_second), alloc);
    obj.AddMember("hash_match", cmp.hash_match, alloc);
    obj.AddMember("selector_count_diff", size(cmp.selector_count_diff), alloc);
    return obj;
}

rapidjson::Value to_json(const huntability::HuntabilityScore& score, Allocator& alloc) {
    rapidjson::Value obj(rapidjson::kObjectType);
    obj.AddMember("score", score.score, alloc);
    obj.AddMember("false_positive_risk",
                  str(huntability::risk_to_string(score.false_positive_risk), alloc), alloc);
    obj.AddMember("coverage_notes", str(score.coverage_notes, alloc), alloc);

    rapidjson::Value breakdown(rapidjson::kObjectType);
    for (const auto& [name, value] : score.breakdown) {
        breakdown.AddMember(str(name, alloc), rapidjson::Value(value), alloc);
    }
    obj.AddMember("breakdown", breakdown, alloc);
    return obj;
}

rapidjson::Value to_json(const semantic::SemanticComparisonResult& r, Allocator& alloc) {
    rapidjson::Value obj(rapidjson::kObjectType);
    obj.AddMember("similarity_score", r.similarity_score, alloc);
    obj.AddMember("missing_behaviors", size(r.missing_behaviors), alloc);
    obj.AddMember("extraneous_behaviors", size(r.extraneous_behaviors), alloc);
    obj.AddMember("missing_behavior_details", strings(r.missing_behavior_details, alloc), alloc);
    obj.AddMember("extraneous_behavior_details", strings(r.extraneous_behavior_details, alloc),
                  alloc);
    obj.AddMember("method", str(semantic::method_to_string(r.method), alloc), alloc);
    obj.AddMember("degraded", r.degraded, alloc);

    if (r.overfitting_detected) {
        obj.AddMember("overfitting_detected", *r.overfitting_detected, alloc);
    } else {
        obj.AddMember("overfitting_detected", rapidjson::Value(rapidjson::kNullType), alloc);
    }
    obj.AddMember("fp_risk", optional_string(r.fp_risk, alloc), alloc);
    obj.AddMember("explanation", optional_string(r.explanation, alloc), alloc);
    return obj;
}

rapidjson::Value to_json(const stability::StabilityResult& r, Allocator& alloc) {
    rapidjson::Value obj(rapidjson::kObjectType);
    obj.AddMember("num_runs", size(r.num_runs), alloc);
    obj.AddMember("successful_runs", size(r.successful_runs), alloc);
    obj.AddMember("failed_runs", size(r.failed_runs), alloc);
    obj.AddMember("unique_hashes", size(r.unique_hashes), alloc);
    obj.AddMember("hash_consistency", r.hash_consistency, alloc);
    obj.AddMember("selectors_variance", r.selectors_variance, alloc);
    obj.AddMember("semantic_variance", r.semantic_variance, alloc);
    obj.AddMember("stability_score", r.stability_score, alloc);
    obj.AddMember("is_stable", r.is_stable, alloc);
    obj.AddMember("run_errors", strings(r.run_errors, alloc), alloc);
    return obj;
}

rapidjson::Value to_json(const novelty::NoveltyResult& r, Allocator& alloc) {
    rapidjson::Value obj(rapidjson::kObjectType);
    obj.AddMember("novelty_score", r.novelty_score, alloc);
    obj.AddMember("novelty_status", str(novelty::status_to_string(r.novelty_status), alloc),
                  alloc);
    obj.AddMember("closest_match_id", optional_string(r.closest_match_id, alloc), alloc);
    obj.AddMember("closest_match_title", optional_string(r.closest_match_title, alloc), alloc);
    obj.AddMember("similarity", optional_double(r.similarity), alloc);
    obj.AddMember("closest_comparison", optional_json(r.closest_comparison, alloc), alloc);
    obj.AddMember("rules_compared", size(r.rules_compared), alloc);
    obj.AddMember("rules_skipped", size(r.rules_skipped), alloc);
    obj.AddMember("corpus_available", r.corpus_available, alloc);
    return obj;
}

rapidjson::Value to_json(const evaluate::RuleReport& report, Allocator& alloc) {
    rapidjson::Value obj(rapidjson::kObjectType);
    obj.AddMember("structural", to_json(report.structural, alloc), alloc);
    obj.AddMember("behavioral_core", optional_json(report.core, alloc), alloc);
    obj.AddMember("semantic", optional_json(report.semantic, alloc), alloc);
    obj.AddMember("huntability", optional_json(report.huntability, alloc), alloc);
    obj.AddMember("stability", optional_json(report.stability, alloc), alloc);
    obj.AddMember("novelty", optional_json(report.novelty, alloc), alloc);
    return obj;
}

rapidjson::Value to_json(const evaluate::ItemResult& item, Allocator& alloc) {
    rapidjson::Value obj(rapidjson::kObjectType);
    obj.AddMember("input_id", str(item.input_id, alloc), alloc);
    obj.AddMember("generated_rule", optional_string(item.rule_text, alloc), alloc);
    obj.AddMember("evaluation", optional_json(item.report, alloc), alloc);
    obj.AddMember("error", optional_string(item.error, alloc), alloc);
    return obj;
}

rapidjson::Value to_json(const evaluate::CorpusMetrics& metrics, Allocator& alloc) {
    rapidjson::Value obj(rapidjson::kObjectType);
    obj.AddMember("total", size(metrics.total), alloc);
    obj.AddMember("valid_results", size(metrics.valid_results), alloc);
    obj.AddMember("errors", size(metrics.errors), alloc);
    obj.AddMember("structural_pass_rate", metrics.structural_pass_rate, alloc);
    obj.AddMember("avg_huntability", optional_double(metrics.avg_huntability), alloc);
    obj.AddMember("avg_semantic_similarity", optional_double(metrics.avg_semantic_similarity),
                  alloc);

    if (metrics.novelty_distribution) {
        rapidjson::Value dist(rapidjson::kObjectType);
        dist.AddMember("duplicates", size(metrics.novelty_distribution->duplicates), alloc);
        dist.AddMember("variants", size(metrics.novelty_distribution->variants), alloc);
        dist.AddMember("novel", size(metrics.novelty_distribution->novel), alloc);
        obj.AddMember("novelty_distribution", dist, alloc);
    } else {
        obj.AddMember("novelty_distribution", rapidjson::Value(rapidjson::kNullType), alloc);
    }

    obj.AddMember("avg_stability", optional_double(metrics.avg_stability), alloc);
    return obj;
}

rapidjson::Value to_json(const evaluate::DatasetResult& result, Allocator& alloc) {
    rapidjson::Value obj(rapidjson::kObjectType);
    rapidjson::Value items(rapidjson::kArrayType);
    for (const auto& item : result.items) {
        items.PushBack(to_json(item, alloc), alloc);
    }
    obj.AddMember("items", items, alloc);
    obj.AddMember("metrics", to_json(result.metrics, alloc), alloc);
    return obj;
}

std::vector<std::string> structural_details(const validate::ExtendedValidationResult& r) {
    std::vector<std::string> lines;
    for (const auto& e : r.base_errors) {
        lines.push_back("grammar: " + e);
    }
    for (const auto& e : r.errors) {
        if (std::find(r.base_errors.begin(), r.base_errors.end(), e) == r.base_errors.end()) {
            lines.push_back("error: " + e);
        }
    }
    for (const auto& w : r.warnings) {
        lines.push_back("warning: " + w);
    }
    return lines;
}

std::string to_string(const rapidjson::Value& value) {
    rapidjson::StringBuffer buffer;
    rapidjson::Writer<rapidjson::StringBuffer> writer(buffer);
    value.Accept(writer);
    return std::string(buffer.GetString(), buffer.GetSize());
}

}  // namespace sigmaeval::report
