// ==============================================================================
// novelty.cpp - Новизна правила относительно корпуса
// ==============================================================================

#include <sigmaeval/novelty.hpp>
#include <sigmaeval/output.hpp>
#include <vector>

namespace sigmaeval::novelty {

std::string_view status_to_string(NoveltyStatus status) {
    switch (status) {
    case NoveltyStatus::Duplicate:
        return "duplicate";
    case NoveltyStatus::Variant:
        return "variant";
    case NoveltyStatus::Novel:
        return "novel";
    }
    return "novel";
}

NoveltyDetector::NoveltyDetector(const NoveltyOptions& options, output::Writer* writer)
    : options_(options), writer_(writer) {}

NoveltyStatus NoveltyDetector::classify(double similarity) const {
    if (similarity >= options_.duplicate_threshold) {
        return NoveltyStatus::Duplicate;
    }
    if (similarity >= options_.variant_threshold) {
        return NoveltyStatus::Variant;
    }
    return NoveltyStatus::Novel;
}

NoveltyResult NoveltyDetector::detect_novelty(const std::string& rule_text,
                                              const capability::Corpus* corpus) const {
    return detect_novelty(fingerprint::extract_behavioral_core(rule_text), corpus);
}

NoveltyResult NoveltyDetector::detect_novelty(const fingerprint::BehavioralCore& candidate,
                                              const capability::Corpus* corpus) const {
    NoveltyResult result;
    if (!corpus) {
        return result;
    }

    std::vector<capability::CorpusRule> rules;
    try {
        rules = corpus->rules();
    } catch (const std::exception& e) {
        if (writer_) {
            writer_->warn(std::string("Corpus unavailable, assuming novel: ") + e.what());
        }
        return result;
    }
    result.corpus_available = true;

    const capability::CorpusRule* best = nullptr;
    double best_similarity = 0.0;

    for (const auto& entry : rules) {
        const auto core = fingerprint::extract_behavioral_core(entry.rule_text);
        if (core.core_hash.empty()) {
            ++result.rules_skipped;
            if (writer_) {
                writer_->trace("Skipping unparsable corpus rule '" + entry.id + "'");
            }
            continue;
        }
        ++result.rules_compared;

        if (!candidate.core_hash.empty() && core.core_hash == candidate.core_hash) {
            result.novelty_status = NoveltyStatus::Duplicate;
            result.novelty_score = static_cast<int>(NoveltyStatus::Duplicate);
            result.closest_match_id = entry.id;
            result.closest_match_title = entry.title;
            result.similarity = 1.0;
            result.closest_comparison = fingerprint::compare_cores(candidate, core);
            return result;
        }

        auto comparison = fingerprint::compare_cores(candidate, core);
        if (best == nullptr || comparison.similarity > best_similarity) {
            best = &entry;
            best_similarity = comparison.similarity;
            result.closest_comparison = std::move(comparison);
        }
    }

    if (best != nullptr) {
        result.closest_match_id = best->id;
        result.closest_match_title = best->title;
        result.similarity = best_similarity;
        result.novelty_status = classify(best_similarity);
    } else {
        result.novelty_status = NoveltyStatus::Novel;
    }
    result.novelty_score = static_cast<int>(result.novelty_status);

    return result;
}

}  // namespace sigmaeval::novelty
