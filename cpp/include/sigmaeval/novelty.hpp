// ==============================================================================
// sigmaeval/novelty.hpp - Новизна правила относительно корпуса
// ==============================================================================
//
// Классификация по лучшему совпадению поведенческих ядер:
// - совпадение непустого core_hash - duplicate (similarity 1.0), поиск прекращается
// - similarity >= duplicate_threshold (0.95) - duplicate
// - similarity >= variant_threshold (0.70)   - variant
// - иначе, а также без корпуса                - novel
//
// ==============================================================================

#ifndef SIGMAEVAL_NOVELTY_HPP
#define SIGMAEVAL_NOVELTY_HPP

#include <optional>
#include <sigmaeval/capability.hpp>
#include <sigmaeval/fingerprint.hpp>
#include <string>
#include <string_view>

namespace sigmaeval::output {
class Writer;
}

namespace sigmaeval::novelty {

enum class NoveltyStatus { Duplicate = 0, Variant = 1, Novel = 2 };

std::string_view status_to_string(NoveltyStatus status);

struct NoveltyResult {
    int novelty_score = 2;  // 0 duplicate, 1 variant, 2 novel
    NoveltyStatus novelty_status = NoveltyStatus::Novel;
    std::optional<std::string> closest_match_id;
    std::optional<std::string> closest_match_title;
    std::optional<double> similarity;
    /// Общие и различающиеся селекторы лучшего совпадения
    std::optional<fingerprint::CoreComparison> closest_comparison;

    size_t rules_compared = 0;
    size_t rules_skipped = 0;
    bool corpus_available = false;
};

struct NoveltyOptions {
    double duplicate_threshold = 0.95;
    double variant_threshold = 0.70;
};

class NoveltyDetector {
public:
    explicit NoveltyDetector(const NoveltyOptions& options = {}, output::Writer* writer = nullptr);

    /// Классифицировать правило. corpus == nullptr - novel без совпадения.
    /// Не бросает исключений.
    NoveltyResult detect_novelty(const std::string& rule_text,
                                 const capability::Corpus* corpus) const;

    /// То же с уже извлечённым ядром кандидата
    NoveltyResult detect_novelty(const fingerprint::BehavioralCore& candidate,
                                 const capability::Corpus* corpus) const;

    /// Статус по величине сходства
    NoveltyStatus classify(double similarity) const;

private:
    NoveltyOptions options_;
    output::Writer* writer_;
};

}  // namespace sigmaeval::novelty

#endif  // SIGMAEVAL_NOVELTY_HPP
