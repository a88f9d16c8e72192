// ==============================================================================
// sigmaeval/evaluator.hpp - Конвейер оценки правила и набора данных
// ==============================================================================
//
// Порядок стадий для одного правила:
//
//   1. StructuralValidator       - при провале отчёт содержит только его
//   2. BehavioralCore            - извлекается один раз
//   3. HuntabilityScorer         - по разобранному правилу
//   4. SemanticScorer            - если задан эталон
//   5. NoveltyDetector           - если задан корпус
//
// StabilityTester вызывается только драйвером набора данных, когда задан
// генератор и число запусков (DatasetOptions::stability_runs, иначе
// Config::stability_runs) больше нуля.
//
// ==============================================================================

#ifndef SIGMAEVAL_EVALUATOR_HPP
#define SIGMAEVAL_EVALUATOR_HPP

#include <filesystem>
#include <memory>
#include <optional>
#include <sigmaeval/capability.hpp>
#include <sigmaeval/config.hpp>
#include <sigmaeval/fingerprint.hpp>
#include <sigmaeval/huntability.hpp>
#include <sigmaeval/novelty.hpp>
#include <sigmaeval/semantic.hpp>
#include <sigmaeval/stability.hpp>
#include <sigmaeval/validator.hpp>
#include <string>
#include <vector>

namespace sigmaeval::output {
class Writer;
}

namespace sigmaeval::evaluate {

// ============================================================================
// Отчёты
// ============================================================================

struct RuleReport {
    validate::ExtendedValidationResult structural;
    std::optional<fingerprint::BehavioralCore> core;
    std::optional<semantic::SemanticComparisonResult> semantic;
    std::optional<huntability::HuntabilityScore> huntability;
    std::optional<stability::StabilityResult> stability;
    std::optional<novelty::NoveltyResult> novelty;
};

struct NoveltyDistribution {
    size_t duplicates = 0;
    size_t variants = 0;
    size_t novel = 0;
};

struct CorpusMetrics {
    size_t total = 0;
    size_t valid_results = 0;
    size_t errors = 0;
    double structural_pass_rate = 0.0;
    std::optional<double> avg_huntability;
    std::optional<double> avg_semantic_similarity;
    std::optional<NoveltyDistribution> novelty_distribution;
    std::optional<double> avg_stability;
};

// ============================================================================
// Набор данных
// ============================================================================

struct DatasetItem {
    std::string input_id;
    std::optional<std::string> rule_text;  // готовое правило; иначе - генератор
    std::vector<std::string> reference_rules;
};

struct ItemResult {
    std::string input_id;
    std::optional<std::string> rule_text;
    std::optional<RuleReport> report;
    std::optional<std::string> error;  // генерация не удалась / нет правила
};

struct DatasetResult {
    std::vector<ItemResult> items;  // порядок совпадает с входным
    CorpusMetrics metrics;
};

struct DatasetOptions {
    const capability::Corpus* corpus = nullptr;
    capability::GenerateFn generate;
    /// Не задано - Config::stability_runs; 0 - без проверки стабильности
    std::optional<size_t> stability_runs;
    size_t num_threads = 0;     // 0 - hardware_concurrency
};

struct DatasetLoadResult {
    bool ok = false;
    std::vector<DatasetItem> items;
    size_t skipped = 0;  // элементы без input_id
    rule::Error error;

    explicit operator bool() const { return ok; }
};

/// Разобрать JSON массив элементов:
/// [{"input_id": "a1", "generated_rule": "...", "reference_rules": ["..."]}]
/// "article_id" (строка или целое) - синоним input_id.
DatasetLoadResult parse_dataset(const std::string& json, output::Writer* writer = nullptr);

/// Загрузить файл набора данных
DatasetLoadResult load_dataset(const std::filesystem::path& path, output::Writer* writer = nullptr);

/// Агрегированные метрики по результатам элементов
CorpusMetrics compute_metrics(const std::vector<ItemResult>& items);

// ============================================================================
// Evaluator
// ============================================================================

class Evaluator {
public:
    /// judge и embedder могут быть nullptr (тогда семантика нейтральна);
    /// base == nullptr - GrammarValidator
    Evaluator(const config::Config& cfg, std::shared_ptr<capability::Judge> judge,
              std::shared_ptr<capability::Embedder> embedder,
              std::shared_ptr<const rule::BaseValidator> base = nullptr,
              output::Writer* writer = nullptr);

    Evaluator(const Evaluator&) = delete;
    Evaluator& operator=(const Evaluator&) = delete;

    /// Оценить одно правило. Не бросает исключений.
    RuleReport evaluate_rule(const std::string& rule_text,
                             const std::optional<std::string>& reference_rule = std::nullopt,
                             const capability::Corpus* corpus = nullptr) const;

    /// Оценить набор данных пулом потоков. Не бросает исключений.
    DatasetResult evaluate_dataset(const std::vector<DatasetItem>& items,
                                   const DatasetOptions& options) const;

    const validate::StructuralValidator& validator() const { return validator_; }
    const semantic::SemanticScorer& semantic_scorer() const { return semantic_; }
    const novelty::NoveltyDetector& novelty_detector() const { return novelty_; }
    const stability::StabilityTester& stability_tester() const { return stability_; }

private:
    ItemResult evaluate_item(const DatasetItem& item, const DatasetOptions& options) const;

    config::Config cfg_;
    output::Writer* writer_;
    validate::StructuralValidator validator_;
    semantic::SemanticScorer semantic_;
    novelty::NoveltyDetector novelty_;
    stability::StabilityTester stability_;
};

}  // namespace sigmaeval::evaluate

#endif  // SIGMAEVAL_EVALUATOR_HPP
