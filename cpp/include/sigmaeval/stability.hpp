// ==============================================================================
// sigmaeval/stability.hpp - Стабильность повторной генерации правила
// ==============================================================================
//
// N раз вызывает генератор для одного входа и сравнивает поведенческие ядра:
//
//   hash_consistency   = доля запусков с модальным core_hash
//   selectors_variance = stdev(selector_count) / mean   (0 при < 2 запусках)
//   semantic_variance  = stdev(similarity) / mean       (0 при < 2 запусках)
//
//   stability_score = 0.5 * hash_consistency
//                   + 0.3 * (1 - min(1, selectors_variance))
//                   + 0.2 * (1 - min(1, semantic_variance))
//
// stdev - выборочное (n - 1). Упавший запуск пропускается и не прерывает
// остальные.
//
// ==============================================================================

#ifndef SIGMAEVAL_STABILITY_HPP
#define SIGMAEVAL_STABILITY_HPP

#include <optional>
#include <sigmaeval/capability.hpp>
#include <string>
#include <vector>

namespace sigmaeval::output {
class Writer;
}

namespace sigmaeval::semantic {
class SemanticScorer;
}

namespace sigmaeval::stability {

constexpr double DEFAULT_STABLE_THRESHOLD = 0.85;

struct StabilityResult {
    size_t num_runs = 0;
    size_t successful_runs = 0;
    size_t failed_runs = 0;

    size_t unique_hashes = 0;
    double hash_consistency = 0.0;
    double selectors_variance = 0.0;
    double semantic_variance = 0.0;
    double stability_score = 0.0;
    bool is_stable = false;

    std::vector<std::string> run_errors;  // "run N: <message>"
};

/// Коэффициент вариации: выборочное stdev / mean; 0 при < 2 значениях или mean == 0
double coefficient_of_variation(const std::vector<double>& values);

class StabilityTester {
public:
    /// semantic может быть nullptr: тогда semantic_variance = 0
    explicit StabilityTester(const semantic::SemanticScorer* semantic = nullptr,
                             output::Writer* writer = nullptr,
                             double stable_threshold = DEFAULT_STABLE_THRESHOLD);

    /// Выполнить num_runs генераций для input_id. Не бросает исключений.
    StabilityResult test_stability(const std::string& input_id,
                                   const capability::GenerateFn& generate,
                                   const std::optional<std::string>& reference_rule = std::nullopt,
                                   size_t num_runs = 5) const;

private:
    const semantic::SemanticScorer* semantic_;
    output::Writer* writer_;
    double stable_threshold_;
};

}  // namespace sigmaeval::stability

#endif  // SIGMAEVAL_STABILITY_HPP
