// ==============================================================================
// sigmaeval/semantic.hpp - Семантическое сравнение правила с эталоном
// ==============================================================================
//
// Стратегии:
// - JudgeStrategy: LLM-судья возвращает JSON с similarity_score и списками
//   отсутствующих/лишних поведений
// - EmbeddingStrategy: косинусная близость эмбеддингов двух текстов
//
// SemanticScorer пробует стратегии по порядку. Результат первой стратегии
// не считается деградированным; результат любой следующей - считается.
// Если отказали все - нейтральный результат (0.5, без различий).
//
// ==============================================================================

#ifndef SIGMAEVAL_SEMANTIC_HPP
#define SIGMAEVAL_SEMANTIC_HPP

#include <chrono>
#include <memory>
#include <optional>
#include <sigmaeval/capability.hpp>
#include <string>
#include <string_view>
#include <vector>

namespace sigmaeval::output {
class Writer;
}

namespace sigmaeval::semantic {

enum class Method { Judge, Embedding, Neutral };

std::string_view method_to_string(Method method);

struct SemanticComparisonResult {
    double similarity_score = 0.5;
    size_t missing_behaviors = 0;
    size_t extraneous_behaviors = 0;
    std::vector<std::string> missing_behavior_details;
    std::vector<std::string> extraneous_behavior_details;

    Method method = Method::Neutral;
    bool degraded = true;  // значение получено запасным путём

    std::optional<bool> overfitting_detected;
    std::optional<std::string> fp_risk;
    std::optional<std::string> explanation;
};

/// Нейтральный результат при отказе всех способностей
SemanticComparisonResult neutral_result();

// ============================================================================
// Стратегии
// ============================================================================

class SemanticStrategy {
public:
    virtual ~SemanticStrategy() = default;

    virtual Method method() const = 0;

    /// Сравнить правила. Любой отказ - исключение.
    virtual SemanticComparisonResult compare(const std::string& generated,
                                             const std::string& reference) const = 0;
};

class JudgeStrategy : public SemanticStrategy {
public:
    JudgeStrategy(std::shared_ptr<capability::Judge> judge, std::chrono::milliseconds timeout);

    Method method() const override { return Method::Judge; }

    SemanticComparisonResult compare(const std::string& generated,
                                     const std::string& reference) const override;

private:
    std::shared_ptr<capability::Judge> judge_;
    std::chrono::milliseconds timeout_;
};

class EmbeddingStrategy : public SemanticStrategy {
public:
    EmbeddingStrategy(std::shared_ptr<capability::Embedder> embedder,
                      std::chrono::milliseconds timeout);

    Method method() const override { return Method::Embedding; }

    SemanticComparisonResult compare(const std::string& generated,
                                     const std::string& reference) const override;

private:
    std::shared_ptr<capability::Embedder> embedder_;
    std::chrono::milliseconds timeout_;
};

// ============================================================================
// SemanticScorer
// ============================================================================

struct SemanticOptions {
    std::chrono::milliseconds judge_timeout{60000};
    std::chrono::milliseconds embed_timeout{30000};
};

class SemanticScorer {
public:
    /// Цепочка: judge (если задан), затем embedder (если задан)
    SemanticScorer(std::shared_ptr<capability::Judge> judge,
                   std::shared_ptr<capability::Embedder> embedder,
                   const SemanticOptions& options = {}, output::Writer* writer = nullptr);

    /// Произвольная цепочка стратегий
    explicit SemanticScorer(std::vector<std::unique_ptr<SemanticStrategy>> chain,
                            output::Writer* writer = nullptr);

    /// Сравнить сгенерированное правило с эталоном. Не бросает исключений.
    SemanticComparisonResult compare_rules(const std::string& generated,
                                           const std::string& reference) const;

private:
    std::vector<std::unique_ptr<SemanticStrategy>> chain_;
    output::Writer* writer_;
};

// ============================================================================
// Разбор ответа судьи
// ============================================================================

/// Запрос к судье с обоими правилами
std::string build_judge_prompt(const std::string& generated, const std::string& reference);

/// Первый сбалансированный объект {...} в тексте (строки JSON учитываются)
std::optional<std::string> extract_json_object(std::string_view text);

/// Разобрать ответ судьи. Бросает CapabilityError при некорректном ответе.
SemanticComparisonResult parse_judge_response(const std::string& response);

}  // namespace sigmaeval::semantic

#endif  // SIGMAEVAL_SEMANTIC_HPP
