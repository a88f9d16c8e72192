// ==============================================================================
// sigmaeval/capability.hpp - Внешние способности конвейера оценки
// ==============================================================================
//
// Назначение:
// - Judge: LLM-судья (prompt -> ответ), может бросать
// - Embedder: текст -> вектор; HashingEmbedder работает без сети
// - Corpus: корпус существующих правил (MemoryCorpus, DirectoryCorpus)
// - GenerateFn: генератор правила по input_id, может бросать
// - call_with_timeout: ограничение времени вызова способности
//
// ==============================================================================

#ifndef SIGMAEVAL_CAPABILITY_HPP
#define SIGMAEVAL_CAPABILITY_HPP

#include <chrono>
#include <filesystem>
#include <functional>
#include <future>
#include <memory>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>

namespace sigmaeval::output {
class Writer;
}

namespace sigmaeval::capability {

/// Отказ внешней способности (таймаут, некорректный ответ)
class CapabilityError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

// ============================================================================
// Judge / Embedder
// ============================================================================

class Judge {
public:
    virtual ~Judge() = default;

    /// Ответ модели на prompt. Может бросать исключения.
    virtual std::string judge(const std::string& prompt) = 0;
};

class Embedder {
public:
    virtual ~Embedder() = default;

    /// Вектор признаков текста. Может бросать исключения.
    virtual std::vector<float> embed(const std::string& text) = 0;
};

/// Офлайн эмбеддер: хеширование токенов (feature hashing) в вектор
/// фиксированной размерности с L2 нормировкой.
/// Токен - максимальная последовательность [A-Za-z0-9_], в нижнем регистре.
class HashingEmbedder : public Embedder {
public:
    explicit HashingEmbedder(size_t dimensions = 256);

    std::vector<float> embed(const std::string& text) override;

    size_t dimensions() const { return dimensions_; }

private:
    size_t dimensions_;
};

/// Косинусная близость. Бросает CapabilityError при разной размерности
/// или нулевой норме.
double cosine_similarity(const std::vector<float>& a, const std::vector<float>& b);

// ============================================================================
// Corpus
// ============================================================================

struct CorpusRule {
    std::string id;
    std::string title;
    std::string rule_text;
};

class Corpus {
public:
    virtual ~Corpus() = default;

    /// Правила корпуса. Может бросать исключения.
    virtual std::vector<CorpusRule> rules() const = 0;
};

class MemoryCorpus : public Corpus {
public:
    MemoryCorpus() = default;
    explicit MemoryCorpus(std::vector<CorpusRule> rules);

    void add(CorpusRule rule);

    std::vector<CorpusRule> rules() const override;

private:
    std::vector<CorpusRule> rules_;
};

/// Корпус из файлов .yml/.yaml в директории (рекурсивно).
/// Файлы загружаются один раз в конструкторе; нечитаемые пропускаются
/// с предупреждением. id берётся из поля id правила, иначе из имени файла.
class DirectoryCorpus : public Corpus {
public:
    explicit DirectoryCorpus(const std::filesystem::path& root, output::Writer* writer = nullptr);

    std::vector<CorpusRule> rules() const override;

    size_t skipped() const { return skipped_; }

private:
    std::vector<CorpusRule> rules_;
    size_t skipped_ = 0;
};

// ============================================================================
// Generator
// ============================================================================

/// Сгенерировать правило для входа input_id. Может бросать исключения.
using GenerateFn = std::function<std::string(const std::string& input_id)>;

// ============================================================================
// Timeout
// ============================================================================

/// Выполнить fn во вспомогательном потоке и дождаться результата не дольше
/// timeout. По истечении бросает CapabilityError; результат брошенного вызова
/// отбрасывается. Исключение из fn пробрасывается вызывающему.
/// timeout <= 0 - вызов в текущем потоке без ограничения.
///
/// fn должен владеть всем, что использует (shared_ptr), так как брошенный
/// вызов может пережить вызывающего.
template <typename Fn>
auto call_with_timeout(Fn fn, std::chrono::milliseconds timeout) -> decltype(fn()) {
    using Result = decltype(fn());

    if (timeout.count() <= 0) {
        return fn();
    }

    auto task = std::make_shared<std::packaged_task<Result()>>(std::move(fn));
    std::future<Result> future = task->get_future();
    std::thread([task]() { (*task)(); }).detach();

    if (future.wait_for(timeout) != std::future_status::ready) {
        throw CapabilityError("capability call timed out after " +
                              std::to_string(timeout.count()) + " ms");
    }
    return future.get();
}

}  // namespace sigmaeval::capability

#endif  // SIGMAEVAL_CAPABILITY_HPP
