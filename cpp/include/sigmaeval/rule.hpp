// ==============================================================================
// sigmaeval/rule.hpp - Модель Sigma правила и базовая проверка грамматики
// ==============================================================================
//
// Назначение:
// - Разбор текста Sigma правила (YAML) в структуру Rule
// - Очистка ответа LLM (markdown code fence, пояснительный текст)
// - Интерфейс BaseValidator и реализация по умолчанию (GrammarValidator)
// - Разбор ключа селектора "Field|mod1|mod2"
//
// ==============================================================================

#ifndef SIGMAEVAL_RULE_HPP
#define SIGMAEVAL_RULE_HPP

#include <optional>
#include <string>
#include <string_view>
#include <vector>
#include <yaml-cpp/yaml.h>

namespace sigmaeval::rule {

// ============================================================================
// LogSource - источник логов
// ============================================================================

struct LogSource {
    std::optional<std::string> category;
    std::optional<std::string> product;
    std::optional<std::string> service;
    std::optional<std::string> definition;
};

// ============================================================================
// Detection
// ============================================================================

/// Именованный блок селекции (selection, filter_*, keywords ...)
struct Selection {
    std::string name;
    YAML::Node body;  // map, список map или список скаляров
};

/// Блок detection: селекции в порядке объявления + условие
struct Detection {
    std::vector<Selection> selections;
    std::string condition;
    std::optional<std::string> timeframe;

    /// Найти селекцию по имени
    const Selection* find(std::string_view name) const;

    /// Имена всех селекций в порядке объявления
    std::vector<std::string> names() const;
};

// ============================================================================
// Rule
// ============================================================================

struct Rule {
    std::string title;
    std::optional<std::string> id;
    std::string description;
    std::optional<std::string> status;
    std::optional<std::string> author;
    std::optional<std::string> level;
    std::vector<std::string> tags;
    std::vector<std::string> falsepositives;
    std::optional<LogSource> logsource;
    Detection detection;

    /// Исходный YAML документ (для обхода произвольной вложенности)
    YAML::Node document;
};

// ============================================================================
// Error / ParseResult
// ============================================================================

/// Ошибка разбора правила
struct Error {
    std::string message;
    std::string context;

    std::string format() const;
};

struct ParseResult {
    bool ok = false;
    Rule rule;
    Error error;

    explicit operator bool() const { return ok; }
};

/// Разобрать текст Sigma правила.
/// Требует YAML mapping на верхнем уровне; поля detection разбираются
/// терпимо (отсутствующий condition даёт пустую строку, а не ошибку).
/// Исключения yaml-cpp перехватываются и возвращаются как Error.
ParseResult parse(const std::string& text);

/// Загрузить YAML документ без построения Rule (nullopt при ошибке разбора)
std::optional<YAML::Node> load_yaml(const std::string& text);

// ============================================================================
// Очистка ответа LLM
// ============================================================================

/// Очистить правило, сгенерированное LLM:
/// - извлечь содержимое первого ```yaml ... ``` блока
/// - иначе отбросить строки до первого известного ключа верхнего уровня
/// - убрать оставшиеся маркеры ``` и пробелы в конце строк
/// - взять в кавычки значения title/description со спецсимволами YAML
std::string clean_rule_text(const std::string& text);

// ============================================================================
// Ключ селектора
// ============================================================================

/// Разобранный ключ "Field|mod1|mod2"
struct FieldKey {
    std::string field;                   // "CommandLine"
    std::vector<std::string> modifiers;  // {"contains", "all"} (lowercase)

    bool has_modifier(std::string_view m) const;
};

/// Разобрать ключ селектора. "=" трактуется как разделитель наравне с "|".
FieldKey parse_field_key(std::string_view key);

// ============================================================================
// Базовая проверка грамматики
// ============================================================================

/// Результат базовой проверки ("является ли текст синтаксически правилом")
struct BaseValidation {
    bool is_valid = false;
    std::vector<std::string> errors;
    std::vector<std::string> warnings;
};

/// Внешняя способность: базовый валидатор грамматики Sigma
class BaseValidator {
public:
    virtual ~BaseValidator() = default;

    /// Проверить текст правила. Не должен бросать исключения.
    virtual BaseValidation validate_base(const std::string& rule_text) const = 0;
};

/// Валидатор по умолчанию на yaml-cpp:
/// обязательные title/logsource/detection, logsource и detection являются mapping,
/// condition присутствует и непуст, есть хотя бы одна селекция,
/// category и level из допустимых наборов.
class GrammarValidator : public BaseValidator {
public:
    BaseValidation validate_base(const std::string& rule_text) const override;
};

/// Допустимые значения logsource.category
const std::vector<std::string>& known_categories();

/// Допустимые значения level
const std::vector<std::string>& known_levels();

// ============================================================================
// Строковые помощники
// ============================================================================

std::string ascii_lowercase(std::string_view str);

std::string trim(std::string_view str);

}  // namespace sigmaeval::rule

#endif  // SIGMAEVAL_RULE_HPP
