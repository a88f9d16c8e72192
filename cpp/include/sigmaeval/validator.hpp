// ==============================================================================
// sigmaeval/validator.hpp - Расширенная структурная проверка правила
// ==============================================================================
//
// Назначение:
// - Жёсткий шлюз: базовая проверка грамматики (BaseValidator)
// - Расширенные проверки поверх разобранного правила:
//   telemetry, condition, невозможные селекции, безопасность шаблонов,
//   утечка IOC, соответствие полей process_creation/windows
//
// Порядок сообщений в errors/warnings совпадает с порядком проверок.
// validate() не бросает исключений.
//
// ==============================================================================

#ifndef SIGMAEVAL_VALIDATOR_HPP
#define SIGMAEVAL_VALIDATOR_HPP

#include <memory>
#include <sigmaeval/rule.hpp>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace sigmaeval::output {
class Writer;
}

namespace sigmaeval::validate {

/// Результат расширенной проверки. ioc_leakage == true означает провал.
struct ExtendedValidationResult {
    bool base_grammar_passed = false;
    std::vector<std::string> base_errors;
    bool telemetry_feasible = false;
    bool condition_valid = false;
    bool pattern_safe = false;
    bool ioc_leakage = false;
    bool field_conformance = false;
    bool selection_feasible = false;
    bool final_pass = false;
    std::vector<std::string> errors;
    std::vector<std::string> warnings;
};

class StructuralValidator {
public:
    /// С GrammarValidator в качестве базовой проверки
    explicit StructuralValidator(output::Writer* writer = nullptr);

    StructuralValidator(std::shared_ptr<const rule::BaseValidator> base,
                        output::Writer* writer = nullptr);

    /// Проверить текст правила (очистка ответа LLM выполняется внутри)
    ExtendedValidationResult validate(const std::string& rule_text) const;

private:
    std::shared_ptr<const rule::BaseValidator> base_;
    output::Writer* writer_;
};

// ============================================================================
// Таблицы и детекторы (общие с HuntabilityScorer)
// ============================================================================

/// Согласованные пары (category, product)
const std::vector<std::pair<std::string, std::string>>& telemetry_combinations();

/// Допустимые поля process_creation + windows
const std::vector<std::string>& process_creation_fields();

/// Поля, принимающие не более одного значения в событии
const std::vector<std::string>& single_value_fields();

/// Есть ли в строке IPv4 адрес
bool contains_ipv4(std::string_view value);

/// Доменные имена в строке. Токены с расширением файла (cmd.exe, a.ps1)
/// доменами не считаются.
std::vector<std::string> find_domains(std::string_view value);

/// Домен из списка заведомо безопасных (microsoft.com, example.com ...)
/// или его поддомен: update.microsoft.com - да, evilmicrosoft.com - нет.
bool is_benign_domain(std::string_view domain);

/// Непрерывные последовательности Base64 длиннее 40 символов (с '=' в конце)
std::vector<std::string> find_base64_blobs(std::string_view value);

/// Есть ли в строке JWT (eyJ....eyJ....подпись)
bool contains_jwt(std::string_view value);

}  // namespace sigmaeval::validate

#endif  // SIGMAEVAL_VALIDATOR_HPP
