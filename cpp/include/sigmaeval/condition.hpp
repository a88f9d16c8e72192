// ==============================================================================
// sigmaeval/condition.hpp - Разбор и анализ detection.condition
// ==============================================================================
//
// Грамматика (ключевые слова без учёта регистра):
//
//   or_expr   := and_expr ( "or" and_expr )*
//   and_expr  := not_expr ( "and" not_expr )*
//   not_expr  := "not" not_expr | primary
//   primary   := "(" or_expr ")" | ( "1" | "all" ) "of" target | IDENT
//   target    := "them" | IDENT        (IDENT может содержать * и ?)
//
// Часть после " | " (агрегация) отбрасывается.
//
// Анализ перебирает все наборы значений упомянутых селекций, каждая
// селекция трактуется как независимая булева переменная.
//
// ==============================================================================

#ifndef SIGMAEVAL_CONDITION_HPP
#define SIGMAEVAL_CONDITION_HPP

#include <sigmaeval/rule.hpp>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

namespace sigmaeval::condition {

// ============================================================================
// AST
// ============================================================================

enum class Op {
    Ref,    // ссылка на селекцию
    Not,    // not <child>
    And,    // <child> and <child> ...
    Or,     // <child> or <child> ...
    OneOf,  // 1 of <pattern>
    AllOf   // all of <pattern>
};

struct Expr {
    Op op = Op::Ref;
    std::string name;  // имя селекции (Ref) или шаблон (OneOf/AllOf), "them" = все
    std::vector<Expr> children;

    static Expr ref(std::string n) { return Expr{Op::Ref, std::move(n), {}}; }
};

struct ParseResult {
    bool ok = false;
    Expr expr;
    rule::Error error;

    explicit operator bool() const { return ok; }
};

/// Токены условия: "(", ")" и слова. Агрегация после " | " отбрасывается.
std::vector<std::string> tokenize(std::string_view condition);

/// Разобрать условие
ParseResult parse(std::string_view condition);

/// Вывести AST в каноническом виде (для отладки и тестов)
std::string to_string(const Expr& expr);

// ============================================================================
// Анализ
// ============================================================================

/// Сопоставление имени с шаблоном (* и ?), с учётом регистра
bool glob_match(std::string_view pattern, std::string_view name);

/// Селекции, на которые ссылается выражение (с раскрытием шаблонов и "them").
/// Порядок: порядок selections; неизвестные Ref добавляются в конец.
std::vector<std::string> references(const Expr& expr, const std::vector<std::string>& selections);

/// Вычислить выражение при заданных значениях селекций (отсутствующие = false)
bool evaluate(const Expr& expr, const std::vector<std::string>& selections,
              const std::unordered_map<std::string, bool>& values);

/// Максимальное число переменных для полного перебора
constexpr size_t MAX_ANALYSIS_VARIABLES = 16;

struct Analysis {
    bool evaluated = false;      // false если переменных больше лимита
    bool tautology = false;      // истинно при любых значениях
    bool unsatisfiable = false;  // ложно при любых значениях
    std::vector<std::string> variables;
};

/// Проверить выражение на тождественную истинность/ложность
Analysis analyze(const Expr& expr, const std::vector<std::string>& selections);

}  // namespace sigmaeval::condition

#endif  // SIGMAEVAL_CONDITION_HPP
