// ==============================================================================
// condition.cpp - Разбор и анализ detection.condition
// ==============================================================================
//
// Рекурсивный спуск по списку токенов. Ошибки разбора возвращаются через
// ParseResult; исключения не используются.
//
// ==============================================================================

#include <algorithm>
#include <cctype>
#include <sigmaeval/condition.hpp>

namespace sigmaeval::condition {

// ============================================================================
// Токенизация
// ============================================================================

std::vector<std::string> tokenize(std::string_view condition) {
    auto pipe = condition.find(" | ");
    if (pipe != std::string_view::npos) {
        condition = condition.substr(0, pipe);
    }

    std::vector<std::string> tokens;
    std::string current;

    auto flush = [&]() {
        if (!current.empty()) {
            tokens.push_back(current);
            current.clear();
        }
    };

    for (char c : condition) {
        if (c == '(' || c == ')') {
            flush();
            tokens.emplace_back(1, c);
        } else if (std::isspace(static_cast<unsigned char>(c))) {
            flush();
        } else {
            current += c;
        }
    }
    flush();

    return tokens;
}

// ============================================================================
// Parser
// ============================================================================

namespace {

class Parser {
public:
    explicit Parser(std::vector<std::string> tokens) : tokens_(std::move(tokens)) {}

    ParseResult run() {
        ParseResult result;
        if (tokens_.empty()) {
            result.error = rule::Error{"empty condition", "condition"};
            return result;
        }

        Expr expr = parse_or();
        if (!error_.empty()) {
            result.error = rule::Error{error_, "condition"};
            return result;
        }
        if (pos_ < tokens_.size()) {
            result.error = rule::Error{"unexpected token '" + tokens_[pos_] + "'", "condition"};
            return result;
        }

        result.ok = true;
        result.expr = std::move(expr);
        return result;
    }

private:
    bool at_end() const { return pos_ >= tokens_.size(); }

    std::string peek_lower() const {
        return at_end() ? std::string() : rule::ascii_lowercase(tokens_[pos_]);
    }

    void fail(const std::string& message) {
        if (error_.empty()) {
            error_ = message;
        }
        pos_ = tokens_.size();
    }

    Expr parse_or() {
        Expr first = parse_and();
        if (peek_lower() != "or") {
            return first;
        }

        Expr group{Op::Or, "", {}};
        group.children.push_back(std::move(first));
        while (error_.empty() && peek_lower() == "or") {
            ++pos_;
            group.children.push_back(parse_and());
        }
        return group;
    }

    Expr parse_and() {
        Expr first = parse_not();
        if (peek_lower() != "and") {
            return first;
        }

        Expr group{Op::And, "", {}};
        group.children.push_back(std::move(first));
        while (error_.empty() && peek_lower() == "and") {
            ++pos_;
            group.children.push_back(parse_not());
        }
        return group;
    }

    Expr parse_not() {
        if (peek_lower() == "not") {
            ++pos_;
            Expr negated{Op::Not, "", {}};
            negated.children.push_back(parse_not());
            return negated;
        }
        return parse_primary();
    }

    Expr parse_primary() {
        if (at_end()) {
            fail("unexpected end of condition");
            return Expr{};
        }

        const std::string token = tokens_[pos_];
        const std::string lower = rule::ascii_lowercase(token);

        if (token == "(") {
            ++pos_;
            Expr inner = parse_or();
            if (peek_lower() != ")") {
                fail("missing closing parenthesis");
                return Expr{};
            }
            ++pos_;
            return inner;
        }

        if (token == ")") {
            fail("unexpected ')'");
            return Expr{};
        }

        if (lower == "and" || lower == "or" || lower == "of" || lower == "them") {
            fail("unexpected keyword '" + token + "'");
            return Expr{};
        }

        if (lower == "1" || lower == "all") {
            ++pos_;
            if (peek_lower() != "of") {
                fail("expected 'of' after '" + token + "'");
                return Expr{};
            }
            ++pos_;
            if (at_end() || tokens_[pos_] == "(" || tokens_[pos_] == ")") {
                fail("expected selection pattern after 'of'");
                return Expr{};
            }
            std::string target = tokens_[pos_++];
            if (rule::ascii_lowercase(target) == "them") {
                target = "them";
            }
            return Expr{lower == "1" ? Op::OneOf : Op::AllOf, target, {}};
        }

        ++pos_;
        return Expr::ref(token);
    }

    std::vector<std::string> tokens_;
    size_t pos_ = 0;
    std::string error_;
};

}  // namespace

ParseResult parse(std::string_view condition) {
    return Parser(tokenize(condition)).run();
}

std::string to_string(const Expr& expr) {
    switch (expr.op) {
    case Op::Ref:
        return expr.name;
    case Op::Not:
        return "not " + to_string(expr.children.front());
    case Op::OneOf:
        return "1 of " + expr.name;
    case Op::AllOf:
        return "all of " + expr.name;
    case Op::And:
    case Op::Or: {
        std::string result = "(";
        for (size_t i = 0; i < expr.children.size(); ++i) {
            if (i > 0) {
                result += expr.op == Op::And ? " and " : " or ";
            }
            result += to_string(expr.children[i]);
        }
        return result + ")";
    }
    }
    return "";
}

// ============================================================================
// Анализ
// ============================================================================

bool glob_match(std::string_view pattern, std::string_view name) {
    size_t p = 0;
    size_t n = 0;
    size_t star = std::string_view::npos;
    size_t mark = 0;

    while (n < name.size()) {
        if (p < pattern.size() && (pattern[p] == '?' || pattern[p] == name[n])) {
            ++p;
            ++n;
        } else if (p < pattern.size() && pattern[p] == '*') {
            star = p++;
            mark = n;
        } else if (star != std::string_view::npos) {
            p = star + 1;
            n = ++mark;
        } else {
            return false;
        }
    }

    while (p < pattern.size() && pattern[p] == '*') {
        ++p;
    }
    return p == pattern.size();
}

namespace {

std::vector<std::string> expand(const std::string& pattern,
                                const std::vector<std::string>& selections) {
    std::vector<std::string> matched;
    for (const auto& s : selections) {
        if (pattern == "them" || glob_match(pattern, s)) {
            matched.push_back(s);
        }
    }
    return matched;
}

void collect(const Expr& expr, const std::vector<std::string>& selections,
             std::vector<std::string>& known, std::vector<std::string>& unknown) {
    switch (expr.op) {
    case Op::Ref:
        if (std::find(selections.begin(), selections.end(), expr.name) != selections.end()) {
            known.push_back(expr.name);
        } else {
            unknown.push_back(expr.name);
        }
        break;
    case Op::OneOf:
    case Op::AllOf:
        for (auto& s : expand(expr.name, selections)) {
            known.push_back(std::move(s));
        }
        break;
    default:
        for (const auto& child : expr.children) {
            collect(child, selections, known, unknown);
        }
        break;
    }
}

}  // namespace

std::vector<std::string> references(const Expr& expr, const std::vector<std::string>& selections) {
    std::vector<std::string> known;
    std::vector<std::string> unknown;
    collect(expr, selections, known, unknown);

    std::vector<std::string> result;
    for (const auto& s : selections) {
        if (std::find(known.begin(), known.end(), s) != known.end()) {
            result.push_back(s);
        }
    }
    for (const auto& u : unknown) {
        if (std::find(result.begin(), result.end(), u) == result.end()) {
            result.push_back(u);
        }
    }
    return result;
}

bool evaluate(const Expr& expr, const std::vector<std::string>& selections,
              const std::unordered_map<std::string, bool>& values) {
    auto value_of = [&](const std::string& name) {
        auto it = values.find(name);
        return it != values.end() && it->second;
    };

    switch (expr.op) {
    case Op::Ref:
        return value_of(expr.name);
    case Op::Not:
        return !evaluate(expr.children.front(), selections, values);
    case Op::And:
        return std::all_of(expr.children.begin(), expr.children.end(),
                           [&](const Expr& c) { return evaluate(c, selections, values); });
    case Op::Or:
        return std::any_of(expr.children.begin(), expr.children.end(),
                           [&](const Expr& c) { return evaluate(c, selections, values); });
    case Op::OneOf: {
        auto matched = expand(expr.name, selections);
        return std::any_of(matched.begin(), matched.end(), value_of);
    }
    case Op::AllOf: {
        auto matched = expand(expr.name, selections);
        return !matched.empty() && std::all_of(matched.begin(), matched.end(), value_of);
    }
    }
    return false;
}

Analysis analyze(const Expr& expr, const std::vector<std::string>& selections) {
    Analysis analysis;
    analysis.variables = references(expr, selections);

    const size_t n = analysis.variables.size();
    if (n > MAX_ANALYSIS_VARIABLES) {
        return analysis;
    }

    bool any_true = false;
    bool any_false = false;
    std::unordered_map<std::string, bool> values;

    const size_t combinations = size_t{1} << n;
    for (size_t mask = 0; mask < combinations && !(any_true && any_false); ++mask) {
        for (size_t i = 0; i < n; ++i) {
            values[analysis.variables[i]] = ((mask >> i) & 1u) != 0;
        }
        if (evaluate(expr, selections, values)) {
            any_true = true;
        } else {
            any_false = true;
        }
    }

    analysis.evaluated = true;
    analysis.tautology = any_true && !any_false;
    analysis.unsatisfiable = any_false && !any_true;
    return analysis;
}

}  // namespace sigmaeval::condition
