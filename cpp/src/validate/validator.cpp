// ==============================================================================
// validator.cpp - Расширенная структурная проверка правила
// ==============================================================================
//
// Расширенные проверки выполняются только после успешной базовой проверки.
// Неожиданная вложенность внутри detection делает проверку неприменимой
// (pass), но не ошибкой.
//
// ==============================================================================

#include <algorithm>
#include <cctype>
#include <iterator>
#include <regex>
#include <set>
#include <sigmaeval/condition.hpp>
#include <sigmaeval/output.hpp>
#include <sigmaeval/validator.hpp>

namespace sigmaeval::validate {

// ============================================================================
// Таблицы
// ============================================================================

const std::vector<std::pair<std::string, std::string>>& telemetry_combinations() {
    static const std::vector<std::pair<std::string, std::string>> combos = {
        {"process_creation", "windows"},   {"process_creation", "linux"},
        {"process_creation", "macos"},     {"network_connection", "windows"},
        {"network_connection", "linux"},   {"network_connection", "macos"},
        {"file_access", "windows"},        {"file_access", "linux"},
        {"file_access", "macos"},          {"registry_access", "windows"},
        {"registry_change", "windows"},    {"dns_query", "windows"},
        {"dns_query", "linux"},            {"dns_query", "macos"},
        {"powershell", "windows"},         {"wmi", "windows"}};
    return combos;
}

const std::vector<std::string>& process_creation_fields() {
    static const std::vector<std::string> fields = {
        "Image",     "ParentImage", "CommandLine",      "ParentCommandLine",
        "ProcessId", "ParentProcessId", "IntegrityLevel", "Hashes",
        "CurrentDirectory", "User", "LogonId"};
    return fields;
}

const std::vector<std::string>& single_value_fields() {
    static const std::vector<std::string> fields = {
        "Image", "ParentImage", "ProcessId", "ParentProcessId",
        "User",  "LogonId",     "CurrentDirectory", "IntegrityLevel"};
    return fields;
}

// ============================================================================
// Детекторы IOC
// ============================================================================

namespace {

const std::regex& ipv4_re() {
    static const std::regex re(R"(\b(?:\d{1,3}\.){3}\d{1,3}\b)");
    return re;
}

const std::regex& domain_re() {
    static const std::regex re(
        R"(\b(?:[a-zA-Z0-9](?:[a-zA-Z0-9\-]{0,61}[a-zA-Z0-9])?\.)+[a-zA-Z]{2,}\b)");
    return re;
}

const std::regex& guid_re() {
    static const std::regex re(
        R"([0-9a-fA-F]{8}-[0-9a-fA-F]{4}-[0-9a-fA-F]{4}-[0-9a-fA-F]{4}-[0-9a-fA-F]{12})");
    return re;
}

bool is_base64_char(char c) {
    return std::isalnum(static_cast<unsigned char>(c)) != 0 || c == '+' || c == '/';
}

bool is_base64url_char(char c) {
    return std::isalnum(static_cast<unsigned char>(c)) != 0 || c == '_' || c == '-';
}

bool is_domain_token_char(char c) {
    return std::isalnum(static_cast<unsigned char>(c)) != 0 || c == '.' || c == '-' || c == '_';
}

// Доменное имя не длиннее 253 символов; более длинные токены не проверяются
constexpr size_t MAX_DOMAIN_TOKEN = 4096;

// Расширения файлов, которые не являются TLD на практике.
// "com" сюда не входит: evil.com - домен.
const std::set<std::string>& file_extensions() {
    static const std::set<std::string> ext = {
        "exe",  "dll", "sys",  "drv",  "ocx", "cpl", "scr",  "msi",  "msp", "ps1",
        "psm1", "psd1", "bat", "cmd",  "vbs", "vbe", "js",   "jse",  "wsf", "wsh",
        "hta",  "lnk", "inf",  "reg",  "jar", "py",  "sh",   "pl",   "rb",  "zip",
        "rar",  "cab", "iso",  "img",  "vhd", "vhdx", "tmp", "log",  "txt", "dat",
        "ini",  "xml", "json", "yml",  "yaml", "doc", "docx", "docm", "xls", "xlsx",
        "xlsm", "ppt", "pptx", "pdf",  "rtf", "csv", "png",  "jpg",  "gif", "etl",
        "evtx", "db",  "sqlite", "config", "aspx", "asp", "php", "jsp", "html", "htm"};
    return ext;
}

}  // namespace

bool contains_ipv4(std::string_view value) {
    return std::regex_search(value.begin(), value.end(), ipv4_re());
}

std::vector<std::string> find_domains(std::string_view value) {
    std::vector<std::string> domains;

    size_t pos = 0;
    while (pos < value.size()) {
        if (!is_domain_token_char(value[pos])) {
            ++pos;
            continue;
        }
        size_t end = pos;
        while (end < value.size() && is_domain_token_char(value[end])) {
            ++end;
        }
        if (end - pos > MAX_DOMAIN_TOKEN) {
            pos = end;
            continue;
        }

        const std::string token(value.substr(pos, end - pos));
        for (auto it = std::sregex_iterator(token.begin(), token.end(), domain_re());
             it != std::sregex_iterator(); ++it) {
            std::string match = it->str();
            auto dot = match.rfind('.');
            std::string tld = rule::ascii_lowercase(match.substr(dot + 1));
            if (file_extensions().count(tld) == 0) {
                domains.push_back(std::move(match));
            }
        }
        pos = end;
    }
    return domains;
}

std::vector<std::string> find_base64_blobs(std::string_view value) {
    std::vector<std::string> blobs;

    size_t pos = 0;
    while (pos < value.size()) {
        if (!is_base64_char(value[pos])) {
            ++pos;
            continue;
        }
        size_t end = pos;
        while (end < value.size() && is_base64_char(value[end])) {
            ++end;
        }
        if (end - pos >= 40) {
            size_t padded = end;
            while (padded < value.size() && padded - end < 2 && value[padded] == '=') {
                ++padded;
            }
            if (padded - pos > 40) {
                blobs.emplace_back(value.substr(pos, padded - pos));
            }
            end = padded;
        }
        pos = end;
    }
    return blobs;
}

bool contains_jwt(std::string_view value) {
    // eyJ<b64url>.eyJ<b64url>.<b64url>
    auto segment_end = [&](size_t from) {
        size_t end = from;
        while (end < value.size() && is_base64url_char(value[end])) {
            ++end;
        }
        return end;
    };

    size_t pos = value.find("eyJ");
    while (pos != std::string_view::npos) {
        size_t header = segment_end(pos + 3);
        if (header > pos + 3 && header < value.size() && value[header] == '.' &&
            value.compare(header + 1, 3, "eyJ") == 0) {
            size_t payload = segment_end(header + 4);
            if (payload > header + 4 && payload < value.size() && value[payload] == '.' &&
                segment_end(payload + 1) > payload + 1) {
                return true;
            }
        }
        pos = value.find("eyJ", pos + 1);
    }
    return false;
}

bool is_benign_domain(std::string_view domain) {
    static const std::set<std::string> benign = {"microsoft.com", "windows.com", "example.com",
                                                 "test.com"};
    const std::string lowered = rule::ascii_lowercase(domain);
    for (const auto& name : benign) {
        if (lowered == name) {
            return true;
        }
        if (lowered.size() > name.size() &&
            lowered.compare(lowered.size() - name.size(), name.size(), name) == 0 &&
            lowered[lowered.size() - name.size() - 1] == '.') {
            return true;
        }
    }
    return false;
}

// ============================================================================
// Обход листьев detection
// ============================================================================

namespace {

/// Строковый лист detection с путём и модификаторами ключа
struct Leaf {
    std::string path;
    std::string value;
    std::vector<std::string> modifiers;
};

void collect_leaves(const YAML::Node& node, const std::string& path,
                    const std::vector<std::string>& modifiers, std::vector<Leaf>& out) {
    if (node.IsScalar()) {
        out.push_back(Leaf{path, node.Scalar(), modifiers});
    } else if (node.IsSequence()) {
        size_t i = 0;
        for (const auto& item : node) {
            collect_leaves(item, path + "[" + std::to_string(i++) + "]", modifiers, out);
        }
    } else if (node.IsMap()) {
        for (const auto& kv : node) {
            if (!kv.first.IsScalar()) {
                continue;
            }
            const std::string& key = kv.first.Scalar();
            collect_leaves(kv.second, path + "." + key, rule::parse_field_key(key).modifiers,
                           out);
        }
    }
}

std::vector<Leaf> detection_leaves(const rule::Detection& detection) {
    std::vector<Leaf> leaves;
    for (const auto& s : detection.selections) {
        collect_leaves(s.body, "detection." + s.name, {}, leaves);
    }
    return leaves;
}

bool contains(const std::vector<std::string>& haystack, std::string_view needle) {
    return std::find(haystack.begin(), haystack.end(), needle) != haystack.end();
}

// ============================================================================
// Telemetry feasibility
// ============================================================================

bool check_telemetry(const rule::Rule& r, std::vector<std::string>& errors,
                     std::vector<std::string>& warnings) {
    std::string category;
    std::string product;
    if (r.logsource) {
        category = r.logsource->category.value_or("");
        product = r.logsource->product.value_or("");
    }

    if (category.empty() && product.empty()) {
        warnings.push_back("Logsource has no category or product");
        return true;
    }
    if (category.empty() || product.empty()) {
        return true;
    }

    const auto& combos = telemetry_combinations();
    if (std::find(combos.begin(), combos.end(), std::make_pair(category, product)) !=
        combos.end()) {
        return true;
    }

    // Категории, существующие только в телеметрии Windows
    if (product != "windows") {
        if (category.rfind("registry_", 0) == 0) {
            errors.push_back("Registry logsource requires Windows product, got " + product);
            return false;
        }
        static const std::set<std::string> windows_only = {
            "powershell", "ps_script", "ps_module", "wmi", "wmi_event", "create_remote_thread",
            "pipe_created", "sysmon"};
        if (windows_only.count(category) != 0) {
            errors.push_back("Invalid logsource combination: " + category + " + " + product);
            return false;
        }
    }

    return true;
}

// ============================================================================
// Condition graph
// ============================================================================

bool is_condition_keyword(const std::string& lower) {
    static const std::set<std::string> keywords = {"and", "or", "not", "1", "all", "of", "them"};
    return keywords.count(lower) != 0;
}

bool identifier_like(const std::string& word) {
    return !word.empty() && std::all_of(word.begin(), word.end(), [](unsigned char c) {
        return std::isalnum(c) || c == '_';
    });
}

bool check_condition(const rule::Rule& r, std::vector<std::string>& errors,
                     std::vector<std::string>& warnings) {
    const rule::Detection& detection = r.detection;
    const std::vector<std::string> names = detection.names();
    const std::string& cond = detection.condition;

    if (rule::trim(cond).empty()) {
        errors.push_back("Missing detection condition");
        return false;
    }

    std::set<std::string> referenced;
    std::vector<std::string> unknown;
    for (const auto& token : condition::tokenize(cond)) {
        std::string word = token;
        word.erase(0, word.find_first_not_of("()|&!"));
        auto last = word.find_last_not_of("()|&!");
        word.erase(last == std::string::npos ? 0 : last + 1);
        if (word.empty()) {
            continue;
        }

        const std::string lower = rule::ascii_lowercase(word);
        if (lower == "them") {
            referenced.insert(names.begin(), names.end());
            continue;
        }
        if (is_condition_keyword(lower)) {
            continue;
        }

        if (word.find_first_of("*?") != std::string::npos) {
            for (const auto& n : names) {
                if (condition::glob_match(word, n)) {
                    referenced.insert(n);
                }
            }
            continue;
        }

        if (contains(names, word)) {
            referenced.insert(word);
        } else if (identifier_like(word) && !contains(unknown, word)) {
            unknown.push_back(word);
        }
    }

    std::string unused;
    for (const auto& n : names) {
        if (referenced.count(n) == 0) {
            unused += unused.empty() ? n : ", " + n;
        }
    }
    if (!unused.empty()) {
        warnings.push_back("Unused selections: " + unused);
    }
    for (const auto& u : unknown) {
        warnings.push_back("Condition references '" + u + "' which may not exist");
    }

    // Буквальная форма "X or not X"
    bool always_true = false;
    const std::string lower = rule::ascii_lowercase(cond);
    const std::string sep = " or not ";
    auto pos = lower.find(sep);
    if (pos != std::string::npos && lower.find(sep, pos + 1) == std::string::npos) {
        always_true = rule::trim(lower.substr(0, pos)) == rule::trim(lower.substr(pos + sep.size()));
    }

    // Полный разбор: тождества вида "(a or not a) and b" и противоречия
    auto parsed = condition::parse(cond);
    if (parsed) {
        auto analysis = condition::analyze(parsed.expr, names);
        if (analysis.evaluated && analysis.tautology) {
            always_true = true;
        } else if (analysis.evaluated && analysis.unsatisfiable) {
            warnings.push_back("Condition can never be true");
        }
    }

    if (always_true) {
        errors.push_back("Condition is always true (selection or not selection)");
        return false;
    }
    return true;
}

// ============================================================================
// Impossible selection
// ============================================================================

enum class MatchKind { Equals, EndsWith, StartsWith };

struct Constraint {
    MatchKind kind;
    std::vector<std::string> values;  // любое из значений (OR)
};

bool ends_with(const std::string& s, const std::string& suffix) {
    return s.size() >= suffix.size() &&
           s.compare(s.size() - suffix.size(), suffix.size(), suffix) == 0;
}

bool starts_with(const std::string& s, const std::string& prefix) {
    return s.compare(0, prefix.size(), prefix) == 0;
}

bool has_wildcard(const std::string& s) {
    return s.find_first_of("*?") != std::string::npos;
}

// Могут ли два значения одновременно описывать одно значение поля
bool compatible_values(MatchKind ka, const std::string& a, MatchKind kb, const std::string& b) {
    if (has_wildcard(a) || has_wildcard(b)) {
        return true;
    }
    if (ka == MatchKind::Equals && kb == MatchKind::Equals) {
        return a == b;
    }
    if (ka == MatchKind::Equals) {
        return kb == MatchKind::EndsWith ? ends_with(a, b) : starts_with(a, b);
    }
    if (kb == MatchKind::Equals) {
        return compatible_values(kb, b, ka, a);
    }
    if (ka != kb) {
        return true;  // startswith + endswith совместимы всегда
    }
    if (ka == MatchKind::EndsWith) {
        return ends_with(a, b) || ends_with(b, a);
    }
    return starts_with(a, b) || starts_with(b, a);
}

bool compatible(const Constraint& a, const Constraint& b) {
    for (const auto& va : a.values) {
        for (const auto& vb : b.values) {
            if (compatible_values(a.kind, va, b.kind, vb)) {
                return true;
            }
        }
    }
    return false;
}

std::string canonical_single_value_field(const std::string& field) {
    const std::string lower = rule::ascii_lowercase(rule::trim(field));
    for (const auto& f : single_value_fields()) {
        if (rule::ascii_lowercase(f) == lower) {
            return f;
        }
    }
    return "";
}

std::vector<std::string> constraint_values(const YAML::Node& node) {
    std::vector<std::string> values;
    if (node.IsScalar()) {
        values.push_back(rule::ascii_lowercase(rule::trim(node.Scalar())));
    } else if (node.IsSequence()) {
        for (const auto& item : node) {
            if (item.IsScalar()) {
                values.push_back(rule::ascii_lowercase(rule::trim(item.Scalar())));
            }
        }
    }
    return values;
}

// Первое поле с несовместимыми ограничениями в одном блоке или ""
std::string impossible_field(const YAML::Node& block) {
    std::vector<std::pair<std::string, std::vector<Constraint>>> by_field;

    for (const auto& kv : block) {
        if (!kv.first.IsScalar()) {
            continue;
        }
        const rule::FieldKey key = rule::parse_field_key(kv.first.Scalar());
        const std::string field = canonical_single_value_field(key.field);
        if (field.empty()) {
            continue;
        }

        const std::string mod = key.modifiers.empty() ? "" : key.modifiers.front();
        MatchKind kind;
        if (mod.empty() || mod == "all") {
            kind = MatchKind::Equals;
        } else if (mod == "endswith") {
            kind = MatchKind::EndsWith;
        } else if (mod == "startswith") {
            kind = MatchKind::StartsWith;
        } else {
            continue;  // contains, re ... могут сосуществовать
        }

        std::vector<std::string> values = constraint_values(kv.second);
        if (values.empty()) {
            continue;
        }

        auto it = std::find_if(by_field.begin(), by_field.end(),
                               [&](const auto& entry) { return entry.first == field; });
        if (it == by_field.end()) {
            by_field.emplace_back(field, std::vector<Constraint>{});
            it = std::prev(by_field.end());
        }

        // |all: каждое значение - отдельное ограничение (AND)
        if (key.has_modifier("all")) {
            for (auto& v : values) {
                it->second.push_back(Constraint{kind, {std::move(v)}});
            }
        } else {
            it->second.push_back(Constraint{kind, std::move(values)});
        }
    }

    for (const auto& [field, constraints] : by_field) {
        for (size_t i = 0; i < constraints.size(); ++i) {
            for (size_t j = i + 1; j < constraints.size(); ++j) {
                if (!compatible(constraints[i], constraints[j])) {
                    return field;
                }
            }
        }
    }
    return "";
}

bool check_selections(const rule::Rule& r, std::vector<std::string>& errors) {
    for (const auto& s : r.detection.selections) {
        std::vector<YAML::Node> blocks;
        if (s.body.IsMap()) {
            blocks.push_back(s.body);
        } else if (s.body.IsSequence()) {
            for (const auto& item : s.body) {
                if (item.IsMap()) {
                    blocks.push_back(item);
                }
            }
        }

        for (const auto& block : blocks) {
            std::string field = impossible_field(block);
            if (!field.empty()) {
                errors.push_back("Selection requires field " + field +
                                 " to match multiple incompatible values (never true)");
                return false;
            }
        }
    }
    return true;
}

// ============================================================================
// Pattern safety
// ============================================================================

bool check_patterns(const std::vector<Leaf>& leaves, std::vector<std::string>& errors,
                    std::vector<std::string>& warnings) {
    bool safe = true;

    for (const auto& leaf : leaves) {
        const std::string& value = leaf.value;

        for (const auto& blob : find_base64_blobs(value)) {
            errors.push_back(leaf.path + ": Base64 blob detected (>40 chars): " +
                             blob.substr(0, 50) + "...");
            safe = false;
        }

        const std::string trimmed = rule::trim(value);
        if (trimmed == "*" || trimmed == ".*") {
            errors.push_back(leaf.path + ": Unanchored wildcard pattern");
            safe = false;
        } else if (value.find("(.*|.+)") != std::string::npos) {
            errors.push_back(leaf.path + ": Dangerous regex pattern (.*|.+) detected");
            safe = false;
        }

        const bool is_regex = contains(leaf.modifiers, "re") || contains(leaf.modifiers, "regex");
        if (!is_regex) {
            continue;
        }
        if (value.find('\n') != std::string::npos) {
            errors.push_back(leaf.path + ": Multi-line regex detected");
            safe = false;
        }
        const bool nocase = value.find("(?i)") != std::string::npos ||
                            contains(leaf.modifiers, "i") || contains(leaf.modifiers, "nocase");
        if (!nocase) {
            warnings.push_back(leaf.path + ": Case-sensitive regex - consider adding |i");
        }
    }

    return safe;
}

// ============================================================================
// IOC leakage
// ============================================================================

bool check_iocs(const std::vector<Leaf>& leaves, std::vector<std::string>& errors,
                std::vector<std::string>& warnings) {
    bool leaked = false;

    for (const auto& leaf : leaves) {
        const std::string& value = leaf.value;

        if (contains_ipv4(value)) {
            errors.push_back(leaf.path + ": IP address detected (IOC leakage)");
            leaked = true;
        }

        for (const auto& domain : find_domains(value)) {
            if (!is_benign_domain(domain)) {
                errors.push_back(leaf.path + ": Domain detected (IOC leakage): " + domain);
                leaked = true;
            }
        }

        if (contains_jwt(value)) {
            errors.push_back(leaf.path + ": JWT token detected (IOC leakage)");
            leaked = true;
        }

        for (auto it = std::sregex_iterator(value.begin(), value.end(), guid_re());
             it != std::sregex_iterator(); ++it) {
            const std::string guid = rule::ascii_lowercase(it->str());
            if (guid != "00000000-0000-0000-0000-000000000000" &&
                guid != "ffffffff-ffff-ffff-ffff-ffffffffffff") {
                warnings.push_back(leaf.path + ": GUID detected (may be IOC): " + it->str());
            }
        }
    }

    return leaked;
}

// ============================================================================
// Field conformance
// ============================================================================

void collect_invalid_fields(const YAML::Node& node, const std::string& path,
                            std::vector<std::string>& invalid) {
    if (node.IsSequence()) {
        size_t i = 0;
        for (const auto& item : node) {
            collect_invalid_fields(item, path + "[" + std::to_string(i++) + "]", invalid);
        }
        return;
    }
    if (!node.IsMap()) {
        return;
    }

    for (const auto& kv : node) {
        if (!kv.first.IsScalar()) {
            continue;
        }
        const std::string& key = kv.first.Scalar();
        const std::string field = rule::parse_field_key(key).field;
        if (!contains(process_creation_fields(), field)) {
            invalid.push_back(path + "." + key + " (field: " + field + ")");
        }
        if (kv.second.IsMap() || kv.second.IsSequence()) {
            collect_invalid_fields(kv.second, path + "." + key, invalid);
        }
    }
}

bool check_fields(const rule::Rule& r, std::vector<std::string>& errors) {
    if (!r.logsource || r.logsource->category.value_or("") != "process_creation" ||
        r.logsource->product.value_or("") != "windows") {
        return true;
    }

    std::vector<std::string> invalid;
    for (const auto& s : r.detection.selections) {
        collect_invalid_fields(s.body, "detection." + s.name, invalid);
    }

    if (invalid.empty()) {
        return true;
    }

    std::string joined;
    for (const auto& f : invalid) {
        joined += joined.empty() ? f : ", " + f;
    }
    errors.push_back("Invalid fields for Windows process_creation: " + joined);
    return false;
}

}  // namespace

// ============================================================================
// StructuralValidator
// ============================================================================

StructuralValidator::StructuralValidator(output::Writer* writer)
    : base_(std::make_shared<rule::GrammarValidator>()), writer_(writer) {}

StructuralValidator::StructuralValidator(std::shared_ptr<const rule::BaseValidator> base,
                                         output::Writer* writer)
    : base_(base ? std::move(base) : std::make_shared<rule::GrammarValidator>()),
      writer_(writer) {}

ExtendedValidationResult StructuralValidator::validate(const std::string& rule_text) const {
    ExtendedValidationResult result;

    const std::string cleaned = rule::clean_rule_text(rule_text);

    // 1. Жёсткий шлюз
    const rule::BaseValidation base = base_->validate_base(cleaned);
    if (!base.is_valid) {
        result.base_errors = base.errors;
        result.errors = base.errors;
        if (writer_) {
            writer_->debug("Base grammar check failed with " + std::to_string(base.errors.size()) +
                           " error(s)");
        }
        return result;
    }

    auto parsed = rule::parse(cleaned);
    if (!parsed) {
        result.base_grammar_passed = true;
        result.errors.push_back("Rule could not be parsed: " + parsed.error.format());
        return result;
    }
    const rule::Rule& r = parsed.rule;

    result.base_grammar_passed = true;
    result.warnings = base.warnings;

    // 2. Расширенные проверки
    const std::vector<Leaf> leaves = detection_leaves(r.detection);

    result.telemetry_feasible = check_telemetry(r, result.errors, result.warnings);
    result.condition_valid = check_condition(r, result.errors, result.warnings);
    result.pattern_safe = check_patterns(leaves, result.errors, result.warnings);
    result.ioc_leakage = check_iocs(leaves, result.errors, result.warnings);
    result.field_conformance = check_fields(r, result.errors);
    result.selection_feasible = check_selections(r, result.errors);

    result.final_pass = result.base_grammar_passed && result.telemetry_feasible &&
                        result.condition_valid && result.pattern_safe && !result.ioc_leakage &&
                        result.field_conformance && result.selection_feasible;

    if (writer_) {
        writer_->debug("Structural validation of '" + r.title + "': " +
                       (result.final_pass ? "pass" : "fail") + " (" +
                       std::to_string(result.errors.size()) + " error(s), " +
                       std::to_string(result.warnings.size()) + " warning(s))");
    }

    return result;
}

}  // namespace sigmaeval::validate
