// ==============================================================================
// rule.cpp - Модель Sigma правила и базовая проверка грамматики
// ==============================================================================
//
// Разбор YAML выполняется через yaml-cpp. Исключения YAML::Exception не
// покидают модуль: parse() возвращает ParseResult, validate_base():
// BaseValidation.
//
// ==============================================================================

#include <algorithm>
#include <cctype>
#include <optional>
#include <sigmaeval/rule.hpp>
#include <sstream>

namespace sigmaeval::rule {

// ============================================================================
// Строковые помощники
// ============================================================================

std::string ascii_lowercase(std::string_view str) {
    std::string result(str);
    std::transform(result.begin(), result.end(), result.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return result;
}

std::string trim(std::string_view str) {
    const char* ws = " \t\r\n\f\v";
    size_t start = str.find_first_not_of(ws);
    if (start == std::string_view::npos) {
        return "";
    }
    size_t end = str.find_last_not_of(ws);
    return std::string(str.substr(start, end - start + 1));
}

// ============================================================================
// Error formatting
// ============================================================================

std::string Error::format() const {
    std::ostringstream oss;
    if (!context.empty()) {
        oss << context << ": ";
    }
    oss << message;
    return oss.str();
}

// ============================================================================
// Detection
// ============================================================================

const Selection* Detection::find(std::string_view name) const {
    for (const auto& s : selections) {
        if (s.name == name) {
            return &s;
        }
    }
    return nullptr;
}

std::vector<std::string> Detection::names() const {
    std::vector<std::string> result;
    result.reserve(selections.size());
    for (const auto& s : selections) {
        result.push_back(s.name);
    }
    return result;
}

// ============================================================================
// Разбор
// ============================================================================

namespace {

std::optional<std::string> scalar(const YAML::Node& node) {
    if (node && node.IsScalar()) {
        return node.as<std::string>();
    }
    return std::nullopt;
}

std::vector<std::string> scalar_list(const YAML::Node& node) {
    std::vector<std::string> result;
    if (!node) {
        return result;
    }
    if (node.IsScalar()) {
        result.push_back(node.as<std::string>());
    } else if (node.IsSequence()) {
        for (const auto& item : node) {
            if (item.IsScalar()) {
                result.push_back(item.as<std::string>());
            }
        }
    }
    return result;
}

// condition может быть строкой или списком строк (список = OR)
std::string parse_condition_node(const YAML::Node& node) {
    if (node.IsScalar()) {
        return node.as<std::string>();
    }
    if (node.IsSequence()) {
        std::string joined;
        for (const auto& item : node) {
            if (!item.IsScalar()) {
                continue;
            }
            if (!joined.empty()) {
                joined += " or ";
            }
            joined += "(" + item.as<std::string>() + ")";
        }
        return joined;
    }
    return "";
}

Detection parse_detection(const YAML::Node& node) {
    Detection d;
    if (!node || !node.IsMap()) {
        return d;
    }

    for (const auto& kv : node) {
        auto key = scalar(kv.first);
        if (!key) {
            continue;
        }
        if (*key == "condition") {
            d.condition = parse_condition_node(kv.second);
        } else if (*key == "timeframe") {
            d.timeframe = scalar(kv.second);
        } else {
            d.selections.push_back(Selection{*key, kv.second});
        }
    }

    return d;
}

}  // namespace

std::optional<YAML::Node> load_yaml(const std::string& text) {
    try {
        return YAML::Load(text);
    } catch (const YAML::Exception&) {
        return std::nullopt;
    }
}

ParseResult parse(const std::string& text) {
    ParseResult result;

    YAML::Node doc;
    try {
        doc = YAML::Load(text);
    } catch (const YAML::Exception& e) {
        result.error = Error{e.what(), "invalid YAML"};
        return result;
    }

    if (!doc.IsMap()) {
        result.error = Error{"rule must be a YAML mapping", "invalid structure"};
        return result;
    }

    try {
        Rule& r = result.rule;
        r.document = doc;
        r.title = scalar(doc["title"]).value_or("");
        r.id = scalar(doc["id"]);
        r.description = scalar(doc["description"]).value_or("");
        r.status = scalar(doc["status"]);
        r.author = scalar(doc["author"]);
        r.level = scalar(doc["level"]);
        r.tags = scalar_list(doc["tags"]);
        r.falsepositives = scalar_list(doc["falsepositives"]);

        const YAML::Node ls = doc["logsource"];
        if (ls && ls.IsMap()) {
            LogSource l;
            l.category = scalar(ls["category"]);
            l.product = scalar(ls["product"]);
            l.service = scalar(ls["service"]);
            l.definition = scalar(ls["definition"]);
            r.logsource = l;
        }

        r.detection = parse_detection(doc["detection"]);
    } catch (const YAML::Exception& e) {
        result.error = Error{e.what(), "invalid structure"};
        return result;
    }

    result.ok = true;
    return result;
}

// ============================================================================
// Очистка ответа LLM
// ============================================================================

namespace {

const std::vector<std::string> TOP_LEVEL_KEYS = {
    "title",     "id",    "description",    "status", "author",     "date",   "modified",
    "logsource", "detection", "falsepositives", "level",  "tags", "references", "fields"};

struct TextField {
    std::string indent;
    std::string key;
    std::string value;
};

bool is_space(char c) {
    return std::isspace(static_cast<unsigned char>(c)) != 0;
}

/// Строка вида "<отступ>title: <значение>" или "<отступ>description: <значение>"
std::optional<TextField> split_text_field(const std::string& line) {
    size_t pos = 0;
    while (pos < line.size() && is_space(line[pos])) {
        ++pos;
    }

    TextField field;
    field.indent = line.substr(0, pos);
    for (const char* key : {"title", "description"}) {
        std::string_view k(key);
        if (line.compare(pos, k.size(), k) == 0) {
            field.key = std::string(k);
            break;
        }
    }
    if (field.key.empty()) {
        return std::nullopt;
    }
    pos += field.key.size();

    while (pos < line.size() && is_space(line[pos])) {
        ++pos;
    }
    if (pos >= line.size() || line[pos] != ':') {
        return std::nullopt;
    }

    field.value = trim(std::string_view(line).substr(pos + 1));
    if (field.value.empty()) {
        return std::nullopt;
    }
    return field;
}

/// Тело первого блока ```yaml / ```yml / ``` с переводом строки после маркера
std::optional<std::string> fenced_block(const std::string& text) {
    static const std::string fence = "```";

    size_t pos = text.find(fence);
    while (pos != std::string::npos) {
        size_t cur = pos + fence.size();
        for (const char* tag : {"yaml", "yml"}) {
            std::string_view t(tag);
            if (text.compare(cur, t.size(), t) == 0) {
                cur += t.size();
                break;
            }
        }
        while (cur < text.size() && (text[cur] == ' ' || text[cur] == '\t')) {
            ++cur;
        }
        if (cur < text.size() && text[cur] == '\r') {
            ++cur;
        }
        if (cur < text.size() && text[cur] == '\n') {
            size_t body = cur + 1;
            size_t close = text.find(fence, body);
            if (close == std::string::npos) {
                return std::nullopt;
            }
            return text.substr(body, close - body);
        }
        pos = text.find(fence, pos + fence.size());
    }
    return std::nullopt;
}

bool is_quoted(const std::string& value) {
    return value.size() >= 2 && ((value.front() == '"' && value.back() == '"') ||
                                 (value.front() == '\'' && value.back() == '\''));
}

// title/description со спецсимволами YAML без кавычек ломают разбор
std::string quote_special_values(const std::string& text) {
    static const std::string special = "?:[]{}|&*#@`";

    std::istringstream in(text);
    std::ostringstream out;
    std::string line;
    bool first = true;

    while (std::getline(in, line)) {
        if (!first) {
            out << '\n';
        }
        first = false;

        auto parts = split_text_field(line);
        if (!parts) {
            out << line;
            continue;
        }

        const std::string& value = parts->value;
        bool block = value == "|" || value == ">" || value == "|-" || value == ">-" ||
                     value.front() == '[' || value.front() == '{' || value.front() == '-';
        bool has_special = value.find_first_of(special) != std::string::npos;
        if (is_quoted(value) || block || !has_special) {
            out << line;
            continue;
        }

        out << parts->indent << parts->key << ": ";
        if (value.find('"') != std::string::npos) {
            std::string escaped;
            for (char c : value) {
                escaped += c;
                if (c == '\'') {
                    escaped += '\'';
                }
            }
            out << '\'' << escaped << '\'';
        } else {
            out << '"' << value << '"';
        }
    }

    return out.str();
}

}  // namespace

std::string clean_rule_text(const std::string& text) {
    std::string cleaned = trim(text);

    // 1. Содержимое первого code block
    auto fenced = fenced_block(cleaned);
    if (fenced) {
        cleaned = trim(*fenced);
    } else {
        // 2. Пояснительный текст до первого ключа верхнего уровня
        std::istringstream in(cleaned);
        std::vector<std::string> lines;
        std::string line;
        while (std::getline(in, line)) {
            lines.push_back(line);
        }

        size_t start = lines.size();
        for (size_t i = 0; i < lines.size() && start == lines.size(); ++i) {
            std::string stripped = trim(lines[i]);
            auto colon = stripped.find(':');
            if (colon == std::string::npos) {
                continue;
            }
            std::string key = trim(stripped.substr(0, colon));
            if (std::find(TOP_LEVEL_KEYS.begin(), TOP_LEVEL_KEYS.end(), key) !=
                TOP_LEVEL_KEYS.end()) {
                start = i;
            }
        }

        if (start != lines.size() && start > 0) {
            std::string rest;
            for (size_t i = start; i < lines.size(); ++i) {
                if (i > start) {
                    rest += '\n';
                }
                rest += lines[i];
            }
            cleaned = rest;
        }
    }

    // 3. Оставшиеся маркеры
    for (const char* prefix : {"```yaml", "```yml", "```"}) {
        std::string_view p(prefix);
        if (cleaned.compare(0, p.size(), p) == 0) {
            cleaned = trim(cleaned.substr(p.size()));
            break;
        }
    }
    if (cleaned.size() >= 3 && cleaned.compare(cleaned.size() - 3, 3, "```") == 0) {
        cleaned = trim(cleaned.substr(0, cleaned.size() - 3));
    }

    // 4. Пробелы в конце строк
    std::istringstream in(cleaned);
    std::string line;
    std::string joined;
    bool first = true;
    while (std::getline(in, line)) {
        auto end = line.find_last_not_of(" \t\r");
        line = (end == std::string::npos) ? "" : line.substr(0, end + 1);
        if (!first) {
            joined += '\n';
        }
        joined += line;
        first = false;
    }

    return trim(quote_special_values(joined));
}

// ============================================================================
// Ключ селектора
// ============================================================================

bool FieldKey::has_modifier(std::string_view m) const {
    return std::find(modifiers.begin(), modifiers.end(), m) != modifiers.end();
}

FieldKey parse_field_key(std::string_view key) {
    FieldKey fk;
    std::string normalized(key);
    std::replace(normalized.begin(), normalized.end(), '=', '|');

    std::istringstream iss(normalized);
    std::string part;
    bool first = true;
    while (std::getline(iss, part, '|')) {
        if (first) {
            fk.field = trim(part);
            first = false;
        } else {
            std::string mod = ascii_lowercase(trim(part));
            if (!mod.empty()) {
                fk.modifiers.push_back(mod);
            }
        }
    }
    return fk;
}

// ============================================================================
// Базовая проверка грамматики
// ============================================================================

const std::vector<std::string>& known_categories() {
    static const std::vector<std::string> categories = {
        "process_creation", "process_access",     "file_access",     "file_change",
        "file_delete",      "file_rename",        "file_write",      "file_event",
        "network_connection", "dns_query",        "http_request",    "registry_access",
        "registry_change",  "registry_delete",    "registry_rename", "registry_event",
        "registry_set",     "registry_add",       "image_load",      "driver_load",
        "create_remote_thread", "pipe_created",   "ps_script",       "ps_module",
        "powershell",       "wmi",                "wmi_event",       "sysmon",
        "windows",          "linux",              "macos",           "proxy",
        "webserver",        "firewall",           "antivirus"};
    return categories;
}

const std::vector<std::string>& known_levels() {
    static const std::vector<std::string> levels = {"informational", "low", "medium", "high",
                                                    "critical"};
    return levels;
}

namespace {

bool contains(const std::vector<std::string>& haystack, const std::string& needle) {
    return std::find(haystack.begin(), haystack.end(), needle) != haystack.end();
}

bool valid_tag(const std::string& tag) {
    if (tag.empty()) {
        return false;
    }
    return std::all_of(tag.begin(), tag.end(), [](unsigned char c) {
        return std::isalnum(c) || c == '.' || c == '_' || c == '-';
    });
}

void check_detection(const YAML::Node& detection, BaseValidation& out) {
    if (!detection.IsMap()) {
        out.errors.push_back(
            "Detection must be a mapping. Example: detection: {selection: {CommandLine|contains: "
            "'malware'}, condition: selection}");
        return;
    }

    const YAML::Node condition = detection["condition"];
    if (!condition) {
        out.errors.push_back(
            "Detection must contain a 'condition' key. Example: condition: selection");
        return;
    }
    if (trim(parse_condition_node(condition)).empty()) {
        out.errors.push_back("Detection condition must be a non-empty string");
    }

    size_t selections = 0;
    for (const auto& kv : detection) {
        auto key = scalar(kv.first);
        if (!key) {
            out.errors.push_back("Detection keys must be strings");
            continue;
        }
        if (*key == "condition" || *key == "timeframe") {
            continue;
        }
        ++selections;
        const YAML::Node& body = kv.second;
        if (body.IsSequence()) {
            for (const auto& item : body) {
                if (!item.IsScalar() && !item.IsMap()) {
                    out.errors.push_back("Invalid search identifier in '" + *key + "'");
                    break;
                }
            }
        } else if (!body.IsMap() && !body.IsScalar()) {
            out.errors.push_back("Invalid selection '" + *key + "': must be list or mapping");
        }
    }

    if (selections == 0) {
        out.errors.push_back(
            "Detection must have at least one selection or filter (e.g., 'selection:', 'filter:')");
    }
}

void check_logsource(const YAML::Node& logsource, BaseValidation& out) {
    if (!logsource.IsMap()) {
        out.errors.push_back(
            "Logsource must be a mapping. Example: logsource: {category: process_creation, "
            "product: windows}");
        return;
    }
    if (logsource.size() == 0) {
        out.errors.push_back("Logsource section is empty");
        return;
    }

    if (!logsource["category"] && !logsource["product"] && !logsource["service"]) {
        out.warnings.push_back("Logsource should specify category, product, or service");
    }

    auto category = scalar(logsource["category"]);
    if (category && !contains(known_categories(), *category)) {
        out.errors.push_back("Invalid logsource category: " + *category);
    }
}

void check_metadata(const YAML::Node& doc, BaseValidation& out) {
    auto title = scalar(doc["title"]).value_or("");
    if (title.size() < 10) {
        out.warnings.push_back("Title is short (less than 10 characters)");
    } else if (title.size() > 200) {
        out.warnings.push_back("Title is very long (more than 200 characters)");
    }

    auto description = scalar(doc["description"]).value_or("");
    if (description.empty()) {
        out.warnings.push_back("Rule has no description");
    } else if (description.size() < 20) {
        out.warnings.push_back("Description is very short");
    }

    if (auto level = scalar(doc["level"])) {
        if (!contains(known_levels(), ascii_lowercase(*level))) {
            out.errors.push_back("Invalid level: " + *level +
                                 ". Must be one of: informational, low, medium, high, critical");
        }
    }

    if (auto status = scalar(doc["status"])) {
        static const std::vector<std::string> statuses = {"experimental", "test", "stable",
                                                          "deprecated", "unsupported"};
        if (!contains(statuses, *status)) {
            out.warnings.push_back("Unknown status: " + *status);
        }
    }

    const YAML::Node tags = doc["tags"];
    if (!tags || (tags.IsSequence() && tags.size() == 0)) {
        out.warnings.push_back("Rule has no tags");
    } else if (tags.IsSequence()) {
        for (const auto& tag : tags) {
            if (!tag.IsScalar()) {
                out.errors.push_back("Invalid tag format: tags must be simple strings");
            } else if (!valid_tag(tag.as<std::string>())) {
                out.warnings.push_back("Tag contains invalid special characters: " +
                                       tag.as<std::string>());
            }
        }
    } else {
        out.errors.push_back("Tags must be a list of strings");
    }
}

}  // namespace

BaseValidation GrammarValidator::validate_base(const std::string& rule_text) const {
    BaseValidation out;
    const std::string cleaned = clean_rule_text(rule_text);

    YAML::Node doc;
    try {
        doc = YAML::Load(cleaned);
    } catch (const YAML::Exception& e) {
        std::string preview = cleaned.size() > 200 ? cleaned.substr(0, 200) + "..." : cleaned;
        out.errors.push_back(std::string("Invalid YAML syntax: ") + e.what() +
                             "\n\nContent preview:\n" + preview);
        return out;
    }

    if (!doc || doc.IsNull()) {
        out.errors.push_back("Empty or invalid YAML content");
        return out;
    }
    if (!doc.IsMap()) {
        out.errors.push_back("Rule must be a YAML mapping");
        return out;
    }

    try {
        for (const char* field : {"title", "logsource", "detection"}) {
            if (!doc[field]) {
                out.errors.push_back(std::string("Missing required field: ") + field);
            }
        }
        if (!out.errors.empty()) {
            return out;
        }

        check_detection(doc["detection"], out);
        check_logsource(doc["logsource"], out);
        check_metadata(doc, out);
    } catch (const YAML::Exception& e) {
        out.errors.push_back(std::string("Invalid rule structure: ") + e.what());
    }

    out.is_valid = out.errors.empty();
    return out;
}

}  // namespace sigmaeval::rule
