// ==============================================================================
// fingerprint.cpp - Поведенческое ядро правила и его отпечаток
// ==============================================================================
//
// Обход detection:
// - селекция-mapping: каждый скалярный лист даёт "field=value", вложенные
//   mapping/sequence обходятся без добавления пути ключей
// - селекция-список скаляров (keywords): "keyword=value"
// - condition и timeframe пропускаются
//
// ==============================================================================

#include <algorithm>
#include <cctype>
#include <openssl/evp.h>
#include <set>
#include <sigmaeval/fingerprint.hpp>
#include <sigmaeval/rule.hpp>
#include <unordered_set>

namespace sigmaeval::fingerprint {

// ============================================================================
// Нормализация
// ============================================================================

namespace {

bool is_quote(char c) {
    return c == '"' || c == '\'';
}

// lowercase + схлопывание пробелов и '*' + trim + снятие внешних кавычек
std::string normalize_text(std::string_view text) {
    std::string out;
    out.reserve(text.size());

    bool in_space = false;
    bool prev_star = false;
    for (char c : text) {
        auto u = static_cast<unsigned char>(c);
        if (std::isspace(u)) {
            if (!in_space) {
                out += ' ';
            }
            in_space = true;
            prev_star = false;
            continue;
        }
        in_space = false;
        if (c == '*') {
            if (prev_star) {
                continue;
            }
            prev_star = true;
        } else {
            prev_star = false;
        }
        out += static_cast<char>(std::tolower(u));
    }

    std::string result = rule::trim(out);
    while (result.size() >= 2 && is_quote(result.front()) && result.back() == result.front()) {
        result = rule::trim(result.substr(1, result.size() - 2));
    }
    return result;
}

}  // namespace

std::string normalize_selector(std::string_view selector) {
    auto eq = selector.find('=');
    if (eq == std::string_view::npos) {
        return normalize_text(selector);
    }
    return normalize_text(selector.substr(0, eq)) + "=" + normalize_text(selector.substr(eq + 1));
}

std::string normalize_commandline(std::string_view commandline) {
    std::string unquoted;
    unquoted.reserve(commandline.size());
    for (char c : commandline) {
        if (!is_quote(c)) {
            unquoted += c;
        }
    }
    return normalize_text(unquoted);
}

std::string normalize_process_chain(std::string_view chain) {
    std::string slashed(chain);
    std::replace(slashed.begin(), slashed.end(), '\\', '/');
    return normalize_text(slashed);
}

std::string sha256_hex(std::string_view data) {
    unsigned char digest[EVP_MAX_MD_SIZE];
    unsigned int length = 0;

    if (EVP_Digest(data.data(), data.size(), digest, &length, EVP_sha256(), nullptr) != 1) {
        return "";
    }

    static const char* hex = "0123456789abcdef";
    std::string result;
    result.reserve(length * 2);
    for (unsigned int i = 0; i < length; ++i) {
        result += hex[digest[i] >> 4];
        result += hex[digest[i] & 0x0F];
    }
    return result;
}

// ============================================================================
// Обход detection
// ============================================================================

namespace {

struct Collected {
    std::vector<std::string> selectors;
    std::vector<std::string> commandlines;
    std::vector<std::string> chains;
};

bool is_value(const YAML::Node& node) {
    return node.IsScalar();
}

void collect_map(const YAML::Node& map, Collected& out);

void collect_value(const std::string& key, const YAML::Node& node, Collected& out) {
    if (is_value(node)) {
        out.selectors.push_back(key + "=" + node.Scalar());
    } else if (node.IsSequence()) {
        for (const auto& item : node) {
            collect_value(key, item, out);
        }
    } else if (node.IsMap()) {
        collect_map(node, out);
    }
}

void collect_commandlines(const YAML::Node& map, Collected& out) {
    for (const auto& kv : map) {
        if (!kv.first.IsScalar()) {
            continue;
        }
        const std::string key = rule::ascii_lowercase(kv.first.Scalar());
        const YAML::Node& value = kv.second;

        if (key.find("command") != std::string::npos) {
            if (is_value(value)) {
                out.commandlines.push_back(value.Scalar());
            } else if (value.IsSequence()) {
                for (const auto& item : value) {
                    if (is_value(item)) {
                        out.commandlines.push_back(item.Scalar());
                    }
                }
            }
        } else if (value.IsMap()) {
            collect_commandlines(value, out);
        } else if (value.IsSequence()) {
            for (const auto& item : value) {
                if (item.IsMap()) {
                    collect_commandlines(item, out);
                }
            }
        }
    }
}

// Image и ParentImage учитываются только в пределах одного mapping
void collect_chains(const YAML::Node& map, Collected& out) {
    std::string image;
    std::string parent;

    for (const auto& kv : map) {
        if (!kv.first.IsScalar() || !is_value(kv.second)) {
            continue;
        }
        const std::string key = rule::ascii_lowercase(kv.first.Scalar());
        if (key.find("image") != std::string::npos && key.find("parent") == std::string::npos) {
            image = kv.second.Scalar();
        } else if (key.find("parentimage") != std::string::npos ||
                   key.find("parent_image") != std::string::npos) {
            parent = kv.second.Scalar();
        }
    }

    if (!image.empty()) {
        out.chains.push_back(parent.empty() ? image : parent + " -> " + image);
    }

    for (const auto& kv : map) {
        const YAML::Node& value = kv.second;
        if (value.IsMap()) {
            collect_chains(value, out);
        } else if (value.IsSequence()) {
            for (const auto& item : value) {
                if (item.IsMap()) {
                    collect_chains(item, out);
                }
            }
        }
    }
}

void collect_map(const YAML::Node& map, Collected& out) {
    for (const auto& kv : map) {
        if (kv.first.IsScalar()) {
            collect_value(kv.first.Scalar(), kv.second, out);
        }
    }
}

void collect_selection(const YAML::Node& body, Collected& out) {
    if (body.IsMap()) {
        collect_map(body, out);
        collect_commandlines(body, out);
        collect_chains(body, out);
    } else if (body.IsSequence()) {
        for (const auto& item : body) {
            if (item.IsMap()) {
                collect_map(item, out);
                collect_commandlines(item, out);
                collect_chains(item, out);
            } else if (is_value(item)) {
                out.selectors.push_back("keyword=" + item.Scalar());
            }
        }
    } else if (is_value(body)) {
        out.selectors.push_back("keyword=" + body.Scalar());
    }
}

}  // namespace

BehavioralCore extract_behavioral_core(const std::string& rule_text) {
    BehavioralCore core;

    auto doc = rule::load_yaml(rule_text);
    if (!doc || !doc->IsMap()) {
        return core;
    }

    Collected collected;
    try {
        const YAML::Node detection = (*doc)["detection"];
        if (!detection || !detection.IsMap()) {
            return core;
        }

        for (const auto& kv : detection) {
            if (!kv.first.IsScalar()) {
                continue;
            }
            const std::string& name = kv.first.Scalar();
            if (name == "condition" || name == "timeframe") {
                continue;
            }
            collect_selection(kv.second, collected);
        }
    } catch (const YAML::Exception&) {
        return core;
    }

    std::unordered_set<std::string> seen;
    for (const auto& s : collected.selectors) {
        std::string normalized = normalize_selector(s);
        if (seen.insert(normalized).second) {
            core.behavior_selectors.push_back(std::move(normalized));
        }
    }
    for (const auto& c : collected.commandlines) {
        core.commandlines.push_back(normalize_commandline(c));
    }
    for (const auto& c : collected.chains) {
        core.process_chains.push_back(normalize_process_chain(c));
    }

    std::vector<std::string> sorted = core.behavior_selectors;
    std::sort(sorted.begin(), sorted.end());

    std::string canonical;
    for (size_t i = 0; i < sorted.size(); ++i) {
        if (i > 0) {
            canonical += '\n';
        }
        canonical += sorted[i];
    }

    core.core_hash = "sha256:" + sha256_hex(canonical);
    core.selector_count = core.behavior_selectors.size();
    return core;
}

CoreComparison compare_cores(const BehavioralCore& a, const BehavioralCore& b) {
    const std::set<std::string> first(a.behavior_selectors.begin(), a.behavior_selectors.end());
    const std::set<std::string> second(b.behavior_selectors.begin(), b.behavior_selectors.end());

    CoreComparison cmp;
    for (const auto& s : first) {
        if (second.count(s) != 0) {
            ++cmp.common_selectors;
        }
    }
    cmp.only_in_first = first.size() - cmp.common_selectors;
    cmp.only_in_second = second.size() - cmp.common_selectors;

    const size_t denominator = std::max<size_t>({first.size(), second.size(), 1});
    cmp.similarity = static_cast<double>(cmp.common_selectors) / static_cast<double>(denominator);
    cmp.hash_match = a.core_hash == b.core_hash;
    cmp.selector_count_diff = a.selector_count > b.selector_count
                                  ? a.selector_count - b.selector_count
                                  : b.selector_count - a.selector_count;
    return cmp;
}

}  // namespace sigmaeval::fingerprint
