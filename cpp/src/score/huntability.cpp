// ==============================================================================
// huntability.cpp - Оценка пригодности правила для охоты
// ==============================================================================

#include <algorithm>
#include <sigmaeval/huntability.hpp>
#include <sigmaeval/validator.hpp>
#include <vector>

namespace sigmaeval::huntability {

std::string_view risk_to_string(FalsePositiveRisk risk) {
    switch (risk) {
    case FalsePositiveRisk::Low:
        return "low";
    case FalsePositiveRisk::Medium:
        return "medium";
    case FalsePositiveRisk::High:
        return "high";
    }
    return "high";
}

namespace {

constexpr double WEIGHT_COMMANDLINE = 0.25;
constexpr double WEIGHT_TTP = 0.20;
constexpr double WEIGHT_PARENT_CHILD = 0.15;
constexpr double WEIGHT_TELEMETRY = 0.15;
constexpr double WEIGHT_OVERFITTING = 0.25;

bool key_contains(const YAML::Node& key, std::string_view needle) {
    return key.IsScalar() &&
           rule::ascii_lowercase(key.Scalar()).find(needle) != std::string::npos;
}

std::string without_wildcards(const std::string& value) {
    std::string result;
    for (char c : value) {
        if (c != '*') {
            result += c;
        }
    }
    return rule::trim(result);
}

// ----------------------------------------------------------------------------
// Command line
// ----------------------------------------------------------------------------

void find_commandlines(const YAML::Node& map, bool& found, std::vector<std::string>& values) {
    for (const auto& kv : map) {
        const YAML::Node& value = kv.second;
        if (key_contains(kv.first, "command")) {
            found = true;
            if (value.IsScalar()) {
                values.push_back(value.Scalar());
            } else if (value.IsSequence()) {
                for (const auto& item : value) {
                    if (item.IsScalar()) {
                        values.push_back(item.Scalar());
                    }
                }
            }
        } else if (value.IsMap()) {
            find_commandlines(value, found, values);
        } else if (value.IsSequence()) {
            for (const auto& item : value) {
                if (item.IsMap()) {
                    find_commandlines(item, found, values);
                }
            }
        }
    }
}

double score_commandline(const YAML::Node& detection) {
    bool found = false;
    std::vector<std::string> values;
    find_commandlines(detection, found, values);

    if (!found) {
        return 0.3;
    }
    if (values.empty()) {
        return 0.5;
    }

    size_t specific = 0;
    for (const auto& v : values) {
        if (v.find('*') == std::string::npos || without_wildcards(v).size() > 10) {
            ++specific;
        }
    }
    return static_cast<double>(specific) / static_cast<double>(values.size());
}

// ----------------------------------------------------------------------------
// TTP clarity
// ----------------------------------------------------------------------------

double score_ttp(const rule::Rule& r) {
    double score = 0.5;

    bool attack = std::any_of(r.tags.begin(), r.tags.end(), [](const std::string& t) {
        return rule::ascii_lowercase(t).find("attack.") != std::string::npos;
    });
    if (attack) {
        score += 0.3;
    }

    if (r.description.size() > 50) {
        score += 0.1;
    }
    const std::string description = rule::ascii_lowercase(r.description);
    if (description.find("ttp") != std::string::npos ||
        description.find("technique") != std::string::npos) {
        score += 0.1;
    }

    return std::min(1.0, score);
}

// ----------------------------------------------------------------------------
// Parent / child
// ----------------------------------------------------------------------------

void find_process_fields(const YAML::Node& map, bool& image, bool& parent) {
    for (const auto& kv : map) {
        if (key_contains(kv.first, "image") && !key_contains(kv.first, "parent")) {
            image = true;
        } else if (key_contains(kv.first, "parentimage") || key_contains(kv.first, "parent_image")) {
            parent = true;
        } else if (kv.second.IsMap()) {
            find_process_fields(kv.second, image, parent);
        } else if (kv.second.IsSequence()) {
            for (const auto& item : kv.second) {
                if (item.IsMap()) {
                    find_process_fields(item, image, parent);
                }
            }
        }
    }
}

double score_parent_child(const YAML::Node& detection) {
    bool image = false;
    bool parent = false;
    find_process_fields(detection, image, parent);

    double score = 0.5;
    if (image) {
        score += 0.3;
    }
    if (parent) {
        score += 0.2;
    }
    return std::min(1.0, score);
}

// ----------------------------------------------------------------------------
// Telemetry
// ----------------------------------------------------------------------------

double score_telemetry(const rule::Rule& r) {
    if (!r.logsource) {
        return 0.3;
    }
    const std::string category = r.logsource->category.value_or("");
    const std::string product = r.logsource->product.value_or("");

    static const std::vector<std::pair<std::string, std::string>> known = {
        {"process_creation", "windows"},
        {"process_creation", "linux"},
        {"network_connection", "windows"},
        {"registry_access", "windows"}};

    if (std::find(known.begin(), known.end(), std::make_pair(category, product)) != known.end()) {
        return 1.0;
    }
    if (!category.empty() && !product.empty()) {
        return 0.7;
    }
    if (!category.empty() || !product.empty()) {
        return 0.5;
    }
    return 0.3;
}

// ----------------------------------------------------------------------------
// False positive risk
// ----------------------------------------------------------------------------

bool bare_wildcard(const std::string& value) {
    const std::string t = rule::trim(value);
    return t == "*" || t == ".*";
}

void count_risk(const YAML::Node& map, int& factors) {
    for (const auto& kv : map) {
        const YAML::Node& value = kv.second;
        if (value.IsScalar()) {
            if (bare_wildcard(value.Scalar())) {
                factors += 2;
            }
            if (without_wildcards(value.Scalar()).size() < 3) {
                factors += 1;
            }
        } else if (value.IsMap()) {
            count_risk(value, factors);
        } else if (value.IsSequence()) {
            for (const auto& item : value) {
                if (item.IsScalar() && bare_wildcard(item.Scalar())) {
                    factors += 2;
                } else if (item.IsMap()) {
                    count_risk(item, factors);
                }
            }
        }
    }
}

FalsePositiveRisk assess_risk(const rule::Rule& r) {
    int factors = 0;
    for (const auto& s : r.detection.selections) {
        if (s.body.IsMap()) {
            count_risk(s.body, factors);
        } else if (s.body.IsSequence()) {
            for (const auto& item : s.body) {
                if (item.IsScalar() && bare_wildcard(item.Scalar())) {
                    factors += 2;
                } else if (item.IsMap()) {
                    count_risk(item, factors);
                }
            }
        } else if (s.body.IsScalar()) {
            if (bare_wildcard(s.body.Scalar())) {
                factors += 2;
            }
            if (without_wildcards(s.body.Scalar()).size() < 3) {
                factors += 1;
            }
        }
    }

    if (factors >= 3) {
        return FalsePositiveRisk::High;
    }
    if (factors >= 1) {
        return FalsePositiveRisk::Medium;
    }
    return FalsePositiveRisk::Low;
}

// ----------------------------------------------------------------------------
// Overfitting
// ----------------------------------------------------------------------------

void count_iocs(const YAML::Node& node, int& indicators) {
    if (node.IsScalar()) {
        const std::string& value = node.Scalar();
        if (validate::contains_ipv4(value)) {
            indicators += 2;
        }
        if (!validate::find_domains(value).empty()) {
            indicators += 1;
        }
    } else if (node.IsSequence()) {
        for (const auto& item : node) {
            count_iocs(item, indicators);
        }
    } else if (node.IsMap()) {
        for (const auto& kv : node) {
            count_iocs(kv.second, indicators);
        }
    }
}

double score_overfitting(const rule::Rule& r) {
    int indicators = 0;
    for (const auto& s : r.detection.selections) {
        count_iocs(s.body, indicators);
    }

    if (indicators == 0) {
        return 1.0;
    }
    if (indicators <= 1) {
        return 0.8;
    }
    if (indicators <= 2) {
        return 0.6;
    }
    return 0.3;
}

std::string coverage_notes(double cmd, double ttp, double pc, double telemetry,
                           FalsePositiveRisk risk) {
    std::vector<std::string> notes;
    if (cmd < 0.5) {
        notes.emplace_back("Low command-line specificity");
    }
    if (ttp < 0.5) {
        notes.emplace_back("Limited TTP clarity");
    }
    if (pc < 0.5) {
        notes.emplace_back("Weak parent/child process tracking");
    }
    if (telemetry < 0.7) {
        notes.emplace_back("Telemetry feasibility concerns");
    }
    if (risk == FalsePositiveRisk::High) {
        notes.emplace_back("High false-positive risk");
    }

    if (notes.empty()) {
        return "Good coverage across all categories";
    }

    std::string joined;
    for (size_t i = 0; i < notes.size(); ++i) {
        if (i > 0) {
            joined += "; ";
        }
        joined += notes[i];
    }
    return joined;
}

YAML::Node detection_node(const rule::Rule& r) {
    if (r.document && r.document.IsMap()) {
        const YAML::Node& doc = r.document;
        YAML::Node detection = doc["detection"];
        if (detection && detection.IsMap()) {
            return detection;
        }
    }
    return YAML::Node();
}

}  // namespace

HuntabilityScore score_rule(const rule::Rule& parsed) {
    HuntabilityScore result;

    const YAML::Node detection = detection_node(parsed);
    if (!detection.IsMap()) {
        result.coverage_notes = "No detection section";
        return result;
    }

    try {
        const double cmd = score_commandline(detection);
        const double ttp = score_ttp(parsed);
        const double pc = score_parent_child(detection);
        const double telemetry = score_telemetry(parsed);
        const FalsePositiveRisk risk = assess_risk(parsed);
        const double overfitting = score_overfitting(parsed);

        const double total = cmd * WEIGHT_COMMANDLINE + ttp * WEIGHT_TTP +
                             pc * WEIGHT_PARENT_CHILD + telemetry * WEIGHT_TELEMETRY +
                             overfitting * WEIGHT_OVERFITTING;

        result.score = std::clamp(total * 10.0, 0.0, 10.0);
        result.false_positive_risk = risk;
        result.coverage_notes = coverage_notes(cmd, ttp, pc, telemetry, risk);
        result.breakdown = {{"commandline_specificity", cmd * 10.0},
                            {"ttp_clarity", ttp * 10.0},
                            {"parent_child", pc * 10.0},
                            {"telemetry_feasibility", telemetry * 10.0},
                            {"overfitting", overfitting * 10.0}};
    } catch (const YAML::Exception&) {
        result = HuntabilityScore{};
        result.coverage_notes = "Invalid rule structure";
    }

    return result;
}

HuntabilityScore score_rule(const std::string& rule_text) {
    auto parsed = rule::parse(rule_text);
    if (!parsed) {
        HuntabilityScore result;
        result.coverage_notes = "Failed to parse rule";
        return result;
    }
    return score_rule(parsed.rule);
}

}  // namespace sigmaeval::huntability
