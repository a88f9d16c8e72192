// ==============================================================================
// semantic.cpp - Семантическое сравнение правила с эталоном
// ==============================================================================

#include <algorithm>
#include <cmath>
#include <rapidjson/document.h>
#include <rapidjson/stringbuffer.h>
#include <rapidjson/writer.h>
#include <sigmaeval/output.hpp>
#include <sigmaeval/semantic.hpp>

namespace sigmaeval::semantic {

std::string_view method_to_string(Method method) {
    switch (method) {
    case Method::Judge:
        return "judge";
    case Method::Embedding:
        return "embedding";
    case Method::Neutral:
        return "neutral";
    }
    return "neutral";
}

SemanticComparisonResult neutral_result() {
    SemanticComparisonResult result;
    result.similarity_score = 0.5;
    result.method = Method::Neutral;
    result.degraded = true;
    return result;
}

// ============================================================================
// Разбор ответа судьи
// ============================================================================

std::string build_judge_prompt(const std::string& generated, const std::string& reference) {
    std::string prompt;
    prompt += "You are evaluating SIGMA detection rules. Compare the generated rule against the "
              "reference rule.\n\n";
    prompt += "Reference Rule:\n```yaml\n" + reference + "\n```\n\n";
    prompt += "Generated Rule:\n```yaml\n" + generated + "\n```\n\n";
    prompt += "Evaluate:\n"
              "1. Does the generated rule detect the same behaviors as the reference?\n"
              "2. Are any behaviors missing from the generated rule?\n"
              "3. Are any irrelevant behaviors added to the generated rule?\n"
              "4. Is there overfitting (IOC-based logic)?\n"
              "5. Are there false-positive amplifiers?\n\n";
    prompt += "Respond in JSON format:\n"
              "{\n"
              "    \"similarity_score\": 0.0-1.0,\n"
              "    \"missing_behaviors\": [\"behavior1\", \"behavior2\"],\n"
              "    \"extraneous_behaviors\": [\"behavior1\", \"behavior2\"],\n"
              "    \"overfitting_detected\": true/false,\n"
              "    \"fp_risk\": \"low/medium/high\",\n"
              "    \"explanation\": \"brief explanation\"\n"
              "}\n";
    return prompt;
}

std::optional<std::string> extract_json_object(std::string_view text) {
    size_t start = text.find('{');
    while (start != std::string_view::npos) {
        int depth = 0;
        bool in_string = false;
        bool escaped = false;

        for (size_t i = start; i < text.size(); ++i) {
            char c = text[i];
            if (in_string) {
                if (escaped) {
                    escaped = false;
                } else if (c == '\\') {
                    escaped = true;
                } else if (c == '"') {
                    in_string = false;
                }
                continue;
            }

            if (c == '"') {
                in_string = true;
            } else if (c == '{') {
                ++depth;
            } else if (c == '}') {
                if (--depth == 0) {
                    return std::string(text.substr(start, i - start + 1));
                }
            }
        }

        // Несбалансированный фрагмент: пробуем следующую '{'
        start = text.find('{', start + 1);
    }
    return std::nullopt;
}

namespace {

std::string value_to_string(const rapidjson::Value& v) {
    if (v.IsString()) {
        return std::string(v.GetString(), v.GetStringLength());
    }
    rapidjson::StringBuffer buffer;
    rapidjson::Writer<rapidjson::StringBuffer> writer(buffer);
    v.Accept(writer);
    return std::string(buffer.GetString(), buffer.GetSize());
}

constexpr double MAX_BEHAVIOR_COUNT = 1000000.0;

/// Список поведений: массив (детали) или число (только количество)
void read_behaviors(const rapidjson::Value& obj, const char* key, size_t& count,
                    std::vector<std::string>& details) {
    auto it = obj.FindMember(key);
    if (it == obj.MemberEnd() || it->value.IsNull()) {
        return;
    }
    const rapidjson::Value& v = it->value;
    if (v.IsArray()) {
        for (const auto& item : v.GetArray()) {
            details.push_back(value_to_string(item));
        }
        count = details.size();
    } else if (v.IsNumber()) {
        const double n = v.GetDouble();
        if (!std::isfinite(n) || n < 0.0 || n > MAX_BEHAVIOR_COUNT || std::floor(n) != n) {
            throw capability::CapabilityError(std::string("judge field '") + key +
                                              "' is not a valid count");
        }
        count = static_cast<size_t>(n);
    } else {
        throw capability::CapabilityError(std::string("judge field '") + key +
                                          "' must be a list");
    }
}

}  // namespace

SemanticComparisonResult parse_judge_response(const std::string& response) {
    auto json = extract_json_object(response);
    if (!json) {
        throw capability::CapabilityError("judge response contains no JSON object");
    }

    rapidjson::Document doc;
    doc.Parse(json->c_str(), json->size());
    if (doc.HasParseError() || !doc.IsObject()) {
        throw capability::CapabilityError("judge response is not a valid JSON object");
    }

    SemanticComparisonResult result;
    result.method = Method::Judge;
    result.degraded = false;
    result.similarity_score = 0.0;

    auto score = doc.FindMember("similarity_score");
    if (score != doc.MemberEnd()) {
        if (!score->value.IsNumber()) {
            throw capability::CapabilityError("judge similarity_score is not a number");
        }
        result.similarity_score = std::clamp(score->value.GetDouble(), 0.0, 1.0);
    }

    read_behaviors(doc, "missing_behaviors", result.missing_behaviors,
                   result.missing_behavior_details);
    read_behaviors(doc, "extraneous_behaviors", result.extraneous_behaviors,
                   result.extraneous_behavior_details);

    auto overfitting = doc.FindMember("overfitting_detected");
    if (overfitting != doc.MemberEnd() && overfitting->value.IsBool()) {
        result.overfitting_detected = overfitting->value.GetBool();
    }
    auto fp_risk = doc.FindMember("fp_risk");
    if (fp_risk != doc.MemberEnd() && fp_risk->value.IsString()) {
        result.fp_risk = fp_risk->value.GetString();
    }
    auto explanation = doc.FindMember("explanation");
    if (explanation != doc.MemberEnd() && explanation->value.IsString()) {
        result.explanation = explanation->value.GetString();
    }

    return result;
}

// ============================================================================
// Стратегии
// ============================================================================

JudgeStrategy::JudgeStrategy(std::shared_ptr<capability::Judge> judge,
                             std::chrono::milliseconds timeout)
    : judge_(std::move(judge)), timeout_(timeout) {}

SemanticComparisonResult JudgeStrategy::compare(const std::string& generated,
                                                const std::string& reference) const {
    if (!judge_) {
        throw capability::CapabilityError("no judge configured");
    }

    auto judge = judge_;
    auto prompt = build_judge_prompt(generated, reference);
    std::string response = capability::call_with_timeout(
        [judge, prompt]() { return judge->judge(prompt); }, timeout_);

    return parse_judge_response(response);
}

EmbeddingStrategy::EmbeddingStrategy(std::shared_ptr<capability::Embedder> embedder,
                                     std::chrono::milliseconds timeout)
    : embedder_(std::move(embedder)), timeout_(timeout) {}

SemanticComparisonResult EmbeddingStrategy::compare(const std::string& generated,
                                                    const std::string& reference) const {
    if (!embedder_) {
        throw capability::CapabilityError("no embedder configured");
    }

    auto embedder = embedder_;
    auto embeddings = capability::call_with_timeout(
        [embedder, generated, reference]() {
            return std::make_pair(embedder->embed(generated), embedder->embed(reference));
        },
        timeout_);

    const double similarity =
        std::clamp(capability::cosine_similarity(embeddings.first, embeddings.second), 0.0, 1.0);

    SemanticComparisonResult result;
    result.similarity_score = similarity;
    result.method = Method::Embedding;
    result.degraded = false;

    // Эмбеддинги не перечисляют различия: только оценка по расстоянию
    if (similarity < 0.7) {
        result.missing_behaviors = static_cast<size_t>((1.0 - similarity) * 2.0);
        result.extraneous_behaviors = static_cast<size_t>((1.0 - similarity) * 1.0);
    }
    return result;
}

// ============================================================================
// SemanticScorer
// ============================================================================

SemanticScorer::SemanticScorer(std::shared_ptr<capability::Judge> judge,
                               std::shared_ptr<capability::Embedder> embedder,
                               const SemanticOptions& options, output::Writer* writer)
    : writer_(writer) {
    if (judge) {
        chain_.push_back(std::make_unique<JudgeStrategy>(std::move(judge), options.judge_timeout));
    }
    if (embedder) {
        chain_.push_back(
            std::make_unique<EmbeddingStrategy>(std::move(embedder), options.embed_timeout));
    }
}

SemanticScorer::SemanticScorer(std::vector<std::unique_ptr<SemanticStrategy>> chain,
                               output::Writer* writer)
    : chain_(std::move(chain)), writer_(writer) {}

SemanticComparisonResult SemanticScorer::compare_rules(const std::string& generated,
                                                       const std::string& reference) const {
    for (size_t i = 0; i < chain_.size(); ++i) {
        const auto& strategy = chain_[i];
        if (!strategy) {
            continue;
        }
        try {
            SemanticComparisonResult result = strategy->compare(generated, reference);
            result.degraded = i > 0;
            if (writer_ && result.degraded) {
                writer_->debug("Semantic score computed via fallback method: " +
                               std::string(method_to_string(result.method)));
            }
            return result;
        } catch (const std::exception& e) {
            if (writer_) {
                writer_->warn(std::string(method_to_string(strategy->method())) +
                              " comparison failed: " + e.what());
            }
        }
    }

    if (writer_) {
        writer_->debug("Semantic score unavailable, using neutral result");
    }
    return neutral_result();
}

}  // namespace sigmaeval::semantic
