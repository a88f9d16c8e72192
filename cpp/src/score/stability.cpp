// ==============================================================================
// stability.cpp - Стабильность повторной генерации правила
// ==============================================================================

#include <algorithm>
#include <cmath>
#include <map>
#include <sigmaeval/fingerprint.hpp>
#include <sigmaeval/output.hpp>
#include <sigmaeval/rule.hpp>
#include <sigmaeval/semantic.hpp>
#include <sigmaeval/stability.hpp>

namespace sigmaeval::stability {

double coefficient_of_variation(const std::vector<double>& values) {
    if (values.size() < 2) {
        return 0.0;
    }

    double sum = 0.0;
    for (double v : values) {
        sum += v;
    }
    const double mean = sum / static_cast<double>(values.size());
    if (mean == 0.0) {
        return 0.0;
    }

    double squares = 0.0;
    for (double v : values) {
        squares += (v - mean) * (v - mean);
    }
    const double stdev = std::sqrt(squares / static_cast<double>(values.size() - 1));
    return stdev / mean;
}

StabilityTester::StabilityTester(const semantic::SemanticScorer* semantic, output::Writer* writer,
                                 double stable_threshold)
    : semantic_(semantic), writer_(writer), stable_threshold_(stable_threshold) {}

StabilityResult StabilityTester::test_stability(const std::string& input_id,
                                                const capability::GenerateFn& generate,
                                                const std::optional<std::string>& reference_rule,
                                                size_t num_runs) const {
    StabilityResult result;
    result.num_runs = num_runs;

    std::vector<std::string> hashes;
    std::vector<double> selector_counts;
    std::vector<double> similarities;

    for (size_t run = 1; run <= num_runs; ++run) {
        std::string rule_text;
        try {
            if (!generate) {
                throw capability::CapabilityError("no generator configured");
            }
            rule_text = rule::clean_rule_text(generate(input_id));
        } catch (const std::exception& e) {
            ++result.failed_runs;
            result.run_errors.push_back("run " + std::to_string(run) + ": " + e.what());
            if (writer_) {
                writer_->warn("Stability run " + std::to_string(run) + " for '" + input_id +
                              "' failed: " + e.what());
            }
            continue;
        }

        const auto core = fingerprint::extract_behavioral_core(rule_text);
        hashes.push_back(core.core_hash);
        selector_counts.push_back(static_cast<double>(core.selector_count));

        if (semantic_ && reference_rule) {
            similarities.push_back(
                semantic_->compare_rules(rule_text, *reference_rule).similarity_score);
        }

        if (writer_) {
            writer_->trace("Stability run " + std::to_string(run) + " for '" + input_id +
                           "': " + core.core_hash);
        }
    }

    result.successful_runs = hashes.size();
    if (hashes.empty()) {
        return result;
    }

    std::map<std::string, size_t> counts;
    for (const auto& h : hashes) {
        ++counts[h];
    }
    size_t modal = 0;
    for (const auto& [hash, count] : counts) {
        modal = std::max(modal, count);
    }

    result.unique_hashes = counts.size();
    result.hash_consistency = static_cast<double>(modal) / static_cast<double>(hashes.size());
    result.selectors_variance = coefficient_of_variation(selector_counts);
    result.semantic_variance = coefficient_of_variation(similarities);

    result.stability_score = 0.5 * result.hash_consistency +
                             0.3 * (1.0 - std::min(1.0, result.selectors_variance)) +
                             0.2 * (1.0 - std::min(1.0, result.semantic_variance));
    result.is_stable = result.stability_score >= stable_threshold_;

    return result;
}

}  // namespace sigmaeval::stability
