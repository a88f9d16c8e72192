// ==============================================================================
// sigmaeval/huntability.hpp - Оценка пригодности правила для охоты (0-10)
// ==============================================================================
//
// Взвешенная сумма подоценок (0..1):
//
//   commandline_specificity  0.25
//   ttp_clarity              0.20
//   parent_child             0.15
//   telemetry_feasibility    0.15
//   overfitting              0.25   (обратная плотность IP/доменов)
//
// score = clamp(10 * sum, 0, 10); breakdown хранит подоценки * 10.
//
// ==============================================================================

#ifndef SIGMAEVAL_HUNTABILITY_HPP
#define SIGMAEVAL_HUNTABILITY_HPP

#include <map>
#include <sigmaeval/rule.hpp>
#include <string>
#include <string_view>

namespace sigmaeval::huntability {

enum class FalsePositiveRisk { Low, Medium, High };

std::string_view risk_to_string(FalsePositiveRisk risk);

struct HuntabilityScore {
    double score = 0.0;
    FalsePositiveRisk false_positive_risk = FalsePositiveRisk::High;
    std::string coverage_notes;
    std::map<std::string, double> breakdown;
};

/// Оценить текст правила
HuntabilityScore score_rule(const std::string& rule_text);

/// Оценить уже разобранное правило
HuntabilityScore score_rule(const rule::Rule& parsed);

}  // namespace sigmaeval::huntability

#endif  // SIGMAEVAL_HUNTABILITY_HPP
