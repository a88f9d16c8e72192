// ==============================================================================
// sigmaeval/report.hpp - JSON представление результатов оценки
// ==============================================================================
//
// Все отсутствующие (nullopt) стадии сериализуются как null, чтобы набор
// ключей отчёта не зависел от того, какие стадии выполнялись.
//
// ==============================================================================

#ifndef SIGMAEVAL_REPORT_HPP
#define SIGMAEVAL_REPORT_HPP

#include <rapidjson/document.h>
#include <sigmaeval/evaluator.hpp>
#include <string>
#include <vector>

namespace sigmaeval::report {

using Allocator = rapidjson::Document::AllocatorType;

rapidjson::Value to_json(const validate::ExtendedValidationResult& r, Allocator& alloc);
rapidjson::Value to_json(const fingerprint::BehavioralCore& core, Allocator& alloc);
rapidjson::Value to_json(const fingerprint::CoreComparison& cmp, Allocator& alloc);
rapidjson::Value to_json(const huntability::HuntabilityScore& score, Allocator& alloc);
rapidjson::Value to_json(const semantic::SemanticComparisonResult& r, Allocator& alloc);
rapidjson::Value to_json(const stability::StabilityResult& r, Allocator& alloc);
rapidjson::Value to_json(const novelty::NoveltyResult& r, Allocator& alloc);
rapidjson::Value to_json(const evaluate::RuleReport& report, Allocator& alloc);
rapidjson::Value to_json(const evaluate::ItemResult& item, Allocator& alloc);
rapidjson::Value to_json(const evaluate::CorpusMetrics& metrics, Allocator& alloc);

/// {"items": [...], "metrics": {...}}
rapidjson::Value to_json(const evaluate::DatasetResult& result, Allocator& alloc);

/// Сериализовать значение в компактную строку
std::string to_string(const rapidjson::Value& value);

/// Строки подробностей структурной проверки для текстового вывода:
/// "grammar: ..." для ошибок базовой проверки, "error: ..." для остальных
/// ошибок (каждая ошибка один раз), затем "warning: ...".
std::vector<std::string> structural_details(const validate::ExtendedValidationResult& r);

}  // namespace sigmaeval::report

#endif  // SIGMAEVAL_REPORT_HPP
