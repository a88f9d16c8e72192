// ==============================================================================
// sigmaeval/fingerprint.hpp - Поведенческое ядро правила и его отпечаток
// ==============================================================================
//
// Назначение:
// - Извлечение нормализованных селекторов field=value из detection
// - Сбор command line значений и цепочек процессов parent -> child
// - SHA-256 отпечаток по отсортированному набору селекторов
// - Сравнение двух ядер
//
// extract_behavioral_core() - чистая детерминированная функция: порядок ключей
// и форматирование YAML не влияют на core_hash.
//
// ==============================================================================

#ifndef SIGMAEVAL_FINGERPRINT_HPP
#define SIGMAEVAL_FINGERPRINT_HPP

#include <cstddef>
#include <string>
#include <string_view>
#include <vector>

namespace sigmaeval::fingerprint {

/// Поведенческое ядро правила
struct BehavioralCore {
    std::vector<std::string> behavior_selectors;  // уникальные, в порядке появления
    std::vector<std::string> commandlines;
    std::vector<std::string> process_chains;
    std::string core_hash;  // "sha256:<hex>" или "" для неразбираемого правила
    size_t selector_count = 0;
};

/// Результат сравнения двух ядер
struct CoreComparison {
    double similarity = 0.0;  // |A∩B| / max(|A|, |B|, 1)
    size_t common_selectors = 0;
    size_t only_in_first = 0;
    size_t only_in_second = 0;
    bool hash_match = false;
    size_t selector_count_diff = 0;
};

/// Извлечь ядро из текста правила. Не бросает исключений.
BehavioralCore extract_behavioral_core(const std::string& rule_text);

/// Сравнить два ядра по множествам селекторов
CoreComparison compare_cores(const BehavioralCore& a, const BehavioralCore& b);

// ============================================================================
// Нормализация
// ============================================================================

/// lowercase, схлопывание пробелов и '*', снятие внешних кавычек, trim.
/// Поле и значение (до и после первого '=') нормализуются раздельно.
std::string normalize_selector(std::string_view selector);

/// Как normalize_selector, дополнительно удаляются все кавычки
std::string normalize_commandline(std::string_view commandline);

/// Как normalize_selector, дополнительно '\' заменяется на '/'
std::string normalize_process_chain(std::string_view chain);

/// Hex SHA-256 (нижний регистр)
std::string sha256_hex(std::string_view data);

}  // namespace sigmaeval::fingerprint

#endif  // SIGMAEVAL_FINGERPRINT_HPP
