// ==============================================================================
// sigmaeval/config.hpp - Файл настроек оценщика (YAML)
// ==============================================================================
//
// Формат (все ключи необязательны, неизвестные игнорируются):
//
//   semantic:
//     judge_timeout_ms: 60000
//     embed_timeout_ms: 30000
//     embedding_dimensions: 256
//   stability:
//     runs: 5
//     stable_threshold: 0.85
//   novelty:
//     duplicate_threshold: 0.95
//     variant_threshold: 0.70
//   dataset:
//     num_threads: 0          # 0 = hardware_concurrency
//
// ==============================================================================

#ifndef SIGMAEVAL_CONFIG_HPP
#define SIGMAEVAL_CONFIG_HPP

#include <filesystem>
#include <sigmaeval/novelty.hpp>
#include <sigmaeval/rule.hpp>
#include <sigmaeval/semantic.hpp>
#include <sigmaeval/stability.hpp>
#include <string>

namespace sigmaeval::config {

struct Config {
    semantic::SemanticOptions semantic;
    size_t embedding_dimensions = 256;

    size_t stability_runs = 5;
    double stable_threshold = stability::DEFAULT_STABLE_THRESHOLD;

    novelty::NoveltyOptions novelty;

    size_t num_threads = 0;
};

struct LoadResult {
    bool ok = false;
    Config config;
    rule::Error error;

    explicit operator bool() const { return ok; }
};

/// Разобрать YAML текст настроек
LoadResult parse(const std::string& text);

/// Загрузить файл настроек
LoadResult load(const std::filesystem::path& path);

}  // namespace sigmaeval::config

#endif  // SIGMAEVAL_CONFIG_HPP
