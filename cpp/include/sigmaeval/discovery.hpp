// ==============================================================================
// sigmaeval/discovery.hpp - Поиск и чтение файлов правил
// ==============================================================================
//
// Назначение:
// - Рекурсивный обход директорий корпуса правил
// - Фильтрация по расширениям (по умолчанию yml, yaml)
// - Детерминированный порядок результатов (сортировка по пути)
// - Режим skip_errors: предупреждение через Writer вместо исключения
//
// ==============================================================================

#ifndef SIGMAEVAL_DISCOVERY_HPP
#define SIGMAEVAL_DISCOVERY_HPP

#include <filesystem>
#include <optional>
#include <string>
#include <unordered_set>
#include <vector>

namespace sigmaeval::output {
class Writer;
}

namespace sigmaeval::io {

/// Параметры discover_files()
struct DiscoveryOptions {
    /// Допустимые расширения БЕЗ точки, сравнение без учёта регистра.
    /// nullopt - все файлы.
    std::optional<std::unordered_set<std::string>> extensions =
        std::unordered_set<std::string>{"yml", "yaml"};

    /// true = предупреждения вместо std::runtime_error
    bool skip_errors = false;

    /// Куда писать предупреждения при skip_errors (может быть nullptr)
    output::Writer* writer = nullptr;
};

/// Найти файлы по путям (файлы и директории, рекурсивно).
/// Результат отсортирован; пустой результат - не ошибка.
///
/// @throws std::runtime_error при ошибке (если skip_errors=false)
std::vector<std::filesystem::path> discover_files(const std::vector<std::filesystem::path>& inputs,
                                                  const DiscoveryOptions& opt);

/// Результат чтения текстового файла
struct ReadResult {
    bool ok = false;
    std::string content;
    std::string error;

    explicit operator bool() const { return ok; }
};

/// Прочитать файл целиком
ReadResult read_text_file(const std::filesystem::path& path);

}  // namespace sigmaeval::io

#endif  // SIGMAEVAL_DISCOVERY_HPP
