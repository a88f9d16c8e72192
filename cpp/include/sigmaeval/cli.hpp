// ==============================================================================
// sigmaeval/cli.hpp - Разбор командной строки
// ==============================================================================
//
// Назначение:
// - Парсинг argv
// - Генерация --help / --version
// - Диагностика ошибок использования (exit code 2)
//
// ==============================================================================

#ifndef SIGMAEVAL_CLI_HPP
#define SIGMAEVAL_CLI_HPP

#include <filesystem>
#include <optional>
#include <string>
#include <variant>
#include <vector>

namespace sigmaeval::cli {

// ----------------------------------------------------------------------------
// Глобальные опции
// ----------------------------------------------------------------------------

struct GlobalOptions {
    bool no_banner = false;                       // --no-banner
    int verbose = 0;                              // -v (repeatable)
    bool quiet = false;                           // -q
    std::optional<std::filesystem::path> config;  // --config
};

/// Общие опции вывода подкоманд
struct OutputOptions {
    bool json = false;                            // -j, --json
    bool jsonl = false;                           // --jsonl
    std::optional<std::filesystem::path> output;  // -o, --output
};

// ----------------------------------------------------------------------------
// Подкоманды
// ----------------------------------------------------------------------------

/// validate - расширенная структурная проверка
struct ValidateCommand {
    std::vector<std::filesystem::path> paths;
    bool skip_errors = false;  // --skip-errors
    OutputOptions out;
};

/// fingerprint - поведенческое ядро правила
struct FingerprintCommand {
    std::filesystem::path rule;
    OutputOptions out;
};

/// score - оценка пригодности для охоты
struct ScoreCommand {
    std::filesystem::path rule;
    OutputOptions out;
};

/// compare - семантическое сравнение с эталоном
struct CompareCommand {
    std::filesystem::path rule;
    std::filesystem::path reference;
    OutputOptions out;
};

/// novelty - новизна относительно корпуса
struct NoveltyCommand {
    std::filesystem::path rule;
    std::filesystem::path corpus;  // --corpus (required)
    OutputOptions out;
};

/// evaluate - полный конвейер для одного правила
struct EvaluateCommand {
    std::filesystem::path rule;
    std::optional<std::filesystem::path> reference;  // --reference
    std::optional<std::filesystem::path> corpus;     // --corpus
    OutputOptions out;
};

/// dataset - оценка набора данных
struct DatasetCommand {
    std::filesystem::path dataset;
    std::optional<std::filesystem::path> corpus;  // --corpus
    std::optional<size_t> num_threads;            // --num-threads
    OutputOptions out;
};

struct HelpCommand {
    std::optional<std::string> command;
};

struct VersionCommand {};

using Command = std::variant<ValidateCommand, FingerprintCommand, ScoreCommand, CompareCommand,
                             NoveltyCommand, EvaluateCommand, DatasetCommand, HelpCommand,
                             VersionCommand>;

// ----------------------------------------------------------------------------
// Результат парсинга
// ----------------------------------------------------------------------------

struct CliDiagnostic {
    int exit_code = 2;
    std::string stderr_message;
};

struct ParseResult {
    bool ok = false;
    GlobalOptions global;
    Command command;
    CliDiagnostic diagnostic;
};

/// Парсить аргументы командной строки
ParseResult parse(int argc, char** argv);

/// Текст --help (общий или для подкоманды)
std::string render_help(const std::optional<std::string>& command = std::nullopt);

/// Текст --version
std::string render_version();

constexpr const char* VERSION = "0.3.0";

constexpr const char* ABOUT = "Evaluate machine-generated Sigma detection rules";

}  // namespace sigmaeval::cli

#endif  // SIGMAEVAL_CLI_HPP
