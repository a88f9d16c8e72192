// ==============================================================================
// sigmaeval/output.hpp - Пользовательский вывод и журналирование
// ==============================================================================
//
// Назначение:
// - Единственная точка записи в stdout/stderr
// - Сообщения журнала с префиксами [+] [!] [x] [*] [~]
// - JSON вывод (RapidJSON)
// - Таблицы для человекочитаемых отчётов
// - Вывод в файл (--output)
//
// Writer безопасен для вызова из нескольких потоков: каждая строка журнала
// пишется целиком под мьютексом (worker pool датасета пишет параллельно).
//
// ==============================================================================

#ifndef SIGMAEVAL_OUTPUT_HPP
#define SIGMAEVAL_OUTPUT_HPP

#include <cstdio>
#include <filesystem>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

// Forward declarations для JSON
namespace rapidjson {
class CrtAllocator;
template <typename BaseAllocator>
class MemoryPoolAllocator;
template <typename Encoding, typename Allocator>
class GenericValue;
template <typename CharType>
struct UTF8;
using Value = GenericValue<UTF8<char>, MemoryPoolAllocator<CrtAllocator>>;
}  // namespace rapidjson

namespace sigmaeval::output {

// ----------------------------------------------------------------------------
// Потоки вывода
// ----------------------------------------------------------------------------

enum class Stream { Stdout, Stderr };

// ----------------------------------------------------------------------------
// Формат вывода
// ----------------------------------------------------------------------------

enum class Format {
    Std,   // Стандартный (таблицы/текст)
    Json,  // Pretty JSON
    Jsonl  // JSON Lines (один объект на строку)
};

// ----------------------------------------------------------------------------
// ANSI цвета для терминала
// ----------------------------------------------------------------------------

enum class Color {
    Default,
    Green,   // Успех, информация
    Yellow,  // Предупреждения
    Red,     // Ошибки
    Cyan,    // Отладка
    Magenta  // Трассировка
};

// ----------------------------------------------------------------------------
// Конфигурация вывода
// ----------------------------------------------------------------------------

struct OutputConfig {
    bool quiet = false;           // -q: подавить informational stderr
    int verbose = 0;              // -v: уровень подробности (0..2+)
    bool no_banner = false;       // --no-banner
    Format format = Format::Std;  // Формат вывода

    // Путь для вывода (--output)
    std::optional<std::filesystem::path> output_path;
};

// ----------------------------------------------------------------------------
// Writer - единый слой вывода
// ----------------------------------------------------------------------------

class Writer {
public:
    explicit Writer(const OutputConfig& cfg);
    ~Writer();

    Writer(const Writer&) = delete;
    Writer& operator=(const Writer&) = delete;

    // Базовый вывод
    // -------------------------------------------------------------------------

    /// Записать байты в поток
    void write(Stream s, std::string_view bytes);

    /// Записать строку с переводом строки
    void write_line(Stream s, std::string_view bytes);

    // Сообщения журнала
    // -------------------------------------------------------------------------

    /// "[+] <message>" в stderr (если не quiet)
    void info(std::string_view message);

    /// "[!] <message>" в stderr (если не quiet)
    void warn(std::string_view message);

    /// "[x] <message>" в stderr (всегда)
    void error(std::string_view message);

    /// "[*] <message>" в stderr (только при verbose > 0)
    void debug(std::string_view message);

    /// "[~] <message>" в stderr (только при verbose > 1)
    void trace(std::string_view message);

    // Цветной вывод
    // -------------------------------------------------------------------------

    /// Зелёная строка в stdout
    void green_line(std::string_view message);

    /// Красная строка в stdout
    void red_line(std::string_view message);

    // JSON вывод
    // -------------------------------------------------------------------------

    /// Компактный JSON без перевода строки
    void write_json(const rapidjson::Value& value);

    /// JSON + newline (JSONL формат)
    void write_json_line(const rapidjson::Value& value);

    /// Pretty JSON (с отступами) + newline
    void write_json_pretty(const rapidjson::Value& value);

    // Управление
    // -------------------------------------------------------------------------

    void flush();

    const OutputConfig& config() const { return config_; }

    /// Открыть файл для вывода (при output_path задан)
    bool open_output_file();

    void close_output_file();

    bool has_output_file() const { return output_file_ != nullptr; }

private:
    void write_impl(Stream s, std::string_view bytes);

    /// Префикс + сообщение одной операцией под мьютексом
    void write_prefixed(std::string_view prefix, Color color, std::string_view message);

    void write_colored(Stream s, std::string_view message, Color color);

    FILE* get_file(Stream s) const;

    OutputConfig config_;
    FILE* output_file_ = nullptr;
    std::recursive_mutex mutex_;
};

// ----------------------------------------------------------------------------
// Table - форматирование таблиц (Unicode box-drawing)
// ----------------------------------------------------------------------------

class Table {
public:
    Table();

    void set_headers(const std::vector<std::string>& headers);

    void add_row(const std::vector<std::string>& cells);

    /// Вывести таблицу через Writer в stdout
    void print(Writer& w) const;

    /// Вывести таблицу в строку
    std::string to_string() const;

    size_t row_count() const { return rows_.size(); }

private:
    std::string format_line(char left, char middle, char right,
                            const std::vector<size_t>& widths) const;

    std::string format_row(const std::vector<std::string>& cells,
                           const std::vector<size_t>& widths) const;

    std::vector<size_t> calculate_widths() const;

    std::vector<std::string> headers_;
    std::vector<std::vector<std::string>> rows_;
};

// ----------------------------------------------------------------------------
// Вспомогательные функции
// ----------------------------------------------------------------------------

/// "[+] <message>\n"
std::string format_info(std::string_view message);

/// "[x] <message>\n"
std::string format_error(std::string_view message);

/// "[!] <message>\n"
std::string format_warning(std::string_view message);

/// "[*] <message>\n"
std::string format_debug(std::string_view message);

/// Сжать пробельные символы и обрезать до limit символов ("..." в конце)
std::string format_cell(std::string_view field, size_t limit);

std::string ansi_color_code(Color color);

std::string ansi_reset_code();

/// Поддерживает ли поток цвета (TTY check)
bool supports_color(Stream s);

}  // namespace sigmaeval::output

#endif  // SIGMAEVAL_OUTPUT_HPP
