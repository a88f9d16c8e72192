// ==============================================================================
// output.cpp - Пользовательский вывод и журналирование
// ==============================================================================
//
// Только этот модуль пишет в stdout/stderr. Байты первичны, std::endl не
// используется.
//
// ==============================================================================

#include "sigmaeval/output.hpp"

#include <algorithm>
#include <cstdio>
#include <rapidjson/document.h>
#include <rapidjson/prettywriter.h>
#include <rapidjson/stringbuffer.h>
#include <rapidjson/writer.h>

#ifdef _WIN32
#include <io.h>
#else
#include <unistd.h>
#endif

namespace sigmaeval::output {

// ----------------------------------------------------------------------------
// ANSI Escape Codes
// ----------------------------------------------------------------------------

namespace {

constexpr const char* ANSI_RESET = "\x1b[0m";
constexpr const char* ANSI_GREEN = "\x1b[32m";
constexpr const char* ANSI_YELLOW = "\x1b[33m";
constexpr const char* ANSI_RED = "\x1b[31m";
constexpr const char* ANSI_CYAN = "\x1b[36m";
constexpr const char* ANSI_MAGENTA = "\x1b[35m";

// Unicode box-drawing characters (UTF-8)
constexpr const char* BOX_V = "\xe2\x94\x82";      // │ U+2502
constexpr const char* BOX_H = "\xe2\x94\x80";      // ─ U+2500
constexpr const char* BOX_TL = "\xe2\x94\x8c";     // ┌ U+250C
constexpr const char* BOX_TR = "\xe2\x94\x90";     // ┐ U+2510
constexpr const char* BOX_BL = "\xe2\x94\x94";     // └ U+2514
constexpr const char* BOX_BR = "\xe2\x94\x98";     // ┘ U+2518
constexpr const char* BOX_LT = "\xe2\x94\x9c";     // ├ U+251C
constexpr const char* BOX_RT = "\xe2\x94\xa4";     // ┤ U+2524
constexpr const char* BOX_TT = "\xe2\x94\xac";     // ┬ U+252C
constexpr const char* BOX_BT = "\xe2\x94\xb4";     // ┴ U+2534
constexpr const char* BOX_CROSS = "\xe2\x94\xbc";  // ┼ U+253C

}  // namespace

// ----------------------------------------------------------------------------
// Writer
// ----------------------------------------------------------------------------

Writer::Writer(const OutputConfig& cfg) : config_(cfg) {
    if (config_.output_path.has_value()) {
        open_output_file();
    }
}

Writer::~Writer() {
    close_output_file();
    flush();
}

void Writer::write(Stream s, std::string_view bytes) {
    std::lock_guard<std::recursive_mutex> lock(mutex_);
    write_impl(s, bytes);
}

void Writer::write_line(Stream s, std::string_view bytes) {
    std::lock_guard<std::recursive_mutex> lock(mutex_);
    write_impl(s, bytes);
    write_impl(s, "\n");
}

void Writer::write_impl(Stream s, std::string_view bytes) {
    FILE* f = nullptr;

    // stdout перенаправляется в файл при --output; журнал всегда в stderr
    if (s == Stream::Stdout && output_file_ != nullptr) {
        f = output_file_;
    } else {
        f = get_file(s);
    }

    if (f != nullptr) {
        std::fwrite(bytes.data(), 1, bytes.size(), f);
    }
}

FILE* Writer::get_file(Stream s) const {
    return (s == Stream::Stdout) ? stdout : stderr;
}

void Writer::write_prefixed(std::string_view prefix, Color color, std::string_view message) {
    std::lock_guard<std::recursive_mutex> lock(mutex_);
    if (supports_color(Stream::Stderr)) {
        write_impl(Stream::Stderr, ansi_color_code(color));
        write_impl(Stream::Stderr, prefix);
        write_impl(Stream::Stderr, ANSI_RESET);
    } else {
        write_impl(Stream::Stderr, prefix);
    }
    write_impl(Stream::Stderr, message);
    write_impl(Stream::Stderr, "\n");
}

void Writer::info(std::string_view message) {
    if (config_.quiet) {
        return;
    }
    write_prefixed("[+] ", Color::Green, message);
}

void Writer::warn(std::string_view message) {
    if (config_.quiet) {
        return;
    }
    write_prefixed("[!] ", Color::Yellow, message);
}

void Writer::error(std::string_view message) {
    // Ошибки печатаются всегда, даже при -q
    write_prefixed("[x] ", Color::Red, message);
}

void Writer::debug(std::string_view message) {
    if (config_.verbose <= 0) {
        return;
    }
    write_prefixed("[*] ", Color::Cyan, message);
}

void Writer::trace(std::string_view message) {
    if (config_.verbose <= 1) {
        return;
    }
    write_prefixed("[~] ", Color::Magenta, message);
}

void Writer::green_line(std::string_view message) {
    std::lock_guard<std::recursive_mutex> lock(mutex_);
    write_colored(Stream::Stdout, message, Color::Green);
    write_impl(Stream::Stdout, "\n");
}

void Writer::red_line(std::string_view message) {
    std::lock_guard<std::recursive_mutex> lock(mutex_);
    write_colored(Stream::Stdout, message, Color::Red);
    write_impl(Stream::Stdout, "\n");
}

void Writer::write_colored(Stream s, std::string_view message, Color color) {
    // При записи в файл без ANSI codes
    bool use_color = (s == Stream::Stdout && output_file_ == nullptr && supports_color(s)) ||
                     (s == Stream::Stderr && supports_color(s));

    if (use_color) {
        write_impl(s, ansi_color_code(color));
        write_impl(s, message);
        write_impl(s, ANSI_RESET);
    } else {
        write_impl(s, message);
    }
}

void Writer::write_json(const rapidjson::Value& value) {
    rapidjson::StringBuffer buffer;
    rapidjson::Writer<rapidjson::StringBuffer> writer(buffer);
    value.Accept(writer);

    write(Stream::Stdout, std::string_view(buffer.GetString(), buffer.GetSize()));
    flush();
}

void Writer::write_json_line(const rapidjson::Value& value) {
    rapidjson::StringBuffer buffer;
    rapidjson::Writer<rapidjson::StringBuffer> writer(buffer);
    value.Accept(writer);

    write_line(Stream::Stdout, std::string_view(buffer.GetString(), buffer.GetSize()));
    flush();
}

void Writer::write_json_pretty(const rapidjson::Value& value) {
    rapidjson::StringBuffer buffer;
    rapidjson::PrettyWriter<rapidjson::StringBuffer> writer(buffer);
    writer.SetIndent(' ', 2);
    value.Accept(writer);

    write_line(Stream::Stdout, std::string_view(buffer.GetString(), buffer.GetSize()));
    flush();
}

void Writer::flush() {
    std::lock_guard<std::recursive_mutex> lock(mutex_);
    std::fflush(stdout);
    std::fflush(stderr);
    if (output_file_ != nullptr) {
        std::fflush(output_file_);
    }
}

bool Writer::open_output_file() {
    if (!config_.output_path.has_value()) {
        return false;
    }

    const auto& path = config_.output_path.value();

#ifdef _WIN32
    output_file_ = _wfopen(path.c_str(), L"wb");
#else
    output_file_ = std::fopen(path.string().c_str(), "wb");
#endif

    return output_file_ != nullptr;
}

void Writer::close_output_file() {
    std::lock_guard<std::recursive_mutex> lock(mutex_);
    if (output_file_ != nullptr) {
        std::fflush(output_file_);
        std::fclose(output_file_);
        output_file_ = nullptr;
    }
}

// ----------------------------------------------------------------------------
// Table
// ----------------------------------------------------------------------------

Table::Table() = default;

void Table::set_headers(const std::vector<std::string>& headers) {
    headers_ = headers;
}

void Table::add_row(const std::vector<std::string>& cells) {
    rows_.push_back(cells);
}

std::vector<size_t> Table::calculate_widths() const {
    size_t num_cols = headers_.size();
    for (const auto& row : rows_) {
        num_cols = std::max(num_cols, row.size());
    }

    std::vector<size_t> widths(num_cols, 0);
    for (size_t i = 0; i < headers_.size(); ++i) {
        widths[i] = std::max(widths[i], headers_[i].size());
    }
    for (const auto& row : rows_) {
        for (size_t i = 0; i < row.size(); ++i) {
            widths[i] = std::max(widths[i], row[i].size());
        }
    }
    return widths;
}

std::string Table::format_line(char left, char middle, char right,
                               const std::vector<size_t>& widths) const {
    std::string line;

    if (left == 'T') {
        line += BOX_TL;
    } else if (left == 'M') {
        line += BOX_LT;
    } else if (left == 'B') {
        line += BOX_BL;
    }

    for (size_t i = 0; i < widths.size(); ++i) {
        // 1 пробел с каждой стороны + содержимое
        for (size_t j = 0; j < widths[i] + 2; ++j) {
            line += BOX_H;
        }

        if (i + 1 < widths.size()) {
            if (middle == 'T') {
                line += BOX_TT;
            } else if (middle == 'M') {
                line += BOX_CROSS;
            } else if (middle == 'B') {
                line += BOX_BT;
            }
        }
    }

    if (right == 'T') {
        line += BOX_TR;
    } else if (right == 'M') {
        line += BOX_RT;
    } else if (right == 'B') {
        line += BOX_BR;
    }

    return line;
}

std::string Table::format_row(const std::vector<std::string>& cells,
                              const std::vector<size_t>& widths) const {
    std::string line;
    line += BOX_V;

    for (size_t i = 0; i < widths.size(); ++i) {
        line += ' ';

        const std::string cell = (i < cells.size()) ? cells[i] : "";
        line += cell;
        if (cell.size() < widths[i]) {
            line.append(widths[i] - cell.size(), ' ');
        }

        line += ' ';
        line += BOX_V;
    }

    return line;
}

std::string Table::to_string() const {
    const auto widths = calculate_widths();
    if (widths.empty()) {
        return "";
    }

    std::string result;
    result += format_line('T', 'T', 'T', widths);
    result += '\n';

    if (!headers_.empty()) {
        result += format_row(headers_, widths);
        result += '\n';
        result += format_line('M', 'M', 'M', widths);
        result += '\n';
    }

    for (const auto& row : rows_) {
        result += format_row(row, widths);
        result += '\n';
    }

    result += format_line('B', 'B', 'B', widths);
    result += '\n';

    return result;
}

void Table::print(Writer& w) const {
    w.write(Stream::Stdout, to_string());
}

// ----------------------------------------------------------------------------
// Вспомогательные функции
// ----------------------------------------------------------------------------

std::string format_info(std::string_view message) {
    std::string result = "[+] ";
    result.append(message);
    result.append("\n");
    return result;
}

std::string format_error(std::string_view message) {
    std::string result = "[x] ";
    result.append(message);
    result.append("\n");
    return result;
}

std::string format_warning(std::string_view message) {
    std::string result = "[!] ";
    result.append(message);
    result.append("\n");
    return result;
}

std::string format_debug(std::string_view message) {
    std::string result = "[*] ";
    result.append(message);
    result.append("\n");
    return result;
}

std::string format_cell(std::string_view field, size_t limit) {
    std::string result;
    result.reserve(field.size());

    bool prev_space = false;
    for (char c : field) {
        if (c == '\n' || c == '\r' || c == '\t' || c == ' ') {
            if (!prev_space) {
                result += ' ';
                prev_space = true;
            }
            continue;
        }
        result += c;
        prev_space = false;
    }

    if (limit > 3 && result.size() > limit) {
        result.resize(limit - 3);
        result += "...";
    }

    return result;
}

std::string ansi_color_code(Color color) {
    switch (color) {
    case Color::Green:
        return ANSI_GREEN;
    case Color::Yellow:
        return ANSI_YELLOW;
    case Color::Red:
        return ANSI_RED;
    case Color::Cyan:
        return ANSI_CYAN;
    case Color::Magenta:
        return ANSI_MAGENTA;
    case Color::Default:
    default:
        return "";
    }
}

std::string ansi_reset_code() {
    return ANSI_RESET;
}

bool supports_color(Stream s) {
#ifdef _WIN32
    return _isatty(s == Stream::Stdout ? 1 : 2) != 0;
#else
    return isatty(s == Stream::Stdout ? STDOUT_FILENO : STDERR_FILENO) != 0;
#endif
}

}  // namespace sigmaeval::output
