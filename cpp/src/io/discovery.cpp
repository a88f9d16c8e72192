// ==============================================================================
// discovery.cpp - Поиск и чтение файлов правил
// ==============================================================================

#include <algorithm>
#include <fstream>
#include <sigmaeval/discovery.hpp>
#include <sigmaeval/output.hpp>
#include <sigmaeval/rule.hpp>
#include <sstream>
#include <stdexcept>
#include <system_error>

namespace sigmaeval::io {

namespace {

// ----------------------------------------------------------------------------
// Вспомогательные функции
// ----------------------------------------------------------------------------

bool matches_extensions(const std::filesystem::path& file_path,
                        const std::optional<std::unordered_set<std::string>>& extensions) {
    if (!extensions.has_value()) {
        return true;
    }
    if (!file_path.has_extension()) {
        return false;
    }

    // extension() возвращает расширение с точкой (".yml")
    std::string ext = rule::ascii_lowercase(file_path.extension().string());
    if (!ext.empty() && ext[0] == '.') {
        ext = ext.substr(1);
    }

    for (const auto& allowed : *extensions) {
        if (rule::ascii_lowercase(allowed) == ext) {
            return true;
        }
    }
    return false;
}

/// Ошибка обхода: предупреждение при skip_errors, иначе исключение
void report(const DiscoveryOptions& opt, const std::string& message) {
    if (!opt.skip_errors) {
        throw std::runtime_error(message);
    }
    if (opt.writer) {
        opt.writer->warn(message);
    }
}

void collect_files_recursive(const std::filesystem::path& path, const DiscoveryOptions& opt,
                             std::vector<std::filesystem::path>& result) {
    std::error_code ec;
    bool exists = std::filesystem::exists(path, ec);

    if (ec) {
        report(opt, "failed to check path existence - " + ec.message());
        return;
    }
    if (!exists) {
        report(opt, "Specified rule path does not exist - " + path.string());
        return;
    }

    std::filesystem::file_status status = std::filesystem::status(path, ec);
    if (ec) {
        report(opt, "failed to get metadata for file - " + ec.message());
        return;
    }

    if (std::filesystem::is_directory(status)) {
        std::filesystem::directory_iterator dir_iter(path, ec);
        if (ec) {
            report(opt, "failed to read directory - " + ec.message());
            return;
        }

        for (auto it = dir_iter; it != std::filesystem::directory_iterator(); it.increment(ec)) {
            if (ec) {
                report(opt, "failed to enter directory - " + ec.message());
                return;
            }
            collect_files_recursive(it->path(), opt, result);
        }
        if (ec) {
            report(opt, "failed to enter directory - " + ec.message());
        }
    } else if (std::filesystem::is_regular_file(status)) {
        if (matches_extensions(path, opt.extensions)) {
            result.push_back(path);
        }
    }
    // Symlink-и на несуществующие цели и специальные файлы игнорируются
}

}  // namespace

// ----------------------------------------------------------------------------
// Публичный API
// ----------------------------------------------------------------------------

std::vector<std::filesystem::path> discover_files(const std::vector<std::filesystem::path>& inputs,
                                                  const DiscoveryOptions& opt) {
    std::vector<std::filesystem::path> result;

    for (const auto& input : inputs) {
        collect_files_recursive(input, opt, result);
    }

    std::sort(result.begin(), result.end());
    return result;
}

ReadResult read_text_file(const std::filesystem::path& path) {
    ReadResult result;

    std::ifstream file(path, std::ios::binary);
    if (!file) {
        result.error = "failed to open file - " + path.string();
        return result;
    }

    std::ostringstream ss;
    ss << file.rdbuf();
    if (file.bad()) {
        result.error = "failed to read file - " + path.string();
        return result;
    }

    result.ok = true;
    result.content = ss.str();
    return result;
}

}  // namespace sigmaeval::io
