// ==============================================================================
// discovery.cpp - Поиск исходных файлов
// ==============================================================================

#include "ruleforge/discovery.hpp"

#include <algorithm>
#include <iostream>
#include <stdexcept>
#include <system_error>

namespace ruleforge::io {

namespace {

bool matches_extensions(const std::filesystem::path& file_path,
                        const std::optional<std::unordered_set<std::string>>& extensions) {
    if (!extensions.has_value()) {
        return true;
    }
    if (!file_path.has_extension()) {
        return false;
    }

    // extension() возвращает расширение с точкой (".list")
    std::string ext = file_path.extension().string();
    if (!ext.empty() && ext[0] == '.') {
        ext = ext.substr(1);
    }
    return extensions->count(ext) > 0;
}

bool is_hidden(const std::filesystem::path& p) {
    const std::string name = p.filename().string();
    return !name.empty() && name[0] == '.';
}

/// Сообщить об ошибке: предупреждение или исключение
void report(bool skip_errors, const std::string& message) {
    if (skip_errors) {
        std::cerr << "[!] " << message << "\n";
        return;
    }
    throw std::runtime_error(message);
}

void collect_files_recursive(const std::filesystem::path& path,
                             const std::optional<std::unordered_set<std::string>>& extensions,
                             bool skip_errors, std::vector<std::filesystem::path>& result) {
    std::error_code ec;
    bool exists = std::filesystem::exists(path, ec);
    if (ec) {
        report(skip_errors, "failed to check path existence - " + ec.message());
        return;
    }
    if (!exists) {
        report(skip_errors, "specified path does not exist - " + path.string());
        return;
    }

    std::filesystem::file_status status = std::filesystem::status(path, ec);
    if (ec) {
        report(skip_errors, "failed to get metadata for file - " + ec.message());
        return;
    }

    if (std::filesystem::is_directory(status)) {
        std::filesystem::directory_iterator it(path, ec);
        if (ec) {
            report(skip_errors, "failed to read directory - " + ec.message());
            return;
        }

        for (; it != std::filesystem::directory_iterator(); it.increment(ec)) {
            if (ec) {
                report(skip_errors, "failed to enter directory - " + ec.message());
                return;
            }
            if (is_hidden(it->path())) {
                continue;
            }
            collect_files_recursive(it->path(), extensions, skip_errors, result);
        }
        if (ec) {
            report(skip_errors, "failed to enter directory - " + ec.message());
        }
    } else if (std::filesystem::is_regular_file(status)) {
        if (matches_extensions(path, extensions)) {
            result.push_back(path);
        }
    }
    // Symlinks на специальные файлы и прочее игнорируются
}

}  // namespace

// ----------------------------------------------------------------------------
// Публичный API
// ----------------------------------------------------------------------------

std::unordered_set<std::string> source_extensions() {
    return {"list", "txt", "conf", "yaml", "yml", "json"};
}

std::vector<std::filesystem::path> discover_files(const std::vector<std::filesystem::path>& inputs,
                                                  const DiscoveryOptions& opt) {
    std::vector<std::filesystem::path> result;

    for (const auto& input : inputs) {
        collect_files_recursive(input, opt.extensions, opt.skip_errors, result);
    }

    // Порядок directory_iterator зависит от ОС
    std::sort(result.begin(), result.end());
    result.erase(std::unique(result.begin(), result.end()), result.end());
    return result;
}

}  // namespace ruleforge::io
