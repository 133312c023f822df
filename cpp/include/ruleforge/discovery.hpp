// ==============================================================================
// ruleforge/discovery.hpp - Поиск исходных файлов
// ==============================================================================
//
// Назначение:
// - Рекурсивный обход директорий для поиска исходных списков
// - Фильтрация по расширениям (без точки, case-sensitive)
// - Детерминированный порядок результатов (сортировка по пути)
// - Режим skip_errors: предупреждение вместо исключения
//
// ==============================================================================

#ifndef RULEFORGE_DISCOVERY_HPP
#define RULEFORGE_DISCOVERY_HPP

#include <filesystem>
#include <optional>
#include <string>
#include <unordered_set>
#include <vector>

namespace ruleforge::io {

// ----------------------------------------------------------------------------
// DiscoveryOptions - параметры поиска файлов
// ----------------------------------------------------------------------------

struct DiscoveryOptions {
    /// Набор допустимых расширений (БЕЗ точки: "list", не ".list")
    /// nullopt означает все файлы
    std::optional<std::unordered_set<std::string>> extensions;

    /// true = предупреждения в stderr вместо исключений
    bool skip_errors = false;
};

/// Расширения всех поддерживаемых диалектов: list, txt, conf, yaml, yml, json
std::unordered_set<std::string> source_extensions();

// ----------------------------------------------------------------------------
// discover_files - основная функция поиска
// ----------------------------------------------------------------------------

/// Найти файлы по путям с фильтрацией по расширениям
///
/// - Путь-файл добавляется при совпадении расширения
/// - Путь-директория обходится рекурсивно
/// - Результат сортируется; пустой результат не ошибка
/// - Скрытые записи (имя начинается с '.') внутри директорий пропускаются:
///   в них живёт каталог fingerprint'ов и временные файлы
///
/// @throws std::runtime_error при ошибке (если skip_errors=false)
std::vector<std::filesystem::path> discover_files(const std::vector<std::filesystem::path>& inputs,
                                                  const DiscoveryOptions& opt);

}  // namespace ruleforge::io

#endif  // RULEFORGE_DISCOVERY_HPP
