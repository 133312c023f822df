// ==============================================================================
// ruleforge/config.hpp - Конфигурация сборки
// ==============================================================================
//
// Назначение:
// - Загрузка YAML-конфигурации (yaml-cpp): группы, источники, опции
// - Построение групп из путей без конфигурации (одна группа на stem файла)
// - Проверка групп: уникальные имена, допустимые имена файлов, id источников
//
// Формат файла:
// @code
//   output: dist
//   state: .fingerprints
//   structured_version: 1
//   sections: true
//   classifier:
//     comment_marker: "#"
//     bare_domain: exact
//     leading_dot: suffix
//     keyword_marker: "*"
//     suffix_markers: ["+.", "*.", "||"]
//   groups:
//     - name: emby
//       sources:
//         - path: emby.list
//           dialect: list
//           id: emby
// @endcode
//
// Относительные пути разрешаются от директории файла конфигурации.
//
// ==============================================================================

#ifndef RULEFORGE_CONFIG_HPP
#define RULEFORGE_CONFIG_HPP

#include <ruleforge/classifier.hpp>
#include <ruleforge/rule.hpp>

#include <filesystem>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace ruleforge::config {

struct Config {
    std::optional<std::filesystem::path> output;
    std::optional<std::filesystem::path> state;
    int structured_version = 1;
    bool sections = true;
    classify::ClassifierOptions classifier;
    std::vector<rule::GroupSpec> groups;
};

/// Результат загрузки конфигурации
struct LoadResult {
    bool ok = false;
    Config config;
    rule::Error error;  // ErrorKind::Config

    explicit operator bool() const { return ok; }
};

/// Загрузить конфигурацию из файла
LoadResult load_config(const std::filesystem::path& file);

/// Разобрать конфигурацию из текста
/// @param base_dir Директория для относительных путей
/// @param source_name Имя для сообщений об ошибках
LoadResult parse_config(const std::string& text, const std::filesystem::path& base_dir,
                        const std::string& source_name);

/// Результат построения групп из путей
struct GroupsResult {
    bool ok = false;
    std::vector<rule::GroupSpec> groups;
    rule::Error error;

    explicit operator bool() const { return ok; }
};

/// Группы по найденным файлам: имя группы = stem файла, диалект по расширению.
/// Файлы с одинаковым stem (emby.list и emby.yaml) образуют одну группу.
/// Группы упорядочены по имени, источники по пути.
GroupsResult groups_from_paths(const std::vector<std::filesystem::path>& inputs);

/// Проверить группы
/// @return nullopt если группы корректны
std::optional<rule::Error> validate_groups(const std::vector<rule::GroupSpec>& groups);

/// Имя группы допустимо как имя файла: непустое, без разделителей пути,
/// не "." и не "..", без управляющих символов
bool is_valid_group_name(std::string_view name);

}  // namespace ruleforge::config

#endif  // RULEFORGE_CONFIG_HPP
