// ==============================================================================
// ruleforge/emitter.hpp - Артефакты группы правил
// ==============================================================================
//
// Назначение:
// - <name>.list: плоский список Clash/Surge с заголовком и секциями
// - <name>.json: исходник sing-box rule-set (RapidJSON, отступ 2 пробела)
// - Пути артефактов группы (включая <name>.srs компилятора)
//
// Рендеры зависят только от RuleGroup и EmitOptions: одна и та же группа
// всегда даёт одни и те же байты.
//
// ==============================================================================

#ifndef RULEFORGE_EMITTER_HPP
#define RULEFORGE_EMITTER_HPP

#include <ruleforge/rule.hpp>

#include <filesystem>
#include <string>

namespace ruleforge::emit {

struct EmitOptions {
    /// Комментарии "# DOMAIN" перед каждой секцией плоского списка
    bool sections = true;

    /// Поле "version" структурированного артефакта
    int structured_version = 1;
};

/// Пути артефактов группы в выходной директории
struct ArtifactPaths {
    std::filesystem::path list;        // <name>.list
    std::filesystem::path structured;  // <name>.json
    std::filesystem::path binary;      // <name>.srs
};

ArtifactPaths artifact_paths(const std::filesystem::path& output_dir, const std::string& name);

/// Плоский список
///
/// @code
///   # NAME: emby
///   # DOMAIN: 1
///   # IP-CIDR: 1
///   # TOTAL: 2
///
///   # DOMAIN
///   DOMAIN,example.com
///
///   # IP-CIDR
///   IP-CIDR,10.0.0.0/8
/// @endcode
std::string render_list(const rule::RuleGroup& group, const EmitOptions& options = {});

/// Структурированный артефакт sing-box
/// {"version": N, "rules": [{"domain": [...], "domain_suffix": [...], ...}]}
/// Пустые типы опускаются; пустая группа -> "rules": []
std::string render_structured(const rule::RuleGroup& group, const EmitOptions& options = {});

}  // namespace ruleforge::emit

#endif  // RULEFORGE_EMITTER_HPP
