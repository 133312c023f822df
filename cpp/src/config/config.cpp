// ==============================================================================
// config.cpp - Конфигурация сборки
// ==============================================================================

#include <ruleforge/config.hpp>
#include <ruleforge/discovery.hpp>
#include <ruleforge/platform.hpp>

#include <map>
#include <set>
#include <stdexcept>
#include <system_error>
#include <utility>

#include <yaml-cpp/yaml.h>

namespace ruleforge::config {

namespace {

/// Исключение разбора с позицией узла
rule::RuleError config_error(const std::string& source, const std::string& message,
                             const YAML::Node& at = YAML::Node()) {
    rule::Error err;
    err.kind = rule::ErrorKind::Config;
    err.source = source;
    err.message = message;
    if (at.IsDefined() && !at.IsNull() && at.Mark().line >= 0) {
        err.line = static_cast<std::size_t>(at.Mark().line) + 1;
    }
    return rule::RuleError(std::move(err));
}

std::string scalar(const std::string& source, const YAML::Node& node, const std::string& key) {
    if (!node.IsScalar()) {
        throw config_error(source, "'" + key + "' must be a string", node);
    }
    return node.Scalar();
}

std::filesystem::path resolve(const std::filesystem::path& base_dir, const std::string& value) {
    std::filesystem::path p = platform::path_from_utf8(value);
    if (p.is_relative() && !base_dir.empty()) {
        p = base_dir / p;
    }
    return p.lexically_normal();
}

std::optional<rule::Dialect> dialect_of(const std::filesystem::path& p) {
    std::string ext = platform::path_to_utf8(p.extension());
    if (!ext.empty()) {
        ext = ext.substr(1);  // без точки
    }
    return rule::dialect_from_extension(ext);
}

rule::RuleKind domain_kind(const std::string& source, const YAML::Node& node,
                           const std::string& key) {
    const std::string value = scalar(source, node, key);
    if (value == "exact") {
        return rule::RuleKind::ExactDomain;
    }
    if (value == "suffix") {
        return rule::RuleKind::DomainSuffix;
    }
    throw config_error(source, "'" + key + "' must be 'exact' or 'suffix', got '" + value + "'",
                       node);
}

void parse_classifier(const std::string& source, const YAML::Node& node,
                      classify::ClassifierOptions& opts) {
    if (!node.IsMap()) {
        throw config_error(source, "'classifier' must be a mapping", node);
    }

    if (const auto n = node["comment_marker"]) {
        opts.comment_marker = scalar(source, n, "comment_marker");
    }
    if (const auto n = node["bare_domain"]) {
        opts.bare_domain = domain_kind(source, n, "bare_domain");
    }
    if (const auto n = node["leading_dot"]) {
        opts.leading_dot = domain_kind(source, n, "leading_dot");
    }
    if (const auto n = node["keyword_marker"]) {
        const std::string marker = scalar(source, n, "keyword_marker");
        if (marker.size() != 1) {
            throw config_error(source, "'keyword_marker' must be a single character", n);
        }
        opts.keyword_marker = marker[0];
    }
    if (const auto n = node["suffix_markers"]) {
        if (!n.IsSequence()) {
            throw config_error(source, "'suffix_markers' must be a list of strings", n);
        }
        opts.suffix_markers.clear();
        for (const auto& item : n) {
            opts.suffix_markers.push_back(scalar(source, item, "suffix_markers"));
        }
    }

    try {
        classify::validate(opts);
    } catch (const std::invalid_argument& e) {
        throw config_error(source, e.what(), node);
    }
}

rule::SourceSpec parse_source(const std::string& source, const YAML::Node& node,
                              const std::filesystem::path& base_dir) {
    rule::SourceSpec spec;

    // Краткая форма: "- emby.list"
    if (node.IsScalar()) {
        const std::string path = node.Scalar();
        spec.location = resolve(base_dir, path);
        spec.id = path;
        auto dialect = dialect_of(spec.location);
        if (!dialect) {
            throw config_error(source, "cannot infer dialect of '" + path + "'", node);
        }
        spec.dialect = *dialect;
        return spec;
    }

    if (!node.IsMap()) {
        throw config_error(source, "source must be a mapping or a path", node);
    }

    const auto path_node = node["path"];
    if (!path_node) {
        throw config_error(source, "source requires 'path'", node);
    }
    const std::string path = scalar(source, path_node, "path");
    if (path.empty()) {
        throw config_error(source, "source 'path' must not be empty", path_node);
    }
    spec.location = resolve(base_dir, path);

    if (const auto d = node["dialect"]) {
        try {
            spec.dialect = rule::parse_dialect(scalar(source, d, "dialect"));
        } catch (const std::invalid_argument& e) {
            throw config_error(source, e.what(), d);
        }
    } else {
        auto dialect = dialect_of(spec.location);
        if (!dialect) {
            throw config_error(source, "cannot infer dialect of '" + path + "', set 'dialect'",
                               node);
        }
        spec.dialect = *dialect;
    }

    spec.id = path;
    if (const auto id = node["id"]) {
        spec.id = scalar(source, id, "id");
    }
    return spec;
}

rule::GroupSpec parse_group(const std::string& source, const YAML::Node& node,
                            const std::filesystem::path& base_dir) {
    if (!node.IsMap()) {
        throw config_error(source, "group must be a mapping", node);
    }

    rule::GroupSpec group;
    const auto name = node["name"];
    if (!name) {
        throw config_error(source, "group requires 'name'", node);
    }
    group.name = scalar(source, name, "name");

    const auto sources = node["sources"];
    if (!sources || !sources.IsSequence()) {
        throw config_error(source, "group '" + group.name + "' requires a 'sources' list", node);
    }
    for (const auto& item : sources) {
        group.sources.push_back(parse_source(source, item, base_dir));
    }
    return group;
}

Config parse_document(const YAML::Node& root, const std::filesystem::path& base_dir,
                      const std::string& source) {
    Config cfg;

    if (root.IsNull()) {
        return cfg;
    }
    if (!root.IsMap()) {
        throw config_error(source, "configuration must be a mapping", root);
    }

    if (const auto n = root["output"]) {
        cfg.output = resolve(base_dir, scalar(source, n, "output"));
    }
    if (const auto n = root["state"]) {
        cfg.state = resolve(base_dir, scalar(source, n, "state"));
    }
    if (const auto n = root["structured_version"]) {
        cfg.structured_version = n.as<int>();
        if (cfg.structured_version < 1) {
            throw config_error(source, "'structured_version' must be positive", n);
        }
    }
    if (const auto n = root["sections"]) {
        cfg.sections = n.as<bool>();
    }
    if (const auto n = root["classifier"]) {
        parse_classifier(source, n, cfg.classifier);
    }
    if (const auto n = root["groups"]) {
        if (!n.IsSequence()) {
            throw config_error(source, "'groups' must be a list", n);
        }
        for (const auto& item : n) {
            cfg.groups.push_back(parse_group(source, item, base_dir));
        }
    }

    if (auto err = validate_groups(cfg.groups)) {
        err->source = source;
        throw rule::RuleError(std::move(*err));
    }
    return cfg;
}

}  // namespace

// ============================================================================
// Загрузка
// ============================================================================

LoadResult parse_config(const std::string& text, const std::filesystem::path& base_dir,
                        const std::string& source_name) {
    LoadResult result;

    try {
        const YAML::Node root = YAML::Load(text);
        result.config = parse_document(root, base_dir, source_name);
        result.ok = true;
    } catch (const rule::RuleError& e) {
        result.error = e.error();
    } catch (const YAML::Exception& e) {
        result.error.kind = rule::ErrorKind::Config;
        result.error.source = source_name;
        result.error.message = e.msg;
        if (e.mark.line >= 0) {
            result.error.line = static_cast<std::size_t>(e.mark.line) + 1;
        }
    }

    return result;
}

LoadResult load_config(const std::filesystem::path& file) {
    const std::string source = platform::path_to_utf8(file);

    std::string text;
    std::error_code ec;
    if (!platform::read_file(file, text, ec)) {
        LoadResult result;
        result.error = rule::Error{rule::ErrorKind::Config,
                                   "failed to read configuration - " + ec.message(), source,
                                   std::nullopt};
        return result;
    }

    return parse_config(text, file.parent_path(), source);
}

// ============================================================================
// Группы из путей
// ============================================================================

GroupsResult groups_from_paths(const std::vector<std::filesystem::path>& inputs) {
    GroupsResult result;

    io::DiscoveryOptions opt;
    opt.extensions = io::source_extensions();

    std::vector<std::filesystem::path> files;
    try {
        files = io::discover_files(inputs, opt);
    } catch (const std::runtime_error& e) {
        result.error = rule::Error{rule::ErrorKind::Config, e.what(), "", std::nullopt};
        return result;
    }

    // std::map: группы по имени; файлы уже отсортированы
    std::map<std::string, rule::GroupSpec> by_name;
    for (const auto& file : files) {
        auto dialect = dialect_of(file);
        if (!dialect) {
            continue;
        }

        const std::string name = platform::path_to_utf8(file.stem());
        rule::GroupSpec& group = by_name[name];
        group.name = name;

        rule::SourceSpec spec;
        spec.location = file.lexically_normal();
        spec.id = platform::path_to_utf8(spec.location);
        spec.dialect = *dialect;
        group.sources.push_back(std::move(spec));
    }

    for (auto& kv : by_name) {
        result.groups.push_back(std::move(kv.second));
    }

    if (auto err = validate_groups(result.groups)) {
        result.error = std::move(*err);
        result.groups.clear();
        return result;
    }

    result.ok = true;
    return result;
}

// ============================================================================
// Проверка
// ============================================================================

bool is_valid_group_name(std::string_view name) {
    if (name.empty() || name == "." || name == "..") {
        return false;
    }
    for (char c : name) {
        const auto byte = static_cast<unsigned char>(c);
        if (c == '/' || c == '\\' || c == ':' || byte < 0x20 || byte == 0x7F) {
            return false;
        }
    }
    return true;
}

std::optional<rule::Error> validate_groups(const std::vector<rule::GroupSpec>& groups) {
    auto make = [](std::string message) {
        return rule::Error{rule::ErrorKind::Config, std::move(message), "", std::nullopt};
    };

    std::set<std::string> names;
    for (const auto& group : groups) {
        if (!is_valid_group_name(group.name)) {
            return make("invalid group name '" + group.name + "'");
        }
        if (!names.insert(group.name).second) {
            return make("duplicate group name '" + group.name + "'");
        }
        if (group.sources.empty()) {
            return make("group '" + group.name + "' has no sources");
        }

        std::set<std::string> ids;
        for (const auto& source : group.sources) {
            if (source.id.empty()) {
                return make("group '" + group.name + "' has a source with an empty id");
            }
            if (!ids.insert(source.id).second) {
                return make("group '" + group.name + "' lists source '" + source.id + "' twice");
            }
        }
    }
    return std::nullopt;
}

}  // namespace ruleforge::config
