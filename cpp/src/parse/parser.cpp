// ==============================================================================
// parser.cpp - Разбор исходных списков правил
// ==============================================================================
//
// List - потоковый проход по байтам без копирования строк до next().
// Yaml - yaml-cpp; структура проверяется целиком при открытии, next() только
//        обходит проверенные последовательности.
//
// ==============================================================================

#include <ruleforge/parser.hpp>

#include <utility>
#include <yaml-cpp/yaml.h>

namespace ruleforge::parse {

namespace {

constexpr std::string_view UTF8_BOM = "\xEF\xBB\xBF";

constexpr std::string_view RULE_KEYS =
    "rule keys (domain, domain_suffix, domain_keyword, ip_cidr, payload)";

bool is_space(char c) {
    return c == ' ' || c == '\t' || c == '\r' || c == '\n' || c == '\f' || c == '\v';
}

// ============================================================================
// ListReader
// ============================================================================

class ListReader final : public LineReader {
public:
    ListReader(std::string source_id, std::string bytes, ParserOptions options)
        : LineReader(std::move(source_id)), bytes_(std::move(bytes)),
          options_(std::move(options)) {
        if (std::string_view(bytes_).substr(0, UTF8_BOM.size()) == UTF8_BOM) {
            pos_ = UTF8_BOM.size();
        }
    }

    bool next(RawLine& out) override {
        while (pos_ < bytes_.size()) {
            std::size_t end = bytes_.find('\n', pos_);
            if (end == std::string::npos) {
                end = bytes_.size();
            }

            std::string_view line(bytes_.data() + pos_, end - pos_);
            pos_ = end + 1;
            ++line_no_;

            // CRLF
            if (!line.empty() && line.back() == '\r') {
                line.remove_suffix(1);
            }

            std::string_view body = trim(line);
            if (body.empty()) {
                continue;
            }
            if (!options_.comment_marker.empty() &&
                body.substr(0, options_.comment_marker.size()) == options_.comment_marker) {
                continue;
            }

            out.text = std::string(line);
            out.line = line_no_;
            out.tag = Tag::None;
            return true;
        }
        return false;
    }

    rule::Dialect dialect() const override { return rule::Dialect::List; }

private:
    std::string bytes_;
    ParserOptions options_;
    std::size_t pos_ = 0;
    std::size_t line_no_ = 0;
};

// ============================================================================
// YamlReader
// ============================================================================

/// Проверенная последовательность значений под одним ключом
struct TaggedNode {
    Tag tag = Tag::None;
    YAML::Node node;  // Sequence или Scalar
};

class YamlReader final : public LineReader {
public:
    YamlReader(std::string source_id, std::vector<TaggedNode> nodes,
               std::vector<std::string> ignored)
        : LineReader(std::move(source_id)), nodes_(std::move(nodes)) {
        ignored_keys_ = std::move(ignored);
    }

    bool next(RawLine& out) override {
        while (node_idx_ < nodes_.size()) {
            const TaggedNode& current = nodes_[node_idx_];

            if (current.node.IsScalar()) {
                if (item_idx_ == 0) {
                    ++item_idx_;
                    fill(out, current.tag, current.node);
                    return true;
                }
            } else if (item_idx_ < current.node.size()) {
                YAML::Node item = current.node[item_idx_];
                ++item_idx_;
                fill(out, current.tag, item);
                return true;
            }

            ++node_idx_;
            item_idx_ = 0;
        }
        return false;
    }

    rule::Dialect dialect() const override { return rule::Dialect::Yaml; }

private:
    static void fill(RawLine& out, Tag tag, const YAML::Node& node) {
        out.text = node.Scalar();
        out.line = static_cast<std::size_t>(node.Mark().line) + 1;
        out.tag = tag;
    }

    std::vector<TaggedNode> nodes_;
    std::size_t node_idx_ = 0;
    std::size_t item_idx_ = 0;
};

rule::RuleError parse_error(const std::string& source, const std::string& message,
                            const YAML::Node& at) {
    rule::Error err;
    err.kind = rule::ErrorKind::Parse;
    err.source = source;
    err.message = message;
    if (at.IsDefined() && at.Mark().line >= 0) {
        err.line = static_cast<std::size_t>(at.Mark().line) + 1;
    }
    return rule::RuleError(std::move(err));
}

YAML::Node load_document(const std::string& source, const std::string& bytes) {
    try {
        return YAML::Load(bytes);
    } catch (const YAML::ParserException& e) {
        rule::Error err;
        err.kind = rule::ErrorKind::Parse;
        err.source = source;
        err.message = e.msg;
        err.line = static_cast<std::size_t>(e.mark.line) + 1;
        throw rule::RuleError(std::move(err));
    }
}

/// Проверить один mapping-of-lists и добавить его последовательности
/// @return число распознанных ключей
std::size_t collect_rule_map(const std::string& source, const YAML::Node& map,
                             std::vector<TaggedNode>& nodes, std::vector<std::string>& ignored) {
    if (!map.IsMap()) {
        throw parse_error(source, "rule set must be a mapping of lists", map);
    }

    std::size_t recognized = 0;
    for (const auto& kv : map) {
        if (!kv.first.IsScalar()) {
            throw parse_error(source, "mapping key must be a string", kv.first);
        }
        const std::string key = kv.first.Scalar();

        auto tag = tag_from_key(key);
        if (!tag) {
            ignored.push_back(key);
            continue;
        }
        ++recognized;

        const YAML::Node& value = kv.second;
        if (value.IsNull()) {
            // "domain:" без значений - пустой список
            continue;
        }
        if (value.IsScalar()) {
            nodes.push_back(TaggedNode{*tag, value});
            continue;
        }
        if (!value.IsSequence()) {
            throw parse_error(source, "key '" + key + "' must hold a list of strings", value);
        }
        for (const auto& item : value) {
            if (!item.IsScalar()) {
                throw parse_error(source, "key '" + key + "' holds a non-string payload", item);
            }
        }
        nodes.push_back(TaggedNode{*tag, value});
    }
    return recognized;
}

}  // namespace

// ============================================================================
// Tag
// ============================================================================

std::string to_string(Tag t) {
    switch (t) {
    case Tag::None:
        return "none";
    case Tag::Domain:
        return "domain";
    case Tag::DomainSuffix:
        return "domain_suffix";
    case Tag::DomainKeyword:
        return "domain_keyword";
    case Tag::IpCidr:
        return "ip_cidr";
    }
    return "unknown";
}

std::optional<Tag> tag_from_key(std::string_view key) {
    std::string normalized(key);
    for (auto& c : normalized) {
        if (c == '-') {
            c = '_';
        }
    }

    if (normalized == "domain")
        return Tag::Domain;
    if (normalized == "domain_suffix")
        return Tag::DomainSuffix;
    if (normalized == "domain_keyword")
        return Tag::DomainKeyword;
    if (normalized == "ip_cidr")
        return Tag::IpCidr;
    // rule-provider mihomo: тип каждой строки определяет классификатор
    if (normalized == "payload")
        return Tag::None;
    return std::nullopt;
}

std::string_view trim(std::string_view s) {
    while (!s.empty() && is_space(s.front())) {
        s.remove_prefix(1);
    }
    while (!s.empty() && is_space(s.back())) {
        s.remove_suffix(1);
    }
    return s;
}

// ============================================================================
// Фабрики
// ============================================================================

std::unique_ptr<LineReader> create_list_reader(std::string source_id, std::string bytes,
                                               const ParserOptions& options) {
    return std::make_unique<ListReader>(std::move(source_id), std::move(bytes), options);
}

std::unique_ptr<LineReader> create_yaml_reader(std::string source_id, const std::string& bytes) {
    const YAML::Node root = load_document(source_id, bytes);

    std::vector<TaggedNode> nodes;
    std::vector<std::string> ignored;

    if (root.IsNull()) {
        // Пустой документ - пустой источник
        return std::make_unique<YamlReader>(std::move(source_id), std::move(nodes),
                                            std::move(ignored));
    }
    if (!root.IsMap()) {
        throw parse_error(source_id, "document must be a mapping", root);
    }

    const YAML::Node rules = root["rules"];
    if (rules) {
        // Обёртка sing-box: {version: N, rules: [ {...}, ... ]}
        if (!rules.IsSequence()) {
            throw parse_error(source_id, "'rules' must be a list of mappings", rules);
        }
        std::size_t recognized = 0;
        for (const auto& item : rules) {
            recognized += collect_rule_map(source_id, item, nodes, ignored);
        }
        // "rules": [] - явно пустой набор
        if (rules.size() > 0 && recognized == 0) {
            throw parse_error(source_id, "'rules' holds no " + std::string(RULE_KEYS), rules);
        }
        for (const auto& kv : root) {
            const std::string key = kv.first.as<std::string>("");
            if (key != "rules" && key != "version") {
                ignored.push_back(key);
            }
        }
    } else if (collect_rule_map(source_id, root, nodes, ignored) == 0) {
        throw parse_error(source_id, "document holds no " + std::string(RULE_KEYS), root);
    }

    return std::make_unique<YamlReader>(std::move(source_id), std::move(nodes),
                                        std::move(ignored));
}

OpenResult LineReader::open(std::string source_id, std::string bytes, rule::Dialect dialect,
                            const ParserOptions& options) {
    OpenResult result;

    try {
        switch (dialect) {
        case rule::Dialect::List:
            result.reader = create_list_reader(source_id, std::move(bytes), options);
            break;
        case rule::Dialect::Yaml:
            result.reader = create_yaml_reader(source_id, bytes);
            break;
        }
        result.ok = true;
    } catch (const rule::RuleError& e) {
        result.error = e.error();
    } catch (const YAML::Exception& e) {
        result.error = rule::Error{rule::ErrorKind::Parse, e.what(), source_id, std::nullopt};
    }

    return result;
}

}  // namespace ruleforge::parse
