// ==============================================================================
// emitter.cpp - Артефакты группы правил
// ==============================================================================

#include <ruleforge/emitter.hpp>
#include <ruleforge/platform.hpp>

#include <string_view>

#include <rapidjson/document.h>
#include <rapidjson/prettywriter.h>
#include <rapidjson/stringbuffer.h>

namespace ruleforge::emit {

namespace {

/// Порядок ключей в правиле sing-box
constexpr std::string_view STRUCTURED_KEYS[] = {"domain", "domain_suffix", "domain_keyword",
                                                "ip_cidr"};

}  // namespace

ArtifactPaths artifact_paths(const std::filesystem::path& output_dir, const std::string& name) {
    ArtifactPaths paths;
    paths.list = output_dir / platform::path_from_utf8(name + ".list");
    paths.structured = output_dir / platform::path_from_utf8(name + ".json");
    paths.binary = output_dir / platform::path_from_utf8(name + ".srs");
    return paths;
}

// ============================================================================
// Плоский список
// ============================================================================

std::string render_list(const rule::RuleGroup& group, const EmitOptions& options) {
    const auto counts = group.counts();

    std::string out;
    out += "# NAME: " + group.name + "\n";
    for (rule::RuleKind k : rule::ALL_RULE_KINDS) {
        const std::size_t n = counts[rule::kind_index(k)];
        if (n > 0) {
            out += "# " + std::string(rule::list_type(k)) + ": " + std::to_string(n) + "\n";
        }
    }
    out += "# TOTAL: " + std::to_string(group.entries.size()) + "\n";

    // entries отсортированы по типу: секция начинается при смене типа
    bool first = true;
    rule::RuleKind current = rule::RuleKind::ExactDomain;
    for (const auto& entry : group.entries) {
        if (first || entry.kind != current) {
            out += "\n";
            if (options.sections) {
                out += "# " + std::string(rule::list_type(entry.kind)) + "\n";
            }
            current = entry.kind;
            first = false;
        }
        out += rule::format_entry(entry);
        out += "\n";
    }
    return out;
}

// ============================================================================
// Структурированный артефакт
// ============================================================================

std::string render_structured(const rule::RuleGroup& group, const EmitOptions& options) {
    rapidjson::Document doc;
    doc.SetObject();
    auto& alloc = doc.GetAllocator();

    doc.AddMember("version", options.structured_version, alloc);

    rapidjson::Value rules(rapidjson::kArrayType);
    if (!group.entries.empty()) {
        rapidjson::Value rule_obj(rapidjson::kObjectType);

        // IPv4Cidr и IPv6Cidr делят ключ ip_cidr; entries отсортированы по
        // типу, поэтому v4 идёт раньше v6
        for (const std::string_view key : STRUCTURED_KEYS) {
            rapidjson::Value values(rapidjson::kArrayType);
            for (const auto& entry : group.entries) {
                if (rule::structured_key(entry.kind) == key) {
                    rapidjson::Value value(entry.value.c_str(),
                                           static_cast<rapidjson::SizeType>(entry.value.size()),
                                           alloc);
                    values.PushBack(value, alloc);
                }
            }
            if (values.Empty()) {
                continue;
            }
            rapidjson::Value name(key.data(), static_cast<rapidjson::SizeType>(key.size()), alloc);
            rule_obj.AddMember(name, values, alloc);
        }
        rules.PushBack(rule_obj, alloc);
    }
    doc.AddMember("rules", rules, alloc);

    rapidjson::StringBuffer buffer;
    rapidjson::PrettyWriter<rapidjson::StringBuffer> writer(buffer);
    writer.SetIndent(' ', 2);
    doc.Accept(writer);

    std::string out(buffer.GetString(), buffer.GetSize());
    out += "\n";
    return out;
}

}  // namespace ruleforge::emit
