// ==============================================================================
// rule.cpp - Модель правил
// ==============================================================================

#include <ruleforge/rule.hpp>

#include <sstream>
#include <stdexcept>

namespace ruleforge::rule {

// ============================================================================
// RuleKind
// ============================================================================

std::string to_string(RuleKind k) {
    switch (k) {
    case RuleKind::ExactDomain:
        return "exact-domain";
    case RuleKind::DomainSuffix:
        return "domain-suffix";
    case RuleKind::Keyword:
        return "keyword";
    case RuleKind::IPv4Cidr:
        return "ipv4-cidr";
    case RuleKind::IPv6Cidr:
        return "ipv6-cidr";
    }
    return "unknown";
}

std::string_view list_type(RuleKind k) {
    switch (k) {
    case RuleKind::ExactDomain:
        return "DOMAIN";
    case RuleKind::DomainSuffix:
        return "DOMAIN-SUFFIX";
    case RuleKind::Keyword:
        return "DOMAIN-KEYWORD";
    case RuleKind::IPv4Cidr:
        return "IP-CIDR";
    case RuleKind::IPv6Cidr:
        return "IP-CIDR6";
    }
    return "UNKNOWN";
}

std::string_view structured_key(RuleKind k) {
    switch (k) {
    case RuleKind::ExactDomain:
        return "domain";
    case RuleKind::DomainSuffix:
        return "domain_suffix";
    case RuleKind::Keyword:
        return "domain_keyword";
    case RuleKind::IPv4Cidr:
    case RuleKind::IPv6Cidr:
        return "ip_cidr";
    }
    return "unknown";
}

RuleKind parse_kind(std::string_view s) {
    if (s == "exact" || s == "exact-domain")
        return RuleKind::ExactDomain;
    if (s == "suffix" || s == "domain-suffix")
        return RuleKind::DomainSuffix;
    if (s == "keyword")
        return RuleKind::Keyword;
    if (s == "ipv4" || s == "ip-cidr")
        return RuleKind::IPv4Cidr;
    if (s == "ipv6" || s == "ip-cidr6")
        return RuleKind::IPv6Cidr;
    throw std::invalid_argument("unknown rule kind '" + std::string(s) +
                                "', must be: exact, suffix, keyword, ipv4 or ipv6");
}

// ============================================================================
// RuleEntry / RuleGroup
// ============================================================================

std::string format_entry(const RuleEntry& e) {
    std::string out(list_type(e.kind));
    out += ',';
    out += e.value;
    return out;
}

std::size_t RuleGroup::count(RuleKind k) const {
    std::size_t n = 0;
    for (const auto& e : entries) {
        if (e.kind == k) {
            ++n;
        }
    }
    return n;
}

std::array<std::size_t, RULE_KIND_COUNT> RuleGroup::counts() const {
    std::array<std::size_t, RULE_KIND_COUNT> result{};
    for (const auto& e : entries) {
        ++result[kind_index(e.kind)];
    }
    return result;
}

// ============================================================================
// Dialect
// ============================================================================

std::string to_string(Dialect d) {
    switch (d) {
    case Dialect::List:
        return "list";
    case Dialect::Yaml:
        return "yaml";
    }
    return "unknown";
}

Dialect parse_dialect(std::string_view s) {
    if (s == "list" || s == "plain")
        return Dialect::List;
    if (s == "yaml" || s == "structured")
        return Dialect::Yaml;
    throw std::invalid_argument("unknown dialect '" + std::string(s) + "', must be: list or yaml");
}

std::optional<Dialect> dialect_from_extension(std::string_view ext) {
    if (ext == "list" || ext == "txt" || ext == "conf")
        return Dialect::List;
    if (ext == "yaml" || ext == "yml" || ext == "json")
        return Dialect::Yaml;
    return std::nullopt;
}

// ============================================================================
// Error formatting
// ============================================================================

std::string to_string(ErrorKind k) {
    switch (k) {
    case ErrorKind::Fetch:
        return "fetch";
    case ErrorKind::Parse:
        return "parse";
    case ErrorKind::Classification:
        return "classification";
    case ErrorKind::Emission:
        return "emission";
    case ErrorKind::Compile:
        return "compile";
    case ErrorKind::Config:
        return "config";
    }
    return "unknown";
}

std::string Error::format() const {
    std::ostringstream oss;
    oss << to_string(kind) << " error";
    if (!source.empty()) {
        oss << " [" << source;
        if (line) {
            oss << ":" << *line;
        }
        oss << "]";
    }
    oss << ": " << message;
    return oss.str();
}

}  // namespace ruleforge::rule
