// ==============================================================================
// classifier.cpp - Классификация и нормализация правил
// ==============================================================================

#include <ruleforge/classifier.hpp>

#include <algorithm>
#include <cctype>
#include <cstring>
#include <stdexcept>

#ifdef _WIN32
#include <winsock2.h>
#include <ws2tcpip.h>
#else
#include <arpa/inet.h>
#include <netinet/in.h>
#include <sys/socket.h>
#endif

namespace ruleforge::classify {

namespace {

using rule::RuleEntry;
using rule::RuleKind;

// RFC 1035: 253 символа в текстовой форме, 63 на метку
constexpr std::size_t MAX_DOMAIN_LENGTH = 253;
constexpr std::size_t MAX_LABEL_LENGTH = 63;

// ----------------------------------------------------------------------------
// Типизированные строки Clash / Surge / Quantumult X
// ----------------------------------------------------------------------------

struct TypedPrefix {
    std::string_view name;
    bool supported;
    RuleKind kind;
};

constexpr TypedPrefix TYPED_PREFIXES[] = {
    {"DOMAIN", true, RuleKind::ExactDomain},
    {"DOMAIN-SUFFIX", true, RuleKind::DomainSuffix},
    {"DOMAIN-KEYWORD", true, RuleKind::Keyword},
    {"IP-CIDR", true, RuleKind::IPv4Cidr},
    {"IP-CIDR6", true, RuleKind::IPv6Cidr},
    {"HOST", true, RuleKind::ExactDomain},
    {"HOST-SUFFIX", true, RuleKind::DomainSuffix},
    {"HOST-KEYWORD", true, RuleKind::Keyword},
    {"IP6-CIDR", true, RuleKind::IPv6Cidr},
    // Распознаются, но не представимы в RuleEntry
    {"PROCESS-NAME", false, RuleKind::ExactDomain},
    {"USER-AGENT", false, RuleKind::ExactDomain},
    {"URL-REGEX", false, RuleKind::ExactDomain},
    {"DOMAIN-REGEX", false, RuleKind::ExactDomain},
    {"DOMAIN-WILDCARD", false, RuleKind::ExactDomain},
    {"IP-ASN", false, RuleKind::ExactDomain},
    {"GEOIP", false, RuleKind::ExactDomain},
    {"GEOSITE", false, RuleKind::ExactDomain},
    {"SRC-IP-CIDR", false, RuleKind::ExactDomain},
    {"DST-PORT", false, RuleKind::ExactDomain},
    {"SRC-PORT", false, RuleKind::ExactDomain},
    {"RULE-SET", false, RuleKind::ExactDomain},
    {"AND", false, RuleKind::ExactDomain},
    {"OR", false, RuleKind::ExactDomain},
    {"NOT", false, RuleKind::ExactDomain},
};

const TypedPrefix* find_typed_prefix(std::string_view upper_name) {
    for (const auto& p : TYPED_PREFIXES) {
        if (p.name == upper_name) {
            return &p;
        }
    }
    return nullptr;
}

bool is_space(char c) {
    return std::isspace(static_cast<unsigned char>(c)) != 0;
}

bool is_host_char(char c) {
    return (c >= 'a' && c <= 'z') || (c >= '0' && c <= '9') || c == '-' || c == '_' || c == '.';
}

bool is_domain_kind(RuleKind k) {
    return k == RuleKind::ExactDomain || k == RuleKind::DomainSuffix;
}

Classification make_error(const parse::RawLine& raw, const std::string& source,
                           const std::string& message) {
    Classification c;
    c.outcome = Outcome::Error;
    c.error.kind = rule::ErrorKind::Classification;
    c.error.source = source;
    c.error.line = raw.line;
    c.error.message = message + " '" + std::string(parse::trim(raw.text)) + "'";
    return c;
}

Classification make_entry(RuleKind kind, std::string value) {
    Classification c;
    c.outcome = Outcome::Entry;
    c.entry = RuleEntry{kind, std::move(value)};
    return c;
}

/// Домен с заданным типом (для суффикса допускается ведущая точка)
Classification domain_entry(const parse::RawLine& raw, const std::string& source, RuleKind kind,
                            std::string_view token) {
    if (kind == RuleKind::DomainSuffix && !token.empty() && token.front() == '.') {
        token.remove_prefix(1);
    }
    auto domain = normalize_domain(token);
    if (!domain) {
        return make_error(raw, source, "invalid domain");
    }
    return make_entry(kind, std::move(*domain));
}

Classification keyword_entry(const parse::RawLine& raw, const std::string& source,
                             std::string_view token) {
    auto keyword = normalize_keyword(token);
    if (!keyword) {
        return make_error(raw, source, "invalid keyword");
    }
    return make_entry(RuleKind::Keyword, std::move(*keyword));
}

Classification cidr_entry(const parse::RawLine& raw, const std::string& source,
                          std::string_view token) {
    auto cidr = canonical_cidr(token);
    if (!cidr) {
        return make_error(raw, source, "invalid IP CIDR");
    }
    Classification c;
    c.outcome = Outcome::Entry;
    c.entry = std::move(*cidr);
    return c;
}

/// Значение с известным типом (тег диалекта или типизированная строка)
Classification typed_entry(const parse::RawLine& raw, const std::string& source, RuleKind kind,
                           std::string_view value) {
    switch (kind) {
    case RuleKind::ExactDomain:
    case RuleKind::DomainSuffix:
        return domain_entry(raw, source, kind, value);
    case RuleKind::Keyword:
        return keyword_entry(raw, source, value);
    case RuleKind::IPv4Cidr:
    case RuleKind::IPv6Cidr:
        // Семейство определяется адресом, а не именем типа
        return cidr_entry(raw, source, value);
    }
    return make_error(raw, source, "unrecognized rule");
}

/// Разобрать "TYPE,value[,options]" или "TYPE value"
/// @return nullopt если строка не начинается с известного типа
std::optional<Classification> classify_typed_line(const parse::RawLine& raw,
                                                  const std::string& source,
                                                  std::string_view text) {
    std::size_t sep = text.find_first_of(", \t");
    if (sep == std::string_view::npos || sep == 0) {
        return std::nullopt;
    }

    std::string type_name(text.substr(0, sep));
    std::transform(type_name.begin(), type_name.end(), type_name.begin(),
                   [](unsigned char c) { return static_cast<char>(std::toupper(c)); });

    const TypedPrefix* prefix = find_typed_prefix(type_name);
    if (prefix == nullptr) {
        return std::nullopt;
    }
    if (!prefix->supported) {
        return make_error(raw, source, "unsupported rule type " + type_name);
    }

    std::string_view rest = text.substr(sep);
    while (!rest.empty() && (rest.front() == ',' || is_space(rest.front()))) {
        rest.remove_prefix(1);
    }
    std::size_t value_end = rest.find_first_of(", \t");
    std::string_view value = rest.substr(0, value_end);
    if (value.empty()) {
        return make_error(raw, source, "missing value for " + type_name);
    }

    return typed_entry(raw, source, prefix->kind, value);
}

// ----------------------------------------------------------------------------
// CIDR helpers
// ----------------------------------------------------------------------------

std::optional<unsigned> parse_mask(std::string_view s) {
    if (s.empty() || s.size() > 3) {
        return std::nullopt;
    }
    unsigned value = 0;
    for (char c : s) {
        if (c < '0' || c > '9') {
            return std::nullopt;
        }
        value = value * 10 + static_cast<unsigned>(c - '0');
    }
    return value;
}

void clear_host_bits(unsigned char* bytes, std::size_t size, unsigned prefix) {
    for (std::size_t i = 0; i < size; ++i) {
        std::size_t bit_start = i * 8;
        if (bit_start >= prefix) {
            bytes[i] = 0;
        } else if (bit_start + 8 > prefix) {
            unsigned keep = prefix - static_cast<unsigned>(bit_start);
            bytes[i] = static_cast<unsigned char>(bytes[i] & (0xFFu << (8 - keep)));
        }
    }
}

}  // namespace

// ============================================================================
// Опции
// ============================================================================

void validate(const ClassifierOptions& options) {
    if (!is_domain_kind(options.bare_domain)) {
        throw std::invalid_argument("bare domain kind must be exact or suffix");
    }
    if (!is_domain_kind(options.leading_dot)) {
        throw std::invalid_argument("leading dot kind must be exact or suffix");
    }
    if (is_host_char(options.keyword_marker) || is_space(options.keyword_marker)) {
        throw std::invalid_argument("keyword marker must not be a hostname character");
    }
    for (const auto& marker : options.suffix_markers) {
        if (marker.empty()) {
            throw std::invalid_argument("suffix marker must not be empty");
        }
    }
}

// ============================================================================
// Нормализация
// ============================================================================

std::string_view strip_inline_comment(std::string_view text, std::string_view marker) {
    if (marker.empty()) {
        return text;
    }
    std::size_t pos = text.find(marker);
    while (pos != std::string_view::npos) {
        if (pos == 0 || is_space(text[pos - 1])) {
            return text.substr(0, pos);
        }
        pos = text.find(marker, pos + 1);
    }
    return text;
}

std::string to_lower(std::string_view s) {
    std::string out(s);
    std::transform(out.begin(), out.end(), out.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return out;
}

std::optional<std::string> normalize_domain(std::string_view token) {
    std::string domain = to_lower(token);

    // FQDN: одна завершающая точка допустима
    if (!domain.empty() && domain.back() == '.') {
        domain.pop_back();
    }
    if (domain.empty() || domain.size() > MAX_DOMAIN_LENGTH) {
        return std::nullopt;
    }

    std::size_t label_len = 0;
    for (char c : domain) {
        if (!is_host_char(c)) {
            return std::nullopt;
        }
        if (c == '.') {
            if (label_len == 0) {
                return std::nullopt;  // пустая метка: "..", ведущая точка
            }
            label_len = 0;
        } else if (++label_len > MAX_LABEL_LENGTH) {
            return std::nullopt;
        }
    }
    if (label_len == 0) {
        return std::nullopt;
    }
    return domain;
}

std::optional<std::string> normalize_keyword(std::string_view token) {
    std::string keyword = to_lower(token);
    if (keyword.empty() || keyword.size() > MAX_DOMAIN_LENGTH) {
        return std::nullopt;
    }
    for (char c : keyword) {
        if (!is_host_char(c)) {
            return std::nullopt;
        }
    }
    return keyword;
}

bool looks_numeric_address(std::string_view token) {
    if (token.empty()) {
        return false;
    }
    for (char c : token) {
        if (!((c >= '0' && c <= '9') || c == '.' || c == ':' || c == '/')) {
            return false;
        }
    }
    return true;
}

std::optional<rule::RuleEntry> canonical_cidr(std::string_view token) {
    std::string_view addr = token;
    std::optional<unsigned> mask;

    std::size_t slash = token.find('/');
    if (slash != std::string_view::npos) {
        addr = token.substr(0, slash);
        mask = parse_mask(token.substr(slash + 1));
        if (!mask) {
            return std::nullopt;
        }
    }
    if (addr.empty()) {
        return std::nullopt;
    }

    const bool v6 = addr.find(':') != std::string_view::npos;
    const int family = v6 ? AF_INET6 : AF_INET;
    const unsigned max_bits = v6 ? 128 : 32;
    const std::size_t size = v6 ? 16 : 4;

    if (mask && *mask > max_bits) {
        return std::nullopt;
    }
    const unsigned prefix = mask.value_or(max_bits);

    const std::string addr_str(addr);
    unsigned char bytes[16] = {};
    if (inet_pton(family, addr_str.c_str(), bytes) != 1) {
        return std::nullopt;
    }
    clear_host_bits(bytes, size, prefix);

    char text[INET6_ADDRSTRLEN] = {};
    if (inet_ntop(family, bytes, text, sizeof(text)) == nullptr) {
        return std::nullopt;
    }

    RuleEntry entry;
    entry.kind = v6 ? RuleKind::IPv6Cidr : RuleKind::IPv4Cidr;
    entry.value = std::string(text) + "/" + std::to_string(prefix);
    return entry;
}

// ============================================================================
// classify
// ============================================================================

Classification classify(const parse::RawLine& raw, const std::string& source,
                        const ClassifierOptions& options) {
    std::string_view text = parse::trim(raw.text);
    text = parse::trim(strip_inline_comment(text, options.comment_marker));
    if (text.empty()) {
        Classification skip;
        skip.outcome = Outcome::Skip;
        return skip;
    }

    // 1. Явный тег структурированного диалекта
    switch (raw.tag) {
    case parse::Tag::Domain:
        return domain_entry(raw, source, RuleKind::ExactDomain, text);
    case parse::Tag::DomainSuffix:
        return domain_entry(raw, source, RuleKind::DomainSuffix, text);
    case parse::Tag::DomainKeyword:
        return keyword_entry(raw, source, text);
    case parse::Tag::IpCidr:
        return cidr_entry(raw, source, text);
    case parse::Tag::None:
        break;
    }

    // 2. Типизированная строка
    if (auto typed = classify_typed_line(raw, source, text)) {
        return std::move(*typed);
    }

    // 3. Форма токена
    if (auto cidr = canonical_cidr(text)) {
        Classification c;
        c.outcome = Outcome::Entry;
        c.entry = std::move(*cidr);
        return c;
    }
    if (looks_numeric_address(text)) {
        return make_error(raw, source, "invalid IP CIDR");
    }

    const char km = options.keyword_marker;
    if (text.size() >= 3 && text.front() == km && text.back() == km) {
        return keyword_entry(raw, source, text.substr(1, text.size() - 2));
    }

    for (const auto& marker : options.suffix_markers) {
        if (text.size() > marker.size() && text.substr(0, marker.size()) == marker) {
            std::string_view domain = text.substr(marker.size());
            if (marker == "||" && !domain.empty() && domain.back() == '^') {
                domain.remove_suffix(1);
            }
            return domain_entry(raw, source, RuleKind::DomainSuffix, domain);
        }
    }

    if (text.front() == '.') {
        auto domain = normalize_domain(text.substr(1));
        if (!domain) {
            return make_error(raw, source, "invalid domain");
        }
        return make_entry(options.leading_dot, std::move(*domain));
    }

    auto domain = normalize_domain(text);
    if (!domain) {
        return make_error(raw, source, "unrecognized rule");
    }
    return make_entry(options.bare_domain, std::move(*domain));
}

}  // namespace ruleforge::classify
