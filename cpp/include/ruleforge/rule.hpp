// ==============================================================================
// ruleforge/rule.hpp - Модель правил
// ==============================================================================
//
// Назначение:
// - Типы правил (RuleKind) и их имена во всех форматах
// - RuleEntry / RuleGroup - нормализованные правила и группы
// - Описание источников и групп (SourceSpec, GroupSpec)
// - Таксономия ошибок (ErrorKind, Error)
//
// ==============================================================================

#ifndef RULEFORGE_RULE_HPP
#define RULEFORGE_RULE_HPP

#include <array>
#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>
#include <tuple>
#include <utility>
#include <vector>

namespace ruleforge::rule {

// ============================================================================
// RuleKind
// ============================================================================

/// Тип правила
/// Порядок перечисления задаёт порядок сортировки в группе и в артефактах.
enum class RuleKind : std::uint8_t {
    ExactDomain,
    DomainSuffix,
    Keyword,
    IPv4Cidr,
    IPv6Cidr,
};

constexpr std::size_t RULE_KIND_COUNT = 5;

/// Все типы в порядке сортировки
constexpr std::array<RuleKind, RULE_KIND_COUNT> ALL_RULE_KINDS = {
    RuleKind::ExactDomain, RuleKind::DomainSuffix, RuleKind::Keyword, RuleKind::IPv4Cidr,
    RuleKind::IPv6Cidr};

/// Имя для логов и отчётов: "exact-domain", "domain-suffix", ...
std::string to_string(RuleKind k);

/// Тип строки в формате Clash/Surge: DOMAIN, DOMAIN-SUFFIX, DOMAIN-KEYWORD,
/// IP-CIDR, IP-CIDR6
std::string_view list_type(RuleKind k);

/// Ключ в структурированном артефакте (sing-box): domain, domain_suffix,
/// domain_keyword, ip_cidr
std::string_view structured_key(RuleKind k);

/// Разобрать RuleKind из имени для конфигурации.
/// Принимает "exact"/"exact-domain", "suffix"/"domain-suffix", "keyword",
/// "ipv4"/"ip-cidr", "ipv6"/"ip-cidr6".
/// @throw std::invalid_argument если строка не распознана
RuleKind parse_kind(std::string_view s);

/// Индекс типа (для массивов счётчиков)
constexpr std::size_t kind_index(RuleKind k) {
    return static_cast<std::size_t>(k);
}

// ============================================================================
// RuleEntry / RuleGroup
// ============================================================================

/// Одно нормализованное правило
struct RuleEntry {
    RuleKind kind = RuleKind::ExactDomain;
    std::string value;

    bool operator==(const RuleEntry& other) const {
        return kind == other.kind && value == other.value;
    }
    bool operator!=(const RuleEntry& other) const { return !(*this == other); }

    /// Канонический порядок: тип, затем лексикографически value
    bool operator<(const RuleEntry& other) const {
        return std::tie(kind, value) < std::tie(other.kind, other.value);
    }
};

/// "DOMAIN,example.com"
std::string format_entry(const RuleEntry& e);

/// Именованная группа правил (один набор артефактов)
/// entries уникальны по (kind, value) и отсортированы.
struct RuleGroup {
    std::string name;
    std::vector<RuleEntry> entries;

    /// Количество правил заданного типа
    std::size_t count(RuleKind k) const;

    /// Счётчики по всем типам (индекс = kind_index)
    std::array<std::size_t, RULE_KIND_COUNT> counts() const;
};

// ============================================================================
// Источники и группы
// ============================================================================

/// Диалект исходного файла. Набор закрыт, диалект задаётся явно.
enum class Dialect {
    List,  // один токен на строку, комментарии, пустые строки
    Yaml,  // mapping-of-lists (YAML или JSON)
};

std::string to_string(Dialect d);

/// @throw std::invalid_argument если строка не распознана
Dialect parse_dialect(std::string_view s);

/// Диалект по расширению файла (без точки): list/txt/conf -> List,
/// yaml/yml/json -> Yaml
std::optional<Dialect> dialect_from_extension(std::string_view ext);

/// Описание одного источника
struct SourceSpec {
    std::string id;                  // стабильный идентификатор (ключ fingerprint)
    std::filesystem::path location;  // путь к файлу
    Dialect dialect = Dialect::List;
};

/// Описание группы: имя + источники
struct GroupSpec {
    std::string name;
    std::vector<SourceSpec> sources;
};

// ============================================================================
// Error handling
// ============================================================================

/// Категории ошибок
enum class ErrorKind {
    Fetch,           // источник не получен (коллаборатор)
    Parse,           // структура источника некорректна - фатально для источника
    Classification,  // строка не распознана - строка пропускается
    Emission,        // ошибка записи артефакта - фатально для группы
    Compile,         // внешний компилятор не отработал - фатально для группы
    Config,          // некорректная конфигурация
};

std::string to_string(ErrorKind k);

/// Ошибка с привязкой к источнику/группе
struct Error {
    ErrorKind kind = ErrorKind::Parse;
    std::string message;
    std::string source;               // id источника или имя группы
    std::optional<std::size_t> line;  // номер строки (1-based), если известен

    /// "parse error [emby.yaml:12]: <message>"
    std::string format() const;
};

/// Исключение-носитель Error
/// Используется внутри модулей; на границе модуля превращается в Error результата.
class RuleError : public std::runtime_error {
public:
    explicit RuleError(Error error) : std::runtime_error(error.format()), error_(std::move(error)) {}

    const Error& error() const noexcept { return error_; }

private:
    Error error_;
};

}  // namespace ruleforge::rule

#endif  // RULEFORGE_RULE_HPP
