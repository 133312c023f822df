// ==============================================================================
// ruleforge/classifier.hpp - Классификация и нормализация правил
// ==============================================================================
//
// Назначение:
// - RawLine -> RuleEntry | пропуск | ClassificationError
// - Нормализация: trim, удаление inline-комментариев, нижний регистр доменов,
//   каноническая CIDR-нотация
//
// Приоритет классификации:
// 1. Явный тег структурированного диалекта
// 2. Типизированная строка Clash/Surge: "DOMAIN-SUFFIX,example.com"
// 3. Форма токена: IP/CIDR, *keyword*, маркеры суффикса (+. *. ||), ведущая
//    точка, голый домен
//
// Неоднозначные соглашения (голый домен, ведущая точка) задаются в
// ClassifierOptions, а не угадываются.
//
// ==============================================================================

#ifndef RULEFORGE_CLASSIFIER_HPP
#define RULEFORGE_CLASSIFIER_HPP

#include <ruleforge/parser.hpp>
#include <ruleforge/rule.hpp>

#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace ruleforge::classify {

// ----------------------------------------------------------------------------
// ClassifierOptions
// ----------------------------------------------------------------------------

struct ClassifierOptions {
    /// Маркер комментария (строка целиком или хвост после пробела)
    std::string comment_marker = "#";

    /// Обёртка ключевого слова: "*cdn*" -> Keyword "cdn"
    char keyword_marker = '*';

    /// Префиксы, означающие "домен и все поддомены"
    /// "||" дополнительно допускает завершающий '^' (синтаксис adblock)
    std::vector<std::string> suffix_markers = {"+.", "*.", "||"};

    /// Тип для голого домена "example.com"
    rule::RuleKind bare_domain = rule::RuleKind::ExactDomain;

    /// Тип для домена с ведущей точкой ".example.com"
    rule::RuleKind leading_dot = rule::RuleKind::DomainSuffix;
};

/// Проверить, что опции допустимы (bare_domain / leading_dot - доменные типы)
/// @throws std::invalid_argument
void validate(const ClassifierOptions& options);

// ----------------------------------------------------------------------------
// Результат классификации
// ----------------------------------------------------------------------------

enum class Outcome {
    Entry,  // правило распознано
    Skip,   // пустая строка или комментарий
    Error,  // ClassificationError: строка пропускается с предупреждением
};

struct Classification {
    Outcome outcome = Outcome::Skip;
    rule::RuleEntry entry;  // при Outcome::Entry
    rule::Error error;      // при Outcome::Error (ErrorKind::Classification)
};

/// Классифицировать одну сырую строку источника
Classification classify(const parse::RawLine& raw, const std::string& source,
                        const ClassifierOptions& options = {});

// ----------------------------------------------------------------------------
// Нормализация (публичные для тестов и конфигурации)
// ----------------------------------------------------------------------------

/// Удалить хвостовой комментарий: маркер в начале строки или после пробела
std::string_view strip_inline_comment(std::string_view text, std::string_view marker);

/// ASCII lower-case
std::string to_lower(std::string_view s);

/// Нормализовать домен: нижний регистр, без завершающей точки, проверка
/// символов (a-z 0-9 - _ .), длины и пустых меток
std::optional<std::string> normalize_domain(std::string_view token);

/// Нормализовать ключевое слово: нижний регистр, символы имени хоста
std::optional<std::string> normalize_keyword(std::string_view token);

/// Каноническая CIDR-нотация
/// "10.1.2.3/8" -> IPv4Cidr "10.0.0.0/8"; "1.2.3.4" -> "1.2.3.4/32";
/// "2001:DB8::1" -> IPv6Cidr "2001:db8::1/128"
/// @return nullopt если токен не является адресом/префиксом
std::optional<rule::RuleEntry> canonical_cidr(std::string_view token);

/// Токен состоит только из символов IP-нотации (цифры . : /)
bool looks_numeric_address(std::string_view token);

}  // namespace ruleforge::classify

#endif  // RULEFORGE_CLASSIFIER_HPP
