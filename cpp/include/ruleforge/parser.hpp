// ==============================================================================
// ruleforge/parser.hpp - Разбор исходных списков правил
// ==============================================================================
//
// Назначение:
// - Разбор сырых байтов источника по явно объявленному диалекту
// - Единое промежуточное представление: RawLine (текст + номер строки)
// - Ленивая итерация через LineReader::next()
//
// Диалекты:
// - List: один токен на строку, строки-комментарии, пустые строки
// - Yaml: mapping-of-lists (domain / domain_suffix / domain_keyword / ip_cidr),
//         обёртка sing-box {version, rules: [...]} и rule-provider mihomo
//         {payload: [...]}; документ без ключей правил - ошибка разбора
//
// Парсер не изменяет разделяемое состояние.
//
// ==============================================================================

#ifndef RULEFORGE_PARSER_HPP
#define RULEFORGE_PARSER_HPP

#include <ruleforge/rule.hpp>

#include <cstddef>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace ruleforge::parse {

// ----------------------------------------------------------------------------
// RawLine - сырая запись источника
// ----------------------------------------------------------------------------

/// Явный тег типа, выставляемый структурированным диалектом
enum class Tag {
    None,           // тип определяет классификатор
    Domain,         // domain
    DomainSuffix,   // domain_suffix
    DomainKeyword,  // domain_keyword
    IpCidr,         // ip_cidr (семейство адреса определяется по значению)
};

std::string to_string(Tag t);

/// Сырая строка источника
struct RawLine {
    std::string text;       // текст как в источнике (без перевода строки)
    std::size_t line = 0;   // номер строки, 1-based
    Tag tag = Tag::None;    // тег структурированного диалекта
};

// ----------------------------------------------------------------------------
// ParserOptions
// ----------------------------------------------------------------------------

struct ParserOptions {
    /// Маркер строки-комментария в диалекте List
    std::string comment_marker = "#";
};

// ----------------------------------------------------------------------------
// LineReader
// ----------------------------------------------------------------------------

struct OpenResult;

/// Ленивая последовательность RawLine одного источника
///
/// Использование:
/// @code
///   auto result = LineReader::open("emby", bytes, rule::Dialect::List);
///   if (!result) {
///       writer.error(result.error.format());
///       return;
///   }
///   RawLine raw;
///   while (result.reader->next(raw)) {
///       // классификация
///   }
/// @endcode
class LineReader {
public:
    virtual ~LineReader() = default;

    /// Создать LineReader для источника
    ///
    /// Для Yaml весь документ разбирается и проверяется здесь: ошибки
    /// структуры возвращаются как ErrorKind::Parse с номером строки.
    ///
    /// @param source_id Идентификатор источника (для ошибок)
    /// @param bytes Сырые байты; LineReader хранит собственную копию
    static OpenResult open(std::string source_id, std::string bytes, rule::Dialect dialect,
                           const ParserOptions& options = {});

    /// Получить следующую строку
    /// @return false, когда строки закончились
    virtual bool next(RawLine& out) = 0;

    virtual rule::Dialect dialect() const = 0;

    const std::string& source() const { return source_; }

    /// Ключи структурированного документа, которые были пропущены
    const std::vector<std::string>& ignored_keys() const { return ignored_keys_; }

protected:
    explicit LineReader(std::string source) : source_(std::move(source)) {}

    std::string source_;
    std::vector<std::string> ignored_keys_;
};

/// Результат открытия LineReader
struct OpenResult {
    bool ok = false;
    std::unique_ptr<LineReader> reader;
    rule::Error error;

    explicit operator bool() const { return ok; }
};

// ----------------------------------------------------------------------------
// Специализированные LineReader'ы
// ----------------------------------------------------------------------------

std::unique_ptr<LineReader> create_list_reader(std::string source_id, std::string bytes,
                                               const ParserOptions& options);

/// @throws rule::RuleError (ErrorKind::Parse) при некорректной структуре
std::unique_ptr<LineReader> create_yaml_reader(std::string source_id, const std::string& bytes);

// ----------------------------------------------------------------------------
// Вспомогательные функции
// ----------------------------------------------------------------------------

/// Убрать пробельные символы по краям (ASCII whitespace)
std::string_view trim(std::string_view s);

/// Тег по ключу структурированного документа
/// Принимает варианты через '_' и '-': domain_suffix, domain-suffix.
/// "payload" -> Tag::None; неизвестный ключ -> nullopt
std::optional<Tag> tag_from_key(std::string_view key);

}  // namespace ruleforge::parse

#endif  // RULEFORGE_PARSER_HPP
