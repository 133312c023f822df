// ==============================================================================
// ruleforge/cli.hpp - CLI парсинг и команды
// ==============================================================================
//
// Назначение:
// - Парсинг argv
// - Генерация --help / --version
// - Диагностические ошибки CLI (exit code 2)
//
// ==============================================================================

#ifndef RULEFORGE_CLI_HPP
#define RULEFORGE_CLI_HPP

#include <ruleforge/rule.hpp>

#include <filesystem>
#include <optional>
#include <string>
#include <variant>
#include <vector>

namespace ruleforge::cli {

// ----------------------------------------------------------------------------
// Глобальные опции
// ----------------------------------------------------------------------------

struct GlobalOptions {
    bool no_banner = false;  // --no-banner
    int verbose = 0;         // -v (repeatable)
    bool quiet = false;      // -q
};

// ----------------------------------------------------------------------------
// Подкоманды
// ----------------------------------------------------------------------------

/// build - собрать артефакты групп
struct BuildCommand {
    std::vector<std::filesystem::path> paths;     // positional: файлы или директории
    std::optional<std::filesystem::path> config;  // -c, --config
    std::optional<std::filesystem::path> output;  // -o, --output
    std::optional<std::filesystem::path> state;   // --state
    std::optional<std::string> compiler;          // --compiler <CMD>
    bool force = false;                           // -f, --force
    std::optional<unsigned> jobs;                 // -j, --jobs
    bool no_sections = false;                     // --no-sections
    std::optional<rule::RuleKind> bare_domain;    // --bare-domain exact|suffix
    std::optional<rule::RuleKind> leading_dot;    // --leading-dot exact|suffix
};

/// lint - разобрать и классифицировать без артефактов
struct LintCommand {
    std::vector<std::filesystem::path> paths;
    std::optional<std::filesystem::path> config;  // -c, --config
    std::optional<unsigned> jobs;                 // -j, --jobs
    std::optional<rule::RuleKind> bare_domain;    // --bare-domain
    std::optional<rule::RuleKind> leading_dot;    // --leading-dot
};

/// help - показать справку
struct HelpCommand {
    std::optional<std::string> command;  // опциональная подкоманда для справки
};

/// version - показать версию
struct VersionCommand {};

using Command = std::variant<BuildCommand, LintCommand, HelpCommand, VersionCommand>;

// ----------------------------------------------------------------------------
// Диагностика CLI
// ----------------------------------------------------------------------------

struct CliDiagnostic {
    int exit_code = 1;
    std::string stderr_message;
};

struct ParseResult {
    bool ok = false;
    GlobalOptions global;
    Command command;
    CliDiagnostic diagnostic;
};

// ----------------------------------------------------------------------------
// API
// ----------------------------------------------------------------------------

/// Парсить аргументы командной строки
ParseResult parse(int argc, char** argv);

/// Генерировать текст --help (для конкретной команды или общий)
std::string render_help(const std::optional<std::string>& command = std::nullopt);

/// Генерировать текст --version
std::string render_version();

// ----------------------------------------------------------------------------
// Константы
// ----------------------------------------------------------------------------

constexpr const char* VERSION = "0.1.0";

constexpr const char* ABOUT = "Build deduplicated rule sets from heterogeneous rule lists";

/// Верхняя граница --jobs
constexpr unsigned MAX_JOBS = 256;

}  // namespace ruleforge::cli

#endif  // RULEFORGE_CLI_HPP
