// ==============================================================================
// cli.cpp - CLI парсинг
// ==============================================================================
//
// Формат сообщений об ошибках повторяет clap: "error: ...", пустая строка,
// Usage, подсказка про --help. Ошибки использования дают exit code 2.
//
// ==============================================================================

#include "ruleforge/cli.hpp"

#include "ruleforge/platform.hpp"

#include <cstring>

namespace ruleforge::cli {

namespace {

bool str_eq(const char* a, const char* b) {
    return std::strcmp(a, b) == 0;
}

bool starts_with(const char* str, const char* prefix) {
    return std::strncmp(str, prefix, std::strlen(prefix)) == 0;
}

std::string usage_line(const std::string& command) {
    if (command == "build") {
        return "Usage: ruleforge build [OPTIONS] <PATH>...";
    }
    if (command == "lint") {
        return "Usage: ruleforge lint [OPTIONS] <PATH>...";
    }
    return "Usage: ruleforge [OPTIONS] <COMMAND>";
}

CliDiagnostic usage_error(const std::string& error_msg, const std::string& command = "") {
    CliDiagnostic d;
    d.exit_code = 2;
    d.stderr_message = "error: " + error_msg + "\n\n" + usage_line(command) +
                       "\n\n"
                       "For more information, try '--help'.\n";
    return d;
}

/// --bare-domain / --leading-dot
std::optional<rule::RuleKind> parse_domain_kind(const std::string& value) {
    if (value == "exact") {
        return rule::RuleKind::ExactDomain;
    }
    if (value == "suffix") {
        return rule::RuleKind::DomainSuffix;
    }
    return std::nullopt;
}

std::optional<unsigned> parse_jobs(const std::string& value) {
    if (value.empty() || value.size() > 4) {
        return std::nullopt;
    }
    unsigned n = 0;
    for (char c : value) {
        if (c < '0' || c > '9') {
            return std::nullopt;
        }
        n = n * 10 + static_cast<unsigned>(c - '0');
    }
    if (n == 0 || n > MAX_JOBS) {
        return std::nullopt;
    }
    return n;
}

/// Опция со значением: "-o DIR", "--output DIR", "--output=DIR"
/// @return true если arg совпал с опцией; value заполняется, если значение есть
bool match_value_option(int argc, char** argv, int& i, const char* short_name,
                        const char* long_name, std::optional<std::string>& value) {
    const char* arg = argv[i];

    const std::string long_eq = std::string(long_name) + "=";
    if (starts_with(arg, long_eq.c_str())) {
        value = std::string(arg + long_eq.size());
        return true;
    }

    if ((short_name != nullptr && str_eq(arg, short_name)) || str_eq(arg, long_name)) {
        if (i + 1 < argc) {
            ++i;
            value = std::string(argv[i]);
        } else {
            value.reset();
        }
        return true;
    }
    return false;
}

std::string missing_value(const char* long_name, const char* placeholder) {
    return std::string("a value is required for '") + long_name + " " + placeholder +
           "' but none was supplied";
}

bool set_domain_kind(const char* option, const std::optional<std::string>& value,
                     std::optional<rule::RuleKind>& target, const std::string& command,
                     ParseResult& result) {
    if (!value) {
        result.diagnostic = usage_error(missing_value(option, "<KIND>"), command);
        return false;
    }
    target = parse_domain_kind(*value);
    if (!target) {
        result.diagnostic = usage_error("invalid value '" + *value + "' for '" + option +
                                            " <KIND>': must be exact or suffix",
                                        command);
        return false;
    }
    return true;
}

/// Разобрать аргументы build/lint, начиная с argv[start]
/// @return false при ошибке (result.diagnostic заполнен)
bool parse_rules_command(int argc, char** argv, int start, const std::string& name,
                         BuildCommand& cmd, ParseResult& result) {
    const bool is_build = name == "build";

    for (int i = start; i < argc; ++i) {
        const char* arg = argv[i];
        std::optional<std::string> value;

        if (str_eq(arg, "-h") || str_eq(arg, "--help")) {
            result.ok = true;
            result.command = HelpCommand{name};
            return false;
        } else if (str_eq(arg, "-q")) {
            result.global.quiet = true;
        } else if (str_eq(arg, "-v")) {
            result.global.verbose++;
        } else if (str_eq(arg, "--no-banner")) {
            result.global.no_banner = true;
        } else if (match_value_option(argc, argv, i, "-c", "--config", value)) {
            if (!value) {
                result.diagnostic = usage_error(missing_value("--config", "<FILE>"), name);
                return false;
            }
            cmd.config = platform::path_from_utf8(*value);
        } else if (match_value_option(argc, argv, i, "-j", "--jobs", value)) {
            if (!value) {
                result.diagnostic = usage_error(missing_value("--jobs", "<N>"), name);
                return false;
            }
            cmd.jobs = parse_jobs(*value);
            if (!cmd.jobs) {
                result.diagnostic = usage_error("invalid value '" + *value +
                                                    "' for '--jobs <N>': expected 1.." +
                                                    std::to_string(MAX_JOBS),
                                                name);
                return false;
            }
        } else if (match_value_option(argc, argv, i, nullptr, "--bare-domain", value)) {
            if (!set_domain_kind("--bare-domain", value, cmd.bare_domain, name, result)) {
                return false;
            }
        } else if (match_value_option(argc, argv, i, nullptr, "--leading-dot", value)) {
            if (!set_domain_kind("--leading-dot", value, cmd.leading_dot, name, result)) {
                return false;
            }
        } else if (is_build && match_value_option(argc, argv, i, "-o", "--output", value)) {
            if (!value) {
                result.diagnostic = usage_error(missing_value("--output", "<DIR>"), name);
                return false;
            }
            cmd.output = platform::path_from_utf8(*value);
        } else if (is_build && match_value_option(argc, argv, i, nullptr, "--state", value)) {
            if (!value) {
                result.diagnostic = usage_error(missing_value("--state", "<DIR>"), name);
                return false;
            }
            cmd.state = platform::path_from_utf8(*value);
        } else if (is_build && match_value_option(argc, argv, i, nullptr, "--compiler", value)) {
            if (!value || value->empty()) {
                result.diagnostic = usage_error(missing_value("--compiler", "<CMD>"), name);
                return false;
            }
            cmd.compiler = *value;
        } else if (is_build && (str_eq(arg, "-f") || str_eq(arg, "--force"))) {
            cmd.force = true;
        } else if (is_build && str_eq(arg, "--no-sections")) {
            cmd.no_sections = true;
        } else if (arg[0] == '-' && arg[1] != '\0') {
            result.diagnostic =
                usage_error(std::string("unexpected argument '") + arg + "' found", name);
            return false;
        } else {
            cmd.paths.push_back(platform::path_from_utf8(arg));
        }
    }

    // С --config пути необязательны: группы берутся из файла
    if (cmd.paths.empty() && !cmd.config) {
        CliDiagnostic d;
        d.exit_code = 2;
        d.stderr_message = "error: the following required arguments were not provided:\n"
                           "  <PATH>...\n\n" +
                           usage_line(name) +
                           "\n\n"
                           "For more information, try '--help'.\n";
        result.diagnostic = d;
        return false;
    }
    return true;
}

}  // anonymous namespace

// ----------------------------------------------------------------------------
// render_version / render_help
// ----------------------------------------------------------------------------

std::string render_version() {
    return std::string("ruleforge ") + VERSION + "\n";
}

std::string render_help(const std::optional<std::string>& command) {
    if (!command.has_value()) {
        return std::string(ABOUT) +
               "\n"
               "\n"
               "Usage: ruleforge [OPTIONS] <COMMAND>\n"
               "\n"
               "Commands:\n"
               "  build  Build list, JSON and compiled artefacts for changed rule groups\n"
               "  lint   Parse and classify rule sources without writing artefacts\n"
               "  help   Print this message or the help of the given subcommand(s)\n"
               "\n"
               "Options:\n"
               "      --no-banner  Hide the banner\n"
               "  -q               Suppress informational output\n"
               "  -v...            Print verbose output\n"
               "  -h, --help       Print help\n"
               "  -V, --version    Print version\n"
               "\n"
               "Examples:\n"
               "\n"
               "    Build every list in a directory:\n"
               "        ./ruleforge build rules/ -o dist/\n"
               "\n"
               "    Build groups from a configuration and compile with sing-box:\n"
               "        ./ruleforge build -c groups.yaml --compiler "
               "'sing-box rule-set compile --output {output} {input}'\n"
               "\n"
               "    Check sources for unrecognized lines:\n"
               "        ./ruleforge lint rules/\n";
    } else if (*command == "build") {
        return "Build list, JSON and compiled artefacts for changed rule groups\n"
               "\n"
               "Usage: ruleforge build [OPTIONS] <PATH>...\n"
               "\n"
               "Arguments:\n"
               "  <PATH>...  Rule source files or directories (one group per file stem)\n"
               "\n"
               "Options:\n"
               "  -c, --config <FILE>         Group definitions (YAML)\n"
               "  -o, --output <DIR>          Output directory [default: .]\n"
               "      --state <DIR>           Fingerprint directory "
               "[default: <output>/.fingerprints]\n"
               "      --compiler <CMD>        Compiler command with {input} and {output}\n"
               "  -f, --force                 Rebuild groups even if sources are unchanged\n"
               "  -j, --jobs <N>              Groups processed in parallel [default: 1]\n"
               "      --no-sections           Omit section comments in .list files\n"
               "      --bare-domain <KIND>    Kind of a bare domain: exact or suffix\n"
               "      --leading-dot <KIND>    Kind of a '.domain' token: exact or suffix\n"
               "  -h, --help                  Print help\n";
    } else if (*command == "lint") {
        return "Parse and classify rule sources without writing artefacts\n"
               "\n"
               "Usage: ruleforge lint [OPTIONS] <PATH>...\n"
               "\n"
               "Arguments:\n"
               "  <PATH>...  Rule source files or directories\n"
               "\n"
               "Options:\n"
               "  -c, --config <FILE>         Group definitions (YAML)\n"
               "  -j, --jobs <N>              Groups processed in parallel [default: 1]\n"
               "      --bare-domain <KIND>    Kind of a bare domain: exact or suffix\n"
               "      --leading-dot <KIND>    Kind of a '.domain' token: exact or suffix\n"
               "  -h, --help                  Print help\n";
    } else {
        return "error: unrecognized subcommand '" + *command + "'\n";
    }
}

// ----------------------------------------------------------------------------
// parse
// ----------------------------------------------------------------------------

ParseResult parse(int argc, char** argv) {
    ParseResult result;
    result.ok = false;
    result.command = HelpCommand{};

    if (argc < 2) {
        // Без аргументов: справка в stderr, exit code 2
        result.diagnostic.exit_code = 2;
        result.diagnostic.stderr_message = render_help(std::nullopt);
        return result;
    }

    // Глобальные опции до подкоманды
    int cmd_idx = argc;
    for (int i = 1; i < argc; ++i) {
        const char* arg = argv[i];

        if (str_eq(arg, "--no-banner")) {
            result.global.no_banner = true;
        } else if (str_eq(arg, "-v")) {
            result.global.verbose++;
        } else if (str_eq(arg, "-q")) {
            result.global.quiet = true;
        } else if (str_eq(arg, "-h") || str_eq(arg, "--help")) {
            result.ok = true;
            result.command = HelpCommand{};
            return result;
        } else if (str_eq(arg, "-V") || str_eq(arg, "--version")) {
            result.ok = true;
            result.command = VersionCommand{};
            return result;
        } else if (arg[0] != '-') {
            cmd_idx = i;
            break;
        } else {
            result.diagnostic =
                usage_error(std::string("unexpected argument '") + arg + "' found");
            return result;
        }
    }

    if (cmd_idx >= argc) {
        result.ok = true;
        result.command = HelpCommand{};
        return result;
    }

    const char* cmd = argv[cmd_idx];

    if (str_eq(cmd, "build")) {
        BuildCommand build_cmd;
        if (!parse_rules_command(argc, argv, cmd_idx + 1, "build", build_cmd, result)) {
            return result;
        }
        result.ok = true;
        result.command = std::move(build_cmd);
    } else if (str_eq(cmd, "lint")) {
        BuildCommand parsed;
        if (!parse_rules_command(argc, argv, cmd_idx + 1, "lint", parsed, result)) {
            return result;
        }
        LintCommand lint_cmd;
        lint_cmd.paths = std::move(parsed.paths);
        lint_cmd.config = std::move(parsed.config);
        lint_cmd.jobs = parsed.jobs;
        lint_cmd.bare_domain = parsed.bare_domain;
        lint_cmd.leading_dot = parsed.leading_dot;
        result.ok = true;
        result.command = std::move(lint_cmd);
    } else if (str_eq(cmd, "help")) {
        if (cmd_idx + 1 < argc) {
            const std::string topic(argv[cmd_idx + 1]);
            if (topic != "build" && topic != "lint") {
                result.diagnostic = usage_error("unrecognized subcommand '" + topic + "'");
                return result;
            }
            result.command = HelpCommand{topic};
        } else {
            result.command = HelpCommand{};
        }
        result.ok = true;
    } else {
        result.diagnostic =
            usage_error(std::string("unrecognized subcommand '") + cmd + "'");
        return result;
    }

    return result;
}

}  // namespace ruleforge::cli
