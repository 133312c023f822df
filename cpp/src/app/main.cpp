// ==============================================================================
// main.cpp - Точка входа приложения
// ==============================================================================
//
// 1. Парсинг argv (cli)
// 2. Создание Writer (output)
// 3. Загрузка конфигурации и групп (config)
// 4. Запуск Pipeline, вывод отчёта
// 5. Возврат exit code: 0 - успех, 1 - ошибка группы/выполнения, 2 - usage
//
// ==============================================================================

#include "ruleforge/cli.hpp"
#include "ruleforge/config.hpp"
#include "ruleforge/output.hpp"
#include "ruleforge/pipeline.hpp"
#include "ruleforge/platform.hpp"

#include <exception>
#include <filesystem>
#include <iostream>
#include <memory>
#include <optional>
#include <string>
#include <type_traits>
#include <variant>
#include <vector>

namespace {

constexpr const char* BANNER = R"(
               __     ____
   _______  __/ /__  / __/___  _________ ____
  / ___/ / / / / _ \/ /_/ __ \/ ___/ __ `/ _ \
 / /  / /_/ / /  __/ __/ /_/ / /  / /_/ /  __/
/_/   \__,_/_/\___/_/  \____/_/   \__, /\___/
                                 /____/
)";

void print_banner(ruleforge::output::Writer& writer, bool no_banner, bool quiet) {
    if (no_banner || quiet) {
        return;
    }
    writer.write(ruleforge::output::Stream::Stderr, BANNER);
    writer.write_line(ruleforge::output::Stream::Stderr, "");
}

// ----------------------------------------------------------------------------
// Общая подготовка build / lint
// ----------------------------------------------------------------------------

/// Конфигурация и группы: из --config, из путей или из обоих
bool load_groups(const std::optional<std::filesystem::path>& config_path,
                 const std::vector<std::filesystem::path>& paths,
                 ruleforge::config::Config& cfg, ruleforge::output::Writer& writer) {
    using namespace ruleforge;

    writer.debug("platform: " + platform::os_name());
    if (config_path) {
        writer.debug("loading configuration " + platform::path_to_utf8(*config_path));
        auto loaded = config::load_config(*config_path);
        if (!loaded) {
            writer.error(loaded.error.format());
            return false;
        }
        cfg = std::move(loaded.config);
    }

    if (!paths.empty()) {
        auto discovered = config::groups_from_paths(paths);
        if (!discovered) {
            writer.error(discovered.error.message);
            return false;
        }
        for (auto& g : discovered.groups) {
            cfg.groups.push_back(std::move(g));
        }
        if (auto err = config::validate_groups(cfg.groups)) {
            writer.error(err->format());
            return false;
        }
    }

    if (cfg.groups.empty()) {
        writer.error("No rule sources were found in the provided paths");
        return false;
    }
    return true;
}

void apply_classifier_overrides(const std::optional<ruleforge::rule::RuleKind>& bare_domain,
                                const std::optional<ruleforge::rule::RuleKind>& leading_dot,
                                ruleforge::pipeline::PipelineOptions& opts) {
    if (bare_domain) {
        opts.classifier.bare_domain = *bare_domain;
    }
    if (leading_dot) {
        opts.classifier.leading_dot = *leading_dot;
    }
    opts.parser.comment_marker = opts.classifier.comment_marker;
}

std::string count_cell(const ruleforge::pipeline::GroupReport& g, std::size_t value) {
    // Группа не собиралась
    if (g.status == ruleforge::pipeline::GroupStatus::Unchanged ||
        g.status == ruleforge::pipeline::GroupStatus::Failed) {
        return "-";
    }
    return std::to_string(value);
}

void print_report(const ruleforge::pipeline::RunReport& report, ruleforge::output::Writer& writer) {
    using namespace ruleforge;

    output::Table table;
    table.set_headers({"group", "status", "rules", "duplicates", "skipped", "detail"});
    for (const auto& g : report.groups) {
        std::string detail;
        if (g.error) {
            detail = g.error->format();
        } else if (g.status == pipeline::GroupStatus::Updated) {
            detail = std::to_string(g.changed_sources) + "/" + std::to_string(g.sources) +
                     " sources changed";
        }
        table.add_row({g.name, pipeline::to_string(g.status), count_cell(g, g.entries),
                       count_cell(g, g.duplicates), count_cell(g, g.skipped), detail});
    }
    table.print(writer);
}

// ----------------------------------------------------------------------------
// build
// ----------------------------------------------------------------------------

int run_build(const ruleforge::cli::BuildCommand& cmd, ruleforge::output::Writer& writer) {
    using namespace ruleforge;

    config::Config cfg;
    if (!load_groups(cmd.config, cmd.paths, cfg, writer)) {
        return 1;
    }

    pipeline::PipelineOptions opts;
    opts.output_dir = cmd.output.value_or(cfg.output.value_or(std::filesystem::path(".")));
    if (cmd.state) {
        opts.state_dir = *cmd.state;
    } else if (cfg.state) {
        opts.state_dir = *cfg.state;
    }
    opts.force = cmd.force;
    opts.jobs = cmd.jobs.value_or(1);
    opts.classifier = cfg.classifier;
    opts.emit.sections = cfg.sections && !cmd.no_sections;
    opts.emit.structured_version = cfg.structured_version;
    apply_classifier_overrides(cmd.bare_domain, cmd.leading_dot, opts);

    std::unique_ptr<pipeline::Compiler> compiler;
    if (cmd.compiler) {
        compiler = std::make_unique<pipeline::CommandCompiler>(*cmd.compiler);
    }

    writer.info("Building " + std::to_string(cfg.groups.size()) + " rule group(s) into " +
                platform::path_to_utf8(opts.output_dir) + "...");

    pipeline::FileSourceProvider provider;
    pipeline::Pipeline pipe(opts, provider, writer, compiler.get());
    const pipeline::RunReport report = pipe.run(cfg.groups);

    print_report(report, writer);
    writer.info(std::to_string(report.count(pipeline::GroupStatus::Updated)) + " updated, " +
                std::to_string(report.count(pipeline::GroupStatus::Unchanged)) + " unchanged, " +
                std::to_string(report.count(pipeline::GroupStatus::Failed)) + " failed");

    return report.has_failures() ? 1 : 0;
}

// ----------------------------------------------------------------------------
// lint
// ----------------------------------------------------------------------------

int run_lint(const ruleforge::cli::LintCommand& cmd, ruleforge::output::Writer& writer) {
    using namespace ruleforge;

    config::Config cfg;
    if (!load_groups(cmd.config, cmd.paths, cfg, writer)) {
        return 1;
    }

    pipeline::PipelineOptions opts;
    opts.lint_only = true;
    opts.jobs = cmd.jobs.value_or(1);
    opts.classifier = cfg.classifier;
    apply_classifier_overrides(cmd.bare_domain, cmd.leading_dot, opts);

    writer.info("Linting " + std::to_string(cfg.groups.size()) + " rule group(s)...");

    pipeline::FileSourceProvider provider;
    pipeline::Pipeline pipe(opts, provider, writer);
    const pipeline::RunReport report = pipe.run(cfg.groups);

    print_report(report, writer);

    std::size_t skipped = 0;
    for (const auto& g : report.groups) {
        skipped += g.skipped;
    }
    writer.info("Checked " + std::to_string(report.count(pipeline::GroupStatus::Checked)) +
                " group(s), " + std::to_string(report.count(pipeline::GroupStatus::Failed)) +
                " failed, " + std::to_string(skipped) + " unrecognized line(s)");

    return (report.has_failures() || skipped > 0) ? 1 : 0;
}

// ----------------------------------------------------------------------------
// run
// ----------------------------------------------------------------------------

int run(int argc, char** argv) {
    using namespace ruleforge;

    cli::ParseResult parse_result = cli::parse(argc, argv);

    output::OutputConfig out_cfg;
    out_cfg.quiet = parse_result.global.quiet;
    out_cfg.verbose = parse_result.global.verbose;
    out_cfg.no_banner = parse_result.global.no_banner;
    output::Writer writer(out_cfg);

    // Сообщение парсера выводится как есть, без префикса [x]
    if (!parse_result.ok) {
        writer.write(output::Stream::Stderr, parse_result.diagnostic.stderr_message);
        return parse_result.diagnostic.exit_code;
    }

    return std::visit(
        [&](auto&& cmd) -> int {
            using T = std::decay_t<decltype(cmd)>;

            if constexpr (std::is_same_v<T, cli::HelpCommand>) {
                writer.write(output::Stream::Stdout, cli::render_help(cmd.command));
                return 0;
            } else if constexpr (std::is_same_v<T, cli::VersionCommand>) {
                writer.write(output::Stream::Stdout, cli::render_version());
                return 0;
            } else if constexpr (std::is_same_v<T, cli::BuildCommand>) {
                print_banner(writer, out_cfg.no_banner, out_cfg.quiet);
                return run_build(cmd, writer);
            } else if constexpr (std::is_same_v<T, cli::LintCommand>) {
                print_banner(writer, out_cfg.no_banner, out_cfg.quiet);
                return run_lint(cmd, writer);
            } else {
                return 1;
            }
        },
        parse_result.command);
}

}  // anonymous namespace

// ----------------------------------------------------------------------------
// main
// ----------------------------------------------------------------------------

int main(int argc, char** argv) {
    try {
        return run(argc, argv);
    } catch (const std::exception& e) {
        std::cerr << ruleforge::output::format_error(e.what());
        return 1;
    } catch (...) {
        std::cerr << ruleforge::output::format_error("Unknown error occurred");
        return 1;
    }
}
