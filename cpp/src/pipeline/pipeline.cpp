// ==============================================================================
// pipeline.cpp - Оркестратор сборки групп
// ==============================================================================

#include <ruleforge/aggregator.hpp>
#include <ruleforge/pipeline.hpp>
#include <ruleforge/platform.hpp>

#include <algorithm>
#include <atomic>
#include <cstdio>
#include <stdexcept>
#include <system_error>
#include <thread>
#include <utility>

#ifdef _WIN32
#define RULEFORGE_POPEN _popen
#define RULEFORGE_PCLOSE _pclose
#else
#include <sys/wait.h>
#define RULEFORGE_POPEN popen
#define RULEFORGE_PCLOSE pclose
#endif

namespace ruleforge::pipeline {

namespace {

rule::RuleError group_error(rule::ErrorKind kind, const std::string& group,
                            const std::string& message) {
    return rule::RuleError(rule::Error{kind, message, group, std::nullopt});
}

void remove_quietly(const std::filesystem::path& p) {
    std::error_code ec;
    std::filesystem::remove(p, ec);
}

/// Временные файлы группы; не опубликованные удаляются в деструкторе
class TempFiles {
public:
    TempFiles() = default;
    TempFiles(const TempFiles&) = delete;
    TempFiles& operator=(const TempFiles&) = delete;

    ~TempFiles() {
        for (const auto& entry : pending_) {
            remove_quietly(entry.first);
        }
    }

    void add(std::filesystem::path temp, std::filesystem::path target) {
        pending_.emplace_back(std::move(temp), std::move(target));
    }

    /// Переименовать все временные файлы в целевые
    /// @throws std::runtime_error при первой ошибке переименования
    void commit() {
        while (!pending_.empty()) {
            const auto& [temp, target] = pending_.back();
            std::error_code ec;
            std::filesystem::rename(temp, target, ec);
            if (ec) {
                throw std::runtime_error("failed to replace '" + platform::path_to_utf8(target) +
                                         "' - " + ec.message());
            }
            pending_.pop_back();
        }
    }

private:
    std::vector<std::pair<std::filesystem::path, std::filesystem::path>> pending_;
};

}  // namespace

// ============================================================================
// FileSourceProvider
// ============================================================================

FileSourceProvider::FileSourceProvider(std::filesystem::path base_dir)
    : base_dir_(std::move(base_dir)) {}

FetchResult FileSourceProvider::fetch(const rule::SourceSpec& source) {
    FetchResult result;

    std::filesystem::path path = source.location;
    if (path.is_relative() && !base_dir_.empty()) {
        path = base_dir_ / path;
    }

    std::error_code ec;
    if (!platform::read_file(path, result.bytes, ec)) {
        result.error = rule::Error{rule::ErrorKind::Fetch,
                                   "failed to read " + platform::path_to_utf8(path) + " - " +
                                       ec.message(),
                                   source.id, std::nullopt};
        result.bytes.clear();
        return result;
    }

    result.ok = true;
    return result;
}

// ============================================================================
// CommandCompiler
// ============================================================================

std::string shell_quote(std::string_view arg) {
    std::string out = "'";
    for (char c : arg) {
        if (c == '\'') {
            out += "'\\''";
        } else {
            out.push_back(c);
        }
    }
    out += "'";
    return out;
}

CommandCompiler::CommandCompiler(std::string command_template)
    : template_(std::move(command_template)) {}

std::string CommandCompiler::expand(const std::filesystem::path& input,
                                    const std::filesystem::path& output) const {
    static constexpr std::string_view INPUT = "{input}";
    static constexpr std::string_view OUTPUT = "{output}";

    const std::string in = shell_quote(platform::path_to_utf8(input));
    const std::string out = shell_quote(platform::path_to_utf8(output));

    std::string cmd;
    std::size_t pos = 0;
    while (pos < template_.size()) {
        std::string_view rest = std::string_view(template_).substr(pos);
        if (rest.substr(0, INPUT.size()) == INPUT) {
            cmd += in;
            pos += INPUT.size();
        } else if (rest.substr(0, OUTPUT.size()) == OUTPUT) {
            cmd += out;
            pos += OUTPUT.size();
        } else {
            cmd.push_back(template_[pos]);
            ++pos;
        }
    }
    return cmd;
}

CompileResult CommandCompiler::compile(const std::filesystem::path& input,
                                       const std::filesystem::path& output) {
    CompileResult result;
    result.error.kind = rule::ErrorKind::Compile;

    const std::string cmd = expand(input, output) + " 2>&1";

    FILE* pipe = RULEFORGE_POPEN(cmd.c_str(), "r");
    if (!pipe) {
        result.error.message = "failed to start compiler command";
        return result;
    }

    char buffer[256];
    while (std::fgets(buffer, sizeof(buffer), pipe) != nullptr) {
        result.output.append(buffer);
    }

    const int status = RULEFORGE_PCLOSE(pipe);
    if (status != 0) {
        int code = status;
#ifndef _WIN32
        if (WIFEXITED(status)) {
            code = WEXITSTATUS(status);
        }
#endif
        result.error.message = "compiler exited with code " + std::to_string(code);
        if (!result.output.empty()) {
            result.error.message += ": " + std::string(parse::trim(result.output));
        }
        return result;
    }

    std::error_code ec;
    if (!std::filesystem::is_regular_file(output, ec)) {
        result.error.message =
            "compiler produced no output file " + platform::path_to_utf8(output);
        return result;
    }

    result.ok = true;
    return result;
}

// ============================================================================
// Отчёт
// ============================================================================

std::string to_string(GroupStatus s) {
    switch (s) {
    case GroupStatus::Unchanged:
        return "unchanged";
    case GroupStatus::Updated:
        return "updated";
    case GroupStatus::Failed:
        return "failed";
    case GroupStatus::Checked:
        return "checked";
    }
    return "unknown";
}

std::size_t RunReport::count(GroupStatus s) const {
    return static_cast<std::size_t>(
        std::count_if(groups.begin(), groups.end(),
                      [s](const GroupReport& g) { return g.status == s; }));
}

bool RunReport::has_failures() const {
    return std::any_of(groups.begin(), groups.end(), [](const GroupReport& g) {
        return g.status == GroupStatus::Failed || g.error.has_value();
    });
}

// ============================================================================
// Pipeline
// ============================================================================

Pipeline::Pipeline(PipelineOptions options, SourceProvider& provider, output::Writer& writer,
                   Compiler* compiler)
    : options_(std::move(options)), provider_(provider), writer_(writer), compiler_(compiler),
      ledger_(options_.state_dir.empty() ? options_.output_dir / ".fingerprints"
                                         : options_.state_dir) {}

RunReport Pipeline::run(const std::vector<rule::GroupSpec>& groups) {
    RunReport report;
    report.groups.resize(groups.size());

    const std::size_t workers =
        std::max<std::size_t>(1, std::min<std::size_t>(options_.jobs, groups.size()));

    if (workers <= 1) {
        for (std::size_t i = 0; i < groups.size(); ++i) {
            report.groups[i] = process(groups[i]);
        }
        return report;
    }

    std::atomic<std::size_t> next{0};
    std::vector<std::thread> pool;
    pool.reserve(workers);
    for (std::size_t w = 0; w < workers; ++w) {
        pool.emplace_back([&]() {
            for (std::size_t i = next.fetch_add(1); i < groups.size(); i = next.fetch_add(1)) {
                report.groups[i] = process(groups[i]);
            }
        });
    }
    for (auto& t : pool) {
        t.join();
    }
    return report;
}

GroupReport Pipeline::process(const rule::GroupSpec& group) {
    try {
        return build(group);
    } catch (const rule::RuleError& e) {
        GroupReport report;
        report.name = group.name;
        report.sources = group.sources.size();
        report.status = GroupStatus::Failed;
        report.error = e.error();
        writer_.error(e.error().format());
        return report;
    } catch (const std::exception& e) {
        // std::bad_alloc, ошибки OpenSSL и filesystem вне publish()
        GroupReport report;
        report.name = group.name;
        report.sources = group.sources.size();
        report.status = GroupStatus::Failed;
        report.error = rule::Error{rule::ErrorKind::Emission, e.what(), group.name, std::nullopt};
        writer_.error(report.error->format());
        return report;
    }
}

GroupReport Pipeline::build(const rule::GroupSpec& group) {
    GroupReport report;
    report.name = group.name;
    report.sources = group.sources.size();

    // 1. fetch
    std::vector<FetchedSource> fetched;
    fetched.reserve(group.sources.size());
    for (const auto& spec : group.sources) {
        FetchResult fr = provider_.fetch(spec);
        if (!fr) {
            throw rule::RuleError(fr.error);
        }
        fetched.push_back(FetchedSource{spec, std::move(fr.bytes)});
    }

    // 2. digest + запись группы в ledger
    fingerprint::SourceDigests digests;
    if (!options_.lint_only) {
        const auto recorded = ledger_.load(group.name);
        for (const auto& src : fetched) {
            const std::string digest = fingerprint::sha256_hex(src.bytes);
            if (fingerprint::check(recorded, src.spec.id, digest) ==
                fingerprint::SourceState::Changed) {
                ++report.changed_sources;
                writer_.debug("source " + src.spec.id + " changed");
            }
            digests[src.spec.id] = digest;
        }

        // Источник убран из группы: его правила ещё в артефактах
        bool removed = false;
        if (recorded) {
            for (const auto& kv : *recorded) {
                if (digests.count(kv.first) == 0) {
                    removed = true;
                    writer_.debug("source " + kv.first + " removed from " + group.name);
                }
            }
        }

        const auto paths = emit::artifact_paths(options_.output_dir, group.name);
        std::error_code ec;
        const bool missing = !std::filesystem::exists(paths.list, ec) ||
                             !std::filesystem::exists(paths.structured, ec) ||
                             (compiler_ != nullptr && !std::filesystem::exists(paths.binary, ec));

        if (report.changed_sources == 0 && !removed && !options_.force && !missing) {
            report.status = GroupStatus::Unchanged;
            writer_.debug("group " + group.name + " unchanged");
            return report;
        }
    }

    // 3. parse + classify + aggregate
    AssembleResult assembled = assemble(group.name, fetched);
    if (!assembled) {
        throw rule::RuleError(assembled.error);
    }
    report.entries = assembled.group.entries.size();
    report.duplicates = assembled.duplicates;
    report.skipped = assembled.skipped;
    report.counts = assembled.group.counts();

    if (options_.lint_only) {
        report.status = GroupStatus::Checked;
        return report;
    }

    // 4. emit + compile + publish
    publish(assembled.group);

    // 5. commit только после публикации, одной записью на группу
    report.status = GroupStatus::Updated;
    try {
        ledger_.commit(group.name, digests);
    } catch (const std::runtime_error& e) {
        // Артефакты уже новые; без записи группа соберётся повторно
        report.error = rule::Error{rule::ErrorKind::Emission,
                                   std::string("failed to record fingerprints - ") + e.what(),
                                   group.name, std::nullopt};
        writer_.warn(report.error->format());
        return report;
    }

    writer_.info("updated " + group.name + " (" + std::to_string(report.entries) + " rules)");
    return report;
}

AssembleResult Pipeline::assemble(const std::string& name,
                                  const std::vector<FetchedSource>& sources) {
    AssembleResult result;
    aggregate::Aggregator aggregator;

    for (const auto& src : sources) {
        auto opened = parse::LineReader::open(src.spec.id, src.bytes, src.spec.dialect,
                                              options_.parser);
        if (!opened) {
            result.error = opened.error;
            return result;
        }

        for (const auto& key : opened.reader->ignored_keys()) {
            writer_.debug(src.spec.id + ": ignoring key '" + key + "'");
        }

        parse::RawLine raw;
        while (opened.reader->next(raw)) {
            classify::Classification c = classify::classify(raw, src.spec.id, options_.classifier);
            switch (c.outcome) {
            case classify::Outcome::Entry:
                aggregator.add(std::move(c.entry));
                break;
            case classify::Outcome::Error:
                ++result.skipped;
                writer_.warn(c.error.format());
                break;
            case classify::Outcome::Skip:
                break;
            }
        }
    }

    result.duplicates = aggregator.duplicates();
    result.group = aggregator.finish(name);
    result.ok = true;
    return result;
}

void Pipeline::publish(const rule::RuleGroup& group) {
    const auto paths = emit::artifact_paths(options_.output_dir, group.name);

    std::error_code ec;
    std::filesystem::create_directories(options_.output_dir, ec);
    if (ec) {
        throw group_error(rule::ErrorKind::Emission, group.name,
                          "failed to create output directory " +
                              platform::path_to_utf8(options_.output_dir) + " - " + ec.message());
    }

    TempFiles temps;
    try {
        temps.add(platform::write_temp_sibling(paths.list, emit::render_list(group, options_.emit)),
                  paths.list);

        const std::filesystem::path json_tmp = platform::write_temp_sibling(
            paths.structured, emit::render_structured(group, options_.emit));
        temps.add(json_tmp, paths.structured);

        if (compiler_ != nullptr) {
            const std::filesystem::path srs_tmp = platform::temp_sibling_path(paths.binary);
            // Файл мог быть частично записан до ошибки
            temps.add(srs_tmp, paths.binary);

            CompileResult cr = compiler_->compile(json_tmp, srs_tmp);
            if (!cr) {
                cr.error.source = group.name;
                throw rule::RuleError(cr.error);
            }
            if (!cr.output.empty()) {
                writer_.trace(group.name + ": " + std::string(parse::trim(cr.output)));
            }
        }

        temps.commit();
    } catch (const rule::RuleError&) {
        throw;
    } catch (const std::runtime_error& e) {
        throw group_error(rule::ErrorKind::Emission, group.name, e.what());
    }
}

}  // namespace ruleforge::pipeline
