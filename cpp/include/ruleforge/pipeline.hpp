// ==============================================================================
// ruleforge/pipeline.hpp - Оркестратор сборки групп
// ==============================================================================
//
// Назначение:
// - Коллабораторы: SourceProvider (получение байтов), Compiler (бинарный
//   артефакт)
// - Для каждой группы: fetch -> digest -> проверка ledger -> parse ->
//   classify -> aggregate -> emit -> compile -> публикация -> commit
// - Группы независимы и обрабатываются пулом потоков (--jobs)
// - Отчёт по группе: unchanged / updated / failed(причина)
//
// Гарантии:
// - Ошибка группы не останавливает остальные группы
// - У группы с ошибкой не меняются ни отпечатки, ни ранее выпущенные артефакты
// - Артефакты публикуются переименованием временных файлов только после того,
//   как все артефакты группы получены
//
// ==============================================================================

#ifndef RULEFORGE_PIPELINE_HPP
#define RULEFORGE_PIPELINE_HPP

#include <ruleforge/classifier.hpp>
#include <ruleforge/emitter.hpp>
#include <ruleforge/fingerprint.hpp>
#include <ruleforge/output.hpp>
#include <ruleforge/parser.hpp>
#include <ruleforge/rule.hpp>

#include <array>
#include <cstddef>
#include <filesystem>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace ruleforge::pipeline {

// ============================================================================
// SourceProvider
// ============================================================================

/// Результат получения источника
struct FetchResult {
    bool ok = false;
    std::string bytes;
    rule::Error error;  // ErrorKind::Fetch

    explicit operator bool() const { return ok; }
};

/// Получение сырых байтов источника
class SourceProvider {
public:
    virtual ~SourceProvider() = default;

    virtual FetchResult fetch(const rule::SourceSpec& source) = 0;
};

/// Локальные файлы; относительные пути разрешаются от base_dir
class FileSourceProvider final : public SourceProvider {
public:
    explicit FileSourceProvider(std::filesystem::path base_dir = {});

    FetchResult fetch(const rule::SourceSpec& source) override;

private:
    std::filesystem::path base_dir_;
};

// ============================================================================
// Compiler
// ============================================================================

struct CompileResult {
    bool ok = false;
    std::string output;  // stdout + stderr команды
    rule::Error error;   // ErrorKind::Compile

    explicit operator bool() const { return ok; }
};

/// Компиляция структурированного артефакта в бинарный
class Compiler {
public:
    virtual ~Compiler() = default;

    /// @param input Готовый структурированный артефакт (JSON)
    /// @param output Куда записать бинарный артефакт
    virtual CompileResult compile(const std::filesystem::path& input,
                                  const std::filesystem::path& output) = 0;
};

/// Внешняя команда через shell
///
/// Шаблон содержит подстановки {input} и {output}, значения экранируются
/// для POSIX shell:
/// @code
///   CommandCompiler c("sing-box rule-set compile --output {output} {input}");
/// @endcode
/// Ненулевой код возврата или отсутствие выходного файла - ошибка.
class CommandCompiler final : public Compiler {
public:
    explicit CommandCompiler(std::string command_template);

    CompileResult compile(const std::filesystem::path& input,
                          const std::filesystem::path& output) override;

    /// Подставить пути в шаблон
    std::string expand(const std::filesystem::path& input,
                       const std::filesystem::path& output) const;

    const std::string& command_template() const { return template_; }

private:
    std::string template_;
};

/// Экранирование аргумента для POSIX shell: 'a b' -> "'a b'"
std::string shell_quote(std::string_view arg);

// ============================================================================
// Отчёт
// ============================================================================

enum class GroupStatus {
    Unchanged,  // все источники без изменений, артефакты на месте
    Updated,    // артефакты перевыпущены
    Failed,     // ошибка; отпечатки и прежние артефакты не тронуты
    Checked,    // lint: разбор и классификация без артефактов
};

std::string to_string(GroupStatus s);

struct GroupReport {
    std::string name;
    GroupStatus status = GroupStatus::Failed;
    std::optional<rule::Error> error;  // Failed; у Updated - отпечатки не записаны

    std::size_t sources = 0;
    std::size_t changed_sources = 0;
    std::size_t entries = 0;     // уникальных правил (если группа собиралась)
    std::size_t duplicates = 0;  // отброшенных дубликатов
    std::size_t skipped = 0;     // строк с ClassificationError
    std::array<std::size_t, rule::RULE_KIND_COUNT> counts{};
};

struct RunReport {
    std::vector<GroupReport> groups;  // в порядке входных групп

    std::size_t count(GroupStatus s) const;
    /// Есть группа Failed или группа с ошибкой записи отпечатков
    bool has_failures() const;
};

// ============================================================================
// Pipeline
// ============================================================================

struct PipelineOptions {
    std::filesystem::path output_dir = ".";
    std::filesystem::path state_dir;  // пусто -> <output_dir>/.fingerprints
    bool force = false;
    bool lint_only = false;
    unsigned jobs = 1;

    parse::ParserOptions parser;
    classify::ClassifierOptions classifier;
    emit::EmitOptions emit;
};

/// Собранная в памяти группа
struct AssembleResult {
    bool ok = false;
    rule::RuleGroup group;
    std::size_t duplicates = 0;
    std::size_t skipped = 0;
    rule::Error error;

    explicit operator bool() const { return ok; }
};

/// Исходник группы: спецификация + полученные байты
struct FetchedSource {
    rule::SourceSpec spec;
    std::string bytes;
};

class Pipeline {
public:
    /// @param compiler nullptr -> бинарный артефакт не выпускается
    Pipeline(PipelineOptions options, SourceProvider& provider, output::Writer& writer,
             Compiler* compiler = nullptr);

    /// Обработать все группы (пул из options.jobs потоков)
    RunReport run(const std::vector<rule::GroupSpec>& groups);

    /// Обработать одну группу
    GroupReport process(const rule::GroupSpec& group);

    /// parse + classify + aggregate
    /// ClassificationError пишутся в Writer как предупреждения
    AssembleResult assemble(const std::string& name, const std::vector<FetchedSource>& sources);

    const PipelineOptions& options() const { return options_; }

private:
    GroupReport build(const rule::GroupSpec& group);

    /// Записать артефакты во временные файлы, скомпилировать, переименовать
    /// @throws rule::RuleError (Emission / Compile)
    void publish(const rule::RuleGroup& group);

    PipelineOptions options_;
    SourceProvider& provider_;
    output::Writer& writer_;
    Compiler* compiler_;
    fingerprint::Ledger ledger_;
};

}  // namespace ruleforge::pipeline

#endif  // RULEFORGE_PIPELINE_HPP
