// ==============================================================================
// ruleforge/output.hpp - Пользовательский вывод
// ==============================================================================
//
// Назначение:
// - Единственная точка записи в stdout/stderr
// - Сообщения с префиксами ([+] [!] [x] [*] [~]) и уровнями -q / -v
// - Цветной вывод (ANSI escape codes)
// - Таблицы для итогового отчёта
//
// Writer потокобезопасен: группы правил собираются параллельно и пишут
// в один Writer.
//
// ==============================================================================

#ifndef RULEFORGE_OUTPUT_HPP
#define RULEFORGE_OUTPUT_HPP

#include <cstdio>
#include <mutex>
#include <string>
#include <string_view>
#include <vector>

namespace ruleforge::output {

// ----------------------------------------------------------------------------
// Потоки вывода
// ----------------------------------------------------------------------------

enum class Stream { Stdout, Stderr };

// ----------------------------------------------------------------------------
// ANSI цвета для терминала
// ----------------------------------------------------------------------------

enum class Color {
    Default,
    Green,   // Успех, информация
    Yellow,  // Предупреждения
    Red,     // Ошибки
    Cyan,    // Отладка
    Magenta  // Трассировка
};

// ----------------------------------------------------------------------------
// Конфигурация вывода
// ----------------------------------------------------------------------------

struct OutputConfig {
    bool quiet = false;      // -q: подавить informational stderr
    int verbose = 0;         // -v: уровень подробности (0..2+)
    bool no_banner = false;  // --no-banner: скрыть баннер
    bool color = true;       // разрешить ANSI-цвета (если поток - TTY)
};

// ----------------------------------------------------------------------------
// Writer - единый слой вывода
// ----------------------------------------------------------------------------

class Writer {
public:
    explicit Writer(const OutputConfig& cfg);
    ~Writer();

    Writer(const Writer&) = delete;
    Writer& operator=(const Writer&) = delete;

    /// Записать байты в поток
    void write(Stream s, std::string_view bytes);

    /// Записать строку с переводом строки
    void write_line(Stream s, std::string_view bytes);

    /// "[+] <message>" в stderr (если не quiet)
    void info(std::string_view message);

    /// "[!] <message>" в stderr (если не quiet)
    void warn(std::string_view message);

    /// "[x] <message>" в stderr (всегда)
    void error(std::string_view message);

    /// "[*] <message>" в stderr (только при verbose > 0)
    void debug(std::string_view message);

    /// "[~] <message>" в stderr (только при verbose > 1)
    void trace(std::string_view message);

    /// Сбросить буферы
    void flush();

    const OutputConfig& config() const { return config_; }

private:
    /// Записать строку с префиксом одним вызовом (без перемешивания потоков)
    void write_prefixed(Stream s, std::string_view prefix, Color color, std::string_view message);

    /// Записать байты (без блокировки, вызывается под mutex_)
    void write_impl(Stream s, std::string_view bytes);

    bool use_color(Stream s) const;

    FILE* get_file(Stream s) const;

    OutputConfig config_;
    std::mutex mutex_;
};

// ----------------------------------------------------------------------------
// Table - форматирование таблиц (Unicode box-drawing)
// ----------------------------------------------------------------------------

class Table {
public:
    Table();

    void set_headers(const std::vector<std::string>& headers);

    void add_row(const std::vector<std::string>& cells);

    /// Вывести таблицу в stdout через Writer
    void print(Writer& w) const;

    std::string to_string() const;

    size_t row_count() const { return rows_.size(); }

private:
    std::string format_line(char position) const;

    std::string format_row(const std::vector<std::string>& cells) const;

    std::vector<size_t> column_widths() const;

    std::vector<std::string> headers_;
    std::vector<std::vector<std::string>> rows_;
};

// ----------------------------------------------------------------------------
// Вспомогательные функции
// ----------------------------------------------------------------------------

/// "[x] <message>\n"
std::string format_error(std::string_view message);

/// Видимая ширина UTF-8 строки (число code points)
size_t display_width(std::string_view s);

std::string ansi_color_code(Color color);

/// Проверить, поддерживает ли поток цвета (TTY check)
bool supports_color(Stream s);

}  // namespace ruleforge::output

#endif  // RULEFORGE_OUTPUT_HPP
