// ==============================================================================
// output.cpp - Пользовательский вывод
// ==============================================================================
//
// Только этот модуль пишет в stdout/stderr.
// Байты первичны, std::endl не используется.
//
// ==============================================================================

#include "ruleforge/output.hpp"

#include "ruleforge/platform.hpp"

#include <algorithm>
#include <cstdio>

namespace ruleforge::output {

// ----------------------------------------------------------------------------
// ANSI Escape Codes
// ----------------------------------------------------------------------------

namespace {

constexpr const char* ANSI_RESET = "\x1b[0m";
constexpr const char* ANSI_GREEN = "\x1b[32m";
constexpr const char* ANSI_YELLOW = "\x1b[33m";
constexpr const char* ANSI_RED = "\x1b[31m";
constexpr const char* ANSI_CYAN = "\x1b[36m";
constexpr const char* ANSI_MAGENTA = "\x1b[35m";

// Unicode box-drawing characters (UTF-8)
constexpr const char* BOX_V = "\xe2\x94\x82";      // │ U+2502
constexpr const char* BOX_H = "\xe2\x94\x80";      // ─ U+2500
constexpr const char* BOX_TL = "\xe2\x94\x8c";     // ┌ U+250C
constexpr const char* BOX_TR = "\xe2\x94\x90";     // ┐ U+2510
constexpr const char* BOX_BL = "\xe2\x94\x94";     // └ U+2514
constexpr const char* BOX_BR = "\xe2\x94\x98";     // ┘ U+2518
constexpr const char* BOX_LT = "\xe2\x94\x9c";     // ├ U+251C
constexpr const char* BOX_RT = "\xe2\x94\xa4";     // ┤ U+2524
constexpr const char* BOX_TT = "\xe2\x94\xac";     // ┬ U+252C
constexpr const char* BOX_BT = "\xe2\x94\xb4";     // ┴ U+2534
constexpr const char* BOX_CROSS = "\xe2\x94\xbc";  // ┼ U+253C

}  // namespace

// ----------------------------------------------------------------------------
// Writer
// ----------------------------------------------------------------------------

Writer::Writer(const OutputConfig& cfg) : config_(cfg) {}

Writer::~Writer() {
    flush();
}

void Writer::write(Stream s, std::string_view bytes) {
    std::lock_guard<std::mutex> lock(mutex_);
    write_impl(s, bytes);
}

void Writer::write_line(Stream s, std::string_view bytes) {
    std::string line(bytes);
    line += '\n';
    write(s, line);
}

void Writer::write_impl(Stream s, std::string_view bytes) {
    std::fwrite(bytes.data(), 1, bytes.size(), get_file(s));
}

FILE* Writer::get_file(Stream s) const {
    return (s == Stream::Stdout) ? stdout : stderr;
}

bool Writer::use_color(Stream s) const {
    if (!config_.color) {
        return false;
    }
    return supports_color(s);
}

void Writer::write_prefixed(Stream s, std::string_view prefix, Color color,
                            std::string_view message) {
    std::string line;
    line.reserve(prefix.size() + message.size() + 16);
    if (use_color(s)) {
        line += ansi_color_code(color);
        line += prefix;
        line += ANSI_RESET;
    } else {
        line += prefix;
    }
    line += message;
    line += '\n';

    std::lock_guard<std::mutex> lock(mutex_);
    write_impl(s, line);
}

void Writer::info(std::string_view message) {
    if (config_.quiet) {
        return;
    }
    write_prefixed(Stream::Stderr, "[+] ", Color::Green, message);
}

void Writer::warn(std::string_view message) {
    if (config_.quiet) {
        return;
    }
    write_prefixed(Stream::Stderr, "[!] ", Color::Yellow, message);
}

void Writer::error(std::string_view message) {
    // Ошибки всегда печатаются, даже при --quiet
    write_prefixed(Stream::Stderr, "[x] ", Color::Red, message);
}

void Writer::debug(std::string_view message) {
    if (config_.verbose <= 0) {
        return;
    }
    write_prefixed(Stream::Stderr, "[*] ", Color::Cyan, message);
}

void Writer::trace(std::string_view message) {
    if (config_.verbose <= 1) {
        return;
    }
    write_prefixed(Stream::Stderr, "[~] ", Color::Magenta, message);
}

void Writer::flush() {
    std::lock_guard<std::mutex> lock(mutex_);
    std::fflush(stdout);
    std::fflush(stderr);
}

// ----------------------------------------------------------------------------
// Table
// ----------------------------------------------------------------------------

Table::Table() = default;

void Table::set_headers(const std::vector<std::string>& headers) {
    headers_ = headers;
}

void Table::add_row(const std::vector<std::string>& cells) {
    rows_.push_back(cells);
}

std::vector<size_t> Table::column_widths() const {
    size_t num_cols = headers_.size();
    for (const auto& row : rows_) {
        num_cols = std::max(num_cols, row.size());
    }

    std::vector<size_t> widths(num_cols, 0);
    for (size_t i = 0; i < headers_.size(); ++i) {
        widths[i] = std::max(widths[i], display_width(headers_[i]));
    }
    for (const auto& row : rows_) {
        for (size_t i = 0; i < row.size(); ++i) {
            widths[i] = std::max(widths[i], display_width(row[i]));
        }
    }
    return widths;
}

std::string Table::format_line(char position) const {
    // position: 'T' - верх, 'M' - разделитель заголовка, 'B' - низ
    const char* left = position == 'T' ? BOX_TL : (position == 'M' ? BOX_LT : BOX_BL);
    const char* middle = position == 'T' ? BOX_TT : (position == 'M' ? BOX_CROSS : BOX_BT);
    const char* right = position == 'T' ? BOX_TR : (position == 'M' ? BOX_RT : BOX_BR);

    const auto widths = column_widths();

    std::string line = left;
    for (size_t i = 0; i < widths.size(); ++i) {
        for (size_t j = 0; j < widths[i] + 2; ++j) {
            line += BOX_H;
        }
        if (i + 1 < widths.size()) {
            line += middle;
        }
    }
    line += right;
    return line;
}

std::string Table::format_row(const std::vector<std::string>& cells) const {
    const auto widths = column_widths();

    std::string line = BOX_V;
    for (size_t i = 0; i < widths.size(); ++i) {
        line += ' ';
        std::string cell = (i < cells.size()) ? cells[i] : "";
        line += cell;
        size_t w = display_width(cell);
        if (w < widths[i]) {
            line.append(widths[i] - w, ' ');
        }
        line += ' ';
        line += BOX_V;
    }
    return line;
}

std::string Table::to_string() const {
    std::string result;

    result += format_line('T');
    result += '\n';

    if (!headers_.empty()) {
        result += format_row(headers_);
        result += '\n';
        result += format_line('M');
        result += '\n';
    }

    for (const auto& row : rows_) {
        result += format_row(row);
        result += '\n';
    }

    result += format_line('B');
    result += '\n';

    return result;
}

void Table::print(Writer& w) const {
    w.write(Stream::Stdout, to_string());
}

// ----------------------------------------------------------------------------
// Вспомогательные функции
// ----------------------------------------------------------------------------

std::string format_error(std::string_view message) {
    std::string result = "[x] ";
    result.append(message);
    result.append("\n");
    return result;
}

size_t display_width(std::string_view s) {
    // Считаем только ведущие байты UTF-8 (не 10xxxxxx)
    size_t width = 0;
    for (char c : s) {
        if ((static_cast<unsigned char>(c) & 0xC0) != 0x80) {
            ++width;
        }
    }
    return width;
}

std::string ansi_color_code(Color color) {
    switch (color) {
    case Color::Green:
        return ANSI_GREEN;
    case Color::Yellow:
        return ANSI_YELLOW;
    case Color::Red:
        return ANSI_RED;
    case Color::Cyan:
        return ANSI_CYAN;
    case Color::Magenta:
        return ANSI_MAGENTA;
    case Color::Default:
    default:
        return "";
    }
}

bool supports_color(Stream s) {
    if (s == Stream::Stdout) {
        return platform::is_tty_stdout();
    }
    return platform::is_tty_stderr();
}

}  // namespace ruleforge::output
