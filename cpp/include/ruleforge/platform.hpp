// ==============================================================================
// ruleforge/platform.hpp - Платформенные абстракции
// ==============================================================================
//
// Назначение:
// - Преобразования std::filesystem::path <-> UTF-8
// - Определение TTY для цветного вывода
// - Атомарная замена файлов (temp + rename)
// - Чтение файлов целиком
//
// Вся платформенная специфика изолирована здесь.
//
// ==============================================================================

#ifndef RULEFORGE_PLATFORM_HPP
#define RULEFORGE_PLATFORM_HPP

#include <filesystem>
#include <string>
#include <string_view>
#include <system_error>

namespace ruleforge::platform {

// ----------------------------------------------------------------------------
// Преобразования путей
// ----------------------------------------------------------------------------

/// Построить path из UTF-8 строки
std::filesystem::path path_from_utf8(std::string_view u8str);

/// Получить UTF-8 представление пути
std::string path_to_utf8(const std::filesystem::path& p);

// ----------------------------------------------------------------------------
// TTY detection
// ----------------------------------------------------------------------------

bool is_tty_stdout();
bool is_tty_stderr();

// ----------------------------------------------------------------------------
// Файлы
// ----------------------------------------------------------------------------

/// Прочитать файл целиком (байты как есть)
/// @return false при ошибке открытия/чтения, ec заполняется
bool read_file(const std::filesystem::path& path, std::string& out, std::error_code& ec);

/// Уникальное имя временного файла рядом с target (файл не создаётся)
/// Имя: "<target>.tmp-<pid>-<n>"
std::filesystem::path temp_sibling_path(const std::filesystem::path& target);

/// Записать байты во временный файл рядом с target
/// Имя: "<target>.tmp-<pid>-<n>". Возвращает путь к временному файлу.
/// @throws std::runtime_error при ошибке записи
std::filesystem::path write_temp_sibling(const std::filesystem::path& target,
                                         std::string_view bytes);

/// Атомарно заменить target содержимым bytes (temp + rename)
/// Читатель видит либо старое, либо новое содержимое.
/// @throws std::runtime_error при ошибке записи/переименования
void write_file_atomic(const std::filesystem::path& target, std::string_view bytes);

// ----------------------------------------------------------------------------
// Информация о платформе
// ----------------------------------------------------------------------------

/// "Windows", "Linux", "macOS" или "Unknown"
std::string os_name();

}  // namespace ruleforge::platform

#endif  // RULEFORGE_PLATFORM_HPP
