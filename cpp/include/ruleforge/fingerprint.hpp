// ==============================================================================
// ruleforge/fingerprint.hpp - Отпечатки источников и детектор изменений
// ==============================================================================
//
// Назначение:
// - SHA-256 (OpenSSL EVP) от сырых байтов источника
// - Ledger: персистентные отпечатки по source id
// - Решение Unchanged / Changed для каждого источника
//
// Формат хранения:
// - Один файл на группу: <state-dir>/<escaped group>.sha256
// - Строка на источник: "<hex digest>  <source id>\n" (как у sha256sum),
//   строки упорядочены по source id
// - Запись группы заменяется целиком одним rename (temp + rename)
// - Группы не видят отпечатков друг друга, даже при общем источнике
// - Коммиты одной группы сериализуются мьютексом
//
// ==============================================================================

#ifndef RULEFORGE_FINGERPRINT_HPP
#define RULEFORGE_FINGERPRINT_HPP

#include <filesystem>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>

namespace ruleforge::fingerprint {

/// Длина hex-представления SHA-256
constexpr std::size_t DIGEST_HEX_LENGTH = 64;

/// SHA-256 от байтов, lower-case hex
/// @throws std::runtime_error при ошибке OpenSSL
std::string sha256_hex(std::string_view bytes);

/// Отпечатки источников группы: source id -> digest
using SourceDigests = std::map<std::string, std::string>;

/// Состояние источника относительно сохранённого отпечатка
enum class SourceState {
    Unchanged,  // отпечаток совпадает с сохранённым
    Changed,    // отличается или записи нет
};

std::string to_string(SourceState s);

/// Сравнить digest источника с записью группы (nullopt - записи нет)
SourceState check(const std::optional<SourceDigests>& recorded, const std::string& id,
                  const std::string& digest);

/// Имя файла записи
/// Символы [A-Za-z0-9_-] и не-ведущая '.' сохраняются, остальные -> %XX
std::string escape_record_name(std::string_view name);

// ----------------------------------------------------------------------------
// Ledger
// ----------------------------------------------------------------------------

class Ledger {
public:
    explicit Ledger(std::filesystem::path directory);

    Ledger(const Ledger&) = delete;
    Ledger& operator=(const Ledger&) = delete;

    const std::filesystem::path& directory() const { return directory_; }

    /// Путь к записи группы
    std::filesystem::path record_path(std::string_view group) const;

    /// Запись группы
    /// Отсутствующая или повреждённая запись -> nullopt
    std::optional<SourceDigests> load(const std::string& group) const;

    /// Сохранённый отпечаток источника в записи группы
    std::optional<std::string> lookup(const std::string& group, const std::string& id) const;

    /// Заменить запись группы (создаёт директорию при необходимости)
    /// Запись меняется целиком или не меняется вовсе.
    /// @throws std::runtime_error при некорректном digest/id или ошибке записи
    void commit(const std::string& group, const SourceDigests& digests);

private:
    std::mutex& mutex_for(const std::string& group);

    std::filesystem::path directory_;

    std::mutex registry_mutex_;
    std::map<std::string, std::unique_ptr<std::mutex>> group_mutexes_;
};

}  // namespace ruleforge::fingerprint

#endif  // RULEFORGE_FINGERPRINT_HPP
