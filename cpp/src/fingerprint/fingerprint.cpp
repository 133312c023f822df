// ==============================================================================
// fingerprint.cpp - Отпечатки источников и детектор изменений
// ==============================================================================

#include <ruleforge/fingerprint.hpp>
#include <ruleforge/platform.hpp>

#include <array>
#include <cctype>
#include <stdexcept>
#include <system_error>
#include <utility>

#include <openssl/evp.h>

namespace ruleforge::fingerprint {

namespace {

constexpr char HEX_DIGITS[] = "0123456789abcdef";
constexpr std::string_view RECORD_EXTENSION = ".sha256";

bool is_plain_char(char c) {
    return (c >= 'a' && c <= 'z') || (c >= 'A' && c <= 'Z') || (c >= '0' && c <= '9') ||
           c == '-' || c == '_';
}

bool is_hex_digest(std::string_view s) {
    if (s.size() != DIGEST_HEX_LENGTH) {
        return false;
    }
    for (char c : s) {
        if (!((c >= '0' && c <= '9') || (c >= 'a' && c <= 'f'))) {
            return false;
        }
    }
    return true;
}

}  // namespace

// ============================================================================
// SHA-256
// ============================================================================

std::string sha256_hex(std::string_view bytes) {
    std::array<unsigned char, EVP_MAX_MD_SIZE> md{};
    unsigned int md_len = 0;

    EVP_MD_CTX* ctx = EVP_MD_CTX_new();
    if (!ctx) {
        throw std::runtime_error("OpenSSL: EVP_MD_CTX_new failed");
    }

    if (EVP_DigestInit_ex(ctx, EVP_sha256(), nullptr) != 1 ||
        EVP_DigestUpdate(ctx, bytes.data(), bytes.size()) != 1 ||
        EVP_DigestFinal_ex(ctx, md.data(), &md_len) != 1) {
        EVP_MD_CTX_free(ctx);
        throw std::runtime_error("OpenSSL: EVP sha256 digest failed");
    }
    EVP_MD_CTX_free(ctx);

    if (md_len * 2 != DIGEST_HEX_LENGTH) {
        throw std::runtime_error("OpenSSL: unexpected SHA-256 digest length");
    }

    std::string hex;
    hex.reserve(DIGEST_HEX_LENGTH);
    for (unsigned int i = 0; i < md_len; ++i) {
        hex.push_back(HEX_DIGITS[md[i] >> 4]);
        hex.push_back(HEX_DIGITS[md[i] & 0x0F]);
    }
    return hex;
}

std::string to_string(SourceState s) {
    switch (s) {
    case SourceState::Unchanged:
        return "unchanged";
    case SourceState::Changed:
        return "changed";
    }
    return "unknown";
}

SourceState check(const std::optional<SourceDigests>& recorded, const std::string& id,
                  const std::string& digest) {
    if (recorded) {
        auto it = recorded->find(id);
        if (it != recorded->end() && it->second == digest) {
            return SourceState::Unchanged;
        }
    }
    return SourceState::Changed;
}

std::string escape_record_name(std::string_view name) {
    std::string out;
    out.reserve(name.size());
    for (std::size_t i = 0; i < name.size(); ++i) {
        const char c = name[i];
        if (is_plain_char(c) || (c == '.' && i > 0)) {
            out.push_back(c);
        } else {
            const auto byte = static_cast<unsigned char>(c);
            out.push_back('%');
            out.push_back(static_cast<char>(std::toupper(HEX_DIGITS[byte >> 4])));
            out.push_back(static_cast<char>(std::toupper(HEX_DIGITS[byte & 0x0F])));
        }
    }
    return out;
}

// ============================================================================
// Ledger
// ============================================================================

Ledger::Ledger(std::filesystem::path directory) : directory_(std::move(directory)) {}

std::filesystem::path Ledger::record_path(std::string_view group) const {
    return directory_ /
           platform::path_from_utf8(escape_record_name(group) + std::string(RECORD_EXTENSION));
}

std::optional<SourceDigests> Ledger::load(const std::string& group) const {
    std::string content;
    std::error_code ec;
    if (!platform::read_file(record_path(group), content, ec)) {
        return std::nullopt;
    }

    // "<digest>  <id>\n" на каждый источник
    SourceDigests digests;
    std::size_t pos = 0;
    while (pos < content.size()) {
        std::size_t end = content.find('\n', pos);
        if (end == std::string::npos) {
            return std::nullopt;  // обрезанная запись
        }
        const std::string_view line(content.data() + pos, end - pos);
        pos = end + 1;

        if (line.size() <= DIGEST_HEX_LENGTH + 2 ||
            line.substr(DIGEST_HEX_LENGTH, 2) != "  " ||
            !is_hex_digest(line.substr(0, DIGEST_HEX_LENGTH))) {
            return std::nullopt;
        }
        std::string id(line.substr(DIGEST_HEX_LENGTH + 2));
        std::string digest(line.substr(0, DIGEST_HEX_LENGTH));
        if (!digests.emplace(std::move(id), std::move(digest)).second) {
            return std::nullopt;
        }
    }
    return digests;
}

std::optional<std::string> Ledger::lookup(const std::string& group, const std::string& id) const {
    auto digests = load(group);
    if (!digests) {
        return std::nullopt;
    }
    auto it = digests->find(id);
    if (it == digests->end()) {
        return std::nullopt;
    }
    return it->second;
}

void Ledger::commit(const std::string& group, const SourceDigests& digests) {
    std::string content;
    for (const auto& [id, digest] : digests) {
        if (!is_hex_digest(digest)) {
            throw std::runtime_error("invalid digest for source '" + id + "'");
        }
        if (id.empty() || id.find_first_of("\r\n") != std::string::npos) {
            throw std::runtime_error("source id '" + id + "' cannot be recorded");
        }
        content += digest;
        content += "  ";
        content += id;
        content += '\n';
    }

    std::lock_guard<std::mutex> lock(mutex_for(group));

    std::error_code ec;
    std::filesystem::create_directories(directory_, ec);
    if (ec) {
        throw std::runtime_error("failed to create state directory " +
                                 platform::path_to_utf8(directory_) + " - " + ec.message());
    }

    platform::write_file_atomic(record_path(group), content);
}

std::mutex& Ledger::mutex_for(const std::string& group) {
    std::lock_guard<std::mutex> lock(registry_mutex_);
    auto& slot = group_mutexes_[group];
    if (!slot) {
        slot = std::make_unique<std::mutex>();
    }
    return *slot;
}

}  // namespace ruleforge::fingerprint
