// ==============================================================================
// test_fingerprint_gtest.cpp - Тесты отпечатков и Ledger (GoogleTest)
// ==============================================================================
//
// fingerprint: SHA-256 (известные векторы), check, escape_record_name, Ledger
//
// ==============================================================================

#include "ruleforge/fingerprint.hpp"

#include <filesystem>
#include <fstream>
#include <gtest/gtest.h>
#include <iterator>
#include <optional>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>

#ifdef _WIN32
#include <windows.h>
#else
#include <unistd.h>
#endif

namespace ruleforge::fingerprint::test {

namespace {

const std::string EMPTY_SHA256 =
    "e3b0c44298fc1c149afbf4c8996fb92427ae41e4649b934ca495991b7852b855";
const std::string ABC_SHA256 = "ba7816bf8f01cfea414140de5dae2223b00361a396177a9cb410ff61f20015ad";

}  // namespace

// ==============================================================================
// SHA-256
// ==============================================================================

TEST(FingerprintTest, Sha256_KnownVectors) {
    EXPECT_EQ(sha256_hex(""), EMPTY_SHA256);
    EXPECT_EQ(sha256_hex("abc"), ABC_SHA256);
    EXPECT_EQ(sha256_hex("abc").size(), DIGEST_HEX_LENGTH);
}

TEST(FingerprintTest, Sha256_BytesSensitive) {
    // Разница только в окончании строк
    EXPECT_NE(sha256_hex("example.com\n"), sha256_hex("example.com\r\n"));
    EXPECT_EQ(sha256_hex(std::string("a\0b", 3)), sha256_hex(std::string("a\0b", 3)));
    EXPECT_NE(sha256_hex(std::string("a\0b", 3)), sha256_hex("a"));
}

TEST(FingerprintTest, SourceState_ToString) {
    EXPECT_EQ(to_string(SourceState::Unchanged), "unchanged");
    EXPECT_EQ(to_string(SourceState::Changed), "changed");
}

// ==============================================================================
// check
// ==============================================================================

TEST(FingerprintTest, Check_AgainstGroupRecord) {
    const std::optional<SourceDigests> recorded = SourceDigests{{"emby.list", ABC_SHA256}};

    EXPECT_EQ(check(recorded, "emby.list", ABC_SHA256), SourceState::Unchanged);
    EXPECT_EQ(check(recorded, "emby.list", EMPTY_SHA256), SourceState::Changed);
    EXPECT_EQ(check(recorded, "netflix.list", ABC_SHA256), SourceState::Changed);
    EXPECT_EQ(check(std::nullopt, "emby.list", ABC_SHA256), SourceState::Changed);
}

// ==============================================================================
// escape_record_name
// ==============================================================================

TEST(FingerprintTest, EscapeRecordName) {
    EXPECT_EQ(escape_record_name("emby"), "emby");
    EXPECT_EQ(escape_record_name("emby.list"), "emby.list");
    EXPECT_EQ(escape_record_name("rules/emby.list"), "rules%2Femby.list");
    EXPECT_EQ(escape_record_name(".hidden"), "%2Ehidden");
    EXPECT_EQ(escape_record_name("a b:c"), "a%20b%3Ac");
    EXPECT_EQ(escape_record_name("100%"), "100%25");
}

TEST(FingerprintTest, EscapeRecordName_DistinctIdsDistinctNames) {
    EXPECT_NE(escape_record_name("a/b"), escape_record_name("a%2Fb"));
}

// ==============================================================================
// Ledger
// ==============================================================================

class LedgerTest : public ::testing::Test {
protected:
    std::filesystem::path test_dir_;

    void SetUp() override {
        auto* test_info = ::testing::UnitTest::GetInstance()->current_test_info();
        std::string unique_name = std::string("ruleforge_ledger_") + test_info->name() + "_" +
                                  std::to_string(
#ifdef _WIN32
                                      GetCurrentProcessId()
#else
                                      getpid()
#endif
                                  );
        test_dir_ = std::filesystem::temp_directory_path() / unique_name;

        std::error_code ec;
        std::filesystem::remove_all(test_dir_, ec);
    }

    void TearDown() override {
        std::error_code ec;
        std::filesystem::remove_all(test_dir_, ec);
    }
};

TEST_F(LedgerTest, Load_NoRecord) {
    Ledger ledger(test_dir_ / "state");

    EXPECT_FALSE(ledger.load("emby").has_value());
    EXPECT_FALSE(ledger.lookup("emby", "emby.list").has_value());
}

TEST_F(LedgerTest, Commit_CreatesDirectoryAndRecord) {
    // Arrange
    Ledger ledger(test_dir_ / "state");

    // Act
    ledger.commit("emby", {{"rules/emby.list", ABC_SHA256}, {"extra/emby.yaml", EMPTY_SHA256}});

    // Assert: одна запись на группу, строки по id
    auto path = ledger.record_path("emby");
    EXPECT_EQ(path, test_dir_ / "state" / "emby.sha256");
    ASSERT_TRUE(std::filesystem::exists(path));

    std::ifstream in(path, std::ios::binary);
    std::string content((std::istreambuf_iterator<char>(in)), std::istreambuf_iterator<char>());
    EXPECT_EQ(content, EMPTY_SHA256 + "  extra/emby.yaml\n" + ABC_SHA256 + "  rules/emby.list\n");
}

TEST_F(LedgerTest, RecordPath_EscapesGroupName) {
    Ledger ledger(test_dir_);

    EXPECT_EQ(ledger.record_path(".hidden"), test_dir_ / "%2Ehidden.sha256");
}

TEST_F(LedgerTest, Load_AfterCommit) {
    Ledger ledger(test_dir_);
    ledger.commit("emby", {{"emby.list", ABC_SHA256}});

    auto recorded = ledger.load("emby");
    ASSERT_TRUE(recorded.has_value());
    EXPECT_EQ(recorded->size(), 1u);
    EXPECT_EQ(ledger.lookup("emby", "emby.list"), ABC_SHA256);
    EXPECT_EQ(check(recorded, "emby.list", ABC_SHA256), SourceState::Unchanged);
}

TEST_F(LedgerTest, Commit_ReplacesWholeRecord) {
    Ledger ledger(test_dir_);
    ledger.commit("emby", {{"a.list", ABC_SHA256}, {"b.list", ABC_SHA256}});
    ledger.commit("emby", {{"a.list", EMPTY_SHA256}});

    EXPECT_EQ(ledger.lookup("emby", "a.list"), EMPTY_SHA256);
    EXPECT_FALSE(ledger.lookup("emby", "b.list").has_value());
}

TEST_F(LedgerTest, SharedSource_RecordedPerGroup) {
    // Arrange: один источник в двух группах
    Ledger ledger(test_dir_);
    ledger.commit("g1", {{"shared.list", ABC_SHA256}});
    ledger.commit("g2", {{"shared.list", ABC_SHA256}});

    // Act: g1 пересобрана с новым содержимым источника
    ledger.commit("g1", {{"shared.list", EMPTY_SHA256}});

    // Assert: g2 по-прежнему видит старый отпечаток
    EXPECT_EQ(ledger.lookup("g1", "shared.list"), EMPTY_SHA256);
    EXPECT_EQ(ledger.lookup("g2", "shared.list"), ABC_SHA256);
    EXPECT_EQ(check(ledger.load("g2"), "shared.list", EMPTY_SHA256), SourceState::Changed);
}

TEST_F(LedgerTest, PersistsAcrossInstances) {
    {
        Ledger first(test_dir_);
        first.commit("emby", {{"emby.list", ABC_SHA256}});
    }

    Ledger second(test_dir_);
    EXPECT_EQ(check(second.load("emby"), "emby.list", ABC_SHA256), SourceState::Unchanged);
}

TEST_F(LedgerTest, Commit_InvalidDigest_RecordUntouched) {
    // Arrange
    Ledger ledger(test_dir_);
    ledger.commit("emby", {{"a.list", ABC_SHA256}});

    // Act: второй источник с некорректным digest
    EXPECT_THROW(ledger.commit("emby", {{"a.list", EMPTY_SHA256}, {"b.list", "not-a-digest"}}),
                 std::runtime_error);
    EXPECT_THROW(ledger.commit("emby", {{"a.list", std::string(64, 'G')}}), std::runtime_error);

    // Assert: запись не изменилась ни частично, ни целиком
    EXPECT_EQ(ledger.lookup("emby", "a.list"), ABC_SHA256);
    EXPECT_FALSE(ledger.lookup("emby", "b.list").has_value());
}

TEST_F(LedgerTest, Commit_IdWithNewline_Throws) {
    Ledger ledger(test_dir_);

    EXPECT_THROW(ledger.commit("emby", {{"a\nb", ABC_SHA256}}), std::runtime_error);
    EXPECT_FALSE(ledger.load("emby").has_value());
}

TEST_F(LedgerTest, Commit_StateDirIsFile_Throws) {
    std::filesystem::create_directories(test_dir_);
    std::ofstream(test_dir_ / "state") << "not a directory\n";
    Ledger ledger(test_dir_ / "state");

    EXPECT_THROW(ledger.commit("emby", {{"emby.list", ABC_SHA256}}), std::runtime_error);
}

TEST_F(LedgerTest, Load_CorruptRecord_TreatedAsMissing) {
    // Arrange
    Ledger ledger(test_dir_);
    std::filesystem::create_directories(test_dir_);
    const std::vector<std::string> corrupt = {
        "garbage\n",
        ABC_SHA256 + "  a.list",                                   // без перевода строки
        ABC_SHA256 + " a.list\n",                                  // один пробел
        ABC_SHA256 + "  a.list\n" + EMPTY_SHA256 + "  a.list\n",  // повтор id
    };

    for (const auto& content : corrupt) {
        {
            std::ofstream out(ledger.record_path("emby"), std::ios::binary | std::ios::trunc);
            out << content;
        }

        // Act + Assert
        EXPECT_FALSE(ledger.load("emby").has_value()) << content;
        EXPECT_EQ(check(ledger.load("emby"), "a.list", ABC_SHA256), SourceState::Changed);
    }
}

TEST_F(LedgerTest, ConcurrentCommits_SameGroup) {
    // Arrange
    Ledger ledger(test_dir_);
    const std::vector<std::string> digests = {ABC_SHA256, EMPTY_SHA256};

    // Act: параллельные коммиты одной группы не портят запись
    std::vector<std::thread> pool;
    for (int t = 0; t < 8; ++t) {
        pool.emplace_back([&ledger, &digests, t]() {
            for (int i = 0; i < 20; ++i) {
                const std::string& d = digests[static_cast<std::size_t>((t + i) % 2)];
                ledger.commit("emby", {{"a.list", d}, {"b.list", d}});
            }
        });
    }
    for (auto& th : pool) {
        th.join();
    }

    // Assert: итог - одна из записанных версий целиком, временных файлов нет
    auto recorded = ledger.load("emby");
    ASSERT_TRUE(recorded.has_value());
    ASSERT_EQ(recorded->size(), 2u);
    EXPECT_EQ(recorded->at("a.list"), recorded->at("b.list"));

    std::size_t files = 0;
    for (const auto& entry : std::filesystem::directory_iterator(test_dir_)) {
        (void)entry;
        ++files;
    }
    EXPECT_EQ(files, 1u);
}

}  // namespace ruleforge::fingerprint::test
