// ==============================================================================
// test_config_gtest.cpp - Тесты конфигурации сборки (GoogleTest)
// ==============================================================================
//
// config: parse_config / load_config (yaml-cpp), groups_from_paths,
// validate_groups
//
// ==============================================================================

#include "ruleforge/config.hpp"

#include <filesystem>
#include <fstream>
#include <gtest/gtest.h>
#include <string>
#include <vector>

#ifdef _WIN32
#include <windows.h>
#else
#include <unistd.h>
#endif

namespace ruleforge::config::test {

using rule::Dialect;
using rule::ErrorKind;
using rule::RuleKind;

namespace {

LoadResult parse(const std::string& text) {
    return parse_config(text, "/etc/ruleforge", "groups.yaml");
}

rule::GroupSpec group(std::string name, std::vector<std::string> ids) {
    rule::GroupSpec g;
    g.name = std::move(name);
    for (auto& id : ids) {
        rule::SourceSpec s;
        s.id = id;
        s.location = id;
        s.dialect = Dialect::List;
        g.sources.push_back(std::move(s));
    }
    return g;
}

}  // namespace

// ==============================================================================
// parse_config
// ==============================================================================

TEST(ConfigTest, Parse_FullDocument) {
    // Arrange
    std::string text = "output: dist\n"
                       "state: /var/lib/ruleforge\n"
                       "structured_version: 2\n"
                       "sections: false\n"
                       "classifier:\n"
                       "  comment_marker: \"!\"\n"
                       "  bare_domain: suffix\n"
                       "  leading_dot: exact\n"
                       "  keyword_marker: \"~\"\n"
                       "  suffix_markers: [\"+.\"]\n"
                       "groups:\n"
                       "  - name: emby\n"
                       "    sources:\n"
                       "      - emby.list\n"
                       "      - path: upstream/emby.yaml\n"
                       "        id: emby-upstream\n"
                       "      - path: extra.conf\n"
                       "        dialect: list\n";

    // Act
    auto result = parse(text);

    // Assert
    ASSERT_TRUE(result.ok) << result.error.format();
    const Config& cfg = result.config;
    EXPECT_EQ(cfg.output, std::filesystem::path("/etc/ruleforge/dist"));
    EXPECT_EQ(cfg.state, std::filesystem::path("/var/lib/ruleforge"));
    EXPECT_EQ(cfg.structured_version, 2);
    EXPECT_FALSE(cfg.sections);
    EXPECT_EQ(cfg.classifier.comment_marker, "!");
    EXPECT_EQ(cfg.classifier.bare_domain, RuleKind::DomainSuffix);
    EXPECT_EQ(cfg.classifier.leading_dot, RuleKind::ExactDomain);
    EXPECT_EQ(cfg.classifier.keyword_marker, '~');
    EXPECT_EQ(cfg.classifier.suffix_markers, std::vector<std::string>{"+."});

    ASSERT_EQ(cfg.groups.size(), 1u);
    const auto& g = cfg.groups[0];
    EXPECT_EQ(g.name, "emby");
    ASSERT_EQ(g.sources.size(), 3u);
    EXPECT_EQ(g.sources[0].id, "emby.list");
    EXPECT_EQ(g.sources[0].location, std::filesystem::path("/etc/ruleforge/emby.list"));
    EXPECT_EQ(g.sources[0].dialect, Dialect::List);
    EXPECT_EQ(g.sources[1].id, "emby-upstream");
    EXPECT_EQ(g.sources[1].dialect, Dialect::Yaml);
    EXPECT_EQ(g.sources[2].dialect, Dialect::List);
}

TEST(ConfigTest, Parse_Defaults) {
    auto result = parse("groups:\n"
                        "  - name: emby\n"
                        "    sources: [emby.list]\n");

    ASSERT_TRUE(result.ok) << result.error.format();
    EXPECT_FALSE(result.config.output.has_value());
    EXPECT_FALSE(result.config.state.has_value());
    EXPECT_EQ(result.config.structured_version, 1);
    EXPECT_TRUE(result.config.sections);
    EXPECT_EQ(result.config.classifier.bare_domain, RuleKind::ExactDomain);
    EXPECT_EQ(result.config.classifier.leading_dot, RuleKind::DomainSuffix);
}

TEST(ConfigTest, Parse_EmptyDocument_NoGroups) {
    auto result = parse("");

    ASSERT_TRUE(result.ok);
    EXPECT_TRUE(result.config.groups.empty());
}

TEST(ConfigTest, Parse_AbsoluteSourcePathKept) {
    auto result = parse("groups:\n"
                        "  - name: emby\n"
                        "    sources: [/srv/rules/../rules/emby.list]\n");

    ASSERT_TRUE(result.ok);
    EXPECT_EQ(result.config.groups[0].sources[0].location,
              std::filesystem::path("/srv/rules/emby.list"));
}

// ==============================================================================
// parse_config: ошибки
// ==============================================================================

TEST(ConfigTest, Parse_InvalidDomainKind_ErrorWithLine) {
    auto result = parse("classifier:\n"
                        "  bare_domain: keyword\n");

    ASSERT_FALSE(result.ok);
    EXPECT_EQ(result.error.kind, ErrorKind::Config);
    EXPECT_EQ(result.error.source, "groups.yaml");
    ASSERT_TRUE(result.error.line.has_value());
    EXPECT_EQ(*result.error.line, 2u);
    EXPECT_NE(result.error.message.find("bare_domain"), std::string::npos);
}

TEST(ConfigTest, Parse_UnknownDialect_Error) {
    auto result = parse("groups:\n"
                        "  - name: emby\n"
                        "    sources:\n"
                        "      - path: emby.toml\n"
                        "        dialect: toml\n");

    ASSERT_FALSE(result.ok);
    EXPECT_EQ(result.error.kind, ErrorKind::Config);
    ASSERT_TRUE(result.error.line.has_value());
    EXPECT_EQ(*result.error.line, 5u);
}

TEST(ConfigTest, Parse_UninferableDialect_Error) {
    auto result = parse("groups:\n"
                        "  - name: emby\n"
                        "    sources: [emby.srs]\n");

    ASSERT_FALSE(result.ok);
    EXPECT_NE(result.error.message.find("emby.srs"), std::string::npos);
}

TEST(ConfigTest, Parse_StructuralErrors) {
    EXPECT_FALSE(parse("- a\n- b\n").ok);
    EXPECT_FALSE(parse("groups: emby\n").ok);
    EXPECT_FALSE(parse("groups:\n  - sources: [a.list]\n").ok);
    EXPECT_FALSE(parse("groups:\n  - name: emby\n").ok);
    EXPECT_FALSE(parse("groups:\n  - name: emby\n    sources: [{dialect: list}]\n").ok);
    EXPECT_FALSE(parse("structured_version: 0\n").ok);
    EXPECT_FALSE(parse("structured_version: two\n").ok);
    EXPECT_FALSE(parse("classifier:\n  keyword_marker: \"**\"\n").ok);
    EXPECT_FALSE(parse("classifier:\n  keyword_marker: a\n").ok);
}

TEST(ConfigTest, Parse_MalformedYaml_ErrorWithLine) {
    auto result = parse("groups:\n"
                        "  - name: [emby\n");

    ASSERT_FALSE(result.ok);
    EXPECT_EQ(result.error.kind, ErrorKind::Config);
    EXPECT_TRUE(result.error.line.has_value());
}

TEST(ConfigTest, Parse_DuplicateGroupName_Error) {
    auto result = parse("groups:\n"
                        "  - name: emby\n"
                        "    sources: [a.list]\n"
                        "  - name: emby\n"
                        "    sources: [b.list]\n");

    ASSERT_FALSE(result.ok);
    EXPECT_EQ(result.error.source, "groups.yaml");
    EXPECT_NE(result.error.message.find("duplicate group name 'emby'"), std::string::npos);
}

TEST(ConfigTest, LoadConfig_MissingFile_Error) {
    auto result = load_config("/nonexistent/ruleforge/groups.yaml");

    ASSERT_FALSE(result.ok);
    EXPECT_EQ(result.error.kind, ErrorKind::Config);
    EXPECT_NE(result.error.message.find("failed to read configuration"), std::string::npos);
}

// ==============================================================================
// validate_groups / is_valid_group_name
// ==============================================================================

TEST(ConfigTest, IsValidGroupName) {
    EXPECT_TRUE(is_valid_group_name("emby"));
    EXPECT_TRUE(is_valid_group_name("geo-cn.direct"));
    EXPECT_FALSE(is_valid_group_name(""));
    EXPECT_FALSE(is_valid_group_name("."));
    EXPECT_FALSE(is_valid_group_name(".."));
    EXPECT_FALSE(is_valid_group_name("a/b"));
    EXPECT_FALSE(is_valid_group_name("a\\b"));
    EXPECT_FALSE(is_valid_group_name("c:x"));
    EXPECT_FALSE(is_valid_group_name("tab\there"));
}

TEST(ConfigTest, ValidateGroups) {
    EXPECT_FALSE(validate_groups({group("a", {"x"}), group("b", {"x"})}).has_value());

    auto dup_name = validate_groups({group("a", {"x"}), group("a", {"y"})});
    ASSERT_TRUE(dup_name.has_value());
    EXPECT_EQ(dup_name->kind, ErrorKind::Config);

    EXPECT_TRUE(validate_groups({group("a", {})}).has_value());
    EXPECT_TRUE(validate_groups({group("a", {"x", "x"})}).has_value());
    EXPECT_TRUE(validate_groups({group("a", {""})}).has_value());
    EXPECT_TRUE(validate_groups({group("../a", {"x"})}).has_value());
}

// ==============================================================================
// groups_from_paths
// ==============================================================================

class GroupsFromPathsTest : public ::testing::Test {
protected:
    std::filesystem::path test_dir_;

    void SetUp() override {
        auto* test_info = ::testing::UnitTest::GetInstance()->current_test_info();
        std::string unique_name = std::string("ruleforge_config_") + test_info->name() + "_" +
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
        std::filesystem::create_directories(test_dir_);
    }

    void TearDown() override {
        std::error_code ec;
        std::filesystem::remove_all(test_dir_, ec);
    }

    void create_file(const std::filesystem::path& path) {
        std::filesystem::create_directories(path.parent_path());
        std::ofstream file(path);
        file << "example.com\n";
    }
};

TEST_F(GroupsFromPathsTest, OneGroupPerStem) {
    // Arrange
    create_file(test_dir_ / "netflix.list");
    create_file(test_dir_ / "emby.list");
    create_file(test_dir_ / "sub" / "emby.yaml");
    create_file(test_dir_ / "notes.md");

    // Act
    auto result = groups_from_paths({test_dir_});

    // Assert
    ASSERT_TRUE(result.ok) << result.error.format();
    ASSERT_EQ(result.groups.size(), 2u);
    EXPECT_EQ(result.groups[0].name, "emby");
    ASSERT_EQ(result.groups[0].sources.size(), 2u);
    EXPECT_EQ(result.groups[0].sources[0].dialect, Dialect::List);
    EXPECT_EQ(result.groups[0].sources[1].dialect, Dialect::Yaml);
    EXPECT_NE(result.groups[0].sources[0].id, result.groups[0].sources[1].id);
    EXPECT_EQ(result.groups[1].name, "netflix");
}

TEST_F(GroupsFromPathsTest, SourceIdIsNormalizedPath) {
    create_file(test_dir_ / "emby.list");

    auto result = groups_from_paths({test_dir_ / "." / "emby.list"});

    ASSERT_TRUE(result.ok);
    ASSERT_EQ(result.groups.size(), 1u);
    EXPECT_EQ(result.groups[0].sources[0].location, (test_dir_ / "emby.list").lexically_normal());
    EXPECT_EQ(result.groups[0].sources[0].id,
              (test_dir_ / "emby.list").lexically_normal().string());
}

TEST_F(GroupsFromPathsTest, EmptyDirectory_NoGroups) {
    auto result = groups_from_paths({test_dir_});

    ASSERT_TRUE(result.ok);
    EXPECT_TRUE(result.groups.empty());
}

TEST_F(GroupsFromPathsTest, MissingPath_ConfigError) {
    auto result = groups_from_paths({test_dir_ / "missing"});

    ASSERT_FALSE(result.ok);
    EXPECT_EQ(result.error.kind, ErrorKind::Config);
}

}  // namespace ruleforge::config::test
