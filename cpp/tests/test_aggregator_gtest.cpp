// ==============================================================================
// test_aggregator_gtest.cpp - Тесты дедупликации и сортировки (GoogleTest)
// ==============================================================================

#include "ruleforge/aggregator.hpp"

#include <algorithm>
#include <gtest/gtest.h>
#include <string>
#include <vector>

namespace ruleforge::aggregate::test {

using rule::RuleEntry;
using rule::RuleKind;

TEST(AggregatorTest, Add_DuplicatesCounted) {
    // Arrange
    Aggregator agg;

    // Act
    bool first = agg.add({RuleKind::ExactDomain, "example.com"});
    bool again = agg.add({RuleKind::ExactDomain, "example.com"});
    bool other_kind = agg.add({RuleKind::DomainSuffix, "example.com"});

    // Assert: дубликат только при совпадении и типа, и значения
    EXPECT_TRUE(first);
    EXPECT_FALSE(again);
    EXPECT_TRUE(other_kind);
    EXPECT_EQ(agg.size(), 2u);
    EXPECT_EQ(agg.duplicates(), 1u);
}

TEST(AggregatorTest, Finish_CanonicalOrder) {
    Aggregator agg;
    agg.add({RuleKind::IPv6Cidr, "2001:db8::/32"});
    agg.add({RuleKind::IPv4Cidr, "10.0.0.0/8"});
    agg.add({RuleKind::Keyword, "emby"});
    agg.add({RuleKind::DomainSuffix, "b.org"});
    agg.add({RuleKind::DomainSuffix, "a.org"});
    agg.add({RuleKind::ExactDomain, "z.com"});

    rule::RuleGroup group = agg.finish("emby");

    EXPECT_EQ(group.name, "emby");
    std::vector<RuleEntry> expected = {
        {RuleKind::ExactDomain, "z.com"},      {RuleKind::DomainSuffix, "a.org"},
        {RuleKind::DomainSuffix, "b.org"},     {RuleKind::Keyword, "emby"},
        {RuleKind::IPv4Cidr, "10.0.0.0/8"},    {RuleKind::IPv6Cidr, "2001:db8::/32"},
    };
    EXPECT_EQ(group.entries, expected);
}

TEST(AggregatorTest, Finish_IndependentOfInsertionOrder) {
    std::vector<RuleEntry> entries = {
        {RuleKind::ExactDomain, "a.com"},   {RuleKind::IPv4Cidr, "1.1.1.1/32"},
        {RuleKind::ExactDomain, "c.com"},   {RuleKind::Keyword, "cdn"},
        {RuleKind::ExactDomain, "a.com"},   {RuleKind::DomainSuffix, "b.com"},
    };

    Aggregator forward;
    for (const auto& e : entries) {
        forward.add(e);
    }
    Aggregator backward;
    for (auto it = entries.rbegin(); it != entries.rend(); ++it) {
        backward.add(*it);
    }

    EXPECT_EQ(forward.finish("g").entries, backward.finish("g").entries);
}

TEST(AggregatorTest, Finish_ResetsState) {
    Aggregator agg;
    agg.add({RuleKind::ExactDomain, "a.com"});
    agg.add({RuleKind::ExactDomain, "a.com"});

    agg.finish("first");

    EXPECT_EQ(agg.size(), 0u);
    EXPECT_EQ(agg.duplicates(), 0u);
    EXPECT_TRUE(agg.finish("second").entries.empty());
}

TEST(AggregatorTest, Finish_Empty) {
    Aggregator agg;

    rule::RuleGroup group = agg.finish("empty");

    EXPECT_EQ(group.name, "empty");
    EXPECT_TRUE(group.entries.empty());
}

}  // namespace ruleforge::aggregate::test
