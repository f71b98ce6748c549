/**
 * @file test_result_mapping.cpp
 * @brief Unit tests for key representations and the entity → key mapping
 */

#include <gtest/gtest.h>
#include <schema/key_declaration.hpp>
#include <string>
#include <vector>

using namespace YangKeys;

using Fields = std::vector<std::string>;

TEST(KeyRepresentationTest, OneFieldIsScalar) {
    auto key = make_key_representation({"name"});
    ASSERT_TRUE(std::holds_alternative<std::string>(key));
    EXPECT_EQ(std::get<std::string>(key), "name");
    EXPECT_EQ(key_fields(key), Fields({"name"}));
    EXPECT_EQ(describe(key), "name");
}

TEST(KeyRepresentationTest, SeveralFieldsAreASequence) {
    auto key = make_key_representation({"vrf", "prefix", "next-hop"});
    ASSERT_TRUE(std::holds_alternative<Fields>(key));
    EXPECT_EQ(std::get<Fields>(key), Fields({"vrf", "prefix", "next-hop"}));
    EXPECT_EQ(key_fields(key), Fields({"vrf", "prefix", "next-hop"}));
    EXPECT_EQ(describe(key), "[vrf, prefix, next-hop]");
}

TEST(KeyRepresentationTest, ScalarDiffersFromOneElementSequence) {
    KeyRepresentation scalar(std::in_place_index<0>, "a");
    KeyRepresentation sequence(std::in_place_index<1>, Fields{"a"});
    EXPECT_NE(scalar, sequence);
}

// ============================================================================
// ResultMapping
// ============================================================================

TEST(ResultMappingTest, AssignReturnsPrevious) {
    ResultMapping m;
    EXPECT_FALSE(m.assign("Foo", make_key_representation({"a"})).has_value());

    auto previous = m.assign("Foo", make_key_representation({"b", "c"}));
    ASSERT_TRUE(previous.has_value());
    EXPECT_EQ(*previous, make_key_representation({"a"}));
    EXPECT_EQ(*m.find("Foo"), make_key_representation({"b", "c"}));
    EXPECT_EQ(m.size(), 1u);
}

TEST(ResultMappingTest, OverwriteKeepsFirstPosition) {
    ResultMapping m;
    m.assign("A", make_key_representation({"1"}));
    m.assign("B", make_key_representation({"2"}));
    m.assign("A", make_key_representation({"3"}));

    ASSERT_EQ(m.entries().size(), 2u);
    EXPECT_EQ(m.entries()[0].first, "A");
    EXPECT_EQ(m.entries()[1].first, "B");
    EXPECT_EQ(*m.find("A"), make_key_representation({"3"}));
}

TEST(ResultMappingTest, FindAndContains) {
    ResultMapping m;
    m.assign("A", make_key_representation({"1"}));
    EXPECT_TRUE(m.contains("A"));
    EXPECT_FALSE(m.contains("a"));
    EXPECT_EQ(m.find("missing"), nullptr);
    EXPECT_FALSE(m.empty());
    EXPECT_TRUE(ResultMapping().empty());
}

TEST(ResultMappingTest, MergeIsLastWriteWins) {
    ResultMapping first;
    first.assign("Foo", make_key_representation({"x"}));
    first.assign("Shared", make_key_representation({"same"}));

    ResultMapping second;
    second.assign("Foo", make_key_representation({"y"}));
    second.assign("Shared", make_key_representation({"same"}));
    second.assign("Bar", make_key_representation({"b1", "b2"}));

    std::vector<std::string> overwritten;
    first.merge(second, [&](const std::string& entity, const KeyRepresentation& previous,
                            const KeyRepresentation& replacement) {
        overwritten.push_back(entity + ":" + describe(previous) + "->" + describe(replacement));
    });

    EXPECT_EQ(*first.find("Foo"), make_key_representation({"y"}));
    EXPECT_EQ(*first.find("Bar"), make_key_representation({"b1", "b2"}));
    EXPECT_EQ(first.size(), 3u);
    // Re-declaring an identical key is not reported
    EXPECT_EQ(overwritten, std::vector<std::string>({"Foo:x->y"}));
}

TEST(ResultMappingTest, MergeOrderDecidesCollisions) {
    ResultMapping a, b;
    a.assign("Foo", make_key_representation({"from-a"}));
    b.assign("Foo", make_key_representation({"from-b"}));

    ResultMapping ab, ba;
    ab.merge(a);
    ab.merge(b);
    ba.merge(b);
    ba.merge(a);

    EXPECT_EQ(*ab.find("Foo"), make_key_representation({"from-b"}));
    EXPECT_EQ(*ba.find("Foo"), make_key_representation({"from-a"}));
}

TEST(ResultMappingTest, EqualityIgnoresOrder) {
    ResultMapping a, b;
    a.assign("A", make_key_representation({"1"}));
    a.assign("B", make_key_representation({"2", "3"}));
    b.assign("B", make_key_representation({"2", "3"}));
    b.assign("A", make_key_representation({"1"}));
    EXPECT_EQ(a, b);

    b.assign("A", make_key_representation({"other"}));
    EXPECT_NE(a, b);

    ResultMapping c = a;
    c.assign("C", make_key_representation({"4"}));
    EXPECT_NE(a, c);
}
