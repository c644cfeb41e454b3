//
// Created by aowei on 2025 10月 7.
//

#include <gtest/gtest.h>
#include <set>
#include <refsm/automaton/state.hpp>

using namespace refsm::automaton;

// 测试区间与单个字符混合的字符类
TEST(StateTest, ParseRangesAndSingletons) {
    const std::set<char> expected{'a', 'b', 'c', '1', '2', '3', '_'};
    EXPECT_EQ(parse_class_members("a-c1-3_"), expected);
}

// 反向区间不包含任何字符
TEST(StateTest, ReversedRangeIsEmpty) {
    EXPECT_TRUE(parse_class_members("z-a").empty());
}

// 末尾的 - 作为普通字符
TEST(StateTest, TrailingDashIsSingleton) {
    const std::set<char> expected{'a', '-'};
    EXPECT_EQ(parse_class_members("a-"), expected);
}

TEST(StateTest, LeadingDashIsSingleton) {
    const std::set<char> expected{'-', 'x'};
    EXPECT_EQ(parse_class_members("-x"), expected);
}

TEST(StateTest, EmptyDefinition) {
    EXPECT_TRUE(parse_class_members("").empty());
    EXPECT_TRUE(make_char_class("").members.empty());
}

TEST(StateTest, FactoriesSetKindAndPayload) {
    const State literal = make_literal('q');
    EXPECT_EQ(literal.kind, StateKind::LITERAL);
    EXPECT_EQ(literal.symbol, 'q');
    EXPECT_EQ(literal.inner, NO_STATE);

    const State star = make_star(4);
    EXPECT_EQ(star.kind, StateKind::STAR);
    EXPECT_EQ(star.inner, 4u);
    EXPECT_TRUE(star.is_quantifier());

    EXPECT_TRUE(make_plus(2).is_quantifier());
    EXPECT_FALSE(make_wildcard().is_quantifier());
    EXPECT_FALSE(make_start().is_quantifier());
}

TEST(StateTest, Describe) {
    EXPECT_EQ(make_start().describe(), "START");
    EXPECT_EQ(make_termination().describe(), "TERMINATION");
    EXPECT_EQ(make_wildcard().describe(), "WILDCARD");
    EXPECT_EQ(make_literal('a').describe(), "LITERAL(a)");
    EXPECT_EQ(make_char_class("a-c").describe(), "CLASS[abc]");
    EXPECT_EQ(make_star(2).describe(), "STAR(2)");
    EXPECT_EQ(make_plus(7).describe(), "PLUS(7)");
}

int main(int argc, char **argv) {
    testing::InitGoogleTest(&argc, argv);
    return RUN_ALL_TESTS();
}
