//
// Created by aowei on 2025 10月 8.
//

#include <gtest/gtest.h>
#include <refsm/compiler/compiler.hpp>
#include <refsm/matcher/closure.hpp>

using namespace refsm::automaton;
using namespace refsm::matcher;

TEST(ClosureTest, EmptyInputGivesEmptyClosure) {
    const Automaton automaton = refsm::compiler::compile("a*");
    EXPECT_TRUE(epsilon_closure(automaton, {}).empty());
}

// 普通转移不参与闭包
TEST(ClosureTest, LabeledEdgesAreNotFollowed) {
    const Automaton automaton = refsm::compiler::compile("ab");
    EXPECT_EQ(epsilon_closure(automaton, {automaton.start()}), StateSet{automaton.start()});
}

// a*b：起始状态 -ε-> STAR(3) -ε-> a(2)
TEST(ClosureTest, FollowsStarBypass) {
    const Automaton automaton = refsm::compiler::compile("a*b");
    const StateSet expected{automaton.start(), 2, 3};
    EXPECT_EQ(epsilon_closure(automaton, {automaton.start()}), expected);
}

TEST(ClosureTest, EmptyPatternReachesTermination) {
    const Automaton automaton = refsm::compiler::compile("");
    const StateSet expected{automaton.start(), automaton.termination()};
    EXPECT_EQ(epsilon_closure(automaton, {automaton.start()}), expected);
}

// ε 环不会导致死循环，输入状态始终保留在结果中
TEST(ClosureTest, CyclesTerminate) {
    Automaton automaton;
    const StateId a = automaton.add_state(make_literal('a'));
    const StateId b = automaton.add_state(make_literal('b'));
    automaton.add_epsilon(a, b);
    automaton.add_epsilon(b, a);
    automaton.add_epsilon(b, automaton.termination());

    const StateSet expected{a, b, automaton.termination()};
    EXPECT_EQ(epsilon_closure(automaton, {a}), expected);
    EXPECT_EQ(epsilon_closure(automaton, {b}), expected);
}

// a+b*：a(2) -ε-> PLUS(3) -ε-> STAR(5) -ε-> b(4)，STAR(5) -ε-> 终止状态
TEST(ClosureTest, ChainsThroughQuantifiers) {
    const Automaton automaton = refsm::compiler::compile("a+b*");
    const StateSet expected{automaton.termination(), 2, 3, 4, 5};
    EXPECT_EQ(epsilon_closure(automaton, {2}), expected);
}

int main(int argc, char **argv) {
    testing::InitGoogleTest(&argc, argv);
    return RUN_ALL_TESTS();
}
