//
// Created by aowei on 2025 10月 5.
//

#ifndef REFSM_SIMULATOR_HPP
#define REFSM_SIMULATOR_HPP

#include <cstddef>
#include <string_view>
#include <refsm/automaton/automaton.hpp>
#include <refsm/matcher/closure.hpp>

namespace refsm::matcher {
    enum class MatchMode {
        ANCHORED, // 只在输入结束时判断是否到达终止状态
        SEARCH,   // 任意时刻到达终止状态即成功
    };

    // 单次匹配尝试：活跃状态集合以及已经触发过至少一次的 + 循环。
    // 所有匹配进度都保存在这里，自动机本身不会被修改。
    class MatchAttempt {
    public:
        // 初始活跃集合为 closure({Start})
        explicit MatchAttempt(const automaton::Automaton &automaton);

        // 消耗一个字符：step + ε 闭包
        void advance(char c);

        [[nodiscard]] const StateSet &active() const { return this->active_states; }
        [[nodiscard]] const StateSet &fired_loops() const { return this->fired; }
        [[nodiscard]] bool has_fired(automaton::StateId loop) const { return this->fired.count(loop) > 0; }
        [[nodiscard]] bool accepted() const;
        [[nodiscard]] bool exhausted() const { return this->active_states.empty(); }

    private:
        const automaton::Automaton &graph;
        StateSet active_states;
        StateSet fired;
    };

    // 单步转移：从 active 出发消耗字符 c 能到达的状态（未做 ε 闭包）
    StateSet step(const automaton::Automaton &automaton, const StateSet &active, char c);

    // 从 text[offset] 开始模拟一次匹配尝试
    bool run(const automaton::Automaton &automaton, std::string_view text, std::size_t offset, MatchMode mode);
}

#endif //REFSM_SIMULATOR_HPP
