//
// Created by aowei on 2025 10月 5.
//

#include <refsm/matcher/simulator.hpp>

// MatchAttempt 的实现
namespace refsm::matcher {
    MatchAttempt::MatchAttempt(const automaton::Automaton &automaton)
        : graph(automaton), active_states(epsilon_closure(automaton, {automaton.start()})) {}

    void MatchAttempt::advance(const char c) {
        const StateSet moved = step(this->graph, this->active_states, c);
        this->active_states = epsilon_closure(this->graph, moved);
        // 本步进入了 + 的循环体（或 + 状态本身）即视为该循环已经触发
        for (const auto s: this->active_states) {
            const automaton::State &state = this->graph.node(s).state;
            if (state.kind == automaton::StateKind::PLUS && (moved.count(s) || moved.count(state.inner))) {
                this->fired.insert(s);
            }
        }
    }

    bool MatchAttempt::accepted() const {
        return this->active_states.count(this->graph.termination()) > 0;
    }
}

// 核心功能函数实现
namespace refsm::matcher {
    StateSet step(const automaton::Automaton &automaton, const StateSet &active, const char c) {
        StateSet result;
        for (const auto s: active) {
            // 目标状态自身的判定决定这条边能否消耗 c
            for (const auto t: automaton.successors(s)) {
                if (automaton.accepts(t, c)) {
                    result.insert(t);
                }
            }
        }
        return result;
    }

    bool run(const automaton::Automaton &automaton, const std::string_view text, const std::size_t offset,
             const MatchMode mode) {
        MatchAttempt attempt(automaton);
        if (mode == MatchMode::SEARCH && attempt.accepted()) {
            return true;
        }
        for (std::size_t pos = offset; pos < text.size(); ++pos) {
            attempt.advance(text[pos]);
            // 活跃集合为空：本次尝试无路可走
            if (attempt.exhausted()) {
                return false;
            }
            if (mode == MatchMode::SEARCH && attempt.accepted()) {
                return true;
            }
        }
        return attempt.accepted();
    }
}
