//
// Created by aowei on 2025 10月 5.
//

#ifndef REFSM_CLOSURE_HPP
#define REFSM_CLOSURE_HPP

#include <set>
#include <refsm/automaton/automaton.hpp>

namespace refsm::matcher {
    // 一组同时活跃的状态
    using StateSet = std::set<automaton::StateId>;

    // 计算 ε 闭包：states 经过零条或多条 ε 转移可以到达的全部状态
    StateSet epsilon_closure(const automaton::Automaton &automaton, const StateSet &states);
}

#endif //REFSM_CLOSURE_HPP
