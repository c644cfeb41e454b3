//
// Created by aowei on 2025 10月 5.
//

#include <queue>
#include <refsm/matcher/closure.hpp>

namespace refsm::matcher {
    StateSet epsilon_closure(const automaton::Automaton &graph, const StateSet &states) {
        StateSet closure = states;
        std::queue<automaton::StateId> q;
        for (const auto s: states) q.push(s);
        while (!q.empty()) {
            const auto current = q.front();
            q.pop();
            // 只遍历 ε 转移
            for (const auto next: graph.node(current).eps_transitions) {
                if (!closure.count(next)) {
                    closure.insert(next);
                    q.push(next);
                }
            }
        }
        return closure;
    }
}
