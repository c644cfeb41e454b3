//
// Created by aowei on 2025 10月 3.
//

#ifndef REFSM_AUTOMATON_HPP
#define REFSM_AUTOMATON_HPP

#include <map>
#include <set>
#include <string>
#include <utility>
#include <vector>
#include <refsm/automaton/state.hpp>

// 全局常量部分
namespace refsm::automaton {
    // 通配符转移的标签
    constexpr const char *WILDCARD_LABEL = ".";
    // 调试输出中 ε 转移的标签
    constexpr const char *EPSILON_LABEL = "ε";
}

// 自动机定义
namespace refsm::automaton {
    struct Node {
        State state;
        std::map<std::string, std::set<StateId> > transitions; // 普通转移：标签 --> 目标状态集合
        std::set<StateId> eps_transitions;                     // ε 转移：不消耗字符 --> 目标状态集合

        explicit Node(State state) : state(std::move(state)) {}
    };

    // 状态池 + 下标表示的边，编译完成之后只读
    class Automaton {
    public:
        // 创建起始状态（ID 0）与终止状态（ID 1）
        Automaton();

        // 添加状态并返回其 ID；START/TERMINATION 每个自动机只能有一个
        StateId add_state(State state);
        // 添加普通转移，重复的边会被合并
        void add_transition(StateId from, const std::string &label, StateId to);
        // 添加 ε 转移
        void add_epsilon(StateId from, StateId to);

        // 状态 id 能否消耗字符 c，所有匹配逻辑共用这一个判定
        [[nodiscard]] bool accepts(StateId id, char c) const;
        // 所有后继状态（普通转移与 ε 转移的并集）
        [[nodiscard]] std::set<StateId> successors(StateId id) const;

        [[nodiscard]] const Node &node(StateId id) const;
        [[nodiscard]] StateId start() const { return this->start_id; }
        [[nodiscard]] StateId termination() const { return this->termination_id; }
        [[nodiscard]] std::size_t size() const { return this->nodes.size(); }

        // 调试用：打印自动机结构
        void print(const std::string &name = "Automaton") const;

    private:
        std::vector<Node> nodes;
        StateId start_id;
        StateId termination_id;
    };
}

#endif //REFSM_AUTOMATON_HPP
