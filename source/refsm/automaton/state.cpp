//
// Created by aowei on 2025 10月 3.
//

#include <unordered_map>
#include <refsm/automaton/state.hpp>

// 匿名数据
namespace refsm::automaton {
    namespace {
        // StateKind 转字符串 map
        std::unordered_map<StateKind, std::string> state_kind_string_map{
            {StateKind::START, "START"},
            {StateKind::TERMINATION, "TERMINATION"},
            {StateKind::WILDCARD, "WILDCARD"},
            {StateKind::LITERAL, "LITERAL"},
            {StateKind::CHAR_CLASS, "CLASS"},
            {StateKind::STAR, "STAR"},
            {StateKind::PLUS, "PLUS"},
        };
    }
}

// State 成员函数
namespace refsm::automaton {
    bool State::is_quantifier() const {
        return this->kind == StateKind::STAR || this->kind == StateKind::PLUS;
    }

    std::string State::describe() const {
        std::string text = state_kind_to_string(this->kind);
        switch (this->kind) {
            case StateKind::LITERAL:
                text += "(" + std::string(1, this->symbol) + ")";
                break;
            case StateKind::CHAR_CLASS: {
                text += "[";
                for (const char c: this->members) text += c;
                text += "]";
                break;
            }
            case StateKind::STAR:
            case StateKind::PLUS:
                text += "(" + std::to_string(this->inner) + ")";
                break;
            default:
                break;
        }
        return text;
    }
}

// 状态构造函数
namespace refsm::automaton {
    State make_start() { return State(StateKind::START); }

    State make_termination() { return State(StateKind::TERMINATION); }

    State make_wildcard() { return State(StateKind::WILDCARD); }

    State make_literal(const char symbol) {
        State state(StateKind::LITERAL);
        state.symbol = symbol;
        return state;
    }

    State make_char_class(const std::string_view definition) {
        State state(StateKind::CHAR_CLASS);
        state.members = parse_class_members(definition);
        return state;
    }

    State make_star(const StateId inner) {
        State state(StateKind::STAR);
        state.inner = inner;
        return state;
    }

    State make_plus(const StateId inner) {
        State state(StateKind::PLUS);
        state.inner = inner;
        return state;
    }

    std::set<char> parse_class_members(const std::string_view definition) {
        std::set<char> members;
        std::size_t i = 0;
        while (i < definition.size()) {
            // X-Y 区间：按照无符号字节值展开
            if (i + 2 < definition.size() && definition[i + 1] == '-') {
                const int first = static_cast<unsigned char>(definition[i]);
                const int last = static_cast<unsigned char>(definition[i + 2]);
                for (int code = first; code <= last; ++code) {
                    members.insert(static_cast<char>(code));
                }
                i += 3;
            } else {
                members.insert(definition[i]);
                i += 1;
            }
        }
        return members;
    }

    std::string state_kind_to_string(const StateKind kind) {
        const auto it = state_kind_string_map.find(kind);
        if (it != state_kind_string_map.end()) {
            return it->second;
        }
        return "UNKNOWN";
    }
}
