//
// Created by aowei on 2025 10月 3.
//

#ifndef REFSM_STATE_HPP
#define REFSM_STATE_HPP

#include <cstddef>
#include <set>
#include <string>
#include <string_view>

// 全局常量部分
namespace refsm::automaton {
    // 状态 ID：状态在自动机状态池中的下标
    using StateId = std::size_t;
    // 无效状态 ID，仅用于非 STAR/PLUS 状态的 inner 字段
    constexpr StateId NO_STATE = static_cast<StateId>(-1);
}

// 状态种类定义
namespace refsm::automaton {
    enum class StateKind {
        START,       // 起始状态，不接受任何字符
        TERMINATION, // 终止状态，不接受任何字符，唯一的接受标记
        WILDCARD,    // . 任意字符
        LITERAL,     // 普通字符
        CHAR_CLASS,  // [a-z0-9] 字符类
        STAR,        // * 零次或多次
        PLUS,        // + 一次或多次
    };

    struct State {
        StateKind kind;
        char symbol;            // 仅 LITERAL 有效
        std::set<char> members; // 仅 CHAR_CLASS 有效：展开后的字符集合
        StateId inner;          // 仅 STAR/PLUS 有效：被重复的原子状态

        explicit State(const StateKind kind) : kind(kind), symbol('\0'), inner(NO_STATE) {}

        [[nodiscard]] bool is_quantifier() const;
        // 调试用：状态的简短描述，例如 LITERAL(a)、STAR(2)
        [[nodiscard]] std::string describe() const;
    };
}

// 状态构造函数
namespace refsm::automaton {
    State make_start();
    State make_termination();
    State make_wildcard();
    State make_literal(char symbol);
    // 字符类：展开 X-Y 区间与单个字符，definition 不含两侧的方括号
    State make_char_class(std::string_view definition);
    State make_star(StateId inner);
    State make_plus(StateId inner);

    // 解析字符类定义，X-Y 展开为 ord(X)..ord(Y) 的全部字符，X > Y 时区间为空
    std::set<char> parse_class_members(std::string_view definition);
    // StateKind 转字符串
    std::string state_kind_to_string(StateKind kind);
}

#endif //REFSM_STATE_HPP
