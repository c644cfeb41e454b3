//
// Created by aowei on 2025 10月 6.
//

#ifndef REFSM_REGEX_FSM_HPP
#define REFSM_REGEX_FSM_HPP

#include <string>
#include <string_view>
#include <refsm/automaton/automaton.hpp>

namespace refsm {
    // 编译后的模式：构造时编译，非法模式抛出 compiler::CompileError
    class RegexFSM {
    public:
        explicit RegexFSM(std::string_view pattern);

        // 整个 text 是否匹配模式（两端锚定）
        [[nodiscard]] bool is_full_match(std::string_view text) const;
        // text 中是否存在匹配模式的子串
        [[nodiscard]] bool check_string(std::string_view text) const;

        [[nodiscard]] const std::string &pattern() const { return this->source; }
        // 调试用：打印编译得到的自动机
        void print() const;

    private:
        std::string source;
        automaton::Automaton graph;
    };
}

#endif //REFSM_REGEX_FSM_HPP
