//
// Created by aowei on 2025 10月 4.
//

#ifndef REFSM_COMPILER_HPP
#define REFSM_COMPILER_HPP

#include <cstddef>
#include <stdexcept>
#include <string>
#include <string_view>
#include <refsm/automaton/automaton.hpp>

// 编译错误定义
namespace refsm::compiler {
    // 模式串错误类型枚举
    enum class ErrorType {
        DANGLING_QUANTIFIER, // * 或 + 前面没有原子，例如 "*a"、"a**"
        UNCLOSED_CLASS,      // [ 没有对应的 ]
        UNMATCHED_BRACKET,   // ] 没有对应的 [
    };

    class CompileError : public std::invalid_argument {
    public:
        explicit CompileError(ErrorType type, const std::string &message, std::size_t position);

        [[nodiscard]] ErrorType type() const noexcept { return this->error_type; }
        // 出错字符在模式串中的下标
        [[nodiscard]] std::size_t position() const noexcept { return this->error_position; }

    private:
        ErrorType error_type;
        std::size_t error_position;
    };

    // ErrorType 转字符串
    std::string error_type_to_string(ErrorType type);
}

// 核心功能函数的声明
namespace refsm::compiler {
    // 模式串 -> 自动机，从左到右逐个原子（及其量词）构建
    automaton::Automaton compile(std::string_view pattern);
}

#endif //REFSM_COMPILER_HPP
