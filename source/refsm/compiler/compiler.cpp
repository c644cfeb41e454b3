//
// Created by aowei on 2025 10月 4.
//

#include <unordered_map>
#include <utility>
#include <refsm/compiler/compiler.hpp>

// 匿名数据
namespace refsm::compiler {
    namespace {
        // ErrorType 转字符串 map
        std::unordered_map<ErrorType, std::string> error_type_string_map{
            {ErrorType::DANGLING_QUANTIFIER, "DANGLING_QUANTIFIER"},
            {ErrorType::UNCLOSED_CLASS, "UNCLOSED_CLASS"},
            {ErrorType::UNMATCHED_BRACKET, "UNMATCHED_BRACKET"},
        };
    }
}

// CompileError
namespace refsm::compiler {
    CompileError::CompileError(const ErrorType type, const std::string &message, const std::size_t position)
        : std::invalid_argument(message + " (at position " + std::to_string(position) + ")"),
          error_type(type), error_position(position) {}

    std::string error_type_to_string(const ErrorType type) {
        const auto it = error_type_string_map.find(type);
        if (it != error_type_string_map.end()) {
            return it->second;
        }
        return "UNKNOWN";
    }
}

// 编译辅助函数
namespace refsm::compiler {
    namespace {
        using automaton::Automaton;
        using automaton::State;
        using automaton::StateId;

        // 读取到的一个原子：状态、转移标签、原子之后的下标
        struct Atom {
            State state;
            std::string label;
            std::size_t end;
        };

        bool is_quantifier(const char c) {
            return c == '*' || c == '+';
        }

        // 从 pos 处读取一个原子，非法字符直接抛出错误
        Atom read_atom(const std::string_view pattern, const std::size_t pos) {
            const char c = pattern[pos];
            switch (c) {
                case '*':
                case '+':
                    throw CompileError(ErrorType::DANGLING_QUANTIFIER,
                                       std::string("Quantifier '") + c + "' has no preceding atom", pos);
                case ']':
                    throw CompileError(ErrorType::UNMATCHED_BRACKET, "Mismatched bracket (missing '[')", pos);
                case '[': {
                    // 字符类：取到第一个 ] 为止
                    const std::size_t close = pattern.find(']', pos + 1);
                    if (close == std::string_view::npos) {
                        throw CompileError(ErrorType::UNCLOSED_CLASS, "Unclosed character class (missing ']')", pos);
                    }
                    const std::string_view definition = pattern.substr(pos + 1, close - pos - 1);
                    return {automaton::make_char_class(definition), std::string(definition), close + 1};
                }
                case '.':
                    return {automaton::make_wildcard(), automaton::WILDCARD_LABEL, pos + 1};
                default:
                    return {automaton::make_literal(c), std::string(1, c), pos + 1};
            }
        }

        // 量词的构建：base 已经通过普通转移接在 frontier 之后，返回新的 frontier
        StateId wrap_quantifier(Automaton &graph, const StateId frontier, const StateId base,
                                const char quantifier) {
            const StateId loop = graph.add_state(
                quantifier == '*' ? automaton::make_star(base) : automaton::make_plus(base));
            // 只有 * 允许跳过 base（零次）
            if (quantifier == '*') {
                graph.add_epsilon(frontier, loop);
            }
            graph.add_epsilon(base, loop);
            graph.add_epsilon(loop, base);
            return loop;
        }
    }
}

// 核心功能函数实现
namespace refsm::compiler {
    Automaton compile(const std::string_view pattern) {
        Automaton graph;
        if (pattern.empty()) {
            graph.add_epsilon(graph.start(), graph.termination());
            return graph;
        }
        StateId frontier = graph.start();
        std::size_t pos = 0;
        while (pos < pattern.size()) {
            auto [state, label, end] = read_atom(pattern, pos);
            const StateId base = graph.add_state(std::move(state));
            // 进入原子的转移，量词的入口边同样带原子自身的标签
            graph.add_transition(frontier, label, base);
            if (end < pattern.size() && is_quantifier(pattern[end])) {
                frontier = wrap_quantifier(graph, frontier, base, pattern[end]);
                ++end;
            } else {
                frontier = base;
            }
            pos = end;
        }
        graph.add_epsilon(frontier, graph.termination());
        return graph;
    }
}
