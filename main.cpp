//
// Created by aowei on 2025/10/6.
//

#include <iostream>
#include <string>
#include <utility>
#include <vector>
#include <refsm/regex_fsm.hpp>
#include <refsm/compiler/compiler.hpp>

int main() {
    // 每个模式及其待检查的文本
    const std::vector<std::pair<std::string, std::vector<std::string> > > samples = {
        {"a*4.+hi", {"aaaaaa4uhi", "4uhi", "meow"}},
        {"[0-9]+", {"123", "abc", "a12b"}},
        {"[a-z0-9]+", {"hello123", "HELLO", "hello_world"}},
    };
    try {
        for (const auto &[pattern, texts]: samples) {
            const refsm::RegexFSM fsm(pattern);
            std::cout << "pattern: " << pattern << std::endl;
            for (const auto &text: texts) {
                std::cout << "  " << text << " -> " << std::boolalpha << fsm.check_string(text) << std::endl;
            }
        }
    } catch (const refsm::compiler::CompileError &e) {
        std::cerr << refsm::compiler::error_type_to_string(e.type()) << ": " << e.what() << std::endl;
        return 1;
    }
    return 0;
}
