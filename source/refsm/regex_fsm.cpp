//
// Created by aowei on 2025 10月 6.
//

#include <cstddef>
#include <refsm/regex_fsm.hpp>
#include <refsm/compiler/compiler.hpp>
#include <refsm/matcher/simulator.hpp>

namespace refsm {
    RegexFSM::RegexFSM(const std::string_view pattern)
        : source(pattern), graph(compiler::compile(pattern)) {}

    bool RegexFSM::is_full_match(const std::string_view text) const {
        return matcher::run(this->graph, text, 0, matcher::MatchMode::ANCHORED);
    }

    bool RegexFSM::check_string(const std::string_view text) const {
        if (this->is_full_match(text)) {
            return true;
        }
        // 逐个起点重新开始模拟，每个起点都是一次全新的尝试
        for (std::size_t offset = 0; offset <= text.size(); ++offset) {
            if (matcher::run(this->graph, text, offset, matcher::MatchMode::SEARCH)) {
                return true;
            }
        }
        return false;
    }

    void RegexFSM::print() const {
        this->graph.print("RegexFSM(" + this->source + ")");
    }
}
