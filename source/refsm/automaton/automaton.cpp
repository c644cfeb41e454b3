//
// Created by aowei on 2025 10月 3.
//

#include <iostream>
#include <stdexcept>
#include <refsm/automaton/automaton.hpp>

namespace refsm::automaton {
    Automaton::Automaton() : start_id(0), termination_id(1) {
        this->nodes.emplace_back(make_start());
        this->nodes.emplace_back(make_termination());
    }

    StateId Automaton::add_state(State state) {
        if (state.kind == StateKind::START || state.kind == StateKind::TERMINATION) {
            throw std::invalid_argument("Automaton already owns its " + state_kind_to_string(state.kind) + " state");
        }
        // 量词状态必须引用已经存在的原子状态
        if (state.is_quantifier() && state.inner >= this->nodes.size()) {
            throw std::out_of_range("Quantifier state refers to unknown state " + std::to_string(state.inner));
        }
        this->nodes.emplace_back(std::move(state));
        return this->nodes.size() - 1;
    }

    void Automaton::add_transition(const StateId from, const std::string &label, const StateId to) {
        if (to >= this->nodes.size()) {
            throw std::out_of_range("Transition target " + std::to_string(to) + " is not a state");
        }
        this->nodes.at(from).transitions[label].insert(to);
    }

    void Automaton::add_epsilon(const StateId from, const StateId to) {
        if (to >= this->nodes.size()) {
            throw std::out_of_range("Epsilon target " + std::to_string(to) + " is not a state");
        }
        this->nodes.at(from).eps_transitions.insert(to);
    }

    const Node &Automaton::node(const StateId id) const {
        return this->nodes.at(id);
    }

    bool Automaton::accepts(const StateId id, const char c) const {
        const State &state = this->node(id).state;
        switch (state.kind) {
            case StateKind::START:
            case StateKind::TERMINATION:
                return false;
            case StateKind::WILDCARD:
                return true;
            case StateKind::LITERAL:
                return state.symbol == c;
            case StateKind::CHAR_CLASS:
                return state.members.count(c) > 0;
            // 量词状态接受的字符与被重复的原子一致
            case StateKind::STAR:
            case StateKind::PLUS:
                return this->accepts(state.inner, c);
        }
        return false;
    }

    std::set<StateId> Automaton::successors(const StateId id) const {
        const Node &current = this->node(id);
        std::set<StateId> result = current.eps_transitions;
        for (const auto &[_, targets]: current.transitions) {
            result.insert(targets.begin(), targets.end());
        }
        return result;
    }

    void Automaton::print(const std::string &name) const {
        std::cout << "=== " << name << " Structure ===" << std::endl;
        std::cout << "Start State: " << this->start_id << std::endl;
        std::cout << "Accept States: " << this->termination_id << std::endl;
        std::cout << "States:\n";
        for (StateId id = 0; id < this->nodes.size(); ++id) {
            std::cout << "  State " << id << ": " << this->nodes[id].state.describe() << std::endl;
        }
        std::cout << "Transitions:\n";
        for (StateId id = 0; id < this->nodes.size(); ++id) {
            for (const auto &[label, targets]: this->nodes[id].transitions) {
                for (const StateId t: targets) {
                    std::cout << "  State " << id << " --" << label << "--> State " << t << std::endl;
                }
            }
            for (const StateId t: this->nodes[id].eps_transitions) {
                std::cout << "  State " << id << " --" << EPSILON_LABEL << "--> State " << t << std::endl;
            }
        }
        std::cout << "===========================\n" << std::endl;
    }
}
