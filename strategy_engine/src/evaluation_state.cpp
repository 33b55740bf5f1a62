#include "evaluation_state.hpp"
#include <stdexcept>
#include <spdlog/fmt/fmt.h>

namespace strategy_engine {

    EvaluationState::EvaluationState(const ConditionTree& tree) {
        states_.reserve(tree.size());
        for (NodeId id = 0; id < tree.size(); ++id) {
            const auto* group = std::get_if<ConditionGroup>(&tree.node(id));
            if (group && group->op == LogicalOp::IfThen) {
                states_.emplace_back(IfThenState{});
            } else if (group && group->op == LogicalOp::Sequence) {
                states_.emplace_back(SequenceState{});
            } else {
                states_.emplace_back(std::monostate{});
            }
        }
    }

    void EvaluationState::reset() {
        for (auto& state : states_) {
            if (std::holds_alternative<IfThenState>(state)) {
                state = IfThenState{};
            } else if (std::holds_alternative<SequenceState>(state)) {
                state = SequenceState{};
            }
        }
    }

    IfThenState& EvaluationState::ifThen(NodeId id) {
        if (id >= states_.size() || !std::holds_alternative<IfThenState>(states_[id])) {
            throw std::logic_error(fmt::format("Node {} has no IF_THEN state in this evaluation run.", id));
        }
        return std::get<IfThenState>(states_[id]);
    }

    SequenceState& EvaluationState::sequence(NodeId id) {
        if (id >= states_.size() || !std::holds_alternative<SequenceState>(states_[id])) {
            throw std::logic_error(fmt::format("Node {} has no SEQUENCE state in this evaluation run.", id));
        }
        return std::get<SequenceState>(states_[id]);
    }

} // namespace strategy_engine
