#include "group_evaluator.hpp"
#include "condition_evaluator.hpp"
#include "logging.hpp"

namespace strategy_engine {

    ConditionGroupEvaluator::ConditionGroupEvaluator(const ConditionTree& tree) : tree_(tree) {}

    bool ConditionGroupEvaluator::evaluate(EvaluationContext& context) const {
        const auto root = tree_.root();
        if (!root) {
            return false;
        }
        return evaluate(*root, context);
    }

    bool ConditionGroupEvaluator::evaluate(NodeId id, EvaluationContext& context) const {
        const ConditionNode& node = tree_.node(id);
        if (const auto* leaf = std::get_if<IndicatorCondition>(&node)) {
            return evaluateCondition(*leaf, context);
        }
        return evaluateGroup(id, std::get<ConditionGroup>(node), context);
    }

    bool ConditionGroupEvaluator::evaluateGroup(NodeId id, const ConditionGroup& group, EvaluationContext& context) const {
        switch (group.op) {
            case LogicalOp::And: {
                bool all_true = true;
                for (NodeId child : group.children) {
                    // No short-circuit: every child must see this bar
                    all_true = evaluate(child, context) && all_true;
                }
                return all_true;
            }
            case LogicalOp::Or: {
                bool any_true = false;
                for (NodeId child : group.children) {
                    any_true = evaluate(child, context) || any_true;
                }
                return any_true;
            }
            case LogicalOp::Not:
                return !evaluate(group.children.front(), context);
            case LogicalOp::IfThen:
                return evaluateIfThen(id, group, context);
            case LogicalOp::Sequence:
                return evaluateSequence(id, group, context);
        }
        return false;
    }

    bool ConditionGroupEvaluator::evaluateIfThen(NodeId id, const ConditionGroup& group, EvaluationContext& context) const {
        if (!group.trigger || !group.confirm) {
            return false;
        }

        auto logger = core::logging::getLogger();
        IfThenState& state = context.state.ifThen(id);
        const std::size_t i = context.current_index;

        // The trigger is evaluated every bar; a repeat while armed keeps the first trigger bar
        const bool triggered = evaluate(*group.trigger, context);
        if (!state.armed) {
            if (!triggered) {
                return false;
            }
            state.armed = true;
            state.triggered_at = i;
            logger->debug("IF_THEN node {} armed at bar {}", id, i);
        }

        if (i - state.triggered_at > static_cast<std::size_t>(group.max_bars_to_wait)) {
            state.armed = false;
            logger->debug("IF_THEN node {} timed out at bar {} (armed at {}, max wait {})",
                          id, i, state.triggered_at, group.max_bars_to_wait);
            return false;
        }

        if (evaluate(*group.confirm, context)) {
            logger->debug("IF_THEN node {} fired at bar {} (armed at {})", id, i, state.triggered_at);
            state.armed = false;
            return true;
        }
        return false;
    }

    bool ConditionGroupEvaluator::evaluateSequence(NodeId id, const ConditionGroup& group, EvaluationContext& context) const {
        auto logger = core::logging::getLogger();
        SequenceState& state = context.state.sequence(id);
        const std::size_t i = context.current_index;

        if (state.last_completed_at &&
            i - *state.last_completed_at > static_cast<std::size_t>(group.max_bars_between_steps)) {
            logger->debug("SEQUENCE node {} reset at bar {}: gap since step completion at bar {} exceeds {}",
                          id, i, *state.last_completed_at, group.max_bars_between_steps);
            state = SequenceState{};
        }

        if (state.next_step >= group.steps.size()) {
            return false;
        }

        if (!evaluate(group.steps[state.next_step], context)) {
            return false;
        }

        ++state.next_step;
        state.last_completed_at = i;
        logger->debug("SEQUENCE node {} completed step {}/{} at bar {}", id, state.next_step, group.steps.size(), i);

        if (state.next_step == group.steps.size()) {
            // A new cycle starts clean: its first step is not gap-checked against this one
            state = SequenceState{};
            logger->debug("SEQUENCE node {} fired at bar {}", id, i);
            return true;
        }
        return false;
    }

} // namespace strategy_engine
