#pragma once

#include "condition_tree.hpp"
#include "evaluation_state.hpp"

namespace strategy_engine {

    // Recursive evaluator over a ConditionTree.
    // All children of AND/OR are evaluated every bar so stateful descendants keep advancing.
    class ConditionGroupEvaluator {
    public:
        explicit ConditionGroupEvaluator(const ConditionTree& tree);

        // Evaluate the root at context.current_index. A tree without a root never matches.
        bool evaluate(EvaluationContext& context) const;

        bool evaluate(NodeId id, EvaluationContext& context) const;

    private:
        bool evaluateGroup(NodeId id, const ConditionGroup& group, EvaluationContext& context) const;
        bool evaluateIfThen(NodeId id, const ConditionGroup& group, EvaluationContext& context) const;
        bool evaluateSequence(NodeId id, const ConditionGroup& group, EvaluationContext& context) const;

        const ConditionTree& tree_;
    };

} // namespace strategy_engine
