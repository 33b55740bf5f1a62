#pragma once

#include "condition_tree.hpp"
#include "evaluation_state.hpp"

namespace strategy_engine {

    // Apply a non-crossing comparison. EQ uses kEqualityTolerance.
    // Crossing operators need two bars and always yield false here.
    bool compareValues(double left, ComparisonOp op, double right);

    // Evaluate one leaf at context.current_index.
    // An unavailable operand (warm-up, unknown indicator, missing prior bar for a cross) is a non-match.
    bool evaluateCondition(const IndicatorCondition& condition, EvaluationContext& context);

} // namespace strategy_engine
