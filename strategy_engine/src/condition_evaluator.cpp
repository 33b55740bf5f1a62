#include "condition_evaluator.hpp"
#include "indicator_cache.hpp"
#include "logging.hpp"
#include <cmath>

namespace strategy_engine {

    namespace {

        double resolveTarget(const CompareTarget& target, EvaluationContext& context, std::size_t index) {
            if (const auto* value = std::get_if<double>(&target)) {
                return *value;
            }
            if (const auto* ref = std::get_if<IndicatorRef>(&target)) {
                return context.cache.valueAt(ref->key, index);
            }
            return priceOf(context.bars[index], std::get<PriceField>(target));
        }

    } // end anonymous namespace

    bool compareValues(double left, ComparisonOp op, double right) {
        switch (op) {
            case ComparisonOp::LT:  return left < right;
            case ComparisonOp::LTE: return left <= right;
            case ComparisonOp::EQ:  return std::fabs(left - right) <= kEqualityTolerance;
            case ComparisonOp::GTE: return left >= right;
            case ComparisonOp::GT:  return left > right;
            case ComparisonOp::CrossAbove:
            case ComparisonOp::CrossBelow:
                return false;
        }
        return false;
    }

    bool evaluateCondition(const IndicatorCondition& condition, EvaluationContext& context) {
        const std::size_t i = context.current_index;
        if (i >= context.bars.size()) {
            return false;
        }

        const double left = context.cache.valueAt(condition.left.key, i);
        const double right = resolveTarget(condition.right, context, i);
        if (!indicators::isAvailable(left) || !indicators::isAvailable(right)) {
            core::logging::getLogger()->trace("Bar {}: operand of '{}' unavailable, no match", i, condition.left.name);
            return false;
        }

        if (condition.op != ComparisonOp::CrossAbove && condition.op != ComparisonOp::CrossBelow) {
            return compareValues(left, condition.op, right);
        }

        // Crossing needs the previous bar
        if (i == 0) {
            return false;
        }
        const double prev_left = context.cache.valueAt(condition.left.key, i - 1);
        const double prev_right = resolveTarget(condition.right, context, i - 1);
        if (!indicators::isAvailable(prev_left) || !indicators::isAvailable(prev_right)) {
            return false;
        }

        if (condition.op == ComparisonOp::CrossAbove) {
            return (prev_left < prev_right) && (left > right);
        }
        return (prev_left > prev_right) && (left < right);
    }

} // namespace strategy_engine
