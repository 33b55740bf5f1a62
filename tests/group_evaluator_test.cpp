#include <gtest/gtest.h>

#include <optional>
#include <utility>
#include <vector>

#include "group_evaluator.hpp"
#include "indicator_cache.hpp"
#include "test_helpers.hpp"

using namespace strategy_engine;
using test_helpers::addCloseCondition;

namespace {

    constexpr double kBaseline = 60.0;
    constexpr double kTrigger = 50.0;
    constexpr double kConfirm = 70.0;

    // Flat baseline closes with the listed bars overridden
    core::TimeSeries<core::Candle> scriptedBars(std::size_t count,
                                                const std::vector<std::pair<std::size_t, double>>& marks) {
        std::vector<double> closes(count, kBaseline);
        for (const auto& mark : marks) {
            closes[mark.first] = mark.second;
        }
        return test_helpers::flatBars(closes);
    }

    // Indices of the bars on which the root evaluates true
    std::vector<std::size_t> firingBars(const ConditionTree& tree, const core::TimeSeries<core::Candle>& bars) {
        indicators::IndicatorCache cache(bars);
        EvaluationState state(tree);
        ConditionGroupEvaluator evaluator(tree);

        std::vector<std::size_t> fired;
        for (std::size_t i = 0; i < bars.size(); ++i) {
            EvaluationContext context{bars, i, cache, state};
            if (evaluator.evaluate(context)) {
                fired.push_back(i);
            }
        }
        return fired;
    }

    ConditionTree ifThenTree(int max_bars_to_wait) {
        ConditionTree tree;
        ConditionGroup group;
        group.op = LogicalOp::IfThen;
        group.trigger = addCloseCondition(tree, ComparisonOp::EQ, kTrigger);
        group.confirm = addCloseCondition(tree, ComparisonOp::EQ, kConfirm);
        group.max_bars_to_wait = max_bars_to_wait;
        tree.setRoot(tree.addGroup(group));
        return tree;
    }

    ConditionTree sequenceTree(int max_bars_between_steps) {
        ConditionTree tree;
        ConditionGroup group;
        group.op = LogicalOp::Sequence;
        group.steps.push_back(addCloseCondition(tree, ComparisonOp::EQ, kTrigger));
        group.steps.push_back(addCloseCondition(tree, ComparisonOp::EQ, kConfirm));
        group.max_bars_between_steps = max_bars_between_steps;
        tree.setRoot(tree.addGroup(group));
        return tree;
    }

} // namespace

TEST(GroupEvaluatorTest, AndOrNot) {
    const auto bars = test_helpers::flatBars({10.0, 20.0, 30.0});

    ConditionTree and_tree;
    {
        ConditionGroup group;
        group.op = LogicalOp::And;
        group.children = {addCloseCondition(and_tree, ComparisonOp::GT, 15.0),
                          addCloseCondition(and_tree, ComparisonOp::LT, 25.0)};
        and_tree.setRoot(and_tree.addGroup(group));
    }
    EXPECT_EQ(firingBars(and_tree, bars), (std::vector<std::size_t>{1}));

    ConditionTree or_tree;
    {
        ConditionGroup group;
        group.op = LogicalOp::Or;
        group.children = {addCloseCondition(or_tree, ComparisonOp::LT, 15.0),
                          addCloseCondition(or_tree, ComparisonOp::GT, 25.0)};
        or_tree.setRoot(or_tree.addGroup(group));
    }
    EXPECT_EQ(firingBars(or_tree, bars), (std::vector<std::size_t>{0, 2}));

    ConditionTree not_tree;
    {
        ConditionGroup group;
        group.op = LogicalOp::Not;
        group.children = {addCloseCondition(not_tree, ComparisonOp::GT, 15.0)};
        not_tree.setRoot(not_tree.addGroup(group));
    }
    EXPECT_EQ(firingBars(not_tree, bars), (std::vector<std::size_t>{0}));
}

TEST(GroupEvaluatorTest, TreeWithoutRootNeverFires) {
    ConditionTree tree;
    addCloseCondition(tree, ComparisonOp::GT, 0.0);
    EXPECT_TRUE(firingBars(tree, test_helpers::flatBars({1.0, 2.0})).empty());
}

TEST(GroupEvaluatorTest, IfThenFiresWithinWindow) {
    const ConditionTree tree = ifThenTree(3);
    // Trigger at bar 2, confirmation three bars later
    EXPECT_EQ(firingBars(tree, scriptedBars(10, {{2, kTrigger}, {5, kConfirm}})),
              (std::vector<std::size_t>{5}));
}

TEST(GroupEvaluatorTest, IfThenExpiresAfterWindow) {
    const ConditionTree tree = ifThenTree(3);
    EXPECT_TRUE(firingBars(tree, scriptedBars(10, {{2, kTrigger}, {6, kConfirm}})).empty());
}

TEST(GroupEvaluatorTest, IfThenConfirmBeforeTriggerDoesNotFire) {
    const ConditionTree tree = ifThenTree(5);
    EXPECT_TRUE(firingBars(tree, scriptedBars(10, {{1, kConfirm}, {3, kTrigger}})).empty());
}

TEST(GroupEvaluatorTest, IfThenRearmsAfterFiring) {
    const ConditionTree tree = ifThenTree(2);
    const auto bars = scriptedBars(12, {{1, kTrigger}, {2, kConfirm}, {3, kConfirm}, {6, kTrigger}, {8, kConfirm}});
    // Bar 3 needs a fresh trigger after the bar 2 firing
    EXPECT_EQ(firingBars(tree, bars), (std::vector<std::size_t>{2, 8}));
}

TEST(GroupEvaluatorTest, IfThenRepeatTriggerKeepsFirstTriggerBar) {
    const ConditionTree tree = ifThenTree(2);
    // Window counts from bar 1; the trigger at bar 3 does not extend it
    EXPECT_TRUE(firingBars(tree, scriptedBars(8, {{1, kTrigger}, {3, kTrigger}, {4, kConfirm}})).empty());
    // Re-armed by a fresh trigger once the first window has expired
    EXPECT_EQ(firingBars(tree, scriptedBars(10, {{1, kTrigger}, {3, kTrigger}, {5, kTrigger}, {6, kConfirm}})),
              (std::vector<std::size_t>{6}));
}

TEST(GroupEvaluatorTest, IfThenFiresOnArmingBar) {
    ConditionTree tree;
    ConditionGroup group;
    group.op = LogicalOp::IfThen;
    group.trigger = addCloseCondition(tree, ComparisonOp::EQ, kTrigger);
    group.confirm = addCloseCondition(tree, ComparisonOp::LT, 55.0);
    group.max_bars_to_wait = 0;
    tree.setRoot(tree.addGroup(group));

    // Bar 3 both arms and confirms; bar 5 confirms without a trigger
    EXPECT_EQ(firingBars(tree, scriptedBars(8, {{3, kTrigger}, {5, 40.0}})), (std::vector<std::size_t>{3}));
}

TEST(GroupEvaluatorTest, IfThenWithMissingExpressionNeverFires) {
    const auto bars = scriptedBars(8, {{1, kTrigger}, {2, kConfirm}, {4, kTrigger}, {5, kConfirm}});

    ConditionTree no_confirm;
    {
        ConditionGroup group;
        group.op = LogicalOp::IfThen;
        group.trigger = addCloseCondition(no_confirm, ComparisonOp::EQ, kTrigger);
        no_confirm.setRoot(no_confirm.addGroup(group));
    }
    EXPECT_NO_THROW(firingBars(no_confirm, bars));
    EXPECT_TRUE(firingBars(no_confirm, bars).empty());

    ConditionTree no_trigger;
    {
        ConditionGroup group;
        group.op = LogicalOp::IfThen;
        group.confirm = addCloseCondition(no_trigger, ComparisonOp::EQ, kConfirm);
        no_trigger.setRoot(no_trigger.addGroup(group));
    }
    EXPECT_NO_THROW(firingBars(no_trigger, bars));
    EXPECT_TRUE(firingBars(no_trigger, bars).empty());
}

TEST(GroupEvaluatorTest, SequenceCompletesWithinGap) {
    const ConditionTree tree = sequenceTree(5);
    EXPECT_EQ(firingBars(tree, scriptedBars(20, {{7, kTrigger}, {12, kConfirm}})),
              (std::vector<std::size_t>{12}));
}

TEST(GroupEvaluatorTest, SequenceResetsWhenGapExceeded) {
    const ConditionTree tree = sequenceTree(5);
    EXPECT_TRUE(firingBars(tree, scriptedBars(20, {{7, kTrigger}, {14, kConfirm}})).empty());
}

TEST(GroupEvaluatorTest, SequenceWithTightGap) {
    const ConditionTree tree = sequenceTree(3);
    EXPECT_EQ(firingBars(tree, scriptedBars(20, {{10, kTrigger}, {12, kConfirm}})),
              (std::vector<std::size_t>{12}));
    EXPECT_TRUE(firingBars(tree, scriptedBars(20, {{10, kTrigger}, {14, kConfirm}})).empty());
}

TEST(GroupEvaluatorTest, SequenceRestartsAfterReset) {
    const ConditionTree tree = sequenceTree(2);
    const auto bars = scriptedBars(20, {{1, kTrigger}, {6, kTrigger}, {7, kConfirm}});
    EXPECT_EQ(firingBars(tree, bars), (std::vector<std::size_t>{7}));
}

TEST(GroupEvaluatorTest, SequenceNewCycleIsNotGapCheckedAgainstPreviousCycle) {
    ConditionTree tree;
    ConditionGroup group;
    group.op = LogicalOp::Sequence;
    group.steps.push_back(addCloseCondition(tree, ComparisonOp::EQ, kTrigger));
    group.steps.push_back(addCloseCondition(tree, ComparisonOp::EQ, kConfirm));
    group.max_bars_between_steps = 2;
    const NodeId sequence_id = tree.addGroup(group);
    tree.setRoot(sequence_id);

    const auto bars = scriptedBars(12, {{1, kTrigger}, {2, kConfirm}, {8, kTrigger}, {9, kConfirm}});
    EXPECT_EQ(firingBars(tree, bars), (std::vector<std::size_t>{2, 9}));

    // Completion leaves no reference bar behind for the next cycle
    indicators::IndicatorCache cache(bars);
    EvaluationState state(tree);
    ConditionGroupEvaluator evaluator(tree);
    for (std::size_t i = 0; i <= 2; ++i) {
        EvaluationContext context{bars, i, cache, state};
        evaluator.evaluate(context);
    }
    EXPECT_EQ(state.sequence(sequence_id).next_step, 0u);
    EXPECT_FALSE(state.sequence(sequence_id).last_completed_at.has_value());
}

TEST(GroupEvaluatorTest, AndKeepsAdvancingStatefulChildren) {
    ConditionTree tree;
    const NodeId never = addCloseCondition(tree, ComparisonOp::GT, 1000.0);

    ConditionGroup sequence;
    sequence.op = LogicalOp::Sequence;
    sequence.steps.push_back(addCloseCondition(tree, ComparisonOp::EQ, kTrigger));
    sequence.steps.push_back(addCloseCondition(tree, ComparisonOp::EQ, kConfirm));
    const NodeId sequence_id = tree.addGroup(sequence);

    ConditionGroup group;
    group.op = LogicalOp::And;
    group.children = {never, sequence_id};
    tree.setRoot(tree.addGroup(group));

    const auto bars = scriptedBars(5, {{1, kTrigger}});
    indicators::IndicatorCache cache(bars);
    EvaluationState state(tree);
    ConditionGroupEvaluator evaluator(tree);
    for (std::size_t i = 0; i <= 2; ++i) {
        EvaluationContext context{bars, i, cache, state};
        EXPECT_FALSE(evaluator.evaluate(context));
    }
    EXPECT_EQ(state.sequence(sequence_id).next_step, 1u);
    EXPECT_EQ(state.sequence(sequence_id).last_completed_at, std::optional<std::size_t>(1));

    state.reset();
    EXPECT_EQ(state.sequence(sequence_id).next_step, 0u);
    EXPECT_THROW(state.ifThen(sequence_id), std::logic_error);
}
