#pragma once

#include "common_types.hpp"
#include "indicators.hpp"
#include <cstddef>
#include <optional>
#include <string>
#include <variant>
#include <vector>

namespace strategy_engine {

    // Index of a node inside its ConditionTree
    using NodeId = std::size_t;

    // An indicator operand: structured cache key plus the name the strategy author used
    struct IndicatorRef {
        indicators::IndicatorKey key;
        std::string name;
    };

    // Right-hand side of a leaf: fixed constant, another indicator, or a price field of the current bar
    using CompareTarget = std::variant<double, IndicatorRef, PriceField>;

    // Leaf: left indicator <op> right target
    struct IndicatorCondition {
        IndicatorRef left;
        ComparisonOp op = ComparisonOp::GT;
        CompareTarget right = 0.0;
    };

    // Recursive node combining children by a logical operator.
    //   AND / OR : children (at least one)
    //   NOT      : exactly one child
    //   IF_THEN  : trigger, confirm, max_bars_to_wait
    //   SEQUENCE : steps (at least one), max_bars_between_steps
    struct ConditionGroup {
        LogicalOp op = LogicalOp::And;
        std::vector<NodeId> children;
        std::optional<NodeId> trigger;
        std::optional<NodeId> confirm;
        int max_bars_to_wait = 5;
        std::vector<NodeId> steps;
        int max_bars_between_steps = 10;
    };

    using ConditionNode = std::variant<IndicatorCondition, ConditionGroup>;

    // Immutable-once-built arena of condition nodes.
    // Children are added before their parent and each node has at most one parent,
    // so the structure is always a forest of trees. Run-scoped state lives in EvaluationState.
    class ConditionTree {
    public:
        NodeId addCondition(IndicatorCondition condition);

        // Validates the group's structure, throws core::StrategyException
        NodeId addGroup(ConditionGroup group);

        void setRoot(NodeId id); // throws core::StrategyException for an unknown id
        std::optional<NodeId> root() const { return root_; }

        const ConditionNode& node(NodeId id) const; // throws std::out_of_range
        std::size_t size() const { return nodes_.size(); }
        bool empty() const { return nodes_.empty(); }

        std::string describe(NodeId id) const;
        std::string describe() const; // Root, or "<empty>"

        // Normalized, de-duplicated indicator keys referenced below the root
        std::vector<indicators::IndicatorKey> collectIndicatorKeys() const;

    private:
        void collectKeys(NodeId id, std::vector<indicators::IndicatorKey>& keys) const;

        std::vector<ConditionNode> nodes_;
        std::vector<bool> has_parent_;
        std::optional<NodeId> root_;
    };

} // namespace strategy_engine
