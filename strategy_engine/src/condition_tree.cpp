#include "condition_tree.hpp"
#include "indicator_cache.hpp"
#include "exceptions.hpp"
#include "logging.hpp"
#include <algorithm>
#include <stdexcept>
#include <utility>
#include <spdlog/fmt/fmt.h>
#include <spdlog/fmt/ranges.h>

namespace strategy_engine {

    namespace {

        std::string describeRef(const IndicatorRef& ref) {
            return indicators::describeKey(indicators::IndicatorCache::normalize(ref.key));
        }

        std::string describeTarget(const CompareTarget& target) {
            if (const auto* value = std::get_if<double>(&target)) {
                return fmt::format("{}", *value);
            }
            if (const auto* ref = std::get_if<IndicatorRef>(&target)) {
                return describeRef(*ref);
            }
            return priceFieldToString(std::get<PriceField>(target));
        }

    } // end anonymous namespace

    NodeId ConditionTree::addCondition(IndicatorCondition condition) {
        if (condition.left.key.kind == indicators::IndicatorKind::Unknown) {
            core::logging::getLogger()->warn("Condition references unknown indicator '{}'. It will never match.",
                                             condition.left.name);
        }
        if (const auto* ref = std::get_if<IndicatorRef>(&condition.right)) {
            if (ref->key.kind == indicators::IndicatorKind::Unknown) {
                core::logging::getLogger()->warn("Condition compares against unknown indicator '{}'. It will never match.",
                                                 ref->name);
            }
        }
        nodes_.emplace_back(std::move(condition));
        has_parent_.push_back(false);
        return nodes_.size() - 1;
    }

    NodeId ConditionTree::addGroup(ConditionGroup group) {
        const std::string op_name = logicalOpToString(group.op);
        const NodeId id = nodes_.size();

        switch (group.op) {
            case LogicalOp::And:
            case LogicalOp::Or:
                if (group.children.empty()) {
                    throw core::StrategyException(fmt::format("{} group requires at least one child.", op_name));
                }
                break;
            case LogicalOp::Not:
                if (group.children.size() != 1) {
                    throw core::StrategyException(
                        fmt::format("NOT group requires exactly one child, got {}.", group.children.size()));
                }
                break;
            case LogicalOp::IfThen:
                if (group.max_bars_to_wait < 0) {
                    throw core::StrategyException(
                        fmt::format("IF_THEN max_bars_to_wait must not be negative, got {}.", group.max_bars_to_wait));
                }
                if (!group.trigger || !group.confirm) {
                    core::logging::getLogger()->warn("IF_THEN group {} is missing its {} expression. It will never fire.",
                                                     id, group.trigger ? "confirm" : "trigger");
                }
                break;
            case LogicalOp::Sequence:
                if (group.steps.empty()) {
                    throw core::StrategyException("SEQUENCE group requires at least one step.");
                }
                if (group.max_bars_between_steps < 0) {
                    throw core::StrategyException(
                        fmt::format("SEQUENCE max_bars_between_steps must not be negative, got {}.",
                                    group.max_bars_between_steps));
                }
                break;
        }

        // Validate every reference before marking any of them as adopted
        std::vector<NodeId> referenced = group.children;
        if (group.trigger) referenced.push_back(*group.trigger);
        if (group.confirm) referenced.push_back(*group.confirm);
        referenced.insert(referenced.end(), group.steps.begin(), group.steps.end());

        std::vector<NodeId> sorted = referenced;
        std::sort(sorted.begin(), sorted.end());
        if (std::adjacent_find(sorted.begin(), sorted.end()) != sorted.end()) {
            throw core::StrategyException(fmt::format("{} group {} references the same node twice.", op_name, id));
        }
        for (NodeId child : referenced) {
            if (child >= id) {
                throw core::StrategyException(
                    fmt::format("{} group {} references node {} which has not been added yet.", op_name, id, child));
            }
            if (has_parent_[child]) {
                throw core::StrategyException(
                    fmt::format("Node {} is already used by another group and cannot be reused by group {}.", child, id));
            }
        }
        for (NodeId child : referenced) {
            has_parent_[child] = true;
        }

        nodes_.emplace_back(std::move(group));
        has_parent_.push_back(false);
        return id;
    }

    void ConditionTree::setRoot(NodeId id) {
        if (id >= nodes_.size()) {
            throw core::StrategyException(fmt::format("Cannot set root to unknown node {}.", id));
        }
        root_ = id;
    }

    const ConditionNode& ConditionTree::node(NodeId id) const {
        if (id >= nodes_.size()) {
            throw std::out_of_range(fmt::format("Condition node {} out of range (size {}).", id, nodes_.size()));
        }
        return nodes_[id];
    }

    std::string ConditionTree::describe(NodeId id) const {
        const ConditionNode& n = node(id);
        if (const auto* leaf = std::get_if<IndicatorCondition>(&n)) {
            return fmt::format("{} {} {}", describeRef(leaf->left), compOpToString(leaf->op), describeTarget(leaf->right));
        }

        const auto& group = std::get<ConditionGroup>(n);
        std::vector<std::string> parts;
        switch (group.op) {
            case LogicalOp::And:
            case LogicalOp::Or:
                for (NodeId child : group.children) parts.push_back(describe(child));
                return fmt::format("({})", fmt::join(parts, group.op == LogicalOp::And ? " AND " : " OR "));
            case LogicalOp::Not:
                return fmt::format("NOT ({})", describe(group.children.front()));
            case LogicalOp::IfThen:
                return fmt::format("IF ({}) THEN ({}) WITHIN {} BARS",
                                   group.trigger ? describe(*group.trigger) : "<missing>",
                                   group.confirm ? describe(*group.confirm) : "<missing>",
                                   group.max_bars_to_wait);
            case LogicalOp::Sequence:
                for (NodeId step : group.steps) parts.push_back(describe(step));
                return fmt::format("SEQUENCE [{}] MAX GAP {} BARS", fmt::join(parts, " -> "),
                                   group.max_bars_between_steps);
        }
        return "?";
    }

    std::string ConditionTree::describe() const {
        return root_ ? describe(*root_) : "<empty>";
    }

    void ConditionTree::collectKeys(NodeId id, std::vector<indicators::IndicatorKey>& keys) const {
        auto add = [&keys](const indicators::IndicatorKey& key) {
            indicators::IndicatorKey normalized = indicators::IndicatorCache::normalize(key);
            if (std::find(keys.begin(), keys.end(), normalized) == keys.end()) {
                keys.push_back(normalized);
            }
        };

        const ConditionNode& n = node(id);
        if (const auto* leaf = std::get_if<IndicatorCondition>(&n)) {
            add(leaf->left.key);
            if (const auto* ref = std::get_if<IndicatorRef>(&leaf->right)) {
                add(ref->key);
            }
            return;
        }

        const auto& group = std::get<ConditionGroup>(n);
        for (NodeId child : group.children) collectKeys(child, keys);
        if (group.trigger) collectKeys(*group.trigger, keys);
        if (group.confirm) collectKeys(*group.confirm, keys);
        for (NodeId step : group.steps) collectKeys(step, keys);
    }

    std::vector<indicators::IndicatorKey> ConditionTree::collectIndicatorKeys() const {
        std::vector<indicators::IndicatorKey> keys;
        if (root_) {
            collectKeys(*root_, keys);
        }
        return keys;
    }

} // namespace strategy_engine
