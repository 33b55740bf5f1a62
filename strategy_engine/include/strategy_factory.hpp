#pragma once

#include <string>
#include <memory> // For std::unique_ptr
#include <nlohmann/json.hpp> // Include JSON library header

#include "condition_tree.hpp"
#include "strategy.hpp"

namespace strategy_engine {

    using json = nlohmann::json; // Alias for convenience

    class StrategyFactory {
    public:
        // Build a strategy from its JSON definition. Throws core::StrategyException.
        static std::unique_ptr<Strategy> createStrategy(const json& config);

        // Build a condition tree whose root is the given condition or group. Throws core::StrategyException.
        static ConditionTree parseConditionTree(const json& condition_config);

        // Parse {"take_profit": ..., "stop_loss": ..., "max_holding_minutes": ...}. Throws core::StrategyException.
        static ExitSettings parseExitSettings(const json& exit_config);

    private:
        // Recursive helpers; they throw std::invalid_argument or json exceptions on malformed input
        static NodeId parseCondition(const json& condition_config, ConditionTree& tree);
        static IndicatorCondition parseLeaf(const json& leaf_config);
        static IndicatorRef parseIndicatorRef(const json& config);
        static ExitLevel parseExitLevel(const json& level_config, const char* name);
    };

} // namespace strategy_engine
