#pragma once

#include "datatypes.hpp"
#include "common_types.hpp"
#include "condition_tree.hpp"
#include "indicators.hpp"
#include <string>
#include <vector>

namespace strategy_engine {

    // --- Strategy Class ---
    // Immutable strategy definition: entry condition tree, trade side, exit settings and cost.
    // Run-scoped state is never stored here, so one Strategy can back any number of runs.
    class Strategy {
    public:
        Strategy(std::string name,
                 core::TradeSide side,
                 ConditionTree entry_conditions,
                 ExitSettings exit_settings,
                 double trading_cost_pct);

        const std::string& getName() const { return name_; }
        core::TradeSide getSide() const { return side_; }
        const ConditionTree& getEntryConditions() const { return entry_conditions_; }
        const ExitSettings& getExitSettings() const { return exit_settings_; }
        double getTradingCostPct() const { return trading_cost_pct_; }

        // Normalized indicator keys the entry conditions read
        const std::vector<indicators::IndicatorKey>& getRequiredIndicators() const { return required_indicators_; }

        std::string describe() const;

    private:
        std::string name_;
        core::TradeSide side_;
        ConditionTree entry_conditions_;
        ExitSettings exit_settings_;
        double trading_cost_pct_;
        std::vector<indicators::IndicatorKey> required_indicators_;
    };

} // namespace strategy_engine
