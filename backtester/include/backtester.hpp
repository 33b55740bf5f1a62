#pragma once

#include <cstddef>
#include <optional>
#include <string>
#include <vector>

// Required project headers (use short paths)
#include "datatypes.hpp"
#include "backtest_config.hpp"
#include "position_tracker.hpp"
#include "capital_account.hpp"
#include "result_aggregator.hpp"
#include "condition_tree.hpp"
#include "strategy.hpp"

namespace backtester {

    // Outcome of one simulation run. Built once, immutable after run() returns.
    struct BacktestResult {
        std::string strategy_name;
        BacktestConfig config;
        std::vector<BacktestTradeEvent> trades;
        BacktestMetrics metrics;

        std::size_t bars_in_range = 0;
        std::size_t bars_scanned = 0;
        std::size_t first_scanned_index = 0; // After indicator warm-up
        int max_lookback = 0;

        int signal_count = 0;           // Bars on which the entry group was true
        int ignored_signal_count = 0;   // Signals while a position was open
        int dropped_signal_count = 0;   // Signals on the last bar of the range (no next bar)
        bool open_position_discarded = false;
        std::size_t indicator_computations = 0;

        StopReason stop_reason = StopReason::Completed;
        std::optional<double> final_capital; // Set when the run has a capital model
    };

    class Backtester {
    public:
        Backtester() = default;

        // Simulate entries from the condition tree over bars. Throws core::BacktestException.
        BacktestResult run(const strategy_engine::ConditionTree& entry_conditions,
                           const core::TimeSeries<core::Candle>& bars,
                           const BacktestConfig& config) const;

        // Side, exits and cost come from the strategy; range, timing and capital from config
        BacktestResult run(const strategy_engine::Strategy& strategy,
                           const core::TimeSeries<core::Candle>& bars,
                           BacktestConfig config) const;

        // Same, with a default config for the range
        BacktestResult run(const strategy_engine::Strategy& strategy,
                           const core::TimeSeries<core::Candle>& bars,
                           const core::Timestamp& start_time,
                           const core::Timestamp& end_time,
                           core::Timeframe timeframe) const;
    };

} // namespace backtester
