#pragma once

#include "datatypes.hpp"
#include "common_types.hpp"
#include <cstddef>
#include <optional>
#include <string>

namespace backtester {

    // Price at which an accepted entry signal is filled
    enum class EntryTiming {
        NextBarOpen // Open of the bar after the signal bar
    };

    std::string entryTimingToString(EntryTiming timing);
    EntryTiming entryTimingFromString(const std::string& timing_str); // throws std::invalid_argument

    // Account simulated in currency alongside the percent PnL
    struct CapitalSettings {
        double initial_capital = 0.0;
        double lot_size = 0.0;          // Units traded per position
        double leverage = 1.0;          // Required margin = lot_size * entry price / leverage
        double bankruptcy_ratio = 0.5;  // Stop once capital <= initial_capital * ratio
    };

    struct BacktestConfig {
        core::Timestamp start_time;
        core::Timestamp end_time;
        core::Timeframe timeframe = core::Timeframe::H1;
        EntryTiming entry_timing = EntryTiming::NextBarOpen;
        core::TradeSide side = core::TradeSide::Buy;
        strategy_engine::ExitSettings exit_settings;
        double trading_cost_pct = 0.0; // Round trip, deducted once from each trade's PnL %
        std::optional<CapitalSettings> capital;

        // Reject the run before any bar is scanned. Throws core::BacktestException.
        void validate(const core::TimeSeries<core::Candle>& bars) const;
    };

    // Inclusive index range of the bars inside [start_time, end_time]
    struct BarRange {
        std::size_t first = 0;
        std::size_t last = 0;
    };

    // Empty bars or no bar inside the range throws core::BacktestException
    BarRange findBarRange(const core::TimeSeries<core::Candle>& bars,
                          const core::Timestamp& start_time,
                          const core::Timestamp& end_time);

} // namespace backtester
