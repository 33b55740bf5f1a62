#include "backtest_config.hpp"
#include "exceptions.hpp"
#include "utils.hpp"
#include <algorithm>
#include <stdexcept>
#include <spdlog/fmt/fmt.h>

namespace backtester {

    namespace {

        void validateExitLevel(const strategy_engine::ExitLevel& level, const char* name) {
            if (!(level.value > 0.0)) {
                throw core::BacktestException(fmt::format("{} must be positive, got {}.", name, level.value));
            }
            if (level.pip_size && !(*level.pip_size > 0.0)) {
                throw core::BacktestException(fmt::format("{} pip size must be positive, got {}.", name, *level.pip_size));
            }
        }

    } // end anonymous namespace

    std::string entryTimingToString(EntryTiming timing) {
        switch (timing) {
            case EntryTiming::NextBarOpen: return "next_bar_open";
        }
        return "next_bar_open";
    }

    EntryTiming entryTimingFromString(const std::string& timing_str) {
        if (timing_str == "next_bar_open" || timing_str == "nextBarOpen") return EntryTiming::NextBarOpen;
        throw std::invalid_argument("Unknown entry timing string: " + timing_str);
    }

    BarRange findBarRange(const core::TimeSeries<core::Candle>& bars,
                          const core::Timestamp& start_time,
                          const core::Timestamp& end_time)
    {
        if (bars.empty()) {
            throw core::BacktestException("Bar series is empty.");
        }

        auto first = std::lower_bound(bars.begin(), bars.end(), start_time,
            [](const core::Candle& candle, const core::Timestamp& ts) { return candle.timestamp < ts; });
        auto past_last = std::upper_bound(bars.begin(), bars.end(), end_time,
            [](const core::Timestamp& ts, const core::Candle& candle) { return ts < candle.timestamp; });

        if (first == bars.end() || first >= past_last) {
            throw core::BacktestException(fmt::format("No bars between {} and {} (series covers {} to {}).",
                core::utils::timestampToString(start_time), core::utils::timestampToString(end_time),
                core::utils::timestampToString(bars.front().timestamp),
                core::utils::timestampToString(bars.back().timestamp)));
        }

        BarRange range;
        range.first = static_cast<std::size_t>(first - bars.begin());
        range.last = static_cast<std::size_t>(past_last - bars.begin()) - 1;
        return range;
    }

    void BacktestConfig::validate(const core::TimeSeries<core::Candle>& bars) const {
        if (bars.empty()) {
            throw core::BacktestException("Bar series is empty.");
        }
        for (std::size_t i = 1; i < bars.size(); ++i) {
            if (!(bars[i - 1].timestamp < bars[i].timestamp)) {
                throw core::BacktestException(fmt::format("Bars are not strictly ascending at index {} ({}).",
                    i, core::utils::timestampToString(bars[i].timestamp)));
            }
        }
        if (end_time < start_time) {
            throw core::BacktestException(fmt::format("End date {} is before start date {}.",
                core::utils::timestampToString(end_time), core::utils::timestampToString(start_time)));
        }

        validateExitLevel(exit_settings.take_profit, "Take-profit");
        validateExitLevel(exit_settings.stop_loss, "Stop-loss");

        if (exit_settings.max_holding_minutes && *exit_settings.max_holding_minutes <= 0) {
            throw core::BacktestException(fmt::format("Maximum holding time must be positive, got {} minutes.",
                                                      *exit_settings.max_holding_minutes));
        }
        if (trading_cost_pct < 0.0) {
            throw core::BacktestException(fmt::format("Trading cost must not be negative, got {}%.", trading_cost_pct));
        }

        if (capital) {
            if (!(capital->initial_capital > 0.0)) {
                throw core::BacktestException(fmt::format("Initial capital must be positive, got {}.", capital->initial_capital));
            }
            if (!(capital->lot_size > 0.0)) {
                throw core::BacktestException(fmt::format("Lot size must be positive, got {}.", capital->lot_size));
            }
            if (!(capital->leverage > 0.0)) {
                throw core::BacktestException(fmt::format("Leverage must be positive, got {}.", capital->leverage));
            }
            if (!(capital->bankruptcy_ratio >= 0.0 && capital->bankruptcy_ratio < 1.0)) {
                throw core::BacktestException(fmt::format("Bankruptcy ratio must be in [0, 1), got {}.",
                                                          capital->bankruptcy_ratio));
            }
        }

        // Throws when no bar falls inside the range
        findBarRange(bars, start_time, end_time);
    }

} // namespace backtester
