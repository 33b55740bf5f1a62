// backtester/include/position_tracker.hpp
#pragma once

#include <cstddef>
#include <optional>
#include <string>
#include <vector>

// Use short paths
#include "datatypes.hpp"
#include "common_types.hpp"

namespace backtester {

    enum class ExitReason {
        TakeProfit,
        StopLoss,
        Timeout
    };

    std::string exitReasonToString(ExitReason reason); // "take_profit", "stop_loss", "timeout"

    // One completed simulated trade
    struct BacktestTradeEvent {
        int sequence = 0;               // 1-based, in close order
        std::size_t signal_index = 0;   // Bar whose evaluation produced the entry signal
        std::size_t entry_index = 0;    // signal_index + 1
        std::size_t exit_index = 0;
        core::Timestamp entry_time;
        double entry_price = 0.0;
        core::Timestamp exit_time;
        double exit_price = 0.0;
        ExitReason exit_reason = ExitReason::Timeout;
        core::TradeSide side = core::TradeSide::Buy;
        double gross_pnl_pct = 0.0;     // Before trading cost
        double pnl_pct = 0.0;           // After trading cost
        std::size_t bars_held = 0;

        // Present only when position sizing is configured
        std::optional<double> lot_size;
        std::optional<double> pnl_amount;        // Currency PnL after cost
        std::optional<double> margin_return_pct; // pnl_amount relative to the required margin
    };

    // Currently open position with its exit levels fixed at entry
    struct OpenPosition {
        std::size_t signal_index = 0;
        std::size_t entry_index = 0;
        core::Timestamp entry_time;
        double entry_price = 0.0;
        double take_profit_price = 0.0;
        double stop_loss_price = 0.0;
    };

    // Tracks at most one open position, resolves its exits bar by bar and keeps the trade log
    class PositionTracker {
    public:
        PositionTracker(core::TradeSide side,
                        strategy_engine::ExitSettings exit_settings,
                        double trading_cost_pct,
                        int timeframe_minutes);

        // Size every later trade in currency: lot_size units, margin at the given leverage
        void setPositionSizing(double lot_size, double leverage);

        bool hasOpenPosition() const { return open_position_.has_value(); }
        const std::optional<OpenPosition>& getOpenPosition() const { return open_position_; }
        const std::vector<BacktestTradeEvent>& getTradeLog() const { return trade_log_; }

        // Open at entry_bar.open. Throws std::logic_error if a position is already open.
        void open(std::size_t signal_index, std::size_t entry_index, const core::Candle& entry_bar);

        // Check TP, then SL, then timeout at bar `index`. Returns the closed trade, if any.
        std::optional<BacktestTradeEvent> checkExit(std::size_t index, const core::Candle& bar);

        // Drop the open position without recording a trade (end of range)
        void discardOpenPosition();

        // Price distance of one exit level from the entry price
        static double levelDistance(const strategy_engine::ExitLevel& level, double entry_price);

        // Price increment for the pips unit when none is configured
        static double defaultPipSize(double entry_price);

    private:
        BacktestTradeEvent close(std::size_t index, const core::Candle& bar, double exit_price, ExitReason reason);

        core::TradeSide side_;
        strategy_engine::ExitSettings exit_settings_;
        double trading_cost_pct_;
        int timeframe_minutes_;
        std::optional<double> lot_size_;
        double leverage_ = 1.0;
        std::optional<OpenPosition> open_position_;
        std::vector<BacktestTradeEvent> trade_log_;
    };

} // namespace backtester
