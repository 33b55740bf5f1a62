#pragma once

#include <optional>
#include <string>
#include <vector>

// Use short paths
#include "position_tracker.hpp" // Provides BacktestTradeEvent

namespace backtester {

    // --- Backtest Metrics Struct ---
    // All PnL figures are cost-adjusted percent of entry price.
    struct BacktestMetrics {
        int total_trades = 0;
        int winning_trades = 0;     // pnl > 0
        int losing_trades = 0;      // pnl < 0
        int breakeven_trades = 0;   // pnl == 0
        int take_profit_count = 0;
        int stop_loss_count = 0;
        int timeout_count = 0;

        double win_rate = 0.0;      // winning / total, 0..1
        double total_profit = 0.0;  // Sum of positive PnL
        double total_loss = 0.0;    // Absolute sum of negative PnL
        std::optional<double> profit_factor; // Empty when total_loss == 0
        double average_pnl = 0.0;
        double expectancy = 0.0;    // Same as average_pnl
        double max_drawdown = 0.0;  // Largest peak-to-trough drop of the cumulative PnL curve
        double net_pnl = 0.0;       // Sum of all trade PnL

        double average_win = 0.0;
        double average_loss = 0.0;  // Absolute
        std::optional<double> risk_reward_ratio; // average_win / average_loss
        int max_consecutive_wins = 0;
        int max_consecutive_losses = 0;
        std::optional<double> sharpe_ratio;
        std::optional<double> sortino_ratio;
        std::string confidence_level = "low";

        // Currency figures, present only when the run has a capital model
        std::optional<double> net_profit;
        std::optional<double> net_profit_rate;     // net_profit / initial capital
        std::optional<double> max_drawdown_amount; // Peak-to-trough of the capital curve
        std::optional<double> max_drawdown_rate;   // max_drawdown_amount / initial capital

        // Helper method to log calculated metrics
        void logMetrics() const;
    };

    // Reduce the ordered trade list (close order) to summary statistics.
    // With initial_capital, the currency figures are filled from each trade's pnl_amount.
    BacktestMetrics calculateMetrics(const std::vector<BacktestTradeEvent>& trades,
                                     std::optional<double> initial_capital = std::nullopt);

} // namespace backtester
