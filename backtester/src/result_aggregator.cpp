#include "result_aggregator.hpp"
#include "logging.hpp"
#include <algorithm>
#include <cmath>
#include <numeric>   // For std::accumulate
#include <spdlog/fmt/fmt.h>

namespace backtester {

    namespace {

        std::string formatOptional(const std::optional<double>& value) {
            return value ? fmt::format("{:.4f}", *value) : std::string("n/a");
        }

        // Annualisation assumes roughly one trade per trading day
        const double kAnnualizationFactor = std::sqrt(252.0);

        void calculateCapitalMetrics(const std::vector<BacktestTradeEvent>& trades, double initial_capital,
                                     BacktestMetrics& metrics)
        {
            double capital = initial_capital;
            double peak = initial_capital;
            double max_drawdown = 0.0;
            for (const auto& trade : trades) {
                capital += trade.pnl_amount.value_or(0.0);
                peak = std::max(peak, capital);
                max_drawdown = std::max(max_drawdown, peak - capital);
            }
            metrics.net_profit = capital - initial_capital;
            metrics.net_profit_rate = *metrics.net_profit / initial_capital;
            metrics.max_drawdown_amount = max_drawdown;
            metrics.max_drawdown_rate = max_drawdown / initial_capital;
        }

    } // end anonymous namespace

    void BacktestMetrics::logMetrics() const {
        auto logger = core::logging::getLogger();
        logger->info("--- Backtest Metrics ---");
        logger->info("Total Trades: {} (Win {}, Loss {}, Breakeven {})",
                     total_trades, winning_trades, losing_trades, breakeven_trades);
        logger->info("Exit Reasons: TP {}, SL {}, Timeout {}", take_profit_count, stop_loss_count, timeout_count);
        logger->info("Win Rate: {:.2f}%", win_rate * 100.0);
        logger->info("Total Profit: {:.4f}%", total_profit);
        logger->info("Total Loss: {:.4f}%", total_loss);
        logger->info("Profit Factor: {}", formatOptional(profit_factor));
        logger->info("Average PnL / Expectancy: {:.4f}%", average_pnl);
        logger->info("Net PnL: {:.4f}%, Max Drawdown: {:.4f}%", net_pnl, max_drawdown);
        if (net_profit) {
            logger->info("Net Profit: {:.2f} ({:.2f}%), Max Drawdown: {:.2f} ({:.2f}%)",
                         *net_profit, net_profit_rate.value_or(0.0) * 100.0,
                         max_drawdown_amount.value_or(0.0), max_drawdown_rate.value_or(0.0) * 100.0);
        }
        logger->info("Avg Win: {:.4f}%, Avg Loss: {:.4f}%, Risk/Reward: {}",
                     average_win, average_loss, formatOptional(risk_reward_ratio));
        logger->info("Max Consecutive Wins: {}, Losses: {}", max_consecutive_wins, max_consecutive_losses);
        logger->info("Sharpe: {}, Sortino: {}, Confidence: {}",
                     formatOptional(sharpe_ratio), formatOptional(sortino_ratio), confidence_level);
        logger->info("------------------------");
    }

    BacktestMetrics calculateMetrics(const std::vector<BacktestTradeEvent>& trades,
                                     std::optional<double> initial_capital)
    {
        BacktestMetrics metrics;
        metrics.total_trades = static_cast<int>(trades.size());
        if (initial_capital && *initial_capital > 0.0) {
            calculateCapitalMetrics(trades, *initial_capital, metrics);
        }
        if (trades.empty()) {
            return metrics;
        }

        // --- Counts, profit and loss ---
        for (const auto& trade : trades) {
            if (trade.pnl_pct > 0) {
                metrics.winning_trades++;
                metrics.total_profit += trade.pnl_pct;
            } else if (trade.pnl_pct < 0) {
                metrics.losing_trades++;
                metrics.total_loss += -trade.pnl_pct;
            } else {
                metrics.breakeven_trades++;
            }

            switch (trade.exit_reason) {
                case ExitReason::TakeProfit: metrics.take_profit_count++; break;
                case ExitReason::StopLoss:   metrics.stop_loss_count++; break;
                case ExitReason::Timeout:    metrics.timeout_count++; break;
            }
        }

        const double count = static_cast<double>(trades.size());
        metrics.win_rate = metrics.winning_trades / count;
        if (metrics.total_loss > 0.0) {
            metrics.profit_factor = metrics.total_profit / metrics.total_loss;
        }

        const double total_pnl = std::accumulate(trades.begin(), trades.end(), 0.0,
            [](double sum, const BacktestTradeEvent& t) { return sum + t.pnl_pct; });
        metrics.net_pnl = total_pnl;
        metrics.average_pnl = total_pnl / count;
        metrics.expectancy = metrics.average_pnl;

        // --- Max Drawdown on the cumulative PnL curve ---
        double cumulative = 0.0;
        double peak = 0.0;
        for (const auto& trade : trades) {
            cumulative += trade.pnl_pct;
            peak = std::max(peak, cumulative);
            metrics.max_drawdown = std::max(metrics.max_drawdown, peak - cumulative);
        }

        // --- Averages and streaks ---
        metrics.average_win = metrics.winning_trades > 0 ? metrics.total_profit / metrics.winning_trades : 0.0;
        metrics.average_loss = metrics.losing_trades > 0 ? metrics.total_loss / metrics.losing_trades : 0.0;
        if (metrics.winning_trades > 0 && metrics.losing_trades > 0) {
            metrics.risk_reward_ratio = metrics.average_win / metrics.average_loss;
        }

        int current_wins = 0;
        int current_losses = 0;
        for (const auto& trade : trades) {
            if (trade.pnl_pct > 0) {
                current_wins++;
                current_losses = 0;
                metrics.max_consecutive_wins = std::max(metrics.max_consecutive_wins, current_wins);
            } else {
                current_losses++;
                current_wins = 0;
                metrics.max_consecutive_losses = std::max(metrics.max_consecutive_losses, current_losses);
            }
        }

        // --- Sharpe / Sortino over per-trade returns ---
        if (trades.size() >= 2) {
            double sq_sum = 0.0;
            double down_sq_sum = 0.0;
            int negative_count = 0;
            for (const auto& trade : trades) {
                sq_sum += (trade.pnl_pct - metrics.average_pnl) * (trade.pnl_pct - metrics.average_pnl);
                if (trade.pnl_pct < 0) {
                    down_sq_sum += trade.pnl_pct * trade.pnl_pct;
                    negative_count++;
                }
            }
            const double std_dev = std::sqrt(sq_sum / (count - 1.0));
            if (std_dev > 0.0) {
                metrics.sharpe_ratio = metrics.average_pnl / std_dev * kAnnualizationFactor;
            }
            if (negative_count > 0) {
                const double down_dev = std::sqrt(down_sq_sum / negative_count);
                if (down_dev > 0.0) {
                    metrics.sortino_ratio = metrics.average_pnl / down_dev * kAnnualizationFactor;
                }
            }
        }

        metrics.confidence_level = trades.size() >= 30 ? "high" : trades.size() >= 10 ? "medium" : "low";
        return metrics;
    }

} // namespace backtester
