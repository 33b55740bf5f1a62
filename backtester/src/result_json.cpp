#include "result_json.hpp"
#include "utils.hpp"

namespace backtester {

    namespace {

        json optionalToJson(const std::optional<double>& value) {
            return value ? json(*value) : json(nullptr);
        }

    } // end anonymous namespace

    json toJson(const BacktestTradeEvent& trade) {
        return json{
            {"sequence", trade.sequence},
            {"side", core::utils::sideToString(trade.side)},
            {"signal_index", trade.signal_index},
            {"entry_index", trade.entry_index},
            {"exit_index", trade.exit_index},
            {"entry_time", core::utils::timestampToString(trade.entry_time)},
            {"entry_price", trade.entry_price},
            {"exit_time", core::utils::timestampToString(trade.exit_time)},
            {"exit_price", trade.exit_price},
            {"exit_reason", exitReasonToString(trade.exit_reason)},
            {"gross_pnl_pct", trade.gross_pnl_pct},
            {"pnl_pct", trade.pnl_pct},
            {"bars_held", trade.bars_held},
            {"lot_size", optionalToJson(trade.lot_size)},
            {"pnl_amount", optionalToJson(trade.pnl_amount)},
            {"margin_return_pct", optionalToJson(trade.margin_return_pct)}
        };
    }

    json toJson(const BacktestMetrics& metrics) {
        return json{
            {"total_trades", metrics.total_trades},
            {"winning_trades", metrics.winning_trades},
            {"losing_trades", metrics.losing_trades},
            {"breakeven_trades", metrics.breakeven_trades},
            {"take_profit_count", metrics.take_profit_count},
            {"stop_loss_count", metrics.stop_loss_count},
            {"timeout_count", metrics.timeout_count},
            {"win_rate", metrics.win_rate},
            {"total_profit", metrics.total_profit},
            {"total_loss", metrics.total_loss},
            {"profit_factor", optionalToJson(metrics.profit_factor)},
            {"average_pnl", metrics.average_pnl},
            {"expectancy", metrics.expectancy},
            {"max_drawdown", metrics.max_drawdown},
            {"net_pnl", metrics.net_pnl},
            {"net_profit", optionalToJson(metrics.net_profit)},
            {"net_profit_rate", optionalToJson(metrics.net_profit_rate)},
            {"max_drawdown_amount", optionalToJson(metrics.max_drawdown_amount)},
            {"max_drawdown_rate", optionalToJson(metrics.max_drawdown_rate)},
            {"average_win", metrics.average_win},
            {"average_loss", metrics.average_loss},
            {"risk_reward_ratio", optionalToJson(metrics.risk_reward_ratio)},
            {"max_consecutive_wins", metrics.max_consecutive_wins},
            {"max_consecutive_losses", metrics.max_consecutive_losses},
            {"sharpe_ratio", optionalToJson(metrics.sharpe_ratio)},
            {"sortino_ratio", optionalToJson(metrics.sortino_ratio)},
            {"confidence_level", metrics.confidence_level}
        };
    }

    json toJson(const BacktestResult& result) {
        json trades = json::array();
        for (const auto& trade : result.trades) {
            trades.push_back(toJson(trade));
        }

        const auto& config = result.config;
        json max_holding = config.exit_settings.max_holding_minutes
            ? json(*config.exit_settings.max_holding_minutes)
            : json(nullptr);

        json capital = nullptr;
        if (config.capital) {
            capital = json{
                {"initial_capital", config.capital->initial_capital},
                {"lot_size", config.capital->lot_size},
                {"leverage", config.capital->leverage},
                {"bankruptcy_ratio", config.capital->bankruptcy_ratio}
            };
        }

        return json{
            {"strategy_name", result.strategy_name},
            {"config", {
                {"start_time", core::utils::timestampToString(config.start_time)},
                {"end_time", core::utils::timestampToString(config.end_time)},
                {"timeframe", core::utils::timeframeToString(config.timeframe)},
                {"entry_timing", entryTimingToString(config.entry_timing)},
                {"side", core::utils::sideToString(config.side)},
                {"take_profit", {
                    {"value", config.exit_settings.take_profit.value},
                    {"unit", strategy_engine::exitUnitToString(config.exit_settings.take_profit.unit)}
                }},
                {"stop_loss", {
                    {"value", config.exit_settings.stop_loss.value},
                    {"unit", strategy_engine::exitUnitToString(config.exit_settings.stop_loss.unit)}
                }},
                {"max_holding_minutes", max_holding},
                {"trading_cost_pct", config.trading_cost_pct},
                {"capital", capital}
            }},
            {"summary", toJson(result.metrics)},
            {"bars_in_range", result.bars_in_range},
            {"bars_scanned", result.bars_scanned},
            {"first_scanned_index", result.first_scanned_index},
            {"max_lookback", result.max_lookback},
            {"signal_count", result.signal_count},
            {"ignored_signal_count", result.ignored_signal_count},
            {"dropped_signal_count", result.dropped_signal_count},
            {"open_position_discarded", result.open_position_discarded},
            {"indicator_computations", result.indicator_computations},
            {"stop_reason", stopReasonToString(result.stop_reason)},
            {"final_capital", optionalToJson(result.final_capital)},
            {"trades", trades}
        };
    }

} // namespace backtester
