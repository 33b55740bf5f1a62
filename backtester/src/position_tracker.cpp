#include "position_tracker.hpp"
#include "logging.hpp"
#include "utils.hpp"
#include <stdexcept>
#include <utility>

namespace backtester {

    std::string exitReasonToString(ExitReason reason) {
        switch (reason) {
            case ExitReason::TakeProfit: return "take_profit";
            case ExitReason::StopLoss:   return "stop_loss";
            case ExitReason::Timeout:    return "timeout";
        }
        return "timeout";
    }

    PositionTracker::PositionTracker(core::TradeSide side,
                                     strategy_engine::ExitSettings exit_settings,
                                     double trading_cost_pct,
                                     int timeframe_minutes)
        : side_(side),
          exit_settings_(std::move(exit_settings)),
          trading_cost_pct_(trading_cost_pct),
          timeframe_minutes_(timeframe_minutes)
    {
        if (timeframe_minutes_ <= 0) {
            throw std::invalid_argument("Timeframe minutes must be positive.");
        }
    }

    void PositionTracker::setPositionSizing(double lot_size, double leverage) {
        if (!(lot_size > 0.0) || !(leverage > 0.0)) {
            throw std::invalid_argument("Lot size and leverage must be positive.");
        }
        lot_size_ = lot_size;
        leverage_ = leverage;
    }

    double PositionTracker::defaultPipSize(double entry_price) {
        // Quote conventions: large prices (JPY crosses, indices) move in 0.01, the rest in 0.0001
        return entry_price > 50.0 ? 0.01 : 0.0001;
    }

    double PositionTracker::levelDistance(const strategy_engine::ExitLevel& level, double entry_price) {
        if (level.unit == strategy_engine::ExitUnit::Pips) {
            const double pip = level.pip_size ? *level.pip_size : defaultPipSize(entry_price);
            return level.value * pip;
        }
        return entry_price * level.value / 100.0;
    }

    void PositionTracker::open(std::size_t signal_index, std::size_t entry_index, const core::Candle& entry_bar) {
        if (open_position_) {
            throw std::logic_error("Cannot open a position while another one is open.");
        }

        OpenPosition position;
        position.signal_index = signal_index;
        position.entry_index = entry_index;
        position.entry_time = entry_bar.timestamp;
        position.entry_price = entry_bar.open;

        const double tp_distance = levelDistance(exit_settings_.take_profit, position.entry_price);
        const double sl_distance = levelDistance(exit_settings_.stop_loss, position.entry_price);
        if (side_ == core::TradeSide::Buy) {
            position.take_profit_price = position.entry_price + tp_distance;
            position.stop_loss_price = position.entry_price - sl_distance;
        } else {
            position.take_profit_price = position.entry_price - tp_distance;
            position.stop_loss_price = position.entry_price + sl_distance;
        }

        core::logging::getLogger()->debug("Position opened: Side={}, Time={}, Entry={:.5f}, TP={:.5f}, SL={:.5f}",
            core::utils::sideToString(side_), core::utils::timestampToString(position.entry_time),
            position.entry_price, position.take_profit_price, position.stop_loss_price);
        open_position_ = position;
    }

    std::optional<BacktestTradeEvent> PositionTracker::checkExit(std::size_t index, const core::Candle& bar) {
        if (!open_position_ || index < open_position_->entry_index) {
            return std::nullopt;
        }
        const OpenPosition& position = *open_position_;
        const bool is_buy = side_ == core::TradeSide::Buy;

        const bool tp_hit = is_buy ? bar.high >= position.take_profit_price : bar.low <= position.take_profit_price;
        if (tp_hit) {
            return close(index, bar, position.take_profit_price, ExitReason::TakeProfit);
        }

        const bool sl_hit = is_buy ? bar.low <= position.stop_loss_price : bar.high >= position.stop_loss_price;
        if (sl_hit) {
            return close(index, bar, position.stop_loss_price, ExitReason::StopLoss);
        }

        if (exit_settings_.max_holding_minutes) {
            const long long held_minutes =
                static_cast<long long>(index - position.entry_index) * timeframe_minutes_;
            if (held_minutes >= *exit_settings_.max_holding_minutes) {
                return close(index, bar, bar.close, ExitReason::Timeout);
            }
        }
        return std::nullopt;
    }

    BacktestTradeEvent PositionTracker::close(std::size_t index, const core::Candle& bar, double exit_price, ExitReason reason) {
        const OpenPosition& position = *open_position_;

        BacktestTradeEvent trade;
        trade.sequence = static_cast<int>(trade_log_.size()) + 1;
        trade.signal_index = position.signal_index;
        trade.entry_index = position.entry_index;
        trade.exit_index = index;
        trade.entry_time = position.entry_time;
        trade.entry_price = position.entry_price;
        trade.exit_time = bar.timestamp;
        trade.exit_price = exit_price;
        trade.exit_reason = reason;
        trade.side = side_;
        trade.bars_held = index - position.entry_index;

        const double move_pct = (exit_price - position.entry_price) / position.entry_price * 100.0;
        trade.gross_pnl_pct = side_ == core::TradeSide::Buy ? move_pct : -move_pct;
        trade.pnl_pct = trade.gross_pnl_pct - trading_cost_pct_;

        if (lot_size_) {
            const double notional = *lot_size_ * position.entry_price;
            trade.lot_size = *lot_size_;
            trade.pnl_amount = notional * trade.pnl_pct / 100.0;
            trade.margin_return_pct = *trade.pnl_amount / (notional / leverage_) * 100.0;
        }

        core::logging::getLogger()->info("Trade #{} closed: Side={}, Entry={} @ {:.5f}, Exit={} @ {:.5f}, Reason={}, PnL={:.4f}%",
            trade.sequence, core::utils::sideToString(trade.side),
            core::utils::timestampToString(trade.entry_time), trade.entry_price,
            core::utils::timestampToString(trade.exit_time), trade.exit_price,
            exitReasonToString(trade.exit_reason), trade.pnl_pct);

        trade_log_.push_back(trade);
        open_position_.reset();
        return trade;
    }

    void PositionTracker::discardOpenPosition() {
        if (!open_position_) {
            return;
        }
        core::logging::getLogger()->info("Discarding position still open at end of range (entered {} @ {:.5f}).",
            core::utils::timestampToString(open_position_->entry_time), open_position_->entry_price);
        open_position_.reset();
    }

} // namespace backtester
