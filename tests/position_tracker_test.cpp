#include <gtest/gtest.h>

#include <optional>
#include <stdexcept>

#include "position_tracker.hpp"
#include "test_helpers.hpp"

using backtester::ExitReason;
using backtester::PositionTracker;
using strategy_engine::ExitLevel;
using strategy_engine::ExitSettings;
using strategy_engine::ExitUnit;
using test_helpers::makeBar;

namespace {

    ExitSettings percentExits(double tp, double sl, std::optional<int> max_hold = std::nullopt) {
        ExitSettings settings;
        settings.take_profit.value = tp;
        settings.stop_loss.value = sl;
        settings.max_holding_minutes = max_hold;
        return settings;
    }

} // namespace

TEST(PositionTrackerTest, LongTakeProfitAtLevelPrice) {
    PositionTracker tracker(core::TradeSide::Buy, percentExits(2.0, 1.0), 0.1, 60);
    tracker.open(3, 4, makeBar(4, 100.0, 100.5, 99.5, 100.2));
    ASSERT_TRUE(tracker.hasOpenPosition());
    EXPECT_DOUBLE_EQ(tracker.getOpenPosition()->take_profit_price, 102.0);
    EXPECT_DOUBLE_EQ(tracker.getOpenPosition()->stop_loss_price, 99.0);

    EXPECT_FALSE(tracker.checkExit(4, makeBar(4, 100.0, 100.5, 99.5, 100.2)).has_value());
    auto trade = tracker.checkExit(5, makeBar(5, 100.2, 103.0, 100.0, 102.5));
    ASSERT_TRUE(trade.has_value());
    EXPECT_EQ(trade->exit_reason, ExitReason::TakeProfit);
    EXPECT_DOUBLE_EQ(trade->exit_price, 102.0);
    EXPECT_NEAR(trade->gross_pnl_pct, 2.0, 1e-9);
    EXPECT_NEAR(trade->pnl_pct, 1.9, 1e-9);
    EXPECT_EQ(trade->bars_held, 1u);
    EXPECT_EQ(trade->sequence, 1);
    EXPECT_FALSE(tracker.hasOpenPosition());
}

TEST(PositionTrackerTest, TakeProfitWinsWhenBothLevelsAreTouched) {
    PositionTracker tracker(core::TradeSide::Buy, percentExits(1.0, 1.0), 0.0, 60);
    tracker.open(0, 1, makeBar(1, 100.0, 100.0, 100.0, 100.0));
    auto trade = tracker.checkExit(2, makeBar(2, 100.0, 105.0, 95.0, 100.0));
    ASSERT_TRUE(trade.has_value());
    EXPECT_EQ(trade->exit_reason, ExitReason::TakeProfit);
}

TEST(PositionTrackerTest, ShortStopLossIsMirrored) {
    PositionTracker tracker(core::TradeSide::Sell, percentExits(2.0, 1.0), 0.0, 60);
    tracker.open(0, 1, makeBar(1, 200.0, 200.0, 200.0, 200.0));
    EXPECT_DOUBLE_EQ(tracker.getOpenPosition()->take_profit_price, 196.0);
    EXPECT_DOUBLE_EQ(tracker.getOpenPosition()->stop_loss_price, 202.0);

    auto trade = tracker.checkExit(2, makeBar(2, 200.0, 203.0, 199.0, 202.5));
    ASSERT_TRUE(trade.has_value());
    EXPECT_EQ(trade->exit_reason, ExitReason::StopLoss);
    EXPECT_DOUBLE_EQ(trade->exit_price, 202.0);
    EXPECT_NEAR(trade->pnl_pct, -1.0, 1e-9);
}

TEST(PositionTrackerTest, TimeoutExitsAtClose) {
    PositionTracker tracker(core::TradeSide::Buy, percentExits(10.0, 10.0, 120), 0.0, 60);
    tracker.open(0, 1, makeBar(1, 100.0, 100.0, 100.0, 100.0));
    EXPECT_FALSE(tracker.checkExit(2, makeBar(2, 100.0, 101.0, 99.0, 100.5)).has_value());
    auto trade = tracker.checkExit(3, makeBar(3, 100.5, 101.0, 99.0, 100.8));
    ASSERT_TRUE(trade.has_value());
    EXPECT_EQ(trade->exit_reason, ExitReason::Timeout);
    EXPECT_DOUBLE_EQ(trade->exit_price, 100.8);
    EXPECT_EQ(trade->bars_held, 2u);
}

TEST(PositionTrackerTest, PipDistances) {
    ExitLevel pips;
    pips.value = 30.0;
    pips.unit = ExitUnit::Pips;
    EXPECT_NEAR(PositionTracker::levelDistance(pips, 1.1000), 0.0030, 1e-12);
    EXPECT_NEAR(PositionTracker::levelDistance(pips, 150.0), 0.30, 1e-12);

    pips.pip_size = 0.5;
    EXPECT_NEAR(PositionTracker::levelDistance(pips, 150.0), 15.0, 1e-12);

    ExitLevel percent;
    percent.value = 2.0;
    EXPECT_NEAR(PositionTracker::levelDistance(percent, 50.0), 1.0, 1e-12);
}

TEST(PositionTrackerTest, OnePositionAtATime) {
    PositionTracker tracker(core::TradeSide::Buy, percentExits(2.0, 1.0), 0.0, 60);
    tracker.open(0, 1, makeBar(1, 100.0, 100.0, 100.0, 100.0));
    EXPECT_THROW(tracker.open(1, 2, makeBar(2, 100.0, 100.0, 100.0, 100.0)), std::logic_error);

    tracker.discardOpenPosition();
    EXPECT_FALSE(tracker.hasOpenPosition());
    EXPECT_TRUE(tracker.getTradeLog().empty());
}

TEST(PositionTrackerTest, ShortTradeSizedInCurrency) {
    PositionTracker tracker(core::TradeSide::Sell, percentExits(2.0, 1.0), 0.0, 60);
    tracker.setPositionSizing(10000.0, 25.0);
    tracker.open(0, 1, makeBar(1, 150.0, 150.0, 150.0, 150.0));

    auto trade = tracker.checkExit(2, makeBar(2, 150.0, 152.0, 149.0, 151.0));
    ASSERT_TRUE(trade.has_value());
    EXPECT_EQ(trade->exit_reason, ExitReason::StopLoss);
    // 1.5 price units against 10000 units, margin 10000 * 150 / 25
    ASSERT_TRUE(trade->pnl_amount.has_value());
    EXPECT_NEAR(*trade->pnl_amount, -15000.0, 1e-6);
    EXPECT_NEAR(*trade->margin_return_pct, -25.0, 1e-9);
    EXPECT_EQ(trade->lot_size, std::optional<double>(10000.0));

    EXPECT_THROW(tracker.setPositionSizing(0.0, 1.0), std::invalid_argument);
}
