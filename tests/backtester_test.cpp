#include <gtest/gtest.h>

#include <algorithm>
#include <chrono>
#include <optional>
#include <utility>

#include <nlohmann/json.hpp>

#include "backtester.hpp"
#include "exceptions.hpp"
#include "strategy_factory.hpp"
#include "test_helpers.hpp"

using namespace backtester;
using strategy_engine::ComparisonOp;
using strategy_engine::ConditionTree;
using test_helpers::addCloseCondition;
using test_helpers::makeBar;

namespace {

    BacktestConfig configFor(const core::TimeSeries<core::Candle>& bars, double tp, double sl,
                             std::optional<int> max_hold, double cost) {
        BacktestConfig config;
        config.start_time = bars.front().timestamp;
        config.end_time = bars.back().timestamp;
        config.timeframe = core::Timeframe::H1;
        config.exit_settings.take_profit.value = tp;
        config.exit_settings.stop_loss.value = sl;
        config.exit_settings.max_holding_minutes = max_hold;
        config.trading_cost_pct = cost;
        return config;
    }

    // Signal whenever the close dips below 60
    ConditionTree dipTree() {
        ConditionTree tree;
        tree.setRoot(addCloseCondition(tree, ComparisonOp::LT, 60.0));
        return tree;
    }

    core::Candle flat(std::size_t index, double price) {
        return makeBar(index, price, price, price, price);
    }

    // Open/high at 100 but closing at 50: a signal bar that cannot touch a 60% stop
    core::Candle dip(std::size_t index) {
        return makeBar(index, 100.0, 100.0, 50.0, 50.0);
    }

} // namespace

TEST(BacktesterTest, EntersAtNextBarOpen) {
    core::TimeSeries<core::Candle> bars;
    for (std::size_t i = 0; i < 10; ++i) bars.push_back(flat(i, 100.0));
    bars[3] = dip(3);
    bars[4] = makeBar(4, 101.0, 101.0, 101.0, 101.0);
    bars[5] = makeBar(5, 101.0, 110.0, 101.0, 105.0);

    const Backtester tester;
    const BacktestResult result = tester.run(dipTree(), bars, configFor(bars, 5.0, 60.0, std::nullopt, 0.1));

    ASSERT_EQ(result.trades.size(), 1u);
    const BacktestTradeEvent& trade = result.trades.front();
    EXPECT_EQ(trade.signal_index, 3u);
    EXPECT_EQ(trade.entry_index, 4u);
    EXPECT_EQ(trade.entry_time, bars[4].timestamp);
    EXPECT_DOUBLE_EQ(trade.entry_price, 101.0);
    EXPECT_EQ(trade.exit_index, 5u);
    EXPECT_EQ(trade.exit_reason, ExitReason::TakeProfit);
    EXPECT_NEAR(trade.exit_price, 106.05, 1e-9);
    EXPECT_NEAR(trade.gross_pnl_pct, 5.0, 1e-9);
    EXPECT_NEAR(trade.pnl_pct, 4.9, 1e-9);

    EXPECT_EQ(result.signal_count, 1);
    EXPECT_EQ(result.bars_in_range, 10u);
    EXPECT_EQ(result.bars_scanned, 10u);
    EXPECT_EQ(result.max_lookback, 0);
    EXPECT_FALSE(result.open_position_discarded);
    EXPECT_EQ(result.metrics.total_trades, 1);
}

TEST(BacktesterTest, OnePositionAtATime) {
    core::TimeSeries<core::Candle> bars;
    for (std::size_t i = 0; i < 12; ++i) bars.push_back(flat(i, 100.0));
    bars[2] = dip(2);
    bars[3] = dip(3);
    bars[8] = dip(8);

    const BacktestResult result =
        Backtester().run(dipTree(), bars, configFor(bars, 60.0, 60.0, 180, 0.1));

    // Bar 2 enters at bar 3, bar 3 is ignored, the 3-hour timeout closes at bar 6,
    // bar 8 enters at bar 9 and is still open when the range ends
    EXPECT_EQ(result.signal_count, 3);
    EXPECT_EQ(result.ignored_signal_count, 1);
    EXPECT_EQ(result.dropped_signal_count, 0);
    ASSERT_EQ(result.trades.size(), 1u);
    EXPECT_EQ(result.trades[0].entry_index, 3u);
    EXPECT_EQ(result.trades[0].exit_index, 6u);
    EXPECT_EQ(result.trades[0].exit_reason, ExitReason::Timeout);
    EXPECT_NEAR(result.trades[0].pnl_pct, -0.1, 1e-9);
    EXPECT_TRUE(result.open_position_discarded);
    EXPECT_EQ(result.metrics.losing_trades, 1);
    EXPECT_EQ(result.metrics.timeout_count, 1);
}

TEST(BacktesterTest, SignalOnLastBarIsDropped) {
    core::TimeSeries<core::Candle> bars;
    for (std::size_t i = 0; i < 6; ++i) bars.push_back(flat(i, 100.0));
    bars[5] = dip(5);

    const BacktestResult result = Backtester().run(dipTree(), bars, configFor(bars, 2.0, 1.0, std::nullopt, 0.0));
    EXPECT_EQ(result.signal_count, 1);
    EXPECT_EQ(result.dropped_signal_count, 1);
    EXPECT_TRUE(result.trades.empty());
    EXPECT_FALSE(result.open_position_discarded);
}

TEST(BacktesterTest, RangeEndBoundsEntriesButWarmUpUsesEarlierBars) {
    core::TimeSeries<core::Candle> bars;
    for (std::size_t i = 0; i < 40; ++i) bars.push_back(flat(i, 100.0 + static_cast<double>(i % 5)));

    ConditionTree tree;
    strategy_engine::IndicatorCondition condition;
    condition.left = test_helpers::indicatorRef(indicators::IndicatorKind::Sma, 20);
    condition.op = ComparisonOp::GT;
    condition.right = 0.0;
    tree.setRoot(tree.addCondition(condition));

    BacktestConfig config = configFor(bars, 50.0, 50.0, std::nullopt, 0.0);
    config.start_time = bars[25].timestamp;
    config.end_time = bars[30].timestamp;

    const BacktestResult result = Backtester().run(tree, bars, config);
    EXPECT_EQ(result.max_lookback, 19);
    EXPECT_EQ(result.first_scanned_index, 25u);
    EXPECT_EQ(result.bars_in_range, 6u);
    EXPECT_EQ(result.bars_scanned, 6u);
    // Every bar signals; the position opened at bar 26 never exits, so the rest are ignored
    EXPECT_EQ(result.signal_count, 6);
    EXPECT_EQ(result.ignored_signal_count, 5);
    EXPECT_EQ(result.dropped_signal_count, 0);
    EXPECT_TRUE(result.trades.empty());
    EXPECT_TRUE(result.open_position_discarded);
}

TEST(BacktesterTest, WarmUpDelaysFirstScannedBar) {
    core::TimeSeries<core::Candle> bars;
    for (std::size_t i = 0; i < 30; ++i) bars.push_back(flat(i, 100.0));

    ConditionTree tree;
    strategy_engine::IndicatorCondition condition;
    condition.left = test_helpers::indicatorRef(indicators::IndicatorKind::Rsi, 14);
    condition.op = ComparisonOp::LT;
    condition.right = 30.0;
    tree.setRoot(tree.addCondition(condition));

    const BacktestResult result = Backtester().run(tree, bars, configFor(bars, 2.0, 1.0, std::nullopt, 0.0));
    EXPECT_EQ(result.first_scanned_index, 14u);
    EXPECT_EQ(result.bars_scanned, 16u);
    EXPECT_EQ(result.indicator_computations, 1u);
}

TEST(BacktesterTest, RejectsInvalidConfiguration) {
    core::TimeSeries<core::Candle> bars;
    for (std::size_t i = 0; i < 5; ++i) bars.push_back(flat(i, 100.0));
    const Backtester tester;
    const ConditionTree tree = dipTree();

    EXPECT_THROW(tester.run(tree, {}, configFor(bars, 2.0, 1.0, std::nullopt, 0.0)), core::BacktestException);

    EXPECT_THROW(tester.run(tree, bars, configFor(bars, 0.0, 1.0, std::nullopt, 0.0)), core::BacktestException);
    EXPECT_THROW(tester.run(tree, bars, configFor(bars, 2.0, -1.0, std::nullopt, 0.0)), core::BacktestException);
    EXPECT_THROW(tester.run(tree, bars, configFor(bars, 2.0, 1.0, 0, 0.0)), core::BacktestException);
    EXPECT_THROW(tester.run(tree, bars, configFor(bars, 2.0, 1.0, std::nullopt, -0.5)), core::BacktestException);

    BacktestConfig reversed = configFor(bars, 2.0, 1.0, std::nullopt, 0.0);
    std::swap(reversed.start_time, reversed.end_time);
    EXPECT_THROW(tester.run(tree, bars, reversed), core::BacktestException);

    BacktestConfig outside = configFor(bars, 2.0, 1.0, std::nullopt, 0.0);
    outside.start_time = bars.back().timestamp + std::chrono::hours(1);
    outside.end_time = bars.back().timestamp + std::chrono::hours(5);
    EXPECT_THROW(tester.run(tree, bars, outside), core::BacktestException);

    auto unsorted = bars;
    std::swap(unsorted[1], unsorted[2]);
    EXPECT_THROW(tester.run(tree, unsorted, configFor(bars, 2.0, 1.0, std::nullopt, 0.0)), core::BacktestException);

    auto duplicated = bars;
    duplicated[2].timestamp = duplicated[1].timestamp;
    EXPECT_THROW(tester.run(tree, duplicated, configFor(bars, 2.0, 1.0, std::nullopt, 0.0)), core::BacktestException);
}

TEST(BacktesterTest, OutOfRangeIndicatorPeriodNeverSignals) {
    core::TimeSeries<core::Candle> bars;
    for (std::size_t i = 0; i < 30; ++i) bars.push_back(dip(i));

    ConditionTree tree;
    strategy_engine::IndicatorCondition condition;
    condition.left = test_helpers::indicatorRef(indicators::IndicatorKind::Rsi, 200000);
    condition.op = ComparisonOp::LT;
    condition.right = 30.0;
    tree.setRoot(tree.addCondition(condition));

    BacktestResult result;
    EXPECT_NO_THROW(result = Backtester().run(tree, bars, configFor(bars, 2.0, 1.0, std::nullopt, 0.0)));
    EXPECT_EQ(result.max_lookback, 0);
    EXPECT_EQ(result.bars_scanned, 30u);
    EXPECT_EQ(result.signal_count, 0);
    EXPECT_TRUE(result.trades.empty());
    EXPECT_EQ(result.indicator_computations, 0u);
}

TEST(BacktesterTest, BankruptcyStopsTheRun) {
    core::TimeSeries<core::Candle> bars;
    for (std::size_t i = 0; i < 14; ++i) bars.push_back(flat(i, 100.0));
    // Signals at 2, 6 and 10; entries at 3 and 7 fall through a 10% stop on their own bar
    bars[2] = dip(2);
    bars[3] = makeBar(3, 100.0, 100.0, 85.0, 100.0);
    bars[6] = dip(6);
    bars[7] = makeBar(7, 100.0, 100.0, 85.0, 100.0);
    bars[10] = dip(10);

    BacktestConfig config = configFor(bars, 50.0, 10.0, std::nullopt, 0.0);
    CapitalSettings capital;
    capital.initial_capital = 1000.0;
    capital.lot_size = 10.0;
    capital.leverage = 10.0;
    capital.bankruptcy_ratio = 0.85;
    config.capital = capital;

    const BacktestResult result = Backtester().run(dipTree(), bars, config);

    EXPECT_EQ(result.stop_reason, StopReason::Bankruptcy);
    ASSERT_TRUE(result.final_capital.has_value());
    EXPECT_NEAR(*result.final_capital, 800.0, 1e-9);
    EXPECT_EQ(result.bars_scanned, 8u);
    EXPECT_EQ(result.signal_count, 2);
    ASSERT_EQ(result.trades.size(), 2u);

    const BacktestTradeEvent& last = result.trades.back();
    EXPECT_EQ(last.exit_reason, ExitReason::StopLoss);
    EXPECT_EQ(last.exit_index, 7u);
    ASSERT_TRUE(last.pnl_amount.has_value());
    EXPECT_NEAR(*last.pnl_amount, -100.0, 1e-9);
    ASSERT_TRUE(last.margin_return_pct.has_value());
    EXPECT_NEAR(*last.margin_return_pct, -100.0, 1e-9);
    EXPECT_EQ(last.lot_size, std::optional<double>(10.0));

    ASSERT_TRUE(result.metrics.net_profit.has_value());
    EXPECT_NEAR(*result.metrics.net_profit, -200.0, 1e-9);
    EXPECT_NEAR(*result.metrics.net_profit_rate, -0.2, 1e-12);
    EXPECT_NEAR(*result.metrics.max_drawdown_amount, 200.0, 1e-9);
    EXPECT_NEAR(*result.metrics.max_drawdown_rate, 0.2, 1e-12);
}

TEST(BacktesterTest, CapitalAboveThresholdCompletes) {
    core::TimeSeries<core::Candle> bars;
    for (std::size_t i = 0; i < 10; ++i) bars.push_back(flat(i, 100.0));
    bars[2] = dip(2);
    bars[3] = makeBar(3, 100.0, 105.0, 100.0, 100.0);

    BacktestConfig config = configFor(bars, 2.0, 10.0, std::nullopt, 0.1);
    CapitalSettings capital;
    capital.initial_capital = 10000.0;
    capital.lot_size = 100.0;
    config.capital = capital;

    const BacktestResult result = Backtester().run(dipTree(), bars, config);
    EXPECT_EQ(result.stop_reason, StopReason::Completed);
    EXPECT_EQ(result.bars_scanned, 10u);
    ASSERT_EQ(result.trades.size(), 1u);
    // 1.9% after cost on a notional of 100 * 100
    EXPECT_NEAR(*result.trades[0].pnl_amount, 190.0, 1e-6);
    EXPECT_NEAR(*result.trades[0].margin_return_pct, 1.9, 1e-9);
    EXPECT_NEAR(*result.final_capital, 10190.0, 1e-6);
    EXPECT_NEAR(*result.metrics.net_profit_rate, 0.019, 1e-9);
    EXPECT_NEAR(*result.metrics.max_drawdown_amount, 0.0, 1e-12);
}

TEST(BacktesterTest, NoCapitalModelLeavesCurrencyFiguresEmpty) {
    core::TimeSeries<core::Candle> bars;
    for (std::size_t i = 0; i < 6; ++i) bars.push_back(flat(i, 100.0));
    bars[1] = dip(1);
    bars[2] = makeBar(2, 100.0, 105.0, 100.0, 100.0);

    const BacktestResult result = Backtester().run(dipTree(), bars, configFor(bars, 2.0, 10.0, std::nullopt, 0.0));
    EXPECT_EQ(result.stop_reason, StopReason::Completed);
    EXPECT_FALSE(result.final_capital.has_value());
    ASSERT_EQ(result.trades.size(), 1u);
    EXPECT_FALSE(result.trades[0].pnl_amount.has_value());
    EXPECT_FALSE(result.metrics.net_profit.has_value());
    EXPECT_NEAR(result.metrics.net_pnl, 2.0, 1e-9);
}

TEST(BacktesterTest, RejectsInvalidCapitalSettings) {
    core::TimeSeries<core::Candle> bars;
    for (std::size_t i = 0; i < 5; ++i) bars.push_back(flat(i, 100.0));
    const Backtester tester;

    const auto withCapital = [&](double initial, double lot, double leverage, double ratio) {
        BacktestConfig config = configFor(bars, 2.0, 1.0, std::nullopt, 0.0);
        config.capital = CapitalSettings{initial, lot, leverage, ratio};
        return config;
    };
    EXPECT_THROW(tester.run(dipTree(), bars, withCapital(0.0, 10.0, 1.0, 0.5)), core::BacktestException);
    EXPECT_THROW(tester.run(dipTree(), bars, withCapital(1000.0, 0.0, 1.0, 0.5)), core::BacktestException);
    EXPECT_THROW(tester.run(dipTree(), bars, withCapital(1000.0, 10.0, 0.0, 0.5)), core::BacktestException);
    EXPECT_THROW(tester.run(dipTree(), bars, withCapital(1000.0, 10.0, 1.0, 1.0)), core::BacktestException);
    EXPECT_NO_THROW(tester.run(dipTree(), bars, withCapital(1000.0, 10.0, 1.0, 0.0)));
}

TEST(BacktesterTest, RsiDipStrategyEndToEnd) {
    // Cycles of 10 falling closes, 17 flat closes and a small uptick. The flat stretch keeps RSI
    // pinned low while SMA(20) converges on the close, so the uptick at bars 27, 55 and 83 crosses
    // the close above the SMA with RSI(14) well under 30.
    std::vector<double> closes;
    double price = 110.0;
    while (closes.size() < 100) {
        for (int k = 0; k < 10; ++k) closes.push_back(price -= 0.5);
        for (int k = 0; k < 17; ++k) closes.push_back(price);
        closes.push_back(price += 0.125);
    }
    closes.resize(100);

    core::TimeSeries<core::Candle> bars;
    for (std::size_t i = 0; i < closes.size(); ++i) {
        const double open = i == 0 ? closes[0] : closes[i - 1];
        bars.push_back(makeBar(i, open, std::max(open, closes[i]), std::min(open, closes[i]), closes[i]));
    }
    // Entry bars: 28 reaches take-profit, 56 the stop, 84 take-profit again
    bars[28].high = bars[28].open * 1.025;
    bars[56].low = bars[56].open * 0.985;
    bars[84].high = bars[84].open * 1.025;

    const auto strategy = strategy_engine::StrategyFactory::createStrategy(nlohmann::json::parse(R"({
        "strategy_name": "RSI Dip Above SMA",
        "entry_conditions": {
            "type": "Group",
            "operator": "AND",
            "conditions": [
                { "indicator": "rsi", "params": { "period": 14 }, "op": "<", "value": 30 },
                { "indicator": "sma", "params": { "period": 20 }, "op": "cross_below",
                  "target": { "type": "price", "price": "close" } }
            ]
        },
        "exit_settings": { "take_profit": 2.0, "stop_loss": 1.0, "max_holding_minutes": 1440 },
        "trading_cost_pct": 0.05
    })"));

    const Backtester tester;
    const BacktestResult first = tester.run(*strategy, bars, bars.front().timestamp, bars.back().timestamp,
                                            core::Timeframe::H1);
    const BacktestResult second = tester.run(*strategy, bars, bars.front().timestamp, bars.back().timestamp,
                                             core::Timeframe::H1);

    EXPECT_EQ(first.strategy_name, "RSI Dip Above SMA");
    EXPECT_EQ(first.max_lookback, 19);
    EXPECT_EQ(first.first_scanned_index, 19u);
    EXPECT_EQ(first.indicator_computations, 2u);

    EXPECT_EQ(first.signal_count, 3);
    EXPECT_EQ(first.ignored_signal_count, 0);
    EXPECT_EQ(first.dropped_signal_count, 0);
    EXPECT_FALSE(first.open_position_discarded);
    ASSERT_EQ(first.trades.size(), 3u);

    const std::size_t expected_signals[] = {27, 55, 83};
    const ExitReason expected_exits[] = {ExitReason::TakeProfit, ExitReason::StopLoss, ExitReason::TakeProfit};
    const double expected_pnl[] = {1.95, -1.05, 1.95};
    for (std::size_t t = 0; t < first.trades.size(); ++t) {
        const auto& trade = first.trades[t];
        EXPECT_EQ(trade.signal_index, expected_signals[t]);
        EXPECT_EQ(trade.entry_index, trade.signal_index + 1);
        EXPECT_DOUBLE_EQ(trade.entry_price, bars[trade.entry_index].open);
        EXPECT_EQ(trade.exit_index, trade.entry_index);
        EXPECT_EQ(trade.exit_reason, expected_exits[t]);
        EXPECT_NEAR(trade.pnl_pct, expected_pnl[t], 1e-9);
        EXPECT_NEAR(trade.pnl_pct, trade.gross_pnl_pct - 0.05, 1e-9);
    }

    const BacktestMetrics& m = first.metrics;
    EXPECT_EQ(m.total_trades, 3);
    EXPECT_EQ(m.winning_trades, 2);
    EXPECT_EQ(m.losing_trades, 1);
    EXPECT_EQ(m.winning_trades + m.losing_trades + m.breakeven_trades, m.total_trades);
    EXPECT_EQ(m.take_profit_count, 2);
    EXPECT_EQ(m.stop_loss_count, 1);
    EXPECT_EQ(m.timeout_count, 0);
    EXPECT_EQ(m.take_profit_count + m.stop_loss_count + m.timeout_count, m.total_trades);
    ASSERT_TRUE(m.profit_factor.has_value());
    EXPECT_NEAR(*m.profit_factor, m.total_profit / m.total_loss, 1e-9);
    EXPECT_NEAR(*m.profit_factor, 3.9 / 1.05, 1e-9);

    // Fresh cache and operator state per run: identical results
    ASSERT_EQ(second.trades.size(), first.trades.size());
    for (std::size_t t = 0; t < first.trades.size(); ++t) {
        EXPECT_EQ(second.trades[t].entry_index, first.trades[t].entry_index);
        EXPECT_EQ(second.trades[t].exit_index, first.trades[t].exit_index);
        EXPECT_DOUBLE_EQ(second.trades[t].pnl_pct, first.trades[t].pnl_pct);
    }
    EXPECT_EQ(second.signal_count, first.signal_count);
}

TEST(BacktesterTest, StrategyRunTakesRangeAndCapitalFromConfig) {
    core::TimeSeries<core::Candle> bars;
    for (std::size_t i = 0; i < 10; ++i) bars.push_back(flat(i, 100.0));
    bars[4] = dip(4);
    bars[5] = makeBar(5, 100.0, 104.0, 100.0, 100.0);

    const auto strategy = strategy_engine::StrategyFactory::createStrategy(nlohmann::json::parse(R"({
        "strategy_name": "Dip",
        "entry_conditions": { "indicator": "sma", "params": { "period": 1 }, "op": "<", "value": 60 },
        "exit_settings": { "take_profit": 3.0, "stop_loss": 5.0 }
    })"));

    BacktestConfig config;
    config.start_time = bars[2].timestamp;
    config.end_time = bars[9].timestamp;
    CapitalSettings capital;
    capital.initial_capital = 5000.0;
    capital.lot_size = 10.0;
    config.capital = capital;

    const BacktestResult result = Backtester().run(*strategy, bars, config);
    EXPECT_EQ(result.strategy_name, "Dip");
    EXPECT_EQ(result.bars_in_range, 8u);
    EXPECT_DOUBLE_EQ(result.config.exit_settings.take_profit.value, 3.0);
    ASSERT_EQ(result.trades.size(), 1u);
    EXPECT_NEAR(*result.final_capital, 5030.0, 1e-6);
}
