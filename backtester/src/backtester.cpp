#include "backtester.hpp"
#include "indicator_cache.hpp"
#include "evaluation_state.hpp"
#include "group_evaluator.hpp"
#include "logging.hpp"
#include "utils.hpp"
#include "exceptions.hpp"

#include <algorithm>
#include <optional>
#include <string>

namespace backtester {

    BacktestResult Backtester::run(const strategy_engine::Strategy& strategy,
                                   const core::TimeSeries<core::Candle>& bars,
                                   const core::Timestamp& start_time,
                                   const core::Timestamp& end_time,
                                   core::Timeframe timeframe) const
    {
        BacktestConfig config;
        config.start_time = start_time;
        config.end_time = end_time;
        config.timeframe = timeframe;
        return run(strategy, bars, config);
    }

    BacktestResult Backtester::run(const strategy_engine::Strategy& strategy,
                                   const core::TimeSeries<core::Candle>& bars,
                                   BacktestConfig config) const
    {
        config.side = strategy.getSide();
        config.exit_settings = strategy.getExitSettings();
        config.trading_cost_pct = strategy.getTradingCostPct();

        core::logging::getLogger()->info("Strategy: {}", strategy.describe());
        BacktestResult result = run(strategy.getEntryConditions(), bars, config);
        result.strategy_name = strategy.getName();
        return result;
    }

    BacktestResult Backtester::run(const strategy_engine::ConditionTree& entry_conditions,
                                   const core::TimeSeries<core::Candle>& bars,
                                   const BacktestConfig& config) const
    {
        auto logger = core::logging::getLogger();
        logger->info("========================================================");
        logger->info("Starting Backtest Run");
        logger->info("========================================================");
        logger->info("Period: {} to {} ({}), Side: {}",
                     core::utils::timestampToString(config.start_time),
                     core::utils::timestampToString(config.end_time),
                     core::utils::timeframeToString(config.timeframe),
                     core::utils::sideToString(config.side));
        logger->info("Entry Conditions: {}", entry_conditions.describe());

        try {
            config.validate(bars);
        } catch (const core::BacktestException& e) {
            logger->error("Backtest rejected: {}", e.what());
            throw;
        }

        const BarRange range = findBarRange(bars, config.start_time, config.end_time);

        BacktestResult result;
        result.config = config;
        result.bars_in_range = range.last - range.first + 1;

        // Fresh per-run state: the cache and the operator state are never shared between runs
        indicators::IndicatorCache cache(bars);
        strategy_engine::EvaluationState state(entry_conditions);
        state.reset();
        const strategy_engine::ConditionGroupEvaluator evaluator(entry_conditions);

        // --- Determine Maximum Lookback ---
        int max_lookback = 0;
        for (const auto& key : entry_conditions.collectIndicatorKeys()) {
            if (auto lookback = cache.lookback(key)) {
                max_lookback = std::max(max_lookback, *lookback);
            }
        }
        result.max_lookback = max_lookback;
        const std::size_t first_index = std::max(range.first, static_cast<std::size_t>(max_lookback));
        result.first_scanned_index = first_index;
        logger->info("Maximum indicator lookback period: {}", max_lookback);

        if (first_index > range.last) {
            logger->warn("Not enough history: warm-up of {} bars ends after the last bar in range (index {}).",
                         max_lookback, range.last);
        }

        PositionTracker tracker(config.side, config.exit_settings, config.trading_cost_pct,
                                core::utils::timeframeToMinutes(config.timeframe));
        std::optional<CapitalAccount> account;
        if (config.capital) {
            tracker.setPositionSizing(config.capital->lot_size, config.capital->leverage);
            account.emplace(*config.capital);
            logger->info("Capital: {:.2f}, Lot Size: {}, Leverage: {}, Bankruptcy at {:.0f}%",
                         config.capital->initial_capital, config.capital->lot_size, config.capital->leverage,
                         config.capital->bankruptcy_ratio * 100.0);
        }

        // --- Main Event Loop ---
        for (std::size_t i = first_index; i <= range.last; ++i) {
            const core::Candle& current_candle = bars[i];
            result.bars_scanned++;

            // --- 1. Exits for the open position ---
            const auto closed = tracker.checkExit(i, current_candle);
            if (closed && account && account->applyTrade(*closed)) {
                result.stop_reason = StopReason::Bankruptcy;
                logger->warn("Stopping at bar {} ({}): bankrupt.", i,
                             core::utils::timestampToString(current_candle.timestamp));
                break;
            }

            // --- 2. Evaluate entry conditions (every bar, so stateful operators see each one) ---
            strategy_engine::EvaluationContext context{bars, i, cache, state};
            const bool signal = evaluator.evaluate(context);
            if (!signal) {
                continue;
            }
            result.signal_count++;
            logger->debug("Time: {}, Entry signal at bar {}", core::utils::timestampToString(current_candle.timestamp), i);

            // --- 3. Entry at the next bar's open ---
            if (tracker.hasOpenPosition()) {
                result.ignored_signal_count++;
                logger->debug("Ignoring entry signal at bar {}: a position is already open.", i);
            } else if (i + 1 > range.last) {
                result.dropped_signal_count++;
                logger->debug("Dropping entry signal at bar {}: no next bar inside the range.", i);
            } else {
                tracker.open(i, i + 1, bars[i + 1]);
            }
        }

        if (tracker.hasOpenPosition()) {
            tracker.discardOpenPosition();
            result.open_position_discarded = true;
        }

        result.trades = tracker.getTradeLog();
        result.indicator_computations = cache.computationCount();
        std::optional<double> initial_capital;
        if (account) {
            result.final_capital = account->getCapital();
            initial_capital = account->getInitialCapital();
        }
        result.metrics = calculateMetrics(result.trades, initial_capital);
        result.metrics.logMetrics();

        logger->info("========================================================");
        logger->info("Backtest Run Completed ({}): {} bars scanned, {} signals, {} trades",
                     stopReasonToString(result.stop_reason), result.bars_scanned, result.signal_count,
                     result.trades.size());
        logger->info("========================================================");
        return result;
    }

} // namespace backtester
