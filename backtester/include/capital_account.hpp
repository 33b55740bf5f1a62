// backtester/include/capital_account.hpp
#pragma once

#include <string>

#include "backtest_config.hpp"
#include "position_tracker.hpp"

namespace backtester {

    enum class StopReason {
        Completed,  // Every bar in range was scanned
        Bankruptcy  // Capital fell to the bankruptcy threshold
    };

    std::string stopReasonToString(StopReason reason); // "completed", "bankruptcy"

    // Currency balance booked from closed trades
    class CapitalAccount {
    public:
        explicit CapitalAccount(const CapitalSettings& settings);

        // Add the trade's pnl_amount. Returns true once the balance is at or below the threshold.
        bool applyTrade(const BacktestTradeEvent& trade);

        double getCapital() const { return capital_; }
        double getInitialCapital() const { return settings_.initial_capital; }
        double getBankruptcyThreshold() const { return threshold_; }
        bool isBankrupt() const { return capital_ <= threshold_; }

    private:
        CapitalSettings settings_;
        double capital_;
        double threshold_;
    };

} // namespace backtester
