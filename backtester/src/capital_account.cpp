#include "capital_account.hpp"
#include "logging.hpp"
#include <stdexcept>

namespace backtester {

    std::string stopReasonToString(StopReason reason) {
        switch (reason) {
            case StopReason::Completed:  return "completed";
            case StopReason::Bankruptcy: return "bankruptcy";
        }
        return "completed";
    }

    CapitalAccount::CapitalAccount(const CapitalSettings& settings)
        : settings_(settings),
          capital_(settings.initial_capital),
          threshold_(settings.initial_capital * settings.bankruptcy_ratio)
    {
        if (settings_.initial_capital <= 0) {
            throw std::invalid_argument("Initial capital must be positive.");
        }
    }

    bool CapitalAccount::applyTrade(const BacktestTradeEvent& trade) {
        capital_ += trade.pnl_amount.value_or(0.0);
        core::logging::getLogger()->debug("Capital after trade #{}: {:.2f} ({:.2f}% of initial)",
            trade.sequence, capital_, capital_ / settings_.initial_capital * 100.0);

        if (isBankrupt()) {
            core::logging::getLogger()->warn("Bankruptcy: capital {:.2f} is at or below {:.2f} ({:.0f}% of initial {:.2f}).",
                capital_, threshold_, settings_.bankruptcy_ratio * 100.0, settings_.initial_capital);
            return true;
        }
        return false;
    }

} // namespace backtester
