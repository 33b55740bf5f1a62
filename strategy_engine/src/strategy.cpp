#include "strategy.hpp"
#include "exceptions.hpp"
#include "logging.hpp" // Use short path
#include "utils.hpp"
#include <utility>
#include <spdlog/fmt/fmt.h>

namespace strategy_engine {

Strategy::Strategy(std::string name,
                   core::TradeSide side,
                   ConditionTree entry_conditions,
                   ExitSettings exit_settings,
                   double trading_cost_pct)
    : name_(std::move(name)),
      side_(side),
      entry_conditions_(std::move(entry_conditions)),
      exit_settings_(std::move(exit_settings)),
      trading_cost_pct_(trading_cost_pct)
{
    if (name_.empty()) throw core::StrategyException("Strategy name cannot be empty.");
    if (!entry_conditions_.root()) throw core::StrategyException(fmt::format("Strategy '{}' has no entry conditions.", name_));
    if (trading_cost_pct_ < 0.0) throw core::StrategyException(fmt::format("Strategy '{}' has a negative trading cost.", name_));

    required_indicators_ = entry_conditions_.collectIndicatorKeys();
    core::logging::getLogger()->debug("Strategy '{}' created with {} condition nodes and {} indicator series.",
                                      name_, entry_conditions_.size(), required_indicators_.size());
}

std::string Strategy::describe() const {
    std::string max_hold = exit_settings_.max_holding_minutes
        ? fmt::format("{}m", *exit_settings_.max_holding_minutes)
        : std::string("none");
    return fmt::format("{} [{}] ENTRY {} | TP {} {} | SL {} {} | MAX HOLD {} | COST {}%",
                       name_, core::utils::sideToString(side_), entry_conditions_.describe(),
                       exit_settings_.take_profit.value, exitUnitToString(exit_settings_.take_profit.unit),
                       exit_settings_.stop_loss.value, exitUnitToString(exit_settings_.stop_loss.unit),
                       max_hold, trading_cost_pct_);
}

} // namespace strategy_engine
