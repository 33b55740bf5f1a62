#pragma once

#include <nlohmann/json.hpp>

#include "backtester.hpp"

namespace backtester {

    using json = nlohmann::json;

    // Undefined ratios (profit factor, risk/reward, Sharpe, Sortino) are written as null
    json toJson(const BacktestTradeEvent& trade);
    json toJson(const BacktestMetrics& metrics);
    json toJson(const BacktestResult& result);

} // namespace backtester
