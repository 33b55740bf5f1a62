#pragma once

#include <optional>
#include <string>
#include <nlohmann/json.hpp>

#include "datatypes.hpp"
#include "backtest_config.hpp"

namespace backtester {

    using json = nlohmann::json;

    // One command-line backtest: where the bars come from, the range, and the strategy document
    struct RunRequest {
        std::string database;   // May be empty when SBE_DATABASE supplies it
        std::string symbol;
        core::Timeframe timeframe = core::Timeframe::H1;
        core::Timestamp start_time;
        core::Timestamp end_time; // A date-only end_date covers the whole day
        EntryTiming entry_timing = EntryTiming::NextBarOpen;
        std::optional<CapitalSettings> capital;
        json strategy;

        // Range, timing and capital for Backtester::run; the strategy supplies the rest
        BacktestConfig toConfig() const;
    };

    // Throws core::ConfigException. A relative strategy_file is resolved against base_dir.
    RunRequest parseRunRequest(const json& config, const std::string& base_dir = "");

    // Read and parse a request file. Throws core::ConfigException.
    RunRequest loadRunRequest(const std::string& path);

    // Read a JSON document from disk. Throws core::ConfigException.
    json loadJsonFile(const std::string& path);

} // namespace backtester
