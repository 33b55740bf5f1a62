// cli/src/main.cpp

// Standard includes
#include <iostream>
#include <string>
#include <exception>   // Needed for std::exception
#include <chrono>
#include <cstdlib>     // Needed for std::getenv
#include <memory>      // For std::shared_ptr

// Project includes
#include "logging.hpp"        // For logging functionality
#include "exceptions.hpp"     // For custom exception types
#include "datatypes.hpp"      // For core::Candle, core::Timestamp, etc.
#include "utils.hpp"          // For timestampToString/timeframe helpers
#include "database_manager.hpp" // Bar supply (SQLite based)
#include "strategy_factory.hpp"
#include "backtester.hpp"
#include "result_json.hpp"
#include "run_request.hpp"

#include <spdlog/spdlog.h>
#include <spdlog/logger.h>

namespace {

    // Bars loaded before start_date so indicators are warmed up when the range begins
    constexpr int kWarmupBars = 200;

    void printUsage(const char* program) {
        std::cerr << "Usage: " << program << " <run_request.json>\n"
                  << "  Environment: SBE_DATABASE overrides the request's database path,\n"
                  << "               SPDLOG_LEVEL sets the log level (trace|debug|info|warn|error|critical|off).\n";
    }

} // end anonymous namespace

int main(int argc, char* argv[]) {
    // Define logger pointer early in the main scope
    std::shared_ptr<spdlog::logger> logger = nullptr;

    if (argc != 2) {
        printUsage(argv[0]);
        return 1;
    }

    // Main try block for exception handling
    try {
        // --- Initialize Logging ---
        core::logging::initialize("strategy_backtest", spdlog::level::info, spdlog::level::debug);
        logger = core::logging::getLogger(); // Assign the initialized logger
        logger->info("Strategy backtest CLI starting...");

        // --- Load Run Request ---
        const std::string request_path = argv[1];
        logger->info("Loading run request from: {}", request_path);
        backtester::RunRequest request = backtester::loadRunRequest(request_path);

        const char* db_env = std::getenv("SBE_DATABASE");
        if (db_env && *db_env) {
            logger->info("Overriding database path from SBE_DATABASE environment variable: {}", db_env);
            request.database = db_env;
        }
        if (request.database.empty()) {
            throw core::ConfigException("No database path: set 'database' in the request or SBE_DATABASE.");
        }

        // --- Load Strategy ---
        auto strategy = strategy_engine::StrategyFactory::createStrategy(request.strategy);

        // --- Load Bars ---
        data::DatabaseManager db_manager(request.database);
        if (!db_manager.connect()) {
            throw core::DataLoadException("Failed to connect to database: " + request.database);
        }
        if (!db_manager.initializeSchema()) {
            throw core::DataLoadException("Failed to initialize database schema: " + request.database);
        }

        const std::string timeframe_str = core::utils::timeframeToString(request.timeframe);
        const core::Timestamp query_start = request.start_time -
            std::chrono::minutes(static_cast<long long>(kWarmupBars) * core::utils::timeframeToMinutes(request.timeframe));
        logger->info("Querying {} ({}) from {} (includes {} warm-up bars) to {}",
                     request.symbol, timeframe_str,
                     core::utils::timestampToString(query_start), kWarmupBars,
                     core::utils::timestampToString(request.end_time));
        core::TimeSeries<core::Candle> bars =
            db_manager.queryCandles(request.symbol, timeframe_str, query_start, request.end_time);
        db_manager.disconnect();
        logger->info("Loaded {} bars.", bars.size());

        // --- Run Backtest ---
        backtester::Backtester the_backtester;
        backtester::BacktestResult result = the_backtester.run(*strategy, bars, request.toConfig());

        nlohmann::json report = backtester::toJson(result);
        report["symbol"] = request.symbol;
        std::cout << report.dump(2) << std::endl;

        logger->info("Strategy backtest CLI finished.");

    // --- Exception Handling ---
    } catch (const core::EngineException& ex) {
        std::cerr << "Engine Error: " << ex.what() << std::endl;
        if (logger) logger->critical("Engine Error: {}", ex.what());
        return 1;
    } catch (const std::exception& ex) {
        std::cerr << "Standard Error: " << ex.what() << std::endl;
        if (logger) logger->critical("Standard Error: {}", ex.what());
        return 1;
    }

    // Success
    return 0;
}
