#include "run_request.hpp"
#include "exceptions.hpp"
#include "logging.hpp"
#include "utils.hpp"
#include <chrono>
#include <filesystem>
#include <fstream>
#include <stdexcept>
#include <spdlog/fmt/fmt.h>

namespace backtester {

    namespace {

        std::string requireString(const json& config, const char* key) {
            if (!config.contains(key) || !config[key].is_string() || config[key].get<std::string>().empty()) {
                throw core::ConfigException(fmt::format("Run request missing '{}' (non-empty string).", key));
            }
            return config[key].get<std::string>();
        }

        core::Timestamp parseDate(const std::string& value, const char* key) {
            try {
                return core::utils::stringToTimestamp(value);
            } catch (const std::runtime_error& e) {
                throw core::ConfigException(fmt::format("Invalid '{}': {}", key, e.what()));
            }
        }

        double readNumber(const json& config, const char* key, double fallback, bool required) {
            if (!config.contains(key)) {
                if (required) {
                    throw core::ConfigException(fmt::format("Capital settings missing '{}' (number).", key));
                }
                return fallback;
            }
            if (!config[key].is_number()) {
                throw core::ConfigException(fmt::format("Capital setting '{}' must be a number.", key));
            }
            return config[key].get<double>();
        }

        CapitalSettings parseCapital(const json& config) {
            if (!config.is_object()) {
                throw core::ConfigException("Run request 'capital' must be an object.");
            }
            CapitalSettings capital;
            capital.initial_capital = readNumber(config, "initial_capital", 0.0, true);
            capital.lot_size = readNumber(config, "lot_size", 0.0, true);
            capital.leverage = readNumber(config, "leverage", capital.leverage, false);
            capital.bankruptcy_ratio = readNumber(config, "bankruptcy_ratio", capital.bankruptcy_ratio, false);
            return capital;
        }

    } // end anonymous namespace

    BacktestConfig RunRequest::toConfig() const {
        BacktestConfig config;
        config.start_time = start_time;
        config.end_time = end_time;
        config.timeframe = timeframe;
        config.entry_timing = entry_timing;
        config.capital = capital;
        return config;
    }

    json loadJsonFile(const std::string& path) {
        std::ifstream ifs(path);
        if (!ifs.is_open()) {
            throw core::ConfigException(fmt::format("Failed to open JSON file: {}", path));
        }
        try {
            return json::parse(ifs);
        } catch (const json::parse_error& e) {
            throw core::ConfigException(fmt::format("Failed to parse JSON file '{}': {}", path, e.what()));
        }
    }

    RunRequest parseRunRequest(const json& config, const std::string& base_dir) {
        if (!config.is_object()) {
            throw core::ConfigException("Run request must be a JSON object.");
        }

        RunRequest request;
        if (config.contains("database")) {
            if (!config["database"].is_string()) {
                throw core::ConfigException("Run request 'database' must be a string.");
            }
            request.database = config["database"].get<std::string>();
        }
        request.symbol = requireString(config, "symbol");

        const std::string timeframe_str = requireString(config, "timeframe");
        try {
            request.timeframe = core::utils::timeframeFromString(timeframe_str);
        } catch (const std::invalid_argument& e) {
            throw core::ConfigException(e.what());
        }

        const std::string start_str = requireString(config, "start_date");
        const std::string end_str = requireString(config, "end_date");
        request.start_time = parseDate(start_str, "start_date");
        request.end_time = parseDate(end_str, "end_date");
        if (end_str.size() == 10) {
            // Inclusive end of a date-only range
            request.end_time += std::chrono::hours(24) - std::chrono::seconds(1);
        }
        if (request.end_time < request.start_time) {
            throw core::ConfigException(fmt::format("end_date {} is before start_date {}.", end_str, start_str));
        }

        if (config.contains("entry_timing")) {
            if (!config["entry_timing"].is_string()) {
                throw core::ConfigException("Run request 'entry_timing' must be a string.");
            }
            try {
                request.entry_timing = entryTimingFromString(config["entry_timing"].get<std::string>());
            } catch (const std::invalid_argument& e) {
                throw core::ConfigException(e.what());
            }
        }
        if (config.contains("capital")) {
            request.capital = parseCapital(config["capital"]);
        }

        if (config.contains("strategy")) {
            if (!config["strategy"].is_object()) {
                throw core::ConfigException("Run request 'strategy' must be an object.");
            }
            request.strategy = config["strategy"];
        } else if (config.contains("strategy_file")) {
            std::filesystem::path strategy_path(requireString(config, "strategy_file"));
            if (strategy_path.is_relative() && !base_dir.empty()) {
                strategy_path = std::filesystem::path(base_dir) / strategy_path;
            }
            request.strategy = loadJsonFile(strategy_path.string());
        } else {
            throw core::ConfigException("Run request requires 'strategy' (object) or 'strategy_file' (path).");
        }

        core::logging::getLogger()->debug("Run request parsed: {} {} from {} to {}",
                                          request.symbol, core::utils::timeframeToString(request.timeframe),
                                          core::utils::timestampToString(request.start_time),
                                          core::utils::timestampToString(request.end_time));
        return request;
    }

    RunRequest loadRunRequest(const std::string& path) {
        json config = loadJsonFile(path);
        return parseRunRequest(config, std::filesystem::path(path).parent_path().string());
    }

} // namespace backtester
