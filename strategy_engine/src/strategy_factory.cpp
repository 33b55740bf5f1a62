#include "strategy_factory.hpp"
#include "logging.hpp"            // Use short path
#include "exceptions.hpp"
#include "utils.hpp"
#include "common_types.hpp"
#include <spdlog/fmt/fmt.h>

#include <algorithm>
#include <cctype>
#include <stdexcept>              // For std::invalid_argument
#include <vector>
#include <string>
#include <memory>


namespace strategy_engine {

    using json = nlohmann::json; // Alias

    namespace { // Use anonymous namespace for file-local helpers

        bool equalsIgnoreCase(const std::string& a, const std::string& b) {
            return a.size() == b.size() &&
                   std::equal(a.begin(), a.end(), b.begin(), [](unsigned char x, unsigned char y) {
                       return std::tolower(x) == std::tolower(y);
                   });
        }

        std::string typeOf(const json& config) {
            if (config.contains("type") && config["type"].is_string()) {
                return config["type"].get<std::string>();
            }
            return "";
        }

        bool isGroupConfig(const json& config) {
            return equalsIgnoreCase(typeOf(config), "Group") || config.contains("operator");
        }

        bool isLeafConfig(const json& config) {
            return equalsIgnoreCase(typeOf(config), "Indicator") || config.contains("indicator");
        }

        // Integer parameter under its snake_case or camelCase name, 0 when absent (defaults apply later)
        int readIntParam(const json& params, const char* snake_name, const char* camel_name) {
            for (const char* key : {snake_name, camel_name}) {
                if (!params.contains(key)) continue;
                if (!params[key].is_number()) {
                    throw std::invalid_argument(fmt::format("Indicator parameter '{}' must be a number.", key));
                }
                return params[key].get<int>();
            }
            return 0;
        }

        int readBarWindow(const json& config, const char* key, int default_value) {
            if (!config.contains(key)) return default_value;
            if (!config[key].is_number_integer()) {
                throw std::invalid_argument(fmt::format("'{}' must be an integer.", key));
            }
            return config[key].get<int>();
        }

    } // end anonymous namespace


    IndicatorRef StrategyFactory::parseIndicatorRef(const json& config) {
        if (!config.contains("indicator") || !config["indicator"].is_string()) {
            throw std::invalid_argument("Indicator operand requires 'indicator' (string).");
        }

        IndicatorRef ref;
        ref.name = config["indicator"].get<std::string>();
        ref.key.kind = indicators::kindFromString(ref.name);

        if (config.contains("params")) {
            const json& params = config["params"];
            if (!params.is_object()) {
                throw std::invalid_argument("'params' must be an object.");
            }
            ref.key.params.period = readIntParam(params, "period", "period");
            ref.key.params.fast_period = readIntParam(params, "fast_period", "fastPeriod");
            ref.key.params.slow_period = readIntParam(params, "slow_period", "slowPeriod");
            ref.key.params.signal_period = readIntParam(params, "signal_period", "signalPeriod");
            for (const char* key : {"std_dev", "stdDev"}) {
                if (!params.contains(key)) continue;
                if (!params[key].is_number()) {
                    throw std::invalid_argument(fmt::format("Indicator parameter '{}' must be a number.", key));
                }
                ref.key.params.std_dev = params[key].get<double>();
                break;
            }
        }

        if (config.contains("field")) {
            if (!config["field"].is_string()) {
                throw std::invalid_argument("'field' must be a string.");
            }
            ref.key.field = indicators::fieldFromString(config["field"].get<std::string>());
        }
        return ref;
    }

    IndicatorCondition StrategyFactory::parseLeaf(const json& config) {
        if (!config.contains("op") || !config["op"].is_string()) {
            throw std::invalid_argument("Indicator condition requires 'op' (string).");
        }

        IndicatorCondition condition;
        condition.left = parseIndicatorRef(config);
        condition.op = stringToCompOp(config["op"].get<std::string>());

        if (config.contains("target")) {
            const json& target = config["target"];
            if (!target.is_object() || !target.contains("type") || !target["type"].is_string()) {
                throw std::invalid_argument("'target' must be an object with a 'type' (string).");
            }
            std::string target_type = target["type"].get<std::string>();
            if (equalsIgnoreCase(target_type, "fixed") || equalsIgnoreCase(target_type, "value")) {
                if (!target.contains("value") || !target["value"].is_number()) {
                    throw std::invalid_argument("Fixed target requires 'value' (number).");
                }
                condition.right = target["value"].get<double>();
            } else if (equalsIgnoreCase(target_type, "indicator")) {
                condition.right = parseIndicatorRef(target);
            } else if (equalsIgnoreCase(target_type, "price")) {
                PriceField field = PriceField::Close;
                if (target.contains("price")) {
                    if (!target["price"].is_string()) {
                        throw std::invalid_argument("Price target 'price' must be a string.");
                    }
                    field = stringToPriceField(target["price"].get<std::string>());
                }
                condition.right = field;
            } else {
                throw std::invalid_argument(fmt::format("Unknown target type '{}'.", target_type));
            }
        } else if (config.contains("value") && config["value"].is_number()) {
            condition.right = config["value"].get<double>();
        } else {
            throw std::invalid_argument("Indicator condition requires a 'target' object or a numeric 'value'.");
        }
        return condition;
    }

    // --- Recursive Helper to Parse Conditions ---
    NodeId StrategyFactory::parseCondition(const json& config, ConditionTree& tree) {
        if (!config.is_object()) {
            throw std::invalid_argument("Condition config must be a JSON object.");
        }
        auto logger = core::logging::getLogger();

        if (isGroupConfig(config)) {
            if (!config.contains("operator") || !config["operator"].is_string()) {
                throw std::invalid_argument("Group condition requires 'operator' (string).");
            }
            ConditionGroup group;
            group.op = stringToLogicalOp(config["operator"].get<std::string>());
            logger->trace("Parsing {} group", logicalOpToString(group.op));

            auto parseList = [&tree](const json& list, const char* key) {
                if (!list.is_array()) {
                    throw std::invalid_argument(fmt::format("'{}' must be an array.", key));
                }
                std::vector<NodeId> ids;
                ids.reserve(list.size());
                for (const auto& sub_conf : list) {
                    ids.push_back(parseCondition(sub_conf, tree)); // Recursive call
                }
                return ids;
            };

            switch (group.op) {
                case LogicalOp::And:
                case LogicalOp::Or:
                case LogicalOp::Not:
                    if (config.contains("conditions")) {
                        group.children = parseList(config["conditions"], "conditions");
                    }
                    break;
                case LogicalOp::IfThen:
                    if (config.contains("if")) {
                        group.trigger = parseCondition(config["if"], tree);
                    } else if (config.contains("conditions") && config["conditions"].is_array() &&
                               !config["conditions"].empty()) {
                        group.trigger = parseCondition(config["conditions"][0], tree);
                    }
                    if (config.contains("then")) {
                        group.confirm = parseCondition(config["then"], tree);
                    } else if (config.contains("conditions") && config["conditions"].is_array() &&
                               config["conditions"].size() > 1) {
                        group.confirm = parseCondition(config["conditions"][1], tree);
                    }
                    group.max_bars_to_wait = readBarWindow(config, "max_bars_to_wait", 5);
                    break;
                case LogicalOp::Sequence:
                    if (config.contains("steps")) {
                        group.steps = parseList(config["steps"], "steps");
                    } else if (config.contains("conditions")) {
                        group.steps = parseList(config["conditions"], "conditions");
                    }
                    group.max_bars_between_steps = readBarWindow(config, "max_bars_between_steps", 10);
                    break;
            }
            return tree.addGroup(std::move(group));
        }

        if (isLeafConfig(config)) {
            return tree.addCondition(parseLeaf(config));
        }

        throw std::invalid_argument(fmt::format("Unknown condition type '{}' in config.", typeOf(config)));
    }

    ConditionTree StrategyFactory::parseConditionTree(const json& config) {
        try {
            ConditionTree tree;
            tree.setRoot(parseCondition(config, tree));
            return tree;
        } catch (const json::exception& e) {
            throw core::StrategyException(fmt::format("Invalid JSON structure for condition: {}", e.what()));
        } catch (const std::invalid_argument& e) {
            throw core::StrategyException(fmt::format("Invalid condition: {}", e.what()));
        }
    }

    ExitLevel StrategyFactory::parseExitLevel(const json& config, const char* name) {
        ExitLevel level;
        if (config.is_number()) {
            level.value = config.get<double>();
            return level;
        }
        if (!config.is_object() || !config.contains("value") || !config["value"].is_number()) {
            throw std::invalid_argument(fmt::format("'{}' must be a number or an object with 'value' (number).", name));
        }
        level.value = config["value"].get<double>();
        if (config.contains("unit")) {
            level.unit = stringToExitUnit(config["unit"].get<std::string>());
        }
        if (config.contains("pip_size")) {
            if (!config["pip_size"].is_number() || config["pip_size"].get<double>() <= 0.0) {
                throw std::invalid_argument(fmt::format("'{}.pip_size' must be a positive number.", name));
            }
            level.pip_size = config["pip_size"].get<double>();
        }
        return level;
    }

    ExitSettings StrategyFactory::parseExitSettings(const json& config) {
        try {
            if (!config.is_object()) throw std::invalid_argument("'exit_settings' must be a JSON object.");
            if (!config.contains("take_profit")) throw std::invalid_argument("'exit_settings' missing 'take_profit'.");
            if (!config.contains("stop_loss")) throw std::invalid_argument("'exit_settings' missing 'stop_loss'.");

            ExitSettings settings;
            settings.take_profit = parseExitLevel(config["take_profit"], "take_profit");
            settings.stop_loss = parseExitLevel(config["stop_loss"], "stop_loss");
            if (config.contains("max_holding_minutes") && !config["max_holding_minutes"].is_null()) {
                if (!config["max_holding_minutes"].is_number_integer()) {
                    throw std::invalid_argument("'max_holding_minutes' must be an integer.");
                }
                settings.max_holding_minutes = config["max_holding_minutes"].get<int>();
            }
            return settings;
        } catch (const json::exception& e) {
            throw core::StrategyException(fmt::format("Invalid JSON structure for exit settings: {}", e.what()));
        } catch (const std::invalid_argument& e) {
            throw core::StrategyException(fmt::format("Invalid exit settings: {}", e.what()));
        }
    }

    // --- Main Factory Method ---
    std::unique_ptr<Strategy> StrategyFactory::createStrategy(const json& config) {
        auto logger = core::logging::getLogger();
        logger->info("Attempting to create strategy from JSON config...");

        try {
            // --- Basic Validation ---
            if (!config.is_object()) throw std::invalid_argument("Config must be JSON object.");
            if (!config.contains("strategy_name") || !config["strategy_name"].is_string()) throw std::invalid_argument("Config missing 'strategy_name'.");
            std::string name = config["strategy_name"].get<std::string>();

            core::TradeSide side = core::TradeSide::Buy;
            if (config.contains("side")) {
                side = core::utils::sideFromString(config["side"].get<std::string>());
            }

            if (!config.contains("entry_conditions") || !config["entry_conditions"].is_object()) throw std::invalid_argument("Config missing 'entry_conditions' object.");
            if (!config.contains("exit_settings")) throw std::invalid_argument("Config missing 'exit_settings' object.");

            double trading_cost_pct = 0.0;
            if (config.contains("trading_cost_pct")) {
                if (!config["trading_cost_pct"].is_number()) throw std::invalid_argument("'trading_cost_pct' must be a number.");
                trading_cost_pct = config["trading_cost_pct"].get<double>();
            }

            ConditionTree entry_conditions = parseConditionTree(config["entry_conditions"]);
            ExitSettings exit_settings = parseExitSettings(config["exit_settings"]);

            // --- Create Strategy Instance ---
            auto strategy = std::make_unique<Strategy>(name, side, std::move(entry_conditions),
                                                       std::move(exit_settings), trading_cost_pct);

            logger->info("Successfully created strategy: {}", strategy->describe());
            return strategy;

        } catch (const json::exception& e) {
            logger->error("JSON parsing error while creating strategy: {}", e.what());
            throw core::StrategyException(fmt::format("Invalid strategy JSON: {}", e.what()));
        } catch (const std::invalid_argument& e) {
            logger->error("Invalid strategy configuration: {}", e.what());
            throw core::StrategyException(e.what());
        } catch (const core::StrategyException& e) {
            logger->error("Invalid strategy definition: {}", e.what());
            throw;
        }
    }

} // namespace strategy_engine
