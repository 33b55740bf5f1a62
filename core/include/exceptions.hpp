#pragma once

#include <stdexcept>
#include <string>

namespace core {

    class EngineException : public std::runtime_error {
    public:
        explicit EngineException(const std::string& message)
            : std::runtime_error(message) {}

        explicit EngineException(const char* message)
            : std::runtime_error(message) {}
    };

    // Specific exception types
    class ConfigException : public EngineException {
    public: using EngineException::EngineException; };

    class DataLoadException : public EngineException {
    public: using EngineException::EngineException; };

    class IndicatorCalculationException : public EngineException {
    public: using EngineException::EngineException; };

    // Structural errors in a strategy definition (raised while the tree is built, never per bar)
    class StrategyException : public EngineException {
    public: using EngineException::EngineException; };

    // Rejected backtest configuration, raised before the simulation loop starts
    class BacktestException : public EngineException {
    public: using EngineException::EngineException; };

} // namespace core
