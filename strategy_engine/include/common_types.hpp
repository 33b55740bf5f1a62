#pragma once
#include "datatypes.hpp"     // Use short path (Provides core types)
#include <optional>
#include <string>

namespace strategy_engine {

    // Enum to specify which candle price field to use
    enum class PriceField {
        Open,
        High,
        Low,
        Close
    };

    // Enum for comparison types
    enum class ComparisonOp {
        LT,         // Less Than (<)
        LTE,        // Less Than or Equal To (<=)
        EQ,         // Equal within kEqualityTolerance (=)
        GTE,        // Greater Than or Equal To (>=)
        GT,         // Greater Than (>)
        CrossAbove, // previous left < previous right, current left > current right
        CrossBelow  // mirror of CrossAbove
    };

    // Operator tag of a condition group
    enum class LogicalOp {
        And,
        Or,
        Not,
        IfThen,
        Sequence
    };

    // Unit of a take-profit / stop-loss magnitude
    enum class ExitUnit {
        Percent, // percent of the entry price
        Pips     // multiples of the instrument's price increment
    };

    // Absolute tolerance used by ComparisonOp::EQ
    inline constexpr double kEqualityTolerance = 1e-4;

    struct ExitLevel {
        double value = 0.0;
        ExitUnit unit = ExitUnit::Percent;
        std::optional<double> pip_size; // Unset: derived from the entry price
    };

    struct ExitSettings {
        ExitLevel take_profit;
        ExitLevel stop_loss;
        std::optional<int> max_holding_minutes; // Unset: no timeout exit
    };

    // --- String helpers ---
    std::string priceFieldToString(PriceField field);
    PriceField stringToPriceField(const std::string& field_str);     // throws std::invalid_argument
    std::string compOpToString(ComparisonOp op);
    ComparisonOp stringToCompOp(const std::string& op_str);          // throws std::invalid_argument
    std::string logicalOpToString(LogicalOp op);
    LogicalOp stringToLogicalOp(const std::string& op_str);          // throws std::invalid_argument
    std::string exitUnitToString(ExitUnit unit);
    ExitUnit stringToExitUnit(const std::string& unit_str);          // throws std::invalid_argument

    double priceOf(const core::Candle& candle, PriceField field);

} // namespace strategy_engine
