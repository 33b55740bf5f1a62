#include "common_types.hpp"
#include <algorithm>
#include <cctype>
#include <stdexcept>

namespace strategy_engine {

    namespace {

        std::string toLower(std::string value) {
            std::transform(value.begin(), value.end(), value.begin(),
                [](unsigned char c){ return static_cast<char>(std::tolower(c)); });
            return value;
        }

        std::string toUpper(std::string value) {
            std::transform(value.begin(), value.end(), value.begin(),
                [](unsigned char c){ return static_cast<char>(std::toupper(c)); });
            return value;
        }

    } // end anonymous namespace

    std::string priceFieldToString(PriceField field) {
        switch (field) {
            case PriceField::Open:  return "open";
            case PriceField::High:  return "high";
            case PriceField::Low:   return "low";
            case PriceField::Close: return "close";
        }
        return "close";
    }

    PriceField stringToPriceField(const std::string& field_str) {
        std::string lower_str = toLower(field_str);
        if (lower_str == "open") return PriceField::Open;
        if (lower_str == "high") return PriceField::High;
        if (lower_str == "low") return PriceField::Low;
        if (lower_str == "close") return PriceField::Close;
        throw std::invalid_argument("Unknown price field string: " + field_str);
    }

    std::string compOpToString(ComparisonOp op) {
        switch (op) {
            case ComparisonOp::LT:         return "<";
            case ComparisonOp::LTE:        return "<=";
            case ComparisonOp::EQ:         return "=";
            case ComparisonOp::GTE:        return ">=";
            case ComparisonOp::GT:         return ">";
            case ComparisonOp::CrossAbove: return "cross_above";
            case ComparisonOp::CrossBelow: return "cross_below";
        }
        return "?";
    }

    ComparisonOp stringToCompOp(const std::string& op_str) {
        if (op_str == ">" || op_str == "GT") return ComparisonOp::GT;
        if (op_str == "<" || op_str == "LT") return ComparisonOp::LT;
        if (op_str == ">=" || op_str == "GTE") return ComparisonOp::GTE;
        if (op_str == "<=" || op_str == "LTE") return ComparisonOp::LTE;
        if (op_str == "=" || op_str == "==" || op_str == "EQ") return ComparisonOp::EQ;
        std::string lower_str = toLower(op_str);
        if (lower_str == "cross_above" || lower_str == "crosses_above") return ComparisonOp::CrossAbove;
        if (lower_str == "cross_below" || lower_str == "crosses_below") return ComparisonOp::CrossBelow;
        throw std::invalid_argument("Unknown comparison operator string: " + op_str);
    }

    std::string logicalOpToString(LogicalOp op) {
        switch (op) {
            case LogicalOp::And:      return "AND";
            case LogicalOp::Or:       return "OR";
            case LogicalOp::Not:      return "NOT";
            case LogicalOp::IfThen:   return "IF_THEN";
            case LogicalOp::Sequence: return "SEQUENCE";
        }
        return "?";
    }

    LogicalOp stringToLogicalOp(const std::string& op_str) {
        std::string upper_str = toUpper(op_str);
        if (upper_str == "AND") return LogicalOp::And;
        if (upper_str == "OR") return LogicalOp::Or;
        if (upper_str == "NOT") return LogicalOp::Not;
        if (upper_str == "IF_THEN" || upper_str == "IFTHEN") return LogicalOp::IfThen;
        if (upper_str == "SEQUENCE") return LogicalOp::Sequence;
        throw std::invalid_argument("Unknown logical operator string: " + op_str);
    }

    std::string exitUnitToString(ExitUnit unit) {
        return unit == ExitUnit::Pips ? "pips" : "percent";
    }

    ExitUnit stringToExitUnit(const std::string& unit_str) {
        std::string lower_str = toLower(unit_str);
        if (lower_str == "percent" || lower_str == "%") return ExitUnit::Percent;
        if (lower_str == "pips" || lower_str == "pip") return ExitUnit::Pips;
        throw std::invalid_argument("Unknown exit unit string: " + unit_str);
    }

    double priceOf(const core::Candle& candle, PriceField field) {
        switch (field) {
            case PriceField::Open:  return candle.open;
            case PriceField::High:  return candle.high;
            case PriceField::Low:   return candle.low;
            case PriceField::Close: return candle.close;
        }
        return candle.close;
    }

} // namespace strategy_engine
