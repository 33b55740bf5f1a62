#include "indicators.hpp"
#include <algorithm>
#include <cctype>
#include <stdexcept>
#include <spdlog/fmt/fmt.h>

namespace indicators {

    namespace {

        std::string toLower(std::string value) {
            std::transform(value.begin(), value.end(), value.begin(),
                [](unsigned char c){ return static_cast<char>(std::tolower(c)); });
            return value;
        }

        void hashCombine(std::size_t& seed, std::size_t value) {
            seed ^= value + 0x9e3779b97f4a7c15ULL + (seed << 6) + (seed >> 2);
        }

    } // end anonymous namespace

    std::size_t IndicatorParamsHash::operator()(const IndicatorParams& p) const noexcept {
        std::size_t seed = 0;
        hashCombine(seed, std::hash<int>{}(p.period));
        hashCombine(seed, std::hash<int>{}(p.fast_period));
        hashCombine(seed, std::hash<int>{}(p.slow_period));
        hashCombine(seed, std::hash<int>{}(p.signal_period));
        hashCombine(seed, std::hash<double>{}(p.std_dev));
        return seed;
    }

    std::size_t IndicatorKeyHash::operator()(const IndicatorKey& key) const noexcept {
        std::size_t seed = IndicatorParamsHash{}(key.params);
        hashCombine(seed, std::hash<int>{}(static_cast<int>(key.kind)));
        hashCombine(seed, std::hash<int>{}(static_cast<int>(key.field)));
        return seed;
    }

    IndicatorKind kindFromString(const std::string& name) {
        std::string lower_str = toLower(name);
        if (lower_str == "sma") return IndicatorKind::Sma;
        if (lower_str == "ema") return IndicatorKind::Ema;
        if (lower_str == "rsi") return IndicatorKind::Rsi;
        if (lower_str == "macd") return IndicatorKind::Macd;
        if (lower_str == "bb" || lower_str == "bollinger" || lower_str == "bbands") return IndicatorKind::Bollinger;
        return IndicatorKind::Unknown;
    }

    std::string kindToString(IndicatorKind kind) {
        switch (kind) {
            case IndicatorKind::Sma:       return "sma";
            case IndicatorKind::Ema:       return "ema";
            case IndicatorKind::Rsi:       return "rsi";
            case IndicatorKind::Macd:      return "macd";
            case IndicatorKind::Bollinger: return "bb";
            case IndicatorKind::Unknown:   return "unknown";
        }
        return "unknown";
    }

    IndicatorField fieldFromString(const std::string& name) {
        std::string lower_str = toLower(name);
        if (lower_str.empty() || lower_str == "value") return IndicatorField::Value;
        if (lower_str == "macd" || lower_str == "main") return IndicatorField::Macd;
        if (lower_str == "signal") return IndicatorField::Signal;
        if (lower_str == "histogram") return IndicatorField::Histogram;
        if (lower_str == "upper") return IndicatorField::Upper;
        if (lower_str == "middle") return IndicatorField::Middle;
        if (lower_str == "lower") return IndicatorField::Lower;
        throw std::invalid_argument("Unknown indicator field string: " + name);
    }

    std::string fieldToString(IndicatorField field) {
        switch (field) {
            case IndicatorField::Value:     return "value";
            case IndicatorField::Macd:      return "macd";
            case IndicatorField::Signal:    return "signal";
            case IndicatorField::Histogram: return "histogram";
            case IndicatorField::Upper:     return "upper";
            case IndicatorField::Middle:    return "middle";
            case IndicatorField::Lower:     return "lower";
        }
        return "value";
    }

    std::string describeKey(const IndicatorKey& key) {
        const auto& p = key.params;
        switch (key.kind) {
            case IndicatorKind::Macd:
                return fmt::format("macd({},{},{}).{}", p.fast_period, p.slow_period, p.signal_period,
                                   fieldToString(key.field));
            case IndicatorKind::Bollinger:
                return fmt::format("bb({},{}).{}", p.period, p.std_dev, fieldToString(key.field));
            default:
                return fmt::format("{}({}).{}", kindToString(key.kind), p.period, fieldToString(key.field));
        }
    }

    IndicatorParams withDefaults(IndicatorKind kind, IndicatorParams params) {
        switch (kind) {
            case IndicatorKind::Rsi:
                if (params.period == 0) params.period = 14;
                break;
            case IndicatorKind::Sma:
            case IndicatorKind::Ema:
                if (params.period == 0) params.period = 20;
                break;
            case IndicatorKind::Macd:
                if (params.fast_period == 0) params.fast_period = 12;
                if (params.slow_period == 0) params.slow_period = 26;
                if (params.signal_period == 0) params.signal_period = 9;
                break;
            case IndicatorKind::Bollinger:
                if (params.period == 0) params.period = 20;
                if (params.std_dev == 0.0) params.std_dev = 2.0;
                break;
            case IndicatorKind::Unknown:
                break;
        }
        return params;
    }

    IndicatorField resolveField(IndicatorKind kind, IndicatorField field) {
        if (field != IndicatorField::Value) {
            return field;
        }
        switch (kind) {
            case IndicatorKind::Macd:      return IndicatorField::Macd;
            case IndicatorKind::Bollinger: return IndicatorField::Middle;
            default:                       return IndicatorField::Value;
        }
    }

    core::TimeSeries<double> alignToInput(std::size_t input_size,
                                          int out_begin_idx,
                                          int out_nb_element,
                                          const std::vector<double>& output)
    {
        core::TimeSeries<double> aligned(input_size, kUnavailable);
        for (int k = 0; k < out_nb_element; ++k) {
            std::size_t target = static_cast<std::size_t>(out_begin_idx + k);
            if (target >= input_size || static_cast<std::size_t>(k) >= output.size()) {
                break;
            }
            aligned[target] = output[static_cast<std::size_t>(k)];
        }
        return aligned;
    }

} // namespace indicators
