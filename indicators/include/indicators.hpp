#pragma once

#include "datatypes.hpp" // Needs TimeSeries
#include <string>
#include <vector>
#include <cstddef>
#include <functional> // For std::hash
#include <limits>
#include <cmath>

namespace indicators {

    // Entries of an indicator series that are not available yet (warm-up) hold this value
    inline constexpr double kUnavailable = std::numeric_limits<double>::quiet_NaN();

    inline bool isAvailable(double value) {
        return !std::isnan(value);
    }

    enum class IndicatorKind {
        Sma,
        Ema,
        Rsi,
        Macd,
        Bollinger,
        Unknown // Name did not match any supported indicator
    };

    // Named output of an indicator. Value is resolved to the primary output of the kind.
    enum class IndicatorField {
        Value,
        Macd,
        Signal,
        Histogram,
        Upper,
        Middle,
        Lower
    };

    // Small fixed parameter set. Fields that a kind does not use stay at zero.
    struct IndicatorParams {
        int period = 0;
        int fast_period = 0;
        int slow_period = 0;
        int signal_period = 0;
        double std_dev = 0.0;

        bool operator==(const IndicatorParams& other) const {
            return period == other.period && fast_period == other.fast_period &&
                   slow_period == other.slow_period && signal_period == other.signal_period &&
                   std_dev == other.std_dev;
        }
        bool operator!=(const IndicatorParams& other) const { return !(*this == other); }
    };

    // Identity of one cached series: (kind, parameters, field)
    struct IndicatorKey {
        IndicatorKind kind = IndicatorKind::Unknown;
        IndicatorParams params;
        IndicatorField field = IndicatorField::Value;

        bool operator==(const IndicatorKey& other) const {
            return kind == other.kind && params == other.params && field == other.field;
        }
    };

    struct IndicatorParamsHash {
        std::size_t operator()(const IndicatorParams& p) const noexcept;
    };

    struct IndicatorKeyHash {
        std::size_t operator()(const IndicatorKey& key) const noexcept;
    };

    // --- Name helpers ---
    IndicatorKind kindFromString(const std::string& name); // Unknown for unsupported names
    std::string kindToString(IndicatorKind kind);
    IndicatorField fieldFromString(const std::string& name); // throws std::invalid_argument
    std::string fieldToString(IndicatorField field);

    // Readable form of a key for logs, e.g. "rsi(14).value", "macd(12,26,9).signal"
    std::string describeKey(const IndicatorKey& key);

    // Fill in default parameters for a kind (rsi 14, sma/ema 20, macd 12/26/9, bollinger 20/2.0)
    IndicatorParams withDefaults(IndicatorKind kind, IndicatorParams params);

    // Map IndicatorField::Value to the primary output of the kind
    IndicatorField resolveField(IndicatorKind kind, IndicatorField field);

    // Build a full-length series from a TA-Lib output block that starts at out_begin_idx
    core::TimeSeries<double> alignToInput(std::size_t input_size,
                                          int out_begin_idx,
                                          int out_nb_element,
                                          const std::vector<double>& output);


    class IIndicator {
    public:
        virtual ~IIndicator() = default;

        // Get the name of the indicator (e.g., "SMA(20)", "MACD(12,26,9)")
        virtual std::string getName() const = 0;

        // Number of leading input points consumed before the first valid output
        virtual int getLookback() const = 0;

        // Calculate the indicator from a closing-price series and store the results internally
        virtual void calculate(const core::TimeSeries<double>& closes) = 0;

        // Result series for one output, aligned index-for-index with the input.
        // Entries before the lookback hold kUnavailable. nullptr if the field is not produced.
        virtual const core::TimeSeries<double>* getResult(IndicatorField field) const = 0;

        // Outputs produced by this indicator
        virtual std::vector<IndicatorField> getFields() const = 0;
    };

} // namespace indicators
