#pragma once

#include "indicators.hpp"
#include "datatypes.hpp"
#include <cstddef>
#include <memory>
#include <optional>
#include <unordered_map>
#include <unordered_set>

namespace indicators {

    // Memoized indicator series for one run over one bar series.
    // Each (kind, params) indicator is calculated at most once and all of its fields are published.
    // Unknown kinds, invalid parameters and TA-Lib failures are cached as misses (logged once).
    class IndicatorCache {
    public:
        explicit IndicatorCache(const core::TimeSeries<core::Candle>& bars);

        IndicatorCache(const IndicatorCache&) = delete;
        IndicatorCache& operator=(const IndicatorCache&) = delete;

        // Full-length series for the key, or nullptr when the indicator is unavailable
        const core::TimeSeries<double>* series(const IndicatorKey& key);

        // Value at a bar index, kUnavailable when missing or out of range
        double valueAt(const IndicatorKey& key, std::size_t index);

        // Warm-up length of the indicator behind the key, empty when it cannot be computed
        std::optional<int> lookback(const IndicatorKey& key);

        // Number of indicator calculations performed so far
        std::size_t computationCount() const { return computation_count_; }

        // Apply parameter defaults and resolve IndicatorField::Value for the kind
        static IndicatorKey normalize(const IndicatorKey& key);

    private:
        // Calculated indicator for one (kind, params); nullptr marks a cached miss
        const IIndicator* indicatorFor(const IndicatorKey& normalized);

        core::TimeSeries<double> closes_;
        std::unordered_map<IndicatorKey, std::unique_ptr<IIndicator>, IndicatorKeyHash> indicators_;
        std::unordered_map<IndicatorKey, const core::TimeSeries<double>*, IndicatorKeyHash> published_;
        std::unordered_set<IndicatorKey, IndicatorKeyHash> missing_fields_;
        std::size_t computation_count_ = 0;
    };

} // namespace indicators
