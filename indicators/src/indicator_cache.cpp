#include "indicator_cache.hpp"
#include "indicator_factory.hpp"
#include "exceptions.hpp"
#include "logging.hpp"
#include <stdexcept>
#include <string>
#include <utility>
#include <spdlog/fmt/fmt.h>

namespace indicators {

    IndicatorCache::IndicatorCache(const core::TimeSeries<core::Candle>& bars) {
        closes_.reserve(bars.size());
        for (const auto& candle : bars) {
            closes_.push_back(candle.close);
        }
        core::logging::getLogger()->debug("IndicatorCache created over {} bars", closes_.size());
    }

    IndicatorKey IndicatorCache::normalize(const IndicatorKey& key) {
        IndicatorKey normalized = key;
        normalized.params = withDefaults(key.kind, key.params);
        normalized.field = resolveField(key.kind, key.field);
        return normalized;
    }

    const IIndicator* IndicatorCache::indicatorFor(const IndicatorKey& normalized) {
        IndicatorKey id = normalized;
        id.field = IndicatorField::Value;

        auto it = indicators_.find(id);
        if (it != indicators_.end()) {
            return it->second.get();
        }

        auto logger = core::logging::getLogger();
        std::unique_ptr<IIndicator> indicator;

        if (id.kind == IndicatorKind::Unknown) {
            logger->warn("Unknown indicator kind referenced by a condition. Treating it as unavailable.");
        } else {
            try {
                indicator = createIndicator(id.kind, id.params);
                if (indicator) {
                    ++computation_count_;
                    indicator->calculate(closes_);
                    for (IndicatorField field : indicator->getFields()) {
                        IndicatorKey published_key = id;
                        published_key.field = field;
                        published_[published_key] = indicator->getResult(field);
                    }
                    logger->debug("Calculated indicator {} (lookback {}) over {} bars",
                                  indicator->getName(), indicator->getLookback(), closes_.size());
                }
            } catch (const std::invalid_argument& e) {
                logger->warn("Invalid parameters for indicator {}: {}", describeKey(normalized), e.what());
                indicator.reset();
            } catch (const core::IndicatorCalculationException& e) {
                logger->error("Indicator calculation failed for {}: {}", describeKey(normalized), e.what());
                indicator.reset();
            }
        }

        auto inserted = indicators_.emplace(id, std::move(indicator));
        return inserted.first->second.get();
    }

    const core::TimeSeries<double>* IndicatorCache::series(const IndicatorKey& key) {
        const IndicatorKey normalized = normalize(key);

        auto found = published_.find(normalized);
        if (found != published_.end()) {
            return found->second;
        }

        const IIndicator* indicator = indicatorFor(normalized);
        if (!indicator) {
            return nullptr;
        }

        found = published_.find(normalized);
        if (found != published_.end()) {
            return found->second;
        }

        if (missing_fields_.insert(normalized).second) {
            core::logging::getLogger()->warn("Indicator {} does not produce field '{}'. Treating it as unavailable.",
                                             indicator->getName(), fieldToString(normalized.field));
        }
        return nullptr;
    }

    double IndicatorCache::valueAt(const IndicatorKey& key, std::size_t index) {
        const core::TimeSeries<double>* values = series(key);
        if (!values || index >= values->size()) {
            return kUnavailable;
        }
        return (*values)[index];
    }

    std::optional<int> IndicatorCache::lookback(const IndicatorKey& key) {
        const IIndicator* indicator = indicatorFor(normalize(key));
        if (!indicator) {
            return std::nullopt;
        }
        return indicator->getLookback();
    }

} // namespace indicators
