#include "macd_indicator.hpp"
#include "ema_indicator.hpp"
#include "logging.hpp"
#include "ta_libc.h"
#include <algorithm>
#include <stdexcept>
#include <spdlog/fmt/fmt.h>

namespace indicators {

MacdIndicator::MacdIndicator(int fast_period, int slow_period, int signal_period)
    : fast_period_(fast_period), slow_period_(slow_period), signal_period_(signal_period), lookback_(0)
{
    if (fast_period_ <= 1 || slow_period_ <= 1 || signal_period_ <= 1) {
        throw std::invalid_argument("MACD periods must be at least 2.");
    }
    if (fast_period_ >= slow_period_) {
        throw std::invalid_argument(fmt::format("MACD fast period ({}) must be shorter than slow period ({}).",
                                                fast_period_, slow_period_));
    }

    const int fast_lookback = TA_EMA_Lookback(fast_period_);
    const int slow_lookback = TA_EMA_Lookback(slow_period_);
    const int signal_lookback = TA_EMA_Lookback(signal_period_);
    if (fast_lookback < 0 || slow_lookback < 0 || signal_lookback < 0) {
        throw std::invalid_argument(fmt::format("MACD periods ({}, {}, {}) are out of range for TA_EMA",
                                                fast_period_, slow_period_, signal_period_));
    }
    lookback_ = std::max(fast_lookback, slow_lookback) + signal_lookback;

    name_ = fmt::format("MACD({},{},{})", fast_period_, slow_period_, signal_period_);
    core::logging::getLogger()->debug("MacdIndicator created: Name='{}', Lookback={}", name_, lookback_);
}

std::string MacdIndicator::getName() const {
    return name_;
}

int MacdIndicator::getLookback() const {
    return lookback_;
}

std::vector<IndicatorField> MacdIndicator::getFields() const {
    return {IndicatorField::Macd, IndicatorField::Signal, IndicatorField::Histogram};
}

const core::TimeSeries<double>* MacdIndicator::getResult(IndicatorField field) const {
    switch (field) {
        case IndicatorField::Macd:      return &macd_line_;
        case IndicatorField::Signal:    return &signal_line_;
        case IndicatorField::Histogram: return &histogram_;
        default:                        return nullptr;
    }
}

void MacdIndicator::calculate(const core::TimeSeries<double>& closes) {
    auto logger = core::logging::getLogger();
    logger->trace("Calculating {}...", name_);

    const auto fast = EmaIndicator::compute(closes, fast_period_);
    const auto slow = EmaIndicator::compute(closes, slow_period_);

    macd_line_.assign(closes.size(), kUnavailable);
    for (size_t i = 0; i < closes.size(); ++i) {
        if (isAvailable(fast[i]) && isAvailable(slow[i])) {
            macd_line_[i] = fast[i] - slow[i];
        }
    }

    signal_line_ = EmaIndicator::compute(macd_line_, signal_period_);

    histogram_.assign(closes.size(), 0.0);
    for (size_t i = 0; i < closes.size(); ++i) {
        if (isAvailable(macd_line_[i]) && isAvailable(signal_line_[i])) {
            histogram_[i] = macd_line_[i] - signal_line_[i];
        }
    }

    logger->trace("Successfully calculated {} over {} closes", name_, closes.size());
}

} // namespace indicators
