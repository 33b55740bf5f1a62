#include "ema_indicator.hpp"
#include "exceptions.hpp"
#include "logging.hpp"
#include "ta_libc.h"
#include <vector>
#include <stdexcept>
#include <spdlog/fmt/fmt.h>

namespace indicators {

EmaIndicator::EmaIndicator(int period) : period_(period), lookback_(0) {
    if (period_ <= 1) {
         throw std::invalid_argument("EMA period must be at least 2.");
    }

    lookback_ = TA_EMA_Lookback(period_);
    if (lookback_ < 0) {
         throw std::invalid_argument(fmt::format("EMA period {} is out of range (TA_EMA_Lookback returned {})", period_, lookback_));
    }

    name_ = fmt::format("EMA({})", period_);
    core::logging::getLogger()->debug("EmaIndicator created: Name='{}', Period={}, Lookback={}", name_, period_, lookback_);
}

std::string EmaIndicator::getName() const {
    return name_;
}

int EmaIndicator::getLookback() const {
    return lookback_;
}

std::vector<IndicatorField> EmaIndicator::getFields() const {
    return {IndicatorField::Value};
}

const core::TimeSeries<double>* EmaIndicator::getResult(IndicatorField field) const {
    return field == IndicatorField::Value ? &results_ : nullptr;
}

void EmaIndicator::calculate(const core::TimeSeries<double>& closes) {
    core::logging::getLogger()->trace("Calculating {}...", name_);
    results_ = compute(closes, period_);
}

core::TimeSeries<double> EmaIndicator::compute(const core::TimeSeries<double>& input, int period) {
    core::TimeSeries<double> aligned(input.size(), kUnavailable);

    // Leading unavailable entries (e.g. a MACD line still warming up) are skipped
    size_t first = 0;
    while (first < input.size() && !isAvailable(input[first])) {
        ++first;
    }
    const int lookback = TA_EMA_Lookback(period);
    if (lookback < 0) {
        throw std::invalid_argument(fmt::format("Invalid EMA period {}", period));
    }
    if (input.size() - first <= static_cast<size_t>(lookback)) {
        return aligned;
    }

    const double* segment = input.data() + first;
    const int segment_size = static_cast<int>(input.size() - first);
    std::vector<double> output(static_cast<size_t>(segment_size - lookback));
    int out_begin_idx = 0;
    int out_nb_element = 0;

    TA_RetCode ret_code = TA_EMA(0, segment_size - 1, segment, period,
                                 &out_begin_idx, &out_nb_element, output.data());
    if (ret_code != TA_SUCCESS) {
        throw core::IndicatorCalculationException(
            fmt::format("TA_EMA failed for period {} with code {}", period, static_cast<int>(ret_code)));
    }

    for (int k = 0; k < out_nb_element; ++k) {
        aligned[first + static_cast<size_t>(out_begin_idx + k)] = output[static_cast<size_t>(k)];
    }
    return aligned;
}

} // namespace indicators
