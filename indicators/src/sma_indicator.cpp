#include "sma_indicator.hpp"
#include "exceptions.hpp"
#include "logging.hpp"
#include "ta_libc.h"            // TA-Lib C API header
#include <vector>
#include <stdexcept>
#include <spdlog/fmt/fmt.h>

namespace indicators {

SmaIndicator::SmaIndicator(int period) : period_(period), lookback_(0) {
    if (period_ <= 0) {
         throw std::invalid_argument("SMA period must be positive.");
    }

    // Determine the lookback period required by TA-Lib for this period
    lookback_ = TA_MA_Lookback(period_, TA_MAType_SMA);
    if (lookback_ < 0) {
         throw std::invalid_argument(fmt::format("SMA period {} is out of range (TA_MA_Lookback returned {})", period_, lookback_));
    }

    name_ = fmt::format("SMA({})", period_);
    core::logging::getLogger()->debug("SmaIndicator created: Name='{}', Period={}, Lookback={}", name_, period_, lookback_);
}

std::string SmaIndicator::getName() const {
    return name_;
}

int SmaIndicator::getLookback() const {
    return lookback_;
}

std::vector<IndicatorField> SmaIndicator::getFields() const {
    return {IndicatorField::Value};
}

const core::TimeSeries<double>* SmaIndicator::getResult(IndicatorField field) const {
    return field == IndicatorField::Value ? &results_ : nullptr;
}

void SmaIndicator::calculate(const core::TimeSeries<double>& closes) {
    auto logger = core::logging::getLogger();
    logger->trace("Calculating {}...", name_);
    results_.assign(closes.size(), kUnavailable);

    // Check if input size is sufficient
    if (closes.size() <= static_cast<size_t>(lookback_)) {
        logger->debug("Input size ({}) is less than or equal to lookback ({}) for {}. No values available.",
                      closes.size(), lookback_, name_);
        return;
    }

    // TA-Lib output size = input size - lookback
    std::vector<double> output(closes.size() - static_cast<size_t>(lookback_));
    int out_begin_idx = 0;
    int out_nb_element = 0;

    TA_RetCode ret_code = TA_MA(
        0,                                     // startIdx
        static_cast<int>(closes.size()) - 1,   // endIdx
        closes.data(),                         // inReal
        period_,                               // optInTimePeriod
        TA_MAType_SMA,                         // optInMAType
        &out_begin_idx,
        &out_nb_element,
        output.data()
    );

    if (ret_code != TA_SUCCESS) {
        throw core::IndicatorCalculationException(
            fmt::format("TA_MA failed for {} with code {}", name_, static_cast<int>(ret_code)));
    }

    if (out_begin_idx != lookback_) {
         logger->warn("TA_MA out_begin_idx ({}) does not match calculated lookback ({}) for {}.",
                      out_begin_idx, lookback_, name_);
    }

    results_ = alignToInput(closes.size(), out_begin_idx, out_nb_element, output);
    logger->trace("Successfully calculated {} values for {}", out_nb_element, name_);
}

} // namespace indicators
