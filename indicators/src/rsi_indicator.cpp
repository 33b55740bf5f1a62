#include "rsi_indicator.hpp"
#include "exceptions.hpp"
#include "logging.hpp"
#include "ta_libc.h"  // TA-Lib C API header
#include <vector>
#include <stdexcept>
#include <spdlog/fmt/fmt.h>

namespace indicators {

RsiIndicator::RsiIndicator(int period) : period_(period), lookback_(0) {
    if (period_ <= 1) {
         throw std::invalid_argument("RSI period must be at least 2.");
    }

    lookback_ = TA_RSI_Lookback(period_);
    if (lookback_ < 0) {
         throw std::invalid_argument(fmt::format("RSI period {} is out of range (TA_RSI_Lookback returned {})", period_, lookback_));
    }

    name_ = fmt::format("RSI({})", period_);
    core::logging::getLogger()->debug("RsiIndicator created: Name='{}', Period={}, Lookback={}", name_, period_, lookback_);
}

std::string RsiIndicator::getName() const {
    return name_;
}

int RsiIndicator::getLookback() const {
    return lookback_;
}

std::vector<IndicatorField> RsiIndicator::getFields() const {
    return {IndicatorField::Value};
}

const core::TimeSeries<double>* RsiIndicator::getResult(IndicatorField field) const {
    return field == IndicatorField::Value ? &results_ : nullptr;
}

void RsiIndicator::calculate(const core::TimeSeries<double>& closes) {
    auto logger = core::logging::getLogger();
    logger->trace("Calculating {}...", name_);
    results_.assign(closes.size(), kUnavailable);

    if (closes.size() <= static_cast<size_t>(lookback_)) {
        logger->debug("Input size ({}) is less than or equal to lookback ({}) for {}. No values available.",
                      closes.size(), lookback_, name_);
        return;
    }

    std::vector<double> output(closes.size() - static_cast<size_t>(lookback_));
    int out_begin_idx = 0;
    int out_nb_element = 0;

    TA_RetCode ret_code = TA_RSI(
        0,
        static_cast<int>(closes.size()) - 1,
        closes.data(),
        period_,
        &out_begin_idx,
        &out_nb_element,
        output.data()
    );

    if (ret_code != TA_SUCCESS) {
        throw core::IndicatorCalculationException(
            fmt::format("TA_RSI failed for {} with code {}", name_, static_cast<int>(ret_code)));
    }

    if (out_begin_idx != lookback_) {
         logger->warn("TA_RSI out_begin_idx ({}) does not match calculated lookback ({}) for {}.",
                      out_begin_idx, lookback_, name_);
    }

    results_ = alignToInput(closes.size(), out_begin_idx, out_nb_element, output);
    logger->trace("Successfully calculated {} values for {}", out_nb_element, name_);
}

} // namespace indicators
