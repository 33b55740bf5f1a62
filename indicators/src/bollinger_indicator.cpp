#include "bollinger_indicator.hpp"
#include "exceptions.hpp"
#include "logging.hpp"
#include "ta_libc.h"
#include <vector>
#include <stdexcept>
#include <spdlog/fmt/fmt.h>

namespace indicators {

BollingerIndicator::BollingerIndicator(int period, double std_dev)
    : period_(period), std_dev_(std_dev), lookback_(0)
{
    if (period_ <= 1) {
        throw std::invalid_argument("Bollinger period must be at least 2.");
    }
    if (std_dev_ <= 0.0) {
        throw std::invalid_argument("Bollinger standard deviation multiplier must be positive.");
    }

    lookback_ = TA_BBANDS_Lookback(period_, std_dev_, std_dev_, TA_MAType_SMA);
    if (lookback_ < 0) {
        throw std::invalid_argument(fmt::format("Bollinger parameters ({}, {}) are out of range (TA_BBANDS_Lookback returned {})", period_, std_dev_, lookback_));
    }

    name_ = fmt::format("BB({},{})", period_, std_dev_);
    core::logging::getLogger()->debug("BollingerIndicator created: Name='{}', Lookback={}", name_, lookback_);
}

std::string BollingerIndicator::getName() const {
    return name_;
}

int BollingerIndicator::getLookback() const {
    return lookback_;
}

std::vector<IndicatorField> BollingerIndicator::getFields() const {
    return {IndicatorField::Upper, IndicatorField::Middle, IndicatorField::Lower};
}

const core::TimeSeries<double>* BollingerIndicator::getResult(IndicatorField field) const {
    switch (field) {
        case IndicatorField::Upper:  return &upper_;
        case IndicatorField::Middle: return &middle_;
        case IndicatorField::Lower:  return &lower_;
        default:                     return nullptr;
    }
}

void BollingerIndicator::calculate(const core::TimeSeries<double>& closes) {
    auto logger = core::logging::getLogger();
    logger->trace("Calculating {}...", name_);
    upper_.assign(closes.size(), kUnavailable);
    middle_.assign(closes.size(), kUnavailable);
    lower_.assign(closes.size(), kUnavailable);

    if (closes.size() <= static_cast<size_t>(lookback_)) {
        logger->debug("Input size ({}) is less than or equal to lookback ({}) for {}. No values available.",
                      closes.size(), lookback_, name_);
        return;
    }

    const size_t output_size = closes.size() - static_cast<size_t>(lookback_);
    std::vector<double> upper(output_size);
    std::vector<double> middle(output_size);
    std::vector<double> lower(output_size);
    int out_begin_idx = 0;
    int out_nb_element = 0;

    TA_RetCode ret_code = TA_BBANDS(
        0,
        static_cast<int>(closes.size()) - 1,
        closes.data(),
        period_,
        std_dev_,                              // optInNbDevUp
        std_dev_,                              // optInNbDevDn
        TA_MAType_SMA,
        &out_begin_idx,
        &out_nb_element,
        upper.data(),
        middle.data(),
        lower.data()
    );

    if (ret_code != TA_SUCCESS) {
        throw core::IndicatorCalculationException(
            fmt::format("TA_BBANDS failed for {} with code {}", name_, static_cast<int>(ret_code)));
    }

    upper_ = alignToInput(closes.size(), out_begin_idx, out_nb_element, upper);
    middle_ = alignToInput(closes.size(), out_begin_idx, out_nb_element, middle);
    lower_ = alignToInput(closes.size(), out_begin_idx, out_nb_element, lower);
    logger->trace("Successfully calculated {} values for {}", out_nb_element, name_);
}

} // namespace indicators
