#pragma once

#include "indicators.hpp"
#include <vector>
#include <string>

namespace indicators {

// Moving-average convergence/divergence with three outputs:
//   Macd      = EMA(fast) - EMA(slow)
//   Signal    = EMA(signal) of the Macd line
//   Histogram = Macd - Signal where both exist, 0 elsewhere
class MacdIndicator : public IIndicator {
public:
    MacdIndicator(int fast_period, int slow_period, int signal_period);

    virtual ~MacdIndicator() override = default;

    std::string getName() const override;
    int getLookback() const override; // Lookback of the signal line
    void calculate(const core::TimeSeries<double>& closes) override;
    const core::TimeSeries<double>* getResult(IndicatorField field) const override;
    std::vector<IndicatorField> getFields() const override;

private:
    const int fast_period_;
    const int slow_period_;
    const int signal_period_;
    int lookback_;
    std::string name_;
    core::TimeSeries<double> macd_line_;
    core::TimeSeries<double> signal_line_;
    core::TimeSeries<double> histogram_;
};

} // namespace indicators
