#pragma once

#include "indicators.hpp"
#include <vector>
#include <string>

namespace indicators {

// Exponential moving average (TA-Lib seeds the average with the SMA of the first period)
class EmaIndicator : public IIndicator {
public:
    explicit EmaIndicator(int period);

    virtual ~EmaIndicator() override = default;

    std::string getName() const override;
    int getLookback() const override;
    void calculate(const core::TimeSeries<double>& closes) override;
    const core::TimeSeries<double>* getResult(IndicatorField field) const override;
    std::vector<IndicatorField> getFields() const override;

    // Aligned EMA over an arbitrary series; also used to build MACD lines
    static core::TimeSeries<double> compute(const core::TimeSeries<double>& input, int period);

private:
    const int period_;
    int lookback_;
    std::string name_;
    core::TimeSeries<double> results_;
};

} // namespace indicators
