#pragma once

#include "indicators.hpp"
#include <vector>
#include <string>

namespace indicators {

class RsiIndicator : public IIndicator {
public:
    // Constructor: Requires the period for the RSI
    explicit RsiIndicator(int period);

    virtual ~RsiIndicator() override = default;

    std::string getName() const override;
    int getLookback() const override;
    void calculate(const core::TimeSeries<double>& closes) override;
    const core::TimeSeries<double>* getResult(IndicatorField field) const override;
    std::vector<IndicatorField> getFields() const override;

private:
    const int period_;
    int lookback_;
    std::string name_;
    core::TimeSeries<double> results_;
};

} // namespace indicators
