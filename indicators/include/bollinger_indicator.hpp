#pragma once

#include "indicators.hpp"
#include <vector>
#include <string>

namespace indicators {

// Volatility bands: SMA middle band, upper/lower at +/- std_dev standard deviations
class BollingerIndicator : public IIndicator {
public:
    BollingerIndicator(int period, double std_dev);

    virtual ~BollingerIndicator() override = default;

    std::string getName() const override;
    int getLookback() const override;
    void calculate(const core::TimeSeries<double>& closes) override;
    const core::TimeSeries<double>* getResult(IndicatorField field) const override;
    std::vector<IndicatorField> getFields() const override;

private:
    const int period_;
    const double std_dev_;
    int lookback_;
    std::string name_;
    core::TimeSeries<double> upper_;
    core::TimeSeries<double> middle_;
    core::TimeSeries<double> lower_;
};

} // namespace indicators
