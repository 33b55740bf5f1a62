#pragma once

#include "indicators.hpp" // Base interface
#include <vector>
#include <string>

namespace indicators {

class SmaIndicator : public IIndicator {
public:
    // Constructor: Requires the period for the SMA
    explicit SmaIndicator(int period);

    virtual ~SmaIndicator() override = default;

    std::string getName() const override;
    int getLookback() const override;
    void calculate(const core::TimeSeries<double>& closes) override;
    const core::TimeSeries<double>* getResult(IndicatorField field) const override;
    std::vector<IndicatorField> getFields() const override;

private:
    const int period_;          // SMA period (e.g., 20, 50)
    int lookback_;              // TA-Lib lookback for the period
    std::string name_;          // Indicator name (e.g., "SMA(20)")
    core::TimeSeries<double> results_; // Aligned with the input closes
};

} // namespace indicators
