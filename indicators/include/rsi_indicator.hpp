#pragma once

#include "indicators.hpp"
#include <vector>
#include <string>

namespace indicators {

// Wilder RSI. Defined as 100 whenever the smoothed average loss is exactly zero,
// which includes a perfectly flat series.
class RsiIndicator : public IIndicator {
public:
    explicit RsiIndicator(int period);

    ~RsiIndicator() override = default;

    std::string getName() const override;
    int getLookback() const override;
    void calculate(const core::TimeSeries<core::PriceBar>& input) override;
    const core::TimeSeries<double>& getResult() const override;

private:
    const int period_;
    int lookback_;
    std::string name_;
    core::TimeSeries<double> results_;
};

} // namespace indicators
