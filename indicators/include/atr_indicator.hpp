#pragma once

#include "indicators.hpp"
#include <vector>
#include <string>

namespace indicators {

// Average True Range with Wilder smoothing
class AtrIndicator : public IIndicator {
public:
    explicit AtrIndicator(int period = 14);

    ~AtrIndicator() override = default;

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
