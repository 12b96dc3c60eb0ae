#pragma once

#include "indicators.hpp"
#include <vector>
#include <string>

namespace indicators {

// Fast stochastic: %K over k_period bars, %D = SMA(%K, d_period).
// %K is 50 when the high/low range of the window is zero.
class StochasticIndicator : public IIndicator {
public:
    StochasticIndicator(int k_period = 14, int d_period = 3);

    ~StochasticIndicator() override = default;

    std::string getName() const override;
    // Lookback of %D (the later of the two lines)
    int getLookback() const override;
    void calculate(const core::TimeSeries<core::PriceBar>& input) override;

    // %K aligned with %D
    const core::TimeSeries<double>& getResult() const override;
    const core::TimeSeries<double>& getSlowLine() const;

private:
    const int k_period_;
    const int d_period_;
    int lookback_;
    std::string name_;
    core::TimeSeries<double> k_line_;
    core::TimeSeries<double> d_line_;
};

} // namespace indicators
