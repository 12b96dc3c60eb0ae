#pragma once

#include "indicators.hpp"
#include <vector>
#include <string>

namespace indicators {

// Exponential moving average seeded with the SMA of the first `period` closes
class EmaIndicator : public IIndicator {
public:
    explicit EmaIndicator(int period);

    ~EmaIndicator() override = default;

    std::string getName() const override;
    int getLookback() const override;
    void calculate(const core::TimeSeries<core::PriceBar>& input) override;
    const core::TimeSeries<double>& getResult() const override;

    // EMA of an arbitrary value series (used for the MACD signal line).
    // Returns values aligned to input index + lookback, empty if too short.
    static std::vector<double> compute(const std::vector<double>& values, int period);

private:
    const int period_;
    int lookback_;
    std::string name_;
    core::TimeSeries<double> results_;
};

} // namespace indicators
