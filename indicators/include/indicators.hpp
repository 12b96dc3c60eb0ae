#pragma once

#include "core/include/datatypes.hpp" // Needs PriceBar, TimeSeries
#include <string>
#include <vector>

namespace indicators {

class IIndicator {
public:
    virtual ~IIndicator() = default;

    // Get the name of the indicator (e.g., "SMA(20)", "RSI(14)")
    virtual std::string getName() const = 0;

    // Number of leading input bars consumed before the first valid output.
    // Result index i corresponds to input index i + getLookback().
    virtual int getLookback() const = 0;

    // Calculate the indicator over the input bars and store the result internally.
    // Leaves the result empty when the input is not longer than the lookback.
    virtual void calculate(const core::TimeSeries<core::PriceBar>& input) = 0;

    // Primary output line (for multi-line indicators, the line named by getName())
    virtual const core::TimeSeries<double>& getResult() const = 0;
};

// Closing prices of the series, in order
inline std::vector<double> closesOf(const core::TimeSeries<core::PriceBar>& input) {
    std::vector<double> closes;
    closes.reserve(input.size());
    for (const auto& bar : input) {
        closes.push_back(bar.close);
    }
    return closes;
}

} // namespace indicators
