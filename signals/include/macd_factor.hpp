#pragma once

#include "interfaces.hpp"

namespace signals {

    // Sign of the MACD histogram, magnitude scaled by the histogram relative to
    // the Bollinger standard deviation
    class MacdFactor : public IFactor {
    public:
        std::string getName() const override { return "MACD"; }
        FactorScore evaluate(const indicators::IndicatorSet& set) const override;
    };

} // namespace signals
