#pragma once

#include "interfaces.hpp"

namespace signals {

    // EMA12 above EMA26 is a bullish trend, anything else bearish
    class TrendFactor : public IFactor {
    public:
        std::string getName() const override { return "Trend"; }
        FactorScore evaluate(const indicators::IndicatorSet& set) const override;
    };

} // namespace signals
