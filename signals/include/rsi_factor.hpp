#pragma once

#include "interfaces.hpp"

namespace signals {

    // Oversold (< 30) is bullish, overbought (> 70) bearish, in between scaled
    // by the distance from 50
    class RsiFactor : public IFactor {
    public:
        RsiFactor(double oversold = 30.0, double overbought = 70.0);

        std::string getName() const override { return "RSI"; }
        FactorScore evaluate(const indicators::IndicatorSet& set) const override;

        // Continuous score in [-100, 100]
        double scoreFor(double rsi) const;

    private:
        double oversold_;
        double overbought_;
    };

} // namespace signals
