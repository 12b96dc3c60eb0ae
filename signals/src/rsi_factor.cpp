#include "rsi_factor.hpp"
#include <algorithm>
#include <stdexcept>
#include <spdlog/fmt/fmt.h>

namespace signals {

    RsiFactor::RsiFactor(double oversold, double overbought)
        : oversold_(oversold), overbought_(overbought) {
        if (!(oversold_ < 50.0 && overbought_ > 50.0)) {
            throw std::invalid_argument("RSI thresholds must straddle 50.");
        }
    }

    double RsiFactor::scoreFor(double rsi) const {
        double score = 0.0;
        if (rsi < oversold_) {
            score = 50.0 + (oversold_ - rsi) * 50.0 / oversold_;
        } else if (rsi > overbought_) {
            score = -(50.0 + (rsi - overbought_) * 50.0 / (100.0 - overbought_));
        } else {
            // 50 at either threshold, 0 at RSI 50
            score = (50.0 - rsi) * 50.0 / (50.0 - oversold_);
        }
        return std::clamp(score, -100.0, 100.0);
    }

    FactorScore RsiFactor::evaluate(const indicators::IndicatorSet& set) const {
        FactorScore result;
        result.name = getName();
        result.score = scoreFor(set.rsi);

        if (set.rsi < oversold_) {
            result.description = fmt::format("RSI ({:.1f}) indicates oversold condition (bullish)", set.rsi);
        } else if (set.rsi > overbought_) {
            result.description = fmt::format("RSI ({:.1f}) indicates overbought condition (bearish)", set.rsi);
        } else if (result.score > 0.0) {
            result.description = fmt::format("RSI ({:.1f}) neutral, leaning bullish", set.rsi);
        } else if (result.score < 0.0) {
            result.description = fmt::format("RSI ({:.1f}) neutral, leaning bearish", set.rsi);
        } else {
            result.description = fmt::format("RSI ({:.1f}) neutral", set.rsi);
        }
        return result;
    }

} // namespace signals
