#include "macd_factor.hpp"
#include <algorithm>
#include <cmath>
#include <spdlog/fmt/fmt.h>

namespace signals {

    FactorScore MacdFactor::evaluate(const indicators::IndicatorSet& set) const {
        FactorScore result;
        result.name = getName();

        const double histogram = set.macd.histogram;
        if (histogram == 0.0) {
            result.score = 0.0;
            result.description = fmt::format("MACD ({:.6f}) on its signal line, no momentum", set.macd.line);
            return result;
        }

        const double sigma = (set.bollinger.upper - set.bollinger.middle) / 2.0;
        double magnitude = 50.0;
        if (sigma > 0.0) {
            magnitude = std::min(100.0, 50.0 + 50.0 * std::abs(histogram) / sigma);
        }
        result.score = histogram > 0.0 ? magnitude : -magnitude;

        if (histogram > 0.0) {
            result.description = fmt::format("MACD bullish crossover (line {:.6f} above signal {:.6f})",
                                             set.macd.line, set.macd.signal);
        } else {
            result.description = fmt::format("MACD bearish crossover (line {:.6f} below signal {:.6f})",
                                             set.macd.line, set.macd.signal);
        }
        return result;
    }

} // namespace signals
