#include "trend_factor.hpp"
#include <spdlog/fmt/fmt.h>

namespace signals {

    FactorScore TrendFactor::evaluate(const indicators::IndicatorSet& set) const {
        FactorScore result;
        result.name = getName();
        if (set.ema_12 > set.ema_26) {
            result.score = 100.0;
            result.description = fmt::format("Short-term EMA above long-term EMA (bullish trend, {:.5f} > {:.5f})",
                                             set.ema_12, set.ema_26);
        } else {
            result.score = -100.0;
            result.description = fmt::format("Short-term EMA not above long-term EMA (bearish trend, {:.5f} <= {:.5f})",
                                             set.ema_12, set.ema_26);
        }
        return result;
    }

} // namespace signals
