#pragma once

#include "core/include/datatypes.hpp"
#include <optional>
#include <cstddef>

namespace indicators {

    struct MacdValues {
        double line = 0.0;
        double signal = 0.0;
        double histogram = 0.0;
    };

    struct BollingerValues {
        double upper = 0.0;
        double middle = 0.0;
        double lower = 0.0;
    };

    struct StochasticValues {
        double k = 0.0;
        double d = 0.0;
    };

    // Indicator values at the most recent bar of a window. Recomputed from the
    // series on every call, never updated in place.
    struct IndicatorSet {
        double rsi = 0.0;
        MacdValues macd;
        BollingerValues bollinger;
        double sma_20 = 0.0;
        double ema_12 = 0.0;
        double ema_26 = 0.0;
        double atr_14 = 0.0;
        std::optional<double> sma_50;               // Needs 50 bars
        std::optional<StochasticValues> stochastic; // Needs 16 bars
        std::size_t bar_count = 0;
        double last_close = 0.0;
        core::Timestamp computed_at;                // Timestamp of the last bar
    };

} // namespace indicators
