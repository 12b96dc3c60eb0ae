#pragma once

#include "indicator_set.hpp"
#include "core/include/datatypes.hpp"
#include <cstddef>

namespace indicators {

    class IndicatorEngine {
    public:
        // Bars needed for the full set (EMA26 / MACD line)
        static constexpr std::size_t kMinimumBars = 26;

        // Computes every indicator for the last bar of `bars` (ascending by time).
        // Throws core::InsufficientDataException with fewer than kMinimumBars bars.
        IndicatorSet compute(const core::TimeSeries<core::PriceBar>& bars) const;
    };

} // namespace indicators
