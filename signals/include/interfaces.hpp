#pragma once

#include <string>
#include "indicator_set.hpp" // Provides indicators::IndicatorSet

namespace signals {

    // Contribution of one factor to the net score
    struct FactorScore {
        std::string name;        // e.g. "RSI"
        double score = 0.0;      // Signed, in [-100, 100]; positive is bullish
        std::string description; // Human-readable reasoning line
    };

    // --- Factor Interface ---
    // A single rule that turns indicator values into a bullish/bearish score
    class IFactor {
    public:
        virtual ~IFactor() = default;

        virtual std::string getName() const = 0;

        // Pure function of the indicator set
        virtual FactorScore evaluate(const indicators::IndicatorSet& set) const = 0;
    };

} // namespace signals
