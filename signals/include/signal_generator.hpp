#pragma once

#include <memory>
#include <string>
#include <vector>

#include "datatypes.hpp"
#include "config.hpp"
#include "interfaces.hpp"
#include "indicator_set.hpp"

namespace signals {

    struct WeightedFactor {
        std::unique_ptr<IFactor> factor;
        double weight = 0.0; // Normalized so all weights sum to 1
    };

    // Rule-based combination of factor scores into a single TradingSignal.
    // Stateless after construction; safe to call from several threads.
    class SignalGenerator {
    public:
        // Uses the RSI, MACD and trend factors with the configured weights
        explicit SignalGenerator(const core::SignalConfig& config);

        // Custom factor list (weights are normalized here)
        SignalGenerator(const core::SignalConfig& config, std::vector<WeightedFactor> factors);

        SignalGenerator(const SignalGenerator&) = delete;
        SignalGenerator& operator=(const SignalGenerator&) = delete;

        // Throws core::InvalidQuoteException for a crossed/non-positive quote and
        // core::InsufficientDataException for a set built from fewer than 26 bars.
        core::TradingSignal generate(const indicators::IndicatorSet& set, const core::Quote& quote) const;

        const core::SignalConfig& getConfig() const { return config_; }
        const std::vector<WeightedFactor>& getFactors() const { return factors_; }

    private:
        void normalizeWeights();

        core::SignalConfig config_;
        std::vector<WeightedFactor> factors_;
    };

    // Throws core::InvalidQuoteException
    void validateQuote(const core::Quote& quote);

} // namespace signals
