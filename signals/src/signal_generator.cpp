#include "signal_generator.hpp"
#include "rsi_factor.hpp"
#include "macd_factor.hpp"
#include "trend_factor.hpp"
#include "indicator_engine.hpp"
#include "exceptions.hpp"
#include "logging.hpp"
#include "utils.hpp"

#include <algorithm>
#include <cmath>
#include <numeric>
#include <spdlog/fmt/fmt.h>

namespace signals {

    namespace {

        // Net score 0 agrees only with factors that are themselves neutral
        bool agrees(double factor_score, double net_score) {
            if (net_score > 0.0) return factor_score > 0.0;
            if (net_score < 0.0) return factor_score < 0.0;
            return factor_score == 0.0;
        }

        core::RiskLevel riskFromConfidence(double confidence) {
            if (confidence < 40.0) return core::RiskLevel::High;
            if (confidence < 70.0) return core::RiskLevel::Medium;
            return core::RiskLevel::Low;
        }

        struct Contribution {
            std::size_t order = 0;
            double weighted = 0.0;
            std::string description;
        };

    } // anonymous namespace

    void validateQuote(const core::Quote& quote) {
        if (!(quote.bid > 0.0) || !(quote.ask > 0.0)) {
            throw core::InvalidQuoteException(fmt::format(
                "Quote for {} has a non-positive side (bid={}, ask={})", quote.pair.symbol(), quote.bid, quote.ask));
        }
        if (quote.bid >= quote.ask) {
            throw core::InvalidQuoteException(fmt::format(
                "Quote for {} is crossed (bid={} >= ask={})", quote.pair.symbol(), quote.bid, quote.ask));
        }
    }

    SignalGenerator::SignalGenerator(const core::SignalConfig& config)
        : config_(config) {
        core::config::validate(config_);
        factors_.push_back({std::make_unique<RsiFactor>(), config_.rsi_weight});
        factors_.push_back({std::make_unique<MacdFactor>(), config_.macd_weight});
        factors_.push_back({std::make_unique<TrendFactor>(), config_.trend_weight});
        normalizeWeights();
    }

    SignalGenerator::SignalGenerator(const core::SignalConfig& config, std::vector<WeightedFactor> factors)
        : config_(config), factors_(std::move(factors)) {
        core::config::validate(config_);
        if (factors_.empty()) {
            throw core::ConfigException("Signal generator needs at least one factor");
        }
        normalizeWeights();
    }

    void SignalGenerator::normalizeWeights() {
        double total = 0.0;
        for (const auto& wf : factors_) {
            if (!wf.factor) {
                throw core::ConfigException("Signal generator factor is null");
            }
            if (wf.weight < 0.0) {
                throw core::ConfigException(fmt::format("Weight of factor '{}' is negative", wf.factor->getName()));
            }
            total += wf.weight;
        }
        if (!(total > 0.0)) {
            throw core::ConfigException("Signal factor weights must sum to a positive value");
        }
        for (auto& wf : factors_) {
            wf.weight /= total;
        }
    }

    core::TradingSignal SignalGenerator::generate(const indicators::IndicatorSet& set, const core::Quote& quote) const {
        auto logger = core::logging::getLogger();

        if (set.bar_count < indicators::IndicatorEngine::kMinimumBars) {
            throw core::InsufficientDataException(fmt::format(
                "Indicator set for {} was built from {} bars, need {}",
                quote.pair.symbol(), set.bar_count, indicators::IndicatorEngine::kMinimumBars));
        }
        validateQuote(quote);

        // --- Score ---
        std::vector<FactorScore> scores;
        scores.reserve(factors_.size());
        double net = 0.0;
        for (const auto& wf : factors_) {
            scores.push_back(wf.factor->evaluate(set));
            net += wf.weight * scores.back().score;
        }
        net = std::clamp(net, -100.0, 100.0);

        core::TradingSignal signal;
        signal.pair = quote.pair;
        signal.score = net;
        signal.strength = std::abs(net);
        signal.generated_at = quote.timestamp;

        if (net > config_.buy_threshold) {
            signal.direction = core::SignalDirection::Buy;
        } else if (net < config_.sell_threshold) {
            signal.direction = core::SignalDirection::Sell;
        } else {
            signal.direction = core::SignalDirection::Hold;
        }

        const auto agreeing = std::count_if(scores.begin(), scores.end(),
            [net](const FactorScore& s) { return agrees(s.score, net); });
        signal.confidence = std::clamp(
            config_.base_confidence * static_cast<double>(agreeing) / static_cast<double>(scores.size()), 0.0, 100.0);
        signal.risk_level = riskFromConfidence(signal.confidence);

        // --- Entry and exits ---
        // Hold signals price the side the score leans towards
        const bool is_long = signal.direction == core::SignalDirection::Buy ||
                             (signal.direction == core::SignalDirection::Hold && net >= 0.0);
        signal.entry_price = is_long ? quote.ask : quote.bid;

        double width = set.atr_14;
        if (!(width > 0.0)) {
            width = quote.ask - quote.bid;
        }

        if (is_long) {
            signal.stop_loss = signal.entry_price - config_.stop_loss_multiplier * width;
            signal.take_profit = signal.entry_price + config_.take_profit_multiplier * width;
            const double band = set.bollinger.lower;
            if (band > signal.stop_loss && band < signal.entry_price) {
                signal.stop_loss = band;
            }
        } else {
            signal.stop_loss = signal.entry_price + config_.stop_loss_multiplier * width;
            signal.take_profit = signal.entry_price - config_.take_profit_multiplier * width;
            const double band = set.bollinger.upper;
            if (band < signal.stop_loss && band > signal.entry_price) {
                signal.stop_loss = band;
            }
        }

        // --- Reasoning (strongest contribution first, stable on ties) ---
        std::vector<Contribution> contributions;
        contributions.reserve(scores.size());
        for (std::size_t i = 0; i < scores.size(); ++i) {
            contributions.push_back({i, std::abs(factors_[i].weight * scores[i].score), scores[i].description});
        }
        std::stable_sort(contributions.begin(), contributions.end(),
            [](const Contribution& a, const Contribution& b) { return a.weighted > b.weighted; });
        for (const auto& c : contributions) {
            signal.reasoning.push_back(c.description);
        }

        const double mid = quote.mid();
        if (mid < set.bollinger.lower) {
            signal.reasoning.push_back(fmt::format(
                "Price {:.5f} below lower Bollinger Band {:.5f} (potential bounce)", mid, set.bollinger.lower));
        } else if (mid > set.bollinger.upper) {
            signal.reasoning.push_back(fmt::format(
                "Price {:.5f} above upper Bollinger Band {:.5f} (potential reversal)", mid, set.bollinger.upper));
        }

        logger->debug("Signal {} {}: score={:.2f} confidence={:.1f} entry={:.5f} SL={:.5f} TP={:.5f}",
                      signal.pair.symbol(), core::utils::toString(signal.direction), signal.score,
                      signal.confidence, signal.entry_price, signal.stop_loss, signal.take_profit);
        return signal;
    }

} // namespace signals
