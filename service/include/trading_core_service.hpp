#pragma once

#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>

#include "datatypes.hpp"
#include "config.hpp"
#include "indicator_engine.hpp"
#include "indicator_set.hpp"
#include "signal_generator.hpp"
#include "portfolio.hpp"
#include "price_series_store.hpp"
#include "market_data_provider.hpp"

namespace service {

    using json = nlohmann::json;

    // Read-only operations exposed to the agent layer
    enum class CoreOperation {
        GetQuote,
        GetTechnicalAnalysis,
        GenerateSignal,
        GetPortfolioSnapshot,
        GetMarketOverview
    };

    std::string toString(CoreOperation operation);
    // Throws std::invalid_argument for an unknown name
    CoreOperation operationFromString(const std::string& name);

    // --- Typed requests / responses ---
    struct QuoteRequest {
        core::CurrencyPair pair;
    };

    inline const std::string kDailyInterval = "daily";

    struct AnalysisRequest {
        core::CurrencyPair pair;
        std::string outputsize = "compact";   // Daily series only
        std::string interval = kDailyInterval; // Or one of data::kIntradayIntervals
    };

    struct AnalysisResponse {
        core::CurrencyPair pair;
        std::string interval;
        indicators::IndicatorSet indicators;
    };

    struct SignalResponse {
        core::TradingSignal signal;
        indicators::IndicatorSet indicators;
        core::Quote quote;
    };

    struct MarketOverviewRequest {
        std::vector<core::CurrencyPair> pairs;
        std::string outputsize = "compact";
        std::string interval = kDailyInterval;
    };

    enum class MarketSentiment {
        Bullish,
        Bearish,
        Neutral
    };

    std::string toString(MarketSentiment sentiment);

    // One row of the overview. A quote without a signal means the series was too
    // short (or unavailable); error_kind names what went wrong.
    struct PairOverview {
        core::CurrencyPair pair;
        std::optional<core::Quote> quote;
        std::optional<core::TradingSignal> signal;
        std::optional<std::string> error_kind;
        std::string error;
    };

    struct MarketOverview {
        std::vector<PairOverview> pairs;
        int buy_signals = 0;
        int sell_signals = 0;
        int hold_signals = 0;
        MarketSentiment sentiment = MarketSentiment::Neutral; // Majority of Buy over Sell signals
    };

    class TradingCoreService {
    public:
        // `portfolio` is optional and not owned (typically the monitor's ledger)
        TradingCoreService(std::shared_ptr<data::IMarketDataProvider> provider,
                           const core::SignalConfig& signal_config,
                           const portfolio::Portfolio* portfolio = nullptr,
                           std::size_t max_bars_per_pair = 500);

        core::Quote getQuote(const QuoteRequest& request);
        AnalysisResponse getTechnicalAnalysis(const AnalysisRequest& request);
        SignalResponse generateSignal(const AnalysisRequest& request);
        // Throws core::ConfigException when no portfolio is attached
        portfolio::PortfolioSnapshot getPortfolioSnapshot() const;
        // Failures are reported per pair; only an invalid request throws
        MarketOverview getMarketOverview(const MarketOverviewRequest& request);

        // args: {"pair": "EUR/USD", "outputsize": "compact", "interval": "daily"} as the
        // operation needs; GetMarketOverview takes "pairs" as an array or "EUR/USD,USD/JPY".
        // Returns {"success": true, "operation": ..., "data": ...} or
        // {"success": false, "operation": ..., "error_kind": ..., "error": ...}; never throws.
        json dispatch(CoreOperation operation, const json& args);
        json dispatch(const std::string& operation, const json& args);

    private:
        static core::CurrencyPair pairArgument(const json& args);
        static std::vector<core::CurrencyPair> pairsArgument(const json& args);
        static AnalysisRequest analysisRequest(const json& args);
        // Throws std::invalid_argument for an interval that is neither daily nor intraday
        static void validateInterval(const std::string& interval);

        core::TimeSeries<core::PriceBar> refreshSeries(const core::CurrencyPair& pair,
                                                       const std::string& outputsize,
                                                       const std::string& interval);
        data::PriceSeriesStore& intradayStore(const std::string& interval);

        std::shared_ptr<data::IMarketDataProvider> provider_;
        indicators::IndicatorEngine engine_;
        signals::SignalGenerator generator_;
        const portfolio::Portfolio* portfolio_;
        std::size_t max_bars_per_pair_;
        data::PriceSeriesStore store_; // Daily bars and latest quotes

        std::mutex intraday_mutex_;
        std::map<std::string, std::unique_ptr<data::PriceSeriesStore>> intraday_stores_;
    };

} // namespace service
