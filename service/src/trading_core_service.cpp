#include "trading_core_service.hpp"
#include "json_serialization.hpp"
#include "exceptions.hpp"
#include "logging.hpp"
#include "utils.hpp"

#include <sstream>
#include <stdexcept>
#include <spdlog/fmt/fmt.h>

namespace service {

    namespace {

        json failure(CoreOperation operation, const std::string& kind, const std::string& message) {
            return json{{"success", false},
                        {"operation", toString(operation)},
                        {"error_kind", kind},
                        {"error", message}};
        }

    } // anonymous namespace

    std::string toString(CoreOperation operation) {
        switch (operation) {
            case CoreOperation::GetQuote:             return "GetQuote";
            case CoreOperation::GetTechnicalAnalysis: return "GetTechnicalAnalysis";
            case CoreOperation::GenerateSignal:       return "GenerateSignal";
            case CoreOperation::GetPortfolioSnapshot: return "GetPortfolioSnapshot";
            case CoreOperation::GetMarketOverview:    return "GetMarketOverview";
        }
        return "Unknown";
    }

    std::string toString(MarketSentiment sentiment) {
        switch (sentiment) {
            case MarketSentiment::Bullish: return "Bullish";
            case MarketSentiment::Bearish: return "Bearish";
            case MarketSentiment::Neutral: return "Neutral";
        }
        return "Unknown";
    }

    CoreOperation operationFromString(const std::string& name) {
        if (name == "GetQuote") return CoreOperation::GetQuote;
        if (name == "GetTechnicalAnalysis") return CoreOperation::GetTechnicalAnalysis;
        if (name == "GenerateSignal") return CoreOperation::GenerateSignal;
        if (name == "GetPortfolioSnapshot") return CoreOperation::GetPortfolioSnapshot;
        if (name == "GetMarketOverview") return CoreOperation::GetMarketOverview;
        throw std::invalid_argument("Unknown core operation: " + name);
    }

    TradingCoreService::TradingCoreService(std::shared_ptr<data::IMarketDataProvider> provider,
                                           const core::SignalConfig& signal_config,
                                           const portfolio::Portfolio* portfolio,
                                           std::size_t max_bars_per_pair)
        : provider_(std::move(provider)),
          generator_(signal_config),
          portfolio_(portfolio),
          max_bars_per_pair_(max_bars_per_pair),
          store_(max_bars_per_pair) {
        if (!provider_) {
            throw core::ConfigException("TradingCoreService requires a market data provider");
        }
    }

    core::Quote TradingCoreService::getQuote(const QuoteRequest& request) {
        core::Quote quote = provider_->getQuote(request.pair);
        quote.pair = request.pair;
        signals::validateQuote(quote);
        store_.updateQuote(quote);
        return quote;
    }

    void TradingCoreService::validateInterval(const std::string& interval) {
        if (interval != kDailyInterval && !data::isIntradayInterval(interval)) {
            throw std::invalid_argument(fmt::format(
                "Unsupported interval '{}' (daily, 1min, 5min, 15min, 30min or 60min)", interval));
        }
    }

    // --- Series ---

    data::PriceSeriesStore& TradingCoreService::intradayStore(const std::string& interval) {
        std::lock_guard<std::mutex> lock(intraday_mutex_);
        auto& store = intraday_stores_[interval];
        if (!store) {
            store = std::make_unique<data::PriceSeriesStore>(max_bars_per_pair_);
        }
        return *store;
    }

    core::TimeSeries<core::PriceBar> TradingCoreService::refreshSeries(const core::CurrencyPair& pair,
                                                                       const std::string& outputsize,
                                                                       const std::string& interval) {
        validateInterval(interval);
        if (interval == kDailyInterval) {
            store_.merge(pair, provider_->getDailySeries(pair, outputsize));
            return store_.bars(pair);
        }
        data::PriceSeriesStore& store = intradayStore(interval);
        store.merge(pair, provider_->getIntradaySeries(pair, interval));
        return store.bars(pair);
    }

    AnalysisResponse TradingCoreService::getTechnicalAnalysis(const AnalysisRequest& request) {
        AnalysisResponse response;
        response.pair = request.pair;
        response.interval = request.interval;
        response.indicators = engine_.compute(refreshSeries(request.pair, request.outputsize, request.interval));
        return response;
    }

    SignalResponse TradingCoreService::generateSignal(const AnalysisRequest& request) {
        SignalResponse response;
        response.indicators = engine_.compute(refreshSeries(request.pair, request.outputsize, request.interval));
        response.quote = getQuote(QuoteRequest{request.pair});
        response.signal = generator_.generate(response.indicators, response.quote);
        return response;
    }

    portfolio::PortfolioSnapshot TradingCoreService::getPortfolioSnapshot() const {
        if (portfolio_ == nullptr) {
            throw core::ConfigException("No portfolio is attached to the service");
        }
        return portfolio_->snapshot();
    }

    // --- Market overview ---

    MarketOverview TradingCoreService::getMarketOverview(const MarketOverviewRequest& request) {
        if (request.pairs.empty()) {
            throw std::invalid_argument("Market overview needs at least one pair");
        }
        validateInterval(request.interval);
        auto logger = core::logging::getLogger();

        MarketOverview overview;
        for (const auto& pair : request.pairs) {
            PairOverview entry;
            entry.pair = pair;
            try {
                entry.quote = getQuote(QuoteRequest{pair});
                auto indicators = engine_.compute(refreshSeries(pair, request.outputsize, request.interval));
                entry.signal = generator_.generate(indicators, *entry.quote);
            } catch (const core::DataProviderException& e) {
                entry.error_kind = core::toString(e.kind());
                entry.error = e.what();
            } catch (const core::InsufficientDataException& e) {
                entry.error_kind = "InsufficientData";
                entry.error = e.what();
            } catch (const core::InvalidQuoteException& e) {
                entry.error_kind = "InvalidQuote";
                entry.error = e.what();
            } catch (const core::TradingPlatformException& e) {
                logger->error("Market overview for {} failed: {}", pair.symbol(), e.what());
                entry.error_kind = "Internal";
                entry.error = e.what();
            }

            if (entry.signal) {
                switch (entry.signal->direction) {
                    case core::SignalDirection::Buy:  ++overview.buy_signals; break;
                    case core::SignalDirection::Sell: ++overview.sell_signals; break;
                    case core::SignalDirection::Hold: ++overview.hold_signals; break;
                }
            } else {
                logger->warn("Market overview: no signal for {} ({})", pair.symbol(), entry.error);
            }
            overview.pairs.push_back(std::move(entry));
        }

        if (overview.buy_signals > overview.sell_signals) {
            overview.sentiment = MarketSentiment::Bullish;
        } else if (overview.sell_signals > overview.buy_signals) {
            overview.sentiment = MarketSentiment::Bearish;
        }
        logger->info("Market overview of {} pairs: {} buy, {} sell, {} hold ({})",
                     overview.pairs.size(), overview.buy_signals, overview.sell_signals,
                     overview.hold_signals, toString(overview.sentiment));
        return overview;
    }

    core::CurrencyPair TradingCoreService::pairArgument(const json& args) {
        if (!args.is_object() || !args.contains("pair") || !args["pair"].is_string()) {
            throw std::invalid_argument("Argument 'pair' (string, e.g. \"EUR/USD\") is required");
        }
        return core::utils::parsePair(args["pair"].get<std::string>());
    }

    std::vector<core::CurrencyPair> TradingCoreService::pairsArgument(const json& args) {
        if (!args.is_object() || !args.contains("pairs")) {
            throw std::invalid_argument("Argument 'pairs' (array or \"EUR/USD,USD/JPY\") is required");
        }
        std::vector<std::string> symbols;
        const json& value = args["pairs"];
        if (value.is_string()) {
            std::stringstream stream(value.get<std::string>());
            std::string item;
            while (std::getline(stream, item, ',')) {
                const auto first = item.find_first_not_of(" \t");
                const auto last = item.find_last_not_of(" \t");
                symbols.push_back(first == std::string::npos ? "" : item.substr(first, last - first + 1));
            }
        } else {
            symbols = value.get<std::vector<std::string>>();
        }

        std::vector<core::CurrencyPair> pairs;
        for (const auto& symbol : symbols) {
            pairs.push_back(core::utils::parsePair(symbol));
        }
        return pairs;
    }

    AnalysisRequest TradingCoreService::analysisRequest(const json& args) {
        AnalysisRequest request{pairArgument(args)};
        request.outputsize = args.value("outputsize", request.outputsize);
        request.interval = args.value("interval", request.interval);
        return request;
    }

    json TradingCoreService::dispatch(CoreOperation operation, const json& args) {
        auto logger = core::logging::getLogger();
        logger->debug("Dispatching {} with {}", toString(operation), args.dump());

        try {
            json data;
            switch (operation) {
                case CoreOperation::GetQuote:
                    data = getQuote(QuoteRequest{pairArgument(args)});
                    break;
                case CoreOperation::GetTechnicalAnalysis: {
                    AnalysisResponse response = getTechnicalAnalysis(analysisRequest(args));
                    data = json{{"pair", response.pair},
                                {"interval", response.interval},
                                {"indicators", response.indicators}};
                    break;
                }
                case CoreOperation::GenerateSignal: {
                    SignalResponse response = generateSignal(analysisRequest(args));
                    data = json{{"signal", response.signal},
                                {"indicators", response.indicators},
                                {"quote", response.quote}};
                    break;
                }
                case CoreOperation::GetPortfolioSnapshot:
                    data = getPortfolioSnapshot();
                    break;
                case CoreOperation::GetMarketOverview: {
                    MarketOverviewRequest request;
                    request.pairs = pairsArgument(args);
                    request.outputsize = args.value("outputsize", request.outputsize);
                    request.interval = args.value("interval", request.interval);
                    data = getMarketOverview(request);
                    break;
                }
            }
            return json{{"success", true}, {"operation", toString(operation)}, {"data", data}};
        } catch (const core::DataProviderException& e) {
            return failure(operation, core::toString(e.kind()), e.what());
        } catch (const core::InsufficientDataException& e) {
            return failure(operation, "InsufficientData", e.what());
        } catch (const core::InvalidQuoteException& e) {
            return failure(operation, "InvalidQuote", e.what());
        } catch (const core::ConfigException& e) {
            return failure(operation, "ConfigurationError", e.what());
        } catch (const core::TradingPlatformException& e) {
            logger->error("{} failed: {}", toString(operation), e.what());
            return failure(operation, "Internal", e.what());
        } catch (const json::exception& e) {
            return failure(operation, "InvalidArgument", e.what());
        } catch (const std::invalid_argument& e) {
            return failure(operation, "InvalidArgument", e.what());
        } catch (const std::exception& e) {
            logger->error("{} failed unexpectedly: {}", toString(operation), e.what());
            return failure(operation, "Internal", e.what());
        }
    }

    json TradingCoreService::dispatch(const std::string& operation, const json& args) {
        CoreOperation op;
        try {
            op = operationFromString(operation);
        } catch (const std::invalid_argument& e) {
            return json{{"success", false}, {"operation", operation},
                        {"error_kind", "InvalidArgument"}, {"error", e.what()}};
        }
        return dispatch(op, args);
    }

} // namespace service
