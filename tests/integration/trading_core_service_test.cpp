// tests/integration/trading_core_service_test.cpp
#include <gtest/gtest.h>
#include "trading_core_service.hpp"
#include "json_serialization.hpp"
#include "portfolio.hpp"
#include "exceptions.hpp"
#include "utils.hpp"
#include "test_helpers.hpp"

#include <memory>
#include <stdexcept>

using testing_support::FakeMarketDataProvider;
using testing_support::pair;
using testing_support::quote;
using testing_support::rampBars;
using service::json;

class TradingCoreServiceTest : public ::testing::Test {
protected:
    void SetUp() override {
        provider_ = std::make_shared<FakeMarketDataProvider>();
        provider_->setSeries(pair("EUR/USD"), rampBars(40, 1.0700, 0.0010));
        provider_->setQuote(quote("EUR/USD", 1.0854, 1.0858));
        service_ = std::make_unique<service::TradingCoreService>(provider_, core::SignalConfig{}, &ledger_);
    }

    std::shared_ptr<FakeMarketDataProvider> provider_;
    portfolio::Portfolio ledger_{10000.0, "USD"};
    std::unique_ptr<service::TradingCoreService> service_;
};

TEST(CoreOperationTest, NamesRoundTrip) {
    for (auto op : {service::CoreOperation::GetQuote, service::CoreOperation::GetTechnicalAnalysis,
                    service::CoreOperation::GenerateSignal, service::CoreOperation::GetPortfolioSnapshot,
                    service::CoreOperation::GetMarketOverview}) {
        EXPECT_EQ(service::operationFromString(service::toString(op)), op);
    }
    EXPECT_THROW(service::operationFromString("PlaceOrder"), std::invalid_argument);
}

TEST_F(TradingCoreServiceTest, GetQuote) {
    auto response = service_->dispatch("GetQuote", json{{"pair", "eur/usd"}});

    ASSERT_TRUE(response["success"].get<bool>()) << response.dump();
    EXPECT_EQ(response["operation"], "GetQuote");
    const auto& data = response["data"];
    EXPECT_EQ(data["pair"], "EUR/USD");
    EXPECT_DOUBLE_EQ(data["bid"].get<double>(), 1.0854);
    EXPECT_DOUBLE_EQ(data["ask"].get<double>(), 1.0858);
    EXPECT_DOUBLE_EQ(data["spread_pips"].get<double>(), 0.4);
    EXPECT_EQ(data["timestamp"], "2024-03-01T12:00:00Z");
}

TEST_F(TradingCoreServiceTest, TechnicalAnalysis) {
    auto response = service_->dispatch(service::CoreOperation::GetTechnicalAnalysis, json{{"pair", "EUR/USD"}});

    ASSERT_TRUE(response["success"].get<bool>()) << response.dump();
    const auto& indicators = response["data"]["indicators"];
    EXPECT_EQ(indicators["bar_count"], 40);
    EXPECT_DOUBLE_EQ(indicators["rsi"].get<double>(), 100.0);
    EXPECT_GT(indicators["ema_12"].get<double>(), indicators["ema_26"].get<double>());
    EXPECT_TRUE(indicators["sma_50"].is_null());
    EXPECT_TRUE(indicators["stochastic"].is_object());
    EXPECT_LE(indicators["bollinger"]["lower"].get<double>(), indicators["bollinger"]["upper"].get<double>());
}

TEST_F(TradingCoreServiceTest, IntradayIntervalUsesIntradaySeries) {
    provider_->setIntradaySeries(pair("EUR/USD"), "5min", rampBars(30, 1.0800, -0.0002));

    auto response = service_->dispatch("GetTechnicalAnalysis", json{{"pair", "EUR/USD"}, {"interval", "5min"}});

    ASSERT_TRUE(response["success"].get<bool>()) << response.dump();
    EXPECT_EQ(response["data"]["interval"], "5min");
    EXPECT_EQ(response["data"]["indicators"]["bar_count"], 30);
    EXPECT_EQ(provider_->intradayCalls(), 1);
    EXPECT_EQ(provider_->seriesCalls(), 0);

    // Daily bars are kept apart from the intraday ones
    response = service_->dispatch("GetTechnicalAnalysis", json{{"pair", "EUR/USD"}, {"interval", "daily"}});
    ASSERT_TRUE(response["success"].get<bool>()) << response.dump();
    EXPECT_EQ(response["data"]["interval"], "daily");
    EXPECT_EQ(response["data"]["indicators"]["bar_count"], 40);
    EXPECT_EQ(provider_->seriesCalls(), 1);
}

TEST_F(TradingCoreServiceTest, UnknownIntervalIsRejected) {
    auto response = service_->dispatch("GetTechnicalAnalysis", json{{"pair", "EUR/USD"}, {"interval", "weekly"}});
    EXPECT_FALSE(response["success"].get<bool>());
    EXPECT_EQ(response["error_kind"], "InvalidArgument");
    EXPECT_EQ(provider_->seriesCalls(), 0);
    EXPECT_EQ(provider_->intradayCalls(), 0);
}

TEST_F(TradingCoreServiceTest, GenerateSignal) {
    auto response = service_->dispatch("GenerateSignal", json{{"pair", "EUR/USD"}});

    ASSERT_TRUE(response["success"].get<bool>()) << response.dump();
    const auto& signal = response["data"]["signal"];
    EXPECT_EQ(signal["pair"], "EUR/USD");
    EXPECT_TRUE(signal["direction"] == "Buy" || signal["direction"] == "Sell" || signal["direction"] == "Hold");
    EXPECT_GE(signal["confidence"].get<double>(), 0.0);
    EXPECT_LE(signal["confidence"].get<double>(), 100.0);
    EXPECT_FALSE(signal["reasoning"].empty());
    EXPECT_EQ(signal["generated_at"], "2024-03-01T12:00:00Z");
    EXPECT_TRUE(response["data"]["quote"].is_object());
}

TEST_F(TradingCoreServiceTest, PortfolioSnapshot) {
    auto response = service_->dispatch("GetPortfolioSnapshot", json::object());

    ASSERT_TRUE(response["success"].get<bool>()) << response.dump();
    EXPECT_EQ(response["data"]["currency"], "USD");
    EXPECT_DOUBLE_EQ(response["data"]["cash_balance"].get<double>(), 10000.0);
    EXPECT_TRUE(response["data"]["pairs"].empty());
}

TEST_F(TradingCoreServiceTest, SnapshotWithoutPortfolioIsConfigurationError) {
    service::TradingCoreService detached(provider_, core::SignalConfig{});
    auto response = detached.dispatch("GetPortfolioSnapshot", json::object());
    EXPECT_FALSE(response["success"].get<bool>());
    EXPECT_EQ(response["error_kind"], "ConfigurationError");
}

TEST_F(TradingCoreServiceTest, ProviderFailuresKeepTheirKind) {
    provider_->failWith(pair("EUR/USD"), core::DataProviderErrorKind::RateLimited);
    auto response = service_->dispatch("GetQuote", json{{"pair", "EUR/USD"}});
    EXPECT_FALSE(response["success"].get<bool>());
    EXPECT_EQ(response["error_kind"], "RateLimited");

    response = service_->dispatch("GetQuote", json{{"pair", "GBP/USD"}});
    EXPECT_EQ(response["error_kind"], "NotFound");
}

TEST_F(TradingCoreServiceTest, DomainErrorsAreClassified) {
    provider_->setSeries(pair("EUR/USD"), rampBars(10, 1.0700, 0.0010));
    service::TradingCoreService fresh(provider_, core::SignalConfig{});
    EXPECT_EQ(fresh.dispatch("GetTechnicalAnalysis", json{{"pair", "EUR/USD"}})["error_kind"], "InsufficientData");

    provider_->setQuote(quote("EUR/USD", 1.0858, 1.0854));
    EXPECT_EQ(service_->dispatch("GetQuote", json{{"pair", "EUR/USD"}})["error_kind"], "InvalidQuote");
}

TEST_F(TradingCoreServiceTest, BadArgumentsAreRejected) {
    EXPECT_EQ(service_->dispatch("PlaceOrder", json::object())["error_kind"], "InvalidArgument");
    EXPECT_EQ(service_->dispatch("GetQuote", json::object())["error_kind"], "InvalidArgument");
    EXPECT_EQ(service_->dispatch("GetQuote", json{{"pair", 42}})["error_kind"], "InvalidArgument");
    EXPECT_EQ(service_->dispatch("GetQuote", json{{"pair", "EURUSD"}})["error_kind"], "InvalidArgument");
    EXPECT_EQ(service_->dispatch("GetTechnicalAnalysis", json{{"pair", "EUR/USD"}, {"outputsize", 5}})["error_kind"],
              "InvalidArgument");
}

// --- Market overview ---

TEST_F(TradingCoreServiceTest, MarketOverviewReportsEachPair) {
    provider_->setSeries(pair("USD/JPY"), rampBars(40, 150.0, 0.5, 0.05));
    provider_->setQuote(quote("USD/JPY", 169.40, 169.43));
    provider_->setSeries(pair("GBP/USD"), rampBars(10, 1.2600, 0.0010));
    provider_->setQuote(quote("GBP/USD", 1.2690, 1.2693));
    provider_->failWith(pair("AUD/USD"), core::DataProviderErrorKind::RateLimited);

    auto response = service_->dispatch("GetMarketOverview",
                                       json{{"pairs", "EUR/USD, USD/JPY,GBP/USD,AUD/USD"}});

    ASSERT_TRUE(response["success"].get<bool>()) << response.dump();
    const auto& data = response["data"];
    ASSERT_EQ(data["pairs"].size(), 4u);

    EXPECT_EQ(data["pairs"][0]["pair"], "EUR/USD");
    EXPECT_TRUE(data["pairs"][0]["signal"].is_object());
    EXPECT_TRUE(data["pairs"][1]["signal"].is_object());

    // Too little history: quote only
    EXPECT_TRUE(data["pairs"][2]["quote"].is_object());
    EXPECT_TRUE(data["pairs"][2]["signal"].is_null());
    EXPECT_EQ(data["pairs"][2]["error_kind"], "InsufficientData");

    EXPECT_TRUE(data["pairs"][3]["quote"].is_null());
    EXPECT_EQ(data["pairs"][3]["error_kind"], "RateLimited");

    EXPECT_EQ(data["buy_signals"].get<int>() + data["sell_signals"].get<int>() + data["hold_signals"].get<int>(), 2);
}

TEST_F(TradingCoreServiceTest, MarketOverviewSentimentFollowsSignals) {
    core::SignalConfig trend_only;
    trend_only.rsi_weight = 0.0;
    trend_only.macd_weight = 0.0;
    trend_only.trend_weight = 1.0;
    service::TradingCoreService trending(provider_, trend_only);

    service::MarketOverviewRequest request;
    request.pairs = {pair("EUR/USD")};
    auto overview = trending.getMarketOverview(request);
    ASSERT_EQ(overview.pairs.size(), 1u);
    ASSERT_TRUE(overview.pairs[0].signal.has_value());
    EXPECT_EQ(overview.buy_signals, 1);
    EXPECT_EQ(overview.sentiment, service::MarketSentiment::Bullish);

    provider_->setSeries(pair("GBP/USD"), rampBars(40, 1.3000, -0.0010));
    provider_->setQuote(quote("GBP/USD", 1.2608, 1.2611));
    provider_->setSeries(pair("AUD/USD"), rampBars(40, 0.7000, -0.0010));
    provider_->setQuote(quote("AUD/USD", 0.6608, 0.6611));
    request.pairs = {pair("EUR/USD"), pair("GBP/USD"), pair("AUD/USD")};
    overview = trending.getMarketOverview(request);
    EXPECT_EQ(overview.sell_signals, 2);
    EXPECT_EQ(overview.sentiment, service::MarketSentiment::Bearish);
}

TEST_F(TradingCoreServiceTest, MarketOverviewArguments) {
    auto response = service_->dispatch("GetMarketOverview", json{{"pairs", json::array({"EUR/USD"})}});
    ASSERT_TRUE(response["success"].get<bool>()) << response.dump();
    EXPECT_EQ(response["data"]["pairs"].size(), 1u);

    EXPECT_EQ(service_->dispatch("GetMarketOverview", json::object())["error_kind"], "InvalidArgument");
    EXPECT_EQ(service_->dispatch("GetMarketOverview", json{{"pairs", json::array()}})["error_kind"],
              "InvalidArgument");
    EXPECT_EQ(service_->dispatch("GetMarketOverview", json{{"pairs", "EUR/USD,EURUSD"}})["error_kind"],
              "InvalidArgument");
    EXPECT_EQ(service_->dispatch("GetMarketOverview", json{{"pairs", 7}})["error_kind"], "InvalidArgument");
}

TEST(JsonSerializationTest, TransactionAndAlertShapes) {
    core::Transaction tx;
    tx.id = "TX-000001";
    tx.pair = pair("USD/JPY");
    tx.side = core::TradeSide::Sell;
    tx.amount = 100.0;
    tx.price = 150.0;
    tx.timestamp = core::utils::parseUtcDateTime("2024-03-01");
    json j = tx;
    EXPECT_EQ(j["side"], "Sell");
    EXPECT_EQ(j["pair"], "USD/JPY");
    EXPECT_TRUE(j["realized_pnl"].is_null());
    tx.realized_pnl = -2.5;
    EXPECT_DOUBLE_EQ(json(tx)["realized_pnl"].get<double>(), -2.5);

    monitor::Alert alert;
    alert.kind = monitor::AlertKind::Degraded;
    alert.pair = pair("GBP/USD");
    alert.severity = monitor::AlertSeverity::Critical;
    alert.message = "down";
    alert.timestamp = core::utils::parseUtcDateTime("2024-03-01");
    json a = alert;
    EXPECT_EQ(a["kind"], "Degraded");
    EXPECT_EQ(a["severity"], "Critical");
    EXPECT_EQ(a["timestamp"], "2024-03-01T00:00:00Z");
}
