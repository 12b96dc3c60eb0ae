// tests/integration/currency_monitor_test.cpp
#include <gtest/gtest.h>
#include "currency_monitor.hpp"
#include "alert_queue.hpp"
#include "database_manager.hpp"
#include "exceptions.hpp"
#include "test_helpers.hpp"

#include <chrono>
#include <memory>
#include <thread>

using testing_support::FakeMarketDataProvider;
using testing_support::pair;
using testing_support::quote;
using testing_support::rampBars;

namespace {

    std::size_t countAlerts(const monitor::TickReport& report, monitor::AlertKind kind,
                            const std::string& symbol = "") {
        std::size_t count = 0;
        for (const auto& alert : report.alerts) {
            if (alert.kind == kind && (symbol.empty() || alert.pair.symbol() == symbol)) {
                ++count;
            }
        }
        return count;
    }

    const monitor::Alert* findAlert(const monitor::TickReport& report, monitor::AlertKind kind) {
        for (const auto& alert : report.alerts) {
            if (alert.kind == kind) {
                return &alert;
            }
        }
        return nullptr;
    }

    // Signals decided by the EMA trend alone, so a rising ramp always reads Buy
    // Same bars, shifted so the last one falls within the current hour
    core::TimeSeries<core::PriceBar> endingNow(core::TimeSeries<core::PriceBar> bars) {
        const auto shift = std::chrono::floor<std::chrono::hours>(std::chrono::system_clock::now()) -
                           bars.back().timestamp;
        for (auto& bar : bars) {
            bar.timestamp += shift;
        }
        return bars;
    }

    core::SignalConfig trendOnlySignals() {
        core::SignalConfig signal;
        signal.rsi_weight = 0.0;
        signal.macd_weight = 0.0;
        signal.trend_weight = 1.0;
        return signal;
    }

} // anonymous namespace

class CurrencyMonitorTest : public ::testing::Test {
protected:
    void SetUp() override {
        provider_ = std::make_shared<FakeMarketDataProvider>();
        alerts_ = std::make_shared<monitor::AlertQueue>();

        provider_->setSeries(pair("EUR/USD"), rampBars(60, 1.0500, 0.0010));
        provider_->setQuote(quote("EUR/USD", 1.1090, 1.1092));
        provider_->setSeries(pair("USD/JPY"), rampBars(60, 145.00, 0.05, 0.05));
        provider_->setQuote(quote("USD/JPY", 147.95, 147.97));
        provider_->setSeries(pair("GBP/USD"), rampBars(60, 1.2500, 0.0005));
        provider_->setQuote(quote("GBP/USD", 1.2795, 1.2797));
        provider_->setSeries(pair("EUR/GBP"), rampBars(60, 0.8500, 0.0002));
        provider_->setQuote(quote("EUR/GBP", 0.8618, 0.8620));

        config_.initial_amount = 10000.0;
        config_.initial_currency = "USD";
        config_.interval_seconds = 1;
        config_.max_backoff_seconds = 8;
        config_.tracked_pairs = {pair("EUR/USD"), pair("USD/JPY"), pair("GBP/USD")};
        config_.analysis_workers = 2;
    }

    std::unique_ptr<monitor::CurrencyMonitor> makeMonitor(const core::SignalConfig& signal = core::SignalConfig{}) {
        return std::make_unique<monitor::CurrencyMonitor>(config_, signal, provider_, alerts_);
    }

    std::shared_ptr<FakeMarketDataProvider> provider_;
    std::shared_ptr<monitor::AlertQueue> alerts_;
    core::MonitoringConfig config_;
};

TEST_F(CurrencyMonitorTest, TickProducesSignalForEveryPair) {
    auto mon = makeMonitor();
    auto report = mon->runTick();

    EXPECT_EQ(report.tick, 1u);
    EXPECT_FALSE(report.cancelled);
    EXPECT_TRUE(report.failed_pairs.empty());
    ASSERT_EQ(report.signals.size(), 3u);
    EXPECT_EQ(mon->getTickCount(), 1u);

    for (const auto& p : config_.tracked_pairs) {
        ASSERT_TRUE(mon->latestSignal(p).has_value()) << p.symbol();
        ASSERT_TRUE(mon->latestIndicators(p).has_value()) << p.symbol();
        EXPECT_EQ(mon->latestIndicators(p)->bar_count, 60u);
    }
    // Every first signal is a change from nothing
    EXPECT_EQ(countAlerts(report, monitor::AlertKind::SignalTriggered), 3u);

    // Alerts reach the queue as well as the report
    EXPECT_EQ(alerts_->size(), report.alerts.size());
    ASSERT_TRUE(mon->lastReport().has_value());
    EXPECT_EQ(mon->lastReport()->tick, 1u);
}

TEST_F(CurrencyMonitorTest, FailingPairDoesNotBlockOthers) {
    provider_->failWith(pair("GBP/USD"), core::DataProviderErrorKind::NotFound);
    auto mon = makeMonitor();
    auto report = mon->runTick();

    EXPECT_EQ(report.signals.size(), 2u);
    EXPECT_EQ(report.signals.count(pair("GBP/USD")), 0u);
    ASSERT_EQ(report.failed_pairs.size(), 1u);
    EXPECT_EQ(report.failed_pairs[0].pair.symbol(), "GBP/USD");
    ASSERT_TRUE(report.failed_pairs[0].provider_error.has_value());
    EXPECT_EQ(*report.failed_pairs[0].provider_error, core::DataProviderErrorKind::NotFound);

    EXPECT_EQ(countAlerts(report, monitor::AlertKind::DataError, "GBP/USD"), 1u);
    EXPECT_EQ(countAlerts(report, monitor::AlertKind::Degraded), 0u);
    EXPECT_FALSE(report.rate_limited);
    EXPECT_EQ(mon->consecutiveFailures(pair("GBP/USD")), 1);
    EXPECT_EQ(mon->consecutiveFailures(pair("EUR/USD")), 0);
}

TEST_F(CurrencyMonitorTest, DegradedRaisedOnceAtThreshold) {
    provider_->failWith(pair("GBP/USD"), core::DataProviderErrorKind::Network);
    auto mon = makeMonitor();

    EXPECT_EQ(countAlerts(mon->runTick(), monitor::AlertKind::Degraded), 0u);
    EXPECT_EQ(countAlerts(mon->runTick(), monitor::AlertKind::Degraded), 0u);

    auto third = mon->runTick();
    ASSERT_EQ(countAlerts(third, monitor::AlertKind::Degraded, "GBP/USD"), 1u);
    EXPECT_EQ(findAlert(third, monitor::AlertKind::Degraded)->severity, monitor::AlertSeverity::Critical);
    // The healthy pairs keep going while one is degraded
    EXPECT_EQ(third.signals.size(), 2u);

    EXPECT_EQ(countAlerts(mon->runTick(), monitor::AlertKind::Degraded), 0u);
    EXPECT_EQ(mon->consecutiveFailures(pair("GBP/USD")), 4);

    provider_->clearFailure(pair("GBP/USD"));
    auto recovered = mon->runTick();
    EXPECT_EQ(recovered.signals.count(pair("GBP/USD")), 1u);
    EXPECT_EQ(mon->consecutiveFailures(pair("GBP/USD")), 0);
}

TEST_F(CurrencyMonitorTest, RateLimitBacksOffAndRecovers) {
    auto mon = makeMonitor();
    EXPECT_EQ(mon->nextSleep(), std::chrono::seconds(1));

    provider_->failWith(pair("USD/JPY"), core::DataProviderErrorKind::RateLimited);
    EXPECT_TRUE(mon->runTick().rate_limited);
    EXPECT_EQ(mon->nextSleep(), std::chrono::seconds(2));
    mon->runTick();
    EXPECT_EQ(mon->nextSleep(), std::chrono::seconds(4));
    mon->runTick();
    EXPECT_EQ(mon->nextSleep(), std::chrono::seconds(8));
    mon->runTick();
    EXPECT_EQ(mon->nextSleep(), std::chrono::seconds(8));

    provider_->clearFailure(pair("USD/JPY"));
    EXPECT_FALSE(mon->runTick().rate_limited);
    EXPECT_EQ(mon->nextSleep(), std::chrono::seconds(1));
}

TEST_F(CurrencyMonitorTest, ShortHistoryIsAnAnalysisFailure) {
    provider_->setSeries(pair("GBP/USD"), rampBars(10, 1.2500, 0.0005));
    auto mon = makeMonitor();
    auto report = mon->runTick();

    EXPECT_EQ(report.signals.size(), 2u);
    ASSERT_EQ(report.failed_pairs.size(), 1u);
    EXPECT_FALSE(report.failed_pairs[0].provider_error.has_value());
    const auto* alert = findAlert(report, monitor::AlertKind::DataError);
    ASSERT_NE(alert, nullptr);
    EXPECT_NE(alert->message.find("[Analysis]"), std::string::npos);
}

TEST_F(CurrencyMonitorTest, CrossedQuoteIsRejected) {
    provider_->setQuote(quote("GBP/USD", 1.2797, 1.2795));
    auto mon = makeMonitor();
    auto report = mon->runTick();

    ASSERT_EQ(report.failed_pairs.size(), 1u);
    EXPECT_EQ(report.failed_pairs[0].pair.symbol(), "GBP/USD");
    EXPECT_FALSE(mon->latestSignal(pair("GBP/USD")).has_value());
}

TEST_F(CurrencyMonitorTest, SignificantMoveRaisesRateChange) {
    auto mon = makeMonitor();
    EXPECT_EQ(countAlerts(mon->runTick(), monitor::AlertKind::RateChange), 0u);

    provider_->setQuote(quote("EUR/USD", 1.1290, 1.1292));
    auto report = mon->runTick();
    ASSERT_EQ(countAlerts(report, monitor::AlertKind::RateChange), 1u);
    const auto* alert = findAlert(report, monitor::AlertKind::RateChange);
    EXPECT_EQ(alert->pair.symbol(), "EUR/USD");
    EXPECT_EQ(alert->severity, monitor::AlertSeverity::Warning);
}

TEST_F(CurrencyMonitorTest, SeriesRefreshedOnSchedule) {
    config_.series_refresh_ticks = 3;
    auto mon = makeMonitor();

    mon->runTick();
    EXPECT_EQ(provider_->seriesCalls(), 3);
    mon->runTick();
    mon->runTick();
    EXPECT_EQ(provider_->seriesCalls(), 3);
    EXPECT_EQ(provider_->quoteCalls(), 9);
    mon->runTick();
    EXPECT_EQ(provider_->seriesCalls(), 6);
}

// --- Restart ---

TEST_F(CurrencyMonitorTest, RecentPersistedBarsReplaceFirstRefresh) {
    config_.series_refresh_ticks = 1;
    auto db = std::make_shared<data::DatabaseManager>(":memory:");
    ASSERT_TRUE(db->connect());
    ASSERT_TRUE(db->initializeSchema());
    ASSERT_TRUE(db->saveBars(endingNow(rampBars(60, 1.0500, 0.0010)), pair("EUR/USD"), "daily"));
    ASSERT_TRUE(db->saveBars(endingNow(rampBars(60, 145.00, 0.05, 0.05)), pair("USD/JPY"), "daily"));
    ASSERT_TRUE(db->saveBars(endingNow(rampBars(60, 1.2500, 0.0005)), pair("GBP/USD"), "daily"));

    monitor::CurrencyMonitor mon(config_, core::SignalConfig{}, provider_, alerts_, db);
    EXPECT_EQ(mon.getStore().barCount(pair("EUR/USD")), 60u);

    auto report = mon.runTick();
    EXPECT_EQ(provider_->seriesCalls(), 0);
    EXPECT_EQ(provider_->quoteCalls(), 3);
    EXPECT_EQ(report.signals.size(), 3u);

    // Later scheduled refreshes fetch again
    mon.runTick();
    EXPECT_EQ(provider_->seriesCalls(), 3);
}

TEST_F(CurrencyMonitorTest, StalePersistedBarsAreRefreshed) {
    auto db = std::make_shared<data::DatabaseManager>(":memory:");
    ASSERT_TRUE(db->connect());
    ASSERT_TRUE(db->initializeSchema());
    ASSERT_TRUE(db->saveBars(rampBars(60, 1.0500, 0.0010), pair("EUR/USD"), "daily"));

    monitor::CurrencyMonitor mon(config_, core::SignalConfig{}, provider_, alerts_, db);
    EXPECT_EQ(mon.getStore().barCount(pair("EUR/USD")), 60u);
    EXPECT_EQ(mon.getStore().barCount(pair("USD/JPY")), 0u);

    auto report = mon.runTick();
    EXPECT_EQ(provider_->seriesCalls(), 3);
    EXPECT_EQ(report.signals.size(), 3u);
}

// --- Simulated trading ---

class CurrencyMonitorTradingTest : public CurrencyMonitorTest {
protected:
    void SetUp() override {
        CurrencyMonitorTest::SetUp();
        config_.tracked_pairs = {pair("EUR/USD"), pair("EUR/GBP")};
    }
};

TEST_F(CurrencyMonitorTradingTest, StrongSignalOpensOnePosition) {
    auto mon = makeMonitor(trendOnlySignals());
    auto report = mon->runTick();

    ASSERT_EQ(report.signals.at(pair("EUR/USD")).direction, core::SignalDirection::Buy);
    EXPECT_EQ(countAlerts(report, monitor::AlertKind::TradeExecuted, "EUR/USD"), 1u);
    // EUR/GBP does not trade the portfolio currency
    EXPECT_EQ(countAlerts(report, monitor::AlertKind::TradeExecuted, "EUR/GBP"), 0u);

    auto transactions = mon->getPortfolio().getTransactions();
    ASSERT_EQ(transactions.size(), 1u);
    EXPECT_EQ(transactions[0].id, "TX-000001");
    EXPECT_EQ(transactions[0].side, core::TradeSide::Buy);
    EXPECT_DOUBLE_EQ(transactions[0].amount, 1000.0); // 10% of 10000
    EXPECT_DOUBLE_EQ(transactions[0].price, 1.1092);  // Buying EUR at the ask
    EXPECT_NEAR(mon->getPortfolio().getCash(), 9000.0, 1e-9);

    // Holding already; the repeated Buy adds nothing
    mon->runTick();
    EXPECT_EQ(mon->getPortfolio().getTransactions().size(), 1u);
    EXPECT_EQ(mon->snapshot().open_positions, 1u);
}

TEST_F(CurrencyMonitorTradingTest, StopLossClosesPosition) {
    auto mon = makeMonitor(trendOnlySignals());
    mon->runTick();
    const double stop = mon->latestSignal(pair("EUR/USD"))->stop_loss;
    ASSERT_LT(stop, 1.1092);

    provider_->setQuote(quote("EUR/USD", 1.0500, 1.0502));
    auto report = mon->runTick();
    EXPECT_EQ(countAlerts(report, monitor::AlertKind::StopLossHit, "EUR/USD"), 1u);

    auto transactions = mon->getPortfolio().getTransactions();
    ASSERT_GE(transactions.size(), 2u);
    EXPECT_EQ(transactions[1].side, core::TradeSide::Sell);
    EXPECT_DOUBLE_EQ(transactions[1].price, 1.0500); // Selling EUR at the bid
    ASSERT_TRUE(transactions[1].realized_pnl.has_value());
    EXPECT_LT(*transactions[1].realized_pnl, 0.0);
}

TEST_F(CurrencyMonitorTradingTest, TakeProfitClosesPosition) {
    auto mon = makeMonitor(trendOnlySignals());
    mon->runTick();

    provider_->setQuote(quote("EUR/USD", 1.2000, 1.2002));
    auto report = mon->runTick();
    EXPECT_EQ(countAlerts(report, monitor::AlertKind::TakeProfitHit, "EUR/USD"), 1u);

    auto transactions = mon->getPortfolio().getTransactions();
    ASSERT_GE(transactions.size(), 2u);
    ASSERT_TRUE(transactions[1].realized_pnl.has_value());
    EXPECT_GT(*transactions[1].realized_pnl, 0.0);
}

TEST_F(CurrencyMonitorTradingTest, TradesArePersisted) {
    auto db = std::make_shared<data::DatabaseManager>(":memory:");
    ASSERT_TRUE(db->connect());
    ASSERT_TRUE(db->initializeSchema());

    monitor::CurrencyMonitor live(config_, trendOnlySignals(), provider_, alerts_, db);
    live.runTick();

    auto meta = db->loadPortfolioMeta();
    ASSERT_TRUE(meta.has_value());
    EXPECT_DOUBLE_EQ(meta->initial_amount, 10000.0);
    EXPECT_EQ(meta->currency, "USD");

    auto stored = db->loadTransactions();
    ASSERT_EQ(stored.size(), 1u);
    EXPECT_EQ(stored[0].id, "TX-000001");

    auto bars = db->queryBars(pair("EUR/USD"), "daily",
                              core::utils::parseUtcDateTime("2024-01-01"),
                              core::utils::parseUtcDateTime("2025-01-01"));
    EXPECT_EQ(bars.size(), 60u);

    // A restarted monitor continues the persisted ledger
    auto restored = portfolio::Portfolio::replay(meta->initial_amount, meta->currency, stored);
    monitor::CurrencyMonitor resumed(config_, trendOnlySignals(), provider_, alerts_, std::move(restored), db);
    EXPECT_NEAR(resumed.getPortfolio().getCash(), live.getPortfolio().getCash(), 1e-9);
    EXPECT_EQ(resumed.snapshot().open_positions, 1u);
}

// --- Construction and loop control ---

TEST_F(CurrencyMonitorTest, InvalidSetupRejected) {
    config_.tracked_pairs.clear();
    EXPECT_THROW(makeMonitor(), core::ConfigException);

    config_.tracked_pairs = {pair("EUR/USD")};
    EXPECT_THROW(monitor::CurrencyMonitor(config_, core::SignalConfig{}, nullptr, alerts_), core::ConfigException);
    EXPECT_THROW(monitor::CurrencyMonitor(config_, core::SignalConfig{}, provider_, nullptr), core::ConfigException);
}

TEST_F(CurrencyMonitorTest, StartAndStop) {
    auto mon = makeMonitor();
    EXPECT_EQ(mon->getState(), monitor::MonitorState::Idle);

    mon->start();
    EXPECT_TRUE(mon->isRunning());

    auto deadline = std::chrono::steady_clock::now() + std::chrono::seconds(5);
    while (!mon->lastReport().has_value() && std::chrono::steady_clock::now() < deadline) {
        std::this_thread::sleep_for(std::chrono::milliseconds(10));
    }
    ASSERT_TRUE(mon->lastReport().has_value());

    auto stop_started = std::chrono::steady_clock::now();
    mon->stop();
    EXPECT_LT(std::chrono::steady_clock::now() - stop_started, std::chrono::seconds(2));

    EXPECT_FALSE(mon->isRunning());
    EXPECT_EQ(mon->getState(), monitor::MonitorState::Idle);
    EXPECT_GT(alerts_->size(), 0u);

    // Stopping twice is harmless
    mon->stop();
}

TEST_F(CurrencyMonitorTest, StopAbandonsInFlightRequests) {
    provider_->holdSeries(true);
    auto mon = makeMonitor();
    mon->start();

    // Two workers: the first batch is blocked inside the provider, the third pair is queued
    auto deadline = std::chrono::steady_clock::now() + std::chrono::seconds(5);
    while (provider_->seriesCalls() < 2 && std::chrono::steady_clock::now() < deadline) {
        std::this_thread::sleep_for(std::chrono::milliseconds(5));
    }
    ASSERT_EQ(provider_->seriesCalls(), 2);

    auto stop_started = std::chrono::steady_clock::now();
    mon->stop();
    EXPECT_LT(std::chrono::steady_clock::now() - stop_started, std::chrono::seconds(2));
    EXPECT_FALSE(mon->isRunning());

    // No batch starts after the stop request
    EXPECT_EQ(provider_->seriesCalls(), 2);
    EXPECT_EQ(provider_->quoteCalls(), 0);
    EXPECT_FALSE(mon->lastReport().has_value());
    provider_->holdSeries(false);
}
