#pragma once

#include <atomic>
#include <chrono>
#include <cstdint>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <set>
#include <string>
#include <thread>
#include <vector>

#include "datatypes.hpp"
#include "config.hpp"
#include "exceptions.hpp"
#include "alert.hpp"
#include "alert_queue.hpp"
#include "cancellation_token.hpp"
#include "indicator_engine.hpp"
#include "indicator_set.hpp"
#include "signal_generator.hpp"
#include "portfolio.hpp"
#include "price_series_store.hpp"
#include "market_data_provider.hpp"
#include "database_manager.hpp"

namespace monitor {

    enum class MonitorState {
        Idle,
        Polling,
        Analyzing,
        Deciding,
        Executing,
        Alerting,
        Sleeping
    };

    std::string toString(MonitorState state);

    struct PairFailure {
        core::CurrencyPair pair;
        std::string message;
        std::optional<core::DataProviderErrorKind> provider_error; // Set for fetch failures
    };

    // Outcome of one pass through the state machine
    struct TickReport {
        std::uint64_t tick = 0; // 1-based
        core::Timestamp started_at;
        std::map<core::CurrencyPair, core::TradingSignal> signals;
        std::vector<PairFailure> failed_pairs;
        std::vector<Alert> alerts;
        bool rate_limited = false;
        bool cancelled = false;  // Stop arrived before the tick completed
    };

    // Long-running scheduler: polls quotes and series for the tracked pairs,
    // computes indicators and signals, trades the simulated portfolio and raises alerts.
    // With a connected database the price store starts from the persisted daily bars.
    class CurrencyMonitor {
    public:
        // Restored daily bars at most this old stand in for the first scheduled refresh
        static constexpr std::chrono::hours kRestoredSeriesMaxAge{48};

        // Throws core::ConfigException on an invalid configuration (before any tick runs)
        CurrencyMonitor(const core::MonitoringConfig& monitoring,
                        const core::SignalConfig& signal,
                        std::shared_ptr<data::IMarketDataProvider> provider,
                        std::shared_ptr<AlertQueue> alerts,
                        std::shared_ptr<data::DatabaseManager> database = nullptr);

        // Continues from a restored ledger instead of a fresh one
        CurrencyMonitor(const core::MonitoringConfig& monitoring,
                        const core::SignalConfig& signal,
                        std::shared_ptr<data::IMarketDataProvider> provider,
                        std::shared_ptr<AlertQueue> alerts,
                        std::unique_ptr<portfolio::Portfolio> restored,
                        std::shared_ptr<data::DatabaseManager> database = nullptr);

        ~CurrencyMonitor();

        CurrencyMonitor(const CurrencyMonitor&) = delete;
        CurrencyMonitor& operator=(const CurrencyMonitor&) = delete;

        // Runs the loop on a background thread until stop()
        void start();
        // Requests cancellation and joins; the loop exits at its next suspension point
        void stop();
        bool isRunning() const { return running_.load(); }

        // One tick, synchronously on the calling thread
        TickReport runTick();

        MonitorState getState() const { return state_.load(); }
        std::uint64_t getTickCount() const { return tick_count_.load(); }
        // Interval to wait after the last tick, including rate-limit backoff
        std::chrono::seconds nextSleep() const;

        // --- Read side (safe while the loop runs) ---
        std::optional<core::TradingSignal> latestSignal(const core::CurrencyPair& pair) const;
        std::optional<indicators::IndicatorSet> latestIndicators(const core::CurrencyPair& pair) const;
        std::optional<TickReport> lastReport() const;
        portfolio::PortfolioSnapshot snapshot() const { return portfolio_->snapshot(); }
        int consecutiveFailures(const core::CurrencyPair& pair) const;

        const portfolio::Portfolio& getPortfolio() const { return *portfolio_; }
        data::PriceSeriesStore& getStore() { return store_; }
        const core::MonitoringConfig& getConfig() const { return config_; }

    private:
        // Protective levels of the signal that opened a position
        struct ProtectiveLevels {
            double stop_loss = 0.0;
            double take_profit = 0.0;
            bool long_pair = true; // Opened on a Buy signal for the pair
        };

        struct FetchResult {
            core::CurrencyPair pair;
            std::optional<core::Quote> quote;
            std::optional<PairFailure> failure;
        };

        struct AnalysisResult {
            core::CurrencyPair pair;
            std::optional<indicators::IndicatorSet> indicators;
            std::optional<PairFailure> failure;
        };

        void run();
        void restoreSeries();
        FetchResult fetchPair(const core::CurrencyPair& pair, bool refresh_series);
        AnalysisResult analyzePair(const core::CurrencyPair& pair);

        void checkProtectiveExits(const std::map<core::CurrencyPair, core::Quote>& quotes, TickReport& report);
        void executeSignal(const core::TradingSignal& signal, const core::Quote& quote, TickReport& report);
        // Applies, persists and reports one transaction; false when the ledger rejected it
        bool submit(core::Transaction tx, const std::string& reason, TickReport& report);

        void raiseRateChange(const core::Quote& quote, TickReport& report);
        void raiseSignalAlert(const core::TradingSignal& signal,
                              const std::optional<core::TradingSignal>& previous,
                              TickReport& report);
        void recordFailure(const PairFailure& failure, TickReport& report);
        void addAlert(TickReport& report, AlertKind kind, const core::CurrencyPair& pair,
                      AlertSeverity severity, std::string message);

        core::MonitoringConfig config_;
        std::shared_ptr<data::IMarketDataProvider> provider_;
        std::shared_ptr<AlertQueue> alerts_;
        std::shared_ptr<data::DatabaseManager> database_;
        std::unique_ptr<portfolio::Portfolio> portfolio_;
        indicators::IndicatorEngine engine_;
        signals::SignalGenerator generator_;
        data::PriceSeriesStore store_;

        // Monitor-thread state
        std::map<core::CurrencyPair, int> consecutive_failures_;
        std::map<core::CurrencyPair, ProtectiveLevels> protective_levels_;
        double backoff_multiplier_ = 1.0;
        std::set<core::CurrencyPair> restored_fresh_; // Skip the series refresh of the first tick

        // Read-side caches
        mutable std::mutex cache_mutex_;
        std::map<core::CurrencyPair, core::TradingSignal> latest_signals_;
        std::map<core::CurrencyPair, indicators::IndicatorSet> latest_indicators_;
        std::optional<TickReport> last_report_;

        std::atomic<MonitorState> state_{MonitorState::Idle};
        std::atomic<std::uint64_t> tick_count_{0};
        std::atomic<bool> running_{false};
        CancellationToken token_;
        std::thread worker_;
        std::mutex tick_mutex_; // One tick at a time
    };

} // namespace monitor
