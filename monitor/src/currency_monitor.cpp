#include "currency_monitor.hpp"
#include "logging.hpp"
#include "utils.hpp"

#include <algorithm>
#include <cmath>
#include <future>
#include <utility>
#include <spdlog/fmt/fmt.h>

namespace monitor {

    namespace {

        // One std::async task per pair, at most `workers` in flight, results in input order.
        // No batch is launched once the token is cancelled, so the result may be short.
        template <typename Result, typename Fn>
        std::vector<Result> runPerPair(const std::vector<core::CurrencyPair>& pairs, std::size_t workers,
                                       const CancellationToken& token, Fn fn) {
            std::vector<Result> results;
            results.reserve(pairs.size());
            workers = std::max<std::size_t>(1, workers);
            for (std::size_t begin = 0; begin < pairs.size() && !token.isCancelled(); begin += workers) {
                const std::size_t end = std::min(pairs.size(), begin + workers);
                std::vector<std::future<Result>> batch;
                batch.reserve(end - begin);
                for (std::size_t i = begin; i < end; ++i) {
                    batch.push_back(std::async(std::launch::async, fn, pairs[i]));
                }
                // Join barrier
                for (auto& future : batch) {
                    results.push_back(future.get());
                }
            }
            return results;
        }

        std::string foreignCurrency(const core::CurrencyPair& pair, const std::string& portfolio_currency) {
            return pair.base == portfolio_currency ? pair.quote : pair.base;
        }

        std::unique_ptr<portfolio::Portfolio> freshPortfolio(const core::MonitoringConfig& monitoring) {
            core::config::validate(monitoring);
            return std::make_unique<portfolio::Portfolio>(monitoring.initial_amount, monitoring.initial_currency);
        }

    } // anonymous namespace

    std::string toString(MonitorState state) {
        switch (state) {
            case MonitorState::Idle:      return "Idle";
            case MonitorState::Polling:   return "Polling";
            case MonitorState::Analyzing: return "Analyzing";
            case MonitorState::Deciding:  return "Deciding";
            case MonitorState::Executing: return "Executing";
            case MonitorState::Alerting:  return "Alerting";
            case MonitorState::Sleeping:  return "Sleeping";
        }
        return "Unknown";
    }

    // --- Construction ---

    CurrencyMonitor::CurrencyMonitor(const core::MonitoringConfig& monitoring,
                                     const core::SignalConfig& signal,
                                     std::shared_ptr<data::IMarketDataProvider> provider,
                                     std::shared_ptr<AlertQueue> alerts,
                                     std::shared_ptr<data::DatabaseManager> database)
        : CurrencyMonitor(monitoring, signal, std::move(provider), std::move(alerts),
                          freshPortfolio(monitoring), std::move(database)) {
        if (database_ && database_->isConnected()) {
            if (!database_->savePortfolioMeta({monitoring.initial_amount, monitoring.initial_currency})) {
                core::logging::getLogger()->error("Failed to persist portfolio metadata; transactions will not be replayable.");
            }
        }
    }

    CurrencyMonitor::CurrencyMonitor(const core::MonitoringConfig& monitoring,
                                     const core::SignalConfig& signal,
                                     std::shared_ptr<data::IMarketDataProvider> provider,
                                     std::shared_ptr<AlertQueue> alerts,
                                     std::unique_ptr<portfolio::Portfolio> restored,
                                     std::shared_ptr<data::DatabaseManager> database)
        : config_(monitoring),
          provider_(std::move(provider)),
          alerts_(std::move(alerts)),
          database_(std::move(database)),
          portfolio_(std::move(restored)),
          generator_(signal),
          store_(monitoring.max_bars_per_pair) {
        core::config::validate(config_);
        if (!provider_) {
            throw core::ConfigException("CurrencyMonitor requires a market data provider");
        }
        if (!alerts_) {
            throw core::ConfigException("CurrencyMonitor requires an alert queue");
        }
        if (!portfolio_) {
            throw core::ConfigException("CurrencyMonitor requires a portfolio");
        }
        if (database_ && database_->isConnected()) {
            restoreSeries();
        }
        provider_->setAbortCheck([this] { return token_.isCancelled(); });
        core::logging::getLogger()->info("CurrencyMonitor configured: {} pairs, interval {}s, portfolio {:.2f} {}",
                                         config_.tracked_pairs.size(), config_.interval_seconds,
                                         portfolio_->getInitialValue(), portfolio_->getCurrency());
    }

    void CurrencyMonitor::restoreSeries() {
        auto logger = core::logging::getLogger();
        const auto now = std::chrono::system_clock::now();
        for (const auto& pair : config_.tracked_pairs) {
            auto bars = database_->queryBars(pair, "daily", core::Timestamp{}, now + std::chrono::hours(24));
            if (bars.empty()) {
                continue;
            }
            const std::size_t added = store_.merge(pair, std::move(bars));
            const auto last = store_.window(pair, 1);
            if (last.empty()) {
                continue;
            }
            const bool fresh = now - last.back().timestamp <= kRestoredSeriesMaxAge;
            if (fresh) {
                restored_fresh_.insert(pair);
            }
            logger->info("Restored {} daily bars for {} (last {}{})", added, pair.symbol(),
                         core::utils::timestampToString(last.back().timestamp), fresh ? "" : ", stale");
        }
    }

    CurrencyMonitor::~CurrencyMonitor() {
        stop();
        provider_->setAbortCheck(nullptr);
    }

    // --- Loop control ---

    void CurrencyMonitor::start() {
        auto logger = core::logging::getLogger();
        if (running_.exchange(true)) {
            logger->warn("CurrencyMonitor already running.");
            return;
        }
        if (worker_.joinable()) {
            worker_.join();
        }
        token_.reset();
        worker_ = std::thread(&CurrencyMonitor::run, this);
        logger->info("CurrencyMonitor started.");
    }

    void CurrencyMonitor::stop() {
        token_.cancel();
        if (worker_.joinable()) {
            worker_.join();
            core::logging::getLogger()->info("CurrencyMonitor stopped after {} ticks.", tick_count_.load());
        }
        running_.store(false);
        state_.store(MonitorState::Idle);
    }

    std::chrono::seconds CurrencyMonitor::nextSleep() const {
        std::lock_guard<std::mutex> lock(cache_mutex_);
        const double seconds = std::min<double>(config_.interval_seconds * backoff_multiplier_,
                                                config_.max_backoff_seconds);
        return std::chrono::seconds(static_cast<long long>(seconds));
    }

    void CurrencyMonitor::run() {
        auto logger = core::logging::getLogger();
        while (!token_.isCancelled()) {
            try {
                runTick();
            } catch (const core::TradingPlatformException& e) {
                logger->error("Tick {} aborted: {}", tick_count_.load(), e.what());
            } catch (const std::exception& e) {
                logger->critical("Tick {} aborted by unexpected error: {}", tick_count_.load(), e.what());
            }
            if (token_.isCancelled()) {
                break;
            }
            state_.store(MonitorState::Sleeping);
            const auto sleep = nextSleep();
            logger->debug("Sleeping {}s until next tick.", sleep.count());
            if (token_.waitFor(std::chrono::duration_cast<std::chrono::milliseconds>(sleep))) {
                break;
            }
        }
        state_.store(MonitorState::Idle);
        running_.store(false);
    }

    // --- Per-pair work (runs on async tasks) ---

    CurrencyMonitor::FetchResult CurrencyMonitor::fetchPair(const core::CurrencyPair& pair, bool refresh_series) {
        auto logger = core::logging::getLogger();
        FetchResult result;
        result.pair = pair;
        if (token_.isCancelled()) {
            return result;
        }
        try {
            const bool skip_refresh = refresh_series && restored_fresh_.count(pair) > 0;
            if (skip_refresh) {
                logger->debug("Using restored bars for {} instead of a refresh.", pair.symbol());
            }
            if ((refresh_series && !skip_refresh) || store_.barCount(pair) == 0) {
                auto bars = provider_->getDailySeries(pair, config_.series_outputsize);
                const std::size_t added = store_.merge(pair, bars);
                if (database_ && added > 0 && !database_->saveBars(bars, pair, "daily")) {
                    logger->warn("Could not persist daily bars for {}", pair.symbol());
                }
            }
            if (token_.isCancelled()) {
                return result;
            }
            core::Quote quote = provider_->getQuote(pair);
            quote.pair = pair;
            signals::validateQuote(quote);
            store_.updateQuote(quote);
            result.quote = quote;
        } catch (const core::DataProviderException& e) {
            result.failure = PairFailure{pair, e.what(), e.kind()};
        } catch (const core::TradingPlatformException& e) {
            result.failure = PairFailure{pair, e.what(), std::nullopt};
        } catch (const std::exception& e) {
            result.failure = PairFailure{pair, fmt::format("Unexpected error: {}", e.what()), std::nullopt};
        }
        return result;
    }

    CurrencyMonitor::AnalysisResult CurrencyMonitor::analyzePair(const core::CurrencyPair& pair) {
        AnalysisResult result;
        result.pair = pair;
        try {
            result.indicators = engine_.compute(store_.window(pair, config_.max_bars_per_pair));
        } catch (const core::TradingPlatformException& e) {
            result.failure = PairFailure{pair, e.what(), std::nullopt};
        } catch (const std::exception& e) {
            result.failure = PairFailure{pair, fmt::format("Unexpected error: {}", e.what()), std::nullopt};
        }
        return result;
    }

    // --- Tick ---

    TickReport CurrencyMonitor::runTick() {
        std::lock_guard<std::mutex> tick_lock(tick_mutex_);
        auto logger = core::logging::getLogger();

        TickReport report;
        report.tick = ++tick_count_;
        report.started_at = std::chrono::system_clock::now();
        const bool refresh_series = config_.series_refresh_ticks <= 1 ||
                                    (report.tick - 1) % static_cast<std::uint64_t>(config_.series_refresh_ticks) == 0;
        logger->debug("Tick {} started ({} pairs, series refresh: {})",
                      report.tick, config_.tracked_pairs.size(), refresh_series);

        const std::size_t workers = static_cast<std::size_t>(config_.analysis_workers);

        // --- Polling ---
        state_.store(MonitorState::Polling);
        auto fetched = runPerPair<FetchResult>(config_.tracked_pairs, workers, token_,
            [this, refresh_series](const core::CurrencyPair& pair) { return fetchPair(pair, refresh_series); });

        restored_fresh_.clear();

        if (token_.isCancelled()) {
            report.cancelled = true;
            logger->info("Tick {} cancelled after polling.", report.tick);
            return report;
        }

        std::map<core::CurrencyPair, core::Quote> quotes;
        std::vector<core::CurrencyPair> ready;
        std::vector<PairFailure> failures;
        for (const auto& f : fetched) {
            if (f.failure) {
                failures.push_back(*f.failure);
            } else if (f.quote) {
                quotes[f.pair] = *f.quote;
                ready.push_back(f.pair);
            }
        }

        // --- Analyzing ---
        state_.store(MonitorState::Analyzing);
        auto analyzed = runPerPair<AnalysisResult>(ready, workers, token_,
            [this](const core::CurrencyPair& pair) { return analyzePair(pair); });

        if (token_.isCancelled()) {
            report.cancelled = true;
            logger->info("Tick {} cancelled after analysis.", report.tick);
            return report;
        }

        // --- Deciding ---
        state_.store(MonitorState::Deciding);
        std::map<core::CurrencyPair, std::optional<core::TradingSignal>> previous_signals;
        for (const auto& a : analyzed) {
            if (a.failure) {
                failures.push_back(*a.failure);
                continue;
            }
            try {
                core::TradingSignal signal = generator_.generate(*a.indicators, quotes.at(a.pair));
                report.signals[a.pair] = signal;

                std::lock_guard<std::mutex> lock(cache_mutex_);
                auto prev_it = latest_signals_.find(a.pair);
                previous_signals[a.pair] = prev_it != latest_signals_.end()
                    ? std::optional<core::TradingSignal>(prev_it->second) : std::nullopt;
                latest_signals_[a.pair] = signal;
                latest_indicators_[a.pair] = *a.indicators;
            } catch (const core::TradingPlatformException& e) {
                failures.push_back(PairFailure{a.pair, e.what(), std::nullopt});
            }
        }

        // --- Executing ---
        state_.store(MonitorState::Executing);
        for (const auto& entry : quotes) {
            if (entry.first.involves(portfolio_->getCurrency())) {
                portfolio_->markToMarket(entry.first, entry.second);
            }
        }
        checkProtectiveExits(quotes, report);
        for (const auto& entry : report.signals) {
            executeSignal(entry.second, quotes.at(entry.first), report);
        }

        // --- Alerting ---
        state_.store(MonitorState::Alerting);
        for (const auto& entry : quotes) {
            raiseRateChange(entry.second, report);
        }
        for (const auto& entry : report.signals) {
            raiseSignalAlert(entry.second, previous_signals[entry.first], report);
        }

        std::vector<core::CurrencyPair> succeeded;
        for (const auto& entry : report.signals) {
            succeeded.push_back(entry.first);
        }
        {
            std::lock_guard<std::mutex> lock(cache_mutex_);
            for (const auto& pair : succeeded) {
                consecutive_failures_[pair] = 0;
            }
        }
        for (const auto& failure : failures) {
            recordFailure(failure, report);
        }
        report.failed_pairs = failures;

        // Rate limits slow the whole loop down; a tick without one restores the interval
        {
            std::lock_guard<std::mutex> lock(cache_mutex_);
            if (report.rate_limited) {
                backoff_multiplier_ = std::min(backoff_multiplier_ * config_.rate_limit_backoff_factor,
                                               static_cast<double>(config_.max_backoff_seconds) /
                                                   static_cast<double>(config_.interval_seconds));
                logger->warn("Rate limited by the data provider; next sleep {:.0f}s.",
                             std::min<double>(config_.interval_seconds * backoff_multiplier_, config_.max_backoff_seconds));
            } else {
                backoff_multiplier_ = 1.0;
            }
        }

        for (const auto& alert : report.alerts) {
            alerts_->push(alert);
        }

        logger->info("Tick {}: {} signals, {} failed pairs, {} alerts",
                     report.tick, report.signals.size(), report.failed_pairs.size(), report.alerts.size());

        {
            std::lock_guard<std::mutex> lock(cache_mutex_);
            last_report_ = report;
        }
        return report;
    }

    // --- Executing helpers ---

    bool CurrencyMonitor::submit(core::Transaction tx, const std::string& reason, TickReport& report) {
        auto logger = core::logging::getLogger();
        const core::CurrencyPair pair = tx.pair;
        try {
            core::Transaction stored = portfolio_->apply(tx);
            if (database_ && !database_->saveTransaction(stored)) {
                logger->error("Transaction {} applied but not persisted.", stored.id);
            }
            std::string message = fmt::format("{} {} {:.2f} {} at {:.5f} ({})",
                                              core::utils::toString(stored.side), pair.symbol(), stored.amount,
                                              portfolio_->getCurrency(), stored.price, reason);
            if (stored.realized_pnl) {
                message += fmt::format(", realized P&L {:.2f}", *stored.realized_pnl);
            }
            addAlert(report, AlertKind::TradeExecuted, pair, AlertSeverity::Info, message);
            return true;
        } catch (const core::LedgerException& e) {
            logger->warn("Transaction {} rejected: {}", tx.id, e.what());
            addAlert(report, AlertKind::TradeRejected, pair, AlertSeverity::Warning,
                     fmt::format("{} {} rejected ({}): {}", core::utils::toString(tx.side), pair.symbol(), reason, e.what()));
            return false;
        }
    }

    void CurrencyMonitor::checkProtectiveExits(const std::map<core::CurrencyPair, core::Quote>& quotes, TickReport& report) {
        for (auto it = protective_levels_.begin(); it != protective_levels_.end();) {
            const core::CurrencyPair pair = it->first;
            const ProtectiveLevels levels = it->second;
            auto position = portfolio_->getPosition(pair);
            if (!position) {
                it = protective_levels_.erase(it);
                continue;
            }
            auto quote_it = quotes.find(pair);
            if (quote_it == quotes.end()) {
                ++it;
                continue;
            }

            const core::Quote& quote = quote_it->second;
            const double mid = quote.mid();
            const bool stop_hit = levels.long_pair ? mid <= levels.stop_loss : mid >= levels.stop_loss;
            const bool take_hit = levels.long_pair ? mid >= levels.take_profit : mid <= levels.take_profit;
            if (!stop_hit && !take_hit) {
                ++it;
                continue;
            }

            // Disposing of the base means selling it at the bid, disposing of the quote buys base at the ask
            const bool foreign_is_base = pair.quote == portfolio_->getCurrency();
            const double price = foreign_is_base ? quote.bid : quote.ask;

            core::Transaction tx;
            tx.id = portfolio_->nextTransactionId();
            tx.pair = pair;
            tx.side = core::TradeSide::Sell;
            tx.amount = portfolio_->marketValue(*position, price);
            tx.price = price;
            tx.timestamp = std::chrono::system_clock::now();

            const char* reason = stop_hit ? "stop-loss" : "take-profit";
            if (submit(tx, reason, report)) {
                if (stop_hit) {
                    addAlert(report, AlertKind::StopLossHit, pair, AlertSeverity::Warning,
                             fmt::format("{} stop-loss {:.5f} hit at mid {:.5f}", pair.symbol(), levels.stop_loss, mid));
                } else {
                    addAlert(report, AlertKind::TakeProfitHit, pair, AlertSeverity::Info,
                             fmt::format("{} take-profit {:.5f} hit at mid {:.5f}", pair.symbol(), levels.take_profit, mid));
                }
                it = protective_levels_.erase(it);
            } else {
                ++it;
            }
        }
    }

    void CurrencyMonitor::executeSignal(const core::TradingSignal& signal, const core::Quote& quote, TickReport& report) {
        auto logger = core::logging::getLogger();
        const std::string& cash_currency = portfolio_->getCurrency();

        if (signal.direction == core::SignalDirection::Hold || signal.strength < config_.min_trade_strength) {
            return;
        }
        if (!signal.pair.involves(cash_currency)) {
            logger->debug("{} does not trade {}; signal is informational only.", signal.pair.symbol(), cash_currency);
            return;
        }

        const bool foreign_is_base = signal.pair.quote == cash_currency;
        // The foreign currency strengthens on Buy when it is the base, on Sell when it is the quote
        const bool acquire = foreign_is_base == (signal.direction == core::SignalDirection::Buy);
        auto position = portfolio_->getPosition(signal.pair);

        core::Transaction tx;
        tx.pair = signal.pair;
        tx.timestamp = std::chrono::system_clock::now();

        if (acquire) {
            if (position) {
                logger->debug("Already holding {} in {}; no add-on.", foreignCurrency(signal.pair, cash_currency),
                              signal.pair.symbol());
                return;
            }
            const auto snap = portfolio_->snapshot();
            const double risk_budget = snap.total_value * config_.max_risk_per_trade / 100.0;
            tx.side = core::TradeSide::Buy;
            tx.amount = std::max(0.01, std::min(snap.cash_balance, risk_budget));
            tx.price = foreign_is_base ? quote.ask : quote.bid;
            tx.id = portfolio_->nextTransactionId();

            const std::string reason = fmt::format("{} signal, strength {:.1f}",
                                                   core::utils::toString(signal.direction), signal.strength);
            if (submit(tx, reason, report)) {
                protective_levels_[signal.pair] = ProtectiveLevels{
                    signal.stop_loss, signal.take_profit, signal.direction == core::SignalDirection::Buy};
            }
        } else {
            if (!position) {
                return; // Nothing to dispose of; the ledger never goes short
            }
            tx.side = core::TradeSide::Sell;
            tx.price = foreign_is_base ? quote.bid : quote.ask;
            tx.amount = portfolio_->marketValue(*position, tx.price);
            tx.id = portfolio_->nextTransactionId();

            const std::string reason = fmt::format("{} signal, strength {:.1f}",
                                                   core::utils::toString(signal.direction), signal.strength);
            if (submit(tx, reason, report)) {
                protective_levels_.erase(signal.pair);
            }
        }
    }

    // --- Alerting helpers ---

    void CurrencyMonitor::addAlert(TickReport& report, AlertKind kind, const core::CurrencyPair& pair,
                                   AlertSeverity severity, std::string message) {
        Alert alert;
        alert.kind = kind;
        alert.pair = pair;
        alert.severity = severity;
        alert.message = std::move(message);
        alert.timestamp = std::chrono::system_clock::now();
        report.alerts.push_back(std::move(alert));
    }

    void CurrencyMonitor::raiseRateChange(const core::Quote& quote, TickReport& report) {
        auto previous = store_.previousQuote(quote.pair);
        if (!previous) {
            return;
        }
        const double before = previous->mid();
        if (!(before > 0.0)) {
            return;
        }
        const double change_pct = (quote.mid() - before) / before * 100.0;
        if (std::abs(change_pct) < config_.significant_change_threshold) {
            return;
        }
        const AlertSeverity severity = std::abs(change_pct) >= 2.0 * config_.significant_change_threshold
                                           ? AlertSeverity::Warning : AlertSeverity::Info;
        addAlert(report, AlertKind::RateChange, quote.pair, severity,
                 fmt::format("{} moved {:+.3f}% ({:.5f} -> {:.5f})",
                             quote.pair.symbol(), change_pct, before, quote.mid()));
    }

    void CurrencyMonitor::raiseSignalAlert(const core::TradingSignal& signal,
                                           const std::optional<core::TradingSignal>& previous,
                                           TickReport& report) {
        const bool changed = !previous || previous->direction != signal.direction;
        const bool strong = signal.direction != core::SignalDirection::Hold &&
                            signal.strength >= config_.strong_signal_strength;
        if (!changed && !strong) {
            return;
        }
        std::string message = fmt::format("{} {} (strength {:.1f}, confidence {:.0f}%)",
                                          signal.pair.symbol(), core::utils::toString(signal.direction),
                                          signal.strength, signal.confidence);
        if (!signal.reasoning.empty()) {
            message += ": " + signal.reasoning.front();
        }
        addAlert(report, AlertKind::SignalTriggered, signal.pair,
                 strong ? AlertSeverity::Warning : AlertSeverity::Info, std::move(message));
    }

    void CurrencyMonitor::recordFailure(const PairFailure& failure, TickReport& report) {
        auto logger = core::logging::getLogger();
        if (failure.provider_error && *failure.provider_error == core::DataProviderErrorKind::RateLimited) {
            report.rate_limited = true;
        }

        int count = 0;
        {
            std::lock_guard<std::mutex> lock(cache_mutex_);
            count = ++consecutive_failures_[failure.pair];
        }
        logger->warn("{} failed ({} in a row): {}", failure.pair.symbol(), count, failure.message);

        const std::string kind = failure.provider_error ? core::toString(*failure.provider_error) : "Analysis";
        addAlert(report, AlertKind::DataError, failure.pair, AlertSeverity::Warning,
                 fmt::format("{} [{}]: {}", failure.pair.symbol(), kind, failure.message));

        if (count == config_.failure_escalation_threshold) {
            addAlert(report, AlertKind::Degraded, failure.pair, AlertSeverity::Critical,
                     fmt::format("{} failed {} consecutive ticks; monitoring continues", failure.pair.symbol(), count));
        }
    }

    // --- Read side ---

    std::optional<core::TradingSignal> CurrencyMonitor::latestSignal(const core::CurrencyPair& pair) const {
        std::lock_guard<std::mutex> lock(cache_mutex_);
        auto it = latest_signals_.find(pair);
        if (it == latest_signals_.end()) {
            return std::nullopt;
        }
        return it->second;
    }

    std::optional<indicators::IndicatorSet> CurrencyMonitor::latestIndicators(const core::CurrencyPair& pair) const {
        std::lock_guard<std::mutex> lock(cache_mutex_);
        auto it = latest_indicators_.find(pair);
        if (it == latest_indicators_.end()) {
            return std::nullopt;
        }
        return it->second;
    }

    std::optional<TickReport> CurrencyMonitor::lastReport() const {
        std::lock_guard<std::mutex> lock(cache_mutex_);
        return last_report_;
    }

    int CurrencyMonitor::consecutiveFailures(const core::CurrencyPair& pair) const {
        std::lock_guard<std::mutex> lock(cache_mutex_);
        auto it = consecutive_failures_.find(pair);
        return it != consecutive_failures_.end() ? it->second : 0;
    }

} // namespace monitor
