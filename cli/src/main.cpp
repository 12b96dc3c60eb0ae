// cli/src/main.cpp

// Standard includes
#include <string>
#include <vector>
#include <exception>
#include <chrono>
#include <csignal>
#include <memory>

// Project includes
#include "logging.hpp"
#include "exceptions.hpp"
#include "datatypes.hpp"
#include "config.hpp"
#include "utils.hpp"
#include "database_manager.hpp"
#include "alpha_vantage_client.hpp"
#include "portfolio.hpp"
#include "alert_queue.hpp"
#include "currency_monitor.hpp"
#include "json_serialization.hpp"

#include <spdlog/spdlog.h>
#include <spdlog/logger.h>
#include <spdlog/fmt/fmt.h>
#include <nlohmann/json.hpp>
#include <cstdio>

namespace {

    volatile std::sig_atomic_t g_stop_requested = 0;

    void handleStopSignal(int) {
        g_stop_requested = 1;
    }

    void logAlert(const std::shared_ptr<spdlog::logger>& logger, const monitor::Alert& alert) {
        const std::string line = fmt::format("[{}] {} {}: {}", monitor::toString(alert.kind),
                                             alert.pair.symbol(), monitor::toString(alert.severity), alert.message);
        switch (alert.severity) {
            case monitor::AlertSeverity::Critical: logger->critical(line); break;
            case monitor::AlertSeverity::Warning:  logger->warn(line); break;
            case monitor::AlertSeverity::Info:     logger->info(line); break;
        }
    }

    // Continues a persisted ledger when the database holds one, otherwise starts fresh
    std::unique_ptr<portfolio::Portfolio> restorePortfolio(data::DatabaseManager& db,
                                                           const core::MonitoringConfig& monitoring) {
        auto meta = db.loadPortfolioMeta();
        if (!meta) {
            return nullptr;
        }
        auto logger = core::logging::getLogger();
        if (meta->currency != monitoring.initial_currency) {
            logger->warn("Persisted portfolio is in {}, configuration says {}; continuing the persisted ledger.",
                         meta->currency, monitoring.initial_currency);
        }
        return portfolio::Portfolio::replay(meta->initial_amount, meta->currency, db.loadTransactions());
    }

} // anonymous namespace

int main(int argc, char* argv[]) {
    std::shared_ptr<spdlog::logger> logger = nullptr;

    try {
        // --- Bootstrap Logging (console until the configuration is read) ---
        core::logging::initializeConsoleOnly(spdlog::level::info);
        logger = core::logging::getLogger();

        // --- Configuration ---
        const std::string config_path = argc > 1 ? argv[1] : "config/monitor.json";
        core::AppConfig config = core::config::loadFromFile(config_path);

        // --- Initialize Logging ---
        core::logging::initialize(config.logging);
        logger = core::logging::getLogger();
        logger->info("FX trading core starting with {}", config_path);

        // --- Market data ---
        auto provider = std::make_shared<data::AlphaVantageClient>(
            data::AlphaVantageClient::fromEnvironment(config.data.api_key_env, config.data.base_url,
                                                      config.data.timeout_ms));

        // --- Database Setup (optional) ---
        std::shared_ptr<data::DatabaseManager> db;
        std::unique_ptr<portfolio::Portfolio> restored;
        if (!config.data.database_path.empty()) {
            db = std::make_shared<data::DatabaseManager>(config.data.database_path);
            if (db->connect() && db->initializeSchema()) {
                restored = restorePortfolio(*db, config.monitoring);
            } else {
                logger->error("Database {} unavailable; running without persistence.", config.data.database_path);
                db.reset();
            }
        }

        // --- Monitor ---
        auto alerts = std::make_shared<monitor::AlertQueue>();
        std::unique_ptr<monitor::CurrencyMonitor> currency_monitor;
        if (restored) {
            logger->info("Continuing persisted portfolio ({} transactions).", restored->getTransactions().size());
            currency_monitor = std::make_unique<monitor::CurrencyMonitor>(
                config.monitoring, config.signal, provider, alerts, std::move(restored), db);
        } else {
            currency_monitor = std::make_unique<monitor::CurrencyMonitor>(
                config.monitoring, config.signal, provider, alerts, db);
        }

        std::signal(SIGINT, handleStopSignal);
        std::signal(SIGTERM, handleStopSignal);

        currency_monitor->start();
        logger->info("Monitoring {} pairs every {}s. Press Ctrl+C to stop.",
                     config.monitoring.tracked_pairs.size(), config.monitoring.interval_seconds);

        while (!g_stop_requested && currency_monitor->isRunning()) {
            if (auto alert = alerts->waitPop(std::chrono::milliseconds(250))) {
                logAlert(logger, *alert);
            }
        }

        logger->info("Stop requested, shutting down monitor...");
        currency_monitor->stop();
        for (const auto& alert : alerts->drain()) {
            logAlert(logger, alert);
        }

        const auto snapshot = currency_monitor->snapshot();
        snapshot.logSummary();
        logger->debug("Final snapshot: {}", nlohmann::json(snapshot).dump());

    } catch (const core::ConfigException& e) {
        if (logger) logger->critical("Configuration error: {}", e.what());
        else fmt::print(stderr, "Configuration error: {}\n", e.what());
        return 2;
    } catch (const core::DataProviderException& e) {
        if (logger) logger->critical("Market data provider error ({}): {}", core::toString(e.kind()), e.what());
        else fmt::print(stderr, "Market data provider error: {}\n", e.what());
        return 3;
    } catch (const core::TradingPlatformException& e) {
        if (logger) logger->critical("Trading platform error: {}", e.what());
        else fmt::print(stderr, "Trading platform error: {}\n", e.what());
        return 1;
    } catch (const std::exception& e) {
        if (logger) logger->critical("Unhandled standard exception: {}", e.what());
        else fmt::print(stderr, "Unhandled standard exception: {}\n", e.what());
        return 1;
    }

    if (logger) logger->info("FX trading core finished.");
    spdlog::shutdown();
    return 0;
}
