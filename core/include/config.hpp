#pragma once

#include "datatypes.hpp"
#include "logging.hpp"
#include <nlohmann/json.hpp>
#include <string>
#include <vector>

namespace core {

    using json = nlohmann::json;

    // Parameters of the rule-based signal generator
    struct SignalConfig {
        double rsi_weight = 0.40;
        double macd_weight = 0.35;
        double trend_weight = 0.25;
        double buy_threshold = 20.0;   // net score > threshold -> Buy
        double sell_threshold = -20.0; // net score < threshold -> Sell
        double base_confidence = 90.0;
        double stop_loss_multiplier = 1.5;   // x ATR
        double take_profit_multiplier = 2.5; // x ATR
    };

    struct MonitoringConfig {
        double initial_amount = 10000.0;
        std::string initial_currency = "USD";
        int interval_seconds = 60;
        std::vector<CurrencyPair> tracked_pairs;
        double significant_change_threshold = 0.5; // percent
        double max_risk_per_trade = 10.0;          // percent of portfolio value per trade
        double strong_signal_strength = 60.0;
        double min_trade_strength = 30.0;
        int failure_escalation_threshold = 3;      // consecutive failures before Degraded
        double rate_limit_backoff_factor = 2.0;
        int max_backoff_seconds = 600;
        std::string series_outputsize = "compact";
        int series_refresh_ticks = 10;
        std::size_t max_bars_per_pair = 500;
        int analysis_workers = 4;                  // concurrent per-pair analysis tasks
    };

    struct DataConfig {
        std::string api_key_env = "ALPHA_VANTAGE_API_KEY";
        std::string base_url = "https://www.alphavantage.co";
        int timeout_ms = 15000;
        std::string database_path; // Empty disables persistence
    };

    struct AppConfig {
        MonitoringConfig monitoring;
        SignalConfig signal;
        DataConfig data;
        logging::LogSettings logging;
    };

    namespace config {

        // Pairs watched when the config names none
        std::vector<CurrencyPair> defaultTrackedPairs();

        AppConfig defaultConfig();

        // Parse + validate. Missing keys keep their defaults. Throws ConfigException.
        AppConfig fromJson(const json& root);
        SignalConfig signalConfigFromJson(const json& node);
        logging::LogSettings logSettingsFromJson(const json& node);

        AppConfig loadFromFile(const std::string& path);

        // Throws ConfigException naming the offending field
        void validate(const MonitoringConfig& monitoring);
        void validate(const SignalConfig& signal);

    } // namespace config

} // namespace core
