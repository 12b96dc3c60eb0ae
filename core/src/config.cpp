#include "config.hpp"
#include "exceptions.hpp"
#include "logging.hpp"
#include "utils.hpp"

#include <fstream>
#include <stdexcept>
#include <cmath>

namespace core {
namespace config {

    namespace {

        // Reads an optional field, keeping the default when absent
        template <typename T>
        void readField(const json& node, const char* key, T& target, const std::string& section) {
            if (!node.contains(key)) {
                return;
            }
            try {
                target = node.at(key).get<T>();
            } catch (const json::exception& e) {
                throw ConfigException("Invalid value for '" + section + "." + key + "': " + e.what());
            }
        }

        void requirePositive(double value, const std::string& field) {
            if (!(value > 0.0) || !std::isfinite(value)) {
                throw ConfigException("Configuration field '" + field + "' must be positive.");
            }
        }

    } // namespace

    std::vector<CurrencyPair> defaultTrackedPairs() {
        std::vector<CurrencyPair> pairs;
        for (const char* symbol : {"USD/EUR", "USD/GBP", "USD/JPY", "EUR/GBP",
                                   "GBP/JPY", "USD/CHF", "USD/CAD", "AUD/USD"}) {
            pairs.push_back(utils::parsePair(symbol));
        }
        return pairs;
    }

    AppConfig defaultConfig() {
        AppConfig cfg;
        cfg.monitoring.tracked_pairs = defaultTrackedPairs();
        return cfg;
    }

    SignalConfig signalConfigFromJson(const json& node) {
        SignalConfig signal;
        if (!node.is_object()) {
            throw ConfigException("'signal' configuration must be an object.");
        }
        const std::string section = "signal";
        readField(node, "rsi_weight", signal.rsi_weight, section);
        readField(node, "macd_weight", signal.macd_weight, section);
        readField(node, "trend_weight", signal.trend_weight, section);
        readField(node, "buy_threshold", signal.buy_threshold, section);
        readField(node, "sell_threshold", signal.sell_threshold, section);
        readField(node, "base_confidence", signal.base_confidence, section);
        readField(node, "stop_loss_multiplier", signal.stop_loss_multiplier, section);
        readField(node, "take_profit_multiplier", signal.take_profit_multiplier, section);
        validate(signal);
        return signal;
    }

    logging::LogSettings logSettingsFromJson(const json& node) {
        if (!node.is_object()) {
            throw ConfigException("'logging' configuration must be an object.");
        }
        logging::LogSettings settings;
        const std::string section = "logging";
        auto readLevel = [&](const char* key, spdlog::level::level_enum& target) {
            std::string name;
            readField(node, key, name, section);
            if (!name.empty() && !logging::tryParseLevel(name, target)) {
                throw ConfigException("Unknown log level '" + name + "' for 'logging." + key + "'.");
            }
        };
        readLevel("console_level", settings.console_level);
        readLevel("file_level", settings.file_level);
        readField(node, "directory", settings.directory, section);
        readField(node, "base_name", settings.base_name, section);
        readField(node, "file_enabled", settings.file_enabled, section);
        readField(node, "max_file_size_mb", settings.max_file_size_mb, section);
        readField(node, "max_files", settings.max_files, section);
        if (settings.file_enabled && (settings.max_file_size_mb == 0 || settings.max_files == 0)) {
            throw ConfigException("'logging.max_file_size_mb' and 'logging.max_files' must be positive.");
        }
        if (settings.base_name.empty()) {
            throw ConfigException("'logging.base_name' must not be empty.");
        }
        return settings;
    }

    AppConfig fromJson(const json& root) {
        if (!root.is_object()) {
            throw ConfigException("Configuration root must be a JSON object.");
        }
        AppConfig cfg = defaultConfig();

        if (root.contains("monitoring")) {
            const json& node = root.at("monitoring");
            const std::string section = "monitoring";
            auto& m = cfg.monitoring;
            readField(node, "initial_amount", m.initial_amount, section);
            readField(node, "initial_currency", m.initial_currency, section);
            readField(node, "interval_seconds", m.interval_seconds, section);
            readField(node, "significant_change_threshold", m.significant_change_threshold, section);
            readField(node, "max_risk_per_trade", m.max_risk_per_trade, section);
            readField(node, "strong_signal_strength", m.strong_signal_strength, section);
            readField(node, "min_trade_strength", m.min_trade_strength, section);
            readField(node, "failure_escalation_threshold", m.failure_escalation_threshold, section);
            readField(node, "rate_limit_backoff_factor", m.rate_limit_backoff_factor, section);
            readField(node, "max_backoff_seconds", m.max_backoff_seconds, section);
            readField(node, "series_outputsize", m.series_outputsize, section);
            readField(node, "series_refresh_ticks", m.series_refresh_ticks, section);
            readField(node, "max_bars_per_pair", m.max_bars_per_pair, section);
            readField(node, "analysis_workers", m.analysis_workers, section);

            if (node.contains("tracked_pairs")) {
                std::vector<std::string> symbols;
                readField(node, "tracked_pairs", symbols, section);
                m.tracked_pairs.clear();
                for (const auto& symbol : symbols) {
                    try {
                        m.tracked_pairs.push_back(utils::parsePair(symbol));
                    } catch (const std::invalid_argument& e) {
                        throw ConfigException(std::string("Invalid entry in 'monitoring.tracked_pairs': ") + e.what());
                    }
                }
            }
        }

        if (root.contains("signal")) {
            cfg.signal = signalConfigFromJson(root.at("signal"));
        }

        if (root.contains("data")) {
            const json& node = root.at("data");
            const std::string section = "data";
            readField(node, "api_key_env", cfg.data.api_key_env, section);
            readField(node, "base_url", cfg.data.base_url, section);
            readField(node, "timeout_ms", cfg.data.timeout_ms, section);
            readField(node, "database_path", cfg.data.database_path, section);
            if (cfg.data.timeout_ms <= 0) {
                throw ConfigException("Configuration field 'data.timeout_ms' must be positive.");
            }
        }

        if (root.contains("logging")) {
            cfg.logging = logSettingsFromJson(root.at("logging"));
        }

        validate(cfg.monitoring);
        return cfg;
    }

    AppConfig loadFromFile(const std::string& path) {
        auto logger = logging::getLogger();
        logger->info("Loading configuration from: {}", path);

        std::ifstream ifs(path);
        if (!ifs.is_open()) {
            throw ConfigException("Failed to open configuration file: " + path);
        }
        json root;
        try {
            root = json::parse(ifs);
        } catch (const json::parse_error& e) {
            throw ConfigException("Failed to parse configuration file '" + path + "': " + e.what());
        }
        AppConfig cfg = fromJson(root);
        logger->info("Configuration loaded: {} tracked pairs, interval {}s, initial {:.2f} {}",
                     cfg.monitoring.tracked_pairs.size(), cfg.monitoring.interval_seconds,
                     cfg.monitoring.initial_amount, cfg.monitoring.initial_currency);
        return cfg;
    }

    void validate(const MonitoringConfig& m) {
        requirePositive(m.initial_amount, "monitoring.initial_amount");
        if (!utils::isCurrencyCode(m.initial_currency)) {
            throw ConfigException("Configuration field 'monitoring.initial_currency' must be a three-letter uppercase code, got '" +
                                  m.initial_currency + "'.");
        }
        if (m.interval_seconds <= 0) {
            throw ConfigException("Configuration field 'monitoring.interval_seconds' must be positive.");
        }
        if (m.tracked_pairs.empty()) {
            throw ConfigException("Configuration field 'monitoring.tracked_pairs' must not be empty.");
        }
        requirePositive(m.significant_change_threshold, "monitoring.significant_change_threshold");
        if (!(m.max_risk_per_trade > 0.0 && m.max_risk_per_trade <= 100.0)) {
            throw ConfigException("Configuration field 'monitoring.max_risk_per_trade' must be in (0, 100].");
        }
        if (m.strong_signal_strength < 0.0 || m.strong_signal_strength > 100.0) {
            throw ConfigException("Configuration field 'monitoring.strong_signal_strength' must be in [0, 100].");
        }
        if (m.min_trade_strength < 0.0 || m.min_trade_strength > 100.0) {
            throw ConfigException("Configuration field 'monitoring.min_trade_strength' must be in [0, 100].");
        }
        if (m.failure_escalation_threshold <= 0) {
            throw ConfigException("Configuration field 'monitoring.failure_escalation_threshold' must be positive.");
        }
        if (m.rate_limit_backoff_factor < 1.0) {
            throw ConfigException("Configuration field 'monitoring.rate_limit_backoff_factor' must be >= 1.");
        }
        if (m.max_backoff_seconds < m.interval_seconds) {
            throw ConfigException("Configuration field 'monitoring.max_backoff_seconds' must be >= interval_seconds.");
        }
        if (m.series_outputsize != "compact" && m.series_outputsize != "full") {
            throw ConfigException("Configuration field 'monitoring.series_outputsize' must be 'compact' or 'full'.");
        }
        if (m.series_refresh_ticks <= 0) {
            throw ConfigException("Configuration field 'monitoring.series_refresh_ticks' must be positive.");
        }
        if (m.max_bars_per_pair < 26) {
            throw ConfigException("Configuration field 'monitoring.max_bars_per_pair' must keep at least 26 bars.");
        }
        if (m.analysis_workers <= 0) {
            throw ConfigException("Configuration field 'monitoring.analysis_workers' must be positive.");
        }
    }

    void validate(const SignalConfig& s) {
        if (s.rsi_weight < 0.0 || s.macd_weight < 0.0 || s.trend_weight < 0.0) {
            throw ConfigException("Signal factor weights must be non-negative.");
        }
        if (!(s.rsi_weight + s.macd_weight + s.trend_weight > 0.0)) {
            throw ConfigException("At least one signal factor weight must be positive.");
        }
        if (s.buy_threshold < 0.0 || s.buy_threshold > 100.0) {
            throw ConfigException("Configuration field 'signal.buy_threshold' must be in [0, 100].");
        }
        if (s.sell_threshold > 0.0 || s.sell_threshold < -100.0) {
            throw ConfigException("Configuration field 'signal.sell_threshold' must be in [-100, 0].");
        }
        if (s.base_confidence < 0.0 || s.base_confidence > 100.0) {
            throw ConfigException("Configuration field 'signal.base_confidence' must be in [0, 100].");
        }
        requirePositive(s.stop_loss_multiplier, "signal.stop_loss_multiplier");
        requirePositive(s.take_profit_multiplier, "signal.take_profit_multiplier");
    }

} // namespace config
} // namespace core
