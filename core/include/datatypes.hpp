#pragma once

#include <string>
#include <vector>
#include <chrono> // For timestamps
#include <optional> // For nullable realized PnL

namespace core {

    // Using system_clock for time points (all timestamps are UTC)
    using Timestamp = std::chrono::system_clock::time_point;

    // Basic TimeSeries concept
    template<typename T>
    using TimeSeries = std::vector<T>;

    // A currency pair such as "EUR/USD": price is quoted in QUOTE units per BASE unit
    struct CurrencyPair {
        std::string base;
        std::string quote;

        std::string symbol() const { return base + "/" + quote; }
        bool isJpyQuoted() const { return quote == "JPY"; }
        bool involves(const std::string& currency) const {
            return base == currency || quote == currency;
        }

        bool operator==(const CurrencyPair& other) const {
            return base == other.base && quote == other.quote;
        }
        bool operator!=(const CurrencyPair& other) const { return !(*this == other); }
        bool operator<(const CurrencyPair& other) const { return symbol() < other.symbol(); }
    };

    struct PriceBar {
        Timestamp timestamp;
        double open = 0.0;
        double high = 0.0;
        double low = 0.0;
        double close = 0.0;

        bool operator<(const PriceBar& other) const {
            return timestamp < other.timestamp;
        }
    };

    struct Quote {
        CurrencyPair pair;
        double bid = 0.0;
        double ask = 0.0;
        Timestamp timestamp;

        double mid() const { return (bid + ask) / 2.0; }
    };

    enum class SignalDirection {
        Buy,
        Sell,
        Hold
    };

    enum class TradeSide {
        Buy,  // Acquire the pair's foreign currency with portfolio cash
        Sell  // Dispose of the foreign currency back into portfolio cash
    };

    enum class RiskLevel {
        Low,
        Medium,
        High
    };

    struct TradingSignal {
        CurrencyPair pair;
        SignalDirection direction = SignalDirection::Hold;
        double score = 0.0;       // Signed net score in [-100, 100]
        double strength = 0.0;    // |score|
        double confidence = 0.0;  // [0, 100]
        double entry_price = 0.0;
        double stop_loss = 0.0;
        double take_profit = 0.0;
        RiskLevel risk_level = RiskLevel::High;
        std::vector<std::string> reasoning; // Contributing factors, strongest first
        Timestamp generated_at;
    };

    struct Transaction {
        std::string id;
        CurrencyPair pair;
        TradeSide side = TradeSide::Buy;
        double amount = 0.0; // Portfolio-currency notional
        double price = 0.0;  // Pair rate (quote per base)
        Timestamp timestamp;
        std::optional<double> realized_pnl; // Set by the ledger on offsetting trades
    };

    // Open holding for one pair. One amount is the portfolio currency committed,
    // the other is the foreign currency held.
    struct Position {
        CurrencyPair pair;
        double base_amount = 0.0;
        double quote_amount = 0.0;
        double average_entry_price = 0.0; // quote_amount / base_amount
        Timestamp last_update_time;
    };

} // namespace core
