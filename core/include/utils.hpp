#pragma once

#include "datatypes.hpp"
#include <string>
#include <chrono>

namespace core {
namespace utils {

    // Convert Timestamp to ISO 8601 UTC string (e.g. 2024-03-01T12:00:00Z)
    std::string timestampToString(const Timestamp& ts);

    // Parse ISO 8601 string with 'Z' or +HH:MM offset to Timestamp
    Timestamp stringToTimestamp(const std::string& iso_string);

    // Parse "YYYY-MM-DD" or "YYYY-MM-DD HH:MM:SS" as UTC (market data provider format)
    Timestamp parseUtcDateTime(const std::string& text);

    // --- Currency pair helpers ---

    // Parses "EUR/USD" (case-insensitive). Throws std::invalid_argument on malformed input.
    CurrencyPair parsePair(const std::string& symbol);

    bool isCurrencyCode(const std::string& code);

    // 0.01 for JPY-quoted pairs, 0.0001 otherwise
    double pipSize(const CurrencyPair& pair);

    double spreadPips(const Quote& quote);

    // --- Enum names ---
    std::string toString(SignalDirection direction);
    std::string toString(TradeSide side);
    std::string toString(RiskLevel level);
    TradeSide tradeSideFromString(const std::string& side_str);

} // namespace utils
} // namespace core
