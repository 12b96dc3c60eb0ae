#pragma once

#include <map>
#include <mutex>
#include <optional>
#include <vector>
#include <cstddef>

#include "datatypes.hpp"

namespace data {

// Time-ordered OHLC bars and the latest two quotes per currency pair.
// All methods are thread-safe.
class PriceSeriesStore {
public:
    explicit PriceSeriesStore(std::size_t max_bars_per_pair = 500);

    // Appends one bar. Throws core::DataLoadException if the timestamp is not
    // after the last stored bar or the prices are inconsistent.
    void append(const core::CurrencyPair& pair, const core::PriceBar& bar);

    // Appends the bars newer than the last stored one; returns how many were added.
    // Invalid bars are skipped with a warning.
    std::size_t merge(const core::CurrencyPair& pair, core::TimeSeries<core::PriceBar> bars);

    // Returns copies of the stored bars
    core::TimeSeries<core::PriceBar> bars(const core::CurrencyPair& pair) const;
    // Last n bars (all of them if fewer are stored)
    core::TimeSeries<core::PriceBar> window(const core::CurrencyPair& pair, std::size_t n) const;
    std::size_t barCount(const core::CurrencyPair& pair) const;

    // Stores the quote as latest, moving the old latest to previous
    void updateQuote(const core::Quote& quote);
    std::optional<core::Quote> latestQuote(const core::CurrencyPair& pair) const;
    std::optional<core::Quote> previousQuote(const core::CurrencyPair& pair) const;

    std::vector<core::CurrencyPair> pairs() const;

private:
    // Throws core::DataLoadException; caller holds the lock
    void appendLocked(const core::CurrencyPair& pair, const core::PriceBar& bar);

    struct PairSeries {
        core::TimeSeries<core::PriceBar> bars;
        std::optional<core::Quote> latest;
        std::optional<core::Quote> previous;
    };

    const std::size_t max_bars_per_pair_;
    std::map<core::CurrencyPair, PairSeries> series_;
    mutable std::mutex mutex_;
};

} // namespace data
