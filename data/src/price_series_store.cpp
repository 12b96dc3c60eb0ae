#include "price_series_store.hpp"
#include "exceptions.hpp"
#include "logging.hpp"
#include "utils.hpp"

#include <algorithm>
#include <stdexcept>
#include <spdlog/fmt/fmt.h>

namespace data {

PriceSeriesStore::PriceSeriesStore(std::size_t max_bars_per_pair)
    : max_bars_per_pair_(max_bars_per_pair) {
    if (max_bars_per_pair_ == 0) {
        throw std::invalid_argument("PriceSeriesStore retention must be at least one bar.");
    }
}

void PriceSeriesStore::appendLocked(const core::CurrencyPair& pair, const core::PriceBar& bar) {
    if (!(bar.open > 0.0) || !(bar.high > 0.0) || !(bar.low > 0.0) || !(bar.close > 0.0)) {
        throw core::DataLoadException(fmt::format(
            "Bar for {} at {} has a non-positive price", pair.symbol(), core::utils::timestampToString(bar.timestamp)));
    }
    if (bar.high < bar.low) {
        throw core::DataLoadException(fmt::format(
            "Bar for {} at {} has high {} below low {}", pair.symbol(),
            core::utils::timestampToString(bar.timestamp), bar.high, bar.low));
    }

    auto& stored = series_[pair].bars;
    if (!stored.empty() && !(stored.back().timestamp < bar.timestamp)) {
        throw core::DataLoadException(fmt::format(
            "Bar for {} at {} is not after the last stored bar ({})", pair.symbol(),
            core::utils::timestampToString(bar.timestamp),
            core::utils::timestampToString(stored.back().timestamp)));
    }

    stored.push_back(bar);
    if (stored.size() > max_bars_per_pair_) {
        stored.erase(stored.begin(), stored.begin() + static_cast<std::ptrdiff_t>(stored.size() - max_bars_per_pair_));
    }
}

void PriceSeriesStore::append(const core::CurrencyPair& pair, const core::PriceBar& bar) {
    std::lock_guard<std::mutex> lock(mutex_);
    appendLocked(pair, bar);
}

std::size_t PriceSeriesStore::merge(const core::CurrencyPair& pair, core::TimeSeries<core::PriceBar> bars) {
    auto logger = core::logging::getLogger();
    std::sort(bars.begin(), bars.end());

    std::lock_guard<std::mutex> lock(mutex_);
    std::size_t appended = 0;
    for (const auto& bar : bars) {
        const auto& stored = series_[pair].bars;
        if (!stored.empty() && !(stored.back().timestamp < bar.timestamp)) {
            continue; // Already have it
        }
        try {
            appendLocked(pair, bar);
            ++appended;
        } catch (const core::DataLoadException& e) {
            logger->warn("Skipping bar during merge: {}", e.what());
        }
    }
    logger->debug("Merged {} new bars for {} ({} offered, {} stored)",
                  appended, pair.symbol(), bars.size(), series_[pair].bars.size());
    return appended;
}

core::TimeSeries<core::PriceBar> PriceSeriesStore::bars(const core::CurrencyPair& pair) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = series_.find(pair);
    return it != series_.end() ? it->second.bars : core::TimeSeries<core::PriceBar>{};
}

core::TimeSeries<core::PriceBar> PriceSeriesStore::window(const core::CurrencyPair& pair, std::size_t n) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = series_.find(pair);
    if (it == series_.end()) {
        return {};
    }
    const auto& stored = it->second.bars;
    const std::size_t count = std::min(n, stored.size());
    return core::TimeSeries<core::PriceBar>(stored.end() - static_cast<std::ptrdiff_t>(count), stored.end());
}

std::size_t PriceSeriesStore::barCount(const core::CurrencyPair& pair) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = series_.find(pair);
    return it != series_.end() ? it->second.bars.size() : 0;
}

void PriceSeriesStore::updateQuote(const core::Quote& quote) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto& entry = series_[quote.pair];
    entry.previous = entry.latest;
    entry.latest = quote;
}

std::optional<core::Quote> PriceSeriesStore::latestQuote(const core::CurrencyPair& pair) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = series_.find(pair);
    return it != series_.end() ? it->second.latest : std::nullopt;
}

std::optional<core::Quote> PriceSeriesStore::previousQuote(const core::CurrencyPair& pair) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = series_.find(pair);
    return it != series_.end() ? it->second.previous : std::nullopt;
}

std::vector<core::CurrencyPair> PriceSeriesStore::pairs() const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<core::CurrencyPair> result;
    result.reserve(series_.size());
    for (const auto& entry : series_) {
        result.push_back(entry.first);
    }
    return result;
}

} // namespace data
