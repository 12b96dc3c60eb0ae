#pragma once

#include <algorithm>
#include <array>
#include <functional>
#include <string>
#include "datatypes.hpp"

namespace data {

inline constexpr std::array<const char*, 5> kIntradayIntervals = {"1min", "5min", "15min", "30min", "60min"};

inline bool isIntradayInterval(const std::string& interval) {
    return std::any_of(kIntradayIntervals.begin(), kIntradayIntervals.end(),
                       [&interval](const char* known) { return interval == known; });
}

// Source of quotes and OHLC series. Implementations report failures by throwing
// core::DataProviderException with a distinguishable kind.
class IMarketDataProvider {
public:
    virtual ~IMarketDataProvider() = default;

    virtual core::Quote getQuote(const core::CurrencyPair& pair) = 0;

    // outputsize: "compact" (about 100 bars) or "full". Ascending by timestamp.
    virtual core::TimeSeries<core::PriceBar> getDailySeries(const core::CurrencyPair& pair,
                                                            const std::string& outputsize) = 0;

    // interval: one of kIntradayIntervals. Ascending by timestamp.
    virtual core::TimeSeries<core::PriceBar> getIntradaySeries(const core::CurrencyPair& pair,
                                                               const std::string& interval) = 0;

    // Polled while a request is in flight. Once it returns true the request is
    // abandoned with DataProviderException(Network). An empty function clears it.
    virtual void setAbortCheck(std::function<bool()> check) { (void)check; }
};

} // namespace data
