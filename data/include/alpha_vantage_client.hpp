#pragma once

#include <functional>
#include <string>
#include <vector>
#include <utility>
#include <nlohmann/json.hpp>

#include "market_data_provider.hpp"

namespace data {

using json = nlohmann::json;

class AlphaVantageClient : public IMarketDataProvider {
public:
    AlphaVantageClient(const std::string& api_key,
                       const std::string& base_url = "https://www.alphavantage.co",
                       int timeout_ms = 15000);

    // Reads the key from the named environment variable.
    // Throws core::DataProviderException(AuthFailed) when it is unset or empty.
    static AlphaVantageClient fromEnvironment(const std::string& env_var = "ALPHA_VANTAGE_API_KEY",
                                              const std::string& base_url = "https://www.alphavantage.co",
                                              int timeout_ms = 15000);

    // --- Data Fetching Methods ---
    core::Quote getQuote(const core::CurrencyPair& pair) override;
    core::TimeSeries<core::PriceBar> getDailySeries(const core::CurrencyPair& pair,
                                                    const std::string& outputsize) override;
    core::TimeSeries<core::PriceBar> getIntradaySeries(const core::CurrencyPair& pair,
                                                       const std::string& interval) override;

    // Checked from libcurl's progress callback; set before requests start
    void setAbortCheck(std::function<bool()> check) override;

    // --- Response parsing (no network) ---
    // Throws core::DataProviderException for API error payloads
    static void checkApiError(const json& body, const std::string& context);
    static core::Quote parseQuote(const json& body, const core::CurrencyPair& pair);
    // series_key: e.g. "Time Series FX (Daily)"
    static core::TimeSeries<core::PriceBar> parseSeries(const json& body,
                                                        const std::string& series_key,
                                                        const std::string& context);

private:
    // GET /query with the given params plus apikey; returns the parsed body.
    json performGetRequest(const std::vector<std::pair<std::string, std::string>>& params,
                           const std::string& context);

    std::string api_key_;
    std::string base_url_;
    int timeout_ms_;
    std::function<bool()> abort_check_;
};

} // namespace data
