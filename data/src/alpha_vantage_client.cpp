#include "alpha_vantage_client.hpp"
#include "logging.hpp"
#include "exceptions.hpp"
#include "utils.hpp"

#include <cpr/cpr.h>
#include <nlohmann/json.hpp>

#include <algorithm>
#include <cstdlib>
#include <functional>
#include <utility>
#include <stdexcept>
#include <spdlog/fmt/fmt.h>

namespace data {

namespace {

    using Kind = core::DataProviderErrorKind;

    bool contains(const std::string& haystack, const std::string& needle) {
        return haystack.find(needle) != std::string::npos;
    }

    double parseNumber(const json& node, const std::string& field, const std::string& context) {
        if (!node.contains(field)) {
            throw core::DataProviderException(Kind::Malformed,
                fmt::format("Missing field '{}' in {} response", field, context));
        }
        const json& value = node.at(field);
        try {
            if (value.is_number()) {
                return value.get<double>();
            }
            if (value.is_string()) {
                std::size_t consumed = 0;
                const std::string text = value.get<std::string>();
                double parsed = std::stod(text, &consumed);
                if (consumed == text.size()) {
                    return parsed;
                }
            }
        } catch (const std::exception&) {
            // Reported below
        }
        throw core::DataProviderException(Kind::Malformed,
            fmt::format("Field '{}' in {} response is not a number: {}", field, context, value.dump()));
    }

} // anonymous namespace

// Constructor Implementation
AlphaVantageClient::AlphaVantageClient(const std::string& api_key,
                                       const std::string& base_url,
                                       int timeout_ms)
    : api_key_(api_key), base_url_(base_url), timeout_ms_(timeout_ms)
{
    if (api_key_.empty()) {
        throw core::DataProviderException(Kind::AuthFailed, "Alpha Vantage API key is empty");
    }
    core::logging::getLogger()->debug("AlphaVantageClient created for {} (timeout {} ms).", base_url_, timeout_ms_);
}

AlphaVantageClient AlphaVantageClient::fromEnvironment(const std::string& env_var,
                                                       const std::string& base_url,
                                                       int timeout_ms) {
    const char* key = std::getenv(env_var.c_str());
    if (key == nullptr || std::string(key).empty()) {
        throw core::DataProviderException(Kind::AuthFailed,
            fmt::format("Environment variable {} is not set", env_var));
    }
    return AlphaVantageClient(key, base_url, timeout_ms);
}

void AlphaVantageClient::setAbortCheck(std::function<bool()> check) {
    abort_check_ = std::move(check);
}

json AlphaVantageClient::performGetRequest(const std::vector<std::pair<std::string, std::string>>& params,
                                           const std::string& context) {
    auto logger = core::logging::getLogger();

    cpr::Parameters parameters;
    for (const auto& p : params) {
        parameters.Add(cpr::Parameter{p.first, p.second});
    }
    parameters.Add(cpr::Parameter{"apikey", api_key_});

    const std::string url = base_url_ + "/query";
    logger->debug("Requesting Alpha Vantage {} for {}", url, context);

    // Returning false from the progress callback makes libcurl drop the transfer
    const std::function<bool()> abort_check = abort_check_;
    cpr::Response response = cpr::Get(cpr::Url{url},
                                      parameters,
                                      cpr::Header{{"Accept", "application/json"}},
                                      cpr::Timeout{timeout_ms_},
                                      cpr::ProgressCallback{
                                          [&abort_check](cpr::cpr_off_t, cpr::cpr_off_t,
                                                         cpr::cpr_off_t, cpr::cpr_off_t, intptr_t) -> bool {
                                              return !(abort_check && abort_check());
                                          }});

    logger->debug("Alpha Vantage response status: {}, body size: {}", response.status_code, response.text.length());

    // --- Transport and HTTP status ---
    if (response.error && abort_check && abort_check()) {
        throw core::DataProviderException(Kind::Network,
            fmt::format("Request for {} abandoned on shutdown", context));
    }
    if (response.error) {
        throw core::DataProviderException(Kind::Network,
            fmt::format("Request for {} failed: {} (cpr code {})",
                        context, response.error.message, static_cast<int>(response.error.code)));
    }
    if (response.status_code == 401 || response.status_code == 403) {
        throw core::DataProviderException(Kind::AuthFailed,
            fmt::format("Alpha Vantage rejected the API key for {} (HTTP {})", context, response.status_code));
    }
    if (response.status_code == 429) {
        throw core::DataProviderException(Kind::RateLimited,
            fmt::format("Alpha Vantage rate limit reached for {} (HTTP 429)", context));
    }
    if (response.status_code >= 500) {
        throw core::DataProviderException(Kind::Network,
            fmt::format("Alpha Vantage server error for {} (HTTP {})", context, response.status_code));
    }
    if (response.status_code != 200) {
        throw core::DataProviderException(Kind::NotFound,
            fmt::format("Alpha Vantage request for {} failed with HTTP {}", context, response.status_code));
    }

    // --- Parse JSON Response ---
    json body;
    try {
        body = json::parse(response.text);
    } catch (const json::parse_error& e) {
        throw core::DataProviderException(Kind::Malformed,
            fmt::format("Unparsable {} response: {}", context, e.what()));
    }

    checkApiError(body, context);
    return body;
}

void AlphaVantageClient::checkApiError(const json& body, const std::string& context) {
    if (!body.is_object()) {
        throw core::DataProviderException(Kind::Malformed,
            fmt::format("{} response is not a JSON object", context));
    }

    if (body.contains("Error Message") && body["Error Message"].is_string()) {
        const std::string message = body["Error Message"].get<std::string>();
        if (contains(message, "API key") || contains(message, "apikey")) {
            throw core::DataProviderException(Kind::AuthFailed,
                fmt::format("API key issue for {}: {}", context, message));
        }
        if (contains(message, "Invalid API call")) {
            throw core::DataProviderException(Kind::NotFound,
                fmt::format("Invalid request for {}: {}", context, message));
        }
        throw core::DataProviderException(Kind::NotFound,
            fmt::format("Alpha Vantage error for {}: {}", context, message));
    }

    for (const char* field : {"Note", "Information"}) {
        if (body.contains(field) && body[field].is_string()) {
            const std::string message = body[field].get<std::string>();
            if (contains(message, "API call frequency") || contains(message, "rate limit")) {
                throw core::DataProviderException(Kind::RateLimited,
                    fmt::format("API rate limit reached for {}: {}", context, message));
            }
            if (contains(message, "API key") || contains(message, "apikey")) {
                throw core::DataProviderException(Kind::AuthFailed,
                    fmt::format("API key issue for {}: {}", context, message));
            }
        }
    }
}

core::Quote AlphaVantageClient::parseQuote(const json& body, const core::CurrencyPair& pair) {
    const std::string context = fmt::format("quote {}", pair.symbol());
    checkApiError(body, context);

    if (!body.contains("Realtime Currency Exchange Rate") || !body["Realtime Currency Exchange Rate"].is_object()) {
        throw core::DataProviderException(Kind::Malformed,
            fmt::format("Missing 'Realtime Currency Exchange Rate' section in {} response", context));
    }
    const json& rate = body["Realtime Currency Exchange Rate"];

    core::Quote quote;
    quote.pair = pair;
    quote.bid = parseNumber(rate, "8. Bid Price", context);
    quote.ask = parseNumber(rate, "9. Ask Price", context);
    quote.timestamp = std::chrono::system_clock::now();

    if (rate.contains("6. Last Refreshed") && rate["6. Last Refreshed"].is_string()) {
        try {
            quote.timestamp = core::utils::parseUtcDateTime(rate["6. Last Refreshed"].get<std::string>());
        } catch (const std::runtime_error& e) {
            core::logging::getLogger()->debug("Using local time for {}: {}", context, e.what());
        }
    }
    return quote;
}

core::TimeSeries<core::PriceBar> AlphaVantageClient::parseSeries(const json& body,
                                                                 const std::string& series_key,
                                                                 const std::string& context) {
    checkApiError(body, context);

    if (!body.contains(series_key)) {
        throw core::DataProviderException(Kind::NotFound,
            fmt::format("No '{}' section in {} response", series_key, context));
    }
    const json& series = body[series_key];
    if (!series.is_object()) {
        throw core::DataProviderException(Kind::Malformed,
            fmt::format("'{}' in {} response is not an object", series_key, context));
    }
    if (series.empty()) {
        throw core::DataProviderException(Kind::NotFound,
            fmt::format("Empty series in {} response", context));
    }

    core::TimeSeries<core::PriceBar> bars;
    bars.reserve(series.size());
    for (auto it = series.begin(); it != series.end(); ++it) {
        core::PriceBar bar;
        try {
            bar.timestamp = core::utils::parseUtcDateTime(it.key());
        } catch (const std::runtime_error& e) {
            throw core::DataProviderException(Kind::Malformed,
                fmt::format("Bad timestamp '{}' in {} response: {}", it.key(), context, e.what()));
        }
        bar.open = parseNumber(it.value(), "1. open", context);
        bar.high = parseNumber(it.value(), "2. high", context);
        bar.low = parseNumber(it.value(), "3. low", context);
        bar.close = parseNumber(it.value(), "4. close", context);
        bars.push_back(bar);
    }

    // Alpha Vantage lists newest first; nlohmann orders keys lexically. Sort either way.
    std::sort(bars.begin(), bars.end());
    return bars;
}

// --- Data Fetching Methods ---

core::Quote AlphaVantageClient::getQuote(const core::CurrencyPair& pair) {
    const std::string context = fmt::format("quote {}", pair.symbol());
    json body = performGetRequest({{"function", "CURRENCY_EXCHANGE_RATE"},
                                   {"from_currency", pair.base},
                                   {"to_currency", pair.quote}},
                                  context);
    core::Quote quote = parseQuote(body, pair);
    core::logging::getLogger()->debug("Quote {}: bid={} ask={}", pair.symbol(), quote.bid, quote.ask);
    return quote;
}

core::TimeSeries<core::PriceBar> AlphaVantageClient::getDailySeries(const core::CurrencyPair& pair,
                                                                    const std::string& outputsize) {
    if (outputsize != "compact" && outputsize != "full") {
        throw std::invalid_argument("outputsize must be 'compact' or 'full', got '" + outputsize + "'");
    }
    const std::string context = fmt::format("daily series {}", pair.symbol());
    json body = performGetRequest({{"function", "FX_DAILY"},
                                   {"from_symbol", pair.base},
                                   {"to_symbol", pair.quote},
                                   {"outputsize", outputsize}},
                                  context);
    auto bars = parseSeries(body, "Time Series FX (Daily)", context);
    core::logging::getLogger()->info("Received {} daily bars for {}.", bars.size(), pair.symbol());
    return bars;
}

core::TimeSeries<core::PriceBar> AlphaVantageClient::getIntradaySeries(const core::CurrencyPair& pair,
                                                                       const std::string& interval) {
    if (!isIntradayInterval(interval)) {
        throw std::invalid_argument("Unsupported intraday interval: '" + interval + "'");
    }
    const std::string context = fmt::format("intraday series {} ({})", pair.symbol(), interval);
    json body = performGetRequest({{"function", "FX_INTRADAY"},
                                   {"from_symbol", pair.base},
                                   {"to_symbol", pair.quote},
                                   {"interval", interval}},
                                  context);
    auto bars = parseSeries(body, fmt::format("Time Series FX ({})", interval), context);
    core::logging::getLogger()->info("Received {} {} bars for {}.", bars.size(), interval, pair.symbol());
    return bars;
}

} // namespace data
