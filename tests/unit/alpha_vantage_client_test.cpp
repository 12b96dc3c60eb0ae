// tests/unit/alpha_vantage_client_test.cpp
#include <gtest/gtest.h>
#include "alpha_vantage_client.hpp"
#include "exceptions.hpp"
#include "utils.hpp"
#include "test_helpers.hpp"

#include <algorithm>
#include <stdexcept>
#include <string>

using data::AlphaVantageClient;
using data::json;
using Kind = core::DataProviderErrorKind;
using testing_support::pair;

namespace {

    // Runs `fn` and returns the kind of the DataProviderException it throws
    template <typename Fn>
    Kind errorKindOf(Fn fn) {
        try {
            fn();
        } catch (const core::DataProviderException& e) {
            return e.kind();
        }
        ADD_FAILURE() << "expected core::DataProviderException";
        return Kind::Malformed;
    }

    json quoteBody() {
        return json::parse(R"({
            "Realtime Currency Exchange Rate": {
                "1. From_Currency Code": "EUR",
                "3. To_Currency Code": "USD",
                "5. Exchange Rate": "1.08560000",
                "6. Last Refreshed": "2024-03-01 16:35:12",
                "7. Time Zone": "UTC",
                "8. Bid Price": "1.08540000",
                "9. Ask Price": "1.08580000"
            }
        })");
    }

    json dailyBody() {
        return json::parse(R"json({
            "Meta Data": {"1. Information": "Forex Daily Prices (open, high, low, close)"},
            "Time Series FX (Daily)": {
                "2024-03-01": {"1. open": "1.0810", "2. high": "1.0870", "3. low": "1.0800", "4. close": "1.0856"},
                "2024-02-29": {"1. open": "1.0830", "2. high": "1.0840", "3. low": "1.0795", "4. close": "1.0810"},
                "2024-02-28": {"1. open": "1.0845", "2. high": "1.0850", "3. low": "1.0820", "4. close": "1.0830"}
            }
        })json");
    }

} // anonymous namespace

TEST(AlphaVantageParseTest, ParsesQuote) {
    auto q = AlphaVantageClient::parseQuote(quoteBody(), pair("EUR/USD"));
    EXPECT_EQ(q.pair.symbol(), "EUR/USD");
    EXPECT_DOUBLE_EQ(q.bid, 1.0854);
    EXPECT_DOUBLE_EQ(q.ask, 1.0858);
    EXPECT_EQ(core::utils::timestampToString(q.timestamp), "2024-03-01T16:35:12Z");
    EXPECT_DOUBLE_EQ(core::utils::spreadPips(q), 0.4);
}

TEST(AlphaVantageParseTest, QuoteMissingSectionIsMalformed) {
    EXPECT_EQ(errorKindOf([] { AlphaVantageClient::parseQuote(json::object(), pair("EUR/USD")); }),
              Kind::Malformed);

    auto body = quoteBody();
    body["Realtime Currency Exchange Rate"].erase("8. Bid Price");
    EXPECT_EQ(errorKindOf([&] { AlphaVantageClient::parseQuote(body, pair("EUR/USD")); }), Kind::Malformed);

    body = quoteBody();
    body["Realtime Currency Exchange Rate"]["9. Ask Price"] = "n/a";
    EXPECT_EQ(errorKindOf([&] { AlphaVantageClient::parseQuote(body, pair("EUR/USD")); }), Kind::Malformed);
}

TEST(AlphaVantageParseTest, ParsesSeriesAscending) {
    auto bars = AlphaVantageClient::parseSeries(dailyBody(), "Time Series FX (Daily)", "daily series EUR/USD");
    ASSERT_EQ(bars.size(), 3u);
    EXPECT_TRUE(std::is_sorted(bars.begin(), bars.end()));
    EXPECT_EQ(core::utils::timestampToString(bars.front().timestamp), "2024-02-28T00:00:00Z");
    EXPECT_DOUBLE_EQ(bars.back().close, 1.0856);
    EXPECT_DOUBLE_EQ(bars.back().high, 1.0870);
}

TEST(AlphaVantageParseTest, SeriesErrors) {
    EXPECT_EQ(errorKindOf([] {
        AlphaVantageClient::parseSeries(json{{"Time Series FX (Daily)", json::object()}}, "Time Series FX (Daily)", "t");
    }), Kind::NotFound);

    EXPECT_EQ(errorKindOf([] {
        AlphaVantageClient::parseSeries(json{{"Meta Data", json::object()}}, "Time Series FX (Daily)", "t");
    }), Kind::NotFound);

    auto body = dailyBody();
    body["Time Series FX (Daily)"]["not-a-date"] = body["Time Series FX (Daily)"]["2024-03-01"];
    EXPECT_EQ(errorKindOf([&] { AlphaVantageClient::parseSeries(body, "Time Series FX (Daily)", "t"); }),
              Kind::Malformed);
}

TEST(AlphaVantageErrorTest, MapsApiPayloads) {
    EXPECT_EQ(errorKindOf([] {
        AlphaVantageClient::checkApiError(json{{"Note", "Thank you for using Alpha Vantage! Our standard API call frequency is 5 calls per minute."}}, "t");
    }), Kind::RateLimited);

    EXPECT_EQ(errorKindOf([] {
        AlphaVantageClient::checkApiError(json{{"Information", "You have reached the rate limit for today."}}, "t");
    }), Kind::RateLimited);

    EXPECT_EQ(errorKindOf([] {
        AlphaVantageClient::checkApiError(json{{"Error Message", "the parameter apikey is invalid or missing."}}, "t");
    }), Kind::AuthFailed);

    EXPECT_EQ(errorKindOf([] {
        AlphaVantageClient::checkApiError(json{{"Error Message", "Invalid API call. Please retry or visit the documentation."}}, "t");
    }), Kind::NotFound);

    EXPECT_EQ(errorKindOf([] { AlphaVantageClient::checkApiError(json::array(), "t"); }), Kind::Malformed);
}

TEST(AlphaVantageErrorTest, UnrelatedInformationIsNotAnError) {
    EXPECT_NO_THROW(AlphaVantageClient::checkApiError(json{{"Information", "Data is delayed by 15 minutes."}}, "t"));
    EXPECT_NO_THROW(AlphaVantageClient::checkApiError(dailyBody(), "t"));
}

TEST(AlphaVantageClientTest, MissingKeyIsAuthFailure) {
    EXPECT_EQ(errorKindOf([] { AlphaVantageClient client(""); }), Kind::AuthFailed);
    EXPECT_EQ(errorKindOf([] { AlphaVantageClient::fromEnvironment("FXT_TEST_UNSET_ALPHA_VANTAGE_KEY"); }),
              Kind::AuthFailed);
}

TEST(AlphaVantageClientTest, IntradayIntervalIsValidatedBeforeRequest) {
    AlphaVantageClient client("demo", "http://127.0.0.1:9", 500);
    EXPECT_THROW(client.getIntradaySeries(pair("EUR/USD"), "2min"), std::invalid_argument);
    EXPECT_TRUE(data::isIntradayInterval("15min"));
    EXPECT_FALSE(data::isIntradayInterval("daily"));
}

TEST(AlphaVantageClientTest, AbortedRequestIsNetworkFailure) {
    // Nothing listens on the discard port; the transfer fails while the abort check is raised
    AlphaVantageClient client("demo", "http://127.0.0.1:9", 2000);
    client.setAbortCheck([] { return true; });
    try {
        client.getQuote(pair("EUR/USD"));
        FAIL() << "expected core::DataProviderException";
    } catch (const core::DataProviderException& e) {
        EXPECT_EQ(e.kind(), Kind::Network);
        EXPECT_NE(std::string(e.what()).find("abandoned"), std::string::npos) << e.what();
    }

    client.setAbortCheck(nullptr);
    EXPECT_EQ(errorKindOf([&client] { client.getQuote(pair("EUR/USD")); }), Kind::Network);
}
