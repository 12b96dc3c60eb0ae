// tests/unit/utils_test.cpp
#include <gtest/gtest.h>
#include "utils.hpp"
#include "test_helpers.hpp"

#include <stdexcept>

using testing_support::quote;

TEST(UtilsTest, SpreadPipsMajorPair) {
    EXPECT_DOUBLE_EQ(core::utils::spreadPips(quote("EUR/USD", 1.0854, 1.0858)), 0.4);
}

TEST(UtilsTest, SpreadPipsJpyQuotedPair) {
    EXPECT_DOUBLE_EQ(core::utils::spreadPips(quote("USD/JPY", 150.10, 150.14)), 0.4);
}

TEST(UtilsTest, PipSizeDependsOnQuoteCurrency) {
    EXPECT_DOUBLE_EQ(core::utils::pipSize(core::utils::parsePair("USD/JPY")), 0.01);
    EXPECT_DOUBLE_EQ(core::utils::pipSize(core::utils::parsePair("JPY/USD")), 0.0001);
    EXPECT_DOUBLE_EQ(core::utils::pipSize(core::utils::parsePair("GBP/USD")), 0.0001);
}

TEST(UtilsTest, ParsePairNormalizesCase) {
    auto p = core::utils::parsePair("eur/usd");
    EXPECT_EQ(p.base, "EUR");
    EXPECT_EQ(p.quote, "USD");
    EXPECT_EQ(p.symbol(), "EUR/USD");
}

TEST(UtilsTest, ParsePairRejectsMalformedSymbols) {
    EXPECT_THROW(core::utils::parsePair("EURUSD"), std::invalid_argument);
    EXPECT_THROW(core::utils::parsePair("EU/USD"), std::invalid_argument);
    EXPECT_THROW(core::utils::parsePair("USD/USD"), std::invalid_argument);
    EXPECT_THROW(core::utils::parsePair("EUR/US1"), std::invalid_argument);
}

TEST(UtilsTest, ParseUtcDateTimeFormats) {
    EXPECT_EQ(core::utils::timestampToString(core::utils::parseUtcDateTime("2024-03-01")),
              "2024-03-01T00:00:00Z");
    EXPECT_EQ(core::utils::timestampToString(core::utils::parseUtcDateTime("2024-03-01 16:35:12")),
              "2024-03-01T16:35:12Z");
    EXPECT_THROW(core::utils::parseUtcDateTime("yesterday"), std::runtime_error);
}

TEST(UtilsTest, StringToTimestampAppliesOffset) {
    auto utc = core::utils::stringToTimestamp("2024-03-01T12:00:00Z");
    auto shifted = core::utils::stringToTimestamp("2024-03-01T14:00:00+02:00");
    EXPECT_EQ(utc, shifted);
    EXPECT_THROW(core::utils::stringToTimestamp("2024-03-01T12:00:00"), std::runtime_error);
}

TEST(UtilsTest, TradeSideNames) {
    EXPECT_EQ(core::utils::tradeSideFromString("Buy"), core::TradeSide::Buy);
    EXPECT_EQ(core::utils::tradeSideFromString(core::utils::toString(core::TradeSide::Sell)), core::TradeSide::Sell);
    EXPECT_THROW(core::utils::tradeSideFromString("Hold"), std::invalid_argument);
}
