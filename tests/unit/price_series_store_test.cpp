// tests/unit/price_series_store_test.cpp
#include <gtest/gtest.h>
#include "price_series_store.hpp"
#include "exceptions.hpp"
#include "test_helpers.hpp"

#include <algorithm>
#include <stdexcept>

using testing_support::pair;
using testing_support::quote;
using testing_support::rampBars;

class PriceSeriesStoreTest : public ::testing::Test {
protected:
    data::PriceSeriesStore store_{50};
    core::CurrencyPair eurusd_ = pair("EUR/USD");
};

TEST_F(PriceSeriesStoreTest, AppendKeepsTimeOrder) {
    auto bars = rampBars(3, 1.1000, 0.0010);
    store_.append(eurusd_, bars[0]);
    store_.append(eurusd_, bars[1]);

    EXPECT_THROW(store_.append(eurusd_, bars[0]), core::DataLoadException);
    EXPECT_THROW(store_.append(eurusd_, bars[1]), core::DataLoadException);
    EXPECT_EQ(store_.barCount(eurusd_), 2u);

    store_.append(eurusd_, bars[2]);
    EXPECT_EQ(store_.barCount(eurusd_), 3u);
}

TEST_F(PriceSeriesStoreTest, AppendRejectsInconsistentBars) {
    auto bar = rampBars(1, 1.1000, 0.0)[0];
    bar.high = bar.low - 0.001;
    EXPECT_THROW(store_.append(eurusd_, bar), core::DataLoadException);

    bar = rampBars(1, 1.1000, 0.0)[0];
    bar.close = 0.0;
    EXPECT_THROW(store_.append(eurusd_, bar), core::DataLoadException);
    EXPECT_EQ(store_.barCount(eurusd_), 0u);
}

TEST_F(PriceSeriesStoreTest, MergeAddsOnlyNewerBars) {
    auto bars = rampBars(30, 1.1000, 0.0010);
    core::TimeSeries<core::PriceBar> first(bars.begin(), bars.begin() + 20);
    EXPECT_EQ(store_.merge(eurusd_, first), 20u);

    // Overlapping refresh, newest first as some providers deliver it
    core::TimeSeries<core::PriceBar> refresh(bars.begin() + 10, bars.end());
    std::reverse(refresh.begin(), refresh.end());
    EXPECT_EQ(store_.merge(eurusd_, refresh), 10u);

    auto stored = store_.bars(eurusd_);
    ASSERT_EQ(stored.size(), 30u);
    EXPECT_TRUE(std::is_sorted(stored.begin(), stored.end()));
    EXPECT_EQ(store_.merge(eurusd_, bars), 0u);
}

TEST_F(PriceSeriesStoreTest, MergeSkipsInvalidBars) {
    auto bars = rampBars(5, 1.1000, 0.0010);
    bars[2].low = -1.0;
    EXPECT_EQ(store_.merge(eurusd_, bars), 4u);
}

TEST_F(PriceSeriesStoreTest, RetentionDropsOldest) {
    auto bars = rampBars(80, 1.1000, 0.0001);
    store_.merge(eurusd_, bars);

    auto stored = store_.bars(eurusd_);
    ASSERT_EQ(stored.size(), 50u);
    EXPECT_EQ(stored.front().timestamp, bars[30].timestamp);
    EXPECT_EQ(stored.back().timestamp, bars.back().timestamp);
}

TEST_F(PriceSeriesStoreTest, WindowReturnsMostRecent) {
    auto bars = rampBars(10, 1.1000, 0.0010);
    store_.merge(eurusd_, bars);

    auto window = store_.window(eurusd_, 4);
    ASSERT_EQ(window.size(), 4u);
    EXPECT_EQ(window.front().timestamp, bars[6].timestamp);
    EXPECT_EQ(store_.window(eurusd_, 100).size(), 10u);
    EXPECT_TRUE(store_.window(pair("USD/JPY"), 4).empty());
}

TEST_F(PriceSeriesStoreTest, QuotesKeepLatestAndPrevious) {
    EXPECT_FALSE(store_.latestQuote(eurusd_).has_value());

    store_.updateQuote(quote("EUR/USD", 1.1000, 1.1002));
    EXPECT_FALSE(store_.previousQuote(eurusd_).has_value());

    store_.updateQuote(quote("EUR/USD", 1.1010, 1.1012));
    ASSERT_TRUE(store_.latestQuote(eurusd_).has_value());
    ASSERT_TRUE(store_.previousQuote(eurusd_).has_value());
    EXPECT_DOUBLE_EQ(store_.latestQuote(eurusd_)->bid, 1.1010);
    EXPECT_DOUBLE_EQ(store_.previousQuote(eurusd_)->bid, 1.1000);

    EXPECT_EQ(store_.pairs().size(), 1u);
}

TEST(PriceSeriesStoreConstructionTest, ZeroRetentionRejected) {
    EXPECT_THROW(data::PriceSeriesStore(0), std::invalid_argument);
}
