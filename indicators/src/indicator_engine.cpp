#include "indicator_engine.hpp"
#include "sma_indicator.hpp"
#include "ema_indicator.hpp"
#include "rsi_indicator.hpp"
#include "macd_indicator.hpp"
#include "bollinger_indicator.hpp"
#include "atr_indicator.hpp"
#include "stochastic_indicator.hpp"
#include "exceptions.hpp"
#include "logging.hpp"
#include <spdlog/fmt/fmt.h>

namespace indicators {

namespace {

    double lastOf(const IIndicator& indicator) {
        const auto& values = indicator.getResult();
        if (values.empty()) {
            throw core::IndicatorCalculationException(
                fmt::format("{} produced no values", indicator.getName()));
        }
        return values.back();
    }

} // anonymous namespace

IndicatorSet IndicatorEngine::compute(const core::TimeSeries<core::PriceBar>& bars) const {
    auto logger = core::logging::getLogger();

    if (bars.size() < kMinimumBars) {
        throw core::InsufficientDataException(
            fmt::format("Need at least {} bars for the indicator set, have {}", kMinimumBars, bars.size()));
    }

    IndicatorSet set;
    set.bar_count = bars.size();
    set.last_close = bars.back().close;
    set.computed_at = bars.back().timestamp;

    RsiIndicator rsi(14);
    rsi.calculate(bars);
    set.rsi = lastOf(rsi);

    EmaIndicator ema12(12);
    ema12.calculate(bars);
    set.ema_12 = lastOf(ema12);

    EmaIndicator ema26(26);
    ema26.calculate(bars);
    set.ema_26 = lastOf(ema26);

    MacdIndicator macd(12, 26, 9);
    macd.calculate(bars);
    set.macd.line = lastOf(macd);
    set.macd.signal = macd.getSignalLine().back();
    set.macd.histogram = macd.getHistogram().back();

    SmaIndicator sma20(20);
    sma20.calculate(bars);
    set.sma_20 = lastOf(sma20);

    BollingerIndicator bollinger(20, 2.0);
    bollinger.calculate(bars);
    set.bollinger.middle = lastOf(bollinger);
    set.bollinger.upper = bollinger.getUpperBand().back();
    set.bollinger.lower = bollinger.getLowerBand().back();

    AtrIndicator atr(14);
    atr.calculate(bars);
    set.atr_14 = lastOf(atr);

    // --- Optional extras ---
    if (bars.size() >= 50) {
        SmaIndicator sma50(50);
        sma50.calculate(bars);
        set.sma_50 = lastOf(sma50);
    }

    StochasticIndicator stochastic(14, 3);
    stochastic.calculate(bars);
    if (!stochastic.getSlowLine().empty()) {
        set.stochastic = StochasticValues{stochastic.getResult().back(), stochastic.getSlowLine().back()};
    }

    logger->debug("Indicators over {} bars: RSI={:.2f} MACD={:.6f}/{:.6f} BB=[{:.5f}, {:.5f}, {:.5f}] ATR={:.6f}",
                  set.bar_count, set.rsi, set.macd.line, set.macd.signal,
                  set.bollinger.lower, set.bollinger.middle, set.bollinger.upper, set.atr_14);
    return set;
}

} // namespace indicators
