#include "stochastic_indicator.hpp"
#include "exceptions.hpp"
#include "logging.hpp"
#include "ta_libc.h"
#include <vector>
#include <stdexcept>
#include <algorithm>
#include <spdlog/fmt/fmt.h>

namespace indicators {

StochasticIndicator::StochasticIndicator(int k_period, int d_period)
    : k_period_(k_period), d_period_(d_period), lookback_(0) {
    if (k_period_ <= 0 || d_period_ <= 0) {
        throw std::invalid_argument("Stochastic periods must be positive.");
    }

    lookback_ = (k_period_ - 1) + (d_period_ - 1);
    name_ = fmt::format("STOCH({},{})", k_period_, d_period_);
    core::logging::getLogger()->trace("StochasticIndicator created: Name='{}', Lookback={}", name_, lookback_);
}

std::string StochasticIndicator::getName() const {
    return name_;
}

int StochasticIndicator::getLookback() const {
    return lookback_;
}

const core::TimeSeries<double>& StochasticIndicator::getResult() const {
    return k_line_;
}

const core::TimeSeries<double>& StochasticIndicator::getSlowLine() const {
    return d_line_;
}

void StochasticIndicator::calculate(const core::TimeSeries<core::PriceBar>& input) {
    auto logger = core::logging::getLogger();
    logger->trace("Calculating {}...", name_);
    k_line_.clear();
    d_line_.clear();

    if (input.size() <= static_cast<size_t>(lookback_)) {
        logger->debug("Input size ({}) is less than or equal to lookback ({}) for {}. No results generated.",
                      input.size(), lookback_, name_);
        return;
    }

    std::vector<double> highs, lows, closes;
    highs.reserve(input.size());
    lows.reserve(input.size());
    closes.reserve(input.size());
    for (const auto& bar : input) {
        highs.push_back(bar.high);
        lows.push_back(bar.low);
        closes.push_back(bar.close);
    }

    // --- Raw %K (fast %D period 1 leaves %K unsmoothed) ---
    const int k_lookback = k_period_ - 1;
    std::vector<double> raw_k(input.size() - static_cast<size_t>(k_lookback));
    std::vector<double> unused_d(raw_k.size());
    int out_begin_idx = 0;
    int out_nb_element = 0;

    TA_RetCode ret_code = TA_STOCHF(
        0,
        static_cast<int>(input.size()) - 1,
        highs.data(),
        lows.data(),
        closes.data(),
        k_period_,
        1,
        TA_MAType_SMA,
        &out_begin_idx,
        &out_nb_element,
        raw_k.data(),
        unused_d.data()
    );

    if (ret_code != TA_SUCCESS) {
        throw core::IndicatorCalculationException(
            fmt::format("TA_STOCHF failed for {} with code {}", name_, static_cast<int>(ret_code)));
    }
    raw_k.resize(static_cast<size_t>(out_nb_element));

    // TA-Lib reports 0 on a zero range; treat it as mid-range instead
    for (size_t i = 0; i < raw_k.size(); ++i) {
        const size_t end = i + static_cast<size_t>(out_begin_idx);
        const size_t begin = end + 1 - static_cast<size_t>(k_period_);
        const double hi = *std::max_element(highs.begin() + begin, highs.begin() + end + 1);
        const double lo = *std::min_element(lows.begin() + begin, lows.begin() + end + 1);
        if (hi - lo == 0.0) {
            raw_k[i] = 50.0;
        }
    }

    // --- %D = SMA(%K) ---
    if (raw_k.size() < static_cast<size_t>(d_period_)) {
        return;
    }
    d_line_.resize(raw_k.size() - static_cast<size_t>(d_period_ - 1));
    ret_code = TA_MA(
        0,
        static_cast<int>(raw_k.size()) - 1,
        raw_k.data(),
        d_period_,
        TA_MAType_SMA,
        &out_begin_idx,
        &out_nb_element,
        d_line_.data()
    );

    if (ret_code != TA_SUCCESS) {
        d_line_.clear();
        throw core::IndicatorCalculationException(
            fmt::format("TA_MA failed for {} %D with code {}", name_, static_cast<int>(ret_code)));
    }
    d_line_.resize(static_cast<size_t>(out_nb_element));
    k_line_.assign(raw_k.begin() + (d_period_ - 1), raw_k.end());

    logger->trace("Successfully calculated {} results for {}", d_line_.size(), name_);
}

} // namespace indicators
