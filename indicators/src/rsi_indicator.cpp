#include "rsi_indicator.hpp"
#include "exceptions.hpp"
#include "logging.hpp"
#include "ta_libc.h"  // TA-Lib C API header
#include <vector>
#include <stdexcept>
#include <algorithm>
#include <cmath>
#include <spdlog/fmt/fmt.h>

namespace indicators {

RsiIndicator::RsiIndicator(int period) : period_(period), lookback_(0) {
    if (period_ <= 0) {
         throw std::invalid_argument("RSI period must be positive.");
    }

    lookback_ = TA_RSI_Lookback(period_);
    if (lookback_ < 0) {
         throw std::runtime_error(fmt::format("TA_RSI_Lookback returned an unexpected value: {}", lookback_));
    }

    name_ = fmt::format("RSI({})", period_);
    core::logging::getLogger()->trace("RsiIndicator created: Name='{}', Period={}, Lookback={}", name_, period_, lookback_);
}

std::string RsiIndicator::getName() const {
    return name_;
}

int RsiIndicator::getLookback() const {
    return lookback_;
}

const core::TimeSeries<double>& RsiIndicator::getResult() const {
    return results_;
}

void RsiIndicator::calculate(const core::TimeSeries<core::PriceBar>& input) {
    auto logger = core::logging::getLogger();
    logger->trace("Calculating {}...", name_);
    results_.clear();

    if (input.size() <= static_cast<size_t>(lookback_)) {
        logger->debug("Input size ({}) is less than or equal to lookback ({}) for {}. No results generated.",
                      input.size(), lookback_, name_);
        return;
    }

    std::vector<double> close_prices = closesOf(input);

    int output_size = static_cast<int>(close_prices.size()) - lookback_;
    results_.resize(static_cast<size_t>(output_size));

    int out_begin_idx = 0;
    int out_nb_element = 0;

    TA_RetCode ret_code = TA_RSI(
        0,
        static_cast<int>(close_prices.size()) - 1,
        close_prices.data(),
        period_,
        &out_begin_idx,
        &out_nb_element,
        results_.data()
    );

    if (ret_code != TA_SUCCESS) {
        results_.clear();
        throw core::IndicatorCalculationException(
            fmt::format("TA_RSI failed for {} with code {}", name_, static_cast<int>(ret_code)));
    }

    if (out_begin_idx != lookback_) {
         logger->warn("TA_RSI out_begin_idx ({}) does not match calculated lookback ({}) for {}. Results might be misaligned.",
                      out_begin_idx, lookback_, name_);
    }
    if (out_nb_element != output_size) {
         logger->warn("TA_RSI out_nb_element ({}) does not match expected output size ({}) for {}. Resizing results vector.",
                      out_nb_element, output_size, name_);
         results_.resize(static_cast<size_t>(out_nb_element));
    }

    // TA-Lib writes 0 whenever avg_gain + avg_loss falls inside its 1e-8 zero band,
    // which happens on flat stretches after tiny moves. Re-run the same Wilder
    // smoothing (seeded over the first period, first delta zero) for those bars.
    const double period = static_cast<double>(period_);
    double avg_gain = 0.0;
    double avg_loss = 0.0;
    for (int i = 1; i < period_; ++i) {
        const double delta = close_prices[static_cast<size_t>(i)] - close_prices[static_cast<size_t>(i) - 1];
        if (delta < 0.0) avg_loss -= delta;
        else avg_gain += delta;
    }
    avg_gain /= period;
    avg_loss /= period;

    for (size_t i = 0; i < results_.size(); ++i) {
        const size_t bar_index = i + static_cast<size_t>(out_begin_idx);
        const double delta = close_prices[bar_index] - close_prices[bar_index - 1];
        avg_gain *= period - 1.0;
        avg_loss *= period - 1.0;
        if (delta < 0.0) avg_loss -= delta;
        else avg_gain += delta;
        avg_gain /= period;
        avg_loss /= period;

        const double total = avg_gain + avg_loss;
        if (avg_loss == 0.0) {
            results_[i] = 100.0; // No losses so far, including a series that never moved
        } else if (std::abs(total) < 1e-8) {
            results_[i] = 100.0 * avg_gain / total;
        }
        results_[i] = std::min(100.0, std::max(0.0, results_[i]));
    }

    logger->trace("Successfully calculated {} results for {}", results_.size(), name_);
}

} // namespace indicators
