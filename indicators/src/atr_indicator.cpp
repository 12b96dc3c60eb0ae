#include "atr_indicator.hpp"
#include "exceptions.hpp"
#include "logging.hpp"
#include "ta_libc.h"
#include <vector>
#include <stdexcept>
#include <spdlog/fmt/fmt.h>

namespace indicators {

AtrIndicator::AtrIndicator(int period) : period_(period), lookback_(0) {
    if (period_ <= 0) {
         throw std::invalid_argument("ATR period must be positive.");
    }

    lookback_ = TA_ATR_Lookback(period_);
    if (lookback_ < 0) {
         throw std::runtime_error(fmt::format("TA_ATR_Lookback returned an unexpected value: {}", lookback_));
    }

    name_ = fmt::format("ATR({})", period_);
    core::logging::getLogger()->trace("AtrIndicator created: Name='{}', Period={}, Lookback={}", name_, period_, lookback_);
}

std::string AtrIndicator::getName() const {
    return name_;
}

int AtrIndicator::getLookback() const {
    return lookback_;
}

const core::TimeSeries<double>& AtrIndicator::getResult() const {
    return results_;
}

void AtrIndicator::calculate(const core::TimeSeries<core::PriceBar>& input) {
    auto logger = core::logging::getLogger();
    logger->trace("Calculating {}...", name_);
    results_.clear();

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

    int output_size = static_cast<int>(input.size()) - lookback_;
    results_.resize(static_cast<size_t>(output_size));

    int out_begin_idx = 0;
    int out_nb_element = 0;

    TA_RetCode ret_code = TA_ATR(
        0,
        static_cast<int>(input.size()) - 1,
        highs.data(),
        lows.data(),
        closes.data(),
        period_,
        &out_begin_idx,
        &out_nb_element,
        results_.data()
    );

    if (ret_code != TA_SUCCESS) {
        results_.clear();
        throw core::IndicatorCalculationException(
            fmt::format("TA_ATR failed for {} with code {}", name_, static_cast<int>(ret_code)));
    }

    if (out_nb_element != output_size) {
         logger->warn("TA_ATR out_nb_element ({}) does not match expected output size ({}) for {}. Resizing results vector.",
                      out_nb_element, output_size, name_);
         results_.resize(static_cast<size_t>(out_nb_element));
    }

    logger->trace("Successfully calculated {} results for {}", results_.size(), name_);
}

} // namespace indicators
