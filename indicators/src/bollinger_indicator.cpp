#include "bollinger_indicator.hpp"
#include "exceptions.hpp"
#include "logging.hpp"
#include "ta_libc.h"
#include <vector>
#include <stdexcept>
#include <algorithm>
#include <spdlog/fmt/fmt.h>

namespace indicators {

BollingerIndicator::BollingerIndicator(int period, double num_std_dev)
    : period_(period), num_std_dev_(num_std_dev), lookback_(0) {
    if (period_ <= 1) {
        throw std::invalid_argument("Bollinger period must be greater than one.");
    }
    if (num_std_dev_ <= 0.0) {
        throw std::invalid_argument("Bollinger deviation multiplier must be positive.");
    }

    lookback_ = TA_BBANDS_Lookback(period_, num_std_dev_, num_std_dev_, TA_MAType_SMA);
    if (lookback_ < 0) {
         throw std::runtime_error(fmt::format("TA_BBANDS_Lookback returned an unexpected value: {}", lookback_));
    }

    name_ = fmt::format("BBANDS({},{:.1f})", period_, num_std_dev_);
    core::logging::getLogger()->trace("BollingerIndicator created: Name='{}', Lookback={}", name_, lookback_);
}

std::string BollingerIndicator::getName() const {
    return name_;
}

int BollingerIndicator::getLookback() const {
    return lookback_;
}

const core::TimeSeries<double>& BollingerIndicator::getResult() const {
    return middle_;
}

const core::TimeSeries<double>& BollingerIndicator::getUpperBand() const {
    return upper_;
}

const core::TimeSeries<double>& BollingerIndicator::getLowerBand() const {
    return lower_;
}

void BollingerIndicator::calculate(const core::TimeSeries<core::PriceBar>& input) {
    auto logger = core::logging::getLogger();
    logger->trace("Calculating {}...", name_);
    upper_.clear();
    middle_.clear();
    lower_.clear();

    if (input.size() <= static_cast<size_t>(lookback_)) {
        logger->debug("Input size ({}) is less than or equal to lookback ({}) for {}. No results generated.",
                      input.size(), lookback_, name_);
        return;
    }

    std::vector<double> close_prices = closesOf(input);
    const size_t output_size = close_prices.size() - static_cast<size_t>(lookback_);
    upper_.resize(output_size);
    middle_.resize(output_size);
    lower_.resize(output_size);

    int out_begin_idx = 0;
    int out_nb_element = 0;

    TA_RetCode ret_code = TA_BBANDS(
        0,
        static_cast<int>(close_prices.size()) - 1,
        close_prices.data(),
        period_,
        num_std_dev_,
        num_std_dev_,
        TA_MAType_SMA,
        &out_begin_idx,
        &out_nb_element,
        upper_.data(),
        middle_.data(),
        lower_.data()
    );

    if (ret_code != TA_SUCCESS) {
        upper_.clear();
        middle_.clear();
        lower_.clear();
        throw core::IndicatorCalculationException(
            fmt::format("TA_BBANDS failed for {} with code {}", name_, static_cast<int>(ret_code)));
    }

    if (static_cast<size_t>(out_nb_element) != output_size) {
         logger->warn("TA_BBANDS out_nb_element ({}) does not match expected output size ({}) for {}. Resizing results.",
                      out_nb_element, output_size, name_);
         upper_.resize(static_cast<size_t>(out_nb_element));
         middle_.resize(static_cast<size_t>(out_nb_element));
         lower_.resize(static_cast<size_t>(out_nb_element));
    }

    // Rounding in the variance can leave the bands a hair inside the middle on flat input
    for (size_t i = 0; i < middle_.size(); ++i) {
        upper_[i] = std::max(upper_[i], middle_[i]);
        lower_[i] = std::min(lower_[i], middle_[i]);
    }

    logger->trace("Successfully calculated {} results for {}", middle_.size(), name_);
}

} // namespace indicators
