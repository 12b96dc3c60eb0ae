#include "ema_indicator.hpp"
#include "exceptions.hpp"
#include "logging.hpp"
#include "ta_libc.h"
#include <vector>
#include <stdexcept>
#include <spdlog/fmt/fmt.h>

namespace indicators {

EmaIndicator::EmaIndicator(int period) : period_(period), lookback_(0) {
    if (period_ <= 0) {
         throw std::invalid_argument("EMA period must be positive.");
    }

    lookback_ = TA_EMA_Lookback(period_);
    if (lookback_ < 0) {
         throw std::runtime_error(fmt::format("TA_EMA_Lookback returned an unexpected value: {}", lookback_));
    }

    name_ = fmt::format("EMA({})", period_);
    core::logging::getLogger()->trace("EmaIndicator created: Name='{}', Period={}, Lookback={}", name_, period_, lookback_);
}

std::string EmaIndicator::getName() const {
    return name_;
}

int EmaIndicator::getLookback() const {
    return lookback_;
}

const core::TimeSeries<double>& EmaIndicator::getResult() const {
    return results_;
}

std::vector<double> EmaIndicator::compute(const std::vector<double>& values, int period) {
    std::vector<double> out;
    const int lookback = TA_EMA_Lookback(period);
    if (lookback < 0 || values.size() <= static_cast<size_t>(lookback)) {
        return out;
    }

    out.resize(values.size() - static_cast<size_t>(lookback));
    int out_begin_idx = 0;
    int out_nb_element = 0;

    TA_RetCode ret_code = TA_EMA(
        0,
        static_cast<int>(values.size()) - 1,
        values.data(),
        period,
        &out_begin_idx,
        &out_nb_element,
        out.data()
    );

    if (ret_code != TA_SUCCESS) {
        throw core::IndicatorCalculationException(
            fmt::format("TA_EMA({}) failed with code {}", period, static_cast<int>(ret_code)));
    }
    out.resize(static_cast<size_t>(out_nb_element));
    return out;
}

void EmaIndicator::calculate(const core::TimeSeries<core::PriceBar>& input) {
    auto logger = core::logging::getLogger();
    logger->trace("Calculating {}...", name_);
    results_.clear();

    if (input.size() <= static_cast<size_t>(lookback_)) {
        logger->debug("Input size ({}) is less than or equal to lookback ({}) for {}. No results generated.",
                      input.size(), lookback_, name_);
        return;
    }

    results_ = compute(closesOf(input), period_);

    logger->trace("Successfully calculated {} results for {}", results_.size(), name_);
}

} // namespace indicators
