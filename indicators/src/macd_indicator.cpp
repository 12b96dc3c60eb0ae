#include "macd_indicator.hpp"
#include "ema_indicator.hpp"
#include "logging.hpp"
#include <vector>
#include <stdexcept>
#include <spdlog/fmt/fmt.h>

namespace indicators {

MacdIndicator::MacdIndicator(int fast_period, int slow_period, int signal_period)
    : fast_period_(fast_period), slow_period_(slow_period), signal_period_(signal_period), lookback_(0) {
    if (fast_period_ <= 0 || slow_period_ <= 0 || signal_period_ <= 0) {
        throw std::invalid_argument("MACD periods must be positive.");
    }
    if (fast_period_ >= slow_period_) {
        throw std::invalid_argument("MACD fast period must be shorter than the slow period.");
    }

    // The line is reported from the first bar where the slow EMA exists
    lookback_ = slow_period_ - 1;
    name_ = fmt::format("MACD({},{},{})", fast_period_, slow_period_, signal_period_);
    core::logging::getLogger()->trace("MacdIndicator created: Name='{}', Lookback={}", name_, lookback_);
}

std::string MacdIndicator::getName() const {
    return name_;
}

int MacdIndicator::getLookback() const {
    return lookback_;
}

const core::TimeSeries<double>& MacdIndicator::getResult() const {
    return macd_line_;
}

const core::TimeSeries<double>& MacdIndicator::getSignalLine() const {
    return signal_line_;
}

const core::TimeSeries<double>& MacdIndicator::getHistogram() const {
    return histogram_;
}

void MacdIndicator::calculate(const core::TimeSeries<core::PriceBar>& input) {
    auto logger = core::logging::getLogger();
    logger->trace("Calculating {}...", name_);
    macd_line_.clear();
    signal_line_.clear();
    histogram_.clear();

    if (input.size() <= static_cast<size_t>(lookback_)) {
        logger->debug("Input size ({}) is less than or equal to lookback ({}) for {}. No results generated.",
                      input.size(), lookback_, name_);
        return;
    }

    const std::vector<double> closes = closesOf(input);
    const std::vector<double> fast = EmaIndicator::compute(closes, fast_period_);
    const std::vector<double> slow = EmaIndicator::compute(closes, slow_period_);

    // fast[i] belongs to bar i + fast_period - 1, slow[j] to bar j + slow_period - 1
    const size_t offset = static_cast<size_t>(slow_period_ - fast_period_);
    macd_line_.reserve(slow.size());
    for (size_t j = 0; j < slow.size(); ++j) {
        macd_line_.push_back(fast[j + offset] - slow[j]);
    }

    // --- Signal line ---
    // Warm-up: running mean until a full EMA seed is available
    const size_t seed = static_cast<size_t>(signal_period_);
    signal_line_.reserve(macd_line_.size());
    double running_sum = 0.0;
    for (size_t i = 0; i < macd_line_.size() && i + 1 < seed; ++i) {
        running_sum += macd_line_[i];
        signal_line_.push_back(running_sum / static_cast<double>(i + 1));
    }
    if (macd_line_.size() >= seed) {
        const std::vector<double> ema = EmaIndicator::compute(macd_line_, signal_period_);
        signal_line_.insert(signal_line_.end(), ema.begin(), ema.end());
    }

    if (signal_line_.size() != macd_line_.size()) {
        logger->warn("{} signal line size ({}) does not match MACD line size ({}).",
                     name_, signal_line_.size(), macd_line_.size());
    }

    histogram_.reserve(macd_line_.size());
    for (size_t i = 0; i < macd_line_.size() && i < signal_line_.size(); ++i) {
        histogram_.push_back(macd_line_[i] - signal_line_[i]);
    }

    logger->trace("Successfully calculated {} results for {}", macd_line_.size(), name_);
}

} // namespace indicators
