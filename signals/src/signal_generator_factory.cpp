#include "signal_generator_factory.hpp"
#include "config.hpp"
#include "logging.hpp"

namespace signals {

    std::unique_ptr<SignalGenerator> SignalGeneratorFactory::createGenerator(const json& config) {
        auto logger = core::logging::getLogger();
        core::SignalConfig signal_config = core::config::signalConfigFromJson(config);
        logger->debug("Creating signal generator: weights RSI={} MACD={} Trend={}, thresholds {}/{}",
                      signal_config.rsi_weight, signal_config.macd_weight, signal_config.trend_weight,
                      signal_config.buy_threshold, signal_config.sell_threshold);
        return createGenerator(signal_config);
    }

    std::unique_ptr<SignalGenerator> SignalGeneratorFactory::createGenerator(const core::SignalConfig& config) {
        return std::make_unique<SignalGenerator>(config);
    }

} // namespace signals
