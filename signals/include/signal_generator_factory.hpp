#pragma once

#include <memory>
#include <nlohmann/json.hpp>

#include "signal_generator.hpp"

namespace signals {

    using json = nlohmann::json;

    class SignalGeneratorFactory {
    public:
        // Builds a generator from the "signal" object of the configuration.
        // Missing keys keep their defaults. Throws core::ConfigException.
        static std::unique_ptr<SignalGenerator> createGenerator(const json& config);

        static std::unique_ptr<SignalGenerator> createGenerator(const core::SignalConfig& config);
    };

} // namespace signals
