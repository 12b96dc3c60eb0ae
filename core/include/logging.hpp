#pragma once

#include <spdlog/spdlog.h>
#include <spdlog/logger.h>
#include <cstddef>
#include <memory>
#include <string>

namespace core {
namespace logging {

    // Sink setup for the process-wide logger. Filled from the "logging" section of the config file.
    struct LogSettings {
        std::string base_name = "fx_trading_core";    // Log file prefix, a UTC start time is appended
        std::string directory = "logs";
        spdlog::level::level_enum console_level = spdlog::level::info;
        spdlog::level::level_enum file_level = spdlog::level::debug;
        std::size_t max_file_size_mb = 10;
        std::size_t max_files = 5;
        bool file_enabled = true;
    };

    // Installs the console (+ rotating file) logger. May be called again to
    // apply new settings; SPDLOG_LEVEL overrides both levels.
    void initialize(const LogSettings& settings);

    void initialize(const std::string& base_log_filename = "fx_trading_core",
                    spdlog::level::level_enum console_level = spdlog::level::info,
                    spdlog::level::level_enum file_level = spdlog::level::debug);

    // Console only, used by test binaries
    void initializeConsoleOnly(spdlog::level::level_enum level = spdlog::level::warn);

    // Throws std::runtime_error before initialize()
    std::shared_ptr<spdlog::logger>& getLogger();

    // "warn"/"warning", "error"/"err", ... Unknown strings give info.
    spdlog::level::level_enum level_from_string(const std::string& level_str);

    // Strict variant for configuration values; returns false on an unknown name
    bool tryParseLevel(const std::string& level_str, spdlog::level::level_enum& level);

} // namespace logging
} // namespace core
