#include "logging.hpp"
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/sinks/rotating_file_sink.h>
#include <vector>
#include <memory>
#include <iostream>
#include <cstdlib>
#include <chrono>
#include <sstream>
#include <iomanip>      // std::put_time
#include <filesystem>
#include <algorithm>
#include <cctype>
#include <stdexcept>

namespace core {
namespace logging {

    static std::shared_ptr<spdlog::logger> global_logger;

    namespace {

        const char* kLoggerName = "FxCore";
        const char* kUtcPattern = "[%Y-%m-%d %H:%M:%S.%e%z] [%^%l%$] [%n] %v";

        void install(std::shared_ptr<spdlog::logger> logger, spdlog::level::level_enum level) {
            spdlog::drop(kLoggerName);
            global_logger = std::move(logger);
            spdlog::register_logger(global_logger);
            spdlog::set_default_logger(global_logger);
            global_logger->set_level(level);
            global_logger->flush_on(spdlog::level::err);
        }

        std::shared_ptr<spdlog::sinks::stdout_color_sink_mt> consoleSink(spdlog::level::level_enum level) {
            auto sink = std::make_shared<spdlog::sinks::stdout_color_sink_mt>();
            sink->set_level(level);
            sink->set_pattern(kUtcPattern);
            return sink;
        }

        // <directory>/<base>_YYYYmmdd_HHMMSSZ.log, one file set per process start
        std::string logFilePath(const LogSettings& settings) {
            std::string dir = settings.directory.empty() ? "." : settings.directory;
            try {
                if (!std::filesystem::exists(dir)) {
                    std::filesystem::create_directories(dir);
                }
            } catch (const std::filesystem::filesystem_error& fs_err) {
                std::cerr << "[Logging] Cannot create log directory '" << dir << "': " << fs_err.what()
                          << ". Writing to the working directory." << std::endl;
                dir = ".";
            }

            const auto itt = std::chrono::system_clock::to_time_t(std::chrono::system_clock::now());
            std::tm utc_tm{};
            #ifdef _WIN32
                gmtime_s(&utc_tm, &itt);
            #else
                gmtime_r(&itt, &utc_tm);
            #endif

            std::ostringstream oss;
            oss << dir << "/" << settings.base_name << "_" << std::put_time(&utc_tm, "%Y%m%d_%H%M%SZ") << ".log";
            return oss.str();
        }

    } // namespace

    void initialize(const LogSettings& requested) {
        LogSettings settings = requested;

        const char* env_level = std::getenv("SPDLOG_LEVEL");
        if (env_level != nullptr) {
            settings.console_level = level_from_string(env_level);
            settings.file_level = settings.console_level;
        }

        if (!settings.file_enabled) {
            initializeConsoleOnly(settings.console_level);
            return;
        }

        std::string log_file_path;
        try {
            log_file_path = logFilePath(settings);
            auto file_sink = std::make_shared<spdlog::sinks::rotating_file_sink_mt>(
                log_file_path, settings.max_file_size_mb * 1024 * 1024, settings.max_files, true);
            file_sink->set_level(settings.file_level);
            file_sink->set_pattern(kUtcPattern);

            std::vector<spdlog::sink_ptr> sinks{consoleSink(settings.console_level), file_sink};
            install(std::make_shared<spdlog::logger>(kLoggerName, sinks.begin(), sinks.end()),
                    std::min(settings.console_level, settings.file_level));
        } catch (const spdlog::spdlog_ex& ex) {
            std::cerr << "[Logging] File sink unavailable (" << ex.what() << "); logging to console only." << std::endl;
            initializeConsoleOnly(settings.console_level);
            return;
        }

        #ifdef NDEBUG
            const char* build_type_str = "Release";
        #else
            const char* build_type_str = "Debug";
        #endif

        getLogger()->info("Logging initialized (Build Type: {}). Console: {}, File: {} -> {} ({} x {} MiB, UTC)",
                          build_type_str,
                          spdlog::level::to_string_view(settings.console_level),
                          spdlog::level::to_string_view(settings.file_level),
                          log_file_path, settings.max_files, settings.max_file_size_mb);
        if (env_level != nullptr) {
            getLogger()->info("Log levels overridden by SPDLOG_LEVEL={}", env_level);
        }
    }

    void initialize(const std::string& base_log_filename,
                    spdlog::level::level_enum console_level,
                    spdlog::level::level_enum file_level) {
        LogSettings settings;
        settings.base_name = base_log_filename;
        settings.console_level = console_level;
        settings.file_level = file_level;
        initialize(settings);
    }

    void initializeConsoleOnly(spdlog::level::level_enum level) {
        install(std::make_shared<spdlog::logger>(kLoggerName, consoleSink(level)), level);
    }

    std::shared_ptr<spdlog::logger>& getLogger() {
        if (!global_logger) {
            throw std::runtime_error("Logger accessed before initialization. Call core::logging::initialize() first.");
        }
        return global_logger;
    }

    bool tryParseLevel(const std::string& level_str, spdlog::level::level_enum& level) {
        std::string lower = level_str;
        std::transform(lower.begin(), lower.end(), lower.begin(),
                       [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
        if (lower == "trace") { level = spdlog::level::trace; return true; }
        if (lower == "debug") { level = spdlog::level::debug; return true; }
        if (lower == "info") { level = spdlog::level::info; return true; }
        if (lower == "warn" || lower == "warning") { level = spdlog::level::warn; return true; }
        if (lower == "error" || lower == "err") { level = spdlog::level::err; return true; }
        if (lower == "critical" || lower == "crit") { level = spdlog::level::critical; return true; }
        if (lower == "off") { level = spdlog::level::off; return true; }
        return false;
    }

    spdlog::level::level_enum level_from_string(const std::string& level_str) {
        spdlog::level::level_enum level = spdlog::level::info;
        if (!tryParseLevel(level_str, level)) {
            std::cerr << "[Logging] Unrecognized log level string: '" << level_str << "'. Defaulting to 'info'." << std::endl;
        }
        return level;
    }

} // namespace logging
} // namespace core
