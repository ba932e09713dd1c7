/// @file logger.cpp
/// @brief Dual spdlog loggers sharing a console sink and an optional rotating file sink.

#include "core/logger.hpp"

#include <spdlog/sinks/rotating_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>

#include <mutex>  // std::call_once
#include <vector>

namespace georadar::core
{

namespace
{
    std::once_flag s_fallback_once;

    void create_loggers(std::shared_ptr<spdlog::logger>& core_logger,
                        std::shared_ptr<spdlog::logger>& app_logger,
                        const std::string& log_file)
    {
        // -----------------------------------------------------------------
        // Shared sinks: both loggers write to the same console and file
        // -----------------------------------------------------------------
        std::vector<spdlog::sink_ptr> sinks;

        // Console sink with color output
        auto console_sink = std::make_shared<spdlog::sinks::stdout_color_sink_mt>();
        console_sink->set_pattern("[%T.%e] [%n] [%^%l%$] %v");
        sinks.push_back(console_sink);

        // Rotating file sink: 5 MB max size, 3 rotated files
        if (!log_file.empty())
        {
            constexpr std::size_t kMaxFileSize = 5 * 1024 * 1024; // 5 MB
            constexpr std::size_t kMaxFiles = 3;
            auto file_sink = std::make_shared<spdlog::sinks::rotating_file_sink_mt>(
                log_file, kMaxFileSize, kMaxFiles);
            file_sink->set_pattern("[%T.%e] [%n] [%^%l%$] %v");
            sinks.push_back(file_sink);
        }

        // Re-initialization replaces any previously registered loggers
        spdlog::drop("GEORADAR");
        spdlog::drop("APP");

        // -----------------------------------------------------------------
        // Core logger ("GEORADAR"): library internals
        // -----------------------------------------------------------------
        core_logger = std::make_shared<spdlog::logger>("GEORADAR", sinks.begin(), sinks.end());
        core_logger->set_level(spdlog::level::info);
        core_logger->flush_on(spdlog::level::warn);
        spdlog::register_logger(core_logger);

        // -----------------------------------------------------------------
        // App logger ("APP"): demo and test executables
        // -----------------------------------------------------------------
        app_logger = std::make_shared<spdlog::logger>("APP", sinks.begin(), sinks.end());
        app_logger->set_level(spdlog::level::trace);
        app_logger->flush_on(spdlog::level::warn);
        spdlog::register_logger(app_logger);
    }
}

// ---- Static member definitions ----
std::shared_ptr<spdlog::logger> Logger::s_core_logger;
std::shared_ptr<spdlog::logger> Logger::s_app_logger;

void Logger::init(const std::string& log_file)
{
    create_loggers(s_core_logger, s_app_logger, log_file);
}

void Logger::shutdown()
{
    s_core_logger.reset();
    s_app_logger.reset();
    spdlog::drop_all();
}

void Logger::ensure_initialized()
{
    // Console-only setup for code that logs without calling init() first.
    // Runs at most once; loggers created by init() are left in place.
    std::call_once(s_fallback_once, [] {
        if (!s_core_logger || !s_app_logger)
        {
            create_loggers(s_core_logger, s_app_logger, "");
        }
    });
}

std::shared_ptr<spdlog::logger>& Logger::get_core_logger()
{
    ensure_initialized();
    return s_core_logger;
}

std::shared_ptr<spdlog::logger>& Logger::get_app_logger()
{
    ensure_initialized();
    return s_app_logger;
}

} // namespace georadar::core
