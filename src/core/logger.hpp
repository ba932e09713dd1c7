#pragma once

/// @file logger.hpp
/// @brief Dual-logger system wrapping spdlog (library + application loggers).

#include <spdlog/spdlog.h>

#include <memory>
#include <string>

namespace georadar::core
{
    /// @brief Centralized logging facility for GeoRadar.
    ///
    /// Provides two separate loggers:
    /// - **GEORADAR** (core): geodesic solvers, refraction, conversion engine
    /// - **APP**: executables and user-facing messages
    ///
    /// Both write to colored console output and, when a path is given to
    /// init(), to a rotating log file. The accessors fall back to a
    /// console-only setup, once, if init() was never called.
    ///
    /// init() and shutdown() are not synchronized with logging: call them
    /// from the main thread before any worker starts and after all have joined.
    class Logger
    {
    public:
        /// @brief Initialize both loggers with a console sink and an optional file sink.
        /// @param log_file Rotating log file path; empty for console only.
        static void init(const std::string& log_file = "");

        /// @brief Flush and tear down all loggers.
        /// Call once at shutdown after all logging is complete.
        static void shutdown();

        /// @brief Access the library-internal logger ("GEORADAR").
        [[nodiscard]] static std::shared_ptr<spdlog::logger>& get_core_logger();

        /// @brief Access the application-level logger ("APP").
        [[nodiscard]] static std::shared_ptr<spdlog::logger>& get_app_logger();

    private:
        static void ensure_initialized();

        static std::shared_ptr<spdlog::logger> s_core_logger;
        static std::shared_ptr<spdlog::logger> s_app_logger;
    };

} // namespace georadar::core

// -----------------------------------------------------------------
// Core library log macros
// -----------------------------------------------------------------
// NOLINTBEGIN(cppcoreguidelines-macro-usage)
#define GRD_CORE_TRACE(...)    ::georadar::core::Logger::get_core_logger()->trace(__VA_ARGS__)
#define GRD_CORE_DEBUG(...)    ::georadar::core::Logger::get_core_logger()->debug(__VA_ARGS__)
#define GRD_CORE_INFO(...)     ::georadar::core::Logger::get_core_logger()->info(__VA_ARGS__)
#define GRD_CORE_WARN(...)     ::georadar::core::Logger::get_core_logger()->warn(__VA_ARGS__)
#define GRD_CORE_ERROR(...)    ::georadar::core::Logger::get_core_logger()->error(__VA_ARGS__)
#define GRD_CORE_CRITICAL(...) ::georadar::core::Logger::get_core_logger()->critical(__VA_ARGS__)

// -----------------------------------------------------------------
// Application log macros
// -----------------------------------------------------------------
#define GRD_TRACE(...)         ::georadar::core::Logger::get_app_logger()->trace(__VA_ARGS__)
#define GRD_INFO(...)          ::georadar::core::Logger::get_app_logger()->info(__VA_ARGS__)
#define GRD_WARN(...)          ::georadar::core::Logger::get_app_logger()->warn(__VA_ARGS__)
#define GRD_ERROR(...)         ::georadar::core::Logger::get_app_logger()->error(__VA_ARGS__)
#define GRD_CRITICAL(...)      ::georadar::core::Logger::get_app_logger()->critical(__VA_ARGS__)
// NOLINTEND(cppcoreguidelines-macro-usage)
