#pragma once

/// @file logger.hpp
/// @brief Dual-logger system wrapping spdlog (engine + application loggers).

#include <spdlog/spdlog.h>

#include <memory>

namespace gochara::core
{
    /// @brief Centralized logging facility for Gochara.
    ///
    /// Provides two separate loggers:
    /// - **GOCHARA** (core): ephemeris engine, file export internals
    /// - **APP**: run progress, user-facing messages
    ///
    /// Both write to colored console output and a rotating log file.
    /// Call init() once from main() before any logging.
    class Logger
    {
    public:
        /// @brief Initialize both loggers with console + file sinks.
        /// Must be called once at startup before any GCH_ macros are used.
        /// @param level Minimum level written by both loggers.
        static void init(spdlog::level::level_enum level = spdlog::level::info);

        /// @brief Change the level of both loggers after init().
        static void set_level(spdlog::level::level_enum level);

        /// @brief Flush and tear down all loggers.
        /// Call once at shutdown after all logging is complete.
        static void shutdown();

        /// @brief Access the engine-internal logger ("GOCHARA").
        [[nodiscard]] static std::shared_ptr<spdlog::logger>& get_core_logger();

        /// @brief Access the application-level logger ("APP").
        [[nodiscard]] static std::shared_ptr<spdlog::logger>& get_app_logger();

    private:
        static std::shared_ptr<spdlog::logger> s_core_logger;
        static std::shared_ptr<spdlog::logger> s_app_logger;
    };

} // namespace gochara::core

// -----------------------------------------------------------------
// Core engine log macros
// -----------------------------------------------------------------
// NOLINTBEGIN(cppcoreguidelines-macro-usage)
#define GCH_CORE_TRACE(...)    ::gochara::core::Logger::get_core_logger()->trace(__VA_ARGS__)
#define GCH_CORE_DEBUG(...)    ::gochara::core::Logger::get_core_logger()->debug(__VA_ARGS__)
#define GCH_CORE_INFO(...)     ::gochara::core::Logger::get_core_logger()->info(__VA_ARGS__)
#define GCH_CORE_WARN(...)     ::gochara::core::Logger::get_core_logger()->warn(__VA_ARGS__)
#define GCH_CORE_ERROR(...)    ::gochara::core::Logger::get_core_logger()->error(__VA_ARGS__)
#define GCH_CORE_CRITICAL(...) ::gochara::core::Logger::get_core_logger()->critical(__VA_ARGS__)

// -----------------------------------------------------------------
// Application log macros
// -----------------------------------------------------------------
#define GCH_TRACE(...)         ::gochara::core::Logger::get_app_logger()->trace(__VA_ARGS__)
#define GCH_DEBUG(...)         ::gochara::core::Logger::get_app_logger()->debug(__VA_ARGS__)
#define GCH_INFO(...)          ::gochara::core::Logger::get_app_logger()->info(__VA_ARGS__)
#define GCH_WARN(...)          ::gochara::core::Logger::get_app_logger()->warn(__VA_ARGS__)
#define GCH_ERROR(...)         ::gochara::core::Logger::get_app_logger()->error(__VA_ARGS__)
#define GCH_CRITICAL(...)      ::gochara::core::Logger::get_app_logger()->critical(__VA_ARGS__)
// NOLINTEND(cppcoreguidelines-macro-usage)
