/**
 * @file Log.hpp
 * @brief Minimal logging façade with runtime severity filtering.
 *
 * Provides a static Log class backed by an injectable ILogger interface.
 * The default implementation writes to stderr. Tests and host applications
 * install their own sink through Log::setLogger().
 *
 * @author MasterLaplace
 * @version 0.1.0
 * @date 2026-02-26
 * @copyright MIT License
 */
#pragma once

#ifndef TES_CORE_LOG_HPP
    #define TES_CORE_LOG_HPP

    #include "Types.hpp"

    #include <string_view>

namespace tes::core {

class Error;

/**
 * @brief Severity levels for log messages.
 */
enum class LogLevel : u8 {
    kDebug = 0,
    kInfo,
    kWarn,
    kError,
    kFatal
};

/**
 * @brief Abstract sink for log messages.
 */
class ILogger {
public:
    virtual ~ILogger() = default;

    /**
     * @brief Write a log entry.
     * @param level   Severity.
     * @param tag     Subsystem tag (e.g. "nav", "spatial", "vision").
     * @param message Formatted message body.
     */
    virtual void write(LogLevel level, std::string_view tag, std::string_view message) = 0;
};

/**
 * @brief Static logging façade used throughout the engine.
 *
 * All methods are thread-safe provided the installed ILogger is thread-safe.
 */
class Log final {
public:
    Log() = delete;

    static void setLogger(ILogger *logger);
    static void setMinLevel(LogLevel level);
    [[nodiscard]] static LogLevel minLevel();
    [[nodiscard]] static bool enabled(LogLevel level);

    static void debug(std::string_view tag, std::string_view msg);
    static void info (std::string_view tag, std::string_view msg);
    static void warn (std::string_view tag, std::string_view msg);
    static void error(std::string_view tag, std::string_view msg);
    static void fatal(std::string_view tag, std::string_view msg);

    /// @brief Log a rejected call at warn level before the Error is returned.
    static void reject(std::string_view tag, const Error &err);

    static void debug(std::string_view msg) { debug("tes", msg); }
    static void info (std::string_view msg) { info ("tes", msg); }
    static void warn (std::string_view msg) { warn ("tes", msg); }
    static void error(std::string_view msg) { error("tes", msg); }
    static void fatal(std::string_view msg) { fatal("tes", msg); }
};

} // namespace tes::core

#endif // TES_CORE_LOG_HPP
