/**
 * @file Log.hpp
 * @brief Minimal logging façade with runtime severity filtering.
 *
 * Provides a static Log class backed by an injectable ILogger interface.
 * The default implementation writes to stderr.  A custom logger can be
 * installed via Log::setLogger() at startup (tests install a capturing
 * sink).
 *
 * @copyright MIT License
 */
#pragma once

#ifndef SYNAPSE_CORE_LOG_HPP
    #define SYNAPSE_CORE_LOG_HPP

    #include "Expected.hpp"
    #include "Types.hpp"

    #include <string_view>

namespace synapse::core {

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
 * @brief Parses "debug", "info", "warn", "error" or "fatal".
 */
[[nodiscard]] Expected<LogLevel> parseLogLevel(std::string_view text);

/**
 * @brief Abstract sink for log messages.
 */
class ILogger {
public:
    virtual ~ILogger() = default;

    /**
     * @brief Write a log entry.
     * @param level   Severity.
     * @param tag     Subsystem tag (e.g. "NET", "TX", "SCHED").
     * @param message Formatted message body.
     */
    virtual void write(LogLevel level, std::string_view tag, std::string_view message) = 0;
};

/**
 * @brief Static logging façade used throughout the bridge.
 *
 * All methods run on the caller's thread; the installed ILogger must be
 * thread-safe if producers log from foreign threads.
 */
class Log final {
public:
    Log() = delete;

    static void setLogger(ILogger *logger);
    static void setMinLevel(LogLevel level);
    [[nodiscard]] static LogLevel minLevel();

    static void debug(std::string_view tag, std::string_view msg);
    static void info (std::string_view tag, std::string_view msg);
    static void warn (std::string_view tag, std::string_view msg);
    static void error(std::string_view tag, std::string_view msg);
    static void fatal(std::string_view tag, std::string_view msg);

    static void debug(std::string_view msg) { debug("synapse", msg); }
    static void info (std::string_view msg) { info ("synapse", msg); }
    static void warn (std::string_view msg) { warn ("synapse", msg); }
    static void error(std::string_view msg) { error("synapse", msg); }
    static void fatal(std::string_view msg) { fatal("synapse", msg); }
};

} // namespace synapse::core

#endif // SYNAPSE_CORE_LOG_HPP
