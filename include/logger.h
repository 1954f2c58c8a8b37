#pragma once

#include <string>
#include <memory>

namespace call_relay {

/**
 * @brief Log levels for filtering output
 */
enum class LogLevel {
    DEBUG = 0,
    INFO = 1,
    WARN = 2,
    ERROR = 3
};

/**
 * @brief Parse "debug" / "info" / "warn" / "error" (case-insensitive)
 * @return Parsed level, or fallback when the name is not recognised
 */
LogLevel parse_log_level(const std::string& name, LogLevel fallback = LogLevel::INFO);

/**
 * @brief Lightweight, thread-safe logging system
 *
 * Capture, relay io, turn workers and HTTP workers all log concurrently;
 * every line is written under one mutex so lines never interleave.
 */
class Logger {
public:
    /**
     * @brief Initialize logger with minimum log level
     * @param min_level Minimum level to output (default: INFO)
     * @param output_file Optional file path for log output (empty = console only)
     */
    static void initialize(LogLevel min_level = LogLevel::INFO,
                          const std::string& output_file = "");

    /**
     * @brief Reopen with a new level and file (after config has been loaded)
     */
    static void reconfigure(LogLevel min_level, const std::string& output_file);

    static void shutdown();

    static void debug(const std::string& message);
    static void info(const std::string& message);
    static void warn(const std::string& message);
    static void error(const std::string& message);

    static void set_level(LogLevel level);
    static LogLevel get_level();

private:
    class Impl;
    static std::unique_ptr<Impl> impl_;

    static void log(LogLevel level, const std::string& message);
};

#define LOG_DEBUG(msg) call_relay::Logger::debug(msg)
#define LOG_INFO(msg) call_relay::Logger::info(msg)
#define LOG_WARN(msg) call_relay::Logger::warn(msg)
#define LOG_ERROR(msg) call_relay::Logger::error(msg)

// Component-specific logging macros
#define LOG_DEVICE(msg) call_relay::Logger::info(std::string("[Device] ") + (msg))
#define LOG_CAPTURE(msg) call_relay::Logger::info(std::string("[Capture] ") + (msg))
#define LOG_PLAYBACK(msg) call_relay::Logger::info(std::string("[Playback] ") + (msg))
#define LOG_RELAY(msg) call_relay::Logger::info(std::string("[Relay] ") + (msg))
#define LOG_CALL(msg) call_relay::Logger::info(std::string("[Call] ") + (msg))
#define LOG_TURN(msg) call_relay::Logger::info(std::string("[Turn] ") + (msg))
#define LOG_HTTP(msg) call_relay::Logger::debug(std::string("[HTTP] ") + (msg))
#define LOG_TRACE(turn_id, stage, data) call_relay::Logger::debug(std::string("[trace] turn_id=") + std::to_string(turn_id) + " stage=" + (stage) + " " + (data))

} // namespace call_relay
