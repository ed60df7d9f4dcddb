#pragma once

#include <string>
#include <ostream>
#include <memory>

namespace samaira {

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
 * @brief Parse a level name ("debug", "info", "warn", "error"); unknown names map to INFO
 */
LogLevel parse_log_level(const std::string& name);

/**
 * @brief Lightweight, thread-safe logging system
 *
 * Provides structured logging with levels and optional file output.
 * Session workers, turn pipelines and connection threads all log concurrently.
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
     * @brief Shutdown logger and close file handles
     */
    static void shutdown();

    static void debug(const std::string& message);
    static void info(const std::string& message);
    static void warn(const std::string& message);
    static void error(const std::string& message);

    /**
     * @brief Set minimum log level (filters output)
     */
    static void set_level(LogLevel level);

    /**
     * @brief Get current minimum log level
     */
    static LogLevel get_level();

private:
    class Impl;
    static std::unique_ptr<Impl> impl_;

    static void log(LogLevel level, const std::string& message);
};

// Convenience macros
#define LOG_DEBUG(msg) samaira::Logger::debug("[" + std::string(__FILE__) + ":" + std::to_string(__LINE__) + "] " + msg)
#define LOG_INFO(msg) samaira::Logger::info(msg)
#define LOG_WARN(msg) samaira::Logger::warn(msg)
#define LOG_ERROR(msg) samaira::Logger::error(msg)

// Component-specific logging macros
#define LOG_AUDIO(msg) samaira::Logger::debug(std::string("[Audio] ") + (msg))
#define LOG_VAD(msg) samaira::Logger::debug(std::string("[VAD] ") + (msg))
#define LOG_STT(msg) samaira::Logger::info(std::string("[STT] ") + (msg))
#define LOG_LLM(msg) samaira::Logger::info(std::string("[LLM] ") + (msg))
#define LOG_TTS(msg) samaira::Logger::info(std::string("[TTS] ") + (msg))
#define LOG_SESSION(msg) samaira::Logger::info(std::string("[Session] ") + (msg))
#define LOG_TURN(msg) samaira::Logger::info(std::string("[Turn] ") + (msg))
#define LOG_BRIDGE(msg) samaira::Logger::debug(std::string("[Bridge] ") + (msg))
#define LOG_NET(msg) samaira::Logger::info(std::string("[Net] ") + (msg))
#define LOG_TRACE(turn_id, stage, data) samaira::Logger::info(std::string("[trace] turn_id=") + std::to_string(turn_id) + " stage=" + (stage) + " " + (data))

} // namespace samaira
