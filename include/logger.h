#pragma once

#include <string>
#include <memory>

namespace optidex {

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
 * @brief Thread-safe logging facade
 *
 * Lines look like "[INFO ] 2024-05-01 12:00:00.123 [loop]: message". The
 * bracketed thread name is present once the thread has called
 * set_thread_name(); the event loop, background jobs and each worker's
 * reader threads name themselves so interleaved output stays readable.
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

    /// Would a message at this level be written?
    static bool enabled(LogLevel level);

    /// Label for the calling thread's lines; empty clears it
    static void set_thread_name(const std::string& name);

    static void set_level(LogLevel level);
    static LogLevel get_level();

private:
    class Impl;
    static std::unique_ptr<Impl> impl_;

    static void log(LogLevel level, const std::string& message);
};

// Debug-level macros skip building the message when it would be dropped;
// relay and display lines are produced on every frame tick.
#define OPTIDEX_LOG_IF_DEBUG(text) \
    do { if (optidex::Logger::enabled(optidex::LogLevel::DEBUG)) optidex::Logger::debug(text); } while (0)

#define LOG_DEBUG(msg) OPTIDEX_LOG_IF_DEBUG("[" + std::string(__FILE__) + ":" + std::to_string(__LINE__) + "] " + (msg))
#define LOG_INFO(msg) optidex::Logger::info(msg)
#define LOG_WARN(msg) optidex::Logger::warn(msg)
#define LOG_ERROR(msg) optidex::Logger::error(msg)

// Component-specific logging macros
#define LOG_FSM(msg) optidex::Logger::info(std::string("[FSM] ") + (msg))
#define LOG_WORKER(msg) optidex::Logger::info(std::string("[Worker] ") + (msg))
#define LOG_RELAY(msg) OPTIDEX_LOG_IF_DEBUG(std::string("[Relay] ") + (msg))
#define LOG_CAMERA(msg) optidex::Logger::info(std::string("[Camera] ") + (msg))
#define LOG_DISPLAY(msg) OPTIDEX_LOG_IF_DEBUG(std::string("[Display] ") + (msg))
#define LOG_NOTIFY(msg) optidex::Logger::info(std::string("[Notify] ") + (msg))
#define LOG_AUDIO(msg) OPTIDEX_LOG_IF_DEBUG(std::string("[Audio] ") + (msg))
#define LOG_STT(msg) optidex::Logger::info(std::string("[STT] ") + (msg))
#define LOG_LLM(msg) optidex::Logger::info(std::string("[LLM] ") + (msg))
#define LOG_TTS(msg) optidex::Logger::info(std::string("[TTS] ") + (msg))
#define LOG_TOOL(msg) optidex::Logger::info(std::string("[Tool] ") + (msg))
#define LOG_TRACE(turn_id, stage, data) optidex::Logger::info(std::string("[trace] turn_id=") + std::to_string(turn_id) + " stage=" + (stage) + " " + (data))

} // namespace optidex
