/**
 * @file logger.hpp
 * @brief Structured logging for the compute dispatcher
 *
 * The Logger provides:
 * - Log levels (DEBUG, INFO, WARN, ERROR)
 * - JSON or plain-text lines with millisecond local timestamps
 * - Request context (correlation id, request type, phase) on every event
 * - Console (stderr) and file sinks, written under a mutex
 *
 * Design Pattern: Singleton logger with structured event emission
 */

#ifndef RETIRECALC_LOGGER_HPP
#define RETIRECALC_LOGGER_HPP

#include "messages.hpp"
#include <cstdint>
#include <fstream>
#include <map>
#include <memory>
#include <mutex>
#include <string>

namespace retirecalc {

/**
 * @brief Log severity levels
 */
enum class LogLevel {
    DEBUG,   ///< Progress messages and state transitions
    INFO,    ///< Request lifecycle (queued, started, completed)
    WARN,    ///< Timeouts and listener failures
    ERROR    ///< Failed requests
};

inline std::string level_to_string(LogLevel level) {
    switch (level) {
        case LogLevel::DEBUG: return "DEBUG";
        case LogLevel::INFO: return "INFO";
        case LogLevel::WARN: return "WARN";
        case LogLevel::ERROR: return "ERROR";
        default: return "UNKNOWN";
    }
}

/**
 * @brief Parse a level name (case-sensitive); unknown names map to INFO
 */
inline LogLevel string_to_level(const std::string& level_str) {
    if (level_str == "DEBUG") return LogLevel::DEBUG;
    if (level_str == "INFO") return LogLevel::INFO;
    if (level_str == "WARN") return LogLevel::WARN;
    if (level_str == "ERROR") return LogLevel::ERROR;
    return LogLevel::INFO;
}

/**
 * @brief Request being logged
 */
struct RequestContext {
    uint64_t request_id;        ///< Correlation id, 0 for dispatcher-wide events
    std::string request_type;   ///< Wire name ("run", "legacy", ...)
    std::string phase;          ///< Optional sub-phase ("monteCarlo")

    RequestContext() : request_id(0) {}

    RequestContext(uint64_t id, MessageType type)
        : request_id(id), request_type(to_string(type)) {}
};

/**
 * @brief Logger configuration
 */
struct LoggerConfig {
    LogLevel min_level;              ///< Minimum log level to output
    bool enable_console;             ///< Log to stderr
    bool enable_file;                ///< Log to file
    std::string log_file_path;       ///< File path for logs (appended)
    bool enable_json;                ///< JSON lines (vs. plain text)

    LoggerConfig()
        : min_level(LogLevel::INFO),
          enable_console(true),
          enable_file(false),
          log_file_path("retirecalc.log"),
          enable_json(true) {}
};

/**
 * @brief Structured logger with JSON output
 *
 * Usage Example:
 *   @code
 *   LoggerConfig config;
 *   config.min_level = LogLevel::DEBUG;
 *   config.enable_file = true;
 *   config.log_file_path = "dispatcher.log";
 *
 *   Logger& logger = Logger::get_instance();
 *   logger.configure(config);
 *
 *   RequestContext ctx(42, MessageType::Run);
 *   logger.log_request_start(ctx);
 *   logger.log_request_complete(ctx, 812.5);
 *   @endcode
 */
class Logger {
public:
    static Logger& get_instance();

    /**
     * @brief Replace the configuration, reopening the log file if enabled
     */
    void configure(const LoggerConfig& config);

    void log_dispatcher_start(size_t queue_capacity, long long legacy_timeout_ms);
    void log_dispatcher_stop(const std::string& reason);

    /**
     * @brief Log a request accepted into the queue
     *
     * @param ctx Request context
     * @param queue_depth Requests waiting after this one was added
     */
    void log_request_queued(const RequestContext& ctx, size_t queue_depth);

    void log_request_start(const RequestContext& ctx);

    /**
     * @brief Log a progress message (DEBUG level)
     */
    void log_progress(const RequestContext& ctx, const ProgressEvent& event);

    void log_request_complete(const RequestContext& ctx, double execution_time_ms);
    void log_request_failed(const RequestContext& ctx, const std::string& error_message);
    void log_request_timeout(const RequestContext& ctx, long long timeout_ms);
    void log_request_cancelled(const RequestContext& ctx, const std::string& reason);

    /**
     * @brief Log a worker state transition (DEBUG level)
     */
    void log_state_transition(DispatcherState old_state, DispatcherState new_state);

    void log_warning(const RequestContext& ctx, const std::string& warning_message);

    void flush();

    void set_min_level(LogLevel level);
    LogLevel get_min_level() const;

private:
    Logger();
    ~Logger();

    Logger(const Logger&) = delete;
    Logger& operator=(const Logger&) = delete;
    Logger(Logger&&) = delete;
    Logger& operator=(Logger&&) = delete;

    LoggerConfig config_;
    std::unique_ptr<std::ofstream> file_stream_;
    mutable std::mutex mutex_;

    void log(LogLevel level, const std::string& message,
             const std::map<std::string, std::string>& fields);
    std::map<std::string, std::string> context_fields(const std::string& event,
                                                      const RequestContext& ctx) const;
    std::string get_timestamp() const;
    std::string format_json_line(LogLevel level, const std::string& message,
                                 const std::map<std::string, std::string>& fields) const;
    std::string format_text_line(LogLevel level, const std::string& message,
                                 const std::map<std::string, std::string>& fields) const;
};

} // namespace retirecalc

#endif // RETIRECALC_LOGGER_HPP
