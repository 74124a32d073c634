/**
 * @file logger.cpp
 * @brief Implementation of structured logger
 */

#include "logger.hpp"
#include <nlohmann/json.hpp>
#include <chrono>
#include <cstdio>
#include <ctime>
#include <iostream>

namespace retirecalc {

Logger& Logger::get_instance() {
    static Logger instance;
    return instance;
}

Logger::Logger() : config_(LoggerConfig()) {}

Logger::~Logger() {
    flush();
    if (file_stream_ && file_stream_->is_open()) {
        file_stream_->close();
    }
}

void Logger::configure(const LoggerConfig& config) {
    std::lock_guard<std::mutex> lock(mutex_);
    config_ = config;
    file_stream_.reset();

    if (config_.enable_file) {
        file_stream_ = std::make_unique<std::ofstream>(config_.log_file_path, std::ios::app);
        if (!file_stream_->is_open()) {
            std::cerr << "Warning: Failed to open log file: " << config_.log_file_path << std::endl;
        }
    }
}

void Logger::set_min_level(LogLevel level) {
    std::lock_guard<std::mutex> lock(mutex_);
    config_.min_level = level;
}

LogLevel Logger::get_min_level() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return config_.min_level;
}

std::map<std::string, std::string> Logger::context_fields(const std::string& event,
                                                          const RequestContext& ctx) const {
    std::map<std::string, std::string> fields;
    fields["event"] = event;
    fields["request_id"] = std::to_string(ctx.request_id);
    fields["request_type"] = ctx.request_type;
    if (!ctx.phase.empty()) {
        fields["phase"] = ctx.phase;
    }
    return fields;
}

void Logger::log_dispatcher_start(size_t queue_capacity, long long legacy_timeout_ms) {
    std::map<std::string, std::string> fields;
    fields["event"] = "dispatcher_start";
    fields["queue_capacity"] = std::to_string(queue_capacity);
    fields["legacy_timeout_ms"] = std::to_string(legacy_timeout_ms);

    log(LogLevel::INFO, "Compute dispatcher started", fields);
}

void Logger::log_dispatcher_stop(const std::string& reason) {
    std::map<std::string, std::string> fields;
    fields["event"] = "dispatcher_stop";
    fields["reason"] = reason;

    log(LogLevel::INFO, "Compute dispatcher stopped", fields);
}

void Logger::log_request_queued(const RequestContext& ctx, size_t queue_depth) {
    auto fields = context_fields("request_queued", ctx);
    fields["queue_depth"] = std::to_string(queue_depth);

    log(LogLevel::INFO, "Request queued", fields);
}

void Logger::log_request_start(const RequestContext& ctx) {
    log(LogLevel::INFO, "Request started", context_fields("request_start", ctx));
}

void Logger::log_progress(const RequestContext& ctx, const ProgressEvent& event) {
    auto fields = context_fields("progress", ctx);
    fields["phase"] = event.phase;
    fields["percent"] = std::to_string(event.percent);

    log(LogLevel::DEBUG, event.message, fields);
}

void Logger::log_request_complete(const RequestContext& ctx, double execution_time_ms) {
    auto fields = context_fields("request_complete", ctx);
    fields["execution_time_ms"] = std::to_string(execution_time_ms);

    log(LogLevel::INFO, "Request completed", fields);
}

void Logger::log_request_failed(const RequestContext& ctx, const std::string& error_message) {
    auto fields = context_fields("request_failed", ctx);
    fields["error_message"] = error_message;

    log(LogLevel::ERROR, "Request failed", fields);
}

void Logger::log_request_timeout(const RequestContext& ctx, long long timeout_ms) {
    auto fields = context_fields("request_timeout", ctx);
    fields["timeout_ms"] = std::to_string(timeout_ms);

    log(LogLevel::WARN, "Request timed out", fields);
}

void Logger::log_request_cancelled(const RequestContext& ctx, const std::string& reason) {
    auto fields = context_fields("request_cancelled", ctx);
    fields["reason"] = reason;

    log(LogLevel::INFO, "Request cancelled", fields);
}

void Logger::log_state_transition(DispatcherState old_state, DispatcherState new_state) {
    std::map<std::string, std::string> fields;
    fields["event"] = "state_transition";
    fields["old_state"] = state_to_string(old_state);
    fields["new_state"] = state_to_string(new_state);

    log(LogLevel::DEBUG, "State transition", fields);
}

void Logger::log_warning(const RequestContext& ctx, const std::string& warning_message) {
    auto fields = context_fields("warning", ctx);
    fields["warning"] = warning_message;

    log(LogLevel::WARN, warning_message, fields);
}

void Logger::flush() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (config_.enable_console) {
        std::cerr.flush();
    }
    if (file_stream_ && file_stream_->is_open()) {
        file_stream_->flush();
    }
}

void Logger::log(LogLevel level, const std::string& message,
                 const std::map<std::string, std::string>& fields) {
    std::lock_guard<std::mutex> lock(mutex_);

    if (level < config_.min_level) {
        return;
    }

    const std::string line = config_.enable_json
        ? format_json_line(level, message, fields)
        : format_text_line(level, message, fields);

    if (config_.enable_console) {
        std::cerr << line << '\n';
    }
    if (config_.enable_file && file_stream_ && file_stream_->is_open()) {
        *file_stream_ << line << '\n';
    }
}

// UTC, ISO-8601 with millisecond precision
std::string Logger::get_timestamp() const {
    using namespace std::chrono;
    const auto now = system_clock::now();
    const std::time_t seconds = system_clock::to_time_t(now);
    const auto millis = duration_cast<milliseconds>(now.time_since_epoch()).count() % 1000;

    std::tm utc{};
#ifdef _WIN32
    gmtime_s(&utc, &seconds);
#else
    gmtime_r(&seconds, &utc);
#endif

    char buf[32];
    std::strftime(buf, sizeof(buf), "%Y-%m-%dT%H:%M:%S", &utc);
    char out[40];
    std::snprintf(out, sizeof(out), "%s.%03dZ", buf, static_cast<int>(millis));
    return out;
}

std::string Logger::format_json_line(LogLevel level, const std::string& message,
                                     const std::map<std::string, std::string>& fields) const {
    nlohmann::json record(fields);
    record["timestamp"] = get_timestamp();
    record["level"] = level_to_string(level);
    record["message"] = message;
    // Invalid UTF-8 in a message must not take the logger down
    return record.dump(-1, ' ', false, nlohmann::json::error_handler_t::replace);
}

std::string Logger::format_text_line(LogLevel level, const std::string& message,
                                     const std::map<std::string, std::string>& fields) const {
    std::string line = get_timestamp() + " [" + level_to_string(level) + "] " + message;
    if (fields.empty()) {
        return line;
    }

    line += " {";
    const char* sep = "";
    for (const auto& entry : fields) {
        line += sep;
        line += entry.first + "=" + entry.second;
        sep = ", ";
    }
    line += "}";
    return line;
}

} // namespace retirecalc
