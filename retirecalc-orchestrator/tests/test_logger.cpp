/**
 * @file test_logger.cpp
 * @brief Unit tests for Logger
 */

#include <catch2/catch_test_macros.hpp>
#include "../src/logger.hpp"
#include <fstream>
#include <sstream>
#include <filesystem>
#include <vector>

using namespace retirecalc;

namespace {

// Flat JSON object of string values, as the logger writes them
std::map<std::string, std::string> parse_json_log(const std::string& line) {
    std::map<std::string, std::string> result;

    size_t pos = 1;  // Skip opening {
    while (pos < line.size() - 1) {
        size_t key_start = line.find('"', pos);
        if (key_start == std::string::npos) break;
        size_t key_end = line.find('"', key_start + 1);
        std::string key = line.substr(key_start + 1, key_end - key_start - 1);

        size_t val_start = line.find('"', key_end + 1);
        if (val_start == std::string::npos) break;
        size_t val_end = line.find('"', val_start + 1);
        std::string value = line.substr(val_start + 1, val_end - val_start - 1);

        result[key] = value;
        pos = val_end + 1;
    }

    return result;
}

// Route the logger to a fresh file
void log_to_file(const std::string& path, LogLevel level = LogLevel::INFO, bool json = true) {
    std::filesystem::remove(path);

    LoggerConfig config;
    config.min_level = level;
    config.enable_console = false;
    config.enable_file = true;
    config.enable_json = json;
    config.log_file_path = path;
    Logger::get_instance().configure(config);
}

std::vector<std::string> read_lines(const std::string& path) {
    Logger::get_instance().flush();

    std::vector<std::string> lines;
    std::ifstream file(path);
    std::string line;
    while (std::getline(file, line)) {
        lines.push_back(line);
    }
    return lines;
}

} // anonymous namespace

TEST_CASE("Logger Configuration", "[logger]") {
    Logger& logger = Logger::get_instance();

    SECTION("Default configuration") {
        LoggerConfig config;

        REQUIRE(config.min_level == LogLevel::INFO);
        REQUIRE(config.enable_console == true);
        REQUIRE(config.enable_file == false);
        REQUIRE(config.enable_json == true);
        REQUIRE(config.log_file_path == "retirecalc.log");
    }

    SECTION("Custom configuration") {
        log_to_file("test_log.log", LogLevel::DEBUG);
        REQUIRE(logger.get_min_level() == LogLevel::DEBUG);
        std::filesystem::remove("test_log.log");
    }

    SECTION("Level setter") {
        logger.set_min_level(LogLevel::ERROR);
        REQUIRE(logger.get_min_level() == LogLevel::ERROR);
    }

    SECTION("Level names") {
        REQUIRE(string_to_level("DEBUG") == LogLevel::DEBUG);
        REQUIRE(string_to_level("WARN") == LogLevel::WARN);
        REQUIRE(string_to_level("verbose") == LogLevel::INFO);
        REQUIRE(level_to_string(LogLevel::ERROR) == "ERROR");
    }
}

TEST_CASE("Logger Dispatcher Lifecycle", "[logger]") {
    const std::string path = "test_dispatcher_lifecycle.log";
    log_to_file(path);

    Logger& logger = Logger::get_instance();
    logger.log_dispatcher_start(16, 60000);
    logger.log_dispatcher_stop("shutdown");

    auto lines = read_lines(path);
    REQUIRE(lines.size() == 2);

    auto start = parse_json_log(lines[0]);
    REQUIRE(start["event"] == "dispatcher_start");
    REQUIRE(start["level"] == "INFO");
    REQUIRE(start["queue_capacity"] == "16");
    REQUIRE(start["legacy_timeout_ms"] == "60000");
    REQUIRE(!start["timestamp"].empty());

    auto stop = parse_json_log(lines[1]);
    REQUIRE(stop["event"] == "dispatcher_stop");
    REQUIRE(stop["reason"] == "shutdown");

    std::filesystem::remove(path);
}

TEST_CASE("Logger Request Tracking", "[logger]") {
    Logger& logger = Logger::get_instance();
    RequestContext ctx(7, MessageType::Run);

    SECTION("Queued and started") {
        const std::string path = "test_request_start.log";
        log_to_file(path);

        logger.log_request_queued(ctx, 3);
        logger.log_request_start(ctx);

        auto lines = read_lines(path);
        REQUIRE(lines.size() == 2);

        auto queued = parse_json_log(lines[0]);
        REQUIRE(queued["event"] == "request_queued");
        REQUIRE(queued["request_id"] == "7");
        REQUIRE(queued["request_type"] == "run");
        REQUIRE(queued["queue_depth"] == "3");

        REQUIRE(parse_json_log(lines[1])["event"] == "request_start");

        std::filesystem::remove(path);
    }

    SECTION("Completed") {
        const std::string path = "test_request_complete.log";
        log_to_file(path);

        logger.log_request_complete(ctx, 812.5);

        auto fields = parse_json_log(read_lines(path).at(0));
        REQUIRE(fields["event"] == "request_complete");
        REQUIRE(std::stod(fields["execution_time_ms"]) == 812.5);

        std::filesystem::remove(path);
    }

    SECTION("Failed") {
        const std::string path = "test_request_failed.log";
        log_to_file(path);

        logger.log_request_failed(ctx, "Monte Carlo simulation returned no balance series");

        auto fields = parse_json_log(read_lines(path).at(0));
        REQUIRE(fields["event"] == "request_failed");
        REQUIRE(fields["level"] == "ERROR");
        REQUIRE(fields["error_message"] == "Monte Carlo simulation returned no balance series");

        std::filesystem::remove(path);
    }

    SECTION("Timed out") {
        const std::string path = "test_request_timeout.log";
        log_to_file(path);

        RequestContext legacy(9, MessageType::Legacy);
        logger.log_request_timeout(legacy, 60000);

        auto fields = parse_json_log(read_lines(path).at(0));
        REQUIRE(fields["event"] == "request_timeout");
        REQUIRE(fields["level"] == "WARN");
        REQUIRE(fields["request_type"] == "legacy");
        REQUIRE(fields["timeout_ms"] == "60000");

        std::filesystem::remove(path);
    }

    SECTION("Cancelled") {
        const std::string path = "test_request_cancelled.log";
        log_to_file(path);

        logger.log_request_cancelled(ctx, "Cancelled before start");

        auto fields = parse_json_log(read_lines(path).at(0));
        REQUIRE(fields["event"] == "request_cancelled");
        REQUIRE(fields["reason"] == "Cancelled before start");

        std::filesystem::remove(path);
    }
}

TEST_CASE("Logger Progress Is Debug Only", "[logger]") {
    Logger& logger = Logger::get_instance();
    RequestContext ctx(3, MessageType::Run);
    ProgressEvent event("monteCarlo", 40, "Running Monte Carlo simulation... 400 / 1000");

    SECTION("Filtered at INFO") {
        const std::string path = "test_progress_info.log";
        log_to_file(path, LogLevel::INFO);

        logger.log_progress(ctx, event);
        REQUIRE(read_lines(path).empty());

        std::filesystem::remove(path);
    }

    SECTION("Written at DEBUG") {
        const std::string path = "test_progress_debug.log";
        log_to_file(path, LogLevel::DEBUG);

        logger.log_progress(ctx, event);

        auto fields = parse_json_log(read_lines(path).at(0));
        REQUIRE(fields["event"] == "progress");
        REQUIRE(fields["phase"] == "monteCarlo");
        REQUIRE(fields["percent"] == "40");
        REQUIRE(fields["message"] == "Running Monte Carlo simulation... 400 / 1000");

        std::filesystem::remove(path);
    }
}

TEST_CASE("Logger State Transitions", "[logger]") {
    const std::string path = "test_states.log";
    log_to_file(path, LogLevel::DEBUG);

    Logger::get_instance().log_state_transition(DispatcherState::IDLE, DispatcherState::BUSY);

    auto fields = parse_json_log(read_lines(path).at(0));
    REQUIRE(fields["event"] == "state_transition");
    REQUIRE(fields["old_state"] == "IDLE");
    REQUIRE(fields["new_state"] == "BUSY");

    std::filesystem::remove(path);
}

TEST_CASE("Logger Warning", "[logger]") {
    const std::string path = "test_warning.log";
    log_to_file(path);

    RequestContext ctx(11, MessageType::Guardrails);
    Logger::get_instance().log_warning(ctx, "Listener threw: bad_alloc");

    auto fields = parse_json_log(read_lines(path).at(0));
    REQUIRE(fields["event"] == "warning");
    REQUIRE(fields["request_type"] == "guardrails");
    REQUIRE(fields["warning"] == "Listener threw: bad_alloc");

    std::filesystem::remove(path);
}

TEST_CASE("Logger Plain Text Output", "[logger]") {
    const std::string path = "test_plain.log";
    log_to_file(path, LogLevel::INFO, false);

    Logger::get_instance().log_request_start(RequestContext(5, MessageType::RothOptimizer));

    auto lines = read_lines(path);
    REQUIRE(lines.size() == 1);
    REQUIRE(lines[0].find("[INFO] Request started") != std::string::npos);
    REQUIRE(lines[0].find("request_type=roth-optimizer") != std::string::npos);
    REQUIRE(lines[0].find("request_id=5") != std::string::npos);

    std::filesystem::remove(path);
}

TEST_CASE("Logger JSON Escaping", "[logger]") {
    const std::string path = "test_escape.log";
    log_to_file(path);

    RequestContext ctx(1, MessageType::Run);
    Logger::get_instance().log_request_failed(ctx, "Error with \"quotes\" and \nnewlines\tand tabs");

    auto lines = read_lines(path);
    REQUIRE(lines.size() == 1);
    REQUIRE(lines[0].find("\\\"") != std::string::npos);
    REQUIRE(lines[0].find("\\n") != std::string::npos);
    REQUIRE(lines[0].find("\\t") != std::string::npos);

    std::filesystem::remove(path);
}
