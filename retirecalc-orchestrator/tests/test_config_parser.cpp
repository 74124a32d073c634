/**
 * @file test_config_parser.cpp
 * @brief Unit tests for run configuration parsing
 */

#include <catch2/catch_test_macros.hpp>
#include <catch2/catch_approx.hpp>
#include "../src/config_parser.hpp"
#include <cstdlib>
#include <filesystem>
#include <fstream>

using namespace retirecalc;
using namespace retirecalc::orchestrator;
using Catch::Approx;

namespace {

void write_file(const std::string& path, const std::string& content) {
    std::ofstream f(path);
    f << content;
}

} // anonymous namespace

TEST_CASE("Parse minimal run config", "[config]") {
    RunConfig config = parse_run_config_from_string(R"({"inputs": {"age1": 50}})");

    REQUIRE(config.inputs.age1 == 50);
    REQUIRE(config.settings.num_paths == 1000);
    REQUIRE(config.settings.seed == 12345);
    REQUIRE(config.returns_path.empty());
    REQUIRE(config.dispatcher.queue_capacity == 16);
    REQUIRE(config.dispatcher.legacy_timeout == std::chrono::seconds(60));
    REQUIRE(config.logging.min_level == LogLevel::INFO);
    REQUIRE_FALSE(config.logging.enable_file);
    REQUIRE(config.output.json_path.empty());
    REQUIRE(config.output.pretty_print);
}

TEST_CASE("Parse complete run config", "[config]") {
    RunConfig config = parse_run_config_from_string(R"({
        "inputs": {"marital": "married", "age1": 45, "age2": 44, "retirementAge": 60},
        "calculation": {"paths": 500, "seed": 7, "showGen": false},
        "returns": "/data/sp500.csv",
        "dispatcher": {"queue_capacity": 4, "legacy_timeout_seconds": 2.5},
        "logging": {"level": "DEBUG", "json": false, "console": false, "file": "/tmp/rc.log"},
        "output": {"json": "/tmp/result.json", "parquet": "/tmp/p.parquet", "pretty": false}
    })");

    REQUIRE(config.inputs.is_married());
    REQUIRE(config.inputs.retirement_age == 60);
    REQUIRE(config.settings.num_paths == 500);
    REQUIRE(config.settings.seed == 7);
    REQUIRE_FALSE(config.settings.include_generational);
    REQUIRE(config.returns_path == "/data/sp500.csv");

    REQUIRE(config.dispatcher.queue_capacity == 4);
    REQUIRE(config.dispatcher.legacy_timeout == std::chrono::milliseconds(2500));

    REQUIRE(config.logging.min_level == LogLevel::DEBUG);
    REQUIRE_FALSE(config.logging.enable_json);
    REQUIRE_FALSE(config.logging.enable_console);
    REQUIRE(config.logging.enable_file);
    REQUIRE(config.logging.log_file_path == "/tmp/rc.log");

    REQUIRE(config.output.json_path == "/tmp/result.json");
    REQUIRE(config.output.parquet_path == "/tmp/p.parquet");
    REQUIRE_FALSE(config.output.pretty_print);
}

TEST_CASE("Run config errors", "[config]") {
    SECTION("Invalid JSON") {
        REQUIRE_THROWS_AS(parse_run_config_from_string("{ invalid json }"), ConfigParseError);
    }

    SECTION("Not an object") {
        REQUIRE_THROWS_AS(parse_run_config_from_string("[]"), ConfigParseError);
    }

    SECTION("Missing inputs") {
        REQUIRE_THROWS_AS(parse_run_config_from_string(R"({"calculation": {}})"),
                          ConfigParseError);
    }

    SECTION("Inputs of the wrong type") {
        REQUIRE_THROWS_AS(parse_run_config_from_string(R"({"inputs": 42})"), ConfigParseError);
    }

    SECTION("Wrongly typed input field") {
        REQUIRE_THROWS_AS(parse_run_config_from_string(R"({"inputs": {"age1": "old"}})"),
                          ConfigParseError);
    }

    SECTION("Zero paths") {
        REQUIRE_THROWS_AS(
            parse_run_config_from_string(R"({"inputs": {}, "calculation": {"paths": 0}})"),
            ConfigParseError);
    }

    SECTION("Section must be an object") {
        REQUIRE_THROWS_AS(parse_run_config_from_string(R"({"inputs": {}, "logging": "DEBUG"})"),
                          ConfigParseError);
    }

    SECTION("Non-positive queue capacity") {
        REQUIRE_THROWS_AS(parse_run_config_from_string(
                              R"({"inputs": {}, "dispatcher": {"queue_capacity": 0}})"),
                          ConfigParseError);
    }

    SECTION("Non-positive legacy timeout") {
        REQUIRE_THROWS_AS(parse_run_config_from_string(
                              R"({"inputs": {}, "dispatcher": {"legacy_timeout_seconds": 0}})"),
                          ConfigParseError);
    }

    SECTION("Unknown log level") {
        REQUIRE_THROWS_AS(
            parse_run_config_from_string(R"({"inputs": {}, "logging": {"level": "TRACE"}})"),
            ConfigParseError);
    }

    SECTION("Unknown enum in inputs") {
        REQUIRE_THROWS_AS(
            parse_run_config_from_string(R"({"inputs": {"filing_status": "widowed"}})"),
            ValidationError);
    }

    SECTION("Missing file") {
        REQUIRE_THROWS_AS(parse_run_config_from_file("/nonexistent/run.json"), ConfigParseError);
    }
}

TEST_CASE("Error messages carry the config prefix", "[config]") {
    try {
        parse_run_config_from_string(R"({"calculation": {}})");
        FAIL("Expected ConfigParseError");
    } catch (const ConfigParseError& e) {
        REQUIRE(std::string(e.what()) == "Config error: Missing required field: inputs");
    }
}

TEST_CASE("Environment variable expansion", "[config]") {
    setenv("RETIRECALC_TEST_DIR", "/var/plans", 1);
    unsetenv("RETIRECALC_TEST_UNSET");

    SECTION("Braced and bare references") {
        REQUIRE(expand_environment_variables("${RETIRECALC_TEST_DIR}/a.json") ==
                "/var/plans/a.json");
        REQUIRE(expand_environment_variables("$RETIRECALC_TEST_DIR/b.json") ==
                "/var/plans/b.json");
    }

    SECTION("Unset variables expand to nothing") {
        REQUIRE(expand_environment_variables("x${RETIRECALC_TEST_UNSET}y") == "xy");
    }

    SECTION("Lone dollar signs are kept") {
        REQUIRE(expand_environment_variables("cost $ 5") == "cost $ 5");
        REQUIRE(expand_environment_variables("${unterminated") == "${unterminated");
        REQUIRE(expand_environment_variables("no references") == "no references");
    }

    SECTION("Expanded in config paths") {
        RunConfig config = parse_run_config_from_string(
            R"({"inputs": {}, "output": {"json": "${RETIRECALC_TEST_DIR}/out.json"}})");
        REQUIRE(config.output.json_path == "/var/plans/out.json");
    }

    unsetenv("RETIRECALC_TEST_DIR");
}

TEST_CASE("Relative path resolution", "[config]") {
    REQUIRE(resolve_relative_path("data/returns.csv", "/etc/retirecalc/run.json") ==
            "/etc/retirecalc/data/returns.csv");
    REQUIRE(resolve_relative_path("/abs/returns.csv", "/etc/retirecalc/run.json") ==
            "/abs/returns.csv");
    REQUIRE(resolve_relative_path("", "/etc/retirecalc/run.json").empty());
}

TEST_CASE("Parse run config from file", "[config]") {
    namespace fs = std::filesystem;
    const fs::path dir = fs::temp_directory_path() / "retirecalc_config_test";
    fs::create_directories(dir);

    const std::string inputs_path = (dir / "plan.json").string();
    const std::string config_path = (dir / "run.json").string();

    write_file(inputs_path, R"({"age1": 38, "retirementAge": 58, "rothBalance": 90000})");
    write_file(config_path, R"({
        "inputs": "plan.json",
        "returns": "returns.csv",
        "output": {"json": "out/result.json"}
    })");

    RunConfig config = parse_run_config_from_file(config_path);
    REQUIRE(config.inputs.age1 == 38);
    REQUIRE(config.inputs.retirement_age == 58);
    REQUIRE(config.inputs.roth_balance == Approx(90000.0));
    REQUIRE(config.returns_path == (dir / "returns.csv").string());
    REQUIRE(config.output.json_path == (dir / "out" / "result.json").string());

    fs::remove_all(dir);
}
