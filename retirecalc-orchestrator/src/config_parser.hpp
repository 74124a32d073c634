/**
 * @file config_parser.hpp
 * @brief Run configuration for the compute dispatcher
 *
 * A run configuration bundles a plan (inputs and calculation settings) with
 * dispatcher, logging and output settings:
 *
 *   @code
 *   {
 *     "inputs": { "age1": 40, "retirementAge": 62, ... },   // or a path to a JSON file
 *     "calculation": { "paths": 1000, "seed": 12345, "generational": { ... } },
 *     "returns": "data/sp500.csv",
 *     "dispatcher": { "queue_capacity": 16, "legacy_timeout_seconds": 60 },
 *     "logging": { "level": "INFO", "json": true, "file": "${HOME}/retirecalc.log" },
 *     "output": { "json": "result.json", "parquet": "percentiles.parquet" }
 *   }
 *   @endcode
 *
 * String values may reference environment variables as ${VAR} or $VAR.
 * Relative paths in a file are resolved against the file's directory.
 */

#ifndef RETIRECALC_ORCHESTRATOR_CONFIG_PARSER_HPP
#define RETIRECALC_ORCHESTRATOR_CONFIG_PARSER_HPP

#include "compute_dispatcher.hpp"
#include "logger.hpp"
#include "../../retirecalc-engine/src/calculation.hpp"
#include "../../retirecalc-engine/src/errors.hpp"
#include "../../retirecalc-engine/src/simulation_inputs.hpp"
#include <string>

namespace retirecalc {
namespace orchestrator {

/**
 * @brief Exception thrown when a run configuration cannot be parsed
 */
class ConfigParseError : public CalcError {
public:
    explicit ConfigParseError(const std::string& message)
        : CalcError("Config error: " + message) {}
};

/**
 * @brief Where results are written; empty paths are skipped
 */
struct OutputConfig {
    std::string json_path;
    std::string parquet_path;
    bool pretty_print;

    OutputConfig() : pretty_print(true) {}
};

/**
 * @brief Parsed run configuration
 */
struct RunConfig {
    SimulationInputs inputs;
    CalculationSettings settings;
    std::string returns_path;      ///< Optional CSV replacing the built-in return history
    DispatcherConfig dispatcher;
    LoggerConfig logging;
    OutputConfig output;
};

/**
 * @brief Parses a run configuration from a JSON file
 *
 * @throws ConfigParseError if the file cannot be read or the JSON is invalid
 * @throws ValidationError if an enum value in the inputs is unknown
 */
RunConfig parse_run_config_from_file(const std::string& file_path);

/**
 * @brief Parses a run configuration from a JSON string
 *
 * An "inputs" value given as a path is resolved against the working directory.
 *
 * @throws ConfigParseError if the JSON is invalid or a section is malformed
 */
RunConfig parse_run_config_from_string(const std::string& json_string);

/**
 * @brief Expands environment variable references in a string
 *
 * Supports ${VAR_NAME} and $VAR_NAME. Unset variables expand to "".
 */
std::string expand_environment_variables(const std::string& value);

/**
 * @brief Resolves a path relative to the directory of the config file
 *
 * Absolute and empty paths are returned unchanged.
 */
std::string resolve_relative_path(const std::string& path, const std::string& config_file_path);

} // namespace orchestrator
} // namespace retirecalc

#endif // RETIRECALC_ORCHESTRATOR_CONFIG_PARSER_HPP
