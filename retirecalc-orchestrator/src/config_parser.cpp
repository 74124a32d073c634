#include "config_parser.hpp"
#include "../../retirecalc-engine/src/io/json_io.hpp"
#include <nlohmann/json.hpp>
#include <cctype>
#include <cmath>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <sstream>

using json = nlohmann::json;
namespace fs = std::filesystem;

namespace retirecalc {
namespace orchestrator {

namespace {

const json* section(const json& j, const char* name) {
    auto it = j.find(name);
    if (it == j.end() || it->is_null()) {
        return nullptr;
    }
    if (!it->is_object()) {
        throw ConfigParseError(std::string("Section '") + name + "' must be an object");
    }
    return &*it;
}

std::string path_value(const json& j, const char* key, const std::string& base_file) {
    auto it = j.find(key);
    if (it == j.end() || it->is_null()) {
        return "";
    }
    std::string value = expand_environment_variables(it->get<std::string>());
    return base_file.empty() ? value : resolve_relative_path(value, base_file);
}

void parse_dispatcher(const json& j, DispatcherConfig& config) {
    if (j.contains("queue_capacity")) {
        int capacity = j["queue_capacity"].get<int>();
        if (capacity <= 0) {
            throw ConfigParseError("dispatcher.queue_capacity must be positive");
        }
        config.queue_capacity = static_cast<size_t>(capacity);
    }
    if (j.contains("legacy_timeout_seconds")) {
        double seconds = j["legacy_timeout_seconds"].get<double>();
        if (!(seconds > 0.0)) {
            throw ConfigParseError("dispatcher.legacy_timeout_seconds must be positive");
        }
        config.legacy_timeout =
            std::chrono::milliseconds(static_cast<long long>(std::llround(seconds * 1000.0)));
    }
}

void parse_logging(const json& j, LoggerConfig& config, const std::string& base_file) {
    if (j.contains("level")) {
        std::string level = j["level"].get<std::string>();
        if (level != "DEBUG" && level != "INFO" && level != "WARN" && level != "ERROR") {
            throw ConfigParseError("Unknown logging.level: " + level);
        }
        config.min_level = string_to_level(level);
    }
    config.enable_json = j.value("json", config.enable_json);
    config.enable_console = j.value("console", config.enable_console);

    std::string file = path_value(j, "file", base_file);
    if (!file.empty()) {
        config.enable_file = true;
        config.log_file_path = file;
    }
}

void parse_output(const json& j, OutputConfig& config, const std::string& base_file) {
    config.json_path = path_value(j, "json", base_file);
    config.parquet_path = path_value(j, "parquet", base_file);
    config.pretty_print = j.value("pretty", config.pretty_print);
}

// base_file is the config file path, or empty when parsing a bare string
RunConfig parse_run_config(const std::string& json_string, const std::string& base_file) {
    RunConfig config;

    try {
        json j = json::parse(json_string);
        if (!j.is_object()) {
            throw ConfigParseError("Run configuration must be a JSON object");
        }

        auto inputs = j.find("inputs");
        if (inputs == j.end() || inputs->is_null()) {
            throw ConfigParseError("Missing required field: inputs");
        }
        if (inputs->is_string()) {
            std::string path = path_value(j, "inputs", base_file);
            config.inputs = io::parse_simulation_inputs_file(path);
        } else if (inputs->is_object()) {
            config.inputs = io::parse_simulation_inputs(*inputs);
        } else {
            throw ConfigParseError("Field 'inputs' must be an object or a file path");
        }

        if (const json* calc = section(j, "calculation")) {
            config.settings = io::parse_calculation_settings(*calc);
        }
        if (config.settings.num_paths == 0) {
            throw ConfigParseError("calculation.paths must be positive");
        }

        config.returns_path = path_value(j, "returns", base_file);

        if (const json* dispatcher = section(j, "dispatcher")) {
            parse_dispatcher(*dispatcher, config.dispatcher);
        }
        if (const json* logging = section(j, "logging")) {
            parse_logging(*logging, config.logging, base_file);
        }
        if (const json* output = section(j, "output")) {
            parse_output(*output, config.output, base_file);
        }
    } catch (const json::parse_error& e) {
        throw ConfigParseError(std::string("JSON parse error: ") + e.what());
    } catch (const json::type_error& e) {
        throw ConfigParseError(std::string("JSON type error: ") + e.what());
    } catch (const io::JsonInputError& e) {
        throw ConfigParseError(std::string("inputs: ") + e.what());
    }

    return config;
}

} // anonymous namespace

std::string expand_environment_variables(const std::string& value) {
    std::string result = value;
    size_t pos = 0;

    while ((pos = result.find('$', pos)) != std::string::npos) {
        size_t start = pos++;

        bool braces = pos < result.size() && result[pos] == '{';
        if (braces) {
            pos++;
        }

        size_t name_start = pos;
        while (pos < result.size() &&
               (std::isalnum(static_cast<unsigned char>(result[pos])) || result[pos] == '_')) {
            pos++;
        }
        std::string var_name = result.substr(name_start, pos - name_start);

        if (var_name.empty() || (braces && (pos >= result.size() || result[pos] != '}'))) {
            pos = start + 1;  // not a reference; keep the '$'
            continue;
        }
        if (braces) {
            pos++;
        }

        const char* env_value = std::getenv(var_name.c_str());
        std::string replacement = env_value ? env_value : "";
        result.replace(start, pos - start, replacement);
        pos = start + replacement.size();
    }

    return result;
}

std::string resolve_relative_path(const std::string& path, const std::string& config_file_path) {
    if (path.empty()) {
        return path;
    }
    fs::path p(path);
    if (p.is_absolute()) {
        return path;
    }
    return (fs::path(config_file_path).parent_path() / p).string();
}

RunConfig parse_run_config_from_string(const std::string& json_string) {
    return parse_run_config(json_string, "");
}

RunConfig parse_run_config_from_file(const std::string& file_path) {
    std::ifstream file(file_path);
    if (!file.is_open()) {
        throw ConfigParseError("Failed to open config file: " + file_path);
    }

    std::ostringstream buffer;
    buffer << file.rdbuf();
    return parse_run_config(buffer.str(), file_path);
}

} // namespace orchestrator
} // namespace retirecalc
