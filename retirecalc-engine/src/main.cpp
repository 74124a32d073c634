#include <iostream>
#include <fstream>
#include <string>
#include "calculation.hpp"
#include "errors.hpp"
#include "plan_optimizer.hpp"
#include "return_generator.hpp"
#include "io/json_io.hpp"
#include "io/parquet_writer.hpp"

#include <nlohmann/json.hpp>
using json = nlohmann::json;

namespace {

struct CLIArgs {
    std::string inputs_path;
    std::string returns_path;
    std::string output_path;
    std::string parquet_path;
    size_t num_paths = 1000;
    bool paths_set = false;
    uint32_t seed = 12345;
    bool seed_set = false;
    bool truly_random = false;
    bool no_generational = false;
    bool optimize = false;
    bool compact = false;
    bool help = false;
};

void print_usage(const char* program_name) {
    std::cerr << "RetireCalc Engine v1.0.0\n\n";
    std::cerr << "Usage: " << program_name << " --inputs <path> [options]\n\n";
    std::cerr << "Input options:\n";
    std::cerr << "  --inputs <path>             JSON plan: a SimulationInputs object, or an object\n";
    std::cerr << "                              with \"inputs\" and an optional \"calculation\"\n";
    std::cerr << "                              section (paths, seed, generational, ...)\n";
    std::cerr << "  --returns <path>            CSV (year,return_pct) replacing the built-in\n";
    std::cerr << "                              S&P 500 series\n\n";
    std::cerr << "Simulation options:\n";
    std::cerr << "  --paths <count>             Monte Carlo paths (default: 1000)\n";
    std::cerr << "  --seed <value>              Base seed for reproducible runs (default: 12345)\n";
    std::cerr << "  --truly-random              Reseed from the operating system\n";
    std::cerr << "  --no-generational           Skip the generational wealth analysis\n";
    std::cerr << "  --optimize                  Also search for contribution surplus, maximum\n";
    std::cerr << "                              splurge and earliest retirement age\n\n";
    std::cerr << "Output options:\n";
    std::cerr << "  --output <path>             JSON output file (default: stdout)\n";
    std::cerr << "  --parquet <path>            Percentile series as Parquet (needs Arrow)\n";
    std::cerr << "  --compact                   Single-line JSON\n\n";
    std::cerr << "Other options:\n";
    std::cerr << "  --help                      Show this help message\n\n";
    std::cerr << "Example:\n";
    std::cerr << "  " << program_name << " --inputs examples/plan.json --paths 2000 --seed 7 \\\n";
    std::cerr << "      --output result.json\n";
}

bool file_exists(const std::string& path) {
    std::ifstream f(path);
    return f.good();
}

bool parse_args(int argc, char* argv[], CLIArgs& args) {
    try {
        for (int i = 1; i < argc; ++i) {
            std::string arg = argv[i];

            if (arg == "--help" || arg == "-h") {
                args.help = true;
                return true;
            } else if (arg == "--inputs" && i + 1 < argc) {
                args.inputs_path = argv[++i];
            } else if (arg == "--returns" && i + 1 < argc) {
                args.returns_path = argv[++i];
            } else if (arg == "--paths" && i + 1 < argc) {
                args.num_paths = static_cast<size_t>(std::stoul(argv[++i]));
                args.paths_set = true;
            } else if (arg == "--seed" && i + 1 < argc) {
                args.seed = static_cast<uint32_t>(std::stoul(argv[++i]));
                args.seed_set = true;
            } else if (arg == "--truly-random") {
                args.truly_random = true;
            } else if (arg == "--no-generational") {
                args.no_generational = true;
            } else if (arg == "--optimize") {
                args.optimize = true;
            } else if (arg == "--output" && i + 1 < argc) {
                args.output_path = argv[++i];
            } else if (arg == "--parquet" && i + 1 < argc) {
                args.parquet_path = argv[++i];
            } else if (arg == "--compact") {
                args.compact = true;
            } else {
                std::cerr << "Error: Unknown option or missing argument: " << arg << "\n\n";
                return false;
            }
        }
    } catch (const std::logic_error& e) {
        std::cerr << "Error: Invalid numeric argument (" << e.what() << ")\n\n";
        return false;
    }
    return true;
}

bool validate_args(const CLIArgs& args) {
    bool valid = true;

    if (args.inputs_path.empty()) {
        std::cerr << "Error: --inputs is required\n";
        valid = false;
    } else if (!file_exists(args.inputs_path)) {
        std::cerr << "Error: Inputs file not found: " << args.inputs_path << "\n";
        valid = false;
    }

    if (!args.returns_path.empty() && !file_exists(args.returns_path)) {
        std::cerr << "Error: Return series file not found: " << args.returns_path << "\n";
        valid = false;
    }

    if (args.paths_set && args.num_paths == 0) {
        std::cerr << "Error: --paths must be greater than 0\n";
        valid = false;
    }

    return valid;
}

json read_json_file(const std::string& path) {
    std::ifstream f(path);
    if (!f.is_open()) {
        throw std::runtime_error("Failed to open inputs file: " + path);
    }
    try {
        json j;
        f >> j;
        return j;
    } catch (const json::exception& e) {
        throw std::runtime_error("Failed to parse JSON: " + std::string(e.what()));
    }
}

} // anonymous namespace

int main(int argc, char* argv[]) {
    CLIArgs args;

    if (!parse_args(argc, argv, args)) {
        print_usage(argv[0]);
        return 1;
    }

    if (args.help || argc == 1) {
        print_usage(argv[0]);
        return 0;
    }

    if (!validate_args(args)) {
        std::cerr << "\nUse --help for usage information.\n";
        return 1;
    }

    try {
        std::cerr << "Loading plan from " << args.inputs_path << "..." << std::flush;
        json doc = read_json_file(args.inputs_path);

        // A plan document wraps the inputs and an optional "calculation"
        // section; a bare inputs object is accepted too
        const bool wrapped = doc.is_object() && doc.contains("inputs");
        retirecalc::SimulationInputs inputs =
            retirecalc::io::parse_simulation_inputs(wrapped ? doc["inputs"] : doc);
        retirecalc::CalculationSettings settings;
        if (wrapped && doc.contains("calculation")) {
            settings = retirecalc::io::parse_calculation_settings(doc["calculation"]);
        }
        std::cerr << " done\n";

        if (!args.returns_path.empty()) {
            std::cerr << "Loading return series from " << args.returns_path << "..." << std::flush;
            retirecalc::ReturnSeries series = retirecalc::load_return_series_csv(args.returns_path);
            inputs.return_series_pct = series.returns_pct;
            inputs.return_series_first_year = series.first_year;
            std::cerr << " loaded " << series.returns_pct.size() << " years from "
                      << series.first_year << "\n";
        }

        // Command-line flags override the plan document
        if (args.paths_set) settings.num_paths = args.num_paths;
        if (args.seed_set) settings.seed = args.seed;
        if (args.truly_random) inputs.return_mode = retirecalc::ReturnMode::TrulyRandom;
        if (args.no_generational) settings.include_generational = false;

        retirecalc::validate_inputs(inputs);

        std::cerr << "RetireCalc Engine v1.0.0\n";
        std::cerr << "Configuration:\n";
        std::cerr << "  Filing:      " << retirecalc::to_string(inputs.filing_status) << "\n";
        std::cerr << "  Ages:        " << inputs.age1;
        if (inputs.is_married()) std::cerr << " / " << inputs.age2;
        std::cerr << " -> retire at " << inputs.retirement_age << "\n";
        std::cerr << "  Return mode: " << retirecalc::to_string(inputs.return_mode) << "\n";
        std::cerr << "  Paths:       " << settings.num_paths << "\n";
        std::cerr << "  Seed:        " << settings.seed << "\n\n";

        retirecalc::BatchOptions options;
        options.on_progress = [](size_t completed, size_t total) {
            std::cerr << "\rRunning Monte Carlo simulation... " << completed << " / " << total
                      << std::flush;
        };

        retirecalc::CalculationResult result =
            retirecalc::run_calculation(inputs, settings, options);
        std::cerr << "\n";

        std::cerr << "\nResults:\n";
        std::cerr << "  Balance at retirement: " << result.balance_at_retirement_nominal
                  << " (real " << result.balance_at_retirement_real << ")\n";
        std::cerr << "  Year-1 withdrawal:     " << result.y1_withdrawal_gross << " gross, "
                  << result.y1_withdrawal_after_tax << " after tax\n";
        std::cerr << "  End of life (real):    " << result.eol_real << "\n";
        std::cerr << "  Estate tax:            " << result.estate_tax_nominal << "\n";
        std::cerr << "  Probability of ruin:   " << result.prob_ruin << "\n";
        std::cerr << "  Execution:             " << result.batch.execution_time_ms << " ms\n";

        json output = retirecalc::io::to_json(result);
        output["inputs"] = retirecalc::io::to_json(inputs);

        if (args.optimize) {
            std::cerr << "\nOptimizing plan..." << std::flush;
            retirecalc::PlanOptimizationResult plan =
                retirecalc::optimize_plan(inputs, settings.seed);
            output["plan_optimization"] = retirecalc::io::to_json(plan);
            std::cerr << " earliest retirement age " << plan.earliest_retirement_age << "\n";
        }

        if (!args.parquet_path.empty()) {
            retirecalc::ParquetWriter::write_percentiles(result.batch, settings.current_year,
                                                         args.parquet_path);
            std::cerr << "Percentiles written to: " << args.parquet_path << "\n";
        }

        const int indent = args.compact ? -1 : 2;
        if (args.output_path.empty()) {
            std::cout << output.dump(indent) << "\n";
        } else {
            std::ofstream out(args.output_path);
            if (!out) {
                throw std::runtime_error("Failed to open output file: " + args.output_path);
            }
            out << output.dump(indent) << "\n";
            std::cerr << "\nOutput written to: " << args.output_path << "\n";
        }

        return 0;
    } catch (const retirecalc::ValidationError& e) {
        std::cerr << "\nError: " << e.what() << " (field: " << e.field() << ")\n";
        return 2;
    } catch (const std::exception& e) {
        std::cerr << "\nError: " << e.what() << "\n";
        return 1;
    }
}
