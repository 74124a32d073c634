/**
 * @file dispatcher_example.cpp
 * @brief Run a plan through the ComputeDispatcher from a run configuration
 *
 * Usage: dispatcher_example <run_config.json>
 *
 * Submits the full calculation, prints Monte Carlo progress as it arrives,
 * then re-runs the guardrails analysis as a separate request on the batch
 * outcomes and writes the configured outputs.
 */

#include "../src/compute_dispatcher.hpp"
#include "../src/config_parser.hpp"
#include "../src/logger.hpp"
#include "../../retirecalc-engine/src/io/json_io.hpp"
#include "../../retirecalc-engine/src/io/parquet_writer.hpp"
#include "../../retirecalc-engine/src/return_generator.hpp"
#include <iostream>

using namespace retirecalc;

int main(int argc, char* argv[]) {
    if (argc != 2) {
        std::cerr << "Usage: " << argv[0] << " <run_config.json>\n";
        return 1;
    }

    try {
        orchestrator::RunConfig config = orchestrator::parse_run_config_from_file(argv[1]);
        Logger::get_instance().configure(config.logging);

        if (!config.returns_path.empty()) {
            ReturnSeries series = load_return_series_csv(config.returns_path);
            config.inputs.return_series_pct = series.returns_pct;
            config.inputs.return_series_first_year = series.first_year;
        }
        validate_inputs(config.inputs);

        ComputeDispatcher dispatcher(config.dispatcher);

        auto calculation = dispatcher.submit_calculation(
            config.inputs, config.settings,
            [](const Message& msg) {
                if (msg.type == MessageType::Progress) {
                    std::cerr << "\r" << msg.progress.message << std::flush;
                } else if (msg.type == MessageType::Error) {
                    std::cerr << "\nRequest " << msg.request_id << " failed: " << msg.error << "\n";
                } else {
                    std::cerr << "\nRequest " << msg.request_id << ": " << to_string(msg.type) << "\n";
                }
            });

        CalculationResult result = calculation.get();

        auto guardrails = dispatcher.submit_guardrails(result.batch.all_runs,
                                                       config.settings.guardrail_spending_reduction);
        GuardrailsResult guardrail_result = guardrails.get();

        std::cout << "Probability of ruin:       " << result.prob_ruin << "\n";
        std::cout << "Median balance at retire:  " << result.balance_at_retirement_nominal << "\n";
        std::cout << "First-year after-tax draw: " << result.y1_withdrawal_after_tax << "\n";
        std::cout << "Success with guardrails:   " << guardrail_result.new_success_rate << "\n";

        if (!config.output.json_path.empty()) {
            io::write_calculation_result_json(config.output.json_path, result,
                                              config.output.pretty_print);
        }
        if (!config.output.parquet_path.empty()) {
            ParquetWriter::write_percentiles(result.batch,
                                                 config.settings.current_year,
                                                 config.output.parquet_path);
        }

        DispatcherStats stats = dispatcher.get_stats();
        std::cerr << "Requests: " << stats.submitted << " submitted, " << stats.completed
                  << " completed, avg " << stats.average_execution_time_ms << " ms\n";

        dispatcher.stop();
        Logger::get_instance().flush();
    } catch (const ValidationError& e) {
        std::cerr << "Error: " << e.what() << " (field: " << e.field() << ")\n";
        return 2;
    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << "\n";
        return 1;
    }

    return 0;
}
