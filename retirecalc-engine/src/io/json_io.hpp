#ifndef RETIRECALC_IO_JSON_IO_HPP
#define RETIRECALC_IO_JSON_IO_HPP

#include "../batch_orchestrator.hpp"
#include "../calculation.hpp"
#include "../errors.hpp"
#include "../generational_model.hpp"
#include "../guardrails.hpp"
#include "../plan_optimizer.hpp"
#include "../roth_optimizer.hpp"
#include "../simulation_inputs.hpp"
#include <nlohmann/json.hpp>
#include <ostream>
#include <string>

namespace retirecalc {
namespace io {

// Malformed JSON or a value of the wrong type
class JsonInputError : public CalcError {
public:
    explicit JsonInputError(const std::string& message) : CalcError(message) {}
};

// ============================================================================
// Readers
// ============================================================================
//
// Every key is accepted in snake_case (the field name) or in the camelCase
// form used by the planner front end ("retirementAge", "cTax1", "wdRate").
// Missing keys keep their defaults. Unknown enum strings raise ValidationError,
// malformed documents JsonInputError. No range checks are done here; call
// validate_inputs() before simulating.

SimulationInputs parse_simulation_inputs(const nlohmann::json& j);
SimulationInputs parse_simulation_inputs_string(const std::string& json_string);
SimulationInputs parse_simulation_inputs_file(const std::string& filepath);

GenerationalSettings parse_generational_settings(const nlohmann::json& j);
RothOptimizerParams parse_roth_params(const nlohmann::json& j);

// Reads an optional top-level "generational" object and the batch size/seed
// keys ("paths", "seed") of a plan document
CalculationSettings parse_calculation_settings(const nlohmann::json& j);

// ============================================================================
// Writers
// ============================================================================

nlohmann::json to_json(const SimulationInputs& inputs);
nlohmann::json to_json(const BatchSummary& batch, bool include_runs = false);
nlohmann::json to_json(const GenerationalPayout& payout);
nlohmann::json to_json(const GuardrailsResult& result);
nlohmann::json to_json(const RothConversionResult& result);
nlohmann::json to_json(const PlanOptimizationResult& result);
nlohmann::json to_json(const CalculationResult& result);

void write_calculation_result_json(std::ostream& os, const CalculationResult& result,
                                   bool pretty_print = true);
void write_calculation_result_json(const std::string& filepath, const CalculationResult& result,
                                   bool pretty_print = true);

void write_batch_summary_json(std::ostream& os, const BatchSummary& batch,
                              bool pretty_print = true);

} // namespace io
} // namespace retirecalc

#endif // RETIRECALC_IO_JSON_IO_HPP
