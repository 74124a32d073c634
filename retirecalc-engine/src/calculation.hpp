#ifndef RETIRECALC_CALCULATION_HPP
#define RETIRECALC_CALCULATION_HPP

#include "batch_orchestrator.hpp"
#include "generational_model.hpp"
#include "guardrails.hpp"
#include "roth_optimizer.hpp"
#include "simulation_inputs.hpp"
#include "tax_model.hpp"
#include <cstdint>
#include <optional>
#include <vector>

namespace retirecalc {

// One year of the median chart series. Balances are in dollars of that year
// (nominal) except `balance_real`.
struct ChartPoint {
    int year;                       // calendar year
    int age1;
    std::optional<int> age2;
    double balance_nominal;
    double balance_real;
    double p10_nominal;
    double p90_nominal;

    ChartPoint();
};

// Estimated RMD in a retirement year against the spending still needed after
// Social Security
struct RmdRow {
    int age;
    double spending;
    double rmd;

    RmdRow();
    RmdRow(int row_age, double need, double required);
};

// Terminal wealth split by the starting account mix, today's dollars
struct AccountSplit {
    double taxable;
    double pretax;
    double roth;

    AccountSplit();
};

// First-year withdrawal taxes, nominal
struct TaxBreakdown {
    double federal_ordinary;
    double federal_capital_gains;
    double niit;
    double state;
    double total;

    TaxBreakdown();
};

struct CalculationSettings {
    size_t num_paths = 1000;
    uint32_t seed = 12345;
    int current_year = TAX_YEAR;

    bool include_generational = true;
    GenerationalSettings generational;

    double guardrail_spending_reduction = 0.10;

    bool run_roth_optimizer = true;
    double roth_target_bracket = 0.24;

    EstateTaxPolicy estate_policy;
};

struct CalculationResult {
    // Accumulation
    double balance_at_retirement_nominal;
    double balance_at_retirement_real;
    double total_contributions;
    int years_to_retirement;
    int years_to_simulate;

    // First retirement year, median-to-p25 blend
    double y1_withdrawal_gross;
    double y1_withdrawal_after_tax;
    double y1_withdrawal_real;
    TaxBreakdown tax;

    // Terminal estate
    int survival_years;
    double eol_nominal;
    double eol_real;
    int year_of_death;
    double estate_tax_nominal;
    double estate_tax_real;
    double net_estate_real;
    AccountSplit eol_accounts;

    double prob_ruin;

    std::vector<ChartPoint> chart;
    std::vector<RmdRow> rmd_table;

    BatchSummary batch;
    std::optional<GenerationalPayout> generational;
    std::optional<GuardrailsResult> guardrails;         // only when some paths ruin
    std::optional<RothConversionResult> roth;

    CalculationResult();
};

// Full pipeline: batch simulation, summary metrics, chart series, RMD table,
// estate tax at the year of death, then the generational, guardrails and Roth
// analyses. Progress and cancellation are forwarded to the batch.
//
// Throws ValidationError, CancelledError, or ComputationError when the batch
// produced no balance series.
CalculationResult run_calculation(const SimulationInputs& inputs,
                                  const CalculationSettings& settings,
                                  const BatchOptions& options = BatchOptions());

} // namespace retirecalc

#endif // RETIRECALC_CALCULATION_HPP
