#ifndef RETIRECALC_SIMULATION_ENGINE_HPP
#define RETIRECALC_SIMULATION_ENGINE_HPP

#include "simulation_inputs.hpp"
#include "tax_model.hpp"
#include <cstdint>
#include <vector>

namespace retirecalc {

// One retirement year of a path: what was needed, what was drawn and where it went.
// Amounts are nominal. gross == net + tax_total holds for every record.
struct WithdrawalRecord {
    int year;                       // decumulation year (1-based)
    int age;                        // primary's age in that year
    double requested;               // spending need, or the RMD when larger
    double gross;                   // actually drawn from the accounts
    double tax_ordinary;
    double tax_capital_gains;
    double tax_niit;
    double tax_state;
    double tax_total;
    double net;                     // gross less all withdrawal taxes
    double rmd;
    double social_security;
    double healthcare;
    double roth_conversion;

    WithdrawalRecord();
};

// Result of simulating one return path
struct PathResult {
    // Total wealth (all accounts + emergency fund) at the end of each year,
    // accumulation years 0..R then retirement years 1..S
    std::vector<double> balances_real;
    std::vector<double> balances_nominal;

    double balance_at_retirement;   // nominal, end of accumulation
    double eol_real;                // terminal wealth in today's dollars
    double eol_nominal;

    double y1_gross;                // first-year gross withdrawal, nominal
    double y1_after_tax_real;       // first-year after-tax withdrawal, today's dollars
    WithdrawalTax y1_tax;

    bool ruined;
    int survival_years;             // retirement years fully funded

    double total_roth_conversions;
    double conversion_taxes_paid;

    std::vector<WithdrawalRecord> withdrawals;

    PathResult();
};

struct SimulationConfig {
    bool record_withdrawals;        // If true, populate PathResult::withdrawals

    SimulationConfig();
};

// Simulate one accumulation and decumulation path.
//
// Accumulation (y = 0..R, R = years to retirement):
//   1. Grow all accounts by the year's factor (y > 0), then tax the dividend
//      yield of the taxable account at LTCG rates
//   2. Escalate contributions by income growth (y > 0, when enabled)
//   3. Add contributions mid-year for each person still working
//   4. Deduct child costs, self-employment drag and pre-Medicare premiums
//      from the taxable account
//
// Decumulation (y = 1..S): grow, yield drag, RMD, Social Security, optional
// Roth conversion, Medicare/IRMAA and LTC, then a pro-rata taxed withdrawal of
// the spending need. Ruin is recorded, never thrown.
//
// Throws ValidationError for invalid inputs.
PathResult run_single_simulation(const SimulationInputs& inputs, uint32_t seed,
                                 const SimulationConfig& config = SimulationConfig());

// Inflation rate (percent) applied in simulation year `year_index`, honouring
// the optional shock that starts at retirement
double effective_inflation_pct(const SimulationInputs& inputs, int year_index);

} // namespace retirecalc

#endif // RETIRECALC_SIMULATION_ENGINE_HPP
