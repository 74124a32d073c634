#ifndef RETIRECALC_GENERATIONAL_MODEL_HPP
#define RETIRECALC_GENERATIONAL_MODEL_HPP

#include "batch_orchestrator.hpp"
#include "simulation_inputs.hpp"
#include "tax_model.hpp"
#include <optional>
#include <vector>

namespace retirecalc {

// ============================================================================
// Beneficiary cohorts
// ============================================================================

// A beneficiary slot after walking past-fertility ages down to descendants
struct BackfilledCohort {
    int age;
    double size;
    int generation;         // 0 = the named beneficiary, n = n-th descendant generation

    BackfilledCohort();
    BackfilledCohort(int cohort_age, double cohort_size, int gen);
};

// Replace each beneficiary older than the fertility window with the descendant
// generation that still lies inside it (age - k * generation_length, size * tfr^k),
// stopping after max_generations steps. Returns std::nullopt when
// generation_length <= 0 and a replacement would be needed.
std::optional<std::vector<BackfilledCohort>> backfill_younger_generations(
    const std::vector<int>& ages, int num_beneficiaries, int fertility_window_end,
    int generation_length, double total_fertility_rate, int max_generations = 20);

// ============================================================================
// Per-beneficiary depletion simulation
// ============================================================================

struct LegacyParams {
    double estate_nominal;              // net estate handed to the trust
    int years_from_now;                 // years between today and the handoff
    double nominal_return_pct;
    double inflation_pct;
    double per_beneficiary_real;        // annual payout per eligible beneficiary, today's dollars
    int start_beneficiaries;
    double total_fertility_rate;
    int generation_length;
    int death_age;
    int min_distribution_age;
    int cap_years;
    std::vector<int> initial_ages;
    int fertility_window_start;
    int fertility_window_end;
    FilingStatus filing_status;
    EstateTaxPolicy estate_policy;

    LegacyParams();
};

// Snapshot of the fund taken once per generation (at most ten)
struct GenerationCheckpoint {
    int generation;
    int year;                           // years after the handoff
    double estate_value;                // nominal
    double estate_tax;
    double net_to_heirs;
    double fund_real;
    double living_beneficiaries;

    GenerationCheckpoint();
};

struct LegacyResult {
    int years;                          // years of payouts made
    bool unbounded;                     // fund never depletes; `years` is meaningless
    double fund_left_real;
    double last_living_count;
    std::vector<GenerationCheckpoint> generations;

    bool is_perpetual() const { return unbounded || fund_left_real > 0.0; }

    LegacyResult();
};

// Deterministic cohort simulation in real terms: yearly deaths at death_age,
// fund growth at the real return, payouts to beneficiaries at or above the
// minimum age, births spread over the fertility window. Runs in 10-year
// chunks up to cap_years with a perpetuity pre-check and early termination
// when the fund keeps compounding after year 1000.
LegacyResult simulate_per_beneficiary_payout(const LegacyParams& params);

// ============================================================================
// Batch wiring
// ============================================================================

struct GenerationalSettings {
    double per_beneficiary_real = 100000.0;
    std::vector<int> beneficiary_ages{0};
    int num_beneficiaries = 1;
    double total_fertility_rate = 2.1;
    int generation_length = 30;
    int death_age = 90;
    int min_distribution_age = 21;
    int fertility_window_start = 25;
    int fertility_window_end = 35;
    int cap_years = 10000;
};

struct PayoutScenario {
    double net_estate_nominal;
    double nominal_return_pct;          // return the scenario compounds at
    LegacyResult result;

    PayoutScenario();
};

struct GenerationalPayout {
    double per_beneficiary_real;
    int start_beneficiaries;
    double total_fertility_rate;
    int generation_length;
    int death_age;
    std::vector<BackfilledCohort> cohorts;

    // p10 runs on the p25 estate, p50 on the median, p90 on the p75 estate
    PayoutScenario p10;
    PayoutScenario p50;
    PayoutScenario p90;

    double prob_perpetual;              // share of batch paths whose estate sustains the payout

    GenerationalPayout();
};

// Net estates at the batch's terminal percentiles, back-solved real CAGRs,
// three depletion runs and the empirical perpetuity probability. Empty when
// there are no beneficiaries or the payout is not positive.
std::optional<GenerationalPayout> compute_generational_payout(
    const SimulationInputs& inputs, const BatchSummary& batch,
    const GenerationalSettings& settings, int current_year = TAX_YEAR,
    const EstateTaxPolicy& estate_policy = EstateTaxPolicy());

// (1 + nominal) / (1 + inflation) - 1, inputs in percent, result as a fraction
double real_return(double nominal_pct, double inflation_pct);

} // namespace retirecalc

#endif // RETIRECALC_GENERATIONAL_MODEL_HPP
