#ifndef RETIRECALC_HEALTHCARE_MODEL_HPP
#define RETIRECALC_HEALTHCARE_MODEL_HPP

#include "simulation_inputs.hpp"
#include <optional>
#include <vector>

namespace retirecalc {

constexpr int MEDICARE_AGE = 65;

// Monthly IRMAA surcharge for a modified AGI (income-related tiers)
double irmaa_surcharge(double modified_agi, FilingStatus status);

// Annual Medicare cost at `age`: base premium plus IRMAA surcharge, scaled by the
// cumulative medical inflation factor. Zero before 65 or when Medicare is excluded.
double medicare_annual_cost(const HealthcareAssumptions& assumptions, int age,
                            double modified_agi, FilingStatus status,
                            double medical_inflation_factor);

// Outcome of the per-path long-term-care draw
struct LtcEvent {
    bool triggered;
    int onset_age;

    LtcEvent();
    LtcEvent(bool did_trigger, int age);
};

// Maps two uniform draws in [0, 1) to an LTC outcome: the first decides whether
// care is needed (draw < probability), the second places the onset age
// uniformly in the configured window.
LtcEvent resolve_ltc_event(const HealthcareAssumptions& assumptions,
                           double trigger_draw, double onset_draw);

// Annual LTC cost at `age` for a resolved event, covering ages in
// [onset, onset + duration)
double ltc_annual_cost(const HealthcareAssumptions& assumptions, const LtcEvent& event,
                       int age, double medical_inflation_factor);

// Individual marketplace premium by age band, before Medicare eligibility
double pre_medicare_premium(int age);

// Household premium for one or two adults plus dependants
double pre_medicare_household_cost(int age1, std::optional<int> age2,
                                   int dependent_children, double medical_inflation_factor);

// Childcare, schooling, college and general dependant costs for children whose
// current ages are given, `years_elapsed` years from now
double child_expenses(const std::vector<int>& child_ages, int years_elapsed,
                      double inflation_factor);

} // namespace retirecalc

#endif // RETIRECALC_HEALTHCARE_MODEL_HPP
