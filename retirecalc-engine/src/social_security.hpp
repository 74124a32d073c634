#ifndef RETIRECALC_SOCIAL_SECURITY_HPP
#define RETIRECALC_SOCIAL_SECURITY_HPP

#include "simulation_inputs.hpp"

namespace retirecalc {

constexpr int FULL_RETIREMENT_AGE = 67;

// Monthly primary insurance amount from average annual covered earnings
double calc_pia(double average_annual_income);

// Monthly benefit after the early-claim reduction or delayed-retirement credit
double adjust_for_claim_age(double monthly_pia, double claim_age,
                            double full_retirement_age = FULL_RETIREMENT_AGE);

// Annual benefit for a worker claiming at `claim_age`
double calc_social_security(double average_annual_income, double claim_age,
                            double full_retirement_age = FULL_RETIREMENT_AGE);

// Monthly benefit: the larger of the worker's own benefit and the spousal
// benefit (half the spouse's PIA, reduced for early claiming, no delayed credit)
double calc_effective_benefit(double own_pia, double spouse_pia, double own_claim_age,
                              double full_retirement_age = FULL_RETIREMENT_AGE);

// Annual benefit after the retirement earnings test
double apply_earnings_test(double annual_benefit, double earned_income, double age,
                           double full_retirement_age = FULL_RETIREMENT_AGE);

// Portion of annual benefits included in taxable income (0%, 50% or 85% tiers)
double calc_taxable_social_security(double annual_benefit, double other_income,
                                    FilingStatus status);

// Household annual benefit in a given year, given both ages in that year
double household_social_security(const SimulationInputs& inputs, int age1, int age2);

} // namespace retirecalc

#endif // RETIRECALC_SOCIAL_SECURITY_HPP
