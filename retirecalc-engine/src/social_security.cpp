#include "social_security.hpp"
#include <algorithm>
#include <cmath>

namespace retirecalc {

namespace {

constexpr double BEND_POINT_1 = 1286.0;
constexpr double BEND_POINT_2 = 7749.0;

constexpr double EARNINGS_TEST_EXEMPT = 23400.0;
constexpr double EARNINGS_TEST_FRA_YEAR_EXEMPT = 62160.0;
constexpr double EARNINGS_TEST_RATE = 0.5;
constexpr double EARNINGS_TEST_FRA_YEAR_RATE = 1.0 / 3.0;

constexpr double TAXATION_TIER1_SINGLE = 25000.0;
constexpr double TAXATION_TIER2_SINGLE = 34000.0;
constexpr double TAXATION_TIER1_MARRIED = 32000.0;
constexpr double TAXATION_TIER2_MARRIED = 44000.0;

} // anonymous namespace

double calc_pia(double average_annual_income) {
    if (average_annual_income <= 0.0) {
        return 0.0;
    }
    double aime = average_annual_income / 12.0;

    if (aime <= BEND_POINT_1) {
        return aime * 0.90;
    }
    if (aime <= BEND_POINT_2) {
        return BEND_POINT_1 * 0.90 + (aime - BEND_POINT_1) * 0.32;
    }
    return BEND_POINT_1 * 0.90 + (BEND_POINT_2 - BEND_POINT_1) * 0.32 +
           (aime - BEND_POINT_2) * 0.15;
}

double adjust_for_claim_age(double monthly_pia, double claim_age, double full_retirement_age) {
    if (monthly_pia <= 0.0) {
        return 0.0;
    }
    double months_from_fra = (claim_age - full_retirement_age) * 12.0;
    double factor = 1.0;

    if (months_from_fra < 0.0) {
        double early = -months_from_fra;
        if (early <= 36.0) {
            factor = 1.0 - early * (5.0 / 9.0) / 100.0;
        } else {
            factor = 1.0 - 36.0 * (5.0 / 9.0) / 100.0 - (early - 36.0) * (5.0 / 12.0) / 100.0;
        }
    } else if (months_from_fra > 0.0) {
        factor = 1.0 + months_from_fra * (2.0 / 3.0) / 100.0;
    }
    return monthly_pia * factor;
}

double calc_social_security(double average_annual_income, double claim_age,
                            double full_retirement_age) {
    if (average_annual_income <= 0.0) {
        return 0.0;
    }
    return adjust_for_claim_age(calc_pia(average_annual_income), claim_age,
                                full_retirement_age) * 12.0;
}

double calc_effective_benefit(double own_pia, double spouse_pia, double own_claim_age,
                              double full_retirement_age) {
    double own = adjust_for_claim_age(own_pia, own_claim_age, full_retirement_age);
    double spousal = spouse_pia * 0.5;

    if (own_claim_age < full_retirement_age) {
        double early = (full_retirement_age - own_claim_age) * 12.0;
        if (early <= 36.0) {
            spousal *= 1.0 - early * (25.0 / 36.0) / 100.0;
        } else {
            spousal *= 1.0 - 36.0 * (25.0 / 36.0) / 100.0 - (early - 36.0) * (5.0 / 12.0) / 100.0;
        }
    }
    return std::max(own, spousal);
}

double apply_earnings_test(double annual_benefit, double earned_income, double age,
                           double full_retirement_age) {
    if (age >= full_retirement_age) {
        return annual_benefit;
    }
    if (annual_benefit <= 0.0) {
        return 0.0;
    }
    if (earned_income <= 0.0) {
        return annual_benefit;
    }

    double reduction = 0.0;
    bool fra_year = std::floor(age) == std::floor(full_retirement_age) - 1.0 &&
                    age + 1.0 >= full_retirement_age;
    if (fra_year) {
        reduction = std::max(0.0, earned_income - EARNINGS_TEST_FRA_YEAR_EXEMPT) *
                    EARNINGS_TEST_FRA_YEAR_RATE;
    } else {
        reduction = std::max(0.0, earned_income - EARNINGS_TEST_EXEMPT) * EARNINGS_TEST_RATE;
    }
    return std::max(0.0, annual_benefit - reduction);
}

double calc_taxable_social_security(double annual_benefit, double other_income,
                                    FilingStatus status) {
    if (annual_benefit <= 0.0) {
        return 0.0;
    }
    bool married = status == FilingStatus::Married;
    double tier1 = married ? TAXATION_TIER1_MARRIED : TAXATION_TIER1_SINGLE;
    double tier2 = married ? TAXATION_TIER2_MARRIED : TAXATION_TIER2_SINGLE;

    double combined = other_income + annual_benefit * 0.5;
    if (combined <= tier1) {
        return 0.0;
    }
    if (combined <= tier2) {
        return std::min(annual_benefit * 0.5, (combined - tier1) * 0.5);
    }
    double tier1_taxable = (tier2 - tier1) * 0.5;
    double tier2_taxable = (combined - tier2) * 0.85;
    return std::min(annual_benefit * 0.85, tier1_taxable + tier2_taxable);
}

double household_social_security(const SimulationInputs& inputs, int age1, int age2) {
    if (!inputs.include_social_security) {
        return 0.0;
    }

    if (!inputs.is_married()) {
        if (age1 >= inputs.ss_claim_age1) {
            return calc_social_security(inputs.ss_income1, inputs.ss_claim_age1);
        }
        return 0.0;
    }

    bool first_claimed = age1 >= inputs.ss_claim_age1;
    bool second_claimed = age2 >= inputs.ss_claim_age2;

    if (first_claimed && second_claimed) {
        double pia1 = calc_pia(inputs.ss_income1);
        double pia2 = calc_pia(inputs.ss_income2);
        double benefit1 = calc_effective_benefit(pia1, pia2, inputs.ss_claim_age1);
        double benefit2 = calc_effective_benefit(pia2, pia1, inputs.ss_claim_age2);
        return (benefit1 + benefit2) * 12.0;
    }
    if (first_claimed) {
        return calc_social_security(inputs.ss_income1, inputs.ss_claim_age1);
    }
    if (second_claimed) {
        return calc_social_security(inputs.ss_income2, inputs.ss_claim_age2);
    }
    return 0.0;
}

} // namespace retirecalc
