#include "healthcare_model.hpp"
#include <algorithm>
#include <array>
#include <cmath>
#include <limits>

namespace retirecalc {

namespace {

struct IrmaaTier {
    double threshold;
    double surcharge;
};

constexpr double INF = std::numeric_limits<double>::infinity();

constexpr std::array<IrmaaTier, 6> IRMAA_SINGLE = {{
    {109000.0, 0.0},
    {137000.0, 81.20},
    {171000.0, 202.90},
    {205000.0, 324.60},
    {500000.0, 446.30},
    {INF, 487.00},
}};

constexpr std::array<IrmaaTier, 6> IRMAA_MARRIED = {{
    {218000.0, 0.0},
    {274000.0, 81.20},
    {342000.0, 202.90},
    {410000.0, 324.60},
    {750000.0, 446.30},
    {INF, 487.00},
}};

constexpr double PER_CHILD_PREMIUM = 3000.0;

constexpr double CHILDCARE_ANNUAL = 15000.0;
constexpr double K12_ANNUAL = 3000.0;
constexpr double COLLEGE_ANNUAL = 25000.0;
constexpr double DEPENDENT_BASE_ANNUAL = 8000.0;
constexpr int CHILDCARE_END_AGE = 6;
constexpr int K12_END_AGE = 18;
constexpr int COLLEGE_END_AGE = 22;
constexpr int DEPENDENT_END_AGE = 18;

} // anonymous namespace

// ============================================================================
// Medicare
// ============================================================================

double irmaa_surcharge(double modified_agi, FilingStatus status) {
    const auto& tiers = status == FilingStatus::Married ? IRMAA_MARRIED : IRMAA_SINGLE;
    for (const IrmaaTier& tier : tiers) {
        if (modified_agi <= tier.threshold) {
            return tier.surcharge;
        }
    }
    return tiers.back().surcharge;
}

double medicare_annual_cost(const HealthcareAssumptions& assumptions, int age,
                            double modified_agi, FilingStatus status,
                            double medical_inflation_factor) {
    if (!assumptions.include_medicare || age < MEDICARE_AGE) {
        return 0.0;
    }
    double monthly = assumptions.medicare_premium_monthly + irmaa_surcharge(modified_agi, status);
    return monthly * 12.0 * medical_inflation_factor;
}

// ============================================================================
// Long-Term Care
// ============================================================================

LtcEvent::LtcEvent() : triggered(false), onset_age(0) {}

LtcEvent::LtcEvent(bool did_trigger, int age) : triggered(did_trigger), onset_age(age) {}

LtcEvent resolve_ltc_event(const HealthcareAssumptions& assumptions,
                           double trigger_draw, double onset_draw) {
    if (!assumptions.include_ltc) {
        return LtcEvent();
    }
    bool triggered = trigger_draw < assumptions.ltc_probability_pct / 100.0;

    int start = assumptions.ltc_onset_window_start;
    int span = std::max(0, assumptions.ltc_onset_window_end - start) + 1;
    int offset = std::min(span - 1, static_cast<int>(std::floor(onset_draw * span)));
    return LtcEvent(triggered, start + offset);
}

double ltc_annual_cost(const HealthcareAssumptions& assumptions, const LtcEvent& event,
                       int age, double medical_inflation_factor) {
    if (!assumptions.include_ltc || !event.triggered || age < event.onset_age) {
        return 0.0;
    }
    double years_into_care = static_cast<double>(age - event.onset_age);
    if (years_into_care >= assumptions.ltc_duration_years) {
        return 0.0;
    }
    return assumptions.ltc_annual_cost * medical_inflation_factor;
}

// ============================================================================
// Pre-Medicare Coverage
// ============================================================================

double pre_medicare_premium(int age) {
    if (age >= MEDICARE_AGE) return 0.0;
    if (age < 30) return 4800.0;
    if (age < 40) return 6000.0;
    if (age < 50) return 8400.0;
    if (age < 55) return 10800.0;
    if (age < 60) return 13200.0;
    return 15600.0;
}

double pre_medicare_household_cost(int age1, std::optional<int> age2,
                                   int dependent_children, double medical_inflation_factor) {
    double total = pre_medicare_premium(age1);
    if (age2) {
        total += pre_medicare_premium(*age2);
    }

    bool anyone_uncovered = age1 < MEDICARE_AGE || (age2 && *age2 < MEDICARE_AGE);
    if (dependent_children > 0 && anyone_uncovered) {
        total += dependent_children * PER_CHILD_PREMIUM;
    }
    return total * medical_inflation_factor;
}

// ============================================================================
// Dependent Costs
// ============================================================================

double child_expenses(const std::vector<int>& child_ages, int years_elapsed,
                      double inflation_factor) {
    double total = 0.0;

    for (int start_age : child_ages) {
        int age = start_age + years_elapsed;
        if (age < 0 || age >= COLLEGE_END_AGE) {
            continue;
        }

        double expense = 0.0;
        if (age < CHILDCARE_END_AGE) {
            expense += CHILDCARE_ANNUAL;
        } else if (age < K12_END_AGE) {
            expense += K12_ANNUAL;
        } else {
            expense += COLLEGE_ANNUAL;
        }

        if (age < DEPENDENT_END_AGE) {
            double age_factor = age < 6 ? 1.0 : (age < 13 ? 0.85 : 0.7);
            expense += DEPENDENT_BASE_ANNUAL * age_factor;
        } else {
            expense += DEPENDENT_BASE_ANNUAL * 0.5;
        }

        total += expense;
    }
    return total * inflation_factor;
}

} // namespace retirecalc
