#include "simulation_inputs.hpp"
#include "errors.hpp"
#include <algorithm>
#include <cmath>
#include <sstream>

namespace retirecalc {

// ============================================================================
// SimulationInputs Implementation
// ============================================================================

int SimulationInputs::younger_age() const {
    return is_married() ? std::min(age1, age2) : age1;
}

int SimulationInputs::older_age() const {
    return is_married() ? std::max(age1, age2) : age1;
}

int SimulationInputs::years_to_retirement() const {
    return retirement_age - younger_age();
}

int SimulationInputs::years_to_simulate() const {
    return std::max(0, LIFE_EXPECTANCY - (older_age() + years_to_retirement()));
}

double SimulationInputs::total_starting_balance() const {
    return taxable_balance + pretax_balance + roth_balance;
}

double SimulationInputs::total_annual_contributions() const {
    double total = contributions1.total();
    if (is_married()) {
        total += contributions2.total();
    }
    return total;
}

// ============================================================================
// Validation
// ============================================================================

namespace {

std::string format_value(double value) {
    std::ostringstream oss;
    oss << value;
    return oss.str();
}

void require_finite(const std::string& field, const std::string& label, double value) {
    if (!std::isfinite(value)) {
        throw ValidationError(field, label + " must be a valid number.");
    }
}

void require_range(const std::string& field, const std::string& label,
                   double value, double min, double max) {
    require_finite(field, label, value);
    if (value < min || value > max) {
        throw ValidationError(field, label + " must be between " + format_value(min) +
                              " and " + format_value(max) + ". You entered " +
                              format_value(value) + ".");
    }
}

void require_non_negative(const std::string& field, const std::string& label, double value) {
    require_finite(field, label, value);
    if (value < 0.0) {
        throw ValidationError(field, label + " cannot be negative. You entered " +
                              format_value(value) + ".");
    }
}

void validate_contributions(const ContributionSchedule& c, const std::string& prefix,
                            const std::string& label_prefix) {
    require_range(prefix + ".taxable", label_prefix + "taxable contributions", c.taxable, 0.0, 1000000.0);
    require_range(prefix + ".pretax", label_prefix + "pre-tax contributions", c.pretax, 0.0, 1000000.0);
    require_range(prefix + ".roth", label_prefix + "Roth contributions", c.roth, 0.0, 1000000.0);
    require_range(prefix + ".employer_match", label_prefix + "employer match", c.employer_match, 0.0, 1000000.0);
}

} // anonymous namespace

void validate_inputs(const SimulationInputs& inputs) {
    require_range("age1", "Your age", inputs.age1, 0, 120);
    if (inputs.is_married()) {
        require_range("age2", "Spouse age", inputs.age2, 0, 120);
    }
    require_range("retirement_age", "Retirement age", inputs.retirement_age, 0, 120);
    if (inputs.retirement_age < inputs.younger_age()) {
        throw ValidationError("retirement_age",
            "Retirement age (" + std::to_string(inputs.retirement_age) +
            ") cannot be earlier than the current age (" +
            std::to_string(inputs.younger_age()) + ").");
    }

    require_non_negative("taxable_balance", "Taxable balance", inputs.taxable_balance);
    require_non_negative("pretax_balance", "Pre-tax balance", inputs.pretax_balance);
    require_non_negative("roth_balance", "Roth balance", inputs.roth_balance);
    require_non_negative("emergency_fund", "Emergency fund", inputs.emergency_fund);
    require_non_negative("primary_income", "Primary income", inputs.primary_income);
    require_non_negative("spouse_income", "Spouse income", inputs.spouse_income);

    validate_contributions(inputs.contributions1, "contributions1", "");
    if (inputs.is_married()) {
        validate_contributions(inputs.contributions2, "contributions2", "Spouse ");
    }

    if (inputs.total_starting_balance() <= 0.0 && inputs.total_annual_contributions() <= 0.0) {
        throw ValidationError("taxable_balance",
            "You must have either a starting balance or annual contributions to run a calculation.");
    }

    require_range("withdrawal_rate_pct", "Withdrawal rate", inputs.withdrawal_rate_pct, 0.0, 20.0);
    require_range("expected_return_pct", "Return rate", inputs.expected_return_pct, -50.0, 50.0);
    require_range("inflation_pct", "Inflation rate", inputs.inflation_pct, 0.0, 50.0);
    require_range("state_tax_pct", "State tax rate", inputs.state_tax_pct, 0.0, 100.0);
    require_range("income_growth_pct", "Income growth rate", inputs.income_growth_pct, -50.0, 50.0);
    require_range("dividend_yield_pct", "Dividend yield", inputs.dividend_yield_pct, 0.0, 20.0);

    if (inputs.inflation_shock_pct) {
        require_range("inflation_shock_pct", "Inflation shock rate", *inputs.inflation_shock_pct, 0.0, 50.0);
        require_range("inflation_shock_years", "Inflation shock duration",
                      inputs.inflation_shock_years, 0, 50);
    }

    if (inputs.return_mode == ReturnMode::HistoricalReplay) {
        require_range("historical_start_year", "Historical start year",
                      inputs.historical_start_year, 1928, 2024);
    }

    if (inputs.include_social_security) {
        require_non_negative("ss_income1", "Social Security earnings", inputs.ss_income1);
        require_range("ss_claim_age1", "Social Security claim age", inputs.ss_claim_age1, 62, 70);
        if (inputs.is_married()) {
            require_non_negative("ss_income2", "Spouse Social Security earnings", inputs.ss_income2);
            require_range("ss_claim_age2", "Spouse Social Security claim age", inputs.ss_claim_age2, 62, 70);
        }
    }

    const HealthcareAssumptions& hc = inputs.healthcare;
    if (hc.include_medicare) {
        require_non_negative("healthcare.medicare_premium_monthly", "Medicare premium", hc.medicare_premium_monthly);
        require_range("healthcare.medical_inflation_pct", "Medical inflation", hc.medical_inflation_pct, 0.0, 50.0);
    }
    if (hc.include_ltc) {
        require_non_negative("healthcare.ltc_annual_cost", "Long-term care cost", hc.ltc_annual_cost);
        require_range("healthcare.ltc_probability_pct", "Long-term care probability",
                      hc.ltc_probability_pct, 0.0, 100.0);
        require_range("healthcare.ltc_duration_years", "Long-term care duration",
                      hc.ltc_duration_years, 0.0, 40.0);
        require_range("healthcare.ltc_onset_window_start", "Long-term care onset age",
                      hc.ltc_onset_window_start, 0, 120);
        if (hc.ltc_onset_window_end < hc.ltc_onset_window_start) {
            throw ValidationError("healthcare.ltc_onset_window_end",
                "Long-term care onset window end must not precede its start.");
        }
    }

    if (inputs.glide_path && inputs.glide_path->strategy == GlidePathStrategy::Custom) {
        const BondGlidePath& gp = *inputs.glide_path;
        require_range("glide_path.start_pct", "Glide path start allocation", gp.start_pct, 0.0, 100.0);
        require_range("glide_path.end_pct", "Glide path end allocation", gp.end_pct, 0.0, 100.0);
        if (gp.end_age <= gp.start_age) {
            throw ValidationError("glide_path.end_age",
                "Glide path end age must be greater than its start age.");
        }
    }

    for (int child_age : inputs.children_ages) {
        require_range("children_ages", "Child age", child_age, 0, 30);
    }
    require_range("additional_children_expected", "Additional children expected",
                  inputs.additional_children_expected, 0, 10);
}

// ============================================================================
// String Conversions
// ============================================================================

std::string to_string(FilingStatus status) {
    return status == FilingStatus::Married ? "married" : "single";
}

std::string to_string(EmploymentType type) {
    switch (type) {
        case EmploymentType::W2: return "w2";
        case EmploymentType::SelfEmployed: return "self-employed";
        case EmploymentType::Both: return "both";
        case EmploymentType::Retired: return "retired";
        case EmploymentType::Other: return "other";
    }
    return "other";
}

std::string to_string(ReturnMode mode) {
    switch (mode) {
        case ReturnMode::Fixed: return "fixed";
        case ReturnMode::HistoricalReplay: return "historical";
        case ReturnMode::SeededRandom: return "seeded";
        case ReturnMode::TrulyRandom: return "trulyRandom";
    }
    return "fixed";
}

std::string to_string(WalkSeries series) {
    return series == WalkSeries::Real ? "real" : "nominal";
}

std::string to_string(GlidePathStrategy strategy) {
    switch (strategy) {
        case GlidePathStrategy::Aggressive: return "aggressive";
        case GlidePathStrategy::AgeBased: return "ageBased";
        case GlidePathStrategy::Custom: return "custom";
    }
    return "custom";
}

std::string to_string(GlidePathShape shape) {
    switch (shape) {
        case GlidePathShape::Linear: return "linear";
        case GlidePathShape::Accelerated: return "accelerated";
        case GlidePathShape::Decelerated: return "decelerated";
    }
    return "linear";
}

FilingStatus parse_filing_status(const std::string& value) {
    if (value == "single") return FilingStatus::Single;
    if (value == "married") return FilingStatus::Married;
    throw ValidationError("marital", "Unknown filing status: " + value);
}

EmploymentType parse_employment_type(const std::string& value) {
    if (value == "w2") return EmploymentType::W2;
    if (value == "self-employed") return EmploymentType::SelfEmployed;
    if (value == "both") return EmploymentType::Both;
    if (value == "retired") return EmploymentType::Retired;
    if (value == "other") return EmploymentType::Other;
    throw ValidationError("employment_type", "Unknown employment type: " + value);
}

ReturnMode parse_return_mode(const std::string& value) {
    if (value == "fixed") return ReturnMode::Fixed;
    if (value == "historical") return ReturnMode::HistoricalReplay;
    if (value == "seeded" || value == "randomWalk") return ReturnMode::SeededRandom;
    if (value == "trulyRandom") return ReturnMode::TrulyRandom;
    throw ValidationError("return_mode", "Unknown return mode: " + value);
}

WalkSeries parse_walk_series(const std::string& value) {
    if (value == "nominal") return WalkSeries::Nominal;
    if (value == "real") return WalkSeries::Real;
    throw ValidationError("walk_series", "Unknown walk series: " + value);
}

GlidePathStrategy parse_glide_path_strategy(const std::string& value) {
    if (value == "aggressive") return GlidePathStrategy::Aggressive;
    if (value == "ageBased") return GlidePathStrategy::AgeBased;
    if (value == "custom") return GlidePathStrategy::Custom;
    throw ValidationError("glide_path.strategy", "Unknown glide path strategy: " + value);
}

GlidePathShape parse_glide_path_shape(const std::string& value) {
    if (value == "linear") return GlidePathShape::Linear;
    if (value == "accelerated") return GlidePathShape::Accelerated;
    if (value == "decelerated") return GlidePathShape::Decelerated;
    throw ValidationError("glide_path.shape", "Unknown glide path shape: " + value);
}

} // namespace retirecalc
