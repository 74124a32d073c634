#include "tax_model.hpp"
#include <algorithm>
#include <array>
#include <cmath>
#include <limits>
#include <utility>

namespace retirecalc {

namespace {

constexpr double INF = std::numeric_limits<double>::infinity();

const std::vector<TaxBracket> SINGLE_BRACKETS = {
    {12400.0, 0.10},
    {50400.0, 0.12},
    {105700.0, 0.22},
    {201775.0, 0.24},
    {256225.0, 0.32},
    {640600.0, 0.35},
    {INF, 0.37},
};

const std::vector<TaxBracket> MARRIED_BRACKETS = {
    {24800.0, 0.10},
    {100800.0, 0.12},
    {211400.0, 0.22},
    {403550.0, 0.24},
    {512450.0, 0.32},
    {768700.0, 0.35},
    {INF, 0.37},
};

const std::vector<TaxBracket> SINGLE_LTCG = {
    {49450.0, 0.0},
    {545500.0, 0.15},
    {INF, 0.20},
};

const std::vector<TaxBracket> MARRIED_LTCG = {
    {98900.0, 0.0},
    {613700.0, 0.15},
    {INF, 0.20},
};

constexpr double SINGLE_DEDUCTION = 16100.0;
constexpr double MARRIED_DEDUCTION = 32200.0;

constexpr double NIIT_RATE = 0.038;
constexpr double NIIT_THRESHOLD_SINGLE = 200000.0;
constexpr double NIIT_THRESHOLD_MARRIED = 250000.0;

// Uniform Lifetime Table, ages 73-120
constexpr std::array<double, 48> RMD_DIVISORS = {
    26.5, 25.5, 24.6, 23.7, 22.9, 22.0, 21.1, 20.2,   // 73-80
    19.4, 18.5, 17.7, 16.8, 16.0, 15.2, 14.4, 13.7,   // 81-88
    12.9, 12.2, 11.5, 10.8, 10.1, 9.5, 8.9, 8.4,      // 89-96
    7.8, 7.3, 6.8, 6.4, 6.0, 5.6, 5.2, 4.9,           // 97-104
    4.6, 4.3, 4.1, 3.9, 3.7, 3.5, 3.4, 3.3,           // 105-112
    3.1, 3.0, 2.9, 2.8, 2.7, 2.5, 2.3, 2.0            // 113-120
};
constexpr int RMD_MAX_AGE = 120;

constexpr double ESTATE_EXEMPTION_SINGLE = 13990000.0;
constexpr double ESTATE_EXEMPTION_MARRIED = 27980000.0;
constexpr double SUNSET_EXEMPTION_SINGLE = 7000000.0;
constexpr double SUNSET_EXEMPTION_MARRIED = 14000000.0;

// Graduated estate and gift tax schedule: {lower bound, marginal rate}
constexpr std::array<std::pair<double, double>, 12> ESTATE_SCHEDULE = {{
    {0.0, 0.18},
    {10000.0, 0.20},
    {20000.0, 0.22},
    {40000.0, 0.24},
    {60000.0, 0.26},
    {80000.0, 0.28},
    {100000.0, 0.30},
    {150000.0, 0.32},
    {250000.0, 0.34},
    {500000.0, 0.37},
    {750000.0, 0.39},
    {1000000.0, 0.40},
}};

// Payroll and self-employment constants
constexpr double SS_WAGE_BASE = 184500.0;
constexpr double SS_RATE_EMPLOYEE = 0.062;
constexpr double SS_RATE_SELF_EMPLOYED = 0.124;
constexpr double MEDICARE_RATE_EMPLOYEE = 0.0145;
constexpr double MEDICARE_RATE_SELF_EMPLOYED = 0.029;
constexpr double ADDITIONAL_MEDICARE_THRESHOLD = 200000.0;
constexpr double ADDITIONAL_MEDICARE_RATE = 0.009;
constexpr double SELF_EMPLOYMENT_FACTOR = 0.9235;

double safe_amount(double value) {
    return std::isfinite(value) ? std::max(0.0, value) : 0.0;
}

const std::vector<TaxBracket>& ltcg_brackets(FilingStatus status) {
    return status == FilingStatus::Married ? MARRIED_LTCG : SINGLE_LTCG;
}

} // anonymous namespace

// ============================================================================
// Federal and State Income Tax
// ============================================================================

const std::vector<TaxBracket>& ordinary_brackets(FilingStatus status) {
    return status == FilingStatus::Married ? MARRIED_BRACKETS : SINGLE_BRACKETS;
}

double standard_deduction(FilingStatus status) {
    return status == FilingStatus::Married ? MARRIED_DEDUCTION : SINGLE_DEDUCTION;
}

double bracket_limit(FilingStatus status, double rate) {
    for (const TaxBracket& b : ordinary_brackets(status)) {
        if (std::fabs(b.rate - rate) < 1e-9) {
            return b.limit;
        }
    }
    return 0.0;
}

double calc_ordinary_tax(double income, FilingStatus status) {
    double adjusted = std::max(0.0, safe_amount(income) - standard_deduction(status));
    double tax = 0.0;
    double prev = 0.0;

    for (const TaxBracket& b : ordinary_brackets(status)) {
        if (adjusted <= 0.0) {
            break;
        }
        double amount = std::min(adjusted, b.limit - prev);
        tax += amount * b.rate;
        adjusted -= amount;
        prev = b.limit;
    }
    return tax;
}

double calc_ltcg_tax(double capital_gain, FilingStatus status, double ordinary_income) {
    double remaining = safe_amount(capital_gain);
    if (remaining <= 0.0) {
        return 0.0;
    }

    double cumulative = safe_amount(ordinary_income);
    double tax = 0.0;

    for (const TaxBracket& b : ltcg_brackets(status)) {
        double room = std::max(0.0, b.limit - cumulative);
        double taxed_here = std::min(remaining, room);
        if (taxed_here > 0.0) {
            tax += taxed_here * b.rate;
            remaining -= taxed_here;
            cumulative += taxed_here;
        }
        if (remaining <= 0.0) {
            break;
        }
    }
    return tax;
}

double calc_niit(double investment_income, FilingStatus status, double modified_agi) {
    double income = safe_amount(investment_income);
    if (income <= 0.0) {
        return 0.0;
    }
    double threshold = status == FilingStatus::Married ? NIIT_THRESHOLD_MARRIED
                                                       : NIIT_THRESHOLD_SINGLE;
    double excess = safe_amount(modified_agi) - threshold;
    if (excess <= 0.0) {
        return 0.0;
    }
    return std::min(income, excess) * NIIT_RATE;
}

double calc_state_tax(double taxable_income, double state_rate_pct) {
    return safe_amount(taxable_income) * (state_rate_pct / 100.0);
}

// ============================================================================
// Required Minimum Distributions
// ============================================================================

double rmd_divisor(int age) {
    if (age < RMD_START_AGE) {
        return 0.0;
    }
    int clamped = std::min(age, RMD_MAX_AGE);
    return RMD_DIVISORS[static_cast<size_t>(clamped - RMD_START_AGE)];
}

double calc_rmd(double pretax_balance, int age) {
    double divisor = rmd_divisor(age);
    if (divisor <= 0.0 || pretax_balance <= 0.0) {
        return 0.0;
    }
    return pretax_balance / divisor;
}

// ============================================================================
// Estate Tax
// ============================================================================

EstateTaxPolicy::EstateTaxPolicy()
    : sunset(false),
      indexing_rate(0.026) {}

double estate_tax_exemption(FilingStatus status, int year, const EstateTaxPolicy& policy) {
    bool married = status == FilingStatus::Married;
    double base = policy.sunset
        ? (married ? SUNSET_EXEMPTION_MARRIED : SUNSET_EXEMPTION_SINGLE)
        : (married ? ESTATE_EXEMPTION_MARRIED : ESTATE_EXEMPTION_SINGLE);

    if (year > TAX_YEAR) {
        base *= std::pow(1.0 + policy.indexing_rate, year - TAX_YEAR);
    }
    return base;
}

double tentative_estate_tax(double amount) {
    double value = safe_amount(amount);
    double tax = 0.0;

    for (size_t i = 0; i < ESTATE_SCHEDULE.size(); ++i) {
        double lower = ESTATE_SCHEDULE[i].first;
        double upper = (i + 1 < ESTATE_SCHEDULE.size()) ? ESTATE_SCHEDULE[i + 1].first : INF;
        if (value <= lower) {
            break;
        }
        tax += (std::min(value, upper) - lower) * ESTATE_SCHEDULE[i].second;
    }
    return tax;
}

double calc_estate_tax(double estate, FilingStatus status, int year, const EstateTaxPolicy& policy) {
    double exemption = estate_tax_exemption(status, year, policy);
    double value = safe_amount(estate);
    if (value <= exemption) {
        return 0.0;
    }
    return tentative_estate_tax(value) - tentative_estate_tax(exemption);
}

// ============================================================================
// Employment Taxes
// ============================================================================

double calc_payroll_tax(double wages) {
    if (wages <= 0.0) {
        return 0.0;
    }
    double ss_tax = std::min(wages, SS_WAGE_BASE) * SS_RATE_EMPLOYEE;
    double medicare_tax = wages * MEDICARE_RATE_EMPLOYEE;
    if (wages > ADDITIONAL_MEDICARE_THRESHOLD) {
        medicare_tax += (wages - ADDITIONAL_MEDICARE_THRESHOLD) * ADDITIONAL_MEDICARE_RATE;
    }
    return ss_tax + medicare_tax;
}

double calc_self_employment_tax(double net_earnings) {
    if (net_earnings <= 0.0) {
        return 0.0;
    }
    double earnings = net_earnings * SELF_EMPLOYMENT_FACTOR;
    double ss_tax = std::min(earnings, SS_WAGE_BASE) * SS_RATE_SELF_EMPLOYED;
    double medicare_tax = earnings * MEDICARE_RATE_SELF_EMPLOYED;
    if (earnings > ADDITIONAL_MEDICARE_THRESHOLD) {
        medicare_tax += (earnings - ADDITIONAL_MEDICARE_THRESHOLD) * ADDITIONAL_MEDICARE_RATE;
    }
    return ss_tax + medicare_tax;
}

double calc_employment_taxes(double income, EmploymentType type) {
    if (income <= 0.0) {
        return 0.0;
    }
    switch (type) {
        case EmploymentType::W2:
            return calc_payroll_tax(income);
        case EmploymentType::SelfEmployed:
            return calc_self_employment_tax(income);
        case EmploymentType::Both:
            return calc_payroll_tax(income * 0.5) + calc_self_employment_tax(income * 0.5);
        case EmploymentType::Retired:
        case EmploymentType::Other:
            return 0.0;
    }
    return 0.0;
}

// ============================================================================
// Withdrawal Taxation
// ============================================================================

WithdrawalTax::WithdrawalTax()
    : total(0.0), ordinary(0.0), capital_gains(0.0), niit(0.0), state(0.0),
      draw_taxable(0.0), draw_pretax(0.0), draw_roth(0.0), realized_gain(0.0),
      new_basis(0.0) {}

WithdrawalTax compute_withdrawal_taxes(double gross, FilingStatus status,
                                       double taxable_balance, double pretax_balance,
                                       double roth_balance, double taxable_basis,
                                       double state_rate_pct, double min_pretax_draw) {
    WithdrawalTax result;
    result.new_basis = taxable_basis;

    double total_balance = taxable_balance + pretax_balance + roth_balance;
    if (total_balance <= 0.0 || gross <= 0.0) {
        return result;
    }

    // The required pre-tax draw comes out first; the rest is split pro rata
    double forced = std::min({std::max(0.0, min_pretax_draw), pretax_balance, gross});
    double rest = gross - forced;
    double pretax_left = pretax_balance - forced;
    double rest_balance = taxable_balance + pretax_left + roth_balance;

    double want_t = 0.0;
    double want_p = 0.0;
    double want_r = 0.0;
    if (rest > 0.0 && rest_balance > 0.0) {
        want_t = rest * (taxable_balance / rest_balance);
        want_p = rest * (pretax_left / rest_balance);
        want_r = rest * (roth_balance / rest_balance);
    }

    // Shortfalls cascade taxable -> pre-tax -> Roth
    double used_t = std::min(want_t, taxable_balance);
    double used_p = std::min(want_p + (want_t - used_t), pretax_left);
    double used_r = std::min(want_r + (want_p + (want_t - used_t) - used_p), roth_balance);

    result.draw_taxable = used_t;
    result.draw_pretax = forced + used_p;
    result.draw_roth = used_r;

    double unrealized = std::max(0.0, taxable_balance - taxable_basis);
    double gain_ratio = taxable_balance > 0.0 ? unrealized / taxable_balance : 0.0;
    double gain = used_t * gain_ratio;
    double basis_used = used_t - gain;

    double ordinary_income = result.draw_pretax;
    result.realized_gain = gain;
    result.ordinary = calc_ordinary_tax(ordinary_income, status);
    result.capital_gains = calc_ltcg_tax(gain, status, ordinary_income);
    result.niit = calc_niit(gain, status, ordinary_income + gain);
    result.state = calc_state_tax(ordinary_income + gain, state_rate_pct);
    result.total = result.ordinary + result.capital_gains + result.niit + result.state;
    result.new_basis = std::max(0.0, taxable_basis - basis_used);

    return result;
}

} // namespace retirecalc
