#include "simulation_engine.hpp"
#include "healthcare_model.hpp"
#include "return_generator.hpp"
#include "social_security.hpp"
#include <algorithm>
#include <cmath>
#include <optional>

namespace retirecalc {

// ============================================================================
// WithdrawalRecord / PathResult / SimulationConfig
// ============================================================================

WithdrawalRecord::WithdrawalRecord()
    : year(0), age(0), requested(0.0), gross(0.0),
      tax_ordinary(0.0), tax_capital_gains(0.0), tax_niit(0.0), tax_state(0.0),
      tax_total(0.0), net(0.0), rmd(0.0), social_security(0.0), healthcare(0.0),
      roth_conversion(0.0) {}

PathResult::PathResult()
    : balance_at_retirement(0.0), eol_real(0.0), eol_nominal(0.0),
      y1_gross(0.0), y1_after_tax_real(0.0), ruined(false), survival_years(0),
      total_roth_conversions(0.0), conversion_taxes_paid(0.0) {}

SimulationConfig::SimulationConfig() : record_withdrawals(false) {}

double effective_inflation_pct(const SimulationInputs& inputs, int year_index) {
    if (!inputs.inflation_shock_pct) {
        return inputs.inflation_pct;
    }
    int start = inputs.years_to_retirement();
    int end = start + inputs.inflation_shock_years;
    if (year_index >= start && year_index < end) {
        return *inputs.inflation_shock_pct;
    }
    return inputs.inflation_pct;
}

namespace {

// Account balances carried through a path
struct Accounts {
    double taxable = 0.0;
    double pretax = 0.0;
    double roth = 0.0;
    double basis = 0.0;
    double emergency = 0.0;

    double invested() const { return taxable + pretax + roth; }
    double total() const { return invested() + emergency; }

    void grow(double factor) {
        taxable *= factor;
        pretax *= factor;
        roth *= factor;
    }
};

// Dividends are reinvested; only the LTCG tax on them leaves the account
void apply_yield_drag(Accounts& acct, double yield_pct, FilingStatus status) {
    if (acct.taxable > 0.0 && yield_pct > 0.0) {
        double yield_income = acct.taxable * (yield_pct / 100.0);
        acct.taxable -= calc_ltcg_tax(yield_income, status, 0.0);
    }
}

// Current children plus expected children, one born every second year
std::vector<int> household_children(const SimulationInputs& inputs) {
    std::vector<int> ages = inputs.children_ages;
    int years_to_ret = inputs.years_to_retirement();
    for (int k = 1; k <= inputs.additional_children_expected; ++k) {
        if (2 * k > years_to_ret) break;
        ages.push_back(-2 * k);
    }
    return ages;
}

int dependents_under_26(const std::vector<int>& ages, int years_elapsed) {
    return static_cast<int>(std::count_if(ages.begin(), ages.end(), [&](int start_age) {
        int age = start_age + years_elapsed;
        return age >= 0 && age < 26;
    }));
}

// Limit of the bracket whose rate is closest to the target rate
double nearest_bracket_limit(const std::vector<TaxBracket>& brackets, double target_rate) {
    const TaxBracket* nearest = &brackets.front();
    for (const TaxBracket& b : brackets) {
        if (std::abs(b.rate - target_rate) < std::abs(nearest->rate - target_rate)) {
            nearest = &b;
        }
    }
    return nearest->limit;
}

void add_contributions(Accounts& acct, const ContributionSchedule& c, double mid_year) {
    acct.taxable += c.taxable * mid_year;
    acct.pretax += (c.pretax + std::max(0.0, c.employer_match)) * mid_year;
    acct.roth += c.roth * mid_year;
    acct.basis += c.taxable;
}

void escalate(ContributionSchedule& c, double factor) {
    c.taxable *= factor;
    c.pretax *= factor;
    c.roth *= factor;
    c.employer_match *= factor;
}

} // anonymous namespace

// ============================================================================
// Single Path Simulation
// ============================================================================

PathResult run_single_simulation(const SimulationInputs& inputs, uint32_t seed,
                                 const SimulationConfig& config) {
    validate_inputs(inputs);

    const bool married = inputs.is_married();
    const FilingStatus status = inputs.filing_status;
    const int years_to_ret = inputs.years_to_retirement();
    const int years_to_sim = inputs.years_to_simulate();
    const double infl_factor = 1.0 + inputs.inflation_pct / 100.0;
    const double med_factor = 1.0 + inputs.healthcare.medical_inflation_pct / 100.0;
    const double income_factor = 1.0 + inputs.income_growth_pct / 100.0;

    ReturnSeries custom;
    const ReturnSeries* data = nullptr;
    if (!inputs.return_series_pct.empty()) {
        custom = ReturnSeries(inputs.return_series_first_year, inputs.return_series_pct);
        data = &custom;
    }

    ReturnGeneratorParams acc_params;
    acc_params.mode = inputs.return_mode;
    acc_params.years = static_cast<size_t>(years_to_ret + 1);
    acc_params.nominal_pct = inputs.expected_return_pct;
    acc_params.inflation_pct = inputs.inflation_pct;
    acc_params.series = inputs.walk_series;
    acc_params.seed = derive_stream_seed(seed, PathStream::Accumulation);
    acc_params.start_year = inputs.historical_start_year;
    acc_params.glide_path = inputs.glide_path;
    acc_params.start_age = inputs.younger_age();
    acc_params.data = data;

    ReturnGeneratorParams draw_params = acc_params;
    draw_params.years = static_cast<size_t>(years_to_sim);
    draw_params.seed = derive_stream_seed(seed, PathStream::Drawdown);
    draw_params.start_year = inputs.historical_start_year + years_to_ret;
    draw_params.start_age = inputs.older_age() + years_to_ret;

    const ReturnPath acc_path = ReturnPath::generate(acc_params);
    const ReturnPath draw_path = ReturnPath::generate(draw_params);

    // LTC is decided once per path from its own stream
    Mulberry32 ltc_rng(derive_stream_seed(seed, PathStream::LongTermCare));
    double trigger_draw = ltc_rng.next();
    double onset_draw = ltc_rng.next();
    const LtcEvent ltc = resolve_ltc_event(inputs.healthcare, trigger_draw, onset_draw);

    const std::vector<int> children = household_children(inputs);

    PathResult result;
    result.balances_real.reserve(static_cast<size_t>(years_to_ret + years_to_sim + 1));
    result.balances_nominal.reserve(static_cast<size_t>(years_to_ret + years_to_sim + 1));

    Accounts acct;
    acct.taxable = inputs.taxable_balance;
    acct.pretax = inputs.pretax_balance;
    acct.roth = inputs.roth_balance;
    acct.basis = inputs.taxable_balance;
    acct.emergency = inputs.emergency_fund;

    ContributionSchedule c1 = inputs.contributions1;
    ContributionSchedule c2 = inputs.contributions2;
    double cumulative_inflation = 1.0;

    // ------------------------------------------------------------------------
    // Accumulation
    // ------------------------------------------------------------------------
    for (int y = 0; y <= years_to_ret; ++y) {
        const double g = acc_path.factor(static_cast<size_t>(y));
        const int a1 = inputs.age1 + y;
        const int a2 = inputs.age2 + y;

        if (y > 0) {
            acct.grow(g);
            apply_yield_drag(acct, inputs.dividend_yield_pct, status);

            if (inputs.escalate_contributions) {
                escalate(c1, income_factor);
                if (married) escalate(c2, income_factor);
            }
        }

        const double mid_year = 1.0 + (g - 1.0) * 0.5;
        if (a1 < inputs.retirement_age) {
            add_contributions(acct, c1, mid_year);
        }
        if (married && a2 < inputs.retirement_age) {
            add_contributions(acct, c2, mid_year);
        }

        if (!children.empty() && a1 < inputs.retirement_age) {
            double cost = child_expenses(children, y, std::pow(infl_factor, y));
            acct.taxable = std::max(0.0, acct.taxable - cost);
        }

        // Self-employed workers carry the employer half of payroll tax themselves
        double income_scale = std::pow(income_factor, y);
        if (a1 < inputs.retirement_age && inputs.primary_income > 0.0 &&
            inputs.employment_type1 == EmploymentType::SelfEmployed) {
            double se_tax = calc_employment_taxes(inputs.primary_income * income_scale,
                                                  inputs.employment_type1);
            acct.taxable = std::max(0.0, acct.taxable - se_tax * 0.5);
        }
        if (married && a2 < inputs.retirement_age && inputs.spouse_income > 0.0 &&
            inputs.employment_type2 == EmploymentType::SelfEmployed) {
            double se_tax = calc_employment_taxes(inputs.spouse_income * income_scale,
                                                  inputs.employment_type2);
            acct.taxable = std::max(0.0, acct.taxable - se_tax * 0.5);
        }

        if (a1 < inputs.retirement_age) {
            std::optional<int> spouse_age;
            if (married) spouse_age = a2;
            double premiums = pre_medicare_household_cost(
                a1, spouse_age, dependents_under_26(children, y), std::pow(med_factor, y));
            acct.taxable = std::max(0.0, acct.taxable - premiums);
        }

        if (y > 0) {
            acct.emergency *= infl_factor;
        }

        cumulative_inflation *= 1.0 + effective_inflation_pct(inputs, y) / 100.0;
        double total = acct.total();
        result.balances_real.push_back(total / cumulative_inflation);
        result.balances_nominal.push_back(total);
    }

    // ------------------------------------------------------------------------
    // First retirement year
    // ------------------------------------------------------------------------
    const double fin_nominal = acct.total();
    result.balance_at_retirement = fin_nominal;
    result.y1_gross = fin_nominal * (inputs.withdrawal_rate_pct / 100.0);
    result.y1_tax = compute_withdrawal_taxes(result.y1_gross, status, acct.taxable, acct.pretax,
                                             acct.roth, acct.basis, inputs.state_tax_pct);
    result.y1_after_tax_real = (result.y1_gross - result.y1_tax.total) /
                               std::pow(infl_factor, years_to_ret);

    // ------------------------------------------------------------------------
    // Decumulation
    // ------------------------------------------------------------------------
    const double target_limit = nearest_bracket_limit(ordinary_brackets(status),
                                                      inputs.roth_conversions.target_bracket);
    const double deduction = standard_deduction(status);

    double withdrawal_gross = result.y1_gross;
    // IRMAA looks back one year; the first retirement year has no history and
    // uses its own estimate
    double prior_magi = -1.0;
    if (config.record_withdrawals) {
        result.withdrawals.reserve(static_cast<size_t>(years_to_sim));
    }

    for (int y = 1; y <= years_to_sim; ++y) {
        acct.grow(draw_path.factor(static_cast<size_t>(y - 1)));
        acct.emergency *= infl_factor;
        apply_yield_drag(acct, inputs.dividend_yield_pct, status);

        const int age1 = inputs.age1 + years_to_ret + y;
        const int age2 = inputs.age2 + years_to_ret + y;
        const int rmd_age = married ? std::max(age1, age2) : age1;
        const double rmd = calc_rmd(acct.pretax, rmd_age);
        const double ss = household_social_security(inputs, age1, married ? age2 : 0);

        // Fill the target bracket with conversions the taxable account can pay for
        double converted = 0.0;
        if (inputs.roth_conversions.enabled && rmd_age < RMD_START_AGE &&
            acct.pretax > 0.0 && acct.taxable > 0.0) {
            double headroom = std::max(0.0, target_limit + deduction - ss);
            if (headroom > 0.0) {
                double max_conversion = std::min(headroom, acct.pretax);
                double base_tax = calc_ordinary_tax(ss, status);
                double full_tax = calc_ordinary_tax(ss + max_conversion, status) - base_tax;
                double affordable = full_tax > 0.0
                    ? std::min(max_conversion, acct.taxable / full_tax * max_conversion)
                    : max_conversion;

                if (affordable > 0.0) {
                    converted = std::min(affordable, acct.pretax);
                    double tax = calc_ordinary_tax(ss + converted, status) - base_tax;
                    acct.pretax -= converted;
                    acct.roth += converted;
                    acct.taxable -= tax;
                    result.total_roth_conversions += converted;
                    result.conversion_taxes_paid += tax;
                }
            }
        }

        const double med_inflation = std::pow(med_factor, y);
        double healthcare = 0.0;
        const double magi = prior_magi >= 0.0 ? prior_magi : withdrawal_gross + ss + rmd;
        healthcare += medicare_annual_cost(inputs.healthcare, age1, magi, status, med_inflation);
        if (married) {
            healthcare += medicare_annual_cost(inputs.healthcare, age2, magi, status, med_inflation);
        }
        healthcare += ltc_annual_cost(inputs.healthcare, ltc, age1, med_inflation);

        double children_cost = 0.0;
        if (!children.empty()) {
            int elapsed = years_to_ret + y;
            children_cost = child_expenses(children, elapsed, std::pow(infl_factor, elapsed));
        }

        const double need = std::max(0.0, withdrawal_gross + healthcare + children_cost - ss);
        double requested = need;
        double rmd_excess = 0.0;
        if (rmd > need) {
            requested = rmd;
            rmd_excess = rmd - need;
        }

        WithdrawalTax taxes = compute_withdrawal_taxes(requested, status, acct.taxable,
                                                       acct.pretax, acct.roth, acct.basis,
                                                       inputs.state_tax_pct, rmd);
        acct.taxable -= taxes.draw_taxable;
        acct.pretax -= taxes.draw_pretax;
        acct.roth -= taxes.draw_roth;
        acct.basis = taxes.new_basis;

        if (rmd_excess > 0.0) {
            double after_tax = rmd_excess - calc_ordinary_tax(rmd_excess, status);
            acct.taxable += after_tax;
            acct.basis += after_tax;
        }

        prior_magi = taxes.draw_pretax + taxes.realized_gain + converted + ss;

        acct.taxable = std::max(0.0, acct.taxable);
        acct.pretax = std::max(0.0, acct.pretax);
        acct.roth = std::max(0.0, acct.roth);

        if (config.record_withdrawals) {
            WithdrawalRecord rec;
            rec.year = y;
            rec.age = age1;
            rec.requested = requested;
            rec.gross = taxes.draw_taxable + taxes.draw_pretax + taxes.draw_roth;
            rec.tax_ordinary = taxes.ordinary;
            rec.tax_capital_gains = taxes.capital_gains;
            rec.tax_niit = taxes.niit;
            rec.tax_state = taxes.state;
            rec.tax_total = taxes.total;
            rec.net = rec.gross - taxes.total;
            rec.rmd = rmd;
            rec.social_security = ss;
            rec.healthcare = healthcare;
            rec.roth_conversion = converted;
            result.withdrawals.push_back(rec);
        }

        double total = acct.total();
        cumulative_inflation *= 1.0 + effective_inflation_pct(inputs, years_to_ret + y) / 100.0;
        result.balances_real.push_back(total / cumulative_inflation);
        result.balances_nominal.push_back(total);

        // The emergency fund is the last line of defence before ruin
        if (acct.invested() <= 0.0 && acct.emergency <= 0.0) {
            if (!result.ruined) {
                result.survival_years = y - 1;
                result.ruined = true;
            }
            acct = Accounts();
        } else if (acct.invested() <= 0.0) {
            acct.emergency -= std::min(withdrawal_gross, acct.emergency);
            acct.taxable = acct.pretax = acct.roth = 0.0;
            result.survival_years = y;
        } else {
            result.survival_years = y;
        }

        withdrawal_gross *= infl_factor;
    }

    result.eol_nominal = std::max(0.0, acct.total());
    result.eol_real = result.eol_nominal / cumulative_inflation;
    return result;
}

} // namespace retirecalc
