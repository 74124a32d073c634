#include "calculation.hpp"
#include "errors.hpp"
#include "social_security.hpp"
#include <algorithm>
#include <cmath>
#include <cstddef>

namespace retirecalc {

ChartPoint::ChartPoint()
    : year(0), age1(0), balance_nominal(0.0), balance_real(0.0),
      p10_nominal(0.0), p90_nominal(0.0) {}

RmdRow::RmdRow() : age(0), spending(0.0), rmd(0.0) {}

RmdRow::RmdRow(int row_age, double need, double required)
    : age(row_age), spending(need), rmd(required) {}

AccountSplit::AccountSplit() : taxable(0.0), pretax(0.0), roth(0.0) {}

TaxBreakdown::TaxBreakdown()
    : federal_ordinary(0.0), federal_capital_gains(0.0), niit(0.0), state(0.0), total(0.0) {}

CalculationResult::CalculationResult()
    : balance_at_retirement_nominal(0.0), balance_at_retirement_real(0.0),
      total_contributions(0.0), years_to_retirement(0), years_to_simulate(0),
      y1_withdrawal_gross(0.0), y1_withdrawal_after_tax(0.0), y1_withdrawal_real(0.0),
      survival_years(0), eol_nominal(0.0), eol_real(0.0), year_of_death(0),
      estate_tax_nominal(0.0), estate_tax_real(0.0), net_estate_real(0.0),
      prob_ruin(0.0) {}

namespace {

// Share of each account in the starting portfolio; an empty portfolio is
// assumed to be split 30/50/20
struct AccountMix {
    double taxable;
    double pretax;
    double roth;
};

AccountMix starting_mix(const SimulationInputs& inputs) {
    double total = inputs.total_starting_balance();
    if (total <= 0.0) {
        return {0.3, 0.5, 0.2};
    }
    return {inputs.taxable_balance / total, inputs.pretax_balance / total,
            inputs.roth_balance / total};
}

// Everything put in before retirement: starting balances plus each working
// year's contributions, escalated when income growth is enabled
double total_contributions(const SimulationInputs& inputs) {
    const double growth = inputs.escalate_contributions ? 1.0 + inputs.income_growth_pct / 100.0
                                                        : 1.0;
    double total = inputs.total_starting_balance();
    for (int y = 0; y <= inputs.years_to_retirement(); ++y) {
        double scale = std::pow(growth, y);
        if (inputs.age1 + y < inputs.retirement_age) {
            total += inputs.contributions1.total() * scale;
        }
        if (inputs.is_married() && inputs.age2 + y < inputs.retirement_age) {
            total += inputs.contributions2.total() * scale;
        }
    }
    return total;
}

int median_survival_years(const std::vector<RunOutcome>& runs) {
    if (runs.empty()) {
        return 0;
    }
    std::vector<int> years;
    years.reserve(runs.size());
    for (const RunOutcome& run : runs) {
        years.push_back(run.survival_years);
    }
    auto mid = years.begin() + static_cast<std::ptrdiff_t>(years.size() / 2);
    std::nth_element(years.begin(), mid, years.end());
    return *mid;
}

// Cost basis carried into retirement: the starting taxable balance plus
// every taxable contribution, never more than the account itself
double estimated_basis(const SimulationInputs& inputs, double taxable_at_retirement) {
    double basis = inputs.taxable_balance;
    for (int y = 0; y < inputs.years_to_retirement(); ++y) {
        if (inputs.age1 + y < inputs.retirement_age) basis += inputs.contributions1.taxable;
        if (inputs.is_married() && inputs.age2 + y < inputs.retirement_age) {
            basis += inputs.contributions2.taxable;
        }
    }
    return std::min(basis, taxable_at_retirement);
}

void build_chart(CalculationResult& result, const SimulationInputs& inputs, int current_year) {
    const BatchSummary& batch = result.batch;
    result.chart.reserve(batch.real.size());

    for (size_t i = 0; i < batch.real.size(); ++i) {
        const int offset = static_cast<int>(i);
        ChartPoint point;
        point.year = current_year + offset;
        point.age1 = inputs.age1 + offset;
        if (inputs.is_married()) {
            point.age2 = inputs.age2 + offset;
        }
        point.balance_real = batch.real.p50[i];
        point.balance_nominal = batch.nominal.p50[i];
        point.p10_nominal = batch.nominal.p10[i];
        point.p90_nominal = batch.nominal.p90[i];
        result.chart.push_back(point);
    }
}

// Median-path RMD estimate for each retirement year once the older spouse is
// 73. Rows carry that spouse's age. The pre-tax share of the median balance is
// taken from the starting account mix.
void build_rmd_table(CalculationResult& result, const SimulationInputs& inputs,
                     const AccountMix& mix) {
    const int years_to_ret = result.years_to_retirement;
    const double infl = 1.0 + inputs.inflation_pct / 100.0;
    const bool married = inputs.is_married();

    for (int y = 1; y <= result.years_to_simulate; ++y) {
        const int age1 = inputs.age1 + years_to_ret + y;
        const int age2 = inputs.age2 + years_to_ret + y;
        const int age = married ? std::max(age1, age2) : age1;
        if (age < RMD_START_AGE) {
            continue;
        }
        const size_t index = static_cast<size_t>(years_to_ret + y);
        if (index >= result.batch.nominal.size()) {
            break;
        }

        double pretax_nominal = result.batch.nominal.p50[index] * mix.pretax;
        double rmd = calc_rmd(pretax_nominal, age);

        double ss = household_social_security(inputs, age1, married ? age2 : 0);
        double spending = result.y1_withdrawal_gross * std::pow(infl, y);
        result.rmd_table.emplace_back(age, std::max(0.0, spending - ss), rmd);
    }
}

RothOptimizerParams roth_params(const CalculationResult& result, const SimulationInputs& inputs,
                                const CalculationSettings& settings, const AccountMix& mix) {
    RothOptimizerParams params;
    params.retirement_age = inputs.retirement_age;
    params.pretax_balance = result.balance_at_retirement_nominal * mix.pretax;
    params.filing_status = inputs.filing_status;

    // Benefit in the first RMD year, when both the conversion window and the
    // RMD schedule are being compared
    const int years_to_rmd = RMD_START_AGE - inputs.age1;
    params.social_security =
        household_social_security(inputs, RMD_START_AGE, inputs.age2 + years_to_rmd);

    params.annual_withdrawal =
        result.balance_at_retirement_nominal * inputs.withdrawal_rate_pct / 100.0;
    params.target_bracket = inputs.roth_conversions.enabled ? inputs.roth_conversions.target_bracket
                                                            : settings.roth_target_bracket;
    params.growth_rate = inputs.expected_return_pct / 100.0;
    return params;
}

} // anonymous namespace

// ============================================================================
// Calculation Pipeline
// ============================================================================

CalculationResult run_calculation(const SimulationInputs& inputs,
                                  const CalculationSettings& settings,
                                  const BatchOptions& options) {
    CalculationResult result;
    result.batch = run_batch(inputs, settings.seed, settings.num_paths, options);

    const BatchSummary& batch = result.batch;
    if (batch.real.size() == 0) {
        throw ComputationError("Monte Carlo simulation returned no balance series");
    }

    const double infl = 1.0 + inputs.inflation_pct / 100.0;
    const AccountMix mix = starting_mix(inputs);

    result.years_to_retirement = inputs.years_to_retirement();
    result.years_to_simulate = inputs.years_to_simulate();
    result.total_contributions = total_contributions(inputs);
    result.prob_ruin = batch.prob_ruin;

    const size_t ret_index = static_cast<size_t>(result.years_to_retirement);
    result.balance_at_retirement_real = batch.real.p50[ret_index];
    result.balance_at_retirement_nominal = batch.nominal.p50[ret_index];

    // First retirement year. The conservative blend of p25 and p50 is reported
    // for the after-tax amount; the tax split is computed on the median
    // balance at retirement divided by the starting account mix.
    result.y1_withdrawal_gross =
        result.balance_at_retirement_nominal * inputs.withdrawal_rate_pct / 100.0;
    result.y1_withdrawal_real = (batch.y1_after_tax_real_p25 + batch.y1_after_tax_real_p50) / 2.0;
    result.y1_withdrawal_after_tax =
        result.y1_withdrawal_real * std::pow(infl, result.years_to_retirement);

    double taxable_at_ret = result.balance_at_retirement_nominal * mix.taxable;
    WithdrawalTax y1_tax = compute_withdrawal_taxes(
        result.y1_withdrawal_gross, inputs.filing_status, taxable_at_ret,
        result.balance_at_retirement_nominal * mix.pretax,
        result.balance_at_retirement_nominal * mix.roth,
        estimated_basis(inputs, taxable_at_ret), inputs.state_tax_pct);
    result.tax.federal_ordinary = y1_tax.ordinary;
    result.tax.federal_capital_gains = y1_tax.capital_gains;
    result.tax.niit = y1_tax.niit;
    result.tax.state = y1_tax.state;
    result.tax.total = y1_tax.total;

    // Terminal estate
    result.survival_years = median_survival_years(batch.all_runs);
    result.eol_real = (batch.eol_real_p25 + batch.eol_real_p50) / 2.0;
    result.eol_nominal =
        result.eol_real * std::pow(infl, result.years_to_retirement + result.years_to_simulate);
    result.year_of_death = settings.current_year + (LIFE_EXPECTANCY - inputs.older_age());
    result.estate_tax_nominal = calc_estate_tax(result.eol_nominal, inputs.filing_status,
                                                result.year_of_death, settings.estate_policy);
    result.estate_tax_real = result.eol_nominal > 0.0
        ? result.estate_tax_nominal * (result.eol_real / result.eol_nominal)
        : 0.0;
    result.net_estate_real = result.eol_real - result.estate_tax_real;

    result.eol_accounts.taxable = result.eol_real * mix.taxable;
    result.eol_accounts.pretax = result.eol_real * mix.pretax;
    result.eol_accounts.roth = result.eol_real * mix.roth;

    build_chart(result, inputs, settings.current_year);
    build_rmd_table(result, inputs, mix);

    // Post-hoc analyses
    if (settings.include_generational && result.net_estate_real > 0.0) {
        result.generational = compute_generational_payout(
            inputs, batch, settings.generational, settings.current_year, settings.estate_policy);
    }

    if (batch.prob_ruin > 0.0) {
        result.guardrails = analyze_guardrails(batch.all_runs, settings.guardrail_spending_reduction);
    }

    if (settings.run_roth_optimizer) {
        result.roth = optimize_roth_conversions(roth_params(result, inputs, settings, mix));
    }

    return result;
}

} // namespace retirecalc
