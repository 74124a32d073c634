#include "roth_optimizer.hpp"
#include "tax_model.hpp"
#include <algorithm>

namespace retirecalc {

namespace {

constexpr double MIN_CONVERSION = 5000.0;
constexpr size_t RMD_ROWS_REPORTED = 10;

constexpr double FALLBACK_LIMIT_SINGLE = 197300.0;
constexpr double FALLBACK_LIMIT_MARRIED = 394600.0;

// RMDs from RMD_START_AGE to LIFE_EXPECTANCY; returns the lifetime tax and
// consumes the balance
double run_rmd_years(double& balance, const RothOptimizerParams& p, std::vector<RmdYear>& rows) {
    double lifetime_tax = 0.0;
    for (int age = RMD_START_AGE; age <= LIFE_EXPECTANCY; ++age) {
        double rmd = calc_rmd(balance, age);
        double tax = calc_ordinary_tax(rmd + p.social_security, p.filing_status);
        rows.emplace_back(age, rmd, tax);
        lifetime_tax += tax;
        balance = (balance - rmd) * (1.0 + p.growth_rate);
    }
    return lifetime_tax;
}

double total_rmds(const std::vector<RmdYear>& rows) {
    double total = 0.0;
    for (const RmdYear& row : rows) total += row.rmd;
    return total;
}

} // anonymous namespace

RothConversion::RothConversion() : age(0), amount(0.0), tax(0.0), pretax_before(0.0) {}

RothConversion::RothConversion(int conversion_age, double conversion, double year_tax,
                               double balance)
    : age(conversion_age), amount(conversion), tax(year_tax), pretax_before(balance) {}

RmdYear::RmdYear() : age(0), rmd(0.0), tax(0.0) {}

RmdYear::RmdYear(int rmd_age, double amount, double year_tax)
    : age(rmd_age), rmd(amount), tax(year_tax) {}

RothConversionResult::RothConversionResult()
    : has_recommendation(false), window_start_age(0), window_end_age(0), window_years(0),
      total_converted(0.0), avg_annual_conversion(0.0), baseline_lifetime_tax(0.0),
      optimized_lifetime_tax(0.0), lifetime_tax_savings(0.0), rmd_reduction(0.0),
      rmd_reduction_pct(0.0), effective_rate_improvement(0.0), target_bracket(0.0),
      target_bracket_limit(0.0) {}

RothConversionResult optimize_roth_conversions(const RothOptimizerParams& params) {
    RothConversionResult result;
    result.target_bracket = params.target_bracket;

    if (params.pretax_balance <= 0.0) {
        result.reason = "No pre-tax balance to convert";
        return result;
    }
    const int window_years = std::max(0, RMD_START_AGE - params.retirement_age);
    if (window_years <= 0) {
        result.reason = "Already at or past RMD age";
        return result;
    }

    const FilingStatus status = params.filing_status;
    const double deduction = standard_deduction(status);
    double limit = bracket_limit(status, params.target_bracket);
    if (limit <= 0.0) {
        limit = status == FilingStatus::Married ? FALLBACK_LIMIT_MARRIED : FALLBACK_LIMIT_SINGLE;
    }
    result.target_bracket_limit = limit;
    result.window_start_age = params.retirement_age;
    result.window_end_age = RMD_START_AGE - 1;
    result.window_years = window_years;

    // Baseline: leave everything pre-tax and take RMDs
    double baseline_balance = params.pretax_balance;
    std::vector<RmdYear> baseline_rows;
    result.baseline_lifetime_tax = run_rmd_years(baseline_balance, params, baseline_rows);

    // Optimized: fill the bracket every year of the window, then take RMDs
    double balance = params.pretax_balance;
    double optimized_tax = 0.0;
    const double base_income = params.social_security + params.annual_withdrawal;
    const double taxable_before = std::max(0.0, base_income - deduction);

    for (int age = params.retirement_age; age < RMD_START_AGE; ++age) {
        double room = std::max(0.0, limit - taxable_before);
        double amount = std::min(room, balance);
        if (amount > MIN_CONVERSION) {
            double tax = calc_ordinary_tax(base_income + amount, status);
            result.conversions.emplace_back(age, amount, tax, balance);
            optimized_tax += tax;
            balance -= amount;
        }
        balance *= 1.0 + params.growth_rate;
    }

    std::vector<RmdYear> optimized_rows;
    optimized_tax += run_rmd_years(balance, params, optimized_rows);
    result.optimized_lifetime_tax = optimized_tax;

    for (const RothConversion& c : result.conversions) {
        result.total_converted += c.amount;
    }
    if (!result.conversions.empty()) {
        result.avg_annual_conversion = result.total_converted /
                                       static_cast<double>(result.conversions.size());
    }

    result.lifetime_tax_savings = result.baseline_lifetime_tax - result.optimized_lifetime_tax;

    const double baseline_rmds = total_rmds(baseline_rows);
    const double optimized_rmds = total_rmds(optimized_rows);
    result.rmd_reduction = baseline_rmds - optimized_rmds;
    result.rmd_reduction_pct = baseline_rmds > 0.0 ? result.rmd_reduction / baseline_rmds * 100.0 : 0.0;

    double baseline_rate = baseline_rmds > 0.0 ? result.baseline_lifetime_tax / baseline_rmds : 0.0;
    double optimized_base = optimized_rmds + result.total_converted;
    double optimized_rate = optimized_base > 0.0 ? result.optimized_lifetime_tax / optimized_base : 0.0;
    result.effective_rate_improvement = (baseline_rate - optimized_rate) * 100.0;

    size_t rows = std::min(RMD_ROWS_REPORTED, baseline_rows.size());
    result.baseline_rmds.assign(baseline_rows.begin(), baseline_rows.begin() + static_cast<std::ptrdiff_t>(rows));
    rows = std::min(RMD_ROWS_REPORTED, optimized_rows.size());
    result.optimized_rmds.assign(optimized_rows.begin(), optimized_rows.begin() + static_cast<std::ptrdiff_t>(rows));

    result.has_recommendation = !result.conversions.empty() && result.lifetime_tax_savings > 0.0;
    return result;
}

} // namespace retirecalc
