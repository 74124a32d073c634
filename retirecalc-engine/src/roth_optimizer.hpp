#ifndef RETIRECALC_ROTH_OPTIMIZER_HPP
#define RETIRECALC_ROTH_OPTIMIZER_HPP

#include "simulation_inputs.hpp"
#include <string>
#include <vector>

namespace retirecalc {

struct RothOptimizerParams {
    int retirement_age = 65;
    double pretax_balance = 0.0;
    FilingStatus filing_status = FilingStatus::Single;
    double social_security = 0.0;       // annual benefit, nominal
    double annual_withdrawal = 0.0;     // other ordinary income drawn each year
    double target_bracket = 0.24;
    double growth_rate = 0.07;          // fraction, applied to the pre-tax balance
};

struct RothConversion {
    int age;
    double amount;
    double tax;                         // tax on the whole year's ordinary income
    double pretax_before;

    RothConversion();
    RothConversion(int conversion_age, double conversion, double year_tax, double balance);
};

struct RmdYear {
    int age;
    double rmd;
    double tax;

    RmdYear();
    RmdYear(int rmd_age, double amount, double year_tax);
};

struct RothConversionResult {
    bool has_recommendation;
    std::string reason;                 // set when no plan could be produced

    std::vector<RothConversion> conversions;
    int window_start_age;
    int window_end_age;
    int window_years;

    double total_converted;
    double avg_annual_conversion;
    double baseline_lifetime_tax;
    double optimized_lifetime_tax;
    double lifetime_tax_savings;
    double rmd_reduction;
    double rmd_reduction_pct;
    double effective_rate_improvement;  // percentage points

    std::vector<RmdYear> baseline_rmds;  // first ten RMD years
    std::vector<RmdYear> optimized_rmds;

    double target_bracket;
    double target_bracket_limit;

    RothConversionResult();
};

// Compare RMD-only taxation from 73 to 95 against filling the target bracket
// with conversions between retirement and 72. Conversions of 5,000 or less
// are skipped.
RothConversionResult optimize_roth_conversions(const RothOptimizerParams& params);

} // namespace retirecalc

#endif // RETIRECALC_ROTH_OPTIMIZER_HPP
