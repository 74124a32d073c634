#include <catch2/catch_test_macros.hpp>
#include <catch2/catch_approx.hpp>
#include "calculation.hpp"
#include "errors.hpp"
#include <atomic>

using namespace retirecalc;
using Catch::Approx;

namespace {

SimulationInputs flat_retiree(double roth, double withdrawal_pct) {
    SimulationInputs in;
    in.age1 = 65;
    in.retirement_age = 65;
    in.roth_balance = roth;
    in.return_mode = ReturnMode::Fixed;
    in.expected_return_pct = 0.0;
    in.inflation_pct = 0.0;
    in.dividend_yield_pct = 0.0;
    in.withdrawal_rate_pct = withdrawal_pct;
    return in;
}

CalculationSettings small_settings() {
    CalculationSettings s;
    s.num_paths = 20;
    s.seed = 7;
    s.current_year = 2026;
    return s;
}

} // anonymous namespace

// ============================================================================
// Summary metrics
// ============================================================================

TEST_CASE("Flat Roth retiree produces exact summary", "[calculation]") {
    CalculationSettings settings = small_settings();
    settings.include_generational = false;
    CalculationResult r = run_calculation(flat_retiree(1000000.0, 3.0), settings);

    REQUIRE(r.years_to_retirement == 0);
    REQUIRE(r.years_to_simulate == 30);
    REQUIRE(r.total_contributions == Approx(1000000.0));
    REQUIRE(r.balance_at_retirement_nominal == Approx(1000000.0));
    REQUIRE(r.balance_at_retirement_real == Approx(1000000.0));

    REQUIRE(r.y1_withdrawal_gross == Approx(30000.0));
    REQUIRE(r.y1_withdrawal_real == Approx(30000.0));
    REQUIRE(r.y1_withdrawal_after_tax == Approx(30000.0));
    REQUIRE(r.tax.total == 0.0);

    REQUIRE(r.survival_years == 30);
    REQUIRE(r.eol_real == Approx(100000.0));
    REQUIRE(r.eol_nominal == Approx(100000.0));
    REQUIRE(r.year_of_death == 2056);
    REQUIRE(r.estate_tax_nominal == 0.0);
    REQUIRE(r.net_estate_real == Approx(100000.0));

    REQUIRE(r.eol_accounts.roth == Approx(100000.0));
    REQUIRE(r.eol_accounts.taxable == 0.0);
    REQUIRE(r.eol_accounts.pretax == 0.0);

    REQUIRE(r.prob_ruin == 0.0);
    REQUIRE_FALSE(r.guardrails.has_value());
    REQUIRE_FALSE(r.generational.has_value());
}

TEST_CASE("Chart covers every simulated year", "[calculation]") {
    CalculationSettings settings = small_settings();
    settings.include_generational = false;
    CalculationResult r = run_calculation(flat_retiree(1000000.0, 3.0), settings);

    REQUIRE(r.chart.size() == 31);
    REQUIRE(r.chart.front().year == 2026);
    REQUIRE(r.chart.front().age1 == 65);
    REQUIRE_FALSE(r.chart.front().age2.has_value());
    REQUIRE(r.chart.back().year == 2056);
    REQUIRE(r.chart.back().age1 == 95);

    // Fixed returns collapse the bands onto the median
    for (const ChartPoint& p : r.chart) {
        REQUIRE(p.p10_nominal == Approx(p.balance_nominal));
        REQUIRE(p.p90_nominal == Approx(p.balance_nominal));
    }
    REQUIRE(r.chart[10].balance_nominal == Approx(700000.0));
}

TEST_CASE("Married chart carries the spouse's age", "[calculation]") {
    SimulationInputs in = flat_retiree(1000000.0, 3.0);
    in.filing_status = FilingStatus::Married;
    in.age2 = 62;
    CalculationSettings settings = small_settings();
    settings.include_generational = false;

    CalculationResult r = run_calculation(in, settings);
    REQUIRE(r.chart.front().age2.has_value());
    REQUIRE(*r.chart.front().age2 == 62);
}

TEST_CASE("RMD table starts at 73", "[calculation]") {
    CalculationSettings settings = small_settings();
    settings.include_generational = false;
    CalculationResult r = run_calculation(flat_retiree(1000000.0, 3.0), settings);

    // Ages 73 through 95
    REQUIRE(r.rmd_table.size() == 23);
    REQUIRE(r.rmd_table.front().age == 73);
    REQUIRE(r.rmd_table.back().age == 95);
    for (const RmdRow& row : r.rmd_table) {
        REQUIRE(row.rmd == 0.0);
        REQUIRE(row.spending == Approx(30000.0));
    }
}

TEST_CASE("RMD table follows the older spouse", "[calculation]") {
    SimulationInputs in = flat_retiree(0.0, 3.0);
    in.pretax_balance = 1000000.0;
    in.filing_status = FilingStatus::Married;
    in.age2 = 70;
    CalculationSettings settings = small_settings();
    settings.include_generational = false;

    CalculationResult r = run_calculation(in, settings);

    // The spouse turns 73 in the third retirement year, while the primary is 68
    REQUIRE(r.rmd_table.size() == 23);
    REQUIRE(r.rmd_table.front().age == 73);
    REQUIRE(r.rmd_table.back().age == 95);
    REQUIRE(r.rmd_table.front().rmd > 0.0);
}

TEST_CASE("Contributions accumulate until retirement", "[calculation]") {
    SimulationInputs in;
    in.age1 = 40;
    in.retirement_age = 60;
    in.taxable_balance = 150000.0;
    in.pretax_balance = 300000.0;
    in.roth_balance = 50000.0;
    in.contributions1.pretax = 23000.0;
    in.contributions1.roth = 7000.0;
    in.contributions1.employer_match = 5000.0;
    in.return_mode = ReturnMode::Fixed;

    CalculationSettings settings = small_settings();
    settings.include_generational = false;
    CalculationResult r = run_calculation(in, settings);

    REQUIRE(r.years_to_retirement == 20);
    REQUIRE(r.total_contributions == Approx(500000.0 + 20 * 35000.0));
    REQUIRE(r.balance_at_retirement_nominal > r.balance_at_retirement_real);
    REQUIRE(r.y1_withdrawal_gross ==
            Approx(r.balance_at_retirement_nominal * in.withdrawal_rate_pct / 100.0));
    REQUIRE(r.tax.total > 0.0);
    REQUIRE(r.tax.total == Approx(r.tax.federal_ordinary + r.tax.federal_capital_gains +
                                  r.tax.niit + r.tax.state));
}

// ============================================================================
// Post-hoc analyses
// ============================================================================

TEST_CASE("Ruined plan triggers the guardrails analysis", "[calculation]") {
    CalculationSettings settings = small_settings();
    settings.include_generational = false;
    CalculationResult r = run_calculation(flat_retiree(300000.0, 20.0), settings);

    REQUIRE(r.prob_ruin == Approx(1.0));
    REQUIRE(r.guardrails.has_value());
    REQUIRE(r.guardrails->total_failures == 20);
}

TEST_CASE("Generational payout follows a positive estate", "[calculation]") {
    CalculationResult r = run_calculation(flat_retiree(1000000.0, 3.0), small_settings());
    REQUIRE(r.generational.has_value());
    REQUIRE(r.generational->start_beneficiaries > 0.0);
}

TEST_CASE("Roth optimizer runs unless disabled", "[calculation]") {
    CalculationSettings settings = small_settings();
    settings.include_generational = false;

    CalculationResult with = run_calculation(flat_retiree(1000000.0, 3.0), settings);
    REQUIRE(with.roth.has_value());
    // Nothing pre-tax to convert
    REQUIRE_FALSE(with.roth->has_recommendation);

    settings.run_roth_optimizer = false;
    CalculationResult without = run_calculation(flat_retiree(1000000.0, 3.0), settings);
    REQUIRE_FALSE(without.roth.has_value());
}

// ============================================================================
// Errors
// ============================================================================

TEST_CASE("Calculation rejects invalid inputs", "[calculation]") {
    SimulationInputs in = flat_retiree(1000000.0, 3.0);
    in.withdrawal_rate_pct = 25.0;
    REQUIRE_THROWS_AS(run_calculation(in, small_settings()), ValidationError);
}

TEST_CASE("Calculation honors cancellation", "[calculation]") {
    std::atomic<bool> cancel(true);
    BatchOptions options;
    options.cancel = &cancel;
    REQUIRE_THROWS_AS(run_calculation(flat_retiree(1000000.0, 3.0), small_settings(), options),
                      CancelledError);
}
