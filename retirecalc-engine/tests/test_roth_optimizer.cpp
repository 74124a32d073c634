#include <catch2/catch_test_macros.hpp>
#include <catch2/catch_approx.hpp>
#include "roth_optimizer.hpp"
#include "tax_model.hpp"

using namespace retirecalc;
using Catch::Approx;

namespace {

RothOptimizerParams make_params() {
    RothOptimizerParams p;
    p.retirement_age = 65;
    p.pretax_balance = 1000000.0;
    p.filing_status = FilingStatus::Single;
    p.social_security = 30000.0;
    p.annual_withdrawal = 0.0;
    p.target_bracket = 0.22;
    p.growth_rate = 0.05;
    return p;
}

} // anonymous namespace

TEST_CASE("Roth conversions fill the target bracket", "[roth]") {
    RothConversionResult r = optimize_roth_conversions(make_params());

    REQUIRE(r.window_start_age == 65);
    REQUIRE(r.window_end_age == 72);
    REQUIRE(r.window_years == 8);
    REQUIRE(r.target_bracket_limit == Approx(105700.0));

    // Room above the deducted Social Security income
    double room = 105700.0 - (30000.0 - 16100.0);
    REQUIRE(r.conversions.size() == 8);
    REQUIRE(r.conversions.front().age == 65);
    REQUIRE(r.conversions.front().amount == Approx(room));
    REQUIRE(r.conversions.front().pretax_before == Approx(1000000.0));
    REQUIRE(r.conversions.front().tax ==
            Approx(calc_ordinary_tax(30000.0 + room, FilingStatus::Single)));

    REQUIRE(r.total_converted == Approx(8.0 * room));
    REQUIRE(r.avg_annual_conversion == Approx(room));
    REQUIRE(r.rmd_reduction > 0.0);
    REQUIRE(r.rmd_reduction_pct > 0.0);
    REQUIRE(r.lifetime_tax_savings == Approx(r.baseline_lifetime_tax - r.optimized_lifetime_tax));

    REQUIRE(r.baseline_rmds.size() == 10);
    REQUIRE(r.baseline_rmds.front().age == RMD_START_AGE);
    REQUIRE(r.optimized_rmds.front().rmd < r.baseline_rmds.front().rmd);
}

TEST_CASE("Small balances skip tiny conversions", "[roth]") {
    RothOptimizerParams p = make_params();
    p.pretax_balance = 4000.0;
    p.growth_rate = 0.0;

    RothConversionResult r = optimize_roth_conversions(p);
    REQUIRE(r.conversions.empty());
    REQUIRE_FALSE(r.has_recommendation);
}

TEST_CASE("Roth optimizer without a window", "[roth]") {
    SECTION("No pre-tax balance") {
        RothOptimizerParams p = make_params();
        p.pretax_balance = 0.0;
        RothConversionResult r = optimize_roth_conversions(p);
        REQUIRE_FALSE(r.has_recommendation);
        REQUIRE(r.reason == "No pre-tax balance to convert");
    }

    SECTION("Retiring at RMD age") {
        RothOptimizerParams p = make_params();
        p.retirement_age = 75;
        RothConversionResult r = optimize_roth_conversions(p);
        REQUIRE_FALSE(r.has_recommendation);
        REQUIRE(r.reason == "Already at or past RMD age");
    }
}

TEST_CASE("Unknown bracket falls back to the 24% limit", "[roth]") {
    RothOptimizerParams p = make_params();
    p.target_bracket = 0.25;
    REQUIRE(optimize_roth_conversions(p).target_bracket_limit == Approx(197300.0));

    p.filing_status = FilingStatus::Married;
    REQUIRE(optimize_roth_conversions(p).target_bracket_limit == Approx(394600.0));
}
