#include <catch2/catch_test_macros.hpp>
#include <catch2/catch_approx.hpp>
#include "healthcare_model.hpp"

using namespace retirecalc;
using Catch::Approx;

TEST_CASE("IRMAA surcharge tiers", "[healthcare][medicare]") {
    REQUIRE(irmaa_surcharge(100000.0, FilingStatus::Single) == 0.0);
    REQUIRE(irmaa_surcharge(120000.0, FilingStatus::Single) == Approx(81.20));
    REQUIRE(irmaa_surcharge(120000.0, FilingStatus::Married) == 0.0);
    REQUIRE(irmaa_surcharge(1000000.0, FilingStatus::Married) == Approx(487.00));
}

TEST_CASE("Medicare annual cost", "[healthcare][medicare]") {
    HealthcareAssumptions hc;
    hc.include_medicare = true;
    hc.medicare_premium_monthly = 200.0;

    REQUIRE(medicare_annual_cost(hc, 64, 50000.0, FilingStatus::Single, 1.0) == 0.0);
    REQUIRE(medicare_annual_cost(hc, 65, 50000.0, FilingStatus::Single, 1.0) == Approx(2400.0));
    REQUIRE(medicare_annual_cost(hc, 70, 50000.0, FilingStatus::Single, 1.5) == Approx(3600.0));
    REQUIRE(medicare_annual_cost(hc, 70, 120000.0, FilingStatus::Single, 1.0) ==
            Approx((200.0 + 81.20) * 12.0));

    SECTION("Excluded") {
        hc.include_medicare = false;
        REQUIRE(medicare_annual_cost(hc, 80, 50000.0, FilingStatus::Single, 1.0) == 0.0);
    }
}

TEST_CASE("Long-term care events", "[healthcare][ltc]") {
    HealthcareAssumptions hc;
    hc.include_ltc = true;
    hc.ltc_probability_pct = 50.0;
    hc.ltc_onset_window_start = 75;
    hc.ltc_onset_window_end = 90;
    hc.ltc_duration_years = 2.5;
    hc.ltc_annual_cost = 80000.0;

    SECTION("Trigger draw below the probability") {
        LtcEvent event = resolve_ltc_event(hc, 0.49, 0.0);
        REQUIRE(event.triggered);
        REQUIRE(event.onset_age == 75);
    }

    SECTION("Trigger draw at or above the probability") {
        REQUIRE_FALSE(resolve_ltc_event(hc, 0.5, 0.5).triggered);
    }

    SECTION("Onset age stays in the window") {
        REQUIRE(resolve_ltc_event(hc, 0.0, 0.999999).onset_age == 90);
        REQUIRE(resolve_ltc_event(hc, 0.0, 0.5).onset_age == 83);
    }

    SECTION("Cost covers the care duration") {
        LtcEvent event(true, 80);
        REQUIRE(ltc_annual_cost(hc, event, 79, 1.0) == 0.0);
        REQUIRE(ltc_annual_cost(hc, event, 80, 1.0) == Approx(80000.0));
        REQUIRE(ltc_annual_cost(hc, event, 82, 2.0) == Approx(160000.0));
        REQUIRE(ltc_annual_cost(hc, event, 83, 1.0) == 0.0);
    }

    SECTION("Excluded") {
        hc.include_ltc = false;
        REQUIRE_FALSE(resolve_ltc_event(hc, 0.0, 0.0).triggered);
        REQUIRE(ltc_annual_cost(hc, LtcEvent(true, 80), 80, 1.0) == 0.0);
    }
}

TEST_CASE("Pre-Medicare premiums", "[healthcare]") {
    REQUIRE(pre_medicare_premium(25) == Approx(4800.0));
    REQUIRE(pre_medicare_premium(62) == Approx(15600.0));
    REQUIRE(pre_medicare_premium(65) == 0.0);

    REQUIRE(pre_medicare_household_cost(62, std::nullopt, 0, 1.0) == Approx(15600.0));
    REQUIRE(pre_medicare_household_cost(62, 58, 0, 1.0) == Approx(15600.0 + 13200.0));
    REQUIRE(pre_medicare_household_cost(45, 45, 2, 1.0) == Approx(2.0 * 8400.0 + 6000.0));
    REQUIRE(pre_medicare_household_cost(66, 67, 2, 1.0) == 0.0);
}

TEST_CASE("Child expenses by age band", "[healthcare][children]") {
    REQUIRE(child_expenses({}, 0, 1.0) == 0.0);

    // Childcare plus full dependant cost
    REQUIRE(child_expenses({3}, 0, 1.0) == Approx(15000.0 + 8000.0));
    // School age
    REQUIRE(child_expenses({10}, 0, 1.0) == Approx(3000.0 + 8000.0 * 0.85));
    // College
    REQUIRE(child_expenses({20}, 0, 1.0) == Approx(25000.0 + 4000.0));
    // Independent
    REQUIRE(child_expenses({10}, 12, 1.0) == 0.0);

    SECTION("Inflation and aging") {
        REQUIRE(child_expenses({3}, 7, 2.0) == Approx(2.0 * (3000.0 + 8000.0 * 0.85)));
    }
}
