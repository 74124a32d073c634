#include <catch2/catch_test_macros.hpp>
#include <catch2/catch_approx.hpp>
#include <catch2/matchers/catch_matchers_string.hpp>
#include "return_generator.hpp"
#include "market_data.hpp"
#include <sstream>

using namespace retirecalc;
using Catch::Approx;

// ============================================================================
// Mulberry32
// ============================================================================

TEST_CASE("Mulberry32 known sequence", "[returns][rng]") {
    Mulberry32 rng(0);
    REQUIRE(rng.next() == Approx(0.26642920868471265).epsilon(1e-12));
    REQUIRE(rng.next() == Approx(0.0003297457005828619).epsilon(1e-9));

    Mulberry32 seeded(12345);
    REQUIRE(seeded.next() == Approx(0.9797282677609473).epsilon(1e-12));
    REQUIRE(seeded.next() == Approx(0.3067522644996643).epsilon(1e-12));
}

TEST_CASE("Mulberry32 draws stay in [0, 1)", "[returns][rng]") {
    Mulberry32 rng(987654321u);
    for (int i = 0; i < 10000; ++i) {
        double x = rng.next();
        REQUIRE(x >= 0.0);
        REQUIRE(x < 1.0);
    }
}

// ============================================================================
// Market Data
// ============================================================================

TEST_CASE("Built-in index series", "[returns][market]") {
    const auto& series = sp500_returns();
    const size_t years = SP500_LAST_YEAR - SP500_FIRST_YEAR + 1;

    REQUIRE(series.size() == 2 * years);
    REQUIRE(sp500_raw_return(1928) == Approx(43.81));
    REQUIRE(sp500_raw_return(2008) == Approx(-36.55));

    SECTION("Returns are capped at 15%") {
        REQUIRE(series[0] == Approx(15.0));
        REQUIRE(series[2008 - SP500_FIRST_YEAR] == Approx(-15.0));
    }

    SECTION("Second half is the damped copy") {
        REQUIRE(series[years] == Approx(7.5));
        REQUIRE(series[years + 1] == Approx(series[1] * 0.5));
    }

    SECTION("Unknown years") {
        REQUIRE_THROWS_AS(sp500_raw_return(1927), std::out_of_range);
        REQUIRE_THROWS_AS(sp500_raw_return(2025), std::out_of_range);
    }
}

// ============================================================================
// Asset Allocation
// ============================================================================

TEST_CASE("Bond glide path allocation", "[returns][glide]") {
    REQUIRE(bond_allocation_pct(50, std::nullopt) == 0.0);

    BondGlidePath gp;
    gp.strategy = GlidePathStrategy::Aggressive;
    REQUIRE(bond_allocation_pct(70, gp) == 0.0);

    SECTION("Age-based schedule") {
        gp.strategy = GlidePathStrategy::AgeBased;
        REQUIRE(bond_allocation_pct(30, gp) == Approx(10.0));
        REQUIRE(bond_allocation_pct(50, gp) == Approx(35.0));
        REQUIRE(bond_allocation_pct(75, gp) == Approx(60.0));
    }

    SECTION("Custom shapes") {
        gp.strategy = GlidePathStrategy::Custom;
        gp.start_age = 40;
        gp.end_age = 60;
        gp.start_pct = 20.0;
        gp.end_pct = 60.0;

        gp.shape = GlidePathShape::Linear;
        REQUIRE(bond_allocation_pct(35, gp) == Approx(20.0));
        REQUIRE(bond_allocation_pct(45, gp) == Approx(30.0));
        REQUIRE(bond_allocation_pct(60, gp) == Approx(60.0));

        gp.shape = GlidePathShape::Accelerated;
        REQUIRE(bond_allocation_pct(45, gp) == Approx(40.0));

        gp.shape = GlidePathShape::Decelerated;
        REQUIRE(bond_allocation_pct(45, gp) == Approx(22.5));
    }
}

TEST_CASE("Bond and blended returns", "[returns][glide]") {
    REQUIRE(bond_return_pct(9.8) == Approx(4.5));
    REQUIRE(bond_return_pct(19.8) == Approx(7.5));
    REQUIRE(blended_return_pct(10.0, 4.0, 50.0) == Approx(7.0));
    REQUIRE(blended_return_pct(10.0, 4.0, 0.0) == Approx(10.0));
}

// ============================================================================
// Return Paths
// ============================================================================

TEST_CASE("Fixed return path", "[returns][path]") {
    ReturnGeneratorParams params;
    params.mode = ReturnMode::Fixed;
    params.years = 5;
    params.nominal_pct = 7.0;

    ReturnPath path = ReturnPath::generate(params);
    REQUIRE(path.size() == 5);
    for (size_t i = 0; i < path.size(); ++i) {
        REQUIRE(path.factor(i) == Approx(1.07));
    }
    REQUIRE_THROWS_AS(path.factor(5), std::out_of_range);

    SECTION("Glide path blends with the bond average") {
        BondGlidePath gp;
        gp.strategy = GlidePathStrategy::AgeBased;
        params.glide_path = gp;
        params.start_age = 70;
        ReturnPath blended = ReturnPath::generate(params);
        REQUIRE(blended.factor(0) == Approx(1.0 + (0.4 * 7.0 + 0.6 * 4.5) / 100.0));
    }
}

TEST_CASE("Historical replay path", "[returns][path]") {
    ReturnGeneratorParams params;
    params.mode = ReturnMode::HistoricalReplay;
    params.years = 3;
    params.start_year = 2008;

    ReturnPath path = ReturnPath::generate(params);
    const auto& data = sp500_returns();
    REQUIRE(path.factor(0) == Approx(1.0 + data[2008 - SP500_FIRST_YEAR] / 100.0));
    REQUIRE(path.factor(2) == Approx(1.0 + data[2010 - SP500_FIRST_YEAR] / 100.0));

    SECTION("Replay wraps at the end of the data") {
        ReturnSeries custom(2000, {10.0, 20.0});
        params.data = &custom;
        params.start_year = 2001;
        ReturnPath wrapped = ReturnPath::generate(params);
        REQUIRE(wrapped.factor(0) == Approx(1.20));
        REQUIRE(wrapped.factor(1) == Approx(1.10));
        REQUIRE(wrapped.factor(2) == Approx(1.20));
    }

    SECTION("Real series deflates by inflation") {
        ReturnSeries custom(2000, {10.0});
        params.data = &custom;
        params.series = WalkSeries::Real;
        params.inflation_pct = 2.0;
        REQUIRE(ReturnPath::generate(params).factor(0) == Approx(1.10 / 1.02));
    }
}

TEST_CASE("Seeded bootstrap path", "[returns][path]") {
    ReturnGeneratorParams params;
    params.mode = ReturnMode::SeededRandom;
    params.years = 40;
    params.seed = 777;

    ReturnPath a = ReturnPath::generate(params);
    ReturnPath b = ReturnPath::generate(params);
    REQUIRE(a.factors() == b.factors());

    params.seed = 778;
    ReturnPath c = ReturnPath::generate(params);
    REQUIRE(a.factors() != c.factors());

    SECTION("Draws come from the data") {
        ReturnSeries custom(1990, {5.0, -5.0});
        params.data = &custom;
        ReturnPath drawn = ReturnPath::generate(params);
        for (double f : drawn.factors()) {
            REQUIRE((f == Approx(1.05) || f == Approx(0.95)));
        }
    }

    SECTION("Empty custom data is rejected") {
        ReturnSeries empty(1990, {});
        params.data = &empty;
        REQUIRE_THROWS_AS(ReturnPath::generate(params), std::invalid_argument);
    }
}

// ============================================================================
// CSV Loading
// ============================================================================

TEST_CASE("Load return series from CSV", "[returns][csv]") {
    SECTION("Consecutive years") {
        std::istringstream csv("year,return_pct\n2000,-9.1\n2001,-11.9\n2002,-22.1\n");
        ReturnSeries series = load_return_series_csv(csv);
        REQUIRE(series.first_year == 2000);
        REQUIRE(series.returns_pct.size() == 3);
        REQUIRE(series.returns_pct[2] == Approx(-22.1));
    }

    SECTION("Gap in years") {
        std::istringstream csv("year,return_pct\n2000,1.0\n2002,2.0\n");
        REQUIRE_THROWS_AS(load_return_series_csv(csv), std::runtime_error);
    }

    SECTION("Header only") {
        std::istringstream csv("year,return_pct\n");
        REQUIRE_THROWS_AS(load_return_series_csv(csv), std::runtime_error);
    }

    SECTION("Comments and blank lines are skipped") {
        std::istringstream csv("year,return_pct\n# dot-com bust\n\n2000, -9.1\n2001,-11.9\n");
        ReturnSeries series = load_return_series_csv(csv);
        REQUIRE(series.first_year == 2000);
        REQUIRE(series.returns_pct.size() == 2);
        REQUIRE(series.returns_pct[0] == Approx(-9.1));
    }

    SECTION("Malformed row reports its line") {
        std::istringstream csv("year,return_pct\n# note\n2000,1.0\nabc,2.0\n");
        REQUIRE_THROWS_WITH(load_return_series_csv(csv),
                            Catch::Matchers::ContainsSubstring("line 4"));
    }

    SECTION("Missing file") {
        REQUIRE_THROWS_AS(load_return_series_csv(std::string("/nonexistent/returns.csv")),
                          std::runtime_error);
    }
}
