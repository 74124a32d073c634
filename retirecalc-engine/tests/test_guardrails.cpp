#include <catch2/catch_test_macros.hpp>
#include <catch2/catch_approx.hpp>
#include "guardrails.hpp"

using namespace retirecalc;
using Catch::Approx;

namespace {

std::vector<RunOutcome> make_runs(const std::vector<int>& failure_years, size_t successes) {
    std::vector<RunOutcome> runs;
    for (size_t i = 0; i < successes; ++i) {
        runs.emplace_back(500000.0, 40000.0, false, 30);
    }
    for (int years : failure_years) {
        runs.emplace_back(0.0, 40000.0, true, years);
    }
    return runs;
}

} // anonymous namespace

TEST_CASE("Prevention rate falls with failure year", "[guardrails]") {
    REQUIRE(guardrail_prevention_rate(3) == Approx(0.75));
    REQUIRE(guardrail_prevention_rate(10) == Approx(0.65));
    REQUIRE(guardrail_prevention_rate(15) == Approx(0.45));
    REQUIRE(guardrail_prevention_rate(18) == Approx(0.30));
    REQUIRE(guardrail_prevention_rate(25) == Approx(0.15));
    REQUIRE(guardrail_prevention_rate(29) == Approx(0.05));
}

TEST_CASE("Guardrails analysis", "[guardrails]") {
    auto runs = make_runs({3, 22}, 8);

    SECTION("Default 10% cut") {
        GuardrailsResult r = analyze_guardrails(runs);
        REQUIRE(r.total_failures == 2);
        REQUIRE(r.preventable_failures == 1);
        REQUIRE(r.baseline_success_rate == Approx(0.8));
        REQUIRE(r.new_success_rate == Approx(0.89));
        REQUIRE(r.improvement == Approx(0.09));
    }

    SECTION("Smaller cut scales the effect") {
        GuardrailsResult r = analyze_guardrails(runs, 0.05);
        REQUIRE(r.preventable_failures == 0);
        REQUIRE(r.new_success_rate == Approx(0.845));
    }

    SECTION("Cuts beyond 10% are capped") {
        GuardrailsResult capped = analyze_guardrails(runs, 0.25);
        REQUIRE(capped.new_success_rate == Approx(analyze_guardrails(runs, 0.10).new_success_rate));
    }

    SECTION("Input is not modified") {
        analyze_guardrails(runs);
        REQUIRE(runs.size() == 10);
        REQUIRE(runs.back().ruined);
    }
}

TEST_CASE("Guardrails with no failures", "[guardrails]") {
    GuardrailsResult r = analyze_guardrails(make_runs({}, 5));
    REQUIRE(r.total_failures == 0);
    REQUIRE(r.preventable_failures == 0);
    REQUIRE(r.baseline_success_rate == 1.0);
    REQUIRE(r.improvement == 0.0);

    GuardrailsResult empty = analyze_guardrails({});
    REQUIRE(empty.total_failures == 0);
}
