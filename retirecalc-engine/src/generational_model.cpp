#include "generational_model.hpp"
#include <algorithm>
#include <cmath>
#include <numeric>

namespace retirecalc {

// ============================================================================
// Constructors
// ============================================================================

BackfilledCohort::BackfilledCohort() : age(0), size(0.0), generation(0) {}

BackfilledCohort::BackfilledCohort(int cohort_age, double cohort_size, int gen)
    : age(cohort_age), size(cohort_size), generation(gen) {}

LegacyParams::LegacyParams()
    : estate_nominal(0.0), years_from_now(0), nominal_return_pct(9.8), inflation_pct(2.6),
      per_beneficiary_real(0.0), start_beneficiaries(1), total_fertility_rate(2.1),
      generation_length(30), death_age(90), min_distribution_age(21), cap_years(10000),
      initial_ages{0}, fertility_window_start(25), fertility_window_end(35),
      filing_status(FilingStatus::Single) {}

GenerationCheckpoint::GenerationCheckpoint()
    : generation(0), year(0), estate_value(0.0), estate_tax(0.0), net_to_heirs(0.0),
      fund_real(0.0), living_beneficiaries(0.0) {}

LegacyResult::LegacyResult()
    : years(0), unbounded(false), fund_left_real(0.0), last_living_count(0.0) {}

PayoutScenario::PayoutScenario() : net_estate_nominal(0.0), nominal_return_pct(0.0) {}

GenerationalPayout::GenerationalPayout()
    : per_beneficiary_real(0.0), start_beneficiaries(0), total_fertility_rate(0.0),
      generation_length(0), death_age(0), prob_perpetual(0.0) {}

double real_return(double nominal_pct, double inflation_pct) {
    return (1.0 + nominal_pct / 100.0) / (1.0 + inflation_pct / 100.0) - 1.0;
}

// ============================================================================
// Backfill
// ============================================================================

std::optional<std::vector<BackfilledCohort>> backfill_younger_generations(
    const std::vector<int>& ages, int num_beneficiaries, int fertility_window_end,
    int generation_length, double total_fertility_rate, int max_generations) {
    std::vector<BackfilledCohort> result;
    if (ages.empty()) {
        return result;
    }
    const double share = static_cast<double>(num_beneficiaries) / static_cast<double>(ages.size());

    for (int age : ages) {
        if (age <= fertility_window_end) {
            result.emplace_back(age, share, 0);
            continue;
        }
        if (generation_length <= 0) {
            return std::nullopt;
        }

        int current_age = age;
        double current_size = share;
        int generation = 0;
        while (current_age > fertility_window_end && generation < max_generations) {
            current_age -= generation_length;
            current_size *= total_fertility_rate;
            ++generation;
        }
        result.emplace_back(current_age, current_size, generation);
    }
    return result;
}

// ============================================================================
// Depletion Simulation
// ============================================================================

namespace {

struct Cohort {
    double size;
    int age;
    bool can_reproduce;
    double cumulative_births;
};

struct ChunkOutcome {
    int years;
    bool depleted;
};

double living_count(const std::vector<Cohort>& cohorts) {
    return std::accumulate(cohorts.begin(), cohorts.end(), 0.0,
                           [](double acc, const Cohort& c) { return acc + c.size; });
}

ChunkOutcome simulate_chunk(std::vector<Cohort>& cohorts, double& fund, double real_rate,
                            const LegacyParams& p, double births_per_year, int num_years) {
    ChunkOutcome out{0, false};

    for (int i = 0; i < num_years; ++i) {
        cohorts.erase(std::remove_if(cohorts.begin(), cohorts.end(),
                                     [&](const Cohort& c) { return c.age >= p.death_age; }),
                      cohorts.end());
        if (living_count(cohorts) <= 0.0) {
            out.depleted = true;
            return out;
        }

        fund *= 1.0 + real_rate;

        double eligible = 0.0;
        for (const Cohort& c : cohorts) {
            if (c.age >= p.min_distribution_age) eligible += c.size;
        }
        fund -= p.per_beneficiary_real * eligible;
        if (fund < 0.0) {
            fund = 0.0;
            out.depleted = true;
            return out;
        }

        ++out.years;

        for (Cohort& c : cohorts) {
            c.age += 1;
        }

        // All of a year's newborns share one cohort
        double births = 0.0;
        for (Cohort& c : cohorts) {
            if (!c.can_reproduce || c.age < p.fertility_window_start ||
                c.age > p.fertility_window_end ||
                c.cumulative_births >= p.total_fertility_rate) {
                continue;
            }
            double births_this_year = std::min(births_per_year,
                                               p.total_fertility_rate - c.cumulative_births);
            births += c.size * births_this_year;
            c.cumulative_births += births_this_year;
        }
        if (births > 0.0) {
            cohorts.push_back(Cohort{births, 0, true, 0.0});
        }
    }
    return out;
}

bool passes_perpetuity_check(double real_rate, const LegacyParams& p, double fund) {
    if (fund <= 0.0 || p.generation_length <= 0) {
        return false;
    }
    double population_growth = (p.total_fertility_rate - 2.0) / p.generation_length;
    double distribution_rate = p.per_beneficiary_real * p.start_beneficiaries / fund;
    return distribution_rate < 0.95 * (real_rate - population_growth);
}

} // anonymous namespace

LegacyResult simulate_per_beneficiary_payout(const LegacyParams& params) {
    constexpr int CHUNK_SIZE = 10;
    constexpr int EARLY_TERM_CHECK = 1000;
    constexpr int UNCAPPED_YEARS = 10000;
    constexpr size_t MAX_CHECKPOINTS = 10;

    LegacyResult result;

    const double inflation_factor = 1.0 + params.inflation_pct / 100.0;
    double fund = params.estate_nominal / std::pow(inflation_factor, params.years_from_now);
    const double r = real_return(params.nominal_return_pct, params.inflation_pct);

    int window = params.fertility_window_end - params.fertility_window_start;
    double births_per_year = window > 0 ? params.total_fertility_rate / window : 0.0;

    std::vector<Cohort> cohorts;
    if (!params.initial_ages.empty()) {
        for (int age : params.initial_ages) {
            cohorts.push_back(Cohort{1.0, age, age <= params.fertility_window_end, 0.0});
        }
    } else if (params.start_beneficiaries > 0) {
        cohorts.push_back(Cohort{static_cast<double>(params.start_beneficiaries), 0, true, 0.0});
    }

    if (params.cap_years >= UNCAPPED_YEARS && passes_perpetuity_check(r, params, fund)) {
        result.unbounded = true;
        result.fund_left_real = fund;
        result.last_living_count = params.start_beneficiaries;
        return result;
    }

    double fund_at_100 = 0.0;
    double fund_at_1000 = 0.0;
    int next_checkpoint = params.generation_length;
    int generation = 1;

    for (int t = 0; t < params.cap_years; t += CHUNK_SIZE) {
        int chunk = std::min(CHUNK_SIZE, params.cap_years - t);
        ChunkOutcome outcome = simulate_chunk(cohorts, fund, r, params, births_per_year, chunk);
        result.years += outcome.years;

        if (outcome.depleted) {
            result.fund_left_real = 0.0;
            result.last_living_count = living_count(cohorts);
            return result;
        }

        if (t >= next_checkpoint && result.generations.size() < MAX_CHECKPOINTS) {
            GenerationCheckpoint cp;
            cp.generation = generation;
            cp.year = t;
            cp.estate_value = fund * std::pow(inflation_factor, params.years_from_now + t);
            cp.estate_tax = calc_estate_tax(cp.estate_value, params.filing_status,
                                            TAX_YEAR + params.years_from_now + t,
                                            params.estate_policy);
            cp.net_to_heirs = cp.estate_value - cp.estate_tax;
            cp.fund_real = fund;
            cp.living_beneficiaries = living_count(cohorts);
            result.generations.push_back(cp);

            next_checkpoint += params.generation_length;
            ++generation;
        }

        if (t == 100 && fund_at_100 == 0.0) {
            fund_at_100 = fund;
        }
        if (t == EARLY_TERM_CHECK && fund_at_1000 == 0.0) {
            fund_at_1000 = fund;
        }

        if (t > EARLY_TERM_CHECK && params.cap_years >= UNCAPPED_YEARS &&
            fund_at_100 > 0.0 && fund > fund_at_1000) {
            double growth = std::pow(fund / fund_at_1000, 1.0 / (t - EARLY_TERM_CHECK)) - 1.0;
            if (growth > 0.03) {
                result.unbounded = true;
                result.fund_left_real = fund;
                result.last_living_count = living_count(cohorts);
                return result;
            }
        }
    }

    result.fund_left_real = fund;
    result.last_living_count = living_count(cohorts);
    return result;
}

// ============================================================================
// Batch Wiring
// ============================================================================

namespace {

// Nominal return that reproduces the percentile's terminal real wealth from
// today's starting balance; falls back to the expected return when undefined
double implied_nominal_return(double eol_real, double starting_balance, int years,
                              const SimulationInputs& inputs) {
    if (starting_balance <= 0.0 || eol_real <= 0.0 || years <= 0) {
        return inputs.expected_return_pct;
    }
    double real_cagr = std::pow(eol_real / starting_balance, 1.0 / years) - 1.0;
    return ((1.0 + real_cagr) * (1.0 + inputs.inflation_pct / 100.0) - 1.0) * 100.0;
}

} // anonymous namespace

std::optional<GenerationalPayout> compute_generational_payout(
    const SimulationInputs& inputs, const BatchSummary& batch,
    const GenerationalSettings& settings, int current_year,
    const EstateTaxPolicy& estate_policy) {
    std::vector<int> ages;
    for (int age : settings.beneficiary_ages) {
        if (age >= 0 && age < 90) ages.push_back(age);
    }
    const double total_distribution = settings.per_beneficiary_real *
                                      std::max(1, settings.num_beneficiaries);
    if (ages.empty() || settings.num_beneficiaries <= 0 ||
        settings.per_beneficiary_real <= 0.0 || total_distribution <= 0.0) {
        return std::nullopt;
    }

    const FilingStatus status = inputs.filing_status;
    const int years_to_ret = inputs.years_to_retirement();
    const int years_total = years_to_ret + inputs.years_to_simulate();
    const double to_nominal = std::pow(1.0 + inputs.inflation_pct / 100.0, years_total);
    const int year_of_death = current_year + (LIFE_EXPECTANCY - inputs.older_age());

    auto net_estate = [&](double eol_real) {
        double nominal = eol_real * to_nominal;
        return nominal - calc_estate_tax(nominal, status, year_of_death, estate_policy);
    };

    std::vector<BackfilledCohort> cohorts;
    std::optional<std::vector<BackfilledCohort>> backfilled = backfill_younger_generations(
        ages, settings.num_beneficiaries, settings.fertility_window_end,
        settings.generation_length, settings.total_fertility_rate);

    std::vector<int> final_ages = ages;
    double adjusted_beneficiaries = settings.num_beneficiaries;
    if (backfilled && !backfilled->empty()) {
        cohorts = *backfilled;
        final_ages.clear();
        adjusted_beneficiaries = 0.0;
        for (const BackfilledCohort& c : cohorts) {
            final_ages.push_back(c.age);
            adjusted_beneficiaries += c.size;
        }
    }

    LegacyParams base;
    base.years_from_now = years_total;
    base.inflation_pct = inputs.inflation_pct;
    base.per_beneficiary_real = settings.per_beneficiary_real;
    base.start_beneficiaries = std::max(1, static_cast<int>(std::lround(adjusted_beneficiaries)));
    base.total_fertility_rate = settings.total_fertility_rate;
    base.generation_length = settings.generation_length;
    base.death_age = std::max(1, settings.death_age);
    base.min_distribution_age = std::max(0, settings.min_distribution_age);
    base.cap_years = settings.cap_years;
    base.initial_ages = final_ages;
    base.fertility_window_start = settings.fertility_window_start;
    base.fertility_window_end = settings.fertility_window_end;
    base.filing_status = status;
    base.estate_policy = estate_policy;

    const double starting_balance = inputs.total_starting_balance();

    auto run_scenario = [&](double eol_real, double nominal_return) {
        PayoutScenario scenario;
        scenario.net_estate_nominal = net_estate(eol_real);
        scenario.nominal_return_pct = nominal_return;

        LegacyParams params = base;
        params.estate_nominal = scenario.net_estate_nominal;
        params.nominal_return_pct = nominal_return;
        scenario.result = simulate_per_beneficiary_payout(params);
        return scenario;
    };

    GenerationalPayout payout;
    payout.per_beneficiary_real = settings.per_beneficiary_real;
    payout.start_beneficiaries = std::max(1, settings.num_beneficiaries);
    payout.total_fertility_rate = settings.total_fertility_rate;
    payout.generation_length = settings.generation_length;
    payout.death_age = base.death_age;
    payout.cohorts = cohorts;

    payout.p10 = run_scenario(batch.eol_real_p25,
                              implied_nominal_return(batch.eol_real_p25, starting_balance,
                                                     years_total, inputs));
    payout.p50 = run_scenario(batch.eol_real_p50, inputs.expected_return_pct);
    payout.p90 = run_scenario(batch.eol_real_p75,
                              implied_nominal_return(batch.eol_real_p75, starting_balance,
                                                     years_total, inputs));

    // Empirical perpetuity: estates large enough to fund the payout forever
    double population_growth = settings.generation_length > 0
        ? (settings.total_fertility_rate - 2.0) / settings.generation_length
        : 0.0;
    double sustainable_rate = real_return(inputs.expected_return_pct, inputs.inflation_pct) -
                              population_growth;
    if (sustainable_rate > 0.0 && !batch.all_runs.empty()) {
        // Threshold is in today's dollars, so the after-tax estate is deflated
        double required = 1.05 * total_distribution / sustainable_rate;
        size_t sustained = 0;
        for (const RunOutcome& run : batch.all_runs) {
            if (net_estate(run.eol_real) / to_nominal >= required) ++sustained;
        }
        payout.prob_perpetual = static_cast<double>(sustained) /
                                static_cast<double>(batch.all_runs.size());
    }

    return payout;
}

} // namespace retirecalc
