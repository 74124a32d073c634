#include "json_io.hpp"
#include <fstream>
#include <sstream>

using json = nlohmann::json;

namespace retirecalc {
namespace io {

namespace {

// Value stored under either spelling of a key, or nullptr when absent or null
const json* find_key(const json& j, const char* snake, const char* camel) {
    if (!j.is_object()) {
        return nullptr;
    }
    if (snake) {
        auto it = j.find(snake);
        if (it != j.end() && !it->is_null()) return &*it;
    }
    if (camel) {
        auto it = j.find(camel);
        if (it != j.end() && !it->is_null()) return &*it;
    }
    return nullptr;
}

template <typename T>
void read(const json& j, const char* snake, const char* camel, T& out) {
    if (const json* value = find_key(j, snake, camel)) {
        out = value->get<T>();
    }
}

void read_contributions(const json& j, int person, ContributionSchedule& c) {
    const std::string n = std::to_string(person);

    // Flat form: cTax1, cPre1, cPost1, cMatch1
    read(j, nullptr, ("cTax" + n).c_str(), c.taxable);
    read(j, nullptr, ("cPre" + n).c_str(), c.pretax);
    read(j, nullptr, ("cPost" + n).c_str(), c.roth);
    read(j, nullptr, ("cMatch" + n).c_str(), c.employer_match);

    if (const json* nested = find_key(j, ("contributions" + n).c_str(), nullptr)) {
        read(*nested, "taxable", nullptr, c.taxable);
        read(*nested, "pretax", nullptr, c.pretax);
        read(*nested, "roth", nullptr, c.roth);
        read(*nested, "employer_match", "employerMatch", c.employer_match);
    }
}

// The planner front end keeps healthcare keys at the top level; the nested
// "healthcare" object uses the field names
void read_healthcare(const json& j, HealthcareAssumptions& hc) {
    read(j, "include_medicare", "includeMedicare", hc.include_medicare);
    read(j, "medicare_premium_monthly", "medicarePremium", hc.medicare_premium_monthly);
    read(j, "medical_inflation_pct", "medicalInflation", hc.medical_inflation_pct);
    read(j, "include_ltc", "includeLTC", hc.include_ltc);
    read(j, "ltc_annual_cost", "ltcAnnualCost", hc.ltc_annual_cost);
    read(j, "ltc_probability_pct", "ltcProbability", hc.ltc_probability_pct);
    read(j, "ltc_duration_years", "ltcDuration", hc.ltc_duration_years);
    read(j, "ltc_onset_window_start", "ltcAgeRangeStart", hc.ltc_onset_window_start);
    read(j, "ltc_onset_window_end", "ltcAgeRangeEnd", hc.ltc_onset_window_end);
}

BondGlidePath read_glide_path(const json& j) {
    BondGlidePath gp;
    std::string strategy = to_string(gp.strategy);
    std::string shape = to_string(gp.shape);
    read(j, "strategy", nullptr, strategy);
    read(j, "shape", nullptr, shape);
    gp.strategy = parse_glide_path_strategy(strategy);
    gp.shape = parse_glide_path_shape(shape);
    read(j, "start_age", "startAge", gp.start_age);
    read(j, "end_age", "endAge", gp.end_age);
    read(j, "start_pct", "startPct", gp.start_pct);
    read(j, "end_pct", "endPct", gp.end_pct);
    return gp;
}

SimulationInputs read_inputs(const json& j) {
    if (!j.is_object()) {
        throw JsonInputError("Simulation inputs must be a JSON object");
    }

    SimulationInputs in;

    std::string text;
    if (const json* v = find_key(j, "filing_status", "marital")) {
        in.filing_status = parse_filing_status(v->get<std::string>());
    }
    read(j, "age1", nullptr, in.age1);
    read(j, "age2", nullptr, in.age2);
    read(j, "retirement_age", "retirementAge", in.retirement_age);

    if (const json* v = find_key(j, "employment_type1", "employmentType1")) {
        in.employment_type1 = parse_employment_type(v->get<std::string>());
    }
    if (const json* v = find_key(j, "employment_type2", "employmentType2")) {
        in.employment_type2 = parse_employment_type(v->get<std::string>());
    }
    read(j, "primary_income", "primaryIncome", in.primary_income);
    read(j, "spouse_income", "spouseIncome", in.spouse_income);

    read(j, "taxable_balance", "taxableBalance", in.taxable_balance);
    read(j, "pretax_balance", "pretaxBalance", in.pretax_balance);
    read(j, "roth_balance", "rothBalance", in.roth_balance);
    read(j, "emergency_fund", "emergencyFund", in.emergency_fund);

    read_contributions(j, 1, in.contributions1);
    read_contributions(j, 2, in.contributions2);

    read(j, "expected_return_pct", "retRate", in.expected_return_pct);
    read(j, "inflation_pct", "inflationRate", in.inflation_pct);
    read(j, "state_tax_pct", "stateRate", in.state_tax_pct);
    read(j, "withdrawal_rate_pct", "wdRate", in.withdrawal_rate_pct);
    read(j, "escalate_contributions", "incContrib", in.escalate_contributions);
    read(j, "income_growth_pct", "incRate", in.income_growth_pct);
    read(j, "dividend_yield_pct", "dividendYield", in.dividend_yield_pct);

    // A zero shock rate means no shock
    if (const json* v = find_key(j, "inflation_shock_pct", "inflationShockRate")) {
        double shock = v->get<double>();
        if (shock > 0.0) {
            in.inflation_shock_pct = shock;
        }
    }
    read(j, "inflation_shock_years", "inflationShockDuration", in.inflation_shock_years);

    if (const json* v = find_key(j, "return_mode", "returnMode")) {
        in.return_mode = parse_return_mode(v->get<std::string>());
    }
    // "trulyRandom" is a series choice in the planner's vocabulary
    if (const json* v = find_key(j, "walk_series", "randomWalkSeries")) {
        text = v->get<std::string>();
        if (text == "trulyRandom") {
            in.return_mode = ReturnMode::TrulyRandom;
        } else {
            in.walk_series = parse_walk_series(text);
        }
    }
    read(j, "historical_start_year", "historicalYear", in.historical_start_year);
    read(j, "return_series_pct", "returnSeries", in.return_series_pct);
    read(j, "return_series_first_year", "returnSeriesFirstYear", in.return_series_first_year);

    read(j, "include_social_security", "includeSS", in.include_social_security);
    read(j, "ss_income1", "ssIncome", in.ss_income1);
    read(j, "ss_claim_age1", "ssClaimAge", in.ss_claim_age1);
    read(j, "ss_income2", "ssIncome2", in.ss_income2);
    read(j, "ss_claim_age2", "ssClaimAge2", in.ss_claim_age2);

    read_healthcare(j, in.healthcare);
    if (const json* hc = find_key(j, "healthcare", nullptr)) {
        read_healthcare(*hc, in.healthcare);
    }

    if (const json* gp = find_key(j, "glide_path", "bondGlidePath")) {
        in.glide_path = read_glide_path(*gp);
    }

    read(j, nullptr, "enableRothConversions", in.roth_conversions.enabled);
    read(j, nullptr, "targetConversionBracket", in.roth_conversions.target_bracket);
    if (const json* rc = find_key(j, "roth_conversions", nullptr)) {
        read(*rc, "enabled", nullptr, in.roth_conversions.enabled);
        read(*rc, "target_bracket", "targetBracket", in.roth_conversions.target_bracket);
    }

    read(j, "children_ages", "childrenAges", in.children_ages);
    read(j, "additional_children_expected", "additionalChildrenExpected",
         in.additional_children_expected);

    return in;
}

// Wraps nlohmann's exceptions so callers only see the calculation hierarchy
template <typename Fn>
auto guarded(Fn fn) -> decltype(fn()) {
    try {
        return fn();
    } catch (const json::parse_error& e) {
        throw JsonInputError(std::string("JSON parse error: ") + e.what());
    } catch (const json::type_error& e) {
        throw JsonInputError(std::string("JSON type error: ") + e.what());
    }
}

json percentile_json(const PercentileSeries& series) {
    return json{
        {"p10", series.p10},
        {"p25", series.p25},
        {"p50", series.p50},
        {"p75", series.p75},
        {"p90", series.p90},
    };
}

json checkpoints_json(const std::vector<GenerationCheckpoint>& checkpoints) {
    json out = json::array();
    for (const GenerationCheckpoint& c : checkpoints) {
        out.push_back({
            {"generation", c.generation},
            {"year", c.year},
            {"estate_value", c.estate_value},
            {"estate_tax", c.estate_tax},
            {"net_to_heirs", c.net_to_heirs},
            {"fund_real", c.fund_real},
            {"living_beneficiaries", c.living_beneficiaries},
        });
    }
    return out;
}

json scenario_json(const PayoutScenario& scenario) {
    const LegacyResult& r = scenario.result;
    json out{
        {"net_estate_nominal", scenario.net_estate_nominal},
        {"nominal_return_pct", scenario.nominal_return_pct},
        {"is_perpetual", r.is_perpetual()},
        {"fund_left_real", r.fund_left_real},
        {"last_living_count", r.last_living_count},
        {"generations", checkpoints_json(r.generations)},
    };
    // Years are meaningless once the fund is known to never deplete
    out["years"] = r.unbounded ? json(nullptr) : json(r.years);
    return out;
}

json rmd_years_json(const std::vector<RmdYear>& rows) {
    json out = json::array();
    for (const RmdYear& row : rows) {
        out.push_back({{"age", row.age}, {"rmd", row.rmd}, {"tax", row.tax}});
    }
    return out;
}

} // anonymous namespace

// ============================================================================
// Readers
// ============================================================================

SimulationInputs parse_simulation_inputs(const json& j) {
    return guarded([&] { return read_inputs(j); });
}

SimulationInputs parse_simulation_inputs_string(const std::string& json_string) {
    return guarded([&] { return read_inputs(json::parse(json_string)); });
}

SimulationInputs parse_simulation_inputs_file(const std::string& filepath) {
    std::ifstream file(filepath);
    if (!file.is_open()) {
        throw JsonInputError("Failed to open inputs file: " + filepath);
    }
    std::ostringstream buffer;
    buffer << file.rdbuf();
    return parse_simulation_inputs_string(buffer.str());
}

GenerationalSettings parse_generational_settings(const json& j) {
    return guarded([&] {
        GenerationalSettings s;
        read(j, "per_beneficiary_real", "hypPerBen", s.per_beneficiary_real);
        read(j, "beneficiary_ages", "hypBenAges", s.beneficiary_ages);
        read(j, "num_beneficiaries", "numberOfBeneficiaries", s.num_beneficiaries);
        read(j, "total_fertility_rate", "totalFertilityRate", s.total_fertility_rate);
        read(j, "generation_length", "generationLength", s.generation_length);
        read(j, "death_age", "hypDeathAge", s.death_age);
        read(j, "min_distribution_age", "hypMinDistAge", s.min_distribution_age);
        read(j, "fertility_window_start", "fertilityWindowStart", s.fertility_window_start);
        read(j, "fertility_window_end", "fertilityWindowEnd", s.fertility_window_end);
        read(j, "cap_years", "capYears", s.cap_years);
        return s;
    });
}

RothOptimizerParams parse_roth_params(const json& j) {
    return guarded([&] {
        RothOptimizerParams p;
        read(j, "retirement_age", "retirementAge", p.retirement_age);
        read(j, "pretax_balance", "pretaxBalance", p.pretax_balance);
        if (const json* v = find_key(j, "filing_status", "marital")) {
            p.filing_status = parse_filing_status(v->get<std::string>());
        }
        read(j, "social_security", "ssIncome", p.social_security);
        read(j, "annual_withdrawal", "annualWithdrawal", p.annual_withdrawal);
        read(j, "target_bracket", "targetBracket", p.target_bracket);
        read(j, "growth_rate", "growthRate", p.growth_rate);
        return p;
    });
}

CalculationSettings parse_calculation_settings(const json& j) {
    return guarded([&] {
        CalculationSettings s;
        read(j, "paths", "numPaths", s.num_paths);
        read(j, "seed", nullptr, s.seed);
        read(j, "current_year", "currentYear", s.current_year);
        read(j, "include_generational", "showGen", s.include_generational);
        if (const json* gen = find_key(j, "generational", nullptr)) {
            s.generational = parse_generational_settings(*gen);
        }
        read(j, "guardrail_spending_reduction", "spendingReduction",
             s.guardrail_spending_reduction);
        read(j, "estate_tax_sunset", nullptr, s.estate_policy.sunset);
        return s;
    });
}

// ============================================================================
// Writers
// ============================================================================

json to_json(const SimulationInputs& in) {
    json j{
        {"filing_status", to_string(in.filing_status)},
        {"age1", in.age1},
        {"age2", in.age2},
        {"retirement_age", in.retirement_age},
        {"employment_type1", to_string(in.employment_type1)},
        {"employment_type2", to_string(in.employment_type2)},
        {"primary_income", in.primary_income},
        {"spouse_income", in.spouse_income},
        {"taxable_balance", in.taxable_balance},
        {"pretax_balance", in.pretax_balance},
        {"roth_balance", in.roth_balance},
        {"emergency_fund", in.emergency_fund},
        {"expected_return_pct", in.expected_return_pct},
        {"inflation_pct", in.inflation_pct},
        {"state_tax_pct", in.state_tax_pct},
        {"withdrawal_rate_pct", in.withdrawal_rate_pct},
        {"escalate_contributions", in.escalate_contributions},
        {"income_growth_pct", in.income_growth_pct},
        {"dividend_yield_pct", in.dividend_yield_pct},
        {"inflation_shock_years", in.inflation_shock_years},
        {"return_mode", to_string(in.return_mode)},
        {"walk_series", to_string(in.walk_series)},
        {"historical_start_year", in.historical_start_year},
        {"include_social_security", in.include_social_security},
        {"ss_income1", in.ss_income1},
        {"ss_claim_age1", in.ss_claim_age1},
        {"ss_income2", in.ss_income2},
        {"ss_claim_age2", in.ss_claim_age2},
        {"children_ages", in.children_ages},
        {"additional_children_expected", in.additional_children_expected},
    };

    const ContributionSchedule* schedules[] = {&in.contributions1, &in.contributions2};
    for (int i = 0; i < 2; ++i) {
        const ContributionSchedule& c = *schedules[i];
        j["contributions" + std::to_string(i + 1)] = {
            {"taxable", c.taxable},
            {"pretax", c.pretax},
            {"roth", c.roth},
            {"employer_match", c.employer_match},
        };
    }

    j["inflation_shock_pct"] = in.inflation_shock_pct ? json(*in.inflation_shock_pct)
                                                      : json(nullptr);
    if (!in.return_series_pct.empty()) {
        j["return_series_pct"] = in.return_series_pct;
        j["return_series_first_year"] = in.return_series_first_year;
    }

    const HealthcareAssumptions& hc = in.healthcare;
    j["healthcare"] = {
        {"include_medicare", hc.include_medicare},
        {"medicare_premium_monthly", hc.medicare_premium_monthly},
        {"medical_inflation_pct", hc.medical_inflation_pct},
        {"include_ltc", hc.include_ltc},
        {"ltc_annual_cost", hc.ltc_annual_cost},
        {"ltc_probability_pct", hc.ltc_probability_pct},
        {"ltc_duration_years", hc.ltc_duration_years},
        {"ltc_onset_window_start", hc.ltc_onset_window_start},
        {"ltc_onset_window_end", hc.ltc_onset_window_end},
    };

    if (in.glide_path) {
        const BondGlidePath& gp = *in.glide_path;
        j["glide_path"] = {
            {"strategy", to_string(gp.strategy)},
            {"start_age", gp.start_age},
            {"end_age", gp.end_age},
            {"start_pct", gp.start_pct},
            {"end_pct", gp.end_pct},
            {"shape", to_string(gp.shape)},
        };
    } else {
        j["glide_path"] = nullptr;
    }

    j["roth_conversions"] = {
        {"enabled", in.roth_conversions.enabled},
        {"target_bracket", in.roth_conversions.target_bracket},
    };
    return j;
}

json to_json(const BatchSummary& batch, bool include_runs) {
    json j{
        {"real", percentile_json(batch.real)},
        {"nominal", percentile_json(batch.nominal)},
        {"y1_after_tax_real", {
            {"p25", batch.y1_after_tax_real_p25},
            {"p50", batch.y1_after_tax_real_p50},
            {"p75", batch.y1_after_tax_real_p75},
        }},
        {"eol_real", {
            {"p25", batch.eol_real_p25},
            {"p50", batch.eol_real_p50},
            {"p75", batch.eol_real_p75},
        }},
        {"prob_ruin", batch.prob_ruin},
        {"num_paths", batch.num_paths},
        {"base_seed", batch.base_seed},
        {"execution_time_ms", batch.execution_time_ms},
    };

    if (include_runs) {
        json runs = json::array();
        for (const RunOutcome& run : batch.all_runs) {
            runs.push_back({
                {"eol_real", run.eol_real},
                {"y1_after_tax_real", run.y1_after_tax_real},
                {"ruined", run.ruined},
                {"survival_years", run.survival_years},
            });
        }
        j["all_runs"] = runs;
    }
    return j;
}

json to_json(const GenerationalPayout& payout) {
    json cohorts = json::array();
    for (const BackfilledCohort& c : payout.cohorts) {
        cohorts.push_back({{"age", c.age}, {"size", c.size}, {"generation", c.generation}});
    }
    return json{
        {"per_beneficiary_real", payout.per_beneficiary_real},
        {"start_beneficiaries", payout.start_beneficiaries},
        {"total_fertility_rate", payout.total_fertility_rate},
        {"generation_length", payout.generation_length},
        {"death_age", payout.death_age},
        {"cohorts", cohorts},
        {"p10", scenario_json(payout.p10)},
        {"p50", scenario_json(payout.p50)},
        {"p90", scenario_json(payout.p90)},
        {"prob_perpetual", payout.prob_perpetual},
    };
}

json to_json(const GuardrailsResult& result) {
    return json{
        {"total_failures", result.total_failures},
        {"preventable_failures", result.preventable_failures},
        {"baseline_success_rate", result.baseline_success_rate},
        {"new_success_rate", result.new_success_rate},
        {"improvement", result.improvement},
    };
}

json to_json(const RothConversionResult& result) {
    json conversions = json::array();
    for (const RothConversion& c : result.conversions) {
        conversions.push_back({
            {"age", c.age},
            {"amount", c.amount},
            {"tax", c.tax},
            {"pretax_before", c.pretax_before},
        });
    }

    json j{
        {"has_recommendation", result.has_recommendation},
        {"conversions", conversions},
        {"window", {
            {"start_age", result.window_start_age},
            {"end_age", result.window_end_age},
            {"years", result.window_years},
        }},
        {"total_converted", result.total_converted},
        {"avg_annual_conversion", result.avg_annual_conversion},
        {"baseline_lifetime_tax", result.baseline_lifetime_tax},
        {"optimized_lifetime_tax", result.optimized_lifetime_tax},
        {"lifetime_tax_savings", result.lifetime_tax_savings},
        {"rmd_reduction", result.rmd_reduction},
        {"rmd_reduction_pct", result.rmd_reduction_pct},
        {"effective_rate_improvement", result.effective_rate_improvement},
        {"baseline_rmds", rmd_years_json(result.baseline_rmds)},
        {"optimized_rmds", rmd_years_json(result.optimized_rmds)},
        {"target_bracket", result.target_bracket},
        {"target_bracket_limit", result.target_bracket_limit},
    };
    if (!result.reason.empty()) {
        j["reason"] = result.reason;
    }
    return j;
}

json to_json(const PlanOptimizationResult& result) {
    return json{
        {"surplus_annual", result.surplus_annual},
        {"surplus_monthly", result.surplus_monthly},
        {"max_splurge", result.max_splurge},
        {"earliest_retirement_age", result.earliest_retirement_age},
        {"years_earlier", result.years_earlier},
    };
}

json to_json(const CalculationResult& result) {
    json chart = json::array();
    for (const ChartPoint& p : result.chart) {
        chart.push_back({
            {"year", p.year},
            {"a1", p.age1},
            {"a2", p.age2 ? json(*p.age2) : json(nullptr)},
            {"bal", p.balance_nominal},
            {"real", p.balance_real},
            {"p10", p.p10_nominal},
            {"p90", p.p90_nominal},
        });
    }

    json rmd_table = json::array();
    for (const RmdRow& row : result.rmd_table) {
        rmd_table.push_back({{"age", row.age}, {"spending", row.spending}, {"rmd", row.rmd}});
    }

    json j{
        {"balance_at_retirement_nominal", result.balance_at_retirement_nominal},
        {"balance_at_retirement_real", result.balance_at_retirement_real},
        {"total_contributions", result.total_contributions},
        {"years_to_retirement", result.years_to_retirement},
        {"years_to_simulate", result.years_to_simulate},
        {"y1_withdrawal", {
            {"gross", result.y1_withdrawal_gross},
            {"after_tax", result.y1_withdrawal_after_tax},
            {"real", result.y1_withdrawal_real},
        }},
        {"tax", {
            {"federal_ordinary", result.tax.federal_ordinary},
            {"federal_capital_gains", result.tax.federal_capital_gains},
            {"niit", result.tax.niit},
            {"state", result.tax.state},
            {"total", result.tax.total},
        }},
        {"survival_years", result.survival_years},
        {"eol_nominal", result.eol_nominal},
        {"eol_real", result.eol_real},
        {"year_of_death", result.year_of_death},
        {"estate_tax_nominal", result.estate_tax_nominal},
        {"estate_tax_real", result.estate_tax_real},
        {"net_estate_real", result.net_estate_real},
        {"eol_accounts", {
            {"taxable", result.eol_accounts.taxable},
            {"pretax", result.eol_accounts.pretax},
            {"roth", result.eol_accounts.roth},
        }},
        {"prob_ruin", result.prob_ruin},
        {"chart", chart},
        {"rmd_table", rmd_table},
        {"batch", to_json(result.batch)},
    };

    j["generational"] = result.generational ? to_json(*result.generational) : json(nullptr);
    j["guardrails"] = result.guardrails ? to_json(*result.guardrails) : json(nullptr);
    j["roth"] = result.roth ? to_json(*result.roth) : json(nullptr);
    return j;
}

void write_calculation_result_json(std::ostream& os, const CalculationResult& result,
                                   bool pretty_print) {
    os << to_json(result).dump(pretty_print ? 2 : -1) << "\n";
}

void write_calculation_result_json(const std::string& filepath, const CalculationResult& result,
                                   bool pretty_print) {
    std::ofstream file(filepath);
    if (!file) {
        throw std::runtime_error("Failed to open output file: " + filepath);
    }
    write_calculation_result_json(file, result, pretty_print);
}

void write_batch_summary_json(std::ostream& os, const BatchSummary& batch, bool pretty_print) {
    os << to_json(batch, true).dump(pretty_print ? 2 : -1) << "\n";
}

} // namespace io
} // namespace retirecalc
