#ifndef RETIRECALC_SIMULATION_INPUTS_HPP
#define RETIRECALC_SIMULATION_INPUTS_HPP

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace retirecalc {

// Planning horizon: every path runs until the older spouse reaches this age
constexpr int LIFE_EXPECTANCY = 95;

enum class FilingStatus : uint8_t {
    Single = 0,
    Married = 1
};

enum class EmploymentType : uint8_t {
    W2 = 0,
    SelfEmployed = 1,
    Both = 2,
    Retired = 3,
    Other = 4
};

// How annual growth factors are produced for a path
enum class ReturnMode : uint8_t {
    Fixed = 0,             // expected return every year
    HistoricalReplay = 1,  // sequential replay of the index from a start year
    SeededRandom = 2,      // bootstrap from the index with a reproducible seed
    TrulyRandom = 3        // bootstrap, reseeded from the OS per batch
};

enum class WalkSeries : uint8_t {
    Nominal = 0,
    Real = 1
};

enum class GlidePathStrategy : uint8_t {
    Aggressive = 0,
    AgeBased = 1,
    Custom = 2
};

enum class GlidePathShape : uint8_t {
    Linear = 0,
    Accelerated = 1,
    Decelerated = 2
};

// Annual contributions for one person, in today's dollars
struct ContributionSchedule {
    double taxable = 0.0;
    double pretax = 0.0;
    double roth = 0.0;
    double employer_match = 0.0;

    double total() const { return taxable + pretax + roth + employer_match; }
};

// Bond allocation schedule; percentages are 0-100
struct BondGlidePath {
    GlidePathStrategy strategy = GlidePathStrategy::AgeBased;
    int start_age = 40;
    int end_age = 65;
    double start_pct = 10.0;
    double end_pct = 60.0;
    GlidePathShape shape = GlidePathShape::Linear;
};

struct HealthcareAssumptions {
    bool include_medicare = false;
    double medicare_premium_monthly = 400.0;
    double medical_inflation_pct = 5.0;

    bool include_ltc = false;
    double ltc_annual_cost = 80000.0;
    double ltc_probability_pct = 50.0;
    double ltc_duration_years = 2.5;
    int ltc_onset_window_start = 75;   // onset age is drawn per path within
    int ltc_onset_window_end = 90;     // [start, end], inclusive
};

struct RothConversionPolicy {
    bool enabled = false;
    double target_bracket = 0.24;      // marginal rate of the bracket to fill
};

// Complete, immutable description of a household plan.
// Rates are expressed in percent (9.8 means 9.8%).
struct SimulationInputs {
    FilingStatus filing_status = FilingStatus::Single;
    int age1 = 35;
    int age2 = 35;
    int retirement_age = 65;

    EmploymentType employment_type1 = EmploymentType::W2;
    EmploymentType employment_type2 = EmploymentType::W2;
    double primary_income = 0.0;
    double spouse_income = 0.0;

    double taxable_balance = 0.0;
    double pretax_balance = 0.0;
    double roth_balance = 0.0;
    double emergency_fund = 0.0;

    ContributionSchedule contributions1;
    ContributionSchedule contributions2;

    double expected_return_pct = 9.8;
    double inflation_pct = 2.6;
    double state_tax_pct = 0.0;
    double withdrawal_rate_pct = 3.5;
    bool escalate_contributions = false;
    double income_growth_pct = 0.0;
    double dividend_yield_pct = 2.0;

    std::optional<double> inflation_shock_pct;
    int inflation_shock_years = 5;

    ReturnMode return_mode = ReturnMode::SeededRandom;
    WalkSeries walk_series = WalkSeries::Nominal;
    int historical_start_year = 1928;
    std::vector<double> return_series_pct;   // empty selects the built-in index
    int return_series_first_year = 1928;

    bool include_social_security = false;
    double ss_income1 = 0.0;            // average annual covered earnings
    int ss_claim_age1 = 67;
    double ss_income2 = 0.0;
    int ss_claim_age2 = 67;

    HealthcareAssumptions healthcare;
    std::optional<BondGlidePath> glide_path;
    RothConversionPolicy roth_conversions;

    std::vector<int> children_ages;     // current ages of dependent children
    int additional_children_expected = 0;

    bool is_married() const { return filing_status == FilingStatus::Married; }
    int younger_age() const;
    int older_age() const;
    int years_to_retirement() const;
    int years_to_simulate() const;

    double total_starting_balance() const;
    double total_annual_contributions() const;
};

// Throws ValidationError naming the first offending field
void validate_inputs(const SimulationInputs& inputs);

// String conversions used by the JSON layer and logging
std::string to_string(FilingStatus status);
std::string to_string(EmploymentType type);
std::string to_string(ReturnMode mode);
std::string to_string(WalkSeries series);
std::string to_string(GlidePathStrategy strategy);
std::string to_string(GlidePathShape shape);

FilingStatus parse_filing_status(const std::string& value);
EmploymentType parse_employment_type(const std::string& value);
ReturnMode parse_return_mode(const std::string& value);
WalkSeries parse_walk_series(const std::string& value);
GlidePathStrategy parse_glide_path_strategy(const std::string& value);
GlidePathShape parse_glide_path_shape(const std::string& value);

} // namespace retirecalc

#endif // RETIRECALC_SIMULATION_INPUTS_HPP
