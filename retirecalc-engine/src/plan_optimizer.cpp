#include "plan_optimizer.hpp"
#include "batch_orchestrator.hpp"
#include "errors.hpp"
#include <algorithm>

namespace retirecalc {

PlanOptimizerConfig::PlanOptimizerConfig()
    : success_threshold(0.95), test_paths(400), max_iterations(50), cancel(nullptr) {}

PlanOptimizationResult::PlanOptimizationResult()
    : surplus_annual(0.0), surplus_monthly(0.0), max_splurge(0.0),
      earliest_retirement_age(0), years_earlier(0) {}

namespace {

constexpr double CONTRIBUTION_TOLERANCE = 100.0;
constexpr double SPLURGE_TOLERANCE = 1000.0;
constexpr double SPLURGE_CAP = 5000000.0;

void scale_contributions(ContributionSchedule& c, double factor) {
    c.taxable *= factor;
    c.pretax *= factor;
    c.roth *= factor;
    c.employer_match *= factor;
}

} // anonymous namespace

bool plan_succeeds(const SimulationInputs& inputs, uint32_t base_seed,
                   const PlanOptimizerConfig& config) {
    BatchOptions options;
    options.cancel = config.cancel;

    try {
        BatchSummary summary = run_batch(inputs, base_seed, config.test_paths, options);
        return summary.prob_ruin < 1.0 - config.success_threshold;
    } catch (const ValidationError&) {
        return false;
    }
}

PlanOptimizationResult optimize_plan(const SimulationInputs& inputs, uint32_t base_seed,
                                     const PlanOptimizerConfig& config) {
    validate_inputs(inputs);
    PlanOptimizationResult result;

    // 1. Minimum contributions that still succeed
    const double current_total = inputs.total_annual_contributions();
    if (current_total > 0.0) {
        double low = 0.0;
        double high = current_total;
        double min_contrib = current_total;

        for (int i = 0; i < config.max_iterations && low < high; ++i) {
            double mid = low + (high - low) / 2.0;
            double factor = mid / current_total;

            SimulationInputs trial = inputs;
            scale_contributions(trial.contributions1, factor);
            scale_contributions(trial.contributions2, factor);

            if (plan_succeeds(trial, base_seed, config)) {
                min_contrib = mid;
                high = mid;
            } else {
                low = mid;
            }
            if (high - low < CONTRIBUTION_TOLERANCE) break;
        }
        result.surplus_annual = std::max(0.0, current_total - min_contrib);
        result.surplus_monthly = result.surplus_annual / 12.0;
    }

    // 2. Largest one-off withdrawal from the taxable account
    if (inputs.taxable_balance > 0.0) {
        double low = 0.0;
        double high = std::min(SPLURGE_CAP, inputs.taxable_balance * 0.95);

        for (int i = 0; i < config.max_iterations && low < high; ++i) {
            double mid = low + (high - low) / 2.0;

            SimulationInputs trial = inputs;
            trial.taxable_balance = std::max(0.0, inputs.taxable_balance - mid);

            if (plan_succeeds(trial, base_seed, config)) {
                result.max_splurge = mid;
                low = mid;
            } else {
                high = mid;
            }
            if (high - low < SPLURGE_TOLERANCE) break;
        }
    }

    // 3. Earliest retirement age
    int min_age = inputs.younger_age() + 1;
    int max_age = inputs.retirement_age;
    int best_age = inputs.retirement_age;

    for (int i = 0; i < config.max_iterations && min_age <= max_age; ++i) {
        int mid_age = (min_age + max_age) / 2;

        SimulationInputs trial = inputs;
        trial.retirement_age = mid_age;

        if (plan_succeeds(trial, base_seed, config)) {
            best_age = mid_age;
            max_age = mid_age - 1;
        } else {
            min_age = mid_age + 1;
        }
    }

    result.earliest_retirement_age = best_age;
    result.years_earlier = std::max(0, inputs.retirement_age - best_age);
    return result;
}

} // namespace retirecalc
