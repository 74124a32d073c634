#ifndef RETIRECALC_PLAN_OPTIMIZER_HPP
#define RETIRECALC_PLAN_OPTIMIZER_HPP

#include "simulation_inputs.hpp"
#include <atomic>
#include <cstdint>

namespace retirecalc {

struct PlanOptimizerConfig {
    double success_threshold;           // required 1 - prob_ruin
    size_t test_paths;                  // paths per trial batch
    int max_iterations;                 // bisection steps per search
    const std::atomic<bool>* cancel;

    PlanOptimizerConfig();
};

struct PlanOptimizationResult {
    double surplus_annual;              // contributions that could stop while staying on track
    double surplus_monthly;
    double max_splurge;                 // largest one-off taxable withdrawal today
    int earliest_retirement_age;
    int years_earlier;

    PlanOptimizationResult();
};

// True when a trial batch over `inputs` meets the success threshold.
// Invalid trial plans count as failures.
bool plan_succeeds(const SimulationInputs& inputs, uint32_t base_seed,
                   const PlanOptimizerConfig& config);

// Three independent bisection searches over seeded trial batches:
// minimum contributions (to within 100), maximum splurge from the taxable
// account (to within 1,000, capped at 5M or 95% of the account) and the
// earliest whole retirement age.
PlanOptimizationResult optimize_plan(const SimulationInputs& inputs, uint32_t base_seed,
                                     const PlanOptimizerConfig& config = PlanOptimizerConfig());

} // namespace retirecalc

#endif // RETIRECALC_PLAN_OPTIMIZER_HPP
