#ifndef RETIRECALC_GUARDRAILS_HPP
#define RETIRECALC_GUARDRAILS_HPP

#include "batch_orchestrator.hpp"
#include <vector>

namespace retirecalc {

// Estimated effect of cutting spending when a path starts to fail
struct GuardrailsResult {
    size_t total_failures;
    long preventable_failures;          // rounded expected number of rescued paths
    double baseline_success_rate;
    double new_success_rate;
    double improvement;                 // new - baseline

    GuardrailsResult();
};

// Share of failures a spending cut rescues, by the year the path ran dry.
// Early failures respond best to a cut.
double guardrail_prevention_rate(int survival_years);

// Post-hoc guardrails evaluation over a batch's per-path outcomes.
// `spending_reduction` is a fraction (0.10 = 10% cut); its effect scales
// linearly up to a 10% cut and is capped there. Does not modify `runs`.
GuardrailsResult analyze_guardrails(const std::vector<RunOutcome>& runs,
                                    double spending_reduction = 0.10);

} // namespace retirecalc

#endif // RETIRECALC_GUARDRAILS_HPP
