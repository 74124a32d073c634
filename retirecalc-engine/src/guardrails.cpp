#include "guardrails.hpp"
#include <algorithm>
#include <cmath>

namespace retirecalc {

GuardrailsResult::GuardrailsResult()
    : total_failures(0), preventable_failures(0), baseline_success_rate(1.0),
      new_success_rate(1.0), improvement(0.0) {}

double guardrail_prevention_rate(int survival_years) {
    if (survival_years <= 5) return 0.75;
    if (survival_years <= 10) return 0.65;
    if (survival_years <= 15) return 0.45;
    if (survival_years <= 20) return 0.30;
    if (survival_years <= 25) return 0.15;
    return 0.05;
}

GuardrailsResult analyze_guardrails(const std::vector<RunOutcome>& runs,
                                    double spending_reduction) {
    GuardrailsResult result;

    size_t failures = 0;
    double preventable = 0.0;
    const double scale = std::min(1.0, std::max(0.0, spending_reduction) / 0.10);

    for (const RunOutcome& run : runs) {
        if (!run.ruined) continue;
        ++failures;
        preventable += guardrail_prevention_rate(run.survival_years) * scale;
    }

    if (failures == 0) {
        return result;
    }

    const double total = static_cast<double>(runs.size());
    result.total_failures = failures;
    result.preventable_failures = std::lround(preventable);
    result.baseline_success_rate = (total - static_cast<double>(failures)) / total;
    result.new_success_rate = (total - static_cast<double>(failures) + preventable) / total;
    result.improvement = result.new_success_rate - result.baseline_success_rate;
    return result;
}

} // namespace retirecalc
