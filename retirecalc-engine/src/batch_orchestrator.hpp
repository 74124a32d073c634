#ifndef RETIRECALC_BATCH_ORCHESTRATOR_HPP
#define RETIRECALC_BATCH_ORCHESTRATOR_HPP

#include "simulation_inputs.hpp"
#include <atomic>
#include <cstdint>
#include <functional>
#include <vector>

namespace retirecalc {

// Percentile bands of a balance series, one entry per year index
struct PercentileSeries {
    std::vector<double> p10;
    std::vector<double> p25;
    std::vector<double> p50;
    std::vector<double> p75;
    std::vector<double> p90;

    size_t size() const { return p50.size(); }
    void resize(size_t n);
};

// Lightweight per-path outcome kept for the post-hoc analyzers
struct RunOutcome {
    double eol_real;
    double y1_after_tax_real;
    bool ruined;
    int survival_years;

    RunOutcome();
    RunOutcome(double eol, double y1, bool did_ruin, int years);
};

// Aggregate of a Monte Carlo batch
struct BatchSummary {
    PercentileSeries real;
    PercentileSeries nominal;

    double y1_after_tax_real_p25;
    double y1_after_tax_real_p50;
    double y1_after_tax_real_p75;

    double eol_real_p25;
    double eol_real_p50;
    double eol_real_p75;

    double prob_ruin;                   // ruined paths / N, in [0, 1]
    std::vector<RunOutcome> all_runs;

    // Execution metadata
    size_t num_paths;
    uint32_t base_seed;                 // seed actually used (OS-drawn in truly random mode)
    double execution_time_ms;

    BatchSummary();
};

using ProgressCallback = std::function<void(size_t completed, size_t total)>;

struct BatchOptions {
    ProgressCallback on_progress;       // called every progress_interval paths and at the end
    const std::atomic<bool>* cancel;    // when set, the batch stops and throws CancelledError
    size_t progress_interval;

    BatchOptions();
};

// Run `num_paths` independent simulations and aggregate them.
//
// Path seeds come from a Mulberry32 stream over base_seed (floor(rng() * 1e6)),
// or from a base seed drawn from std::random_device when the inputs select
// ReturnMode::TrulyRandom. The extremes are trimmed (floor(N * 0.025) from each
// tail) before percentiles are taken, per year index.
//
// Throws ValidationError for invalid inputs, std::invalid_argument for N == 0,
// CancelledError when cancelled.
BatchSummary run_batch(const SimulationInputs& inputs, uint32_t base_seed, size_t num_paths,
                       const BatchOptions& options = BatchOptions());

// ============================================================================
// Statistics helpers
// ============================================================================

std::vector<uint32_t> derive_path_seeds(uint32_t base_seed, size_t count);

// Values trimmed from each tail for a batch of n paths
size_t trim_count(size_t n);

// Sort and drop `trim` values from each end; untouched (but sorted) when the
// batch is too small to trim
std::vector<double> trim_extremes(std::vector<double> values, size_t trim);

// Linear interpolation percentile; values must be sorted ascending, p in 0-100
double calculate_percentile(const std::vector<double>& sorted_values, double p);

} // namespace retirecalc

#endif // RETIRECALC_BATCH_ORCHESTRATOR_HPP
