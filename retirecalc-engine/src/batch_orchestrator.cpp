#include "batch_orchestrator.hpp"
#include "errors.hpp"
#include "return_generator.hpp"
#include "simulation_engine.hpp"
#include <algorithm>
#include <chrono>
#include <cmath>
#include <exception>
#include <random>
#include <stdexcept>
#ifdef HAVE_OPENMP
#include <omp.h>
#endif

namespace retirecalc {

// ============================================================================
// Result Types
// ============================================================================

void PercentileSeries::resize(size_t n) {
    p10.assign(n, 0.0);
    p25.assign(n, 0.0);
    p50.assign(n, 0.0);
    p75.assign(n, 0.0);
    p90.assign(n, 0.0);
}

RunOutcome::RunOutcome() : eol_real(0.0), y1_after_tax_real(0.0), ruined(false), survival_years(0) {}

RunOutcome::RunOutcome(double eol, double y1, bool did_ruin, int years)
    : eol_real(eol), y1_after_tax_real(y1), ruined(did_ruin), survival_years(years) {}

BatchSummary::BatchSummary()
    : y1_after_tax_real_p25(0.0), y1_after_tax_real_p50(0.0), y1_after_tax_real_p75(0.0),
      eol_real_p25(0.0), eol_real_p50(0.0), eol_real_p75(0.0),
      prob_ruin(0.0), num_paths(0), base_seed(0), execution_time_ms(0.0) {}

BatchOptions::BatchOptions() : cancel(nullptr), progress_interval(100) {}

// ============================================================================
// Statistics Helper Functions
// ============================================================================

std::vector<uint32_t> derive_path_seeds(uint32_t base_seed, size_t count) {
    Mulberry32 rng(base_seed);
    std::vector<uint32_t> seeds(count);
    for (size_t i = 0; i < count; ++i) {
        seeds[i] = static_cast<uint32_t>(std::floor(rng.next() * 1000000.0));
    }
    return seeds;
}

size_t trim_count(size_t n) {
    constexpr double TRIM_FRACTION = 0.025;
    return static_cast<size_t>(std::floor(static_cast<double>(n) * TRIM_FRACTION));
}

std::vector<double> trim_extremes(std::vector<double> values, size_t trim) {
    std::sort(values.begin(), values.end());
    if (trim == 0 || values.size() <= trim * 2) {
        return values;
    }
    return std::vector<double>(values.begin() + static_cast<std::ptrdiff_t>(trim),
                               values.end() - static_cast<std::ptrdiff_t>(trim));
}

double calculate_percentile(const std::vector<double>& sorted_values, double p) {
    if (sorted_values.empty()) {
        return 0.0;
    }
    if (p < 0.0 || p > 100.0) {
        throw std::invalid_argument("Percentile must be between 0 and 100");
    }
    if (sorted_values.size() == 1) {
        return sorted_values[0];
    }

    double n = static_cast<double>(sorted_values.size());
    double pos = (p / 100.0) * (n - 1);

    size_t lower_idx = static_cast<size_t>(std::floor(pos));
    size_t upper_idx = static_cast<size_t>(std::ceil(pos));

    if (lower_idx == upper_idx || upper_idx >= sorted_values.size()) {
        return sorted_values[lower_idx];
    }

    double frac = pos - static_cast<double>(lower_idx);
    return sorted_values[lower_idx] * (1.0 - frac) + sorted_values[upper_idx] * frac;
}

namespace {

void fill_bands(PercentileSeries& bands, size_t t, const std::vector<double>& trimmed) {
    bands.p10[t] = calculate_percentile(trimmed, 10.0);
    bands.p25[t] = calculate_percentile(trimmed, 25.0);
    bands.p50[t] = calculate_percentile(trimmed, 50.0);
    bands.p75[t] = calculate_percentile(trimmed, 75.0);
    bands.p90[t] = calculate_percentile(trimmed, 90.0);
}

bool is_cancelled(const BatchOptions& options) {
    return options.cancel != nullptr && options.cancel->load(std::memory_order_relaxed);
}

} // anonymous namespace

// ============================================================================
// Batch Implementation
// ============================================================================

BatchSummary run_batch(const SimulationInputs& inputs, uint32_t base_seed, size_t num_paths,
                       const BatchOptions& options) {
    if (num_paths == 0) {
        throw std::invalid_argument("Batch needs at least one path");
    }
    validate_inputs(inputs);

    auto start_time = std::chrono::high_resolution_clock::now();

    BatchSummary summary;
    summary.num_paths = num_paths;
    summary.base_seed = base_seed;
    if (inputs.return_mode == ReturnMode::TrulyRandom) {
        std::random_device rd;
        summary.base_seed = rd();
    }

    const std::vector<uint32_t> seeds = derive_path_seeds(summary.base_seed, num_paths);
    std::vector<PathResult> results(num_paths);

    const size_t interval = std::max<size_t>(1, options.progress_interval);
    size_t completed = 0;
    bool cancelled = false;
    std::exception_ptr first_error;

#ifdef HAVE_OPENMP
    // Each path writes only its own slot, so the output matches a serial run
    #pragma omp parallel for schedule(dynamic, 16)
    for (long i = 0; i < static_cast<long>(num_paths); ++i) {
        bool skip = false;
        #pragma omp critical(batch_state)
        {
            skip = cancelled || first_error != nullptr;
            if (!skip && is_cancelled(options)) {
                cancelled = true;
                skip = true;
            }
        }
        if (skip) continue;

        try {
            results[static_cast<size_t>(i)] = run_single_simulation(inputs, seeds[static_cast<size_t>(i)]);
        } catch (...) {
            #pragma omp critical(batch_state)
            {
                if (!first_error) first_error = std::current_exception();
            }
            continue;
        }

        #pragma omp critical(batch_progress)
        {
            ++completed;
            if (options.on_progress && (completed % interval == 0 || completed == num_paths)) {
                options.on_progress(completed, num_paths);
            }
        }
    }
#else
    for (size_t i = 0; i < num_paths; ++i) {
        if (is_cancelled(options)) {
            cancelled = true;
            break;
        }
        results[i] = run_single_simulation(inputs, seeds[i]);
        ++completed;
        if (options.on_progress && (completed % interval == 0 || completed == num_paths)) {
            options.on_progress(completed, num_paths);
        }
    }
#endif

    if (first_error) {
        std::rethrow_exception(first_error);
    }
    if (cancelled) {
        throw CancelledError("batch of " + std::to_string(num_paths) + " paths stopped after " +
                             std::to_string(completed));
    }

    // Aggregate per year index
    const size_t trim = trim_count(num_paths);
    const size_t horizon = results[0].balances_real.size();
    summary.real.resize(horizon);
    summary.nominal.resize(horizon);

    std::vector<double> column(num_paths);
    for (size_t t = 0; t < horizon; ++t) {
        for (size_t i = 0; i < num_paths; ++i) {
            column[i] = results[i].balances_real[t];
        }
        fill_bands(summary.real, t, trim_extremes(column, trim));

        for (size_t i = 0; i < num_paths; ++i) {
            column[i] = results[i].balances_nominal[t];
        }
        fill_bands(summary.nominal, t, trim_extremes(column, trim));
    }

    std::vector<double> eol(num_paths);
    std::vector<double> y1(num_paths);
    size_t ruined = 0;
    summary.all_runs.reserve(num_paths);

    for (size_t i = 0; i < num_paths; ++i) {
        const PathResult& r = results[i];
        eol[i] = r.eol_real;
        y1[i] = r.y1_after_tax_real;
        if (r.ruined) ++ruined;
        summary.all_runs.emplace_back(r.eol_real, r.y1_after_tax_real, r.ruined, r.survival_years);
    }

    std::vector<double> eol_sorted = trim_extremes(std::move(eol), trim);
    summary.eol_real_p25 = calculate_percentile(eol_sorted, 25.0);
    summary.eol_real_p50 = calculate_percentile(eol_sorted, 50.0);
    summary.eol_real_p75 = calculate_percentile(eol_sorted, 75.0);

    std::vector<double> y1_sorted = trim_extremes(std::move(y1), trim);
    summary.y1_after_tax_real_p25 = calculate_percentile(y1_sorted, 25.0);
    summary.y1_after_tax_real_p50 = calculate_percentile(y1_sorted, 50.0);
    summary.y1_after_tax_real_p75 = calculate_percentile(y1_sorted, 75.0);

    summary.prob_ruin = static_cast<double>(ruined) / static_cast<double>(num_paths);

    auto end_time = std::chrono::high_resolution_clock::now();
    summary.execution_time_ms = std::chrono::duration<double, std::milli>(
        end_time - start_time).count();

    return summary;
}

} // namespace retirecalc
