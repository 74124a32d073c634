#ifndef RETIRECALC_RETURN_GENERATOR_HPP
#define RETIRECALC_RETURN_GENERATOR_HPP

#include "simulation_inputs.hpp"
#include <cstdint>
#include <istream>
#include <optional>
#include <string>
#include <vector>

namespace retirecalc {

// Mulberry32: small 32-bit seeded PRNG. The same seed always yields the same
// stream on every platform, which keeps seeded batches reproducible.
class Mulberry32 {
public:
    explicit Mulberry32(uint32_t seed);

    // Uniform draw in [0, 1)
    double next();

private:
    uint32_t state_;
};

// Independent sub-stream seeds within one path (accumulation, drawdown, LTC).
// Streams are a golden-ratio offset of the path seed passed through the
// murmur3 finalizer, so no path's stream coincides with another path's for
// seeds below one million.
enum class PathStream : uint32_t { Accumulation = 0, Drawdown = 1, LongTermCare = 2 };

uint32_t derive_stream_seed(uint32_t path_seed, PathStream stream);

// ============================================================================
// Asset allocation
// ============================================================================

// Bond allocation (0-100) at `age`; 0 when no glide path is configured
double bond_allocation_pct(int age, const std::optional<BondGlidePath>& glide_path);

// Bond return correlated with the stock return: 4.5 + (stock - 9.8) * 0.3
double bond_return_pct(double stock_return_pct);

double blended_return_pct(double stock_return_pct, double bond_return_pct,
                          double bond_allocation_pct);

// ============================================================================
// Return paths
// ============================================================================

// Annual return series in percent with the calendar year of its first entry
struct ReturnSeries {
    int first_year;
    std::vector<double> returns_pct;

    ReturnSeries();
    ReturnSeries(int first, std::vector<double> values);
};

struct ReturnGeneratorParams {
    ReturnMode mode;
    size_t years;
    double nominal_pct;                 // used by ReturnMode::Fixed
    double inflation_pct;               // deflates the real walk series
    WalkSeries series;
    uint32_t seed;
    int start_year;                     // first replayed year (historical mode)
    std::optional<BondGlidePath> glide_path;
    int start_age;                      // age in the first generated year
    const ReturnSeries* data;           // nullptr selects the built-in index

    ReturnGeneratorParams();
};

// ReturnPath: gross annual growth factors (1.07 for +7%) for one leg of a path
class ReturnPath {
public:
    ReturnPath();
    explicit ReturnPath(std::vector<double> factors);

    // Growth factor for a 0-based year index
    double factor(size_t year_index) const;
    size_t size() const;
    bool empty() const;

    const std::vector<double>& factors() const { return factors_; }

    // Fixed: expected return every year. HistoricalReplay: sequential from
    // start_year, wrapping at the end of the data. SeededRandom/TrulyRandom:
    // bootstrap draws from the data with Mulberry32(seed).
    static ReturnPath generate(const ReturnGeneratorParams& params);

private:
    std::vector<double> factors_;
};

// Load a custom annual return series from CSV with columns year,return_pct
// (header row required, rows must cover consecutive years)
ReturnSeries load_return_series_csv(const std::string& filepath);
ReturnSeries load_return_series_csv(std::istream& is);

} // namespace retirecalc

#endif // RETIRECALC_RETURN_GENERATOR_HPP
