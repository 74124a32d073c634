#include "return_generator.hpp"
#include "market_data.hpp"
#include "io/csv_reader.hpp"
#include <algorithm>
#include <cmath>
#include <fstream>
#include <stdexcept>

namespace retirecalc {

// ============================================================================
// Mulberry32 Implementation
// ============================================================================

Mulberry32::Mulberry32(uint32_t seed) : state_(seed) {}

double Mulberry32::next() {
    state_ += 0x6D2B79F5u;
    uint32_t r = (state_ ^ (state_ >> 15)) * (1u | state_);
    r ^= r + (r ^ (r >> 7)) * (61u | r);
    return static_cast<double>(r ^ (r >> 14)) / 4294967296.0;
}

uint32_t derive_stream_seed(uint32_t path_seed, PathStream stream) {
    uint32_t z = path_seed + 0x9E3779B9u * (static_cast<uint32_t>(stream) + 1u);
    z = (z ^ (z >> 16)) * 0x85EBCA6Bu;
    z = (z ^ (z >> 13)) * 0xC2B2AE35u;
    return z ^ (z >> 16);
}

// ============================================================================
// Asset Allocation
// ============================================================================

double bond_allocation_pct(int age, const std::optional<BondGlidePath>& glide_path) {
    if (!glide_path) {
        return 0.0;
    }
    const BondGlidePath& path = *glide_path;

    switch (path.strategy) {
        case GlidePathStrategy::Aggressive:
            return 0.0;
        case GlidePathStrategy::AgeBased:
            // 10% floor before 40, linear to 60% at 60, capped after
            if (age < 40) return 10.0;
            if (age <= 60) return 10.0 + 50.0 * (age - 40) / 20.0;
            return 60.0;
        case GlidePathStrategy::Custom:
            break;
    }

    if (age < path.start_age) {
        return path.start_pct;
    }
    if (age >= path.end_age) {
        return path.end_pct;
    }

    double progress = static_cast<double>(age - path.start_age) /
                      static_cast<double>(path.end_age - path.start_age);
    switch (path.shape) {
        case GlidePathShape::Accelerated:
            progress = std::sqrt(progress);
            break;
        case GlidePathShape::Decelerated:
            progress = progress * progress;
            break;
        case GlidePathShape::Linear:
            break;
    }
    return path.start_pct + (path.end_pct - path.start_pct) * progress;
}

double bond_return_pct(double stock_return_pct) {
    return BOND_NOMINAL_AVG + (stock_return_pct - SP500_LONG_RUN_AVG) * 0.3;
}

double blended_return_pct(double stock_return_pct, double bond_return,
                          double bond_allocation) {
    double bond_share = bond_allocation / 100.0;
    return (1.0 - bond_share) * stock_return_pct + bond_share * bond_return;
}

// ============================================================================
// ReturnSeries / ReturnGeneratorParams
// ============================================================================

ReturnSeries::ReturnSeries() : first_year(SP500_FIRST_YEAR) {}

ReturnSeries::ReturnSeries(int first, std::vector<double> values)
    : first_year(first), returns_pct(std::move(values)) {}

ReturnGeneratorParams::ReturnGeneratorParams()
    : mode(ReturnMode::SeededRandom), years(0), nominal_pct(9.8), inflation_pct(2.6),
      series(WalkSeries::Nominal), seed(12345), start_year(SP500_FIRST_YEAR),
      start_age(35), data(nullptr) {}

// ============================================================================
// ReturnPath Implementation
// ============================================================================

ReturnPath::ReturnPath() = default;

ReturnPath::ReturnPath(std::vector<double> factors) : factors_(std::move(factors)) {}

double ReturnPath::factor(size_t year_index) const {
    if (year_index >= factors_.size()) {
        throw std::out_of_range("Return path index " + std::to_string(year_index) +
                                " beyond " + std::to_string(factors_.size()) + " years");
    }
    return factors_[year_index];
}

size_t ReturnPath::size() const {
    return factors_.size();
}

bool ReturnPath::empty() const {
    return factors_.empty();
}

namespace {

double stock_to_factor(double stock_pct, double bond_alloc, bool has_glide_path,
                       bool real_series, double inflation_factor) {
    double pct = has_glide_path
        ? blended_return_pct(stock_pct, bond_return_pct(stock_pct), bond_alloc)
        : stock_pct;
    double factor = 1.0 + pct / 100.0;
    return real_series ? factor / inflation_factor : factor;
}

} // anonymous namespace

ReturnPath ReturnPath::generate(const ReturnGeneratorParams& params) {
    std::vector<double> factors;
    factors.reserve(params.years);

    const bool has_glide_path = params.glide_path.has_value();
    std::vector<double> allocations(params.years, 0.0);
    if (has_glide_path) {
        for (size_t i = 0; i < params.years; ++i) {
            allocations[i] = bond_allocation_pct(params.start_age + static_cast<int>(i),
                                                 params.glide_path);
        }
    }

    if (params.mode == ReturnMode::Fixed) {
        for (size_t i = 0; i < params.years; ++i) {
            double pct = has_glide_path
                ? blended_return_pct(params.nominal_pct, BOND_NOMINAL_AVG, allocations[i])
                : params.nominal_pct;
            factors.push_back(1.0 + pct / 100.0);
        }
        return ReturnPath(std::move(factors));
    }

    int data_first_year = SP500_FIRST_YEAR;
    const std::vector<double>* data = &sp500_returns();
    if (params.data != nullptr) {
        data = &params.data->returns_pct;
        data_first_year = params.data->first_year;
    }
    if (data->empty()) {
        throw std::invalid_argument("Return series is empty");
    }

    const size_t length = data->size();
    const bool real_series = params.series == WalkSeries::Real;
    const double inflation_factor = 1.0 + params.inflation_pct / 100.0;

    if (params.mode == ReturnMode::HistoricalReplay) {
        long offset = static_cast<long>(params.start_year) - data_first_year;
        long len = static_cast<long>(length);
        size_t start = static_cast<size_t>(((offset % len) + len) % len);

        for (size_t i = 0; i < params.years; ++i) {
            double stock_pct = (*data)[(start + i) % length];
            factors.push_back(stock_to_factor(stock_pct, allocations[i], has_glide_path,
                                              real_series, inflation_factor));
        }
        return ReturnPath(std::move(factors));
    }

    Mulberry32 rng(params.seed);
    for (size_t i = 0; i < params.years; ++i) {
        size_t ix = static_cast<size_t>(std::floor(rng.next() * static_cast<double>(length)));
        ix = std::min(ix, length - 1);
        factors.push_back(stock_to_factor((*data)[ix], allocations[i], has_glide_path,
                                          real_series, inflation_factor));
    }
    return ReturnPath(std::move(factors));
}

// ============================================================================
// Custom Series Loading
// ============================================================================

ReturnSeries load_return_series_csv(const std::string& filepath) {
    std::ifstream file(filepath);
    if (!file) {
        throw std::runtime_error("Cannot open file: " + filepath);
    }
    return load_return_series_csv(file);
}

ReturnSeries load_return_series_csv(std::istream& is) {
    CsvReader reader(is);

    auto header = reader.read_row();
    if (header.size() < 2) {
        throw std::runtime_error("Return series CSV needs a year,return_pct header");
    }

    ReturnSeries series;
    int expected_year = 0;
    bool first = true;

    while (reader.has_more()) {
        auto row = reader.read_row();
        if (row.size() < 2) continue;

        int year = 0;
        double pct = 0.0;
        try {
            year = std::stoi(row[0]);
            pct = std::stod(row[1]);
        } catch (const std::exception&) {
            throw std::runtime_error("Malformed return row at line " +
                                     std::to_string(reader.line_number()) + ": " +
                                     row[0] + "," + row[1]);
        }

        if (first) {
            series.first_year = year;
            first = false;
        } else if (year != expected_year) {
            throw std::runtime_error("Return series must cover consecutive years; expected " +
                                     std::to_string(expected_year) + ", found " +
                                     std::to_string(year));
        }
        expected_year = year + 1;
        series.returns_pct.push_back(pct);
    }

    if (series.returns_pct.empty()) {
        throw std::runtime_error("Return series CSV has no data rows");
    }
    return series;
}

} // namespace retirecalc
