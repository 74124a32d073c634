#include "market_data.hpp"
#include <algorithm>
#include <array>
#include <stdexcept>
#include <string>

namespace retirecalc {

namespace {

constexpr double RETURN_CAP = 15.0;

constexpr std::array<double, SP500_LAST_YEAR - SP500_FIRST_YEAR + 1> SP500_RAW = {{
    43.81, -8.30, -25.12, -43.84, -8.64, 49.98, -1.19, 46.74, 31.94, 35.34,     // 1928-1937
    -35.34, 29.28, -1.10, -12.77, 19.17, 25.06, 19.03, 35.82, -8.43, 5.20,      // 1938-1947
    5.70, 18.30, 30.81, 23.68, 14.37, -1.21, 52.56, 31.24, 18.15, -0.73,        // 1948-1957
    23.68, 52.40, 31.74, 26.63, -8.81, 22.61, 16.42, 12.40, -10.06, 23.80,      // 1958-1967
    10.81, -8.24, -14.31, 3.56, 14.22, 18.76, -14.31, -25.90, 37.00, 23.83,     // 1968-1977
    -7.18, 6.56, 18.44, -4.70, 20.42, 22.34, 6.15, 31.24, 18.49, 5.81,          // 1978-1987
    16.54, 31.48, -3.06, 30.23, 7.49, 9.97, 1.33, 37.20, 22.68, 33.10,          // 1988-1997
    28.34, 20.89, -9.03, -11.85, -21.97, 28.36, 10.74, 4.83, 15.61, 5.48,       // 1998-2007
    -36.55, 25.94, 14.82, 2.10, 15.89, 32.15, 13.52, 1.36, 11.77, 21.61,        // 2008-2017
    -4.23, 31.21, 18.02, 28.47, -18.04, 26.06, 25.02                            // 2018-2024
}};

std::vector<double> build_series() {
    std::vector<double> series;
    series.reserve(SP500_RAW.size() * 2);

    for (double r : SP500_RAW) {
        series.push_back(std::max(-RETURN_CAP, std::min(RETURN_CAP, r)));
    }
    for (size_t i = 0; i < SP500_RAW.size(); ++i) {
        series.push_back(series[i] * 0.5);
    }
    return series;
}

} // anonymous namespace

const std::vector<double>& sp500_returns() {
    static const std::vector<double> series = build_series();
    return series;
}

double sp500_raw_return(int year) {
    if (year < SP500_FIRST_YEAR || year > SP500_LAST_YEAR) {
        throw std::out_of_range("No index return recorded for year " + std::to_string(year));
    }
    return SP500_RAW[static_cast<size_t>(year - SP500_FIRST_YEAR)];
}

} // namespace retirecalc
