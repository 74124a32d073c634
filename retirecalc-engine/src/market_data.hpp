#ifndef RETIRECALC_MARKET_DATA_HPP
#define RETIRECALC_MARKET_DATA_HPP

#include <vector>

namespace retirecalc {

// First and last calendar year of the built-in S&P 500 total return history
constexpr int SP500_FIRST_YEAR = 1928;
constexpr int SP500_LAST_YEAR = 2024;

// Long-run average nominal return of the index and of a bond sleeve, in percent
constexpr double SP500_LONG_RUN_AVG = 9.8;
constexpr double BOND_NOMINAL_AVG = 4.5;

// Annual total returns in percent, 1928-2024, each capped at +/-15%, followed by
// the same years at half magnitude. Historical replay indexes the first
// (SP500_LAST_YEAR - SP500_FIRST_YEAR + 1) entries by calendar year and wraps
// into the damped half.
const std::vector<double>& sp500_returns();

// Raw (uncapped) annual total return for a calendar year in the history
double sp500_raw_return(int year);

} // namespace retirecalc

#endif // RETIRECALC_MARKET_DATA_HPP
