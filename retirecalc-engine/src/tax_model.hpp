#ifndef RETIRECALC_TAX_MODEL_HPP
#define RETIRECALC_TAX_MODEL_HPP

#include "simulation_inputs.hpp"
#include <vector>

namespace retirecalc {

// Rule set year for all bracket and threshold constants below
constexpr int TAX_YEAR = 2026;

// SECURE Act 2.0 required beginning age
constexpr int RMD_START_AGE = 73;

struct TaxBracket {
    double limit;   // upper bound of taxable income for this bracket
    double rate;
};

// Ordinary income brackets (after the standard deduction)
const std::vector<TaxBracket>& ordinary_brackets(FilingStatus status);
double standard_deduction(FilingStatus status);

// Upper limit of the bracket taxed at `rate`, or 0 if no bracket has that rate
double bracket_limit(FilingStatus status, double rate);

// Federal tax on ordinary income (gross, the standard deduction is applied here)
double calc_ordinary_tax(double income, FilingStatus status);

// Long-term capital gains tax; gains stack on top of `ordinary_income`
double calc_ltcg_tax(double capital_gain, FilingStatus status, double ordinary_income);

// Net investment income tax: 3.8% of min(investment income, MAGI over threshold)
double calc_niit(double investment_income, FilingStatus status, double modified_agi);

// Flat state income tax; rate in percent
double calc_state_tax(double taxable_income, double state_rate_pct);

// ----------------------------------------------------------------------------
// Required minimum distributions
// ----------------------------------------------------------------------------

// Uniform Lifetime Table divisor; 0 before RMD_START_AGE
double rmd_divisor(int age);
double calc_rmd(double pretax_balance, int age);

// ----------------------------------------------------------------------------
// Estate tax
// ----------------------------------------------------------------------------

struct EstateTaxPolicy {
    bool sunset;              // exemption reverts to the pre-2018 level
    double indexing_rate;     // annual exemption indexing from TAX_YEAR + 1

    EstateTaxPolicy();
};

double estate_tax_exemption(FilingStatus status, int year,
                            const EstateTaxPolicy& policy = EstateTaxPolicy());

// Tentative tax from the graduated 18%-40% schedule
double tentative_estate_tax(double amount);

// Tentative tax on the estate less the credit for the exemption amount
double calc_estate_tax(double estate, FilingStatus status, int year,
                       const EstateTaxPolicy& policy = EstateTaxPolicy());

// ----------------------------------------------------------------------------
// Employment taxes
// ----------------------------------------------------------------------------

double calc_payroll_tax(double wages);
double calc_self_employment_tax(double net_earnings);
double calc_employment_taxes(double income, EmploymentType type);

// ----------------------------------------------------------------------------
// Withdrawal taxation
// ----------------------------------------------------------------------------

// Taxes owed on one gross withdrawal, drawn pro rata across accounts
struct WithdrawalTax {
    double total;
    double ordinary;          // federal tax on pre-tax draws
    double capital_gains;     // federal LTCG tax on realized gains
    double niit;
    double state;

    double draw_taxable;
    double draw_pretax;
    double draw_roth;
    double realized_gain;     // capital gain realized by the taxable draw
    double new_basis;         // taxable account cost basis after the draw

    WithdrawalTax();
};

// Splits `gross` across the accounts by balance share; a shortfall in the taxable
// account cascades to pre-tax, then to Roth. Gains are realized in proportion to
// the unrealized gain share of the taxable account. `min_pretax_draw` (an RMD)
// is taken from the pre-tax account before the pro-rata split.
WithdrawalTax compute_withdrawal_taxes(double gross, FilingStatus status,
                                       double taxable_balance, double pretax_balance,
                                       double roth_balance, double taxable_basis,
                                       double state_rate_pct, double min_pretax_draw = 0.0);

} // namespace retirecalc

#endif // RETIRECALC_TAX_MODEL_HPP
