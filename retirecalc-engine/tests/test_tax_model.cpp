#include <catch2/catch_test_macros.hpp>
#include <catch2/catch_approx.hpp>
#include "tax_model.hpp"
#include <limits>

using namespace retirecalc;
using Catch::Approx;

// ============================================================================
// Federal Income Tax
// ============================================================================

TEST_CASE("Ordinary tax applies standard deduction and brackets", "[tax][ordinary]") {
    SECTION("Income below the deduction is untaxed") {
        REQUIRE(calc_ordinary_tax(16100.0, FilingStatus::Single) == 0.0);
        REQUIRE(calc_ordinary_tax(32200.0, FilingStatus::Married) == 0.0);
    }

    SECTION("Single filer spanning three brackets") {
        // 100000 taxable: 1240 + 4560 + 10912
        REQUIRE(calc_ordinary_tax(116100.0, FilingStatus::Single) == Approx(16712.0));
    }

    SECTION("Married brackets are twice as wide") {
        REQUIRE(calc_ordinary_tax(232200.0, FilingStatus::Married) ==
                Approx(2.0 * calc_ordinary_tax(116100.0, FilingStatus::Single)));
    }

    SECTION("Negative and non-finite income is untaxed") {
        REQUIRE(calc_ordinary_tax(-5000.0, FilingStatus::Single) == 0.0);
        REQUIRE(calc_ordinary_tax(std::numeric_limits<double>::quiet_NaN(),
                                  FilingStatus::Single) == 0.0);
    }
}

TEST_CASE("Bracket limits by rate", "[tax][ordinary]") {
    REQUIRE(bracket_limit(FilingStatus::Single, 0.24) == Approx(201775.0));
    REQUIRE(bracket_limit(FilingStatus::Married, 0.22) == Approx(211400.0));
    REQUIRE(bracket_limit(FilingStatus::Single, 0.25) == 0.0);
}

TEST_CASE("Long-term capital gains stack on ordinary income", "[tax][ltcg]") {
    SECTION("Gains inside the 0% band") {
        REQUIRE(calc_ltcg_tax(20000.0, FilingStatus::Single, 10000.0) == 0.0);
    }

    SECTION("Gains straddling the 0% and 15% bands") {
        // 4450 at 0%, 5550 at 15%
        REQUIRE(calc_ltcg_tax(10000.0, FilingStatus::Single, 45000.0) == Approx(832.5));
    }

    SECTION("Zero gain") {
        REQUIRE(calc_ltcg_tax(0.0, FilingStatus::Married, 500000.0) == 0.0);
    }
}

TEST_CASE("Net investment income tax", "[tax][niit]") {
    REQUIRE(calc_niit(50000.0, FilingStatus::Single, 150000.0) == 0.0);
    REQUIRE(calc_niit(50000.0, FilingStatus::Single, 220000.0) == Approx(20000.0 * 0.038));
    REQUIRE(calc_niit(10000.0, FilingStatus::Married, 400000.0) == Approx(10000.0 * 0.038));
}

TEST_CASE("State tax is a flat percentage", "[tax][state]") {
    REQUIRE(calc_state_tax(100000.0, 5.0) == Approx(5000.0));
    REQUIRE(calc_state_tax(-100.0, 5.0) == 0.0);
}

// ============================================================================
// RMDs
// ============================================================================

TEST_CASE("Required minimum distributions", "[tax][rmd]") {
    REQUIRE(rmd_divisor(72) == 0.0);
    REQUIRE(rmd_divisor(RMD_START_AGE) == Approx(26.5));
    REQUIRE(rmd_divisor(130) == Approx(2.0));

    REQUIRE(calc_rmd(265000.0, 73) == Approx(10000.0));
    REQUIRE(calc_rmd(265000.0, 70) == 0.0);
    REQUIRE(calc_rmd(0.0, 80) == 0.0);

    SECTION("Divisors shrink with age") {
        for (int age = RMD_START_AGE; age < 120; ++age) {
            REQUIRE(rmd_divisor(age + 1) < rmd_divisor(age));
        }
    }
}

// ============================================================================
// Estate Tax
// ============================================================================

TEST_CASE("Estate tax exemption", "[tax][estate]") {
    EstateTaxPolicy policy;

    REQUIRE(estate_tax_exemption(FilingStatus::Single, TAX_YEAR, policy) == Approx(13990000.0));
    REQUIRE(estate_tax_exemption(FilingStatus::Married, TAX_YEAR, policy) == Approx(27980000.0));
    REQUIRE(estate_tax_exemption(FilingStatus::Single, TAX_YEAR + 1, policy) ==
            Approx(13990000.0 * 1.026));

    SECTION("Sunset halves the exemption") {
        policy.sunset = true;
        REQUIRE(estate_tax_exemption(FilingStatus::Single, TAX_YEAR, policy) == Approx(7000000.0));
    }
}

TEST_CASE("Estate tax uses the graduated schedule", "[tax][estate]") {
    REQUIRE(tentative_estate_tax(1000000.0) == Approx(345800.0));
    REQUIRE(tentative_estate_tax(2000000.0) == Approx(745800.0));

    SECTION("Estates under the exemption owe nothing") {
        REQUIRE(calc_estate_tax(5000000.0, FilingStatus::Single, TAX_YEAR) == 0.0);
    }

    SECTION("Excess over the exemption is taxed at 40%") {
        REQUIRE(calc_estate_tax(15990000.0, FilingStatus::Single, TAX_YEAR) == Approx(800000.0));
    }

    SECTION("Strictly increasing above the exemption") {
        for (FilingStatus status : {FilingStatus::Single, FilingStatus::Married}) {
            double exemption = estate_tax_exemption(status, TAX_YEAR);
            REQUIRE(calc_estate_tax(exemption, status, TAX_YEAR) == 0.0);

            double previous = 0.0;
            for (double excess = 1000.0; excess <= 50.0e6; excess *= 2.0) {
                double tax = calc_estate_tax(exemption + excess, status, TAX_YEAR);
                REQUIRE(tax > previous);
                previous = tax;
            }
        }
    }
}

// ============================================================================
// Employment Taxes
// ============================================================================

TEST_CASE("Payroll and self-employment taxes", "[tax][employment]") {
    REQUIRE(calc_payroll_tax(100000.0) == Approx(7650.0));

    SECTION("Wage base cap and additional Medicare") {
        // 184500 * 6.2% + 250000 * 1.45% + 50000 * 0.9%
        REQUIRE(calc_payroll_tax(250000.0) == Approx(11439.0 + 3625.0 + 450.0));
    }

    SECTION("Self-employment on 92.35% of earnings") {
        REQUIRE(calc_self_employment_tax(100000.0) == Approx(92350.0 * 0.153));
    }

    SECTION("By employment type") {
        REQUIRE(calc_employment_taxes(100000.0, EmploymentType::W2) == Approx(7650.0));
        REQUIRE(calc_employment_taxes(100000.0, EmploymentType::Retired) == 0.0);
        REQUIRE(calc_employment_taxes(100000.0, EmploymentType::Both) ==
                Approx(calc_payroll_tax(50000.0) + calc_self_employment_tax(50000.0)));
    }
}

// ============================================================================
// Withdrawal Taxation
// ============================================================================

TEST_CASE("Withdrawal taxes split by account share", "[tax][withdrawal]") {
    WithdrawalTax tax = compute_withdrawal_taxes(100000.0, FilingStatus::Single,
                                                 500000.0, 500000.0, 0.0, 250000.0, 0.0);

    REQUIRE(tax.draw_taxable == Approx(50000.0));
    REQUIRE(tax.draw_pretax == Approx(50000.0));
    REQUIRE(tax.draw_roth == 0.0);

    // Half the taxable draw is gain
    REQUIRE(tax.new_basis == Approx(225000.0));
    REQUIRE(tax.realized_gain == Approx(25000.0));
    REQUIRE(tax.ordinary == Approx(3820.0));
    REQUIRE(tax.capital_gains == Approx(3750.0));
    REQUIRE(tax.niit == 0.0);
    REQUIRE(tax.total == Approx(7570.0));
}

TEST_CASE("Withdrawal taxes edge cases", "[tax][withdrawal]") {
    SECTION("Roth-only draws are untaxed") {
        WithdrawalTax tax = compute_withdrawal_taxes(40000.0, FilingStatus::Married,
                                                     0.0, 0.0, 400000.0, 0.0, 5.0);
        REQUIRE(tax.draw_roth == Approx(40000.0));
        REQUIRE(tax.total == 0.0);
    }

    SECTION("Shortfall cascades to the next account") {
        WithdrawalTax tax = compute_withdrawal_taxes(150000.0, FilingStatus::Single,
                                                     50000.0, 50000.0, 0.0, 50000.0, 0.0);
        REQUIRE(tax.draw_taxable == Approx(50000.0));
        REQUIRE(tax.draw_pretax == Approx(50000.0));
        REQUIRE(tax.draw_roth == 0.0);
    }

    SECTION("Empty accounts") {
        WithdrawalTax tax = compute_withdrawal_taxes(10000.0, FilingStatus::Single,
                                                     0.0, 0.0, 0.0, 0.0, 5.0);
        REQUIRE(tax.total == 0.0);
        REQUIRE(tax.draw_taxable == 0.0);
    }

    SECTION("Required pre-tax draw comes first") {
        // An RMD of 48000 inside a 60000 need; the other 12000 is split pro rata
        WithdrawalTax tax = compute_withdrawal_taxes(60000.0, FilingStatus::Single,
                                                     0.0, 1290000.0, 1290000.0, 0.0, 0.0,
                                                     48000.0);
        REQUIRE(tax.draw_pretax == Approx(48000.0 + 12000.0 * 1242000.0 / 2532000.0));
        REQUIRE(tax.draw_roth == Approx(12000.0 * 1290000.0 / 2532000.0));
        REQUIRE(tax.draw_pretax + tax.draw_roth == Approx(60000.0));
        REQUIRE(tax.ordinary == Approx(calc_ordinary_tax(tax.draw_pretax, FilingStatus::Single)));
        REQUIRE(tax.ordinary > compute_withdrawal_taxes(60000.0, FilingStatus::Single, 0.0,
                                                        1290000.0, 1290000.0, 0.0, 0.0).ordinary);
    }

    SECTION("Required draw is capped by the pre-tax balance") {
        WithdrawalTax tax = compute_withdrawal_taxes(30000.0, FilingStatus::Single,
                                                     0.0, 10000.0, 100000.0, 0.0, 0.0, 20000.0);
        REQUIRE(tax.draw_pretax == Approx(10000.0));
        REQUIRE(tax.draw_roth == Approx(20000.0));
    }

    SECTION("State tax on ordinary income and gains") {
        WithdrawalTax tax = compute_withdrawal_taxes(20000.0, FilingStatus::Single,
                                                     0.0, 100000.0, 0.0, 0.0, 5.0);
        REQUIRE(tax.state == Approx(1000.0));
    }
}
