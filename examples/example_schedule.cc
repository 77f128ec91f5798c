// SPDX-License-Identifier: MIT
/**
 * @file example_schedule.cc
 * @brief Example: 30-year mortgage with yearly Sondertilgung
 */

#include "tilgung/amortization/amortization_engine.hpp"
#include "tilgung/analytics/sondertilgung_analytics.hpp"
#include "tilgung/loan/loan_calculations.hpp"
#include <iomanip>
#include <iostream>
#include <vector>

using namespace tilgung;

int main() {
    std::cout << "=== Mortgage with Sondertilgung Example ===\n\n";

    auto config = LoanConfiguration::from_input(LoanConfigurationInput{
        .amount = 300'000.0,
        .annual_rate = 3.5,
        .term_in_months = std::nullopt,
        .term_in_years = 30.0,
        .monthly_payment = 1'347.13
    });
    if (!config) {
        std::cout << "   ✗ Invalid loan: " << config.error() << "\n";
        return 1;
    }

    std::cout << std::fixed << std::setprecision(2);

    // 1. Plain annuity
    {
        std::cout << "1. Annuity loan:\n";
        auto payment = monthly_payment(*config);
        if (!payment) {
            std::cout << "   ✗ " << payment.error() << "\n";
            return 1;
        }
        std::cout << "   Monthly payment:   " << payment->total().to_major() << " EUR\n";
        std::cout << "   First interest:    " << payment->interest().to_major() << " EUR\n";
        std::cout << "   First principal:   " << payment->principal().to_major() << " EUR\n";
        std::cout << "   Initial repayment: " << initial_repayment_rate(*config) << " %\n\n";
    }

    // 2. 5% of the loan amount allowed per year, 5,000 EUR every December
    std::vector<ExtraPayment> payments;
    for (int64_t year = 1; year <= 10; ++year) {
        auto payment = ExtraPayment::create(year * 12, 5'000.0);
        if (!payment) {
            std::cout << "   ✗ " << payment.error() << "\n";
            return 1;
        }
        payments.push_back(*payment);
    }
    auto plan = ExtraPaymentPlan::create(*Percentage::create(5.0), payments);
    if (!plan) {
        std::cout << "   ✗ " << plan.error() << "\n";
        return 1;
    }

    {
        std::cout << "2. Schedule with ten yearly extra payments:\n";
        auto base = generate_schedule(*config);
        auto schedule = generate_schedule(*config, *plan);
        if (!base || !schedule) {
            std::cout << "   ✗ " << (base ? schedule.error() : base.error()) << "\n";
            return 1;
        }

        const auto& m = schedule->metrics();
        std::cout << "   Months:            " << m.actual_term.value()
                  << " (was " << base->size() << ")\n";
        std::cout << "   Total interest:    " << m.total_interest.to_major() << " EUR\n";
        std::cout << "   Interest saved:    " << m.interest_saved.to_major() << " EUR\n";
        std::cout << "   Payoff:            year " << m.payoff_date.year
                  << ", month " << m.payoff_date.month << "\n";

        auto comparison = compare_schedules(*base, *schedule);
        if (comparison) {
            std::cout << "   Return on extras:  " << comparison->return_on_investment << " %"
                      << (comparison->is_worthwhile ? " (worthwhile)" : "") << "\n";
        }

        auto first_year = first_year_summary(*schedule);
        if (first_year) {
            std::cout << "   Paid in year one:  " << first_year->total_paid.to_major()
                      << " EUR, balance " << first_year->ending_balance.to_major() << " EUR\n";
        }
        std::cout << "\n";
    }

    // 3. Rate exposure of a single payment
    {
        std::cout << "3. Sensitivity of 10,000 EUR in month 12:\n";
        auto sensitivity = interest_sensitivity(*config, *Money::from_major(10'000.0),
                                                *PaymentMonth::create(12));
        if (!sensitivity) {
            std::cout << "   ✗ " << sensitivity.error() << "\n";
            return 1;
        }
        std::cout << "   Saved at -1 point: " << sensitivity->low_rate_savings.to_major() << " EUR\n";
        std::cout << "   Saved at rate:     " << sensitivity->base_savings.to_major() << " EUR\n";
        std::cout << "   Saved at +1 point: " << sensitivity->high_rate_savings.to_major() << " EUR\n";
        std::cout << "   Sensitivity:       " << sensitivity->sensitivity << " %\n";
    }

    return 0;
}
