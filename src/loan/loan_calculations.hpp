// SPDX-License-Identifier: MIT
/**
 * @file loan_calculations.hpp
 * @brief Loan algebra relating amount, rate, term and payment
 *
 * Pure functions over validated values. Failures are definitional: the
 * inputs admit no valid answer, so nothing here is retried.
 */

#pragma once

#include "tilgung/loan/loan_configuration.hpp"
#include "tilgung/loan/monthly_payment.hpp"
#include "tilgung/math/root_finding.hpp"
#include "tilgung/support/error_types.hpp"
#include <cstdint>
#include <expected>
#include <optional>
#include <span>
#include <vector>

namespace tilgung {

/// What-if adjustment applied to a base configuration
struct PaymentAdjustment {
    std::optional<double> amount_multiplier;   ///< Scales the loan amount
    std::optional<double> rate_adjustment;     ///< Percentage points added to the rate
    std::optional<int64_t> term_adjustment;    ///< Months added to the term
};

/// Exact (unrounded) level payment of a configuration in major units
std::expected<double, LoanError> annuity_payment(const LoanConfiguration& config);

/// Level payment with the first month's principal/interest split
///
/// P = L*c*(1+c)^n / ((1+c)^n - 1), or L/n at a zero rate.
std::expected<MonthlyPayment, LoanError> monthly_payment(const LoanConfiguration& config);

/// Same as monthly_payment() without requiring a consistent configuration
std::expected<MonthlyPayment, LoanError>
monthly_payment(Money amount, InterestRate annual_rate, MonthCount term);

/// Months needed to repay amount with a level payment, rounded up
///
/// Fails InsufficientPayment if the payment does not exceed the first
/// month's interest.
std::expected<MonthCount, LoanError>
loan_term(Money amount, InterestRate annual_rate, Money payment);

/// Annual rate at which payment repays amount over term (bisection)
std::expected<InterestRate, LoanError>
interest_rate(Money amount, Money payment, MonthCount term,
              const RootFindingConfig& config = {});

/// Lifetime interest: payment * term - amount, with the payment rounded to cents
std::expected<Money, LoanError> total_interest(const LoanConfiguration& config);

/// Lifetime interest of the unrounded level payment
///
/// The reference a schedule without extra payments reproduces to the cent.
std::expected<Money, LoanError> baseline_interest(const LoanConfiguration& config);

/// Outstanding balance after payments_made level payments
std::expected<Money, LoanError>
remaining_balance(const LoanConfiguration& config, int64_t payments_made);

/// Months until refinancing costs are recovered by a lower payment
std::expected<MonthCount, LoanError>
break_even_point(const LoanConfiguration& current, const LoanConfiguration& refinanced,
                 Money refinancing_costs);

/// Payments for a batch of adjusted configurations
///
/// Any invalid adjustment fails the whole batch with the lowest failing
/// index in LoanError::index.
std::expected<std::vector<MonthlyPayment>, LoanError>
payment_scenarios(const LoanConfiguration& base, std::span<const PaymentAdjustment> adjustments);

/// Initial yearly repayment rate ("anfaenglicher Tilgungssatz") in percent
///
/// ((12 * P - L * r) / L) * 100
double initial_repayment_rate(const LoanConfiguration& config);

}  // namespace tilgung
