// SPDX-License-Identifier: MIT
/**
 * @file sondertilgung_analytics.hpp
 * @brief Impact, ranking and sensitivity of extra payment plans
 *
 * Every function runs the amortization engine on explicit inputs and reduces
 * the result. Batches (compare_strategies, interest_sensitivity) evaluate
 * their cases independently and in parallel when OpenMP is available.
 *
 * Usage:
 * @code
 * auto plan = ExtraPaymentPlan::create(std::nullopt, payments);
 * auto impact = sondertilgung_impact(config, *plan);
 * if (impact) {
 *     std::cout << impact->interest_saved.to_major() << "\n";
 * }
 * @endcode
 */

#pragma once

#include "tilgung/amortization/extra_payment.hpp"
#include "tilgung/loan/loan_configuration.hpp"
#include "tilgung/support/error_types.hpp"
#include "tilgung/value/money.hpp"
#include "tilgung/value/month.hpp"
#include <cstddef>
#include <cstdint>
#include <expected>
#include <span>
#include <vector>

namespace tilgung {

/// Effect of a plan relative to the same loan without extra payments
struct SondertilgungImpact {
    Money interest_saved;             ///< Clamped at zero
    Money original_total_interest;    ///< Loan algebra, no plan
    Money new_total_interest;         ///< Simulated with the plan
    MonthCount original_term;
    MonthCount new_term;
    int64_t term_reduction_months;
    Money total_extra_payments;       ///< Amounts actually applied
    double effective_interest_rate;   ///< Saved / extras * 100, 0 without extras
};

/// One ranked plan of compare_strategies()
struct StrategyResult {
    size_t plan_index;  ///< Position in the input span
    SondertilgungImpact impact;
};

/// Savings of a single extra payment at the rate -1 and +1 point
struct InterestSensitivity {
    Money low_rate_savings;    ///< At max(0.1, rate - 1)
    Money base_savings;
    Money high_rate_savings;   ///< At min(25, rate + 1)
    double sensitivity;        ///< (high - low) / (2 * base) * 100, 0 if base is 0
};

std::expected<SondertilgungImpact, AnalyticsError>
sondertilgung_impact(const LoanConfiguration& config, const ExtraPaymentPlan& plan);

/// Suggested extra payment: min(max_amount, scheduled balance before month)
///
/// Deliberately a cap, not an optimizer.
std::expected<Money, AnalyticsError>
optimal_extra_payment(const LoanConfiguration& config, PaymentMonth month, Money max_amount);

/// Impact of each plan, sorted by descending interest saved
///
/// Ties keep input order. The first failing plan is reported with its index.
std::expected<std::vector<StrategyResult>, AnalyticsError>
compare_strategies(const LoanConfiguration& config, std::span<const ExtraPaymentPlan> plans);

std::expected<InterestSensitivity, AnalyticsError>
interest_sensitivity(const LoanConfiguration& config, Money amount, PaymentMonth month);

/// Last simulated month with the plan applied
std::expected<PaymentMonth, AnalyticsError>
payoff_month(const LoanConfiguration& config, const ExtraPaymentPlan& plan);

}  // namespace tilgung
