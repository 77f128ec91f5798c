// SPDX-License-Identifier: MIT
/**
 * @file amortization_engine.hpp
 * @brief Month-by-month loan simulation with Sondertilgung injection
 *
 * The contractual instalment is fixed once from the configuration and never
 * re-amortized. Extra payments only move the payoff date earlier and shrink
 * lifetime interest.
 *
 * Per month, starting from the loan amount:
 *   1. interest   = balance * monthly_rate
 *   2. principal  = min(payment - interest, balance)
 *   3. extra      = min(planned extra, balance - principal)
 *   4. balance   -= principal + extra
 * The loop ends when the balance drops to the precision epsilon, or fails
 * with SafetyLimitExceeded after safety_term_multiplier * term months.
 */

#pragma once

#include "tilgung/amortization/amortization_schedule.hpp"
#include "tilgung/amortization/extra_payment.hpp"
#include "tilgung/loan/loan_configuration.hpp"
#include "tilgung/support/error_types.hpp"
#include "tilgung/support/precision.hpp"
#include <cstdint>
#include <expected>
#include <optional>
#include <span>

namespace tilgung {

/// Simulate the loan to payoff and compute metrics
///
/// Any failed sub-construction stops the simulation. Partial schedules are
/// never returned.
std::expected<AmortizationSchedule, AmortizationError>
generate_schedule(const LoanConfiguration& config,
                  const std::optional<ExtraPaymentPlan>& plan = std::nullopt,
                  const ScheduleConfig& schedule_config = {});

/// Second-pass metrics over completed entries
///
/// Interest saved is measured against baseline_interest() of the same
/// configuration without extra payments.
std::expected<ScheduleMetrics, AmortizationError>
calculate_metrics(const LoanConfiguration& config, std::span<const AmortizationEntry> entries);

/// Regenerate a schedule's loan with a different plan
std::expected<AmortizationSchedule, AmortizationError>
apply_extra_payments(const AmortizationSchedule& schedule, const ExtraPaymentPlan& plan,
                     const ScheduleConfig& schedule_config = {});

/// Savings of one schedule relative to another
struct ScheduleComparison {
    Money interest_savings;          ///< Clamped at zero
    int64_t term_reduction_months;   ///< Clamped at zero
    Money total_extra_payments;      ///< Of the compared schedule
    double return_on_investment;     ///< Percent of extra payments, 0 without extras
    bool is_worthwhile;              ///< Savings > 0 and return above 2%
};

std::expected<ScheduleComparison, AmortizationError>
compare_schedules(const AmortizationSchedule& base, const AmortizationSchedule& comparison);

/// Entry of a given month, EntryNotFound past payoff
std::expected<AmortizationEntry, AmortizationError>
schedule_entry(const AmortizationSchedule& schedule, PaymentMonth month);

/// Ending balance after a month, zero once the loan is paid off
Money remaining_balance_at(const AmortizationSchedule& schedule, PaymentMonth month);

/// Read-only projection over the first twelve months
struct FirstYearSummary {
    size_t months;              ///< Fewer than 12 if paid off early
    Money total_paid;
    Money interest_paid;
    Money principal_paid;       ///< Regular principal only
    Money extra_paid;
    Money ending_balance;
};

std::expected<FirstYearSummary, AmortizationError>
first_year_summary(const AmortizationSchedule& schedule);

}  // namespace tilgung
