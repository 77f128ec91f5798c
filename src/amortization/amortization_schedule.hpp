// SPDX-License-Identifier: MIT
/**
 * @file amortization_schedule.hpp
 * @brief Month-by-month schedule entries, aggregate metrics and the schedule
 */

#pragma once

#include "tilgung/amortization/extra_payment.hpp"
#include "tilgung/loan/loan_configuration.hpp"
#include "tilgung/loan/monthly_payment.hpp"
#include "tilgung/support/error_types.hpp"
#include "tilgung/support/precision.hpp"
#include "tilgung/value/money.hpp"
#include "tilgung/value/month.hpp"
#include "tilgung/value/percentage.hpp"
#include <cstdint>
#include <expected>
#include <optional>
#include <span>
#include <utility>
#include <vector>

namespace tilgung {

/// One simulated month
struct AmortizationEntry {
    PaymentMonth month_number;
    Money starting_balance;
    MonthlyPayment regular_payment;        ///< Contractual instalment split for this month
    std::optional<Money> extra_payment;    ///< Applied Sondertilgung, capped at the balance
    Money total_payment_amount;            ///< Cash paid: principal + interest + extra
    Money ending_balance;
    Money cumulative_interest;
    Money cumulative_principal;            ///< Includes extra payments
    Percentage principal_percentage;       ///< Share of this month's cash that reduced principal
    MonthCount remaining_months;           ///< Contractual months left, at least 1
};

/// Calendar position of the final payment relative to loan start
struct PayoffDate {
    int64_t year;   ///< 1-based loan year
    int64_t month;  ///< 1..12 within that year
};

/// Aggregates over a completed schedule
struct ScheduleMetrics {
    Money total_interest;
    Money total_principal;           ///< Regular principal only
    Money total_extra_payments;
    Money total_payments;            ///< All cash paid
    MonthCount actual_term;
    Money interest_saved;            ///< Versus the same loan without extra payments
    int64_t term_reduction_months;
    double effective_interest_rate;  ///< Percent return on extra payments
    Money average_payment;
    Money largest_payment;
    Money smallest_payment;
    PayoffDate payoff_date;
};

/// Simulation settings
struct ScheduleConfig {
    /// Month ceiling as a multiple of the contractual term
    int64_t safety_term_multiplier = 2;

    /// Rounding and payoff thresholds
    PrecisionConfig precision{};
};

/**
 * @brief Complete schedule built atomically by generate_schedule()
 *
 * Never mutated. Applying more payments produces a new schedule.
 */
class AmortizationSchedule {
public:
    const LoanConfiguration& loan_configuration() const noexcept { return config_; }
    const std::optional<ExtraPaymentPlan>& extra_payment_plan() const noexcept { return plan_; }
    std::span<const AmortizationEntry> entries() const noexcept { return entries_; }
    const ScheduleMetrics& metrics() const noexcept { return metrics_; }

    size_t size() const noexcept { return entries_.size(); }
    const AmortizationEntry& back() const { return entries_.back(); }

private:
    friend std::expected<AmortizationSchedule, AmortizationError>
    generate_schedule(const LoanConfiguration& config,
                      const std::optional<ExtraPaymentPlan>& plan,
                      const ScheduleConfig& schedule_config);

    AmortizationSchedule(LoanConfiguration config,
                         std::optional<ExtraPaymentPlan> plan,
                         std::vector<AmortizationEntry> entries,
                         ScheduleMetrics metrics)
        : config_(config)
        , plan_(std::move(plan))
        , entries_(std::move(entries))
        , metrics_(metrics) {}

    LoanConfiguration config_;
    std::optional<ExtraPaymentPlan> plan_;
    std::vector<AmortizationEntry> entries_;
    ScheduleMetrics metrics_;
};

}  // namespace tilgung
