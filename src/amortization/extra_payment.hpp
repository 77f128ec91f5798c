// SPDX-License-Identifier: MIT
/**
 * @file extra_payment.hpp
 * @brief Sondertilgung (extra principal payment) values and plans
 *
 * A plan carries an informational yearly limit (percent of the loan amount,
 * or unlimited). The engine only aggregates per year; accepting or rejecting
 * a payment against bank rules is left to the caller's rules component.
 */

#pragma once

#include "tilgung/support/error_types.hpp"
#include "tilgung/value/money.hpp"
#include "tilgung/value/month.hpp"
#include "tilgung/value/percentage.hpp"
#include <cstdint>
#include <expected>
#include <map>
#include <optional>
#include <span>
#include <utility>
#include <vector>

namespace tilgung {

/// One scheduled additional principal payment
class ExtraPayment {
public:
    /// 1.00 EUR
    static constexpr int64_t kMinCents = 100;
    /// 1,000,000.00 EUR
    static constexpr int64_t kMaxCents = 100'000'000;

    /// Validates the amount against [kMinCents, kMaxCents]
    static std::expected<ExtraPayment, ValidationError>
    create(PaymentMonth month, Money amount) noexcept;

    /// Convenience factory from raw month number and euro amount
    static std::expected<ExtraPayment, ValidationError>
    create(int64_t month, double amount) noexcept;

    PaymentMonth month() const noexcept { return month_; }
    Money amount() const noexcept { return amount_; }

private:
    ExtraPayment(PaymentMonth month, Money amount) noexcept
        : month_(month), amount_(amount) {}

    PaymentMonth month_;
    Money amount_;
};

/// Merge two payments of the same month
std::expected<ExtraPayment, ValidationError>
combine(const ExtraPayment& a, const ExtraPayment& b);

/// Merge same-month payments and sort by month
std::expected<std::vector<ExtraPayment>, ValidationError>
group_by_month(std::span<const ExtraPayment> payments);

/// Payments falling into a loan year (1-based)
std::vector<ExtraPayment> filter_by_year(std::span<const ExtraPayment> payments, int64_t year);

/// Sum of payment amounts
std::expected<Money, ValidationError> total(std::span<const ExtraPayment> payments);

/// Per-year aggregate of a plan
struct YearlyPaymentSummary {
    int64_t year;
    Money total;
    size_t count;
    Money average;
};

/**
 * @brief Ordered set of extra payments with an informational yearly limit
 *
 * Payments are kept sorted by month with at most one payment per month.
 * All modifiers return a new plan.
 */
class ExtraPaymentPlan {
public:
    /// Percent of the loan amount per year, or nullopt for unlimited
    using YearlyLimit = std::optional<Percentage>;

    static std::expected<ExtraPaymentPlan, ValidationError>
    create(YearlyLimit yearly_limit, std::span<const ExtraPayment> payments);

    /// Unlimited plan without payments
    static ExtraPaymentPlan none() { return ExtraPaymentPlan(std::nullopt, {}); }

    const YearlyLimit& yearly_limit() const noexcept { return yearly_limit_; }
    bool is_unlimited() const noexcept { return !yearly_limit_.has_value(); }

    std::span<const ExtraPayment> payments() const noexcept { return payments_; }
    bool empty() const noexcept { return payments_.empty(); }

    /// Planned amount for a month, if any
    std::optional<Money> amount_for_month(PaymentMonth month) const;

    std::expected<Money, ValidationError> total() const;

    /// Totals keyed by loan year
    std::expected<std::map<int64_t, Money>, ValidationError> yearly_totals() const;

    /// Totals, counts and averages per loan year, ascending by year
    std::expected<std::vector<YearlyPaymentSummary>, ValidationError> yearly_summaries() const;

    /// Unused part of the yearly allowance, nullopt when unlimited
    std::expected<std::optional<Money>, ValidationError>
    remaining_yearly_limit(Money loan_amount, int64_t year) const;

    /// Whether payment fits into its year's allowance (informational)
    std::expected<bool, ValidationError>
    can_add_payment(Money loan_amount, const ExtraPayment& payment) const;

    /// Plan with payment added (merged into an existing same-month payment)
    std::expected<ExtraPaymentPlan, ValidationError> with_payment(const ExtraPayment& payment) const;

    /// Plan without the payment of a month
    ExtraPaymentPlan without_payment(PaymentMonth month) const;

private:
    ExtraPaymentPlan(YearlyLimit yearly_limit, std::vector<ExtraPayment> payments)
        : yearly_limit_(yearly_limit), payments_(std::move(payments)) {}

    YearlyLimit yearly_limit_;
    std::vector<ExtraPayment> payments_;
};

}  // namespace tilgung
