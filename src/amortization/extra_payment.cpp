// SPDX-License-Identifier: MIT
#include "tilgung/amortization/extra_payment.hpp"
#include "tilgung/support/tilgung_trace.h"
#include <algorithm>
#include <iterator>
#include <utility>

namespace tilgung {

std::expected<ExtraPayment, ValidationError>
ExtraPayment::create(PaymentMonth month, Money amount) noexcept {
    if (amount.cents() < kMinCents || amount.cents() > kMaxCents) {
        TILGUNG_TRACE_VALIDATION_ERROR(MODULE_VALIDATION,
            static_cast<int>(ValidationErrorCode::InvalidExtraPayment),
            amount.to_major(), static_cast<double>(month.value()));
        return std::unexpected(ValidationError(ValidationErrorCode::InvalidExtraPayment,
                                               amount.to_major(),
                                               static_cast<size_t>(month.value())));
    }
    return ExtraPayment(month, amount);
}

std::expected<ExtraPayment, ValidationError>
ExtraPayment::create(int64_t month, double amount) noexcept {
    return PaymentMonth::create(month).and_then([amount](PaymentMonth payment_month) {
        return Money::from_major(amount).and_then([payment_month](Money money) {
            return create(payment_month, money);
        });
    });
}

std::expected<ExtraPayment, ValidationError>
combine(const ExtraPayment& a, const ExtraPayment& b) {
    if (a.month() != b.month()) {
        return std::unexpected(ValidationError(ValidationErrorCode::MonthMismatch,
                                               static_cast<double>(b.month().value()),
                                               static_cast<size_t>(a.month().value())));
    }
    return a.amount().add(b.amount()).and_then([month = a.month()](Money sum) {
        return ExtraPayment::create(month, sum);
    });
}

std::expected<std::vector<ExtraPayment>, ValidationError>
group_by_month(std::span<const ExtraPayment> payments) {
    std::vector<ExtraPayment> sorted(payments.begin(), payments.end());
    std::stable_sort(sorted.begin(), sorted.end(),
                     [](const ExtraPayment& a, const ExtraPayment& b) {
                         return a.month() < b.month();
                     });

    std::vector<ExtraPayment> grouped;
    grouped.reserve(sorted.size());
    for (const auto& payment : sorted) {
        if (!grouped.empty() && grouped.back().month() == payment.month()) {
            auto merged = combine(grouped.back(), payment);
            if (!merged) {
                return std::unexpected(merged.error());
            }
            grouped.back() = *merged;
        } else {
            grouped.push_back(payment);
        }
    }
    return grouped;
}

std::vector<ExtraPayment> filter_by_year(std::span<const ExtraPayment> payments, int64_t year) {
    std::vector<ExtraPayment> result;
    std::copy_if(payments.begin(), payments.end(), std::back_inserter(result),
                 [year](const ExtraPayment& p) { return p.month().year() == year; });
    return result;
}

std::expected<Money, ValidationError> total(std::span<const ExtraPayment> payments) {
    Money sum = Money::zero();
    for (const auto& payment : payments) {
        auto next = sum.add(payment.amount());
        if (!next) {
            return std::unexpected(next.error());
        }
        sum = *next;
    }
    return sum;
}

// ===========================================================================
// ExtraPaymentPlan
// ===========================================================================

std::expected<ExtraPaymentPlan, ValidationError>
ExtraPaymentPlan::create(YearlyLimit yearly_limit, std::span<const ExtraPayment> payments) {
    auto grouped = group_by_month(payments);
    if (!grouped) {
        return std::unexpected(grouped.error());
    }
    return ExtraPaymentPlan(yearly_limit, std::move(*grouped));
}

std::optional<Money> ExtraPaymentPlan::amount_for_month(PaymentMonth month) const {
    auto it = std::lower_bound(payments_.begin(), payments_.end(), month,
                               [](const ExtraPayment& p, PaymentMonth m) { return p.month() < m; });
    if (it == payments_.end() || it->month() != month) {
        return std::nullopt;
    }
    return it->amount();
}

std::expected<Money, ValidationError> ExtraPaymentPlan::total() const {
    return tilgung::total(payments_);
}

std::expected<std::map<int64_t, Money>, ValidationError> ExtraPaymentPlan::yearly_totals() const {
    std::map<int64_t, Money> totals;
    for (const auto& payment : payments_) {
        auto [it, inserted] = totals.try_emplace(payment.month().year(), Money::zero());
        auto next = it->second.add(payment.amount());
        if (!next) {
            return std::unexpected(next.error());
        }
        it->second = *next;
    }
    return totals;
}

std::expected<std::vector<YearlyPaymentSummary>, ValidationError>
ExtraPaymentPlan::yearly_summaries() const {
    std::vector<YearlyPaymentSummary> summaries;
    for (const auto& payment : payments_) {
        int64_t year = payment.month().year();
        if (summaries.empty() || summaries.back().year != year) {
            summaries.push_back(YearlyPaymentSummary{
                .year = year, .total = Money::zero(), .count = 0, .average = Money::zero()});
        }
        auto& summary = summaries.back();
        auto next = summary.total.add(payment.amount());
        if (!next) {
            return std::unexpected(next.error());
        }
        summary.total = *next;
        ++summary.count;
    }

    for (auto& summary : summaries) {
        auto average = summary.total.multiply(1.0 / static_cast<double>(summary.count));
        if (!average) {
            return std::unexpected(average.error());
        }
        summary.average = *average;
    }
    return summaries;
}

std::expected<std::optional<Money>, ValidationError>
ExtraPaymentPlan::remaining_yearly_limit(Money loan_amount, int64_t year) const {
    if (!yearly_limit_) {
        return std::optional<Money>{};
    }
    auto allowance = yearly_limit_->of(loan_amount);
    if (!allowance) {
        return std::unexpected(allowance.error());
    }
    auto used = tilgung::total(filter_by_year(payments_, year));
    if (!used) {
        return std::unexpected(used.error());
    }
    if (*used >= *allowance) {
        return std::optional<Money>{Money::zero()};
    }
    auto remaining = allowance->subtract(*used);
    if (!remaining) {
        return std::unexpected(remaining.error());
    }
    return std::optional<Money>{*remaining};
}

std::expected<bool, ValidationError>
ExtraPaymentPlan::can_add_payment(Money loan_amount, const ExtraPayment& payment) const {
    auto remaining = remaining_yearly_limit(loan_amount, payment.month().year());
    if (!remaining) {
        return std::unexpected(remaining.error());
    }
    if (!remaining->has_value()) {
        return true;
    }
    return payment.amount() <= **remaining;
}

std::expected<ExtraPaymentPlan, ValidationError>
ExtraPaymentPlan::with_payment(const ExtraPayment& payment) const {
    std::vector<ExtraPayment> extended = payments_;
    extended.push_back(payment);
    return create(yearly_limit_, extended);
}

ExtraPaymentPlan ExtraPaymentPlan::without_payment(PaymentMonth month) const {
    std::vector<ExtraPayment> kept;
    kept.reserve(payments_.size());
    std::copy_if(payments_.begin(), payments_.end(), std::back_inserter(kept),
                 [month](const ExtraPayment& p) { return p.month() != month; });
    return ExtraPaymentPlan(yearly_limit_, std::move(kept));
}

}  // namespace tilgung
