// SPDX-License-Identifier: MIT
/**
 * @file month.hpp
 * @brief Loan durations (MonthCount) and payment indices (PaymentMonth)
 *
 * Both are bounded to 1..480 months (40 years) but are distinct types:
 * a duration is not interchangeable with a 1-indexed point in a schedule.
 */

#pragma once

#include "tilgung/support/error_types.hpp"
#include <compare>
#include <cstdint>
#include <expected>

namespace tilgung {

inline constexpr int64_t kMaxLoanMonths = 480;
inline constexpr int64_t kMaxLoanYears = 40;

/// Loan duration in months
class MonthCount {
public:
    static std::expected<MonthCount, ValidationError> create(int64_t months) noexcept;

    /// Whole months from a duration in years (1..40), rounded to the nearest month
    static std::expected<MonthCount, ValidationError> from_years(double years) noexcept;

    int64_t value() const noexcept { return months_; }
    double to_years() const noexcept { return static_cast<double>(months_) / 12.0; }

    std::expected<MonthCount, ValidationError> add_months(int64_t months) const noexcept;
    std::expected<MonthCount, ValidationError> subtract_months(int64_t months) const noexcept;

    auto operator<=>(const MonthCount&) const = default;

private:
    explicit MonthCount(int64_t months) noexcept : months_(months) {}

    int64_t months_;
};

/// 1-indexed month within a loan schedule
class PaymentMonth {
public:
    static std::expected<PaymentMonth, ValidationError> create(int64_t month) noexcept;

    /// Month from a 1-based loan year and a month within that year (1..12)
    static std::expected<PaymentMonth, ValidationError>
    from_year_and_month(int64_t year, int64_t month_in_year) noexcept;

    int64_t value() const noexcept { return month_; }

    /// Loan year containing this month (months 1..12 are year 1)
    int64_t year() const noexcept { return (month_ + 11) / 12; }

    /// Position within the loan year (1..12)
    int64_t month_in_year() const noexcept { return ((month_ - 1) % 12) + 1; }

    bool is_first_year() const noexcept { return month_ <= 12; }

    std::expected<PaymentMonth, ValidationError> add_months(int64_t months) const noexcept;
    std::expected<PaymentMonth, ValidationError> next() const noexcept { return add_months(1); }

    auto operator<=>(const PaymentMonth&) const = default;

private:
    explicit PaymentMonth(int64_t month) noexcept : month_(month) {}

    int64_t month_;
};

}  // namespace tilgung
