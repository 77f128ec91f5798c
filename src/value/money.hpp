// SPDX-License-Identifier: MIT
/**
 * @file money.hpp
 * @brief Non-negative monetary amount stored as integer minor units
 */

#pragma once

#include "tilgung/support/error_types.hpp"
#include <compare>
#include <cstdint>
#include <expected>

namespace tilgung {

/**
 * @brief Non-negative euro amount in cents
 *
 * Constructed only through validating factories. Arithmetic returns a new
 * value or a ValidationError on overflow or negative result.
 */
class Money {
public:
    /// 999,999,999.00 EUR
    static constexpr int64_t kMaxCents = 99'999'999'900;

    /// Create from a count of cents
    static std::expected<Money, ValidationError> from_cents(int64_t cents) noexcept;

    /// Create from euros, rounded to the nearest cent
    static std::expected<Money, ValidationError> from_major(double amount) noexcept;

    static Money zero() noexcept { return Money(0); }
    static Money max() noexcept { return Money(kMaxCents); }

    int64_t cents() const noexcept { return cents_; }
    double to_major() const noexcept;
    bool is_zero() const noexcept { return cents_ == 0; }

    /// Sum, failing with ExceedsMaximum past kMaxCents
    std::expected<Money, ValidationError> add(Money other) const noexcept;

    /// Difference, failing with NegativeAmount when other > *this
    std::expected<Money, ValidationError> subtract(Money other) const noexcept;

    /// Scale by a finite non-negative factor, rounded to the nearest cent
    std::expected<Money, ValidationError> multiply(double factor) const noexcept;

    /// percent / 100 of this amount, percent within [0, 100]
    std::expected<Money, ValidationError> percentage_of(double percent) const noexcept;

    auto operator<=>(const Money&) const = default;

private:
    explicit Money(int64_t cents) noexcept : cents_(cents) {}

    int64_t cents_;
};

}  // namespace tilgung
