// SPDX-License-Identifier: MIT
#pragma once

#include "tilgung/support/error_types.hpp"
#include "tilgung/support/precision.hpp"
#include "tilgung/value/money.hpp"
#include <expected>

namespace tilgung {

/// One instalment split into principal and interest
///
/// Invariant: principal + interest == total within one minor unit.
class MonthlyPayment {
public:
    /// Build from a split, deriving the total
    static std::expected<MonthlyPayment, ValidationError>
    from_split(Money principal, Money interest) noexcept;

    /// Build from all three parts, checking the decomposition
    static std::expected<MonthlyPayment, ValidationError>
    create(Money principal, Money interest, Money total,
           const PrecisionConfig& precision = {}) noexcept;

    Money principal() const noexcept { return principal_; }
    Money interest() const noexcept { return interest_; }
    Money total() const noexcept { return total_; }

private:
    MonthlyPayment(Money principal, Money interest, Money total) noexcept
        : principal_(principal), interest_(interest), total_(total) {}

    Money principal_;
    Money interest_;
    Money total_;
};

inline std::expected<MonthlyPayment, ValidationError>
MonthlyPayment::from_split(Money principal, Money interest) noexcept {
    return principal.add(interest).transform([principal, interest](Money total) {
        return MonthlyPayment(principal, interest, total);
    });
}

inline std::expected<MonthlyPayment, ValidationError>
MonthlyPayment::create(Money principal, Money interest, Money total,
                       const PrecisionConfig& precision) noexcept {
    int64_t diff = principal.cents() + interest.cents() - total.cents();
    if (diff > precision.decomposition_tolerance_minor ||
        diff < -precision.decomposition_tolerance_minor) {
        return std::unexpected(ValidationError(ValidationErrorCode::InvalidDecomposition,
                                               static_cast<double>(diff)));
    }
    return MonthlyPayment(principal, interest, total);
}

}  // namespace tilgung
