// SPDX-License-Identifier: MIT
#include "tilgung/value/money.hpp"
#include "tilgung/math/safe_math.hpp"
#include "tilgung/support/precision.hpp"
#include "tilgung/support/tilgung_trace.h"
#include <cmath>

namespace tilgung {

namespace {

std::unexpected<ValidationError> reject(ValidationErrorCode code, double value) {
    TILGUNG_TRACE_VALIDATION_ERROR(MODULE_VALIDATION, static_cast<int>(code), value, 0.0);
    return std::unexpected(ValidationError(code, value));
}

}  // namespace

std::expected<Money, ValidationError> Money::from_cents(int64_t cents) noexcept {
    if (cents < 0) {
        return reject(ValidationErrorCode::NegativeAmount, static_cast<double>(cents));
    }
    if (cents > kMaxCents) {
        return reject(ValidationErrorCode::ExceedsMaximum, static_cast<double>(cents));
    }
    return Money(cents);
}

std::expected<Money, ValidationError> Money::from_major(double amount) noexcept {
    if (!std::isfinite(amount)) {
        return reject(ValidationErrorCode::InvalidAmount, amount);
    }
    if (amount < 0.0) {
        return reject(ValidationErrorCode::NegativeAmount, amount);
    }

    // Range check before rounding so llround never sees an unrepresentable value
    double scaled = amount * static_cast<double>(kMinorUnitsPerMajor);
    if (scaled > static_cast<double>(kMaxCents) + 0.5) {
        return reject(ValidationErrorCode::ExceedsMaximum, amount);
    }
    return from_cents(std::llround(scaled));
}

double Money::to_major() const noexcept {
    return static_cast<double>(cents_) / static_cast<double>(kMinorUnitsPerMajor);
}

std::expected<Money, ValidationError> Money::add(Money other) const noexcept {
    auto sum = safe_add(cents_, other.cents_);
    if (!sum) {
        return reject(ValidationErrorCode::ExceedsMaximum, to_major());
    }
    return from_cents(*sum);
}

std::expected<Money, ValidationError> Money::subtract(Money other) const noexcept {
    if (other.cents_ > cents_) {
        return reject(ValidationErrorCode::NegativeAmount,
                      static_cast<double>(cents_ - other.cents_) /
                          static_cast<double>(kMinorUnitsPerMajor));
    }
    return Money(cents_ - other.cents_);
}

std::expected<Money, ValidationError> Money::multiply(double factor) const noexcept {
    if (!std::isfinite(factor)) {
        return reject(ValidationErrorCode::InvalidAmount, factor);
    }
    if (factor < 0.0) {
        return reject(ValidationErrorCode::NegativeAmount, factor);
    }
    return from_major(to_major() * factor);
}

std::expected<Money, ValidationError> Money::percentage_of(double percent) const noexcept {
    if (!std::isfinite(percent)) {
        return reject(ValidationErrorCode::InvalidPercentage, percent);
    }
    if (percent < 0.0 || percent > 100.0) {
        return reject(ValidationErrorCode::PercentageOutOfRange, percent);
    }
    return multiply(percent / 100.0);
}

}  // namespace tilgung
