// SPDX-License-Identifier: MIT
#include "tilgung/value/percentage.hpp"
#include "tilgung/support/tilgung_trace.h"
#include <cmath>

namespace tilgung {

std::expected<Percentage, ValidationError> Percentage::create(double percent) noexcept {
    if (!std::isfinite(percent)) {
        TILGUNG_TRACE_VALIDATION_ERROR(MODULE_VALIDATION,
            static_cast<int>(ValidationErrorCode::InvalidPercentage), percent, 100.0);
        return std::unexpected(ValidationError(ValidationErrorCode::InvalidPercentage, percent));
    }
    if (percent < 0.0 || percent > 100.0) {
        TILGUNG_TRACE_VALIDATION_ERROR(MODULE_VALIDATION,
            static_cast<int>(ValidationErrorCode::PercentageOutOfRange), percent, 100.0);
        return std::unexpected(ValidationError(ValidationErrorCode::PercentageOutOfRange, percent));
    }
    return Percentage(percent);
}

std::expected<Percentage, ValidationError> Percentage::from_decimal(double decimal) noexcept {
    return create(decimal * 100.0);
}

std::expected<Money, ValidationError> Percentage::of(Money amount) const noexcept {
    return amount.multiply(to_decimal());
}

}  // namespace tilgung
