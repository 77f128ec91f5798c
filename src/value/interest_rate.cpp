// SPDX-License-Identifier: MIT
#include "tilgung/value/interest_rate.hpp"
#include "tilgung/support/tilgung_trace.h"
#include <cmath>

namespace tilgung {

std::expected<InterestRate, ValidationError> InterestRate::create(double percent) noexcept {
    if (!std::isfinite(percent) || percent < kMinPercent || percent > kMaxPercent) {
        TILGUNG_TRACE_VALIDATION_ERROR(MODULE_VALIDATION,
            static_cast<int>(ValidationErrorCode::InvalidInterestRate), percent, kMaxPercent);
        return std::unexpected(ValidationError(ValidationErrorCode::InvalidInterestRate, percent));
    }
    return InterestRate(percent);
}

std::expected<InterestRate, ValidationError> InterestRate::from_decimal(double decimal) noexcept {
    return create(decimal * 100.0);
}

std::expected<InterestRate, ValidationError> InterestRate::from_monthly_rate(double monthly) noexcept {
    return from_decimal(monthly * 12.0);
}

std::expected<InterestRate, ValidationError>
InterestRate::add_basis_points(double basis_points) const noexcept {
    return create(percent_ + basis_points / 100.0);
}

}  // namespace tilgung
