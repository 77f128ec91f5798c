// SPDX-License-Identifier: MIT
#include "tilgung/value/month.hpp"
#include "tilgung/support/tilgung_trace.h"
#include <cmath>

namespace tilgung {

namespace {

std::unexpected<ValidationError> reject(ValidationErrorCode code, double value) {
    TILGUNG_TRACE_VALIDATION_ERROR(MODULE_VALIDATION, static_cast<int>(code), value,
                                   static_cast<double>(kMaxLoanMonths));
    return std::unexpected(ValidationError(code, value));
}

}  // namespace

std::expected<MonthCount, ValidationError> MonthCount::create(int64_t months) noexcept {
    if (months < 1 || months > kMaxLoanMonths) {
        return reject(ValidationErrorCode::InvalidTerm, static_cast<double>(months));
    }
    return MonthCount(months);
}

std::expected<MonthCount, ValidationError> MonthCount::from_years(double years) noexcept {
    if (!std::isfinite(years) || years < 1.0 || years > static_cast<double>(kMaxLoanYears)) {
        return reject(ValidationErrorCode::InvalidTerm, years);
    }
    return create(std::llround(years * 12.0));
}

std::expected<MonthCount, ValidationError> MonthCount::add_months(int64_t months) const noexcept {
    return create(months_ + months);
}

std::expected<MonthCount, ValidationError>
MonthCount::subtract_months(int64_t months) const noexcept {
    return create(months_ - months);
}

std::expected<PaymentMonth, ValidationError> PaymentMonth::create(int64_t month) noexcept {
    if (month < 1 || month > kMaxLoanMonths) {
        return reject(ValidationErrorCode::InvalidPaymentMonth, static_cast<double>(month));
    }
    return PaymentMonth(month);
}

std::expected<PaymentMonth, ValidationError>
PaymentMonth::from_year_and_month(int64_t year, int64_t month_in_year) noexcept {
    if (year < 1 || year > kMaxLoanYears || month_in_year < 1 || month_in_year > 12) {
        return reject(ValidationErrorCode::InvalidPaymentMonth,
                      static_cast<double>(year) * 100.0 + static_cast<double>(month_in_year));
    }
    return create((year - 1) * 12 + month_in_year);
}

std::expected<PaymentMonth, ValidationError>
PaymentMonth::add_months(int64_t months) const noexcept {
    return create(month_ + months);
}

}  // namespace tilgung
