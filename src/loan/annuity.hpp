// SPDX-License-Identifier: MIT
/**
 * @file annuity.hpp
 * @brief Closed-form annuity formulas on plain doubles
 *
 * L = loan amount, c = monthly rate, n = number of payments, F(x) = (1+c)^x.
 * Shared by configuration validation and the loan algebra.
 */

#pragma once

#include "tilgung/support/error_types.hpp"
#include <algorithm>
#include <cmath>
#include <cstdint>
#include <expected>

namespace tilgung {

/// Level payment P = L*c*F(n) / (F(n) - 1), or L/n when c == 0
inline std::expected<double, LoanError>
annuity_payment(double amount, double monthly_rate, int64_t n) noexcept {
    if (n <= 0) {
        return std::unexpected(LoanError{.code = LoanErrorCode::InvalidParameters,
                                         .value = static_cast<double>(n)});
    }
    if (monthly_rate == 0.0) {
        return amount / static_cast<double>(n);
    }

    double factor = std::pow(1.0 + monthly_rate, static_cast<double>(n));
    double denominator = factor - 1.0;
    if (denominator == 0.0 || !std::isfinite(factor)) {
        return std::unexpected(LoanError{.code = LoanErrorCode::MathematicalError,
                                         .value = denominator});
    }
    return amount * monthly_rate * factor / denominator;
}

/// Outstanding balance after k level payments: L*(F(n) - F(k)) / (F(n) - 1)
inline double annuity_balance(double amount, double monthly_rate, int64_t n, int64_t k) noexcept {
    if (k >= n) {
        return 0.0;
    }
    if (monthly_rate == 0.0) {
        double principal_per_month = amount / static_cast<double>(n);
        return std::max(0.0, amount - principal_per_month * static_cast<double>(k));
    }
    double fn = std::pow(1.0 + monthly_rate, static_cast<double>(n));
    double fk = std::pow(1.0 + monthly_rate, static_cast<double>(k));
    return std::max(0.0, amount * (fn - fk) / (fn - 1.0));
}

}  // namespace tilgung
