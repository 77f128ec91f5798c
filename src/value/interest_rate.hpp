// SPDX-License-Identifier: MIT
#pragma once

#include "tilgung/support/error_types.hpp"
#include <compare>
#include <expected>

namespace tilgung {

/// Annual nominal interest rate, held as a percentage in [0, 25]
class InterestRate {
public:
    static constexpr double kMinPercent = 0.0;
    static constexpr double kMaxPercent = 25.0;

    /// Create from an annual percentage (3.5 means 3.5%)
    static std::expected<InterestRate, ValidationError> create(double percent) noexcept;

    /// Create from an annual decimal fraction (0.035 means 3.5%)
    static std::expected<InterestRate, ValidationError> from_decimal(double decimal) noexcept;

    /// Create from a monthly decimal fraction
    static std::expected<InterestRate, ValidationError> from_monthly_rate(double monthly) noexcept;

    double percent() const noexcept { return percent_; }
    double to_decimal() const noexcept { return percent_ / 100.0; }

    /// Monthly rate used by the simulation (annual decimal / 12)
    double monthly_rate() const noexcept { return to_decimal() / 12.0; }

    bool is_zero() const noexcept { return percent_ == 0.0; }

    /// Shift by basis points (100 bp = 1 percentage point)
    std::expected<InterestRate, ValidationError> add_basis_points(double basis_points) const noexcept;

    auto operator<=>(const InterestRate&) const = default;

private:
    explicit InterestRate(double percent) noexcept : percent_(percent) {}

    double percent_;
};

}  // namespace tilgung
