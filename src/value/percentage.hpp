// SPDX-License-Identifier: MIT
#pragma once

#include "tilgung/support/error_types.hpp"
#include "tilgung/value/money.hpp"
#include <compare>
#include <expected>

namespace tilgung {

/// Percentage in [0, 100]
class Percentage {
public:
    static std::expected<Percentage, ValidationError> create(double percent) noexcept;
    static std::expected<Percentage, ValidationError> from_decimal(double decimal) noexcept;

    double value() const noexcept { return percent_; }
    double to_decimal() const noexcept { return percent_ / 100.0; }

    /// This share of an amount, rounded to the nearest cent
    std::expected<Money, ValidationError> of(Money amount) const noexcept;

    auto operator<=>(const Percentage&) const = default;

private:
    explicit Percentage(double percent) noexcept : percent_(percent) {}

    double percent_;
};

}  // namespace tilgung
