// SPDX-License-Identifier: MIT
#pragma once

#include "tilgung/support/error_types.hpp"
#include <cstdint>
#include <expected>
#include <limits>

namespace tilgung {

/// Safely add two minor-unit amounts, detecting int64 overflow
///
/// @param a First operand
/// @param b Second operand
/// @return Sum if no overflow, OverflowError otherwise
[[nodiscard]] inline std::expected<int64_t, OverflowError>
safe_add(int64_t a, int64_t b) noexcept {
    int64_t sum = 0;
    if (__builtin_add_overflow(a, b, &sum)) {
        return std::unexpected(OverflowError{a, b});
    }
    return sum;
}

/// Safely multiply two minor-unit quantities, detecting overflow via __int128
///
/// @param a First operand
/// @param b Second operand
/// @return Product if no overflow, OverflowError otherwise
[[nodiscard]] inline std::expected<int64_t, OverflowError>
safe_multiply(int64_t a, int64_t b) noexcept {
    __int128 product = static_cast<__int128>(a) * static_cast<__int128>(b);

    if (product > std::numeric_limits<int64_t>::max() ||
        product < std::numeric_limits<int64_t>::min()) {
        return std::unexpected(OverflowError{a, b});
    }

    return static_cast<int64_t>(product);
}

/// Safely sum a range of minor-unit amounts
///
/// @tparam Container Range type with int64_t-convertible elements
/// @param values Container of values to add
/// @return Sum if no overflow, OverflowError otherwise
template <typename Container>
[[nodiscard]] std::expected<int64_t, OverflowError>
safe_sum(const Container& values) noexcept {
    int64_t acc = 0;
    for (const auto& v : values) {
        auto next = safe_add(acc, static_cast<int64_t>(v));
        if (!next) return next;
        acc = *next;
    }
    return acc;
}

} // namespace tilgung
