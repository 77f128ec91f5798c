// SPDX-License-Identifier: MIT
#pragma once

#include <cstdint>

namespace tilgung {

/// Minor units per major unit (cents per euro)
inline constexpr int64_t kMinorUnitsPerMajor = 100;

/// Numeric precision context for monetary calculations
///
/// Passed explicitly to every calculation that rounds or compares amounts,
/// so results are reproducible in isolation.
struct PrecisionConfig {
    /// Balances at or below this amount (major units) count as paid off
    double balance_epsilon = 0.01;

    /// Allowed deviation between a configured payment and the annuity formula
    double payment_tolerance = 1.0;

    /// Allowed deviation for zero-rate loans, where the payment is exact
    double zero_rate_payment_tolerance = 0.01;

    /// Allowed |principal + interest - total| in minor units
    int64_t decomposition_tolerance_minor = 1;
};

}  // namespace tilgung
