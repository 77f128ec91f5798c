// SPDX-License-Identifier: MIT
#pragma once

#include "tilgung/support/tilgung_trace.h"
#include <cmath>
#include <concepts>
#include <cstddef>
#include <limits>
#include <optional>
#include <string>

namespace tilgung {

/// Configuration for the scalar root finder
struct RootFindingConfig {
    /// Maximum bisection iterations
    size_t max_iter = 50;

    /// Absolute tolerance on |f(x)|
    double tolerance = 0.01;

    /// Default bracket for annual interest rates (decimal)
    double lower_bound = 0.0001;
    double upper_bound = 0.30;
};

/// Result from a root-finding run
///
/// Provides convergence status, iteration count and diagnostic information.
struct RootFindingResult {
    /// Convergence status
    bool converged;

    /// Number of iterations performed
    size_t iterations;

    /// Final |f(x)| at the returned point
    double final_error;

    /// Optional failure diagnostic message
    std::optional<std::string> failure_reason;

    /// Root value when converged
    std::optional<double> root;
};

/// Concept for objective functions (scalar functions f: R -> R)
template<typename F>
concept ObjectiveFunction = requires(F f, double x) {
    { f(x) } -> std::convertible_to<double>;
};

/// Find the root of a monotonically increasing function by bisection
///
/// Bisection never diverges on a monotonic function, so it is used for the
/// annual-rate inversion of the annuity formula where iteration count is not
/// critical.
///
/// **Precondition:** f(a) <= 0 <= f(b)
///
/// @param f Increasing function to find the root of
/// @param a Left bracket
/// @param b Right bracket
/// @param config Root-finding configuration
/// @return Result with root (if converged) and convergence status
template<ObjectiveFunction F>
RootFindingResult bisection_find_root(F&& f, double a, double b,
                                      const RootFindingConfig& config) {
    double fa = f(a);
    double fb = f(b);

    TILGUNG_TRACE_BISECTION_START(a, b, config.tolerance, config.max_iter);

    if (!std::isfinite(fa) || !std::isfinite(fb)) {
        return RootFindingResult{
            .converged = false,
            .iterations = 0,
            .final_error = std::numeric_limits<double>::quiet_NaN(),
            .failure_reason = "Function returned non-finite value (NaN or Inf)",
            .root = std::nullopt
        };
    }

    // Target outside the achievable range of the bracket
    if (fa > 0.0 || fb < 0.0) {
        return RootFindingResult{
            .converged = false,
            .iterations = 0,
            .final_error = fa > 0.0 ? fa : -fb,
            .failure_reason = "Root not bracketed",
            .root = std::nullopt
        };
    }

    double lo = a;
    double hi = b;
    double mid = 0.5 * (lo + hi);
    double fmid = std::numeric_limits<double>::quiet_NaN();

    for (size_t iter = 0; iter < config.max_iter; ++iter) {
        mid = 0.5 * (lo + hi);
        fmid = f(mid);

        [[maybe_unused]] double interval_width = hi - lo;
        TILGUNG_TRACE_BISECTION_ITER(iter, mid, fmid, interval_width);
        TILGUNG_TRACE_CONVERGENCE_ITER(MODULE_RATE_SOLVER, 0, iter, std::abs(fmid),
                                       config.tolerance);

        if (std::abs(fmid) < config.tolerance) {
            TILGUNG_TRACE_BISECTION_COMPLETE(mid, iter + 1);
            TILGUNG_TRACE_CONVERGENCE_SUCCESS(MODULE_RATE_SOLVER, 0, iter + 1, std::abs(fmid));
            return RootFindingResult{
                .converged = true,
                .iterations = iter + 1,
                .final_error = std::abs(fmid),
                .failure_reason = std::nullopt,
                .root = mid
            };
        }

        if (fmid < 0.0) {
            lo = mid;
        } else {
            hi = mid;
        }
    }

    TILGUNG_TRACE_CONVERGENCE_FAILED(MODULE_RATE_SOLVER, 0, config.max_iter, std::abs(fmid));
    return RootFindingResult{
        .converged = false,
        .iterations = config.max_iter,
        .final_error = std::abs(fmid),
        .failure_reason = "Maximum iterations reached",
        .root = std::nullopt
    };
}

}  // namespace tilgung
