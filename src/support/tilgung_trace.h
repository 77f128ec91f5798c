// SPDX-License-Identifier: MIT
/**
 * @file tilgung_trace.h
 * @brief USDT (User Statically-Defined Tracing) probes for the tilgung library
 *
 * Zero-overhead tracing points that can be enabled at runtime with bpftrace,
 * systemtap or perf. With tracing disabled the probes compile to NOPs.
 *
 * Example usage with bpftrace:
 *   # Follow every simulated month of a schedule
 *   sudo bpftrace -e 'usdt:./lib*:tilgung:schedule_month { printf("%d %d\n", arg0, arg1); }'
 *
 *   # Watch the rate bisection converge
 *   sudo bpftrace -e 'usdt:./lib*:tilgung:bisection_iter { ... }'
 */

#ifndef TILGUNG_TRACE_H
#define TILGUNG_TRACE_H

#include <stddef.h>

/**
 * USDT Configuration
 *
 * On Linux with systemtap-sdt-dev installed, use sys/sdt.h
 * Otherwise, define no-op macros for compatibility
 */
#ifdef HAVE_SYSTEMTAP_SDT
#include <sys/sdt.h>
#else
// Fallback: define empty macros when SDT is not available
#define DTRACE_PROBE(provider, probe) do {} while(0)
#define DTRACE_PROBE1(provider, probe, arg1) do {} while(0)
#define DTRACE_PROBE2(provider, probe, arg1, arg2) do {} while(0)
#define DTRACE_PROBE3(provider, probe, arg1, arg2, arg3) do {} while(0)
#define DTRACE_PROBE4(provider, probe, arg1, arg2, arg3, arg4) do {} while(0)
#define DTRACE_PROBE5(provider, probe, arg1, arg2, arg3, arg4, arg5) do {} while(0)
#endif

/**
 * Provider name for all tilgung probes
 */
#define TILGUNG_PROVIDER tilgung

/**
 * Module identifiers for multi-module tracing
 * These are passed as the first parameter to many probes
 */
#define MODULE_LOAN_ALGEBRA     1
#define MODULE_RATE_SOLVER      2
#define MODULE_AMORTIZATION     3
#define MODULE_ANALYTICS        4
#define MODULE_VALIDATION       5
#define MODULE_BATCH            6

/**
 * ============================================================================
 * Algorithm Lifecycle Probes
 * ============================================================================
 */

/**
 * Fired when an algorithm begins execution
 * @param module_id: Module identifier (MODULE_* constant)
 * @param param1: Module-specific parameter (e.g., term, batch size)
 * @param param2: Module-specific parameter (e.g., amount, tolerance)
 * @param param3: Module-specific parameter
 */
#define TILGUNG_TRACE_ALGO_START(module_id, param1, param2, param3) \
    DTRACE_PROBE4(TILGUNG_PROVIDER, algo_start, module_id, param1, param2, param3)

/**
 * Fired periodically during algorithm execution to report progress
 * @param module_id: Module identifier
 * @param current: Current progress (e.g., month, batch item)
 * @param total: Total work
 * @param metric: Progress metric (e.g., running balance)
 */
#define TILGUNG_TRACE_ALGO_PROGRESS(module_id, current, total, metric) \
    DTRACE_PROBE4(TILGUNG_PROVIDER, algo_progress, module_id, current, total, metric)

/**
 * Fired when an algorithm completes successfully
 * @param module_id: Module identifier
 * @param iterations: Number of iterations/steps completed
 * @param final_metric: Final metric value
 */
#define TILGUNG_TRACE_ALGO_COMPLETE(module_id, iterations, final_metric) \
    DTRACE_PROBE3(TILGUNG_PROVIDER, algo_complete, module_id, iterations, final_metric)

/**
 * ============================================================================
 * Convergence Tracking Probes
 * ============================================================================
 */

/**
 * Fired on each iteration of a convergence loop
 * @param module_id: Module identifier
 * @param step: Outer step/stage number (0 if not applicable)
 * @param iter: Current iteration number
 * @param error: Current error metric
 * @param tolerance: Convergence threshold
 */
#define TILGUNG_TRACE_CONVERGENCE_ITER(module_id, step, iter, error, tolerance) \
    DTRACE_PROBE5(TILGUNG_PROVIDER, convergence_iter, module_id, step, iter, error, tolerance)

/**
 * Fired when convergence is achieved
 * @param module_id: Module identifier
 * @param step: Outer step/stage number (0 if not applicable)
 * @param final_iter: Number of iterations required
 * @param final_error: Final error achieved
 */
#define TILGUNG_TRACE_CONVERGENCE_SUCCESS(module_id, step, final_iter, final_error) \
    DTRACE_PROBE4(TILGUNG_PROVIDER, convergence_success, module_id, step, final_iter, final_error)

/**
 * Fired when convergence fails
 * @param module_id: Module identifier
 * @param step: Outer step/stage number (0 if not applicable)
 * @param max_iter: Maximum iterations attempted
 * @param final_error: Final error at failure
 */
#define TILGUNG_TRACE_CONVERGENCE_FAILED(module_id, step, max_iter, final_error) \
    DTRACE_PROBE4(TILGUNG_PROVIDER, convergence_failed, module_id, step, max_iter, final_error)

/**
 * ============================================================================
 * Validation and Error Probes
 * ============================================================================
 */

/**
 * Fired when input validation fails
 * @param module_id: Module identifier
 * @param error_code: Error code (module-specific)
 * @param param1: Relevant parameter value
 * @param param2: Relevant parameter value or threshold
 */
#define TILGUNG_TRACE_VALIDATION_ERROR(module_id, error_code, param1, param2) \
    DTRACE_PROBE4(TILGUNG_PROVIDER, validation_error, module_id, error_code, param1, param2)

/**
 * Fired when a runtime error occurs
 * @param module_id: Module identifier
 * @param error_code: Error code
 * @param context: Context value (e.g., month number, iteration)
 */
#define TILGUNG_TRACE_RUNTIME_ERROR(module_id, error_code, context) \
    DTRACE_PROBE3(TILGUNG_PROVIDER, runtime_error, module_id, error_code, context)

/**
 * ============================================================================
 * Amortization Schedule Probes
 * ============================================================================
 */

/**
 * Fired when schedule generation starts
 * @param term: Contractual term in months
 * @param amount: Loan amount in major units
 * @param n_extra: Number of planned extra payments
 */
#define TILGUNG_TRACE_SCHEDULE_START(term, amount, n_extra) \
    DTRACE_PROBE4(TILGUNG_PROVIDER, schedule_start, MODULE_AMORTIZATION, term, amount, n_extra)

/**
 * Fired for each simulated month
 * @param month: Month number (1-based)
 * @param balance: Ending balance after this month
 * @param interest: Interest charged this month
 */
#define TILGUNG_TRACE_SCHEDULE_MONTH(month, balance, interest) \
    DTRACE_PROBE3(TILGUNG_PROVIDER, schedule_month, month, balance, interest)

/**
 * Fired when an extra payment is applied
 * @param month: Month number
 * @param requested: Planned extra amount
 * @param applied: Amount applied after capping at the outstanding balance
 */
#define TILGUNG_TRACE_EXTRA_PAYMENT_APPLIED(month, requested, applied) \
    DTRACE_PROBE3(TILGUNG_PROVIDER, extra_payment_applied, month, requested, applied)

/**
 * Fired when schedule generation completes
 * @param months: Number of simulated months
 * @param total_interest: Total interest paid
 */
#define TILGUNG_TRACE_SCHEDULE_COMPLETE(months, total_interest) \
    TILGUNG_TRACE_ALGO_COMPLETE(MODULE_AMORTIZATION, months, total_interest)

/**
 * ============================================================================
 * Rate Bisection Probes
 * ============================================================================
 */

/**
 * Fired when the rate bisection starts
 * @param lo: Lower bracket
 * @param hi: Upper bracket
 * @param tolerance: Residual tolerance
 * @param max_iter: Maximum iterations
 */
#define TILGUNG_TRACE_BISECTION_START(lo, hi, tolerance, max_iter) \
    TILGUNG_TRACE_ALGO_START(MODULE_RATE_SOLVER, max_iter, tolerance, (hi - lo))

/**
 * Fired on each bisection iteration
 * @param iter: Iteration number
 * @param x: Midpoint
 * @param fx: Residual at midpoint
 * @param interval_width: Current bracket width
 */
#define TILGUNG_TRACE_BISECTION_ITER(iter, x, fx, interval_width) \
    DTRACE_PROBE4(TILGUNG_PROVIDER, bisection_iter, iter, x, fx, interval_width)

/**
 * Fired when the bisection completes
 * @param root: Root found
 * @param iterations: Iterations used
 */
#define TILGUNG_TRACE_BISECTION_COMPLETE(root, iterations) \
    TILGUNG_TRACE_ALGO_COMPLETE(MODULE_RATE_SOLVER, iterations, root)

#endif // TILGUNG_TRACE_H
