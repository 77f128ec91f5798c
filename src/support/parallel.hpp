// SPDX-License-Identifier: MIT
#pragma once

/**
 * @file parallel.hpp
 * @brief Parallelization macros for OpenMP and sequential execution
 *
 * Batch evaluations (payment scenarios, strategy comparison, sensitivity runs)
 * are independent computations over immutable inputs. These macros let them
 * run across threads when OpenMP is enabled and sequentially otherwise.
 *
 * Usage:
 *   TILGUNG_PRAGMA_PARALLEL_FOR
 *   for (size_t i = 0; i < n; ++i) { results[i] = evaluate(inputs[i]); }
 */

#if defined(_OPENMP)
    #define TILGUNG_PRAGMA_PARALLEL_FOR                 _Pragma("omp parallel for")
    #define TILGUNG_PRAGMA_PARALLEL_FOR_DYNAMIC         _Pragma("omp parallel for schedule(dynamic, 1)")
#else
    // Sequential execution (no parallelization)
    #define TILGUNG_PRAGMA_PARALLEL_FOR
    #define TILGUNG_PRAGMA_PARALLEL_FOR_DYNAMIC
#endif

/**
 * Design notes:
 *
 * 1. Loops annotated with these macros must write only to their own result
 *    slot. Errors are collected per slot and the lowest failing index is
 *    reported after the loop, so output never depends on thread timing.
 *
 * 2. _Pragma is used instead of #pragma because pragmas cannot appear in
 *    macro definitions otherwise.
 *
 * Available macros:
 * - TILGUNG_PRAGMA_PARALLEL_FOR: Parallelize a loop of uniform-cost items
 * - TILGUNG_PRAGMA_PARALLEL_FOR_DYNAMIC: Parallelize items of uneven cost
 *   (full schedule simulations of different lengths)
 */
