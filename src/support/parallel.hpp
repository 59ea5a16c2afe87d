// SPDX-License-Identifier: MIT
#pragma once

/**
 * @file parallel.hpp
 * @brief Parallel-loop macros that compile to OpenMP pragmas or to nothing
 *
 * Usage:
 *   SASH_PRAGMA_PARALLEL_FOR_DYNAMIC
 *   for (size_t i = 0; i < n; ++i) { ... }
 *
 * Loop bodies must not touch shared mutable state. In this library they
 * only read the immutable CoefficientTable and write their own output slot.
 */

#if defined(_OPENMP)
    #define SASH_PRAGMA_PARALLEL_FOR_DYNAMIC  _Pragma("omp parallel for schedule(dynamic, 64)")
#else
    #define SASH_PRAGMA_PARALLEL_FOR_DYNAMIC
#endif
