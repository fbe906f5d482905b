#pragma once

/**
 * @file parallel.hpp
 * @brief Parallelization macros for OpenMP or sequential execution
 *
 * Work in dvolkit is split along two independent axes: one unit per
 * (asset, snapshot hour) for DVOL, and one unit per asset for VoV. Neither
 * shares mutable state across units, so plain parallel-for loops suffice.
 *
 * Usage:
 *   DVOLKIT_PRAGMA_PARALLEL_FOR_DYNAMIC
 *   for (size_t i = 0; i < n; ++i) { ... }
 */

#if defined(_OPENMP)
    #include <omp.h>
    #define DVOLKIT_PRAGMA_PARALLEL_FOR_DYNAMIC         _Pragma("omp parallel for schedule(dynamic, 1)")
#else
    // Sequential execution (no parallelization)
    #define DVOLKIT_PRAGMA_PARALLEL_FOR_DYNAMIC
#endif

namespace dvolkit {

/// Number of threads a parallel region would use (1 without OpenMP)
inline int max_parallel_threads() {
#if defined(_OPENMP)
    return omp_get_max_threads();
#else
    return 1;
#endif
}

}  // namespace dvolkit
