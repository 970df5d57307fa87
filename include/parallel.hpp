#pragma once

#include <cstdint>

// Per-frame loops are distributed over an OpenMP team when available.
// The region ends with an implicit barrier.
#ifdef _OPENMP
    #include <omp.h>
    #define GIFPRESS_PARALLEL_FOR _Pragma("omp parallel for schedule(dynamic)")
#else
    #define GIFPRESS_PARALLEL_FOR
#endif

namespace gifpress {

/**
 * Size the worker team used by per-frame stages
 * @param count Number of threads (0 = one per available core)
 */
void set_worker_threads(uint32_t count);

/**
 * Number of threads a parallel stage will use
 */
uint32_t worker_threads();

} // namespace gifpress
