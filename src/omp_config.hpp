// omp_config.hpp - OpenMP switch and worker-count control
//
// The field kernels parallelise their outer loop with OpenMP when the
// compiler enables it. Without OpenMP the same code runs serially through
// the stand-ins below.

#pragma once

#if defined(_OPENMP)
#include <omp.h>
#define FDTD_OMP_ENABLED 1
#else
#define FDTD_OMP_ENABLED 0

inline int omp_get_max_threads() { return 1; }
inline void omp_set_num_threads(int) {}
#endif

// Apply a requested worker count (0 keeps the OpenMP runtime default)
inline int fdtd_configure_threads(int requested) {
    if (requested > 0) omp_set_num_threads(requested);
    return omp_get_max_threads();
}
