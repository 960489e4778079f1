#pragma once

#include <cstdint>

#include <omp.h>

// One "dispatch": fn(i) for every i in [0, n). Returns after all iterations
// finished, so the next kernel sees every write of this one.
template <class Fn>
inline void parallelFor(int n, const Fn& fn) {
    if (n <= 0) return;
#pragma omp parallel for schedule(static)
    for (int i = 0; i < n; ++i) {
        fn(i);
    }
}

inline int parallelWorkerCount() {
    return omp_get_max_threads();
}
