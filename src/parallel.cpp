#include "parallel.hpp"

namespace gifpress {

void set_worker_threads(uint32_t count)
{
#ifdef _OPENMP
    if (count == 0) {
        count = static_cast<uint32_t>(omp_get_num_procs());
    }
    omp_set_num_threads(static_cast<int>(count));
#else
    (void)count;
#endif
}

uint32_t worker_threads()
{
#ifdef _OPENMP
    return static_cast<uint32_t>(omp_get_max_threads());
#else
    return 1;
#endif
}

} // namespace gifpress
