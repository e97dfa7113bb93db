// =============================================================================
// Triple Accel - Benchmark Entry Point
// =============================================================================

#define ANKERL_NANOBENCH_IMPLEMENT
#include "triple_accel/triple_accel.h"

#include <nanobench.h>

namespace triple_accel {
void benchMismatchKernels();
void benchLaneOps();
}  // namespace triple_accel

int main(int argc, char** argv) {
    (void)argc;
    (void)argv;

    auto init = triple_accel::initialize();
    if (!init) {
        return 1;
    }

    triple_accel::benchMismatchKernels();
    triple_accel::benchLaneOps();

    triple_accel::shutdown();
    return 0;
}
