// =============================================================================
// Triple Accel - Basic Usage Example
// =============================================================================

#include "triple_accel/triple_accel.h"

#include <cstdint>
#include <iostream>
#include <span>
#include <string_view>

int main() {
    // Initialize runtime
    triple_accel::RuntimeConfig config;
    config.enable_debug_output = true;

    auto init_result = triple_accel::initialize(config);
    if (!init_result) {
        std::cerr << "Failed to initialize: " << init_result.error().toString() << "\n";
        return 1;
    }

    // Print hardware info
    const auto& hw = triple_accel::getHardwareInfo();
    std::cout << hw.simdCapabilitySummary();
    std::cout << "Word kernels: " << triple_accel::activeSimdTarget() << " ("
              << triple_accel::wordStepLanes() << " lanes per step)\n";

    // Hamming distance through the checked entry point
    const std::string_view a = "ACGTACGTACGTACGTACGTACGTACGTACGTACGT";
    const std::string_view b = "ACGTACCTACGTACGTACGTAAGTACGTACGTACGA";
    auto as_bytes = [](std::string_view s) {
        return std::span<const uint8_t>(reinterpret_cast<const uint8_t*>(s.data()), s.size());
    };

    auto dist = triple_accel::hamming(as_bytes(a), as_bytes(b));
    if (!dist) {
        std::cerr << "hamming failed: " << dist.error().toString() << "\n";
        return 1;
    }
    std::cout << "Hamming distance: " << *dist << "\n";

    // One DP step on lane vectors: cheapest of three moves, longest path on ties
    const size_t len = 8;
    auto sub = triple_accel::LaneVector::repeating(5, len);
    auto a_gap = triple_accel::LaneVector::repeating(5, len);
    auto b_gap = triple_accel::LaneVector::repeating(6, len);
    auto sub_length = triple_accel::LaneVector::repeating(3, len);
    auto a_gap_length = triple_accel::LaneVector::repeating(7, len);
    auto b_gap_length = triple_accel::LaneVector::repeating(4, len);
    auto res_min = triple_accel::LaneVector::repeating(0, len);
    auto res_length = triple_accel::LaneVector::repeating(0, len);

    triple_accel::LaneVector::tripleMinLength(sub, a_gap, b_gap, sub_length, a_gap_length,
                                              b_gap_length, res_min, res_length);

    std::cout << "Min:    " << res_min.toString() << "\n";
    std::cout << "Length: " << res_length.toString() << "\n";

    // Shift the diagonal by one lane
    res_min.shiftRight1();
    res_min.insertFirstMax();
    std::cout << "Shifted: " << res_min.toString() << "\n";

    // Cleanup
    triple_accel::shutdown();

    return 0;
}
