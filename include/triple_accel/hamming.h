#pragma once

// =============================================================================
// Triple Accel - Hamming Distance
// =============================================================================
//
// Checked entry points over the mismatch kernels in LaneVector. Short inputs use
// the direct popcount kernel; inputs longer than
// RuntimeConfig::direct_kernel_max_len use the batched kernel.
//

#include "triple_accel/error.h"
#include "triple_accel/lane_vector.h"

#include <cstdint>
#include <span>

namespace triple_accel {

// Number of positions where a and b differ.
// kShapeMismatch if the lengths differ, kNumericalOverflow if they exceed UINT32_MAX.
Result<uint32_t> hamming(std::span<const uint8_t> a, std::span<const uint8_t> b);

// Mismatches between every backed lane of a and the first a.upperBound() bytes of b.
// kBufferTooSmall if b is shorter than a.upperBound().
Result<uint32_t> hammingVector(const LaneVector& a, std::span<const uint8_t> b);

}  // namespace triple_accel
