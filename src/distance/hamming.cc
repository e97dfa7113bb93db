// =============================================================================
// Triple Accel - Hamming Distance Implementation
// =============================================================================

#include "triple_accel/hamming.h"

#include "triple_accel/triple_accel.h"

#include <fmt/format.h>
#include <spdlog/spdlog.h>

#include <limits>

namespace triple_accel {

Result<uint32_t> hamming(std::span<const uint8_t> a, std::span<const uint8_t> b) {
    if (a.size() != b.size()) {
        TA_RETURN_ERROR(ErrorCode::kShapeMismatch,
                        fmt::format("hamming of {} and {} byte inputs", a.size(), b.size()));
    }
    if (a.size() > std::numeric_limits<uint32_t>::max()) {
        TA_RETURN_ERROR(ErrorCode::kNumericalOverflow,
                        fmt::format("{} bytes exceed the 32-bit count", a.size()));
    }

    if (a.size() <= directKernelMaxLen()) {
        return LaneVector::mmCountMismatches(a.data(), b.data(), a.size());
    }

    spdlog::debug("hamming: batched kernel for {} bytes", a.size());
    return LaneVector::countMismatches(a.data(), b.data(), a.size());
}

Result<uint32_t> hammingVector(const LaneVector& a, std::span<const uint8_t> b) {
    if (b.size() < a.upperBound()) {
        TA_RETURN_ERROR(ErrorCode::kBufferTooSmall,
                        fmt::format("hammingVector needs {} bytes, got {}", a.upperBound(),
                                    b.size()));
    }
    return LaneVector::vectorCountMismatches(a, b.data());
}

}  // namespace triple_accel
