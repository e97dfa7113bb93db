// =============================================================================
// Triple Accel - Aligned String Buffers Implementation
// =============================================================================

#include "triple_accel/string_buffer.h"

#include <spdlog/spdlog.h>

#include <cstring>
#include <utility>

namespace triple_accel {

static_assert(HWY_ALIGNMENT >= kStringAlignment, "Highway alignment below chunk size");

AlignedString::AlignedString(size_t len) : len_(len) {
    if (len_ == 0) {
        return;
    }

    const size_t padded = capacity();
    storage_ = hwy::AllocateAligned<uint8_t>(padded);
    TA_BOUNDS_CHECK(storage_ != nullptr);
    TA_ASSERT(isAligned(storage_.get(), kStringAlignment));
    std::memset(storage_.get(), 0, padded);

    spdlog::debug("allocStr: {} bytes ({} backed)", len_, padded);
}

AlignedString::AlignedString(AlignedString&& other) noexcept
    : len_(std::exchange(other.len_, 0)), storage_(std::move(other.storage_)) {}

AlignedString& AlignedString::operator=(AlignedString&& other) noexcept {
    if (this != &other) {
        len_ = std::exchange(other.len_, 0);
        storage_ = std::move(other.storage_);
    }
    return *this;
}

AlignedString allocStr(size_t len) {
    return AlignedString(len);
}

void fillStr(std::span<uint8_t> dest, std::span<const uint8_t> src) {
    TA_BOUNDS_CHECK(src.size() <= dest.size());
    if (!src.empty()) {
        std::memcpy(dest.data(), src.data(), src.size());
    }
}

}  // namespace triple_accel
