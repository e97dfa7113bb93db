#pragma once

// =============================================================================
// Triple Accel - Aligned String Buffers
// =============================================================================
//
// Byte buffers that the kernels can read as 128-bit chunks: storage is aligned to
// at least kStringAlignment and padded to a multiple of it with zero bytes.
//

#include "triple_accel/common.h"

#include <hwy/aligned_allocator.h>

#include <cstddef>
#include <cstdint>
#include <span>

namespace triple_accel {

// Fixed-length zero-initialized byte string. Length is set at allocation; there
// is no growth operation.
class AlignedString : private NonCopyable {
  public:
    AlignedString() = default;
    ~AlignedString() = default;

    AlignedString(AlignedString&& other) noexcept;
    AlignedString& operator=(AlignedString&& other) noexcept;

    [[nodiscard]] size_t size() const { return len_; }
    [[nodiscard]] bool empty() const { return len_ == 0; }

    // Backed bytes, size() rounded up to kStringAlignment
    [[nodiscard]] size_t capacity() const { return alignUp(len_, kStringAlignment); }

    [[nodiscard]] uint8_t* data() { return storage_.get(); }
    [[nodiscard]] const uint8_t* data() const { return storage_.get(); }

    [[nodiscard]] uint8_t& operator[](size_t i) {
        TA_ASSERT(i < len_);
        return storage_[i];
    }
    [[nodiscard]] uint8_t operator[](size_t i) const {
        TA_ASSERT(i < len_);
        return storage_[i];
    }

    // Logical bytes
    [[nodiscard]] std::span<uint8_t> bytes() { return {storage_.get(), len_}; }
    [[nodiscard]] std::span<const uint8_t> bytes() const { return {storage_.get(), len_}; }

    // Logical bytes plus the zero padding
    [[nodiscard]] std::span<const uint8_t> paddedBytes() const {
        return {storage_.get(), capacity()};
    }

  private:
    friend AlignedString allocStr(size_t len);

    explicit AlignedString(size_t len);

    size_t len_ = 0;
    hwy::AlignedFreeUniquePtr<uint8_t[]> storage_;
};

// len zero bytes in 16-byte aligned, 16-byte padded storage
AlignedString allocStr(size_t len);

// Copy src into the prefix of dest. Terminates if src is longer than dest.
void fillStr(std::span<uint8_t> dest, std::span<const uint8_t> src);

}  // namespace triple_accel
