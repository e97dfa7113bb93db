#pragma once

// =============================================================================
// Triple Accel - LaneVector (N x 32 x 8)
// =============================================================================
//
// The Jewel backend: `len` signed/unsigned byte lanes stored as ceil(len / 32)
// 32-byte words in one Highway aligned allocation. Each word is one 256-bit
// register on AVX2; the kernels behind it are dispatched at runtime, so the same
// object runs the portable kernels on CPUs without wide vectors.
//
// Lanes past `len` in the last word are real storage. Broadcast construction
// fills them, loadu zeroes them, in-place operations may change them. Code that
// walks every backed lane must use upperBound(), not size().
//
// Two tiers of access:
// - Hot path: raw pointers and in-place operations. Preconditions (equal word
//   counts, indices below upperBound(), long enough buffers) are asserted in
//   debug builds only.
// - Checked: span overloads, at(), set() and checkSameShape() return Result.
//
// Copies are explicit (clone()); vectors move freely.
//

#include "triple_accel/common.h"
#include "triple_accel/error.h"

#include <hwy/aligned_allocator.h>

#include <cstddef>
#include <cstdint>
#include <span>
#include <string>

namespace triple_accel {

class LaneVector : private NonCopyable {
  public:
    // Empty vector: zero words
    LaneVector() = default;
    ~LaneVector() = default;

    LaneVector(LaneVector&& other) noexcept;
    LaneVector& operator=(LaneVector&& other) noexcept;

    // =========================================================================
    // Construction
    // =========================================================================

    // Broadcast (uint8_t)val into every lane of every word, tail included
    static LaneVector repeating(uint32_t val, size_t len);

    // Broadcast kLaneMax into every lane of every word
    static LaneVector repeatingMax(size_t len);

    // Unaligned load of len bytes; tail lanes of the last word are zero.
    // Reads exactly len bytes from ptr.
    static LaneVector loadu(const uint8_t* ptr, size_t len);

    // Checked load: kBufferTooSmall if src holds fewer than len bytes
    static Result<LaneVector> loadu(std::span<const uint8_t> src, size_t len);

    // Explicit deep copy
    [[nodiscard]] LaneVector clone() const;

    // =========================================================================
    // Properties
    // =========================================================================

    // Logical length given at construction
    [[nodiscard]] size_t size() const { return len_; }
    [[nodiscard]] bool empty() const { return words_ == 0; }

    [[nodiscard]] size_t wordCount() const { return words_; }

    // Physically backed lanes, wordCount() * 32
    [[nodiscard]] size_t upperBound() const { return words_ << kWordShift; }

    // Every backed lane, upperBound() bytes
    [[nodiscard]] std::span<const uint8_t> lanes() const {
        return std::span<const uint8_t>(storage_.get(), upperBound());
    }

    // =========================================================================
    // In-Place Reload
    // =========================================================================

    // Lane idx + i (idx - i when reverse) = ptr[i] for i < len
    void slowLoadu(size_t idx, const uint8_t* ptr, size_t len, bool reverse);

    // Reload every word from ptr; ptr must hold upperBound() bytes
    void fastLoadu(const uint8_t* ptr);

    // Checked reload: kBufferTooSmall if src holds fewer than upperBound() bytes
    Result<void> fastLoadu(std::span<const uint8_t> src);

    // =========================================================================
    // In-Place Arithmetic and Logic
    // =========================================================================

    // Wrapping lane-wise addition
    void add(const LaneVector& o);

    // Signed saturating addition
    void adds(const LaneVector& o);

    // *this = o - *this, lane-wise
    void negAdd(const LaneVector& o);

    void bitAnd(const LaneVector& o);

    // *this is the mask: lanes whose mask byte has the high bit set take b,
    // the others take a
    void blendv(const LaneVector& a, const LaneVector& b);

    // =========================================================================
    // Cross-Word Shifts
    // =========================================================================

    // Lane i takes lane i + 1 across word boundaries; the last backed lane becomes 0
    void shiftLeft1();

    // Lane i takes lane i - 1 across word boundaries; lane 0 becomes 0
    void shiftRight1();

    // =========================================================================
    // Scalar Access (unchecked)
    // =========================================================================

    [[nodiscard]] uint32_t extract(size_t i) const;
    void insert(size_t i, uint32_t val);

    // Last, second to last and third to last backed lanes (lanes 31, 30 and 29
    // of the last word)
    void insertLast0(uint32_t val);
    void insertLast1(uint32_t val);
    void insertLast2(uint32_t val);
    void insertLastMax();

    void insertFirst(uint32_t val);
    void insertFirstMax();

    // =========================================================================
    // Checked Access
    // =========================================================================

    [[nodiscard]] Result<uint32_t> at(size_t i) const;
    Result<void> set(size_t i, uint32_t val);

    // kShapeMismatch unless both vectors have the same word count
    [[nodiscard]] Result<void> checkSameShape(const LaneVector& o) const;

    // =========================================================================
    // Mismatch Counting
    // =========================================================================
    //
    // Number of byte positions where two sequences differ. The raw buffers need
    // not be aligned.

    // Mask popcount per word. Fastest for short inputs; the 32-bit accumulator is
    // not protected against overflow.
    static uint32_t mmCountMismatches(const uint8_t* a_ptr, const uint8_t* b_ptr, size_t len);

    // Batched 8-bit counters, folded into 64-bit sums every 255 words
    static uint32_t countMismatches(const uint8_t* a_ptr, const uint8_t* b_ptr, size_t len);

    // Batched count of a against b over a.upperBound() lanes; b_ptr must hold
    // upperBound() bytes
    static uint32_t vectorCountMismatches(const LaneVector& a, const uint8_t* b_ptr);

    // =========================================================================
    // Fused Clone + Operate
    // =========================================================================

    // 0xFF where a == b, else 0
    static LaneVector cmpeq(const LaneVector& a, const LaneVector& b);

    // 0xFF where int8(a) > int8(b), else 0
    static LaneVector cmpgt(const LaneVector& a, const LaneVector& b);

    static LaneVector min(const LaneVector& a, const LaneVector& b);
    static LaneVector max(const LaneVector& a, const LaneVector& b);

    // Per lane, two left-associated stages:
    //   m1 = min(a_gap, b_gap), length from the smaller one, the larger length on a tie
    //   m2 = min(sub, m1),      length from the smaller one, the larger length on a tie
    // res_min = m2, res_length = the stage-2 length. When all three costs tie the
    // result is max(sub_length, max(a_gap_length, b_gap_length)), decided pairwise.
    // res_min and res_length must already have the inputs' word count.
    static void tripleMinLength(const LaneVector& sub, const LaneVector& a_gap,
                                const LaneVector& b_gap, const LaneVector& sub_length,
                                const LaneVector& a_gap_length, const LaneVector& b_gap_length,
                                LaneVector& res_min, LaneVector& res_length);

    // =========================================================================
    // Debug
    // =========================================================================

    // Logical lanes as "[  1,   2,   3]"
    [[nodiscard]] std::string toString() const;

  private:
    // Allocates words for len lanes, contents unspecified
    explicit LaneVector(size_t len);

    [[nodiscard]] const uint8_t* data() const { return storage_.get(); }
    [[nodiscard]] uint8_t* data() { return storage_.get(); }

    size_t len_ = 0;
    size_t words_ = 0;
    hwy::AlignedFreeUniquePtr<uint8_t[]> storage_;
};

}  // namespace triple_accel
