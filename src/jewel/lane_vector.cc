// =============================================================================
// Triple Accel - LaneVector Implementation
// =============================================================================

#include "triple_accel/lane_vector.h"

#include "triple_accel/codegen/word_ops.h"
#include "triple_accel/jewel.h"

#include <fmt/format.h>

#include <cstring>
#include <utility>

namespace triple_accel {

static_assert(kIsJewel<LaneVector>, "LaneVector must satisfy the Jewel contract");

// =============================================================================
// Construction
// =============================================================================

LaneVector::LaneVector(size_t len) : len_(len), words_(wordsFor(len)) {
    if (words_ == 0) {
        return;
    }

    storage_ = hwy::AllocateAligned<uint8_t>(upperBound());
    TA_BOUNDS_CHECK(storage_ != nullptr);
    TA_ASSERT(isAligned(storage_.get(), kWordLanes));
}

LaneVector::LaneVector(LaneVector&& other) noexcept
    : len_(std::exchange(other.len_, 0)),
      words_(std::exchange(other.words_, 0)),
      storage_(std::move(other.storage_)) {}

LaneVector& LaneVector::operator=(LaneVector&& other) noexcept {
    if (this != &other) {
        len_ = std::exchange(other.len_, 0);
        words_ = std::exchange(other.words_, 0);
        storage_ = std::move(other.storage_);
    }
    return *this;
}

LaneVector LaneVector::repeating(uint32_t val, size_t len) {
    LaneVector v(len);
    simd::Broadcast(v.data(), static_cast<uint8_t>(val), v.upperBound());
    return v;
}

LaneVector LaneVector::repeatingMax(size_t len) {
    return repeating(kLaneMax, len);
}

LaneVector LaneVector::loadu(const uint8_t* ptr, size_t len) {
    LaneVector v(len);
    simd::LoadPadded(v.data(), ptr, len, v.upperBound());
    return v;
}

Result<LaneVector> LaneVector::loadu(std::span<const uint8_t> src, size_t len) {
    if (len > src.size()) {
        TA_RETURN_ERROR(ErrorCode::kBufferTooSmall,
                        fmt::format("loadu of {} lanes from a {} byte buffer", len, src.size()));
    }
    return loadu(src.data(), len);
}

LaneVector LaneVector::clone() const {
    LaneVector v(len_);
    simd::CopyWords(v.data(), data(), upperBound());
    return v;
}

// =============================================================================
// In-Place Reload
// =============================================================================

void LaneVector::slowLoadu(size_t idx, const uint8_t* ptr, size_t len, bool reverse) {
    if (len == 0) {
        return;
    }

    uint8_t* lanes = data();
    if (reverse) {
        TA_ASSERT(idx < upperBound() && idx + 1 >= len);
        for (size_t i = 0; i < len; ++i) {
            lanes[idx - i] = ptr[i];
        }
    } else {
        TA_ASSERT(idx + len <= upperBound());
        std::memcpy(lanes + idx, ptr, len);
    }
}

void LaneVector::fastLoadu(const uint8_t* ptr) {
    simd::CopyWords(data(), ptr, upperBound());
}

Result<void> LaneVector::fastLoadu(std::span<const uint8_t> src) {
    if (src.size() < upperBound()) {
        TA_RETURN_ERROR(ErrorCode::kBufferTooSmall,
                        fmt::format("fastLoadu needs {} bytes, got {}", upperBound(), src.size()));
    }
    fastLoadu(src.data());
    return {};
}

// =============================================================================
// In-Place Arithmetic and Logic
// =============================================================================

void LaneVector::add(const LaneVector& o) {
    TA_ASSERT(words_ == o.words_);
    simd::AddWrapping(data(), o.data(), upperBound());
}

void LaneVector::adds(const LaneVector& o) {
    TA_ASSERT(words_ == o.words_);
    simd::AddSaturated(data(), o.data(), upperBound());
}

void LaneVector::negAdd(const LaneVector& o) {
    TA_ASSERT(words_ == o.words_);
    simd::NegAdd(data(), o.data(), upperBound());
}

void LaneVector::bitAnd(const LaneVector& o) {
    TA_ASSERT(words_ == o.words_);
    simd::BitwiseAnd(data(), o.data(), upperBound());
}

void LaneVector::blendv(const LaneVector& a, const LaneVector& b) {
    TA_ASSERT(words_ == a.words_ && words_ == b.words_);
    simd::Blend(data(), a.data(), b.data(), upperBound());
}

// =============================================================================
// Cross-Word Shifts
// =============================================================================

void LaneVector::shiftLeft1() {
    simd::ShiftLeft1(data(), upperBound());
}

void LaneVector::shiftRight1() {
    simd::ShiftRight1(data(), upperBound());
}

// =============================================================================
// Scalar Access
// =============================================================================

uint32_t LaneVector::extract(size_t i) const {
    TA_ASSERT(i < upperBound());
    return data()[i];
}

void LaneVector::insert(size_t i, uint32_t val) {
    TA_ASSERT(i < upperBound());
    data()[i] = static_cast<uint8_t>(val);
}

void LaneVector::insertLast0(uint32_t val) {
    TA_ASSERT(words_ > 0);
    data()[upperBound() - 1] = static_cast<uint8_t>(val);
}

void LaneVector::insertLast1(uint32_t val) {
    TA_ASSERT(words_ > 0);
    data()[upperBound() - 2] = static_cast<uint8_t>(val);
}

void LaneVector::insertLast2(uint32_t val) {
    TA_ASSERT(words_ > 0);
    data()[upperBound() - 3] = static_cast<uint8_t>(val);
}

void LaneVector::insertLastMax() {
    insertLast0(kLaneMax);
}

void LaneVector::insertFirst(uint32_t val) {
    TA_ASSERT(words_ > 0);
    data()[0] = static_cast<uint8_t>(val);
}

void LaneVector::insertFirstMax() {
    insertFirst(kLaneMax);
}

// =============================================================================
// Checked Access
// =============================================================================

Result<uint32_t> LaneVector::at(size_t i) const {
    if (i >= upperBound()) {
        TA_RETURN_ERROR(ErrorCode::kIndexOutOfBounds,
                        fmt::format("lane {} out of range (upper bound {})", i, upperBound()));
    }
    return extract(i);
}

Result<void> LaneVector::set(size_t i, uint32_t val) {
    if (i >= upperBound()) {
        TA_RETURN_ERROR(ErrorCode::kIndexOutOfBounds,
                        fmt::format("lane {} out of range (upper bound {})", i, upperBound()));
    }
    insert(i, val);
    return {};
}

Result<void> LaneVector::checkSameShape(const LaneVector& o) const {
    if (words_ != o.words_) {
        TA_RETURN_ERROR(ErrorCode::kShapeMismatch,
                        fmt::format("word count {} vs {}", words_, o.words_));
    }
    return {};
}

// =============================================================================
// Mismatch Counting
// =============================================================================

uint32_t LaneVector::mmCountMismatches(const uint8_t* a_ptr, const uint8_t* b_ptr, size_t len) {
    return simd::CountMismatchesDirect(a_ptr, b_ptr, len);
}

uint32_t LaneVector::countMismatches(const uint8_t* a_ptr, const uint8_t* b_ptr, size_t len) {
    return simd::CountMismatchesBatched(a_ptr, b_ptr, len);
}

uint32_t LaneVector::vectorCountMismatches(const LaneVector& a, const uint8_t* b_ptr) {
    return simd::CountMismatchesWords(a.data(), b_ptr, a.upperBound());
}

// =============================================================================
// Fused Clone + Operate
// =============================================================================

LaneVector LaneVector::cmpeq(const LaneVector& a, const LaneVector& b) {
    TA_ASSERT(a.words_ == b.words_);
    LaneVector v(a.len_);
    simd::CompareEq(v.data(), a.data(), b.data(), a.upperBound());
    return v;
}

LaneVector LaneVector::cmpgt(const LaneVector& a, const LaneVector& b) {
    TA_ASSERT(a.words_ == b.words_);
    LaneVector v(a.len_);
    simd::CompareGt(v.data(), a.data(), b.data(), a.upperBound());
    return v;
}

LaneVector LaneVector::min(const LaneVector& a, const LaneVector& b) {
    TA_ASSERT(a.words_ == b.words_);
    LaneVector v(a.len_);
    simd::Min(v.data(), a.data(), b.data(), a.upperBound());
    return v;
}

LaneVector LaneVector::max(const LaneVector& a, const LaneVector& b) {
    TA_ASSERT(a.words_ == b.words_);
    LaneVector v(a.len_);
    simd::Max(v.data(), a.data(), b.data(), a.upperBound());
    return v;
}

void LaneVector::tripleMinLength(const LaneVector& sub, const LaneVector& a_gap,
                                 const LaneVector& b_gap, const LaneVector& sub_length,
                                 const LaneVector& a_gap_length, const LaneVector& b_gap_length,
                                 LaneVector& res_min, LaneVector& res_length) {
    TA_ASSERT(sub.words_ == a_gap.words_ && sub.words_ == b_gap.words_);
    TA_ASSERT(sub.words_ == sub_length.words_ && sub.words_ == a_gap_length.words_ &&
              sub.words_ == b_gap_length.words_);
    TA_ASSERT(sub.words_ == res_min.words_ && sub.words_ == res_length.words_);

    simd::TripleMinLength(sub.data(), a_gap.data(), b_gap.data(), sub_length.data(),
                          a_gap_length.data(), b_gap_length.data(), res_min.data(),
                          res_length.data(), sub.upperBound());
}

// =============================================================================
// Debug
// =============================================================================

std::string LaneVector::toString() const {
    std::string out = "[";
    for (size_t i = 0; i < len_; ++i) {
        if (i > 0) {
            out += ", ";
        }
        out += fmt::format("{:>3}", static_cast<unsigned>(data()[i]));
    }
    out += "]";
    return out;
}

}  // namespace triple_accel
