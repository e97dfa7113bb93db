// =============================================================================
// Triple Accel - LaneVector Tests
// =============================================================================
//
// Construction, reload, scalar access and in-place arithmetic of the 32-lane
// word vector. Shifts, counting and the fused minimum have their own files.
//
// =============================================================================

#include "triple_accel/jewel.h"
#include "triple_accel/lane_vector.h"

#include <cstdint>
#include <numeric>
#include <utility>
#include <vector>

#include <gtest/gtest.h>

namespace triple_accel {
namespace {

static_assert(kIsJewel<LaneVector>);
static_assert(!kIsJewel<int>);
static_assert(!std::is_copy_constructible_v<LaneVector>);
static_assert(std::is_nothrow_move_constructible_v<LaneVector>);

std::vector<uint8_t> iota(size_t len, uint8_t start = 1) {
    std::vector<uint8_t> v(len);
    std::iota(v.begin(), v.end(), start);
    return v;
}

// =============================================================================
// Construction
// =============================================================================

TEST(LaneVectorTest, DefaultIsEmpty) {
    LaneVector v;
    EXPECT_TRUE(v.empty());
    EXPECT_EQ(v.size(), 0u);
    EXPECT_EQ(v.upperBound(), 0u);
}

TEST(LaneVectorTest, WordCount) {
    EXPECT_EQ(LaneVector::repeating(0, 0).wordCount(), 0u);
    EXPECT_EQ(LaneVector::repeating(0, 1).wordCount(), 1u);
    EXPECT_EQ(LaneVector::repeating(0, 32).wordCount(), 1u);
    EXPECT_EQ(LaneVector::repeating(0, 33).wordCount(), 2u);
    EXPECT_EQ(LaneVector::repeating(0, 33).upperBound(), 64u);
}

TEST(LaneVectorTest, RepeatingFillsTail) {
    for (size_t len : {1u, 31u, 32u, 33u, 100u}) {
        auto v = LaneVector::repeating(9, len);
        EXPECT_EQ(v.size(), len);
        for (size_t i = 0; i < v.upperBound(); ++i) {
            EXPECT_EQ(v.extract(i), 9u) << "len=" << len << " lane=" << i;
        }
    }
}

TEST(LaneVectorTest, RepeatingTruncatesToByte) {
    auto v = LaneVector::repeating(0x1FF, 4);
    EXPECT_EQ(v.extract(0), 0xFFu);
}

TEST(LaneVectorTest, RepeatingMax) {
    auto v = LaneVector::repeatingMax(40);
    for (size_t i = 0; i < v.upperBound(); ++i) {
        EXPECT_EQ(v.extract(i), kLaneMax);
    }
}

TEST(LaneVectorTest, LoadRoundTrip) {
    for (size_t len : {0u, 1u, 31u, 32u, 33u, 63u, 1000u}) {
        auto src = iota(len);
        auto v = LaneVector::loadu(src.data(), len);
        ASSERT_EQ(v.size(), len);
        for (size_t i = 0; i < len; ++i) {
            EXPECT_EQ(v.extract(i), src[i]) << "len=" << len << " lane=" << i;
        }
        for (size_t i = len; i < v.upperBound(); ++i) {
            EXPECT_EQ(v.extract(i), 0u) << "tail lane " << i;
        }
    }
}

TEST(LaneVectorTest, CheckedLoadRejectsShortBuffer) {
    auto src = iota(10);
    auto bad = LaneVector::loadu(std::span<const uint8_t>(src), 11);
    ASSERT_TRUE(bad.hasError());
    EXPECT_EQ(bad.error().code(), ErrorCode::kBufferTooSmall);

    auto good = LaneVector::loadu(std::span<const uint8_t>(src), 10);
    ASSERT_TRUE(good.hasValue());
    EXPECT_EQ(good->extract(9), 10u);
}

TEST(LaneVectorTest, CloneIsDeep) {
    auto src = iota(40);
    auto a = LaneVector::loadu(src.data(), src.size());
    auto b = a.clone();

    b.insert(0, 200);
    EXPECT_EQ(a.extract(0), 1u);
    EXPECT_EQ(b.extract(0), 200u);
    EXPECT_EQ(b.size(), a.size());
}

TEST(LaneVectorTest, MoveLeavesSourceEmpty) {
    auto a = LaneVector::repeating(3, 50);
    LaneVector b = std::move(a);
    EXPECT_EQ(b.size(), 50u);
    EXPECT_EQ(b.extract(49), 3u);
    EXPECT_TRUE(a.empty());  // NOLINT(bugprone-use-after-move)

    LaneVector c;
    c = std::move(b);
    EXPECT_EQ(c.upperBound(), 64u);
    EXPECT_EQ(b.upperBound(), 0u);  // NOLINT(bugprone-use-after-move)
}

// =============================================================================
// In-Place Reload
// =============================================================================

TEST(LaneVectorTest, SlowLoadForward) {
    auto v = LaneVector::repeating(0, 64);
    const uint8_t src[] = {7, 8, 9};
    v.slowLoadu(30, src, 3, false);

    EXPECT_EQ(v.extract(29), 0u);
    EXPECT_EQ(v.extract(30), 7u);
    EXPECT_EQ(v.extract(31), 8u);
    EXPECT_EQ(v.extract(32), 9u);
    EXPECT_EQ(v.extract(33), 0u);
}

TEST(LaneVectorTest, SlowLoadReverse) {
    auto v = LaneVector::repeating(0, 64);
    const uint8_t src[] = {7, 8, 9};
    v.slowLoadu(33, src, 3, true);

    EXPECT_EQ(v.extract(33), 7u);
    EXPECT_EQ(v.extract(32), 8u);
    EXPECT_EQ(v.extract(31), 9u);
    EXPECT_EQ(v.extract(30), 0u);
}

TEST(LaneVectorTest, SlowLoadZeroLengthIsNoOp) {
    auto v = LaneVector::repeating(3, 64);
    const uint8_t src[] = {7};
    v.slowLoadu(5, src, 0, false);
    v.slowLoadu(5, src, 0, true);

    for (size_t i = 0; i < v.upperBound(); ++i) {
        EXPECT_EQ(v.extract(i), 3u) << "lane " << i;
    }
}

TEST(LaneVectorTest, SlowLoadForwardAcrossWords) {
    auto v = LaneVector::repeating(0, 128);
    auto src = iota(70);
    v.slowLoadu(20, src.data(), src.size(), false);

    EXPECT_EQ(v.extract(19), 0u);
    for (size_t i = 0; i < src.size(); ++i) {
        EXPECT_EQ(v.extract(20 + i), src[i]) << "lane " << 20 + i;
    }
    EXPECT_EQ(v.extract(90), 0u);
}

TEST(LaneVectorTest, SlowLoadReverseAcrossWords) {
    auto v = LaneVector::repeating(0, 128);
    auto src = iota(70);
    v.slowLoadu(100, src.data(), src.size(), true);

    EXPECT_EQ(v.extract(101), 0u);
    for (size_t i = 0; i < src.size(); ++i) {
        EXPECT_EQ(v.extract(100 - i), src[i]) << "lane " << 100 - i;
    }
    EXPECT_EQ(v.extract(30), 0u);
}

TEST(LaneVectorTest, FastLoadReplacesEveryWord) {
    auto v = LaneVector::repeating(1, 40);
    auto src = iota(v.upperBound(), 100);
    v.fastLoadu(src.data());
    for (size_t i = 0; i < v.upperBound(); ++i) {
        EXPECT_EQ(v.extract(i), src[i]);
    }
}

TEST(LaneVectorTest, CheckedFastLoad) {
    auto v = LaneVector::repeating(1, 40);
    auto short_src = iota(63);
    auto result = v.fastLoadu(std::span<const uint8_t>(short_src));
    ASSERT_TRUE(result.hasError());
    EXPECT_EQ(result.error().code(), ErrorCode::kBufferTooSmall);
    EXPECT_EQ(v.extract(0), 1u);

    auto src = iota(64);
    EXPECT_TRUE(v.fastLoadu(std::span<const uint8_t>(src)).hasValue());
    EXPECT_EQ(v.extract(63), 64u);
}

// =============================================================================
// In-Place Arithmetic
// =============================================================================

TEST(LaneVectorTest, AddWraps) {
    auto a = LaneVector::repeating(200, 40);
    a.add(LaneVector::repeating(100, 40));
    EXPECT_EQ(a.extract(0), 44u);
    EXPECT_EQ(a.extract(63), 44u);
}

TEST(LaneVectorTest, AddsSaturatesSigned) {
    auto hi = LaneVector::repeating(100, 32);
    hi.adds(LaneVector::repeating(100, 32));
    EXPECT_EQ(hi.extract(0), 127u);

    auto lo = LaneVector::repeating(static_cast<uint8_t>(-100), 32);
    lo.adds(LaneVector::repeating(static_cast<uint8_t>(-100), 32));
    EXPECT_EQ(lo.extract(0), 0x80u);

    auto mixed = LaneVector::repeating(5, 32);
    mixed.adds(LaneVector::repeating(static_cast<uint8_t>(-7), 32));
    EXPECT_EQ(mixed.extract(0), static_cast<uint8_t>(-2));
}

TEST(LaneVectorTest, NegAddSubtractsSelf) {
    auto a = LaneVector::repeating(3, 32);
    a.negAdd(LaneVector::repeating(10, 32));
    EXPECT_EQ(a.extract(0), 7u);

    auto b = LaneVector::repeating(10, 32);
    b.negAdd(LaneVector::repeating(3, 32));
    EXPECT_EQ(b.extract(0), static_cast<uint8_t>(-7));
}

TEST(LaneVectorTest, BitAnd) {
    auto a = LaneVector::repeating(0xF0, 64);
    a.bitAnd(LaneVector::repeating(0x3C, 64));
    EXPECT_EQ(a.extract(0), 0x30u);
    EXPECT_EQ(a.extract(63), 0x30u);
}

TEST(LaneVectorTest, BlendSelectsOnHighBit) {
    const size_t len = 70;
    std::vector<uint8_t> mask_bytes(len);
    for (size_t i = 0; i < len; ++i) {
        mask_bytes[i] = (i % 2 == 0) ? 0x80 : 0x00;
    }

    auto mask = LaneVector::loadu(mask_bytes.data(), len);
    auto a = LaneVector::repeating(1, len);
    auto b = LaneVector::repeating(2, len);
    mask.blendv(a, b);

    for (size_t i = 0; i < len; ++i) {
        EXPECT_EQ(mask.extract(i), i % 2 == 0 ? 2u : 1u) << "lane " << i;
    }
    // Zeroed tail lanes have a clear high bit
    EXPECT_EQ(mask.extract(mask.upperBound() - 1), 1u);
}

// =============================================================================
// Scalar Access
// =============================================================================

TEST(LaneVectorTest, InsertExtract) {
    auto v = LaneVector::repeating(0, 64);
    v.insert(40, 0xAB);
    EXPECT_EQ(v.extract(40), 0xABu);
    EXPECT_EQ(v.extract(39), 0u);
}

TEST(LaneVectorTest, InsertLastTargetsFinalPhysicalLanes) {
    auto v = LaneVector::repeating(0, 40);
    v.insertLast0(1);
    v.insertLast1(2);
    v.insertLast2(3);

    EXPECT_EQ(v.extract(63), 1u);
    EXPECT_EQ(v.extract(62), 2u);
    EXPECT_EQ(v.extract(61), 3u);
    EXPECT_EQ(v.extract(39), 0u);

    v.insertLastMax();
    EXPECT_EQ(v.extract(63), kLaneMax);
}

TEST(LaneVectorTest, InsertFirst) {
    auto v = LaneVector::repeating(0, 40);
    v.insertFirst(5);
    EXPECT_EQ(v.extract(0), 5u);
    v.insertFirstMax();
    EXPECT_EQ(v.extract(0), kLaneMax);
    EXPECT_EQ(v.extract(1), 0u);
}

TEST(LaneVectorTest, CheckedAccess) {
    auto v = LaneVector::repeating(4, 10);

    auto in_tail = v.at(31);
    ASSERT_TRUE(in_tail.hasValue());
    EXPECT_EQ(*in_tail, 4u);

    auto past = v.at(32);
    ASSERT_TRUE(past.hasError());
    EXPECT_EQ(past.error().code(), ErrorCode::kIndexOutOfBounds);

    EXPECT_TRUE(v.set(5, 77).hasValue());
    EXPECT_EQ(v.extract(5), 77u);
    EXPECT_EQ(v.set(32, 1).error().code(), ErrorCode::kIndexOutOfBounds);
}

TEST(LaneVectorTest, CheckSameShape) {
    auto a = LaneVector::repeating(0, 33);
    auto b = LaneVector::repeating(0, 64);
    auto c = LaneVector::repeating(0, 65);

    EXPECT_TRUE(a.checkSameShape(b).hasValue());
    auto r = a.checkSameShape(c);
    ASSERT_TRUE(r.hasError());
    EXPECT_EQ(r.error().code(), ErrorCode::kShapeMismatch);
}

TEST(LaneVectorTest, LanesSpanCoversUpperBound) {
    auto v = LaneVector::repeating(2, 33);
    auto lanes = v.lanes();
    EXPECT_EQ(lanes.size(), 64u);
    EXPECT_TRUE(isAligned(lanes.data(), kWordLanes));
}

// =============================================================================
// Debug
// =============================================================================

TEST(LaneVectorTest, ToStringShowsLogicalLanes) {
    const uint8_t src[] = {1, 2, 3};
    auto v = LaneVector::loadu(src, 3);
    EXPECT_EQ(v.toString(), "[  1,   2,   3]");
    EXPECT_EQ(LaneVector().toString(), "[]");
}

TEST(LaneVectorTest, ToStringPrintsUnsigned) {
    auto v = LaneVector::repeating(255, 2);
    EXPECT_EQ(v.toString(), "[255, 255]");
}

}  // namespace
}  // namespace triple_accel
