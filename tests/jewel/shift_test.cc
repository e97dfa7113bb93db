// =============================================================================
// Triple Accel - Cross-Word Shift Tests
// =============================================================================

#include "triple_accel/lane_vector.h"

#include <cstdint>
#include <random>
#include <vector>

#include <gtest/gtest.h>

namespace triple_accel {
namespace {

class ShiftTest : public ::testing::TestWithParam<size_t> {
  protected:
    void SetUp() override { rng_.seed(42); }

    // Random bytes covering every backed lane of a `len`-lane vector
    std::vector<uint8_t> randomLanes(size_t len) {
        std::vector<uint8_t> v(wordsFor(len) * kWordLanes);
        std::uniform_int_distribution<int> dist(1, 255);
        for (auto& b : v) {
            b = static_cast<uint8_t>(dist(rng_));
        }
        return v;
    }

    std::mt19937 rng_;
};

TEST_P(ShiftTest, LeftMovesTowardLaneZero) {
    const size_t len = GetParam();
    auto src = randomLanes(len);
    auto v = LaneVector::repeating(0, len);
    v.fastLoadu(src.data());

    v.shiftLeft1();

    const size_t upper = v.upperBound();
    for (size_t i = 0; i + 1 < upper; ++i) {
        EXPECT_EQ(v.extract(i), src[i + 1]) << "lane " << i;
    }
    EXPECT_EQ(v.extract(upper - 1), 0u);
}

TEST_P(ShiftTest, RightMovesAwayFromLaneZero) {
    const size_t len = GetParam();
    auto src = randomLanes(len);
    auto v = LaneVector::repeating(0, len);
    v.fastLoadu(src.data());

    v.shiftRight1();

    EXPECT_EQ(v.extract(0), 0u);
    for (size_t i = 1; i < v.upperBound(); ++i) {
        EXPECT_EQ(v.extract(i), src[i - 1]) << "lane " << i;
    }
}

TEST_P(ShiftTest, LeftThenRightClearsLaneZeroOnly) {
    const size_t len = GetParam();
    auto src = randomLanes(len);
    auto v = LaneVector::repeating(0, len);
    v.fastLoadu(src.data());

    v.shiftLeft1();
    v.shiftRight1();

    EXPECT_EQ(v.extract(0), 0u);
    for (size_t i = 1; i < v.upperBound(); ++i) {
        EXPECT_EQ(v.extract(i), src[i]) << "lane " << i;
    }
}

INSTANTIATE_TEST_SUITE_P(Lengths, ShiftTest,
                         ::testing::Values(1, 16, 31, 32, 33, 64, 65, 100, 1000));

TEST(ShiftEdgeTest, CarriesAcrossWordBoundary) {
    for (size_t len : {33, 64, 65, 100, 1000}) {
        SCOPED_TRACE(len);
        auto v = LaneVector::repeating(0, len);
        v.insert(kWordLanes, 9);

        v.shiftLeft1();
        EXPECT_EQ(v.extract(kWordLanes - 1), 9u);
        EXPECT_EQ(v.extract(kWordLanes), 0u);

        v.shiftRight1();
        v.shiftRight1();
        EXPECT_EQ(v.extract(kWordLanes + 1), 9u);
        EXPECT_EQ(v.extract(kWordLanes - 1), 0u);
    }
}

TEST(ShiftEdgeTest, EmptyVectorIsNoOp) {
    LaneVector v = LaneVector::repeating(0, 0);
    v.shiftLeft1();
    v.shiftRight1();
    EXPECT_EQ(v.upperBound(), 0u);
}

}  // namespace
}  // namespace triple_accel
