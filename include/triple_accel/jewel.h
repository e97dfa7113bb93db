#pragma once

// =============================================================================
// Triple Accel - Jewel Lane-Vector Contract
// =============================================================================
//
// Jewel is the operation set every SIMD lane-vector backend provides to the
// Hamming and Levenshtein drivers. A backend V is a value type holding a
// logical length `len` and ceil(len / 32) words of 32 byte-lanes each.
//
// Construction (static):
//   V::repeating(val, len)        every lane, tail included, = (uint8_t)val
//   V::repeatingMax(len)          every lane = kLaneMax
//   V::loadu(ptr, len)            len bytes from ptr, tail lanes zero
//
// In-place (mutate *this, operands need the same word count):
//   slowLoadu, fastLoadu, add, adds, negAdd, bitAnd, blendv,
//   shiftLeft1, shiftRight1, insert, insertLast0/1/2, insertLastMax,
//   insertFirst, insertFirstMax
//
// Queries:
//   upperBound(), extract(i)
//
// Mismatch counting (static):
//   mmCountMismatches, countMismatches, vectorCountMismatches
//
// Fused clone + operate (static, operands retained):
//   cmpeq, cmpgt, min, max, tripleMinLength
//
// Most operations mutate in place so that long operation sequences reuse the
// same storage instead of reallocating.
//

#include "triple_accel/common.h"

#include <cstddef>
#include <cstdint>
#include <type_traits>
#include <utility>

namespace triple_accel {

// =============================================================================
// Contract Detection
// =============================================================================

template <typename V, typename = void>
struct IsJewel : std::false_type {};

template <typename V>
struct IsJewel<
    V,
    std::void_t<
        // Construction
        decltype(V::repeating(uint32_t{}, size_t{})),
        decltype(V::repeatingMax(size_t{})),
        decltype(V::loadu(std::declval<const uint8_t*>(), size_t{})),
        decltype(std::declval<const V&>().upperBound()),
        // In-place reload and arithmetic
        decltype(std::declval<V&>().slowLoadu(size_t{}, std::declval<const uint8_t*>(),
                                              size_t{}, bool{})),
        decltype(std::declval<V&>().fastLoadu(std::declval<const uint8_t*>())),
        decltype(std::declval<V&>().add(std::declval<const V&>())),
        decltype(std::declval<V&>().adds(std::declval<const V&>())),
        decltype(std::declval<V&>().negAdd(std::declval<const V&>())),
        decltype(std::declval<V&>().bitAnd(std::declval<const V&>())),
        decltype(std::declval<V&>().blendv(std::declval<const V&>(), std::declval<const V&>())),
        decltype(std::declval<V&>().shiftLeft1()),
        decltype(std::declval<V&>().shiftRight1()),
        // Scalar access
        decltype(std::declval<const V&>().extract(size_t{})),
        decltype(std::declval<V&>().insert(size_t{}, uint32_t{})),
        decltype(std::declval<V&>().insertLast0(uint32_t{})),
        decltype(std::declval<V&>().insertLast1(uint32_t{})),
        decltype(std::declval<V&>().insertLast2(uint32_t{})),
        decltype(std::declval<V&>().insertLastMax()),
        decltype(std::declval<V&>().insertFirst(uint32_t{})),
        decltype(std::declval<V&>().insertFirstMax()),
        // Mismatch counting
        decltype(V::mmCountMismatches(std::declval<const uint8_t*>(),
                                      std::declval<const uint8_t*>(), size_t{})),
        decltype(V::countMismatches(std::declval<const uint8_t*>(),
                                    std::declval<const uint8_t*>(), size_t{})),
        decltype(V::vectorCountMismatches(std::declval<const V&>(),
                                          std::declval<const uint8_t*>())),
        // Fused clone + operate
        decltype(V::cmpeq(std::declval<const V&>(), std::declval<const V&>())),
        decltype(V::cmpgt(std::declval<const V&>(), std::declval<const V&>())),
        decltype(V::min(std::declval<const V&>(), std::declval<const V&>())),
        decltype(V::max(std::declval<const V&>(), std::declval<const V&>())),
        decltype(V::tripleMinLength(std::declval<const V&>(), std::declval<const V&>(),
                                    std::declval<const V&>(), std::declval<const V&>(),
                                    std::declval<const V&>(), std::declval<const V&>(),
                                    std::declval<V&>(), std::declval<V&>()))>>
    : std::bool_constant<std::is_move_constructible_v<V> &&
                         std::is_same_v<decltype(V::repeating(uint32_t{}, size_t{})), V>> {};

template <typename V>
inline constexpr bool kIsJewel = IsJewel<V>::value;

}  // namespace triple_accel
