// =============================================================================
// Triple Accel - Highway Word Kernels
// =============================================================================
//
// Byte-lane kernels over contiguous word storage, compiled once per SIMD target
// by Highway and dispatched at runtime to the best target the CPU supports:
// AVX2 processes each 32-lane word as one 256-bit register, narrower targets
// (SSE4, NEON, EMU128) walk a word in several steps. Every target produces
// bit-identical results.
//
// Conventions:
// - `bytes` arguments are whole-word sizes (multiples of kWordLanes) and the
//   word storage they describe is aligned to HWY_ALIGNMENT.
// - `len` arguments are arbitrary byte counts over caller memory, read with
//   unaligned loads.
// - Arithmetic, compare, min/max and blend interpret lanes as int8_t.
//
// =============================================================================

#pragma once

#include "triple_accel/common.h"

#include <hwy/base.h>

#include <cstddef>
#include <cstdint>

namespace triple_accel {
namespace simd {

// =============================================================================
// Construction and Reload
// =============================================================================

// out[0..bytes) = value
void Broadcast(uint8_t* HWY_RESTRICT out, uint8_t value, size_t bytes);

// out[0..len) = src[0..len), out[len..bytes) = 0. Never reads src past len.
void LoadPadded(uint8_t* HWY_RESTRICT out, const uint8_t* HWY_RESTRICT src, size_t len,
                size_t bytes);

// out[0..bytes) = src[0..bytes)
void CopyWords(uint8_t* HWY_RESTRICT out, const uint8_t* HWY_RESTRICT src, size_t bytes);

// =============================================================================
// In-Place Elementwise Operations (self may alias other operands)
// =============================================================================

// self[i] = self[i] + o[i] (wrapping)
void AddWrapping(uint8_t* self, const uint8_t* o, size_t bytes);

// self[i] = sat_i8(self[i] + o[i])
void AddSaturated(uint8_t* self, const uint8_t* o, size_t bytes);

// self[i] = o[i] - self[i] (wrapping)
void NegAdd(uint8_t* self, const uint8_t* o, size_t bytes);

// self[i] = self[i] & o[i]
void BitwiseAnd(uint8_t* self, const uint8_t* o, size_t bytes);

// mask[i] = (mask[i] & 0x80) ? b[i] : a[i]
void Blend(uint8_t* mask, const uint8_t* a, const uint8_t* b, size_t bytes);

// =============================================================================
// Cross-Word Shifts
// =============================================================================

// data[i] = data[i + 1], data[bytes - 1] = 0
void ShiftLeft1(uint8_t* data, size_t bytes);

// data[i] = data[i - 1], data[0] = 0
void ShiftRight1(uint8_t* data, size_t bytes);

// =============================================================================
// Out-of-Place Compare and Select
// =============================================================================

// out[i] = (a[i] == b[i]) ? 0xFF : 0
void CompareEq(uint8_t* out, const uint8_t* a, const uint8_t* b, size_t bytes);

// out[i] = (int8(a[i]) > int8(b[i])) ? 0xFF : 0
void CompareGt(uint8_t* out, const uint8_t* a, const uint8_t* b, size_t bytes);

// out[i] = min_i8(a[i], b[i])
void Min(uint8_t* out, const uint8_t* a, const uint8_t* b, size_t bytes);

// out[i] = max_i8(a[i], b[i])
void Max(uint8_t* out, const uint8_t* a, const uint8_t* b, size_t bytes);

// Two-stage minimum of (sub, a_gap, b_gap) with length tie-break; see LaneVector.
// Outputs may alias inputs.
void TripleMinLength(const uint8_t* sub, const uint8_t* a_gap, const uint8_t* b_gap,
                     const uint8_t* sub_length, const uint8_t* a_gap_length,
                     const uint8_t* b_gap_length, uint8_t* res_min, uint8_t* res_length,
                     size_t bytes);

// =============================================================================
// Mismatch Counting
// =============================================================================

// Mask popcount per word into a 32-bit accumulator, scalar tail.
[[nodiscard]] uint32_t CountMismatchesDirect(const uint8_t* HWY_RESTRICT a,
                                             const uint8_t* HWY_RESTRICT b, size_t len);

// 8-bit per-lane counters folded every kBatchSteps steps, scalar tail.
[[nodiscard]] uint32_t CountMismatchesBatched(const uint8_t* HWY_RESTRICT a,
                                              const uint8_t* HWY_RESTRICT b, size_t len);

// Batched count with `words` taken from aligned word storage.
[[nodiscard]] uint32_t CountMismatchesWords(const uint8_t* HWY_RESTRICT words,
                                            const uint8_t* HWY_RESTRICT b, size_t bytes);

// =============================================================================
// Dispatch Information
// =============================================================================

// Name of the Highway target the kernels currently dispatch to (e.g. "AVX2")
[[nodiscard]] const char* ActiveTargetName();

// Lanes processed per vector step on the current target (32 on AVX2)
[[nodiscard]] size_t StepLanes();

}  // namespace simd
}  // namespace triple_accel
