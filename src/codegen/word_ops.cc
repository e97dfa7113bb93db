// =============================================================================
// Triple Accel - Highway Word Kernels Implementation
// =============================================================================
//
// Multi-target dispatch for the word kernels. foreach_target.h compiles
// word_ops-inl.h once per enabled SIMD target; HWY_DYNAMIC_DISPATCH picks the
// best target the running CPU supports on first use and caches the choice.
//
// =============================================================================

#include "triple_accel/codegen/word_ops.h"

#undef HWY_TARGET_INCLUDE
#define HWY_TARGET_INCLUDE "codegen/word_ops-inl.h"
#include <hwy/foreach_target.h>  // IWYU pragma: keep
#include <hwy/highway.h>

#include "codegen/word_ops-inl.h"  // For the static target

namespace triple_accel {

// =============================================================================
// HWY_EXPORT declarations
// =============================================================================

HWY_EXPORT(BroadcastImpl);
HWY_EXPORT(LoadPaddedImpl);
HWY_EXPORT(CopyWordsImpl);

HWY_EXPORT(AddWrappingImpl);
HWY_EXPORT(AddSaturatedImpl);
HWY_EXPORT(NegAddImpl);
HWY_EXPORT(BitwiseAndImpl);
HWY_EXPORT(BlendImpl);

HWY_EXPORT(ShiftLeft1Impl);
HWY_EXPORT(ShiftRight1Impl);

HWY_EXPORT(CompareEqImpl);
HWY_EXPORT(CompareGtImpl);
HWY_EXPORT(MinImpl);
HWY_EXPORT(MaxImpl);
HWY_EXPORT(TripleMinLengthImpl);

HWY_EXPORT(CountMismatchesDirectImpl);
HWY_EXPORT(CountMismatchesBatchedImpl);
HWY_EXPORT(CountMismatchesWordsImpl);

HWY_EXPORT(ActiveTargetNameImpl);
HWY_EXPORT(StepLanesImpl);

namespace simd {

// =============================================================================
// Construction and Reload
// =============================================================================

void Broadcast(uint8_t* HWY_RESTRICT out, uint8_t value, size_t bytes) {
    HWY_DYNAMIC_DISPATCH(BroadcastImpl)(out, value, bytes);
}

void LoadPadded(uint8_t* HWY_RESTRICT out, const uint8_t* HWY_RESTRICT src, size_t len,
                size_t bytes) {
    HWY_DYNAMIC_DISPATCH(LoadPaddedImpl)(out, src, len, bytes);
}

void CopyWords(uint8_t* HWY_RESTRICT out, const uint8_t* HWY_RESTRICT src, size_t bytes) {
    HWY_DYNAMIC_DISPATCH(CopyWordsImpl)(out, src, bytes);
}

// =============================================================================
// In-Place Elementwise Operations
// =============================================================================

void AddWrapping(uint8_t* self, const uint8_t* o, size_t bytes) {
    HWY_DYNAMIC_DISPATCH(AddWrappingImpl)(self, o, bytes);
}

void AddSaturated(uint8_t* self, const uint8_t* o, size_t bytes) {
    HWY_DYNAMIC_DISPATCH(AddSaturatedImpl)(self, o, bytes);
}

void NegAdd(uint8_t* self, const uint8_t* o, size_t bytes) {
    HWY_DYNAMIC_DISPATCH(NegAddImpl)(self, o, bytes);
}

void BitwiseAnd(uint8_t* self, const uint8_t* o, size_t bytes) {
    HWY_DYNAMIC_DISPATCH(BitwiseAndImpl)(self, o, bytes);
}

void Blend(uint8_t* mask, const uint8_t* a, const uint8_t* b, size_t bytes) {
    HWY_DYNAMIC_DISPATCH(BlendImpl)(mask, a, b, bytes);
}

// =============================================================================
// Cross-Word Shifts
// =============================================================================

void ShiftLeft1(uint8_t* data, size_t bytes) {
    HWY_DYNAMIC_DISPATCH(ShiftLeft1Impl)(data, bytes);
}

void ShiftRight1(uint8_t* data, size_t bytes) {
    HWY_DYNAMIC_DISPATCH(ShiftRight1Impl)(data, bytes);
}

// =============================================================================
// Out-of-Place Compare and Select
// =============================================================================

void CompareEq(uint8_t* out, const uint8_t* a, const uint8_t* b, size_t bytes) {
    HWY_DYNAMIC_DISPATCH(CompareEqImpl)(out, a, b, bytes);
}

void CompareGt(uint8_t* out, const uint8_t* a, const uint8_t* b, size_t bytes) {
    HWY_DYNAMIC_DISPATCH(CompareGtImpl)(out, a, b, bytes);
}

void Min(uint8_t* out, const uint8_t* a, const uint8_t* b, size_t bytes) {
    HWY_DYNAMIC_DISPATCH(MinImpl)(out, a, b, bytes);
}

void Max(uint8_t* out, const uint8_t* a, const uint8_t* b, size_t bytes) {
    HWY_DYNAMIC_DISPATCH(MaxImpl)(out, a, b, bytes);
}

void TripleMinLength(const uint8_t* sub, const uint8_t* a_gap, const uint8_t* b_gap,
                     const uint8_t* sub_length, const uint8_t* a_gap_length,
                     const uint8_t* b_gap_length, uint8_t* res_min, uint8_t* res_length,
                     size_t bytes) {
    HWY_DYNAMIC_DISPATCH(TripleMinLengthImpl)(sub, a_gap, b_gap, sub_length, a_gap_length,
                                              b_gap_length, res_min, res_length, bytes);
}

// =============================================================================
// Mismatch Counting
// =============================================================================

uint32_t CountMismatchesDirect(const uint8_t* HWY_RESTRICT a, const uint8_t* HWY_RESTRICT b,
                               size_t len) {
    return HWY_DYNAMIC_DISPATCH(CountMismatchesDirectImpl)(a, b, len);
}

uint32_t CountMismatchesBatched(const uint8_t* HWY_RESTRICT a, const uint8_t* HWY_RESTRICT b,
                                size_t len) {
    return HWY_DYNAMIC_DISPATCH(CountMismatchesBatchedImpl)(a, b, len);
}

uint32_t CountMismatchesWords(const uint8_t* HWY_RESTRICT words, const uint8_t* HWY_RESTRICT b,
                              size_t bytes) {
    return HWY_DYNAMIC_DISPATCH(CountMismatchesWordsImpl)(words, b, bytes);
}

// =============================================================================
// Dispatch Information
// =============================================================================

const char* ActiveTargetName() {
    return HWY_DYNAMIC_DISPATCH(ActiveTargetNameImpl)();
}

size_t StepLanes() {
    return HWY_DYNAMIC_DISPATCH(StepLanesImpl)();
}

}  // namespace simd
}  // namespace triple_accel
