// =============================================================================
// Triple Accel - Highway Word Kernels (Inline Header)
// =============================================================================
//
// This file is included multiple times with different HWY_TARGET values to
// generate code for each supported SIMD instruction set. DO NOT include this
// file directly - include triple_accel/codegen/word_ops.h instead.
//
// =============================================================================

// Highway toggle guard pattern - allows this file to be included multiple times
#if defined(TRIPLE_ACCEL_WORD_OPS_INL_H_) == defined(HWY_TARGET_TOGGLE)
    #ifdef TRIPLE_ACCEL_WORD_OPS_INL_H_
        #undef TRIPLE_ACCEL_WORD_OPS_INL_H_
    #else
        #define TRIPLE_ACCEL_WORD_OPS_INL_H_
    #endif

    #include "triple_accel/common.h"

    #include <hwy/highway.h>

    #include <cstddef>
    #include <cstdint>

HWY_BEFORE_NAMESPACE();
namespace triple_accel {
namespace HWY_NAMESPACE {

namespace hn = hwy::HWY_NAMESPACE;

// One vector step covers at most one 32-lane word. On AVX2 and AVX-512 this is
// exactly one 256-bit register per word; 128-bit targets take two steps.
using WordTag = hn::CappedTag<uint8_t, kWordLanes>;
using SignedWordTag = hn::RebindToSigned<WordTag>;

HWY_INLINE const int8_t* AsSigned(const uint8_t* p) {
    return reinterpret_cast<const int8_t*>(p);
}

HWY_INLINE int8_t* AsSigned(uint8_t* p) {
    return reinterpret_cast<int8_t*>(p);
}

// =============================================================================
// Construction and Reload
// =============================================================================

HWY_ATTR void BroadcastImpl(uint8_t* HWY_RESTRICT out, uint8_t value, size_t bytes) {
    const WordTag d;
    const size_t N = hn::Lanes(d);
    const auto v = hn::Set(d, value);

    for (size_t i = 0; i < bytes; i += N) {
        hn::Store(v, d, out + i);
    }
}

HWY_ATTR void LoadPaddedImpl(uint8_t* HWY_RESTRICT out, const uint8_t* HWY_RESTRICT src,
                             size_t len, size_t bytes) {
    const WordTag d;
    const size_t N = hn::Lanes(d);

    for (size_t i = 0; i < bytes; i += N) {
        if (i + N <= len) {
            hn::Store(hn::LoadU(d, src + i), d, out + i);
        } else if (i < len) {
            // Partial step: LoadN does not touch memory past len and zero-fills
            hn::Store(hn::LoadN(d, src + i, len - i), d, out + i);
        } else {
            hn::Store(hn::Zero(d), d, out + i);
        }
    }
}

HWY_ATTR void CopyWordsImpl(uint8_t* HWY_RESTRICT out, const uint8_t* HWY_RESTRICT src,
                            size_t bytes) {
    const WordTag d;
    const size_t N = hn::Lanes(d);

    for (size_t i = 0; i < bytes; i += N) {
        hn::Store(hn::LoadU(d, src + i), d, out + i);
    }
}

// =============================================================================
// Operation Functors (signed byte lanes)
// =============================================================================

struct AddOp {
    template <class D, class V>
    HWY_INLINE V operator()(D, V self, V o) const {
        return hn::Add(self, o);
    }
};

struct SaturatedAddOp {
    template <class D, class V>
    HWY_INLINE V operator()(D, V self, V o) const {
        return hn::SaturatedAdd(self, o);
    }
};

struct NegAddOp {
    template <class D, class V>
    HWY_INLINE V operator()(D, V self, V o) const {
        return hn::Sub(o, self);
    }
};

struct AndOp {
    template <class D, class V>
    HWY_INLINE V operator()(D, V self, V o) const {
        return hn::And(self, o);
    }
};

struct EqOp {
    template <class D, class V>
    HWY_INLINE V operator()(D d, V a, V b) const {
        return hn::VecFromMask(d, hn::Eq(a, b));
    }
};

struct GtOp {
    template <class D, class V>
    HWY_INLINE V operator()(D d, V a, V b) const {
        return hn::VecFromMask(d, hn::Gt(a, b));
    }
};

struct MinOp {
    template <class D, class V>
    HWY_INLINE V operator()(D, V a, V b) const {
        return hn::Min(a, b);
    }
};

struct MaxOp {
    template <class D, class V>
    HWY_INLINE V operator()(D, V a, V b) const {
        return hn::Max(a, b);
    }
};

// out[i] = op(a[i], b[i]) over whole words; out may alias a or b because each
// step loads both operands before storing.
template <class Op>
HWY_ATTR void BinaryWordOpImpl(uint8_t* out, const uint8_t* a, const uint8_t* b, size_t bytes,
                               Op op) {
    const SignedWordTag d;
    const size_t N = hn::Lanes(d);

    for (size_t i = 0; i < bytes; i += N) {
        const auto va = hn::Load(d, AsSigned(a + i));
        const auto vb = hn::Load(d, AsSigned(b + i));
        hn::Store(op(d, va, vb), d, AsSigned(out + i));
    }
}

HWY_ATTR void AddWrappingImpl(uint8_t* self, const uint8_t* o, size_t bytes) {
    BinaryWordOpImpl(self, self, o, bytes, AddOp());
}

HWY_ATTR void AddSaturatedImpl(uint8_t* self, const uint8_t* o, size_t bytes) {
    BinaryWordOpImpl(self, self, o, bytes, SaturatedAddOp());
}

HWY_ATTR void NegAddImpl(uint8_t* self, const uint8_t* o, size_t bytes) {
    BinaryWordOpImpl(self, self, o, bytes, NegAddOp());
}

HWY_ATTR void BitwiseAndImpl(uint8_t* self, const uint8_t* o, size_t bytes) {
    BinaryWordOpImpl(self, self, o, bytes, AndOp());
}

HWY_ATTR void CompareEqImpl(uint8_t* out, const uint8_t* a, const uint8_t* b, size_t bytes) {
    BinaryWordOpImpl(out, a, b, bytes, EqOp());
}

HWY_ATTR void CompareGtImpl(uint8_t* out, const uint8_t* a, const uint8_t* b, size_t bytes) {
    BinaryWordOpImpl(out, a, b, bytes, GtOp());
}

HWY_ATTR void MinImpl(uint8_t* out, const uint8_t* a, const uint8_t* b, size_t bytes) {
    BinaryWordOpImpl(out, a, b, bytes, MinOp());
}

HWY_ATTR void MaxImpl(uint8_t* out, const uint8_t* a, const uint8_t* b, size_t bytes) {
    BinaryWordOpImpl(out, a, b, bytes, MaxOp());
}

HWY_ATTR void BlendImpl(uint8_t* mask, const uint8_t* a, const uint8_t* b, size_t bytes) {
    const SignedWordTag d;
    const size_t N = hn::Lanes(d);

    for (size_t i = 0; i < bytes; i += N) {
        const auto vm = hn::Load(d, AsSigned(mask + i));
        const auto va = hn::Load(d, AsSigned(a + i));
        const auto vb = hn::Load(d, AsSigned(b + i));
        // High bit set (negative as int8) selects b
        hn::Store(hn::IfNegativeThenElse(vm, vb, va), d, AsSigned(mask + i));
    }
}

// =============================================================================
// Cross-Word Shifts
// =============================================================================

HWY_ATTR void ShiftLeft1Impl(uint8_t* data, size_t bytes) {
    if (bytes == 0) {
        return;
    }

    const WordTag d;
    const size_t N = hn::Lanes(d);

    // Ascending: the unaligned load at i + 1 reads lanes not yet overwritten
    size_t i = 0;
    for (; i + N < bytes; i += N) {
        hn::Store(hn::LoadU(d, data + i + 1), d, data + i);
    }

    // Last step shifts in a zero lane
    hn::Store(hn::LoadN(d, data + i + 1, N - 1), d, data + i);
}

HWY_ATTR void ShiftRight1Impl(uint8_t* data, size_t bytes) {
    if (bytes == 0) {
        return;
    }

    const WordTag d;
    const size_t N = hn::Lanes(d);

    // Descending: the unaligned load at i - 1 reads lanes not yet overwritten
    for (size_t i = bytes - N; i > 0; i -= N) {
        hn::Store(hn::LoadU(d, data + i - 1), d, data + i);
    }

    // First step shifts in a zero lane
    hn::Store(hn::Slide1Up(d, hn::Load(d, data)), d, data);
}

// =============================================================================
// Fused Three-Way Minimum with Length Tie-Break
// =============================================================================

HWY_ATTR void TripleMinLengthImpl(const uint8_t* sub, const uint8_t* a_gap, const uint8_t* b_gap,
                                  const uint8_t* sub_length, const uint8_t* a_gap_length,
                                  const uint8_t* b_gap_length, uint8_t* res_min,
                                  uint8_t* res_length, size_t bytes) {
    const SignedWordTag d;
    const size_t N = hn::Lanes(d);

    // Independent compares are issued before the dependent selects to hide latency
    for (size_t i = 0; i < bytes; i += N) {
        const auto v_sub = hn::Load(d, AsSigned(sub + i));
        const auto v_a_gap = hn::Load(d, AsSigned(a_gap + i));
        const auto v_b_gap = hn::Load(d, AsSigned(b_gap + i));
        const auto v_sub_length = hn::Load(d, AsSigned(sub_length + i));
        const auto v_a_gap_length = hn::Load(d, AsSigned(a_gap_length + i));
        const auto v_b_gap_length = hn::Load(d, AsSigned(b_gap_length + i));

        // Stage 1: a gap vs b gap
        const auto min1 = hn::Min(v_a_gap, v_b_gap);
        const auto a_b_gt = hn::Gt(v_a_gap, v_b_gap);
        const auto a_b_eq = hn::Eq(v_a_gap, v_b_gap);
        const auto a_b_max_length = hn::Max(v_a_gap_length, v_b_gap_length);
        auto length1 = hn::IfThenElse(a_b_gt, v_b_gap_length, v_a_gap_length);
        length1 = hn::IfThenElse(a_b_eq, a_b_max_length, length1);

        // Stage 2: sub vs stage 1 winner
        const auto min2 = hn::Min(v_sub, min1);
        const auto sub_gt = hn::Gt(v_sub, min1);
        const auto sub_eq = hn::Eq(v_sub, min1);
        const auto sub_max_length = hn::Max(v_sub_length, length1);
        auto length2 = hn::IfThenElse(sub_gt, length1, v_sub_length);
        length2 = hn::IfThenElse(sub_eq, sub_max_length, length2);

        hn::Store(min2, d, AsSigned(res_min + i));
        hn::Store(length2, d, AsSigned(res_length + i));
    }
}

// =============================================================================
// Mismatch Counting
// =============================================================================

HWY_ATTR uint32_t CountMismatchesDirectImpl(const uint8_t* HWY_RESTRICT a,
                                            const uint8_t* HWY_RESTRICT b, size_t len) {
    const WordTag d;
    const size_t N = hn::Lanes(d);
    const size_t word_bytes = (len >> kWordShift) << kWordShift;

    uint32_t matches = 0;
    size_t i = 0;
    for (; i < word_bytes; i += N) {
        const auto eq = hn::Eq(hn::LoadU(d, a + i), hn::LoadU(d, b + i));
        matches += static_cast<uint32_t>(hn::CountTrue(d, eq));
    }

    for (; i < len; ++i) {
        matches += static_cast<uint32_t>(a[i] == b[i]);
    }

    return static_cast<uint32_t>(len) - matches;
}

template <bool kAligned, class D>
HWY_INLINE hn::VFromD<D> LoadStep(D d, const uint8_t* HWY_RESTRICT p) {
    if constexpr (kAligned) {
        return hn::Load(d, p);
    } else {
        return hn::LoadU(d, p);
    }
}

// Counts equal lanes over `bytes` (a whole number of words). Matches are counted
// instead of mismatches: subtracting the all-ones equality mask adds 1 per match.
// Per-lane counters are 8 bits wide, so they are folded into 64-bit sums (sum of
// absolute differences against zero) at least every kBatchSteps steps.
template <bool kAlignedA>
HWY_ATTR uint64_t CountMatchingLanes(const uint8_t* HWY_RESTRICT a, const uint8_t* HWY_RESTRICT b,
                                     size_t bytes) {
    const WordTag d;
    const hn::Repartition<uint64_t, WordTag> d64;
    const size_t N = hn::Lanes(d);
    const size_t batch_count = (bytes / N) / kBatchSteps;

    auto sums = hn::Zero(d64);
    size_t i = 0;

    for (size_t batch = 0; batch < batch_count; ++batch) {
        auto counts = hn::Zero(d);
        for (size_t step = 0; step < kBatchSteps; ++step, i += N) {
            const auto eq = hn::Eq(LoadStep<kAlignedA>(d, a + i), hn::LoadU(d, b + i));
            counts = hn::Sub(counts, hn::VecFromMask(d, eq));
        }
        sums = hn::Add(sums, hn::SumsOf8(counts));
    }

    // Leftover steps of the final partial batch
    auto counts = hn::Zero(d);
    for (; i < bytes; i += N) {
        const auto eq = hn::Eq(LoadStep<kAlignedA>(d, a + i), hn::LoadU(d, b + i));
        counts = hn::Sub(counts, hn::VecFromMask(d, eq));
    }
    sums = hn::Add(sums, hn::SumsOf8(counts));

    return hn::ReduceSum(d64, sums);
}

HWY_ATTR uint32_t CountMismatchesBatchedImpl(const uint8_t* HWY_RESTRICT a,
                                             const uint8_t* HWY_RESTRICT b, size_t len) {
    const size_t word_bytes = (len >> kWordShift) << kWordShift;
    uint64_t matches = CountMatchingLanes<false>(a, b, word_bytes);

    for (size_t i = word_bytes; i < len; ++i) {
        matches += static_cast<uint64_t>(a[i] == b[i]);
    }

    return static_cast<uint32_t>(len - matches);
}

HWY_ATTR uint32_t CountMismatchesWordsImpl(const uint8_t* HWY_RESTRICT words,
                                           const uint8_t* HWY_RESTRICT b, size_t bytes) {
    return static_cast<uint32_t>(bytes - CountMatchingLanes<true>(words, b, bytes));
}

// =============================================================================
// Dispatch Information
// =============================================================================

HWY_ATTR const char* ActiveTargetNameImpl() {
    return hwy::TargetName(HWY_TARGET);
}

HWY_ATTR size_t StepLanesImpl() {
    const WordTag d;
    return hn::Lanes(d);
}

}  // namespace HWY_NAMESPACE
}  // namespace triple_accel
HWY_AFTER_NAMESPACE();

#endif  // guard
