#pragma once

// =============================================================================
// Triple Accel - Common Definitions
// =============================================================================

#include <cstddef>
#include <cstdint>

// Version information
#define TA_VERSION_MAJOR 0
#define TA_VERSION_MINOR 4
#define TA_VERSION_PATCH 0

// Compile-time architecture name, reported next to the Highway targets
#if defined(__x86_64__) || defined(_M_X64)
    #define TA_ARCH_NAME "x86_64"
#elif defined(__i386__) || defined(_M_IX86)
    #define TA_ARCH_NAME "x86"
#elif defined(__aarch64__) || defined(_M_ARM64)
    #define TA_ARCH_NAME "arm64"
#elif defined(__arm__) || defined(_M_ARM)
    #define TA_ARCH_NAME "arm32"
#else
    #define TA_ARCH_NAME "unknown"
#endif

#if defined(__GNUC__) || defined(__clang__)
    #define TA_UNLIKELY(x) __builtin_expect(!!(x), 0)
#else
    #define TA_UNLIKELY(x) (x)
#endif

namespace triple_accel {

// =============================================================================
// Lane Layout
// =============================================================================

// Lanes (bytes) per physical word; one 256-bit register on AVX2
constexpr size_t kWordLanes = 32;
constexpr size_t kWordShift = 5;
constexpr size_t kWordMask = kWordLanes - 1;

// Vector steps an 8-bit per-lane counter absorbs before it can wrap
constexpr size_t kBatchSteps = 255;

// "Infinite" cost for signed 8-bit DP lanes
constexpr uint8_t kLaneMax = 127;

// allocStr alignment and padding (one u128 chunk)
constexpr size_t kStringAlignment = 16;

// Words backing `len` lanes
constexpr size_t wordsFor(size_t len) {
    return (len >> kWordShift) + ((len & kWordMask) > 0 ? 1 : 0);
}

// alignment must be a power of two
constexpr size_t alignUp(size_t value, size_t alignment) {
    return (value + alignment - 1) & ~(alignment - 1);
}

inline bool isAligned(const void* ptr, size_t alignment) {
    return (reinterpret_cast<uintptr_t>(ptr) & (alignment - 1)) == 0;
}

// =============================================================================
// Contract Checks
// =============================================================================
//
// TA_ASSERT covers the unchecked hot path and compiles away with NDEBUG.
// TA_BOUNDS_CHECK stays on in every build and terminates; it guards writes that
// would otherwise run past caller or library memory.

// Both handlers log through spdlog and abort (error.cc)
[[noreturn]] void assertFailed(const char* cond, const char* file, int line);
[[noreturn]] void boundsFailed(const char* cond, const char* file, int line);

#ifdef NDEBUG
    #define TA_ASSERT(cond) ((void)0)
#else
    #define TA_ASSERT(cond)                                            \
        do {                                                           \
            if (TA_UNLIKELY(!(cond))) {                                \
                triple_accel::assertFailed(#cond, __FILE__, __LINE__); \
            }                                                          \
        } while (0)
#endif

#define TA_BOUNDS_CHECK(cond)                                      \
    do {                                                           \
        if (TA_UNLIKELY(!(cond))) {                                \
            triple_accel::boundsFailed(#cond, __FILE__, __LINE__); \
        }                                                          \
    } while (0)

// =============================================================================
// Utility Types
// =============================================================================

// Owners of aligned lane storage: move-only, duplicated explicitly
class NonCopyable {
  protected:
    NonCopyable() = default;
    ~NonCopyable() = default;

    NonCopyable(const NonCopyable&) = delete;
    NonCopyable& operator=(const NonCopyable&) = delete;
    NonCopyable(NonCopyable&&) = default;
    NonCopyable& operator=(NonCopyable&&) = default;
};

}  // namespace triple_accel
