#pragma once

// =============================================================================
// Triple Accel - Main Header
// =============================================================================
//
// SIMD lane vectors and mismatch kernels for byte-string edit distance.
//
// Include this header for full API access.
//

#include "triple_accel/common.h"
#include "triple_accel/error.h"
#include "triple_accel/hamming.h"
#include "triple_accel/jewel.h"
#include "triple_accel/lane_vector.h"
#include "triple_accel/string_buffer.h"

#include <string>
#include <string_view>
#include <vector>

namespace triple_accel {

// =============================================================================
// Version Information
// =============================================================================

struct Version {
    static constexpr int major = TA_VERSION_MAJOR;
    static constexpr int minor = TA_VERSION_MINOR;
    static constexpr int patch = TA_VERSION_PATCH;

    static std::string string() {
        return std::to_string(major) + "." + std::to_string(minor) + "." + std::to_string(patch);
    }
};

// =============================================================================
// Runtime Initialization
// =============================================================================

struct RuntimeConfig {
    // Dispatch only to HWY_STATIC_TARGET, the target the translation units were
    // compiled for without runtime dispatch (SSE2 on a default x86-64 build,
    // NEON on arm64, EMU128 where the compiler enables no SIMD)
    bool baseline_only = false;

    // Kernel selection
    size_t direct_kernel_max_len = kBatchSteps * kWordLanes;  // hamming(): direct kernel up to here

    // Debug settings
    bool enable_debug_output = false;  // Debug log level
};

// Initialize the runtime. Optional: without it every kernel dispatches to the
// best target and RuntimeConfig defaults apply. initialize() and shutdown() may
// race with kernel calls on other threads; those calls see either the old or the
// new configuration.
Result<void> initialize(const RuntimeConfig& config = {});

// Shutdown the runtime; restores the default configuration and re-enables every
// compiled SIMD target
void shutdown();

bool isInitialized();

// Snapshot of the active configuration (defaults before initialize())
RuntimeConfig getRuntimeConfig();

// RuntimeConfig::direct_kernel_max_len without taking the configuration lock
size_t directKernelMaxLen();

// =============================================================================
// Hardware Information
// =============================================================================

struct HardwareInfo {
    std::string_view arch = TA_ARCH_NAME;
    bool is_64bit = sizeof(void*) == 8;

    // hwy::SupportedTargets() bit mask at detection time
    int64_t supported_targets = 0;

    // Targets the word kernels can dispatch to on this CPU (supported and
    // compiled), best first
    std::vector<std::string> usable_targets;

    [[nodiscard]] std::string_view bestTarget() const {
        return usable_targets.empty() ? std::string_view() : std::string_view(usable_targets.front());
    }

    // Multi-line human-readable report
    [[nodiscard]] std::string simdCapabilitySummary() const;
};

// Detected once, thread-safe
const HardwareInfo& getHardwareInfo();

// Name of the Highway target the word kernels currently dispatch to
std::string_view activeSimdTarget();

// Lanes processed per kernel step on the active target (at most 32)
size_t wordStepLanes();

}  // namespace triple_accel
