// =============================================================================
// Triple Accel - Runtime
// =============================================================================

#include "triple_accel/codegen/word_ops.h"
#include "triple_accel/triple_accel.h"

#include <hwy/targets.h>

#include <spdlog/spdlog.h>

#include <atomic>
#include <mutex>

namespace triple_accel {

// =============================================================================
// Runtime State
// =============================================================================
//
// initialize() and shutdown() serialize on g_config_mutex. The hamming() hot
// path reads only g_direct_kernel_max_len, which is published separately.

namespace {
std::mutex g_config_mutex;
std::atomic<bool> g_initialized{false};
RuntimeConfig g_config;
std::atomic<size_t> g_direct_kernel_max_len{RuntimeConfig{}.direct_kernel_max_len};
}  // namespace

// =============================================================================
// Initialization
// =============================================================================

Result<void> initialize(const RuntimeConfig& config) {
    std::lock_guard<std::mutex> lock(g_config_mutex);

    if (g_initialized.load()) {
        spdlog::warn("Triple Accel runtime already initialized");
        return {};
    }

    if (config.direct_kernel_max_len == 0) {
        TA_RETURN_ERROR(ErrorCode::kInvalidInput, "direct_kernel_max_len must be positive");
    }

    if (config.enable_debug_output) {
        spdlog::set_level(spdlog::level::debug);
    } else {
        spdlog::set_level(spdlog::level::info);
    }

    spdlog::info("Triple Accel v{} initializing...", Version::string());

    const HardwareInfo& hw = getHardwareInfo();
    if (config.baseline_only) {
        // SupportedTargets() never drops below the static target
        hwy::DisableTargets(~static_cast<int64_t>(HWY_STATIC_TARGET));
        spdlog::info("  Dispatch restricted from {} to static target {}", hw.bestTarget(),
                     hwy::TargetName(HWY_STATIC_TARGET));
    }

    g_config = config;
    g_direct_kernel_max_len.store(config.direct_kernel_max_len);
    g_initialized.store(true);

    spdlog::info("  Word kernels: {} ({} lanes per step)", simd::ActiveTargetName(),
                 simd::StepLanes());
    spdlog::debug("  Direct kernel limit: {} bytes", config.direct_kernel_max_len);

    spdlog::info("Triple Accel initialized successfully");
    return {};
}

void shutdown() {
    std::lock_guard<std::mutex> lock(g_config_mutex);

    if (!g_initialized.exchange(false)) {
        return;  // Not initialized
    }

    spdlog::info("Triple Accel shutting down...");

    if (g_config.baseline_only) {
        hwy::DisableTargets(0);
    }
    g_config = {};
    g_direct_kernel_max_len.store(g_config.direct_kernel_max_len);

    spdlog::info("Triple Accel shutdown complete");
}

bool isInitialized() {
    return g_initialized.load();
}

RuntimeConfig getRuntimeConfig() {
    std::lock_guard<std::mutex> lock(g_config_mutex);
    return g_config;
}

size_t directKernelMaxLen() {
    return g_direct_kernel_max_len.load(std::memory_order_relaxed);
}

// =============================================================================
// Dispatch Information
// =============================================================================

std::string_view activeSimdTarget() {
    return simd::ActiveTargetName();
}

size_t wordStepLanes() {
    return simd::StepLanes();
}

}  // namespace triple_accel
