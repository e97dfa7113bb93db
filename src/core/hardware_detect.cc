// =============================================================================
// Triple Accel - Hardware Detection
// =============================================================================
//
// The word kernels are compiled once per Highway target; what matters at runtime
// is which of those targets this CPU can execute.
//

#include "triple_accel/triple_accel.h"

#include <hwy/targets.h>

#include <fmt/format.h>
#include <fmt/ranges.h>
#include <spdlog/spdlog.h>

#include <mutex>

namespace triple_accel {

namespace {

HardwareInfo detectHardware() {
    HardwareInfo info;
    info.supported_targets = hwy::SupportedTargets();

    // Lowest bit first, which Highway orders best first
    for (int64_t target : hwy::SupportedAndGeneratedTargets()) {
        info.usable_targets.emplace_back(hwy::TargetName(target));
    }

    spdlog::info("Hardware detection: {} ({}-bit), best word kernel target {}", info.arch,
                 info.is_64bit ? 64 : 32, info.bestTarget());
    spdlog::debug("  Usable targets: {}", fmt::join(info.usable_targets, " "));

    return info;
}

std::once_flag g_hardware_init_flag;
HardwareInfo g_hardware_info;

void initializeHardwareInfo() {
    g_hardware_info = detectHardware();
}

}  // namespace

const HardwareInfo& getHardwareInfo() {
    std::call_once(g_hardware_init_flag, initializeHardwareInfo);
    return g_hardware_info;
}

std::string HardwareInfo::simdCapabilitySummary() const {
    std::string summary;
    summary.reserve(256);

    summary += fmt::format("Architecture: {} ({}-bit)\n", arch, is_64bit ? 64 : 32);
    summary += fmt::format("Usable Targets: {}\n",
                           usable_targets.empty() ? std::string("none")
                                                  : fmt::format("{}", fmt::join(usable_targets, " ")));
    summary += fmt::format("Best Target: {}\n", bestTarget());
    summary += fmt::format("Static Target: {}\n", hwy::TargetName(HWY_STATIC_TARGET));

    return summary;
}

}  // namespace triple_accel
