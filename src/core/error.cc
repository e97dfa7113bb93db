// =============================================================================
// Triple Accel - Error Reporting
// =============================================================================

#include "triple_accel/error.h"

#include <fmt/format.h>
#include <spdlog/spdlog.h>

#include <cstdio>
#include <cstdlib>

namespace triple_accel {

[[noreturn]] void assertFailed(const char* cond, const char* file, int line) {
    spdlog::critical("Assertion failed: {} at {}:{}", cond, file, line);
    std::fflush(stderr);
    std::abort();
}

[[noreturn]] void boundsFailed(const char* cond, const char* file, int line) {
    spdlog::critical("Bounds check failed: {} at {}:{}", cond, file, line);
    std::fflush(stderr);
    std::abort();
}

std::string_view errorCodeToString(ErrorCode code) {
    switch (code) {
    case ErrorCode::kOk:
        return "OK";
    case ErrorCode::kBufferTooSmall:
        return "BufferTooSmall";
    case ErrorCode::kShapeMismatch:
        return "ShapeMismatch";
    case ErrorCode::kNumericalOverflow:
        return "NumericalOverflow";
    case ErrorCode::kInvalidInput:
        return "InvalidInput";
    case ErrorCode::kIndexOutOfBounds:
        return "IndexOutOfBounds";
    }
    return "UnknownError";
}

std::string Error::toString() const {
    if (isOk()) {
        return "OK";
    }
    if (message_.empty()) {
        return std::string(errorCodeToString(code_));
    }
    return fmt::format("{}: {}", errorCodeToString(code_), message_);
}

}  // namespace triple_accel
