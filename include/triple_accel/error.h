#pragma once

// =============================================================================
// Triple Accel - Checked Results
// =============================================================================
//
// The checked tier (span overloads, at/set, shape checks, hamming, initialize)
// reports contract violations as Result<T>. Nothing throws.
//

#include "triple_accel/common.h"

#include <cstdint>
#include <string>
#include <string_view>
#include <utility>
#include <variant>

namespace triple_accel {

enum class ErrorCode : uint32_t {
    kOk = 0,

    // Caller buffer holds fewer bytes than the operation reads
    kBufferTooSmall = 103,

    // Operands differ in length or word count
    kShapeMismatch = 203,

    // Count does not fit the 32-bit result
    kNumericalOverflow = 502,

    // Rejected configuration value
    kInvalidInput = 503,

    // Lane index at or past upperBound()
    kIndexOutOfBounds = 504,
};

std::string_view errorCodeToString(ErrorCode code);

class Error {
  public:
    Error() = default;
    Error(ErrorCode code, std::string message) : code_(code), message_(std::move(message)) {}

    [[nodiscard]] bool isOk() const { return code_ == ErrorCode::kOk; }
    [[nodiscard]] ErrorCode code() const { return code_; }
    [[nodiscard]] std::string_view message() const { return message_; }

    // "Code: message", or "OK"
    [[nodiscard]] std::string toString() const;

  private:
    ErrorCode code_ = ErrorCode::kOk;
    std::string message_;
};

// Value or Error. Accessing the wrong alternative is undefined.
template <typename T>
class Result {
  public:
    Result(T value) : data_(std::move(value)) {}      // NOLINT: intentional implicit
    Result(Error error) : data_(std::move(error)) {}  // NOLINT: intentional implicit

    [[nodiscard]] bool hasValue() const { return std::holds_alternative<T>(data_); }
    [[nodiscard]] bool hasError() const { return !hasValue(); }
    explicit operator bool() const { return hasValue(); }

    [[nodiscard]] const Error& error() const { return std::get<Error>(data_); }

    T& operator*() & {
        TA_ASSERT(hasValue());
        return std::get<T>(data_);
    }
    const T& operator*() const& {
        TA_ASSERT(hasValue());
        return std::get<T>(data_);
    }
    T&& operator*() && {
        TA_ASSERT(hasValue());
        return std::get<T>(std::move(data_));
    }
    T* operator->() {
        TA_ASSERT(hasValue());
        return &std::get<T>(data_);
    }
    const T* operator->() const {
        TA_ASSERT(hasValue());
        return &std::get<T>(data_);
    }

  private:
    std::variant<T, Error> data_;
};

template <>
class Result<void> {
  public:
    Result() = default;
    Result(Error error) : error_(std::move(error)) {}  // NOLINT: intentional implicit

    [[nodiscard]] bool hasValue() const { return error_.isOk(); }
    [[nodiscard]] bool hasError() const { return !hasValue(); }
    explicit operator bool() const { return hasValue(); }

    [[nodiscard]] const Error& error() const { return error_; }

  private:
    Error error_;
};

// Return an Error with a formatted message from a Result-returning function
#define TA_RETURN_ERROR(code, msg) return ::triple_accel::Error(code, msg)

}  // namespace triple_accel
