#pragma once

/// @file error.h
/// @brief PromptGuard error handling utilities using absl::Status

#include <string>
#include <string_view>

#include <absl/status/status.h>
#include <absl/status/statusor.h>
#include <absl/strings/str_cat.h>

namespace promptguard {

/// @brief Error codes specific to PromptGuard
enum class ErrorCode {
    kOk = 0,
    kUnknown,
    kInvalidArgument,
    kNotFound,
    kFailedPrecondition,
    kOutOfRange,
    kInternal,
    kUnavailable,

    // PromptGuard-specific error codes
    kValidationError,     ///< Malformed value (score outside [0,1], bad parameter)
    kConfigurationError,  ///< Inconsistent configuration (inverted thresholds)
    kInputTooLarge,       ///< Input beyond a hard length ceiling
    kSerializationError,
};

/// @brief Convert PromptGuard error code to absl::StatusCode
absl::StatusCode ToAbslCode(ErrorCode code);

/// @brief Create an OK status
inline absl::Status OkStatus() {
    return absl::OkStatus();
}

/// @brief Create an error status with the given code and message
absl::Status MakeError(ErrorCode code, std::string_view message);

/// @brief Create an internal error
inline absl::Status InternalError(std::string_view message) {
    return absl::InternalError(absl::string_view(message.data(), message.size()));
}

/// @brief Create an invalid argument error
inline absl::Status InvalidArgumentError(std::string_view message) {
    return absl::InvalidArgumentError(absl::string_view(message.data(), message.size()));
}

/// @brief Create a failed precondition error
inline absl::Status FailedPreconditionError(std::string_view message) {
    return absl::FailedPreconditionError(absl::string_view(message.data(), message.size()));
}

/// @brief True if the status was produced for an oversized input
inline bool IsInputTooLarge(const absl::Status& status) {
    return status.code() == ToAbslCode(ErrorCode::kInputTooLarge);
}

// Macros for status checking and propagation

/// @brief Return if status is not OK
#define PROMPTGUARD_RETURN_IF_ERROR(expr)                                      \
    do {                                                                        \
        auto _status = (expr);                                                  \
        if (!_status.ok()) {                                                    \
            return _status;                                                     \
        }                                                                       \
    } while (0)

/// @brief Assign or return if status is not OK
#define PROMPTGUARD_ASSIGN_OR_RETURN(lhs, rhs)                                 \
    PROMPTGUARD_ASSIGN_OR_RETURN_IMPL(                                         \
        PROMPTGUARD_CONCAT(_status_or_, __LINE__), lhs, rhs)

#define PROMPTGUARD_ASSIGN_OR_RETURN_IMPL(statusor, lhs, rhs)                  \
    auto statusor = (rhs);                                                      \
    if (!statusor.ok()) {                                                       \
        return statusor.status();                                               \
    }                                                                           \
    lhs = std::move(statusor).value()

#define PROMPTGUARD_CONCAT(a, b) PROMPTGUARD_CONCAT_IMPL(a, b)
#define PROMPTGUARD_CONCAT_IMPL(a, b) a##b

}  // namespace promptguard
