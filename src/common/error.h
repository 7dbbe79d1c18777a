#pragma once

/// @file error.h
/// @brief tokenledger error handling utilities using absl::Status

#include <string>
#include <string_view>

#include <absl/status/status.h>
#include <absl/status/statusor.h>
#include <absl/strings/str_cat.h>

namespace tokenledger {

/// @brief Error codes specific to tokenledger
enum class ErrorCode {
    kOk = 0,
    kUnknown,
    kInvalidArgument,
    kNotFound,
    kFailedPrecondition,
    kInternal,
    kUnavailable,

    // Pricing error taxonomy
    kNetworkError,        ///< Catalog request failed or returned a non-success status
    kParseError,          ///< Catalog payload is not valid JSON or has the wrong shape
    kModelNotPriced,      ///< No catalog entry resolves for a model name
    kConfigurationError,
};

/// @brief Convert tokenledger error code to absl::StatusCode
absl::StatusCode ToAbslCode(ErrorCode code);

/// @brief Create an OK status
inline absl::Status OkStatus() {
    return absl::OkStatus();
}

/// @brief Create an error status with the given code and message
absl::Status MakeError(ErrorCode code, std::string_view message);

/// @brief Create a network error (transport failure or non-2xx response)
inline absl::Status NetworkError(std::string_view message) {
    return MakeError(ErrorCode::kNetworkError, message);
}

/// @brief Create a parse error (malformed JSON or unexpected document shape)
inline absl::Status ParseError(std::string_view message) {
    return MakeError(ErrorCode::kParseError, message);
}

/// @brief Create a not found error
inline absl::Status NotFoundError(std::string_view message) {
    return absl::NotFoundError(message);
}

/// @brief Create the error reported when a model name resolves to no pricing entry
inline absl::Status ModelNotPricedError(std::string_view model_name) {
    return MakeError(ErrorCode::kModelNotPriced,
                     absl::StrCat("Model pricing not found for ", model_name));
}

/// @brief Create an invalid argument error
inline absl::Status InvalidArgumentError(std::string_view message) {
    return absl::InvalidArgumentError(message);
}

/// @brief Create an unavailable error
inline absl::Status UnavailableError(std::string_view message) {
    return absl::UnavailableError(message);
}

// Macros for status checking and propagation

/// @brief Return if status is not OK
#define TOKENLEDGER_RETURN_IF_ERROR(expr)                                      \
    do {                                                                        \
        auto _status = (expr);                                                  \
        if (!_status.ok()) {                                                    \
            return _status;                                                     \
        }                                                                       \
    } while (0)

/// @brief Assign or return if status is not OK
#define TOKENLEDGER_ASSIGN_OR_RETURN(lhs, rhs)                                 \
    TOKENLEDGER_ASSIGN_OR_RETURN_IMPL(                                         \
        TOKENLEDGER_CONCAT(_status_or_, __LINE__), lhs, rhs)

#define TOKENLEDGER_ASSIGN_OR_RETURN_IMPL(statusor, lhs, rhs)                  \
    auto statusor = (rhs);                                                      \
    if (!statusor.ok()) {                                                       \
        return statusor.status();                                               \
    }                                                                           \
    lhs = std::move(statusor).value()

#define TOKENLEDGER_CONCAT(a, b) TOKENLEDGER_CONCAT_IMPL(a, b)
#define TOKENLEDGER_CONCAT_IMPL(a, b) a##b

}  // namespace tokenledger
