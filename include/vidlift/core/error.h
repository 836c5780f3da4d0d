#pragma once

#include <string>

namespace vidlift::core {

/// @brief Canonical error codes used across modules and mapped to HTTP responses.
enum class ErrorCode {
    kOk = 0,
    kInvalidArgument,
    kNotFound,
    kAlreadyExists,
    kIoError,
    kDbError,
    kUnauthorized,
    kForbidden,
    kFailedPrecondition,
    // Upload session taxonomy.
    kSessionInit,
    kPartAuthExpired,
    kTransientNetwork,
    kConflict,
    kIncompleteParts,
    kCancelled,
    kProtocol,
    kInternal,
};

/// @brief Error payload describing a failure with a code and human-readable message.
struct Error {
    ErrorCode code{ErrorCode::kOk};
    std::string message;
};

/// @brief Stable upper-case name for an error code ("SESSION_INIT", "CONFLICT", ...).
const char* ErrorCodeName(ErrorCode code);

}  // namespace vidlift::core
