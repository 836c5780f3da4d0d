#include "vidlift/core/error.h"

namespace vidlift::core {

const char* ErrorCodeName(ErrorCode code) {
    switch (code) {
        case ErrorCode::kOk:
            return "OK";
        case ErrorCode::kInvalidArgument:
            return "INVALID_ARGUMENT";
        case ErrorCode::kNotFound:
            return "NOT_FOUND";
        case ErrorCode::kAlreadyExists:
            return "ALREADY_EXISTS";
        case ErrorCode::kIoError:
            return "IO_ERROR";
        case ErrorCode::kDbError:
            return "DB_ERROR";
        case ErrorCode::kUnauthorized:
            return "UNAUTHORIZED";
        case ErrorCode::kForbidden:
            return "FORBIDDEN";
        case ErrorCode::kFailedPrecondition:
            return "FAILED_PRECONDITION";
        case ErrorCode::kSessionInit:
            return "SESSION_INIT";
        case ErrorCode::kPartAuthExpired:
            return "PART_AUTH_EXPIRED";
        case ErrorCode::kTransientNetwork:
            return "TRANSIENT_NETWORK";
        case ErrorCode::kConflict:
            return "CONFLICT";
        case ErrorCode::kIncompleteParts:
            return "INCOMPLETE_PARTS";
        case ErrorCode::kCancelled:
            return "CANCELLED";
        case ErrorCode::kProtocol:
            return "PROTOCOL";
        case ErrorCode::kInternal:
            return "INTERNAL";
    }
    return "INTERNAL";
}

}  // namespace vidlift::core
