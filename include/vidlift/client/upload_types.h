#pragma once

#include <cstdint>
#include <string>

#include "vidlift/client/chunker.h"
#include "vidlift/core/error.h"

namespace vidlift::client {

/// @brief Lifecycle of one upload session.
enum class UploadStatus {
    kInitializing,
    kUploading,
    kCompleting,
    kCompleted,
    kFailed,
    kCancelled,
};

/// @brief Lower-case wire/display name ("uploading", ...).
const char* UploadStatusName(UploadStatus status);
bool IsTerminal(UploadStatus status);
/// @brief True for initializing, uploading and completing.
bool IsActive(UploadStatus status);
/// @brief Whether `from -> to` is a legal forward move of the session state machine.
bool CanTransition(UploadStatus from, UploadStatus to);

enum class PartState {
    kPending,
    kUploading,
    kUploaded,
    kFailed,
};

const char* PartStateName(PartState state);

/// @brief Pre-authorized target for one part, as issued by the Upload API.
struct PartDestination {
    int index{0};
    std::string url;
    std::string expires_at;
};

/// @brief One part of a session and its transfer state.
struct PartDescriptor {
    int index{0};
    ByteRange range;
    PartDestination destination;
    PartState state{PartState::kPending};
    std::uint64_t uploaded_bytes{0};
    int attempts{0};
    std::string checksum;
};

/// @brief Observable projection of a session. Counters only cover parts the server accepted.
struct UploadProgress {
    std::string video_id;
    std::string file_name;
    std::uint64_t total_bytes{0};
    std::uint64_t uploaded_bytes{0};
    int completed_parts{0};
    int total_parts{0};
    UploadStatus status{UploadStatus::kInitializing};
    core::ErrorCode error_code{core::ErrorCode::kOk};
    std::string error_message;
};

}  // namespace vidlift::client
