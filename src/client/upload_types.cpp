#include "vidlift/client/upload_types.h"

namespace vidlift::client {

const char* UploadStatusName(UploadStatus status) {
    switch (status) {
        case UploadStatus::kInitializing:
            return "initializing";
        case UploadStatus::kUploading:
            return "uploading";
        case UploadStatus::kCompleting:
            return "completing";
        case UploadStatus::kCompleted:
            return "completed";
        case UploadStatus::kFailed:
            return "failed";
        case UploadStatus::kCancelled:
            return "cancelled";
    }
    return "unknown";
}

bool IsTerminal(UploadStatus status) {
    return status == UploadStatus::kCompleted || status == UploadStatus::kFailed ||
           status == UploadStatus::kCancelled;
}

bool IsActive(UploadStatus status) { return !IsTerminal(status); }

bool CanTransition(UploadStatus from, UploadStatus to) {
    switch (from) {
        case UploadStatus::kInitializing:
            return to == UploadStatus::kUploading || to == UploadStatus::kFailed ||
                   to == UploadStatus::kCancelled;
        case UploadStatus::kUploading:
            return to == UploadStatus::kCompleting || to == UploadStatus::kFailed ||
                   to == UploadStatus::kCancelled;
        case UploadStatus::kCompleting:
            return to == UploadStatus::kCompleted || to == UploadStatus::kFailed;
        case UploadStatus::kCompleted:
        case UploadStatus::kFailed:
        case UploadStatus::kCancelled:
            return false;
    }
    return false;
}

const char* PartStateName(PartState state) {
    switch (state) {
        case PartState::kPending:
            return "pending";
        case PartState::kUploading:
            return "uploading";
        case PartState::kUploaded:
            return "uploaded";
        case PartState::kFailed:
            return "failed";
    }
    return "unknown";
}

}  // namespace vidlift::client
