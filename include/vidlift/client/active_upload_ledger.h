#pragma once

#include <mutex>
#include <string>
#include <vector>

#include "vidlift/core/result.h"

namespace vidlift::client {

struct ActiveUpload {
    std::string video_id;
    std::string organization_id;

    bool operator==(const ActiveUpload& other) const {
        return video_id == other.video_id && organization_id == other.organization_id;
    }
    bool operator!=(const ActiveUpload& other) const { return !(*this == other); }
};

/// @brief Durable record of which uploads are in flight, kept for crash diagnostics only.
///
/// The file is a JSON object; only `kStorageKey` is owned here and other keys are preserved.
/// Nothing reads the ledger to resume a transfer.
class ActiveUploadLedger {
public:
    static constexpr const char* kStorageKey = "vidlift:active-uploads";

    explicit ActiveUploadLedger(std::string path);

    /// @brief Replaces the recorded set. An empty set removes the key, and the file when no
    /// other keys remain.
    core::Result<void> Write(const std::vector<ActiveUpload>& uploads);
    /// @brief Recorded set; empty when the file or key is absent.
    core::Result<std::vector<ActiveUpload>> Read() const;

    const std::string& path() const { return path_; }

private:
    std::string path_;
    mutable std::mutex mutex_;
};

}  // namespace vidlift::client
