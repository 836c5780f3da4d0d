#pragma once

#include <cstdint>
#include <string>
#include <vector>

#include "vidlift/core/error.h"
#include "vidlift/core/result.h"

namespace vidlift::metadata {

/// @brief Video record. Provisioned before upload; owns at most one stored object.
struct VideoRecord {
    std::string video_id;
    std::string organization_id;
    /// "pending" until an upload session finalizes, then "uploaded".
    std::string status;
    std::string object_location;
    std::uint64_t size_bytes{0};
    std::string etag;
    std::string thumbnail_key;
    std::string created_at;
    std::string updated_at;
};

/// @brief Server-side upload session. At most one per video is "active".
struct UploadSessionRecord {
    std::string session_id;
    std::string video_id;
    std::string organization_id;
    /// active | completed | aborted | superseded | expired
    std::string state;
    std::string file_name;
    std::string mime_type;
    std::uint64_t total_bytes{0};
    std::uint64_t part_size{0};
    int total_parts{0};
    std::string expires_at;
    std::int64_t expires_at_unix{0};
    std::string created_at;
    std::string updated_at;
};

/// @brief A part the server holds for a session.
struct SessionPartRecord {
    std::string session_id;
    int part_index{0};
    std::uint64_t size_bytes{0};
    /// SHA-256 hex of the received bytes.
    std::string checksum;
    /// 1 once the client reported the part complete with a matching checksum.
    int reported{0};
    std::string received_at;
};

/// @brief Abstract metadata store for videos, upload sessions and their parts.
class MetadataStore {
public:
    virtual ~MetadataStore() = default;

    virtual core::Result<VideoRecord> UpsertVideo(const std::string& organization_id,
                                                  const std::string& video_id) = 0;
    virtual core::Result<VideoRecord> GetVideo(const std::string& video_id) = 0;
    virtual core::Result<void> UpdateVideoObject(const std::string& video_id,
                                                 const std::string& object_location,
                                                 std::uint64_t size_bytes,
                                                 const std::string& etag) = 0;
    virtual core::Result<void> UpdateVideoThumbnail(const std::string& video_id,
                                                    const std::string& thumbnail_key) = 0;

    virtual core::Result<UploadSessionRecord> CreateSession(const UploadSessionRecord& session) = 0;
    virtual core::Result<UploadSessionRecord> GetSession(const std::string& session_id) = 0;
    virtual core::Result<UploadSessionRecord> GetActiveSessionForVideo(
        const std::string& video_id) = 0;
    virtual core::Result<void> UpdateSessionState(const std::string& session_id,
                                                  const std::string& state) = 0;
    virtual core::Result<void> ExtendSession(const std::string& session_id,
                                             const std::string& expires_at,
                                             std::int64_t expires_at_unix) = 0;
    virtual core::Result<std::vector<UploadSessionRecord>> ListExpiredSessions(
        std::int64_t now_unix, int limit) = 0;

    /// @brief Records received bytes for a part. A new checksum clears the reported flag.
    virtual core::Result<SessionPartRecord> UpsertPartReceived(const std::string& session_id,
                                                               int part_index,
                                                               std::uint64_t size_bytes,
                                                               const std::string& checksum) = 0;
    virtual core::Result<void> MarkPartReported(const std::string& session_id, int part_index) = 0;
    virtual core::Result<SessionPartRecord> GetPart(const std::string& session_id,
                                                    int part_index) = 0;
    virtual core::Result<std::vector<SessionPartRecord>> ListParts(
        const std::string& session_id) = 0;
    virtual core::Result<void> DeleteParts(const std::string& session_id) = 0;
};

}  // namespace vidlift::metadata
