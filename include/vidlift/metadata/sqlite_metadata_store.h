#pragma once

#include <cstdint>
#include <string>

#include <Poco/Data/Session.h>

#include "vidlift/metadata/metadata_store.h"

namespace vidlift::metadata {

/// @brief SQLite-backed metadata store. Not thread-safe; callers serialize access.
class SqliteMetadataStore : public MetadataStore {
public:
    explicit SqliteMetadataStore(const std::string& db_path);

    core::Result<VideoRecord> UpsertVideo(const std::string& organization_id,
                                          const std::string& video_id) override;
    core::Result<VideoRecord> GetVideo(const std::string& video_id) override;
    core::Result<void> UpdateVideoObject(const std::string& video_id,
                                         const std::string& object_location,
                                         std::uint64_t size_bytes,
                                         const std::string& etag) override;
    core::Result<void> UpdateVideoThumbnail(const std::string& video_id,
                                            const std::string& thumbnail_key) override;

    core::Result<UploadSessionRecord> CreateSession(const UploadSessionRecord& session) override;
    core::Result<UploadSessionRecord> GetSession(const std::string& session_id) override;
    core::Result<UploadSessionRecord> GetActiveSessionForVideo(
        const std::string& video_id) override;
    core::Result<void> UpdateSessionState(const std::string& session_id,
                                          const std::string& state) override;
    core::Result<void> ExtendSession(const std::string& session_id, const std::string& expires_at,
                                     std::int64_t expires_at_unix) override;
    core::Result<std::vector<UploadSessionRecord>> ListExpiredSessions(std::int64_t now_unix,
                                                                       int limit) override;

    core::Result<SessionPartRecord> UpsertPartReceived(const std::string& session_id,
                                                       int part_index, std::uint64_t size_bytes,
                                                       const std::string& checksum) override;
    core::Result<void> MarkPartReported(const std::string& session_id, int part_index) override;
    core::Result<SessionPartRecord> GetPart(const std::string& session_id,
                                            int part_index) override;
    core::Result<std::vector<SessionPartRecord>> ListParts(const std::string& session_id) override;
    core::Result<void> DeleteParts(const std::string& session_id) override;

private:
    void InitSchema();
    Poco::Data::Session session_;
};

}  // namespace vidlift::metadata
