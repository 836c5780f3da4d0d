#pragma once

#include <cstdint>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

#include "vidlift/core/config.h"
#include "vidlift/core/result.h"
#include "vidlift/metadata/metadata_store.h"
#include "vidlift/server/destination_signer.h"
#include "vidlift/storage/local_storage.h"

namespace vidlift::server {

struct InitSessionRequest {
    std::string organization_id;
    std::string video_id;
    std::uint64_t total_bytes{0};
    /// 0 selects the configured default.
    std::uint64_t part_size{0};
    std::string file_name;
    std::string mime_type;
    std::string resume_session_id;
};

struct PartGrant {
    int index{0};
    std::string url;
    std::string expires_at;
};

struct IssuedSession {
    std::string session_id;
    std::uint64_t part_size{0};
    int total_parts{0};
    std::string expires_at;
    std::vector<PartGrant> parts;
    bool resumed{false};
};

struct FinalizedObject {
    std::string object_location;
    std::uint64_t size_bytes{0};
    std::string etag;
};

struct SessionSnapshot {
    std::string session_id;
    std::vector<int> completed_part_indexes;
    std::uint64_t part_size{0};
    int total_parts{0};
    std::uint64_t total_bytes{0};
    std::string expires_at;
};

/// @brief Server side of the multipart upload protocol.
///
/// The session record is authoritative: a part counts only once its bytes were received
/// through a signed destination and the client reported it with the matching checksum.
/// All operations are serialized by one mutex.
class UploadService {
public:
    UploadService(core::UploadPolicyConfig policy, std::string public_base_url,
                  std::shared_ptr<metadata::MetadataStore> metadata,
                  std::shared_ptr<storage::LocalStorage> storage);

    /// @brief Provisions a video for an organization. Idempotent for the owning organization.
    core::Result<metadata::VideoRecord> RegisterVideo(const std::string& organization_id,
                                                      const std::string& video_id);
    core::Result<metadata::VideoRecord> GetVideo(const std::string& organization_id,
                                                 const std::string& video_id);

    /// @brief Issues a session, superseding any active one unless it is resumed.
    core::Result<IssuedSession> InitializeSession(const InitSessionRequest& request);
    /// @brief Checks a part destination before its body is read.
    /// @return Byte length the part must have.
    core::Result<std::uint64_t> AuthorizePart(const std::string& session_id, int part_index,
                                              const std::string& expires,
                                              const std::string& signature);
    /// @brief Adopts a received part body written to `temp_path`.
    core::Result<metadata::SessionPartRecord> RecordPartReceived(const std::string& session_id,
                                                                 int part_index,
                                                                 const std::string& temp_path,
                                                                 std::uint64_t size_bytes,
                                                                 const std::string& checksum);
    core::Result<void> ReportPartComplete(const std::string& organization_id,
                                          const std::string& video_id,
                                          const std::string& session_id, int part_index,
                                          const std::string& checksum);
    /// @brief Composes the object. Fails with kIncompleteParts and fills `missing_part_indexes`
    /// when any part is unreported.
    core::Result<FinalizedObject> FinalizeSession(const std::string& organization_id,
                                                  const std::string& video_id,
                                                  const std::string& session_id,
                                                  std::vector<int>* missing_part_indexes);
    core::Result<SessionSnapshot> QueryStatus(const std::string& organization_id,
                                              const std::string& video_id);
    core::Result<void> AbortSession(const std::string& organization_id,
                                    const std::string& video_id, const std::string& session_id);
    /// @return The thumbnail key.
    core::Result<std::string> StoreThumbnail(const std::string& organization_id,
                                             const std::string& video_id,
                                             const std::string& content_type,
                                             const std::string& bytes);
    core::Result<storage::StoredObject> OpenObject(const std::string& organization_id,
                                                   const std::string& video_id);
    /// @brief Expires active sessions past their expiry plus `grace_period_seconds`.
    /// @return Number of sessions expired.
    core::Result<int> SweepExpired(int grace_period_seconds, int limit);

    /// @brief Byte length of part `part_index` under the session's layout.
    static std::uint64_t PartLength(const metadata::UploadSessionRecord& session, int part_index);

    const core::UploadPolicyConfig& policy() const { return policy_; }

private:
    core::Result<metadata::VideoRecord> RequireVideo(const std::string& organization_id,
                                                     const std::string& video_id);
    core::Result<metadata::UploadSessionRecord> RequireActiveSession(
        const std::string& video_id, const std::string& session_id);
    IssuedSession Issue(const metadata::UploadSessionRecord& session, bool resumed) const;
    void DiscardSession(const metadata::UploadSessionRecord& session, const std::string& state);

    core::UploadPolicyConfig policy_;
    DestinationSigner signer_;
    std::shared_ptr<metadata::MetadataStore> metadata_;
    std::shared_ptr<storage::LocalStorage> storage_;
    std::mutex mutex_;
};

}  // namespace vidlift::server
