#pragma once

#include <cstdint>
#include <memory>
#include <string>
#include <vector>

#include "vidlift/client/api_client.h"
#include "vidlift/client/cancellation.h"
#include "vidlift/client/upload_types.h"
#include "vidlift/core/result.h"

namespace vidlift::client {

/// @brief Identifies the video a session belongs to.
struct VideoKey {
    std::string organization_id;
    std::string video_id;
};

struct InitRequest {
    VideoKey video;
    std::uint64_t total_bytes{0};
    std::uint64_t part_size{0};
    std::string file_name;
    std::string mime_type;
    /// Session to continue; the server decides whether it is still resumable.
    std::string resume_session_id;
};

/// @brief Session issued by `Initialize`, one destination per part.
struct SessionGrant {
    std::string session_id;
    std::uint64_t part_size{0};
    int total_parts{0};
    std::string expires_at;
    std::vector<PartDestination> parts;
};

struct FinalizeResult {
    std::string object_location;
    std::uint64_t size_bytes{0};
    std::string etag;
};

/// @brief Server-side view of the active session for a video.
struct SessionStatus {
    std::string session_id;
    std::vector<int> completed_part_indexes;
    std::uint64_t part_size{0};
    int total_parts{0};
    std::uint64_t total_bytes{0};
    std::string expires_at;
};

/// @brief Request/response operations against the Upload API for one session.
///
/// Error kinds: Initialize fails with kSessionInit for unknown videos, foreign videos and
/// rejected parameters. ReportPartComplete fails with kConflict when the session was
/// superseded or finalized elsewhere. Finalize fails with kIncompleteParts when the server's
/// part record disagrees, filling `missing_part_indexes`. QueryStatus fails with kNotFound
/// when no session exists. Any call may fail with kTransientNetwork or kCancelled.
class SessionNegotiator {
public:
    virtual ~SessionNegotiator() = default;

    virtual core::Result<SessionGrant> Initialize(const InitRequest& request,
                                                  const CancellationToken& token) = 0;
    virtual core::Result<void> ReportPartComplete(const VideoKey& video,
                                                  const std::string& session_id, int part_index,
                                                  const std::string& checksum,
                                                  const CancellationToken& token) = 0;
    virtual core::Result<FinalizeResult> Finalize(const VideoKey& video,
                                                  const std::string& session_id,
                                                  std::vector<int>* missing_part_indexes,
                                                  const CancellationToken& token) = 0;
    virtual core::Result<SessionStatus> QueryStatus(const VideoKey& video,
                                                    const CancellationToken& token) = 0;
    virtual core::Result<void> Abort(const VideoKey& video, const std::string& session_id,
                                     const CancellationToken& token) = 0;
};

/// @brief JSON-over-HTTP negotiator for the `/orgs/{org}/videos/{video}/upload/...` API.
class HttpSessionNegotiator : public SessionNegotiator {
public:
    explicit HttpSessionNegotiator(std::shared_ptr<const ApiClient> client);

    core::Result<SessionGrant> Initialize(const InitRequest& request,
                                          const CancellationToken& token) override;
    core::Result<void> ReportPartComplete(const VideoKey& video, const std::string& session_id,
                                          int part_index, const std::string& checksum,
                                          const CancellationToken& token) override;
    core::Result<FinalizeResult> Finalize(const VideoKey& video, const std::string& session_id,
                                          std::vector<int>* missing_part_indexes,
                                          const CancellationToken& token) override;
    core::Result<SessionStatus> QueryStatus(const VideoKey& video,
                                            const CancellationToken& token) override;
    core::Result<void> Abort(const VideoKey& video, const std::string& session_id,
                             const CancellationToken& token) override;

    static std::string UploadPath(const VideoKey& video, const std::string& suffix);

private:
    core::Result<ApiResponse> PostJson(const std::string& path, const std::string& body,
                                       const CancellationToken& token);

    std::shared_ptr<const ApiClient> client_;
};

}  // namespace vidlift::client
