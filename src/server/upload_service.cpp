#include "vidlift/server/upload_service.h"

#include <algorithm>
#include <cctype>
#include <filesystem>
#include <optional>
#include <set>
#include <system_error>

#include "vidlift/core/ids.h"
#include "vidlift/core/logger.h"
#include "vidlift/core/time.h"
#include "vidlift/observability/metrics.h"

namespace vidlift::server {

namespace {

constexpr const char* kStateActive = "active";
constexpr const char* kStateCompleted = "completed";
constexpr const char* kVideoUploaded = "uploaded";

int CountParts(std::uint64_t total_bytes, std::uint64_t part_size) {
    if (total_bytes == 0) {
        return 1;
    }
    return static_cast<int>((total_bytes + part_size - 1) / part_size);
}

std::optional<std::int64_t> ParseUnixSeconds(const std::string& value) {
    if (value.empty() || value.size() > 18 ||
        !std::all_of(value.begin(), value.end(),
                     [](char c) { return std::isdigit(static_cast<unsigned char>(c)); })) {
        return std::nullopt;
    }
    return static_cast<std::int64_t>(std::stoll(value));
}

std::string BaseContentType(const std::string& content_type) {
    auto base = content_type.substr(0, content_type.find(';'));
    while (!base.empty() && std::isspace(static_cast<unsigned char>(base.back()))) {
        base.pop_back();
    }
    std::transform(base.begin(), base.end(), base.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return base;
}

void RemoveTemp(const std::string& temp_path) {
    std::error_code ec;
    std::filesystem::remove(temp_path, ec);
    if (ec) {
        core::LogWarning("failed to remove temp file " + temp_path + ": " + ec.message());
    }
}

}  // namespace

UploadService::UploadService(core::UploadPolicyConfig policy, std::string public_base_url,
                             std::shared_ptr<metadata::MetadataStore> metadata,
                             std::shared_ptr<storage::LocalStorage> storage)
    : policy_(std::move(policy)),
      signer_(policy_.signing_secret, std::move(public_base_url)),
      metadata_(std::move(metadata)),
      storage_(std::move(storage)) {}

core::Result<metadata::VideoRecord> UploadService::RegisterVideo(const std::string& organization_id,
                                                                 const std::string& video_id) {
    if (!storage::LocalStorage::IsSafeName(organization_id) ||
        !storage::LocalStorage::IsSafeName(video_id)) {
        return core::Error{core::ErrorCode::kInvalidArgument, "invalid organization or video id"};
    }
    std::lock_guard<std::mutex> lock(mutex_);
    return metadata_->UpsertVideo(organization_id, video_id);
}

core::Result<metadata::VideoRecord> UploadService::GetVideo(const std::string& organization_id,
                                                            const std::string& video_id) {
    std::lock_guard<std::mutex> lock(mutex_);
    return RequireVideo(organization_id, video_id);
}

core::Result<IssuedSession> UploadService::InitializeSession(const InitSessionRequest& request) {
    const auto part_size = request.part_size == 0 ? policy_.default_part_size : request.part_size;
    if (part_size < policy_.min_part_size || part_size > policy_.max_part_size) {
        return core::Error{core::ErrorCode::kInvalidArgument,
                           "partSize must be between " + std::to_string(policy_.min_part_size) +
                               " and " + std::to_string(policy_.max_part_size)};
    }
    const int total_parts = CountParts(request.total_bytes, part_size);
    if (total_parts > policy_.max_parts) {
        return core::Error{core::ErrorCode::kInvalidArgument,
                           "file needs " + std::to_string(total_parts) + " parts, limit is " +
                               std::to_string(policy_.max_parts)};
    }

    std::lock_guard<std::mutex> lock(mutex_);
    auto video = RequireVideo(request.organization_id, request.video_id);
    if (!video.ok()) {
        return video.error();
    }
    if (video.value().status == kVideoUploaded) {
        return core::Error{core::ErrorCode::kFailedPrecondition, "video is already uploaded"};
    }

    const auto now = core::NowUnixSeconds();
    const auto expires_at_unix = now + policy_.session_ttl_seconds;
    auto existing = metadata_->GetActiveSessionForVideo(request.video_id);
    if (existing.ok()) {
        auto session = existing.value();
        const bool resumable = !request.resume_session_id.empty() &&
                               session.session_id == request.resume_session_id &&
                               session.total_bytes == request.total_bytes &&
                               session.part_size == part_size && session.expires_at_unix > now;
        if (resumable) {
            session.expires_at_unix = expires_at_unix;
            session.expires_at = core::UnixSecondsToIso8601(expires_at_unix);
            auto extended =
                metadata_->ExtendSession(session.session_id, session.expires_at, expires_at_unix);
            if (!extended.ok()) {
                return extended.error();
            }
            observability::RecordSessionInitialized(true);
            core::LogEvent("session_resumed", {{"organization_id", session.organization_id},
                                               {"video_id", session.video_id},
                                               {"session_id", session.session_id}});
            return Issue(session, true);
        }
        DiscardSession(session, "superseded");
    } else if (existing.error().code != core::ErrorCode::kNotFound) {
        return existing.error();
    }

    metadata::UploadSessionRecord session;
    session.session_id = core::GenerateSessionId();
    session.video_id = request.video_id;
    session.organization_id = request.organization_id;
    session.file_name = request.file_name;
    session.mime_type = request.mime_type;
    session.total_bytes = request.total_bytes;
    session.part_size = part_size;
    session.total_parts = total_parts;
    session.expires_at_unix = expires_at_unix;
    session.expires_at = core::UnixSecondsToIso8601(expires_at_unix);
    auto created = metadata_->CreateSession(session);
    if (!created.ok()) {
        return created.error();
    }
    observability::RecordSessionInitialized(false);
    core::LogEvent("session_initialized", {{"organization_id", session.organization_id},
                                           {"video_id", session.video_id},
                                           {"session_id", session.session_id},
                                           {"total_bytes", std::to_string(session.total_bytes)},
                                           {"total_parts", std::to_string(session.total_parts)}});
    return Issue(created.value(), false);
}

core::Result<std::uint64_t> UploadService::AuthorizePart(const std::string& session_id,
                                                         int part_index,
                                                         const std::string& expires,
                                                         const std::string& signature) {
    const auto expires_at_unix = ParseUnixSeconds(expires);
    if (!expires_at_unix) {
        return core::Error{core::ErrorCode::kForbidden, "malformed destination"};
    }
    auto verified = signer_.Verify(session_id, part_index, *expires_at_unix, signature,
                                   core::NowUnixSeconds());
    if (!verified.ok()) {
        return verified.error();
    }

    std::lock_guard<std::mutex> lock(mutex_);
    auto session = metadata_->GetSession(session_id);
    if (!session.ok()) {
        return core::Error{core::ErrorCode::kForbidden, "unknown upload session"};
    }
    if (session.value().state != kStateActive) {
        return core::Error{core::ErrorCode::kForbidden,
                           "upload session is " + session.value().state};
    }
    if (part_index < 0 || part_index >= session.value().total_parts) {
        return core::Error{core::ErrorCode::kForbidden, "part index out of range"};
    }
    auto part = metadata_->GetPart(session_id, part_index);
    if (part.ok() && part.value().reported != 0) {
        return core::Error{core::ErrorCode::kForbidden, "destination already used"};
    }
    return PartLength(session.value(), part_index);
}

core::Result<metadata::SessionPartRecord> UploadService::RecordPartReceived(
    const std::string& session_id, int part_index, const std::string& temp_path,
    std::uint64_t size_bytes, const std::string& checksum) {
    std::lock_guard<std::mutex> lock(mutex_);
    // Re-checked: the session may have been superseded while the body was streaming.
    auto session = metadata_->GetSession(session_id);
    if (!session.ok() || session.value().state != kStateActive) {
        RemoveTemp(temp_path);
        return core::Error{core::ErrorCode::kForbidden, "upload session is no longer active"};
    }
    auto existing = metadata_->GetPart(session_id, part_index);
    if (existing.ok() && existing.value().reported != 0) {
        RemoveTemp(temp_path);
        return core::Error{core::ErrorCode::kForbidden, "destination already used"};
    }
    const auto expected = PartLength(session.value(), part_index);
    if (size_bytes != expected) {
        RemoveTemp(temp_path);
        return core::Error{core::ErrorCode::kInvalidArgument,
                           "part " + std::to_string(part_index) + " must be " +
                               std::to_string(expected) + " bytes, received " +
                               std::to_string(size_bytes)};
    }

    auto adopted = storage_->AdoptPart(temp_path, session_id, part_index);
    if (!adopted.ok()) {
        return adopted.error();
    }
    auto part = metadata_->UpsertPartReceived(session_id, part_index, size_bytes, checksum);
    if (!part.ok()) {
        return part.error();
    }
    observability::RecordPartReceived(size_bytes);
    return part;
}

core::Result<void> UploadService::ReportPartComplete(const std::string& organization_id,
                                                     const std::string& video_id,
                                                     const std::string& session_id,
                                                     int part_index, const std::string& checksum) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto video = RequireVideo(organization_id, video_id);
    if (!video.ok()) {
        return video.error();
    }
    auto session = RequireActiveSession(video_id, session_id);
    if (!session.ok()) {
        return session.error();
    }
    if (part_index < 0 || part_index >= session.value().total_parts) {
        return core::Error{core::ErrorCode::kInvalidArgument, "part index out of range"};
    }
    auto part = metadata_->GetPart(session_id, part_index);
    if (!part.ok()) {
        if (part.error().code == core::ErrorCode::kNotFound) {
            return core::Error{core::ErrorCode::kInvalidArgument,
                               "part " + std::to_string(part_index) + " has not been received"};
        }
        return part.error();
    }
    if (part.value().checksum != checksum) {
        return core::Error{core::ErrorCode::kInvalidArgument,
                           "checksum mismatch for part " + std::to_string(part_index)};
    }
    if (part.value().reported != 0) {
        return core::Ok();
    }
    return metadata_->MarkPartReported(session_id, part_index);
}

core::Result<FinalizedObject> UploadService::FinalizeSession(
    const std::string& organization_id, const std::string& video_id,
    const std::string& session_id, std::vector<int>* missing_part_indexes) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto video = RequireVideo(organization_id, video_id);
    if (!video.ok()) {
        return video.error();
    }

    auto stored = metadata_->GetSession(session_id);
    if (stored.ok() && stored.value().video_id == video_id &&
        stored.value().state == kStateCompleted && video.value().status == kVideoUploaded) {
        // A retried finalize whose first response was lost.
        return FinalizedObject{video.value().object_location, video.value().size_bytes,
                               video.value().etag};
    }

    auto session = RequireActiveSession(video_id, session_id);
    if (!session.ok()) {
        return session.error();
    }
    auto parts = metadata_->ListParts(session_id);
    if (!parts.ok()) {
        return parts.error();
    }
    std::set<int> reported;
    for (const auto& part : parts.value()) {
        if (part.reported != 0) {
            reported.insert(part.part_index);
        }
    }
    std::vector<int> missing;
    for (int index = 0; index < session.value().total_parts; ++index) {
        if (reported.count(index) == 0) {
            missing.push_back(index);
        }
    }
    if (!missing.empty()) {
        if (missing_part_indexes) {
            *missing_part_indexes = missing;
        }
        observability::RecordFinalizeRejected();
        return core::Error{core::ErrorCode::kIncompleteParts,
                           std::to_string(missing.size()) + " of " +
                               std::to_string(session.value().total_parts) +
                               " parts have not been reported"};
    }

    const auto key = storage::LocalStorage::ObjectKey(organization_id, video_id);
    auto composed = storage_->ComposeObject(key, session_id, session.value().total_parts);
    if (!composed.ok()) {
        return composed.error();
    }
    if (composed.value().size_bytes != session.value().total_bytes) {
        return core::Error{core::ErrorCode::kIoError, "composed object size does not match"};
    }
    auto updated = metadata_->UpdateVideoObject(video_id, key, composed.value().size_bytes,
                                                composed.value().etag);
    if (!updated.ok()) {
        return updated.error();
    }
    DiscardSession(session.value(), kStateCompleted);

    observability::RecordSessionFinalized();
    core::LogEvent("session_finalized", {{"organization_id", organization_id},
                                         {"video_id", video_id},
                                         {"session_id", session_id},
                                         {"size_bytes", std::to_string(composed.value().size_bytes)},
                                         {"etag", composed.value().etag}});
    return FinalizedObject{key, composed.value().size_bytes, composed.value().etag};
}

core::Result<SessionSnapshot> UploadService::QueryStatus(const std::string& organization_id,
                                                         const std::string& video_id) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto video = RequireVideo(organization_id, video_id);
    if (!video.ok()) {
        return video.error();
    }
    auto session = metadata_->GetActiveSessionForVideo(video_id);
    if (!session.ok()) {
        return session.error();
    }
    if (session.value().expires_at_unix <= core::NowUnixSeconds()) {
        return core::Error{core::ErrorCode::kNotFound, "upload session expired"};
    }
    auto parts = metadata_->ListParts(session.value().session_id);
    if (!parts.ok()) {
        return parts.error();
    }

    SessionSnapshot snapshot;
    snapshot.session_id = session.value().session_id;
    snapshot.part_size = session.value().part_size;
    snapshot.total_parts = session.value().total_parts;
    snapshot.total_bytes = session.value().total_bytes;
    snapshot.expires_at = session.value().expires_at;
    for (const auto& part : parts.value()) {
        if (part.reported != 0) {
            snapshot.completed_part_indexes.push_back(part.part_index);
        }
    }
    return snapshot;
}

core::Result<void> UploadService::AbortSession(const std::string& organization_id,
                                               const std::string& video_id,
                                               const std::string& session_id) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto video = RequireVideo(organization_id, video_id);
    if (!video.ok()) {
        return video.error();
    }
    auto session = metadata_->GetActiveSessionForVideo(video_id);
    if (!session.ok()) {
        return session.error();
    }
    if (session.value().session_id != session_id) {
        return core::Error{core::ErrorCode::kNotFound, "session is not the active session"};
    }
    DiscardSession(session.value(), "aborted");
    core::LogEvent("session_aborted", {{"organization_id", organization_id},
                                       {"video_id", video_id},
                                       {"session_id", session_id}});
    return core::Ok();
}

core::Result<std::string> UploadService::StoreThumbnail(const std::string& organization_id,
                                                        const std::string& video_id,
                                                        const std::string& content_type,
                                                        const std::string& bytes) {
    const auto type = BaseContentType(content_type);
    if (type != "image/jpeg" && type != "image/png" && type != "image/webp") {
        return core::Error{core::ErrorCode::kInvalidArgument,
                           "thumbnail must be image/jpeg, image/png or image/webp"};
    }
    if (bytes.empty()) {
        return core::Error{core::ErrorCode::kInvalidArgument, "thumbnail is empty"};
    }
    if (bytes.size() > policy_.max_thumbnail_bytes) {
        return core::Error{core::ErrorCode::kInvalidArgument,
                           "thumbnail exceeds " + std::to_string(policy_.max_thumbnail_bytes) +
                               " bytes"};
    }

    std::lock_guard<std::mutex> lock(mutex_);
    auto video = RequireVideo(organization_id, video_id);
    if (!video.ok()) {
        return video.error();
    }
    const auto key = storage::LocalStorage::ThumbnailKey(organization_id, video_id);
    auto written = storage_->WriteObject(key, bytes);
    if (!written.ok()) {
        return written.error();
    }
    auto updated = metadata_->UpdateVideoThumbnail(video_id, key);
    if (!updated.ok()) {
        return updated.error();
    }
    observability::RecordThumbnailStored();
    return key;
}

core::Result<storage::StoredObject> UploadService::OpenObject(const std::string& organization_id,
                                                              const std::string& video_id) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto video = RequireVideo(organization_id, video_id);
    if (!video.ok()) {
        return video.error();
    }
    if (video.value().status != kVideoUploaded) {
        return core::Error{core::ErrorCode::kNotFound, "video has no uploaded object"};
    }
    auto object = storage_->StatObject(video.value().object_location);
    if (!object.ok()) {
        return object.error();
    }
    auto stored = object.value();
    stored.etag = video.value().etag;
    return stored;
}

core::Result<int> UploadService::SweepExpired(int grace_period_seconds, int limit) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto expired =
        metadata_->ListExpiredSessions(core::NowUnixSeconds() - grace_period_seconds, limit);
    if (!expired.ok()) {
        return expired.error();
    }
    for (const auto& session : expired.value()) {
        DiscardSession(session, "expired");
        core::LogEvent("session_expired", {{"video_id", session.video_id},
                                           {"session_id", session.session_id}});
    }
    const auto count = static_cast<int>(expired.value().size());
    observability::RecordSessionsExpired(count);
    return count;
}

std::uint64_t UploadService::PartLength(const metadata::UploadSessionRecord& session,
                                        int part_index) {
    const auto offset = session.part_size * static_cast<std::uint64_t>(part_index);
    if (offset >= session.total_bytes) {
        return 0;
    }
    return std::min(session.part_size, session.total_bytes - offset);
}

core::Result<metadata::VideoRecord> UploadService::RequireVideo(const std::string& organization_id,
                                                                const std::string& video_id) {
    if (!storage::LocalStorage::IsSafeName(organization_id) ||
        !storage::LocalStorage::IsSafeName(video_id)) {
        return core::Error{core::ErrorCode::kNotFound, "video not found"};
    }
    auto video = metadata_->GetVideo(video_id);
    if (!video.ok()) {
        return video.error();
    }
    // Another organization's video is indistinguishable from a missing one.
    if (video.value().organization_id != organization_id) {
        return core::Error{core::ErrorCode::kNotFound, "video not found"};
    }
    return video;
}

core::Result<metadata::UploadSessionRecord> UploadService::RequireActiveSession(
    const std::string& video_id, const std::string& session_id) {
    auto session = metadata_->GetSession(session_id);
    if (!session.ok()) {
        if (session.error().code == core::ErrorCode::kNotFound) {
            return core::Error{core::ErrorCode::kConflict, "unknown upload session"};
        }
        return session.error();
    }
    if (session.value().video_id != video_id) {
        return core::Error{core::ErrorCode::kConflict, "session belongs to another video"};
    }
    if (session.value().state != kStateActive) {
        return core::Error{core::ErrorCode::kConflict,
                           "upload session is " + session.value().state};
    }
    return session;
}

IssuedSession UploadService::Issue(const metadata::UploadSessionRecord& session,
                                   bool resumed) const {
    IssuedSession issued;
    issued.session_id = session.session_id;
    issued.part_size = session.part_size;
    issued.total_parts = session.total_parts;
    issued.expires_at = session.expires_at;
    issued.resumed = resumed;
    const auto destination_expiry = std::min<std::int64_t>(
        core::NowUnixSeconds() + policy_.destination_ttl_seconds, session.expires_at_unix);
    issued.parts.reserve(static_cast<std::size_t>(session.total_parts));
    for (int index = 0; index < session.total_parts; ++index) {
        auto signed_destination = signer_.Sign(session.session_id, index, destination_expiry);
        issued.parts.push_back(
            PartGrant{index, signed_destination.url, signed_destination.expires_at});
    }
    return issued;
}

void UploadService::DiscardSession(const metadata::UploadSessionRecord& session,
                                   const std::string& state) {
    auto updated = metadata_->UpdateSessionState(session.session_id, state);
    if (!updated.ok()) {
        core::LogError("failed to mark session " + session.session_id + " " + state + ": " +
                       updated.error().message);
    }
    auto deleted = metadata_->DeleteParts(session.session_id);
    if (!deleted.ok()) {
        core::LogError("failed to delete parts of session " + session.session_id + ": " +
                       deleted.error().message);
    }
    auto removed = storage_->RemoveSessionParts(session.session_id);
    if (!removed.ok()) {
        core::LogWarning("failed to remove part files of session " + session.session_id + ": " +
                         removed.error().message);
    }
}

}  // namespace vidlift::server
