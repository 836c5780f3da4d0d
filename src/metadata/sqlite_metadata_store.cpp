#include "vidlift/metadata/sqlite_metadata_store.h"

#include <Poco/Data/SQLite/Connector.h>
#include <Poco/Data/SessionFactory.h>
#include <Poco/Data/Statement.h>

#include "vidlift/core/time.h"

namespace {
using namespace Poco::Data::Keywords;

const std::string kSessionColumns =
    "session_id, video_id, organization_id, state, file_name, mime_type, total_bytes, "
    "part_size, total_parts, expires_at, expires_at_unix, created_at, updated_at";

const std::string kPartColumns =
    "session_id, part_index, size_bytes, checksum, reported, received_at";

void IntoSession(Poco::Data::Statement& statement, vidlift::metadata::UploadSessionRecord& s) {
    statement, into(s.session_id), into(s.video_id), into(s.organization_id), into(s.state),
        into(s.file_name), into(s.mime_type), into(s.total_bytes), into(s.part_size),
        into(s.total_parts), into(s.expires_at), into(s.expires_at_unix), into(s.created_at),
        into(s.updated_at);
}

void IntoPart(Poco::Data::Statement& statement, vidlift::metadata::SessionPartRecord& p) {
    statement, into(p.session_id), into(p.part_index), into(p.size_bytes), into(p.checksum),
        into(p.reported), into(p.received_at);
}

}  // namespace

namespace vidlift::metadata {

SqliteMetadataStore::SqliteMetadataStore(const std::string& db_path)
    : session_([](const std::string& path) {
          Poco::Data::SQLite::Connector::registerConnector();
          return Poco::Data::Session("SQLite", path);
      }(db_path)) {
    InitSchema();
}

void SqliteMetadataStore::InitSchema() {
    session_ << "PRAGMA foreign_keys = ON", now;

    session_ <<
            "CREATE TABLE IF NOT EXISTS videos ("
            "video_id TEXT PRIMARY KEY,"
            "organization_id TEXT NOT NULL,"
            "status TEXT NOT NULL,"
            "object_location TEXT NOT NULL,"
            "size_bytes INTEGER NOT NULL,"
            "etag TEXT NOT NULL,"
            "thumbnail_key TEXT NOT NULL,"
            "created_at TEXT NOT NULL,"
            "updated_at TEXT NOT NULL"
            ")",
        now;

    session_ <<
            "CREATE TABLE IF NOT EXISTS upload_sessions ("
            "session_id TEXT PRIMARY KEY,"
            "video_id TEXT NOT NULL,"
            "organization_id TEXT NOT NULL,"
            "state TEXT NOT NULL,"
            "file_name TEXT NOT NULL,"
            "mime_type TEXT NOT NULL,"
            "total_bytes INTEGER NOT NULL,"
            "part_size INTEGER NOT NULL,"
            "total_parts INTEGER NOT NULL,"
            "expires_at TEXT NOT NULL,"
            "expires_at_unix INTEGER NOT NULL,"
            "created_at TEXT NOT NULL,"
            "updated_at TEXT NOT NULL,"
            "FOREIGN KEY(video_id) REFERENCES videos(video_id) ON DELETE CASCADE"
            ")",
        now;

    session_ <<
            "CREATE TABLE IF NOT EXISTS session_parts ("
            "session_id TEXT NOT NULL,"
            "part_index INTEGER NOT NULL,"
            "size_bytes INTEGER NOT NULL,"
            "checksum TEXT NOT NULL,"
            "reported INTEGER NOT NULL DEFAULT 0,"
            "received_at TEXT NOT NULL,"
            "PRIMARY KEY(session_id, part_index),"
            "FOREIGN KEY(session_id) REFERENCES upload_sessions(session_id) ON DELETE CASCADE"
            ")",
        now;

    // One active session per video.
    session_ <<
            "CREATE UNIQUE INDEX IF NOT EXISTS idx_upload_sessions_active_video "
            "ON upload_sessions(video_id) WHERE state = 'active'",
        now;
    session_ <<
            "CREATE INDEX IF NOT EXISTS idx_upload_sessions_expires "
            "ON upload_sessions(state, expires_at_unix)",
        now;
}

core::Result<VideoRecord> SqliteMetadataStore::UpsertVideo(const std::string& organization_id,
                                                           const std::string& video_id) {
    auto existing = GetVideo(video_id);
    if (existing.ok()) {
        if (existing.value().organization_id != organization_id) {
            return core::Error{core::ErrorCode::kAlreadyExists,
                               "video belongs to another organization"};
        }
        return existing;
    }

    try {
        std::string now_time = core::NowIso8601();
        std::string video_value = video_id;
        std::string org_value = organization_id;
        session_ <<
                "INSERT INTO videos(video_id, organization_id, status, object_location, "
                "size_bytes, etag, thumbnail_key, created_at, updated_at) "
                "VALUES(?, ?, 'pending', '', 0, '', '', ?, ?)",
            use(video_value), use(org_value), use(now_time), use(now_time), now;
    } catch (const Poco::Exception& ex) {
        return core::Error{core::ErrorCode::kAlreadyExists, ex.displayText()};
    }
    return GetVideo(video_id);
}

core::Result<VideoRecord> SqliteMetadataStore::GetVideo(const std::string& video_id) {
    VideoRecord video;
    std::string video_value = video_id;
    try {
        Poco::Data::Statement select(session_);
        select <<
                "SELECT video_id, organization_id, status, object_location, size_bytes, etag, "
                "thumbnail_key, created_at, updated_at FROM videos WHERE video_id = ?",
            use(video_value), into(video.video_id), into(video.organization_id),
            into(video.status), into(video.object_location), into(video.size_bytes),
            into(video.etag), into(video.thumbnail_key), into(video.created_at),
            into(video.updated_at), now;
    } catch (const Poco::Exception& ex) {
        return core::Error{core::ErrorCode::kDbError, ex.displayText()};
    }

    if (video.video_id.empty()) {
        return core::Error{core::ErrorCode::kNotFound, "video not found"};
    }
    return video;
}

core::Result<void> SqliteMetadataStore::UpdateVideoObject(const std::string& video_id,
                                                          const std::string& object_location,
                                                          std::uint64_t size_bytes,
                                                          const std::string& etag) {
    try {
        std::string now_time = core::NowIso8601();
        std::string video_value = video_id;
        std::string location_value = object_location;
        std::uint64_t size_value = size_bytes;
        std::string etag_value = etag;
        Poco::Data::Statement update(session_);
        update <<
                "UPDATE videos SET status = 'uploaded', object_location = ?, size_bytes = ?, "
                "etag = ?, updated_at = ? WHERE video_id = ?",
            use(location_value), use(size_value), use(etag_value), use(now_time),
            use(video_value), now;
        if (update.affectedRowCount() == 0) {
            return core::Error{core::ErrorCode::kNotFound, "video not found"};
        }
    } catch (const Poco::Exception& ex) {
        return core::Error{core::ErrorCode::kDbError, ex.displayText()};
    }
    return core::Ok();
}

core::Result<void> SqliteMetadataStore::UpdateVideoThumbnail(const std::string& video_id,
                                                             const std::string& thumbnail_key) {
    try {
        std::string now_time = core::NowIso8601();
        std::string video_value = video_id;
        std::string key_value = thumbnail_key;
        Poco::Data::Statement update(session_);
        update << "UPDATE videos SET thumbnail_key = ?, updated_at = ? WHERE video_id = ?",
            use(key_value), use(now_time), use(video_value), now;
        if (update.affectedRowCount() == 0) {
            return core::Error{core::ErrorCode::kNotFound, "video not found"};
        }
    } catch (const Poco::Exception& ex) {
        return core::Error{core::ErrorCode::kDbError, ex.displayText()};
    }
    return core::Ok();
}

core::Result<UploadSessionRecord> SqliteMetadataStore::CreateSession(
    const UploadSessionRecord& session) {
    try {
        std::string now_time = core::NowIso8601();
        UploadSessionRecord row = session;
        session_ <<
                "INSERT INTO upload_sessions(session_id, video_id, organization_id, state, "
                "file_name, mime_type, total_bytes, part_size, total_parts, expires_at, "
                "expires_at_unix, created_at, updated_at) "
                "VALUES(?, ?, ?, 'active', ?, ?, ?, ?, ?, ?, ?, ?, ?)",
            use(row.session_id), use(row.video_id), use(row.organization_id),
            use(row.file_name), use(row.mime_type), use(row.total_bytes), use(row.part_size),
            use(row.total_parts), use(row.expires_at), use(row.expires_at_unix), use(now_time),
            use(now_time), now;
    } catch (const Poco::Exception& ex) {
        // The partial unique index rejects a second active session for the video.
        return core::Error{core::ErrorCode::kAlreadyExists, ex.displayText()};
    }
    return GetSession(session.session_id);
}

core::Result<UploadSessionRecord> SqliteMetadataStore::GetSession(const std::string& session_id) {
    UploadSessionRecord session;
    std::string session_value = session_id;
    try {
        Poco::Data::Statement select(session_);
        select << "SELECT " + kSessionColumns + " FROM upload_sessions WHERE session_id = ?",
            use(session_value);
        IntoSession(select, session);
        select.execute();
    } catch (const Poco::Exception& ex) {
        return core::Error{core::ErrorCode::kDbError, ex.displayText()};
    }

    if (session.session_id.empty()) {
        return core::Error{core::ErrorCode::kNotFound, "upload session not found"};
    }
    return session;
}

core::Result<UploadSessionRecord> SqliteMetadataStore::GetActiveSessionForVideo(
    const std::string& video_id) {
    UploadSessionRecord session;
    std::string video_value = video_id;
    try {
        Poco::Data::Statement select(session_);
        select << "SELECT " + kSessionColumns +
                      " FROM upload_sessions WHERE video_id = ? AND state = 'active'",
            use(video_value);
        IntoSession(select, session);
        select.execute();
    } catch (const Poco::Exception& ex) {
        return core::Error{core::ErrorCode::kDbError, ex.displayText()};
    }

    if (session.session_id.empty()) {
        return core::Error{core::ErrorCode::kNotFound, "no active upload session"};
    }
    return session;
}

core::Result<void> SqliteMetadataStore::UpdateSessionState(const std::string& session_id,
                                                           const std::string& state) {
    try {
        std::string now_time = core::NowIso8601();
        std::string session_value = session_id;
        std::string state_value = state;
        Poco::Data::Statement update(session_);
        update << "UPDATE upload_sessions SET state = ?, updated_at = ? WHERE session_id = ?",
            use(state_value), use(now_time), use(session_value), now;
        if (update.affectedRowCount() == 0) {
            return core::Error{core::ErrorCode::kNotFound, "upload session not found"};
        }
    } catch (const Poco::Exception& ex) {
        return core::Error{core::ErrorCode::kDbError, ex.displayText()};
    }
    return core::Ok();
}

core::Result<void> SqliteMetadataStore::ExtendSession(const std::string& session_id,
                                                      const std::string& expires_at,
                                                      std::int64_t expires_at_unix) {
    try {
        std::string now_time = core::NowIso8601();
        std::string session_value = session_id;
        std::string expires_value = expires_at;
        std::int64_t expires_unix_value = expires_at_unix;
        Poco::Data::Statement update(session_);
        update <<
                "UPDATE upload_sessions SET expires_at = ?, expires_at_unix = ?, updated_at = ? "
                "WHERE session_id = ?",
            use(expires_value), use(expires_unix_value), use(now_time), use(session_value), now;
        if (update.affectedRowCount() == 0) {
            return core::Error{core::ErrorCode::kNotFound, "upload session not found"};
        }
    } catch (const Poco::Exception& ex) {
        return core::Error{core::ErrorCode::kDbError, ex.displayText()};
    }
    return core::Ok();
}

core::Result<std::vector<UploadSessionRecord>> SqliteMetadataStore::ListExpiredSessions(
    std::int64_t now_unix, int limit) {
    std::vector<UploadSessionRecord> sessions;
    UploadSessionRecord session;

    std::int64_t cutoff_value = now_unix;
    int limit_value = limit;
    try {
        Poco::Data::Statement select(session_);
        select << "SELECT " + kSessionColumns +
                      " FROM upload_sessions WHERE state = 'active' AND expires_at_unix < ? "
                      "ORDER BY expires_at_unix ASC LIMIT ?",
            use(cutoff_value), use(limit_value);
        IntoSession(select, session);
        select, range(0, 1);

        while (!select.done()) {
            session = {};
            select.execute();
            if (select.done() && session.session_id.empty()) {
                break;
            }
            if (!session.session_id.empty()) {
                sessions.push_back(session);
            }
        }
    } catch (const Poco::Exception& ex) {
        return core::Error{core::ErrorCode::kDbError, ex.displayText()};
    }
    return sessions;
}

core::Result<SessionPartRecord> SqliteMetadataStore::UpsertPartReceived(
    const std::string& session_id, int part_index, std::uint64_t size_bytes,
    const std::string& checksum) {
    try {
        std::string now_time = core::NowIso8601();
        std::string session_value = session_id;
        int index_value = part_index;
        std::uint64_t size_value = size_bytes;
        std::string checksum_value = checksum;
        session_ <<
                "INSERT INTO session_parts(session_id, part_index, size_bytes, checksum, "
                "reported, received_at) VALUES(?, ?, ?, ?, 0, ?) "
                "ON CONFLICT(session_id, part_index) DO UPDATE SET "
                "size_bytes=excluded.size_bytes, "
                "reported=CASE WHEN session_parts.checksum = excluded.checksum "
                "THEN session_parts.reported ELSE 0 END, "
                "checksum=excluded.checksum, received_at=excluded.received_at",
            use(session_value), use(index_value), use(size_value), use(checksum_value),
            use(now_time), now;
    } catch (const Poco::Exception& ex) {
        return core::Error{core::ErrorCode::kDbError, ex.displayText()};
    }
    return GetPart(session_id, part_index);
}

core::Result<void> SqliteMetadataStore::MarkPartReported(const std::string& session_id,
                                                         int part_index) {
    try {
        std::string session_value = session_id;
        int index_value = part_index;
        Poco::Data::Statement update(session_);
        update << "UPDATE session_parts SET reported = 1 WHERE session_id = ? AND part_index = ?",
            use(session_value), use(index_value), now;
        if (update.affectedRowCount() == 0) {
            return core::Error{core::ErrorCode::kNotFound, "part not received"};
        }
    } catch (const Poco::Exception& ex) {
        return core::Error{core::ErrorCode::kDbError, ex.displayText()};
    }
    return core::Ok();
}

core::Result<SessionPartRecord> SqliteMetadataStore::GetPart(const std::string& session_id,
                                                             int part_index) {
    SessionPartRecord part;
    std::string session_value = session_id;
    int index_value = part_index;
    try {
        Poco::Data::Statement select(session_);
        select << "SELECT " + kPartColumns +
                      " FROM session_parts WHERE session_id = ? AND part_index = ?",
            use(session_value), use(index_value);
        IntoPart(select, part);
        select.execute();
    } catch (const Poco::Exception& ex) {
        return core::Error{core::ErrorCode::kDbError, ex.displayText()};
    }

    if (part.session_id.empty()) {
        return core::Error{core::ErrorCode::kNotFound, "part not received"};
    }
    return part;
}

core::Result<std::vector<SessionPartRecord>> SqliteMetadataStore::ListParts(
    const std::string& session_id) {
    std::vector<SessionPartRecord> parts;
    SessionPartRecord part;

    std::string session_value = session_id;
    try {
        Poco::Data::Statement select(session_);
        select << "SELECT " + kPartColumns +
                      " FROM session_parts WHERE session_id = ? ORDER BY part_index ASC",
            use(session_value);
        IntoPart(select, part);
        select, range(0, 1);

        while (!select.done()) {
            part = {};
            select.execute();
            if (select.done() && part.session_id.empty()) {
                break;
            }
            if (!part.session_id.empty()) {
                parts.push_back(part);
            }
        }
    } catch (const Poco::Exception& ex) {
        return core::Error{core::ErrorCode::kDbError, ex.displayText()};
    }
    return parts;
}

core::Result<void> SqliteMetadataStore::DeleteParts(const std::string& session_id) {
    try {
        std::string session_value = session_id;
        Poco::Data::Statement del(session_);
        del << "DELETE FROM session_parts WHERE session_id = ?", use(session_value), now;
    } catch (const Poco::Exception& ex) {
        return core::Error{core::ErrorCode::kDbError, ex.displayText()};
    }
    return core::Ok();
}

}  // namespace vidlift::metadata
