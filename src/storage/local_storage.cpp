#include "vidlift/storage/local_storage.h"

#include <array>
#include <cctype>
#include <filesystem>
#include <fstream>
#include <sstream>
#include <system_error>

#include <Poco/DigestEngine.h>
#include <Poco/SHA2Engine.h>
#include <Poco/UUIDGenerator.h>

#include <fcntl.h>
#include <unistd.h>

namespace vidlift::storage {

namespace {

// Streams `data` into `temp_path`, hashing as it goes.
core::Result<StoredObject> WriteTempFile(const std::string& temp_path, std::istream& data) {
    const int fd = ::open(temp_path.c_str(), O_CREAT | O_WRONLY | O_TRUNC, 0644);
    if (fd < 0) {
        return core::Error{core::ErrorCode::kIoError, "failed to open temp file"};
    }
    Poco::SHA2Engine256 sha256;
    std::uint64_t total = 0;
    std::array<char, 8192> buffer{};
    while (data) {
        data.read(buffer.data(), buffer.size());
        const std::streamsize bytes = data.gcount();
        if (bytes <= 0) {
            break;
        }
        ssize_t written = ::write(fd, buffer.data(), static_cast<size_t>(bytes));
        if (written != bytes) {
            ::close(fd);
            ::unlink(temp_path.c_str());
            return core::Error{core::ErrorCode::kIoError, "failed to write temp file"};
        }
        sha256.update(buffer.data(), static_cast<unsigned int>(bytes));
        total += static_cast<std::uint64_t>(bytes);
    }
    ::fsync(fd);
    ::close(fd);

    StoredObject stored;
    stored.path = temp_path;
    stored.size_bytes = total;
    stored.etag = Poco::DigestEngine::digestToHex(sha256.digest());
    return stored;
}

core::Result<void> MoveIntoPlace(const std::string& temp_path, const std::string& final_path) {
    std::error_code ec;
    std::filesystem::create_directories(std::filesystem::path(final_path).parent_path(), ec);
    if (!ec) {
        std::filesystem::rename(temp_path, final_path, ec);
    }
    if (ec) {
        std::error_code ignored;
        std::filesystem::remove(temp_path, ignored);
        return core::Error{core::ErrorCode::kIoError, "failed to move object into place: " + ec.message()};
    }
    return core::Ok();
}

}  // namespace

LocalStorage::LocalStorage(std::string base_path, std::string temp_path)
    : base_path_(std::move(base_path)), temp_path_(std::move(temp_path)) {
    std::filesystem::create_directories(base_path_);
    std::filesystem::create_directories(temp_path_);
}

core::Result<std::string> LocalStorage::AdoptPart(const std::string& temp_path,
                                                  const std::string& session_id, int part_index) {
    if (!IsSafeName(session_id) || part_index < 0) {
        std::error_code ignored;
        std::filesystem::remove(temp_path, ignored);
        return core::Error{core::ErrorCode::kInvalidArgument, "invalid part path"};
    }
    const auto final_path = PartPath(session_id, part_index);
    auto moved = MoveIntoPlace(temp_path, final_path);
    if (!moved.ok()) {
        return moved.error();
    }
    return final_path;
}

core::Result<StoredObject> LocalStorage::ComposeObject(const std::string& key,
                                                       const std::string& session_id,
                                                       int part_count) {
    if (!IsSafeName(session_id)) {
        return core::Error{core::ErrorCode::kInvalidArgument, "invalid session id"};
    }
    const auto temp_path = NewTempPath();
    const int fd = ::open(temp_path.c_str(), O_CREAT | O_WRONLY | O_TRUNC, 0644);
    if (fd < 0) {
        return core::Error{core::ErrorCode::kIoError, "failed to open temp file"};
    }

    Poco::SHA2Engine256 sha256;
    std::uint64_t total = 0;
    std::array<char, 65536> buffer{};
    for (int index = 0; index < part_count; ++index) {
        std::ifstream in(PartPath(session_id, index), std::ios::binary);
        if (!in.is_open()) {
            ::close(fd);
            ::unlink(temp_path.c_str());
            return core::Error{core::ErrorCode::kNotFound,
                               "part " + std::to_string(index) + " missing on disk"};
        }
        while (in) {
            in.read(buffer.data(), buffer.size());
            const std::streamsize bytes = in.gcount();
            if (bytes <= 0) {
                break;
            }
            ssize_t written = ::write(fd, buffer.data(), static_cast<size_t>(bytes));
            if (written != bytes) {
                ::close(fd);
                ::unlink(temp_path.c_str());
                return core::Error{core::ErrorCode::kIoError, "failed to write object"};
            }
            sha256.update(buffer.data(), static_cast<unsigned int>(bytes));
            total += static_cast<std::uint64_t>(bytes);
        }
    }
    ::fsync(fd);
    ::close(fd);

    const auto final_path = ObjectPath(key);
    auto moved = MoveIntoPlace(temp_path, final_path);
    if (!moved.ok()) {
        return moved.error();
    }

    StoredObject stored;
    stored.path = final_path;
    stored.size_bytes = total;
    stored.etag = Poco::DigestEngine::digestToHex(sha256.digest());
    return stored;
}

core::Result<StoredObject> LocalStorage::WriteObject(const std::string& key,
                                                     const std::string& bytes) {
    std::istringstream data(bytes);
    auto written = WriteTempFile(NewTempPath(), data);
    if (!written.ok()) {
        return written;
    }
    const auto final_path = ObjectPath(key);
    auto moved = MoveIntoPlace(written.value().path, final_path);
    if (!moved.ok()) {
        return moved.error();
    }
    auto stored = written.value();
    stored.path = final_path;
    return stored;
}

core::Result<StoredObject> LocalStorage::StatObject(const std::string& key) const {
    const auto path = ObjectPath(key);
    std::error_code ec;
    if (!std::filesystem::exists(path, ec)) {
        return core::Error{core::ErrorCode::kNotFound, "object not found"};
    }
    StoredObject stored;
    stored.path = path;
    stored.size_bytes = static_cast<std::uint64_t>(std::filesystem::file_size(path, ec));
    if (ec) {
        return core::Error{core::ErrorCode::kIoError, ec.message()};
    }
    return stored;
}

core::Result<void> LocalStorage::RemoveSessionParts(const std::string& session_id) {
    if (!IsSafeName(session_id)) {
        return core::Error{core::ErrorCode::kInvalidArgument, "invalid session id"};
    }
    std::error_code ec;
    std::filesystem::remove_all(SessionDir(session_id), ec);
    if (ec) {
        return core::Error{core::ErrorCode::kIoError, ec.message()};
    }
    return core::Ok();
}

std::string LocalStorage::NewTempPath() const {
    return (std::filesystem::path(temp_path_) / Poco::UUIDGenerator().createOne().toString())
        .string();
}

std::string LocalStorage::ObjectPath(const std::string& key) const {
    return (std::filesystem::path(base_path_) / key).string();
}

std::string LocalStorage::PartPath(const std::string& session_id, int part_index) const {
    return (std::filesystem::path(SessionDir(session_id)) / ("part-" + std::to_string(part_index)))
        .string();
}

std::string LocalStorage::SessionDir(const std::string& session_id) const {
    return (std::filesystem::path(temp_path_) / "sessions" / session_id).string();
}

bool LocalStorage::IsSafeName(const std::string& name) {
    if (name.empty() || name.size() > 255) {
        return false;
    }
    for (char c : name) {
        if (!(std::isalnum(static_cast<unsigned char>(c)) || c == '-' || c == '_' || c == '.')) {
            return false;
        }
    }
    if (name == "." || name == "..") {
        return false;
    }
    return true;
}

std::string LocalStorage::ObjectKey(const std::string& organization_id,
                                    const std::string& video_id) {
    return "orgs/" + organization_id + "/videos/" + video_id + "/original";
}

std::string LocalStorage::ThumbnailKey(const std::string& organization_id,
                                       const std::string& video_id) {
    return "orgs/" + organization_id + "/videos/" + video_id + "/thumbnail";
}

}  // namespace vidlift::storage
