#pragma once

#include <cstdint>
#include <string>

#include "vidlift/core/error.h"
#include "vidlift/core/result.h"

namespace vidlift::storage {

/// @brief Stored object attributes used for metadata updates.
struct StoredObject {
    std::string path;
    std::string etag;
    std::uint64_t size_bytes{0};
};

/// @brief Local filesystem object storage with atomic writes.
///
/// Objects live under `base_path` by key; part files live under
/// `temp_path/sessions/{session}` until they are composed or discarded.
class LocalStorage {
public:
    LocalStorage(std::string base_path, std::string temp_path);

    /// @brief Moves a fully written temp file into place as part `part_index`.
    core::Result<std::string> AdoptPart(const std::string& temp_path, const std::string& session_id,
                                        int part_index);
    /// @brief Concatenates parts 0..part_count-1 into the object at `key`.
    core::Result<StoredObject> ComposeObject(const std::string& key, const std::string& session_id,
                                             int part_count);
    core::Result<StoredObject> WriteObject(const std::string& key, const std::string& bytes);
    core::Result<StoredObject> StatObject(const std::string& key) const;
    core::Result<void> RemoveSessionParts(const std::string& session_id);

    /// @brief Temp file path for streamed writes; caller renames it into place.
    std::string NewTempPath() const;
    std::string ObjectPath(const std::string& key) const;
    std::string PartPath(const std::string& session_id, int part_index) const;
    std::string SessionDir(const std::string& session_id) const;

    const std::string& base_path() const { return base_path_; }
    const std::string& temp_path() const { return temp_path_; }

    /// @brief Identifier segment check: [A-Za-z0-9._-], 1..255 chars, not "." or "..".
    static bool IsSafeName(const std::string& name);
    static std::string ObjectKey(const std::string& organization_id, const std::string& video_id);
    static std::string ThumbnailKey(const std::string& organization_id,
                                    const std::string& video_id);

private:
    std::string base_path_;
    std::string temp_path_;
};

}  // namespace vidlift::storage
