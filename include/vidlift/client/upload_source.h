#pragma once

#include <cstdint>
#include <memory>
#include <optional>
#include <string>

#include "vidlift/core/result.h"

namespace vidlift::client {

/// @brief Read-only handle on the file being uploaded.
///
/// Entries keep the source alive for as long as a retry may need it. Implementations must
/// allow concurrent `Read` calls from several part workers.
class UploadSource {
public:
    virtual ~UploadSource() = default;

    virtual const std::string& name() const = 0;
    virtual std::uint64_t size() const = 0;
    virtual const std::string& mime_type() const = 0;
    /// @brief Reads `[offset, offset + length)`; fails if the range is out of bounds.
    virtual core::Result<std::string> Read(std::uint64_t offset, std::uint64_t length) const = 0;
    /// @brief Filesystem path when the bytes live in a file (used by thumbnail extraction).
    virtual std::optional<std::string> path() const { return std::nullopt; }
};

/// @brief Source backed by a file on disk.
class FileSource : public UploadSource {
public:
    static core::Result<std::shared_ptr<const FileSource>> Open(const std::string& path);

    const std::string& name() const override { return name_; }
    std::uint64_t size() const override { return size_; }
    const std::string& mime_type() const override { return mime_type_; }
    core::Result<std::string> Read(std::uint64_t offset, std::uint64_t length) const override;
    std::optional<std::string> path() const override { return path_; }

private:
    FileSource(std::string path, std::string name, std::uint64_t size, std::string mime_type);

    std::string path_;
    std::string name_;
    std::uint64_t size_{0};
    std::string mime_type_;
};

/// @brief Source backed by an in-memory buffer.
class MemorySource : public UploadSource {
public:
    MemorySource(std::string name, std::string data, std::string mime_type = "");

    const std::string& name() const override { return name_; }
    std::uint64_t size() const override { return data_.size(); }
    const std::string& mime_type() const override { return mime_type_; }
    core::Result<std::string> Read(std::uint64_t offset, std::uint64_t length) const override;

private:
    std::string name_;
    std::string data_;
    std::string mime_type_;
};

/// @brief Video MIME type inferred from the file extension, "application/octet-stream" if unknown.
std::string MimeTypeForFileName(const std::string& file_name);

}  // namespace vidlift::client
