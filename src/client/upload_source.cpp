#include "vidlift/client/upload_source.h"

#include <cctype>
#include <filesystem>
#include <fstream>

namespace vidlift::client {

namespace {

core::Error OutOfRange(std::uint64_t offset, std::uint64_t length, std::uint64_t size) {
    return core::Error{core::ErrorCode::kInvalidArgument,
                       "range " + std::to_string(offset) + "+" + std::to_string(length) +
                           " exceeds source size " + std::to_string(size)};
}

}  // namespace

FileSource::FileSource(std::string path, std::string name, std::uint64_t size,
                       std::string mime_type)
    : path_(std::move(path)), name_(std::move(name)), size_(size),
      mime_type_(std::move(mime_type)) {}

core::Result<std::shared_ptr<const FileSource>> FileSource::Open(const std::string& path) {
    std::error_code ec;
    if (!std::filesystem::is_regular_file(path, ec)) {
        return core::Error{core::ErrorCode::kNotFound, "file not found: " + path};
    }
    const auto size = std::filesystem::file_size(path, ec);
    if (ec) {
        return core::Error{core::ErrorCode::kIoError, "failed to stat " + path + ": " + ec.message()};
    }
    const auto name = std::filesystem::path(path).filename().string();
    return std::shared_ptr<const FileSource>(
        new FileSource(path, name, static_cast<std::uint64_t>(size), MimeTypeForFileName(name)));
}

core::Result<std::string> FileSource::Read(std::uint64_t offset, std::uint64_t length) const {
    if (offset > size_ || length > size_ - offset) {
        return OutOfRange(offset, length, size_);
    }
    // One stream per call keeps concurrent part reads independent.
    std::ifstream in(path_, std::ios::binary);
    if (!in.is_open()) {
        return core::Error{core::ErrorCode::kIoError, "failed to open " + path_};
    }
    in.seekg(static_cast<std::streamoff>(offset));
    std::string out(static_cast<std::size_t>(length), '\0');
    if (length > 0) {
        in.read(&out[0], static_cast<std::streamsize>(length));
        if (in.gcount() != static_cast<std::streamsize>(length)) {
            return core::Error{core::ErrorCode::kIoError, "short read from " + path_};
        }
    }
    return out;
}

MemorySource::MemorySource(std::string name, std::string data, std::string mime_type)
    : name_(std::move(name)), data_(std::move(data)), mime_type_(std::move(mime_type)) {
    if (mime_type_.empty()) {
        mime_type_ = MimeTypeForFileName(name_);
    }
}

core::Result<std::string> MemorySource::Read(std::uint64_t offset, std::uint64_t length) const {
    const auto size = static_cast<std::uint64_t>(data_.size());
    if (offset > size || length > size - offset) {
        return OutOfRange(offset, length, size);
    }
    return data_.substr(static_cast<std::size_t>(offset), static_cast<std::size_t>(length));
}

std::string MimeTypeForFileName(const std::string& file_name) {
    const auto dot = file_name.rfind('.');
    if (dot == std::string::npos) {
        return "application/octet-stream";
    }
    std::string ext = file_name.substr(dot + 1);
    for (auto& c : ext) {
        c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
    }
    if (ext == "mp4") {
        return "video/mp4";
    }
    if (ext == "webm") {
        return "video/webm";
    }
    if (ext == "mov") {
        return "video/quicktime";
    }
    if (ext == "avi") {
        return "video/x-msvideo";
    }
    if (ext == "mkv") {
        return "video/x-matroska";
    }
    return "application/octet-stream";
}

}  // namespace vidlift::client
