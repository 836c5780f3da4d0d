#include "vidlift/client/active_upload_ledger.h"

#include <filesystem>
#include <fstream>
#include <sstream>
#include <system_error>

#include <Poco/Exception.h>
#include <Poco/JSON/Array.h>
#include <Poco/JSON/Object.h>
#include <Poco/JSON/Parser.h>
#include <Poco/JSON/Stringifier.h>
#include <Poco/UUIDGenerator.h>

namespace vidlift::client {

namespace {

core::Result<Poco::JSON::Object::Ptr> LoadDocument(const std::string& path) {
    Poco::JSON::Object::Ptr document = new Poco::JSON::Object();
    std::error_code ec;
    if (!std::filesystem::exists(path, ec)) {
        return document;
    }
    std::ifstream in(path, std::ios::binary);
    if (!in.is_open()) {
        return core::Error{core::ErrorCode::kIoError, "failed to open " + path};
    }
    std::ostringstream contents;
    contents << in.rdbuf();
    if (contents.str().empty()) {
        return document;
    }
    try {
        Poco::JSON::Parser parser;
        auto parsed = parser.parse(contents.str());
        auto object = parsed.extract<Poco::JSON::Object::Ptr>();
        if (object) {
            return object;
        }
    } catch (const Poco::Exception& ex) {
        return core::Error{core::ErrorCode::kIoError, "corrupt ledger " + path + ": " + ex.displayText()};
    }
    return core::Error{core::ErrorCode::kIoError, "ledger " + path + " is not a JSON object"};
}

}  // namespace

ActiveUploadLedger::ActiveUploadLedger(std::string path) : path_(std::move(path)) {}

core::Result<void> ActiveUploadLedger::Write(const std::vector<ActiveUpload>& uploads) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto loaded = LoadDocument(path_);
    Poco::JSON::Object::Ptr document = new Poco::JSON::Object();
    // A corrupt file is replaced rather than blocking the record.
    if (loaded.ok()) {
        document = loaded.value();
    }

    if (uploads.empty()) {
        document->remove(kStorageKey);
    } else {
        Poco::JSON::Array::Ptr entries = new Poco::JSON::Array();
        for (const auto& upload : uploads) {
            Poco::JSON::Object::Ptr entry = new Poco::JSON::Object();
            entry->set("videoId", upload.video_id);
            entry->set("organizationId", upload.organization_id);
            entries->add(entry);
        }
        document->set(kStorageKey, entries);
    }

    std::error_code ec;
    if (document->size() == 0) {
        std::filesystem::remove(path_, ec);
        if (ec) {
            return core::Error{core::ErrorCode::kIoError, "failed to remove " + path_ + ": " + ec.message()};
        }
        return core::Ok();
    }

    const auto target = std::filesystem::path(path_);
    if (target.has_parent_path()) {
        std::filesystem::create_directories(target.parent_path(), ec);
        if (ec) {
            return core::Error{core::ErrorCode::kIoError, "failed to create " +
                                                              target.parent_path().string()};
        }
    }
    const auto temp_path =
        target.string() + "." + Poco::UUIDGenerator().createOne().toString() + ".tmp";
    {
        std::ofstream out(temp_path, std::ios::binary | std::ios::trunc);
        if (!out.is_open()) {
            return core::Error{core::ErrorCode::kIoError, "failed to open temp file"};
        }
        Poco::JSON::Stringifier::stringify(document, out);
        out.flush();
        if (!out) {
            std::filesystem::remove(temp_path, ec);
            return core::Error{core::ErrorCode::kIoError, "failed to write " + temp_path};
        }
    }
    std::filesystem::rename(temp_path, target, ec);
    if (ec) {
        std::error_code ignored;
        std::filesystem::remove(temp_path, ignored);
        return core::Error{core::ErrorCode::kIoError, "failed to replace " + path_ + ": " + ec.message()};
    }
    return core::Ok();
}

core::Result<std::vector<ActiveUpload>> ActiveUploadLedger::Read() const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto loaded = LoadDocument(path_);
    if (!loaded.ok()) {
        return loaded.error();
    }
    std::vector<ActiveUpload> uploads;
    auto entries = loaded.value()->getArray(kStorageKey);
    if (!entries) {
        return uploads;
    }
    for (std::size_t i = 0; i < entries->size(); ++i) {
        auto entry = entries->getObject(static_cast<unsigned int>(i));
        if (!entry) {
            continue;
        }
        ActiveUpload upload;
        upload.video_id = entry->optValue<std::string>("videoId", "");
        upload.organization_id = entry->optValue<std::string>("organizationId", "");
        if (!upload.video_id.empty()) {
            uploads.push_back(std::move(upload));
        }
    }
    return uploads;
}

}  // namespace vidlift::client
