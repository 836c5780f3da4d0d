#include "vidlift/client/session_negotiator.h"

#include <sstream>

#include <Poco/JSON/Array.h>
#include <Poco/JSON/Object.h>
#include <Poco/JSON/Parser.h>
#include <Poco/Net/HTTPRequest.h>
#include <Poco/URI.h>

namespace vidlift::client {

namespace {

std::string Stringify(const Poco::JSON::Object::Ptr& obj) {
    std::stringstream ss;
    obj->stringify(ss);
    return ss.str();
}

std::string Encode(const std::string& segment) {
    std::string out;
    Poco::URI::encode(segment, "/?#&=", out);
    return out;
}

std::string Describe(const ApiResponse& response) {
    const auto detail = ApiClient::ParseErrorBody(response.body);
    std::string text = "HTTP " + std::to_string(response.status);
    if (!detail.code.empty()) {
        text += " " + detail.code;
    }
    if (!detail.message.empty()) {
        text += ": " + detail.message;
    }
    return text;
}

core::Error TransientOrProtocol(const ApiResponse& response, const std::string& what) {
    if (IsRetryableStatus(response.status)) {
        return core::Error{core::ErrorCode::kTransientNetwork, what + " failed: " + Describe(response)};
    }
    return core::Error{core::ErrorCode::kProtocol, what + " failed: " + Describe(response)};
}

std::vector<int> ReadIndexArray(const Poco::JSON::Array::Ptr& arr) {
    std::vector<int> out;
    if (!arr) {
        return out;
    }
    out.reserve(arr->size());
    for (std::size_t i = 0; i < arr->size(); ++i) {
        out.push_back(arr->getElement<int>(static_cast<unsigned int>(i)));
    }
    return out;
}

}  // namespace

HttpSessionNegotiator::HttpSessionNegotiator(std::shared_ptr<const ApiClient> client)
    : client_(std::move(client)) {}

std::string HttpSessionNegotiator::UploadPath(const VideoKey& video, const std::string& suffix) {
    return "/orgs/" + Encode(video.organization_id) + "/videos/" + Encode(video.video_id) +
           "/upload" + suffix;
}

core::Result<ApiResponse> HttpSessionNegotiator::PostJson(const std::string& path,
                                                          const std::string& body,
                                                          const CancellationToken& token) {
    ApiRequest request;
    request.method = Poco::Net::HTTPRequest::HTTP_POST;
    request.target = path;
    request.content_type = "application/json";
    request.body = body;
    return client_->Send(request, token);
}

core::Result<SessionGrant> HttpSessionNegotiator::Initialize(const InitRequest& init,
                                                             const CancellationToken& token) {
    Poco::JSON::Object::Ptr body = new Poco::JSON::Object();
    body->set("totalBytes", static_cast<Poco::UInt64>(init.total_bytes));
    body->set("partSize", static_cast<Poco::UInt64>(init.part_size));
    if (!init.file_name.empty()) {
        body->set("fileName", init.file_name);
    }
    if (!init.mime_type.empty()) {
        body->set("mimeType", init.mime_type);
    }
    if (!init.resume_session_id.empty()) {
        body->set("resumeSessionId", init.resume_session_id);
    }

    auto response = PostJson(UploadPath(init.video, "/init"), Stringify(body), token);
    if (!response.ok()) {
        return response.error();
    }
    const auto& res = response.value();
    if (res.status >= 400 && res.status < 500 && !IsRetryableStatus(res.status)) {
        return core::Error{core::ErrorCode::kSessionInit,
                           "session initialization rejected: " + Describe(res)};
    }
    if (res.status != 200) {
        return TransientOrProtocol(res, "session initialization");
    }

    try {
        Poco::JSON::Parser parser;
        auto root = parser.parse(res.body).extract<Poco::JSON::Object::Ptr>();
        SessionGrant grant;
        grant.session_id = root->getValue<std::string>("sessionId");
        grant.part_size = root->optValue<Poco::UInt64>("partSize", init.part_size);
        grant.expires_at = root->optValue<std::string>("expiresAt", "");
        auto parts = root->getArray("parts");
        if (!parts) {
            return core::Error{core::ErrorCode::kProtocol, "init response missing parts"};
        }
        for (std::size_t i = 0; i < parts->size(); ++i) {
            auto part = parts->getObject(static_cast<unsigned int>(i));
            if (!part) {
                return core::Error{core::ErrorCode::kProtocol, "invalid part destination"};
            }
            PartDestination destination;
            destination.index = part->getValue<int>("index");
            destination.url = part->getValue<std::string>("url");
            destination.expires_at = part->optValue<std::string>("expiresAt", "");
            grant.parts.push_back(std::move(destination));
        }
        grant.total_parts = root->optValue<int>("totalParts", static_cast<int>(grant.parts.size()));
        return grant;
    } catch (const Poco::Exception& ex) {
        return core::Error{core::ErrorCode::kProtocol,
                           "malformed init response: " + ex.displayText()};
    }
}

core::Result<void> HttpSessionNegotiator::ReportPartComplete(const VideoKey& video,
                                                             const std::string& session_id,
                                                             int part_index,
                                                             const std::string& checksum,
                                                             const CancellationToken& token) {
    Poco::JSON::Object::Ptr body = new Poco::JSON::Object();
    body->set("sessionId", session_id);
    body->set("checksum", checksum);

    auto response = PostJson(
        UploadPath(video, "/parts/" + std::to_string(part_index) + "/complete"),
        Stringify(body), token);
    if (!response.ok()) {
        return response.error();
    }
    const auto& res = response.value();
    if (res.status >= 200 && res.status < 300) {
        return core::Ok();
    }
    if (res.status == 409 || res.status == 404) {
        return core::Error{core::ErrorCode::kConflict,
                           "part " + std::to_string(part_index) + " report refused: " +
                               Describe(res)};
    }
    return TransientOrProtocol(res, "part report");
}

core::Result<FinalizeResult> HttpSessionNegotiator::Finalize(const VideoKey& video,
                                                             const std::string& session_id,
                                                             std::vector<int>* missing_part_indexes,
                                                             const CancellationToken& token) {
    Poco::JSON::Object::Ptr body = new Poco::JSON::Object();
    body->set("sessionId", session_id);

    auto response = PostJson(UploadPath(video, "/complete"), Stringify(body), token);
    if (!response.ok()) {
        return response.error();
    }
    const auto& res = response.value();
    if (res.status == 409 || res.status == 404) {
        const auto detail = ApiClient::ParseErrorBody(res.body);
        if (detail.code == "INCOMPLETE_PARTS") {
            if (missing_part_indexes) {
                try {
                    Poco::JSON::Parser parser;
                    auto root = parser.parse(res.body).extract<Poco::JSON::Object::Ptr>();
                    auto error = root->getObject("error");
                    Poco::JSON::Array::Ptr missing;
                    if (error) {
                        missing = error->getArray("missingPartIndexes");
                    }
                    *missing_part_indexes = ReadIndexArray(missing);
                } catch (const Poco::Exception&) {
                    missing_part_indexes->clear();
                }
            }
            return core::Error{core::ErrorCode::kIncompleteParts,
                               "server is missing parts: " + Describe(res)};
        }
        return core::Error{core::ErrorCode::kConflict, "finalize refused: " + Describe(res)};
    }
    if (res.status != 200) {
        return TransientOrProtocol(res, "finalize");
    }

    try {
        Poco::JSON::Parser parser;
        auto root = parser.parse(res.body).extract<Poco::JSON::Object::Ptr>();
        FinalizeResult result;
        result.object_location = root->getValue<std::string>("objectLocation");
        result.size_bytes = root->optValue<Poco::UInt64>("sizeBytes", 0);
        result.etag = root->optValue<std::string>("etag", "");
        return result;
    } catch (const Poco::Exception& ex) {
        return core::Error{core::ErrorCode::kProtocol,
                           "malformed finalize response: " + ex.displayText()};
    }
}

core::Result<SessionStatus> HttpSessionNegotiator::QueryStatus(const VideoKey& video,
                                                               const CancellationToken& token) {
    ApiRequest request;
    request.method = Poco::Net::HTTPRequest::HTTP_GET;
    request.target = UploadPath(video, "/status");
    auto response = client_->Send(request, token);
    if (!response.ok()) {
        return response.error();
    }
    const auto& res = response.value();
    if (res.status == 404) {
        return core::Error{core::ErrorCode::kNotFound, "no upload session for video"};
    }
    if (res.status != 200) {
        return TransientOrProtocol(res, "status query");
    }

    try {
        Poco::JSON::Parser parser;
        auto root = parser.parse(res.body).extract<Poco::JSON::Object::Ptr>();
        SessionStatus status;
        status.session_id = root->getValue<std::string>("sessionId");
        status.completed_part_indexes = ReadIndexArray(root->getArray("completedPartIndexes"));
        status.part_size = root->optValue<Poco::UInt64>("partSize", 0);
        status.total_parts = root->optValue<int>("totalParts", 0);
        status.total_bytes = root->optValue<Poco::UInt64>("totalBytes", 0);
        status.expires_at = root->optValue<std::string>("expiresAt", "");
        return status;
    } catch (const Poco::Exception& ex) {
        return core::Error{core::ErrorCode::kProtocol,
                           "malformed status response: " + ex.displayText()};
    }
}

core::Result<void> HttpSessionNegotiator::Abort(const VideoKey& video,
                                                const std::string& session_id,
                                                const CancellationToken& token) {
    Poco::JSON::Object::Ptr body = new Poco::JSON::Object();
    body->set("sessionId", session_id);
    auto response = PostJson(UploadPath(video, "/abort"), Stringify(body), token);
    if (!response.ok()) {
        return response.error();
    }
    const auto& res = response.value();
    if (res.status >= 200 && res.status < 300) {
        return core::Ok();
    }
    if (res.status == 404 || res.status == 409) {
        return core::Error{core::ErrorCode::kNotFound, "nothing to abort: " + Describe(res)};
    }
    return TransientOrProtocol(res, "abort");
}

}  // namespace vidlift::client
