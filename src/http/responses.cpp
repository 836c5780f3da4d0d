#include "vidlift/http/responses.h"

#include <sstream>

namespace vidlift::http {

namespace {
namespace http = boost::beast::http;
}  // namespace

StringResponse JsonOk(int version, const std::string& body) {
    StringResponse response{http::status::ok, version};
    response.set(http::field::content_type, "application/json");
    response.body() = body;
    response.prepare_payload();
    return response;
}

StringResponse JsonOk(int version, const Poco::JSON::Object::Ptr& body) {
    std::stringstream ss;
    body->stringify(ss);
    return JsonOk(version, ss.str());
}

StringResponse JsonError(int version, const std::string& code, const std::string& message,
                         const std::string& request_id, http::status status,
                         const Poco::JSON::Object::Ptr& extra) {
    Poco::JSON::Object::Ptr error = new Poco::JSON::Object();
    error->set("code", code);
    error->set("message", message);
    error->set("request_id", request_id);
    if (!extra.isNull()) {
        for (const auto& member : *extra) {
            error->set(member.first, member.second);
        }
    }
    Poco::JSON::Object::Ptr root = new Poco::JSON::Object();
    root->set("error", error);

    std::stringstream ss;
    root->stringify(ss);
    StringResponse response{status, version};
    response.set(http::field::content_type, "application/json");
    response.body() = ss.str();
    response.prepare_payload();
    return response;
}

StringResponse ServiceErrorResponse(int version, const core::Error& error,
                                    const std::string& request_id,
                                    const std::string& not_found_code) {
    switch (error.code) {
        case core::ErrorCode::kNotFound:
            return JsonError(version, not_found_code, error.message, request_id,
                             http::status::not_found);
        case core::ErrorCode::kInvalidArgument:
            return JsonError(version, "INVALID_ARGUMENT", error.message, request_id,
                             http::status::bad_request);
        case core::ErrorCode::kConflict:
            return JsonError(version, "SESSION_CONFLICT", error.message, request_id,
                             http::status::conflict);
        case core::ErrorCode::kIncompleteParts:
            return JsonError(version, "INCOMPLETE_PARTS", error.message, request_id,
                             http::status::conflict);
        case core::ErrorCode::kFailedPrecondition:
            return JsonError(version, "INVALID_STATE", error.message, request_id,
                             http::status::conflict);
        case core::ErrorCode::kAlreadyExists:
            return JsonError(version, "ALREADY_EXISTS", error.message, request_id,
                             http::status::conflict);
        case core::ErrorCode::kForbidden:
            return JsonError(version, "DESTINATION_REJECTED", error.message, request_id,
                             http::status::forbidden);
        case core::ErrorCode::kIoError:
            return JsonError(version, "IO_ERROR", error.message, request_id,
                             http::status::internal_server_error);
        case core::ErrorCode::kDbError:
            return JsonError(version, "DB_ERROR", error.message, request_id,
                             http::status::internal_server_error);
        default:
            return JsonError(version, "INTERNAL", error.message, request_id,
                             http::status::internal_server_error);
    }
}

}  // namespace vidlift::http
