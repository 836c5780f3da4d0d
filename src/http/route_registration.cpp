#include "vidlift/http/route_registration.h"

#include <istream>
#include <optional>
#include <sstream>
#include <string>

#include <Poco/Exception.h>
#include <Poco/JSON/Array.h>
#include <Poco/JSON/Object.h>
#include <Poco/JSON/Parser.h>
#include <Poco/Net/HTMLForm.h>
#include <Poco/Net/HTTPRequest.h>
#include <Poco/Net/MessageHeader.h>
#include <Poco/Net/NameValueCollection.h>
#include <Poco/Net/PartHandler.h>
#include <Poco/NullStream.h>
#include <Poco/StreamCopier.h>

#include "vidlift/http/responses.h"
#include "vidlift/observability/metrics.h"
#include "vidlift/server/upload_service.h"

namespace vidlift::http {
namespace {

namespace beast_http = boost::beast::http;

constexpr const char* kVideoNotFound = "VIDEO_NOT_FOUND";
constexpr const char* kSessionNotFound = "SESSION_NOT_FOUND";

std::optional<int> ParseIndex(const std::string& value) {
    if (value.empty()) {
        return std::nullopt;
    }
    try {
        size_t consumed = 0;
        int parsed = std::stoi(value, &consumed);
        if (consumed != value.size() || parsed < 0) {
            return std::nullopt;
        }
        return parsed;
    } catch (const std::exception&) {
        return std::nullopt;
    }
}

Poco::JSON::Object::Ptr ParseObject(const std::string& body) {
    Poco::JSON::Parser parser;
    auto result = parser.parse(body);
    return result.extract<Poco::JSON::Object::Ptr>();
}

HttpResponse InvalidJson(const HttpRequest& req, const RequestContext& ctx,
                         const std::string& message) {
    return JsonError(req.version(), "INVALID_JSON", message, ctx.request_id,
                     beast_http::status::bad_request);
}

Poco::JSON::Object::Ptr VideoJson(const metadata::VideoRecord& video) {
    Poco::JSON::Object::Ptr obj = new Poco::JSON::Object();
    obj->set("videoId", video.video_id);
    obj->set("organizationId", video.organization_id);
    obj->set("status", video.status);
    obj->set("objectLocation", video.object_location);
    obj->set("sizeBytes", static_cast<Poco::UInt64>(video.size_bytes));
    obj->set("etag", video.etag);
    obj->set("thumbnailKey", video.thumbnail_key);
    return obj;
}

Poco::JSON::Array::Ptr IndexArray(const std::vector<int>& indexes) {
    Poco::JSON::Array::Ptr arr = new Poco::JSON::Array();
    for (int index : indexes) {
        arr->add(index);
    }
    return arr;
}

/// Collects the `file` field of a multipart/form-data body.
class ThumbnailPartHandler : public Poco::Net::PartHandler {
public:
    void handlePart(const Poco::Net::MessageHeader& header, std::istream& stream) override {
        std::string disposition;
        Poco::Net::NameValueCollection params;
        Poco::Net::MessageHeader::splitParameters(header.get("Content-Disposition", ""),
                                                  disposition, params);
        if (params.get("name", "") != "file" || found_) {
            Poco::NullOutputStream sink;
            Poco::StreamCopier::copyStream(stream, sink);
            return;
        }
        found_ = true;
        content_type_ = header.get("Content-Type", "application/octet-stream");
        Poco::StreamCopier::copyToString(stream, data_);
    }

    bool found() const { return found_; }
    const std::string& content_type() const { return content_type_; }
    const std::string& data() const { return data_; }

private:
    bool found_{false};
    std::string content_type_;
    std::string data_;
};

}  // namespace

void RegisterDefaultRoutes(Router& router, std::shared_ptr<server::UploadService> service) {
    router.Add("GET", "/healthz",
               [](const RequestContext& ctx, const HttpRequest& req, const RouteParams&) {
                   return JsonOk(req.version(),
                                 "{\"status\":\"ok\",\"request_id\":\"" + ctx.request_id + "\"}");
               });

    router.Add("GET", "/readyz",
               [](const RequestContext& ctx, const HttpRequest& req, const RouteParams&) {
                   return JsonOk(req.version(),
                                 "{\"status\":\"ready\",\"request_id\":\"" + ctx.request_id + "\"}");
               });

    router.Add("GET", "/metrics",
               [](const RequestContext&, const HttpRequest& req, const RouteParams&) {
                   HttpResponse response{beast_http::status::ok, req.version()};
                   response.set(beast_http::field::content_type, "text/plain");
                   response.body() = observability::RenderMetrics();
                   response.prepare_payload();
                   return response;
               });

    router.Add("PUT", "/orgs/{org}/videos/{video}",
               [service](const RequestContext& ctx, const HttpRequest& req,
                         const RouteParams& params) {
                   auto video = service->RegisterVideo(params.at("org"), params.at("video"));
                   if (!video.ok()) {
                       return ServiceErrorResponse(req.version(), video.error(), ctx.request_id,
                                                   kVideoNotFound);
                   }
                   Poco::JSON::Object::Ptr root = new Poco::JSON::Object();
                   root->set("videoId", video.value().video_id);
                   root->set("organizationId", video.value().organization_id);
                   root->set("status", video.value().status);
                   return JsonOk(req.version(), root);
               });

    router.Add("GET", "/orgs/{org}/videos/{video}",
               [service](const RequestContext& ctx, const HttpRequest& req,
                         const RouteParams& params) {
                   auto video = service->GetVideo(params.at("org"), params.at("video"));
                   if (!video.ok()) {
                       return ServiceErrorResponse(req.version(), video.error(), ctx.request_id,
                                                   kVideoNotFound);
                   }
                   return JsonOk(req.version(), VideoJson(video.value()));
               });

    router.Add("POST", "/orgs/{org}/videos/{video}/upload/init",
               [service](const RequestContext& ctx, const HttpRequest& req,
                         const RouteParams& params) {
                   server::InitSessionRequest init;
                   init.organization_id = params.at("org");
                   init.video_id = params.at("video");
                   try {
                       auto obj = ParseObject(req.body());
                       init.total_bytes = obj->getValue<Poco::UInt64>("totalBytes");
                       init.part_size = obj->optValue<Poco::UInt64>("partSize", 0);
                       init.file_name = obj->optValue<std::string>("fileName", "");
                       init.mime_type = obj->optValue<std::string>("mimeType", "");
                       init.resume_session_id = obj->optValue<std::string>("resumeSessionId", "");
                   } catch (const Poco::Exception& ex) {
                       return InvalidJson(req, ctx, ex.displayText());
                   }

                   auto issued = service->InitializeSession(init);
                   if (!issued.ok()) {
                       return ServiceErrorResponse(req.version(), issued.error(), ctx.request_id,
                                                   kVideoNotFound);
                   }
                   const auto& session = issued.value();
                   Poco::JSON::Array::Ptr parts = new Poco::JSON::Array();
                   for (const auto& grant : session.parts) {
                       Poco::JSON::Object::Ptr item = new Poco::JSON::Object();
                       item->set("index", grant.index);
                       item->set("url", grant.url);
                       item->set("expiresAt", grant.expires_at);
                       parts->add(item);
                   }
                   Poco::JSON::Object::Ptr root = new Poco::JSON::Object();
                   root->set("sessionId", session.session_id);
                   root->set("partSize", static_cast<Poco::UInt64>(session.part_size));
                   root->set("totalParts", session.total_parts);
                   root->set("expiresAt", session.expires_at);
                   root->set("resumed", session.resumed);
                   root->set("parts", parts);
                   return JsonOk(req.version(), root);
               });

    router.Add("POST", "/orgs/{org}/videos/{video}/upload/parts/{index}/complete",
               [service](const RequestContext& ctx, const HttpRequest& req,
                         const RouteParams& params) {
                   auto index = ParseIndex(params.at("index"));
                   if (!index) {
                       return JsonError(req.version(), "INVALID_ARGUMENT",
                                        "part index must be a non-negative integer",
                                        ctx.request_id, beast_http::status::bad_request);
                   }
                   std::string session_id;
                   std::string checksum;
                   try {
                       auto obj = ParseObject(req.body());
                       session_id = obj->getValue<std::string>("sessionId");
                       checksum = obj->getValue<std::string>("checksum");
                   } catch (const Poco::Exception& ex) {
                       return InvalidJson(req, ctx, ex.displayText());
                   }

                   auto reported = service->ReportPartComplete(params.at("org"),
                                                               params.at("video"), session_id,
                                                               *index, checksum);
                   if (!reported.ok()) {
                       return ServiceErrorResponse(req.version(), reported.error(),
                                                   ctx.request_id, kVideoNotFound);
                   }
                   HttpResponse response{beast_http::status::no_content, req.version()};
                   response.prepare_payload();
                   return response;
               });

    router.Add("POST", "/orgs/{org}/videos/{video}/upload/complete",
               [service](const RequestContext& ctx, const HttpRequest& req,
                         const RouteParams& params) {
                   std::string session_id;
                   try {
                       auto obj = ParseObject(req.body());
                       session_id = obj->getValue<std::string>("sessionId");
                   } catch (const Poco::Exception& ex) {
                       return InvalidJson(req, ctx, ex.displayText());
                   }

                   std::vector<int> missing;
                   auto finalized = service->FinalizeSession(params.at("org"), params.at("video"),
                                                             session_id, &missing);
                   if (!finalized.ok()) {
                       if (finalized.error().code == core::ErrorCode::kIncompleteParts) {
                           Poco::JSON::Object::Ptr extra = new Poco::JSON::Object();
                           extra->set("missingPartIndexes", IndexArray(missing));
                           return JsonError(req.version(), "INCOMPLETE_PARTS",
                                            finalized.error().message, ctx.request_id,
                                            beast_http::status::conflict, extra);
                       }
                       return ServiceErrorResponse(req.version(), finalized.error(),
                                                   ctx.request_id, kVideoNotFound);
                   }
                   Poco::JSON::Object::Ptr root = new Poco::JSON::Object();
                   root->set("objectLocation", finalized.value().object_location);
                   root->set("sizeBytes", static_cast<Poco::UInt64>(finalized.value().size_bytes));
                   root->set("etag", finalized.value().etag);
                   return JsonOk(req.version(), root);
               });

    router.Add("GET", "/orgs/{org}/videos/{video}/upload/status",
               [service](const RequestContext& ctx, const HttpRequest& req,
                         const RouteParams& params) {
                   auto status = service->QueryStatus(params.at("org"), params.at("video"));
                   if (!status.ok()) {
                       return ServiceErrorResponse(req.version(), status.error(), ctx.request_id,
                                                   kSessionNotFound);
                   }
                   const auto& snapshot = status.value();
                   Poco::JSON::Object::Ptr root = new Poco::JSON::Object();
                   root->set("sessionId", snapshot.session_id);
                   root->set("completedPartIndexes", IndexArray(snapshot.completed_part_indexes));
                   root->set("partSize", static_cast<Poco::UInt64>(snapshot.part_size));
                   root->set("totalParts", snapshot.total_parts);
                   root->set("totalBytes", static_cast<Poco::UInt64>(snapshot.total_bytes));
                   root->set("expiresAt", snapshot.expires_at);
                   return JsonOk(req.version(), root);
               });

    router.Add("POST", "/orgs/{org}/videos/{video}/upload/abort",
               [service](const RequestContext& ctx, const HttpRequest& req,
                         const RouteParams& params) {
                   std::string session_id;
                   try {
                       auto obj = ParseObject(req.body());
                       session_id = obj->getValue<std::string>("sessionId");
                   } catch (const Poco::Exception& ex) {
                       return InvalidJson(req, ctx, ex.displayText());
                   }
                   auto aborted = service->AbortSession(params.at("org"), params.at("video"),
                                                        session_id);
                   if (!aborted.ok()) {
                       return ServiceErrorResponse(req.version(), aborted.error(), ctx.request_id,
                                                   kSessionNotFound);
                   }
                   return JsonOk(req.version(), "{\"aborted\":true}");
               });

    router.Add("POST", "/orgs/{org}/videos/{video}/upload/thumbnail",
               [service](const RequestContext& ctx, const HttpRequest& req,
                         const RouteParams& params) {
                   ThumbnailPartHandler handler;
                   try {
                       Poco::Net::HTTPRequest form_request(Poco::Net::HTTPRequest::HTTP_POST,
                                                           std::string(req.target()),
                                                           Poco::Net::HTTPMessage::HTTP_1_1);
                       form_request.setContentType(
                           std::string(req[beast_http::field::content_type]));
                       std::istringstream body(req.body());
                       Poco::Net::HTMLForm form;
                       form.load(form_request, body, handler);
                   } catch (const Poco::Exception& ex) {
                       return JsonError(req.version(), "INVALID_ARGUMENT",
                                        "malformed multipart body: " + ex.displayText(),
                                        ctx.request_id, beast_http::status::bad_request);
                   }
                   if (!handler.found()) {
                       return JsonError(req.version(), "INVALID_ARGUMENT",
                                        "multipart field 'file' is required", ctx.request_id,
                                        beast_http::status::bad_request);
                   }

                   auto stored = service->StoreThumbnail(params.at("org"), params.at("video"),
                                                         handler.content_type(), handler.data());
                   if (!stored.ok()) {
                       return ServiceErrorResponse(req.version(), stored.error(), ctx.request_id,
                                                   kVideoNotFound);
                   }
                   Poco::JSON::Object::Ptr root = new Poco::JSON::Object();
                   root->set("thumbnailKey", stored.value());
                   return JsonOk(req.version(), root);
               });
}

}  // namespace vidlift::http
