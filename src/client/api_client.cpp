#include "vidlift/client/api_client.h"

#include <memory>
#include <mutex>

#include <Poco/Exception.h>
#include <Poco/JSON/Object.h>
#include <Poco/JSON/Parser.h>
#include <Poco/Net/Context.h>
#include <Poco/Net/HTTPClientSession.h>
#include <Poco/Net/HTTPResponse.h>
#include <Poco/Net/HTTPSClientSession.h>
#include <Poco/Net/NetException.h>
#include <Poco/Net/RejectCertificateHandler.h>
#include <Poco/Net/SSLManager.h>
#include <Poco/StreamCopier.h>
#include <Poco/Timespan.h>
#include <Poco/URI.h>

namespace vidlift::client {

namespace {

bool IsAbsoluteUrl(const std::string& target) {
    return target.rfind("http://", 0) == 0 || target.rfind("https://", 0) == 0;
}

std::unique_ptr<Poco::Net::HTTPClientSession> MakeSession(const Poco::URI& uri) {
    const bool is_https = uri.getScheme() == "https";
    const auto port = uri.getPort() > 0 ? uri.getPort()
                                        : static_cast<Poco::UInt16>(is_https ? 443 : 80);
    if (is_https) {
        // Initialize Poco SSL once for HTTPS endpoints.
        static std::once_flag ssl_once;
        std::call_once(ssl_once, []() {
            Poco::Net::initializeSSL();
            Poco::Net::Context::Ptr context =
                new Poco::Net::Context(Poco::Net::Context::CLIENT_USE, "", "", "",
                                       Poco::Net::Context::VERIFY_STRICT);
            Poco::SharedPtr<Poco::Net::InvalidCertificateHandler> handler(
                new Poco::Net::RejectCertificateHandler(false));
            Poco::Net::SSLManager::instance().initializeClient(nullptr, handler, context);
        });
        return std::make_unique<Poco::Net::HTTPSClientSession>(uri.getHost(), port);
    }
    return std::make_unique<Poco::Net::HTTPClientSession>(uri.getHost(), port);
}

std::string StripQuotes(const std::string& value) {
    if (value.size() >= 2 && value.front() == '"' && value.back() == '"') {
        return value.substr(1, value.size() - 2);
    }
    return value;
}

}  // namespace

ApiClient::ApiClient(core::ApiConfig config) : config_(std::move(config)) {}

std::string ApiClient::ResolveUrl(const std::string& target) const {
    if (IsAbsoluteUrl(target)) {
        return target;
    }
    std::string base = config_.base_url;
    while (!base.empty() && base.back() == '/') {
        base.pop_back();
    }
    if (!target.empty() && target.front() != '/') {
        return base + "/" + target;
    }
    return base + target;
}

core::Result<ApiResponse> ApiClient::Send(const ApiRequest& request,
                                          const CancellationToken& token) const {
    if (token.IsCancelled()) {
        return core::Error{core::ErrorCode::kCancelled, "request cancelled"};
    }

    const bool api_call = !IsAbsoluteUrl(request.target);
    try {
        Poco::URI uri(ResolveUrl(request.target));
        auto session = MakeSession(uri);
        session->setTimeout(Poco::Timespan(config_.timeout_seconds, 0));
        CancellationRegistration abort_on_cancel(token, [&session]() { session->abort(); });

        const std::string path = uri.getPathEtc().empty() ? "/" : uri.getPathEtc();
        Poco::Net::HTTPRequest req(request.method, path, Poco::Net::HTTPMessage::HTTP_1_1);
        req.set("User-Agent", config_.user_agent);
        // Credentials go only to the Upload API, never to signed part destinations.
        if (api_call && !config_.session_cookie.empty()) {
            req.set("Cookie", config_.session_cookie);
        }
        if (!request.content_type.empty()) {
            req.setContentType(request.content_type);
        }
        if (request.write_body) {
            if (request.content_length) {
                req.setContentLength64(static_cast<Poco::Int64>(*request.content_length));
            }
        } else {
            req.setContentLength64(static_cast<Poco::Int64>(request.body.size()));
        }
        if (request.prepare) {
            request.prepare(req);
        }

        std::ostream& os = session->sendRequest(req);
        if (request.write_body) {
            auto written = request.write_body(os);
            if (!written.ok()) {
                return written.error();
            }
        } else {
            os << request.body;
        }
        os.flush();
        if (!os.good()) {
            if (token.IsCancelled()) {
                return core::Error{core::ErrorCode::kCancelled, "request cancelled"};
            }
            return core::Error{core::ErrorCode::kTransientNetwork,
                               "connection lost while sending request body"};
        }

        Poco::Net::HTTPResponse res;
        std::istream& rs = session->receiveResponse(res);
        ApiResponse response;
        response.status = static_cast<int>(res.getStatus());
        response.etag = StripQuotes(res.get("ETag", ""));
        response.content_type = res.getContentType();
        Poco::StreamCopier::copyToString(rs, response.body);
        if (token.IsCancelled()) {
            return core::Error{core::ErrorCode::kCancelled, "request cancelled"};
        }
        return response;
    } catch (const Poco::TimeoutException& ex) {
        if (token.IsCancelled()) {
            return core::Error{core::ErrorCode::kCancelled, "request cancelled"};
        }
        return core::Error{core::ErrorCode::kTransientNetwork, "timeout: " + ex.displayText()};
    } catch (const Poco::Net::NetException& ex) {
        if (token.IsCancelled()) {
            return core::Error{core::ErrorCode::kCancelled, "request cancelled"};
        }
        return core::Error{core::ErrorCode::kTransientNetwork, ex.displayText()};
    } catch (const Poco::IOException& ex) {
        if (token.IsCancelled()) {
            return core::Error{core::ErrorCode::kCancelled, "request cancelled"};
        }
        return core::Error{core::ErrorCode::kTransientNetwork, ex.displayText()};
    } catch (const Poco::Exception& ex) {
        if (token.IsCancelled()) {
            return core::Error{core::ErrorCode::kCancelled, "request cancelled"};
        }
        return core::Error{core::ErrorCode::kInternal, ex.displayText()};
    }
}

ApiErrorBody ApiClient::ParseErrorBody(const std::string& body) {
    ApiErrorBody out;
    try {
        Poco::JSON::Parser parser;
        auto root = parser.parse(body).extract<Poco::JSON::Object::Ptr>();
        auto error = root->getObject("error");
        if (error) {
            out.code = error->optValue<std::string>("code", "");
            out.message = error->optValue<std::string>("message", "");
        }
    } catch (const Poco::Exception&) {
        // Non-JSON bodies (proxies, load balancers) leave the fields empty.
    }
    return out;
}

bool IsRetryableStatus(int status) {
    return status == 408 || status == 429 || status >= 500;
}

}  // namespace vidlift::client
