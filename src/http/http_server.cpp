#include "vidlift/http/http_server.h"

#include <algorithm>
#include <array>
#include <chrono>
#include <filesystem>
#include <memory>
#include <optional>
#include <sstream>
#include <string>
#include <system_error>
#include <type_traits>

#include <Poco/DigestEngine.h>
#include <Poco/SHA2Engine.h>

#include <boost/asio/bind_executor.hpp>
#include <boost/asio/dispatch.hpp>
#include <boost/asio/ip/tcp.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/http.hpp>
#include <boost/beast/ssl.hpp>

#include <fcntl.h>
#include <unistd.h>

#include "vidlift/core/ids.h"
#include "vidlift/core/logger.h"
#include "vidlift/http/responses.h"
#include "vidlift/observability/metrics.h"

namespace {
namespace beast = boost::beast;
namespace http = beast::http;
namespace net = boost::asio;
using tcp = net::ip::tcp;

constexpr std::size_t kBufferSize = 65536;
constexpr const char* kPartPattern = "/parts/{session}/{index}";
constexpr const char* kObjectPattern = "/orgs/{org}/videos/{video}/object";

struct RangeRequest {
    std::uint64_t start{0};
    std::uint64_t end{0};
};

std::string StripQuery(const std::string& target) {
    auto pos = target.find('?');
    if (pos == std::string::npos) {
        return target;
    }
    return target.substr(0, pos);
}

std::string GetQueryParam(const std::string& target, const std::string& key) {
    auto pos = target.find('?');
    if (pos == std::string::npos) {
        return "";
    }
    auto query = target.substr(pos + 1);
    std::stringstream ss(query);
    std::string item;
    while (std::getline(ss, item, '&')) {
        auto eq = item.find('=');
        if (eq == std::string::npos) {
            continue;
        }
        if (item.substr(0, eq) == key) {
            return item.substr(eq + 1);
        }
    }
    return "";
}

std::optional<int> ParseIndex(const std::string& value) {
    if (value.empty() ||
        !std::all_of(value.begin(), value.end(), [](char c) { return c >= '0' && c <= '9'; })) {
        return std::nullopt;
    }
    try {
        return std::stoi(value);
    } catch (const std::exception&) {
        return std::nullopt;
    }
}

std::optional<RangeRequest> ParseRange(const std::string& header, std::uint64_t size) {
    // We only accept byte ranges; other units are rejected early.
    if (header.rfind("bytes=", 0) != 0 || size == 0) {
        return std::nullopt;
    }
    auto range = header.substr(6);
    auto dash = range.find('-');
    if (dash == std::string::npos) {
        return std::nullopt;
    }
    std::string start_str = range.substr(0, dash);
    std::string end_str = range.substr(dash + 1);

    RangeRequest req;
    if (start_str.empty()) {
        return std::nullopt;
    }
    try {
        req.start = static_cast<std::uint64_t>(std::stoull(start_str));
        if (end_str.empty()) {
            req.end = size - 1;
        } else {
            req.end = std::min<std::uint64_t>(std::stoull(end_str), size - 1);
        }
    } catch (const std::exception&) {
        return std::nullopt;
    }
    if (req.start > req.end || req.start >= size) {
        return std::nullopt;
    }
    return req;
}

http::response<http::string_body> JsonResponse(http::status status, int version,
                                               const std::string& body) {
    http::response<http::string_body> response{status, version};
    response.set(http::field::content_type, "application/json");
    response.body() = body;
    response.prepare_payload();
    return response;
}

void RemoveFile(const std::string& path) {
    std::error_code ec;
    std::filesystem::remove(path, ec);
    if (ec) {
        vidlift::core::LogWarning("failed to remove " + path + ": " + ec.message());
    }
}

template <typename Stream>
class Session : public std::enable_shared_from_this<Session<Stream>> {
public:
    Session(Stream&& stream, vidlift::http::Router router, vidlift::core::Config config,
            std::shared_ptr<vidlift::server::UploadService> service,
            std::shared_ptr<vidlift::storage::LocalStorage> storage)
        : stream_(std::move(stream)),
          router_(std::move(router)),
          config_(std::move(config)),
          service_(std::move(service)),
          storage_(std::move(storage)) {
    }

    void Start() {
        // TLS handshake happens once per connection when enabled.
        if constexpr (std::is_same_v<Stream, beast::ssl_stream<beast::tcp_stream>>) {
            stream_.async_handshake(net::ssl::stream_base::server,
                                    beast::bind_front_handler(&Session::OnHandshake,
                                                              this->shared_from_this()));
        } else {
            DoReadHeader();
        }
    }

private:
    void OnHandshake(beast::error_code ec) {
        if (ec) {
            vidlift::core::LogError("TLS handshake failed: " + ec.message());
            return;
        }
        DoReadHeader();
    }

    void DoReadHeader() {
        parser_.emplace();
        // Part bodies may exceed the buffered-request limit; the tighter limit is applied
        // once the route is known.
        parser_->body_limit(std::max<std::uint64_t>(config_.server.limits.max_body_bytes,
                                                    config_.upload.max_part_size));
        http::async_read_header(stream_, buffer_, *parser_,
                                beast::bind_front_handler(&Session::OnReadHeader,
                                                          this->shared_from_this()));
    }

    void OnReadHeader(beast::error_code ec, std::size_t) {
        if (ec == http::error::end_of_stream) {
            return DoClose();
        }
        if (ec == http::error::body_limit) {
            BeginRequest();
            return SendAndClose(vidlift::http::JsonError(
                parser_->get().version(), "PAYLOAD_TOO_LARGE", "request body too large",
                request_id_, http::status::payload_too_large));
        }
        if (ec) {
            vidlift::core::LogError("Read header failed: " + ec.message());
            return;
        }

        BeginRequest();
        const auto target = request_target_;
        const auto path = StripQuery(target);
        const auto method = parser_->get().method();

        // Fast-path: stream part bodies directly to disk to avoid buffering large bodies.
        vidlift::http::RouteParams params;
        if (method == http::verb::put &&
            vidlift::http::Router::Match(kPartPattern, path, &params)) {
            return StartPartUpload(params["session"], params["index"], target);
        }

        const auto length = parser_->content_length();
        if (length && *length > config_.server.limits.max_body_bytes) {
            return SendAndClose(vidlift::http::JsonError(
                parser_->get().version(), "PAYLOAD_TOO_LARGE", "request body too large",
                request_id_, http::status::payload_too_large));
        }
        parser_->body_limit(config_.server.limits.max_body_bytes);

        if (parser_->is_done()) {
            body_.clear();
            return HandleRequest();
        }
        ReadBodyToString();
    }

    void BeginRequest() {
        request_id_ = vidlift::core::GenerateRequestId();
        request_start_ = std::chrono::steady_clock::now();
        request_method_ = std::string(parser_->get().method_string());
        request_target_ = std::string(parser_->get().target());
        request_remote_ = GetRemoteAddress();
    }

    void ReadBodyToString() {
        body_.clear();
        if (parser_->content_length() && parser_->content_length().value() == 0) {
            return HandleRequest();
        }
        DoReadBodyChunk();
    }

    void DoReadBodyChunk() {
        parser_->get().body().data = body_buffer_.data();
        parser_->get().body().size = body_buffer_.size();
        http::async_read(stream_, buffer_, *parser_,
                         beast::bind_front_handler(&Session::OnBodyChunk,
                                                   this->shared_from_this()));
    }

    void OnBodyChunk(beast::error_code ec, std::size_t) {
        if (ec && ec != http::error::need_buffer) {
            vidlift::core::LogError("Read body failed: " + ec.message());
            return;
        }
        const auto bytes = body_buffer_.size() - parser_->get().body().size;
        body_.append(body_buffer_.data(), bytes);
        if (parser_->is_done()) {
            return HandleRequest();
        }
        DoReadBodyChunk();
    }

    void HandleRequest() {
        // Convert buffer_body parser into a string_body request for routing handlers.
        vidlift::http::HttpRequest request;
        request.method(parser_->get().method());
        request.target(parser_->get().target());
        request.version(parser_->get().version());
        for (const auto& field : parser_->get()) {
            request.set(field.name(), field.value());
        }
        request.body() = body_;
        request.prepare_payload();

        vidlift::http::RequestContext ctx;
        ctx.request_id = request_id_;
        ctx.method = std::string(request.method_string());
        ctx.target = std::string(request.target());
        ctx.remote = request_remote_;

        const auto path = StripQuery(std::string(request.target()));
        vidlift::http::RouteParams params;
        if (request.method() == http::verb::get &&
            vidlift::http::Router::Match(kObjectPattern, path, &params)) {
            return HandleDownload(request, params["org"], params["video"]);
        }

        auto result = router_.Route(ctx, request);
        if (!result.ok()) {
            auto response = vidlift::http::JsonError(request.version(), "INTERNAL",
                                                     result.error().message, request_id_,
                                                     http::status::internal_server_error);
            return Send(std::move(response));
        }
        Send(std::move(result.value()));
    }

    void StartPartUpload(const std::string& session_id, const std::string& index_text,
                         const std::string& target) {
        const auto version = parser_->get().version();
        part_rejection_.reset();
        part_fd_ = -1;
        part_temp_path_.clear();

        auto index = ParseIndex(index_text);
        if (!index) {
            return RejectPart(vidlift::http::JsonError(version, "INVALID_ARGUMENT",
                                                       "invalid part index", request_id_,
                                                       http::status::bad_request));
        }
        auto authorized = service_->AuthorizePart(session_id, *index,
                                                  GetQueryParam(target, "expires"),
                                                  GetQueryParam(target, "sig"));
        if (!authorized.ok()) {
            return RejectPart(vidlift::http::ServiceErrorResponse(
                version, authorized.error(), request_id_, "SESSION_NOT_FOUND"));
        }
        const auto expected = authorized.value();
        const auto length = parser_->content_length();
        if (length && *length != expected) {
            return RejectPart(vidlift::http::JsonError(
                version, "INVALID_ARGUMENT",
                "part " + std::to_string(*index) + " must be " + std::to_string(expected) +
                    " bytes",
                request_id_, http::status::bad_request));
        }
        parser_->body_limit(config_.upload.max_part_size);

        part_session_ = session_id;
        part_index_ = *index;
        part_temp_path_ = storage_->NewTempPath();
        part_fd_ = ::open(part_temp_path_.c_str(), O_CREAT | O_WRONLY | O_TRUNC, 0644);
        if (part_fd_ < 0) {
            return RejectPart(vidlift::http::JsonError(version, "IO_ERROR",
                                                       "failed to open temp file", request_id_,
                                                       http::status::internal_server_error));
        }
        part_hasher_.emplace();
        part_total_ = 0;
        ContinuePartUpload();
    }

    // The body of a rejected part is still drained so the client reads the error response
    // instead of a reset connection.
    void RejectPart(http::response<http::string_body>&& response) {
        part_rejection_ = std::move(response);
        ContinuePartUpload();
    }

    void ContinuePartUpload() {
        if (parser_->is_done()) {
            return FinishPartUpload();
        }
        parser_->get().body().data = body_buffer_.data();
        parser_->get().body().size = body_buffer_.size();
        http::async_read(stream_, buffer_, *parser_,
                         beast::bind_front_handler(&Session::OnPartChunk,
                                                   this->shared_from_this()));
    }

    void OnPartChunk(beast::error_code ec, std::size_t) {
        if (ec && ec != http::error::need_buffer) {
            vidlift::core::LogError("Read part failed: " + ec.message());
            AbandonPartFile();
            if (ec == http::error::body_limit) {
                return SendAndClose(vidlift::http::JsonError(
                    parser_->get().version(), "PAYLOAD_TOO_LARGE", "part body too large",
                    request_id_, http::status::payload_too_large));
            }
            return;
        }
        const auto bytes = body_buffer_.size() - parser_->get().body().size;
        if (bytes > 0 && !part_rejection_) {
            std::size_t offset = 0;
            while (offset < bytes) {
                ssize_t written = ::write(part_fd_, body_buffer_.data() + offset, bytes - offset);
                if (written < 0) {
                    AbandonPartFile();
                    part_rejection_ = vidlift::http::JsonError(
                        parser_->get().version(), "IO_ERROR", "failed to write temp file",
                        request_id_, http::status::internal_server_error);
                    break;
                }
                offset += static_cast<std::size_t>(written);
            }
            if (!part_rejection_) {
                part_hasher_->update(body_buffer_.data(), static_cast<unsigned int>(bytes));
                part_total_ += static_cast<std::uint64_t>(bytes);
            }
        }
        ContinuePartUpload();
    }

    void FinishPartUpload() {
        if (part_rejection_) {
            auto response = std::move(*part_rejection_);
            part_rejection_.reset();
            return Send(std::move(response));
        }

        ::fsync(part_fd_);
        ::close(part_fd_);
        part_fd_ = -1;

        const auto checksum = Poco::DigestEngine::digestToHex(part_hasher_->digest());
        auto recorded = service_->RecordPartReceived(part_session_, part_index_, part_temp_path_,
                                                     part_total_, checksum);
        if (!recorded.ok()) {
            if (std::filesystem::exists(part_temp_path_)) {
                RemoveFile(part_temp_path_);
            }
            return Send(vidlift::http::ServiceErrorResponse(
                parser_->get().version(), recorded.error(), request_id_, "SESSION_NOT_FOUND"));
        }

        auto response = JsonResponse(http::status::ok, parser_->get().version(),
                                     "{\"index\":" + std::to_string(part_index_) +
                                         ",\"size\":" + std::to_string(part_total_) +
                                         ",\"etag\":\"" + checksum + "\"}");
        response.set(http::field::etag, "\"" + checksum + "\"");
        Send(std::move(response));
    }

    void AbandonPartFile() {
        if (part_fd_ >= 0) {
            ::close(part_fd_);
            part_fd_ = -1;
        }
        if (!part_temp_path_.empty()) {
            RemoveFile(part_temp_path_);
            part_temp_path_.clear();
        }
    }

    void HandleDownload(const vidlift::http::HttpRequest& request,
                        const std::string& organization_id, const std::string& video_id) {
        auto object = service_->OpenObject(organization_id, video_id);
        if (!object.ok()) {
            return Send(vidlift::http::ServiceErrorResponse(request.version(), object.error(),
                                                            request_id_, "OBJECT_NOT_FOUND"));
        }

        beast::error_code ec;
        http::response<http::file_body> response{http::status::ok, request.version()};
        response.body().open(object.value().path.c_str(), beast::file_mode::scan, ec);
        if (ec) {
            auto err = vidlift::http::JsonError(request.version(), "IO_ERROR",
                                                "failed to open file", request_id_,
                                                http::status::internal_server_error);
            return Send(std::move(err));
        }

        const auto size = response.body().size();
        response.set(http::field::content_type, "application/octet-stream");
        response.set(http::field::accept_ranges, "bytes");
        response.set(http::field::etag, "\"" + object.value().etag + "\"");

        // Support HTTP Range for large object reads and resumable downloads.
        auto range_header = request[http::field::range];
        if (!range_header.empty()) {
            auto range = ParseRange(std::string(range_header), size);
            if (!range) {
                auto err = vidlift::http::JsonError(request.version(), "INVALID_RANGE",
                                                    "invalid range", request_id_,
                                                    http::status::range_not_satisfiable);
                err.set(http::field::content_range, "bytes */" + std::to_string(size));
                return Send(std::move(err));
            }
            response.result(http::status::partial_content);
            response.body().seek(range->start, ec);
            if (ec) {
                auto err = vidlift::http::JsonError(request.version(), "IO_ERROR",
                                                    "failed to seek file", request_id_,
                                                    http::status::internal_server_error);
                return Send(std::move(err));
            }
            const auto length = range->end - range->start + 1;
            response.content_length(length);
            response.set(http::field::content_range,
                         "bytes " + std::to_string(range->start) + "-" +
                             std::to_string(range->end) + "/" + std::to_string(size));
        } else {
            response.content_length(size);
        }

        Send(std::move(response));
    }

    void SendAndClose(http::response<http::string_body>&& response) {
        response.keep_alive(false);
        Send(std::move(response));
    }

    template <typename Body>
    void Send(http::response<Body>&& response) {
        response.set(http::field::server, "vidlift");
        response.set("X-Request-Id", request_id_);
        const auto latency = std::chrono::duration_cast<std::chrono::milliseconds>(
                                 std::chrono::steady_clock::now() - request_start_)
                                 .count();
        vidlift::core::LogRequest(request_id_, request_method_, request_target_, request_remote_,
                                  response.result_int(), latency);
        vidlift::observability::RecordRequest(response.result_int(), latency);
        auto sp = std::make_shared<http::response<Body>>(std::move(response));
        http::async_write(stream_, *sp,
                          beast::bind_front_handler(&Session::OnWrite<Body>,
                                                    this->shared_from_this(), sp->need_eof(), sp));
    }

    template <typename Body>
    void OnWrite(bool close, std::shared_ptr<http::response<Body>>,
                 beast::error_code ec, std::size_t) {
        if (ec) {
            vidlift::core::LogError("Write failed: " + ec.message());
            return;
        }
        if (close) {
            return DoClose();
        }
        DoReadHeader();
    }

    void DoClose() {
        beast::error_code ec;
        if constexpr (std::is_same_v<Stream, beast::ssl_stream<beast::tcp_stream>>) {
            stream_.shutdown(ec);
        } else {
            stream_.socket().shutdown(tcp::socket::shutdown_send, ec);
        }
    }

    std::string GetRemoteAddress() const {
        beast::error_code ec;
        auto endpoint = beast::get_lowest_layer(stream_).socket().remote_endpoint(ec);
        if (ec) {
            return "unknown";
        }
        return endpoint.address().to_string() + ":" + std::to_string(endpoint.port());
    }

    Stream stream_;
    beast::flat_buffer buffer_;
    std::optional<http::request_parser<http::buffer_body>> parser_;
    std::array<char, kBufferSize> body_buffer_{};

    vidlift::http::Router router_;
    vidlift::core::Config config_;
    std::shared_ptr<vidlift::server::UploadService> service_;
    std::shared_ptr<vidlift::storage::LocalStorage> storage_;

    std::string request_id_;
    std::string request_method_;
    std::string request_target_;
    std::string request_remote_;
    std::chrono::steady_clock::time_point request_start_{};
    std::string body_;

    std::string part_session_;
    int part_index_{0};
    std::string part_temp_path_;
    std::optional<Poco::SHA2Engine256> part_hasher_;
    std::uint64_t part_total_{0};
    int part_fd_{-1};
    std::optional<http::response<http::string_body>> part_rejection_;
};

class Listener : public std::enable_shared_from_this<Listener> {
public:
    Listener(net::io_context& ioc, tcp::endpoint endpoint, vidlift::http::Router router,
             vidlift::core::Config config,
             std::shared_ptr<vidlift::server::UploadService> service,
             std::shared_ptr<vidlift::storage::LocalStorage> storage,
             net::ssl::context* ssl_ctx)
        : acceptor_(ioc),
          router_(std::move(router)),
          config_(std::move(config)),
          service_(std::move(service)),
          storage_(std::move(storage)),
          ssl_ctx_(ssl_ctx) {
        beast::error_code ec;
        acceptor_.open(endpoint.protocol(), ec);
        if (!ec) {
            acceptor_.set_option(net::socket_base::reuse_address(true), ec);
        }
        if (!ec) {
            acceptor_.bind(endpoint, ec);
        }
        if (!ec) {
            acceptor_.listen(net::socket_base::max_listen_connections, ec);
        }
        if (ec) {
            vidlift::core::LogError("Listen on " + endpoint.address().to_string() + ":" +
                                    std::to_string(endpoint.port()) + " failed: " + ec.message());
        }
    }

    void Run() { DoAccept(); }

private:
    void DoAccept() {
        acceptor_.async_accept(beast::bind_front_handler(&Listener::OnAccept,
                                                         shared_from_this()));
    }

    void OnAccept(beast::error_code ec, tcp::socket socket) {
        if (ec) {
            vidlift::core::LogError("Accept failed: " + ec.message());
            if (!acceptor_.is_open()) {
                return;
            }
        } else {
            if (ssl_ctx_) {
                auto stream = beast::ssl_stream<beast::tcp_stream>(std::move(socket), *ssl_ctx_);
                std::make_shared<Session<beast::ssl_stream<beast::tcp_stream>>>(
                    std::move(stream), router_, config_, service_, storage_)
                    ->Start();
            } else {
                auto stream = beast::tcp_stream(std::move(socket));
                std::make_shared<Session<beast::tcp_stream>>(std::move(stream), router_, config_,
                                                             service_, storage_)
                    ->Start();
            }
        }
        DoAccept();
    }

    tcp::acceptor acceptor_;
    vidlift::http::Router router_;
    vidlift::core::Config config_;
    std::shared_ptr<vidlift::server::UploadService> service_;
    std::shared_ptr<vidlift::storage::LocalStorage> storage_;
    net::ssl::context* ssl_ctx_{nullptr};
};

}  // namespace

namespace vidlift::http {

HttpServer::HttpServer(boost::asio::io_context& ioc, const core::Config& config, Router router,
                       std::shared_ptr<server::UploadService> service,
                       std::shared_ptr<storage::LocalStorage> storage)
    : ioc_(ioc),
      config_(config),
      router_(std::move(router)),
      service_(std::move(service)),
      storage_(std::move(storage)) {
    if (config_.server.tls.enabled) {
        ssl_context_ = std::make_unique<net::ssl::context>(net::ssl::context::tlsv12_server);
        ssl_context_->use_certificate_chain_file(config_.server.tls.certificate);
        ssl_context_->use_private_key_file(config_.server.tls.private_key, net::ssl::context::pem);
    }
}

void HttpServer::Run() {
    StartCleanupJob();

    const auto address = net::ip::make_address(config_.server.host);
    const tcp::endpoint endpoint{address, static_cast<unsigned short>(config_.server.port)};

    std::make_shared<Listener>(ioc_, endpoint, router_, config_, service_, storage_,
                               ssl_context_ ? ssl_context_.get() : nullptr)
        ->Run();
}

void HttpServer::StartCleanupJob() {
    if (!config_.cleanup.enabled) {
        return;
    }
    cleanup_timer_ = std::make_unique<net::steady_timer>(ioc_);
    ScheduleCleanupSweep();
}

void HttpServer::ScheduleCleanupSweep() {
    if (!cleanup_timer_) {
        return;
    }
    cleanup_timer_->expires_after(
        std::chrono::seconds(config_.cleanup.sweep_interval_seconds));
    cleanup_timer_->async_wait([this](const beast::error_code& ec) {
        if (ec) {
            return;
        }
        RunCleanupSweep();
        ScheduleCleanupSweep();
    });
}

void HttpServer::RunCleanupSweep() {
    auto expired = service_->SweepExpired(config_.cleanup.grace_period_seconds,
                                          config_.cleanup.max_sessions_per_sweep);
    if (!expired.ok()) {
        core::LogError("Cleanup sweep failed: " + expired.error().message);
        return;
    }
    if (expired.value() > 0) {
        core::LogInfo("Cleanup sweep expired " + std::to_string(expired.value()) +
                      " upload sessions");
    }
}

}  // namespace vidlift::http
