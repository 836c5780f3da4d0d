#pragma once

#include <cstdint>
#include <functional>
#include <optional>
#include <ostream>
#include <string>

#include <Poco/Net/HTTPRequest.h>

#include "vidlift/client/cancellation.h"
#include "vidlift/core/config.h"
#include "vidlift/core/result.h"

namespace vidlift::client {

/// @brief One HTTP exchange against the Upload API or a part destination.
struct ApiRequest {
    std::string method{Poco::Net::HTTPRequest::HTTP_GET};
    /// Absolute URL, or a path resolved against `api.base_url`.
    std::string target;
    std::string content_type;
    std::string body;
    /// Streams the body instead of `body`; requires `content_length` unless `prepare`
    /// switches the request to chunked encoding.
    std::function<core::Result<void>(std::ostream&)> write_body;
    std::optional<std::uint64_t> content_length;
    /// Last-chance header customization before the request is sent.
    std::function<void(Poco::Net::HTTPRequest&)> prepare;
};

struct ApiResponse {
    int status{0};
    std::string body;
    std::string etag;
    std::string content_type;
};

/// @brief Parsed `{"error":{"code","message"}}` envelope; empty fields when absent.
struct ApiErrorBody {
    std::string code;
    std::string message;
};

/// @brief Thin blocking HTTP client over Poco Net with cooperative cancellation.
///
/// A cancelled token aborts the socket of the in-flight request. Connection-level failures
/// map to kTransientNetwork, cancellation to kCancelled; HTTP status codes are returned
/// untouched for the caller to classify.
class ApiClient {
public:
    explicit ApiClient(core::ApiConfig config);

    core::Result<ApiResponse> Send(const ApiRequest& request,
                                   const CancellationToken& token) const;

    /// @brief Absolute URL for `target`.
    std::string ResolveUrl(const std::string& target) const;
    const core::ApiConfig& config() const { return config_; }

    static ApiErrorBody ParseErrorBody(const std::string& body);

private:
    core::ApiConfig config_;
};

/// @brief True for statuses worth retrying: 408, 429 and 5xx.
bool IsRetryableStatus(int status);

}  // namespace vidlift::client
