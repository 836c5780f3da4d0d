#include "vidlift/client/part_transport.h"

#include <Poco/DigestEngine.h>
#include <Poco/Net/HTTPRequest.h>
#include <Poco/SHA2Engine.h>

namespace vidlift::client {

HttpPartTransport::HttpPartTransport(std::shared_ptr<const ApiClient> client)
    : client_(std::move(client)) {}

core::Result<std::string> HttpPartTransport::Send(const PartDestination& destination,
                                                  const UploadSource& source,
                                                  const ByteRange& range,
                                                  const BytesTransferredFn& on_bytes,
                                                  const CancellationToken& token) {
    Poco::SHA2Engine256 sha256;

    ApiRequest request;
    request.method = Poco::Net::HTTPRequest::HTTP_PUT;
    request.target = destination.url;
    request.content_type = "application/octet-stream";
    request.content_length = range.length;
    request.write_body = [&](std::ostream& os) -> core::Result<void> {
        std::uint64_t sent = 0;
        while (sent < range.length) {
            if (token.IsCancelled()) {
                return core::Error{core::ErrorCode::kCancelled, "part transfer cancelled"};
            }
            const std::uint64_t remaining = range.length - sent;
            const std::uint64_t chunk = remaining < kChunkBytes ? remaining : kChunkBytes;
            auto bytes = source.Read(range.offset + sent, chunk);
            if (!bytes.ok()) {
                return bytes.error();
            }
            os.write(bytes.value().data(), static_cast<std::streamsize>(bytes.value().size()));
            if (!os.good()) {
                return core::Error{core::ErrorCode::kTransientNetwork,
                                   "connection lost while sending part " +
                                       std::to_string(destination.index)};
            }
            sha256.update(bytes.value().data(), static_cast<unsigned int>(bytes.value().size()));
            sent += chunk;
            if (on_bytes) {
                on_bytes(sent);
            }
        }
        return core::Ok();
    };

    auto response = client_->Send(request, token);
    if (!response.ok()) {
        return response.error();
    }

    const auto& res = response.value();
    const auto checksum = Poco::DigestEngine::digestToHex(sha256.digest());
    if (res.status >= 200 && res.status < 300) {
        if (!res.etag.empty() && res.etag != checksum) {
            // The destination stored something other than what we sent; resend.
            return core::Error{core::ErrorCode::kTransientNetwork,
                               "checksum mismatch for part " + std::to_string(destination.index)};
        }
        return checksum;
    }
    if (IsRetryableStatus(res.status)) {
        return core::Error{core::ErrorCode::kTransientNetwork,
                           "part " + std::to_string(destination.index) + " rejected with HTTP " +
                               std::to_string(res.status)};
    }
    if (res.status >= 400 && res.status < 500) {
        const auto detail = ApiClient::ParseErrorBody(res.body);
        return core::Error{core::ErrorCode::kPartAuthExpired,
                           "destination for part " + std::to_string(destination.index) +
                               " refused (HTTP " + std::to_string(res.status) + ")" +
                               (detail.message.empty() ? "" : ": " + detail.message)};
    }
    return core::Error{core::ErrorCode::kProtocol,
                       "unexpected HTTP " + std::to_string(res.status) + " for part upload"};
}

}  // namespace vidlift::client
