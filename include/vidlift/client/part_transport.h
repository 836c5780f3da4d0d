#pragma once

#include <cstdint>
#include <functional>
#include <memory>
#include <string>

#include "vidlift/client/api_client.h"
#include "vidlift/client/cancellation.h"
#include "vidlift/client/chunker.h"
#include "vidlift/client/upload_source.h"
#include "vidlift/client/upload_types.h"
#include "vidlift/core/result.h"

namespace vidlift::client {

/// @brief Called with the cumulative number of bytes sent for the current attempt.
using BytesTransferredFn = std::function<void(std::uint64_t bytes_sent)>;

/// @brief Moves one byte range to its pre-authorized destination.
///
/// Errors: kTransientNetwork (timeouts, resets, 408/429/5xx, checksum disagreement),
/// kPartAuthExpired (other 4xx), kCancelled. Transports never retry on their own.
class PartTransport {
public:
    virtual ~PartTransport() = default;

    /// @return Hex SHA-256 of the bytes sent, as acknowledged by the destination.
    virtual core::Result<std::string> Send(const PartDestination& destination,
                                           const UploadSource& source, const ByteRange& range,
                                           const BytesTransferredFn& on_bytes,
                                           const CancellationToken& token) = 0;
};

/// @brief HTTP PUT transport streaming the range in fixed-size chunks.
class HttpPartTransport : public PartTransport {
public:
    static constexpr std::uint64_t kChunkBytes = 64 * 1024;

    explicit HttpPartTransport(std::shared_ptr<const ApiClient> client);

    core::Result<std::string> Send(const PartDestination& destination,
                                   const UploadSource& source, const ByteRange& range,
                                   const BytesTransferredFn& on_bytes,
                                   const CancellationToken& token) override;

private:
    std::shared_ptr<const ApiClient> client_;
};

}  // namespace vidlift::client
