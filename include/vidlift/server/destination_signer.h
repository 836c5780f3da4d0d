#pragma once

#include <cstdint>
#include <string>

#include "vidlift/core/result.h"

namespace vidlift::server {

struct SignedDestination {
    std::string url;
    std::string expires_at;
    std::int64_t expires_at_unix{0};
};

/// @brief Issues and checks pre-authorized part URLs.
///
/// A destination is `{public_base_url}/parts/{session}/{index}?expires={unix}&sig={hex}` where
/// `sig` is HMAC-SHA256 over "session:index:expires". Whether a destination is still usable
/// (session active, part not yet reported) is checked by the upload service.
class DestinationSigner {
public:
    DestinationSigner(std::string secret, std::string public_base_url);

    SignedDestination Sign(const std::string& session_id, int part_index,
                           std::int64_t expires_at_unix) const;
    /// @return kForbidden for a bad signature or an expired destination.
    core::Result<void> Verify(const std::string& session_id, int part_index,
                              std::int64_t expires_at_unix, const std::string& signature,
                              std::int64_t now_unix) const;

    std::string Signature(const std::string& session_id, int part_index,
                          std::int64_t expires_at_unix) const;

    static std::string PartPath(const std::string& session_id, int part_index);

private:
    std::string secret_;
    std::string public_base_url_;
};

}  // namespace vidlift::server
