#include "vidlift/server/destination_signer.h"

#include <Poco/DigestEngine.h>
#include <Poco/HMACEngine.h>
#include <Poco/SHA2Engine.h>

#include "vidlift/core/time.h"

namespace vidlift::server {

namespace {

bool ConstantTimeEquals(const std::string& a, const std::string& b) {
    if (a.size() != b.size()) {
        return false;
    }
    unsigned char diff = 0;
    for (std::size_t i = 0; i < a.size(); ++i) {
        diff |= static_cast<unsigned char>(a[i] ^ b[i]);
    }
    return diff == 0;
}

}  // namespace

DestinationSigner::DestinationSigner(std::string secret, std::string public_base_url)
    : secret_(std::move(secret)), public_base_url_(std::move(public_base_url)) {
    while (!public_base_url_.empty() && public_base_url_.back() == '/') {
        public_base_url_.pop_back();
    }
}

SignedDestination DestinationSigner::Sign(const std::string& session_id, int part_index,
                                          std::int64_t expires_at_unix) const {
    SignedDestination destination;
    destination.expires_at_unix = expires_at_unix;
    destination.expires_at = core::UnixSecondsToIso8601(expires_at_unix);
    destination.url = public_base_url_ + PartPath(session_id, part_index) +
                      "?expires=" + std::to_string(expires_at_unix) +
                      "&sig=" + Signature(session_id, part_index, expires_at_unix);
    return destination;
}

core::Result<void> DestinationSigner::Verify(const std::string& session_id, int part_index,
                                             std::int64_t expires_at_unix,
                                             const std::string& signature,
                                             std::int64_t now_unix) const {
    if (!ConstantTimeEquals(Signature(session_id, part_index, expires_at_unix), signature)) {
        return core::Error{core::ErrorCode::kForbidden, "invalid destination signature"};
    }
    if (expires_at_unix <= now_unix) {
        return core::Error{core::ErrorCode::kForbidden, "destination expired"};
    }
    return core::Ok();
}

std::string DestinationSigner::Signature(const std::string& session_id, int part_index,
                                         std::int64_t expires_at_unix) const {
    Poco::HMACEngine<Poco::SHA2Engine256> hmac(secret_);
    hmac.update(session_id + ":" + std::to_string(part_index) + ":" +
                std::to_string(expires_at_unix));
    return Poco::DigestEngine::digestToHex(hmac.digest());
}

std::string DestinationSigner::PartPath(const std::string& session_id, int part_index) {
    return "/parts/" + session_id + "/" + std::to_string(part_index);
}

}  // namespace vidlift::server
