#pragma once

#include <string>

#include <Poco/JSON/Object.h>
#include <boost/beast/http.hpp>

#include "vidlift/core/error.h"

namespace vidlift::http {

using StringResponse = boost::beast::http::response<boost::beast::http::string_body>;

StringResponse JsonOk(int version, const std::string& body);
StringResponse JsonOk(int version, const Poco::JSON::Object::Ptr& body);

/// @brief Error envelope `{"error":{"code","message","request_id", extra...}}`.
/// Members of `extra` are merged into the error object.
StringResponse JsonError(int version, const std::string& code, const std::string& message,
                         const std::string& request_id, boost::beast::http::status status,
                         const Poco::JSON::Object::Ptr& extra = Poco::JSON::Object::Ptr());

/// @brief Maps a service error onto its HTTP status and wire code.
/// `not_found_code` names the missing resource for kNotFound ("VIDEO_NOT_FOUND", ...).
StringResponse ServiceErrorResponse(int version, const core::Error& error,
                                    const std::string& request_id,
                                    const std::string& not_found_code);

}  // namespace vidlift::http
