#pragma once

#include <string>

namespace vidlift::core {

/// @brief Generate a unique request ID for correlation.
std::string GenerateRequestId();
/// @brief Generate an opaque upload session identifier.
std::string GenerateSessionId();

}  // namespace vidlift::core
