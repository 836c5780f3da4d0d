#pragma once

#include <cstdint>
#include <string>

namespace vidlift::core {

/// @brief Returns the current time formatted as ISO8601 UTC.
std::string NowIso8601();
/// @brief Seconds since the Unix epoch.
std::int64_t NowUnixSeconds();
/// @brief Formats epoch seconds as ISO8601 UTC.
std::string UnixSecondsToIso8601(std::int64_t seconds);

}  // namespace vidlift::core
