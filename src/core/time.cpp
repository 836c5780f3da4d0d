#include "vidlift/core/time.h"

#include <ctime>

#include <Poco/DateTimeFormatter.h>
#include <Poco/DateTimeFormat.h>
#include <Poco/Timestamp.h>

namespace vidlift::core {

std::string NowIso8601() {
    return Poco::DateTimeFormatter::format(Poco::Timestamp(), Poco::DateTimeFormat::ISO8601_FORMAT);
}

std::int64_t NowUnixSeconds() {
    return static_cast<std::int64_t>(Poco::Timestamp().epochTime());
}

std::string UnixSecondsToIso8601(std::int64_t seconds) {
    return Poco::DateTimeFormatter::format(
        Poco::Timestamp::fromEpochTime(static_cast<std::time_t>(seconds)),
        Poco::DateTimeFormat::ISO8601_FORMAT);
}

}  // namespace vidlift::core
