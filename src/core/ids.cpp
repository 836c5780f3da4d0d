#include "vidlift/core/ids.h"

#include <Poco/UUIDGenerator.h>

namespace vidlift::core {

std::string GenerateRequestId() {
    return Poco::UUIDGenerator().createOne().toString();
}

std::string GenerateSessionId() {
    // Random (v4) UUIDs so session ids cannot be guessed from a previous one.
    return "ups_" + Poco::UUIDGenerator::defaultGenerator().createRandom().toString();
}

}  // namespace vidlift::core
