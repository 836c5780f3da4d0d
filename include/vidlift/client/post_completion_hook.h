#pragma once

#include <string>

#include "vidlift/client/cancellation.h"
#include "vidlift/client/session_negotiator.h"
#include "vidlift/client/upload_source.h"
#include "vidlift/core/result.h"

namespace vidlift::client {

/// @brief Work run once a session has completed. Failures are logged by the caller and never
/// change the upload's status.
class PostCompletionHook {
public:
    virtual ~PostCompletionHook() = default;

    virtual core::Result<void> Run(const VideoKey& video, const UploadSource& source,
                                   const CancellationToken& token) = 0;
};

}  // namespace vidlift::client
