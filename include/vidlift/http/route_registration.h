#pragma once

#include <memory>

#include "vidlift/http/router.h"

namespace vidlift::server {
class UploadService;
}

namespace vidlift::http {

/// Registers the Upload API routes into the provided router.
/// Part bodies and object downloads are streamed by the server and are not routed here.
void RegisterDefaultRoutes(Router& router, std::shared_ptr<server::UploadService> service);

}  // namespace vidlift::http
