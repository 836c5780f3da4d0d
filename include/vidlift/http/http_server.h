#pragma once

#include <memory>
#include <string>

#include <boost/asio/io_context.hpp>
#include <boost/asio/ssl/context.hpp>
#include <boost/asio/steady_timer.hpp>

#include "vidlift/core/config.h"
#include "vidlift/http/router.h"
#include "vidlift/server/upload_service.h"
#include "vidlift/storage/local_storage.h"

namespace vidlift::http {

/// @brief HTTP server bootstrapper (acceptor + TLS context + session sweep).
///
/// Part bodies (`PUT /parts/{session}/{index}`) are streamed to disk and object downloads are
/// served from file; every other request is buffered and dispatched through the router.
class HttpServer {
public:
    HttpServer(boost::asio::io_context& ioc, const core::Config& config, Router router,
               std::shared_ptr<server::UploadService> service,
               std::shared_ptr<storage::LocalStorage> storage);
    void Run();

private:
    void StartCleanupJob();
    void ScheduleCleanupSweep();
    void RunCleanupSweep();

    boost::asio::io_context& ioc_;
    core::Config config_;
    Router router_;
    std::shared_ptr<server::UploadService> service_;
    std::shared_ptr<storage::LocalStorage> storage_;
    std::unique_ptr<boost::asio::ssl::context> ssl_context_;
    std::unique_ptr<boost::asio::steady_timer> cleanup_timer_;
};

}  // namespace vidlift::http
