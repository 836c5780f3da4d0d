#include <exception>
#include <filesystem>
#include <iostream>
#include <memory>
#include <string>
#include <thread>
#include <vector>

#include <boost/asio/io_context.hpp>

#include "vidlift/core/config.h"
#include "vidlift/core/logger.h"
#include "vidlift/http/http_server.h"
#include "vidlift/http/route_registration.h"
#include "vidlift/http/router.h"
#include "vidlift/metadata/sqlite_metadata_store.h"
#include "vidlift/server/upload_service.h"
#include "vidlift/storage/local_storage.h"

namespace {

std::string GetArgValue(int argc, char** argv, const std::string& key,
                        const std::string& default_value) {
    for (int i = 1; i < argc - 1; ++i) {
        if (argv[i] == key) {
            return argv[i + 1];
        }
    }
    return default_value;
}

std::string DefaultPublicBaseUrl(const vidlift::core::ServerConfig& server) {
    const std::string scheme = server.tls.enabled ? "https" : "http";
    const std::string host =
        (server.host == "0.0.0.0" || server.host.empty()) ? "127.0.0.1" : server.host;
    return scheme + "://" + host + ":" + std::to_string(server.port);
}

}  // namespace

int main(int argc, char** argv) {
    const std::string config_path = GetArgValue(argc, argv, "--config", "config/server.json");
    const std::string db_path = GetArgValue(argc, argv, "--database", "config/database.json");

    vidlift::core::Config config;
    std::string sqlite_path;
    try {
        config = vidlift::core::LoadConfig(config_path);
        sqlite_path = vidlift::core::LoadDatabasePath(db_path);
    } catch (const std::exception& ex) {
        std::cerr << "vidlift-server: invalid configuration: " << ex.what() << std::endl;
        return 2;
    }
    vidlift::core::InitLogging(config.observability.log_level);

    const auto db_dir = std::filesystem::path(sqlite_path).parent_path();
    if (!db_dir.empty()) {
        std::filesystem::create_directories(db_dir);
    }
    auto metadata = std::make_shared<vidlift::metadata::SqliteMetadataStore>(sqlite_path);
    auto storage = std::make_shared<vidlift::storage::LocalStorage>(config.storage.base_path,
                                                                    config.storage.temp_path);

    const auto public_base_url = config.server.public_base_url.empty()
                                     ? DefaultPublicBaseUrl(config.server)
                                     : config.server.public_base_url;
    auto service = std::make_shared<vidlift::server::UploadService>(config.upload,
                                                                    public_base_url, metadata,
                                                                    storage);

    vidlift::http::Router router;
    vidlift::http::RegisterDefaultRoutes(router, service);

    boost::asio::io_context ioc(config.server.threads);
    vidlift::http::HttpServer server(ioc, config, std::move(router), service, storage);
    server.Run();
    vidlift::core::LogInfo("vidlift-server listening on " + config.server.host + ":" +
                           std::to_string(config.server.port) + ", part destinations under " +
                           public_base_url);

    std::vector<std::thread> threads;
    threads.reserve(static_cast<size_t>(config.server.threads));
    for (int i = 0; i < config.server.threads; ++i) {
        threads.emplace_back([&ioc]() { ioc.run(); });
    }
    for (auto& t : threads) {
        t.join();
    }

    return 0;
}
