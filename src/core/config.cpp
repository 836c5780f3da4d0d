#include "vidlift/core/config.h"

#include <cctype>
#include <stdexcept>

#include <Poco/AutoPtr.h>
#include <Poco/Util/JSONConfiguration.h>

namespace vidlift::core {

namespace {

bool IsBlank(const std::string& value) {
    for (char c : value) {
        if (!std::isspace(static_cast<unsigned char>(c))) {
            return false;
        }
    }
    return true;
}

void RequirePositive(long long value, const char* key) {
    if (value <= 0) {
        throw std::invalid_argument(std::string(key) + " must be positive");
    }
}

}  // namespace

Config LoadConfig(const std::string& path) {
    Poco::AutoPtr<Poco::Util::JSONConfiguration> cfg(
        new Poco::Util::JSONConfiguration(path));

    Config config;
    config.server.host = cfg->getString("server.host", "0.0.0.0");
    config.server.port = cfg->getInt("server.port", 8080);
    config.server.threads = cfg->getInt("server.threads", 4);
    config.server.public_base_url = cfg->getString("server.public_base_url", "");
    config.server.tls.enabled = cfg->getBool("server.tls.enabled", false);
    config.server.tls.certificate = cfg->getString("server.tls.certificate", "");
    config.server.tls.private_key = cfg->getString("server.tls.private_key", "");
    config.server.limits.max_body_bytes =
        static_cast<std::uint64_t>(cfg->getInt64("server.limits.max_body_bytes", 268435456));

    config.storage.base_path = cfg->getString("storage.base_path", "data");
    config.storage.temp_path = cfg->getString("storage.temp_path", "data/tmp");

    config.upload.default_part_size = static_cast<std::uint64_t>(
        cfg->getInt64("upload.default_part_size", 10LL * 1024 * 1024));
    config.upload.min_part_size = static_cast<std::uint64_t>(
        cfg->getInt64("upload.min_part_size", 5LL * 1024 * 1024));
    config.upload.max_part_size = static_cast<std::uint64_t>(
        cfg->getInt64("upload.max_part_size", 5LL * 1024 * 1024 * 1024));
    config.upload.max_parts = cfg->getInt("upload.max_parts", 10000);
    config.upload.session_ttl_seconds =
        cfg->getInt("upload.session_ttl_seconds", 7 * 24 * 60 * 60);
    config.upload.destination_ttl_seconds = cfg->getInt("upload.destination_ttl_seconds", 3600);
    config.upload.signing_secret = cfg->getString("upload.signing_secret", "");
    config.upload.max_thumbnail_bytes = static_cast<std::uint64_t>(
        cfg->getInt64("upload.max_thumbnail_bytes", 5LL * 1024 * 1024));

    config.cleanup.enabled = cfg->getBool("cleanup.enabled", true);
    config.cleanup.sweep_interval_seconds = cfg->getInt("cleanup.sweep_interval_seconds", 300);
    config.cleanup.grace_period_seconds = cfg->getInt("cleanup.grace_period_seconds", 60);
    config.cleanup.max_sessions_per_sweep = cfg->getInt("cleanup.max_sessions_per_sweep", 200);

    config.observability.log_level = cfg->getString("observability.log_level", "information");

    // Unsigned destinations would let anyone write parts, so refuse to start without a secret.
    if (IsBlank(config.upload.signing_secret)) {
        throw std::invalid_argument("upload.signing_secret must be non-empty");
    }
    RequirePositive(static_cast<long long>(config.upload.min_part_size), "upload.min_part_size");
    if (config.upload.max_part_size < config.upload.min_part_size) {
        throw std::invalid_argument("upload.max_part_size must be >= upload.min_part_size");
    }
    if (config.upload.default_part_size < config.upload.min_part_size ||
        config.upload.default_part_size > config.upload.max_part_size) {
        throw std::invalid_argument(
            "upload.default_part_size must lie within [min_part_size, max_part_size]");
    }
    RequirePositive(config.upload.max_parts, "upload.max_parts");
    RequirePositive(config.upload.session_ttl_seconds, "upload.session_ttl_seconds");
    RequirePositive(config.upload.destination_ttl_seconds, "upload.destination_ttl_seconds");
    RequirePositive(static_cast<long long>(config.upload.max_thumbnail_bytes),
                    "upload.max_thumbnail_bytes");
    RequirePositive(config.cleanup.sweep_interval_seconds, "cleanup.sweep_interval_seconds");
    RequirePositive(config.cleanup.max_sessions_per_sweep, "cleanup.max_sessions_per_sweep");
    return config;
}

std::string LoadDatabasePath(const std::string& path) {
    Poco::AutoPtr<Poco::Util::JSONConfiguration> cfg(
        new Poco::Util::JSONConfiguration(path));
    return cfg->getString("sqlite.path", "data/metadata.db");
}

ClientConfig LoadClientConfig(const std::string& path) {
    Poco::AutoPtr<Poco::Util::JSONConfiguration> cfg(
        new Poco::Util::JSONConfiguration(path));

    ClientConfig config;
    config.api.base_url = cfg->getString("api.base_url", "");
    config.api.session_cookie = cfg->getString("api.session_cookie", "");
    config.api.timeout_seconds = cfg->getInt("api.timeout_seconds", 30);
    config.api.user_agent = cfg->getString("api.user_agent", "vidlift-client");

    config.upload.part_size = static_cast<std::uint64_t>(
        cfg->getInt64("upload.part_size", 10LL * 1024 * 1024));
    config.upload.max_parts = cfg->getInt("upload.max_parts", 10000);
    config.upload.concurrency = cfg->getInt("upload.concurrency", 4);
    config.upload.max_attempts = cfg->getInt("upload.max_attempts", 3);
    config.upload.retry_base_delay_ms = cfg->getInt("upload.retry_base_delay_ms", 1000);
    config.upload.retry_max_delay_ms = cfg->getInt("upload.retry_max_delay_ms", 30000);
    config.upload.resume_on_start = cfg->getBool("upload.resume_on_start", false);
    config.upload.abort_on_cancel = cfg->getBool("upload.abort_on_cancel", true);

    config.thumbnail.enabled = cfg->getBool("thumbnail.enabled", true);
    config.thumbnail.ffmpeg_path = cfg->getString("thumbnail.ffmpeg_path", "ffmpeg");
    config.thumbnail.seek_seconds = cfg->getInt("thumbnail.seek_seconds", 2);
    config.thumbnail.max_dimension = cfg->getInt("thumbnail.max_dimension", 640);

    config.state.path = cfg->getString("state.path", "state/vidlift_state.json");
    config.observability.log_level = cfg->getString("observability.log_level", "information");

    if (IsBlank(config.api.base_url)) {
        throw std::invalid_argument("api.base_url must be non-empty");
    }
    RequirePositive(config.api.timeout_seconds, "api.timeout_seconds");
    RequirePositive(static_cast<long long>(config.upload.part_size), "upload.part_size");
    RequirePositive(config.upload.max_parts, "upload.max_parts");
    RequirePositive(config.upload.concurrency, "upload.concurrency");
    RequirePositive(config.upload.max_attempts, "upload.max_attempts");
    if (config.upload.retry_base_delay_ms < 0 ||
        config.upload.retry_max_delay_ms < config.upload.retry_base_delay_ms) {
        throw std::invalid_argument(
            "upload.retry_max_delay_ms must be >= upload.retry_base_delay_ms >= 0");
    }
    if (config.thumbnail.seek_seconds < 0) {
        throw std::invalid_argument("thumbnail.seek_seconds must not be negative");
    }
    RequirePositive(config.thumbnail.max_dimension, "thumbnail.max_dimension");
    return config;
}

}  // namespace vidlift::core
