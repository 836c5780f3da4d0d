#pragma once

#include <cstdint>
#include <string>

namespace vidlift::core {

/// @brief TLS configuration for the HTTP server.
struct TlsConfig {
    bool enabled{false};
    std::string certificate;
    std::string private_key;
};

/// @brief Request/connection limits for the HTTP server.
struct LimitsConfig {
    std::uint64_t max_body_bytes{268435456};
};

/// @brief HTTP server configuration (bind address, TLS, limits).
struct ServerConfig {
    std::string host{"0.0.0.0"};
    int port{8080};
    int threads{4};
    // Base URL embedded in part destinations; derived from host/port when empty.
    std::string public_base_url;
    TlsConfig tls;
    LimitsConfig limits;
};

/// @brief Storage configuration for local filesystem backend.
struct StorageConfig {
    std::string base_path{"data"};
    std::string temp_path{"data/tmp"};
};

/// @brief Multipart session policy enforced by the Upload API.
struct UploadPolicyConfig {
    std::uint64_t default_part_size{10ULL * 1024 * 1024};
    std::uint64_t min_part_size{5ULL * 1024 * 1024};
    std::uint64_t max_part_size{5ULL * 1024 * 1024 * 1024};
    int max_parts{10000};
    int session_ttl_seconds{7 * 24 * 60 * 60};
    int destination_ttl_seconds{3600};
    std::string signing_secret;
    std::uint64_t max_thumbnail_bytes{5ULL * 1024 * 1024};
};

/// @brief Background sweep of expired upload sessions.
struct CleanupConfig {
    bool enabled{true};
    int sweep_interval_seconds{300};
    int grace_period_seconds{60};
    int max_sessions_per_sweep{200};
};

/// @brief Observability settings (logging).
struct ObservabilityConfig {
    std::string log_level{"information"};
};

/// @brief Top-level configuration for the Upload API server.
struct Config {
    ServerConfig server;
    StorageConfig storage;
    UploadPolicyConfig upload;
    CleanupConfig cleanup;
    ObservabilityConfig observability;
};

/// @brief Connection settings for the external Upload API.
struct ApiConfig {
    std::string base_url;
    std::string session_cookie;
    int timeout_seconds{30};
    std::string user_agent{"vidlift-client"};
};

/// @brief Client-side chunking, concurrency and retry settings.
struct ClientUploadConfig {
    std::uint64_t part_size{10ULL * 1024 * 1024};
    int max_parts{10000};
    int concurrency{4};
    int max_attempts{3};
    int retry_base_delay_ms{1000};
    int retry_max_delay_ms{30000};
    bool resume_on_start{false};
    bool abort_on_cancel{true};
};

/// @brief Thumbnail extraction settings for the post-completion hook.
struct ThumbnailConfig {
    bool enabled{true};
    std::string ffmpeg_path{"ffmpeg"};
    int seek_seconds{2};
    int max_dimension{640};
};

/// @brief Durable local state (active upload ledger).
struct StateConfig {
    std::string path{"state/vidlift_state.json"};
};

/// @brief Top-level configuration for the upload client.
struct ClientConfig {
    ApiConfig api;
    ClientUploadConfig upload;
    ThumbnailConfig thumbnail;
    StateConfig state;
    ObservabilityConfig observability;
};

/// @brief Load server configuration from a JSON file.
Config LoadConfig(const std::string& path);
/// @brief Load SQLite metadata DB path from a JSON file.
std::string LoadDatabasePath(const std::string& path);
/// @brief Load client configuration from a JSON file.
ClientConfig LoadClientConfig(const std::string& path);

}  // namespace vidlift::core
