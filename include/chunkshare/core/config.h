#pragma once

#include <cstdint>
#include <string>

namespace chunkshare::core {

/// @brief TLS configuration for the HTTP server.
struct TlsConfig {
    bool enabled{false};
    std::string certificate;
    std::string private_key;
};

/// @brief Request/connection limits for the HTTP server.
struct LimitsConfig {
    std::uint64_t max_body_bytes{33554432};
};

/// @brief HTTP server configuration (bind address, TLS, limits).
struct ServerConfig {
    std::string host{"0.0.0.0"};
    int port{8080};
    int threads{4};
    TlsConfig tls;
    LimitsConfig limits;
};

/// @brief On-disk layout: chunk staging area and finalized blobs.
struct StorageConfig {
    std::string root{"data"};
    std::string tmp_dir{"data/uploads/tmp"};
    std::string files_dir{"data/files"};
};

/// @brief Chunked upload limits and session lifetime.
struct UploadConfig {
    std::uint64_t max_chunk_size{16ULL * 1024 * 1024};
    std::uint64_t default_chunk_size{8ULL * 1024 * 1024};
    int session_ttl_seconds{6 * 60 * 60};
    int finalize_workers{2};
};

/// @brief Download link policy.
struct LinksConfig {
    int default_expiry_minutes{60};
    // 0 leaves link lifetime unbounded and permits never-expiring links.
    std::int64_t max_lifetime_seconds{0};
    int password_iterations{120000};
};

/// @brief Bearer/download token signing settings.
struct AuthConfig {
    std::string token_secret;
    int clock_skew_seconds{60};
};

/// @brief Background sweep of stale upload sessions.
struct CleanupConfig {
    bool enabled{true};
    int sweep_interval_seconds{300};
    int max_sessions_per_sweep{200};
};

/// @brief Observability settings (logging).
struct ObservabilityConfig {
    std::string log_level{"information"};
};

/// @brief Top-level configuration, loaded once and passed by value to each component.
struct Config {
    ServerConfig server;
    StorageConfig storage;
    UploadConfig uploads;
    LinksConfig links;
    AuthConfig auth;
    CleanupConfig cleanup;
    ObservabilityConfig observability;
};

/// @brief Load server configuration from a JSON file.
/// @throws std::invalid_argument when a value is out of range or required and missing.
Config LoadConfig(const std::string& path);
/// @brief Load SQLite metadata DB path from a JSON file.
std::string LoadDatabasePath(const std::string& path);
/// @brief Validate cross-field constraints; LoadConfig calls this.
void ValidateConfig(const Config& config);

}  // namespace chunkshare::core
