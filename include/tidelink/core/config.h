#pragma once

#include <cstdint>
#include <string>

namespace tidelink::core {

/// @brief TLS configuration for the HTTP server.
struct TlsConfig {
    bool enabled{false};
    std::string certificate;
    std::string private_key;
};

/// @brief Request/connection limits for the HTTP server.
struct LimitsConfig {
    /// Largest request body accepted, which bounds a single upload chunk.
    std::uint64_t max_body_bytes{268435456};
};

/// @brief HTTP server configuration (bind address, TLS, limits).
struct ServerConfig {
    std::string host{"0.0.0.0"};
    int port{8080};
    int threads{4};
    /// Prefix for upload Location headers; derived from Host when empty.
    std::string public_base_url;
    TlsConfig tls;
    LimitsConfig limits;
};

/// @brief Storage configuration for local filesystem backend.
struct StorageConfig {
    std::string base_path{"data"};
};

/// @brief Resumable upload settings.
struct UploadConfig {
    std::uint64_t max_size_bytes{107374182400ULL};
    std::string offset_store{"file"};
    int lock_shards{16};
};

/// @brief Transfer expiry policy.
struct TransfersConfig {
    int default_expiry_days{7};
    int max_expiry_days{30};
};

/// @brief Background sweep of expired transfers.
struct CleanupConfig {
    bool enabled{true};
    int sweep_interval_seconds{3600};
    int max_transfers_per_sweep{100};
};

/// @brief Observability settings (logging).
struct ObservabilityConfig {
    std::string log_level{"information"};
};

/// @brief Top-level configuration for TideLink.
struct Config {
    ServerConfig server;
    StorageConfig storage;
    UploadConfig upload;
    TransfersConfig transfers;
    CleanupConfig cleanup;
    ObservabilityConfig observability;
};

/// @brief Load server configuration from a JSON file.
Config LoadConfig(const std::string& path);
/// @brief Load SQLite metadata DB path from a JSON file.
std::string LoadDatabasePath(const std::string& path);

}  // namespace tidelink::core
