#include "tidelink/core/config.h"

#include <cctype>
#include <stdexcept>

#include <Poco/AutoPtr.h>
#include <Poco/Util/JSONConfiguration.h>

namespace tidelink::core {

namespace {

// Ten years; keeps expiry arithmetic in seconds well inside int.
constexpr int kExpiryDaysCeiling = 3650;

bool IsBlank(const std::string& value) {
    for (char c : value) {
        if (!std::isspace(static_cast<unsigned char>(c))) {
            return false;
        }
    }
    return true;
}

std::string StripTrailingSlash(std::string value) {
    while (!value.empty() && value.back() == '/') {
        value.pop_back();
    }
    return value;
}

}  // namespace

Config LoadConfig(const std::string& path) {
    Poco::AutoPtr<Poco::Util::JSONConfiguration> cfg(
        new Poco::Util::JSONConfiguration(path));

    Config config;
    config.server.host = cfg->getString("server.host", "0.0.0.0");
    config.server.port = cfg->getInt("server.port", 8080);
    config.server.threads = cfg->getInt("server.threads", 4);
    config.server.public_base_url =
        StripTrailingSlash(cfg->getString("server.public_base_url", ""));
    config.server.tls.enabled = cfg->getBool("server.tls.enabled", false);
    config.server.tls.certificate = cfg->getString("server.tls.certificate", "");
    config.server.tls.private_key = cfg->getString("server.tls.private_key", "");
    const auto max_body =
        cfg->getInt64("server.limits.max_body_bytes", 268435456);

    config.storage.base_path = cfg->getString("storage.base_path", "data");

    const auto max_size = cfg->getInt64("upload.max_size_bytes", 107374182400LL);
    config.upload.offset_store = cfg->getString("upload.offset_store", "file");
    config.upload.lock_shards = cfg->getInt("upload.lock_shards", 16);

    config.transfers.default_expiry_days = cfg->getInt("transfers.default_expiry_days", 7);
    config.transfers.max_expiry_days = cfg->getInt("transfers.max_expiry_days", 30);

    config.cleanup.enabled = cfg->getBool("cleanup.enabled", true);
    config.cleanup.sweep_interval_seconds = cfg->getInt("cleanup.sweep_interval_seconds", 3600);
    config.cleanup.max_transfers_per_sweep = cfg->getInt("cleanup.max_transfers_per_sweep", 100);

    config.observability.log_level = cfg->getString("observability.log_level", "information");

    if (config.server.threads <= 0) {
        throw std::invalid_argument("server.threads must be positive");
    }
    if (max_body <= 0) {
        throw std::invalid_argument("server.limits.max_body_bytes must be positive");
    }
    config.server.limits.max_body_bytes = static_cast<std::uint64_t>(max_body);
    if (config.server.tls.enabled) {
        // Fail fast so TLS mode cannot start without key material.
        if (IsBlank(config.server.tls.certificate) || IsBlank(config.server.tls.private_key)) {
            throw std::invalid_argument(
                "server.tls.enabled=true requires certificate and private_key");
        }
    }
    if (max_size <= 0) {
        throw std::invalid_argument("upload.max_size_bytes must be positive");
    }
    config.upload.max_size_bytes = static_cast<std::uint64_t>(max_size);
    if (config.upload.offset_store != "file" && config.upload.offset_store != "memory") {
        throw std::invalid_argument("upload.offset_store must be \"file\" or \"memory\"");
    }
    if (config.upload.lock_shards <= 0) {
        throw std::invalid_argument("upload.lock_shards must be positive");
    }
    if (config.transfers.max_expiry_days <= 0 || config.transfers.default_expiry_days <= 0 ||
        config.transfers.default_expiry_days > config.transfers.max_expiry_days) {
        throw std::invalid_argument(
            "transfers.default_expiry_days must be within [1, transfers.max_expiry_days]");
    }
    if (config.transfers.max_expiry_days > kExpiryDaysCeiling) {
        throw std::invalid_argument("transfers.max_expiry_days must not exceed " +
                                    std::to_string(kExpiryDaysCeiling));
    }
    if (config.cleanup.sweep_interval_seconds <= 0) {
        throw std::invalid_argument("cleanup.sweep_interval_seconds must be positive");
    }
    if (config.cleanup.max_transfers_per_sweep <= 0) {
        throw std::invalid_argument("cleanup.max_transfers_per_sweep must be positive");
    }
    return config;
}

std::string LoadDatabasePath(const std::string& path) {
    Poco::AutoPtr<Poco::Util::JSONConfiguration> cfg(
        new Poco::Util::JSONConfiguration(path));
    return cfg->getString("sqlite.path", "data/metadata.db");
}

}  // namespace tidelink::core
