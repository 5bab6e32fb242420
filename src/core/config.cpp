#include "chunkshare/core/config.h"

#include <cctype>
#include <stdexcept>

#include <Poco/AutoPtr.h>
#include <Poco/Util/JSONConfiguration.h>

namespace chunkshare::core {

namespace {

bool IsBlank(const std::string& value) {
    for (char c : value) {
        if (!std::isspace(static_cast<unsigned char>(c))) {
            return false;
        }
    }
    return true;
}

constexpr std::size_t kMinTokenSecretLength = 16;

}  // namespace

Config LoadConfig(const std::string& path) {
    Poco::AutoPtr<Poco::Util::JSONConfiguration> cfg(
        new Poco::Util::JSONConfiguration(path));

    Config config;
    config.server.host = cfg->getString("server.host", "0.0.0.0");
    config.server.port = cfg->getInt("server.port", 8080);
    config.server.threads = cfg->getInt("server.threads", 4);
    config.server.tls.enabled = cfg->getBool("server.tls.enabled", false);
    config.server.tls.certificate = cfg->getString("server.tls.certificate", "");
    config.server.tls.private_key = cfg->getString("server.tls.private_key", "");
    config.server.limits.max_body_bytes =
        static_cast<std::uint64_t>(cfg->getInt64("server.limits.max_body_bytes", 33554432));

    config.storage.root = cfg->getString("storage.root", "data");
    config.storage.tmp_dir = cfg->getString("storage.tmp_dir", config.storage.root + "/uploads/tmp");
    config.storage.files_dir = cfg->getString("storage.files_dir", config.storage.root + "/files");

    config.uploads.max_chunk_size = static_cast<std::uint64_t>(
        cfg->getInt64("uploads.max_chunk_size", 16LL * 1024 * 1024));
    config.uploads.default_chunk_size = static_cast<std::uint64_t>(
        cfg->getInt64("uploads.default_chunk_size", 8LL * 1024 * 1024));
    config.uploads.session_ttl_seconds = cfg->getInt("uploads.session_ttl_seconds", 21600);
    config.uploads.finalize_workers = cfg->getInt("uploads.finalize_workers", 2);

    config.links.default_expiry_minutes = cfg->getInt("links.default_expiry_minutes", 60);
    config.links.max_lifetime_seconds = cfg->getInt64("links.max_lifetime_seconds", 0);
    config.links.password_iterations = cfg->getInt("links.password_iterations", 120000);

    config.auth.token_secret = cfg->getString("auth.token_secret", "");
    config.auth.clock_skew_seconds = cfg->getInt("auth.clock_skew_seconds", 60);

    config.cleanup.enabled = cfg->getBool("cleanup.enabled", true);
    config.cleanup.sweep_interval_seconds = cfg->getInt("cleanup.sweep_interval_seconds", 300);
    config.cleanup.max_sessions_per_sweep = cfg->getInt("cleanup.max_sessions_per_sweep", 200);

    config.observability.log_level = cfg->getString("observability.log_level", "information");

    ValidateConfig(config);
    return config;
}

void ValidateConfig(const Config& config) {
    if (IsBlank(config.auth.token_secret) ||
        config.auth.token_secret.size() < kMinTokenSecretLength) {
        throw std::invalid_argument("auth.token_secret must be at least 16 characters");
    }
    if (config.server.threads <= 0) {
        throw std::invalid_argument("server.threads must be positive");
    }
    if (config.uploads.max_chunk_size == 0) {
        throw std::invalid_argument("uploads.max_chunk_size must be positive");
    }
    if (config.uploads.default_chunk_size == 0 ||
        config.uploads.default_chunk_size > config.uploads.max_chunk_size) {
        throw std::invalid_argument(
            "uploads.default_chunk_size must be positive and not exceed max_chunk_size");
    }
    if (config.server.limits.max_body_bytes < config.uploads.max_chunk_size) {
        throw std::invalid_argument(
            "server.limits.max_body_bytes must be at least uploads.max_chunk_size");
    }
    if (config.uploads.session_ttl_seconds <= 0) {
        throw std::invalid_argument("uploads.session_ttl_seconds must be positive");
    }
    if (config.uploads.finalize_workers <= 0) {
        throw std::invalid_argument("uploads.finalize_workers must be positive");
    }
    if (config.links.default_expiry_minutes <= 0) {
        throw std::invalid_argument("links.default_expiry_minutes must be positive");
    }
    if (config.links.max_lifetime_seconds < 0) {
        throw std::invalid_argument("links.max_lifetime_seconds must not be negative");
    }
    if (config.links.password_iterations < 1000) {
        throw std::invalid_argument("links.password_iterations must be at least 1000");
    }
    if (config.cleanup.sweep_interval_seconds <= 0) {
        throw std::invalid_argument("cleanup.sweep_interval_seconds must be positive");
    }
    if (config.cleanup.max_sessions_per_sweep <= 0) {
        throw std::invalid_argument("cleanup.max_sessions_per_sweep must be positive");
    }
}

std::string LoadDatabasePath(const std::string& path) {
    Poco::AutoPtr<Poco::Util::JSONConfiguration> cfg(
        new Poco::Util::JSONConfiguration(path));
    return cfg->getString("sqlite.path", "data/metadata.db");
}

}  // namespace chunkshare::core
