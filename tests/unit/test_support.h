#pragma once

#include <filesystem>
#include <sstream>
#include <string>

#include <Poco/DigestEngine.h>
#include <Poco/SHA2Engine.h>
#include <Poco/UUIDGenerator.h>

#include "chunkshare/metadata/sqlite_repository.h"

namespace chunkshare::testing {

/// Scratch directory removed on destruction.
class TempDir {
public:
    TempDir() {
        path_ = std::filesystem::temp_directory_path() /
                ("chunkshare_test_" + Poco::UUIDGenerator().createOne().toString());
        std::filesystem::create_directories(path_);
    }
    ~TempDir() {
        std::error_code ec;
        std::filesystem::remove_all(path_, ec);
    }
    TempDir(const TempDir&) = delete;
    TempDir& operator=(const TempDir&) = delete;

    const std::filesystem::path& path() const { return path_; }
    std::string Sub(const std::string& name) const { return (path_ / name).string(); }

private:
    std::filesystem::path path_;
};

inline std::string Sha256Hex(const std::string& data) {
    Poco::SHA2Engine256 engine;
    engine.update(data);
    return Poco::DigestEngine::digestToHex(engine.digest());
}

inline metadata::Principal SeedPrincipal(metadata::Repository& repository, const std::string& id,
                                         std::optional<std::uint64_t> quota = std::nullopt,
                                         std::uint64_t used = 0, bool is_admin = false) {
    metadata::Principal principal;
    principal.id = id;
    principal.is_admin = is_admin;
    principal.quota_bytes = quota;
    principal.used_bytes = used;
    return repository.CreatePrincipal(principal).value();
}

}  // namespace chunkshare::testing
