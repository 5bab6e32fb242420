#pragma once

#include <string>

#include "chunkshare/core/result.h"

namespace chunkshare::auth {

/// @brief Salted PBKDF2-HMAC-SHA256 password hashing for link passwords.
///
/// Encoded form: `pbkdf2_sha256$<iterations>$<salt-hex>$<hash-hex>`. The iteration count
/// travels with the hash, so raising `iterations` later does not break stored hashes.
class PasswordHasher {
public:
    explicit PasswordHasher(int iterations);

    core::Result<std::string> Hash(const std::string& password) const;
    bool Verify(const std::string& password, const std::string& encoded) const;

private:
    int iterations_;
};

}  // namespace chunkshare::auth
