#pragma once

#include <cstdint>
#include <optional>
#include <string>

#include <Poco/JSON/Object.h>

#include "chunkshare/core/result.h"

namespace chunkshare::auth {

/// @brief Registered claims pulled out of a verified token; `payload` keeps the rest.
struct JwtClaims {
    std::string subject;
    std::optional<std::int64_t> issued_at;
    std::optional<std::int64_t> not_before;
    std::optional<std::int64_t> expires_at;
    Poco::JSON::Object::Ptr payload;
};

/// @brief HS256 JWT signer/verifier shared by access tokens and download tokens.
class JwtCodec {
public:
    JwtCodec(std::string secret, int clock_skew_seconds);

    std::string Sign(const Poco::JSON::Object& claims) const;

    /// @brief Verify structure, algorithm and signature. Time claims are parsed, not enforced.
    core::Result<JwtClaims> Verify(const std::string& token) const;

    /// @brief Enforce nbf/exp (with clock skew). `require_exp` rejects tokens without exp.
    core::Result<void> CheckTimeWindow(const JwtClaims& claims, bool require_exp) const;

    /// @brief True when `exp` is present and already past the skew window.
    bool IsExpired(const JwtClaims& claims) const;

private:
    std::string Mac(const std::string& message) const;

    std::string secret_;
    int clock_skew_seconds_;
};

}  // namespace chunkshare::auth
