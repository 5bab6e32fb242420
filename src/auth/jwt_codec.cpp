#include "chunkshare/auth/jwt_codec.h"

#include <sstream>

#include <Poco/JSON/Parser.h>

#include <openssl/evp.h>
#include <openssl/hmac.h>

#include "chunkshare/auth/jwt_utils.h"
#include "chunkshare/core/time.h"

namespace chunkshare::auth {

namespace {

constexpr const char* kHeader = "{\"alg\":\"HS256\",\"typ\":\"JWT\"}";

std::optional<std::int64_t> OptionalSeconds(const Poco::JSON::Object::Ptr& payload,
                                            const std::string& key) {
    if (!payload->has(key) || payload->isNull(key)) {
        return std::nullopt;
    }
    return payload->getValue<Poco::Int64>(key);
}

}  // namespace

JwtCodec::JwtCodec(std::string secret, int clock_skew_seconds)
    : secret_(std::move(secret)), clock_skew_seconds_(clock_skew_seconds) {}

std::string JwtCodec::Mac(const std::string& message) const {
    unsigned char mac[EVP_MAX_MD_SIZE];
    unsigned int mac_len = 0;
    HMAC(EVP_sha256(), secret_.data(), static_cast<int>(secret_.size()),
         reinterpret_cast<const unsigned char*>(message.data()), message.size(), mac, &mac_len);
    return Base64UrlEncode(mac, mac_len);
}

std::string JwtCodec::Sign(const Poco::JSON::Object& claims) const {
    std::stringstream ss;
    claims.stringify(ss);
    const auto message = Base64UrlEncode(kHeader) + "." + Base64UrlEncode(ss.str());
    return message + "." + Mac(message);
}

core::Result<JwtClaims> JwtCodec::Verify(const std::string& token) const {
    auto parts = Split(token, '.');
    if (parts.size() != 3 || parts[0].empty() || parts[1].empty() || parts[2].empty()) {
        return core::Error{core::ErrorCode::kInvalidToken, "invalid token format"};
    }

    // Signature first so nothing attacker-controlled is parsed beyond the header.
    const auto message = parts[0] + "." + parts[1];
    if (!ConstantTimeEquals(Mac(message), parts[2])) {
        return core::Error{core::ErrorCode::kInvalidToken, "signature verification failed"};
    }

    Poco::JSON::Parser parser;
    Poco::JSON::Object::Ptr header;
    Poco::JSON::Object::Ptr payload;
    try {
        header = parser.parse(Base64UrlDecodeToString(parts[0])).extract<Poco::JSON::Object::Ptr>();
        parser.reset();
        payload = parser.parse(Base64UrlDecodeToString(parts[1])).extract<Poco::JSON::Object::Ptr>();
    } catch (const std::exception& ex) {
        return core::Error{core::ErrorCode::kInvalidToken, ex.what()};
    }
    if (!header || !payload) {
        return core::Error{core::ErrorCode::kInvalidToken, "invalid token json"};
    }
    if (header->optValue<std::string>("alg", "") != "HS256") {
        return core::Error{core::ErrorCode::kInvalidToken, "unsupported alg"};
    }

    JwtClaims claims;
    try {
        claims.subject = payload->optValue<std::string>("sub", "");
        claims.issued_at = OptionalSeconds(payload, "iat");
        claims.not_before = OptionalSeconds(payload, "nbf");
        claims.expires_at = OptionalSeconds(payload, "exp");
    } catch (const std::exception& ex) {
        return core::Error{core::ErrorCode::kInvalidToken, ex.what()};
    }
    claims.payload = payload;
    return claims;
}

core::Result<void> JwtCodec::CheckTimeWindow(const JwtClaims& claims, bool require_exp) const {
    const auto now_sec = core::NowEpochSeconds();
    if (!claims.expires_at) {
        if (require_exp) {
            return core::Error{core::ErrorCode::kUnauthorized, "missing exp"};
        }
    } else if (IsExpired(claims)) {
        return core::Error{core::ErrorCode::kUnauthorized, "token expired"};
    }
    if (claims.not_before && now_sec + clock_skew_seconds_ < *claims.not_before) {
        return core::Error{core::ErrorCode::kUnauthorized, "token not yet valid"};
    }
    return core::Ok();
}

bool JwtCodec::IsExpired(const JwtClaims& claims) const {
    return claims.expires_at && core::NowEpochSeconds() > *claims.expires_at + clock_skew_seconds_;
}

}  // namespace chunkshare::auth
