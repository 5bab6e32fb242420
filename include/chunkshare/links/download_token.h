#pragma once

#include <cstdint>
#include <optional>
#include <string>

#include "chunkshare/auth/jwt_codec.h"
#include "chunkshare/core/result.h"

namespace chunkshare::links {

/// @brief Self-describing claims of a download token.
struct DownloadTokenClaims {
    std::string link_id;
    std::string file_id;
    bool one_time{false};
    std::optional<std::int64_t> expires_at;  // absent for never-expiring links
};

/// @brief Sign `{tid, fid, one_time, iat, nbf[, exp]}` with the shared HS256 codec.
std::string IssueDownloadToken(const auth::JwtCodec& codec, const DownloadTokenClaims& claims);

/// @brief Verify a download token without touching the database.
///
/// Format/signature failures are kInvalidToken; a signed expiry that has passed is kLinkExpired.
core::Result<DownloadTokenClaims> DecodeDownloadToken(const auth::JwtCodec& codec,
                                                      const std::string& token);

}  // namespace chunkshare::links
