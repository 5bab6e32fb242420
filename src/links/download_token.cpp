#include "chunkshare/links/download_token.h"

#include <Poco/JSON/Object.h>

#include "chunkshare/core/time.h"

namespace chunkshare::links {

std::string IssueDownloadToken(const auth::JwtCodec& codec, const DownloadTokenClaims& claims) {
    const auto now_sec = core::NowEpochSeconds();
    Poco::JSON::Object payload;
    payload.set("tid", claims.link_id);
    payload.set("fid", claims.file_id);
    payload.set("one_time", claims.one_time);
    payload.set("iat", static_cast<Poco::Int64>(now_sec));
    payload.set("nbf", static_cast<Poco::Int64>(now_sec));
    if (claims.expires_at) {
        payload.set("exp", static_cast<Poco::Int64>(*claims.expires_at));
    }
    return codec.Sign(payload);
}

core::Result<DownloadTokenClaims> DecodeDownloadToken(const auth::JwtCodec& codec,
                                                      const std::string& token) {
    auto verified = codec.Verify(token);
    if (!verified.ok()) {
        return verified.error();
    }
    const auto& jwt = verified.value();
    if (codec.IsExpired(jwt)) {
        return core::Error{core::ErrorCode::kLinkExpired, "download link expired"};
    }
    auto window = codec.CheckTimeWindow(jwt, false);
    if (!window.ok()) {
        return core::Error{core::ErrorCode::kInvalidToken, window.error().message};
    }

    DownloadTokenClaims claims;
    try {
        claims.link_id = jwt.payload->optValue<std::string>("tid", "");
        claims.file_id = jwt.payload->optValue<std::string>("fid", "");
        claims.one_time = jwt.payload->optValue<bool>("one_time", false);
    } catch (const Poco::Exception& ex) {
        return core::Error{core::ErrorCode::kInvalidToken, ex.displayText()};
    }
    if (claims.link_id.empty() || claims.file_id.empty()) {
        return core::Error{core::ErrorCode::kInvalidToken, "token is not a download token"};
    }
    claims.expires_at = jwt.expires_at;
    return claims;
}

}  // namespace chunkshare::links
