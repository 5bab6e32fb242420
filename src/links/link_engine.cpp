#include "chunkshare/links/link_engine.h"

#include <filesystem>

#include <Poco/URI.h>

#include "chunkshare/core/ids.h"
#include "chunkshare/core/logger.h"
#include "chunkshare/core/time.h"
#include "chunkshare/links/download_token.h"
#include "chunkshare/links/short_code.h"
#include "chunkshare/observability/metrics.h"

namespace chunkshare::links {

namespace {

constexpr int kShortCodeAttempts = 5;

std::optional<core::Error> PasswordRejection(const metadata::DownloadLink& link,
                                             const std::optional<std::string>& password,
                                             const auth::PasswordHasher& hasher) {
    if (!link.password_hash) {
        return std::nullopt;
    }
    if (!password || password->empty()) {
        return core::Error{core::ErrorCode::kPasswordRequired, "password required"};
    }
    if (!hasher.Verify(*password, *link.password_hash)) {
        return core::Error{core::ErrorCode::kInvalidPassword, "invalid password"};
    }
    return std::nullopt;
}

}  // namespace

std::optional<core::Error> LinkRejection(const metadata::DownloadLink& link,
                                         const std::string& now) {
    // ISO8601 UTC strings of one fixed format compare chronologically.
    if (link.expires_at && *link.expires_at <= now) {
        return core::Error{core::ErrorCode::kLinkExpired, "download link expired"};
    }
    if (link.exhausted()) {
        return core::Error{core::ErrorCode::kLinkExhausted, "download link already used"};
    }
    if (!link.is_enabled) {
        return core::Error{core::ErrorCode::kLinkDisabled, "download link disabled"};
    }
    return std::nullopt;
}

LinkEngine::LinkEngine(metadata::Repository& repository, const auth::JwtCodec& codec,
                       core::LinksConfig config)
    : repository_(repository),
      codec_(codec),
      config_(std::move(config)),
      hasher_(config_.password_iterations) {}

core::Result<std::optional<std::int64_t>> LinkEngine::ResolveExpiry(
    const LinkExpiry& expiry) const {
    const auto now_sec = core::NowEpochSeconds();
    std::optional<std::int64_t> at;
    switch (expiry.kind) {
        case LinkExpiry::Kind::kDefault:
            at = now_sec + static_cast<std::int64_t>(config_.default_expiry_minutes) * 60;
            break;
        case LinkExpiry::Kind::kAfterMinutes:
            if (expiry.minutes <= 0) {
                return core::Error{core::ErrorCode::kInvalidExpiry,
                                   "expiry minutes must be positive"};
            }
            at = now_sec + static_cast<std::int64_t>(expiry.minutes) * 60;
            break;
        case LinkExpiry::Kind::kAt:
            if (expiry.at_epoch_seconds <= now_sec) {
                return core::Error{core::ErrorCode::kInvalidExpiry, "expiry must be in the future"};
            }
            at = expiry.at_epoch_seconds;
            break;
        case LinkExpiry::Kind::kNever:
            break;
    }

    if (config_.max_lifetime_seconds > 0) {
        if (!at) {
            return core::Error{core::ErrorCode::kInvalidExpiry,
                               "never-expiring links are not allowed"};
        }
        if (*at - now_sec > config_.max_lifetime_seconds) {
            return core::Error{core::ErrorCode::kInvalidExpiry,
                               "expiry exceeds the maximum link lifetime"};
        }
    }
    return at;
}

core::Result<IssuedLink> LinkEngine::IssueLink(const std::string& file_id,
                                               const LinkOptions& options) {
    auto file = repository_.GetStoredFile(file_id);
    if (!file.ok()) {
        return file.error();
    }
    if (file.value().status != metadata::FileStatus::kReady) {
        return core::Error{core::ErrorCode::kFileNotReady, "file is not ready"};
    }
    auto expiry = ResolveExpiry(options.expiry);
    if (!expiry.ok()) {
        return expiry.error();
    }

    metadata::DownloadLink link;
    link.id = core::GenerateId();
    link.file_id = file_id;
    link.one_time = options.one_time;
    link.require_landing_page = options.require_landing_page;
    link.created_at = core::NowIso8601();
    if (expiry.value()) {
        link.expires_at = core::FormatEpochSeconds(*expiry.value());
    }
    if (options.password && !options.password->empty()) {
        auto hashed = hasher_.Hash(*options.password);
        if (!hashed.ok()) {
            return hashed.error();
        }
        link.password_hash = hashed.value();
    }
    link.token = IssueDownloadToken(codec_,
                                    DownloadTokenClaims{link.id, file_id, link.one_time,
                                                        expiry.value()});

    const int attempts = options.with_short_code ? kShortCodeAttempts : 1;
    for (int attempt = 0; attempt < attempts; ++attempt) {
        if (options.with_short_code) {
            auto code = GenerateShortCode();
            if (!code.ok()) {
                return code.error();
            }
            link.short_code = code.value();
        }
        auto created = repository_.CreateDownloadLink(link);
        if (created.ok()) {
            return IssuedLink{created.value(), created.value().token,
                              created.value().never_expires()};
        }
        if (created.code() != core::ErrorCode::kAlreadyExists || !options.with_short_code) {
            return created.error();
        }
        core::LogDebug("short code collision, retrying");
    }
    return core::Error{core::ErrorCode::kInternal, "could not allocate a unique short code"};
}

core::Result<DownloadHandle> LinkEngine::ValidateAndConsume(
    const std::string& token, const std::optional<std::string>& password) {
    auto claims = DecodeDownloadToken(codec_, token);
    if (!claims.ok()) {
        return claims.error();
    }
    auto link = repository_.GetDownloadLinkByToken(token);
    if (!link.ok()) {
        if (link.code() == core::ErrorCode::kNotFound) {
            return core::Error{core::ErrorCode::kLinkNotFound, "download link not found"};
        }
        return link.error();
    }
    if (link.value().id != claims.value().link_id ||
        link.value().file_id != claims.value().file_id) {
        return core::Error{core::ErrorCode::kLinkNotFound, "download link not found"};
    }

    const auto now = core::NowIso8601();
    if (auto rejected = LinkRejection(link.value(), now)) {
        return *rejected;
    }
    if (auto rejected = PasswordRejection(link.value(), password, hasher_)) {
        return *rejected;
    }

    auto file = repository_.GetStoredFile(link.value().file_id);
    if (!file.ok()) {
        return file.error();
    }
    if (file.value().status != metadata::FileStatus::kReady) {
        return core::Error{core::ErrorCode::kFileNotReady, "file is not ready"};
    }
    std::error_code ec;
    if (!std::filesystem::is_regular_file(file.value().storage_path, ec)) {
        core::LogError("blob missing for ready file " + file.value().id);
        return core::Error{core::ErrorCode::kNotFound, "file data missing"};
    }

    auto consumed = repository_.ConsumeDownloadLink(link.value().id, now);
    if (!consumed.ok()) {
        return consumed.error();
    }
    if (!consumed.value()) {
        // Lost a race (typically a concurrent one-time download); report the current reason.
        auto current = repository_.GetDownloadLink(link.value().id);
        if (!current.ok()) {
            return core::Error{core::ErrorCode::kLinkNotFound, "download link not found"};
        }
        if (auto rejected = LinkRejection(current.value(), now)) {
            return *rejected;
        }
        return core::Error{core::ErrorCode::kLinkExhausted, "download link already used"};
    }

    observability::RecordDownload();
    return DownloadHandle{file.value(), file.value().storage_path,
                          link.value().download_count + 1};
}

core::Result<ShortCodeResolution> LinkEngine::ResolveShortCode(const std::string& code) {
    if (!IsValidShortCode(code)) {
        return core::Error{core::ErrorCode::kLinkNotFound, "download link not found"};
    }
    auto link = repository_.GetDownloadLinkByShortCode(code);
    if (!link.ok()) {
        if (link.code() == core::ErrorCode::kNotFound) {
            return core::Error{core::ErrorCode::kLinkNotFound, "download link not found"};
        }
        return link.error();
    }
    if (auto rejected = LinkRejection(link.value(), core::NowIso8601())) {
        return *rejected;
    }

    ShortCodeResolution resolution;
    resolution.file_id = link.value().file_id;
    resolution.token = link.value().token;
    if (link.value().require_landing_page || link.value().password_hash) {
        auto file = repository_.GetStoredFile(link.value().file_id);
        if (!file.ok()) {
            return file.error();
        }
        std::string token_param;
        std::string name_param;
        Poco::URI::encode(link.value().token, "&=?#+", token_param);
        Poco::URI::encode(file.value().filename, "&=?#+/", name_param);
        resolution.landing_target = "/share-download/" + file.value().id +
                                    "?token=" + token_param + "&name=" + name_param;
    }
    return resolution;
}

core::Result<std::vector<metadata::DownloadLink>> LinkEngine::ListLinks(
    const std::string& file_id) {
    auto file = repository_.GetStoredFile(file_id);
    if (!file.ok()) {
        return file.error();
    }
    return repository_.ListDownloadLinks(file_id);
}

core::Result<void> LinkEngine::RevokeLink(const std::string& file_id,
                                          const std::string& link_id) {
    auto link = repository_.GetDownloadLink(link_id);
    if (!link.ok()) {
        if (link.code() == core::ErrorCode::kNotFound) {
            return core::Error{core::ErrorCode::kLinkNotFound, "download link not found"};
        }
        return link.error();
    }
    if (link.value().file_id != file_id) {
        return core::Error{core::ErrorCode::kLinkNotFound, "download link not found"};
    }
    return repository_.DeleteDownloadLink(link_id);
}

}  // namespace chunkshare::links
