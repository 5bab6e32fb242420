#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

#include "chunkshare/auth/jwt_codec.h"
#include "chunkshare/auth/password_hasher.h"
#include "chunkshare/core/config.h"
#include "chunkshare/metadata/repository.h"

namespace chunkshare::links {

/// @brief Requested lifetime of a link.
struct LinkExpiry {
    enum class Kind {
        kDefault,       // links.default_expiry_minutes from now
        kAfterMinutes,  // `minutes` from now
        kAt,            // absolute `at_epoch_seconds`
        kNever,
    };
    Kind kind{Kind::kDefault};
    int minutes{0};
    std::int64_t at_epoch_seconds{0};
};

struct LinkOptions {
    LinkExpiry expiry;
    bool one_time{false};
    std::optional<std::string> password;
    bool require_landing_page{false};
    bool with_short_code{false};
};

struct IssuedLink {
    metadata::DownloadLink link;
    std::string token;
    bool never_expires{false};
};

/// @brief What a validated download streams.
struct DownloadHandle {
    metadata::StoredFile file;
    std::string path;
    std::int64_t download_count{0};
};

struct ShortCodeResolution {
    std::string file_id;
    std::string token;
    // Set when the link needs the landing page (explicitly or for a password prompt).
    std::optional<std::string> landing_target;
};

/// @brief Issues, validates and consumes download links.
class LinkEngine {
public:
    LinkEngine(metadata::Repository& repository, const auth::JwtCodec& codec,
               core::LinksConfig config);

    core::Result<IssuedLink> IssueLink(const std::string& file_id, const LinkOptions& options);

    /// @brief Check the token and link policy, then atomically count the download.
    core::Result<DownloadHandle> ValidateAndConsume(const std::string& token,
                                                    const std::optional<std::string>& password);

    core::Result<ShortCodeResolution> ResolveShortCode(const std::string& code);

    core::Result<std::vector<metadata::DownloadLink>> ListLinks(const std::string& file_id);
    core::Result<void> RevokeLink(const std::string& file_id, const std::string& link_id);

private:
    core::Result<std::optional<std::int64_t>> ResolveExpiry(const LinkExpiry& expiry) const;

    metadata::Repository& repository_;
    const auth::JwtCodec& codec_;
    core::LinksConfig config_;
    auth::PasswordHasher hasher_;
};

/// @brief Lifecycle reason a link refuses downloads at `now`, checked expired -> exhausted ->
/// disabled; nullopt when the link is usable.
std::optional<core::Error> LinkRejection(const metadata::DownloadLink& link,
                                         const std::string& now);

}  // namespace chunkshare::links
