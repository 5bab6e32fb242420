#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

#include "chunkshare/core/error.h"
#include "chunkshare/core/result.h"

namespace chunkshare::metadata {

/// @brief Upload session lifecycle. FAILED and EXPIRED are terminal alternatives to COMPLETED.
enum class SessionStatus {
    kInit,
    kUploading,
    kFinalizing,
    kCompleted,
    kFailed,
    kExpired,
};

enum class FileStatus {
    kPending,
    kReady,
    kError,
};

const char* ToString(SessionStatus status);
const char* ToString(FileStatus status);
std::optional<SessionStatus> ParseSessionStatus(const std::string& value);
std::optional<FileStatus> ParseFileStatus(const std::string& value);
bool IsTerminal(SessionStatus status);
/// @brief Legal edges of the session state machine.
bool CanTransition(SessionStatus from, SessionStatus to);

/// @brief Externally managed account; only the fields the core needs.
struct Principal {
    std::string id;
    bool is_admin{false};
    bool is_active{true};
    std::optional<std::uint64_t> quota_bytes;  // nullopt = unlimited
    std::uint64_t used_bytes{0};
    std::string created_at;
};

struct UploadSession {
    std::string id;
    std::string owner_id;
    std::string filename;
    std::uint64_t size_bytes{0};
    std::string mime_type;
    std::uint64_t chunk_size{0};
    int total_chunks{0};
    std::string file_sha256;
    SessionStatus status{SessionStatus::kInit};
    std::string created_at;
    std::string updated_at;
    std::string expires_at;
    std::optional<std::string> finalized_at;
};

struct UploadChunk {
    std::string session_id;
    int index{0};
    std::string checksum;
    std::uint64_t size_bytes{0};
    std::string stored_path;
    std::string received_at;
};

struct StoredFile {
    std::string id;
    std::optional<std::string> session_id;
    std::string owner_id;
    std::string filename;
    std::uint64_t size_bytes{0};
    std::string mime_type;
    std::string sha256;
    std::string storage_path;
    FileStatus status{FileStatus::kPending};
    std::string created_at;
    std::optional<std::string> completed_at;
};

struct DownloadLink {
    std::string id;
    std::string file_id;
    std::string token;
    std::optional<std::string> expires_at;  // nullopt = never expires
    bool one_time{false};
    std::int64_t download_count{0};
    std::optional<std::string> password_hash;
    bool is_enabled{true};
    bool require_landing_page{false};
    std::optional<std::string> short_code;
    std::string created_at;

    bool never_expires() const { return !expires_at.has_value(); }
    bool exhausted() const { return one_time && download_count >= 1; }
};

/// @brief Transactional store for principals, sessions, chunks, files and links.
///
/// Uniqueness violations are reported as kAlreadyExists so callers can resolve races;
/// other database failures surface as kDbError.
class Repository {
public:
    virtual ~Repository() = default;

    virtual core::Result<Principal> CreatePrincipal(const Principal& principal) = 0;
    virtual core::Result<Principal> GetPrincipal(const std::string& id) = 0;
    /// @brief used_bytes = max(0, used_bytes + delta).
    virtual core::Result<void> AdjustUsedBytes(const std::string& principal_id,
                                               std::int64_t delta) = 0;

    virtual core::Result<UploadSession> CreateUploadSession(const UploadSession& session) = 0;
    virtual core::Result<UploadSession> GetUploadSession(const std::string& id) = 0;
    /// @brief Compare-and-set the status; kInvalidState when the row is no longer in `from`.
    virtual core::Result<void> UpdateUploadSessionStatus(const std::string& id,
                                                         SessionStatus from,
                                                         SessionStatus to) = 0;
    virtual core::Result<std::vector<UploadSession>> ListExpiredUploadSessions(
        const std::string& expires_before, int limit) = 0;
    virtual core::Result<std::vector<UploadSession>> ListUploadSessionsByStatus(
        SessionStatus status, int limit) = 0;

    virtual core::Result<UploadChunk> InsertUploadChunk(const UploadChunk& chunk) = 0;
    virtual core::Result<UploadChunk> GetUploadChunk(const std::string& session_id,
                                                     int index) = 0;
    virtual core::Result<void> DeleteUploadChunk(const std::string& session_id, int index) = 0;
    /// @brief Distinct received indexes in ascending order.
    virtual core::Result<std::vector<int>> ListChunkIndexes(const std::string& session_id) = 0;

    /// @brief Move the session to FINALIZING and bind a pending file to it, atomically.
    ///
    /// Legal from UPLOADING or FINALIZING (kInvalidState otherwise). When a pending file is
    /// already bound to the session (a retried request) it is returned instead of `candidate`.
    virtual core::Result<StoredFile> BeginFinalize(const std::string& session_id,
                                                   const StoredFile& candidate) = 0;
    /// @brief Mark a pending file as being merged by `worker_id`.
    ///
    /// Returns false when the file is no longer pending or another worker holds the claim.
    virtual core::Result<bool> ClaimFinalize(const std::string& file_id,
                                             const std::string& worker_id) = 0;
    virtual core::Result<void> ReleaseFinalizeClaim(const std::string& file_id,
                                                    const std::string& worker_id) = 0;
    /// @brief Drop every claim on pending files; only safe while no worker is running.
    virtual core::Result<int> ReleaseAllFinalizeClaims() = 0;
    /// @brief file -> error, session -> FAILED in one transaction.
    ///
    /// Only applies while the file is still pending; returns whether it applied.
    virtual core::Result<bool> MarkFinalizeFailed(const std::string& session_id,
                                                  const std::string& file_id) = 0;
    /// @brief file -> ready (size, completed_at), owner charged, session -> COMPLETED.
    ///
    /// Only applies while the file is still pending; returns whether it applied so a
    /// redelivered job never charges quota twice. The owner's quota is checked in the
    /// same transaction; kQuotaExceeded leaves the file pending and nothing charged.
    virtual core::Result<bool> MarkFinalizeSucceeded(const std::string& session_id,
                                                     const std::string& file_id,
                                                     std::uint64_t merged_size) = 0;

    virtual core::Result<StoredFile> GetStoredFile(const std::string& id) = 0;
    virtual core::Result<StoredFile> GetStoredFileBySession(const std::string& session_id) = 0;
    virtual core::Result<std::vector<StoredFile>> ListStoredFiles(
        const std::optional<std::string>& owner_id) = 0;
    /// @brief Delete the file and its links; a ready file's size is released from the owner.
    virtual core::Result<void> DeleteStoredFile(const std::string& id) = 0;

    virtual core::Result<DownloadLink> CreateDownloadLink(const DownloadLink& link) = 0;
    virtual core::Result<DownloadLink> GetDownloadLink(const std::string& id) = 0;
    virtual core::Result<DownloadLink> GetDownloadLinkByToken(const std::string& token) = 0;
    virtual core::Result<DownloadLink> GetDownloadLinkByShortCode(const std::string& code) = 0;
    virtual core::Result<std::vector<DownloadLink>> ListDownloadLinks(
        const std::string& file_id) = 0;
    virtual core::Result<void> DeleteDownloadLink(const std::string& id) = 0;
    /// @brief Atomically count one download if the link is still usable at `now`.
    ///
    /// A single conditional UPDATE checks enabled/expiry/one-time exhaustion and increments
    /// the counter (disabling one-time links). Returns false when the guard did not match.
    virtual core::Result<bool> ConsumeDownloadLink(const std::string& id,
                                                   const std::string& now) = 0;
};

}  // namespace chunkshare::metadata
