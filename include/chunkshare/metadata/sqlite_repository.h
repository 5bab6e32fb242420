#pragma once

#include <memory>
#include <string>

#include <Poco/Data/Session.h>
#include <Poco/Data/SessionPool.h>

#include "chunkshare/metadata/repository.h"

namespace chunkshare::metadata {

/// @brief SQLite-backed repository for single-node mode.
///
/// Each operation borrows a pooled session; the database runs in WAL mode with a busy timeout
/// so concurrent request threads and finalize workers serialize on writes instead of failing.
class SqliteRepository : public Repository {
public:
    explicit SqliteRepository(const std::string& db_path, int max_sessions = 16);

    core::Result<Principal> CreatePrincipal(const Principal& principal) override;
    core::Result<Principal> GetPrincipal(const std::string& id) override;
    core::Result<void> AdjustUsedBytes(const std::string& principal_id,
                                       std::int64_t delta) override;

    core::Result<UploadSession> CreateUploadSession(const UploadSession& session) override;
    core::Result<UploadSession> GetUploadSession(const std::string& id) override;
    core::Result<void> UpdateUploadSessionStatus(const std::string& id, SessionStatus from,
                                                 SessionStatus to) override;
    core::Result<std::vector<UploadSession>> ListExpiredUploadSessions(
        const std::string& expires_before, int limit) override;
    core::Result<std::vector<UploadSession>> ListUploadSessionsByStatus(SessionStatus status,
                                                                        int limit) override;

    core::Result<UploadChunk> InsertUploadChunk(const UploadChunk& chunk) override;
    core::Result<UploadChunk> GetUploadChunk(const std::string& session_id, int index) override;
    core::Result<void> DeleteUploadChunk(const std::string& session_id, int index) override;
    core::Result<std::vector<int>> ListChunkIndexes(const std::string& session_id) override;

    core::Result<StoredFile> BeginFinalize(const std::string& session_id,
                                           const StoredFile& candidate) override;
    core::Result<bool> ClaimFinalize(const std::string& file_id,
                                     const std::string& worker_id) override;
    core::Result<void> ReleaseFinalizeClaim(const std::string& file_id,
                                            const std::string& worker_id) override;
    core::Result<int> ReleaseAllFinalizeClaims() override;
    core::Result<bool> MarkFinalizeFailed(const std::string& session_id,
                                          const std::string& file_id) override;
    core::Result<bool> MarkFinalizeSucceeded(const std::string& session_id,
                                             const std::string& file_id,
                                             std::uint64_t merged_size) override;

    core::Result<StoredFile> GetStoredFile(const std::string& id) override;
    core::Result<StoredFile> GetStoredFileBySession(const std::string& session_id) override;
    core::Result<std::vector<StoredFile>> ListStoredFiles(
        const std::optional<std::string>& owner_id) override;
    core::Result<void> DeleteStoredFile(const std::string& id) override;

    core::Result<DownloadLink> CreateDownloadLink(const DownloadLink& link) override;
    core::Result<DownloadLink> GetDownloadLink(const std::string& id) override;
    core::Result<DownloadLink> GetDownloadLinkByToken(const std::string& token) override;
    core::Result<DownloadLink> GetDownloadLinkByShortCode(const std::string& code) override;
    core::Result<std::vector<DownloadLink>> ListDownloadLinks(const std::string& file_id) override;
    core::Result<void> DeleteDownloadLink(const std::string& id) override;
    core::Result<bool> ConsumeDownloadLink(const std::string& id, const std::string& now) override;

private:
    void InitSchema();
    /// @brief Borrow a pooled session with per-connection pragmas applied.
    Poco::Data::Session Acquire();

    std::unique_ptr<Poco::Data::SessionPool> pool_;
};

}  // namespace chunkshare::metadata
