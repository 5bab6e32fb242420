#pragma once

#include <cstdint>
#include <istream>
#include <optional>
#include <string>
#include <vector>

#include "chunkshare/core/config.h"
#include "chunkshare/metadata/repository.h"
#include "chunkshare/storage/chunk_store.h"
#include "chunkshare/upload/finalize_queue.h"

namespace chunkshare::upload {

struct CreateSessionRequest {
    std::string filename;
    std::uint64_t size_bytes{0};
    std::string mime_type;
    std::uint64_t chunk_size{0};  // 0 selects the configured default
    int total_chunks{0};
    std::string file_sha256;
};

enum class RecordOutcome {
    kInserted,
    kAlreadyRecorded,
};

/// @brief Optional client-declared properties of a chunk body, checked before recording.
struct ChunkExpectations {
    std::optional<std::uint64_t> size_bytes;
    std::optional<std::string> sha256;
};

struct ChunkReceipt {
    int index{0};
    std::uint64_t size_bytes{0};
    std::string sha256;
    bool already_recorded{false};
};

struct SessionStatusView {
    metadata::UploadSession session;
    std::vector<int> received;
    std::vector<int> missing;
};

struct FinalizeTicket {
    std::string session_id;
    std::string file_id;
    metadata::SessionStatus status{metadata::SessionStatus::kFinalizing};
};

/// @brief Upload session state machine and chunk bookkeeping.
class SessionManager {
public:
    SessionManager(metadata::Repository& repository, storage::ChunkStore& store,
                   FinalizeQueue& queue, core::UploadConfig config);

    core::Result<metadata::UploadSession> CreateSession(const metadata::Principal& owner,
                                                        const CreateSessionRequest& request);

    /// @brief Record a chunk digest for `index`; identical re-submissions are no-ops.
    core::Result<RecordOutcome> RecordChunk(const metadata::UploadSession& session, int index,
                                            const std::string& sha256, std::uint64_t size_bytes,
                                            const std::string& location);

    /// @brief Stage, verify, record and commit one chunk body.
    core::Result<ChunkReceipt> AcceptChunk(const std::string& session_id, int index,
                                           std::istream& body,
                                           const ChunkExpectations& expectations);

    core::Result<std::vector<int>> ListReceived(const std::string& session_id);
    core::Result<std::vector<int>> ListMissing(const metadata::UploadSession& session);
    core::Result<SessionStatusView> GetStatus(const std::string& session_id);

    /// @brief Gate on completeness and digest, then queue the merge.
    core::Result<FinalizeTicket> RequestFinalize(const std::string& session_id,
                                                 const std::string& declared_sha256);

    /// @brief Move overdue UPLOADING sessions to EXPIRED; returns how many moved.
    core::Result<int> ExpireStaleSessions(int limit);
    /// @brief Resubmit FINALIZING sessions whose file is still pending; run at start-up.
    ///
    /// Claims left by workers of a previous process are dropped first, so call this before
    /// the queue has run any job.
    core::Result<int> RecoverPendingFinalizations(int limit);

    static bool IsValidDigest(const std::string& hex);

private:
    metadata::Repository& repository_;
    storage::ChunkStore& store_;
    FinalizeQueue& queue_;
    core::UploadConfig config_;
};

}  // namespace chunkshare::upload
