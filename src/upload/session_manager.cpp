#include "chunkshare/upload/session_manager.h"

#include <algorithm>
#include <cctype>
#include <cstdint>
#include <limits>

#include "chunkshare/auth/jwt_utils.h"
#include "chunkshare/core/ids.h"
#include "chunkshare/core/logger.h"
#include "chunkshare/core/time.h"
#include "chunkshare/observability/metrics.h"

namespace chunkshare::upload {

using metadata::SessionStatus;

namespace {

bool AcceptsChunks(SessionStatus status) {
    return status == SessionStatus::kInit || status == SessionStatus::kUploading;
}

bool ExceedsQuota(std::uint64_t used, std::uint64_t quota, std::uint64_t size) {
    return used > quota || size > quota - used;
}

}  // namespace

SessionManager::SessionManager(metadata::Repository& repository, storage::ChunkStore& store,
                               FinalizeQueue& queue, core::UploadConfig config)
    : repository_(repository), store_(store), queue_(queue), config_(std::move(config)) {}

bool SessionManager::IsValidDigest(const std::string& hex) {
    return hex.size() == 64 && std::all_of(hex.begin(), hex.end(), [](char c) {
               return std::isxdigit(static_cast<unsigned char>(c)) != 0;
           });
}

core::Result<metadata::UploadSession> SessionManager::CreateSession(
    const metadata::Principal& owner, const CreateSessionRequest& request) {
    if (!owner.is_active) {
        return core::Error{core::ErrorCode::kForbidden, "account is disabled"};
    }
    if (request.filename.empty() || request.filename.find('/') != std::string::npos ||
        request.filename.find('\\') != std::string::npos) {
        return core::Error{core::ErrorCode::kInvalidArgument, "invalid filename"};
    }
    if (request.total_chunks <= 0) {
        return core::Error{core::ErrorCode::kInvalidArgument, "total_chunks must be positive"};
    }
    if (request.size_bytes == 0) {
        return core::Error{core::ErrorCode::kInvalidArgument, "size must be positive"};
    }
    // Every chunk carries at least one byte.
    if (static_cast<std::uint64_t>(request.total_chunks) > request.size_bytes) {
        return core::Error{core::ErrorCode::kInvalidArgument, "total_chunks exceeds size"};
    }
    if (!IsValidDigest(request.file_sha256)) {
        return core::Error{core::ErrorCode::kInvalidArgument,
                           "file_sha256 must be 64 hex characters"};
    }
    const std::uint64_t chunk_size =
        request.chunk_size == 0 ? config_.default_chunk_size : request.chunk_size;
    if (chunk_size > config_.max_chunk_size) {
        return core::Error{core::ErrorCode::kUnprocessable,
                           "chunk_size exceeds " + std::to_string(config_.max_chunk_size)};
    }
    if (owner.quota_bytes &&
        ExceedsQuota(owner.used_bytes, *owner.quota_bytes, request.size_bytes)) {
        return core::Error{core::ErrorCode::kQuotaExceeded, "storage quota exceeded"};
    }
    if (request.size_bytes > static_cast<std::uint64_t>(std::numeric_limits<std::int64_t>::max())) {
        return core::Error{core::ErrorCode::kInvalidArgument, "size too large"};
    }

    metadata::UploadSession session;
    session.id = core::GenerateId();
    session.owner_id = owner.id;
    session.filename = request.filename;
    session.size_bytes = request.size_bytes;
    session.mime_type =
        request.mime_type.empty() ? "application/octet-stream" : request.mime_type;
    session.chunk_size = chunk_size;
    session.total_chunks = request.total_chunks;
    session.file_sha256 = auth::ToLower(request.file_sha256);
    session.status = SessionStatus::kUploading;
    session.created_at = core::NowIso8601();
    session.updated_at = session.created_at;
    session.expires_at = core::NowIso8601WithOffsetSeconds(config_.session_ttl_seconds);
    return repository_.CreateUploadSession(session);
}

core::Result<RecordOutcome> SessionManager::RecordChunk(const metadata::UploadSession& session,
                                                        int index, const std::string& sha256,
                                                        std::uint64_t size_bytes,
                                                        const std::string& location) {
    if (index < 0 || index >= session.total_chunks) {
        return core::Error{core::ErrorCode::kInvalidIndex, "invalid chunk index"};
    }

    metadata::UploadChunk chunk;
    chunk.session_id = session.id;
    chunk.index = index;
    chunk.checksum = auth::ToLower(sha256);
    chunk.size_bytes = size_bytes;
    chunk.stored_path = location;
    chunk.received_at = core::NowIso8601();

    auto inserted = repository_.InsertUploadChunk(chunk);
    if (inserted.ok()) {
        return RecordOutcome::kInserted;
    }
    if (inserted.code() != core::ErrorCode::kAlreadyExists) {
        return inserted.error();
    }

    // Lost the insert (earlier or concurrent submission): the stored digest decides.
    auto existing = repository_.GetUploadChunk(session.id, index);
    if (!existing.ok()) {
        return existing.error();
    }
    if (auth::ToLower(existing.value().checksum) == chunk.checksum) {
        return RecordOutcome::kAlreadyRecorded;
    }
    return core::Error{core::ErrorCode::kChecksumConflict,
                       "chunk " + std::to_string(index) + " already stored with another digest"};
}

core::Result<ChunkReceipt> SessionManager::AcceptChunk(const std::string& session_id, int index,
                                                       std::istream& body,
                                                       const ChunkExpectations& expectations) {
    auto session = repository_.GetUploadSession(session_id);
    if (!session.ok()) {
        return session.error();
    }
    const auto& upload = session.value();
    if (!AcceptsChunks(upload.status)) {
        return core::Error{core::ErrorCode::kInvalidState, "session not accepting chunks"};
    }
    if (core::IsPast(upload.expires_at)) {
        return core::Error{core::ErrorCode::kInvalidState, "upload session expired"};
    }
    if (index < 0 || index >= upload.total_chunks) {
        return core::Error{core::ErrorCode::kInvalidIndex, "invalid chunk index"};
    }

    auto staged = store_.StageChunk(upload.id, body, config_.max_chunk_size);
    if (!staged.ok()) {
        return staged.error();
    }
    const auto& stage = staged.value();
    auto reject = [&](core::ErrorCode code, const std::string& message) {
        store_.DiscardChunk(stage);
        return core::Error{code, message};
    };

    if (stage.size_bytes == 0) {
        return reject(core::ErrorCode::kInvalidArgument, "empty chunk");
    }
    if (expectations.size_bytes && *expectations.size_bytes != stage.size_bytes) {
        return reject(core::ErrorCode::kInvalidArgument, "chunk size mismatch");
    }
    if (expectations.sha256 && auth::ToLower(*expectations.sha256) != stage.sha256) {
        return reject(core::ErrorCode::kDigestMismatch, "chunk checksum mismatch");
    }

    const auto location = store_.ChunkPath(upload.id, index);
    auto recorded = RecordChunk(upload, index, stage.sha256, stage.size_bytes, location);
    if (!recorded.ok()) {
        return reject(recorded.error().code, recorded.error().message);
    }

    ChunkReceipt receipt;
    receipt.index = index;
    receipt.size_bytes = stage.size_bytes;
    receipt.sha256 = stage.sha256;
    if (recorded.value() == RecordOutcome::kAlreadyRecorded) {
        // The first writer may not have committed yet; identical bytes overwrite safely.
        auto committed = store_.CommitChunk(stage, index);
        if (!committed.ok() && !store_.ReadChunk(upload.id, index).ok()) {
            return committed.error();
        }
        receipt.already_recorded = true;
        return receipt;
    }

    auto committed = store_.CommitChunk(stage, index);
    if (!committed.ok()) {
        if (store_.ReadChunk(upload.id, index).ok()) {
            // A same-digest writer already placed the bytes; the row stays valid.
            observability::RecordChunkAccepted(stage.size_bytes);
            return receipt;
        }
        auto undone = repository_.DeleteUploadChunk(upload.id, index);
        if (!undone.ok()) {
            core::LogError("failed to release chunk " + std::to_string(index) + " of session " +
                           upload.id + ": " + undone.error().message);
        }
        return committed.error();
    }
    observability::RecordChunkAccepted(stage.size_bytes);
    return receipt;
}

core::Result<std::vector<int>> SessionManager::ListReceived(const std::string& session_id) {
    return repository_.ListChunkIndexes(session_id);
}

core::Result<std::vector<int>> SessionManager::ListMissing(
    const metadata::UploadSession& session) {
    auto received = repository_.ListChunkIndexes(session.id);
    if (!received.ok()) {
        return received.error();
    }
    std::vector<int> missing;
    auto it = received.value().begin();
    for (int index = 0; index < session.total_chunks; ++index) {
        while (it != received.value().end() && *it < index) {
            ++it;
        }
        if (it == received.value().end() || *it != index) {
            missing.push_back(index);
        }
    }
    return missing;
}

core::Result<SessionStatusView> SessionManager::GetStatus(const std::string& session_id) {
    auto session = repository_.GetUploadSession(session_id);
    if (!session.ok()) {
        return session.error();
    }
    auto received = ListReceived(session_id);
    if (!received.ok()) {
        return received.error();
    }
    auto missing = ListMissing(session.value());
    if (!missing.ok()) {
        return missing.error();
    }
    return SessionStatusView{session.value(), received.value(), missing.value()};
}

core::Result<FinalizeTicket> SessionManager::RequestFinalize(const std::string& session_id,
                                                             const std::string& declared_sha256) {
    auto session = repository_.GetUploadSession(session_id);
    if (!session.ok()) {
        return session.error();
    }
    const auto& upload = session.value();
    if (!metadata::CanTransition(upload.status, SessionStatus::kFinalizing)) {
        return core::Error{core::ErrorCode::kInvalidState, "session not finalizable"};
    }
    if (auth::ToLower(declared_sha256) != auth::ToLower(upload.file_sha256)) {
        return core::Error{core::ErrorCode::kDigestMismatch, "file hash mismatch"};
    }
    auto missing = ListMissing(upload);
    if (!missing.ok()) {
        return missing.error();
    }
    if (!missing.value().empty()) {
        return core::Error{core::ErrorCode::kIncompleteUpload,
                           std::to_string(missing.value().size()) + " chunk(s) missing"};
    }

    metadata::StoredFile candidate;
    candidate.id = core::GenerateId();
    candidate.session_id = upload.id;
    candidate.owner_id = upload.owner_id;
    candidate.filename = upload.filename;
    candidate.size_bytes = upload.size_bytes;
    candidate.mime_type = upload.mime_type;
    candidate.sha256 = upload.file_sha256;
    candidate.storage_path = store_.FinalFilePath(candidate.id);
    candidate.status = metadata::FileStatus::kPending;
    candidate.created_at = core::NowIso8601();

    auto file = repository_.BeginFinalize(upload.id, candidate);
    if (!file.ok()) {
        return file.error();
    }
    queue_.Submit(FinalizeJob{upload.id, file.value().id});
    return FinalizeTicket{upload.id, file.value().id, SessionStatus::kFinalizing};
}

core::Result<int> SessionManager::ExpireStaleSessions(int limit) {
    auto stale = repository_.ListExpiredUploadSessions(core::NowIso8601(), limit);
    if (!stale.ok()) {
        return stale.error();
    }
    int expired = 0;
    for (const auto& session : stale.value()) {
        if (!metadata::CanTransition(session.status, SessionStatus::kExpired)) {
            continue;
        }
        auto updated =
            repository_.UpdateUploadSessionStatus(session.id, session.status, SessionStatus::kExpired);
        if (!updated.ok()) {
            // Typically a finalize request won the race; the session is no longer stale.
            core::LogDebug("skip expiring session " + session.id + ": " + updated.error().message);
            continue;
        }
        store_.CleanupSession(session.id);
        ++expired;
    }
    return expired;
}

core::Result<int> SessionManager::RecoverPendingFinalizations(int limit) {
    auto released = repository_.ReleaseAllFinalizeClaims();
    if (!released.ok()) {
        return released.error();
    }
    if (released.value() > 0) {
        core::LogInfo("dropped " + std::to_string(released.value()) + " stale finalize claim(s)");
    }
    auto finalizing = repository_.ListUploadSessionsByStatus(SessionStatus::kFinalizing, limit);
    if (!finalizing.ok()) {
        return finalizing.error();
    }
    int submitted = 0;
    for (const auto& session : finalizing.value()) {
        auto file = repository_.GetStoredFileBySession(session.id);
        if (!file.ok() || file.value().status != metadata::FileStatus::kPending) {
            continue;
        }
        queue_.Submit(FinalizeJob{session.id, file.value().id});
        ++submitted;
    }
    return submitted;
}

}  // namespace chunkshare::upload
