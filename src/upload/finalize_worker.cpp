#include "chunkshare/upload/finalize_worker.h"

#include <filesystem>
#include <utility>

#include "chunkshare/auth/jwt_utils.h"
#include "chunkshare/core/ids.h"
#include "chunkshare/core/logger.h"
#include "chunkshare/observability/metrics.h"

namespace chunkshare::upload {

const char* ToString(FinalizeOutcome outcome) {
    switch (outcome) {
        case FinalizeOutcome::kReady:
            return "ready";
        case FinalizeOutcome::kFailed:
            return "failed";
        case FinalizeOutcome::kSkipped:
            return "skipped";
        case FinalizeOutcome::kAborted:
            return "aborted";
    }
    return "aborted";
}

namespace {

/// @brief Releases a finalize claim on scope exit unless the job settled the file.
class ClaimGuard {
public:
    ClaimGuard(metadata::Repository& repository, std::string file_id)
        : repository_(repository), file_id_(std::move(file_id)), worker_id_(core::GenerateId()) {}
    ~ClaimGuard() {
        if (settled_) {
            return;
        }
        auto released = repository_.ReleaseFinalizeClaim(file_id_, worker_id_);
        if (!released.ok()) {
            core::LogWarning("failed to release finalize claim on " + file_id_ + ": " +
                             released.error().message);
        }
    }
    ClaimGuard(const ClaimGuard&) = delete;
    ClaimGuard& operator=(const ClaimGuard&) = delete;

    const std::string& worker_id() const { return worker_id_; }

    void Settle() { settled_ = true; }
    FinalizeOutcome Settle(FinalizeOutcome outcome) {
        // An aborted failure leaves the file pending, so the claim must go.
        settled_ = outcome != FinalizeOutcome::kAborted;
        return outcome;
    }

private:
    metadata::Repository& repository_;
    std::string file_id_;
    std::string worker_id_;
    bool settled_{false};
};

}  // namespace

FinalizeWorker::FinalizeWorker(metadata::Repository& repository, storage::ChunkStore& store)
    : repository_(repository), store_(store) {}

FinalizeOutcome FinalizeWorker::Report(const FinalizeJob& job, FinalizeOutcome outcome,
                                       const std::string& detail) {
    core::LogEvent("finalize", {{"session_id", job.session_id},
                                {"file_id", job.file_id},
                                {"outcome", ToString(outcome)},
                                {"detail", detail}});
    if (outcome == FinalizeOutcome::kReady || outcome == FinalizeOutcome::kFailed) {
        observability::RecordFinalize(outcome == FinalizeOutcome::kReady);
    }
    return outcome;
}

FinalizeOutcome FinalizeWorker::Fail(const FinalizeJob& job, const std::string& reason,
                                     const std::string& merged_path) {
    auto marked = repository_.MarkFinalizeFailed(job.session_id, job.file_id);
    if (!marked.ok()) {
        // Leaves the job pending; the start-up recovery sweep redelivers it.
        return Report(job, FinalizeOutcome::kAborted,
                      reason + "; marking failed: " + marked.error().message);
    }
    if (!marked.value()) {
        // Settled elsewhere; the blob at merged_path may belong to a ready file.
        return Report(job, FinalizeOutcome::kSkipped, reason + "; file no longer pending");
    }
    if (!merged_path.empty()) {
        std::error_code ec;
        std::filesystem::remove(merged_path, ec);
    }
    store_.CleanupSession(job.session_id);
    return Report(job, FinalizeOutcome::kFailed, reason);
}

FinalizeOutcome FinalizeWorker::Finalize(const FinalizeJob& job) {
    auto session = repository_.GetUploadSession(job.session_id);
    if (!session.ok()) {
        return Report(job, FinalizeOutcome::kAborted, session.error().message);
    }
    auto file = repository_.GetStoredFile(job.file_id);
    if (!file.ok()) {
        return Report(job, FinalizeOutcome::kAborted, file.error().message);
    }
    if (file.value().status != metadata::FileStatus::kPending) {
        return Report(job, FinalizeOutcome::kSkipped,
                      std::string("file already ") + metadata::ToString(file.value().status));
    }

    ClaimGuard claim(repository_, job.file_id);
    auto claimed = repository_.ClaimFinalize(job.file_id, claim.worker_id());
    if (!claimed.ok()) {
        return Report(job, FinalizeOutcome::kAborted, claimed.error().message);
    }
    if (!claimed.value()) {
        claim.Settle();
        return Report(job, FinalizeOutcome::kSkipped, "claimed by another worker");
    }

    const auto& upload = session.value();
    auto received = repository_.ListChunkIndexes(upload.id);
    if (!received.ok()) {
        return Report(job, FinalizeOutcome::kAborted, received.error().message);
    }
    if (static_cast<int>(received.value().size()) != upload.total_chunks) {
        return claim.Settle(Fail(job, "upload incomplete", ""));
    }

    const auto& target = file.value().storage_path;
    auto merged = store_.MergeChunks(upload.id, upload.total_chunks, target);
    if (!merged.ok()) {
        return claim.Settle(Fail(job, "merge failed: " + merged.error().message, ""));
    }

    auto digest = store_.ComputeDigest(target);
    if (!digest.ok()) {
        return claim.Settle(Fail(job, "digest failed: " + digest.error().message, target));
    }
    if (auth::ToLower(digest.value()) != auth::ToLower(upload.file_sha256)) {
        return claim.Settle(Fail(job, "digest mismatch", target));
    }

    auto promoted = repository_.MarkFinalizeSucceeded(upload.id, job.file_id, merged.value());
    if (!promoted.ok()) {
        if (promoted.code() == core::ErrorCode::kQuotaExceeded) {
            return claim.Settle(Fail(job, "quota exceeded", target));
        }
        return Report(job, FinalizeOutcome::kAborted, promoted.error().message);
    }
    claim.Settle();
    if (!promoted.value()) {
        return Report(job, FinalizeOutcome::kSkipped, "promoted concurrently");
    }
    store_.CleanupSession(upload.id);
    return Report(job, FinalizeOutcome::kReady, std::to_string(merged.value()) + " bytes");
}

}  // namespace chunkshare::upload
