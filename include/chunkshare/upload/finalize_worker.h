#pragma once

#include "chunkshare/metadata/repository.h"
#include "chunkshare/storage/chunk_store.h"
#include "chunkshare/upload/finalize_queue.h"

namespace chunkshare::upload {

enum class FinalizeOutcome {
    kReady,    // file promoted, quota charged, session completed
    kFailed,   // file error, session failed
    kSkipped,  // already settled, or another worker holds the claim
    kAborted,  // records missing or unreadable; nothing changed
};

const char* ToString(FinalizeOutcome outcome);

/// @brief Merges a complete upload, verifies it and promotes the file record.
class FinalizeWorker {
public:
    FinalizeWorker(metadata::Repository& repository, storage::ChunkStore& store);

    FinalizeOutcome Finalize(const FinalizeJob& job);

private:
    FinalizeOutcome Fail(const FinalizeJob& job, const std::string& reason,
                         const std::string& merged_path);
    FinalizeOutcome Report(const FinalizeJob& job, FinalizeOutcome outcome,
                           const std::string& detail);

    metadata::Repository& repository_;
    storage::ChunkStore& store_;
};

}  // namespace chunkshare::upload
