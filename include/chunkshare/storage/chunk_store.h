#pragma once

#include <cstdint>
#include <istream>
#include <limits>
#include <string>

#include "chunkshare/core/error.h"
#include "chunkshare/core/result.h"

namespace chunkshare::storage {

/// @brief A chunk body streamed to a private staging file, not yet visible under its index.
struct StagedChunk {
    std::string session_id;
    std::string stage_path;
    std::uint64_t size_bytes{0};
    std::string sha256;
};

/// @brief Filesystem layout for upload chunks and finalized blobs.
///
/// Chunks live at `<tmp_dir>/<session>/chunk_<index:08d>.part`; finalized blobs at
/// `<files_dir>/<file>/data`. All copies go through 8 KiB buffers.
class ChunkStore {
public:
    ChunkStore(std::string tmp_dir, std::string files_dir);

    /// @brief Stream `data` to a staging file while hashing it.
    ///
    /// Fails with kPayloadTooLarge (stage removed) once more than `max_bytes` arrive.
    core::Result<StagedChunk> StageChunk(
        const std::string& session_id, std::istream& data,
        std::uint64_t max_bytes = std::numeric_limits<std::uint64_t>::max());
    /// @brief Atomically rename a stage onto its indexed chunk path, replacing any previous file.
    core::Result<std::string> CommitChunk(const StagedChunk& staged, int index);
    void DiscardChunk(const StagedChunk& staged);
    /// @brief Stage and commit in one step.
    core::Result<std::string> WriteChunk(const std::string& session_id, int index,
                                         std::istream& data);
    /// @brief Path of a stored chunk, kNotFound when absent.
    core::Result<std::string> ReadChunk(const std::string& session_id, int index) const;

    /// @brief Concatenate chunks 0..total-1 into `target`; returns the merged byte count.
    core::Result<std::uint64_t> MergeChunks(const std::string& session_id, int total_chunks,
                                            const std::string& target);
    /// @brief Streaming SHA-256 of a file as lowercase hex.
    core::Result<std::string> ComputeDigest(const std::string& path) const;

    /// @brief Best-effort removal of a session's temp area; failures are logged.
    void CleanupSession(const std::string& session_id);

    std::string FinalFilePath(const std::string& file_id) const;
    core::Result<void> RemoveFinalFile(const std::string& file_id);

    std::string SessionDir(const std::string& session_id) const;
    std::string ChunkPath(const std::string& session_id, int index) const;

    const std::string& tmp_dir() const { return tmp_dir_; }
    const std::string& files_dir() const { return files_dir_; }

    static bool IsSafeName(const std::string& name);

private:
    std::string tmp_dir_;
    std::string files_dir_;
};

}  // namespace chunkshare::storage
