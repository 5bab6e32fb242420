#pragma once

#include <optional>
#include <string>
#include <vector>

#include "chunkshare/metadata/repository.h"
#include "chunkshare/storage/chunk_store.h"

namespace chunkshare::files {

/// @brief Owner-facing catalogue of stored files.
class FileService {
public:
    FileService(metadata::Repository& repository, storage::ChunkStore& store);

    /// @brief All files, or only `owner_id`'s, newest first.
    core::Result<std::vector<metadata::StoredFile>> ListFiles(
        const std::optional<std::string>& owner_id);
    core::Result<metadata::StoredFile> GetFile(const std::string& file_id);
    /// @brief Remove the blob, links and record; a ready file's size is released from quota.
    core::Result<void> DeleteFile(const std::string& file_id);

private:
    metadata::Repository& repository_;
    storage::ChunkStore& store_;
};

}  // namespace chunkshare::files
