#include "chunkshare/files/file_service.h"

#include "chunkshare/core/logger.h"

namespace chunkshare::files {

FileService::FileService(metadata::Repository& repository, storage::ChunkStore& store)
    : repository_(repository), store_(store) {}

core::Result<std::vector<metadata::StoredFile>> FileService::ListFiles(
    const std::optional<std::string>& owner_id) {
    return repository_.ListStoredFiles(owner_id);
}

core::Result<metadata::StoredFile> FileService::GetFile(const std::string& file_id) {
    return repository_.GetStoredFile(file_id);
}

core::Result<void> FileService::DeleteFile(const std::string& file_id) {
    auto file = repository_.GetStoredFile(file_id);
    if (!file.ok()) {
        return file.error();
    }

    auto removed = store_.RemoveFinalFile(file_id);
    if (!removed.ok()) {
        core::LogWarning("failed to remove blob of file " + file_id + ": " +
                         removed.error().message);
    }
    if (file.value().session_id) {
        store_.CleanupSession(*file.value().session_id);
    }
    return repository_.DeleteStoredFile(file_id);
}

}  // namespace chunkshare::files
