#include "chunkshare/storage/chunk_store.h"

#include <array>
#include <cctype>
#include <cstdio>
#include <filesystem>
#include <fstream>

#include <Poco/DigestEngine.h>
#include <Poco/SHA2Engine.h>
#include <Poco/UUIDGenerator.h>

#include <fcntl.h>
#include <unistd.h>

#include "chunkshare/core/logger.h"

namespace chunkshare::storage {

namespace {

constexpr std::size_t kBufferSize = 8192;

bool WriteAll(int fd, const char* data, std::size_t size) {
    while (size > 0) {
        const ssize_t written = ::write(fd, data, size);
        if (written < 0) {
            return false;
        }
        data += written;
        size -= static_cast<std::size_t>(written);
    }
    return true;
}

void RemoveQuietly(const std::string& path) {
    std::error_code ec;
    std::filesystem::remove(path, ec);
}

}  // namespace

ChunkStore::ChunkStore(std::string tmp_dir, std::string files_dir)
    : tmp_dir_(std::move(tmp_dir)), files_dir_(std::move(files_dir)) {
    std::filesystem::create_directories(tmp_dir_);
    std::filesystem::create_directories(files_dir_);
}

std::string ChunkStore::SessionDir(const std::string& session_id) const {
    return (std::filesystem::path(tmp_dir_) / session_id).string();
}

std::string ChunkStore::ChunkPath(const std::string& session_id, int index) const {
    char name[32];
    std::snprintf(name, sizeof(name), "chunk_%08d.part", index);
    return (std::filesystem::path(tmp_dir_) / session_id / name).string();
}

std::string ChunkStore::FinalFilePath(const std::string& file_id) const {
    return (std::filesystem::path(files_dir_) / file_id / "data").string();
}

core::Result<StagedChunk> ChunkStore::StageChunk(const std::string& session_id,
                                                 std::istream& data, std::uint64_t max_bytes) {
    if (!IsSafeName(session_id)) {
        return core::Error{core::ErrorCode::kInvalidArgument, "invalid session id"};
    }
    std::error_code ec;
    std::filesystem::create_directories(SessionDir(session_id), ec);
    if (ec) {
        return core::Error{core::ErrorCode::kIoError, "failed to create session dir: " + ec.message()};
    }

    // Stages sit beside the chunks so the commit rename never crosses filesystems.
    StagedChunk staged;
    staged.session_id = session_id;
    staged.stage_path = (std::filesystem::path(SessionDir(session_id)) /
                         (".stage-" + Poco::UUIDGenerator().createOne().toString()))
                            .string();

    const int fd = ::open(staged.stage_path.c_str(), O_CREAT | O_WRONLY | O_TRUNC, 0644);
    if (fd < 0) {
        return core::Error{core::ErrorCode::kIoError, "failed to open stage file"};
    }

    Poco::SHA2Engine256 sha256;
    std::array<char, kBufferSize> buffer{};
    while (data) {
        data.read(buffer.data(), buffer.size());
        const std::streamsize bytes = data.gcount();
        if (bytes <= 0) {
            break;
        }
        staged.size_bytes += static_cast<std::uint64_t>(bytes);
        if (staged.size_bytes > max_bytes) {
            ::close(fd);
            RemoveQuietly(staged.stage_path);
            return core::Error{core::ErrorCode::kPayloadTooLarge, "chunk exceeds maximum size"};
        }
        if (!WriteAll(fd, buffer.data(), static_cast<std::size_t>(bytes))) {
            ::close(fd);
            RemoveQuietly(staged.stage_path);
            return core::Error{core::ErrorCode::kIoError, "failed to write stage file"};
        }
        sha256.update(buffer.data(), static_cast<unsigned int>(bytes));
    }
    ::fsync(fd);
    ::close(fd);
    if (data.bad()) {
        RemoveQuietly(staged.stage_path);
        return core::Error{core::ErrorCode::kIoError, "failed to read chunk body"};
    }

    staged.sha256 = Poco::DigestEngine::digestToHex(sha256.digest());
    return staged;
}

core::Result<std::string> ChunkStore::CommitChunk(const StagedChunk& staged, int index) {
    const auto path = ChunkPath(staged.session_id, index);
    std::error_code ec;
    std::filesystem::rename(staged.stage_path, path, ec);
    if (ec) {
        RemoveQuietly(staged.stage_path);
        return core::Error{core::ErrorCode::kIoError, "failed to commit chunk: " + ec.message()};
    }
    return path;
}

void ChunkStore::DiscardChunk(const StagedChunk& staged) {
    RemoveQuietly(staged.stage_path);
}

core::Result<std::string> ChunkStore::WriteChunk(const std::string& session_id, int index,
                                                 std::istream& data) {
    if (index < 0) {
        return core::Error{core::ErrorCode::kInvalidIndex, "chunk index must be non-negative"};
    }
    auto staged = StageChunk(session_id, data);
    if (!staged.ok()) {
        return staged.error();
    }
    return CommitChunk(staged.value(), index);
}

core::Result<std::string> ChunkStore::ReadChunk(const std::string& session_id, int index) const {
    if (!IsSafeName(session_id) || index < 0) {
        return core::Error{core::ErrorCode::kInvalidArgument, "invalid chunk reference"};
    }
    const auto path = ChunkPath(session_id, index);
    std::error_code ec;
    if (!std::filesystem::is_regular_file(path, ec)) {
        return core::Error{core::ErrorCode::kNotFound, "chunk not found"};
    }
    return path;
}

core::Result<std::uint64_t> ChunkStore::MergeChunks(const std::string& session_id,
                                                    int total_chunks, const std::string& target) {
    if (!IsSafeName(session_id) || total_chunks <= 0) {
        return core::Error{core::ErrorCode::kInvalidArgument, "invalid merge request"};
    }
    std::error_code ec;
    std::filesystem::create_directories(std::filesystem::path(target).parent_path(), ec);
    if (ec) {
        return core::Error{core::ErrorCode::kIoError, "failed to create target dir: " + ec.message()};
    }

    const auto partial = target + ".partial-" + Poco::UUIDGenerator().createOne().toString();
    const int fd = ::open(partial.c_str(), O_CREAT | O_WRONLY | O_TRUNC, 0644);
    if (fd < 0) {
        return core::Error{core::ErrorCode::kIoError, "failed to open merge target"};
    }

    std::uint64_t total = 0;
    std::array<char, kBufferSize> buffer{};
    for (int index = 0; index < total_chunks; ++index) {
        std::ifstream in(ChunkPath(session_id, index), std::ios::binary);
        if (!in.is_open()) {
            ::close(fd);
            RemoveQuietly(partial);
            return core::Error{core::ErrorCode::kMissingChunk,
                               "missing chunk " + std::to_string(index)};
        }
        while (in) {
            in.read(buffer.data(), buffer.size());
            const std::streamsize bytes = in.gcount();
            if (bytes <= 0) {
                break;
            }
            if (!WriteAll(fd, buffer.data(), static_cast<std::size_t>(bytes))) {
                ::close(fd);
                RemoveQuietly(partial);
                return core::Error{core::ErrorCode::kIoError, "failed to write merge target"};
            }
            total += static_cast<std::uint64_t>(bytes);
        }
        if (in.bad()) {
            ::close(fd);
            RemoveQuietly(partial);
            return core::Error{core::ErrorCode::kIoError,
                               "failed to read chunk " + std::to_string(index)};
        }
    }
    ::fsync(fd);
    ::close(fd);

    std::filesystem::rename(partial, target, ec);
    if (ec) {
        RemoveQuietly(partial);
        return core::Error{core::ErrorCode::kIoError, "failed to promote merged file: " + ec.message()};
    }
    return total;
}

core::Result<std::string> ChunkStore::ComputeDigest(const std::string& path) const {
    std::ifstream in(path, std::ios::binary);
    if (!in.is_open()) {
        return core::Error{core::ErrorCode::kNotFound, "file not found: " + path};
    }
    Poco::SHA2Engine256 sha256;
    std::array<char, kBufferSize> buffer{};
    while (in) {
        in.read(buffer.data(), buffer.size());
        const std::streamsize bytes = in.gcount();
        if (bytes <= 0) {
            break;
        }
        sha256.update(buffer.data(), static_cast<unsigned int>(bytes));
    }
    if (in.bad()) {
        return core::Error{core::ErrorCode::kIoError, "failed to read " + path};
    }
    return Poco::DigestEngine::digestToHex(sha256.digest());
}

void ChunkStore::CleanupSession(const std::string& session_id) {
    if (!IsSafeName(session_id)) {
        return;
    }
    std::error_code ec;
    std::filesystem::remove_all(SessionDir(session_id), ec);
    if (ec) {
        core::LogWarning("failed to clean upload dir for session " + session_id + ": " +
                         ec.message());
    }
}

core::Result<void> ChunkStore::RemoveFinalFile(const std::string& file_id) {
    if (!IsSafeName(file_id)) {
        return core::Error{core::ErrorCode::kInvalidArgument, "invalid file id"};
    }
    std::error_code ec;
    std::filesystem::remove_all(std::filesystem::path(files_dir_) / file_id, ec);
    if (ec) {
        return core::Error{core::ErrorCode::kIoError, "failed to remove file: " + ec.message()};
    }
    return core::Ok();
}

bool ChunkStore::IsSafeName(const std::string& name) {
    if (name.empty() || name.size() > 255) {
        return false;
    }
    for (char c : name) {
        if (!(std::isalnum(static_cast<unsigned char>(c)) || c == '-' || c == '_')) {
            return false;
        }
    }
    return true;
}

}  // namespace chunkshare::storage
