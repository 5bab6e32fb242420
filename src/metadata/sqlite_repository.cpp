#include "chunkshare/metadata/sqlite_repository.h"

#include <Poco/Data/SQLite/Connector.h>
#include <Poco/Data/SQLite/SQLiteException.h>
#include <Poco/Data/Statement.h>

#include "chunkshare/core/logger.h"
#include "chunkshare/core/time.h"

namespace chunkshare::metadata {

namespace {
using namespace Poco::Data::Keywords;

constexpr const char* kPrincipalSelect =
    "SELECT id, is_admin, is_active, COALESCE(quota_bytes, -1), used_bytes, created_at "
    "FROM principals";
constexpr const char* kSessionSelect =
    "SELECT id, owner_id, filename, size_bytes, mime_type, chunk_size, total_chunks, "
    "file_sha256, status, created_at, updated_at, expires_at, COALESCE(finalized_at, '') "
    "FROM upload_sessions";
constexpr const char* kChunkSelect =
    "SELECT session_id, chunk_index, checksum, size_bytes, stored_path, received_at "
    "FROM upload_chunks";
constexpr const char* kFileSelect =
    "SELECT id, COALESCE(session_id, ''), owner_id, filename, size_bytes, mime_type, sha256, "
    "storage_path, status, created_at, COALESCE(completed_at, '') FROM files";
constexpr const char* kLinkSelect =
    "SELECT id, file_id, token, COALESCE(expires_at, ''), one_time, download_count, "
    "COALESCE(password_hash, ''), is_enabled, require_landing_page, COALESCE(short_code, ''), "
    "created_at FROM download_links";

std::optional<std::string> OptionalText(const std::string& value) {
    if (value.empty()) {
        return std::nullopt;
    }
    return value;
}

// Row buffers mirror the SELECT column lists above; nullable columns arrive COALESCEd.
struct PrincipalRow {
    Principal value;
    int is_admin{0};
    int is_active{1};
    Poco::Int64 quota{-1};

    void Bind(Poco::Data::Statement& st) {
        st, into(value.id), into(is_admin), into(is_active), into(quota), into(value.used_bytes),
            into(value.created_at);
    }
    bool empty() const { return value.id.empty(); }
    core::Result<Principal> Convert() const {
        Principal out = value;
        out.is_admin = is_admin != 0;
        out.is_active = is_active != 0;
        if (quota >= 0) {
            out.quota_bytes = static_cast<std::uint64_t>(quota);
        }
        return out;
    }
};

struct SessionRow {
    UploadSession value;
    std::string status;
    std::string finalized_at;

    void Bind(Poco::Data::Statement& st) {
        st, into(value.id), into(value.owner_id), into(value.filename), into(value.size_bytes),
            into(value.mime_type), into(value.chunk_size), into(value.total_chunks),
            into(value.file_sha256), into(status), into(value.created_at), into(value.updated_at),
            into(value.expires_at), into(finalized_at);
    }
    bool empty() const { return value.id.empty(); }
    core::Result<UploadSession> Convert() const {
        auto parsed = ParseSessionStatus(status);
        if (!parsed) {
            return core::Error{core::ErrorCode::kDbError, "unknown session status: " + status};
        }
        UploadSession out = value;
        out.status = *parsed;
        out.finalized_at = OptionalText(finalized_at);
        return out;
    }
};

struct ChunkRow {
    UploadChunk value;

    void Bind(Poco::Data::Statement& st) {
        st, into(value.session_id), into(value.index), into(value.checksum),
            into(value.size_bytes), into(value.stored_path), into(value.received_at);
    }
    bool empty() const { return value.session_id.empty(); }
    core::Result<UploadChunk> Convert() const { return value; }
};

struct FileRow {
    StoredFile value;
    std::string session_id;
    std::string status;
    std::string completed_at;

    void Bind(Poco::Data::Statement& st) {
        st, into(value.id), into(session_id), into(value.owner_id), into(value.filename),
            into(value.size_bytes), into(value.mime_type), into(value.sha256),
            into(value.storage_path), into(status), into(value.created_at), into(completed_at);
    }
    bool empty() const { return value.id.empty(); }
    core::Result<StoredFile> Convert() const {
        auto parsed = ParseFileStatus(status);
        if (!parsed) {
            return core::Error{core::ErrorCode::kDbError, "unknown file status: " + status};
        }
        StoredFile out = value;
        out.status = *parsed;
        out.session_id = OptionalText(session_id);
        out.completed_at = OptionalText(completed_at);
        return out;
    }
};

struct LinkRow {
    DownloadLink value;
    std::string expires_at;
    int one_time{0};
    Poco::Int64 download_count{0};
    std::string password_hash;
    int is_enabled{1};
    int require_landing_page{0};
    std::string short_code;

    void Bind(Poco::Data::Statement& st) {
        st, into(value.id), into(value.file_id), into(value.token), into(expires_at),
            into(one_time), into(download_count), into(password_hash), into(is_enabled),
            into(require_landing_page), into(short_code), into(value.created_at);
    }
    bool empty() const { return value.id.empty(); }
    core::Result<DownloadLink> Convert() const {
        DownloadLink out = value;
        out.expires_at = OptionalText(expires_at);
        out.one_time = one_time != 0;
        out.download_count = static_cast<std::int64_t>(download_count);
        out.password_hash = OptionalText(password_hash);
        out.is_enabled = is_enabled != 0;
        out.require_landing_page = require_landing_page != 0;
        out.short_code = OptionalText(short_code);
        return out;
    }
};

/// @brief Fetch at most one row; kNotFound when nothing matched.
template <typename Row>
auto SelectOne(Poco::Data::Session& session, const std::string& sql,
               std::vector<std::string> keys, const char* what) -> decltype(Row{}.Convert()) {
    Row row;
    Poco::Data::Statement select(session);
    select << sql;
    row.Bind(select);
    for (auto& key : keys) {
        select, use(key);
    }
    select, now;
    if (row.empty()) {
        return core::Error{core::ErrorCode::kNotFound, std::string(what) + " not found"};
    }
    return row.Convert();
}

template <typename Row, typename T>
core::Result<std::vector<T>> SelectMany(Poco::Data::Session& session, const std::string& sql,
                                        std::vector<std::string> keys) {
    std::vector<T> out;
    Row row;
    Poco::Data::Statement select(session);
    select << sql;
    row.Bind(select);
    for (auto& key : keys) {
        select, use(key);
    }
    select, range(0, 1);

    while (!select.done()) {
        row = Row{};
        select.execute();
        if (select.done() && row.empty()) {
            break;
        }
        if (!row.empty()) {
            auto converted = row.Convert();
            if (!converted.ok()) {
                return converted.error();
            }
            out.push_back(converted.value());
        }
    }
    return out;
}

std::size_t Changes(Poco::Data::Session& session) {
    Poco::Int64 changed = 0;
    session << "SELECT changes()", into(changed), now;
    return static_cast<std::size_t>(changed);
}

/// @brief BEGIN IMMEDIATE guard; rolls back unless committed.
class WriteTransaction {
public:
    explicit WriteTransaction(Poco::Data::Session& session) : session_(session) {
        session_ << "BEGIN IMMEDIATE", now;
    }
    ~WriteTransaction() {
        if (committed_) {
            return;
        }
        try {
            session_ << "ROLLBACK", now;
        } catch (const Poco::Exception& ex) {
            core::LogWarning("rollback failed: " + ex.displayText());
        }
    }
    WriteTransaction(const WriteTransaction&) = delete;
    WriteTransaction& operator=(const WriteTransaction&) = delete;

    void Commit() {
        session_ << "COMMIT", now;
        committed_ = true;
    }

private:
    Poco::Data::Session& session_;
    bool committed_{false};
};

/// @brief Run a database operation, mapping Poco exceptions onto error codes.
template <typename F>
auto Guarded(const char* op, F&& fn) -> decltype(fn()) {
    try {
        return fn();
    } catch (const Poco::Data::SQLite::ConstraintViolationException& ex) {
        return core::Error{core::ErrorCode::kAlreadyExists, ex.displayText()};
    } catch (const Poco::Exception& ex) {
        return core::Error{core::ErrorCode::kDbError, std::string(op) + ": " + ex.displayText()};
    }
}

}  // namespace

SqliteRepository::SqliteRepository(const std::string& db_path, int max_sessions) {
    Poco::Data::SQLite::Connector::registerConnector();
    pool_ = std::make_unique<Poco::Data::SessionPool>("SQLite", db_path, 1, max_sessions, 60);
    InitSchema();
}

Poco::Data::Session SqliteRepository::Acquire() {
    Poco::Data::Session session = pool_->get();
    session << "PRAGMA foreign_keys = ON", now;
    int busy_timeout = 0;
    session << "PRAGMA busy_timeout = 5000", into(busy_timeout), now;
    return session;
}

void SqliteRepository::InitSchema() {
    auto session = Acquire();
    std::string journal_mode;
    session << "PRAGMA journal_mode = WAL", into(journal_mode), now;

    session <<
            "CREATE TABLE IF NOT EXISTS principals ("
            "id TEXT PRIMARY KEY,"
            "is_admin INTEGER NOT NULL DEFAULT 0,"
            "is_active INTEGER NOT NULL DEFAULT 1,"
            "quota_bytes INTEGER,"
            "used_bytes INTEGER NOT NULL DEFAULT 0,"
            "created_at TEXT NOT NULL"
            ")",
        now;

    session <<
            "CREATE TABLE IF NOT EXISTS upload_sessions ("
            "id TEXT PRIMARY KEY,"
            "owner_id TEXT NOT NULL,"
            "filename TEXT NOT NULL,"
            "size_bytes INTEGER NOT NULL,"
            "mime_type TEXT NOT NULL,"
            "chunk_size INTEGER NOT NULL,"
            "total_chunks INTEGER NOT NULL,"
            "file_sha256 TEXT NOT NULL,"
            "status TEXT NOT NULL,"
            "created_at TEXT NOT NULL,"
            "updated_at TEXT NOT NULL,"
            "expires_at TEXT NOT NULL,"
            "finalized_at TEXT,"
            "FOREIGN KEY(owner_id) REFERENCES principals(id) ON DELETE CASCADE"
            ")",
        now;

    session <<
            "CREATE TABLE IF NOT EXISTS upload_chunks ("
            "id INTEGER PRIMARY KEY AUTOINCREMENT,"
            "session_id TEXT NOT NULL,"
            "chunk_index INTEGER NOT NULL,"
            "checksum TEXT NOT NULL,"
            "size_bytes INTEGER NOT NULL,"
            "stored_path TEXT NOT NULL,"
            "received_at TEXT NOT NULL,"
            "UNIQUE(session_id, chunk_index),"
            "FOREIGN KEY(session_id) REFERENCES upload_sessions(id) ON DELETE CASCADE"
            ")",
        now;

    session <<
            "CREATE TABLE IF NOT EXISTS files ("
            "id TEXT PRIMARY KEY,"
            "session_id TEXT UNIQUE,"
            "owner_id TEXT NOT NULL,"
            "filename TEXT NOT NULL,"
            "size_bytes INTEGER NOT NULL,"
            "mime_type TEXT NOT NULL,"
            "sha256 TEXT NOT NULL,"
            "storage_path TEXT NOT NULL,"
            "status TEXT NOT NULL,"
            "created_at TEXT NOT NULL,"
            "completed_at TEXT,"
            "finalize_claim TEXT,"
            "FOREIGN KEY(session_id) REFERENCES upload_sessions(id) ON DELETE SET NULL,"
            "FOREIGN KEY(owner_id) REFERENCES principals(id) ON DELETE CASCADE"
            ")",
        now;

    session <<
            "CREATE TABLE IF NOT EXISTS download_links ("
            "id TEXT PRIMARY KEY,"
            "file_id TEXT NOT NULL,"
            "token TEXT NOT NULL UNIQUE,"
            "expires_at TEXT,"
            "one_time INTEGER NOT NULL DEFAULT 0,"
            "download_count INTEGER NOT NULL DEFAULT 0,"
            "password_hash TEXT,"
            "is_enabled INTEGER NOT NULL DEFAULT 1,"
            "require_landing_page INTEGER NOT NULL DEFAULT 0,"
            "short_code TEXT UNIQUE,"
            "created_at TEXT NOT NULL,"
            "FOREIGN KEY(file_id) REFERENCES files(id) ON DELETE CASCADE"
            ")",
        now;

    session << "CREATE INDEX IF NOT EXISTS idx_upload_sessions_status_expires "
               "ON upload_sessions(status, expires_at)",
        now;
    session << "CREATE INDEX IF NOT EXISTS idx_files_owner ON files(owner_id)", now;
    session << "CREATE INDEX IF NOT EXISTS idx_download_links_file ON download_links(file_id)",
        now;
}

core::Result<Principal> SqliteRepository::CreatePrincipal(const Principal& principal) {
    return Guarded("create principal", [&]() -> core::Result<Principal> {
        auto session = Acquire();
        std::string id = principal.id;
        int is_admin = principal.is_admin ? 1 : 0;
        int is_active = principal.is_active ? 1 : 0;
        Poco::Int64 quota = principal.quota_bytes ? static_cast<Poco::Int64>(*principal.quota_bytes)
                                                  : -1;
        std::uint64_t used = principal.used_bytes;
        std::string created_at = core::NowIso8601();
        session << "INSERT INTO principals(id, is_admin, is_active, quota_bytes, used_bytes, "
                   "created_at) VALUES(?, ?, ?, NULLIF(?, -1), ?, ?)",
            use(id), use(is_admin), use(is_active), use(quota), use(used), use(created_at), now;
        return SelectOne<PrincipalRow>(session, std::string(kPrincipalSelect) + " WHERE id = ?",
                                       {principal.id}, "principal");
    });
}

core::Result<Principal> SqliteRepository::GetPrincipal(const std::string& id) {
    return Guarded("get principal", [&]() -> core::Result<Principal> {
        auto session = Acquire();
        return SelectOne<PrincipalRow>(session, std::string(kPrincipalSelect) + " WHERE id = ?",
                                       {id}, "principal");
    });
}

core::Result<void> SqliteRepository::AdjustUsedBytes(const std::string& principal_id,
                                                     std::int64_t delta) {
    return Guarded("adjust used bytes", [&]() -> core::Result<void> {
        auto session = Acquire();
        Poco::Int64 delta_value = delta;
        std::string id = principal_id;
        session << "UPDATE principals SET used_bytes = MAX(0, used_bytes + ?) WHERE id = ?",
            use(delta_value), use(id), now;
        if (Changes(session) == 0) {
            return core::Error{core::ErrorCode::kNotFound, "principal not found"};
        }
        return core::Ok();
    });
}

core::Result<UploadSession> SqliteRepository::CreateUploadSession(const UploadSession& upload) {
    return Guarded("create upload session", [&]() -> core::Result<UploadSession> {
        auto session = Acquire();
        UploadSession v = upload;
        std::string status = ToString(upload.status);
        session << "INSERT INTO upload_sessions(id, owner_id, filename, size_bytes, mime_type, "
                   "chunk_size, total_chunks, file_sha256, status, created_at, updated_at, "
                   "expires_at) VALUES(?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?)",
            use(v.id), use(v.owner_id), use(v.filename), use(v.size_bytes), use(v.mime_type),
            use(v.chunk_size), use(v.total_chunks), use(v.file_sha256), use(status),
            use(v.created_at), use(v.updated_at), use(v.expires_at), now;
        return SelectOne<SessionRow>(session, std::string(kSessionSelect) + " WHERE id = ?",
                                     {upload.id}, "upload session");
    });
}

core::Result<UploadSession> SqliteRepository::GetUploadSession(const std::string& id) {
    return Guarded("get upload session", [&]() -> core::Result<UploadSession> {
        auto session = Acquire();
        return SelectOne<SessionRow>(session, std::string(kSessionSelect) + " WHERE id = ?", {id},
                                     "upload session");
    });
}

core::Result<void> SqliteRepository::UpdateUploadSessionStatus(const std::string& id,
                                                               SessionStatus from,
                                                               SessionStatus to) {
    return Guarded("update upload session", [&]() -> core::Result<void> {
        auto session = Acquire();
        std::string from_value = ToString(from);
        std::string to_value = ToString(to);
        std::string now_time = core::NowIso8601();
        std::string id_value = id;
        session << "UPDATE upload_sessions SET status = ?, updated_at = ? "
                   "WHERE id = ? AND status = ?",
            use(to_value), use(now_time), use(id_value), use(from_value), now;
        if (Changes(session) == 0) {
            return core::Error{core::ErrorCode::kInvalidState,
                               "upload session is not " + from_value};
        }
        return core::Ok();
    });
}

core::Result<std::vector<UploadSession>> SqliteRepository::ListExpiredUploadSessions(
    const std::string& expires_before, int limit) {
    return Guarded("list expired sessions", [&]() -> core::Result<std::vector<UploadSession>> {
        auto session = Acquire();
        return SelectMany<SessionRow, UploadSession>(
            session,
            std::string(kSessionSelect) +
                " WHERE status IN ('init', 'uploading') AND expires_at < ? "
                "ORDER BY expires_at ASC LIMIT " +
                std::to_string(limit),
            {expires_before});
    });
}

core::Result<std::vector<UploadSession>> SqliteRepository::ListUploadSessionsByStatus(
    SessionStatus status, int limit) {
    return Guarded("list sessions by status", [&]() -> core::Result<std::vector<UploadSession>> {
        auto session = Acquire();
        return SelectMany<SessionRow, UploadSession>(
            session,
            std::string(kSessionSelect) + " WHERE status = ? ORDER BY updated_at ASC LIMIT " +
                std::to_string(limit),
            {ToString(status)});
    });
}

core::Result<UploadChunk> SqliteRepository::InsertUploadChunk(const UploadChunk& chunk) {
    return Guarded("insert chunk", [&]() -> core::Result<UploadChunk> {
        auto session = Acquire();
        UploadChunk v = chunk;
        session << "INSERT INTO upload_chunks(session_id, chunk_index, checksum, size_bytes, "
                   "stored_path, received_at) VALUES(?, ?, ?, ?, ?, ?)",
            use(v.session_id), use(v.index), use(v.checksum), use(v.size_bytes),
            use(v.stored_path), use(v.received_at), now;
        return v;
    });
}

core::Result<UploadChunk> SqliteRepository::GetUploadChunk(const std::string& session_id,
                                                           int index) {
    return Guarded("get chunk", [&]() -> core::Result<UploadChunk> {
        auto session = Acquire();
        return SelectOne<ChunkRow>(
            session,
            std::string(kChunkSelect) + " WHERE session_id = ? AND chunk_index = " +
                std::to_string(index),
            {session_id}, "chunk");
    });
}

core::Result<void> SqliteRepository::DeleteUploadChunk(const std::string& session_id, int index) {
    return Guarded("delete chunk", [&]() -> core::Result<void> {
        auto session = Acquire();
        std::string id = session_id;
        int index_value = index;
        session << "DELETE FROM upload_chunks WHERE session_id = ? AND chunk_index = ?", use(id),
            use(index_value), now;
        return core::Ok();
    });
}

core::Result<std::vector<int>> SqliteRepository::ListChunkIndexes(const std::string& session_id) {
    return Guarded("list chunks", [&]() -> core::Result<std::vector<int>> {
        auto session = Acquire();
        std::vector<int> indexes;
        std::string id = session_id;
        session << "SELECT DISTINCT chunk_index FROM upload_chunks WHERE session_id = ? "
                   "ORDER BY chunk_index ASC",
            use(id), into(indexes), now;
        return indexes;
    });
}

core::Result<StoredFile> SqliteRepository::BeginFinalize(const std::string& session_id,
                                                         const StoredFile& candidate) {
    return Guarded("begin finalize", [&]() -> core::Result<StoredFile> {
        auto session = Acquire();
        WriteTransaction tx(session);

        std::string id = session_id;
        std::string now_time = core::NowIso8601();
        session << "UPDATE upload_sessions SET status = 'finalizing', updated_at = ? "
                   "WHERE id = ? AND status IN ('uploading', 'finalizing')",
            use(now_time), use(id), now;
        if (Changes(session) == 0) {
            return core::Error{core::ErrorCode::kInvalidState,
                               "session is not accepting finalize requests"};
        }

        auto existing = SelectOne<FileRow>(
            session, std::string(kFileSelect) + " WHERE session_id = ?", {session_id}, "file");
        if (existing.ok()) {
            if (existing.value().status != FileStatus::kPending) {
                return core::Error{core::ErrorCode::kInvalidState, "file already finalized"};
            }
            tx.Commit();
            return existing;
        }
        if (existing.code() != core::ErrorCode::kNotFound) {
            return existing.error();
        }

        StoredFile v = candidate;
        std::string status = ToString(FileStatus::kPending);
        session << "INSERT INTO files(id, session_id, owner_id, filename, size_bytes, mime_type, "
                   "sha256, storage_path, status, created_at) "
                   "VALUES(?, ?, ?, ?, ?, ?, ?, ?, ?, ?)",
            use(v.id), use(id), use(v.owner_id), use(v.filename), use(v.size_bytes),
            use(v.mime_type), use(v.sha256), use(v.storage_path), use(status),
            use(v.created_at), now;
        auto created = SelectOne<FileRow>(session, std::string(kFileSelect) + " WHERE id = ?",
                                          {candidate.id}, "file");
        if (!created.ok()) {
            return created.error();
        }
        tx.Commit();
        return created;
    });
}

core::Result<bool> SqliteRepository::ClaimFinalize(const std::string& file_id,
                                                   const std::string& worker_id) {
    return Guarded("claim finalize", [&]() -> core::Result<bool> {
        auto session = Acquire();
        std::string fid = file_id;
        std::string claim = worker_id;
        session << "UPDATE files SET finalize_claim = ? "
                   "WHERE id = ? AND status = 'pending' AND finalize_claim IS NULL",
            use(claim), use(fid), now;
        return Changes(session) == 1;
    });
}

core::Result<void> SqliteRepository::ReleaseFinalizeClaim(const std::string& file_id,
                                                          const std::string& worker_id) {
    return Guarded("release finalize claim", [&]() -> core::Result<void> {
        auto session = Acquire();
        std::string fid = file_id;
        std::string claim = worker_id;
        session << "UPDATE files SET finalize_claim = NULL WHERE id = ? AND finalize_claim = ?",
            use(fid), use(claim), now;
        return core::Ok();
    });
}

core::Result<int> SqliteRepository::ReleaseAllFinalizeClaims() {
    return Guarded("release finalize claims", [&]() -> core::Result<int> {
        auto session = Acquire();
        session << "UPDATE files SET finalize_claim = NULL "
                   "WHERE status = 'pending' AND finalize_claim IS NOT NULL",
            now;
        return static_cast<int>(Changes(session));
    });
}

core::Result<bool> SqliteRepository::MarkFinalizeFailed(const std::string& session_id,
                                                        const std::string& file_id) {
    return Guarded("mark finalize failed", [&]() -> core::Result<bool> {
        auto session = Acquire();
        WriteTransaction tx(session);
        std::string sid = session_id;
        std::string fid = file_id;
        std::string now_time = core::NowIso8601();
        session << "UPDATE files SET status = 'error', finalize_claim = NULL "
                   "WHERE id = ? AND status = 'pending'",
            use(fid), now;
        if (Changes(session) == 0) {
            tx.Commit();
            return false;
        }
        session << "UPDATE upload_sessions SET status = 'failed', updated_at = ? "
                   "WHERE id = ? AND status IN ('uploading', 'finalizing')",
            use(now_time), use(sid), now;
        tx.Commit();
        return true;
    });
}

core::Result<bool> SqliteRepository::MarkFinalizeSucceeded(const std::string& session_id,
                                                           const std::string& file_id,
                                                           std::uint64_t merged_size) {
    return Guarded("mark finalize succeeded", [&]() -> core::Result<bool> {
        auto session = Acquire();
        WriteTransaction tx(session);
        std::string sid = session_id;
        std::string fid = file_id;
        std::uint64_t size = merged_size;
        std::string now_time = core::NowIso8601();

        session << "UPDATE files SET status = 'ready', size_bytes = ?, completed_at = ?, "
                   "finalize_claim = NULL WHERE id = ? AND status = 'pending'",
            use(size), use(now_time), use(fid), now;
        if (Changes(session) == 0) {
            tx.Commit();
            return false;
        }

        // Written as a difference so the guard cannot overflow; rows over quota never pass.
        Poco::Int64 delta = static_cast<Poco::Int64>(merged_size);
        session << "UPDATE principals SET used_bytes = used_bytes + ? "
                   "WHERE id = (SELECT owner_id FROM files WHERE id = ?) "
                   "AND (quota_bytes IS NULL OR "
                   "(used_bytes <= quota_bytes AND ? <= quota_bytes - used_bytes))",
            use(delta), use(fid), use(delta), now;
        if (Changes(session) == 0) {
            // Rolls back the promotion; the caller fails the file under its own claim.
            return core::Error{core::ErrorCode::kQuotaExceeded, "storage quota exceeded"};
        }
        session << "UPDATE upload_sessions SET status = 'completed', finalized_at = ?, "
                   "updated_at = ? WHERE id = ?",
            use(now_time), use(now_time), use(sid), now;
        tx.Commit();
        return true;
    });
}

core::Result<StoredFile> SqliteRepository::GetStoredFile(const std::string& id) {
    return Guarded("get file", [&]() -> core::Result<StoredFile> {
        auto session = Acquire();
        return SelectOne<FileRow>(session, std::string(kFileSelect) + " WHERE id = ?", {id},
                                  "file");
    });
}

core::Result<StoredFile> SqliteRepository::GetStoredFileBySession(const std::string& session_id) {
    return Guarded("get file by session", [&]() -> core::Result<StoredFile> {
        auto session = Acquire();
        return SelectOne<FileRow>(session, std::string(kFileSelect) + " WHERE session_id = ?",
                                  {session_id}, "file");
    });
}

core::Result<std::vector<StoredFile>> SqliteRepository::ListStoredFiles(
    const std::optional<std::string>& owner_id) {
    return Guarded("list files", [&]() -> core::Result<std::vector<StoredFile>> {
        auto session = Acquire();
        if (owner_id) {
            return SelectMany<FileRow, StoredFile>(
                session,
                std::string(kFileSelect) + " WHERE owner_id = ? ORDER BY created_at DESC, id ASC",
                {*owner_id});
        }
        return SelectMany<FileRow, StoredFile>(
            session, std::string(kFileSelect) + " ORDER BY created_at DESC, id ASC", {});
    });
}

core::Result<void> SqliteRepository::DeleteStoredFile(const std::string& id) {
    return Guarded("delete file", [&]() -> core::Result<void> {
        auto session = Acquire();
        WriteTransaction tx(session);
        auto file = SelectOne<FileRow>(session, std::string(kFileSelect) + " WHERE id = ?", {id},
                                       "file");
        if (!file.ok()) {
            return file.error();
        }

        std::string id_value = id;
        session << "DELETE FROM download_links WHERE file_id = ?", use(id_value), now;
        session << "DELETE FROM files WHERE id = ?", use(id_value), now;
        if (file.value().status == FileStatus::kReady) {
            Poco::Int64 delta = -static_cast<Poco::Int64>(file.value().size_bytes);
            std::string owner = file.value().owner_id;
            session << "UPDATE principals SET used_bytes = MAX(0, used_bytes + ?) WHERE id = ?",
                use(delta), use(owner), now;
        }
        tx.Commit();
        return core::Ok();
    });
}

core::Result<DownloadLink> SqliteRepository::CreateDownloadLink(const DownloadLink& link) {
    return Guarded("create link", [&]() -> core::Result<DownloadLink> {
        auto session = Acquire();
        DownloadLink v = link;
        std::string expires_at = link.expires_at.value_or("");
        int one_time = link.one_time ? 1 : 0;
        Poco::Int64 download_count = link.download_count;
        std::string password_hash = link.password_hash.value_or("");
        int is_enabled = link.is_enabled ? 1 : 0;
        int require_landing_page = link.require_landing_page ? 1 : 0;
        std::string short_code = link.short_code.value_or("");
        session << "INSERT INTO download_links(id, file_id, token, expires_at, one_time, "
                   "download_count, password_hash, is_enabled, require_landing_page, short_code, "
                   "created_at) VALUES(?, ?, ?, NULLIF(?, ''), ?, ?, NULLIF(?, ''), ?, ?, "
                   "NULLIF(?, ''), ?)",
            use(v.id), use(v.file_id), use(v.token), use(expires_at), use(one_time),
            use(download_count), use(password_hash), use(is_enabled), use(require_landing_page),
            use(short_code), use(v.created_at), now;
        return SelectOne<LinkRow>(session, std::string(kLinkSelect) + " WHERE id = ?", {link.id},
                                  "link");
    });
}

core::Result<DownloadLink> SqliteRepository::GetDownloadLink(const std::string& id) {
    return Guarded("get link", [&]() -> core::Result<DownloadLink> {
        auto session = Acquire();
        return SelectOne<LinkRow>(session, std::string(kLinkSelect) + " WHERE id = ?", {id},
                                  "link");
    });
}

core::Result<DownloadLink> SqliteRepository::GetDownloadLinkByToken(const std::string& token) {
    return Guarded("get link by token", [&]() -> core::Result<DownloadLink> {
        auto session = Acquire();
        return SelectOne<LinkRow>(session, std::string(kLinkSelect) + " WHERE token = ?", {token},
                                  "link");
    });
}

core::Result<DownloadLink> SqliteRepository::GetDownloadLinkByShortCode(const std::string& code) {
    return Guarded("get link by short code", [&]() -> core::Result<DownloadLink> {
        auto session = Acquire();
        return SelectOne<LinkRow>(session, std::string(kLinkSelect) + " WHERE short_code = ?",
                                  {code}, "link");
    });
}

core::Result<std::vector<DownloadLink>> SqliteRepository::ListDownloadLinks(
    const std::string& file_id) {
    return Guarded("list links", [&]() -> core::Result<std::vector<DownloadLink>> {
        auto session = Acquire();
        return SelectMany<LinkRow, DownloadLink>(
            session,
            std::string(kLinkSelect) + " WHERE file_id = ? ORDER BY created_at ASC, id ASC",
            {file_id});
    });
}

core::Result<void> SqliteRepository::DeleteDownloadLink(const std::string& id) {
    return Guarded("delete link", [&]() -> core::Result<void> {
        auto session = Acquire();
        std::string id_value = id;
        session << "DELETE FROM download_links WHERE id = ?", use(id_value), now;
        if (Changes(session) == 0) {
            return core::Error{core::ErrorCode::kNotFound, "link not found"};
        }
        return core::Ok();
    });
}

core::Result<bool> SqliteRepository::ConsumeDownloadLink(const std::string& id,
                                                         const std::string& now_time) {
    return Guarded("consume link", [&]() -> core::Result<bool> {
        auto session = Acquire();
        std::string id_value = id;
        std::string now_value = now_time;
        session << "UPDATE download_links SET download_count = download_count + 1, "
                   "is_enabled = CASE WHEN one_time = 1 THEN 0 ELSE is_enabled END "
                   "WHERE id = ? AND is_enabled = 1 "
                   "AND (expires_at IS NULL OR expires_at > ?) "
                   "AND (one_time = 0 OR download_count = 0)",
            use(id_value), use(now_value), now;
        return Changes(session) == 1;
    });
}

}  // namespace chunkshare::metadata
