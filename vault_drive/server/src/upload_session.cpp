#include "upload_session.hpp"

#include <sqlite3.h>

#include <stdexcept>

namespace vault::server {

namespace {

constexpr const char* kColumns =
    "id,bin_path,bytes_offset,size,size_is_deferred,checksum_sha1,checksum_md5,checksum_adler32,"
    "space_root,node_id,node_parent_id,versions_path,lock_id,filename,filesize,size_diff,"
    "space_owner,executant,blob_id,state,created_at";

std::string column_text(sqlite3_stmt* stmt, int index) {
    const auto* text = sqlite3_column_text(stmt, index);
    return text ? reinterpret_cast<const char*>(text) : std::string();
}

UploadSession read_row(sqlite3_stmt* stmt) {
    UploadSession session;
    session.id = column_text(stmt, 0);
    session.bin_path = column_text(stmt, 1);
    session.offset = sqlite3_column_int64(stmt, 2);
    session.size = sqlite3_column_int64(stmt, 3);
    session.size_is_deferred = sqlite3_column_int(stmt, 4) != 0;
    session.checksum_sha1 = column_text(stmt, 5);
    session.checksum_md5 = column_text(stmt, 6);
    session.checksum_adler32 = column_text(stmt, 7);
    session.space_root = column_text(stmt, 8);
    session.node_id = column_text(stmt, 9);
    session.node_parent_id = column_text(stmt, 10);
    session.versions_path = column_text(stmt, 11);
    session.lock_id = column_text(stmt, 12);
    session.filename = column_text(stmt, 13);
    session.filesize = sqlite3_column_int64(stmt, 14);
    session.size_diff = sqlite3_column_int64(stmt, 15);
    session.space_owner = column_text(stmt, 16);
    session.executant = column_text(stmt, 17);
    session.blob_id = column_text(stmt, 18);
    session.state = parse_upload_state(column_text(stmt, 19));
    session.created_at = sqlite3_column_int64(stmt, 20);
    return session;
}

}  // namespace

std::string upload_state_name(UploadState state) {
    switch (state) {
        case UploadState::kReceiving:
            return "receiving";
        case UploadState::kCommitting:
            return "committing";
        case UploadState::kProcessingSync:
            return "processing_sync";
        case UploadState::kProcessingAsyncPending:
            return "processing_async_pending";
        case UploadState::kDone:
            return "done";
        case UploadState::kFailed:
            return "failed";
    }
    return "receiving";
}

UploadState parse_upload_state(const std::string& name) {
    if (name == "receiving" || name.empty()) {
        return UploadState::kReceiving;
    }
    if (name == "committing") {
        return UploadState::kCommitting;
    }
    if (name == "processing_sync") {
        return UploadState::kProcessingSync;
    }
    if (name == "processing_async_pending") {
        return UploadState::kProcessingAsyncPending;
    }
    if (name == "done") {
        return UploadState::kDone;
    }
    if (name == "failed") {
        return UploadState::kFailed;
    }
    throw std::invalid_argument("Unknown upload state: " + name);
}

FileInfo UploadSession::to_file_info() const {
    FileInfo info;
    info.id = id;
    info.offset = offset;
    info.size = size;
    info.size_is_deferred = size_is_deferred;
    info.metadata = {
        {"filename", filename},
        {"space_root", space_root},
        {"node_id", node_id},
        {"parent_id", node_parent_id},
        {"lock_id", lock_id},
        {"executant", executant},
        {"state", upload_state_name(state)},
    };
    return info;
}

SessionStore::SessionStore(const std::string& database_path, std::filesystem::path uploads_dir)
    : uploads_dir_(std::move(uploads_dir)) {
    const auto parent = std::filesystem::path(database_path).parent_path();
    if (!parent.empty()) {
        std::filesystem::create_directories(parent);
    }
    std::filesystem::create_directories(uploads_dir_);
    if (sqlite3_open(database_path.c_str(), &db_) != SQLITE_OK) {
        std::string msg = db_ ? sqlite3_errmsg(db_) : "out of memory";
        sqlite3_close(db_);
        db_ = nullptr;
        throw std::runtime_error("Failed to open session database: " + msg);
    }
    sqlite3_busy_timeout(db_, 5000);
}

SessionStore::~SessionStore() {
    if (db_) {
        sqlite3_close(db_);
        db_ = nullptr;
    }
}

void SessionStore::initialize_schema() {
    const char* ddl = R"SQL(
        CREATE TABLE IF NOT EXISTS upload_sessions (
            id TEXT PRIMARY KEY,
            bin_path TEXT NOT NULL,
            bytes_offset INTEGER NOT NULL DEFAULT 0,
            size INTEGER NOT NULL DEFAULT 0,
            size_is_deferred INTEGER NOT NULL DEFAULT 0,
            checksum_sha1 TEXT,
            checksum_md5 TEXT,
            checksum_adler32 TEXT,
            space_root TEXT NOT NULL,
            node_id TEXT,
            node_parent_id TEXT,
            versions_path TEXT,
            lock_id TEXT,
            filename TEXT,
            filesize INTEGER NOT NULL DEFAULT 0,
            size_diff INTEGER NOT NULL DEFAULT 0,
            space_owner TEXT,
            executant TEXT,
            blob_id TEXT,
            state TEXT NOT NULL,
            created_at INTEGER NOT NULL
        );
        CREATE INDEX IF NOT EXISTS idx_upload_sessions_state ON upload_sessions(state);
    )SQL";

    std::lock_guard<std::mutex> lock(mutex_);
    char* err = nullptr;
    if (sqlite3_exec(db_, ddl, nullptr, nullptr, &err) != SQLITE_OK) {
        std::string msg = err ? err : "unknown error";
        sqlite3_free(err);
        throw std::runtime_error("Failed to initialize session store: " + msg);
    }
}

std::filesystem::path SessionStore::bin_path_for(const std::string& id) const {
    return uploads_dir_ / id;
}

void SessionStore::persist(const UploadSession& session) {
    const std::string sql = std::string("INSERT OR REPLACE INTO upload_sessions(") + kColumns +
                            ") VALUES(?,?,?,?,?,?,?,?,?,?,?,?,?,?,?,?,?,?,?,?,?)";

    std::lock_guard<std::mutex> lock(mutex_);
    sqlite3_stmt* stmt = nullptr;
    if (sqlite3_prepare_v2(db_, sql.c_str(), -1, &stmt, nullptr) != SQLITE_OK) {
        throw std::runtime_error("Failed to prepare session upsert: " + std::string(sqlite3_errmsg(db_)));
    }
    const std::string bin_path = session.bin_path.string();
    const std::string state = upload_state_name(session.state);
    sqlite3_bind_text(stmt, 1, session.id.c_str(), -1, SQLITE_TRANSIENT);
    sqlite3_bind_text(stmt, 2, bin_path.c_str(), -1, SQLITE_TRANSIENT);
    sqlite3_bind_int64(stmt, 3, session.offset);
    sqlite3_bind_int64(stmt, 4, session.size);
    sqlite3_bind_int(stmt, 5, session.size_is_deferred ? 1 : 0);
    sqlite3_bind_text(stmt, 6, session.checksum_sha1.c_str(), -1, SQLITE_TRANSIENT);
    sqlite3_bind_text(stmt, 7, session.checksum_md5.c_str(), -1, SQLITE_TRANSIENT);
    sqlite3_bind_text(stmt, 8, session.checksum_adler32.c_str(), -1, SQLITE_TRANSIENT);
    sqlite3_bind_text(stmt, 9, session.space_root.c_str(), -1, SQLITE_TRANSIENT);
    sqlite3_bind_text(stmt, 10, session.node_id.c_str(), -1, SQLITE_TRANSIENT);
    sqlite3_bind_text(stmt, 11, session.node_parent_id.c_str(), -1, SQLITE_TRANSIENT);
    sqlite3_bind_text(stmt, 12, session.versions_path.c_str(), -1, SQLITE_TRANSIENT);
    sqlite3_bind_text(stmt, 13, session.lock_id.c_str(), -1, SQLITE_TRANSIENT);
    sqlite3_bind_text(stmt, 14, session.filename.c_str(), -1, SQLITE_TRANSIENT);
    sqlite3_bind_int64(stmt, 15, session.filesize);
    sqlite3_bind_int64(stmt, 16, session.size_diff);
    sqlite3_bind_text(stmt, 17, session.space_owner.c_str(), -1, SQLITE_TRANSIENT);
    sqlite3_bind_text(stmt, 18, session.executant.c_str(), -1, SQLITE_TRANSIENT);
    sqlite3_bind_text(stmt, 19, session.blob_id.c_str(), -1, SQLITE_TRANSIENT);
    sqlite3_bind_text(stmt, 20, state.c_str(), -1, SQLITE_TRANSIENT);
    sqlite3_bind_int64(stmt, 21, session.created_at);

    const int rc = sqlite3_step(stmt);
    sqlite3_finalize(stmt);
    if (rc != SQLITE_DONE) {
        throw std::runtime_error("Failed to persist upload session " + session.id + ": " + sqlite3_errmsg(db_));
    }
}

std::optional<UploadSession> SessionStore::load(const std::string& id) {
    auto rows = query(std::string("SELECT ") + kColumns + " FROM upload_sessions WHERE id=?", id);
    if (rows.empty()) {
        return std::nullopt;
    }
    return std::move(rows.front());
}

bool SessionStore::purge(const std::string& id) {
    std::lock_guard<std::mutex> lock(mutex_);
    sqlite3_stmt* stmt = nullptr;
    if (sqlite3_prepare_v2(db_, "DELETE FROM upload_sessions WHERE id=?", -1, &stmt, nullptr) != SQLITE_OK) {
        throw std::runtime_error("Failed to prepare session purge: " + std::string(sqlite3_errmsg(db_)));
    }
    sqlite3_bind_text(stmt, 1, id.c_str(), -1, SQLITE_TRANSIENT);
    const int rc = sqlite3_step(stmt);
    sqlite3_finalize(stmt);
    if (rc != SQLITE_DONE) {
        throw std::runtime_error("Failed to purge upload session " + id + ": " + sqlite3_errmsg(db_));
    }
    return sqlite3_changes(db_) > 0;
}

std::vector<UploadSession> SessionStore::list() {
    return query(std::string("SELECT ") + kColumns + " FROM upload_sessions ORDER BY created_at", "");
}

std::vector<UploadSession> SessionStore::list_in_state(UploadState state) {
    return query(std::string("SELECT ") + kColumns + " FROM upload_sessions WHERE state=? ORDER BY created_at",
                 upload_state_name(state));
}

std::vector<UploadSession> SessionStore::query(const std::string& sql, const std::string& bind) {
    std::lock_guard<std::mutex> lock(mutex_);
    sqlite3_stmt* stmt = nullptr;
    if (sqlite3_prepare_v2(db_, sql.c_str(), -1, &stmt, nullptr) != SQLITE_OK) {
        throw std::runtime_error("Failed to prepare session query: " + std::string(sqlite3_errmsg(db_)));
    }
    if (sqlite3_bind_parameter_count(stmt) > 0) {
        sqlite3_bind_text(stmt, 1, bind.c_str(), -1, SQLITE_TRANSIENT);
    }

    std::vector<UploadSession> sessions;
    int rc = SQLITE_ROW;
    while ((rc = sqlite3_step(stmt)) == SQLITE_ROW) {
        sessions.push_back(read_row(stmt));
    }
    sqlite3_finalize(stmt);
    if (rc != SQLITE_DONE) {
        throw std::runtime_error("Failed to read upload sessions: " + std::string(sqlite3_errmsg(db_)));
    }
    return sessions;
}

}  // namespace vault::server
