#pragma once

#include <cstdint>
#include <filesystem>
#include <map>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

struct sqlite3;

namespace vault::server {

enum class UploadState {
    kReceiving,
    kCommitting,
    kProcessingSync,
    kProcessingAsyncPending,
    kDone,
    kFailed,
};

std::string upload_state_name(UploadState state);
UploadState parse_upload_state(const std::string& name);

struct FileInfo {
    std::string id;
    std::int64_t offset = 0;
    std::int64_t size = 0;
    bool size_is_deferred = false;
    std::map<std::string, std::string> metadata;
};

struct UploadSession {
    std::string id;
    std::filesystem::path bin_path;

    std::int64_t offset = 0;
    std::int64_t size = 0;
    bool size_is_deferred = false;

    std::string checksum_sha1;
    std::string checksum_md5;
    std::string checksum_adler32;

    std::string space_root;
    std::string node_id;
    std::string node_parent_id;
    std::string versions_path;

    std::string lock_id;
    std::string filename;
    std::int64_t filesize = 0;
    std::int64_t size_diff = 0;

    std::string space_owner;
    std::string executant;
    std::string blob_id;

    UploadState state = UploadState::kReceiving;
    std::int64_t created_at = 0;

    FileInfo to_file_info() const;
};

// Durable session records. Writes are synchronous; nothing is persisted implicitly.
class SessionStore {
public:
    SessionStore(const std::string& database_path, std::filesystem::path uploads_dir);
    ~SessionStore();

    SessionStore(const SessionStore&) = delete;
    SessionStore& operator=(const SessionStore&) = delete;

    void initialize_schema();

    std::filesystem::path bin_path_for(const std::string& id) const;

    void persist(const UploadSession& session);
    std::optional<UploadSession> load(const std::string& id);
    // Returns false when no record existed.
    bool purge(const std::string& id);
    std::vector<UploadSession> list();
    std::vector<UploadSession> list_in_state(UploadState state);

private:
    std::vector<UploadSession> query(const std::string& sql, const std::string& bind);

    std::mutex mutex_;
    sqlite3* db_{};
    std::filesystem::path uploads_dir_;
};

}  // namespace vault::server
