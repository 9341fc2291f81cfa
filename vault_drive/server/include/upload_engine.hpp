#pragma once

#include "upload.hpp"

#include <cstdint>
#include <memory>
#include <string>
#include <vector>

namespace vault::server {

struct NewUploadRequest {
    std::string space_root;
    std::string parent_id;
    std::string filename;
    std::int64_t size = 0;
    bool size_is_deferred = false;
    std::string checksum_sha1;
    std::string checksum_md5;
    std::string checksum_adler32;
    std::string lock_id;
    std::string executant;
    // Optional pre-assigned id for a new node; ignored when overwriting.
    std::string node_id;
};

struct EngineOptions {
    bool async = false;
    std::size_t copy_buffer_bytes = 1 * 1024 * 1024;
    std::size_t propagation_retries = 3;
};

// Creates, resumes and terminates uploads bound to one tree and session store.
class UploadEngine {
public:
    UploadEngine(Tree& tree,
                 SessionStore& sessions,
                 Logger& logger,
                 Tracer& tracer,
                 const TokenIssuer& tokens,
                 EventPublisher* publisher,
                 EngineOptions options);

    std::unique_ptr<Upload> new_upload(const NewUploadRequest& request);
    // Rebuilds an upload from its session; the offset is taken from the staging file.
    std::unique_ptr<Upload> get_upload(const std::string& id);
    void terminate(const std::string& id);

    std::vector<UploadSession> pending_postprocessing();

private:
    UploadCapabilities capabilities();

    Tree& tree_;
    SessionStore& sessions_;
    Logger& logger_;
    Tracer& tracer_;
    const TokenIssuer& tokens_;
    EventPublisher* publisher_;
    EngineOptions options_;
};

}  // namespace vault::server
