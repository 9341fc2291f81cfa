#pragma once

#include "tree.hpp"
#include "upload_session.hpp"

#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <istream>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace vault::server {

class EventPublisher;
class Logger;
class TokenIssuer;
class Tracer;

// Body of a chunk request.
class ByteSource {
public:
    virtual ~ByteSource() = default;
    // Returns 0 at the regular end of the stream. Throws UnexpectedEndOfStream when the
    // sender disconnected mid-stream; any other exception is an I/O failure.
    virtual std::size_t read(char* buffer, std::size_t size) = 0;
};

class IstreamSource : public ByteSource {
public:
    explicit IstreamSource(std::istream& stream) : stream_(stream) {}
    std::size_t read(char* buffer, std::size_t size) override;

private:
    std::istream& stream_;
};

class StagingPathProvider {
public:
    virtual ~StagingPathProvider() = default;
    virtual const std::filesystem::path& staging_path() const = 0;
};

// Resumable upload verbs.
class ResumableUpload {
public:
    virtual ~ResumableUpload() = default;

    virtual std::uint64_t write_chunk(std::int64_t offset, ByteSource& source) = 0;
    virtual FileInfo get_info() const = 0;
    virtual std::unique_ptr<std::istream> get_reader() const = 0;
    virtual void declare_length(std::int64_t length) = 0;
    virtual void concat_uploads(const std::vector<const ResumableUpload*>& parts) = 0;
    virtual void finish_upload() = 0;
    virtual void terminate() = 0;

    // Null when the upload is not backed by a local staging file.
    virtual const StagingPathProvider* staging() const { return nullptr; }
};

struct UploadCapabilities {
    Tree& tree;
    SessionStore& sessions;
    Logger& logger;
    Tracer& tracer;
    EventPublisher* publisher = nullptr;
    const TokenIssuer* tokens = nullptr;
    bool async = false;
    std::size_t copy_buffer_bytes = 1 * 1024 * 1024;
    std::size_t propagation_retries = 3;
};

class Upload : public ResumableUpload, public StagingPathProvider {
public:
    Upload(UploadSession session, UploadCapabilities capabilities);

    std::uint64_t write_chunk(std::int64_t offset, ByteSource& source) override;
    FileInfo get_info() const override;
    std::unique_ptr<std::istream> get_reader() const override;
    void declare_length(std::int64_t length) override;
    void concat_uploads(const std::vector<const ResumableUpload*>& parts) override;
    void finish_upload() override;
    void terminate() override;

    const StagingPathProvider* staging() const override { return this; }
    const std::filesystem::path& staging_path() const override { return session_.bin_path; }

    // Moves the staged bytes into permanent blob storage. Does not clean up.
    void finalize();
    // Post-processing entry point for uploads committed in asynchronous mode.
    void resume_postprocessing();
    // Signed download URL for this upload's bytes.
    std::string url() const;

    const UploadSession& session() const { return session_; }
    UploadState state() const { return session_.state; }
    const std::optional<Node>& node() const { return node_; }

private:
    friend void cleanup_upload(Upload& upload, bool failure, bool keep_upload);

    void cleanup(bool clean_node, bool clean_bin, bool clean_info);
    void set_state(UploadState state, bool persist);
    void publish_bytes_received();
    void propagate_with_retry();
    void fail_and_cleanup();

    UploadSession session_;
    UploadCapabilities caps_;
    std::optional<Node> node_;
};

// Cleans an upload after processing; `failure` rolls the node back, `keep_upload` keeps
// the staging file and the session record. Clears the node's processing marker.
void cleanup_upload(Upload& upload, bool failure, bool keep_upload);

bool is_restorable_attribute(const std::string& name);

}  // namespace vault::server
