#include "upload.hpp"

#include "checksum.hpp"
#include "errors.hpp"
#include "events.hpp"
#include "logger.hpp"
#include "token_issuer.hpp"
#include "tracer.hpp"

#include <fcntl.h>
#include <unistd.h>

#include <algorithm>
#include <cerrno>
#include <cstring>
#include <fstream>
#include <system_error>
#include <vector>

namespace vault::server {

namespace {

// Append-only handle on a staging file. Never creates, truncates or seeks.
class AppendFile {
public:
    explicit AppendFile(const std::filesystem::path& path) : path_(path) {
        fd_ = ::open(path.c_str(), O_WRONLY | O_APPEND | O_CLOEXEC);
        if (fd_ < 0) {
            const int err = errno;
            throw UploadError(err == ENOENT ? ErrorCode::kNotFound : ErrorCode::kIo,
                              "opening staging area " + path.string(), std::strerror(err));
        }
    }
    ~AppendFile() {
        if (fd_ >= 0) {
            ::close(fd_);
        }
    }

    AppendFile(const AppendFile&) = delete;
    AppendFile& operator=(const AppendFile&) = delete;

    // Returns an empty string on success, the error text otherwise.
    std::string write_all(const char* data, std::size_t size) {
        std::size_t done = 0;
        while (done < size) {
            const ssize_t written = ::write(fd_, data + done, size - done);
            if (written < 0) {
                if (errno == EINTR) {
                    continue;
                }
                return std::strerror(errno);
            }
            done += static_cast<std::size_t>(written);
        }
        return {};
    }

private:
    std::filesystem::path path_;
    int fd_ = -1;
};

std::string describe(const UploadSession& session) {
    return "upload " + session.id + " (" + session.space_root + "/" + session.filename + ")";
}

}  // namespace

std::size_t IstreamSource::read(char* buffer, std::size_t size) {
    stream_.read(buffer, static_cast<std::streamsize>(size));
    const auto read = stream_.gcount();
    if (stream_.bad()) {
        throw std::runtime_error("read error on chunk stream");
    }
    return static_cast<std::size_t>(read);
}

bool is_restorable_attribute(const std::string& name) {
    return name.rfind(attrs::kChecksumPrefix, 0) == 0 || name == attrs::kType || name == attrs::kBlobId ||
           name == attrs::kBlobSize || name == attrs::kMTime;
}

Upload::Upload(UploadSession session, UploadCapabilities capabilities)
    : session_(std::move(session)), caps_(capabilities) {}

std::uint64_t Upload::write_chunk(std::int64_t offset, ByteSource& source) {
    auto span = caps_.tracer.start_span("WriteChunk");
    if (session_.state != UploadState::kReceiving) {
        throw UploadError(ErrorCode::kPrecondition, describe(session_) + " no longer accepts data");
    }
    if (offset != session_.offset) {
        throw UploadError(ErrorCode::kOffsetMismatch, "chunk offset " + std::to_string(offset) +
                                                          " does not match upload offset " +
                                                          std::to_string(session_.offset));
    }

    auto open_span = caps_.tracer.start_span("WriteChunk/open");
    AppendFile file(session_.bin_path);
    open_span.end();

    std::uint64_t limit = UINT64_MAX;
    if (!session_.size_is_deferred) {
        limit = static_cast<std::uint64_t>(std::max<std::int64_t>(session_.size - session_.offset, 0));
    }

    auto copy_span = caps_.tracer.start_span("WriteChunk/copy");
    std::vector<char> buffer(caps_.copy_buffer_bytes);
    std::uint64_t written = 0;
    bool paused = false;
    while (written < limit) {
        const auto want = static_cast<std::size_t>(std::min<std::uint64_t>(buffer.size(), limit - written));
        std::size_t got = 0;
        try {
            got = source.read(buffer.data(), want);
        } catch (const UnexpectedEndOfStream&) {
            paused = true;
            break;
        } catch (const std::exception& ex) {
            throw ChunkWriteError(written, ex.what());
        }
        if (got == 0) {
            break;
        }
        if (const auto err = file.write_all(buffer.data(), got); !err.empty()) {
            throw ChunkWriteError(written, "appending to " + session_.bin_path.string() + ": " + err);
        }
        written += got;
    }
    copy_span.end();

    if (paused) {
        caps_.logger.info(describe(session_) + " paused after " + std::to_string(written) + " bytes at offset " +
                          std::to_string(session_.offset + static_cast<std::int64_t>(written)));
    }
    // The durable offset is re-derived from the staging file on lookup; persisted in finish_upload.
    session_.offset += static_cast<std::int64_t>(written);
    return written;
}

FileInfo Upload::get_info() const {
    return session_.to_file_info();
}

std::unique_ptr<std::istream> Upload::get_reader() const {
    auto span = caps_.tracer.start_span("GetReader");
    auto stream = std::make_unique<std::ifstream>(session_.bin_path, std::ios::binary);
    if (!stream->is_open()) {
        throw UploadError(ErrorCode::kNotFound, "staging area " + session_.bin_path.string() + " not found");
    }
    return stream;
}

void Upload::declare_length(std::int64_t length) {
    auto span = caps_.tracer.start_span("DeclareLength");
    if (!session_.size_is_deferred) {
        throw UploadError(ErrorCode::kPrecondition, describe(session_) + " already has a declared length");
    }
    if (length < session_.offset) {
        throw UploadError(ErrorCode::kPrecondition, "declared length " + std::to_string(length) +
                                                        " is below the received offset " +
                                                        std::to_string(session_.offset));
    }
    session_.size = length;
    session_.filesize = length;
    session_.size_is_deferred = false;
    caps_.sessions.persist(session_);
}

void Upload::concat_uploads(const std::vector<const ResumableUpload*>& parts) {
    auto span = caps_.tracer.start_span("ConcatUploads");
    if (session_.state != UploadState::kReceiving) {
        throw UploadError(ErrorCode::kPrecondition, describe(session_) + " no longer accepts data");
    }
    std::vector<std::filesystem::path> sources;
    sources.reserve(parts.size());
    std::uint64_t total = 0;
    for (std::size_t i = 0; i < parts.size(); ++i) {
        const StagingPathProvider* staged = parts[i] != nullptr ? parts[i]->staging() : nullptr;
        if (staged == nullptr) {
            throw UploadError(ErrorCode::kInvalidPart,
                              "part " + std::to_string(i) + " does not expose a staging area");
        }
        std::error_code ec;
        const auto part_size = std::filesystem::file_size(staged->staging_path(), ec);
        if (ec) {
            throw UploadError(ErrorCode::kNotFound, "partial upload " + staged->staging_path().string() + " not found",
                              ec.message());
        }
        total += part_size;
        sources.push_back(staged->staging_path());
    }
    if (!session_.size_is_deferred &&
        session_.offset + static_cast<std::int64_t>(total) > session_.size) {
        throw UploadError(ErrorCode::kPrecondition, "parts hold " + std::to_string(total) +
                                                        " bytes, more than the " +
                                                        std::to_string(session_.size - session_.offset) +
                                                        " left in " + describe(session_));
    }

    AppendFile file(session_.bin_path);
    std::vector<char> buffer(caps_.copy_buffer_bytes);
    std::int64_t appended = 0;
    for (const auto& path : sources) {
        std::ifstream src(path, std::ios::binary);
        if (!src.is_open()) {
            throw UploadError(ErrorCode::kNotFound, "partial upload " + path.string() + " not found");
        }
        while (src) {
            src.read(buffer.data(), static_cast<std::streamsize>(buffer.size()));
            const auto read = src.gcount();
            if (read <= 0) {
                break;
            }
            if (const auto err = file.write_all(buffer.data(), static_cast<std::size_t>(read)); !err.empty()) {
                throw UploadError(ErrorCode::kIo, "concatenating " + path.string(), err);
            }
            appended += read;
        }
        if (src.bad()) {
            throw UploadError(ErrorCode::kIo, "concatenating " + path.string(), "read error");
        }
    }
    session_.offset += appended;
}

void Upload::finish_upload() {
    auto span = caps_.tracer.start_span("FinishUpload");
    if (session_.state != UploadState::kReceiving) {
        throw UploadError(ErrorCode::kPrecondition,
                          describe(session_) + " cannot finish from state " + upload_state_name(session_.state));
    }
    if (session_.size_is_deferred) {
        throw UploadError(ErrorCode::kPrecondition, describe(session_) + " has no declared length");
    }
    set_state(UploadState::kCommitting, false);

    ChecksumSet checksums;
    {
        auto checksum_span = caps_.tracer.start_span("FinishUpload/checksums");
        std::ifstream input(session_.bin_path, std::ios::binary);
        if (!input.is_open()) {
            caps_.logger.error(describe(session_) + " lost its staging area " + session_.bin_path.string());
            fail_and_cleanup();
            throw UploadError(ErrorCode::kNotFound, "staging area " + session_.bin_path.string() + " not found");
        }
        std::uint64_t bytes = 0;
        try {
            checksums = ChecksumPipeline::compute(input, caps_.copy_buffer_bytes, &bytes);
        } catch (const std::runtime_error& ex) {
            caps_.logger.error(describe(session_) + " could not read its staging area: " + ex.what());
            fail_and_cleanup();
            throw UploadError(ErrorCode::kIo, "reading staging area " + session_.bin_path.string(), ex.what());
        }
        session_.offset = static_cast<std::int64_t>(bytes);
    }
    if (session_.offset != session_.size) {
        // Nothing is discarded: the client resumes from the staged offset.
        set_state(UploadState::kReceiving, false);
        throw UploadError(ErrorCode::kPrecondition, describe(session_) + " holds " +
                                                        std::to_string(session_.offset) + " of " +
                                                        std::to_string(session_.size) + " bytes");
    }

    const ChecksumExpectation expected{session_.checksum_sha1, session_.checksum_md5, session_.checksum_adler32};
    try {
        verify_checksum(checksums, expected);
    } catch (const ChecksumMismatchError& ex) {
        caps_.logger.warn(describe(session_) + ": " + ex.what());
        fail_and_cleanup();
        throw;
    }

    const Attributes checksum_attributes{
        {attrs::kChecksumSha1, checksums.sha1},
        {attrs::kChecksumMd5, checksums.md5},
        {attrs::kChecksumAdler32, checksums.adler32},
    };

    try {
        auto node_span = caps_.tracer.start_span("FinishUpload/create_node");
        node_ = caps_.tree.create_node_for_upload(session_, checksum_attributes);
        set_state(caps_.async ? UploadState::kProcessingAsyncPending : UploadState::kCommitting, true);
    } catch (const std::exception& ex) {
        caps_.logger.error(describe(session_) + " commit failed: " + ex.what());
        fail_and_cleanup();
        throw UploadError(ErrorCode::kBackend, "failed to create node for upload", ex.what());
    }

    if (caps_.publisher != nullptr) {
        publish_bytes_received();
    }

    if (!caps_.async) {
        set_state(UploadState::kProcessingSync, false);
        try {
            finalize();
        } catch (const std::exception& ex) {
            caps_.logger.error(describe(session_) + " failed to upload: " + ex.what());
            cleanup_upload(*this, true, false);
            session_.state = UploadState::kFailed;
            throw;
        }
        cleanup_upload(*this, false, false);
        session_.state = UploadState::kDone;
    }

    propagate_with_retry();
}

void Upload::finalize() {
    auto span = caps_.tracer.start_span("Finalize");
    if (!node_) {
        node_ = caps_.tree.read_node(session_.space_root, session_.node_id);
    }

    auto blob_span = caps_.tracer.start_span("Finalize/write_blob");
    try {
        caps_.tree.write_blob(*node_, session_.bin_path);
    } catch (const std::exception& ex) {
        throw UploadError(ErrorCode::kBackend, "failed to upload file to blobstore", ex.what());
    }
}

void Upload::resume_postprocessing() {
    auto span = caps_.tracer.start_span("ResumePostprocessing");
    if (session_.state != UploadState::kCommitting && session_.state != UploadState::kProcessingAsyncPending) {
        throw UploadError(ErrorCode::kPrecondition, describe(session_) + " is not awaiting post-processing (" +
                                                        upload_state_name(session_.state) + ")");
    }
    try {
        finalize();
    } catch (const std::exception& ex) {
        caps_.logger.error(describe(session_) + " post-processing failed: " + ex.what());
        cleanup_upload(*this, true, false);
        session_.state = UploadState::kFailed;
        throw;
    }
    cleanup_upload(*this, false, false);
    session_.state = UploadState::kDone;
    caps_.logger.info(describe(session_) + " post-processing finished");
}

void Upload::terminate() {
    auto span = caps_.tracer.start_span("Terminate");
    const bool committed = session_.state == UploadState::kCommitting ||
                           session_.state == UploadState::kProcessingAsyncPending;
    if (!node_ && committed && !session_.node_id.empty()) {
        try {
            node_ = caps_.tree.read_node(session_.space_root, session_.node_id);
        } catch (const std::exception& ex) {
            caps_.logger.info(describe(session_) + " has no node to roll back: " + ex.what());
        }
    }
    cleanup(true, true, true);
    session_.state = UploadState::kFailed;
}

std::string Upload::url() const {
    if (caps_.tokens == nullptr) {
        throw UploadError(ErrorCode::kPrecondition, "no token issuer configured");
    }
    try {
        return caps_.tokens->upload_url(session_.id);
    } catch (const UploadError&) {
        throw;
    } catch (const std::exception& ex) {
        throw UploadError(ErrorCode::kTokenSigning, "error signing token for upload " + session_.id, ex.what());
    }
}

void Upload::publish_bytes_received() {
    auto span = caps_.tracer.start_span("FinishUpload/publish");
    BytesReceived event;
    event.upload_id = session_.id;
    event.url = url();
    event.space_owner = session_.space_owner;
    event.executing_user = session_.executant;
    event.resource_id = ResourceId{node_->space_id, node_->id};
    event.filename = session_.filename;
    event.filesize = static_cast<std::uint64_t>(session_.size);
    try {
        caps_.publisher->publish(event);
    } catch (const UploadError&) {
        throw;
    } catch (const std::exception& ex) {
        throw UploadError(ErrorCode::kBackend, "failed to publish bytes received event", ex.what());
    }
}

void Upload::propagate_with_retry() {
    auto span = caps_.tracer.start_span("FinishUpload/propagate");
    const std::size_t attempts = std::max<std::size_t>(caps_.propagation_retries, 1);
    std::string last_error;
    for (std::size_t attempt = 1; attempt <= attempts; ++attempt) {
        try {
            caps_.tree.propagate(*node_, session_.size_diff);
            return;
        } catch (const std::exception& ex) {
            last_error = ex.what();
            caps_.logger.warn(describe(session_) + " propagation attempt " + std::to_string(attempt) + "/" +
                              std::to_string(attempts) + " failed: " + last_error);
        }
    }
    throw PropagationError(node_->id, last_error);
}

void Upload::set_state(UploadState state, bool persist) {
    session_.state = state;
    if (persist) {
        caps_.sessions.persist(session_);
    }
}

void Upload::fail_and_cleanup() {
    cleanup_upload(*this, true, false);
    session_.state = UploadState::kFailed;
}

void Upload::cleanup(bool clean_node, bool clean_bin, bool clean_info) {
    if (clean_node && node_) {
        if (session_.versions_path.empty()) {
            try {
                caps_.tree.remove_node(*node_);
            } catch (const std::exception& ex) {
                caps_.logger.info(describe(session_) + " removing node " + node_->id + " failed: " + ex.what());
            }
            node_.reset();
        } else {
            const auto& versions_path = session_.versions_path;
            try {
                caps_.tree.restore_version(versions_path, *node_, [](const std::string& name, const std::string&) {
                    return is_restorable_attribute(name);
                });
            } catch (const std::exception& ex) {
                caps_.logger.info(describe(session_) + " restoring version " + versions_path + " onto node " +
                                  node_->id + " failed: " + ex.what());
            }
            try {
                caps_.tree.remove_version(versions_path);
            } catch (const std::exception& ex) {
                caps_.logger.info(describe(session_) + " removing version " + versions_path + " failed: " +
                                  ex.what());
            }
        }
    }

    if (clean_bin) {
        std::error_code ec;
        std::filesystem::remove(session_.bin_path, ec);
        if (ec) {
            caps_.logger.error(describe(session_) + " removing staging area " + session_.bin_path.string() +
                               " failed: " + ec.message());
        }
    }

    if (clean_info) {
        try {
            caps_.sessions.purge(session_.id);
        } catch (const std::exception& ex) {
            caps_.logger.error(describe(session_) + " removing session record failed: " + ex.what());
        }
    }
}

void cleanup_upload(Upload& upload, bool failure, bool keep_upload) {
    auto span = upload.caps_.tracer.start_span("Cleanup");
    upload.cleanup(failure, !keep_upload, !keep_upload);

    // The node is gone when the upload failed before or during its creation.
    if (upload.node_) {
        try {
            upload.caps_.tree.unmark_processing(*upload.node_, upload.session_.id);
        } catch (const std::exception& ex) {
            upload.caps_.logger.info(describe(upload.session_) + " unmarking processing failed: " + ex.what());
        }
    }
}

}  // namespace vault::server
