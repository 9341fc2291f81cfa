#include "upload_engine.hpp"

#include "errors.hpp"
#include "ids.hpp"
#include "logger.hpp"
#include "tracer.hpp"

#include <fcntl.h>
#include <unistd.h>

#include <cerrno>
#include <chrono>
#include <cstring>

namespace vault::server {

namespace {

void create_staging_file(const std::filesystem::path& path) {
    const int fd = ::open(path.c_str(), O_CREAT | O_EXCL | O_WRONLY | O_CLOEXEC, 0644);
    if (fd < 0) {
        throw UploadError(ErrorCode::kIo, "creating staging area " + path.string(), std::strerror(errno));
    }
    ::close(fd);
}

}  // namespace

UploadEngine::UploadEngine(Tree& tree,
                           SessionStore& sessions,
                           Logger& logger,
                           Tracer& tracer,
                           const TokenIssuer& tokens,
                           EventPublisher* publisher,
                           EngineOptions options)
    : tree_(tree),
      sessions_(sessions),
      logger_(logger),
      tracer_(tracer),
      tokens_(tokens),
      publisher_(publisher),
      options_(options) {}

UploadCapabilities UploadEngine::capabilities() {
    return UploadCapabilities{.tree = tree_,
                              .sessions = sessions_,
                              .logger = logger_,
                              .tracer = tracer_,
                              .publisher = publisher_,
                              .tokens = &tokens_,
                              .async = options_.async,
                              .copy_buffer_bytes = options_.copy_buffer_bytes,
                              .propagation_retries = options_.propagation_retries};
}

std::unique_ptr<Upload> UploadEngine::new_upload(const NewUploadRequest& request) {
    auto span = tracer_.start_span("NewUpload");
    if (request.filename.empty() || request.filename.find('/') != std::string::npos) {
        throw UploadError(ErrorCode::kInvalidArgument, "invalid filename '" + request.filename + "'");
    }
    if (!request.size_is_deferred && request.size < 0) {
        throw UploadError(ErrorCode::kInvalidArgument, "negative upload size");
    }
    const auto parent = tree_.read_node(request.space_root, request.parent_id);
    if (parent.type != NodeType::kDirectory) {
        throw UploadError(ErrorCode::kPrecondition, "parent " + parent.id + " is not a directory");
    }
    const auto root = tree_.read_node(request.space_root, request.space_root);
    const auto root_attributes = tree_.attributes(root);

    UploadSession session;
    session.id = util::random_id();
    session.bin_path = sessions_.bin_path_for(session.id);
    session.size = request.size_is_deferred ? 0 : request.size;
    session.size_is_deferred = request.size_is_deferred;
    session.checksum_sha1 = request.checksum_sha1;
    session.checksum_md5 = request.checksum_md5;
    session.checksum_adler32 = request.checksum_adler32;
    session.space_root = request.space_root;
    session.node_id = request.node_id;
    session.node_parent_id = request.parent_id;
    session.lock_id = request.lock_id;
    session.filename = request.filename;
    session.filesize = session.size;
    session.executant = request.executant;
    if (auto it = root_attributes.find(attrs::kOwner); it != root_attributes.end()) {
        session.space_owner = it->second;
    }
    session.blob_id = util::random_id();
    session.state = UploadState::kReceiving;
    session.created_at = std::chrono::duration_cast<std::chrono::seconds>(
                             std::chrono::system_clock::now().time_since_epoch())
                             .count();

    create_staging_file(session.bin_path);
    try {
        sessions_.persist(session);
    } catch (const std::exception&) {
        std::error_code ec;
        std::filesystem::remove(session.bin_path, ec);
        throw;
    }
    logger_.info("created upload " + session.id + " for " + session.space_root + "/" + session.filename +
                 (session.size_is_deferred ? " (deferred length)" : " size=" + std::to_string(session.size)));
    return std::make_unique<Upload>(std::move(session), capabilities());
}

std::unique_ptr<Upload> UploadEngine::get_upload(const std::string& id) {
    auto span = tracer_.start_span("GetUpload");
    auto session = sessions_.load(id);
    if (!session) {
        throw UploadError(ErrorCode::kNotFound, "upload " + id + " not found");
    }
    std::error_code ec;
    const auto staged = std::filesystem::file_size(session->bin_path, ec);
    if (ec) {
        if (session->state == UploadState::kReceiving) {
            throw UploadError(ErrorCode::kNotFound, "staging area of upload " + id + " is missing", ec.message());
        }
        logger_.warn("staging area of upload " + id + " is missing: " + ec.message());
    } else {
        session->offset = static_cast<std::int64_t>(staged);
    }
    return std::make_unique<Upload>(std::move(*session), capabilities());
}

void UploadEngine::terminate(const std::string& id) {
    auto upload = get_upload(id);
    upload->terminate();
    logger_.info("terminated upload " + id);
}

std::vector<UploadSession> UploadEngine::pending_postprocessing() {
    auto sessions = sessions_.list_in_state(UploadState::kProcessingAsyncPending);
    auto committing = sessions_.list_in_state(UploadState::kCommitting);
    sessions.insert(sessions.end(), committing.begin(), committing.end());
    return sessions;
}

}  // namespace vault::server
