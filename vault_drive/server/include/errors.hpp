#pragma once

#include <cstdint>
#include <stdexcept>
#include <string>

namespace vault::server {

enum class ErrorCode {
    kNotFound,
    kInvalidArgument,
    kOffsetMismatch,
    kChecksumMismatch,
    kBackend,
    kInvalidPart,
    kIo,
    kTokenSigning,
    kPropagation,
    kPrecondition,
};

std::string error_code_name(ErrorCode code);

class UploadError : public std::runtime_error {
public:
    UploadError(ErrorCode code, const std::string& message);
    // Prefixes `context` to the cause while keeping the cause text available.
    UploadError(ErrorCode code, const std::string& context, const std::string& cause);

    ErrorCode code() const noexcept { return code_; }
    const std::string& cause() const noexcept { return cause_; }

private:
    ErrorCode code_;
    std::string cause_;
};

class ChecksumMismatchError : public UploadError {
public:
    ChecksumMismatchError(std::string algorithm, std::string expected, std::string actual);

    const std::string& algorithm() const noexcept { return algorithm_; }
    const std::string& expected() const noexcept { return expected_; }
    const std::string& actual() const noexcept { return actual_; }

private:
    std::string algorithm_;
    std::string expected_;
    std::string actual_;
};

class ChunkWriteError : public UploadError {
public:
    ChunkWriteError(std::uint64_t bytes_written, const std::string& cause);

    std::uint64_t bytes_written() const noexcept { return bytes_written_; }

private:
    std::uint64_t bytes_written_;
};

// The object is committed and visible; only the ancestor metadata is stale.
class PropagationError : public UploadError {
public:
    PropagationError(std::string node_id, const std::string& cause);

    const std::string& node_id() const noexcept { return node_id_; }

private:
    std::string node_id_;
};

// Raised by byte sources when the peer went away in the middle of a stream.
class UnexpectedEndOfStream : public std::runtime_error {
public:
    UnexpectedEndOfStream() : std::runtime_error("unexpected end of stream") {}
};

}  // namespace vault::server
