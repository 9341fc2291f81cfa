#include "errors.hpp"

namespace vault::server {

std::string error_code_name(ErrorCode code) {
    switch (code) {
        case ErrorCode::kNotFound:
            return "not_found";
        case ErrorCode::kInvalidArgument:
            return "invalid_argument";
        case ErrorCode::kOffsetMismatch:
            return "offset_mismatch";
        case ErrorCode::kChecksumMismatch:
            return "checksum_mismatch";
        case ErrorCode::kBackend:
            return "backend";
        case ErrorCode::kInvalidPart:
            return "invalid_part";
        case ErrorCode::kIo:
            return "io";
        case ErrorCode::kTokenSigning:
            return "token_signing";
        case ErrorCode::kPropagation:
            return "propagation";
        case ErrorCode::kPrecondition:
            return "precondition";
    }
    return "unknown";
}

UploadError::UploadError(ErrorCode code, const std::string& message)
    : std::runtime_error(message), code_(code), cause_(message) {}

UploadError::UploadError(ErrorCode code, const std::string& context, const std::string& cause)
    : std::runtime_error(context + ": " + cause), code_(code), cause_(cause) {}

ChecksumMismatchError::ChecksumMismatchError(std::string algorithm, std::string expected, std::string actual)
    : UploadError(ErrorCode::kChecksumMismatch,
                  "invalid checksum: expected " + expected + " got " + actual + " (" + algorithm + ")"),
      algorithm_(std::move(algorithm)),
      expected_(std::move(expected)),
      actual_(std::move(actual)) {}

ChunkWriteError::ChunkWriteError(std::uint64_t bytes_written, const std::string& cause)
    : UploadError(ErrorCode::kIo, "chunk write failed after " + std::to_string(bytes_written) + " bytes", cause),
      bytes_written_(bytes_written) {}

PropagationError::PropagationError(std::string node_id, const std::string& cause)
    : UploadError(ErrorCode::kPropagation, "node " + node_id + " committed but propagation failed", cause),
      node_id_(std::move(node_id)) {}

}  // namespace vault::server
