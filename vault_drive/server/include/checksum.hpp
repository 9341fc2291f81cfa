#pragma once

#include <cstddef>
#include <cstdint>
#include <istream>
#include <memory>
#include <optional>
#include <string>

typedef struct evp_md_ctx_st EVP_MD_CTX;

namespace vault::server {

enum class ChecksumAlgorithm {
    kSha1,
    kMd5,
    kAdler32,
};

std::string algorithm_name(ChecksumAlgorithm algorithm);

// Raw digest bytes for every algorithm; all three are always present.
struct ChecksumSet {
    std::string sha1;
    std::string md5;
    std::string adler32;

    const std::string& digest(ChecksumAlgorithm algorithm) const;
    std::string hex(ChecksumAlgorithm algorithm) const;
};

// Caller-declared hex digests; an empty value skips that algorithm.
struct ChecksumExpectation {
    std::string sha1;
    std::string md5;
    std::string adler32;

    // First non-empty expectation in priority order sha1, md5, adler32.
    std::optional<ChecksumAlgorithm> selected() const;
    const std::string& value(ChecksumAlgorithm algorithm) const;
};

class ChecksumPipeline {
public:
    ChecksumPipeline();
    ~ChecksumPipeline();

    ChecksumPipeline(const ChecksumPipeline&) = delete;
    ChecksumPipeline& operator=(const ChecksumPipeline&) = delete;

    void update(const char* data, std::size_t size);
    ChecksumSet finish();

    std::uint64_t bytes_consumed() const { return bytes_consumed_; }

    // One pass over the whole stream.
    static ChecksumSet compute(std::istream& input, std::size_t buffer_size, std::uint64_t* bytes_read = nullptr);

private:
    struct CtxDeleter {
        void operator()(EVP_MD_CTX* ctx) const;
    };

    std::unique_ptr<EVP_MD_CTX, CtxDeleter> sha1_;
    std::unique_ptr<EVP_MD_CTX, CtxDeleter> md5_;
    unsigned long adler_;
    std::uint64_t bytes_consumed_ = 0;
    bool finished_ = false;
};

// Throws ChecksumMismatchError when the selected expectation does not match.
void verify_checksum(const ChecksumSet& computed, const ChecksumExpectation& expected);

}  // namespace vault::server
