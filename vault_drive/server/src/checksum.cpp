#include "checksum.hpp"

#include "base64.hpp"
#include "errors.hpp"

#include <openssl/evp.h>
#include <zlib.h>

#include <algorithm>
#include <array>
#include <cctype>
#include <stdexcept>
#include <vector>

namespace vault::server {

namespace {

std::string lowercase(std::string value) {
    std::transform(value.begin(), value.end(), value.begin(),
                   [](unsigned char ch) { return static_cast<char>(std::tolower(ch)); });
    return value;
}

EVP_MD_CTX* new_digest(const EVP_MD* md) {
    EVP_MD_CTX* ctx = EVP_MD_CTX_new();
    if (ctx == nullptr) {
        throw std::runtime_error("EVP_MD_CTX_new failed");
    }
    if (EVP_DigestInit_ex(ctx, md, nullptr) != 1) {
        EVP_MD_CTX_free(ctx);
        throw std::runtime_error("EVP_DigestInit_ex failed");
    }
    return ctx;
}

std::string final_digest(EVP_MD_CTX* ctx) {
    std::array<unsigned char, EVP_MAX_MD_SIZE> digest{};
    unsigned int len = 0;
    if (EVP_DigestFinal_ex(ctx, digest.data(), &len) != 1) {
        throw std::runtime_error("EVP_DigestFinal_ex failed");
    }
    return std::string(reinterpret_cast<const char*>(digest.data()), len);
}

}  // namespace

std::string algorithm_name(ChecksumAlgorithm algorithm) {
    switch (algorithm) {
        case ChecksumAlgorithm::kSha1:
            return "sha1";
        case ChecksumAlgorithm::kMd5:
            return "md5";
        case ChecksumAlgorithm::kAdler32:
            return "adler32";
    }
    return "unknown";
}

const std::string& ChecksumSet::digest(ChecksumAlgorithm algorithm) const {
    switch (algorithm) {
        case ChecksumAlgorithm::kSha1:
            return sha1;
        case ChecksumAlgorithm::kMd5:
            return md5;
        case ChecksumAlgorithm::kAdler32:
            return adler32;
    }
    throw std::invalid_argument("unknown checksum algorithm");
}

std::string ChecksumSet::hex(ChecksumAlgorithm algorithm) const {
    return util::hex_encode(digest(algorithm));
}

std::optional<ChecksumAlgorithm> ChecksumExpectation::selected() const {
    if (!sha1.empty()) {
        return ChecksumAlgorithm::kSha1;
    }
    if (!md5.empty()) {
        return ChecksumAlgorithm::kMd5;
    }
    if (!adler32.empty()) {
        return ChecksumAlgorithm::kAdler32;
    }
    return std::nullopt;
}

const std::string& ChecksumExpectation::value(ChecksumAlgorithm algorithm) const {
    switch (algorithm) {
        case ChecksumAlgorithm::kSha1:
            return sha1;
        case ChecksumAlgorithm::kMd5:
            return md5;
        case ChecksumAlgorithm::kAdler32:
            return adler32;
    }
    throw std::invalid_argument("unknown checksum algorithm");
}

void ChecksumPipeline::CtxDeleter::operator()(EVP_MD_CTX* ctx) const {
    EVP_MD_CTX_free(ctx);
}

ChecksumPipeline::ChecksumPipeline()
    : sha1_(new_digest(EVP_sha1())), md5_(new_digest(EVP_md5())), adler_(adler32(0L, Z_NULL, 0)) {}

ChecksumPipeline::~ChecksumPipeline() = default;

void ChecksumPipeline::update(const char* data, std::size_t size) {
    if (finished_) {
        throw std::logic_error("checksum pipeline already finished");
    }
    if (size == 0) {
        return;
    }
    if (EVP_DigestUpdate(sha1_.get(), data, size) != 1 || EVP_DigestUpdate(md5_.get(), data, size) != 1) {
        throw std::runtime_error("EVP_DigestUpdate failed");
    }
    // zlib takes uInt lengths.
    std::size_t remaining = size;
    const auto* cursor = reinterpret_cast<const Bytef*>(data);
    while (remaining > 0) {
        const auto step = static_cast<uInt>(std::min<std::size_t>(remaining, 1U << 30));
        adler_ = adler32(adler_, cursor, step);
        cursor += step;
        remaining -= step;
    }
    bytes_consumed_ += size;
}

ChecksumSet ChecksumPipeline::finish() {
    if (finished_) {
        throw std::logic_error("checksum pipeline already finished");
    }
    finished_ = true;

    ChecksumSet set;
    set.sha1 = final_digest(sha1_.get());
    set.md5 = final_digest(md5_.get());
    const auto value = static_cast<std::uint32_t>(adler_);
    set.adler32 = std::string{static_cast<char>((value >> 24) & 0xFF), static_cast<char>((value >> 16) & 0xFF),
                              static_cast<char>((value >> 8) & 0xFF), static_cast<char>(value & 0xFF)};
    return set;
}

ChecksumSet ChecksumPipeline::compute(std::istream& input, std::size_t buffer_size, std::uint64_t* bytes_read) {
    ChecksumPipeline pipeline;
    std::vector<char> buf(buffer_size == 0 ? 64 * 1024 : buffer_size);
    while (input) {
        input.read(buf.data(), static_cast<std::streamsize>(buf.size()));
        const auto read = input.gcount();
        if (read > 0) {
            pipeline.update(buf.data(), static_cast<std::size_t>(read));
        }
    }
    if (input.bad()) {
        throw std::runtime_error("read error while computing checksums");
    }
    if (bytes_read != nullptr) {
        *bytes_read = pipeline.bytes_consumed();
    }
    return pipeline.finish();
}

void verify_checksum(const ChecksumSet& computed, const ChecksumExpectation& expected) {
    const auto algorithm = expected.selected();
    if (!algorithm) {
        return;
    }
    const std::string actual = computed.hex(*algorithm);
    const std::string wanted = lowercase(expected.value(*algorithm));
    if (wanted != actual) {
        throw ChecksumMismatchError(algorithm_name(*algorithm), expected.value(*algorithm), actual);
    }
}

}  // namespace vault::server
