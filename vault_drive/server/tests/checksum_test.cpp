#include "checksum.hpp"
#include "errors.hpp"

#include <gtest/gtest.h>

#include <sstream>
#include <string>

namespace vault::server::test {

namespace {

ChecksumSet digest_of(const std::string& data, std::size_t buffer_size = 7) {
    std::istringstream in(data);
    return ChecksumPipeline::compute(in, buffer_size);
}

}  // namespace

TEST(ChecksumPipelineTest, KnownVectors) {
    const auto set = digest_of("abc");
    EXPECT_EQ(set.hex(ChecksumAlgorithm::kSha1), "a9993e364706816aba3e25717850c26c9cd0d89d");
    EXPECT_EQ(set.hex(ChecksumAlgorithm::kMd5), "900150983cd24fb0d6963f7d28e17f72");
    EXPECT_EQ(set.hex(ChecksumAlgorithm::kAdler32), "024d0127");
    EXPECT_EQ(set.adler32.size(), 4u);
}

TEST(ChecksumPipelineTest, EmptyInput) {
    std::uint64_t bytes = 99;
    std::istringstream in("");
    const auto set = ChecksumPipeline::compute(in, 16, &bytes);
    EXPECT_EQ(bytes, 0u);
    EXPECT_EQ(set.hex(ChecksumAlgorithm::kSha1), "da39a3ee5e6b4b0d3255bfef95601890afd80709");
    EXPECT_EQ(set.hex(ChecksumAlgorithm::kMd5), "d41d8cd98f00b204e9800998ecf8427e");
    EXPECT_EQ(set.hex(ChecksumAlgorithm::kAdler32), "00000001");
}

TEST(ChecksumPipelineTest, ChunkingDoesNotChangeDigests) {
    std::string data;
    for (int i = 0; i < 5000; ++i) {
        data.push_back(static_cast<char>(i * 31));
    }
    const auto small = digest_of(data, 3);
    const auto large = digest_of(data, 1 << 16);
    EXPECT_EQ(small.sha1, large.sha1);
    EXPECT_EQ(small.md5, large.md5);
    EXPECT_EQ(small.adler32, large.adler32);
}

TEST(ChecksumPipelineTest, FinishTwiceThrows) {
    ChecksumPipeline pipeline;
    pipeline.update("abc", 3);
    EXPECT_EQ(pipeline.bytes_consumed(), 3u);
    pipeline.finish();
    EXPECT_THROW(pipeline.finish(), std::logic_error);
    EXPECT_THROW(pipeline.update("x", 1), std::logic_error);
}

TEST(ChecksumExpectationTest, PriorityIsSha1ThenMd5ThenAdler32) {
    ChecksumExpectation expected;
    EXPECT_FALSE(expected.selected().has_value());
    expected.adler32 = "024d0127";
    EXPECT_TRUE(expected.selected() == ChecksumAlgorithm::kAdler32);
    expected.md5 = "900150983cd24fb0d6963f7d28e17f72";
    EXPECT_TRUE(expected.selected() == ChecksumAlgorithm::kMd5);
    expected.sha1 = "a9993e364706816aba3e25717850c26c9cd0d89d";
    EXPECT_TRUE(expected.selected() == ChecksumAlgorithm::kSha1);
}

TEST(VerifyChecksumTest, AcceptsUppercaseHex) {
    const auto set = digest_of("abc");
    ChecksumExpectation expected;
    expected.sha1 = "A9993E364706816ABA3E25717850C26C9CD0D89D";
    EXPECT_NO_THROW(verify_checksum(set, expected));
}

TEST(VerifyChecksumTest, OnlyHighestPriorityIsChecked) {
    const auto set = digest_of("abc");
    ChecksumExpectation expected;
    expected.md5 = "900150983cd24fb0d6963f7d28e17f72";
    expected.adler32 = "ffffffff";
    EXPECT_NO_THROW(verify_checksum(set, expected));
}

TEST(VerifyChecksumTest, MismatchCarriesBothValues) {
    const auto set = digest_of("abc");
    ChecksumExpectation expected;
    expected.adler32 = "00000000";
    try {
        verify_checksum(set, expected);
        FAIL() << "expected a checksum mismatch";
    } catch (const ChecksumMismatchError& ex) {
        EXPECT_EQ(ex.code(), ErrorCode::kChecksumMismatch);
        EXPECT_EQ(ex.algorithm(), "adler32");
        EXPECT_EQ(ex.expected(), "00000000");
        EXPECT_EQ(ex.actual(), "024d0127");
    }
}

TEST(VerifyChecksumTest, NothingDeclaredPasses) {
    EXPECT_NO_THROW(verify_checksum(digest_of("abc"), ChecksumExpectation{}));
}

}  // namespace vault::server::test
