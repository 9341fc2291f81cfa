#include "test_support.hpp"

#include "config_loader.hpp"
#include "logger.hpp"

#include <gtest/gtest.h>

#include <fstream>

namespace vault::server::test {

class ConfigTest : public ::testing::Test {
protected:
    std::string write_config(const std::string& body) {
        const auto path = dir_.path() / "server.conf";
        std::ofstream(path) << body;
        return path.string();
    }

    TempDir dir_;
};

TEST_F(ConfigTest, MissingFileFallsBackToDefaults) {
    const auto config = load_config((dir_.path() / "absent.conf").string());
    EXPECT_EQ(config.storage_root, "./data/storage");
    EXPECT_EQ(config.log_level, "info");
    EXPECT_FALSE(config.async_postprocessing);
    EXPECT_EQ(config.propagation_retries, 3u);
    EXPECT_EQ(config.max_chunk_bytes, 1024u * 1024u);
    EXPECT_EQ(config.tokens.transfer_expires, 86400u);
}

TEST_F(ConfigTest, ParsesKeysCommentsAndWhitespace) {
    const auto config = load_config(write_config(
        "# engine\n"
        "storage_root = /srv/vault\n"
        "  async_postprocessing=true\n"
        "postprocessing_threads = 4\n"
        "max_chunk_bytes = 65536\n"
        "\n"
        "transfer_shared_secret = abc\n"
        "transfer_expires = 60\n"
        "data_gateway_endpoint = https://gw/\n"
        "unknown_key = ignored\n"
        "no equals sign here\n"));
    EXPECT_EQ(config.storage_root, "/srv/vault");
    EXPECT_TRUE(config.async_postprocessing);
    EXPECT_EQ(config.postprocessing_threads, 4u);
    EXPECT_EQ(config.max_chunk_bytes, 65536u);
    EXPECT_EQ(config.tokens.transfer_shared_secret, "abc");
    EXPECT_EQ(config.tokens.transfer_expires, 60u);
    EXPECT_EQ(config.tokens.data_gateway_endpoint, "https://gw/");
}

TEST_F(ConfigTest, RejectsMalformedValues) {
    EXPECT_THROW(load_config(write_config("propagation_retries = three\n")), std::invalid_argument);
    EXPECT_THROW(load_config(write_config("postprocessing_threads = -1\n")), std::invalid_argument);
    EXPECT_THROW(load_config(write_config("async_postprocessing = maybe\n")), std::invalid_argument);
    EXPECT_THROW(load_config(write_config("max_chunk_bytes = 0\n")), std::invalid_argument);
}

TEST(LogLevelTest, ParsesNames) {
    EXPECT_EQ(parse_log_level("debug"), LogLevel::kDebug);
    EXPECT_EQ(parse_log_level("warning"), LogLevel::kWarn);
    EXPECT_EQ(parse_log_level("error"), LogLevel::kError);
    EXPECT_THROW(parse_log_level("loud"), std::invalid_argument);
}

TEST(LoggerTest, FiltersBelowMinimumLevel) {
    TempDir dir;
    const auto path = dir.path() / "logs" / "engine.log";
    {
        Logger logger(path.string(), LogLevel::kWarn, false);
        logger.info("quiet");
        logger.warn("loud");
        EXPECT_FALSE(logger.enabled(LogLevel::kDebug));
    }
    const auto content = read_file(path);
    EXPECT_EQ(content.find("quiet"), std::string::npos);
    EXPECT_NE(content.find("[WARN] loud"), std::string::npos);
}

}  // namespace vault::server::test
