#pragma once

#include <cstddef>
#include <cstdint>
#include <string>

namespace vault::server {

struct TokenOptions {
    std::string transfer_shared_secret = "change-me";
    uint32_t transfer_expires = 86400;
    std::string issuer = "vault_drive";
    std::string audience = "vault_drive";
    std::string download_endpoint = "http://localhost:9200/data";
    std::string data_gateway_endpoint = "http://localhost:9200/data-gateway";
};

struct EngineConfig {
    std::string storage_root = "./data/storage";
    std::string database_file = "./data/vault_drive.db";
    std::string log_file = "./data/vault_drive.log";
    std::string log_level = "info";
    bool async_postprocessing = false;
    std::size_t postprocessing_threads = 2;
    std::size_t propagation_retries = 3;
    std::size_t max_chunk_bytes = 1 * 1024 * 1024;
    TokenOptions tokens;
};

EngineConfig load_config(const std::string& path);

}  // namespace vault::server
