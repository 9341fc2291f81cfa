#include "config_loader.hpp"

#include <fstream>
#include <iostream>
#include <stdexcept>

namespace vault::server {

namespace {

std::string trim(const std::string& value) {
    const auto first = value.find_first_not_of(" \t\r\n");
    if (first == std::string::npos) {
        return "";
    }
    const auto last = value.find_last_not_of(" \t\r\n");
    return value.substr(first, last - first + 1);
}

unsigned long long parse_number(const std::string& key, const std::string& value) {
    std::size_t consumed = 0;
    unsigned long long parsed = 0;
    try {
        parsed = std::stoull(value, &consumed);
    } catch (const std::exception&) {
        throw std::invalid_argument("Invalid numeric value for " + key + ": " + value);
    }
    if (consumed != value.size() || value.front() == '-') {
        throw std::invalid_argument("Invalid numeric value for " + key + ": " + value);
    }
    return parsed;
}

bool parse_bool(const std::string& key, const std::string& value) {
    if (value == "true" || value == "1" || value == "yes") {
        return true;
    }
    if (value == "false" || value == "0" || value == "no") {
        return false;
    }
    throw std::invalid_argument("Invalid boolean value for " + key + ": " + value);
}

}  // namespace

EngineConfig load_config(const std::string& path) {
    EngineConfig config;
    std::ifstream stream(path);
    if (!stream.is_open()) {
        std::cerr << "[WARN] Unable to open config file " << path
                  << ", falling back to defaults" << std::endl;
        return config;
    }

    std::string line;
    while (std::getline(stream, line)) {
        line = trim(line);
        if (line.empty() || line[0] == '#') {
            continue;
        }
        const auto equals_pos = line.find('=');
        if (equals_pos == std::string::npos) {
            continue;
        }
        const std::string key = trim(line.substr(0, equals_pos));
        const std::string value = trim(line.substr(equals_pos + 1));

        if (key == "storage_root") {
            config.storage_root = value;
        } else if (key == "database_file") {
            config.database_file = value;
        } else if (key == "log_file") {
            config.log_file = value;
        } else if (key == "log_level") {
            config.log_level = value;
        } else if (key == "async_postprocessing") {
            config.async_postprocessing = parse_bool(key, value);
        } else if (key == "postprocessing_threads") {
            config.postprocessing_threads = static_cast<std::size_t>(parse_number(key, value));
        } else if (key == "propagation_retries") {
            config.propagation_retries = static_cast<std::size_t>(parse_number(key, value));
        } else if (key == "max_chunk_bytes") {
            config.max_chunk_bytes = static_cast<std::size_t>(parse_number(key, value));
        } else if (key == "transfer_shared_secret") {
            config.tokens.transfer_shared_secret = value;
        } else if (key == "transfer_expires") {
            config.tokens.transfer_expires = static_cast<uint32_t>(parse_number(key, value));
        } else if (key == "token_issuer") {
            config.tokens.issuer = value;
        } else if (key == "token_audience") {
            config.tokens.audience = value;
        } else if (key == "download_endpoint") {
            config.tokens.download_endpoint = value;
        } else if (key == "data_gateway_endpoint") {
            config.tokens.data_gateway_endpoint = value;
        }
    }

    if (config.max_chunk_bytes == 0) {
        throw std::invalid_argument("max_chunk_bytes must be > 0");
    }
    return config;
}

}  // namespace vault::server
