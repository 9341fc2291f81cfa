#pragma once

#include "ids.hpp"
#include "local_tree.hpp"
#include "logger.hpp"
#include "token_issuer.hpp"
#include "tracer.hpp"
#include "upload_engine.hpp"
#include "upload_session.hpp"

#include <gtest/gtest.h>

#include <filesystem>
#include <fstream>
#include <iterator>
#include <memory>
#include <string>

namespace vault::server::test {

class TempDir {
public:
    TempDir() : path_(std::filesystem::temp_directory_path() / ("vault_drive_test_" + util::random_id())) {
        std::filesystem::create_directories(path_);
    }
    ~TempDir() {
        std::error_code ec;
        std::filesystem::remove_all(path_, ec);
    }

    TempDir(const TempDir&) = delete;
    TempDir& operator=(const TempDir&) = delete;

    const std::filesystem::path& path() const { return path_; }

private:
    std::filesystem::path path_;
};

inline std::string read_file(const std::filesystem::path& path) {
    std::ifstream in(path, std::ios::binary);
    return std::string(std::istreambuf_iterator<char>(in), std::istreambuf_iterator<char>());
}

inline std::string read_all(std::istream& in) {
    return std::string(std::istreambuf_iterator<char>(in), std::istreambuf_iterator<char>());
}

// One space ("space-1", owned by "alice") with a directory "docs" under its root.
class EngineFixture : public ::testing::Test {
protected:
    void SetUp() override {
        logger_ = std::make_unique<Logger>((dir_.path() / "test.log").string(), LogLevel::kDebug, false);
        tree_ = std::make_unique<LocalTree>(dir_.path() / "storage", (dir_.path() / "tree.db").string(), *logger_);
        tree_->initialize_schema();
        sessions_ = std::make_unique<SessionStore>((dir_.path() / "sessions.db").string(), dir_.path() / "uploads");
        sessions_->initialize_schema();

        TokenOptions token_options;
        token_options.transfer_shared_secret = "test-secret";
        tokens_ = std::make_unique<TokenIssuer>(token_options);

        root_ = tree_->create_space("space-1", "alice");
        docs_.space_id = root_.space_id;
        docs_.id = "docs-id";
        docs_.parent_id = root_.id;
        docs_.name = "docs";
        docs_.type = NodeType::kDirectory;
        tree_->create_dir(docs_);
    }

    // Engine over `tree` (defaults to the local tree), rebuilt on every call.
    UploadEngine& engine(EngineOptions options = {}, EventPublisher* publisher = nullptr, Tree* tree = nullptr) {
        engine_ = std::make_unique<UploadEngine>(tree ? *tree : *tree_, *sessions_, *logger_, tracer_, *tokens_,
                                                 publisher, options);
        return *engine_;
    }

    NewUploadRequest request(const std::string& filename, std::int64_t size) const {
        NewUploadRequest req;
        req.space_root = root_.space_id;
        req.parent_id = docs_.id;
        req.filename = filename;
        req.size = size;
        req.executant = "bob";
        return req;
    }

    TempDir dir_;
    NullTracer tracer_;
    std::unique_ptr<Logger> logger_;
    std::unique_ptr<LocalTree> tree_;
    std::unique_ptr<SessionStore> sessions_;
    std::unique_ptr<TokenIssuer> tokens_;
    std::unique_ptr<UploadEngine> engine_;
    Node root_;
    Node docs_;
};

}  // namespace vault::server::test
