#include "test_support.hpp"

#include "upload_session.hpp"

#include <gtest/gtest.h>

namespace vault::server::test {

class SessionStoreTest : public ::testing::Test {
protected:
    void SetUp() override {
        store_ = std::make_unique<SessionStore>((dir_.path() / "sessions.db").string(), dir_.path() / "uploads");
        store_->initialize_schema();
    }

    UploadSession sample(const std::string& id, UploadState state) const {
        UploadSession session;
        session.id = id;
        session.bin_path = store_->bin_path_for(id);
        session.offset = 12;
        session.size = 100;
        session.checksum_md5 = "900150983cd24fb0d6963f7d28e17f72";
        session.space_root = "space-1";
        session.node_parent_id = "docs-id";
        session.filename = "report.pdf";
        session.filesize = 100;
        session.space_owner = "alice";
        session.executant = "bob";
        session.blob_id = "blob-" + id;
        session.state = state;
        session.created_at = 1700000000;
        return session;
    }

    TempDir dir_;
    std::unique_ptr<SessionStore> store_;
};

TEST_F(SessionStoreTest, StagingFilesLiveUnderUploadsDir) {
    EXPECT_EQ(store_->bin_path_for("abc"), dir_.path() / "uploads" / "abc");
    EXPECT_TRUE(std::filesystem::is_directory(dir_.path() / "uploads"));
}

TEST_F(SessionStoreTest, PersistAndLoadRoundTrip) {
    auto session = sample("u1", UploadState::kReceiving);
    session.size_is_deferred = true;
    session.versions_path = "space-1/n1.REV.42";
    session.size_diff = -7;
    store_->persist(session);

    const auto loaded = store_->load("u1");
    ASSERT_TRUE(loaded.has_value());
    EXPECT_EQ(loaded->bin_path, session.bin_path);
    EXPECT_EQ(loaded->offset, 12);
    EXPECT_EQ(loaded->size, 100);
    EXPECT_TRUE(loaded->size_is_deferred);
    EXPECT_EQ(loaded->checksum_md5, session.checksum_md5);
    EXPECT_EQ(loaded->versions_path, "space-1/n1.REV.42");
    EXPECT_EQ(loaded->size_diff, -7);
    EXPECT_EQ(loaded->space_owner, "alice");
    EXPECT_EQ(loaded->executant, "bob");
    EXPECT_EQ(loaded->state, UploadState::kReceiving);
    EXPECT_EQ(loaded->created_at, 1700000000);
}

TEST_F(SessionStoreTest, PersistOverwritesExistingRecord) {
    auto session = sample("u1", UploadState::kReceiving);
    store_->persist(session);
    session.state = UploadState::kProcessingAsyncPending;
    session.node_id = "node-1";
    store_->persist(session);

    ASSERT_EQ(store_->list().size(), 1u);
    const auto loaded = store_->load("u1");
    ASSERT_TRUE(loaded.has_value());
    EXPECT_EQ(loaded->state, UploadState::kProcessingAsyncPending);
    EXPECT_EQ(loaded->node_id, "node-1");
}

TEST_F(SessionStoreTest, PurgeIsIdempotent) {
    store_->persist(sample("u1", UploadState::kReceiving));
    EXPECT_TRUE(store_->purge("u1"));
    EXPECT_FALSE(store_->load("u1").has_value());
    EXPECT_FALSE(store_->purge("u1"));
}

TEST_F(SessionStoreTest, ListInStateFilters) {
    store_->persist(sample("u1", UploadState::kReceiving));
    store_->persist(sample("u2", UploadState::kProcessingAsyncPending));
    store_->persist(sample("u3", UploadState::kProcessingAsyncPending));

    const auto pending = store_->list_in_state(UploadState::kProcessingAsyncPending);
    ASSERT_EQ(pending.size(), 2u);
    for (const auto& session : pending) {
        EXPECT_EQ(session.state, UploadState::kProcessingAsyncPending);
    }
    EXPECT_TRUE(store_->list_in_state(UploadState::kDone).empty());
}

TEST(UploadStateTest, NamesParseBack) {
    for (auto state : {UploadState::kReceiving, UploadState::kCommitting, UploadState::kProcessingSync,
                       UploadState::kProcessingAsyncPending, UploadState::kDone, UploadState::kFailed}) {
        EXPECT_EQ(parse_upload_state(upload_state_name(state)), state);
    }
    EXPECT_THROW(parse_upload_state("bogus"), std::invalid_argument);
}

TEST(FileInfoTest, ExposesSessionMetadata) {
    UploadSession session;
    session.id = "u1";
    session.offset = 5;
    session.size = 10;
    session.filename = "a.txt";
    session.space_root = "space-1";
    const auto info = session.to_file_info();
    EXPECT_EQ(info.id, "u1");
    EXPECT_EQ(info.offset, 5);
    EXPECT_EQ(info.size, 10);
    EXPECT_EQ(info.metadata.at("filename"), "a.txt");
    EXPECT_EQ(info.metadata.at("state"), "receiving");
}

}  // namespace vault::server::test
