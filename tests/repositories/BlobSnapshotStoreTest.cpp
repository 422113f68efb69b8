#include "repositories/BlobSnapshotStore.hpp"

#include "errors/ReplicationErrors.hpp"
#include "repositories/FileSystems.hpp"

#include <gtest/gtest.h>

using cre::domain::Timestamp;
using cre::errors::MalformedEventError;
using cre::repositories::BlobSnapshotStore;
using cre::repositories::Snapshot;

class BlobSnapshotStoreTest : public ::testing::Test {
protected:
    std::shared_ptr<arrow::fs::FileSystem> fs_ = cre::repositories::make_memory_fs();
    BlobSnapshotStore store_{fs_, "snapshots"};

    void write_file(const std::string& path, const std::string& content) {
        auto slash = path.rfind('/');
        ASSERT_TRUE(fs_->CreateDir(path.substr(0, slash), true).ok());
        auto out = fs_->OpenOutputStream(path).ValueOrDie();
        ASSERT_TRUE(out->Write(content.data(), static_cast<int64_t>(content.size())).ok());
        ASSERT_TRUE(out->Close().ok());
    }
};

TEST_F(BlobSnapshotStoreTest, NoSnapshotYet) {
    EXPECT_FALSE(store_.load_latest("p0").has_value());
}

TEST_F(BlobSnapshotStoreTest, StoresAndLoads) {
    ASSERT_TRUE(store_.store(Snapshot{"p0", 409, R"({"as_of_sequence_number":409})", Timestamp(5000)}));

    auto loaded = store_.load_latest("p0");
    ASSERT_TRUE(loaded.has_value());
    EXPECT_EQ(loaded->partition_key, "p0");
    EXPECT_EQ(loaded->sequence_number, 409);
    EXPECT_EQ(loaded->payload, R"({"as_of_sequence_number":409})");
    EXPECT_EQ(loaded->created_at, Timestamp(5000));
}

TEST_F(BlobSnapshotStoreTest, PathIsZeroPaddedSequence) {
    EXPECT_EQ(store_.snapshot_path("p0", 409), "snapshots/p0/00000000000000000409.json");
}

TEST_F(BlobSnapshotStoreTest, LatestIsHighestSequence) {
    ASSERT_TRUE(store_.store(Snapshot{"p0", 9, "nine", Timestamp(1)}));
    ASSERT_TRUE(store_.store(Snapshot{"p0", 100, "hundred", Timestamp(2)}));

    EXPECT_EQ(store_.load_latest("p0")->payload, "hundred");
}

TEST_F(BlobSnapshotStoreTest, RejectsStaleWrite) {
    ASSERT_TRUE(store_.store(Snapshot{"p0", 100, "hundred", Timestamp(1)}));

    EXPECT_FALSE(store_.store(Snapshot{"p0", 100, "again", Timestamp(2)}));
    EXPECT_FALSE(store_.store(Snapshot{"p0", 50, "older", Timestamp(3)}));
    EXPECT_EQ(store_.load_latest("p0")->payload, "hundred");
}

TEST_F(BlobSnapshotStoreTest, LeavesNoTemporaryFiles) {
    ASSERT_TRUE(store_.store(Snapshot{"p0", 1, "one", Timestamp(1)}));

    arrow::fs::FileSelector selector;
    selector.base_dir = "snapshots/p0";
    auto listing = fs_->GetFileInfo(selector).ValueOrDie();
    ASSERT_EQ(listing.size(), 1);
    EXPECT_EQ(listing[0].path(), store_.snapshot_path("p0", 1));
}

TEST_F(BlobSnapshotStoreTest, PartitionsAreIndependent) {
    ASSERT_TRUE(store_.store(Snapshot{"p0", 100, "p0", Timestamp(1)}));
    ASSERT_TRUE(store_.store(Snapshot{"p1", 3, "p1", Timestamp(1)}));

    EXPECT_EQ(store_.load_latest("p1")->sequence_number, 3);
    EXPECT_EQ(store_.load_latest("p0")->sequence_number, 100);
}

TEST_F(BlobSnapshotStoreTest, IgnoresStrayFiles) {
    ASSERT_TRUE(store_.store(Snapshot{"p0", 7, "seven", Timestamp(1)}));
    write_file("snapshots/p0/00000000000000000099.json.tmp", "partial");
    write_file("snapshots/p0/notes.json", "{}");

    EXPECT_EQ(store_.load_latest("p0")->sequence_number, 7);
}

TEST_F(BlobSnapshotStoreTest, CorruptDocumentIsMalformed) {
    write_file(store_.snapshot_path("p0", 12), "{\"partition_key\": \"p0\"}");
    EXPECT_THROW(store_.load_latest("p0"), MalformedEventError);
}

TEST_F(BlobSnapshotStoreTest, BadCreationTimeIsMalformed) {
    write_file(store_.snapshot_path("p0", 12),
               R"({"payload": "{}", "created_at_ms": -5})");
    EXPECT_THROW(store_.load_latest("p0"), MalformedEventError);

    write_file(store_.snapshot_path("p0", 13),
               R"({"payload": "{}", "created_at_ms": "yesterday"})");
    EXPECT_THROW(store_.load_latest("p0"), MalformedEventError);
}
