#include <gtest/gtest.h>
#include "core/Util.hpp"
#include "persistence/FileBlobStore.hpp"
#include "persistence/SqliteStore.hpp"
#include "persistence/StorageHealth.hpp"
#include "persistence/TtlCache.hpp"
#include <filesystem>

using namespace filesentry;

namespace fs = std::filesystem;

namespace {

StoreRecord Record(const std::string& collection, const std::string& record_id,
                   const std::string& file_id, uint64_t timestamp, int value) {
    StoreRecord record;
    record.collection = collection;
    record.record_id = record_id;
    record.file_id = file_id;
    record.timestamp = timestamp;
    record.data = {{"value", value}};
    return record;
}

} // namespace

// ═══════════════════════════════════════════════════════════════════
// SqliteStore
// ═══════════════════════════════════════════════════════════════════

class SqliteStoreTest : public ::testing::Test {
protected:
    void SetUp() override {
        ASSERT_TRUE(store_.Initialize(":memory:"));
    }

    void TearDown() override {
        store_.Shutdown();
    }

    SqliteStore store_;
};

TEST_F(SqliteStoreTest, InsertAndQueryInInsertOrder) {
    store_.Insert(Record("events", "a", "f1", 300, 1));
    store_.Insert(Record("events", "b", "f2", 100, 2));
    store_.Insert(Record("events", "c", "f1", 200, 3));

    QueryCriteria criteria;
    criteria.collection = "events";
    auto records = store_.Query(criteria);
    ASSERT_EQ(records.size(), 3u);
    EXPECT_EQ(records[0].record_id, "a");
    EXPECT_EQ(records[1].record_id, "b");
    EXPECT_EQ(records[2].record_id, "c");
    EXPECT_EQ(records[2].data["value"], 3);
    EXPECT_EQ(records[0].timestamp, 300u);
}

TEST_F(SqliteStoreTest, QueryFilters) {
    store_.Insert(Record("events", "a", "f1", 100, 1));
    store_.Insert(Record("events", "b", "f2", 200, 2));
    store_.Insert(Record("other", "c", "f1", 300, 3));
    store_.Insert(Record("events", "d", "f1", 400, 4));

    QueryCriteria by_file;
    by_file.collection = "events";
    by_file.file_id = "f1";
    EXPECT_EQ(store_.Query(by_file).size(), 2u);

    QueryCriteria window;
    window.collection = "events";
    window.since = 150;
    window.until = 400;
    auto records = store_.Query(window);
    ASSERT_EQ(records.size(), 2u);
    EXPECT_EQ(records[0].record_id, "b");

    QueryCriteria latest;
    latest.collection = "events";
    latest.descending = true;
    latest.limit = 1;
    records = store_.Query(latest);
    ASSERT_EQ(records.size(), 1u);
    EXPECT_EQ(records[0].record_id, "d");
}

TEST_F(SqliteStoreTest, VersionsShareRecordId) {
    store_.Insert(Record("tickets", "t1", "", 100, 1));
    store_.Insert(Record("tickets", "t1", "", 200, 2));

    QueryCriteria criteria;
    criteria.collection = "tickets";
    criteria.record_id = "t1";
    auto records = store_.Query(criteria);
    ASSERT_EQ(records.size(), 2u);
    EXPECT_EQ(records[1].data["value"], 2);
    EXPECT_EQ(records[0].file_id, "");
}

TEST_F(SqliteStoreTest, CountPerCollection) {
    store_.Insert(Record("a", "1", "", 1, 1));
    store_.Insert(Record("a", "2", "", 2, 1));
    store_.Insert(Record("b", "3", "", 3, 1));
    EXPECT_EQ(store_.Count("a"), 2u);
    EXPECT_EQ(store_.Count("b"), 1u);
    EXPECT_EQ(store_.Count("missing"), 0u);
}

TEST_F(SqliteStoreTest, RecordWithoutCollectionIsRejected) {
    EXPECT_THROW(store_.Insert(Record("", "x", "", 1, 1)), StorageError);
}

TEST(SqliteStoreClosedTest, ClosedStoreThrows) {
    SqliteStore store;
    EXPECT_FALSE(store.IsOpen());
    EXPECT_THROW(store.Insert(Record("a", "1", "", 1, 1)), StorageError);
    EXPECT_THROW(store.Query(QueryCriteria{}), StorageError);
}

// ═══════════════════════════════════════════════════════════════════
// FileBlobStore
// ═══════════════════════════════════════════════════════════════════

class FileBlobStoreTest : public ::testing::Test {
protected:
    void SetUp() override {
        root_ = fs::temp_directory_path() / ("filesentry_blobs_" + GenerateUUID());
        store_ = std::make_unique<FileBlobStore>(root_);
    }

    void TearDown() override {
        store_.reset();
        std::error_code ec;
        fs::remove_all(root_, ec);
    }

    fs::path root_;
    std::unique_ptr<FileBlobStore> store_;
};

TEST_F(FileBlobStoreTest, PutGetRoundTripWithMetadata) {
    std::vector<uint8_t> bytes = {0x00, 0x01, 0xff, 'a'};
    store_->Put("quarantine/abc-file.bin", bytes, {{"reason", "threat"}, {"file_id", "f1"}});

    auto blob = store_->Get("quarantine/abc-file.bin");
    ASSERT_TRUE(blob.has_value());
    EXPECT_EQ(blob->bytes, bytes);
    EXPECT_EQ(blob->metadata.at("reason"), "threat");
    EXPECT_EQ(blob->metadata.at("file_id"), "f1");
    EXPECT_TRUE(fs::exists(root_ / "quarantine" / "abc-file.bin"));
}

TEST_F(FileBlobStoreTest, PutReplacesExistingKey) {
    store_->Put("k", {'1'}, {});
    store_->Put("k", {'2', '3'}, {});
    auto blob = store_->Get("k");
    ASSERT_TRUE(blob.has_value());
    EXPECT_EQ(blob->bytes, (std::vector<uint8_t>{'2', '3'}));
}

TEST_F(FileBlobStoreTest, MissingKeyIsEmpty) {
    EXPECT_FALSE(store_->Get("nothing").has_value());
    EXPECT_FALSE(store_->Delete("nothing"));
}

TEST_F(FileBlobStoreTest, DeleteRemovesBlob) {
    store_->Put("gone", {'x'}, {});
    EXPECT_TRUE(store_->Delete("gone"));
    EXPECT_FALSE(store_->Get("gone").has_value());
}

TEST_F(FileBlobStoreTest, EscapingKeysAreRejected) {
    EXPECT_FALSE(FileBlobStore::IsValidKey("../outside"));
    EXPECT_FALSE(FileBlobStore::IsValidKey("/etc/passwd"));
    EXPECT_FALSE(FileBlobStore::IsValidKey("a/./b"));
    EXPECT_FALSE(FileBlobStore::IsValidKey(""));
    EXPECT_TRUE(FileBlobStore::IsValidKey("sanitized/uuid-report.txt"));
    EXPECT_THROW(store_->Put("../outside", {'x'}, {}), StorageError);
}

// ═══════════════════════════════════════════════════════════════════
// TtlCache
// ═══════════════════════════════════════════════════════════════════

TEST(TtlCacheTest, EntriesExpire) {
    uint64_t now = 1000;
    TtlCache<int> cache([&now]() { return now; });

    cache.Put("k", 7, 100);
    ASSERT_TRUE(cache.Get("k").has_value());
    EXPECT_EQ(*cache.Get("k"), 7);

    now = 1099;
    EXPECT_TRUE(cache.Get("k").has_value());
    now = 1100;
    EXPECT_FALSE(cache.Get("k").has_value());
}

TEST(TtlCacheTest, ExpiredEntriesArePurgedOnWrite) {
    uint64_t now = 0;
    TtlCache<int> cache([&now]() { return now; });
    cache.Put("a", 1, 10);
    cache.Put("b", 2, 1000);
    now = 50;
    cache.Put("c", 3, 10);
    EXPECT_EQ(cache.Size(), 2u);
}

TEST(TtlCacheTest, InvalidateDropsEntry) {
    TtlCache<std::string> cache;
    cache.Put("k", "v", 60000);
    cache.Invalidate("k");
    EXPECT_FALSE(cache.Get("k").has_value());
}

// ═══════════════════════════════════════════════════════════════════
// StorageHealth
// ═══════════════════════════════════════════════════════════════════

TEST(StorageHealthTest, CountsFailuresByKind) {
    StorageHealth health;
    health.RecordFailure("audit_log", "disk full");
    health.RecordFailure("escalations", "locked");
    health.RecordBlobFailure("quarantine/x", "permission denied");
    EXPECT_EQ(health.AuditWriteFailures(), 2u);
    EXPECT_EQ(health.BlobWriteFailures(), 1u);
    EXPECT_EQ(health.TotalFailures(), 3u);
}
