#include <gtest/gtest.h>
#include "compliance/AuditLogger.hpp"
#include "persistence/SqliteStore.hpp"
#include "tests/TestStores.hpp"

using namespace filesentry;

class AuditLoggerTest : public ::testing::Test {
protected:
    void SetUp() override {
        logger_ = std::make_unique<AuditLogger>(&store_, "test-hmac-key", &health_);
        logger_->Initialize();
    }

    test::MemoryAuditStore store_;
    StorageHealth health_;
    std::unique_ptr<AuditLogger> logger_;
};

TEST_F(AuditLoggerTest, EmptyChainVerifies) {
    EXPECT_TRUE(logger_->VerifyIntegrity());
    EXPECT_EQ(logger_->GetEntryCount(), 0u);
}

TEST_F(AuditLoggerTest, ChainLinksEntries) {
    logger_->LogAction("SCAN_COMPLETED", "alice", "file-1", "{}");
    logger_->LogEvent(AuditEventType::PII_DETECTED, "alice", "file-1", {{"ssn", 1}});
    logger_->LogAction("RESPONSE_EXECUTED", "system", "file-1");

    auto entries = logger_->QueryEntries();
    ASSERT_EQ(entries.size(), 3u);
    EXPECT_EQ(entries[0].prev_hash, AuditLogger::kGenesisHash);
    EXPECT_EQ(entries[1].prev_hash, entries[0].entry_hash);
    EXPECT_EQ(entries[2].prev_hash, entries[1].entry_hash);
    EXPECT_EQ(entries[1].action, "PII_DETECTED");
    EXPECT_EQ(entries[1].details, R"({"ssn":1})");
    EXPECT_EQ(entries[0].entry_hash.size(), 64u);
    EXPECT_EQ(logger_->GetEntryCount(), 3u);
    EXPECT_TRUE(logger_->VerifyIntegrity());
}

TEST_F(AuditLoggerTest, TamperedDetailsAreDetected) {
    logger_->LogAction("SCAN_COMPLETED", "alice", "file-1", "clean");
    logger_->LogAction("SCAN_COMPLETED", "alice", "file-2", "clean");

    store_.Records()[0].data["details"] = "edited";
    EXPECT_FALSE(logger_->VerifyIntegrity());
}

TEST_F(AuditLoggerTest, DeletedEntryBreaksChain) {
    logger_->LogAction("A", "x", "t");
    logger_->LogAction("B", "x", "t");
    logger_->LogAction("C", "x", "t");

    auto& records = store_.Records();
    records.erase(records.begin() + 1);
    EXPECT_FALSE(logger_->VerifyIntegrity());
}

TEST_F(AuditLoggerTest, DifferentKeyFailsVerification) {
    logger_->LogAction("A", "x", "t");
    AuditLogger other(&store_, "another-key", &health_);
    EXPECT_FALSE(other.VerifyIntegrity());
}

TEST_F(AuditLoggerTest, FailedWriteIsCountedAndChainTipHolds) {
    logger_->LogAction("A", "x", "t");
    store_.fail_inserts = true;
    logger_->LogAction("B", "x", "t");
    store_.fail_inserts = false;
    logger_->LogAction("C", "x", "t");

    EXPECT_EQ(health_.AuditWriteFailures(), 1u);
    EXPECT_EQ(logger_->GetEntryCount(), 2u);
    EXPECT_TRUE(logger_->VerifyIntegrity());
}

TEST_F(AuditLoggerTest, InitializeResumesChainTip) {
    logger_->LogAction("A", "x", "t");
    logger_->LogAction("B", "x", "t");

    AuditLogger resumed(&store_, "test-hmac-key", &health_);
    resumed.Initialize();
    EXPECT_EQ(resumed.GetEntryCount(), 2u);
    resumed.LogAction("C", "x", "t");
    EXPECT_TRUE(resumed.VerifyIntegrity());
}

TEST_F(AuditLoggerTest, ResponsesAndSecurityEventsGoToTheirCollections) {
    ThreatResponse response;
    response.id = "resp-1";
    response.scan_id = "scan-1";
    response.action = ResponseActionKind::BLOCK;
    response.timestamp = 1000;
    response.details.original.file_id = "file-9";
    logger_->RecordResponse(response);
    logger_->RecordSecurityEvent("file-9", "scan_completed", {{"risk_score", 0}});

    ASSERT_EQ(store_.CountIn(AuditLogger::kResponseCollection), 1u);
    ASSERT_EQ(store_.CountIn(AuditLogger::kSecurityEventCollection), 1u);

    QueryCriteria criteria;
    criteria.collection = AuditLogger::kResponseCollection;
    auto records = store_.Query(criteria);
    EXPECT_EQ(records[0].file_id, "file-9");
    EXPECT_EQ(records[0].record_id, "resp-1");
    EXPECT_EQ(records[0].data["action"], "block");

    // Side collections do not affect the chain.
    EXPECT_TRUE(logger_->VerifyIntegrity());
}

TEST_F(AuditLoggerTest, SideCollectionFailuresAreCounted) {
    store_.fail_inserts = true;
    logger_->RecordSecurityEvent("file-1", "scan_failed", nlohmann::json::object());
    EXPECT_EQ(health_.AuditWriteFailures(), 1u);
}

TEST_F(AuditLoggerTest, HashCoversEveryField) {
    AuditEntry entry;
    entry.timestamp = 1700000000000ull;
    entry.action = "A";
    entry.actor = "x";
    entry.target = "t";
    entry.details = "d";
    entry.prev_hash = AuditLogger::kGenesisHash;
    std::string base = logger_->ComputeEntryHash(entry);
    EXPECT_EQ(base, logger_->ComputeEntryHash(entry));

    AuditEntry changed = entry;
    changed.actor = "y";
    EXPECT_NE(base, logger_->ComputeEntryHash(changed));
    changed = entry;
    changed.prev_hash = "other";
    EXPECT_NE(base, logger_->ComputeEntryHash(changed));
}

TEST(AuditLoggerSqliteTest, ChainVerifiesOnSqlite) {
    SqliteStore store;
    ASSERT_TRUE(store.Initialize(":memory:"));
    StorageHealth health;
    AuditLogger logger(&store, "k", &health);
    logger.Initialize();
    for (int i = 0; i < 20; ++i) {
        logger.LogAction("EVENT", "actor", "target-" + std::to_string(i));
    }
    EXPECT_EQ(store.Count(AuditLogger::kAuditCollection), 20u);
    EXPECT_TRUE(logger.VerifyIntegrity());
    EXPECT_EQ(logger.QueryEntries(0, 0, 5).size(), 5u);
}
