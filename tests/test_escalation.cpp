#include <gtest/gtest.h>
#include "response/EscalationManager.hpp"
#include "tests/TestStores.hpp"

using namespace filesentry;

class EscalationManagerTest : public ::testing::Test {
protected:
    void SetUp() override {
        manager_ = std::make_unique<EscalationManager>(&store_, &health_);
    }

    EscalationTicket CreateTicket(const std::string& file_id = "file-1") {
        EscalationRequest request;
        request.scan_id = "scan-1";
        request.file_id = file_id;
        request.file_name = "payload.js";
        request.severity = Severity::CRITICAL;
        request.risk_score = 100;
        request.threat_count = 3;
        request.pii_count = 1;
        request.classification = "restricted";
        request.actor = "cli";
        return manager_->Create(request);
    }

    test::MemoryAuditStore store_;
    StorageHealth health_;
    std::unique_ptr<EscalationManager> manager_;
};

TEST_F(EscalationManagerTest, CreateOpensAndPersists) {
    auto ticket = CreateTicket();
    EXPECT_FALSE(ticket.id.empty());
    EXPECT_EQ(ticket.status, TicketState::OPEN);
    EXPECT_EQ(ticket.created_at, ticket.updated_at);
    EXPECT_EQ(manager_->GetOpenTicketCount(), 1u);

    QueryCriteria criteria;
    criteria.collection = EscalationManager::kCollection;
    auto records = store_.Query(criteria);
    ASSERT_EQ(records.size(), 1u);
    EXPECT_EQ(records[0].record_id, ticket.id);
    EXPECT_EQ(records[0].file_id, "file-1");
    EXPECT_EQ(records[0].data["status"], "OPEN");
    EXPECT_EQ(records[0].data["severity"], "critical");
}

TEST_F(EscalationManagerTest, FullLifecycle) {
    auto ticket = CreateTicket();
    EXPECT_TRUE(manager_->StartInvestigation(ticket.id, "analyst"));
    EXPECT_TRUE(manager_->Resolve(ticket.id, "analyst", "false positive"));
    EXPECT_EQ(manager_->GetOpenTicketCount(), 0u);
    EXPECT_TRUE(manager_->Close(ticket.id, "lead", "done"));

    auto stored = manager_->GetTicket(ticket.id);
    ASSERT_TRUE(stored.has_value());
    EXPECT_EQ(stored->status, TicketState::CLOSED);
    ASSERT_EQ(stored->history.size(), 3u);
    EXPECT_EQ(stored->history[1].from_state, TicketState::INVESTIGATING);
    EXPECT_EQ(stored->history[1].to_state, TicketState::RESOLVED);
    EXPECT_EQ(stored->history[1].reason, "false positive");
    EXPECT_EQ(stored->history[2].actor, "lead");

    // One record per version.
    QueryCriteria criteria;
    criteria.collection = EscalationManager::kCollection;
    criteria.record_id = ticket.id;
    EXPECT_EQ(store_.Query(criteria).size(), 4u);
}

TEST_F(EscalationManagerTest, InvalidTransitionsAreRefused) {
    auto ticket = CreateTicket();
    EXPECT_FALSE(manager_->Resolve(ticket.id, "analyst", "skip ahead"));
    EXPECT_TRUE(manager_->Close(ticket.id, "analyst", "duplicate"));
    EXPECT_FALSE(manager_->StartInvestigation(ticket.id, "analyst"));
    EXPECT_FALSE(manager_->Close(ticket.id, "analyst", "again"));
    EXPECT_EQ(manager_->GetTicket(ticket.id)->history.size(), 1u);
}

TEST_F(EscalationManagerTest, UnknownTicket) {
    EXPECT_FALSE(manager_->GetTicket("missing").has_value());
    EXPECT_FALSE(manager_->StartInvestigation("missing", "analyst"));
}

TEST_F(EscalationManagerTest, TransitionTable) {
    EXPECT_TRUE(EscalationManager::IsValidTransition(TicketState::OPEN, TicketState::INVESTIGATING));
    EXPECT_TRUE(EscalationManager::IsValidTransition(TicketState::OPEN, TicketState::CLOSED));
    EXPECT_FALSE(EscalationManager::IsValidTransition(TicketState::OPEN, TicketState::RESOLVED));
    EXPECT_TRUE(EscalationManager::IsValidTransition(TicketState::INVESTIGATING, TicketState::RESOLVED));
    EXPECT_TRUE(EscalationManager::IsValidTransition(TicketState::RESOLVED, TicketState::CLOSED));
    EXPECT_FALSE(EscalationManager::IsValidTransition(TicketState::RESOLVED, TicketState::OPEN));
    EXPECT_FALSE(EscalationManager::IsValidTransition(TicketState::CLOSED, TicketState::OPEN));
}

TEST_F(EscalationManagerTest, StoreFailureDoesNotLoseTicket) {
    store_.fail_inserts = true;
    auto ticket = CreateTicket();
    EXPECT_TRUE(manager_->GetTicket(ticket.id).has_value());
    EXPECT_EQ(health_.AuditWriteFailures(), 1u);
}

TEST_F(EscalationManagerTest, ListsAllTickets) {
    CreateTicket("a");
    CreateTicket("b");
    auto second = CreateTicket("c");
    manager_->Close(second.id, "x", "noise");
    EXPECT_EQ(manager_->ListTickets().size(), 3u);
    EXPECT_EQ(manager_->GetOpenTicketCount(), 2u);
}
