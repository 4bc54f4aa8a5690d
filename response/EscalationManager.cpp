#include "response/EscalationManager.hpp"
#include "core/Logger.hpp"
#include "core/Util.hpp"
#include <nlohmann/json.hpp>

namespace filesentry {

namespace {

nlohmann::json TicketToJson(const EscalationTicket& ticket) {
    nlohmann::json j;
    j["id"] = ticket.id;
    j["scan_id"] = ticket.scan_id;
    j["file_id"] = ticket.file_id;
    j["file_name"] = ticket.file_name;
    j["severity"] = SeverityToString(ticket.severity);
    j["risk_score"] = ticket.risk_score;
    j["threat_count"] = ticket.threat_count;
    j["pii_count"] = ticket.pii_count;
    j["classification"] = ticket.classification;
    j["actor"] = ticket.actor;
    j["status"] = TicketStateToString(ticket.status);
    j["created_at"] = TimestampToISO8601(ticket.created_at);
    j["updated_at"] = TimestampToISO8601(ticket.updated_at);

    nlohmann::json history_json = nlohmann::json::array();
    for (const auto& trans : ticket.history) {
        nlohmann::json hj;
        hj["from"] = TicketStateToString(trans.from_state);
        hj["to"] = TicketStateToString(trans.to_state);
        hj["timestamp"] = TimestampToISO8601(trans.timestamp);
        hj["actor"] = trans.actor;
        hj["reason"] = trans.reason;
        history_json.push_back(hj);
    }
    j["history"] = history_json;
    return j;
}

} // namespace

EscalationManager::EscalationManager(AuditStore* store, StorageHealth* health)
    : store_(store), health_(health) {}

EscalationTicket EscalationManager::Create(const EscalationRequest& request) {
    EscalationTicket ticket;
    ticket.id = GenerateUUID();
    ticket.scan_id = request.scan_id;
    ticket.file_id = request.file_id;
    ticket.file_name = request.file_name;
    ticket.severity = request.severity;
    ticket.risk_score = request.risk_score;
    ticket.threat_count = request.threat_count;
    ticket.pii_count = request.pii_count;
    ticket.classification = request.classification;
    ticket.actor = request.actor;
    ticket.status = TicketState::OPEN;
    ticket.created_at = NowMillis();
    ticket.updated_at = ticket.created_at;

    {
        std::lock_guard<std::mutex> lock(mutex_);
        tickets_[ticket.id] = ticket;
    }

    LOG_WARN("Escalation ticket {} opened for file {} (severity={}, risk={})",
             ticket.id, ticket.file_id, SeverityToString(ticket.severity), ticket.risk_score);
    Persist(ticket);
    return ticket;
}

std::vector<EscalationTicket> EscalationManager::ListTickets() const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<EscalationTicket> result;
    result.reserve(tickets_.size());
    for (const auto& [id, ticket] : tickets_) {
        result.push_back(ticket);
    }
    return result;
}

std::optional<EscalationTicket> EscalationManager::GetTicket(const std::string& id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = tickets_.find(id);
    if (it != tickets_.end()) {
        return it->second;
    }
    return std::nullopt;
}

size_t EscalationManager::GetOpenTicketCount() const {
    std::lock_guard<std::mutex> lock(mutex_);
    size_t count = 0;
    for (const auto& [id, ticket] : tickets_) {
        if (ticket.status != TicketState::CLOSED && ticket.status != TicketState::RESOLVED) {
            ++count;
        }
    }
    return count;
}

bool EscalationManager::StartInvestigation(const std::string& id, const std::string& actor) {
    return Transition(id, TicketState::INVESTIGATING, actor, "Investigation started");
}

bool EscalationManager::Resolve(const std::string& id, const std::string& actor,
                                const std::string& reason) {
    return Transition(id, TicketState::RESOLVED, actor, reason);
}

bool EscalationManager::Close(const std::string& id, const std::string& actor,
                              const std::string& reason) {
    return Transition(id, TicketState::CLOSED, actor, reason);
}

bool EscalationManager::Transition(const std::string& id, TicketState new_state,
                                   const std::string& actor, const std::string& reason) {
    EscalationTicket snapshot;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = tickets_.find(id);
        if (it == tickets_.end()) {
            LOG_WARN("Escalation ticket {} not found", id);
            return false;
        }

        EscalationTicket& ticket = it->second;
        if (!IsValidTransition(ticket.status, new_state)) {
            LOG_WARN("Invalid state transition for ticket {}: {} -> {}",
                     id, TicketStateToString(ticket.status), TicketStateToString(new_state));
            return false;
        }

        TicketTransition transition{ticket.status, new_state, NowMillis(), actor, reason};
        ticket.history.push_back(transition);
        ticket.status = new_state;
        ticket.updated_at = transition.timestamp;
        snapshot = ticket;

        LOG_INFO("Escalation ticket {} state: {} -> {} (actor: {}, reason: {})",
                 id, TicketStateToString(transition.from_state),
                 TicketStateToString(new_state), actor, reason);
    }

    Persist(snapshot);
    return true;
}

bool EscalationManager::IsValidTransition(TicketState from, TicketState to) {
    switch (from) {
        case TicketState::OPEN:
            return to == TicketState::INVESTIGATING || to == TicketState::CLOSED;
        case TicketState::INVESTIGATING:
            return to == TicketState::RESOLVED || to == TicketState::CLOSED;
        case TicketState::RESOLVED:
            return to == TicketState::CLOSED;
        case TicketState::CLOSED:
            return false;
        default:
            return false;
    }
}

void EscalationManager::Persist(const EscalationTicket& ticket) {
    if (!store_) {
        return;
    }

    StoreRecord record;
    record.collection = kCollection;
    record.record_id = ticket.id;
    record.file_id = ticket.file_id;
    record.timestamp = ticket.updated_at;
    record.data = TicketToJson(ticket);
    try {
        store_->Insert(record);
    } catch (const StorageError& ex) {
        if (health_) health_->RecordFailure("escalations", ex.what());
    }
}

} // namespace filesentry
