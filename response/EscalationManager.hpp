#pragma once

#include "engine/ThreatTypes.hpp"
#include "persistence/Storage.hpp"
#include "persistence/StorageHealth.hpp"
#include <cstdint>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

namespace filesentry {

enum class TicketState {
    OPEN,
    INVESTIGATING,
    RESOLVED,
    CLOSED
};

inline std::string TicketStateToString(TicketState state) {
    switch (state) {
        case TicketState::OPEN:          return "OPEN";
        case TicketState::INVESTIGATING: return "INVESTIGATING";
        case TicketState::RESOLVED:      return "RESOLVED";
        case TicketState::CLOSED:        return "CLOSED";
        default:                         return "UNKNOWN";
    }
}

struct TicketTransition {
    TicketState from_state;
    TicketState to_state;
    uint64_t timestamp;
    std::string actor;
    std::string reason;
};

struct EscalationTicket {
    std::string id;
    std::string scan_id;
    std::string file_id;
    std::string file_name;
    Severity severity{Severity::INFO};
    uint32_t risk_score{0};
    size_t threat_count{0};
    size_t pii_count{0};
    std::string classification;
    std::string actor;
    TicketState status{TicketState::OPEN};
    uint64_t created_at{0};
    uint64_t updated_at{0};
    std::vector<TicketTransition> history;
};

// Everything a new ticket records about the scan that raised it.
struct EscalationRequest {
    std::string scan_id;
    std::string file_id;
    std::string file_name;
    Severity severity{Severity::INFO};
    uint32_t risk_score{0};
    size_t threat_count{0};
    size_t pii_count{0};
    std::string classification;
    std::string actor;
};

// Human-review tickets raised by the escalate action. Every ticket version
// is appended to the escalations collection.
class EscalationManager {
public:
    static constexpr const char* kCollection = "escalations";

    EscalationManager(AuditStore* store, StorageHealth* health);

    EscalationTicket Create(const EscalationRequest& request);

    std::vector<EscalationTicket> ListTickets() const;
    std::optional<EscalationTicket> GetTicket(const std::string& id) const;
    size_t GetOpenTicketCount() const;

    bool StartInvestigation(const std::string& id, const std::string& actor);
    bool Resolve(const std::string& id, const std::string& actor, const std::string& reason);
    bool Close(const std::string& id, const std::string& actor, const std::string& reason);

    static bool IsValidTransition(TicketState from, TicketState to);

private:
    bool Transition(const std::string& id, TicketState new_state,
                    const std::string& actor, const std::string& reason);
    void Persist(const EscalationTicket& ticket);

    AuditStore* store_{nullptr};
    StorageHealth* health_{nullptr};

    std::unordered_map<std::string, EscalationTicket> tickets_;
    mutable std::mutex mutex_;
};

} // namespace filesentry
