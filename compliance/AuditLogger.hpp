#pragma once

#include "persistence/Storage.hpp"
#include "persistence/StorageHealth.hpp"
#include "response/ResponseTypes.hpp"
#include <nlohmann/json.hpp>
#include <atomic>
#include <cstdint>
#include <mutex>
#include <string>
#include <vector>

namespace filesentry {

enum class AuditEventType {
    SCAN_COMPLETED,
    PII_DETECTED,
    RESPONSE_EXECUTED,
    SCAN_FAILED,
    INTEL_UPDATED,
    SYSTEM_STARTED
};

inline std::string AuditEventTypeToString(AuditEventType type) {
    switch (type) {
        case AuditEventType::SCAN_COMPLETED:    return "SCAN_COMPLETED";
        case AuditEventType::PII_DETECTED:      return "PII_DETECTED";
        case AuditEventType::RESPONSE_EXECUTED: return "RESPONSE_EXECUTED";
        case AuditEventType::SCAN_FAILED:       return "SCAN_FAILED";
        case AuditEventType::INTEL_UPDATED:     return "INTEL_UPDATED";
        case AuditEventType::SYSTEM_STARTED:    return "SYSTEM_STARTED";
        default:                                return "UNKNOWN";
    }
}

struct AuditEntry {
    uint64_t timestamp{0};
    std::string action;
    std::string actor;
    std::string target;
    std::string details;
    std::string prev_hash;
    std::string entry_hash;
};

// Tamper-evident audit trail. Each entry carries the HMAC-SHA256 of its
// fields and of the previous entry's hash. Writes never throw: a failing
// store is counted in StorageHealth and the chain tip is left unchanged.
class AuditLogger {
public:
    static constexpr const char* kAuditCollection = "audit_log";
    static constexpr const char* kResponseCollection = "threat_responses";
    static constexpr const char* kSecurityEventCollection = "security_events";
    static constexpr const char* kGenesisHash = "GENESIS";

    AuditLogger(AuditStore* store, std::string hmac_key, StorageHealth* health);

    // Resumes the chain from the newest stored entry.
    void Initialize();

    void LogEvent(AuditEventType type, const std::string& actor,
                  const std::string& target, const nlohmann::json& details);

    void LogAction(const std::string& action, const std::string& actor,
                   const std::string& target, const std::string& details = "");

    void RecordResponse(const ThreatResponse& response);
    void RecordSecurityEvent(const std::string& file_id, const std::string& event_type,
                             const nlohmann::json& details);

    bool VerifyIntegrity();

    std::vector<AuditEntry> QueryEntries(uint64_t start_time = 0, uint64_t end_time = 0,
                                         size_t limit = 1000);
    size_t GetEntryCount() const;

    std::string ComputeEntryHash(const AuditEntry& entry) const;

private:
    std::string ComputeHMAC(const std::string& data) const;
    static AuditEntry EntryFromRecord(const StoreRecord& record);
    void Write(const StoreRecord& record, const char* operation);

    AuditStore* store_{nullptr};
    std::string hmac_key_;
    StorageHealth* health_{nullptr};
    std::string last_hash_{kGenesisHash};

    mutable std::mutex mutex_;
    std::atomic<size_t> entry_count_{0};
};

} // namespace filesentry
