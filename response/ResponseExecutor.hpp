#pragma once

#include "compliance/AuditLogger.hpp"
#include "config/SecurityConfig.hpp"
#include "engine/ThreatTypes.hpp"
#include "persistence/Storage.hpp"
#include "persistence/StorageHealth.hpp"
#include "privacy/PIITypes.hpp"
#include "response/EscalationManager.hpp"
#include "response/NotificationChannel.hpp"
#include "response/ResponseTypes.hpp"
#include <cstdint>
#include <string>
#include <vector>

namespace filesentry {

struct ExecutionContext {
    std::string scan_id;
    std::string actor;
    const std::vector<uint8_t>& bytes;
    FileDescriptor file;
    const ThreatDetectionResult& threats;
    const PIIDetectionResult& pii;
};

struct ExecutionOutcome {
    std::vector<ThreatResponse> responses;
    FileDescriptor file;  // state after all actions ran
};

// Runs policy actions in order. Each action is an independent unit of work:
// its failure is recorded in its own ThreatResponse and the next action
// still runs. Every response is appended to the audit trail.
class ResponseExecutor {
public:
    ResponseExecutor(BlobStore* blobs,
                     NotificationChannel* notifier,
                     EscalationManager* escalations,
                     AuditLogger* audit,
                     StorageHealth* health,
                     NotificationConfig notifications,
                     QuarantineConfig quarantine,
                     MaskTokens masks);

    ExecutionOutcome Execute(const ExecutionContext& context,
                             const std::vector<ResponseAction>& actions);

    // Replaces in-content threat spans and PII spans with mask tokens,
    // back to front. Returns the number of spans replaced.
    size_t BuildSanitizedCopy(const std::vector<uint8_t>& original,
                              const ThreatDetectionResult& threats,
                              const PIIDetectionResult& pii,
                              std::vector<uint8_t>& out) const;

    // Blob key component derived from a client-supplied file name.
    static std::string SafeKeyName(const std::string& file_name);

private:
    struct ActionVisitor;

    void DoLog(const ExecutionContext& context, ThreatResponse& response);
    void DoNotify(const ExecutionContext& context, ThreatResponse& response);
    void DoSanitize(const ExecutionContext& context, ThreatResponse& response);
    void DoQuarantine(const ExecutionContext& context, ThreatResponse& response);
    void DoDelete(FileDescriptor& file, ThreatResponse& response);
    void DoBlock(FileDescriptor& file, ThreatResponse& response);
    void DoEscalate(const ExecutionContext& context, ThreatResponse& response);

    static std::string NotificationMessage(const ExecutionContext& context);

    BlobStore* blobs_{nullptr};
    NotificationChannel* notifier_{nullptr};
    EscalationManager* escalations_{nullptr};
    AuditLogger* audit_{nullptr};
    StorageHealth* health_{nullptr};
    NotificationConfig notifications_;
    QuarantineConfig quarantine_;
    MaskTokens masks_;
};

} // namespace filesentry
