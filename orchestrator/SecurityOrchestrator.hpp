#pragma once

#include "compliance/AuditLogger.hpp"
#include "compliance/PIIClassifier.hpp"
#include "config/SecurityConfig.hpp"
#include "core/ThreadPool.hpp"
#include "engine/ThreatDetectionEngine.hpp"
#include "intel/ThreatIntelRepository.hpp"
#include "persistence/Storage.hpp"
#include "persistence/StorageHealth.hpp"
#include "privacy/PIITypes.hpp"
#include "response/EscalationManager.hpp"
#include "response/NotificationChannel.hpp"
#include "response/ResponseExecutor.hpp"
#include "response/ResponsePolicyEngine.hpp"
#include "response/ResponseTypes.hpp"
#include <nlohmann/json_fwd.hpp>
#include <atomic>
#include <cstdint>
#include <memory>
#include <string>
#include <vector>

namespace filesentry {

struct ActorContext {
    std::string actor_id{"system"};
    std::string source;  // e.g. client address or upload channel
};

struct UnifiedSecurityResult {
    std::string scan_id;
    bool success{false};  // false when the file was blocked or the scan failed
    bool blocked{false};
    Recommendation recommendation{Recommendation::MANUAL_REVIEW};
    ThreatDetectionResult threat_result;
    PIIDetectionResult pii_result;
    std::vector<ThreatResponse> responses;
    std::vector<std::string> fired_rules;
    FileDescriptor file;
    std::string summary;
    std::string error;
    std::string error_code;
    bool retryable{false};
    uint64_t duration_ms{0};
};

struct FileSecurityHistory {
    std::string file_id;
    std::vector<StoreRecord> responses;
    std::vector<StoreRecord> security_events;
    std::vector<StoreRecord> escalations;
};

struct SecurityStatistics {
    uint64_t scans{0};
    uint64_t failures{0};
    uint64_t blocked_files{0};
    uint64_t threats_detected{0};
    uint64_t pii_findings{0};
    uint64_t storage_failures{0};
    size_t open_escalations{0};
    std::string intel_version;
};

void to_json(nlohmann::json& j, const UnifiedSecurityResult& result);
void to_json(nlohmann::json& j, const SecurityStatistics& stats);

// Single entry point of the upload pipeline: detection, PII scan, policy
// decision and response execution for one file. ScanAndRespond reports every
// failure inside the returned result.
class SecurityOrchestrator {
public:
    // `store`, `blobs` and `notifier` must outlive the orchestrator.
    SecurityOrchestrator(SecurityConfig config,
                         AuditStore* store,
                         BlobStore* blobs,
                         NotificationChannel* notifier);
    ~SecurityOrchestrator();

    SecurityOrchestrator(const SecurityOrchestrator&) = delete;
    SecurityOrchestrator& operator=(const SecurityOrchestrator&) = delete;

    UnifiedSecurityResult ScanAndRespond(const std::vector<uint8_t>& bytes,
                                         const FileMetadata& metadata,
                                         const ActorContext& actor);

    // Publishes a new reference data version. Returns false when the store
    // rejected it; the previous version then stays active.
    bool UpdateThreatIntelligence(const ThreatIntelDatabase& database, const ActorContext& actor);

    FileSecurityHistory GetFileSecurityHistory(const std::string& file_id);
    SecurityStatistics GetStatistics();

    const SecurityConfig& Config() const { return config_; }
    ThreatDetectionEngine& Engine() { return engine_; }
    ThreatIntelRepository& Intel() { return intel_; }
    AuditLogger& Audit() { return audit_; }
    EscalationManager& Escalations() { return escalations_; }
    const StorageHealth& Health() const { return health_; }

private:
    UnifiedSecurityResult RunScan(const std::string& scan_id,
                                  const std::vector<uint8_t>& bytes,
                                  const FileMetadata& metadata,
                                  const ActorContext& actor);
    UnifiedSecurityResult FailureResult(const std::string& scan_id,
                                        const FileMetadata& metadata,
                                        const ActorContext& actor,
                                        const std::string& code,
                                        const std::string& message,
                                        bool retryable);
    ThreatDetectionResult DisabledThreatResult(const FileMetadata& metadata,
                                               const std::string& intel_version) const;
    static std::string Summarize(const UnifiedSecurityResult& result);

    SecurityConfig config_;
    AuditStore* store_{nullptr};

    StorageHealth health_;
    std::unique_ptr<ThreadPool> pool_;
    AuditLogger audit_;
    EscalationManager escalations_;
    ThreatIntelRepository intel_;
    ThreatDetectionEngine engine_;
    PIIClassifier classifier_;
    ResponsePolicyEngine policy_;
    ResponseExecutor executor_;

    std::atomic<uint64_t> scans_{0};
    std::atomic<uint64_t> failures_{0};
    std::atomic<uint64_t> blocked_{0};
    std::atomic<uint64_t> threats_detected_{0};
    std::atomic<uint64_t> pii_findings_{0};
};

} // namespace filesentry
