#include "orchestrator/SecurityOrchestrator.hpp"
#include "core/Logger.hpp"
#include "core/Util.hpp"
#include "engine/HashMatcher.hpp"
#include <fmt/format.h>
#include <nlohmann/json.hpp>
#include <chrono>
#include <future>
#include <map>

namespace filesentry {

namespace {

uint64_t ElapsedMillis(std::chrono::steady_clock::time_point start) {
    return static_cast<uint64_t>(std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now() - start).count());
}

std::string JoinActions(const std::vector<ThreatResponse>& responses) {
    std::string joined;
    for (const auto& response : responses) {
        if (!joined.empty()) joined += ", ";
        joined += ResponseActionKindToString(response.action);
        if (!response.success) joined += " (failed)";
    }
    return joined.empty() ? "none" : joined;
}

} // namespace

void to_json(nlohmann::json& j, const UnifiedSecurityResult& result) {
    j = nlohmann::json{
        {"scan_id", result.scan_id},
        {"success", result.success},
        {"blocked", result.blocked},
        {"recommendation", RecommendationToString(result.recommendation)},
        {"threat_result", result.threat_result},
        {"pii_result", result.pii_result},
        {"responses", result.responses},
        {"fired_rules", result.fired_rules},
        {"file", result.file},
        {"summary", result.summary},
        {"duration_ms", result.duration_ms}
    };
    if (!result.error.empty()) {
        j["error"] = {
            {"code", result.error_code},
            {"message", result.error},
            {"retryable", result.retryable}
        };
    }
}

void to_json(nlohmann::json& j, const SecurityStatistics& stats) {
    j = nlohmann::json{
        {"scans", stats.scans},
        {"failures", stats.failures},
        {"blocked_files", stats.blocked_files},
        {"threats_detected", stats.threats_detected},
        {"pii_findings", stats.pii_findings},
        {"storage_failures", stats.storage_failures},
        {"open_escalations", stats.open_escalations},
        {"intel_version", stats.intel_version}
    };
}

SecurityOrchestrator::SecurityOrchestrator(SecurityConfig config,
                                           AuditStore* store,
                                           BlobStore* blobs,
                                           NotificationChannel* notifier)
    : config_(std::move(config)),
      store_(store),
      pool_(std::make_unique<ThreadPool>(config_.limits.worker_threads > 0
                                             ? config_.limits.worker_threads
                                             : ThreadPool::DefaultThreadCount())),
      audit_(store, config_.persistence.audit_hmac_key, &health_),
      escalations_(store, &health_),
      intel_(config_.intel, store),
      engine_(config_.detection, config_.limits, config_.tables.weights,
              config_.tables.thresholds, pool_.get()),
      classifier_(config_.tables.compliance),
      policy_(config_.policy, config_.notifications),
      executor_(blobs, notifier, &escalations_, &audit_, &health_,
                config_.notifications, config_.quarantine, config_.tables.masks) {
    audit_.Initialize();
    audit_.LogEvent(AuditEventType::SYSTEM_STARTED, "system", "filesentry",
                    {{"engine", ThreatDetectionEngine::kEngineName},
                     {"engine_version", ThreatDetectionEngine::kEngineVersion},
                     {"worker_threads", pool_->GetThreadCount()}});
    LOG_INFO("SecurityOrchestrator started ({} worker threads)", pool_->GetThreadCount());
}

SecurityOrchestrator::~SecurityOrchestrator() {
    pool_->Shutdown();
}

UnifiedSecurityResult SecurityOrchestrator::ScanAndRespond(const std::vector<uint8_t>& bytes,
                                                           const FileMetadata& metadata,
                                                           const ActorContext& actor) {
    std::string scan_id;
    try {
        scan_id = GenerateUUID();
        scans_++;
        return RunScan(scan_id, bytes, metadata, actor);
    } catch (const ScanError& ex) {
        return FailureResult(scan_id, metadata, actor, ScanErrorCodeToString(ex.code()),
                             ex.what(), ex.retryable());
    } catch (const std::exception& ex) {
        return FailureResult(scan_id, metadata, actor, ScanErrorCodeToString(ScanErrorCode::INTERNAL),
                             ex.what(), false);
    } catch (...) {
        return FailureResult(scan_id, metadata, actor, ScanErrorCodeToString(ScanErrorCode::INTERNAL),
                             "unknown exception", false);
    }
}

ThreatDetectionResult SecurityOrchestrator::DisabledThreatResult(const FileMetadata& metadata,
                                                                 const std::string& intel_version) const {
    ThreatDetectionResult result;
    result.file_id = metadata.file_id;
    result.file_name = metadata.file_name;
    result.scan_timestamp = NowMillis();
    result.engine_name = ThreatDetectionEngine::kEngineName;
    result.engine_version = ThreatDetectionEngine::kEngineVersion;
    result.intel_version = intel_version;
    result.diagnostics.push_back({"engine", "malware detection disabled"});
    return result;
}

UnifiedSecurityResult SecurityOrchestrator::RunScan(const std::string& scan_id,
                                                    const std::vector<uint8_t>& bytes,
                                                    const FileMetadata& metadata,
                                                    const ActorContext& actor) {
    auto start = std::chrono::steady_clock::now();
    const auto& detection = config_.detection;

    if (!detection.enable_malware_detection && !detection.enable_pii_detection) {
        throw ScanError(ScanErrorCode::CONFIGURATION_DISABLED, "Malware and PII detection are both disabled");
    }
    if (bytes.size() > config_.limits.max_scan_size) {
        throw ScanError(ScanErrorCode::SIZE_EXCEEDED,
                        "File size " + std::to_string(bytes.size()) + " exceeds scan limit " +
                        std::to_string(config_.limits.max_scan_size));
    }

    auto deadline = start + std::chrono::milliseconds(config_.limits.scan_timeout_ms);
    auto snapshot = intel_.Snapshot();
    auto content = ScanContent::Create(bytes, metadata, config_.limits.content_sample_bytes);
    CancellationToken token;

    // PII matching runs on the pool while the threat analyzers fan out.
    std::future<std::vector<PIIFinding>> pii_future;
    bool pii_enabled = detection.enable_pii_detection && snapshot->pii;
    if (pii_enabled) {
        auto matcher = snapshot->pii;
        pii_future = pool_->Submit(token, [matcher, content, token]() {
            return matcher->Scan(*content, token);
        });
    }

    ThreatDetectionResult threats;
    try {
        threats = detection.enable_malware_detection
            ? engine_.Scan(content, snapshot, token, deadline)
            : DisabledThreatResult(metadata, snapshot->version);
    } catch (const ScanError&) {
        token.Cancel();
        throw;
    }

    PIIDetectionResult pii;
    pii.file_id = metadata.file_id;
    pii.file_name = metadata.file_name;
    pii.scan_timestamp = NowMillis();
    pii.intel_version = snapshot->version;
    if (pii_enabled) {
        if (pii_future.wait_until(deadline) != std::future_status::ready) {
            token.Cancel();
            throw ScanError(ScanErrorCode::TIMEOUT,
                            "PII detection exceeded " + std::to_string(config_.limits.scan_timeout_ms) + " ms");
        }
        try {
            pii.findings = pii_future.get();
        } catch (const std::exception& ex) {
            LOG_ERROR("PII matcher failed on {}: {}", metadata.file_id, ex.what());
            threats.diagnostics.push_back({"pii", ex.what()});
        } catch (...) {
            LOG_ERROR("PII matcher failed on {}: unknown exception", metadata.file_id);
            threats.diagnostics.push_back({"pii", "unknown exception"});
        }
    }
    classifier_.Annotate(pii);
    pii.scan_duration_ms = ElapsedMillis(start);

    UnifiedSecurityResult result;
    result.scan_id = scan_id;
    result.file.file_id = metadata.file_id;
    result.file.file_name = metadata.file_name;
    result.file.mime_type = metadata.mime_type;
    result.file.size = bytes.size();
    result.file.sha256 = HashMatcher::ComputeDigest("sha256", bytes);

    PolicyDecision decision = policy_.Decide(threats, pii);
    ExecutionContext context{scan_id, actor.actor_id, bytes, result.file, threats, pii};
    ExecutionOutcome outcome = executor_.Execute(context, decision.actions);

    result.file = outcome.file;
    result.responses = std::move(outcome.responses);
    result.fired_rules = std::move(decision.fired_rules);
    result.blocked = result.file.blocked;
    result.success = !result.blocked;
    result.recommendation = result.blocked ? Recommendation::BLOCK : threats.recommendation;
    result.threat_result = std::move(threats);
    result.pii_result = std::move(pii);
    result.duration_ms = ElapsedMillis(start);
    result.summary = Summarize(result);

    threats_detected_ += result.threat_result.threats.size();
    pii_findings_ += result.pii_result.findings.size();
    if (result.blocked) {
        blocked_++;
    }

    const auto& tr = result.threat_result;
    nlohmann::json scan_details = {
        {"scan_id", scan_id},
        {"file_name", metadata.file_name},
        {"sha256", result.file.sha256},
        {"risk_score", tr.risk_score},
        {"severity", SeverityToString(tr.overall_severity)},
        {"recommendation", RecommendationToString(result.recommendation)},
        {"threat_count", tr.threats.size()},
        {"pii_count", result.pii_result.findings.size()},
        {"classification", ClassificationToString(result.pii_result.classification)},
        {"intel_version", snapshot->version},
        {"actions", JoinActions(result.responses)}
    };
    audit_.LogEvent(AuditEventType::SCAN_COMPLETED, actor.actor_id, metadata.file_id, scan_details);
    audit_.RecordSecurityEvent(metadata.file_id, "scan_completed", scan_details);

    if (!result.pii_result.findings.empty()) {
        std::map<std::string, size_t> counts;
        for (const auto& finding : result.pii_result.findings) {
            counts[PIITypeToString(finding.type)]++;
        }
        audit_.LogEvent(AuditEventType::PII_DETECTED, actor.actor_id, metadata.file_id,
                        {{"scan_id", scan_id},
                         {"counts", counts},
                         {"classification", ClassificationToString(result.pii_result.classification)},
                         {"handling", HandlingToString(result.pii_result.recommended_handling)}});
    }

    LOG_INFO("{}", result.summary);
    return result;
}

UnifiedSecurityResult SecurityOrchestrator::FailureResult(const std::string& scan_id,
                                                          const FileMetadata& metadata,
                                                          const ActorContext& actor,
                                                          const std::string& code,
                                                          const std::string& message,
                                                          bool retryable) {
    failures_++;

    UnifiedSecurityResult result;
    result.scan_id = scan_id;
    result.success = false;
    result.recommendation = Recommendation::MANUAL_REVIEW;
    result.threat_result.file_id = metadata.file_id;
    result.threat_result.file_name = metadata.file_name;
    result.threat_result.recommendation = Recommendation::MANUAL_REVIEW;
    result.threat_result.engine_name = ThreatDetectionEngine::kEngineName;
    result.threat_result.engine_version = ThreatDetectionEngine::kEngineVersion;
    result.pii_result.file_id = metadata.file_id;
    result.pii_result.file_name = metadata.file_name;
    result.file.file_id = metadata.file_id;
    result.file.file_name = metadata.file_name;
    result.file.mime_type = metadata.mime_type;
    result.error = message;
    result.error_code = code;
    result.retryable = retryable;
    result.summary = fmt::format("Scan of '{}' failed ({}): {}. Manual review required.",
                                 metadata.file_name, code, message);

    LOG_ERROR("{}", result.summary);

    // Runs inside ScanAndRespond's handlers, so nothing may escape from here.
    try {
        nlohmann::json details = {
            {"scan_id", scan_id},
            {"file_name", metadata.file_name},
            {"code", code},
            {"message", message},
            {"retryable", retryable}
        };
        audit_.LogEvent(AuditEventType::SCAN_FAILED, actor.actor_id, metadata.file_id, details);
        audit_.RecordSecurityEvent(metadata.file_id, "scan_failed", details);
    } catch (const std::exception& ex) {
        health_.RecordFailure("scan_failed_audit", ex.what());
    }
    return result;
}

std::string SecurityOrchestrator::Summarize(const UnifiedSecurityResult& result) {
    const auto& tr = result.threat_result;
    const auto& pr = result.pii_result;
    return fmt::format("File '{}' {}: {} threats (risk {}, severity {}), {} PII findings ({}); actions: {}",
                       tr.file_name,
                       result.blocked ? "blocked" : "accepted",
                       tr.threats.size(), tr.risk_score, SeverityToString(tr.overall_severity),
                       pr.findings.size(), ClassificationToString(pr.classification),
                       JoinActions(result.responses));
}

bool SecurityOrchestrator::UpdateThreatIntelligence(const ThreatIntelDatabase& database,
                                                    const ActorContext& actor) {
    try {
        intel_.Publish(database);
    } catch (const std::exception& ex) {
        LOG_ERROR("Threat intel update {} rejected: {}", database.version, ex.what());
        return false;
    }

    audit_.LogEvent(AuditEventType::INTEL_UPDATED, actor.actor_id, "threat_intel",
                    {{"version", database.version},
                     {"source", database.source},
                     {"signatures", database.signatures.size()},
                     {"hashes", database.malware_hashes.size()},
                     {"pii_patterns", database.pii_patterns.size()}});
    return true;
}

FileSecurityHistory SecurityOrchestrator::GetFileSecurityHistory(const std::string& file_id) {
    FileSecurityHistory history;
    history.file_id = file_id;
    if (!store_ || file_id.empty()) {
        return history;
    }

    auto query = [&](const char* collection) {
        QueryCriteria criteria;
        criteria.collection = collection;
        criteria.file_id = file_id;
        return store_->Query(criteria);
    };

    try {
        history.responses = query(AuditLogger::kResponseCollection);
        history.security_events = query(AuditLogger::kSecurityEventCollection);
        history.escalations = query(EscalationManager::kCollection);
    } catch (const StorageError& ex) {
        LOG_ERROR("Failed to load security history for {}: {}", file_id, ex.what());
    }
    return history;
}

SecurityStatistics SecurityOrchestrator::GetStatistics() {
    SecurityStatistics stats;
    stats.scans = scans_.load();
    stats.failures = failures_.load();
    stats.blocked_files = blocked_.load();
    stats.threats_detected = threats_detected_.load();
    stats.pii_findings = pii_findings_.load();
    stats.storage_failures = health_.TotalFailures();
    stats.open_escalations = escalations_.GetOpenTicketCount();
    try {
        stats.intel_version = intel_.Snapshot()->version;
    } catch (const std::exception& ex) {
        LOG_WARN("Threat intel unavailable for statistics: {}", ex.what());
        stats.intel_version = "unavailable";
    }
    return stats;
}

} // namespace filesentry
