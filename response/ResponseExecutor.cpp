#include "response/ResponseExecutor.hpp"
#include "core/Logger.hpp"
#include "core/Util.hpp"
#include "engine/HashMatcher.hpp"
#include <nlohmann/json.hpp>
#include <algorithm>
#include <cctype>
#include <stdexcept>

namespace filesentry {

namespace {

struct Span {
    size_t offset;
    size_t length;
    const std::string* token;
};

std::string Reason(const ExecutionContext& context, const std::string& rule) {
    return "policy rule " + rule + " (risk=" + std::to_string(context.threats.risk_score) +
           ", severity=" + SeverityToString(context.threats.overall_severity) +
           ", classification=" + ClassificationToString(context.pii.classification) + ")";
}

} // namespace

// No generic overload: adding an action kind without a handler fails to compile.
struct ResponseExecutor::ActionVisitor {
    ResponseExecutor& executor;
    const ExecutionContext& context;
    FileDescriptor& file;
    ThreatResponse& response;

    void operator()(const LogAction&)        { executor.DoLog(context, response); }
    void operator()(const NotifyAction&)     { executor.DoNotify(context, response); }
    void operator()(const SanitizeAction&)   { executor.DoSanitize(context, response); }
    void operator()(const QuarantineAction&) { executor.DoQuarantine(context, response); }
    void operator()(const DeleteAction&)     { executor.DoDelete(file, response); }
    void operator()(const BlockAction&)      { executor.DoBlock(file, response); }
    void operator()(const EscalateAction&)   { executor.DoEscalate(context, response); }
};

ResponseExecutor::ResponseExecutor(BlobStore* blobs,
                                   NotificationChannel* notifier,
                                   EscalationManager* escalations,
                                   AuditLogger* audit,
                                   StorageHealth* health,
                                   NotificationConfig notifications,
                                   QuarantineConfig quarantine,
                                   MaskTokens masks)
    : blobs_(blobs), notifier_(notifier), escalations_(escalations), audit_(audit),
      health_(health), notifications_(std::move(notifications)),
      quarantine_(std::move(quarantine)), masks_(std::move(masks)) {}

ExecutionOutcome ResponseExecutor::Execute(const ExecutionContext& context,
                                           const std::vector<ResponseAction>& actions) {
    ExecutionOutcome outcome;
    outcome.file = context.file;

    for (const auto& action : actions) {
        ThreatResponse response;
        response.id = GenerateUUID();
        response.scan_id = context.scan_id;
        response.action = KindOf(action);
        response.timestamp = NowMillis();
        response.automated = true;
        response.actor = context.actor.empty() ? "system" : context.actor;
        response.reason = Reason(context, RuleOf(action));
        response.success = true;

        try {
            std::visit(ActionVisitor{*this, context, outcome.file, response}, action);
        } catch (const std::exception& ex) {
            response.success = false;
            response.error = ex.what();
            LOG_ERROR("Response action {} failed for file {}: {}",
                      ResponseActionKindToString(response.action), context.file.file_id, ex.what());
        }

        // Descriptor state after this action, so later records see earlier effects.
        response.details.original = outcome.file;

        if (audit_) {
            audit_->RecordResponse(response);
            audit_->LogEvent(AuditEventType::RESPONSE_EXECUTED, response.actor, context.file.file_id,
                             {{"scan_id", context.scan_id},
                              {"response_id", response.id},
                              {"action", ResponseActionKindToString(response.action)},
                              {"success", response.success},
                              {"error", response.error}});
        }
        outcome.responses.push_back(std::move(response));
    }
    return outcome;
}

void ResponseExecutor::DoLog(const ExecutionContext& context, ThreatResponse&) {
    LOG_INFO("Scan {} file={} risk={} severity={} threats={} pii={} classification={}",
             context.scan_id, context.file.file_id, context.threats.risk_score,
             SeverityToString(context.threats.overall_severity),
             context.threats.threats.size(), context.pii.findings.size(),
             ClassificationToString(context.pii.classification));
}

std::string ResponseExecutor::NotificationMessage(const ExecutionContext& context) {
    return "FileSentry alert: file '" + context.file.file_name + "' (" + context.file.file_id +
           ") risk=" + std::to_string(context.threats.risk_score) +
           " severity=" + SeverityToString(context.threats.overall_severity) +
           " recommendation=" + RecommendationToString(context.threats.recommendation) +
           " threats=" + std::to_string(context.threats.threats.size()) +
           " pii_findings=" + std::to_string(context.pii.findings.size()) +
           " classification=" + ClassificationToString(context.pii.classification);
}

void ResponseExecutor::DoNotify(const ExecutionContext& context, ThreatResponse& response) {
    if (!notifier_) {
        throw std::runtime_error("no notification channel configured");
    }

    struct Target { std::string channel; std::string recipient; };
    std::vector<Target> targets;
    if (notifications_.email_enabled) {
        for (const auto& recipient : notifications_.email_recipients) {
            targets.push_back({"email", recipient});
        }
    }
    if (notifications_.webhook_enabled && !notifications_.webhook_url.empty()) {
        targets.push_back({"webhook", notifications_.webhook_url});
    }
    if (targets.empty()) {
        // No external channel enabled: the alert goes to the operator log.
        targets.push_back({"log", quarantine_.access_level});
    }

    std::string message = NotificationMessage(context);
    size_t failed = 0;
    for (const auto& target : targets) {
        NotificationRecord record;
        record.channel = target.channel;
        record.recipient = target.recipient;
        record.method = target.channel;
        record.timestamp = NowMillis();
        try {
            DeliveryStatus status = notifier_->Send(target.recipient, target.channel, message);
            record.delivered = status.delivered;
            record.status = status.status;
        } catch (const std::exception& ex) {
            record.delivered = false;
            record.status = ex.what();
        }
        if (!record.delivered) {
            ++failed;
            LOG_WARN("Notification via {} to {} failed: {}", record.channel, record.recipient, record.status);
        }
        response.details.notifications.push_back(std::move(record));
    }

    if (failed > 0) {
        response.success = false;
        response.error = std::to_string(failed) + " of " + std::to_string(targets.size()) +
                         " notifications failed";
    }
}

std::string ResponseExecutor::SafeKeyName(const std::string& file_name) {
    std::string name;
    name.reserve(file_name.size());
    for (unsigned char c : file_name) {
        name.push_back((std::isalnum(c) || c == '.' || c == '-' || c == '_') ? static_cast<char>(c) : '_');
    }
    while (!name.empty() && name.front() == '.') {
        name.erase(name.begin());
    }
    return name.empty() ? "file" : name;
}

size_t ResponseExecutor::BuildSanitizedCopy(const std::vector<uint8_t>& original,
                                            const ThreatDetectionResult& threats,
                                            const PIIDetectionResult& pii,
                                            std::vector<uint8_t>& out) const {
    std::vector<Span> spans;
    for (const auto& threat : threats.threats) {
        if (threat.location.in_content && threat.location.length > 0) {
            spans.push_back({threat.location.offset, threat.location.length, &masks_.threat_placeholder});
        }
    }
    for (const auto& finding : pii.findings) {
        if (finding.location.length > 0) {
            spans.push_back({finding.location.offset, finding.location.length, &masks_.ForPII(finding.type)});
        }
    }

    std::sort(spans.begin(), spans.end(), [](const Span& a, const Span& b) {
        if (a.offset != b.offset) return a.offset > b.offset;
        return a.length > b.length;
    });

    out = original;
    size_t replaced = 0;
    size_t lowest_start = original.size();
    for (const auto& span : spans) {
        if (span.offset >= original.size() || span.length > original.size() - span.offset) {
            continue;
        }
        if (span.offset + span.length > lowest_start) {
            continue;  // overlaps a span already replaced
        }
        out.erase(out.begin() + span.offset, out.begin() + span.offset + span.length);
        out.insert(out.begin() + span.offset, span.token->begin(), span.token->end());
        lowest_start = span.offset;
        ++replaced;
    }
    return replaced;
}

void ResponseExecutor::DoSanitize(const ExecutionContext& context, ThreatResponse& response) {
    if (!blobs_) {
        throw std::runtime_error("no blob store configured");
    }

    std::vector<uint8_t> sanitized;
    size_t replaced = BuildSanitizedCopy(context.bytes, context.threats, context.pii, sanitized);

    FileDescriptor processed;
    processed.file_id = context.file.file_id;
    processed.file_name = context.file.file_name;
    processed.mime_type = context.file.mime_type;
    processed.size = sanitized.size();
    processed.sha256 = HashMatcher::ComputeDigest("sha256", sanitized);
    processed.storage_key = "sanitized/" + GenerateUUID() + "-" + SafeKeyName(context.file.file_name);

    BlobMetadata metadata{
        {"original_file_id", context.file.file_id},
        {"original_sha256", context.file.sha256},
        {"scan_id", context.scan_id},
        {"replaced_spans", std::to_string(replaced)},
        {"sanitized_at", TimestampToISO8601(response.timestamp)}
    };

    try {
        blobs_->Put(processed.storage_key, sanitized, metadata);
    } catch (const StorageError& ex) {
        if (health_) health_->RecordBlobFailure(processed.storage_key, ex.what());
        response.success = false;
        response.error = ex.what();
        return;
    }

    response.details.processed = processed;
    response.details.replaced_spans = replaced;
    LOG_INFO("Sanitized copy of {} stored at {} ({} spans replaced)",
             context.file.file_id, processed.storage_key, replaced);
}

void ResponseExecutor::DoQuarantine(const ExecutionContext& context, ThreatResponse& response) {
    if (!blobs_) {
        throw std::runtime_error("no blob store configured");
    }

    QuarantineRecord record;
    record.location = "quarantine/" + GenerateUUID() + "-" + SafeKeyName(context.file.file_name);
    record.quarantined_at = response.timestamp;
    record.expires_at = record.quarantined_at + quarantine_.retention_days * kMillisPerDay;
    record.access_level = quarantine_.access_level;
    record.review_required = quarantine_.review_required;
    record.review_deadline = record.quarantined_at + quarantine_.review_deadline_days * kMillisPerDay;
    record.reason = response.reason;

    BlobMetadata metadata{
        {"file_id", context.file.file_id},
        {"file_name", context.file.file_name},
        {"sha256", context.file.sha256},
        {"scan_id", context.scan_id},
        {"risk_score", std::to_string(context.threats.risk_score)},
        {"severity", SeverityToString(context.threats.overall_severity)},
        {"scan_timestamp", TimestampToISO8601(context.threats.scan_timestamp)},
        {"reason", record.reason},
        {"expires_at", TimestampToISO8601(record.expires_at)},
        {"review_deadline", TimestampToISO8601(record.review_deadline)},
        {"access_level", record.access_level}
    };

    try {
        blobs_->Put(record.location, context.bytes, metadata);
    } catch (const StorageError& ex) {
        if (health_) health_->RecordBlobFailure(record.location, ex.what());
        response.success = false;
        response.error = ex.what();
        return;
    }

    response.details.quarantine = record;
    LOG_WARN("File {} quarantined at {} (expires {})",
             context.file.file_id, record.location, TimestampToISO8601(record.expires_at));
}

void ResponseExecutor::DoDelete(FileDescriptor& file, ThreatResponse&) {
    file.removed = true;
    LOG_WARN("File {} marked for removal", file.file_id);
}

void ResponseExecutor::DoBlock(FileDescriptor& file, ThreatResponse&) {
    file.blocked = true;
    LOG_WARN("File {} blocked", file.file_id);
}

void ResponseExecutor::DoEscalate(const ExecutionContext& context, ThreatResponse& response) {
    if (!escalations_) {
        throw std::runtime_error("no escalation manager configured");
    }

    EscalationRequest request;
    request.scan_id = context.scan_id;
    request.file_id = context.file.file_id;
    request.file_name = context.file.file_name;
    request.severity = context.threats.overall_severity;
    request.risk_score = context.threats.risk_score;
    request.threat_count = context.threats.threats.size();
    request.pii_count = context.pii.findings.size();
    request.classification = ClassificationToString(context.pii.classification);
    request.actor = response.actor;

    response.details.escalation_id = escalations_->Create(request).id;
}

} // namespace filesentry
