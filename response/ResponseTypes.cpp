#include "response/ResponseTypes.hpp"
#include "core/Util.hpp"
#include <nlohmann/json.hpp>
#include <type_traits>

namespace filesentry {

namespace {

template<typename T>
constexpr ResponseActionKind KindFor() {
    if constexpr (std::is_same_v<T, LogAction>) {
        return ResponseActionKind::LOG;
    } else if constexpr (std::is_same_v<T, NotifyAction>) {
        return ResponseActionKind::NOTIFY;
    } else if constexpr (std::is_same_v<T, SanitizeAction>) {
        return ResponseActionKind::SANITIZE;
    } else if constexpr (std::is_same_v<T, QuarantineAction>) {
        return ResponseActionKind::QUARANTINE;
    } else if constexpr (std::is_same_v<T, DeleteAction>) {
        return ResponseActionKind::DELETE;
    } else if constexpr (std::is_same_v<T, BlockAction>) {
        return ResponseActionKind::BLOCK;
    } else {
        static_assert(std::is_same_v<T, EscalateAction>, "unhandled response action");
        return ResponseActionKind::ESCALATE;
    }
}

} // namespace

ResponseActionKind KindOf(const ResponseAction& action) {
    return std::visit([](const auto& a) {
        return KindFor<std::decay_t<decltype(a)>>();
    }, action);
}

const std::string& RuleOf(const ResponseAction& action) {
    return std::visit([](const auto& a) -> const std::string& { return a.rule; }, action);
}

ResponseAction MakeAction(ResponseActionKind kind, const std::string& rule) {
    switch (kind) {
        case ResponseActionKind::LOG:        return LogAction{rule};
        case ResponseActionKind::NOTIFY:     return NotifyAction{rule};
        case ResponseActionKind::SANITIZE:   return SanitizeAction{rule};
        case ResponseActionKind::QUARANTINE: return QuarantineAction{rule};
        case ResponseActionKind::DELETE:     return DeleteAction{rule};
        case ResponseActionKind::BLOCK:      return BlockAction{rule};
        case ResponseActionKind::ESCALATE:   return EscalateAction{rule};
    }
    return LogAction{rule};
}

void to_json(nlohmann::json& j, const FileDescriptor& descriptor) {
    j = nlohmann::json{
        {"file_id", descriptor.file_id},
        {"file_name", descriptor.file_name},
        {"mime_type", descriptor.mime_type},
        {"size", descriptor.size},
        {"sha256", descriptor.sha256},
        {"storage_key", descriptor.storage_key},
        {"removed", descriptor.removed},
        {"blocked", descriptor.blocked}
    };
}

void to_json(nlohmann::json& j, const QuarantineRecord& record) {
    j = nlohmann::json{
        {"location", record.location},
        {"quarantined_at", TimestampToISO8601(record.quarantined_at)},
        {"expires_at", TimestampToISO8601(record.expires_at)},
        {"access_level", record.access_level},
        {"review_required", record.review_required},
        {"review_deadline", TimestampToISO8601(record.review_deadline)},
        {"reason", record.reason}
    };
}

void to_json(nlohmann::json& j, const NotificationRecord& record) {
    j = nlohmann::json{
        {"channel", record.channel},
        {"recipient", record.recipient},
        {"method", record.method},
        {"delivered", record.delivered},
        {"status", record.status},
        {"timestamp", TimestampToISO8601(record.timestamp)}
    };
}

void to_json(nlohmann::json& j, const ThreatResponseDetails& details) {
    j = nlohmann::json{
        {"original", details.original},
        {"notifications", details.notifications}
    };
    if (details.processed) {
        j["processed"] = *details.processed;
    }
    if (details.quarantine) {
        j["quarantine"] = *details.quarantine;
    }
    if (!details.escalation_id.empty()) {
        j["escalation_id"] = details.escalation_id;
    }
    if (details.replaced_spans > 0) {
        j["replaced_spans"] = details.replaced_spans;
    }
}

void to_json(nlohmann::json& j, const ThreatResponse& response) {
    j = nlohmann::json{
        {"id", response.id},
        {"scan_id", response.scan_id},
        {"action", ResponseActionKindToString(response.action)},
        {"timestamp", TimestampToISO8601(response.timestamp)},
        {"automated", response.automated},
        {"actor", response.actor},
        {"reason", response.reason},
        {"success", response.success},
        {"details", response.details}
    };
    if (!response.error.empty()) {
        j["error"] = response.error;
    }
}

} // namespace filesentry
