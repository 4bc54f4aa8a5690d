#pragma once

#include "engine/ThreatTypes.hpp"
#include <nlohmann/json_fwd.hpp>
#include <cstdint>
#include <optional>
#include <string>
#include <variant>
#include <vector>

namespace filesentry {

enum class ResponseActionKind {
    LOG,
    NOTIFY,
    SANITIZE,
    QUARANTINE,
    DELETE,
    BLOCK,
    ESCALATE
};

inline std::string ResponseActionKindToString(ResponseActionKind kind) {
    switch (kind) {
        case ResponseActionKind::LOG:        return "log";
        case ResponseActionKind::NOTIFY:     return "notify";
        case ResponseActionKind::SANITIZE:   return "sanitize";
        case ResponseActionKind::QUARANTINE: return "quarantine";
        case ResponseActionKind::DELETE:     return "delete";
        case ResponseActionKind::BLOCK:      return "block";
        case ResponseActionKind::ESCALATE:   return "escalate";
        default:                             return "unknown";
    }
}

// One struct per action kind. `rule` names the policy rule that first
// requested the action.
struct LogAction        { std::string rule; };
struct NotifyAction     { std::string rule; };
struct SanitizeAction   { std::string rule; };
struct QuarantineAction { std::string rule; };
struct DeleteAction     { std::string rule; };
struct BlockAction      { std::string rule; };
struct EscalateAction   { std::string rule; };

using ResponseAction = std::variant<LogAction, NotifyAction, SanitizeAction, QuarantineAction,
                                    DeleteAction, BlockAction, EscalateAction>;

ResponseActionKind KindOf(const ResponseAction& action);
const std::string& RuleOf(const ResponseAction& action);
ResponseAction MakeAction(ResponseActionKind kind, const std::string& rule);

struct FileDescriptor {
    std::string file_id;
    std::string file_name;
    std::string mime_type;
    uint64_t size{0};
    std::string sha256;
    std::string storage_key;  // empty for the caller-held original
    bool removed{false};
    bool blocked{false};
};

struct QuarantineRecord {
    std::string location;
    uint64_t quarantined_at{0};
    uint64_t expires_at{0};
    std::string access_level;
    bool review_required{true};
    uint64_t review_deadline{0};
    std::string reason;
};

struct NotificationRecord {
    std::string channel;
    std::string recipient;
    std::string method;
    bool delivered{false};
    std::string status;
    uint64_t timestamp{0};
};

struct ThreatResponseDetails {
    FileDescriptor original;
    std::optional<FileDescriptor> processed;
    std::vector<NotificationRecord> notifications;
    std::optional<QuarantineRecord> quarantine;
    std::string escalation_id;
    size_t replaced_spans{0};
};

// Append-only audit fact for one executed action.
struct ThreatResponse {
    std::string id;
    std::string scan_id;  // correlates the originating threat and PII results
    ResponseActionKind action{ResponseActionKind::LOG};
    uint64_t timestamp{0};
    bool automated{true};
    std::string actor;
    std::string reason;
    bool success{false};
    std::string error;
    ThreatResponseDetails details;
};

void to_json(nlohmann::json& j, const FileDescriptor& descriptor);
void to_json(nlohmann::json& j, const QuarantineRecord& record);
void to_json(nlohmann::json& j, const NotificationRecord& record);
void to_json(nlohmann::json& j, const ThreatResponseDetails& details);
void to_json(nlohmann::json& j, const ThreatResponse& response);

} // namespace filesentry
