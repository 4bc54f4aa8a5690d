#include "response/ResponsePolicyEngine.hpp"
#include <algorithm>
#include <set>

namespace filesentry {

namespace {

using Kind = ResponseActionKind;

bool AboveThreshold(const PolicyInput& in) {
    return in.threats.risk_score >= in.auto_quarantine_threshold;
}

bool HasDestructiveThreat(const PolicyInput& in) {
    return std::any_of(in.threats.threats.begin(), in.threats.threats.end(),
        [](const DetectedThreat& t) {
            return t.signature.type == ThreatType::RANSOMWARE ||
                   t.signature.type == ThreatType::MALWARE ||
                   t.signature.type == ThreatType::BACKDOOR;
        });
}

bool HasCriticalPII(const PolicyInput& in) {
    return std::any_of(in.pii.findings.begin(), in.pii.findings.end(),
        [](const PIIFinding& f) { return f.severity == Severity::CRITICAL; });
}

} // namespace

bool PolicyDecision::Contains(ResponseActionKind kind) const {
    return std::any_of(actions.begin(), actions.end(),
        [kind](const ResponseAction& action) { return KindOf(action) == kind; });
}

std::vector<ResponseActionKind> PolicyDecision::Kinds() const {
    std::vector<ResponseActionKind> kinds;
    kinds.reserve(actions.size());
    for (const auto& action : actions) {
        kinds.push_back(KindOf(action));
    }
    return kinds;
}

std::vector<PolicyRule> ResponsePolicyEngine::DefaultRules() {
    return {
        {"always_log", "Every scan is logged", "",
         [](const PolicyInput&) { return true; },
         {Kind::LOG}},

        {"threshold_critical", "Risk at or above auto-quarantine threshold with critical severity", "threshold",
         [](const PolicyInput& in) {
             return AboveThreshold(in) && in.threats.overall_severity == Severity::CRITICAL;
         },
         {Kind::BLOCK, Kind::DELETE, Kind::ESCALATE}},

        {"threshold_high", "Risk at or above auto-quarantine threshold with high severity", "threshold",
         [](const PolicyInput& in) {
             return AboveThreshold(in) && in.threats.overall_severity == Severity::HIGH;
         },
         {Kind::QUARANTINE, Kind::ESCALATE}},

        {"threshold_other", "Risk at or above auto-quarantine threshold", "threshold",
         [](const PolicyInput& in) { return AboveThreshold(in); },
         {Kind::QUARANTINE}},

        {"medium_severity", "Medium severity below the auto-quarantine threshold", "threshold",
         [](const PolicyInput& in) { return in.threats.overall_severity == Severity::MEDIUM; },
         {Kind::NOTIFY}},

        {"destructive_threat", "Ransomware, malware or backdoor detected", "",
         HasDestructiveThreat,
         {Kind::BLOCK, Kind::ESCALATE}},

        {"pii_restricted", "Restricted PII or any critical PII finding", "pii",
         [](const PolicyInput& in) {
             return in.pii.classification == DataClassification::RESTRICTED || HasCriticalPII(in);
         },
         {Kind::BLOCK, Kind::SANITIZE, Kind::ESCALATE}},

        {"pii_confidential", "Confidential PII", "pii",
         [](const PolicyInput& in) { return in.pii.classification == DataClassification::CONFIDENTIAL; },
         {Kind::SANITIZE, Kind::NOTIFY}},

        {"pii_present", "Any PII finding", "pii",
         [](const PolicyInput& in) { return !in.pii.findings.empty(); },
         {Kind::NOTIFY}},

        {"global_notify", "Notifications enabled and threats were detected", "",
         [](const PolicyInput& in) { return in.notifications_enabled && !in.threats.threats.empty(); },
         {Kind::NOTIFY}},
    };
}

ResponsePolicyEngine::ResponsePolicyEngine(PolicyConfig policy, NotificationConfig notifications)
    : policy_(policy), notifications_(std::move(notifications)), rules_(DefaultRules()) {}

PolicyDecision ResponsePolicyEngine::Decide(const ThreatDetectionResult& threats,
                                            const PIIDetectionResult& pii) const {
    PolicyInput input{threats, pii, policy_.auto_quarantine_threshold, notifications_.enabled};

    PolicyDecision decision;
    std::set<std::string> fired_groups;
    for (const auto& rule : rules_) {
        if (!rule.exclusive_group.empty() && fired_groups.count(rule.exclusive_group)) {
            continue;
        }
        if (!rule.matches(input)) {
            continue;
        }
        if (!rule.exclusive_group.empty()) {
            fired_groups.insert(rule.exclusive_group);
        }
        decision.fired_rules.push_back(rule.id);

        for (auto kind : rule.actions) {
            if (!decision.Contains(kind)) {
                decision.actions.push_back(MakeAction(kind, rule.id));
            }
        }
    }
    return decision;
}

} // namespace filesentry
