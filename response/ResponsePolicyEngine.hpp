#pragma once

#include "config/SecurityConfig.hpp"
#include "engine/ThreatTypes.hpp"
#include "privacy/PIITypes.hpp"
#include "response/ResponseTypes.hpp"
#include <functional>
#include <string>
#include <vector>

namespace filesentry {

struct PolicyInput {
    const ThreatDetectionResult& threats;
    const PIIDetectionResult& pii;
    uint32_t auto_quarantine_threshold;
    bool notifications_enabled;
};

// One row of the decision table. Rows sharing a non-empty exclusive group
// are alternatives: only the first matching row of a group fires.
struct PolicyRule {
    std::string id;
    std::string description;
    std::string exclusive_group;
    std::function<bool(const PolicyInput&)> matches;
    std::vector<ResponseActionKind> actions;
};

struct PolicyDecision {
    std::vector<ResponseAction> actions;
    std::vector<std::string> fired_rules;

    bool Contains(ResponseActionKind kind) const;
    std::vector<ResponseActionKind> Kinds() const;
};

// Maps detection results to an ordered action list by walking a fixed rule
// table. An action requested by several rules appears once, at the position
// of the first rule that asked for it.
class ResponsePolicyEngine {
public:
    ResponsePolicyEngine(PolicyConfig policy, NotificationConfig notifications);

    PolicyDecision Decide(const ThreatDetectionResult& threats,
                          const PIIDetectionResult& pii) const;

    const std::vector<PolicyRule>& Rules() const { return rules_; }

    static std::vector<PolicyRule> DefaultRules();

private:
    PolicyConfig policy_;
    NotificationConfig notifications_;
    std::vector<PolicyRule> rules_;
};

} // namespace filesentry
