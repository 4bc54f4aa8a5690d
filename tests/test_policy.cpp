#include <gtest/gtest.h>
#include "response/ResponsePolicyEngine.hpp"

using namespace filesentry;

namespace {

using Kind = ResponseActionKind;

DetectedThreat Threat(ThreatType type, Severity severity) {
    DetectedThreat threat;
    threat.id = ThreatTypeToString(type);
    threat.signature.id = threat.id;
    threat.signature.type = type;
    threat.signature.severity = severity;
    threat.confidence = 80;
    return threat;
}

ThreatDetectionResult Threats(uint32_t score, Severity severity, std::vector<DetectedThreat> threats) {
    ThreatDetectionResult result;
    result.risk_score = score;
    result.overall_severity = severity;
    result.threats = std::move(threats);
    return result;
}

PIIDetectionResult Pii(DataClassification classification, std::vector<Severity> severities) {
    PIIDetectionResult result;
    result.classification = classification;
    for (Severity severity : severities) {
        PIIFinding finding;
        finding.type = PIIType::EMAIL;
        finding.severity = severity;
        result.findings.push_back(finding);
    }
    return result;
}

} // namespace

class ResponsePolicyTest : public ::testing::Test {
protected:
    PolicyDecision Decide(const ThreatDetectionResult& threats, const PIIDetectionResult& pii,
                          bool notifications = true) {
        NotificationConfig config;
        config.enabled = notifications;
        ResponsePolicyEngine engine(PolicyConfig{}, config);
        return engine.Decide(threats, pii);
    }

    ThreatDetectionResult clean_;
    PIIDetectionResult no_pii_;
};

TEST_F(ResponsePolicyTest, CleanScanIsOnlyLogged) {
    auto decision = Decide(clean_, no_pii_);
    EXPECT_EQ(decision.Kinds(), (std::vector<Kind>{Kind::LOG}));
    EXPECT_EQ(decision.fired_rules, (std::vector<std::string>{"always_log"}));
}

TEST_F(ResponsePolicyTest, CriticalAboveThresholdBlocksDeletesEscalates) {
    auto threats = Threats(100, Severity::CRITICAL, {Threat(ThreatType::SPYWARE, Severity::CRITICAL)});
    auto decision = Decide(threats, no_pii_);
    EXPECT_EQ(decision.Kinds(),
              (std::vector<Kind>{Kind::LOG, Kind::BLOCK, Kind::DELETE, Kind::ESCALATE, Kind::NOTIFY}));
}

TEST_F(ResponsePolicyTest, HighAboveThresholdQuarantines) {
    auto threats = Threats(90, Severity::HIGH, {Threat(ThreatType::SUSPICIOUS_SCRIPT, Severity::HIGH)});
    auto decision = Decide(threats, no_pii_, false);
    EXPECT_EQ(decision.Kinds(), (std::vector<Kind>{Kind::LOG, Kind::QUARANTINE, Kind::ESCALATE}));
}

TEST_F(ResponsePolicyTest, OtherSeverityAboveThresholdQuarantinesOnly) {
    auto threats = Threats(86, Severity::MEDIUM, {Threat(ThreatType::PHISHING, Severity::MEDIUM)});
    auto decision = Decide(threats, no_pii_, false);
    EXPECT_EQ(decision.Kinds(), (std::vector<Kind>{Kind::LOG, Kind::QUARANTINE}));
    EXPECT_EQ(decision.fired_rules, (std::vector<std::string>{"always_log", "threshold_other"}));
}

TEST_F(ResponsePolicyTest, MediumBelowThresholdNotifies) {
    auto threats = Threats(70, Severity::MEDIUM, {Threat(ThreatType::PHISHING, Severity::MEDIUM)});
    auto decision = Decide(threats, no_pii_, false);
    EXPECT_EQ(decision.Kinds(), (std::vector<Kind>{Kind::LOG, Kind::NOTIFY}));
}

TEST_F(ResponsePolicyTest, ThresholdIsConfigurable) {
    auto threats = Threats(60, Severity::HIGH, {Threat(ThreatType::SUSPICIOUS_SCRIPT, Severity::HIGH)});
    PolicyConfig policy;
    policy.auto_quarantine_threshold = 60;
    NotificationConfig notifications;
    notifications.enabled = false;
    ResponsePolicyEngine engine(policy, notifications);
    EXPECT_TRUE(engine.Decide(threats, no_pii_).Contains(Kind::QUARANTINE));

    EXPECT_FALSE(Decide(threats, no_pii_, false).Contains(Kind::QUARANTINE));
}

TEST_F(ResponsePolicyTest, DestructiveThreatBlocksBelowThreshold) {
    auto threats = Threats(40, Severity::MEDIUM, {Threat(ThreatType::BACKDOOR, Severity::MEDIUM)});
    auto decision = Decide(threats, no_pii_, false);
    EXPECT_EQ(decision.Kinds(), (std::vector<Kind>{Kind::LOG, Kind::NOTIFY, Kind::BLOCK, Kind::ESCALATE}));
}

TEST_F(ResponsePolicyTest, DuplicateActionsKeepFirstPosition) {
    auto threats = Threats(100, Severity::CRITICAL, {Threat(ThreatType::RANSOMWARE, Severity::CRITICAL)});
    auto decision = Decide(threats, no_pii_, false);
    EXPECT_EQ(decision.Kinds(), (std::vector<Kind>{Kind::LOG, Kind::BLOCK, Kind::DELETE, Kind::ESCALATE}));
    EXPECT_EQ(RuleOf(decision.actions[1]), "threshold_critical");
    EXPECT_EQ(decision.fired_rules,
              (std::vector<std::string>{"always_log", "threshold_critical", "destructive_threat"}));
}

TEST_F(ResponsePolicyTest, RestrictedPiiBlocksAndSanitizes) {
    auto pii = Pii(DataClassification::RESTRICTED, {Severity::CRITICAL});
    auto decision = Decide(clean_, pii);
    EXPECT_EQ(decision.Kinds(), (std::vector<Kind>{Kind::LOG, Kind::BLOCK, Kind::SANITIZE, Kind::ESCALATE}));
    EXPECT_EQ(decision.fired_rules, (std::vector<std::string>{"always_log", "pii_restricted"}));
}

TEST_F(ResponsePolicyTest, CriticalFindingTriggersRestrictedRuleEvenIfLowerClassification) {
    auto pii = Pii(DataClassification::INTERNAL, {Severity::CRITICAL});
    EXPECT_TRUE(Decide(clean_, pii).Contains(Kind::BLOCK));
}

TEST_F(ResponsePolicyTest, ConfidentialPiiSanitizesAndNotifies) {
    auto pii = Pii(DataClassification::CONFIDENTIAL, {Severity::HIGH});
    auto decision = Decide(clean_, pii);
    EXPECT_EQ(decision.Kinds(), (std::vector<Kind>{Kind::LOG, Kind::SANITIZE, Kind::NOTIFY}));
}

TEST_F(ResponsePolicyTest, AnyPiiNotifies) {
    auto pii = Pii(DataClassification::INTERNAL, {Severity::MEDIUM});
    auto decision = Decide(clean_, pii);
    EXPECT_EQ(decision.Kinds(), (std::vector<Kind>{Kind::LOG, Kind::NOTIFY}));
    EXPECT_EQ(decision.fired_rules, (std::vector<std::string>{"always_log", "pii_present"}));
}

TEST_F(ResponsePolicyTest, GlobalNotifyRequiresThreatsAndEnabledNotifications) {
    auto threats = Threats(20, Severity::LOW, {Threat(ThreatType::SUSPICIOUS_PATTERN, Severity::LOW)});
    EXPECT_EQ(Decide(threats, no_pii_, true).Kinds(), (std::vector<Kind>{Kind::LOG, Kind::NOTIFY}));
    EXPECT_EQ(Decide(threats, no_pii_, false).Kinds(), (std::vector<Kind>{Kind::LOG}));
}

TEST_F(ResponsePolicyTest, RuleTableOrderIsStable) {
    auto rules = ResponsePolicyEngine::DefaultRules();
    ASSERT_EQ(rules.size(), 10u);
    EXPECT_EQ(rules.front().id, "always_log");
    EXPECT_EQ(rules.back().id, "global_notify");
}
