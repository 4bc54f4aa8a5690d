#include "engine/RiskScorer.hpp"
#include <algorithm>
#include <cmath>

namespace filesentry {

RiskScorer::RiskScorer(SeverityWeights weights, RecommendationThresholds thresholds)
    : weights_(weights), thresholds_(thresholds) {}

uint32_t RiskScorer::Score(const std::vector<DetectedThreat>& threats) const {
    double total = 0.0;
    for (const auto& threat : threats) {
        total += static_cast<double>(threat.confidence) * weights_.For(threat.signature.severity);
        if (total >= kMaxScore) {
            return kMaxScore;
        }
    }
    return static_cast<uint32_t>(std::floor(total));
}

Severity RiskScorer::OverallSeverity(const std::vector<DetectedThreat>& threats, uint32_t score) const {
    if (threats.empty()) {
        return Severity::INFO;
    }

    Severity highest = Severity::INFO;
    for (const auto& threat : threats) {
        highest = std::max(highest, threat.signature.severity);
    }

    if (highest == Severity::CRITICAL || score >= thresholds_.block) {
        return Severity::CRITICAL;
    }
    return highest;
}

Recommendation RiskScorer::Recommend(uint32_t score, Severity severity) const {
    if (severity == Severity::CRITICAL || score >= thresholds_.block) {
        return Recommendation::BLOCK;
    }
    if (severity == Severity::HIGH || score >= thresholds_.quarantine) {
        return Recommendation::QUARANTINE;
    }
    if (score >= thresholds_.review) {
        return Recommendation::MANUAL_REVIEW;
    }
    if (score >= thresholds_.warn) {
        return Recommendation::WARN;
    }
    return Recommendation::ALLOW;
}

RiskAssessment RiskScorer::Assess(const std::vector<DetectedThreat>& threats) const {
    RiskAssessment assessment;
    for (const auto& threat : threats) {
        assessment.contributing_factors[threat.signature.id] +=
            static_cast<double>(threat.confidence) * weights_.For(threat.signature.severity);
    }
    assessment.score = Score(threats);
    assessment.severity = OverallSeverity(threats, assessment.score);
    assessment.recommendation = Recommend(assessment.score, assessment.severity);
    return assessment;
}

} // namespace filesentry
