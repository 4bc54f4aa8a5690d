#pragma once

#include "config/PolicyTables.hpp"
#include "engine/ThreatTypes.hpp"
#include <map>
#include <string>
#include <vector>

namespace filesentry {

struct RiskAssessment {
    uint32_t score{0};
    Severity severity{Severity::INFO};
    Recommendation recommendation{Recommendation::ALLOW};
    // signature id -> weighted points contributed before capping
    std::map<std::string, double> contributing_factors;
};

// Pure scoring over a set of detected threats. No I/O, no shared state.
class RiskScorer {
public:
    static constexpr uint32_t kMaxScore = 100;

    explicit RiskScorer(SeverityWeights weights = {}, RecommendationThresholds thresholds = {});

    RiskAssessment Assess(const std::vector<DetectedThreat>& threats) const;

    uint32_t Score(const std::vector<DetectedThreat>& threats) const;
    Severity OverallSeverity(const std::vector<DetectedThreat>& threats, uint32_t score) const;
    Recommendation Recommend(uint32_t score, Severity severity) const;

    const SeverityWeights& Weights() const { return weights_; }
    const RecommendationThresholds& Thresholds() const { return thresholds_; }

private:
    SeverityWeights weights_;
    RecommendationThresholds thresholds_;
};

} // namespace filesentry
