#include <gtest/gtest.h>
#include "engine/RiskScorer.hpp"

using namespace filesentry;

namespace {

DetectedThreat MakeThreat(const std::string& id, Severity severity, uint32_t confidence) {
    DetectedThreat threat;
    threat.id = id;
    threat.signature.id = id;
    threat.signature.severity = severity;
    threat.confidence = confidence;
    return threat;
}

} // namespace

class RiskScorerTest : public ::testing::Test {
protected:
    RiskScorer scorer;
};

TEST_F(RiskScorerTest, NoThreatsScoresZero) {
    auto assessment = scorer.Assess({});
    EXPECT_EQ(assessment.score, 0u);
    EXPECT_EQ(assessment.severity, Severity::INFO);
    EXPECT_EQ(assessment.recommendation, Recommendation::ALLOW);
}

TEST_F(RiskScorerTest, ScoreIsWeightedConfidence) {
    // 20 * 1.0 (medium)
    EXPECT_EQ(scorer.Score({MakeThreat("a", Severity::MEDIUM, 20)}), 20u);
    // 30 * 0.8 (low) = 24
    EXPECT_EQ(scorer.Score({MakeThreat("a", Severity::LOW, 30)}), 24u);
    // 15 * 0.5 + 15 * 0.5 = 15
    EXPECT_EQ(scorer.Score({MakeThreat("a", Severity::INFO, 15), MakeThreat("b", Severity::INFO, 15)}), 15u);
}

TEST_F(RiskScorerTest, ScoreIsFlooredAndCapped) {
    // 33 * 1.2 = 39.6
    EXPECT_EQ(scorer.Score({MakeThreat("a", Severity::HIGH, 33)}), 39u);
    EXPECT_EQ(scorer.Score({MakeThreat("a", Severity::CRITICAL, 100),
                            MakeThreat("b", Severity::CRITICAL, 100)}), 100u);
}

TEST_F(RiskScorerTest, AddingThreatNeverLowersScore) {
    std::vector<DetectedThreat> threats{MakeThreat("a", Severity::LOW, 10)};
    uint32_t previous = scorer.Score(threats);
    const Severity tiers[] = {Severity::LOW, Severity::MEDIUM, Severity::HIGH, Severity::CRITICAL};
    for (auto severity : tiers) {
        threats.push_back(MakeThreat("t" + std::to_string(threats.size()), severity, 5));
        uint32_t current = scorer.Score(threats);
        EXPECT_GE(current, previous);
        previous = current;
    }
}

TEST_F(RiskScorerTest, CriticalThreatForcesCriticalSeverity) {
    auto assessment = scorer.Assess({MakeThreat("a", Severity::CRITICAL, 10)});
    EXPECT_EQ(assessment.score, 15u);
    EXPECT_EQ(assessment.severity, Severity::CRITICAL);
    EXPECT_EQ(assessment.recommendation, Recommendation::BLOCK);
}

TEST_F(RiskScorerTest, HighScoreForcesCriticalSeverity) {
    auto assessment = scorer.Assess({MakeThreat("a", Severity::MEDIUM, 60), MakeThreat("b", Severity::MEDIUM, 35)});
    EXPECT_EQ(assessment.score, 95u);
    EXPECT_EQ(assessment.severity, Severity::CRITICAL);
    EXPECT_EQ(assessment.recommendation, Recommendation::BLOCK);
}

TEST_F(RiskScorerTest, OverallSeverityIsMaximumBelowOverride) {
    auto assessment = scorer.Assess({MakeThreat("a", Severity::LOW, 10), MakeThreat("b", Severity::HIGH, 20)});
    EXPECT_EQ(assessment.severity, Severity::HIGH);
    EXPECT_EQ(assessment.recommendation, Recommendation::QUARANTINE);
}

TEST_F(RiskScorerTest, RecommendationStepFunction) {
    EXPECT_EQ(scorer.Recommend(0, Severity::INFO), Recommendation::ALLOW);
    EXPECT_EQ(scorer.Recommend(9, Severity::LOW), Recommendation::ALLOW);
    EXPECT_EQ(scorer.Recommend(10, Severity::LOW), Recommendation::WARN);
    EXPECT_EQ(scorer.Recommend(39, Severity::MEDIUM), Recommendation::WARN);
    EXPECT_EQ(scorer.Recommend(40, Severity::MEDIUM), Recommendation::MANUAL_REVIEW);
    EXPECT_EQ(scorer.Recommend(70, Severity::MEDIUM), Recommendation::QUARANTINE);
    EXPECT_EQ(scorer.Recommend(5, Severity::HIGH), Recommendation::QUARANTINE);
    EXPECT_EQ(scorer.Recommend(90, Severity::MEDIUM), Recommendation::BLOCK);
    EXPECT_EQ(scorer.Recommend(0, Severity::CRITICAL), Recommendation::BLOCK);
}

TEST_F(RiskScorerTest, ContributingFactorsGroupBySignature) {
    auto assessment = scorer.Assess({MakeThreat("sig", Severity::MEDIUM, 10),
                                     MakeThreat("sig", Severity::MEDIUM, 10),
                                     MakeThreat("other", Severity::INFO, 10)});
    ASSERT_EQ(assessment.contributing_factors.size(), 2u);
    EXPECT_DOUBLE_EQ(assessment.contributing_factors["sig"], 20.0);
    EXPECT_DOUBLE_EQ(assessment.contributing_factors["other"], 5.0);
}

TEST(RiskScorerTablesTest, InjectedTablesChangeOutcome) {
    SeverityWeights weights;
    weights.medium = 2.0;
    weights.high = 3.0;
    weights.critical = 4.0;
    RecommendationThresholds thresholds;
    thresholds.block = 50;
    thresholds.quarantine = 30;
    thresholds.review = 20;
    thresholds.warn = 5;
    RiskScorer scorer(weights, thresholds);

    auto assessment = scorer.Assess({MakeThreat("a", Severity::MEDIUM, 30)});
    EXPECT_EQ(assessment.score, 60u);
    EXPECT_EQ(assessment.severity, Severity::CRITICAL);
    EXPECT_EQ(assessment.recommendation, Recommendation::BLOCK);
}
