#pragma once

#include "config/SecurityConfig.hpp"
#include "core/ThreadPool.hpp"
#include "engine/RiskScorer.hpp"
#include "engine/ScanContent.hpp"
#include "engine/ScanError.hpp"
#include "engine/ThreatAnalyzer.hpp"
#include "intel/ThreatIntel.hpp"
#include <chrono>
#include <memory>
#include <string>
#include <vector>

namespace filesentry {

using ScanDeadline = std::chrono::steady_clock::time_point;

// Runs the hash, signature, behavior, extension and structure analyzers on
// one file and scores the merged findings. Holds no per-scan state.
class ThreatDetectionEngine {
public:
    static constexpr const char* kEngineName = "FileSentry Threat Detection Engine";
    static constexpr const char* kEngineVersion = "1.0.0";

    // `pool` may be null, in which case analyzers run on the calling thread.
    ThreatDetectionEngine(DetectionConfig detection,
                          LimitsConfig limits,
                          SeverityWeights weights,
                          RecommendationThresholds thresholds,
                          ThreadPool* pool);

    // Throws ScanError CONFIGURATION_DISABLED or SIZE_EXCEEDED.
    void CheckPreconditions(uint64_t size) const;

    ThreatDetectionResult Scan(const std::vector<uint8_t>& bytes,
                               const FileMetadata& metadata,
                               std::shared_ptr<const ThreatIntelSnapshot> intel) const;

    // Runs against already-sampled content. Throws ScanError TIMEOUT when the
    // deadline passes before every analyzer has finished; `token` is then
    // cancelled so analyzers still running stop early.
    ThreatDetectionResult Scan(std::shared_ptr<const ScanContent> content,
                               std::shared_ptr<const ThreatIntelSnapshot> intel,
                               const CancellationToken& token,
                               ScanDeadline deadline) const;

    // Extra analyzers run after the built-in ones.
    void AddAnalyzer(std::shared_ptr<const ThreatAnalyzer> analyzer);

    const RiskScorer& Scorer() const { return scorer_; }

private:
    std::vector<std::shared_ptr<const ThreatAnalyzer>> AnalyzersFor(
        const std::shared_ptr<const ThreatIntelSnapshot>& intel) const;

    DetectionConfig detection_;
    LimitsConfig limits_;
    RiskScorer scorer_;
    ThreadPool* pool_{nullptr};

    std::shared_ptr<const ThreatAnalyzer> behavior_;
    std::shared_ptr<const ThreatAnalyzer> extension_;
    std::shared_ptr<const ThreatAnalyzer> structure_;
    std::vector<std::shared_ptr<const ThreatAnalyzer>> extra_;
};

} // namespace filesentry
