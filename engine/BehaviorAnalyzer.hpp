#pragma once

#include "engine/ThreatAnalyzer.hpp"
#include <regex>

namespace filesentry {

struct BehaviorThresholds {
    double entropy_bits_per_byte{7.5};
    size_t url_count{20};
};

// Fixed-confidence heuristics over the content sample. Each check that
// fires contributes one synthetic whole-file threat.
class BehaviorAnalyzer : public ThreatAnalyzer {
public:
    static constexpr uint32_t kHeuristicConfidence = 75;

    BehaviorAnalyzer(BehaviorThresholds thresholds, size_t sample_bytes);

    std::string Name() const override { return "behavior"; }
    std::vector<DetectedThreat> Analyze(const ScanContent& content,
                                        const CancellationToken& token) const override;

    // Shannon entropy in bits per byte of the first `limit` bytes.
    static double ShannonEntropy(const std::vector<uint8_t>& bytes, size_t limit);
    static size_t CountUrls(const std::string& text);

private:
    DetectedThreat MakeThreat(const std::string& name, ThreatType type, Severity severity,
                              const std::string& detail, size_t file_size) const;

    BehaviorThresholds thresholds_;
    size_t sample_bytes_;
    std::regex api_call_regex_;
    std::regex network_call_regex_;
};

} // namespace filesentry
