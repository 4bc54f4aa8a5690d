#pragma once

#include "engine/ThreatAnalyzer.hpp"
#include <regex>
#include <vector>

namespace filesentry {

// Runs every enabled signature regex over the decoded text sample.
class SignatureMatcher : public ThreatAnalyzer {
public:
    static constexpr size_t kMaxMatchesPerSignature = 100;
    static constexpr size_t kContextRadius = 100;

    explicit SignatureMatcher(const std::vector<ThreatSignature>& signatures);

    std::string Name() const override { return "signature"; }
    std::vector<DetectedThreat> Analyze(const ScanContent& content,
                                        const CancellationToken& token) const override;

    size_t CompiledCount() const { return compiled_.size(); }
    size_t RejectedCount() const { return rejected_; }

private:
    struct CompiledSignature {
        ThreatSignature signature;
        std::regex regex;
    };

    std::vector<CompiledSignature> compiled_;
    size_t rejected_{0};
};

} // namespace filesentry
