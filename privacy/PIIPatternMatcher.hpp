#pragma once

#include "engine/ScanContent.hpp"
#include "privacy/PIITypes.hpp"
#include <regex>
#include <vector>

namespace filesentry {

// Regex candidates filtered through type-specific validators. Findings
// leave the matcher masked; rejected candidates are dropped silently.
class PIIPatternMatcher {
public:
    static constexpr size_t kContextRadius = 50;
    static constexpr size_t kMaxFindingsPerPattern = 1000;

    explicit PIIPatternMatcher(const std::vector<PIIPattern>& patterns);

    std::vector<PIIFinding> Scan(const ScanContent& content, const CancellationToken& token) const;

    // True when a regex candidate of `type` is real PII.
    static bool Validate(PIIType type, const std::string& value);
    static uint32_t BaseConfidence(PIIType type);

    size_t CompiledCount() const { return compiled_.size(); }
    size_t RejectedCount() const { return rejected_; }

private:
    struct CompiledPattern {
        PIIPattern pattern;
        std::regex regex;
    };

    bool IsFalsePositive(const CompiledPattern& entry, const std::string& value) const;
    uint32_t Confidence(PIIType type, const std::string& text, size_t offset) const;

    std::vector<CompiledPattern> compiled_;
    size_t rejected_{0};
};

} // namespace filesentry
