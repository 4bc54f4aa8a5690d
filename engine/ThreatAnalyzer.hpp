#pragma once

#include "engine/ScanContent.hpp"
#include "engine/ThreatTypes.hpp"
#include <string>
#include <vector>

namespace filesentry {

// One independent detector. Implementations only read the content and
// return their own findings, so several may run concurrently on one scan.
class ThreatAnalyzer {
public:
    virtual ~ThreatAnalyzer() = default;

    virtual std::string Name() const = 0;
    virtual std::vector<DetectedThreat> Analyze(const ScanContent& content,
                                                const CancellationToken& token) const = 0;
};

} // namespace filesentry
