#pragma once

#include "engine/ThreatAnalyzer.hpp"
#include <set>
#include <string>

namespace filesentry {

// Filename-only checks: executable-class extensions and disguising
// double extensions. Never looks at the content.
class ExtensionAnalyzer : public ThreatAnalyzer {
public:
    ExtensionAnalyzer();

    std::string Name() const override { return "extension"; }
    std::vector<DetectedThreat> Analyze(const ScanContent& content,
                                        const CancellationToken& token) const override;

    bool IsSuspiciousExtension(const std::string& extension) const;
    static bool HasDoubleExtension(const std::string& file_name);

private:
    std::set<std::string> suspicious_;
};

} // namespace filesentry
