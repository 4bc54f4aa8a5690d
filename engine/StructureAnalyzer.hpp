#pragma once

#include "engine/ThreatAnalyzer.hpp"
#include <vector>

namespace filesentry {

struct EmbeddedMagic {
    std::string type;
    std::string name;
    std::vector<uint8_t> magic;
    Severity severity;
};

// Looks for embedded-file magic numbers anywhere in the raw bytes past a
// header tolerance. A magic number at the very start is the file's own type.
class StructureAnalyzer : public ThreatAnalyzer {
public:
    static constexpr uint32_t kStructureConfidence = 85;
    static constexpr size_t kMaxHitsPerMagic = 100;

    explicit StructureAnalyzer(size_t header_tolerance);

    std::string Name() const override { return "structure"; }
    std::vector<DetectedThreat> Analyze(const ScanContent& content,
                                        const CancellationToken& token) const override;

    static const std::vector<EmbeddedMagic>& KnownMagics();

    // A PE hit needs a DOS header whose e_lfanew points at "PE\0\0".
    static bool IsPlausiblePE(const std::vector<uint8_t>& bytes, size_t offset);

private:
    size_t header_tolerance_;
};

} // namespace filesentry
