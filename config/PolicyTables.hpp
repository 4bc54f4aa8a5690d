#pragma once

#include "engine/ThreatTypes.hpp"
#include "privacy/PIITypes.hpp"
#include <cstdint>
#include <map>
#include <string>
#include <vector>

namespace filesentry {

// Multipliers applied to a threat's confidence when summing the risk score.
struct SeverityWeights {
    double info{0.5};
    double low{0.8};
    double medium{1.0};
    double high{1.2};
    double critical{1.5};

    double For(Severity severity) const;
};

struct RecommendationThresholds {
    uint32_t block{90};
    uint32_t quarantine{70};
    uint32_t review{40};
    uint32_t warn{10};
};

struct MaskTokens {
    std::string threat_placeholder{"[THREAT_REMOVED]"};
    std::string default_pii{"[PII_REDACTED]"};
    std::map<PIIType, std::string> pii;

    const std::string& ForPII(PIIType type) const;

    static MaskTokens Defaults();
};

struct RegulationRequirement {
    std::string requirement;
    Severity severity{Severity::HIGH};
    std::string remediation;
};

struct ComplianceTable {
    std::map<PIIType, std::vector<Regulation>> regulations_by_type;
    std::map<Regulation, RegulationRequirement> requirements;

    const std::vector<Regulation>& RegulationsFor(PIIType type) const;
    RegulationRequirement RequirementFor(Regulation regulation) const;

    static ComplianceTable Defaults();
};

// Immutable decision tables injected into the engines at construction.
struct PolicyTables {
    SeverityWeights weights;
    RecommendationThresholds thresholds;
    MaskTokens masks{MaskTokens::Defaults()};
    ComplianceTable compliance{ComplianceTable::Defaults()};
};

} // namespace filesentry
