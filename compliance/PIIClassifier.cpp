#include "compliance/PIIClassifier.hpp"
#include <algorithm>
#include <set>

namespace filesentry {

PIIClassifier::PIIClassifier(ComplianceTable table)
    : table_(std::move(table)) {}

DataClassification PIIClassifier::Classify(const std::vector<PIIFinding>& findings) const {
    Severity highest = Severity::INFO;
    for (const auto& finding : findings) {
        highest = std::max(highest, finding.severity);
    }

    switch (highest) {
        case Severity::CRITICAL: return DataClassification::RESTRICTED;
        case Severity::HIGH:     return DataClassification::CONFIDENTIAL;
        case Severity::MEDIUM:   return DataClassification::INTERNAL;
        default:                 return DataClassification::PUBLIC;
    }
}

PIIHandling PIIClassifier::RecommendHandling(DataClassification classification,
                                             const std::vector<PIIFinding>& findings) const {
    bool critical_financial = std::any_of(findings.begin(), findings.end(), [](const PIIFinding& f) {
        return f.severity == Severity::CRITICAL &&
               (f.type == PIIType::SSN || f.type == PIIType::CREDIT_CARD || f.type == PIIType::BANK_ACCOUNT);
    });
    if (critical_financial) {
        return PIIHandling::REJECT;
    }

    switch (classification) {
        case DataClassification::RESTRICTED:   return PIIHandling::REJECT;
        case DataClassification::CONFIDENTIAL: return PIIHandling::ENCRYPT;
        case DataClassification::INTERNAL:     return PIIHandling::REDACT;
        case DataClassification::PUBLIC:       return PIIHandling::ALLOW;
    }
    return PIIHandling::SECURE_STORAGE;
}

std::vector<ComplianceFlag> PIIClassifier::ComplianceFlags(const std::vector<PIIFinding>& findings) const {
    // First-seen order keeps the flag list stable across identical scans.
    std::vector<Regulation> implicated;
    std::set<Regulation> seen;
    for (const auto& finding : findings) {
        for (Regulation regulation : table_.RegulationsFor(finding.type)) {
            if (seen.insert(regulation).second) {
                implicated.push_back(regulation);
            }
        }
    }

    std::vector<ComplianceFlag> flags;
    flags.reserve(implicated.size());
    for (Regulation regulation : implicated) {
        RegulationRequirement requirement = table_.RequirementFor(regulation);
        ComplianceFlag flag;
        flag.regulation = regulation;
        flag.requirement = requirement.requirement;
        flag.violated = true;
        flag.severity = requirement.severity;
        flag.remediation = requirement.remediation;
        flags.push_back(std::move(flag));
    }
    return flags;
}

void PIIClassifier::Annotate(PIIDetectionResult& result) const {
    result.classification = Classify(result.findings);
    result.recommended_handling = RecommendHandling(result.classification, result.findings);
    result.compliance_flags = ComplianceFlags(result.findings);
}

} // namespace filesentry
