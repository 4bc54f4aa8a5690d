#pragma once

#include "config/PolicyTables.hpp"
#include "privacy/PIITypes.hpp"
#include <vector>

namespace filesentry {

// Maps masked findings to a sensitivity tier, a handling recommendation
// and the compliance regulations they implicate.
class PIIClassifier {
public:
    explicit PIIClassifier(ComplianceTable table = ComplianceTable::Defaults());

    DataClassification Classify(const std::vector<PIIFinding>& findings) const;
    PIIHandling RecommendHandling(DataClassification classification,
                                  const std::vector<PIIFinding>& findings) const;
    std::vector<ComplianceFlag> ComplianceFlags(const std::vector<PIIFinding>& findings) const;

    // Fills classification, handling and compliance flags of `result` from
    // its findings.
    void Annotate(PIIDetectionResult& result) const;

private:
    ComplianceTable table_;
};

} // namespace filesentry
