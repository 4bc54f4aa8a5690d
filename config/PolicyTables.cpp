#include "config/PolicyTables.hpp"

namespace filesentry {

double SeverityWeights::For(Severity severity) const {
    switch (severity) {
        case Severity::INFO:     return info;
        case Severity::LOW:      return low;
        case Severity::MEDIUM:   return medium;
        case Severity::HIGH:     return high;
        case Severity::CRITICAL: return critical;
    }
    return medium;
}

const std::string& MaskTokens::ForPII(PIIType type) const {
    auto it = pii.find(type);
    return it != pii.end() ? it->second : default_pii;
}

MaskTokens MaskTokens::Defaults() {
    MaskTokens tokens;
    tokens.pii = {
        {PIIType::SSN,          "[SSN_REDACTED]"},
        {PIIType::CREDIT_CARD,  "[CREDIT_CARD_REDACTED]"},
        {PIIType::PHONE,        "[PHONE_REDACTED]"},
        {PIIType::EMAIL,        "[EMAIL_REDACTED]"},
        {PIIType::BANK_ACCOUNT, "[BANK_ACCOUNT_REDACTED]"},
    };
    return tokens;
}

const std::vector<Regulation>& ComplianceTable::RegulationsFor(PIIType type) const {
    static const std::vector<Regulation> kNone;
    auto it = regulations_by_type.find(type);
    return it != regulations_by_type.end() ? it->second : kNone;
}

RegulationRequirement ComplianceTable::RequirementFor(Regulation regulation) const {
    auto it = requirements.find(regulation);
    if (it != requirements.end()) {
        return it->second;
    }
    return RegulationRequirement{"Compliance requirement not specified",
                                 Severity::MEDIUM,
                                 "Consult legal team for specific remediation"};
}

ComplianceTable ComplianceTable::Defaults() {
    using R = Regulation;
    ComplianceTable table;
    table.regulations_by_type = {
        {PIIType::SSN,             {R::GDPR, R::CCPA, R::SOX}},
        {PIIType::CREDIT_CARD,     {R::PCI_DSS, R::GDPR, R::CCPA}},
        {PIIType::PHONE,           {R::GDPR, R::CCPA, R::COPPA}},
        {PIIType::EMAIL,           {R::GDPR, R::CCPA, R::COPPA}},
        {PIIType::IP_ADDRESS,      {R::GDPR, R::CCPA}},
        {PIIType::DRIVERS_LICENSE, {R::GDPR, R::CCPA}},
        {PIIType::PASSPORT,        {R::GDPR, R::CCPA}},
        {PIIType::DATE_OF_BIRTH,   {R::GDPR, R::CCPA, R::COPPA}},
        {PIIType::BANK_ACCOUNT,    {R::GDPR, R::CCPA, R::GLBA}},
        {PIIType::TAX_ID,          {R::GDPR, R::CCPA, R::SOX}},
        {PIIType::MEDICAL_RECORD,  {R::HIPAA, R::GDPR, R::CCPA}},
        {PIIType::BIOMETRIC,       {R::GDPR, R::CCPA}},
        {PIIType::GOVERNMENT_ID,   {R::GDPR, R::CCPA}},
        {PIIType::CUSTOM,          {}},
    };

    table.requirements = {
        {R::GDPR,    {"Personal data must be processed lawfully and protected", Severity::HIGH,
                      "Obtain consent, implement data minimization, enable data deletion"}},
        {R::CCPA,    {"Consumer personal information must be disclosed and protected", Severity::HIGH,
                      "Provide privacy notice, enable opt-out, implement data deletion"}},
        {R::HIPAA,   {"Protected health information must be secured", Severity::CRITICAL,
                      "Implement administrative, physical, and technical safeguards"}},
        {R::PCI_DSS, {"Payment card data must be protected", Severity::CRITICAL,
                      "Encrypt cardholder data, implement access controls"}},
        {R::SOX,     {"Financial data must be accurately reported and secured", Severity::HIGH,
                      "Implement financial controls and audit trails"}},
        {R::GLBA,    {"Financial information must be protected", Severity::HIGH,
                      "Implement information security program"}},
        {R::FERPA,   {"Educational records must be protected", Severity::MEDIUM,
                      "Limit access to educational records"}},
        {R::COPPA,   {"Children's personal information must be protected", Severity::HIGH,
                      "Obtain parental consent for children under 13"}},
    };
    return table;
}

} // namespace filesentry
