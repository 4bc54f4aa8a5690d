#include "privacy/PIITypes.hpp"
#include "core/Util.hpp"
#include <nlohmann/json.hpp>

namespace filesentry {

std::optional<PIIType> PIITypeFromString(const std::string& value) {
    std::string v = ToLower(value);
    if (v == "ssn") return PIIType::SSN;
    if (v == "credit_card") return PIIType::CREDIT_CARD;
    if (v == "phone") return PIIType::PHONE;
    if (v == "email") return PIIType::EMAIL;
    if (v == "ip_address") return PIIType::IP_ADDRESS;
    if (v == "drivers_license") return PIIType::DRIVERS_LICENSE;
    if (v == "passport") return PIIType::PASSPORT;
    if (v == "date_of_birth") return PIIType::DATE_OF_BIRTH;
    if (v == "bank_account") return PIIType::BANK_ACCOUNT;
    if (v == "tax_id") return PIIType::TAX_ID;
    if (v == "medical_record") return PIIType::MEDICAL_RECORD;
    if (v == "biometric") return PIIType::BIOMETRIC;
    if (v == "government_id") return PIIType::GOVERNMENT_ID;
    if (v == "custom") return PIIType::CUSTOM;
    return std::nullopt;
}

std::optional<Regulation> RegulationFromString(const std::string& value) {
    std::string v = ToLower(value);
    if (v == "gdpr") return Regulation::GDPR;
    if (v == "ccpa") return Regulation::CCPA;
    if (v == "hipaa") return Regulation::HIPAA;
    if (v == "pci_dss") return Regulation::PCI_DSS;
    if (v == "sox") return Regulation::SOX;
    if (v == "glba") return Regulation::GLBA;
    if (v == "coppa") return Regulation::COPPA;
    if (v == "ferpa") return Regulation::FERPA;
    return std::nullopt;
}

void to_json(nlohmann::json& j, const PIIPattern& pattern) {
    j = nlohmann::json{
        {"id", pattern.id},
        {"name", pattern.name},
        {"type", PIITypeToString(pattern.type)},
        {"pattern", pattern.pattern},
        {"severity", SeverityToString(pattern.severity)},
        {"locale", pattern.locale},
        {"description", pattern.description},
        {"examples", pattern.examples},
        {"false_positives", pattern.false_positives},
        {"enabled", pattern.enabled}
    };
}

void to_json(nlohmann::json& j, const PIIFinding& finding) {
    j = nlohmann::json{
        {"id", finding.id},
        {"type", PIITypeToString(finding.type)},
        {"masked_value", finding.masked_value},
        {"confidence", finding.confidence},
        {"offset", finding.location.offset},
        {"length", finding.location.length},
        {"line", finding.location.line},
        {"column", finding.location.column},
        {"severity", SeverityToString(finding.severity)},
        {"pattern_id", finding.pattern_id},
        {"context", finding.context}
    };
}

void to_json(nlohmann::json& j, const ComplianceFlag& flag) {
    j = nlohmann::json{
        {"regulation", RegulationToString(flag.regulation)},
        {"requirement", flag.requirement},
        {"violated", flag.violated},
        {"severity", SeverityToString(flag.severity)},
        {"remediation", flag.remediation}
    };
}

void to_json(nlohmann::json& j, const PIIDetectionResult& result) {
    nlohmann::json findings = nlohmann::json::array();
    for (const auto& finding : result.findings) {
        findings.push_back(finding);
    }
    nlohmann::json flags = nlohmann::json::array();
    for (const auto& flag : result.compliance_flags) {
        flags.push_back(flag);
    }

    j = nlohmann::json{
        {"file_id", result.file_id},
        {"file_name", result.file_name},
        {"findings", findings},
        {"classification", ClassificationToString(result.classification)},
        {"recommended_handling", HandlingToString(result.recommended_handling)},
        {"compliance_flags", flags},
        {"scan_duration_ms", result.scan_duration_ms},
        {"scan_timestamp", TimestampToISO8601(result.scan_timestamp)},
        {"intel_version", result.intel_version}
    };
}

} // namespace filesentry
