#pragma once

#include "engine/ThreatTypes.hpp"
#include <nlohmann/json_fwd.hpp>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace filesentry {

enum class PIIType {
    SSN,
    CREDIT_CARD,
    PHONE,
    EMAIL,
    IP_ADDRESS,
    DRIVERS_LICENSE,
    PASSPORT,
    DATE_OF_BIRTH,
    BANK_ACCOUNT,
    TAX_ID,
    MEDICAL_RECORD,
    BIOMETRIC,
    GOVERNMENT_ID,
    CUSTOM
};

enum class DataClassification {
    PUBLIC,
    INTERNAL,
    CONFIDENTIAL,
    RESTRICTED
};

enum class PIIHandling {
    ALLOW,
    REDACT,
    ENCRYPT,
    REJECT,
    SECURE_STORAGE
};

enum class Regulation {
    GDPR,
    CCPA,
    HIPAA,
    PCI_DSS,
    SOX,
    GLBA,
    COPPA,
    FERPA
};

inline std::string PIITypeToString(PIIType type) {
    switch (type) {
        case PIIType::SSN:             return "ssn";
        case PIIType::CREDIT_CARD:     return "credit_card";
        case PIIType::PHONE:           return "phone";
        case PIIType::EMAIL:           return "email";
        case PIIType::IP_ADDRESS:      return "ip_address";
        case PIIType::DRIVERS_LICENSE: return "drivers_license";
        case PIIType::PASSPORT:        return "passport";
        case PIIType::DATE_OF_BIRTH:   return "date_of_birth";
        case PIIType::BANK_ACCOUNT:    return "bank_account";
        case PIIType::TAX_ID:          return "tax_id";
        case PIIType::MEDICAL_RECORD:  return "medical_record";
        case PIIType::BIOMETRIC:       return "biometric";
        case PIIType::GOVERNMENT_ID:   return "government_id";
        case PIIType::CUSTOM:          return "custom";
        default:                       return "custom";
    }
}

inline std::string ClassificationToString(DataClassification classification) {
    switch (classification) {
        case DataClassification::PUBLIC:       return "public";
        case DataClassification::INTERNAL:     return "internal";
        case DataClassification::CONFIDENTIAL: return "confidential";
        case DataClassification::RESTRICTED:   return "restricted";
        default:                               return "public";
    }
}

inline std::string HandlingToString(PIIHandling handling) {
    switch (handling) {
        case PIIHandling::ALLOW:          return "allow";
        case PIIHandling::REDACT:         return "redact";
        case PIIHandling::ENCRYPT:        return "encrypt";
        case PIIHandling::REJECT:         return "reject";
        case PIIHandling::SECURE_STORAGE: return "secure_storage";
        default:                          return "allow";
    }
}

inline std::string RegulationToString(Regulation regulation) {
    switch (regulation) {
        case Regulation::GDPR:    return "GDPR";
        case Regulation::CCPA:    return "CCPA";
        case Regulation::HIPAA:   return "HIPAA";
        case Regulation::PCI_DSS: return "PCI_DSS";
        case Regulation::SOX:     return "SOX";
        case Regulation::GLBA:    return "GLBA";
        case Regulation::COPPA:   return "COPPA";
        case Regulation::FERPA:   return "FERPA";
        default:                  return "GDPR";
    }
}

std::optional<PIIType> PIITypeFromString(const std::string& value);
std::optional<Regulation> RegulationFromString(const std::string& value);

struct PIIPattern {
    std::string id;
    std::string name;
    PIIType type{PIIType::CUSTOM};
    std::string pattern;
    Severity severity{Severity::MEDIUM};
    std::string locale;
    std::string description;
    std::vector<std::string> examples;
    std::vector<std::string> false_positives;
    bool enabled{true};
};

struct PIILocation {
    size_t offset{0};
    size_t length{0};
    uint32_t line{0};
    uint32_t column{0};
};

// Only the masked value is ever stored. The raw match does not leave the
// matcher.
struct PIIFinding {
    std::string id;
    PIIType type{PIIType::CUSTOM};
    std::string masked_value;
    uint32_t confidence{0};
    PIILocation location;
    Severity severity{Severity::MEDIUM};
    std::string pattern_id;
    std::string context;
};

struct ComplianceFlag {
    Regulation regulation{Regulation::GDPR};
    std::string requirement;
    bool violated{true};
    Severity severity{Severity::HIGH};
    std::string remediation;
};

struct PIIDetectionResult {
    std::string file_id;
    std::string file_name;
    std::vector<PIIFinding> findings;
    DataClassification classification{DataClassification::PUBLIC};
    PIIHandling recommended_handling{PIIHandling::ALLOW};
    std::vector<ComplianceFlag> compliance_flags;
    uint64_t scan_duration_ms{0};
    uint64_t scan_timestamp{0};
    std::string intel_version;
};

void to_json(nlohmann::json& j, const PIIPattern& pattern);
void to_json(nlohmann::json& j, const PIIFinding& finding);
void to_json(nlohmann::json& j, const ComplianceFlag& flag);
void to_json(nlohmann::json& j, const PIIDetectionResult& result);

} // namespace filesentry
