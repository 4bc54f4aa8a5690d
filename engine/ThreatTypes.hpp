#pragma once

#include <nlohmann/json_fwd.hpp>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace filesentry {

enum class Severity {
    INFO,
    LOW,
    MEDIUM,
    HIGH,
    CRITICAL
};

enum class ThreatType {
    MALWARE,
    VIRUS,
    TROJAN,
    RANSOMWARE,
    SPYWARE,
    BACKDOOR,
    OBFUSCATED_CODE,
    EMBEDDED_EXECUTABLE,
    SUSPICIOUS_SCRIPT,
    SUSPICIOUS_PATTERN,
    PHISHING,
    UNKNOWN
};

enum class Recommendation {
    ALLOW,
    WARN,
    SANITIZE,
    QUARANTINE,
    BLOCK,
    MANUAL_REVIEW
};

inline std::string SeverityToString(Severity severity) {
    switch (severity) {
        case Severity::INFO:     return "info";
        case Severity::LOW:      return "low";
        case Severity::MEDIUM:   return "medium";
        case Severity::HIGH:     return "high";
        case Severity::CRITICAL: return "critical";
        default:                 return "unknown";
    }
}

inline std::string ThreatTypeToString(ThreatType type) {
    switch (type) {
        case ThreatType::MALWARE:             return "malware";
        case ThreatType::VIRUS:               return "virus";
        case ThreatType::TROJAN:              return "trojan";
        case ThreatType::RANSOMWARE:          return "ransomware";
        case ThreatType::SPYWARE:             return "spyware";
        case ThreatType::BACKDOOR:            return "backdoor";
        case ThreatType::OBFUSCATED_CODE:     return "obfuscated_code";
        case ThreatType::EMBEDDED_EXECUTABLE: return "embedded_executable";
        case ThreatType::SUSPICIOUS_SCRIPT:   return "suspicious_script";
        case ThreatType::SUSPICIOUS_PATTERN:  return "suspicious_pattern";
        case ThreatType::PHISHING:            return "phishing";
        case ThreatType::UNKNOWN:             return "unknown";
        default:                              return "unknown";
    }
}

inline std::string RecommendationToString(Recommendation recommendation) {
    switch (recommendation) {
        case Recommendation::ALLOW:         return "allow";
        case Recommendation::WARN:          return "warn";
        case Recommendation::SANITIZE:      return "sanitize";
        case Recommendation::QUARANTINE:    return "quarantine";
        case Recommendation::BLOCK:         return "block";
        case Recommendation::MANUAL_REVIEW: return "manual_review";
        default:                            return "unknown";
    }
}

std::optional<Severity> SeverityFromString(const std::string& value);
std::optional<ThreatType> ThreatTypeFromString(const std::string& value);

// Fixed remediation text per threat class.
std::string MitigationFor(ThreatType type);

struct ThreatSignature {
    std::string id;
    std::string name;
    ThreatType type{ThreatType::UNKNOWN};
    std::string pattern;
    std::string description;
    Severity severity{Severity::INFO};
    uint32_t confidence{0};
    std::string source;
    uint64_t last_updated{0};
    bool enabled{true};
};

struct MalwareHash {
    std::string hash;
    std::string hash_type;  // sha256, sha1, md5
    std::string malware_family;
    ThreatType threat_type{ThreatType::MALWARE};
    Severity severity{Severity::HIGH};
    uint64_t first_seen{0};
    uint64_t last_seen{0};
    std::string source;
    std::string description;
};

// in_content marks spans that address the scanned bytes; whole-file and
// filename findings leave it false.
struct ThreatLocation {
    size_t offset{0};
    size_t length{0};
    uint32_t line{0};
    uint32_t column{0};
    bool in_content{false};
};

struct DetectedThreat {
    std::string id;
    ThreatSignature signature;
    ThreatLocation location;
    uint32_t confidence{0};
    std::string context;
    std::string mitigation;
};

struct AnalyzerDiagnostic {
    std::string analyzer;
    std::string message;
};

struct FileMetadata {
    std::string file_id;
    std::string file_name;
    std::string mime_type;
    std::string uploader_id;
};

struct ThreatDetectionResult {
    std::string file_id;
    std::string file_name;
    std::vector<DetectedThreat> threats;
    uint32_t risk_score{0};
    Severity overall_severity{Severity::INFO};
    uint64_t scan_duration_ms{0};
    uint64_t scan_timestamp{0};
    std::string engine_name;
    std::string engine_version;
    std::string intel_version;
    Recommendation recommendation{Recommendation::ALLOW};
    std::vector<AnalyzerDiagnostic> diagnostics;
};

void to_json(nlohmann::json& j, const ThreatSignature& signature);
void to_json(nlohmann::json& j, const MalwareHash& hash);
void to_json(nlohmann::json& j, const DetectedThreat& threat);
void to_json(nlohmann::json& j, const ThreatDetectionResult& result);

} // namespace filesentry
