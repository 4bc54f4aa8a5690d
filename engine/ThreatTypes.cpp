#include "engine/ThreatTypes.hpp"
#include "core/Util.hpp"
#include <nlohmann/json.hpp>

namespace filesentry {

std::optional<Severity> SeverityFromString(const std::string& value) {
    std::string v = ToLower(value);
    if (v == "info") return Severity::INFO;
    if (v == "low") return Severity::LOW;
    if (v == "medium") return Severity::MEDIUM;
    if (v == "high") return Severity::HIGH;
    if (v == "critical") return Severity::CRITICAL;
    return std::nullopt;
}

std::optional<ThreatType> ThreatTypeFromString(const std::string& value) {
    std::string v = ToLower(value);
    if (v == "malware") return ThreatType::MALWARE;
    if (v == "virus") return ThreatType::VIRUS;
    if (v == "trojan") return ThreatType::TROJAN;
    if (v == "ransomware") return ThreatType::RANSOMWARE;
    if (v == "spyware") return ThreatType::SPYWARE;
    if (v == "backdoor") return ThreatType::BACKDOOR;
    if (v == "obfuscated_code") return ThreatType::OBFUSCATED_CODE;
    if (v == "embedded_executable") return ThreatType::EMBEDDED_EXECUTABLE;
    if (v == "suspicious_script") return ThreatType::SUSPICIOUS_SCRIPT;
    if (v == "suspicious_pattern") return ThreatType::SUSPICIOUS_PATTERN;
    if (v == "phishing") return ThreatType::PHISHING;
    if (v == "unknown") return ThreatType::UNKNOWN;
    return std::nullopt;
}

std::string MitigationFor(ThreatType type) {
    switch (type) {
        case ThreatType::MALWARE:             return "Block file and quarantine immediately";
        case ThreatType::VIRUS:               return "Delete file and scan system";
        case ThreatType::TROJAN:              return "Block file and investigate source";
        case ThreatType::RANSOMWARE:          return "Block immediately and alert security team";
        case ThreatType::SPYWARE:             return "Block file and check for data exfiltration";
        case ThreatType::BACKDOOR:            return "Block file and audit system access";
        case ThreatType::OBFUSCATED_CODE:     return "Analyze obfuscated content and block if malicious";
        case ThreatType::EMBEDDED_EXECUTABLE: return "Extract and analyze embedded content";
        case ThreatType::SUSPICIOUS_SCRIPT:   return "Review script content and block if malicious";
        case ThreatType::SUSPICIOUS_PATTERN:  return "Manual review recommended";
        case ThreatType::PHISHING:            return "Block file and educate users";
        case ThreatType::UNKNOWN:             return "Manual investigation required";
    }
    return "Review and assess threat level";
}

void to_json(nlohmann::json& j, const ThreatSignature& signature) {
    j = nlohmann::json{
        {"id", signature.id},
        {"name", signature.name},
        {"type", ThreatTypeToString(signature.type)},
        {"pattern", signature.pattern},
        {"description", signature.description},
        {"severity", SeverityToString(signature.severity)},
        {"confidence", signature.confidence},
        {"source", signature.source},
        {"last_updated", signature.last_updated},
        {"enabled", signature.enabled}
    };
}

void to_json(nlohmann::json& j, const MalwareHash& hash) {
    j = nlohmann::json{
        {"hash", hash.hash},
        {"hash_type", hash.hash_type},
        {"malware_family", hash.malware_family},
        {"threat_type", ThreatTypeToString(hash.threat_type)},
        {"severity", SeverityToString(hash.severity)},
        {"first_seen", hash.first_seen},
        {"last_seen", hash.last_seen},
        {"source", hash.source},
        {"description", hash.description}
    };
}

void to_json(nlohmann::json& j, const DetectedThreat& threat) {
    j = nlohmann::json{
        {"id", threat.id},
        {"signature_id", threat.signature.id},
        {"name", threat.signature.name},
        {"type", ThreatTypeToString(threat.signature.type)},
        {"severity", SeverityToString(threat.signature.severity)},
        {"confidence", threat.confidence},
        {"offset", threat.location.offset},
        {"length", threat.location.length},
        {"line", threat.location.line},
        {"column", threat.location.column},
        {"in_content", threat.location.in_content},
        {"context", threat.context},
        {"mitigation", threat.mitigation}
    };
}

void to_json(nlohmann::json& j, const ThreatDetectionResult& result) {
    nlohmann::json threats = nlohmann::json::array();
    for (const auto& threat : result.threats) {
        threats.push_back(threat);
    }

    nlohmann::json diagnostics = nlohmann::json::array();
    for (const auto& diag : result.diagnostics) {
        diagnostics.push_back({{"analyzer", diag.analyzer}, {"message", diag.message}});
    }

    j = nlohmann::json{
        {"file_id", result.file_id},
        {"file_name", result.file_name},
        {"threats", threats},
        {"risk_score", result.risk_score},
        {"overall_severity", SeverityToString(result.overall_severity)},
        {"scan_duration_ms", result.scan_duration_ms},
        {"scan_timestamp", TimestampToISO8601(result.scan_timestamp)},
        {"engine", result.engine_name},
        {"engine_version", result.engine_version},
        {"intel_version", result.intel_version},
        {"recommendation", RecommendationToString(result.recommendation)},
        {"diagnostics", diagnostics}
    };
}

} // namespace filesentry
