#include "intel/ThreatIntel.hpp"
#include "config/SecurityConfig.hpp"
#include "core/Logger.hpp"
#include "core/Util.hpp"
#include <nlohmann/json.hpp>
#include <yaml-cpp/yaml.h>
#include <algorithm>
#include <stdexcept>

namespace filesentry {

namespace {

Severity RequireSeverity(const std::string& value) {
    auto severity = SeverityFromString(value);
    if (!severity) {
        throw std::invalid_argument("unknown severity '" + value + "'");
    }
    return *severity;
}

ThreatType RequireThreatType(const std::string& value) {
    auto type = ThreatTypeFromString(value);
    if (!type) {
        throw std::invalid_argument("unknown threat type '" + value + "'");
    }
    return *type;
}

PIIType RequirePIIType(const std::string& value) {
    auto type = PIITypeFromString(value);
    if (!type) {
        throw std::invalid_argument("unknown PII type '" + value + "'");
    }
    return *type;
}

YAML::Node SequenceOf(const YAML::Node& root, const char* key) {
    YAML::Node node = root[key];
    if (node && !node.IsSequence()) {
        throw std::invalid_argument(std::string("'") + key + "' must be a list");
    }
    return node ? node : YAML::Node(YAML::NodeType::Sequence);
}

std::vector<std::string> StringList(const YAML::Node& node) {
    std::vector<std::string> values;
    if (node && node.IsSequence()) {
        for (const auto& item : node) {
            values.push_back(item.as<std::string>());
        }
    }
    return values;
}

} // namespace

ThreatSignature SignatureFromJson(const nlohmann::json& j) {
    ThreatSignature signature;
    signature.id = j.at("id").get<std::string>();
    signature.name = j.value("name", signature.id);
    signature.type = RequireThreatType(j.at("type").get<std::string>());
    signature.pattern = j.at("pattern").get<std::string>();
    signature.description = j.value("description", "");
    signature.severity = RequireSeverity(j.at("severity").get<std::string>());
    signature.confidence = std::min<uint32_t>(100, j.value("confidence", 50u));
    signature.source = j.value("source", "");
    signature.last_updated = j.value("last_updated", uint64_t{0});
    signature.enabled = j.value("enabled", true);
    return signature;
}

MalwareHash MalwareHashFromJson(const nlohmann::json& j) {
    MalwareHash hash;
    hash.hash = ToLower(j.at("hash").get<std::string>());
    hash.hash_type = ToLower(j.value("hash_type", "sha256"));
    hash.malware_family = j.value("malware_family", "unknown");
    hash.threat_type = RequireThreatType(j.value("threat_type", "malware"));
    hash.severity = RequireSeverity(j.value("severity", "high"));
    hash.first_seen = j.value("first_seen", uint64_t{0});
    hash.last_seen = j.value("last_seen", uint64_t{0});
    hash.source = j.value("source", "");
    hash.description = j.value("description", "");
    return hash;
}

PIIPattern PIIPatternFromJson(const nlohmann::json& j) {
    PIIPattern pattern;
    pattern.id = j.at("id").get<std::string>();
    pattern.name = j.value("name", pattern.id);
    pattern.type = RequirePIIType(j.at("type").get<std::string>());
    pattern.pattern = j.at("pattern").get<std::string>();
    pattern.severity = RequireSeverity(j.at("severity").get<std::string>());
    pattern.locale = j.value("locale", "");
    pattern.description = j.value("description", "");
    pattern.examples = j.value("examples", std::vector<std::string>{});
    pattern.false_positives = j.value("false_positives", std::vector<std::string>{});
    pattern.enabled = j.value("enabled", true);
    return pattern;
}

ThreatIntelDatabase LoadThreatIntelFile(const std::string& path) {
    YAML::Node root;
    try {
        root = YAML::LoadFile(path);
    } catch (const YAML::Exception& ex) {
        throw ConfigurationError("Failed to load threat intel file " + path + ": " + ex.what());
    }

    ThreatIntelDatabase db;
    try {
        db.version = root["version"] ? root["version"].as<std::string>() : "file";
        db.source = root["source"] ? root["source"].as<std::string>() : path;
        db.last_updated = NowMillis();

        for (const auto& node : SequenceOf(root, "signatures")) {
            ThreatSignature signature;
            signature.id = node["id"].as<std::string>();
            signature.name = node["name"] ? node["name"].as<std::string>() : signature.id;
            signature.type = RequireThreatType(node["type"].as<std::string>());
            signature.pattern = node["pattern"].as<std::string>();
            signature.description = node["description"] ? node["description"].as<std::string>() : "";
            signature.severity = RequireSeverity(node["severity"].as<std::string>());
            signature.confidence = std::min<uint32_t>(100, node["confidence"] ? node["confidence"].as<uint32_t>() : 50);
            signature.source = db.source;
            signature.last_updated = db.last_updated;
            signature.enabled = node["enabled"] ? node["enabled"].as<bool>() : true;
            db.signatures.push_back(std::move(signature));
        }

        for (const auto& node : SequenceOf(root, "malware_hashes")) {
            MalwareHash hash;
            hash.hash = ToLower(node["hash"].as<std::string>());
            hash.hash_type = node["hash_type"] ? ToLower(node["hash_type"].as<std::string>()) : "sha256";
            hash.malware_family = node["malware_family"] ? node["malware_family"].as<std::string>() : "unknown";
            hash.threat_type = RequireThreatType(node["threat_type"] ? node["threat_type"].as<std::string>() : "malware");
            hash.severity = RequireSeverity(node["severity"] ? node["severity"].as<std::string>() : "high");
            hash.source = db.source;
            hash.description = node["description"] ? node["description"].as<std::string>() : "";
            hash.first_seen = db.last_updated;
            hash.last_seen = db.last_updated;
            db.malware_hashes.push_back(std::move(hash));
        }

        for (const auto& node : SequenceOf(root, "pii_patterns")) {
            PIIPattern pattern;
            pattern.id = node["id"].as<std::string>();
            pattern.name = node["name"] ? node["name"].as<std::string>() : pattern.id;
            pattern.type = RequirePIIType(node["type"].as<std::string>());
            pattern.pattern = node["pattern"].as<std::string>();
            pattern.severity = RequireSeverity(node["severity"].as<std::string>());
            pattern.locale = node["locale"] ? node["locale"].as<std::string>() : "";
            pattern.description = node["description"] ? node["description"].as<std::string>() : "";
            pattern.examples = StringList(node["examples"]);
            pattern.false_positives = StringList(node["false_positives"]);
            pattern.enabled = node["enabled"] ? node["enabled"].as<bool>() : true;
            db.pii_patterns.push_back(std::move(pattern));
        }
    } catch (const YAML::Exception& ex) {
        throw ConfigurationError("Malformed threat intel file " + path + ": " + ex.what());
    } catch (const std::invalid_argument& ex) {
        throw ConfigurationError("Invalid entry in threat intel file " + path + ": " + ex.what());
    }

    LOG_INFO("Loaded threat intel {} from {} ({} signatures, {} hashes, {} PII patterns)",
             db.version, path, db.signatures.size(), db.malware_hashes.size(), db.pii_patterns.size());
    return db;
}

std::shared_ptr<const ThreatIntelSnapshot> CompileSnapshot(const ThreatIntelDatabase& database) {
    auto snapshot = std::make_shared<ThreatIntelSnapshot>();
    snapshot->version = database.version;
    snapshot->source = database.source;
    snapshot->compiled_at = NowMillis();
    auto signatures = std::make_shared<const SignatureMatcher>(database.signatures);
    auto pii = std::make_shared<const PIIPatternMatcher>(database.pii_patterns);
    snapshot->rejected_patterns = signatures->RejectedCount() + pii->RejectedCount();
    snapshot->signatures = std::move(signatures);
    snapshot->hashes = std::make_shared<const HashMatcher>(database.malware_hashes);
    snapshot->pii = std::move(pii);
    return snapshot;
}

} // namespace filesentry
