#pragma once

#include "engine/HashMatcher.hpp"
#include "engine/SignatureMatcher.hpp"
#include "engine/ThreatTypes.hpp"
#include "privacy/PIIPatternMatcher.hpp"
#include "privacy/PIITypes.hpp"
#include <nlohmann/json_fwd.hpp>
#include <memory>
#include <string>
#include <vector>

namespace filesentry {

// Versioned reference data set: signatures, known hashes and PII patterns.
struct ThreatIntelDatabase {
    std::string version;
    std::string source;
    uint64_t last_updated{0};
    std::vector<ThreatSignature> signatures;
    std::vector<MalwareHash> malware_hashes;
    std::vector<PIIPattern> pii_patterns;
};

// Compiled, immutable form shared by concurrent scans.
struct ThreatIntelSnapshot {
    std::string version;
    std::string source;
    uint64_t compiled_at{0};
    std::shared_ptr<const SignatureMatcher> signatures;
    std::shared_ptr<const HashMatcher> hashes;
    std::shared_ptr<const PIIPatternMatcher> pii;
    size_t rejected_patterns{0};
};

std::shared_ptr<const ThreatIntelSnapshot> CompileSnapshot(const ThreatIntelDatabase& database);

ThreatIntelDatabase DefaultThreatIntel();

// Throws ConfigurationError when the file is unreadable or malformed.
ThreatIntelDatabase LoadThreatIntelFile(const std::string& path);

// Store record decoding. Throws std::invalid_argument on malformed records.
ThreatSignature SignatureFromJson(const nlohmann::json& j);
MalwareHash MalwareHashFromJson(const nlohmann::json& j);
PIIPattern PIIPatternFromJson(const nlohmann::json& j);

} // namespace filesentry
