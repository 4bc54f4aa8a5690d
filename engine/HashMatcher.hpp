#pragma once

#include "engine/ThreatAnalyzer.hpp"
#include <map>
#include <string>
#include <unordered_map>
#include <vector>

namespace filesentry {

// Exact-match lookup of whole-file digests against known malware hashes.
class HashMatcher : public ThreatAnalyzer {
public:
    explicit HashMatcher(const std::vector<MalwareHash>& hashes);

    std::string Name() const override { return "hash"; }
    std::vector<DetectedThreat> Analyze(const ScanContent& content,
                                        const CancellationToken& token) const override;

    size_t Size() const { return index_.size(); }

    // Lowercase hex digest. Supported algorithms: sha256, sha1, md5.
    static std::string ComputeDigest(const std::string& algorithm, const std::vector<uint8_t>& bytes);

    static const std::vector<std::string>& SupportedAlgorithms();

private:
    // Keyed by "<hash_type>:<lowercase hex>".
    std::unordered_map<std::string, MalwareHash> index_;
    std::vector<std::string> algorithms_in_use_;
};

} // namespace filesentry
