#include "engine/HashMatcher.hpp"
#include "core/Logger.hpp"
#include "core/Util.hpp"
#include <openssl/evp.h>
#include <algorithm>
#include <memory>
#include <stdexcept>

namespace filesentry {

const std::vector<std::string>& HashMatcher::SupportedAlgorithms() {
    static const std::vector<std::string> kAlgorithms = {"sha256", "sha1", "md5"};
    return kAlgorithms;
}

std::string HashMatcher::ComputeDigest(const std::string& algorithm, const std::vector<uint8_t>& bytes) {
    const EVP_MD* md = nullptr;
    if (algorithm == "sha256") {
        md = EVP_sha256();
    } else if (algorithm == "sha1") {
        md = EVP_sha1();
    } else if (algorithm == "md5") {
        md = EVP_md5();
    } else {
        throw std::invalid_argument("Unsupported digest algorithm: " + algorithm);
    }

    std::unique_ptr<EVP_MD_CTX, decltype(&EVP_MD_CTX_free)> ctx(EVP_MD_CTX_new(), &EVP_MD_CTX_free);
    if (!ctx) {
        throw std::runtime_error("EVP_MD_CTX_new failed");
    }

    unsigned char digest[EVP_MAX_MD_SIZE];
    unsigned int digest_len = 0;
    if (EVP_DigestInit_ex(ctx.get(), md, nullptr) != 1 ||
        EVP_DigestUpdate(ctx.get(), bytes.data(), bytes.size()) != 1 ||
        EVP_DigestFinal_ex(ctx.get(), digest, &digest_len) != 1) {
        throw std::runtime_error("Digest computation failed for " + algorithm);
    }
    return HexEncode(digest, digest_len);
}

HashMatcher::HashMatcher(const std::vector<MalwareHash>& hashes) {
    const auto& supported = SupportedAlgorithms();
    for (const auto& hash : hashes) {
        std::string type = ToLower(hash.hash_type);
        if (std::find(supported.begin(), supported.end(), type) == supported.end()) {
            LOG_WARN("HashMatcher: skipping {} hash of unsupported type '{}'", hash.malware_family, hash.hash_type);
            continue;
        }
        MalwareHash entry = hash;
        // A confirmed malware digest always scores as a blocking hit.
        if (entry.severity < Severity::HIGH) {
            LOG_WARN("HashMatcher: raising severity of {} hash for {} to high", type, entry.malware_family);
            entry.severity = Severity::HIGH;
        }
        index_[type + ":" + ToLower(entry.hash)] = std::move(entry);
        if (std::find(algorithms_in_use_.begin(), algorithms_in_use_.end(), type) == algorithms_in_use_.end()) {
            algorithms_in_use_.push_back(type);
        }
    }
    // Stable digest order so repeated scans report hits identically.
    std::sort(algorithms_in_use_.begin(), algorithms_in_use_.end(),
              [&supported](const std::string& a, const std::string& b) {
                  return std::find(supported.begin(), supported.end(), a) <
                         std::find(supported.begin(), supported.end(), b);
              });
}

std::vector<DetectedThreat> HashMatcher::Analyze(const ScanContent& content,
                                                 const CancellationToken& token) const {
    std::vector<DetectedThreat> threats;
    for (const auto& algorithm : algorithms_in_use_) {
        if (token.IsCancelled()) {
            break;
        }

        std::string digest = ComputeDigest(algorithm, content.Bytes());
        auto it = index_.find(algorithm + ":" + digest);
        if (it == index_.end()) {
            continue;
        }

        const MalwareHash& known = it->second;
        std::string upper_type = algorithm;
        std::transform(upper_type.begin(), upper_type.end(), upper_type.begin(), ::toupper);

        DetectedThreat threat;
        threat.id = "hash_" + digest;
        threat.signature.id = "mal_hash_" + algorithm;
        threat.signature.name = "Known Malware Hash (" + upper_type + ")";
        threat.signature.type = known.threat_type;
        threat.signature.pattern = digest;
        threat.signature.description = known.description.empty()
            ? "Known malware: " + known.malware_family
            : known.description;
        threat.signature.severity = known.severity;
        threat.signature.confidence = 100;
        threat.signature.source = known.source;
        threat.signature.last_updated = known.last_seen;
        threat.location.offset = 0;
        threat.location.length = content.Bytes().size();
        threat.confidence = 100;
        threat.context = "File hash matches known malware: " + known.malware_family;
        threat.mitigation = MitigationFor(known.threat_type);
        threats.push_back(std::move(threat));
    }
    return threats;
}

} // namespace filesentry
