#include "engine/SignatureMatcher.hpp"
#include "core/Logger.hpp"
#include "engine/RegexScan.hpp"
#include <utility>

namespace filesentry {

SignatureMatcher::SignatureMatcher(const std::vector<ThreatSignature>& signatures) {
    for (const auto& signature : signatures) {
        if (!signature.enabled) {
            continue;
        }
        try {
            compiled_.push_back(CompiledSignature{
                signature,
                std::regex(signature.pattern,
                           std::regex::ECMAScript | std::regex::icase | std::regex::optimize)
            });
        } catch (const std::regex_error& ex) {
            ++rejected_;
            LOG_WARN("SignatureMatcher: skipping signature {} with invalid pattern: {}",
                     signature.id, ex.what());
        }
    }
    LOG_DEBUG("SignatureMatcher compiled {} signatures ({} rejected)", compiled_.size(), rejected_);
}

std::vector<DetectedThreat> SignatureMatcher::Analyze(const ScanContent& content,
                                                      const CancellationToken& token) const {
    std::vector<DetectedThreat> threats;

    for (const auto& entry : compiled_) {
        if (token.IsCancelled()) {
            break;
        }

        size_t matches = 0;
        ScanRegexBounded(content.Text(), entry.regex, [&](size_t offset, const std::smatch& match) {
            DetectedThreat threat;
            threat.id = "sig_" + entry.signature.id + "_" + std::to_string(offset);
            threat.signature = entry.signature;
            threat.location.offset = offset;
            threat.location.length = static_cast<size_t>(match.length(0));
            threat.location.line = content.LineAt(offset);
            threat.location.column = content.ColumnAt(offset);
            threat.location.in_content = true;
            threat.confidence = entry.signature.confidence;
            threat.context = content.ContextAt(offset, threat.location.length, kContextRadius);
            threat.mitigation = MitigationFor(entry.signature.type);
            threats.push_back(std::move(threat));

            if (++matches >= kMaxMatchesPerSignature) {
                LOG_DEBUG("SignatureMatcher: match cap reached for {}", entry.signature.id);
                return false;
            }
            return true;
        }, &token);
    }
    return threats;
}

} // namespace filesentry
