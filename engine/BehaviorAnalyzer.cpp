#include "engine/BehaviorAnalyzer.hpp"
#include "engine/RegexScan.hpp"
#include <fmt/format.h>
#include <algorithm>
#include <array>
#include <cctype>
#include <cmath>

namespace filesentry {

BehaviorAnalyzer::BehaviorAnalyzer(BehaviorThresholds thresholds, size_t sample_bytes)
    : thresholds_(thresholds),
      sample_bytes_(sample_bytes),
      api_call_regex_("CreateProcess|VirtualAlloc|WriteProcessMemory|CreateThread|LoadLibrary|SetWindowsHook",
                      std::regex::ECMAScript | std::regex::icase | std::regex::optimize),
      network_call_regex_("\\b(socket|connect|send|recv|bind|listen|accept)\\s*\\(",
                          std::regex::ECMAScript | std::regex::icase | std::regex::optimize) {}

double BehaviorAnalyzer::ShannonEntropy(const std::vector<uint8_t>& bytes, size_t limit) {
    size_t n = std::min(bytes.size(), limit);
    if (n == 0) {
        return 0.0;
    }

    std::array<size_t, 256> counts{};
    for (size_t i = 0; i < n; ++i) {
        counts[bytes[i]]++;
    }

    double entropy = 0.0;
    for (size_t count : counts) {
        if (count == 0) continue;
        double p = static_cast<double>(count) / static_cast<double>(n);
        entropy -= p * std::log2(p);
    }
    return entropy;
}

size_t BehaviorAnalyzer::CountUrls(const std::string& text) {
    // Equivalent to counting matches of https?://\S+ without regex backtracking.
    size_t count = 0;
    size_t pos = 0;
    while ((pos = text.find("://", pos)) != std::string::npos) {
        bool is_http = (pos >= 4 && text.compare(pos - 4, 4, "http") == 0) ||
                       (pos >= 5 && text.compare(pos - 5, 5, "https") == 0);
        bool has_body = pos + 3 < text.size() &&
                        !std::isspace(static_cast<unsigned char>(text[pos + 3]));
        if (is_http && has_body) {
            ++count;
        }
        pos += 3;
    }
    return count;
}

DetectedThreat BehaviorAnalyzer::MakeThreat(const std::string& name, ThreatType type, Severity severity,
                                            const std::string& detail, size_t file_size) const {
    std::string id = "behavior_";
    for (char c : name) {
        id.push_back(c == ' ' ? '_' : static_cast<char>(std::tolower(static_cast<unsigned char>(c))));
    }

    DetectedThreat threat;
    threat.id = id;
    threat.signature.id = id;
    threat.signature.name = name;
    threat.signature.type = type;
    threat.signature.pattern = "behavioral_analysis";
    threat.signature.description = "Behavioral analysis detected: " + name;
    threat.signature.severity = severity;
    threat.signature.confidence = kHeuristicConfidence;
    threat.signature.source = "behavioral_analysis";
    threat.location.offset = 0;
    threat.location.length = file_size;
    threat.confidence = kHeuristicConfidence;
    threat.context = detail;
    threat.mitigation = MitigationFor(type);
    return threat;
}

std::vector<DetectedThreat> BehaviorAnalyzer::Analyze(const ScanContent& content,
                                                      const CancellationToken& token) const {
    std::vector<DetectedThreat> threats;
    const std::string& text = content.Text();
    size_t file_size = content.Bytes().size();

    double entropy = ShannonEntropy(content.Bytes(), sample_bytes_);
    if (entropy > thresholds_.entropy_bits_per_byte) {
        std::string detail = fmt::format("Content entropy {:.2f} bits/byte exceeds {:.2f}",
                                         entropy, thresholds_.entropy_bits_per_byte);
        threats.push_back(MakeThreat("High Entropy Content", ThreatType::OBFUSCATED_CODE,
                                     Severity::MEDIUM, detail, file_size));
    }
    if (token.IsCancelled()) return threats;

    size_t urls = CountUrls(text);
    if (urls > thresholds_.url_count) {
        threats.push_back(MakeThreat("Excessive URL References", ThreatType::PHISHING, Severity::MEDIUM,
                                     std::to_string(urls) + " URLs referenced in content", file_size));
    }
    if (token.IsCancelled()) return threats;

    std::string matched;
    if (SearchRegexBounded(text, api_call_regex_, &matched)) {
        threats.push_back(MakeThreat("Suspicious API Calls", ThreatType::MALWARE, Severity::HIGH,
                                     "Process injection API referenced: " + matched, file_size));
    }
    if (token.IsCancelled()) return threats;

    if (SearchRegexBounded(text, network_call_regex_, &matched, 1)) {
        threats.push_back(MakeThreat("Network Communication", ThreatType::BACKDOOR, Severity::MEDIUM,
                                     "Raw network call referenced: " + matched, file_size));
    }
    return threats;
}

} // namespace filesentry
