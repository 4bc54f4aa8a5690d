#include "engine/StructureAnalyzer.hpp"
#include <algorithm>
#include <fmt/format.h>

namespace filesentry {

const std::vector<EmbeddedMagic>& StructureAnalyzer::KnownMagics() {
    static const std::vector<EmbeddedMagic> kMagics = {
        {"ZIP",  "Embedded ZIP Archive",    {0x50, 0x4B, 0x03, 0x04}, Severity::MEDIUM},
        {"PE",   "Embedded PE Executable",  {0x4D, 0x5A},             Severity::HIGH},
        {"ELF",  "Embedded ELF Executable", {0x7F, 0x45, 0x4C, 0x46}, Severity::HIGH},
        {"JPEG", "Embedded JPEG",           {0xFF, 0xD8, 0xFF},       Severity::MEDIUM},
        {"PNG",  "Embedded PNG",            {0x89, 0x50, 0x4E, 0x47}, Severity::MEDIUM},
    };
    return kMagics;
}

StructureAnalyzer::StructureAnalyzer(size_t header_tolerance)
    : header_tolerance_(header_tolerance) {}

bool StructureAnalyzer::IsPlausiblePE(const std::vector<uint8_t>& bytes, size_t offset) {
    constexpr size_t kLfanewOffset = 0x3C;
    if (offset + kLfanewOffset + 4 > bytes.size()) {
        return false;
    }
    uint32_t lfanew = static_cast<uint32_t>(bytes[offset + kLfanewOffset]) |
                      (static_cast<uint32_t>(bytes[offset + kLfanewOffset + 1]) << 8) |
                      (static_cast<uint32_t>(bytes[offset + kLfanewOffset + 2]) << 16) |
                      (static_cast<uint32_t>(bytes[offset + kLfanewOffset + 3]) << 24);
    size_t pe = offset + lfanew;
    if (lfanew < 0x40 || pe < offset || pe + 4 > bytes.size()) {
        return false;
    }
    return bytes[pe] == 'P' && bytes[pe + 1] == 'E' && bytes[pe + 2] == 0 && bytes[pe + 3] == 0;
}

std::vector<DetectedThreat> StructureAnalyzer::Analyze(const ScanContent& content,
                                                       const CancellationToken& token) const {
    std::vector<DetectedThreat> threats;
    const auto& bytes = content.Bytes();

    for (const auto& magic : KnownMagics()) {
        if (token.IsCancelled()) {
            break;
        }

        size_t hits = 0;
        auto it = bytes.begin();
        while (hits < kMaxHitsPerMagic) {
            it = std::search(it, bytes.end(), magic.magic.begin(), magic.magic.end());
            if (it == bytes.end()) {
                break;
            }
            size_t offset = static_cast<size_t>(it - bytes.begin());
            ++it;

            if (offset <= header_tolerance_) {
                continue;
            }
            if (magic.type == "PE" && !IsPlausiblePE(bytes, offset)) {
                continue;
            }

            std::string pattern;
            for (uint8_t b : magic.magic) {
                pattern += fmt::format("{:02x}", b);
            }

            DetectedThreat threat;
            threat.id = fmt::format("embedded_{}_{}", magic.type, offset);
            threat.signature.id = "embedded_" + magic.type;
            threat.signature.name = magic.name;
            threat.signature.type = ThreatType::EMBEDDED_EXECUTABLE;
            threat.signature.pattern = pattern;
            threat.signature.description = "Embedded " + magic.type + " file detected";
            threat.signature.severity = magic.severity;
            threat.signature.confidence = kStructureConfidence;
            threat.signature.source = "structure_analysis";
            threat.location.offset = offset;
            threat.location.length = magic.magic.size();
            threat.location.in_content = true;
            if (offset < content.Text().size()) {
                threat.location.line = content.LineAt(offset);
                threat.location.column = content.ColumnAt(offset);
            }
            threat.confidence = kStructureConfidence;
            threat.context = fmt::format("Embedded {} file found at offset {}", magic.type, offset);
            threat.mitigation = MitigationFor(ThreatType::EMBEDDED_EXECUTABLE);
            threats.push_back(std::move(threat));
            ++hits;
        }
    }
    return threats;
}

} // namespace filesentry
