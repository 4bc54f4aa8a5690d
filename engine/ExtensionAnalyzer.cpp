#include "engine/ExtensionAnalyzer.hpp"
#include "core/Util.hpp"
#include <cctype>

namespace filesentry {

namespace {

bool IsAsciiAlpha(char c) {
    return std::isalpha(static_cast<unsigned char>(c)) != 0;
}

// Length of the trailing ".[a-z]{2,4}" segment ending at `end`, or 0.
size_t ExtensionSegmentLength(const std::string& name, size_t end) {
    size_t letters = 0;
    while (letters < end && IsAsciiAlpha(name[end - 1 - letters])) {
        ++letters;
        if (letters > 4) return 0;
    }
    if (letters < 2 || letters == end || name[end - 1 - letters] != '.') {
        return 0;
    }
    return letters + 1;
}

const std::set<std::string>& BenignCompoundExtensions() {
    static const std::set<std::string> kCompound = {".tar.gz", ".tar.bz2", ".tar.xz"};
    return kCompound;
}

} // namespace

ExtensionAnalyzer::ExtensionAnalyzer()
    : suspicious_{".exe", ".scr", ".bat", ".cmd", ".com", ".pif", ".vbs", ".js", ".jar",
                  ".ps1", ".psm1", ".psd1", ".dll", ".sys", ".drv", ".ocx", ".cpl", ".msi",
                  ".msp", ".mst", ".scf", ".lnk", ".inf", ".reg"} {}

bool ExtensionAnalyzer::IsSuspiciousExtension(const std::string& extension) const {
    return suspicious_.count(ToLower(extension)) > 0;
}

bool ExtensionAnalyzer::HasDoubleExtension(const std::string& file_name) {
    std::string name = ToLower(file_name);
    size_t last = ExtensionSegmentLength(name, name.size());
    if (last == 0) return false;
    size_t first = ExtensionSegmentLength(name, name.size() - last);
    if (first == 0) return false;
    return BenignCompoundExtensions().count(name.substr(name.size() - last - first)) == 0;
}

std::vector<DetectedThreat> ExtensionAnalyzer::Analyze(const ScanContent& content,
                                                       const CancellationToken& /*token*/) const {
    std::vector<DetectedThreat> threats;
    std::string name = ToLower(content.Metadata().file_name);
    size_t dot = name.rfind('.');
    if (dot == std::string::npos) {
        return threats;
    }

    std::string extension = name.substr(dot);
    if (IsSuspiciousExtension(extension)) {
        DetectedThreat threat;
        threat.id = "ext_" + extension;
        threat.signature.id = "ext_" + extension;
        threat.signature.name = "Suspicious File Extension";
        threat.signature.type = ThreatType::SUSPICIOUS_PATTERN;
        threat.signature.pattern = "\\" + extension + "$";
        threat.signature.description = "File has suspicious extension: " + extension;
        threat.signature.severity = Severity::HIGH;
        threat.signature.confidence = 80;
        threat.signature.source = "extension_analysis";
        threat.location.offset = dot;
        threat.location.length = extension.size();
        threat.confidence = 80;
        threat.context = "File extension " + extension + " is commonly used for malware";
        threat.mitigation = "Block execution and scan for embedded threats";
        threats.push_back(std::move(threat));
    }

    if (HasDoubleExtension(name)) {
        size_t first_dot = dot > 0 ? name.rfind('.', dot - 1) : std::string::npos;
        size_t start = first_dot == std::string::npos ? dot : first_dot;

        DetectedThreat threat;
        threat.id = "double_ext_" + name.substr(start);
        threat.signature.id = "double_extension";
        threat.signature.name = "Double File Extension";
        threat.signature.type = ThreatType::SUSPICIOUS_PATTERN;
        threat.signature.pattern = "\\.[a-z]{2,4}\\.[a-z]{2,4}$";
        threat.signature.description = "File has double extension (potential disguise)";
        threat.signature.severity = Severity::MEDIUM;
        threat.signature.confidence = 70;
        threat.signature.source = "extension_analysis";
        threat.location.offset = start;
        threat.location.length = name.size() - start;
        threat.confidence = 70;
        threat.context = "Double extensions can be used to disguise malware";
        threat.mitigation = "Additional scanning recommended";
        threats.push_back(std::move(threat));
    }
    return threats;
}

} // namespace filesentry
