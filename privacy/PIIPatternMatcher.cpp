#include "privacy/PIIPatternMatcher.hpp"
#include "privacy/PIIMasker.hpp"
#include "privacy/PIIValidators.hpp"
#include "engine/RegexScan.hpp"
#include "core/Logger.hpp"
#include "core/Util.hpp"
#include <algorithm>
#include <array>
#include <set>
#include <utility>

namespace filesentry {

PIIPatternMatcher::PIIPatternMatcher(const std::vector<PIIPattern>& patterns) {
    for (const auto& pattern : patterns) {
        if (!pattern.enabled) {
            continue;
        }
        try {
            compiled_.push_back(CompiledPattern{
                pattern,
                std::regex(pattern.pattern,
                           std::regex::ECMAScript | std::regex::icase | std::regex::optimize)
            });
        } catch (const std::regex_error& ex) {
            ++rejected_;
            LOG_WARN("PIIPatternMatcher: skipping pattern {} with invalid regex: {}", pattern.id, ex.what());
        }
    }
}

bool PIIPatternMatcher::Validate(PIIType type, const std::string& value) {
    switch (type) {
        case PIIType::SSN:          return pii::IsValidSSN(value);
        case PIIType::CREDIT_CARD:  return pii::IsValidCreditCard(value);
        case PIIType::PHONE:        return pii::IsValidPhone(value);
        case PIIType::EMAIL:        return pii::IsValidEmail(value);
        case PIIType::IP_ADDRESS:   return pii::IsValidIPv4(value);
        case PIIType::BANK_ACCOUNT: return pii::IsValidBankAccount(value);
        default:                    return true;
    }
}

uint32_t PIIPatternMatcher::BaseConfidence(PIIType type) {
    switch (type) {
        case PIIType::SSN:
        case PIIType::CREDIT_CARD: return 95;
        case PIIType::EMAIL:       return 90;
        case PIIType::PHONE:       return 85;
        case PIIType::IP_ADDRESS:  return 70;
        default:                   return 80;
    }
}

bool PIIPatternMatcher::IsFalsePositive(const CompiledPattern& entry, const std::string& value) const {
    std::string lowered = ToLower(value);
    return std::any_of(entry.pattern.false_positives.begin(), entry.pattern.false_positives.end(),
                       [&](const std::string& fp) { return ToLower(fp) == lowered; });
}

uint32_t PIIPatternMatcher::Confidence(PIIType type, const std::string& text, size_t offset) const {
    static const std::array<const char*, 12> kKeywords = {
        "ssn", "social", "credit", "card", "phone", "email",
        "account", "birth", "dob", "passport", "license", "tax"
    };

    uint32_t confidence = BaseConfidence(type);
    size_t start = offset > kContextRadius ? offset - kContextRadius : 0;
    std::string before = ToLower(text.substr(start, offset - start));
    bool keyword = std::any_of(kKeywords.begin(), kKeywords.end(),
                               [&](const char* k) { return before.find(k) != std::string::npos; });
    if (keyword) {
        confidence += 10;
    }
    return std::min<uint32_t>(100, confidence);
}

std::vector<PIIFinding> PIIPatternMatcher::Scan(const ScanContent& content,
                                                const CancellationToken& token) const {
    const std::string& text = content.Text();
    std::vector<PIIFinding> accepted;
    std::set<std::string> dedup;

    for (const auto& entry : compiled_) {
        if (token.IsCancelled()) {
            break;
        }

        size_t count = 0;
        ScanRegexBounded(text, entry.regex, [&](size_t offset, const std::smatch& match) {
            std::string raw = match.str(0);
            if (IsFalsePositive(entry, raw) || !Validate(entry.pattern.type, raw)) {
                return true;
            }

            std::string masked = MaskPII(entry.pattern.type, raw);
            std::string key = PIITypeToString(entry.pattern.type) + ":" + std::to_string(offset) + ":" + masked;
            if (!dedup.insert(key).second) {
                return true;
            }

            PIIFinding finding;
            finding.id = entry.pattern.id + ":" + std::to_string(offset);
            finding.type = entry.pattern.type;
            finding.masked_value = std::move(masked);
            finding.confidence = Confidence(entry.pattern.type, text, offset);
            finding.location.offset = offset;
            finding.location.length = raw.size();
            finding.location.line = content.LineAt(offset);
            finding.location.column = content.ColumnAt(offset);
            finding.severity = entry.pattern.severity;
            finding.pattern_id = entry.pattern.id;
            accepted.push_back(std::move(finding));

            return ++count < kMaxFindingsPerPattern;
        }, &token);
    }

    // A validated card number also matches the bank account pattern; the
    // card finding covers that span.
    std::set<std::pair<size_t, size_t>> card_spans;
    for (const auto& finding : accepted) {
        if (finding.type == PIIType::CREDIT_CARD) {
            card_spans.emplace(finding.location.offset, finding.location.length);
        }
    }
    accepted.erase(std::remove_if(accepted.begin(), accepted.end(), [&](const PIIFinding& finding) {
        return finding.type == PIIType::BANK_ACCOUNT &&
               card_spans.count({finding.location.offset, finding.location.length}) > 0;
    }), accepted.end());

    // Context windows are cut from a copy of the sample in which every
    // accepted span is already masked, so no raw value survives in them.
    std::string redacted = text;
    for (const auto& finding : accepted) {
        const auto& loc = finding.location;
        const std::string& masked = finding.masked_value;
        if (masked.size() == loc.length) {
            redacted.replace(loc.offset, loc.length, masked);
        } else {
            redacted.replace(loc.offset, loc.length, std::string(loc.length, '*'));
        }
    }

    for (auto& finding : accepted) {
        size_t offset = finding.location.offset;
        size_t start = offset > kContextRadius ? offset - kContextRadius : 0;
        size_t end = std::min(redacted.size(), offset + finding.location.length + kContextRadius);
        finding.context = redacted.substr(start, offset - start) + finding.masked_value +
                          redacted.substr(offset + finding.location.length,
                                          end - offset - finding.location.length);
    }
    return accepted;
}

} // namespace filesentry
