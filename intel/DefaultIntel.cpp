#include "intel/ThreatIntel.hpp"
#include "core/Util.hpp"

namespace filesentry {

namespace {

ThreatSignature Signature(const char* id, const char* name, ThreatType type, const char* pattern,
                          const char* description, Severity severity, uint32_t confidence) {
    ThreatSignature signature;
    signature.id = id;
    signature.name = name;
    signature.type = type;
    signature.pattern = pattern;
    signature.description = description;
    signature.severity = severity;
    signature.confidence = confidence;
    signature.source = "builtin";
    return signature;
}

PIIPattern Pattern(const char* id, const char* name, PIIType type, const char* pattern, Severity severity,
                   const char* locale, std::vector<std::string> examples,
                   std::vector<std::string> false_positives) {
    PIIPattern p;
    p.id = id;
    p.name = name;
    p.type = type;
    p.pattern = pattern;
    p.severity = severity;
    p.locale = locale;
    p.description = name;
    p.examples = std::move(examples);
    p.false_positives = std::move(false_positives);
    return p;
}

} // namespace

ThreatIntelDatabase DefaultThreatIntel() {
    ThreatIntelDatabase db;
    db.version = "builtin-1.0.0";
    db.source = "builtin";
    db.last_updated = NowMillis();

    db.signatures = {
        Signature("mal_001", "JavaScript Obfuscation", ThreatType::OBFUSCATED_CODE,
                  R"((eval\s*\(|Function\s*\(|\[\s*["']constructor["']\s*\]|\$\$\w+\$\$))",
                  "Dynamic code evaluation commonly used to hide payloads",
                  Severity::HIGH, 85),
        Signature("mal_003", "Suspicious Script Tags", ThreatType::SUSPICIOUS_SCRIPT,
                  R"(<script[^>]*>.*?(document\.write|eval\s*\(|innerHTML\s*=|outerHTML\s*=).*?</script>)",
                  "Inline script that rewrites the document",
                  Severity::HIGH, 90),
        Signature("mal_004", "PowerShell Encoded Command", ThreatType::MALWARE,
                  R"((powershell.*-encodedcommand|powershell.*-enc\b|powershell.*-e\s+[A-Za-z0-9+/=]{20,}))",
                  "PowerShell invoked with an encoded command",
                  Severity::HIGH, 88),
        Signature("mal_005", "Suspicious Base64", ThreatType::OBFUSCATED_CODE,
                  R"([A-Za-z0-9+/]{100,}={0,2})",
                  "Long base64 run that may carry an encoded payload",
                  Severity::MEDIUM, 70),
        Signature("mal_006", "Ransomware Indicators", ThreatType::RANSOMWARE,
                  R"((your files (have been|are) encrypted|ransom note|pay the ransom|bitcoin wallet|decrypt(ion)? key|\.locked\b))",
                  "Ransom note phrasing or encrypted-file markers",
                  Severity::CRITICAL, 80),
        Signature("mal_007", "Keylogger Patterns", ThreatType::SPYWARE,
                  R"((keylogger|keystroke|getasynckey|setwindowshook|password.*capture))",
                  "Keystroke capture primitives",
                  Severity::HIGH, 85),
        Signature("mal_008", "Network Backdoor", ThreatType::BACKDOOR,
                  R"((reverse.*shell|bind.*shell|nc\s.*-l.*-p|netcat.*listen))",
                  "Shell bound to a network listener",
                  Severity::CRITICAL, 92),
        Signature("mal_009", "Cryptocurrency Mining", ThreatType::MALWARE,
                  R"((coinhive|cryptonight|stratum\+tcp://|mining.*pool))",
                  "Browser or host cryptocurrency miner",
                  Severity::MEDIUM, 80),
        Signature("mal_010", "JavaScript Decoding Primitives", ThreatType::OBFUSCATED_CODE,
                  R"((atob\s*\(|String\.fromCharCode\s*\(|unescape\s*\())",
                  "Runtime decoding of embedded strings",
                  Severity::MEDIUM, 75),
    };

    // EICAR anti-virus test file.
    MalwareHash eicar;
    eicar.hash = "275a021bbfb6489e54d471899f7db9d1663fc695ec2fe2a2c4538aabf651fd0f";
    eicar.hash_type = "sha256";
    eicar.malware_family = "EICAR-Test-File";
    eicar.threat_type = ThreatType::MALWARE;
    eicar.severity = Severity::HIGH;
    eicar.source = "builtin";
    eicar.description = "EICAR anti-malware test file";
    db.malware_hashes.push_back(eicar);

    MalwareHash eicar_md5 = eicar;
    eicar_md5.hash = "44d88612fea8a8f36de82e1278abb02f";
    eicar_md5.hash_type = "md5";
    db.malware_hashes.push_back(eicar_md5);

    db.pii_patterns = {
        Pattern("ssn_us", "US Social Security Number", PIIType::SSN,
                R"(\b(?!000|666|9[0-9]{2})[0-9]{3}-?(?!00)[0-9]{2}-?(?!0000)[0-9]{4}\b)",
                Severity::CRITICAL, "US", {"123-45-6789", "123456789"}, {"000-00-0000", "123-00-0000"}),
        Pattern("credit_card", "Credit card number", PIIType::CREDIT_CARD,
                R"(\b(?:4[0-9]{12}(?:[0-9]{3})?|5[1-5][0-9]{14}|3[47][0-9]{13}|3[0-9]{13}|6(?:011|5[0-9]{2})[0-9]{12})\b)",
                Severity::CRITICAL, "", {"4111111111111111", "5555555555554444"},
                {"0000000000000000", "1111111111111111"}),
        Pattern("phone_us", "US phone number", PIIType::PHONE,
                R"(\b(?:\+?1[-\s]?)?\(?([0-9]{3})\)?[-\s]?([0-9]{3})[-\s]?([0-9]{4})\b)",
                Severity::MEDIUM, "US", {"(555) 123-4567", "+1-555-123-4567"},
                {"000-000-0000", "123-456-7890"}),
        Pattern("email", "Email address", PIIType::EMAIL,
                R"(\b[A-Za-z0-9._%+-]+@[A-Za-z0-9.-]+\.[A-Za-z]{2,}\b)",
                Severity::MEDIUM, "", {"user@example.com", "test.email@domain.org"},
                {"test@test.com", "example@example.com"}),
        Pattern("ip_address", "IP address", PIIType::IP_ADDRESS,
                R"(\b(?:[0-9]{1,3}\.){3}[0-9]{1,3}\b)",
                Severity::LOW, "", {"192.168.1.1", "10.0.0.1"}, {"0.0.0.0", "127.0.0.1"}),
        Pattern("drivers_license_us", "US driver's license number", PIIType::DRIVERS_LICENSE,
                R"(\b[A-Z]{1,2}[0-9]{6,8}\b)",
                Severity::HIGH, "US", {"A1234567", "CA12345678"}, {}),
        Pattern("bank_account", "Bank account number", PIIType::BANK_ACCOUNT,
                R"(\b[0-9]{8,17}\b)",
                Severity::CRITICAL, "", {"123456789012"}, {"00000000", "11111111"}),
        Pattern("date_of_birth", "Date of birth", PIIType::DATE_OF_BIRTH,
                R"(\b(?:0[1-9]|1[0-2])[/-](?:0[1-9]|[12][0-9]|3[01])[/-](?:19|20)[0-9]{2}\b)",
                Severity::HIGH, "", {"01/15/1990", "12-25-1985"}, {"01/01/1900", "12/31/2099"}),
        Pattern("passport", "Passport number", PIIType::PASSPORT,
                R"(\b[A-Z]{1,2}[0-9]{6,9}\b)",
                Severity::HIGH, "", {"A12345678", "US123456789"}, {}),
        Pattern("tax_id", "Tax identification number", PIIType::TAX_ID,
                R"(\b[0-9]{2}-[0-9]{7}\b)",
                Severity::CRITICAL, "US", {"12-3456789"}, {"00-0000000"}),
    };
    return db;
}

} // namespace filesentry
