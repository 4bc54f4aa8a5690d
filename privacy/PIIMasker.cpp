#include "privacy/PIIMasker.hpp"
#include <cctype>

namespace filesentry {

namespace {

bool IsDigit(char c) {
    return std::isdigit(static_cast<unsigned char>(c)) != 0;
}

std::string MaskDigitsKeepLast(const std::string& raw, size_t keep) {
    size_t total_digits = 0;
    for (char c : raw) {
        if (IsDigit(c)) ++total_digits;
    }

    std::string masked = raw;
    size_t seen = 0;
    for (char& c : masked) {
        if (!IsDigit(c)) continue;
        ++seen;
        if (seen + keep <= total_digits) {
            c = '*';
        }
    }
    return masked;
}

} // namespace

std::string MaskPII(PIIType type, const std::string& raw) {
    switch (type) {
        case PIIType::SSN:
        case PIIType::CREDIT_CARD:
            return MaskDigitsKeepLast(raw, 4);

        case PIIType::PHONE:
            return MaskDigitsKeepLast(raw, 0);

        case PIIType::EMAIL: {
            size_t at = raw.find('@');
            if (at == std::string::npos || at == 0) {
                return std::string(raw.size(), '*');
            }
            return raw.substr(0, 1) + std::string(at - 1, '*') + raw.substr(at);
        }

        case PIIType::BANK_ACCOUNT:
            if (raw.size() <= 4) {
                return std::string(raw.size(), '*');
            }
            return std::string(raw.size() - 4, '*') + raw.substr(raw.size() - 4);

        default:
            return std::string(raw.size(), '*');
    }
}

} // namespace filesentry
