#include "privacy/PIIValidators.hpp"
#include "core/Util.hpp"
#include <algorithm>
#include <array>
#include <cctype>

namespace filesentry {
namespace pii {

std::string DigitsOnly(const std::string& value) {
    std::string digits;
    digits.reserve(value.size());
    for (char c : value) {
        if (std::isdigit(static_cast<unsigned char>(c))) {
            digits.push_back(c);
        }
    }
    return digits;
}

bool AllSameDigit(const std::string& digits) {
    return !digits.empty() &&
           std::all_of(digits.begin(), digits.end(), [&](char c) { return c == digits[0]; });
}

bool PassesLuhn(const std::string& digits) {
    if (digits.empty()) {
        return false;
    }
    int sum = 0;
    bool double_it = false;
    for (auto it = digits.rbegin(); it != digits.rend(); ++it) {
        if (!std::isdigit(static_cast<unsigned char>(*it))) {
            return false;
        }
        int digit = *it - '0';
        if (double_it) {
            digit *= 2;
            if (digit > 9) digit -= 9;
        }
        sum += digit;
        double_it = !double_it;
    }
    return sum % 10 == 0;
}

bool IsValidSSN(const std::string& value) {
    std::string digits = DigitsOnly(value);
    if (digits.size() != 9 || AllSameDigit(digits)) {
        return false;
    }

    int area = std::stoi(digits.substr(0, 3));
    int group = std::stoi(digits.substr(3, 2));
    int serial = std::stoi(digits.substr(5, 4));
    if (area == 0 || area == 666 || area >= 900) return false;
    if (group == 0) return false;
    if (serial == 0) return false;
    return true;
}

bool IsValidCreditCard(const std::string& value) {
    std::string digits = DigitsOnly(value);
    if (digits.size() < 13 || digits.size() > 19 || AllSameDigit(digits)) {
        return false;
    }
    return PassesLuhn(digits);
}

bool IsValidPhone(const std::string& value) {
    std::string digits = DigitsOnly(value);
    if (digits.size() == 11 && digits[0] == '1') {
        digits.erase(0, 1);
    }
    if (digits.size() != 10) {
        return false;
    }
    if (std::all_of(digits.begin(), digits.end(), [](char c) { return c == '0'; })) {
        return false;
    }

    auto valid_code = [](const std::string& code) {
        if (code[0] == '0' || code[0] == '1') return false;
        if (code[1] == '1' && code[2] == '1') return false;  // N11 service codes
        return true;
    };
    return valid_code(digits.substr(0, 3)) && valid_code(digits.substr(3, 3));
}

bool IsPlaceholderEmail(const std::string& value) {
    static const std::array<const char*, 5> kPlaceholders = {
        "test@test.com", "example@example.com", "user@example.com",
        "admin@admin.com", "noreply@noreply.com"
    };
    std::string lowered = ToLower(value);
    return std::any_of(kPlaceholders.begin(), kPlaceholders.end(),
                       [&](const char* p) { return lowered == p; });
}

bool IsValidEmail(const std::string& value) {
    size_t at = value.find('@');
    if (at == std::string::npos || at == 0 || value.find('@', at + 1) != std::string::npos) {
        return false;
    }
    size_t dot = value.find('.', at + 1);
    if (dot == std::string::npos || dot == at + 1 || dot + 1 >= value.size()) {
        return false;
    }
    if (std::any_of(value.begin(), value.end(), [](char c) { return std::isspace(static_cast<unsigned char>(c)); })) {
        return false;
    }
    return !IsPlaceholderEmail(value);
}

bool IsValidIPv4(const std::string& value) {
    static const std::array<const char*, 6> kNonPersonal = {
        "0.0.0.0", "127.0.0.1", "255.255.255.255",
        "192.168.1.1", "10.0.0.1", "172.16.0.1"
    };

    size_t start = 0;
    int octets = 0;
    while (start <= value.size()) {
        size_t end = value.find('.', start);
        if (end == std::string::npos) end = value.size();
        std::string part = value.substr(start, end - start);
        if (part.empty() || part.size() > 3 ||
            !std::all_of(part.begin(), part.end(), [](char c) { return std::isdigit(static_cast<unsigned char>(c)); })) {
            return false;
        }
        if (std::stoi(part) > 255) {
            return false;
        }
        ++octets;
        start = end + 1;
        if (end == value.size()) break;
    }
    if (octets != 4) {
        return false;
    }
    return std::none_of(kNonPersonal.begin(), kNonPersonal.end(),
                        [&](const char* ip) { return value == ip; });
}

bool IsValidBankAccount(const std::string& value) {
    std::string digits = DigitsOnly(value);
    return digits.size() >= 8 && digits.size() <= 17 && !AllSameDigit(digits);
}

} // namespace pii
} // namespace filesentry
