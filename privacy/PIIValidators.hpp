#pragma once

#include <string>

namespace filesentry {
namespace pii {

std::string DigitsOnly(const std::string& value);
bool AllSameDigit(const std::string& digits);

bool PassesLuhn(const std::string& digits);

// 9 digits, not a repeated digit, area not 000/666/9xx, group not 00,
// serial not 0000.
bool IsValidSSN(const std::string& value);

// 13 to 19 digits passing the Luhn checksum.
bool IsValidCreditCard(const std::string& value);

// NANP numbers: optional leading 1, area and exchange codes must start
// with 2-9 and must not be N11 service codes.
bool IsValidPhone(const std::string& value);

bool IsPlaceholderEmail(const std::string& value);
bool IsValidEmail(const std::string& value);

// Dotted quad with octets 0-255 that is not a well-known non-personal address.
bool IsValidIPv4(const std::string& value);

bool IsValidBankAccount(const std::string& value);

} // namespace pii
} // namespace filesentry
