#pragma once

#include "privacy/PIITypes.hpp"
#include <string>

namespace filesentry {

// Masked form of a raw PII value. Output depends only on the type and the
// shape of the input; the masked value keeps the input length.
//   ssn, credit_card  every digit except the last four becomes '*'
//   phone             every digit becomes '*'
//   email             first character of the local part kept, rest '*'
//   bank_account      last four characters kept
//   other types       every character becomes '*'
std::string MaskPII(PIIType type, const std::string& raw);

} // namespace filesentry
