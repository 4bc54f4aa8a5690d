#pragma once

#include <nlohmann/json_fwd.hpp>
#include <cstdint>
#include <string>
#include <vector>

namespace filesentry {

uint64_t NowMillis();
std::string TimestampToISO8601(uint64_t ms_epoch);

// RFC 4122 version 4 identifier from OpenSSL's CSPRNG.
std::string GenerateUUID();

std::string ToLower(std::string value);
std::string HexEncode(const unsigned char* data, size_t length);

// Serializes with invalid UTF-8 replaced by U+FFFD. File names and other
// caller-supplied strings are not guaranteed to be valid UTF-8.
std::string DumpJson(const nlohmann::json& value, int indent = -1);
std::string ToValidUtf8(const std::string& text);

constexpr uint64_t kMillisPerDay = 24ull * 60 * 60 * 1000;

} // namespace filesentry
