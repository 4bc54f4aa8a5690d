#pragma once

#include "engine/ScanContent.hpp"
#include <functional>
#include <regex>
#include <string>

namespace filesentry {

// Window size bounds the backtracking depth of std::regex on long runs.
constexpr size_t kRegexWindowBytes = 2048;
constexpr size_t kRegexWindowOverlap = 256;

using RegexMatchCallback = std::function<bool(size_t offset, const std::smatch& match)>;

// Runs `regex` line by line over `text`. Lines longer than the window are
// cut into overlapping windows; a match touching the cut edge is left for
// the next window. Matches never overlap each other, as with a single
// regex iterator. `on_match` receives absolute offsets and returns false to
// stop the scan.
void ScanRegexBounded(const std::string& text,
                      const std::regex& regex,
                      const RegexMatchCallback& on_match,
                      const CancellationToken* token = nullptr);

// First match only, same windowing as ScanRegexBounded.
bool SearchRegexBounded(const std::string& text, const std::regex& regex, std::string* matched_group = nullptr,
                        size_t group = 0);

} // namespace filesentry
