#include "engine/RegexScan.hpp"
#include <algorithm>

namespace filesentry {

void ScanRegexBounded(const std::string& text,
                      const std::regex& regex,
                      const RegexMatchCallback& on_match,
                      const CancellationToken* token) {
    size_t frontier = 0;
    size_t line_start = 0;

    while (line_start <= text.size()) {
        size_t line_end = text.find('\n', line_start);
        if (line_end == std::string::npos) {
            line_end = text.size();
        }

        size_t window_start = line_start;
        while (true) {
            size_t window_end = std::min(line_end, window_start + kRegexWindowBytes);
            bool cut = window_end < line_end;

            auto flags = std::regex_constants::match_default;
            if (window_start > 0) {
                flags |= std::regex_constants::match_prev_avail;
            }

            std::sregex_iterator it(text.begin() + static_cast<std::ptrdiff_t>(window_start),
                                    text.begin() + static_cast<std::ptrdiff_t>(window_end),
                                    regex, flags);
            for (; it != std::sregex_iterator(); ++it) {
                size_t length = static_cast<size_t>(it->length(0));
                size_t offset = window_start + static_cast<size_t>(it->position(0));
                if (length == 0 || offset < frontier) {
                    continue;
                }
                if (cut && offset + length == window_end) {
                    continue;
                }
                frontier = offset + length;
                if (!on_match(offset, *it)) {
                    return;
                }
            }

            if (token && token->IsCancelled()) {
                return;
            }
            if (!cut) {
                break;
            }
            window_start = window_end - kRegexWindowOverlap;
        }

        if (line_end == text.size()) {
            break;
        }
        line_start = line_end + 1;
    }
}

bool SearchRegexBounded(const std::string& text, const std::regex& regex, std::string* matched_group,
                        size_t group) {
    bool found = false;
    ScanRegexBounded(text, regex, [&](size_t, const std::smatch& match) {
        found = true;
        if (matched_group) {
            *matched_group = match.str(group);
        }
        return false;
    });
    return found;
}

} // namespace filesentry
