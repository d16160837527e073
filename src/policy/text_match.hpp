#pragma once

#include <algorithm>
#include <cctype>
#include <optional>
#include <string>
#include <vector>

namespace warden::policy::text {

inline constexpr const char* kWhitespace = " \t\n\v\f\r";

inline std::string lowercase(std::string value) {
    std::transform(value.begin(), value.end(), value.begin(),
                   [](const unsigned char c) {
                       return static_cast<char>(std::tolower(c));
                   });
    return value;
}

inline std::string trim(const std::string& value) {
    const auto first = value.find_first_not_of(kWhitespace);
    if (first == std::string::npos) {
        return "";
    }
    const auto last = value.find_last_not_of(kWhitespace);
    return value.substr(first, last - first + 1);
}

inline bool starts_with(const std::string& value, const std::string& prefix) {
    return value.size() >= prefix.size() &&
           value.compare(0, prefix.size(), prefix) == 0;
}

// First pattern (in table order) that occurs in `lowered`. Patterns are
// lowercased before matching, so `lowered` must already be lowercase.
inline std::optional<std::string> first_substring_match(
    const std::string& lowered, const std::vector<std::string>& patterns) {
    for (const auto& pattern : patterns) {
        if (pattern.empty()) {
            continue;
        }
        if (lowered.find(lowercase(pattern)) != std::string::npos) {
            return pattern;
        }
    }
    return std::nullopt;
}

}  // namespace warden::policy::text
