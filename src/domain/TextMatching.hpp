/**
 * @file TextMatching.hpp
 * @brief Case-insensitive string helpers shared by the matching and scoring rules.
 */

#pragma once

#include <algorithm>
#include <cctype>
#include <string>
#include <vector>

namespace trialguard::domain {

/**
 * @brief Lower-cases and trims surrounding whitespace.
 */
inline std::string Normalize(const std::string& input) {
    const auto first = std::find_if_not(input.begin(), input.end(), [](unsigned char c) { return std::isspace(c); });
    const auto last = std::find_if_not(input.rbegin(), input.rend(), [](unsigned char c) { return std::isspace(c); }).base();
    std::string out;
    if (first >= last) return out;
    out.reserve(static_cast<size_t>(last - first));
    for (auto it = first; it != last; ++it) {
        out.push_back(static_cast<char>(std::tolower(static_cast<unsigned char>(*it))));
    }
    return out;
}

/**
 * @brief Lower-cases without trimming.
 */
inline std::string ToLower(const std::string& input) {
    std::string out = input;
    std::transform(out.begin(), out.end(), out.begin(), [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return out;
}

/**
 * @brief True if either already-normalized string contains the other.
 *
 * Two empty strings never match here; callers handle equality first.
 */
inline bool ContainsEitherWay(const std::string& a, const std::string& b) {
    if (a.empty() || b.empty()) return false;
    return a.find(b) != std::string::npos || b.find(a) != std::string::npos;
}

/**
 * @brief Case-insensitive containment of @p needle inside @p haystack.
 */
inline bool ContainsIgnoreCase(const std::string& haystack, const std::string& needle) {
    return ToLower(haystack).find(ToLower(needle)) != std::string::npos;
}

/**
 * @brief Number of UTF-8 code points; continuation bytes are not counted.
 */
inline size_t CodePointCount(const std::string& text) {
    return static_cast<size_t>(std::count_if(text.begin(), text.end(), [](unsigned char c) {
        return (c & 0xC0) != 0x80;
    }));
}

inline bool ContainsAny(const std::string& lowered, const std::vector<std::string>& needles) {
    for (const auto& needle : needles) {
        if (lowered.find(needle) != std::string::npos) return true;
    }
    return false;
}

} // namespace trialguard::domain
