#pragma once

#include <algorithm>
#include <cctype>
#include <cmath>
#include <string>
#include <string_view>

namespace devscore::config {

// String trimming utilities
inline void ltrim(std::string& s) {
    s.erase(s.begin(),
            std::find_if(s.begin(), s.end(), [](unsigned char ch) { return !std::isspace(ch); }));
}

inline void rtrim(std::string& s) {
    s.erase(std::find_if(s.rbegin(), s.rend(), [](unsigned char ch) { return !std::isspace(ch); })
                .base(),
            s.end());
}

inline void trim(std::string& s) {
    ltrim(s);
    rtrim(s);
}

// State labels compare case-insensitively with surrounding whitespace ignored,
// so "In Progress", "in progress " and "IN PROGRESS" are one label.
inline std::string normalize_label(std::string_view label) {
    std::string out(label);
    trim(out);
    std::transform(out.begin(), out.end(), out.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return out;
}

inline bool is_finite_non_negative(double v) {
    return std::isfinite(v) && v >= 0.0;
}

} // namespace devscore::config
