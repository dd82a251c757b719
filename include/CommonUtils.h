#pragma once

#include <algorithm>
#include <cctype>
#include <charconv>
#include <cmath>
#include <string>
#include <string_view>

namespace CommonUtils {

inline std::string trim(std::string_view s) {
    const size_t b = s.find_first_not_of(" \t\r\n");
    if (b == std::string::npos) return "";
    const size_t e = s.find_last_not_of(" \t\r\n");
    return std::string(s.substr(b, e - b + 1));
}

inline std::string toLower(std::string_view s) {
    std::string out(s);
    std::transform(out.begin(), out.end(), out.begin(), [](unsigned char c) {
        return static_cast<char>(std::tolower(c));
    });
    return out;
}

inline bool iequals(std::string_view a, std::string_view b) {
    if (a.size() != b.size()) return false;
    for (size_t i = 0; i < a.size(); ++i) {
        if (std::tolower(static_cast<unsigned char>(a[i])) != std::tolower(static_cast<unsigned char>(b[i]))) {
            return false;
        }
    }
    return true;
}

// Parses the whole token as a finite double; a leading '+' is accepted.
inline bool parseFiniteDouble(std::string_view token, double& out) {
    std::string cleaned = trim(token);
    if (!cleaned.empty() && cleaned.front() == '+') cleaned.erase(cleaned.begin());
    if (cleaned.empty()) return false;

    const char* b = cleaned.data();
    const char* e = b + cleaned.size();
    double parsed = 0.0;
    auto [p, ec] = std::from_chars(b, e, parsed, std::chars_format::general);
    if (ec != std::errc{} || p != e || !std::isfinite(parsed)) return false;
    out = parsed;
    return true;
}

} // namespace CommonUtils
