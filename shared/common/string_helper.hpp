#pragma once
#include <algorithm>
#include <cctype>
#include <cerrno>
#include <cmath>
#include <cstdlib>
#include <optional>
#include <string>
#include <string_view>


inline std::string toLower(std::string_view s) {
    std::string out(s);
    std::transform(out.begin(), out.end(), out.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return out;
}

inline std::string trim(std::string_view s) {
    auto first = s.find_first_not_of(" \t\r\n\v\f");
    if (first == std::string_view::npos) return {};
    auto last = s.find_last_not_of(" \t\r\n\v\f");
    return std::string(s.substr(first, last - first + 1));
}

// Decimal or scientific notation only; hex, inf and nan are not numbers here.
inline std::optional<double> parseNumber(std::string_view text) {
    std::string s = trim(text);
    if (s.empty()) return std::nullopt;

    bool digit = false;
    for (char c : s) {
        if (std::isdigit(static_cast<unsigned char>(c))) { digit = true; continue; }
        if (c == '+' || c == '-' || c == '.' || c == 'e' || c == 'E') continue;
        return std::nullopt;
    }
    if (!digit) return std::nullopt;

    errno = 0;
    char* end = nullptr;
    double v = std::strtod(s.c_str(), &end);
    if (end != s.c_str() + s.size() || errno == ERANGE) return std::nullopt;
    return v;
}

// Whole numbers inside the long long range only.
inline std::optional<long long> toInteger(double v) {
    // 2^63 is exact as a double; the range is [-2^63, 2^63)
    constexpr double kLimit = 9223372036854775808.0;
    if (!(v >= -kLimit && v < kLimit) || std::trunc(v) != v) return std::nullopt;
    return static_cast<long long>(v);
}

// Optional sign and decimal digits only, within the long long range.
inline std::optional<long long> parseInteger(std::string_view text) {
    std::string s = trim(text);
    if (s.empty()) return std::nullopt;
    size_t i = (s[0] == '+' || s[0] == '-') ? 1 : 0;
    if (i == s.size()) return std::nullopt;
    for (; i < s.size(); ++i) {
        if (!std::isdigit(static_cast<unsigned char>(s[i]))) return std::nullopt;
    }

    errno = 0;
    char* end = nullptr;
    long long v = std::strtoll(s.c_str(), &end, 10);
    if (end != s.c_str() + s.size() || errno == ERANGE) return std::nullopt;
    return v;
}
