#pragma once

#include <cctype>
#include <cmath>
#include <cstdio>
#include <cstdlib>
#include <optional>
#include <string>
#include <vector>

namespace text_utils {

inline std::string trim(const std::string& s) {
    size_t start = 0;
    while (start < s.size() && std::isspace(static_cast<unsigned char>(s[start]))) ++start;
    size_t end = s.size();
    while (end > start && std::isspace(static_cast<unsigned char>(s[end - 1]))) --end;
    return s.substr(start, end - start);
}

inline std::string to_lower(std::string s) {
    for (char& c : s) c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
    return s;
}

// Split on a single delimiter; pieces are trimmed, empty pieces kept.
inline std::vector<std::string> split(const std::string& s, char delim) {
    std::vector<std::string> parts;
    std::string current;
    for (char c : s) {
        if (c == delim) {
            parts.push_back(trim(current));
            current.clear();
        } else {
            current += c;
        }
    }
    parts.push_back(trim(current));
    return parts;
}

inline bool starts_with(const std::string& s, const std::string& prefix) {
    return s.size() >= prefix.size() && s.compare(0, prefix.size(), prefix) == 0;
}

// Canonical text form of a number: integers without a decimal point,
// everything else with up to 15 significant digits.
inline std::string format_number(double v) {
    if (std::isnan(v)) return "NA";
    if (std::isinf(v)) return v > 0 ? "Inf" : "-Inf";
    char buf[64];
    if (v == std::floor(v) && std::abs(v) < 1e15) {
        std::snprintf(buf, sizeof(buf), "%.0f", v);
    } else {
        std::snprintf(buf, sizeof(buf), "%.15g", v);
    }
    return buf;
}

// Parse a whole (trimmed) string as a number. Infinite values are accepted,
// NaN and partial parses are not.
inline std::optional<double> parse_number(const std::string& s) {
    std::string t = trim(s);
    if (t.empty()) return std::nullopt;
    const char* begin = t.c_str();
    char* end = nullptr;
    double v = std::strtod(begin, &end);
    if (end != begin + t.size()) return std::nullopt;
    if (std::isnan(v)) return std::nullopt;
    return v;
}

// Trimmed, case-sensitive equality. A missing value never equals anything,
// including the literal string "NA".
inline bool safe_equal(const std::optional<std::string>& value, const std::string& target) {
    if (!value.has_value()) return false;
    return trim(*value) == trim(target);
}

// Round half away from zero to `decimals` places.
inline double round_to(double v, int decimals) {
    double scale = std::pow(10.0, decimals);
    return std::round(v * scale) / scale;
}

}  // namespace text_utils
