#pragma once

#include <algorithm>
#include <cctype>
#include <sstream>
#include <string>
#include <vector>

namespace uiauto {

// ===== String Utils =====

inline std::string trim(std::string s) {
    auto start = s.find_first_not_of(" \t\n\r");
    auto end = s.find_last_not_of(" \t\n\r");
    return (start == std::string::npos) ? "" : s.substr(start, end - start + 1);
}

inline std::string toLower(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return s;
}

inline bool startsWith(const std::string& s, const std::string& prefix) {
    return s.rfind(prefix, 0) == 0;
}

// ===== Split =====

inline std::vector<std::string> split(const std::string& s, char delim) {
    std::vector<std::string> result;
    std::stringstream ss(s);
    std::string token;
    while (std::getline(ss, token, delim)) result.push_back(token);
    return result;
}

// Splits on runs of whitespace; no quoting or escapes.
inline std::vector<std::string> splitWhitespace(const std::string& s) {
    std::vector<std::string> result;
    std::istringstream ss(s);
    std::string token;
    while (ss >> token) result.push_back(token);
    return result;
}

// Case-insensitive contains
inline bool insens(const std::string& input, const std::string& substring) {
    return toLower(input).find(toLower(substring)) != std::string::npos;
}

} // namespace uiauto
