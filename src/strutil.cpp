#include "strutil.hpp"
#include <algorithm>
#include <cctype>
#include <sstream>

namespace px {

std::string toLower(const std::string& s) {
    std::string result = s;
    std::transform(result.begin(), result.end(), result.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return result;
}

bool containsIgnoreCase(const std::string& haystack, const std::string& needle) {
    if (needle.empty()) return false;
    return toLower(haystack).find(toLower(needle)) != std::string::npos;
}

std::string trim(const std::string& s) {
    const char* ws = " \t\n\r\f\v";
    size_t start = s.find_first_not_of(ws);
    if (start == std::string::npos) return "";
    size_t end = s.find_last_not_of(ws);
    return s.substr(start, end - start + 1);
}

std::vector<std::string> splitWhitespace(const std::string& s) {
    std::vector<std::string> tokens;
    std::istringstream iss(s);
    std::string token;
    while (iss >> token) {
        tokens.push_back(token);
    }
    return tokens;
}

std::optional<int> parsePort(const std::string& s) {
    std::string t = trim(s);
    if (t.empty() || t.size() > 5) return std::nullopt;
    for (char c : t) {
        if (!std::isdigit(static_cast<unsigned char>(c))) return std::nullopt;
    }
    int value = std::stoi(t);
    if (value < 1 || value > 65535) return std::nullopt;
    return value;
}

} // namespace px
