#ifndef PX_STRUTIL_HPP
#define PX_STRUTIL_HPP

#include <optional>
#include <string>
#include <vector>

namespace px {

std::string toLower(const std::string& s);

// Case-insensitive substring test; an empty needle never matches
bool containsIgnoreCase(const std::string& haystack, const std::string& needle);

std::string trim(const std::string& s);

// Split on any run of whitespace, dropping empty tokens
std::vector<std::string> splitWhitespace(const std::string& s);

// Parse a decimal port number in 1..65535
std::optional<int> parsePort(const std::string& s);

} // namespace px

#endif // PX_STRUTIL_HPP
