#ifndef PX_WORKDIR_HPP
#define PX_WORKDIR_HPP

#include "filesystem.hpp"
#include <optional>
#include <string>
#include <vector>

namespace px {

// Infer the project directory a process runs from, using its command line.
// Rules in priority order:
//   1. a workspace root mentioned in the command line
//   2. an extra workspace path mentioned in the command line
//      (relative extras are joined to the first workspace root)
//   3. the first quoted substring, if it exists on disk
//   4. the nearest existing ancestor directory of any path-like token
std::optional<std::string> resolveWorkingDirectory(
    const std::string& commandLine,
    const std::vector<std::string>& workspaceRoots,
    const std::vector<std::string>& extraPaths,
    const FileSystem& fs
);

// First '...' or "..." substring in the command line, trimmed
std::optional<std::string> firstQuotedSubstring(const std::string& commandLine);

// Remove leading and trailing ' " ` characters
std::string stripQuotes(const std::string& token);

} // namespace px

#endif // PX_WORKDIR_HPP
