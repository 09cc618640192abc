#include "workdir.hpp"
#include "strutil.hpp"

namespace px {

std::optional<std::string> firstQuotedSubstring(const std::string& commandLine) {
    size_t open = commandLine.find_first_of("\"'");
    while (open != std::string::npos) {
        char quote = commandLine[open];
        size_t close = commandLine.find(quote, open + 1);
        if (close == std::string::npos) {
            return std::nullopt;
        }
        // Empty quotes never match; continue after them
        if (close > open + 1) {
            return trim(commandLine.substr(open + 1, close - open - 1));
        }
        open = commandLine.find_first_of("\"'", close + 1);
    }
    return std::nullopt;
}

std::string stripQuotes(const std::string& token) {
    const char* quotes = "'\"`";
    size_t start = token.find_first_not_of(quotes);
    if (start == std::string::npos) return "";
    size_t end = token.find_last_not_of(quotes);
    return token.substr(start, end - start + 1);
}

std::optional<std::string> resolveWorkingDirectory(
    const std::string& commandLine,
    const std::vector<std::string>& workspaceRoots,
    const std::vector<std::string>& extraPaths,
    const FileSystem& fs
) {
    if (commandLine.empty()) {
        return std::nullopt;
    }

    std::string lower = toLower(commandLine);

    for (const auto& root : workspaceRoots) {
        if (!root.empty() && lower.find(toLower(root)) != std::string::npos) {
            return root;
        }
    }

    for (const auto& extra : extraPaths) {
        if (extra.empty()) continue;

        std::string candidate = extra;
        if (!isAbsolutePath(extra) && !workspaceRoots.empty()) {
            candidate = joinPath(workspaceRoots.front(), extra);
        }
        if (lower.find(toLower(candidate)) != std::string::npos) {
            return candidate;
        }
    }

    auto quoted = firstQuotedSubstring(commandLine);
    if (quoted && !quoted->empty() && fs.exists(*quoted)) {
        return quoted;
    }

    for (const auto& token : splitWhitespace(commandLine)) {
        if (token.find('/') == std::string::npos && token.find('\\') == std::string::npos) {
            continue;
        }

        std::string current = stripQuotes(token);
        while (!current.empty()) {
            if (fs.isDirectory(current)) {
                return current;
            }
            std::string parent = parentPath(current);
            if (parent == current) {
                break;
            }
            current = parent;
        }
    }

    return std::nullopt;
}

} // namespace px
