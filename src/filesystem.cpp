#include "filesystem.hpp"
#include <filesystem>
#include <fstream>
#include <sstream>
#include <system_error>

namespace px {

namespace fs = std::filesystem;

bool LocalFileSystem::exists(const std::string& path) const {
    if (path.empty()) return false;
    std::error_code ec;
    bool result = fs::exists(fs::path(path), ec);
    return !ec && result;
}

bool LocalFileSystem::isDirectory(const std::string& path) const {
    if (path.empty()) return false;
    std::error_code ec;
    bool result = fs::is_directory(fs::path(path), ec);
    return !ec && result;
}

std::optional<std::string> LocalFileSystem::readFile(const std::string& path) const {
    std::ifstream file(path, std::ios::in | std::ios::binary);
    if (!file.is_open()) {
        return std::nullopt;
    }
    std::ostringstream oss;
    oss << file.rdbuf();
    if (file.bad()) {
        return std::nullopt;
    }
    return oss.str();
}

std::shared_ptr<FileSystem> localFileSystem() {
    static std::shared_ptr<FileSystem> instance = std::make_shared<LocalFileSystem>();
    return instance;
}

static bool isSeparator(char c) {
    return c == '/' || c == '\\';
}

std::string parentPath(const std::string& path) {
    std::string p = path;

    // Drop trailing separators, keeping a lone root
    while (p.size() > 1 && isSeparator(p.back())) {
        p.pop_back();
    }

    size_t pos = p.find_last_of("/\\");
    if (pos == std::string::npos) {
        return "";
    }
    if (pos == 0) {
        return p.substr(0, 1);
    }
    // "C:\" stays a drive root
    if (pos == 2 && p[1] == ':') {
        return p.substr(0, 3);
    }
    return p.substr(0, pos);
}

std::string baseName(const std::string& path) {
    std::string p = path;
    while (p.size() > 1 && isSeparator(p.back())) {
        p.pop_back();
    }
    size_t pos = p.find_last_of("/\\");
    if (pos == std::string::npos) {
        return p;
    }
    return p.substr(pos + 1);
}

std::string joinPath(const std::string& dir, const std::string& name) {
    if (dir.empty()) return name;
    if (isSeparator(dir.back())) return dir + name;
    return dir + "/" + name;
}

bool isAbsolutePath(const std::string& path) {
    if (path.empty()) return false;
    if (isSeparator(path[0])) return true;
    return path.size() >= 3 && path[1] == ':' && isSeparator(path[2]);
}

} // namespace px
