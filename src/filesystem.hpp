#ifndef PX_FILESYSTEM_HPP
#define PX_FILESYSTEM_HPP

#include <memory>
#include <optional>
#include <string>

namespace px {

// FileSystem is the read-only view of the disk used by the resolver and the
// project detector. Implementations never throw: any I/O failure reads as
// "does not exist" / nullopt.
class FileSystem {
public:
    virtual ~FileSystem() = default;

    virtual bool exists(const std::string& path) const = 0;
    virtual bool isDirectory(const std::string& path) const = 0;
    virtual std::optional<std::string> readFile(const std::string& path) const = 0;
};

// FileSystem backed by the local disk
class LocalFileSystem : public FileSystem {
public:
    bool exists(const std::string& path) const override;
    bool isDirectory(const std::string& path) const override;
    std::optional<std::string> readFile(const std::string& path) const override;
};

std::shared_ptr<FileSystem> localFileSystem();

// Path helpers that treat both '/' and '\' as separators
std::string parentPath(const std::string& path);
std::string baseName(const std::string& path);
std::string joinPath(const std::string& dir, const std::string& name);
bool isAbsolutePath(const std::string& path);

} // namespace px

#endif // PX_FILESYSTEM_HPP
