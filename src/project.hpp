#ifndef PX_PROJECT_HPP
#define PX_PROJECT_HPP

#include "types.hpp"
#include "filesystem.hpp"
#include "diagnostics.hpp"
#include <optional>
#include <string>

namespace px {

// Manifest files checked by detectProject, in priority order
extern const std::vector<std::string> PROJECT_MANIFESTS;

// Framework label for a parsed package.json (dependencies + devDependencies)
std::string detectNodeFramework(const json& manifest);

// Inspect manifest files in the directory and label the project.
// Best effort: parse and I/O failures yield nullopt and a warning on diag.
std::optional<ProjectInfo> detectProject(const std::string& workingDirectory,
                                         const FileSystem& fs,
                                         DiagnosticLog* diag = nullptr);

} // namespace px

#endif // PX_PROJECT_HPP
