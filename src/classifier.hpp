#ifndef PX_CLASSIFIER_HPP
#define PX_CLASSIFIER_HPP

#include "types.hpp"
#include <map>
#include <string>
#include <vector>

namespace px {

// Well-known development ports and their labels
extern const std::map<int, std::string> DEFAULT_PORT_LABELS;

// Process-name fragments of developer tools and runtimes
extern const std::vector<std::string> DEV_PROCESS_HINTS;

// Command-line fragments of dev-tool invocations
extern const std::vector<std::string> DEV_COMMAND_HINTS;

// Merge user label overrides over the built-in table; user entries win
std::map<int, std::string> mergePortLabels(const std::map<int, std::string>& overrides);

struct ClassifierOptions {
    std::map<int, std::string> portLabels;   // Already merged
    std::vector<std::string> workspaceRoots;
    bool strictWorkspace = false;
};

bool isDevProcess(const std::string& processName);
bool hasDevCommand(const std::string& commandLine);
bool isInWorkspace(const std::string& commandLine, const std::vector<std::string>& workspaceRoots);

// Decide dev vs system. A labelled port is always dev; otherwise the process
// must look like a dev runtime and be corroborated by a dev command or by
// running inside an open workspace.
Category classify(int port, const std::string& processName, const std::string& commandLine,
                  const ClassifierOptions& options);

// Label for the port, or empty
std::string labelFor(int port, const std::map<int, std::string>& portLabels);

} // namespace px

#endif // PX_CLASSIFIER_HPP
