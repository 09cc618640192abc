#ifndef PX_TYPES_HPP
#define PX_TYPES_HPP

#include <string>
#include <map>
#include <vector>
#include <optional>
#include <ctime>
#include <stdexcept>
#include <nlohmann/json.hpp>

namespace px {

using json = nlohmann::json;

enum class Category { Dev, System };

// Lifecycle of a record relative to the previous snapshot
enum class PortStatus { New, Changed, Stable };

enum class HistoryAction { Started, Stopped, Changed };

std::string toString(Category c);
std::string toString(PortStatus s);
std::string toString(HistoryAction a);
std::optional<HistoryAction> parseHistoryAction(const std::string& s);

// ProjectInfo describes the project a dev server appears to belong to
struct ProjectInfo {
    std::string name;       // Basename of the project directory
    std::string path;       // Project directory
    std::string framework;  // "Next.js", "Django", ...
};

inline bool operator==(const ProjectInfo& a, const ProjectInfo& b) {
    return a.name == b.name && a.path == b.path && a.framework == b.framework;
}

inline void to_json(json& j, const ProjectInfo& p) {
    j = json{{"name", p.name}, {"path", p.path}, {"framework", p.framework}};
}

inline void from_json(const json& j, ProjectInfo& p) {
    j.at("name").get_to(p.name);
    j.at("path").get_to(p.path);
    j.at("framework").get_to(p.framework);
}

// PortRecord is one observed listening socket + owning process
struct PortRecord {
    int port = 0;
    int pid = 0;                             // 0 = unknown owner
    std::string processName;
    std::string commandLine;
    Category category = Category::System;
    bool isFavorite = false;
    std::optional<ProjectInfo> project;
    std::optional<std::string> workspaceFolder;
    PortStatus status = PortStatus::New;
    time_t firstSeen = 0;
    time_t lastSeen = 0;
};

inline void to_json(json& j, const PortRecord& r) {
    j = json{
        {"port", r.port},
        {"pid", r.pid},
        {"process", r.processName},
        {"cmdline", r.commandLine},
        {"category", toString(r.category)},
        {"favorite", r.isFavorite},
        {"status", toString(r.status)},
        {"firstSeen", r.firstSeen},
        {"lastSeen", r.lastSeen}
    };
    if (r.project) j["project"] = *r.project;
    if (r.workspaceFolder) j["workspaceFolder"] = *r.workspaceFolder;
}

// HistoryEntry is one recorded port transition
struct HistoryEntry {
    int port = 0;
    int pid = 0;
    std::string processName;
    time_t timestamp = 0;
    HistoryAction action = HistoryAction::Started;
    std::string details;                     // Optional, empty when absent
};

inline void to_json(json& j, const HistoryEntry& h) {
    j = json{
        {"port", h.port},
        {"pid", h.pid},
        {"process", h.processName},
        {"timestamp", h.timestamp},
        {"action", toString(h.action)}
    };
    if (!h.details.empty()) j["details"] = h.details;
}

inline void from_json(const json& j, HistoryEntry& h) {
    j.at("port").get_to(h.port);
    j.at("pid").get_to(h.pid);
    j.at("process").get_to(h.processName);
    j.at("timestamp").get_to(h.timestamp);

    auto action = parseHistoryAction(j.at("action").get<std::string>());
    if (!action) {
        throw std::runtime_error("unknown history action: " + j.at("action").get<std::string>());
    }
    h.action = *action;

    if (j.contains("details")) j.at("details").get_to(h.details);
}

// GroupDefinition is a user-named set of ports
struct GroupDefinition {
    std::string name;
    std::vector<int> ports;                  // Ordered, duplicates removed
};

// Connection is one socket as reported by the primary backend
struct Connection {
    std::string protocol;                    // tcp|tcp6|udp|...
    std::string state;                       // LISTEN, ESTABLISHED, ...
    int localPort = 0;
    int pid = 0;
    std::string process;                     // Embedded process name, may be empty
};

// ProcessEntry is one running process as reported by the primary backend
struct ProcessEntry {
    int pid = 0;
    std::string name;
    std::string command;
};

// SocketRow is one row streamed by the fallback backend
struct SocketRow {
    std::string protocol;
    std::string state;
    int localPort = 0;
    int pid = 0;
    std::string process;
    std::string cmdline;
};

// Listener is a deduplicated (port, pid) pair with its process details
struct Listener {
    int port = 0;
    int pid = 0;
    std::string processName;
    std::string commandLine;
};

} // namespace px

#endif // PX_TYPES_HPP
