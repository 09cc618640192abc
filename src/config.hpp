#ifndef PX_CONFIG_HPP
#define PX_CONFIG_HPP

#include "types.hpp"
#include <map>
#include <optional>
#include <string>
#include <vector>

namespace px {

enum class GroupBy { Port, Process, Group, Category, Workspace };
enum class ViewMode { Tree, List };
enum class FilterMode { None, Favorites, Dev, Workspace };

std::string toString(GroupBy g);
std::string toString(ViewMode v);
std::string toString(FilterMode f);

std::optional<GroupBy> parseGroupBy(const std::string& s);
std::optional<ViewMode> parseViewMode(const std::string& s);
std::optional<FilterMode> parseFilterMode(const std::string& s);

// Config holds the user settings read by the engine
struct Config {
    GroupBy groupBy = GroupBy::Category;
    ViewMode viewMode = ViewMode::Tree;
    FilterMode filterMode = FilterMode::None;
    int autoRefresh = 0;                            // Seconds, 0 = disabled
    bool showOnlyWorkspace = false;
    bool strictWorkspace = false;
    bool showSystemProcesses = true;
    std::map<int, std::string> portLabels;          // User overrides only
    std::vector<GroupDefinition> groups;            // Configuration order
    std::vector<std::string> workspacePaths;        // Extra paths
    std::vector<std::string> workspaceRoots;        // Open workspace roots
    size_t historyLimit = 1000;
    bool recordHistory = true;
    int scanTimeoutSeconds = 10;

    // Parse from JSON; malformed entries are skipped and described in warnings
    static Config fromJson(const nlohmann::ordered_json& j, std::vector<std::string>* warnings = nullptr);

    // Load ~/.portsexplorer/config.json, defaults if missing or unparsable
    static Config load();
    static Config loadFrom(const std::string& path);

    nlohmann::ordered_json toJson() const;

    static std::string getConfigDir();
    static std::string getConfigFilePath();
};

} // namespace px

#endif // PX_CONFIG_HPP
