#include "config.hpp"
#include "strutil.hpp"
#include <algorithm>
#include <fstream>
#include <iostream>
#include <pwd.h>
#include <unistd.h>

namespace px {

using ordered_json = nlohmann::ordered_json;

std::string toString(GroupBy g) {
    switch (g) {
        case GroupBy::Port: return "port";
        case GroupBy::Process: return "process";
        case GroupBy::Group: return "group";
        case GroupBy::Category: return "category";
        case GroupBy::Workspace: return "workspace";
    }
    return "category";
}

std::string toString(ViewMode v) {
    return v == ViewMode::List ? "list" : "tree";
}

std::string toString(FilterMode f) {
    switch (f) {
        case FilterMode::None: return "none";
        case FilterMode::Favorites: return "favorites";
        case FilterMode::Dev: return "dev";
        case FilterMode::Workspace: return "workspace";
    }
    return "none";
}

std::optional<GroupBy> parseGroupBy(const std::string& s) {
    std::string v = toLower(trim(s));
    if (v == "port") return GroupBy::Port;
    if (v == "process") return GroupBy::Process;
    if (v == "group") return GroupBy::Group;
    if (v == "category") return GroupBy::Category;
    if (v == "workspace") return GroupBy::Workspace;
    return std::nullopt;
}

std::optional<ViewMode> parseViewMode(const std::string& s) {
    std::string v = toLower(trim(s));
    if (v == "tree") return ViewMode::Tree;
    if (v == "list") return ViewMode::List;
    return std::nullopt;
}

std::optional<FilterMode> parseFilterMode(const std::string& s) {
    std::string v = toLower(trim(s));
    if (v == "none") return FilterMode::None;
    if (v == "favorites") return FilterMode::Favorites;
    if (v == "dev") return FilterMode::Dev;
    if (v == "workspace") return FilterMode::Workspace;
    return std::nullopt;
}

std::string Config::getConfigDir() {
    const char* home = getenv("HOME");
    if (!home) {
        struct passwd* pw = getpwuid(getuid());
        if (pw) {
            home = pw->pw_dir;
        } else {
            home = "/tmp";
        }
    }
    return std::string(home) + "/.portsexplorer";
}

std::string Config::getConfigFilePath() {
    return getConfigDir() + "/config.json";
}

static void warn(std::vector<std::string>* warnings, const std::string& message) {
    if (warnings) warnings->push_back(message);
}

// Port from a JSON number or numeric string
static std::optional<int> portFromJson(const ordered_json& v) {
    if (v.is_number_integer()) {
        int n = v.get<int>();
        if (n >= 1 && n <= 65535) return n;
        return std::nullopt;
    }
    if (v.is_string()) {
        return parsePort(v.get<std::string>());
    }
    return std::nullopt;
}

static std::vector<std::string> stringList(const ordered_json& j, const char* key,
                                           std::vector<std::string>* warnings) {
    std::vector<std::string> result;
    if (!j.contains(key)) return result;

    const auto& v = j.at(key);
    if (!v.is_array()) {
        warn(warnings, std::string(key) + " is not an array, ignored");
        return result;
    }
    for (const auto& item : v) {
        if (item.is_string() && !item.get<std::string>().empty()) {
            result.push_back(item.get<std::string>());
        } else {
            warn(warnings, std::string(key) + " entry is not a string, skipped");
        }
    }
    return result;
}

template <typename T>
static void readScalar(const ordered_json& j, const char* key, T& out, std::vector<std::string>* warnings) {
    if (!j.contains(key)) return;
    try {
        out = j.at(key).get<T>();
    } catch (const nlohmann::json::exception&) {
        warn(warnings, std::string(key) + " has the wrong type, using default");
    }
}

template <typename Enum>
static void readEnum(const ordered_json& j, const char* key, Enum& out,
                     std::optional<Enum> (*parse)(const std::string&),
                     std::vector<std::string>* warnings) {
    if (!j.contains(key)) return;
    const auto& v = j.at(key);
    auto parsed = v.is_string() ? parse(v.get<std::string>()) : std::nullopt;
    if (parsed) {
        out = *parsed;
    } else {
        warn(warnings, std::string(key) + " has an unknown value, using default");
    }
}

Config Config::fromJson(const ordered_json& j, std::vector<std::string>* warnings) {
    Config config;
    if (!j.is_object()) {
        warn(warnings, "configuration is not an object, using defaults");
        return config;
    }

    readEnum(j, "groupBy", config.groupBy, parseGroupBy, warnings);
    readEnum(j, "viewMode", config.viewMode, parseViewMode, warnings);
    readEnum(j, "filterMode", config.filterMode, parseFilterMode, warnings);

    readScalar(j, "autoRefresh", config.autoRefresh, warnings);
    if (config.autoRefresh < 0) config.autoRefresh = 0;
    readScalar(j, "showOnlyWorkspace", config.showOnlyWorkspace, warnings);
    readScalar(j, "strictWorkspace", config.strictWorkspace, warnings);
    readScalar(j, "showSystemProcesses", config.showSystemProcesses, warnings);
    readScalar(j, "historyLimit", config.historyLimit, warnings);
    readScalar(j, "recordHistory", config.recordHistory, warnings);
    readScalar(j, "scanTimeoutSeconds", config.scanTimeoutSeconds, warnings);
    if (config.scanTimeoutSeconds <= 0) config.scanTimeoutSeconds = 10;

    // portLabels: {"3000": "My app"}; non-numeric keys are skipped
    if (j.contains("portLabels")) {
        const auto& labels = j.at("portLabels");
        if (labels.is_object()) {
            for (const auto& item : labels.items()) {
                const std::string& key = item.key();
                const auto& value = item.value();
                auto port = parsePort(key);
                if (!port || !value.is_string()) {
                    warn(warnings, "portLabels entry '" + key + "' skipped");
                    continue;
                }
                config.portLabels[*port] = value.get<std::string>();
            }
        } else {
            warn(warnings, "portLabels is not an object, ignored");
        }
    }

    // groups: {"Backend": [5000, "8000"]}
    if (j.contains("groups")) {
        const auto& groups = j.at("groups");
        if (groups.is_object()) {
            for (const auto& item : groups.items()) {
                const std::string& name = item.key();
                const auto& ports = item.value();
                GroupDefinition group;
                group.name = name;
                if (ports.is_array()) {
                    for (const auto& p : ports) {
                        auto port = portFromJson(p);
                        if (!port) {
                            warn(warnings, "group '" + name + "' has an invalid port, skipped");
                            continue;
                        }
                        if (std::find(group.ports.begin(), group.ports.end(), *port) == group.ports.end()) {
                            group.ports.push_back(*port);
                        }
                    }
                } else {
                    warn(warnings, "group '" + name + "' is not an array");
                }
                config.groups.push_back(group);
            }
        } else {
            warn(warnings, "groups is not an object, ignored");
        }
    }

    config.workspacePaths = stringList(j, "workspacePaths", warnings);
    config.workspaceRoots = stringList(j, "workspaceRoots", warnings);

    return config;
}

Config Config::loadFrom(const std::string& path) {
    std::ifstream file(path);
    if (!file.is_open()) {
        // Return defaults if file doesn't exist
        return Config();
    }

    try {
        ordered_json j;
        file >> j;

        std::vector<std::string> warnings;
        Config config = fromJson(j, &warnings);
        for (const auto& w : warnings) {
            std::cerr << "Config warning: " << w << std::endl;
        }
        return config;

    } catch (const std::exception& e) {
        std::cerr << "Error parsing config file: " << e.what() << std::endl;
        return Config();
    }
}

Config Config::load() {
    return loadFrom(getConfigFilePath());
}

ordered_json Config::toJson() const {
    ordered_json j;
    j["groupBy"] = toString(groupBy);
    j["viewMode"] = toString(viewMode);
    j["filterMode"] = toString(filterMode);
    j["autoRefresh"] = autoRefresh;
    j["showOnlyWorkspace"] = showOnlyWorkspace;
    j["strictWorkspace"] = strictWorkspace;
    j["showSystemProcesses"] = showSystemProcesses;

    ordered_json labels = ordered_json::object();
    for (const auto& kv : portLabels) {
        labels[std::to_string(kv.first)] = kv.second;
    }
    j["portLabels"] = labels;

    ordered_json groupsJson = ordered_json::object();
    for (const auto& g : groups) {
        groupsJson[g.name] = g.ports;
    }
    j["groups"] = groupsJson;

    j["workspacePaths"] = workspacePaths;
    j["workspaceRoots"] = workspaceRoots;
    j["historyLimit"] = historyLimit;
    j["recordHistory"] = recordHistory;
    j["scanTimeoutSeconds"] = scanTimeoutSeconds;
    return j;
}

} // namespace px
