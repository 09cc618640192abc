#include "test.hpp"
#include "store.hpp"
#include "config.hpp"
#include <cstdlib>
#include <fstream>
#include <iostream>
#include <sstream>
#include <sys/stat.h>
#include <unistd.h>

using namespace px;

// Fresh directory under /tmp for one test
static std::string makeTempDir() {
    char tmpl[] = "/tmp/px-test-XXXXXX";
    char* dir = mkdtemp(tmpl);
    ASSERT_TRUE(dir != nullptr, "mkdtemp failed");
    return dir;
}

static void writeFile(const std::string& path, const std::string& content) {
    std::ofstream file(path);
    file << content;
}

static void removeDir(const std::string& dir) {
    std::string cmd = "rm -rf '" + dir + "'";
    int rc = system(cmd.c_str());
    (void)rc;
}

static HistoryEntry entry(int port, HistoryAction action, const std::string& details = "") {
    HistoryEntry e;
    e.port = port;
    e.pid = 1000 + port;
    e.processName = "node";
    e.timestamp = 1700000000 + port;
    e.action = action;
    e.details = details;
    return e;
}

TEST(Store_PersistsFavoritesAndHistory) {
    std::string dir = makeTempDir();
    std::string path = dir + "/state.json";

    auto store = Store::loadFrom(path);
    ASSERT_TRUE(store->favorites().empty(), "fresh store");
    ASSERT_TRUE(store->toggleFavorite(3000), "added");
    ASSERT_TRUE(store->toggleFavorite(8080), "added");
    ASSERT_TRUE(!store->toggleFavorite(8080), "removed");
    store->appendHistory({entry(3000, HistoryAction::Started, "Next.js - shop"), entry(8080, HistoryAction::Stopped)});

    struct stat st;
    ASSERT_TRUE(stat(path.c_str(), &st) == 0, "state file written");
    ASSERT_EQUALS(0600, static_cast<int>(st.st_mode & 0777), "owner-only permissions");

    auto reloaded = Store::loadFrom(path);
    ASSERT_EQUALS(size_t(1), reloaded->favorites().size(), "favorites persisted");
    ASSERT_TRUE(reloaded->isFavorite(3000), "3000 is a favorite");

    auto history = reloaded->history();
    ASSERT_EQUALS(size_t(2), history.size(), "history persisted");
    ASSERT_TRUE(history[0].action == HistoryAction::Started, "action");
    ASSERT_EQUALS(std::string("Next.js - shop"), history[0].details, "details");
    ASSERT_EQUALS(std::string(""), history[1].details, "absent details");
    ASSERT_EQUALS(time_t(1700008080), history[1].timestamp, "timestamp");

    removeDir(dir);
}

TEST(Store_HistoryLimit) {
    Store store("", 3);
    for (int port = 1; port <= 5; port++) {
        store.appendHistory({entry(port, HistoryAction::Started)});
    }

    auto history = store.history();
    ASSERT_EQUALS(size_t(3), history.size(), "capped");
    ASSERT_EQUALS(3, history.front().port, "oldest dropped");
    ASSERT_EQUALS(5, history.back().port, "newest kept");

    store.setHistoryLimit(1);
    ASSERT_EQUALS(size_t(1), store.history().size(), "shrinking truncates");
}

TEST(Store_LoadKeepsHistoryUpToConfiguredLimit) {
    const char* saved = getenv("HOME");
    std::string previous = saved ? saved : "";
    std::string home = makeTempDir();
    setenv("HOME", home.c_str(), 1);

    std::vector<HistoryEntry> entries;
    for (int i = 0; i < 1500; i++) {
        entries.push_back(entry(1 + i, HistoryAction::Started));
    }
    mkdir((home + "/.portsexplorer").c_str(), 0755);
    nlohmann::json j;
    j["favorites"] = nlohmann::json::array();
    j["history"] = entries;
    writeFile(Store::getStateFilePath(), j.dump());

    Config config;
    config.historyLimit = 5000;
    ASSERT_TRUE(Store::load(config)->toggleFavorite(3000), "favorite added");

    auto reloaded = Store::load(config);
    ASSERT_EQUALS(size_t(1500), reloaded->history().size(), "toggle kept the whole log");
    ASSERT_TRUE(reloaded->isFavorite(3000), "favorite persisted");

    if (saved) {
        setenv("HOME", previous.c_str(), 1);
    } else {
        unsetenv("HOME");
    }
    removeDir(home);
}

TEST(Store_SaveFailureIsReported) {
    Store store("/proc/px-missing/state.json");

    std::ostringstream captured;
    std::streambuf* old = std::cerr.rdbuf(captured.rdbuf());
    bool added = store.toggleFavorite(3000);
    store.appendHistory({entry(3000, HistoryAction::Started)});
    std::cerr.rdbuf(old);

    ASSERT_TRUE(added, "toggle still applied in memory");
    ASSERT_CONTAINS(captured.str(), "Error saving favorites", "favorite save failure");
    ASSERT_CONTAINS(captured.str(), "Error saving history", "history save failure");
}

TEST(Store_InMemoryDoesNotSave) {
    Store store;
    ASSERT_TRUE(!store.save(), "no backing file");
    ASSERT_TRUE(store.toggleFavorite(22), "toggle still works");
}

TEST(Store_BadFileFallsBack) {
    std::string dir = makeTempDir();
    std::string path = dir + "/state.json";

    writeFile(path, "{ not json");
    auto broken = Store::loadFrom(path);
    ASSERT_TRUE(broken->favorites().empty(), "defaults on parse error");

    writeFile(path, R"({
        "favorites": [3000, "x", 70000],
        "history": [
            {"port": 3000, "pid": 1, "process": "node", "timestamp": 1, "action": "started"},
            {"port": 3001, "pid": 2, "process": "node", "timestamp": 2, "action": "exploded"}
        ]
    })");
    auto partial = Store::loadFrom(path);
    ASSERT_EQUALS(size_t(1), partial->favorites().size(), "invalid favorites skipped");
    ASSERT_EQUALS(size_t(1), partial->history().size(), "invalid history entry skipped");

    removeDir(dir);
}

TEST(Config_Defaults) {
    Config config;
    ASSERT_TRUE(config.groupBy == GroupBy::Category, "groupBy");
    ASSERT_TRUE(config.viewMode == ViewMode::Tree, "viewMode");
    ASSERT_EQUALS(0, config.autoRefresh, "auto refresh disabled");
    ASSERT_TRUE(config.showSystemProcesses, "system shown");
    ASSERT_EQUALS(size_t(1000), config.historyLimit, "history limit");
}

TEST(Config_ParsesAndCoerces) {
    auto j = nlohmann::ordered_json::parse(R"({
        "groupBy": "workspace",
        "viewMode": "sideways",
        "filterMode": "dev",
        "autoRefresh": "fast",
        "strictWorkspace": true,
        "portLabels": {"3000": "Shop", "abc": "x", "70000": "y", "9000": 5},
        "groups": {"Backend": [5000, "8000", "x", 8000, 0], "Frontend": [3000], "Broken": "nope"},
        "workspacePaths": ["services/api", 3],
        "historyLimit": 50
    })");

    std::vector<std::string> warnings;
    Config config = Config::fromJson(j, &warnings);

    ASSERT_TRUE(config.groupBy == GroupBy::Workspace, "groupBy");
    ASSERT_TRUE(config.viewMode == ViewMode::Tree, "unknown viewMode keeps default");
    ASSERT_TRUE(config.filterMode == FilterMode::Dev, "filterMode");
    ASSERT_EQUALS(0, config.autoRefresh, "wrong type keeps default");
    ASSERT_TRUE(config.strictWorkspace, "strict");
    ASSERT_EQUALS(size_t(50), config.historyLimit, "historyLimit");

    ASSERT_EQUALS(size_t(1), config.portLabels.size(), "invalid labels skipped");
    ASSERT_EQUALS(std::string("Shop"), config.portLabels.at(3000), "label");

    ASSERT_EQUALS(size_t(3), config.groups.size(), "groups kept");
    ASSERT_EQUALS(std::string("Backend"), config.groups[0].name, "configuration order");
    ASSERT_EQUALS(size_t(2), config.groups[0].ports.size(), "coerced and deduplicated");
    ASSERT_EQUALS(8000, config.groups[0].ports[1], "numeric string coerced");
    ASSERT_EQUALS(std::string("Frontend"), config.groups[1].name, "second group");
    ASSERT_TRUE(config.groups[2].ports.empty(), "non-array group is empty");

    ASSERT_EQUALS(size_t(1), config.workspacePaths.size(), "non-string path skipped");
    ASSERT_TRUE(warnings.size() >= 8, "every problem described");
}

TEST(Config_LoadFromFile) {
    std::string dir = makeTempDir();
    std::string path = dir + "/config.json";

    Config missing = Config::loadFrom(path);
    ASSERT_TRUE(missing.groups.empty(), "missing file gives defaults");

    writeFile(path, "{ nope");
    Config broken = Config::loadFrom(path);
    ASSERT_TRUE(broken.groupBy == GroupBy::Category, "broken file gives defaults");

    Config original;
    original.groupBy = GroupBy::Group;
    original.autoRefresh = 15;
    original.portLabels[4000] = "Docs";
    original.groups.push_back({"Zeta", {9000}});
    original.groups.push_back({"Alpha", {3000, 3001}});
    writeFile(path, original.toJson().dump(2));

    Config loaded = Config::loadFrom(path);
    ASSERT_TRUE(loaded.groupBy == GroupBy::Group, "groupBy");
    ASSERT_EQUALS(15, loaded.autoRefresh, "autoRefresh");
    ASSERT_EQUALS(std::string("Docs"), loaded.portLabels.at(4000), "label");
    ASSERT_EQUALS(std::string("Zeta"), loaded.groups[0].name, "group order kept");
    ASSERT_EQUALS(size_t(2), loaded.groups[1].ports.size(), "group ports");

    removeDir(dir);
}

TEST(Config_StateDirectoryFollowsHome) {
    const char* saved = getenv("HOME");
    std::string previous = saved ? saved : "";

    setenv("HOME", "/tmp/px-home", 1);
    ASSERT_EQUALS(std::string("/tmp/px-home/.portsexplorer"), Config::getConfigDir(), "config dir");
    ASSERT_EQUALS(std::string("/tmp/px-home/.portsexplorer/config.json"), Config::getConfigFilePath(), "config file");
    ASSERT_EQUALS(std::string("/tmp/px-home/.portsexplorer/state.json"), Store::getStateFilePath(), "state file");

    if (saved) {
        setenv("HOME", previous.c_str(), 1);
    } else {
        unsetenv("HOME");
    }
}
