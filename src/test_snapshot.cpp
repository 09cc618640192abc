#include "test.hpp"
#include "snapshot.hpp"
#include "analytics.hpp"

using namespace px;

static PortRecord rec(int port, int pid, const std::string& name) {
    PortRecord r;
    r.port = port;
    r.pid = pid;
    r.processName = name;
    return r;
}

TEST(Lifecycle_BaselineIsAllNew) {
    std::vector<PortRecord> current = {rec(3000, 1, "node"), rec(5432, 2, "postgres")};
    auto diff = applyLifecycle(nullptr, current, 100);

    ASSERT_TRUE(diff.empty(), "no transitions on baseline");
    for (const auto& r : current) {
        ASSERT_TRUE(r.status == PortStatus::New, "new");
        ASSERT_EQUALS(time_t(100), r.firstSeen, "firstSeen");
        ASSERT_EQUALS(time_t(100), r.lastSeen, "lastSeen");
    }
}

TEST(Lifecycle_Transitions) {
    Snapshot previous;
    previous.records = {rec(3000, 1, "node"), rec(5432, 2, "postgres"), rec(631, 3, "cupsd"), rec(8000, 4, "python")};
    applyLifecycle(nullptr, previous.records, 100);

    std::vector<PortRecord> current = {
        rec(3000, 1, "node"),       // same owner
        rec(5432, 9, "postgres"),   // new pid
        rec(8000, 4, "uvicorn"),    // same pid, different process
        rec(9000, 5, "go")          // new port
    };
    auto diff = applyLifecycle(&previous, current, 200);

    ASSERT_TRUE(current[0].status == PortStatus::Stable, "stable");
    ASSERT_EQUALS(time_t(100), current[0].firstSeen, "firstSeen carried");
    ASSERT_EQUALS(time_t(200), current[0].lastSeen, "lastSeen refreshed");
    ASSERT_TRUE(current[1].status == PortStatus::Changed, "pid changed");
    ASSERT_TRUE(current[2].status == PortStatus::Changed, "process changed");
    ASSERT_EQUALS(time_t(200), current[1].firstSeen, "changed owner starts over");
    ASSERT_TRUE(current[3].status == PortStatus::New, "new");

    ASSERT_EQUALS(size_t(1), diff.started.size(), "started");
    ASSERT_EQUALS(size_t(2), diff.changed.size(), "changed");
    ASSERT_EQUALS(size_t(1), diff.stopped.size(), "stopped");
    ASSERT_EQUALS(631, diff.stopped[0].port, "stopped port");
}

TEST(Lifecycle_SharedPortReportedOnce) {
    Snapshot previous;
    previous.records = {rec(8080, 1, "java"), rec(8080, 2, "java")};

    std::vector<PortRecord> current = {rec(8080, 3, "java"), rec(8080, 4, "java")};
    auto diff = applyLifecycle(&previous, current, 10);
    ASSERT_EQUALS(size_t(1), diff.changed.size(), "one change per port");

    std::vector<PortRecord> none;
    diff = applyLifecycle(&previous, none, 20);
    ASSERT_EQUALS(size_t(1), diff.stopped.size(), "one stop per port");

    Snapshot empty;
    std::vector<PortRecord> appeared = {rec(9090, 10, "java"), rec(9090, 11, "java")};
    diff = applyLifecycle(&empty, appeared, 30);
    ASSERT_EQUALS(size_t(1), diff.started.size(), "one start per port");
    ASSERT_EQUALS(size_t(1), historyFromDiff(diff, 30).size(), "one history entry");
    ASSERT_TRUE(appeared[1].status == PortStatus::New, "both records new");
}

TEST(Lifecycle_HistoryEntries) {
    SnapshotDiff diff;
    auto started = rec(3000, 1, "node");
    started.project = ProjectInfo{"shop", "/ws/shop", "Next.js"};
    diff.started.push_back(started);
    diff.started.push_back(rec(9000, 5, "go"));
    diff.changed.push_back(rec(5432, 9, "postgres"));
    diff.stopped.push_back(rec(631, 3, "cupsd"));

    auto entries = historyFromDiff(diff, 42);
    ASSERT_EQUALS(size_t(4), entries.size(), "one entry per transition");
    ASSERT_EQUALS(std::string("Next.js - shop"), entries[0].details, "project details");
    ASSERT_EQUALS(std::string(""), entries[1].details, "no project");
    ASSERT_EQUALS(std::string("now PID 9"), entries[2].details, "new owner");
    ASSERT_TRUE(entries[3].action == HistoryAction::Stopped, "stopped");
    ASSERT_EQUALS(time_t(42), entries[3].timestamp, "timestamp");
}

TEST(Analytics_Counters) {
    auto shop = rec(3000, 1, "node");
    shop.category = Category::Dev;
    shop.isFavorite = true;
    shop.project = ProjectInfo{"shop", "/ws/shop", "Next.js"};
    auto pg = rec(5432, 2, "postgres");
    auto anon = rec(631, 0, "");

    std::vector<HistoryEntry> history;
    for (int i = 0; i < 12; i++) {
        HistoryEntry e;
        e.port = i < 5 ? 8080 : 4000 + i;
        e.timestamp = i;
        history.push_back(e);
    }
    history.push_back(HistoryEntry{3000, 1, "node", 100, HistoryAction::Started, ""});
    history.push_back(HistoryEntry{3000, 1, "node", 101, HistoryAction::Stopped, ""});

    auto a = computeAnalytics({shop, pg, anon}, history);

    ASSERT_EQUALS(3, a.totalPorts, "total");
    ASSERT_EQUALS(1, a.activeDev, "dev");
    ASSERT_EQUALS(2, a.systemPorts, "system");
    ASSERT_EQUALS(1, a.favoriteCount, "favorites");

    ASSERT_EQUALS(size_t(10), a.mostUsedPorts.size(), "top ten");
    ASSERT_EQUALS(8080, a.mostUsedPorts[0].port, "busiest first");
    ASSERT_EQUALS(5, a.mostUsedPorts[0].count, "count");
    ASSERT_EQUALS(std::string("Unknown"), a.mostUsedPorts[0].label, "no live record");
    ASSERT_EQUALS(3000, a.mostUsedPorts[1].port, "second");
    ASSERT_EQUALS(std::string("Next.js"), a.mostUsedPorts[1].label, "framework label");
    ASSERT_EQUALS(631, a.mostUsedPorts[2].port, "ties ordered by port");
    ASSERT_EQUALS(std::string("Unknown"), a.mostUsedPorts[2].label, "empty process name");

    ASSERT_EQUALS(size_t(10), a.recentActivity.size(), "recent ten");
    ASSERT_EQUALS(time_t(101), a.recentActivity[0].timestamp, "newest first");
}
