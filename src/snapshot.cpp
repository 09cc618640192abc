#include "snapshot.hpp"
#include <map>
#include <set>
#include <utility>

namespace px {

std::string toString(ScanOutcome o) {
    switch (o) {
        case ScanOutcome::Pending: return "pending";
        case ScanOutcome::Ok: return "ok";
        case ScanOutcome::NoPorts: return "no-ports";
        case ScanOutcome::Failed: return "failed";
    }
    return "pending";
}

SnapshotDiff applyLifecycle(const Snapshot* previous, std::vector<PortRecord>& current, time_t now) {
    SnapshotDiff diff;

    for (auto& r : current) {
        r.lastSeen = now;
        r.firstSeen = now;
        r.status = PortStatus::New;
    }
    if (!previous) {
        return diff;
    }

    // Previous records by port and by (port, pid)
    std::map<int, std::vector<const PortRecord*>> prevByPort;
    std::map<std::pair<int, int>, const PortRecord*> prevByKey;
    for (const auto& r : previous->records) {
        prevByPort[r.port].push_back(&r);
        prevByKey[{r.port, r.pid}] = &r;
    }

    std::set<int> currentPorts;
    std::set<int> reportedChanged;
    std::set<int> reportedStarted;
    for (auto& r : current) {
        currentPorts.insert(r.port);

        auto same = prevByKey.find({r.port, r.pid});
        if (same != prevByKey.end() && same->second->processName == r.processName) {
            r.status = PortStatus::Stable;
            r.firstSeen = same->second->firstSeen ? same->second->firstSeen : now;
            continue;
        }

        if (prevByPort.count(r.port)) {
            r.status = PortStatus::Changed;
            if (reportedChanged.insert(r.port).second) {
                diff.changed.push_back(r);
            }
        } else if (reportedStarted.insert(r.port).second) {
            diff.started.push_back(r);
        }
    }

    std::set<int> reportedStopped;
    for (const auto& r : previous->records) {
        if (!currentPorts.count(r.port) && reportedStopped.insert(r.port).second) {
            diff.stopped.push_back(r);
        }
    }

    return diff;
}

std::vector<HistoryEntry> historyFromDiff(const SnapshotDiff& diff, time_t now) {
    std::vector<HistoryEntry> entries;

    auto add = [&entries, now](const PortRecord& r, HistoryAction action, const std::string& details) {
        HistoryEntry e;
        e.port = r.port;
        e.pid = r.pid;
        e.processName = r.processName;
        e.timestamp = now;
        e.action = action;
        e.details = details;
        entries.push_back(e);
    };

    for (const auto& r : diff.started) {
        add(r, HistoryAction::Started, r.project ? r.project->framework + " - " + r.project->name : "");
    }
    for (const auto& r : diff.changed) {
        add(r, HistoryAction::Changed, "now PID " + std::to_string(r.pid));
    }
    for (const auto& r : diff.stopped) {
        add(r, HistoryAction::Stopped, "");
    }

    return entries;
}

} // namespace px
