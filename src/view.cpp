#include "view.hpp"
#include "filesystem.hpp"
#include "strutil.hpp"
#include <algorithm>
#include <map>
#include <set>
#include <utility>

namespace px {

const char* const BUCKET_FAVORITES = "favorites";
const char* const BUCKET_DEV = "dev";
const char* const BUCKET_SYSTEM = "system";
const char* const BUCKET_UNGROUPED = "__ungrouped";
const char* const BUCKET_OUTSIDE = "__outside__";

bool matchesSearch(const PortRecord& record, const std::string& term) {
    if (term.empty()) {
        return true;
    }
    std::string t = toLower(term);

    if (std::to_string(record.port).find(t) != std::string::npos) return true;
    if (toLower(record.processName).find(t) != std::string::npos) return true;
    if (record.project && toLower(record.project->name).find(t) != std::string::npos) return true;
    return toLower(record.commandLine).find(t) != std::string::npos;
}

bool passesFilter(const PortRecord& record, FilterMode filter) {
    switch (filter) {
        case FilterMode::None: return true;
        case FilterMode::Favorites: return record.isFavorite;
        case FilterMode::Dev: return record.category == Category::Dev;
        case FilterMode::Workspace: return record.workspaceFolder.has_value();
    }
    return true;
}

std::vector<PortRecord> filterRecords(const std::vector<PortRecord>& records,
                                      const std::string& searchTerm,
                                      FilterMode filter) {
    std::vector<PortRecord> result;
    for (const auto& r : records) {
        if (matchesSearch(r, searchTerm) && passesFilter(r, filter)) {
            result.push_back(r);
        }
    }

    std::stable_sort(result.begin(), result.end(), [](const PortRecord& a, const PortRecord& b) {
        if (a.port != b.port) return a.port < b.port;
        return a.pid < b.pid;
    });
    return result;
}

std::vector<Bucket> groupByCategory(const std::vector<PortRecord>& records) {
    Bucket fav{BUCKET_FAVORITES, "Favorites", {}};
    Bucket dev{BUCKET_DEV, "Dev Servers", {}};
    Bucket sys{BUCKET_SYSTEM, "System", {}};

    for (const auto& r : records) {
        if (r.isFavorite) {
            fav.records.push_back(r);
        } else if (r.category == Category::Dev) {
            dev.records.push_back(r);
        } else {
            sys.records.push_back(r);
        }
    }

    std::vector<Bucket> buckets;
    for (auto* b : {&fav, &dev, &sys}) {
        if (!b->records.empty()) buckets.push_back(std::move(*b));
    }
    return buckets;
}

std::vector<Bucket> groupByProcess(const std::vector<PortRecord>& records) {
    std::vector<Bucket> buckets;
    std::map<std::string, size_t> index;

    for (const auto& r : records) {
        std::string name = r.processName.empty() ? "Unknown" : r.processName;
        auto it = index.find(name);
        if (it == index.end()) {
            index[name] = buckets.size();
            buckets.push_back({name, name, {r}});
        } else {
            buckets[it->second].records.push_back(r);
        }
    }
    return buckets;
}

std::vector<Bucket> groupByCustomGroup(const std::vector<PortRecord>& records,
                                       const std::vector<GroupDefinition>& groups) {
    std::vector<Bucket> buckets;
    std::set<int> grouped;

    for (const auto& g : groups) {
        std::set<int> ports(g.ports.begin(), g.ports.end());
        grouped.insert(ports.begin(), ports.end());

        Bucket b{g.name, g.name, {}};
        for (const auto& r : records) {
            if (ports.count(r.port)) b.records.push_back(r);
        }
        if (!b.records.empty()) buckets.push_back(std::move(b));
    }

    Bucket ungrouped{BUCKET_UNGROUPED, "Ungrouped", {}};
    for (const auto& r : records) {
        if (!grouped.count(r.port)) ungrouped.records.push_back(r);
    }
    if (!ungrouped.records.empty()) buckets.push_back(std::move(ungrouped));

    return buckets;
}

std::vector<Bucket> groupByWorkspace(const std::vector<PortRecord>& records) {
    std::vector<Bucket> buckets;
    std::map<std::string, size_t> index;
    Bucket outside{BUCKET_OUTSIDE, "Outside Workspace", {}};

    for (const auto& r : records) {
        if (!r.workspaceFolder) {
            outside.records.push_back(r);
            continue;
        }
        const std::string& folder = *r.workspaceFolder;
        auto it = index.find(folder);
        if (it == index.end()) {
            index[folder] = buckets.size();
            buckets.push_back({folder, baseName(folder), {r}});
        } else {
            buckets[it->second].records.push_back(r);
        }
    }

    if (!outside.records.empty()) buckets.push_back(std::move(outside));
    return buckets;
}

std::vector<Bucket> groupRecords(const std::vector<PortRecord>& records,
                                 GroupBy groupBy,
                                 const std::vector<GroupDefinition>& groups) {
    switch (groupBy) {
        case GroupBy::Port:
        case GroupBy::Category:
            return groupByCategory(records);
        case GroupBy::Process:
            return groupByProcess(records);
        case GroupBy::Group:
            return groupByCustomGroup(records, groups);
        case GroupBy::Workspace:
            return groupByWorkspace(records);
    }
    return {};
}

View buildView(const std::vector<PortRecord>& records,
               ScanOutcome outcome,
               const std::string& searchTerm,
               FilterMode filter,
               GroupBy groupBy,
               ViewMode mode,
               const std::vector<GroupDefinition>& groups) {
    View view;
    view.mode = mode;

    switch (outcome) {
        case ScanOutcome::Pending:
            view.state = ViewState::Pending;
            return view;
        case ScanOutcome::Failed:
            view.state = ViewState::Failed;
            return view;
        case ScanOutcome::NoPorts:
            view.state = ViewState::NoPorts;
            return view;
        case ScanOutcome::Ok:
            break;
    }

    view.records = filterRecords(records, searchTerm, filter);
    if (view.records.empty()) {
        view.state = ViewState::NoMatches;
        return view;
    }

    view.state = ViewState::Populated;
    if (mode == ViewMode::Tree) {
        view.buckets = groupRecords(view.records, groupBy, groups);
    }
    return view;
}

} // namespace px
