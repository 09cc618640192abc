#include "analytics.hpp"
#include <algorithm>
#include <map>

namespace px {

Analytics computeAnalytics(const std::vector<PortRecord>& records,
                           const std::vector<HistoryEntry>& history) {
    Analytics a;

    a.totalPorts = static_cast<int>(records.size());
    for (const auto& r : records) {
        if (r.category == Category::Dev) a.activeDev++;
        else a.systemPorts++;
        if (r.isFavorite) a.favoriteCount++;
    }

    // Count occurrences in history; live ports count at least once
    std::map<int, int> counts;
    std::map<int, std::string> labels;
    for (const auto& e : history) {
        counts[e.port]++;
    }
    for (const auto& r : records) {
        if (!counts.count(r.port)) {
            counts[r.port] = 1;
        }
        std::string label = r.project ? r.project->framework : r.processName;
        labels[r.port] = label.empty() ? "Unknown" : label;
    }

    for (const auto& kv : counts) {
        auto it = labels.find(kv.first);
        a.mostUsedPorts.push_back({kv.first, kv.second, it != labels.end() ? it->second : "Unknown"});
    }
    std::stable_sort(a.mostUsedPorts.begin(), a.mostUsedPorts.end(),
                     [](const PortUsage& x, const PortUsage& y) { return x.count > y.count; });
    if (a.mostUsedPorts.size() > 10) {
        a.mostUsedPorts.resize(10);
    }

    size_t recent = std::min<size_t>(10, history.size());
    a.recentActivity.assign(history.end() - recent, history.end());
    std::reverse(a.recentActivity.begin(), a.recentActivity.end());

    return a;
}

} // namespace px
