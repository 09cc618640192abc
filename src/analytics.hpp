#ifndef PX_ANALYTICS_HPP
#define PX_ANALYTICS_HPP

#include "types.hpp"
#include <string>
#include <vector>

namespace px {

struct PortUsage {
    int port;
    int count;
    std::string label;
};

// Aggregates over the current records and the history log
struct Analytics {
    int totalPorts = 0;
    int activeDev = 0;
    int systemPorts = 0;
    int favoriteCount = 0;
    std::vector<PortUsage> mostUsedPorts;       // At most 10, busiest first
    std::vector<HistoryEntry> recentActivity;   // At most 10, newest first
};

Analytics computeAnalytics(const std::vector<PortRecord>& records,
                           const std::vector<HistoryEntry>& history);

} // namespace px

#endif // PX_ANALYTICS_HPP
