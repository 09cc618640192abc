#ifndef PX_VIEW_HPP
#define PX_VIEW_HPP

#include "types.hpp"
#include "config.hpp"
#include "snapshot.hpp"
#include <string>
#include <vector>

namespace px {

// Bucket ids of the synthetic groups
extern const char* const BUCKET_FAVORITES;
extern const char* const BUCKET_DEV;
extern const char* const BUCKET_SYSTEM;
extern const char* const BUCKET_UNGROUPED;
extern const char* const BUCKET_OUTSIDE;

// Bucket is one top-level node of the hierarchical view
struct Bucket {
    std::string id;          // Stable key (process name, group name, path, ...)
    std::string label;       // Display name without the count
    std::vector<PortRecord> records;

    size_t count() const { return records.size(); }
};

enum class ViewState {
    Pending,      // No scan has completed yet
    Failed,       // Both backends raised
    NoPorts,      // Backends answered with zero listening sockets
    NoMatches,    // Sockets exist but post-filters, search or filter removed them all
    Populated
};

struct View {
    ViewState state = ViewState::Pending;
    ViewMode mode = ViewMode::Tree;
    std::vector<Bucket> buckets;     // Tree mode
    std::vector<PortRecord> records; // Filtered records in (port, pid) order
};

// Case-insensitive match against port, process name, project name and command line
bool matchesSearch(const PortRecord& record, const std::string& term);

bool passesFilter(const PortRecord& record, FilterMode filter);

// Search, then filter, then order by (port, pid)
std::vector<PortRecord> filterRecords(const std::vector<PortRecord>& records,
                                      const std::string& searchTerm,
                                      FilterMode filter);

// Bucket records by one grouping dimension; empty buckets are omitted
std::vector<Bucket> groupRecords(const std::vector<PortRecord>& records,
                                 GroupBy groupBy,
                                 const std::vector<GroupDefinition>& groups);

std::vector<Bucket> groupByCategory(const std::vector<PortRecord>& records);
std::vector<Bucket> groupByProcess(const std::vector<PortRecord>& records);
std::vector<Bucket> groupByCustomGroup(const std::vector<PortRecord>& records,
                                       const std::vector<GroupDefinition>& groups);
std::vector<Bucket> groupByWorkspace(const std::vector<PortRecord>& records);

// The empty state comes from the scan outcome, never from the record count
View buildView(const std::vector<PortRecord>& records,
               ScanOutcome outcome,
               const std::string& searchTerm,
               FilterMode filter,
               GroupBy groupBy,
               ViewMode mode,
               const std::vector<GroupDefinition>& groups);

} // namespace px

#endif // PX_VIEW_HPP
