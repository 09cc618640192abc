#ifndef PX_SNAPSHOT_HPP
#define PX_SNAPSHOT_HPP

#include "types.hpp"
#include "scanner.hpp"
#include <cstdint>
#include <ctime>
#include <memory>
#include <vector>

namespace px {

enum class ScanOutcome {
    Pending,      // No scan has completed yet
    Ok,           // At least one listening socket
    NoPorts,      // Backends answered with zero listening sockets
    Failed        // Both backends raised
};

std::string toString(ScanOutcome o);

// Transitions between two consecutive snapshots, keyed by port
struct SnapshotDiff {
    std::vector<PortRecord> started;
    std::vector<PortRecord> stopped;
    std::vector<PortRecord> changed;

    bool empty() const { return started.empty() && stopped.empty() && changed.empty(); }
};

// Snapshot is an immutable published scan result
struct Snapshot {
    std::vector<PortRecord> records;
    ScanOutcome outcome = ScanOutcome::Pending;
    ScanSource source = ScanSource::None;
    uint64_t generation = 0;
    time_t timestamp = 0;
    SnapshotDiff diff;
};

// Fill status/firstSeen on current records and compute transitions.
// previous may be null (baseline scan): every record is New and no
// transitions are reported.
SnapshotDiff applyLifecycle(const Snapshot* previous, std::vector<PortRecord>& current, time_t now);

// History entries for a diff
std::vector<HistoryEntry> historyFromDiff(const SnapshotDiff& diff, time_t now);

} // namespace px

#endif // PX_SNAPSHOT_HPP
