#ifndef PX_ENGINE_HPP
#define PX_ENGINE_HPP

#include "types.hpp"
#include "config.hpp"
#include "store.hpp"
#include "scanner.hpp"
#include "snapshot.hpp"
#include "view.hpp"
#include "analytics.hpp"
#include "filesystem.hpp"
#include "diagnostics.hpp"
#include <atomic>
#include <chrono>
#include <condition_variable>
#include <functional>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

namespace px {

// Collaborators the engine scans through
struct EngineBackends {
    std::shared_ptr<ConnectionBackend> primary;
    std::shared_ptr<SocketStream> fallback;
    std::shared_ptr<FileSystem> fs;

    // procfs + ss + local disk
    static EngineBackends system();
};

// Provides the currently open workspace roots
using WorkspaceProvider = std::function<std::vector<std::string>()>;

// Maximum number of project detections running at once
constexpr size_t MAX_PARALLEL_DETECTIONS = 8;

// Engine owns the scan pipeline and the current snapshot. At most one scan
// runs at a time: a scan() call that arrives while another is in flight
// returns false immediately and the running scan performs one more pass.
class Engine {
public:
    Engine(Config config,
           std::shared_ptr<Store> store,
           EngineBackends backends,
           WorkspaceProvider workspaceRoots = nullptr,
           std::shared_ptr<DiagnosticLog> diag = nullptr);
    ~Engine();

    Engine(const Engine&) = delete;
    Engine& operator=(const Engine&) = delete;

    // Run a scan and publish its snapshot; false if coalesced into a running scan
    bool scan();
    bool isScanning() const { return scanning_; }

    // Current published snapshot, never null
    std::shared_ptr<const Snapshot> snapshot() const;

    View currentView(const std::string& searchTerm, FilterMode filter,
                     GroupBy groupBy, ViewMode mode) const;

    // View with the stored search term and filter and the configured grouping
    View currentView() const;

    // Flip favorite membership for a port; returns the new membership
    bool toggleFavorite(int port);

    void setFilter(FilterMode mode);
    FilterMode filter() const;
    void setSearchTerm(const std::string& term);
    std::string searchTerm() const;

    // Periodic re-scan every config.autoRefresh seconds (no-op when 0)
    void startAutoRefresh();
    void stopAutoRefresh();
    bool isAutoRefreshRunning() const { return timerRunning_; }
    void setRefreshInterval(std::chrono::milliseconds interval);

    // Called after every publish, on the publishing thread
    void setOnSnapshot(std::function<void(std::shared_ptr<const Snapshot>)> callback);

    std::vector<std::string> workspaceRoots() const;
    std::string labelFor(int port) const;
    std::vector<HistoryEntry> history() const;
    Analytics analytics() const;

    const Config& config() const { return config_; }
    std::shared_ptr<DiagnosticLog> diagnostics() const { return diag_; }

    // Classification, resolution and detection for one scan
    std::vector<PortRecord> buildRecords(const std::vector<Listener>& listeners,
                                         const std::vector<std::string>& roots) const;

private:
    void runScan();
    void publish(std::shared_ptr<Snapshot> next);
    void timerThreadFunc();

    Config config_;
    std::map<int, std::string> portLabels_;
    std::shared_ptr<Store> store_;
    EngineBackends backends_;
    WorkspaceProvider workspaceProvider_;
    std::shared_ptr<DiagnosticLog> diag_;
    Scanner scanner_;

    // Single-flight guard
    std::atomic<bool> scanning_{false};
    std::atomic<bool> rescanRequested_{false};

    mutable std::mutex snapshotMutex_;
    std::shared_ptr<const Snapshot> snapshot_;
    std::shared_ptr<const Snapshot> lastGood_;    // Diff base, skips failed scans
    uint64_t generation_ = 0;

    mutable std::mutex viewMutex_;
    FilterMode filter_;
    std::string searchTerm_;

    std::function<void(std::shared_ptr<const Snapshot>)> onSnapshot_;
    std::mutex callbackMutex_;

    // Auto-refresh thread
    std::thread timerThread_;
    std::atomic<bool> timerRunning_{false};
    std::atomic<long long> refreshIntervalMs_;
    std::condition_variable timerCv_;
    std::mutex timerMutex_;
};

} // namespace px

#endif // PX_ENGINE_HPP
