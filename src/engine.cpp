#include "engine.hpp"
#include "classifier.hpp"
#include "project.hpp"
#include "workdir.hpp"
#include <algorithm>
#include <future>
#include <set>
#include <utility>

namespace px {

EngineBackends EngineBackends::system() {
    EngineBackends b;
    b.primary = std::make_shared<ProcfsBackend>();
    b.fallback = std::make_shared<SocketStatBackend>();
    b.fs = localFileSystem();
    return b;
}

Engine::Engine(Config config,
               std::shared_ptr<Store> store,
               EngineBackends backends,
               WorkspaceProvider workspaceRoots,
               std::shared_ptr<DiagnosticLog> diag)
    : config_(std::move(config)),
      portLabels_(mergePortLabels(config_.portLabels)),
      store_(store ? std::move(store) : std::make_shared<Store>()),
      backends_(std::move(backends)),
      workspaceProvider_(std::move(workspaceRoots)),
      diag_(diag ? std::move(diag) : std::make_shared<DiagnosticLog>()),
      scanner_(backends_.primary, backends_.fallback, diag_,
               std::chrono::seconds(config_.scanTimeoutSeconds > 0 ? config_.scanTimeoutSeconds : 10)),
      filter_(config_.filterMode),
      refreshIntervalMs_(static_cast<long long>(config_.autoRefresh) * 1000) {
    if (!backends_.fs) {
        backends_.fs = localFileSystem();
    }
    store_->setHistoryLimit(config_.historyLimit);

    // Initial empty snapshot
    snapshot_ = std::make_shared<Snapshot>();
}

Engine::~Engine() {
    stopAutoRefresh();
}

std::vector<std::string> Engine::workspaceRoots() const {
    if (workspaceProvider_) {
        return workspaceProvider_();
    }
    return config_.workspaceRoots;
}

std::string Engine::labelFor(int port) const {
    return px::labelFor(port, portLabels_);
}

bool Engine::scan() {
    // Raised before the claim so a running pass cannot miss it
    rescanRequested_ = true;

    bool expected = false;
    if (!scanning_.compare_exchange_strong(expected, true)) {
        return false;
    }

    for (;;) {
        rescanRequested_ = false;

        try {
            runScan();
        } catch (const std::exception& e) {
            // Previous snapshot stays published
            diag_->error("engine", std::string("scan aborted: ") + e.what());
        }

        if (rescanRequested_) {
            continue;
        }

        scanning_ = false;

        // A request may have arrived between the check and the release
        if (!rescanRequested_) {
            break;
        }
        expected = false;
        if (!scanning_.compare_exchange_strong(expected, true)) {
            break;
        }
    }

    return true;
}

std::vector<PortRecord> Engine::buildRecords(const std::vector<Listener>& listeners,
                                             const std::vector<std::string>& roots) const {
    ClassifierOptions options;
    options.portLabels = portLabels_;
    options.workspaceRoots = roots;
    options.strictWorkspace = config_.strictWorkspace;

    auto favorites = store_->favorites();

    std::vector<PortRecord> records;
    records.reserve(listeners.size());
    std::vector<size_t> devIndices;

    for (const auto& l : listeners) {
        PortRecord r;
        r.port = l.port;
        r.pid = l.pid;
        r.processName = l.processName;
        r.commandLine = l.commandLine;
        r.category = classify(l.port, l.processName, l.commandLine, options);
        r.isFavorite = favorites.count(l.port) > 0;
        r.workspaceFolder = resolveWorkingDirectory(l.commandLine, roots, config_.workspacePaths, *backends_.fs);

        if (r.category == Category::Dev && r.workspaceFolder) {
            devIndices.push_back(records.size());
        }
        records.push_back(std::move(r));
    }

    // Detect projects in bounded batches; every unit finishes before we return
    const FileSystem& fs = *backends_.fs;
    DiagnosticLog* diag = diag_.get();
    for (size_t start = 0; start < devIndices.size(); start += MAX_PARALLEL_DETECTIONS) {
        size_t end = std::min(devIndices.size(), start + MAX_PARALLEL_DETECTIONS);

        std::vector<std::future<std::optional<ProjectInfo>>> batch;
        for (size_t i = start; i < end; i++) {
            std::string folder = *records[devIndices[i]].workspaceFolder;
            batch.push_back(std::async(std::launch::async, [folder, &fs, diag]() {
                return detectProject(folder, fs, diag);
            }));
        }
        for (size_t i = start; i < end; i++) {
            records[devIndices[i]].project = batch[i - start].get();
        }
    }

    return records;
}

void Engine::runScan() {
    auto roots = workspaceRoots();
    ScanResult result = scanner_.scan();

    std::vector<Listener> listeners = result.listeners;
    if (config_.showOnlyWorkspace) {
        std::vector<std::string> paths = roots;
        paths.insert(paths.end(), config_.workspacePaths.begin(), config_.workspacePaths.end());
        listeners = filterToWorkspace(listeners, paths);
    }

    auto next = std::make_shared<Snapshot>();
    next->records = buildRecords(listeners, roots);
    next->source = result.source;
    next->timestamp = time(nullptr);

    if (!config_.showSystemProcesses) {
        next->records.erase(
            std::remove_if(next->records.begin(), next->records.end(), [](const PortRecord& r) {
                return r.category != Category::Dev && !r.isFavorite;
            }),
            next->records.end());
    }

    if (result.failed) {
        next->outcome = ScanOutcome::Failed;
    } else if (result.listeners.empty()) {
        next->outcome = ScanOutcome::NoPorts;
        diag_->info("engine", "no listening ports found");
    } else {
        next->outcome = ScanOutcome::Ok;
    }

    publish(std::move(next));
}

void Engine::publish(std::shared_ptr<Snapshot> next) {
    std::shared_ptr<const Snapshot> published;
    std::vector<HistoryEntry> entries;

    {
        std::lock_guard<std::mutex> lock(snapshotMutex_);

        // Favorites may have been toggled while the scan ran
        auto favorites = store_->favorites();
        for (auto& r : next->records) {
            r.isFavorite = favorites.count(r.port) > 0;
        }

        auto previous = lastGood_;
        if (next->outcome == ScanOutcome::Failed) {
            applyLifecycle(nullptr, next->records, next->timestamp);
        } else {
            next->diff = applyLifecycle(previous.get(), next->records, next->timestamp);
        }

        next->generation = ++generation_;
        snapshot_ = next;
        published = snapshot_;
        if (next->outcome != ScanOutcome::Failed) {
            lastGood_ = next;
        }

        if (config_.recordHistory && previous && next->outcome != ScanOutcome::Failed) {
            entries = historyFromDiff(next->diff, next->timestamp);
        }
    }

    store_->appendHistory(entries);

    std::function<void(std::shared_ptr<const Snapshot>)> callback;
    {
        std::lock_guard<std::mutex> lock(callbackMutex_);
        callback = onSnapshot_;
    }
    if (callback) {
        callback(published);
    }
}

std::shared_ptr<const Snapshot> Engine::snapshot() const {
    std::lock_guard<std::mutex> lock(snapshotMutex_);
    return snapshot_;
}

View Engine::currentView(const std::string& searchTerm, FilterMode filter,
                         GroupBy groupBy, ViewMode mode) const {
    auto snap = snapshot();
    return buildView(snap->records, snap->outcome, searchTerm, filter, groupBy, mode, config_.groups);
}

View Engine::currentView() const {
    std::string term;
    FilterMode filter;
    {
        std::lock_guard<std::mutex> lock(viewMutex_);
        term = searchTerm_;
        filter = filter_;
    }
    return currentView(term, filter, config_.groupBy, config_.viewMode);
}

bool Engine::toggleFavorite(int port) {
    bool favorite = store_->toggleFavorite(port);

    std::shared_ptr<const Snapshot> published;
    {
        std::lock_guard<std::mutex> lock(snapshotMutex_);
        auto next = std::make_shared<Snapshot>(*snapshot_);
        for (auto& r : next->records) {
            if (r.port == port) {
                r.isFavorite = favorite;
            }
        }
        snapshot_ = next;
        published = snapshot_;
    }

    std::function<void(std::shared_ptr<const Snapshot>)> callback;
    {
        std::lock_guard<std::mutex> lock(callbackMutex_);
        callback = onSnapshot_;
    }
    if (callback) {
        callback(published);
    }

    return favorite;
}

void Engine::setFilter(FilterMode mode) {
    std::lock_guard<std::mutex> lock(viewMutex_);
    filter_ = mode;
}

FilterMode Engine::filter() const {
    std::lock_guard<std::mutex> lock(viewMutex_);
    return filter_;
}

void Engine::setSearchTerm(const std::string& term) {
    std::lock_guard<std::mutex> lock(viewMutex_);
    searchTerm_ = term;
}

std::string Engine::searchTerm() const {
    std::lock_guard<std::mutex> lock(viewMutex_);
    return searchTerm_;
}

void Engine::setOnSnapshot(std::function<void(std::shared_ptr<const Snapshot>)> callback) {
    std::lock_guard<std::mutex> lock(callbackMutex_);
    onSnapshot_ = std::move(callback);
}

std::vector<HistoryEntry> Engine::history() const {
    return store_->history();
}

Analytics Engine::analytics() const {
    return computeAnalytics(snapshot()->records, store_->history());
}

void Engine::setRefreshInterval(std::chrono::milliseconds interval) {
    refreshIntervalMs_ = interval.count();
    timerCv_.notify_all(); // Wake up thread to adjust timing
}

void Engine::startAutoRefresh() {
    if (timerRunning_ || refreshIntervalMs_ <= 0) {
        return;
    }
    timerRunning_ = true;
    timerThread_ = std::thread(&Engine::timerThreadFunc, this);
}

void Engine::stopAutoRefresh() {
    {
        std::lock_guard<std::mutex> lock(timerMutex_);
        timerRunning_ = false;
    }
    timerCv_.notify_all();

    if (timerThread_.joinable()) {
        timerThread_.join();
    }
}

void Engine::timerThreadFunc() {
    while (timerRunning_) {
        {
            std::unique_lock<std::mutex> lock(timerMutex_);
            timerCv_.wait_for(lock, std::chrono::milliseconds(refreshIntervalMs_.load()), [this] {
                return !timerRunning_;
            });
        }

        if (!timerRunning_) {
            break;
        }

        // Coalesced if a manual scan is already running
        scan();
    }
}

} // namespace px
