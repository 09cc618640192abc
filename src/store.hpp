#ifndef PX_STORE_HPP
#define PX_STORE_HPP

#include "types.hpp"
#include "config.hpp"
#include <memory>
#include <mutex>
#include <set>
#include <string>
#include <vector>

namespace px {

// Store persists the favorites set and the port history log
class Store {
public:
    // An empty path keeps everything in memory
    explicit Store(std::string path = "", size_t historyLimit = 1000);

    // Load from ~/.portsexplorer/state.json, capped at config.historyLimit
    static std::shared_ptr<Store> load(const Config& config);
    static std::shared_ptr<Store> loadFrom(const std::string& path, size_t historyLimit = 1000);

    // Write to the backing file; false on I/O failure or when in memory
    bool save();

    // Favorites
    bool isFavorite(int port) const;
    std::set<int> favorites() const;

    // Flip membership and persist; returns the new membership
    bool toggleFavorite(int port);

    // History
    void appendHistory(const std::vector<HistoryEntry>& entries);
    std::vector<HistoryEntry> history() const;
    void setHistoryLimit(size_t limit);

    const std::string& path() const { return path_; }

    static std::string getStateFilePath();

private:
    mutable std::mutex mutex_;
    std::string path_;
    size_t historyLimit_;
    std::set<int> favorites_;
    std::vector<HistoryEntry> history_;

    bool saveLocked();
    void truncateLocked();
};

} // namespace px

#endif // PX_STORE_HPP
