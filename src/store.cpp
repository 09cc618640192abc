#include "store.hpp"
#include "config.hpp"
#include <fstream>
#include <utility>
#include <iostream>
#include <sys/stat.h>

namespace px {

Store::Store(std::string path, size_t historyLimit)
    : path_(std::move(path)), historyLimit_(historyLimit) {}

std::string Store::getStateFilePath() {
    return Config::getConfigDir() + "/state.json";
}

std::shared_ptr<Store> Store::load(const Config& config) {
    return loadFrom(getStateFilePath(), config.historyLimit);
}

std::shared_ptr<Store> Store::loadFrom(const std::string& path, size_t historyLimit) {
    auto store = std::make_shared<Store>(path, historyLimit);

    std::ifstream file(path);
    if (!file.is_open()) {
        // Return defaults if file doesn't exist
        return store;
    }

    try {
        json j;
        file >> j;

        // Load favorites
        if (j.contains("favorites") && j["favorites"].is_array()) {
            for (const auto& p : j["favorites"]) {
                if (p.is_number_integer()) {
                    int port = p.get<int>();
                    if (port >= 1 && port <= 65535) store->favorites_.insert(port);
                }
            }
        }

        // Load history, skipping entries that do not parse
        if (j.contains("history") && j["history"].is_array()) {
            for (const auto& e : j["history"]) {
                try {
                    store->history_.push_back(e.get<HistoryEntry>());
                } catch (const std::exception& ex) {
                    std::cerr << "Skipping history entry: " << ex.what() << std::endl;
                }
            }
        }

        store->truncateLocked();

    } catch (const std::exception& e) {
        std::cerr << "Error parsing state file: " << e.what() << std::endl;
        // Return default state on parse error
    }

    return store;
}

bool Store::save() {
    std::lock_guard<std::mutex> lock(mutex_);
    return saveLocked();
}

bool Store::saveLocked() {
    if (path_.empty()) {
        return false;
    }

    // Create directory if it doesn't exist
    std::string dir = path_.substr(0, path_.find_last_of('/'));
    if (!dir.empty() && dir != path_) {
        mkdir(dir.c_str(), 0755);
    }

    try {
        json j;
        j["favorites"] = favorites_;
        j["history"] = history_;

        std::ofstream file(path_);
        if (!file.is_open()) {
            return false;
        }

        file << j.dump(2);  // Pretty print with 2-space indent
        file.close();

        chmod(path_.c_str(), 0600);

        return !file.fail();

    } catch (const std::exception& e) {
        std::cerr << "Error saving state: " << e.what() << std::endl;
        return false;
    }
}

bool Store::isFavorite(int port) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return favorites_.count(port) > 0;
}

std::set<int> Store::favorites() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return favorites_;
}

bool Store::toggleFavorite(int port) {
    std::lock_guard<std::mutex> lock(mutex_);

    bool nowFavorite;
    if (favorites_.erase(port) > 0) {
        nowFavorite = false;
    } else {
        favorites_.insert(port);
        nowFavorite = true;
    }

    if (!path_.empty() && !saveLocked()) {
        std::cerr << "Error saving favorites to " << path_ << std::endl;
    }
    return nowFavorite;
}

void Store::appendHistory(const std::vector<HistoryEntry>& entries) {
    if (entries.empty()) return;

    std::lock_guard<std::mutex> lock(mutex_);
    history_.insert(history_.end(), entries.begin(), entries.end());
    truncateLocked();
    if (!path_.empty() && !saveLocked()) {
        std::cerr << "Error saving history to " << path_ << std::endl;
    }
}

std::vector<HistoryEntry> Store::history() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return history_;
}

void Store::setHistoryLimit(size_t limit) {
    std::lock_guard<std::mutex> lock(mutex_);
    historyLimit_ = limit;
    truncateLocked();
}

// Oldest entries go first
void Store::truncateLocked() {
    if (history_.size() > historyLimit_) {
        history_.erase(history_.begin(), history_.begin() + (history_.size() - historyLimit_));
    }
}

} // namespace px
