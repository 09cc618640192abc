#ifndef PX_TEST_SUPPORT_HPP
#define PX_TEST_SUPPORT_HPP

#include "backends.hpp"
#include "filesystem.hpp"
#include "types.hpp"
#include <atomic>
#include <functional>
#include <map>
#include <mutex>
#include <set>
#include <stdexcept>
#include <string>
#include <vector>

namespace px {
namespace test {

// In-memory FileSystem
class FakeFileSystem : public FileSystem {
public:
    void addDir(const std::string& path) {
        std::lock_guard<std::mutex> lock(mutex_);
        dirs_.insert(path);
    }

    void addFile(const std::string& path, const std::string& content) {
        std::lock_guard<std::mutex> lock(mutex_);
        files_[path] = content;
    }

    // Exists but cannot be read
    void addUnreadable(const std::string& path) {
        std::lock_guard<std::mutex> lock(mutex_);
        unreadable_.insert(path);
    }

    bool exists(const std::string& path) const override {
        std::lock_guard<std::mutex> lock(mutex_);
        return dirs_.count(path) || files_.count(path) || unreadable_.count(path);
    }

    bool isDirectory(const std::string& path) const override {
        std::lock_guard<std::mutex> lock(mutex_);
        return dirs_.count(path) > 0;
    }

    std::optional<std::string> readFile(const std::string& path) const override {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = files_.find(path);
        if (it == files_.end()) return std::nullopt;
        return it->second;
    }

private:
    mutable std::mutex mutex_;
    std::set<std::string> dirs_;
    std::set<std::string> unreadable_;
    std::map<std::string, std::string> files_;
};

// Primary backend returning canned data
class FakeConnectionBackend : public ConnectionBackend {
public:
    std::vector<Connection> conns;
    std::vector<ProcessEntry> procs;
    bool fail = false;
    std::function<void()> onQuery;        // Runs at the start of every connections() call
    std::atomic<int> calls{0};

    std::string name() const override { return "fake"; }

    std::vector<Connection> connections() override {
        calls++;
        if (onQuery) onQuery();
        if (fail) throw std::runtime_error("fake backend unavailable");
        std::lock_guard<std::mutex> lock(mutex_);
        return conns;
    }

    std::vector<ProcessEntry> processes() override {
        std::lock_guard<std::mutex> lock(mutex_);
        return procs;
    }

    // Replace the data between scans
    void set(std::vector<Connection> c, std::vector<ProcessEntry> p) {
        std::lock_guard<std::mutex> lock(mutex_);
        conns = std::move(c);
        procs = std::move(p);
    }

private:
    std::mutex mutex_;
};

// Fallback backend delivering rows synchronously
class FakeSocketStream : public SocketStream {
public:
    std::vector<SocketRow> rows;
    bool fail = false;
    bool hang = false;                    // Never signal completion
    std::atomic<int> calls{0};

    std::string name() const override { return "fake-stream"; }

    void stream(RowCallback onRow, DoneCallback onDone) override {
        calls++;
        for (const auto& row : rows) {
            onRow(row);
        }
        if (hang) return;
        if (fail) {
            onDone(std::make_exception_ptr(std::runtime_error("fake stream failed")));
            return;
        }
        onDone(nullptr);
    }
};

inline Connection listenConn(int port, int pid, const std::string& protocol = "tcp") {
    return Connection{protocol, "LISTEN", port, pid, ""};
}

inline SocketRow listenRow(int port, int pid, const std::string& process, const std::string& cmdline = "") {
    return SocketRow{"tcp", "LISTEN", port, pid, process, cmdline};
}

} // namespace test
} // namespace px

#endif // PX_TEST_SUPPORT_HPP
