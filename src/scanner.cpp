#include "scanner.hpp"
#include "strutil.hpp"
#include <condition_variable>
#include <map>
#include <mutex>
#include <set>
#include <stdexcept>
#include <utility>

namespace px {

std::string toString(ScanSource s) {
    switch (s) {
        case ScanSource::Primary: return "primary";
        case ScanSource::Fallback: return "fallback";
        case ScanSource::None: return "none";
    }
    return "none";
}

bool isListeningTcp(const std::string& protocol, const std::string& state) {
    std::string proto = toLower(protocol);
    if (proto.compare(0, 3, "tcp") != 0) {
        return false;
    }
    return toLower(state).find("listen") != std::string::npos;
}

Scanner::Scanner(std::shared_ptr<ConnectionBackend> primary,
                 std::shared_ptr<SocketStream> fallback,
                 std::shared_ptr<DiagnosticLog> diag,
                 std::chrono::milliseconds fallbackTimeout)
    : primary_(std::move(primary)),
      fallback_(std::move(fallback)),
      diag_(diag ? std::move(diag) : std::make_shared<DiagnosticLog>()),
      fallbackTimeout_(fallbackTimeout) {}

std::vector<Listener> Scanner::scanPrimary() {
    if (!primary_) {
        throw std::runtime_error("no primary backend");
    }

    auto connections = primary_->connections();
    auto processes = primary_->processes();

    std::map<int, const ProcessEntry*> byPid;
    for (const auto& p : processes) {
        byPid.emplace(p.pid, &p);
    }

    std::vector<Listener> result;
    std::set<std::pair<int, int>> seen;

    for (const auto& conn : connections) {
        if (!isListeningTcp(conn.protocol, conn.state) || conn.localPort <= 0) {
            continue;
        }

        int pid = conn.pid > 0 ? conn.pid : 0;
        if (!seen.insert({conn.localPort, pid}).second) {
            continue;
        }

        Listener l;
        l.port = conn.localPort;
        l.pid = pid;
        l.processName = conn.process.empty() ? "Unknown" : conn.process;

        if (pid) {
            auto it = byPid.find(pid);
            if (it != byPid.end()) {
                if (!it->second->name.empty()) l.processName = it->second->name;
                l.commandLine = it->second->command;
            }
        }

        result.push_back(l);
    }

    return result;
}

std::vector<Listener> Scanner::scanFallback() {
    if (!fallback_) {
        throw std::runtime_error("no fallback backend");
    }

    // Shared with the stream so a late completion after a timeout is harmless
    struct StreamState {
        std::mutex mutex;
        std::condition_variable cv;
        std::vector<Listener> listeners;
        std::set<std::pair<int, int>> seen;
        bool done = false;
        std::exception_ptr error;
    };
    auto state = std::make_shared<StreamState>();

    fallback_->stream(
        [state](const SocketRow& row) {
            if (!isListeningTcp(row.protocol, row.state) || row.localPort <= 0) {
                return;
            }
            int pid = row.pid > 0 ? row.pid : 0;

            std::lock_guard<std::mutex> lock(state->mutex);
            if (state->done || !state->seen.insert({row.localPort, pid}).second) {
                return;
            }
            state->listeners.push_back({row.localPort, pid,
                                        row.process.empty() ? "Unknown" : row.process,
                                        row.cmdline});
        },
        [state](std::exception_ptr error) {
            {
                std::lock_guard<std::mutex> lock(state->mutex);
                state->done = true;
                state->error = error;
            }
            state->cv.notify_all();
        });

    std::unique_lock<std::mutex> lock(state->mutex);
    if (!state->cv.wait_for(lock, fallbackTimeout_, [&state] { return state->done; })) {
        state->done = true; // Ignore rows that arrive later
        throw std::runtime_error(fallback_->name() + " timed out");
    }
    if (state->error) {
        std::rethrow_exception(state->error);
    }
    return state->listeners;
}

ScanResult Scanner::scan() {
    ScanResult result;
    bool primaryFailed = false;

    try {
        result.listeners = scanPrimary();
        if (!result.listeners.empty()) {
            result.source = ScanSource::Primary;
            return result;
        }
        diag_->info("scanner", "no listening sockets from primary backend, trying fallback");
    } catch (const std::exception& e) {
        primaryFailed = true;
        diag_->warning("scanner", std::string("primary backend failed, falling back: ") + e.what());
    }

    try {
        result.listeners = scanFallback();
        result.source = result.listeners.empty() ? ScanSource::None : ScanSource::Fallback;
    } catch (const std::exception& e) {
        result.listeners.clear();
        result.source = ScanSource::None;
        result.failed = primaryFailed;
        diag_->warning("scanner", std::string("fallback backend failed: ") + e.what());
    }

    return result;
}

std::vector<Listener> filterToWorkspace(const std::vector<Listener>& listeners,
                                        const std::vector<std::string>& paths) {
    std::vector<std::string> lowered;
    for (const auto& p : paths) {
        if (!p.empty()) lowered.push_back(toLower(p));
    }
    if (lowered.empty()) {
        return listeners;
    }

    std::vector<Listener> result;
    for (const auto& l : listeners) {
        std::string cmd = toLower(l.commandLine);
        for (const auto& p : lowered) {
            if (cmd.find(p) != std::string::npos) {
                result.push_back(l);
                break;
            }
        }
    }
    return result;
}

} // namespace px
