#include "engine.hpp"
#include "classifier.hpp"
#include "procutil.hpp"
#include "strutil.hpp"
#include <iostream>
#include <iomanip>
#include <vector>
#include <string>
#include <cstring>
#include <csignal>
#include <chrono>
#include <thread>
#include <set>
#include <sstream>
#include <ctime>
#include <memory>
#include <cstdlib>

using namespace px;

static volatile std::sig_atomic_t stopRequested = 0;

static void handleSignal(int) {
    stopRequested = 1;
}

// Command line options shared by every command
struct Options {
    std::string search;
    std::optional<FilterMode> filter;
    std::optional<GroupBy> groupBy;
    std::optional<ViewMode> viewMode;
    std::vector<std::string> roots;
    bool verbose = false;
    std::vector<std::string> positional;
};

Options parseOptions(const std::vector<std::string>& args) {
    Options opts;

    for (const auto& arg : args) {
        if (arg.substr(0, 2) != "--") {
            opts.positional.push_back(arg);
            continue;
        }

        std::string key = arg.substr(2);
        std::string value = "true";
        size_t eqPos = arg.find('=');
        if (eqPos != std::string::npos) {
            key = arg.substr(2, eqPos - 2);
            value = arg.substr(eqPos + 1);
        }

        if (key == "search") {
            opts.search = value;
        } else if (key == "filter") {
            opts.filter = parseFilterMode(value);
            if (!opts.filter) throw std::runtime_error("unknown filter: " + value);
        } else if (key == "group") {
            opts.groupBy = parseGroupBy(value);
            if (!opts.groupBy) throw std::runtime_error("unknown grouping: " + value);
        } else if (key == "view") {
            opts.viewMode = parseViewMode(value);
            if (!opts.viewMode) throw std::runtime_error("unknown view mode: " + value);
        } else if (key == "root") {
            opts.roots.push_back(value);
        } else if (key == "verbose") {
            opts.verbose = value != "false";
        } else {
            throw std::runtime_error("unknown option: --" + key);
        }
    }

    return opts;
}

std::unique_ptr<Engine> makeEngine(const Options& opts, int autoRefresh = -1) {
    Config config = Config::load();
    if (opts.filter) config.filterMode = *opts.filter;
    if (opts.groupBy) config.groupBy = *opts.groupBy;
    if (opts.viewMode) config.viewMode = *opts.viewMode;
    if (autoRefresh >= 0) config.autoRefresh = autoRefresh;
    config.workspaceRoots.insert(config.workspaceRoots.end(), opts.roots.begin(), opts.roots.end());

    auto store = Store::load(config);
    auto diag = std::make_shared<DiagnosticLog>(opts.verbose);

    auto engine = std::make_unique<Engine>(config, store, EngineBackends::system(), nullptr, diag);
    engine->setSearchTerm(opts.search);
    return engine;
}

static std::string clip(const std::string& s, size_t width) {
    if (s.length() <= width) return s;
    return s.substr(0, width - 3) + "...";
}

void printRecord(const Engine& engine, const PortRecord& r, const std::string& indent) {
    std::string project = "-";
    if (r.project) {
        project = r.project->name + " (" + r.project->framework + ")";
    }
    std::string label = engine.labelFor(r.port);

    std::cout << indent << std::left
              << std::setw(2) << (r.isFavorite ? "*" : "")
              << std::setw(7) << r.port
              << std::setw(8) << (r.pid > 0 ? std::to_string(r.pid) : "-")
              << std::setw(20) << clip(r.processName, 19)
              << std::setw(8) << toString(r.category)
              << std::setw(30) << clip(project, 29)
              << label << "\n";
}

void printView(const Engine& engine, const View& view) {
    if (view.state == ViewState::Pending) {
        std::cout << "No scan yet, run a refresh\n";
        return;
    }
    if (view.state == ViewState::Failed) {
        std::cout << "Could not enumerate listening sockets\n";
        return;
    }
    if (view.state == ViewState::NoPorts) {
        std::cout << "No listening ports found\n";
        return;
    }
    if (view.state == ViewState::NoMatches) {
        std::cout << "No ports match current filter\n";
        return;
    }

    // Header
    std::cout << std::left
              << std::setw(2) << ""
              << std::setw(7) << "PORT"
              << std::setw(8) << "PID"
              << std::setw(20) << "PROCESS"
              << std::setw(8) << "TYPE"
              << std::setw(30) << "PROJECT"
              << "LABEL\n";

    if (view.mode == ViewMode::List) {
        for (const auto& r : view.records) {
            printRecord(engine, r, "");
        }
        return;
    }

    for (const auto& bucket : view.buckets) {
        std::cout << bucket.label << " (" << bucket.count() << ")\n";
        for (const auto& r : bucket.records) {
            printRecord(engine, r, "  ");
        }
    }
}

void handlePs(const Options& opts) {
    auto engine = makeEngine(opts);
    engine->scan();

    auto snap = engine->snapshot();
    if (snap->outcome == ScanOutcome::Failed) {
        std::cerr << "Error: could not enumerate listening sockets\n";
        exit(1);
    }

    printView(*engine, engine->currentView());
}

void handleWatch(const Options& opts) {
    int seconds = 5;
    if (!opts.positional.empty()) {
        auto parsed = parsePort(opts.positional[0]);
        if (!parsed) {
            std::cerr << "Usage: px watch [seconds]\n";
            exit(1);
        }
        seconds = *parsed;
    }

    auto engine = makeEngine(opts, seconds);
    Engine* raw = engine.get();

    engine->setOnSnapshot([raw](std::shared_ptr<const Snapshot> snap) {
        time_t ts = snap->timestamp;
        std::cout << "\n--- " << std::put_time(std::localtime(&ts), "%H:%M:%S")
                  << " (" << toString(snap->outcome) << ", " << toString(snap->source) << ") ---\n";
        for (const auto& r : snap->diff.started) {
            std::cout << "+ " << r.port << " " << r.processName << "\n";
        }
        for (const auto& r : snap->diff.changed) {
            std::cout << "~ " << r.port << " now PID " << r.pid << "\n";
        }
        for (const auto& r : snap->diff.stopped) {
            std::cout << "- " << r.port << " " << r.processName << "\n";
        }
        printView(*raw, raw->currentView());
        std::cout.flush();
    });

    std::signal(SIGINT, handleSignal);
    std::signal(SIGTERM, handleSignal);

    engine->scan();
    engine->startAutoRefresh();

    while (!stopRequested) {
        std::this_thread::sleep_for(std::chrono::milliseconds(200));
    }

    engine->stopAutoRefresh();
    std::cout << "\nStopped watching\n";
}

void handleFav(const Options& opts) {
    if (opts.positional.empty()) {
        std::cerr << "Usage: px fav <port>\n";
        exit(1);
    }

    auto port = parsePort(opts.positional[0]);
    if (!port) {
        std::cerr << "Invalid port: " << opts.positional[0] << "\n";
        exit(1);
    }

    auto store = Store::load(Config::load());
    bool favorite = store->toggleFavorite(*port);
    std::cout << "Port " << *port << (favorite ? " added to" : " removed from") << " favorites\n";
}

void handleHistory(const Options& opts) {
    size_t limit = 50;
    if (!opts.positional.empty()) {
        try {
            limit = std::stoul(opts.positional[0]);
        } catch (const std::exception&) {
            std::cerr << "Usage: px history [n]\n";
            exit(1);
        }
    }

    auto store = Store::load(Config::load());
    auto history = store->history();
    if (history.empty()) {
        std::cout << "No history recorded\n";
        return;
    }

    std::cout << std::left
              << std::setw(22) << "TIME"
              << std::setw(9) << "ACTION"
              << std::setw(7) << "PORT"
              << std::setw(8) << "PID"
              << std::setw(20) << "PROCESS"
              << "DETAILS\n";

    size_t shown = 0;
    for (auto it = history.rbegin(); it != history.rend() && shown < limit; ++it, ++shown) {
        time_t ts = it->timestamp;
        std::ostringstream when;
        when << std::put_time(std::localtime(&ts), "%Y-%m-%d %H:%M:%S");

        std::cout << std::left
                  << std::setw(22) << when.str()
                  << std::setw(9) << toString(it->action)
                  << std::setw(7) << it->port
                  << std::setw(8) << it->pid
                  << std::setw(20) << clip(it->processName, 19)
                  << it->details << "\n";
    }
}

void handleStats(const Options& opts) {
    auto engine = makeEngine(opts);
    engine->scan();

    auto stats = engine->analytics();
    std::cout << "Total ports:     " << stats.totalPorts << "\n";
    std::cout << "Dev servers:     " << stats.activeDev << "\n";
    std::cout << "System:          " << stats.systemPorts << "\n";
    std::cout << "Favorites:       " << stats.favoriteCount << "\n";

    if (!stats.mostUsedPorts.empty()) {
        std::cout << "\nMost used ports:\n";
        for (const auto& usage : stats.mostUsedPorts) {
            std::string label = engine->labelFor(usage.port);
            std::cout << "  " << std::left << std::setw(7) << usage.port
                      << std::setw(6) << usage.count
                      << usage.label;
            if (!label.empty()) std::cout << " [" << label << "]";
            std::cout << "\n";
        }
    }

    if (!stats.recentActivity.empty()) {
        std::cout << "\nRecent activity:\n";
        for (const auto& e : stats.recentActivity) {
            std::cout << "  " << std::left << std::setw(9) << toString(e.action)
                      << std::setw(7) << e.port << e.processName << "\n";
        }
    }
}

void handleKill(const Options& opts) {
    if (opts.positional.empty()) {
        std::cerr << "Usage: px kill <port>\n";
        exit(1);
    }

    auto port = parsePort(opts.positional[0]);
    if (!port) {
        std::cerr << "Invalid port: " << opts.positional[0] << "\n";
        exit(1);
    }

    auto engine = makeEngine(opts);
    engine->scan();

    std::set<int> pids;
    for (const auto& r : engine->snapshot()->records) {
        if (r.port == *port && r.pid > 0) {
            pids.insert(r.pid);
        }
    }

    if (pids.empty()) {
        std::cerr << "No process found listening on port " << *port << "\n";
        exit(1);
    }

    bool failed = false;
    for (int pid : pids) {
        try {
            killProcess(pid);
            std::cout << "Killed PID " << pid << " on port " << *port << "\n";
        } catch (const std::exception& e) {
            std::cerr << "Error killing PID " << pid << ": " << e.what() << "\n";
            failed = true;
        }
    }

    if (failed) {
        exit(1);
    }
}

void printUsage() {
    std::cerr << "Usage: px <command> [args...] [--key=value...]\n";
    std::cerr << "Commands:\n";
    std::cerr << "  ps                 - List listening ports (default)\n";
    std::cerr << "  watch [seconds]    - Re-scan periodically until interrupted (default: 5)\n";
    std::cerr << "  fav <port>         - Toggle a favorite port\n";
    std::cerr << "  history [n]        - Show the last n port events (default: 50)\n";
    std::cerr << "  stats              - Show port statistics\n";
    std::cerr << "  kill <port>        - Terminate the processes listening on a port\n";
    std::cerr << "Options:\n";
    std::cerr << "  --search=<term>                                 - Filter by port, process, project or command\n";
    std::cerr << "  --filter=none|favorites|dev|workspace\n";
    std::cerr << "  --group=port|process|group|category|workspace\n";
    std::cerr << "  --view=tree|list\n";
    std::cerr << "  --root=<path>                                   - Add a workspace root (repeatable)\n";
    std::cerr << "  --verbose                                       - Echo diagnostics to stderr\n";
}

int main(int argc, char* argv[]) {
    std::string cmd = "ps";
    int first = 1;

    if (argc >= 2 && std::strncmp(argv[1], "--", 2) != 0) {
        cmd = argv[1];
        first = 2;
    }

    std::vector<std::string> args;
    for (int i = first; i < argc; i++) {
        args.push_back(argv[i]);
    }

    if (cmd == "help" || cmd == "-h") {
        printUsage();
        return 0;
    }

    try {
        Options opts = parseOptions(args);

        if (cmd == "ps") {
            handlePs(opts);
        } else if (cmd == "watch") {
            handleWatch(opts);
        } else if (cmd == "fav") {
            handleFav(opts);
        } else if (cmd == "history") {
            handleHistory(opts);
        } else if (cmd == "stats") {
            handleStats(opts);
        } else if (cmd == "kill") {
            handleKill(opts);
        } else {
            std::cerr << "Unknown command: " << cmd << "\n";
            printUsage();
            return 1;
        }
    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << "\n";
        return 1;
    }

    return 0;
}
