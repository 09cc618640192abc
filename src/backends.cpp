#include "backends.hpp"
#include "procutil.hpp"
#include "strutil.hpp"
#include <cstdio>
#include <cerrno>
#include <cstring>
#include <stdexcept>
#include <thread>
#include <utility>

namespace px {

std::vector<Connection> ProcfsBackend::connections() {
    std::vector<Connection> result;

    const std::pair<const char*, const char*> tables[] = {
        {"/proc/net/tcp", "tcp"},
        {"/proc/net/tcp6", "tcp6"}
    };

    bool anyTable = false;
    std::vector<std::pair<std::string, TcpSocketEntry>> entries;
    for (const auto& table : tables) {
        auto rows = readTcpTable(table.first);
        if (!rows) continue;
        anyTable = true;
        for (const auto& row : *rows) {
            entries.emplace_back(table.second, row);
        }
    }

    if (!anyTable) {
        throw std::runtime_error("cannot read /proc/net/tcp or /proc/net/tcp6");
    }

    auto inodeToPids = buildInodeToPidMap();

    for (const auto& [protocol, entry] : entries) {
        auto it = inodeToPids.find(entry.inode);
        if (it == inodeToPids.end() || it->second.empty()) {
            // Owner not visible (other user, or socket in TIME_WAIT)
            result.push_back({protocol, entry.state, entry.localPort, 0, ""});
            continue;
        }
        for (int pid : it->second) {
            result.push_back({protocol, entry.state, entry.localPort, pid, ""});
        }
    }

    return result;
}

std::vector<ProcessEntry> ProcfsBackend::processes() {
    std::vector<ProcessEntry> result;
    for (int pid : listPids()) {
        auto info = readProcessInfo(pid);
        if (!info) {
            continue; // Exited between listing and reading
        }
        result.push_back(*info);
    }
    return result;
}

std::vector<SocketRow> parseSsLine(const std::string& line) {
    std::vector<SocketRow> rows;

    auto fields = splitWhitespace(line);
    if (fields.size() < 5) return rows;

    SocketRow base;
    base.protocol = "tcp";

    // With -t the first column is the state; with -A it is the netid
    size_t offset = 0;
    if (fields[0] == "tcp" || fields[0] == "tcp6") {
        base.protocol = fields[0];
        offset = 1;
        if (fields.size() < 6) return rows;
    }
    base.state = fields[offset];

    // Local address is "addr:port", "[v6]:port", "addr%if:port" or "*:port"
    const std::string& local = fields[offset + 3];
    size_t colon = local.rfind(':');
    if (colon == std::string::npos) return rows;
    auto port = parsePort(local.substr(colon + 1));
    if (!port) return rows;
    base.localPort = *port;

    // users:(("name",pid=123,fd=4),("name",pid=124,fd=4))
    size_t users = line.find("users:(");
    if (users == std::string::npos) {
        rows.push_back(base);
        return rows;
    }

    size_t pos = users;
    while ((pos = line.find("(\"", pos)) != std::string::npos) {
        size_t nameEnd = line.find('"', pos + 2);
        if (nameEnd == std::string::npos) break;

        SocketRow row = base;
        row.process = line.substr(pos + 2, nameEnd - pos - 2);

        size_t close = line.find(')', nameEnd);
        size_t pidPos = line.find("pid=", nameEnd);
        if (pidPos != std::string::npos && (close == std::string::npos || pidPos < close)) {
            size_t pidEnd = line.find_first_not_of("0123456789", pidPos + 4);
            std::string digits = line.substr(pidPos + 4, pidEnd == std::string::npos ? std::string::npos : pidEnd - pidPos - 4);
            if (!digits.empty()) {
                row.pid = std::stoi(digits);
            }
        }
        rows.push_back(row);

        if (close == std::string::npos) break;
        pos = close;
    }

    if (rows.empty()) {
        rows.push_back(base);
    }
    return rows;
}

SocketStatBackend::SocketStatBackend(std::string command) : command_(std::move(command)) {}

void SocketStatBackend::stream(RowCallback onRow, DoneCallback onDone) {
    std::string command = command_;

    std::thread([command, onRow, onDone]() {
        FILE* pipe = popen(command.c_str(), "r");
        if (!pipe) {
            onDone(std::make_exception_ptr(
                std::runtime_error(std::string("cannot run ss: ") + strerror(errno))));
            return;
        }

        std::exception_ptr failure;
        try {
            std::string line;
            char buffer[4096];
            while (fgets(buffer, sizeof(buffer), pipe) != nullptr) {
                line += buffer;
                if (line.empty() || line.back() != '\n') {
                    continue; // Partial line, keep reading
                }
                for (auto& row : parseSsLine(line)) {
                    if (row.pid > 0) {
                        row.cmdline = readCommandLine(row.pid);
                    }
                    onRow(row);
                }
                line.clear();
            }
            if (!line.empty()) {
                for (auto& row : parseSsLine(line)) {
                    if (row.pid > 0) {
                        row.cmdline = readCommandLine(row.pid);
                    }
                    onRow(row);
                }
            }
        } catch (const std::exception&) {
            failure = std::current_exception();
        }

        int status = pclose(pipe);
        if (!failure && status != 0) {
            failure = std::make_exception_ptr(
                std::runtime_error("ss exited with status " + std::to_string(status)));
        }
        onDone(failure);
    }).detach();
}

} // namespace px
