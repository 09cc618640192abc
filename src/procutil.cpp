#include "procutil.hpp"
#include "strutil.hpp"
#include <fstream>
#include <sstream>
#include <dirent.h>
#include <unistd.h>
#include <signal.h>
#include <cerrno>
#include <cstring>
#include <cctype>
#include <chrono>
#include <thread>
#include <stdexcept>
#include <sys/stat.h>

namespace px {

const std::map<std::string, std::string> TCP_STATE_NAMES = {
    {"01", "ESTABLISHED"}, {"02", "SYN_SENT"}, {"03", "SYN_RECV"},
    {"04", "FIN_WAIT1"}, {"05", "FIN_WAIT2"}, {"06", "TIME_WAIT"},
    {"07", "CLOSE"}, {"08", "CLOSE_WAIT"}, {"09", "LAST_ACK"},
    {"0A", "LISTEN"}, {"0B", "CLOSING"}, {"0C", "NEW_SYN_RECV"}
};

std::vector<TcpSocketEntry> parseProcNetTcp(const std::string& content) {
    std::vector<TcpSocketEntry> entries;
    std::istringstream in(content);

    std::string line;
    std::getline(in, line); // Skip header

    while (std::getline(in, line)) {
        std::istringstream iss(line);
        std::vector<std::string> fields;
        std::string field;
        while (iss >> field) {
            fields.push_back(field);
        }

        if (fields.size() < 10) continue;

        // Parse port from local_address (IP:PORT in hex)
        const std::string& localAddr = fields[1];
        size_t colonPos = localAddr.rfind(':');
        if (colonPos == std::string::npos) continue;

        std::string portHex = localAddr.substr(colonPos + 1);
        if (portHex.empty() || portHex.find_first_not_of("0123456789abcdefABCDEF") != std::string::npos) {
            continue;
        }

        TcpSocketEntry entry;
        entry.localPort = std::stoi(portHex, nullptr, 16);

        // Field 3 is connection state (0A = LISTEN)
        std::string stateHex = fields[3];
        for (char& c : stateHex) {
            c = static_cast<char>(std::toupper(static_cast<unsigned char>(c)));
        }
        auto it = TCP_STATE_NAMES.find(stateHex);
        entry.state = it != TCP_STATE_NAMES.end() ? it->second : "UNKNOWN";

        entry.inode = fields[9];
        entries.push_back(entry);
    }

    return entries;
}

std::optional<std::vector<TcpSocketEntry>> readTcpTable(const std::string& path) {
    std::ifstream file(path);
    if (!file.is_open()) {
        return std::nullopt;
    }
    std::ostringstream oss;
    oss << file.rdbuf();
    return parseProcNetTcp(oss.str());
}

std::map<std::string, std::vector<int>> buildInodeToPidMap() {
    std::map<std::string, std::vector<int>> inodeToPids;

    DIR* procDir = opendir("/proc");
    if (!procDir) return inodeToPids;

    struct dirent* entry;
    while ((entry = readdir(procDir)) != nullptr) {
        // Check if entry is a PID (numeric)
        if (!isdigit(static_cast<unsigned char>(entry->d_name[0]))) continue;

        int pid = atoi(entry->d_name);

        // Read all FDs for this PID; unreadable ones belong to other users
        std::string fdDir = std::string("/proc/") + entry->d_name + "/fd";
        DIR* fdDirPtr = opendir(fdDir.c_str());
        if (!fdDirPtr) continue;

        struct dirent* fdEntry;
        while ((fdEntry = readdir(fdDirPtr)) != nullptr) {
            if (fdEntry->d_name[0] == '.') continue;

            std::string fdPath = fdDir + "/" + fdEntry->d_name;
            char link[256];
            ssize_t len = readlink(fdPath.c_str(), link, sizeof(link) - 1);
            if (len == -1) continue;
            link[len] = '\0';

            // Check if it's a socket
            std::string linkStr(link);
            if (linkStr.compare(0, 8, "socket:[") != 0 || linkStr.back() != ']') continue;

            // Extract inode
            std::string inode = linkStr.substr(8, linkStr.length() - 9);

            auto& pids = inodeToPids[inode];
            if (pids.empty() || pids.back() != pid) {
                pids.push_back(pid);
            }
        }
        closedir(fdDirPtr);
    }
    closedir(procDir);

    return inodeToPids;
}

std::string readCommandLine(int pid) {
    std::string cmdlinePath = "/proc/" + std::to_string(pid) + "/cmdline";
    std::ifstream cmdlineFile(cmdlinePath, std::ios::binary);
    if (!cmdlineFile.is_open()) {
        return "";
    }

    std::string cmdline((std::istreambuf_iterator<char>(cmdlineFile)),
                        std::istreambuf_iterator<char>());

    // Replace null bytes with spaces
    for (char& c : cmdline) {
        if (c == '\0') c = ' ';
    }

    // Trim trailing whitespace
    cmdline.erase(cmdline.find_last_not_of(" \t\n\r") + 1);
    return cmdline;
}

std::shared_ptr<ProcessEntry> readProcessInfo(int pid) {
    std::string procDir = "/proc/" + std::to_string(pid);

    // Check if process exists
    struct stat st;
    if (stat(procDir.c_str(), &st) != 0) {
        return nullptr;
    }

    std::ifstream statFile(procDir + "/stat");
    if (!statFile.is_open()) return nullptr;

    std::string statLine;
    std::getline(statFile, statLine);

    // Extract name from (name); the name itself may contain ')'
    size_t firstParen = statLine.find('(');
    size_t lastParen = statLine.rfind(')');
    if (firstParen == std::string::npos || lastParen == std::string::npos || lastParen < firstParen) {
        return nullptr;
    }

    auto info = std::make_shared<ProcessEntry>();
    info->pid = pid;
    info->name = statLine.substr(firstParen + 1, lastParen - firstParen - 1);
    info->command = readCommandLine(pid);
    return info;
}

std::vector<int> listPids() {
    std::vector<int> pids;

    DIR* procDir = opendir("/proc");
    if (!procDir) return pids;

    struct dirent* entry;
    while ((entry = readdir(procDir)) != nullptr) {
        int pid = atoi(entry->d_name);
        if (pid > 0) {
            pids.push_back(pid);
        }
    }
    closedir(procDir);

    return pids;
}

bool isProcessRunning(int pid) {
    return pid > 0 && kill(pid, 0) == 0;
}

void killProcess(int pid) {
    if (pid <= 0) {
        throw std::runtime_error("invalid pid " + std::to_string(pid));
    }

    if (kill(pid, SIGTERM) != 0) {
        throw std::runtime_error("cannot signal pid " + std::to_string(pid) + ": " + strerror(errno));
    }

    // Wait up to 2 seconds for graceful shutdown
    for (int i = 0; i < 20; i++) {
        if (!isProcessRunning(pid)) {
            return;
        }
        std::this_thread::sleep_for(std::chrono::milliseconds(100));
    }

    // Force kill if still running
    if (kill(pid, SIGKILL) != 0 && errno != ESRCH) {
        throw std::runtime_error("cannot kill pid " + std::to_string(pid) + ": " + strerror(errno));
    }
}

} // namespace px
