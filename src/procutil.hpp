#ifndef PX_PROCUTIL_HPP
#define PX_PROCUTIL_HPP

#include "types.hpp"
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace px {

// TCP state names indexed by the hex code used in /proc/net/tcp
extern const std::map<std::string, std::string> TCP_STATE_NAMES;

// One row of /proc/net/tcp or /proc/net/tcp6
struct TcpSocketEntry {
    int localPort;
    std::string state;       // LISTEN, ESTABLISHED, ...
    std::string inode;
};

// Parse the contents of /proc/net/tcp or /proc/net/tcp6 (header included)
std::vector<TcpSocketEntry> parseProcNetTcp(const std::string& content);

// Read and parse one /proc/net table; nullopt if it cannot be opened
std::optional<std::vector<TcpSocketEntry>> readTcpTable(const std::string& path);

// Map socket inode -> owning PIDs by scanning /proc/[pid]/fd
std::map<std::string, std::vector<int>> buildInodeToPidMap();

// Read name and command line of a process from /proc/[pid]
std::shared_ptr<ProcessEntry> readProcessInfo(int pid);

// Command line of a process with NUL separators replaced by spaces
std::string readCommandLine(int pid);

// All numeric entries of /proc
std::vector<int> listPids();

// Check if a process exists and can be signalled
bool isProcessRunning(int pid);

// Send SIGTERM, wait up to two seconds, then SIGKILL.
// Throws std::runtime_error if the signal cannot be delivered.
void killProcess(int pid);

} // namespace px

#endif // PX_PROCUTIL_HPP
