#ifndef PX_BACKENDS_HPP
#define PX_BACKENDS_HPP

#include "types.hpp"
#include <exception>
#include <functional>
#include <memory>
#include <string>
#include <vector>

namespace px {

// Primary backend: snapshot queries for sockets and processes.
// Either call may throw; the scanner then falls back.
class ConnectionBackend {
public:
    virtual ~ConnectionBackend() = default;

    virtual std::string name() const = 0;
    virtual std::vector<Connection> connections() = 0;
    virtual std::vector<ProcessEntry> processes() = 0;
};

// Fallback backend: streams one row at a time and signals completion
// exactly once, possibly from another thread. A non-null exception_ptr
// in onDone reports a failed enumeration.
class SocketStream {
public:
    using RowCallback = std::function<void(const SocketRow&)>;
    using DoneCallback = std::function<void(std::exception_ptr)>;

    virtual ~SocketStream() = default;

    virtual std::string name() const = 0;
    virtual void stream(RowCallback onRow, DoneCallback onDone) = 0;
};

// Reads /proc/net/tcp{,6} and /proc/[pid]
class ProcfsBackend : public ConnectionBackend {
public:
    std::string name() const override { return "procfs"; }
    std::vector<Connection> connections() override;
    std::vector<ProcessEntry> processes() override;
};

// Runs `ss -H -t -l -n -p` on a worker thread
class SocketStatBackend : public SocketStream {
public:
    explicit SocketStatBackend(std::string command = "ss -H -t -l -n -p 2>/dev/null");

    std::string name() const override { return "ss"; }
    void stream(RowCallback onRow, DoneCallback onDone) override;

private:
    std::string command_;
};

// Parse one line of `ss -H -t -l -n -p`; one row per owning pid, or one
// row with pid 0 when the owner is not visible
std::vector<SocketRow> parseSsLine(const std::string& line);

} // namespace px

#endif // PX_BACKENDS_HPP
