#ifndef PX_SCANNER_HPP
#define PX_SCANNER_HPP

#include "types.hpp"
#include "backends.hpp"
#include "diagnostics.hpp"
#include <chrono>
#include <memory>
#include <string>
#include <vector>

namespace px {

enum class ScanSource { Primary, Fallback, None };

std::string toString(ScanSource s);

// Result of enumerating listening sockets
struct ScanResult {
    std::vector<Listener> listeners;
    ScanSource source = ScanSource::None;
    bool failed = false;                  // Both backends raised
};

// True for TCP (any family) sockets in LISTEN state
bool isListeningTcp(const std::string& protocol, const std::string& state);

// Scanner enumerates listening TCP sockets through the primary backend,
// falling back to the streaming backend when the primary throws or finds
// nothing. Results are deduplicated by (port, pid), first occurrence wins.
class Scanner {
public:
    Scanner(std::shared_ptr<ConnectionBackend> primary,
            std::shared_ptr<SocketStream> fallback,
            std::shared_ptr<DiagnosticLog> diag,
            std::chrono::milliseconds fallbackTimeout = std::chrono::seconds(10));

    ScanResult scan();

    // Individual paths, exposed for tests
    std::vector<Listener> scanPrimary();
    std::vector<Listener> scanFallback();

private:
    std::shared_ptr<ConnectionBackend> primary_;
    std::shared_ptr<SocketStream> fallback_;
    std::shared_ptr<DiagnosticLog> diag_;
    std::chrono::milliseconds fallbackTimeout_;
};

// Drop listeners whose command line mentions none of the given paths.
// An empty path list keeps everything.
std::vector<Listener> filterToWorkspace(const std::vector<Listener>& listeners,
                                        const std::vector<std::string>& paths);

} // namespace px

#endif // PX_SCANNER_HPP
