#include "test.hpp"
#include "test_support.hpp"
#include "scanner.hpp"

using namespace px;
using namespace px::test;

struct ScannerFixture {
    std::shared_ptr<FakeConnectionBackend> primary = std::make_shared<FakeConnectionBackend>();
    std::shared_ptr<FakeSocketStream> fallback = std::make_shared<FakeSocketStream>();
    std::shared_ptr<DiagnosticLog> diag = std::make_shared<DiagnosticLog>();

    Scanner scanner() {
        return Scanner(primary, fallback, diag, std::chrono::milliseconds(200));
    }
};

TEST(Scanner_ListeningTcpOnly) {
    ASSERT_TRUE(isListeningTcp("tcp", "LISTEN"), "tcp listen");
    ASSERT_TRUE(isListeningTcp("TCP6", "listening"), "case-insensitive");
    ASSERT_TRUE(!isListeningTcp("udp", "LISTEN"), "udp");
    ASSERT_TRUE(!isListeningTcp("tcp", "ESTABLISHED"), "not listening");
}

TEST(Scanner_PrimaryDedupFirstWins) {
    ScannerFixture f;
    f.primary->conns = {
        listenConn(3000, 10),
        listenConn(3000, 10, "tcp6"),
        listenConn(3000, 11),
        {"tcp", "LISTEN", 8080, 0, "java"},
        {"tcp", "ESTABLISHED", 5000, 12, ""},
        {"udp", "LISTEN", 53, 13, ""},
        listenConn(0, 14)
    };
    f.primary->procs = {
        {10, "node", "node a.js"},
        {11, "", "mystery --serve"}
    };

    auto result = f.scanner().scan();

    ASSERT_TRUE(result.source == ScanSource::Primary, "primary used");
    ASSERT_TRUE(!result.failed, "not failed");
    ASSERT_EQUALS(size_t(3), result.listeners.size(), "dedup by (port, pid)");

    ASSERT_EQUALS(std::string("node"), result.listeners[0].processName, "name from process list");
    ASSERT_EQUALS(std::string("node a.js"), result.listeners[0].commandLine, "command line");
    ASSERT_EQUALS(11, result.listeners[1].pid, "same port, other pid kept");
    ASSERT_EQUALS(std::string("Unknown"), result.listeners[1].processName, "no name anywhere");
    ASSERT_EQUALS(std::string("mystery --serve"), result.listeners[1].commandLine, "command line kept");
    ASSERT_EQUALS(std::string("java"), result.listeners[2].processName, "embedded name");
    ASSERT_EQUALS(0, result.listeners[2].pid, "unknown owner");
    ASSERT_EQUALS(0, f.fallback->calls.load(), "fallback not consulted");
}

TEST(Scanner_FallbackWhenPrimaryThrows) {
    ScannerFixture f;
    f.primary->fail = true;
    f.fallback->rows = {listenRow(5173, 42, "node", "node vite"), listenRow(5173, 42, "node")};

    auto result = f.scanner().scan();

    ASSERT_TRUE(result.source == ScanSource::Fallback, "fallback used");
    ASSERT_EQUALS(size_t(1), result.listeners.size(), "fallback rows deduplicated");
    ASSERT_EQUALS(std::string("node vite"), result.listeners[0].commandLine, "first row wins");
    ASSERT_EQUALS(size_t(1), f.diag->count(Severity::Warning), "primary fault reported");
}

TEST(Scanner_FallbackWhenPrimaryEmpty) {
    ScannerFixture f;
    f.primary->conns = {{"tcp", "ESTABLISHED", 443, 1, ""}};
    f.fallback->rows = {
        listenRow(8000, 7, "python"),
        {"tcp", "ESTAB", 9000, 8, "x", ""},
        listenRow(0, 9, "zero")
    };

    auto result = f.scanner().scan();

    ASSERT_TRUE(result.source == ScanSource::Fallback, "fallback used");
    ASSERT_EQUALS(size_t(1), result.listeners.size(), "filters applied to streamed rows");
    ASSERT_EQUALS(8000, result.listeners[0].port, "port");
    ASSERT_EQUALS(size_t(1), f.diag->count(Severity::Info), "empty primary noted");
    ASSERT_EQUALS(size_t(0), f.diag->count(Severity::Warning), "no warnings");
}

TEST(Scanner_BothBackendsFail) {
    ScannerFixture f;
    f.primary->fail = true;
    f.fallback->fail = true;

    auto result = f.scanner().scan();

    ASSERT_TRUE(result.failed, "failure surfaced");
    ASSERT_TRUE(result.listeners.empty(), "no stale data");
    ASSERT_TRUE(result.source == ScanSource::None, "no source");
    ASSERT_EQUALS(size_t(2), f.diag->count(Severity::Warning), "both faults reported");
}

TEST(Scanner_NothingListening) {
    ScannerFixture f;
    f.fallback->fail = true;

    auto result = f.scanner().scan();

    ASSERT_TRUE(!result.failed, "primary answered, so the scan did not fail");
    ASSERT_TRUE(result.listeners.empty(), "empty");
}

TEST(Scanner_FallbackTimeout) {
    ScannerFixture f;
    f.primary->fail = true;
    f.fallback->hang = true;
    f.fallback->rows = {listenRow(3000, 1, "node")};

    auto start = std::chrono::steady_clock::now();
    auto result = f.scanner().scan();
    auto elapsed = std::chrono::steady_clock::now() - start;

    ASSERT_TRUE(result.failed, "timeout counts as a failure");
    ASSERT_TRUE(result.listeners.empty(), "partial rows discarded");
    ASSERT_TRUE(elapsed < std::chrono::seconds(5), "bounded wait");
    ASSERT_CONTAINS(f.diag->recent().back().message, "timed out", "timeout reported");
}

TEST(Scanner_WorkspaceFilter) {
    std::vector<Listener> listeners = {
        {3000, 1, "node", "node /Home/U/App/server.js"},
        {5432, 2, "postgres", "/usr/lib/postgresql/bin/postgres"},
        {8000, 3, "python", "python /opt/tools/serve.py"}
    };

    auto kept = filterToWorkspace(listeners, {"/home/u/app", "/opt/tools"});
    ASSERT_EQUALS(size_t(2), kept.size(), "only workspace processes");
    ASSERT_EQUALS(3000, kept[0].port, "case-insensitive");
    ASSERT_EQUALS(8000, kept[1].port, "extra path");

    ASSERT_EQUALS(size_t(3), filterToWorkspace(listeners, {}).size(), "no paths keeps everything");
}
