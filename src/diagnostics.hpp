#ifndef PX_DIAGNOSTICS_HPP
#define PX_DIAGNOSTICS_HPP

#include <ctime>
#include <deque>
#include <mutex>
#include <string>
#include <vector>

namespace px {

enum class Severity { Info, Warning, Error };

std::string toString(Severity s);

// Diagnostic is one event surfaced by a scan stage
struct Diagnostic {
    time_t timestamp;
    Severity severity;
    std::string source;      // scanner|detector|config|store|engine
    std::string message;
};

// DiagnosticLog keeps the most recent diagnostics and optionally echoes them
// to stderr. Safe to share between the scan thread and readers.
class DiagnosticLog {
public:
    explicit DiagnosticLog(bool echo = false, size_t capacity = 200);

    void report(Severity severity, const std::string& source, const std::string& message);

    void info(const std::string& source, const std::string& message) {
        report(Severity::Info, source, message);
    }
    void warning(const std::string& source, const std::string& message) {
        report(Severity::Warning, source, message);
    }
    void error(const std::string& source, const std::string& message) {
        report(Severity::Error, source, message);
    }

    std::vector<Diagnostic> recent() const;
    size_t count(Severity severity) const;
    void clear();

    void setEcho(bool echo);

private:
    mutable std::mutex mutex_;
    std::deque<Diagnostic> entries_;
    size_t capacity_;
    bool echo_;
};

} // namespace px

#endif // PX_DIAGNOSTICS_HPP
