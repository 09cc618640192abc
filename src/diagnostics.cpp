#include "diagnostics.hpp"
#include <algorithm>
#include <iostream>

namespace px {

std::string toString(Severity s) {
    switch (s) {
        case Severity::Info: return "info";
        case Severity::Warning: return "warning";
        case Severity::Error: return "error";
    }
    return "info";
}

DiagnosticLog::DiagnosticLog(bool echo, size_t capacity)
    : capacity_(capacity == 0 ? 1 : capacity), echo_(echo) {}

void DiagnosticLog::report(Severity severity, const std::string& source, const std::string& message) {
    std::lock_guard<std::mutex> lock(mutex_);

    entries_.push_back({time(nullptr), severity, source, message});
    while (entries_.size() > capacity_) {
        entries_.pop_front();
    }

    if (echo_) {
        std::cerr << "[px] " << toString(severity) << " (" << source << "): " << message << std::endl;
    }
}

std::vector<Diagnostic> DiagnosticLog::recent() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return std::vector<Diagnostic>(entries_.begin(), entries_.end());
}

size_t DiagnosticLog::count(Severity severity) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return static_cast<size_t>(std::count_if(entries_.begin(), entries_.end(),
        [severity](const Diagnostic& d) { return d.severity == severity; }));
}

void DiagnosticLog::clear() {
    std::lock_guard<std::mutex> lock(mutex_);
    entries_.clear();
}

void DiagnosticLog::setEcho(bool echo) {
    std::lock_guard<std::mutex> lock(mutex_);
    echo_ = echo;
}

} // namespace px
