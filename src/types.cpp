#include "types.hpp"

namespace px {

std::string toString(Category c) {
    switch (c) {
        case Category::Dev: return "dev";
        case Category::System: return "system";
    }
    return "system";
}

std::string toString(PortStatus s) {
    switch (s) {
        case PortStatus::New: return "new";
        case PortStatus::Changed: return "changed";
        case PortStatus::Stable: return "stable";
    }
    return "stable";
}

std::string toString(HistoryAction a) {
    switch (a) {
        case HistoryAction::Started: return "started";
        case HistoryAction::Stopped: return "stopped";
        case HistoryAction::Changed: return "changed";
    }
    return "changed";
}

std::optional<HistoryAction> parseHistoryAction(const std::string& s) {
    if (s == "started") return HistoryAction::Started;
    if (s == "stopped") return HistoryAction::Stopped;
    if (s == "changed") return HistoryAction::Changed;
    return std::nullopt;
}

} // namespace px
