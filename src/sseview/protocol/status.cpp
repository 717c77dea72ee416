#include "sseview/protocol/status.hpp"

namespace sseview::protocol {

std::string status_text(const ConnectionState &state, Clock::time_point now) {
    switch (state.phase) {
    case ConnectionPhase::Idle:
        return "idle";
    case ConnectionPhase::Connecting:
        return "connecting...";
    case ConnectionPhase::Open:
        return "open";
    case ConnectionPhase::Erroring:
        return "error";
    case ConnectionPhase::BackingOff: {
        const auto remaining =
            std::chrono::duration_cast<std::chrono::milliseconds>(state.deadline - now);
        const long long ms = remaining.count() > 0 ? remaining.count() : 0;
        const long long seconds = (ms + 999) / 1000;
        return "retrying in " + std::to_string(seconds) + "s";
    }
    case ConnectionPhase::Closed:
        if (state.creation_error.has_value()) {
            return std::string("failed to create ") + kStreamTransportName;
        }
        return "closed";
    default:
        return "unknown";
    }
}

} // namespace sseview::protocol
