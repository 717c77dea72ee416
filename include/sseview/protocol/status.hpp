#pragma once

#include "sseview/protocol/connection.hpp"

#include <string>

namespace sseview::protocol {

/// Transport name shown when opening a handle throws.
inline constexpr const char *kStreamTransportName = "event stream";

/// Human-readable status for the status bar:
/// "idle", "connecting...", "open", "error", "retrying in Ns", "closed",
/// or "failed to create event stream".
/// While backing off, N is the remaining wait rounded up to whole seconds.
std::string status_text(const ConnectionState &state, Clock::time_point now);

/// True only while the stream is Open.
[[nodiscard]] inline bool is_connected(const ConnectionState &state) {
    return state.phase == ConnectionPhase::Open;
}

} // namespace sseview::protocol
