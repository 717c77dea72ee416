#pragma once

#include "sseview/protocol/event_record.hpp"

#include <chrono>
#include <cstdint>
#include <optional>
#include <string>
#include <variant>
#include <vector>

namespace sseview::protocol {

using Clock = std::chrono::steady_clock;

/// Lifecycle phase of the stream connection.
enum class ConnectionPhase {
    Idle,
    Connecting,
    Open,
    Erroring,
    BackingOff,
    Closed,
};

/// Converts ConnectionPhase to a log label.
const char *connection_phase_label(ConnectionPhase phase);

/// Upper bound of any reconnect delay.
inline constexpr std::chrono::milliseconds kMaxBackoff{30000};

/// Delay before the reconnect that follows `attempt` consecutive failures:
/// min(30 s, 1 s * 2^min(attempt, 6)).
std::chrono::milliseconds backoff_delay(uint32_t attempt);

/// Snapshot of the connection state machine.
/// `generation` is bumped by every connect and disconnect; timers and
/// transport events tagged with another generation are stale.
struct ConnectionState {
    ConnectionPhase phase = ConnectionPhase::Idle;
    uint32_t attempts = 0;
    uint64_t generation = 0;
    Clock::time_point deadline{}; // BackingOff only
    std::string endpoint;         // base URL of the current attempt
    std::optional<std::string> creation_error;

    /// Connecting, Open and Erroring own a transport handle.
    [[nodiscard]] bool has_live_handle() const {
        return phase == ConnectionPhase::Connecting || phase == ConnectionPhase::Open ||
               phase == ConnectionPhase::Erroring;
    }
};

struct ReconnectPolicy {
    bool auto_reconnect = true;
};

// --- Events ---

/// Manual or automatic connect request.
struct ConnectRequested {
    std::string endpoint;
};

/// The transport reported the stream established.
struct Opened {
    uint64_t generation = 0;
};

/// Network failure, bad HTTP status or server-side close.
struct StreamFailed {
    uint64_t generation = 0;
    std::string reason;
};

/// Opening the handle threw synchronously.
struct HandleCreationFailed {
    uint64_t generation = 0;
    std::string reason;
};

/// A backoff timer expired.
struct ReconnectDue {
    uint64_t generation = 0;
};

struct DisconnectRequested {};

using ConnectionEvent = std::variant<ConnectRequested, Opened, StreamFailed, HandleCreationFailed,
                                     ReconnectDue, DisconnectRequested>;

// --- Effects (executed by the owner, in order) ---

/// Close and destroy the current handle, if any.
struct ReleaseHandle {};

/// Create a handle for the current endpoint, tagged with `generation`.
struct OpenHandle {
    uint64_t generation = 0;
};

/// Append a record to the event buffer.
struct EmitRecord {
    DisplayRecord record;
};

/// Deliver ReconnectDue{generation} once `deadline` has passed.
struct ScheduleReconnect {
    uint64_t generation = 0;
    Clock::time_point deadline{};
};

using Effect = std::variant<ReleaseHandle, OpenHandle, EmitRecord, ScheduleReconnect>;

struct Transition {
    ConnectionState state;
    std::vector<Effect> effects;
};

/// Pure transition function. Stale or inapplicable events return the input
/// state unchanged with no effects.
Transition transition(const ConnectionState &state, const ConnectionEvent &event,
                      const ReconnectPolicy &policy, Clock::time_point now);

} // namespace sseview::protocol
