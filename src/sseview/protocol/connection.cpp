#include "sseview/protocol/connection.hpp"

#include <algorithm>
#include <utility>

namespace sseview::protocol {

namespace {

constexpr std::chrono::milliseconds kBaseBackoff{1000};
constexpr uint32_t kMaxBackoffExponent = 6;

/// Supersede whatever handle exists and start a new attempt.
void begin_attempt(Transition &out) {
    // Release is idempotent; a BackingOff state may still hold the failed handle.
    out.effects.emplace_back(ReleaseHandle{});
    out.state.generation += 1;
    out.state.phase = ConnectionPhase::Connecting;
    out.state.deadline = {};
    out.state.creation_error.reset();
    out.effects.emplace_back(OpenHandle{out.state.generation});
}

bool is_current(const ConnectionState &state, uint64_t generation) {
    return state.generation == generation;
}

} // namespace

const char *connection_phase_label(ConnectionPhase phase) {
    switch (phase) {
    case ConnectionPhase::Idle:
        return "Idle";
    case ConnectionPhase::Connecting:
        return "Connecting";
    case ConnectionPhase::Open:
        return "Open";
    case ConnectionPhase::Erroring:
        return "Erroring";
    case ConnectionPhase::BackingOff:
        return "BackingOff";
    case ConnectionPhase::Closed:
        return "Closed";
    default:
        return "Unknown";
    }
}

std::chrono::milliseconds backoff_delay(uint32_t attempt) {
    const uint32_t exponent = std::min(attempt, kMaxBackoffExponent);
    const std::chrono::milliseconds delay = kBaseBackoff * (int64_t{1} << exponent);
    return std::min(delay, kMaxBackoff);
}

Transition transition(const ConnectionState &state, const ConnectionEvent &event,
                      const ReconnectPolicy &policy, Clock::time_point now) {
    Transition out{state, {}};

    if (const auto *connect = std::get_if<ConnectRequested>(&event)) {
        out.state.endpoint = connect->endpoint;
        begin_attempt(out);

    } else if (const auto *opened = std::get_if<Opened>(&event)) {
        if (!is_current(state, opened->generation) || state.phase != ConnectionPhase::Connecting) {
            return out;
        }
        out.state.phase = ConnectionPhase::Open;
        out.state.attempts = 0;
        out.effects.emplace_back(EmitRecord{make_meta_record("connected to " + state.endpoint)});

    } else if (const auto *failed = std::get_if<StreamFailed>(&event)) {
        if (!is_current(state, failed->generation) ||
            (state.phase != ConnectionPhase::Connecting && state.phase != ConnectionPhase::Open)) {
            return out;
        }
        out.state.phase = ConnectionPhase::Erroring;
        out.state.attempts += 1;
        out.effects.emplace_back(EmitRecord{
            make_meta_record("error (attempt " + std::to_string(out.state.attempts) + ")")});

        if (policy.auto_reconnect) {
            out.state.phase = ConnectionPhase::BackingOff;
            out.state.deadline = now + backoff_delay(out.state.attempts);
            out.effects.emplace_back(ScheduleReconnect{out.state.generation, out.state.deadline});
        }

    } else if (const auto *creation = std::get_if<HandleCreationFailed>(&event)) {
        if (!is_current(state, creation->generation) ||
            state.phase != ConnectionPhase::Connecting) {
            return out;
        }
        // No handle exists, so nothing will ever report an error for this
        // attempt: no retry is scheduled.
        out.state.phase = ConnectionPhase::Closed;
        out.state.creation_error = creation->reason;
        out.effects.emplace_back(EmitRecord{make_meta_record(creation->reason)});

    } else if (const auto *due = std::get_if<ReconnectDue>(&event)) {
        if (!is_current(state, due->generation) || state.phase != ConnectionPhase::BackingOff) {
            return out;
        }
        begin_attempt(out);

    } else if (std::holds_alternative<DisconnectRequested>(event)) {
        out.effects.emplace_back(ReleaseHandle{});
        out.state.generation += 1;
        out.state.phase = ConnectionPhase::Closed;
        out.state.deadline = {};
        out.state.creation_error.reset();
    }

    return out;
}

} // namespace sseview::protocol
