#pragma once

#include "sseview/data/event_buffer.hpp"
#include "sseview/protocol/broadcast.hpp"
#include "sseview/protocol/connection.hpp"
#include "sseview/protocol/transport.hpp"

#include <cstddef>
#include <cstdint>
#include <memory>
#include <random>
#include <string>
#include <vector>

namespace sseview::protocol {

/// Connection settings. The token is passed through as the `t` query value.
struct ClientConfig {
    std::string base_url = "http://localhost:3001";
    std::string token;
    bool auto_reconnect = true;
    bool auto_connect = true;
};

/// Server-Sent-Events client with automatic reconnection.
/// Owns the connection state machine, at most one stream handle, the
/// pending reconnect timers, the side-channel sender and the event buffer.
/// All methods must be called from one thread; poll() once per UI frame
/// delivers transport events, fires due timers and collects send results.
class SseClient {
  public:
    /// Uses the IXWebSocket transports.
    explicit SseClient(ClientConfig config = {});

    SseClient(ClientConfig config, std::unique_ptr<StreamTransport> stream_transport,
              std::unique_ptr<RequestTransport> request_transport);

    ~SseClient();

    SseClient(const SseClient &) = delete;
    SseClient &operator=(const SseClient &) = delete;

    /// Connect if auto_connect is set.
    void start();

    /// Tear down any existing handle and open a new one.
    void connect();

    /// Release the handle and cancel pending reconnects. Idempotent.
    void disconnect();

    /// Send a JSON body to <base>/broadcast. The outcome lands in records().
    void send_broadcast(const std::string &body_text);

    /// Drive timers and drain transport events.
    void poll(Clock::time_point now = Clock::now());

    [[nodiscard]] const ConnectionState &state() const { return state_; }
    [[nodiscard]] const data::EventBuffer &records() const { return records_; }
    [[nodiscard]] uint32_t attempts() const { return state_.attempts; }
    [[nodiscard]] bool connected() const;
    [[nodiscard]] std::string status_text(Clock::time_point now = Clock::now()) const;

    [[nodiscard]] const ClientConfig &config() const { return config_; }
    void set_auto_connect(bool enabled) { config_.auto_connect = enabled; }

    /// True while a transport handle exists (live or failed, not yet superseded).
    [[nodiscard]] bool has_handle() const { return handle_ != nullptr; }

    /// Reconnect timers still armed for the current generation.
    [[nodiscard]] size_t pending_reconnects() const;

  private:
    struct PendingReconnect {
        uint64_t generation = 0;
        Clock::time_point deadline{};
    };

    void apply(const ConnectionEvent &event, Clock::time_point now);
    void execute(const Effect &effect, Clock::time_point now);
    void open_handle(uint64_t generation, Clock::time_point now);
    void release_handle();
    void fire_due_reconnects(Clock::time_point now);
    void drain_handle(Clock::time_point now);
    void drain_broadcasts();
    void push_record(DisplayRecord record);
    uint32_t next_client_id();

    ClientConfig config_;
    std::unique_ptr<StreamTransport> stream_transport_;
    std::unique_ptr<RequestTransport> request_transport_;
    BroadcastSender broadcaster_;

    ConnectionState state_;
    std::unique_ptr<StreamHandle> handle_;
    std::vector<PendingReconnect> reconnects_;
    data::EventBuffer records_;

    std::mt19937 rng_;
};

} // namespace sseview::protocol
