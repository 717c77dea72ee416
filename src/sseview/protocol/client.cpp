#include "sseview/protocol/client.hpp"

#include "sseview/protocol/status.hpp"

#include <algorithm>
#include <cstdio>
#include <stdexcept>
#include <utility>

namespace sseview::protocol {

namespace {

constexpr size_t kMirrorSummaryLength = 120;

RequestTransport &require_transport(const std::unique_ptr<RequestTransport> &transport) {
    if (!transport) {
        throw std::invalid_argument("SseClient requires a request transport");
    }
    return *transport;
}

std::string summarize(const nlohmann::json &data) {
    std::string text = data.is_string() ? data.get<std::string>() : data.dump();
    if (text.size() > kMirrorSummaryLength) {
        text.resize(kMirrorSummaryLength);
        text += "...";
    }
    return text;
}

} // namespace

SseClient::SseClient(ClientConfig config)
    : SseClient(std::move(config), std::make_unique<IxStreamTransport>(),
                std::make_unique<IxRequestTransport>()) {}

SseClient::SseClient(ClientConfig config, std::unique_ptr<StreamTransport> stream_transport,
                     std::unique_ptr<RequestTransport> request_transport)
    : config_(std::move(config)), stream_transport_(std::move(stream_transport)),
      request_transport_(std::move(request_transport)),
      broadcaster_(require_transport(request_transport_)), rng_(std::random_device{}()) {
    if (!stream_transport_) {
        throw std::invalid_argument("SseClient requires a stream transport");
    }
}

SseClient::~SseClient() { release_handle(); }

void SseClient::start() {
    if (config_.auto_connect) {
        connect();
    }
}

void SseClient::connect() { apply(ConnectRequested{config_.base_url}, Clock::now()); }

void SseClient::disconnect() { apply(DisconnectRequested{}, Clock::now()); }

void SseClient::send_broadcast(const std::string &body_text) {
    if (auto rejected = broadcaster_.send(config_.base_url, body_text)) {
        push_record(std::move(*rejected));
    }
}

void SseClient::poll(Clock::time_point now) {
    drain_handle(now);
    fire_due_reconnects(now);
    drain_broadcasts();
}

bool SseClient::connected() const { return is_connected(state_); }

std::string SseClient::status_text(Clock::time_point now) const {
    return protocol::status_text(state_, now);
}

size_t SseClient::pending_reconnects() const {
    return static_cast<size_t>(
        std::count_if(reconnects_.begin(), reconnects_.end(), [this](const PendingReconnect &r) {
            return r.generation == state_.generation;
        }));
}

void SseClient::apply(const ConnectionEvent &event, Clock::time_point now) {
    const ConnectionPhase before = state_.phase;
    Transition next = transition(state_, event, ReconnectPolicy{config_.auto_reconnect}, now);
    state_ = std::move(next.state);

    if (state_.phase != before) {
        std::printf("[SseView] Connection: %s -> %s\n", connection_phase_label(before),
                    connection_phase_label(state_.phase));
    }

    // OpenHandle is always the last effect, so a nested apply() from a
    // creation failure never runs ahead of earlier effects.
    for (const auto &effect : next.effects) {
        execute(effect, now);
    }
}

void SseClient::execute(const Effect &effect, Clock::time_point now) {
    if (std::holds_alternative<ReleaseHandle>(effect)) {
        release_handle();
    } else if (const auto *open = std::get_if<OpenHandle>(&effect)) {
        open_handle(open->generation, now);
    } else if (const auto *emit = std::get_if<EmitRecord>(&effect)) {
        push_record(emit->record);
    } else if (const auto *schedule = std::get_if<ScheduleReconnect>(&effect)) {
        reconnects_.push_back(PendingReconnect{schedule->generation, schedule->deadline});
        const auto delay =
            std::chrono::duration_cast<std::chrono::milliseconds>(schedule->deadline - now);
        std::printf("[SseView] Reconnecting in %lld ms\n", static_cast<long long>(delay.count()));
    }
}

void SseClient::open_handle(uint64_t generation, Clock::time_point now) {
    const StreamEndpoint endpoint{config_.base_url, config_.token, next_client_id()};
    try {
        handle_ = stream_transport_->open(endpoint, generation);
    } catch (const std::exception &e) {
        std::fprintf(stderr, "[SseView] Failed to create %s: %s\n", kStreamTransportName,
                     e.what());
        handle_.reset();
        apply(HandleCreationFailed{generation, e.what()}, now);
    }
}

void SseClient::release_handle() {
    if (handle_) {
        handle_->close();
        handle_.reset();
    }
}

void SseClient::fire_due_reconnects(Clock::time_point now) {
    std::vector<uint64_t> due;
    const auto stale_or_due = [&](const PendingReconnect &reconnect) {
        if (reconnect.generation != state_.generation) {
            return true;
        }
        if (reconnect.deadline <= now) {
            due.push_back(reconnect.generation);
            return true;
        }
        return false;
    };
    reconnects_.erase(std::remove_if(reconnects_.begin(), reconnects_.end(), stale_or_due),
                      reconnects_.end());

    for (const uint64_t generation : due) {
        apply(ReconnectDue{generation}, now);
    }
}

void SseClient::drain_handle(Clock::time_point now) {
    TransportEvent event;
    while (handle_ && handle_->poll(event)) {
        const uint64_t generation = handle_->generation();
        switch (event.type) {
        case TransportEventType::Opened:
            apply(Opened{generation}, now);
            break;
        case TransportEventType::Frame:
            push_record(classify(event.frame));
            break;
        case TransportEventType::Failed:
            std::fprintf(stderr, "[SseView] Stream error: %s\n", event.reason.c_str());
            apply(StreamFailed{generation, event.reason}, now);
            break;
        }
    }
}

void SseClient::drain_broadcasts() {
    DisplayRecord record;
    while (broadcaster_.poll(record)) {
        push_record(std::move(record));
    }
}

void SseClient::push_record(DisplayRecord record) {
    // Mirror to terminal
    std::printf("[EVT] %s %s\n", record.event.value_or(std::string(kDefaultEventName)).c_str(),
                summarize(record.data).c_str());
    records_.push(std::move(record));
}

uint32_t SseClient::next_client_id() {
    std::uniform_int_distribution<uint32_t> dist(0, kClientIdRange - 1);
    return dist(rng_);
}

} // namespace sseview::protocol
