#pragma once

#include "sseview/protocol/broadcast.hpp"
#include "sseview/protocol/transport.hpp"

#include <algorithm>
#include <cstddef>
#include <deque>
#include <memory>
#include <optional>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

namespace sseview::testing {

/// Test-side view of one handle created by FakeStreamTransport.
struct FakeChannel {
    std::string url;
    uint64_t generation = 0;
    bool closed = false;
    std::deque<protocol::TransportEvent> pending;

    void push_opened() {
        protocol::TransportEvent event;
        event.type = protocol::TransportEventType::Opened;
        pending.push_back(std::move(event));
    }

    void push_frame(const std::string &event_name, const std::string &data,
                    std::optional<std::string> id = std::nullopt) {
        protocol::TransportEvent event;
        event.type = protocol::TransportEventType::Frame;
        event.frame.event = event_name;
        event.frame.data = data;
        event.frame.id = std::move(id);
        pending.push_back(std::move(event));
    }

    void push_failed(const std::string &reason) {
        protocol::TransportEvent event;
        event.type = protocol::TransportEventType::Failed;
        event.reason = reason;
        pending.push_back(std::move(event));
    }
};

class FakeStreamHandle : public protocol::StreamHandle {
  public:
    explicit FakeStreamHandle(std::shared_ptr<FakeChannel> channel)
        : channel_(std::move(channel)) {}

    ~FakeStreamHandle() override { close(); }

    bool poll(protocol::TransportEvent &event) override {
        if (channel_->closed || channel_->pending.empty()) {
            return false;
        }
        event = std::move(channel_->pending.front());
        channel_->pending.pop_front();
        return true;
    }

    void close() override { channel_->closed = true; }

    [[nodiscard]] uint64_t generation() const override { return channel_->generation; }

  private:
    std::shared_ptr<FakeChannel> channel_;
};

/// Records every open() and hands out scriptable channels.
class FakeStreamTransport : public protocol::StreamTransport {
  public:
    std::unique_ptr<protocol::StreamHandle> open(const protocol::StreamEndpoint &endpoint,
                                                 uint64_t generation) override {
        if (!fail_with.empty()) {
            throw std::invalid_argument(fail_with);
        }
        auto channel = std::make_shared<FakeChannel>();
        channel->url = endpoint.url();
        channel->generation = generation;
        channels.push_back(channel);
        return std::make_unique<FakeStreamHandle>(channel);
    }

    [[nodiscard]] size_t live_count() const {
        return static_cast<size_t>(std::count_if(channels.begin(), channels.end(),
                                                 [](const auto &c) { return !c->closed; }));
    }

    FakeChannel &last() { return *channels.back(); }

    std::string fail_with; // non-empty: open() throws with this message
    std::vector<std::shared_ptr<FakeChannel>> channels;
};

/// Captures POSTs; tests complete them explicitly.
class FakeRequestTransport : public protocol::RequestTransport {
  public:
    struct Post {
        std::string url;
        std::string body;
        protocol::BroadcastCallback on_done;
    };

    void post_json(const std::string &url, const std::string &body,
                   protocol::BroadcastCallback on_done) override {
        posts.push_back(Post{url, body, std::move(on_done)});
    }

    void complete(size_t index, protocol::BroadcastResponse response) {
        posts.at(index).on_done(std::move(response));
    }

    std::vector<Post> posts;
};

inline protocol::BroadcastResponse http_response(int status, std::string body) {
    protocol::BroadcastResponse response;
    response.transport_ok = true;
    response.status = status;
    response.body = std::move(body);
    return response;
}

} // namespace sseview::testing
