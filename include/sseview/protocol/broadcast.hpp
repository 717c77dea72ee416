#pragma once

#include "sseview/data/event_queue.hpp"
#include "sseview/protocol/event_record.hpp"

#include <ixwebsocket/IXHttpClient.h>
#include <nlohmann/json.hpp>

#include <cstddef>
#include <functional>
#include <memory>
#include <optional>
#include <string>

namespace sseview::protocol {

/// Transport-level result of one side-channel POST.
struct BroadcastResponse {
    bool transport_ok = false; // false: connect/send/read failed, see error
    int status = 0;
    std::string body;
    std::string error;
};

using BroadcastCallback = std::function<void(BroadcastResponse)>;

/// Outbound request primitive for the side channel.
class RequestTransport {
  public:
    virtual ~RequestTransport() = default;

    /// POST `body` as application/json. on_done may run on another thread,
    /// but calls for one transport are never concurrent.
    virtual void post_json(const std::string &url, const std::string &body,
                           BroadcastCallback on_done) = 0;
};

/// IXWebSocket HttpClient in async mode (single worker thread).
class IxRequestTransport : public RequestTransport {
  public:
    void post_json(const std::string &url, const std::string &body,
                   BroadcastCallback on_done) override;

  private:
    ix::HttpClient http_{true};
};

/// Parse a user-supplied body. Throws nlohmann::json::parse_error.
nlohmann::json parse_broadcast_body(const std::string &body_text);

/// Map a finished POST to a manual-send-result or manual-send-error record.
DisplayRecord broadcast_outcome(const BroadcastResponse &response);

/// Side-channel sender. Independent of the stream connection state.
/// Results are queued from the transport thread and collected with poll().
class BroadcastSender {
  public:
    static constexpr size_t kDefaultQueueCapacity = 64;

    explicit BroadcastSender(RequestTransport &transport,
                             size_t queue_capacity = kDefaultQueueCapacity);

    /// Validate and send body_text to <base_url>/broadcast.
    /// Returns the manual-send-error record immediately when body_text is not
    /// JSON; in that case no request is issued.
    std::optional<DisplayRecord> send(const std::string &base_url, const std::string &body_text);

    /// Pop the next finished request's record (owner thread).
    bool poll(DisplayRecord &record);

    [[nodiscard]] size_t requests_issued() const { return requests_issued_; }

  private:
    using ResultQueue = data::SPSCQueue<DisplayRecord>;

    RequestTransport &transport_;
    // In-flight callbacks hold a weak_ptr; they may outlive the sender.
    std::shared_ptr<ResultQueue> results_;
    size_t requests_issued_ = 0;
};

} // namespace sseview::protocol
