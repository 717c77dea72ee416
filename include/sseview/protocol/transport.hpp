#pragma once

#include "sseview/data/event_queue.hpp"
#include "sseview/protocol/endpoint.hpp"
#include "sseview/protocol/sse_frame.hpp"

#include <cstddef>
#include <cstdint>
#include <memory>
#include <string>

namespace sseview::protocol {

enum class TransportEventType { Opened, Frame, Failed };

/// Notification from one stream handle to its owner.
struct TransportEvent {
    TransportEventType type = TransportEventType::Frame;
    EventFrame frame;   // Frame only
    std::string reason; // Failed only
};

/// Worker thread -> owner thread queue of one handle.
using TransportQueue = data::SPSCQueue<TransportEvent>;

/// How a streaming request ended, as reported by the HTTP layer.
struct StreamCompletion {
    bool transport_ok = false; // false: connect/read failed, see error
    int status = 0;
    std::string error;
};

/// Failure reason for a finished stream: the transport error, "HTTP <status>"
/// for a non-2xx reply, otherwise "stream closed by server".
std::string stream_failure_reason(const StreamCompletion &completion);

/// One live streaming request.
/// Events are produced on the handle's own thread and consumed through poll().
/// After close() returns no further events are produced.
class StreamHandle {
  public:
    virtual ~StreamHandle() = default;

    /// Pop the next pending event (owner thread). Returns false if none.
    virtual bool poll(TransportEvent &event) = 0;

    /// Stop the request and join the worker. Idempotent.
    virtual void close() = 0;

    [[nodiscard]] virtual uint64_t generation() const = 0;
};

/// Factory for stream handles.
class StreamTransport {
  public:
    virtual ~StreamTransport() = default;

    /// Start streaming from endpoint.url().
    /// Throws std::invalid_argument if the URL is unusable and
    /// std::system_error if the worker cannot be started.
    virtual std::unique_ptr<StreamHandle> open(const StreamEndpoint &endpoint,
                                               uint64_t generation) = 0;
};

/// IXWebSocket HttpClient transport: one blocking GET per handle on a
/// background thread, body chunks fed through SseParser.
/// The handle reports Opened once the body yields a valid event-stream line,
/// so an error page on a 4xx/5xx reply goes straight to Failed.
class IxStreamTransport : public StreamTransport {
  public:
    static constexpr size_t kDefaultQueueCapacity = 1024;
    static constexpr int kConnectTimeoutSecs = 10;

    explicit IxStreamTransport(size_t queue_capacity = kDefaultQueueCapacity);

    std::unique_ptr<StreamHandle> open(const StreamEndpoint &endpoint,
                                       uint64_t generation) override;

  private:
    size_t queue_capacity_;
};

} // namespace sseview::protocol
