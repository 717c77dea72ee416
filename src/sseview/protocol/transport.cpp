#include "sseview/protocol/transport.hpp"

#include <ixwebsocket/IXHttpClient.h>
#include <ixwebsocket/IXUrlParser.h>

#include <atomic>
#include <chrono>
#include <cstdio>
#include <limits>
#include <stdexcept>
#include <thread>
#include <utility>

namespace sseview::protocol {

namespace {

constexpr auto kQueueRetryInterval = std::chrono::milliseconds(1);

/// One GET request streaming text/event-stream on its own thread.
class IxStreamHandle final : public StreamHandle {
  public:
    IxStreamHandle(std::string url, uint64_t generation, size_t queue_capacity)
        : url_(std::move(url)), generation_(generation), queue_(queue_capacity) {
        args_ = http_.createRequest(url_, ix::HttpClient::kGet);
        args_->extraHeaders["Accept"] = "text/event-stream";
        args_->extraHeaders["Cache-Control"] = "no-cache";
        args_->connectTimeout = IxStreamTransport::kConnectTimeoutSecs;
        // The stream is expected to stay open indefinitely.
        args_->transferTimeout = std::numeric_limits<int>::max();
        args_->compress = false;
        args_->onChunkCallback = [this](const std::string &chunk) { on_chunk(chunk); };

        worker_ = std::thread([this] { run(); });
    }

    ~IxStreamHandle() override { close(); }

    IxStreamHandle(const IxStreamHandle &) = delete;
    IxStreamHandle &operator=(const IxStreamHandle &) = delete;

    bool poll(TransportEvent &event) override { return queue_.try_pop(event); }

    void close() override {
        if (closed_.exchange(true)) {
            return;
        }
        args_->cancel = true;
        if (worker_.joinable()) {
            worker_.join();
        }
    }

    [[nodiscard]] uint64_t generation() const override { return generation_; }

  private:
    void run() {
        auto response = http_.request(url_, ix::HttpClient::kGet, std::string(), args_);
        if (closed_.load()) {
            return; // released by the owner; not a stream failure
        }

        StreamCompletion completion;
        if (!response) {
            completion.error = "no response";
        } else if (response->errorCode != ix::HttpErrorCode::Ok) {
            completion.error = response->errorMsg;
        } else {
            completion.transport_ok = true;
            completion.status = response->statusCode;
        }

        TransportEvent event;
        event.type = TransportEventType::Failed;
        event.reason = stream_failure_reason(completion);
        push(std::move(event));
    }

    void on_chunk(const std::string &chunk) {
        // IXWebSocket passes error bodies through this callback too and reports
        // the status only when the request ends; a valid event-stream line is
        // the first sign of a 2xx text/event-stream reply.
        parser_.feed(chunk, [this](EventFrame &&frame) {
            mark_opened();
            TransportEvent event;
            event.type = TransportEventType::Frame;
            event.frame = std::move(frame);
            push(std::move(event));
        });
        if (parser_.saw_valid_line()) {
            mark_opened();
        }
    }

    void mark_opened() {
        if (opened_) {
            return;
        }
        opened_ = true;
        TransportEvent event;
        event.type = TransportEventType::Opened;
        push(std::move(event));
    }

    /// Block the worker (never the owner) until the queue has room.
    void push(TransportEvent &&event) {
        while (!queue_.try_push(std::move(event))) {
            if (closed_.load()) {
                return;
            }
            std::this_thread::sleep_for(kQueueRetryInterval);
        }
    }

    std::string url_;
    uint64_t generation_;
    TransportQueue queue_;

    ix::HttpClient http_;
    ix::HttpRequestArgsPtr args_;
    SseParser parser_; // worker thread only
    bool opened_ = false;

    std::atomic<bool> closed_{false};
    std::thread worker_;
};

} // namespace

std::string stream_failure_reason(const StreamCompletion &completion) {
    if (!completion.transport_ok) {
        return completion.error.empty() ? "request failed" : completion.error;
    }
    if (completion.status < 200 || completion.status >= 300) {
        return "HTTP " + std::to_string(completion.status);
    }
    return "stream closed by server";
}

IxStreamTransport::IxStreamTransport(size_t queue_capacity) : queue_capacity_(queue_capacity) {}

std::unique_ptr<StreamHandle> IxStreamTransport::open(const StreamEndpoint &endpoint,
                                                      uint64_t generation) {
    const std::string url = endpoint.url();

    std::string protocol;
    std::string host;
    std::string path;
    std::string query;
    int port = 0;
    if (!ix::UrlParser::parse(url, protocol, host, path, query, port)) {
        throw std::invalid_argument("malformed stream URL: " + url);
    }
    if (protocol != "http" && protocol != "https") {
        throw std::invalid_argument("unsupported stream URL scheme '" + protocol + "'");
    }

    std::printf("[SseView] Opening stream %s\n", url.c_str());
    return std::make_unique<IxStreamHandle>(url, generation, queue_capacity_);
}

} // namespace sseview::protocol
