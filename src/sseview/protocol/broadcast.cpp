#include "sseview/protocol/broadcast.hpp"

#include "sseview/protocol/endpoint.hpp"

#include <cstdio>
#include <utility>

namespace sseview::protocol {

void IxRequestTransport::post_json(const std::string &url, const std::string &body,
                                   BroadcastCallback on_done) {
    auto args = http_.createRequest(url, ix::HttpClient::kPost);
    args->body = body;
    args->extraHeaders["Content-Type"] = "application/json";
    args->extraHeaders["Accept"] = "application/json";

    const bool queued =
        http_.performRequest(args, [on_done](const ix::HttpResponsePtr &response) {
            BroadcastResponse result;
            if (!response) {
                result.error = "no response";
            } else if (response->errorCode != ix::HttpErrorCode::Ok) {
                result.error = response->errorMsg.empty() ? "request failed" : response->errorMsg;
            } else {
                result.transport_ok = true;
                result.status = response->statusCode;
                result.body = response->body;
            }
            on_done(std::move(result));
        });

    if (!queued) {
        BroadcastResponse result;
        result.error = "request could not be queued";
        on_done(std::move(result));
    }
}

nlohmann::json parse_broadcast_body(const std::string &body_text) {
    return nlohmann::json::parse(body_text);
}

DisplayRecord broadcast_outcome(const BroadcastResponse &response) {
    if (!response.transport_ok) {
        return make_record(kSendErrorEvent, response.error);
    }
    if (response.status < 200 || response.status >= 300) {
        std::string message = "HTTP " + std::to_string(response.status);
        if (!response.body.empty()) {
            message += ": " + response.body;
        }
        return make_record(kSendErrorEvent, message);
    }

    try {
        return make_record(kSendResultEvent, nlohmann::json::parse(response.body));
    } catch (const nlohmann::json::parse_error &e) {
        return make_record(kSendErrorEvent, std::string("invalid JSON response: ") + e.what());
    }
}

BroadcastSender::BroadcastSender(RequestTransport &transport, size_t queue_capacity)
    : transport_(transport), results_(std::make_shared<ResultQueue>(queue_capacity)) {}

std::optional<DisplayRecord> BroadcastSender::send(const std::string &base_url,
                                                   const std::string &body_text) {
    nlohmann::json body;
    try {
        body = parse_broadcast_body(body_text);
    } catch (const nlohmann::json::parse_error &e) {
        return make_record(kSendErrorEvent, e.what());
    }

    ++requests_issued_;
    std::weak_ptr<ResultQueue> weak_results = results_;
    transport_.post_json(broadcast_url(base_url), body.dump(),
                         [weak_results](BroadcastResponse response) {
                             auto results = weak_results.lock();
                             if (!results) {
                                 return; // sender gone
                             }
                             if (!results->try_push(broadcast_outcome(response))) {
                                 std::fprintf(stderr,
                                              "[SseView] Broadcast result dropped: queue full\n");
                             }
                         });
    return std::nullopt;
}

bool BroadcastSender::poll(DisplayRecord &record) { return results_->try_pop(record); }

} // namespace sseview::protocol
