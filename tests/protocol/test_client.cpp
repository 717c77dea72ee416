#include "sseview/protocol/client.hpp"

#include "support/fake_transports.hpp"

#include <gtest/gtest.h>

#include <chrono>
#include <memory>

using namespace sseview::protocol;
using namespace std::chrono_literals;
using sseview::testing::FakeRequestTransport;
using sseview::testing::FakeStreamTransport;
using sseview::testing::http_response;

namespace {

class SseClientTest : public ::testing::Test {
  protected:
    void make_client(ClientConfig config = {}) {
        auto stream = std::make_unique<FakeStreamTransport>();
        auto requests = std::make_unique<FakeRequestTransport>();
        stream_ = stream.get();
        requests_ = requests.get();
        client_ = std::make_unique<SseClient>(std::move(config), std::move(stream),
                                              std::move(requests));
    }

    std::string newest_text() const {
        const auto &data = client_->records().newest().data;
        return data.is_string() ? data.get<std::string>() : data.dump();
    }

    std::unique_ptr<SseClient> client_;
    FakeStreamTransport *stream_ = nullptr;
    FakeRequestTransport *requests_ = nullptr;
};

} // namespace

TEST_F(SseClientTest, StartsIdleWithoutAutoConnect) {
    ClientConfig config;
    config.auto_connect = false;
    make_client(config);

    client_->start();

    EXPECT_EQ(client_->state().phase, ConnectionPhase::Idle);
    EXPECT_TRUE(stream_->channels.empty());
    EXPECT_EQ(client_->status_text(), "idle");
}

TEST_F(SseClientTest, AutoConnectOpensStream) {
    make_client();
    client_->start();

    ASSERT_EQ(stream_->channels.size(), 1u);
    EXPECT_EQ(client_->state().phase, ConnectionPhase::Connecting);
    EXPECT_EQ(client_->status_text(), "connecting...");
    EXPECT_EQ(stream_->last().url.rfind("http://localhost:3001/sse?clientId=", 0), 0u);

    stream_->last().push_opened();
    client_->poll();

    EXPECT_TRUE(client_->connected());
    EXPECT_EQ(client_->status_text(), "open");
    ASSERT_EQ(client_->records().size(), 1u);
    EXPECT_EQ(client_->records().newest().event, kMetaEvent);
    EXPECT_EQ(newest_text(), "connected to http://localhost:3001");
}

TEST_F(SseClientTest, TokenIsSentAsQueryParameter) {
    ClientConfig config;
    config.token = "secret";
    make_client(config);
    client_->connect();

    EXPECT_NE(stream_->last().url.find("?t=secret&clientId="), std::string::npos);
}

TEST_F(SseClientTest, FramesBecomeRecordsNewestFirst) {
    make_client();
    client_->start();
    auto &channel = stream_->last();
    channel.push_opened();
    channel.push_frame("update", R"({"v":1})", "1");
    channel.push_frame("message", "plain text");
    client_->poll();

    ASSERT_EQ(client_->records().size(), 3u);
    const auto &newest = client_->records().at(0);
    EXPECT_EQ(newest.event, "message");
    EXPECT_EQ(newest.data.get<std::string>(), "plain text");

    const auto &update = client_->records().at(1);
    EXPECT_EQ(update.event, "update");
    EXPECT_EQ(update.id, "1");
    EXPECT_EQ(update.data["v"], 1);
}

TEST_F(SseClientTest, ManualConnectWhileOpenKeepsSingleHandle) {
    make_client();
    client_->start();
    auto &first = stream_->last();
    first.push_opened();
    client_->poll();

    client_->connect();

    ASSERT_EQ(stream_->channels.size(), 2u);
    EXPECT_TRUE(first.closed);
    EXPECT_EQ(stream_->live_count(), 1u);

    // Anything the superseded handle still produces is never seen.
    first.push_frame("message", "stale");
    first.push_failed("late error");
    client_->poll();

    EXPECT_EQ(client_->state().phase, ConnectionPhase::Connecting);
    EXPECT_EQ(client_->attempts(), 0u);
    EXPECT_EQ(newest_text(), "connected to http://localhost:3001");
}

TEST_F(SseClientTest, FailureSchedulesBackoffAndReconnects) {
    make_client();
    client_->start();
    stream_->last().push_opened();
    const auto t0 = Clock::now();
    client_->poll(t0);

    stream_->last().push_failed("connection reset");
    client_->poll(t0);

    EXPECT_EQ(client_->state().phase, ConnectionPhase::BackingOff);
    EXPECT_EQ(client_->attempts(), 1u);
    EXPECT_EQ(client_->pending_reconnects(), 1u);
    EXPECT_EQ(client_->status_text(t0), "retrying in 2s");
    EXPECT_EQ(newest_text(), "error (attempt 1)");

    client_->poll(t0 + 1999ms);
    EXPECT_EQ(stream_->channels.size(), 1u);

    client_->poll(t0 + 2s);
    ASSERT_EQ(stream_->channels.size(), 2u);
    EXPECT_EQ(client_->state().phase, ConnectionPhase::Connecting);
    EXPECT_EQ(client_->pending_reconnects(), 0u);
    EXPECT_EQ(stream_->live_count(), 1u);
    EXPECT_NE(stream_->last().url.find("clientId="), std::string::npos);
}

TEST_F(SseClientTest, ConsecutiveFailuresGrowBackoff) {
    make_client();
    client_->start();
    auto now = Clock::now();

    stream_->last().push_failed("refused");
    client_->poll(now);
    EXPECT_EQ(client_->state().deadline, now + 2s);

    now = client_->state().deadline;
    client_->poll(now);
    stream_->last().push_failed("refused");
    client_->poll(now);

    EXPECT_EQ(client_->attempts(), 2u);
    EXPECT_EQ(client_->state().deadline, now + 4s);

    now = client_->state().deadline;
    client_->poll(now);
    stream_->last().push_opened();
    client_->poll(now);
    EXPECT_EQ(client_->attempts(), 0u);
}

TEST_F(SseClientTest, DisconnectDuringBackoffCancelsReconnect) {
    make_client();
    client_->start();
    const auto t0 = Clock::now();
    stream_->last().push_failed("down");
    client_->poll(t0);
    ASSERT_EQ(client_->state().phase, ConnectionPhase::BackingOff);

    client_->disconnect();

    EXPECT_EQ(client_->state().phase, ConnectionPhase::Closed);
    EXPECT_EQ(client_->status_text(), "closed");
    EXPECT_FALSE(client_->has_handle());

    client_->poll(t0 + 1h);
    EXPECT_EQ(client_->state().phase, ConnectionPhase::Closed);
    EXPECT_EQ(stream_->channels.size(), 1u);
}

TEST_F(SseClientTest, AutoReconnectDisabledStopsAtError) {
    ClientConfig config;
    config.auto_reconnect = false;
    make_client(config);
    client_->start();

    stream_->last().push_failed("down");
    client_->poll();

    EXPECT_EQ(client_->state().phase, ConnectionPhase::Erroring);
    EXPECT_EQ(client_->status_text(), "error");
    EXPECT_EQ(client_->pending_reconnects(), 0u);
}

TEST_F(SseClientTest, HandleCreationFailureDoesNotRetry) {
    make_client();
    stream_->fail_with = "unsupported scheme";
    client_->start();

    EXPECT_EQ(client_->state().phase, ConnectionPhase::Closed);
    EXPECT_EQ(client_->status_text(), "failed to create event stream");
    EXPECT_FALSE(client_->has_handle());
    EXPECT_EQ(client_->pending_reconnects(), 0u);
    EXPECT_EQ(newest_text(), "unsupported scheme");

    // The next manual connect tries again.
    stream_->fail_with.clear();
    client_->connect();
    EXPECT_EQ(client_->state().phase, ConnectionPhase::Connecting);
    EXPECT_EQ(client_->status_text(), "connecting...");
}

TEST_F(SseClientTest, BroadcastIsIndependentOfStream) {
    ClientConfig config;
    config.auto_connect = false;
    make_client(config);

    client_->send_broadcast(R"({"msg":"hi"})");

    EXPECT_EQ(client_->state().phase, ConnectionPhase::Idle);
    ASSERT_EQ(requests_->posts.size(), 1u);
    EXPECT_EQ(requests_->posts[0].url, "http://localhost:3001/broadcast");

    requests_->complete(0, http_response(200, R"({"ok":true})"));
    client_->poll();

    EXPECT_EQ(client_->state().phase, ConnectionPhase::Idle);
    ASSERT_EQ(client_->records().size(), 1u);
    EXPECT_EQ(client_->records().newest().event, kSendResultEvent);
}

TEST_F(SseClientTest, InvalidBroadcastRecordsErrorWithoutRequest) {
    make_client();

    client_->send_broadcast("{");

    EXPECT_TRUE(requests_->posts.empty());
    ASSERT_EQ(client_->records().size(), 1u);
    EXPECT_EQ(client_->records().newest().event, kSendErrorEvent);
}

TEST_F(SseClientTest, BufferStaysBounded) {
    make_client();
    client_->start();
    auto &channel = stream_->last();
    channel.push_opened();
    for (int i = 0; i < 300; ++i) {
        channel.push_frame("message", std::to_string(i));
    }
    client_->poll();

    EXPECT_EQ(client_->records().size(), 200u);
    EXPECT_EQ(client_->records().newest().data, 299);
}

TEST_F(SseClientTest, DestructorReleasesHandle) {
    make_client();
    client_->start();
    auto channel = stream_->channels.front();

    client_.reset();
    EXPECT_TRUE(channel->closed);
}

TEST(SseClient, RejectsMissingTransports) {
    EXPECT_THROW(SseClient(ClientConfig{}, nullptr, std::make_unique<FakeRequestTransport>()),
                 std::invalid_argument);
    EXPECT_THROW(SseClient(ClientConfig{}, std::make_unique<FakeStreamTransport>(), nullptr),
                 std::invalid_argument);
}
