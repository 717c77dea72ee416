#include "sseview/protocol/endpoint.hpp"

#include <gtest/gtest.h>

using namespace sseview::protocol;

TEST(StreamEndpoint, UrlWithTokenAndClientId) {
    StreamEndpoint endpoint{"http://localhost:3001", "abc123", 42};
    EXPECT_EQ(endpoint.url(), "http://localhost:3001/sse?t=abc123&clientId=42");
}

TEST(StreamEndpoint, EmptyTokenIsOmitted) {
    StreamEndpoint endpoint{"http://localhost:3001", "", 7};
    EXPECT_EQ(endpoint.url(), "http://localhost:3001/sse?clientId=7");
}

TEST(StreamEndpoint, TokenIsPercentEncoded) {
    StreamEndpoint endpoint{"https://example.com", "a.b+c/d=", 1};
    EXPECT_EQ(endpoint.url(), "https://example.com/sse?t=a.b%2Bc%2Fd%3D&clientId=1");
}

TEST(JoinUrl, CollapsesTrailingSlash) {
    EXPECT_EQ(join_url("http://host:1/", "/sse"), "http://host:1/sse");
    EXPECT_EQ(join_url("http://host:1//", "/sse"), "http://host:1/sse");
    EXPECT_EQ(join_url("http://host:1/api", "/sse"), "http://host:1/api/sse");
}

TEST(BroadcastUrl, SameServerAsStream) {
    EXPECT_EQ(broadcast_url("http://localhost:3001"), "http://localhost:3001/broadcast");
}

TEST(PercentEncode, KeepsUnreservedCharacters) {
    EXPECT_EQ(percent_encode("AZaz09-_.~"), "AZaz09-_.~");
    EXPECT_EQ(percent_encode("a b"), "a%20b");
    EXPECT_EQ(percent_encode("\xC3\xA9"), "%C3%A9");
}
