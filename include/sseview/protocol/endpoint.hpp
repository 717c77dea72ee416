#pragma once

#include <cstdint>
#include <string>
#include <string_view>

namespace sseview::protocol {

/// Server path of the event stream, relative to the base URL.
inline constexpr std::string_view kStreamPath = "/sse";

/// Server path of the side-channel POST endpoint.
inline constexpr std::string_view kBroadcastPath = "/broadcast";

/// Exclusive upper bound of the per-connection client id.
inline constexpr uint32_t kClientIdRange = 1000000;

/// Target of one stream connection attempt.
/// The token travels as a query parameter since the stream request carries no
/// custom auth header. A fresh client_id is drawn for every attempt.
struct StreamEndpoint {
    std::string base_url;
    std::string token;
    uint32_t client_id = 0;

    /// <base>/sse?t=<token>&clientId=<id>; `t` is omitted for an empty token.
    [[nodiscard]] std::string url() const;
};

/// Append a path to a base URL, collapsing a trailing slash on the base.
std::string join_url(std::string_view base_url, std::string_view path);

/// <base>/broadcast
std::string broadcast_url(std::string_view base_url);

/// RFC 3986 percent-encoding for a query value (unreserved characters kept).
std::string percent_encode(std::string_view value);

} // namespace sseview::protocol
