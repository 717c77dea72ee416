#include "sseview/protocol/endpoint.hpp"

#include <cctype>

namespace sseview::protocol {

namespace {

bool is_unreserved(unsigned char c) {
    return std::isalnum(c) != 0 || c == '-' || c == '_' || c == '.' || c == '~';
}

} // namespace

std::string StreamEndpoint::url() const {
    std::string result = join_url(base_url, kStreamPath);
    result += '?';
    if (!token.empty()) {
        result += "t=" + percent_encode(token) + "&";
    }
    result += "clientId=" + std::to_string(client_id);
    return result;
}

std::string join_url(std::string_view base_url, std::string_view path) {
    while (!base_url.empty() && base_url.back() == '/') {
        base_url.remove_suffix(1);
    }
    std::string result(base_url);
    result.append(path);
    return result;
}

std::string broadcast_url(std::string_view base_url) { return join_url(base_url, kBroadcastPath); }

std::string percent_encode(std::string_view value) {
    static constexpr char kHex[] = "0123456789ABCDEF";

    std::string encoded;
    encoded.reserve(value.size());
    for (const char ch : value) {
        const auto c = static_cast<unsigned char>(ch);
        if (is_unreserved(c)) {
            encoded.push_back(ch);
        } else {
            encoded.push_back('%');
            encoded.push_back(kHex[c >> 4]);
            encoded.push_back(kHex[c & 0x0F]);
        }
    }
    return encoded;
}

} // namespace sseview::protocol
