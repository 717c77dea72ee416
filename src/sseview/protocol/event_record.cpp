#include "sseview/protocol/event_record.hpp"

#include <utility>

namespace sseview::protocol {

std::optional<nlohmann::json> decode_payload(const std::string &payload) {
    auto decoded = nlohmann::json::parse(payload, nullptr, false);
    if (decoded.is_discarded()) {
        return std::nullopt;
    }
    return decoded;
}

DisplayRecord classify(const EventFrame &frame) {
    DisplayRecord record;
    record.id = frame.id;
    record.event = frame.event.empty() ? std::string(kDefaultEventName) : frame.event;
    record.raw = frame.data;

    if (auto decoded = decode_payload(frame.data)) {
        record.data = std::move(*decoded);
    } else {
        record.data = frame.data;
    }
    return record;
}

DisplayRecord make_record(const std::string &event, nlohmann::json data) {
    DisplayRecord record;
    record.event = event;
    record.data = std::move(data);
    return record;
}

DisplayRecord make_meta_record(const std::string &text) { return make_record(kMetaEvent, text); }

} // namespace sseview::protocol
