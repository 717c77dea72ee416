#pragma once

#include "sseview/protocol/sse_frame.hpp"

#include <nlohmann/json.hpp>

#include <optional>
#include <string>

namespace sseview::protocol {

/// Event names of records synthesized by the client itself.
inline constexpr const char *kMetaEvent = "__meta";
inline constexpr const char *kSendResultEvent = "manual-send-result";
inline constexpr const char *kSendErrorEvent = "manual-send-error";

/// A received or synthesized event as shown to the user.
/// `data` is the decoded JSON payload, or the raw payload as a JSON string
/// when decoding failed.
struct DisplayRecord {
    std::optional<std::string> id;
    std::optional<std::string> event;
    nlohmann::json data;
    std::optional<std::string> raw;
};

/// Best-effort JSON decoding. Returns std::nullopt for anything that is not a
/// complete JSON document.
std::optional<nlohmann::json> decode_payload(const std::string &payload);

/// Convert a stream frame to a display record. Never throws on bad payloads.
DisplayRecord classify(const EventFrame &frame);

/// Record with an explicit event name and no id/raw text.
DisplayRecord make_record(const std::string &event, nlohmann::json data);

/// Lifecycle note ("connected to ...", "error (attempt N)") under kMetaEvent.
DisplayRecord make_meta_record(const std::string &text);

} // namespace sseview::protocol
