#include "sseview/protocol/sse_frame.hpp"

#include <cstdio>

namespace sseview::protocol {

namespace {

constexpr char kUtf8Bom[] = "\xEF\xBB\xBF";
constexpr size_t kUtf8BomLength = sizeof(kUtf8Bom) - 1;

} // namespace

size_t SseParser::feed(std::string_view chunk, const FrameCallback &on_frame) {
    size_t dispatched = 0;

    for (const char c : chunk) {
        if (skip_bom_byte(c)) {
            continue;
        }

        if (skip_next_lf_) {
            skip_next_lf_ = false;
            if (c == '\n') {
                continue; // second half of \r\n
            }
        }

        if (c == '\r' || c == '\n') {
            skip_next_lf_ = (c == '\r');
            if (discarding_line_) {
                discarding_line_ = false;
            } else if (process_line(partial_line_, on_frame)) {
                ++dispatched;
            }
            partial_line_.clear();
        } else if (!discarding_line_) {
            if (partial_line_.size() >= kMaxLineLength) {
                discarding_line_ = true;
                partial_line_.clear();
                drop_frame();
            } else {
                partial_line_.push_back(c);
            }
        }
    }

    return dispatched;
}

void SseParser::reset() {
    partial_line_.clear();
    skip_next_lf_ = false;
    discarding_line_ = false;
    bom_matched_ = 0;
    bom_done_ = false;
    event_.clear();
    data_.clear();
    has_data_ = false;
    frame_dropped_ = false;
    last_event_id_.reset();
    saw_valid_line_ = false;
}

bool SseParser::skip_bom_byte(char c) {
    if (bom_done_) {
        return false;
    }
    if (c == kUtf8Bom[bom_matched_]) {
        if (++bom_matched_ == kUtf8BomLength) {
            bom_done_ = true;
        }
        return true;
    }
    // Not a BOM after all: the held-back bytes are ordinary line content.
    bom_done_ = true;
    partial_line_.append(kUtf8Bom, bom_matched_);
    return false;
}

bool SseParser::process_line(std::string_view line, const FrameCallback &on_frame) {
    if (line.empty()) {
        if (frame_dropped_) {
            frame_dropped_ = false;
            return false;
        }
        // Blank line terminates the frame; frames without data are discarded.
        if (!has_data_) {
            event_.clear();
            return false;
        }

        EventFrame frame;
        frame.id = last_event_id_;
        if (!event_.empty()) {
            frame.event = event_;
        }
        frame.data = std::move(data_);

        event_.clear();
        data_.clear();
        has_data_ = false;

        if (on_frame) {
            on_frame(std::move(frame));
        }
        return true;
    }

    if (line.front() == ':') {
        saw_valid_line_ = true;
        return false;
    }

    const size_t colon = line.find(':');
    if (colon == std::string_view::npos) {
        process_field(line, {});
        return false;
    }

    std::string_view value = line.substr(colon + 1);
    if (!value.empty() && value.front() == ' ') {
        value.remove_prefix(1);
    }
    process_field(line.substr(0, colon), value);
    return false;
}

void SseParser::process_field(std::string_view field, std::string_view value) {
    if (field == "event" || field == "data" || field == "id" || field == "retry") {
        saw_valid_line_ = true;
    }
    if (frame_dropped_) {
        return;
    }

    if (field == "event") {
        event_.assign(value);
    } else if (field == "data") {
        if (data_.size() + value.size() + 1 > kMaxLineLength) {
            drop_frame();
            return;
        }
        if (has_data_) {
            data_.push_back('\n');
        }
        data_.append(value);
        has_data_ = true;
    } else if (field == "id") {
        if (value.find('\0') != std::string_view::npos) {
            return;
        }
        if (value.empty()) {
            last_event_id_.reset();
        } else {
            last_event_id_ = std::string(value);
        }
    }
    // "retry" and unknown fields are ignored; reconnection timing is client policy.
}

void SseParser::drop_frame() {
    std::fprintf(stderr, "[SseView] Dropping frame longer than %zu bytes\n", kMaxLineLength);
    event_.clear();
    data_.clear();
    has_data_ = false;
    frame_dropped_ = true;
}

} // namespace sseview::protocol
