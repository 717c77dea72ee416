#pragma once

#include <cstddef>
#include <functional>
#include <optional>
#include <string>
#include <string_view>

namespace sseview::protocol {

/// Event name used when the server omits the `event:` field.
inline constexpr std::string_view kDefaultEventName = "message";

/// One dispatched unit of a text/event-stream body.
struct EventFrame {
    std::optional<std::string> id; // last-event-id at dispatch time
    std::string event{kDefaultEventName};
    std::string data;
};

/// Incremental text/event-stream parser.
/// Accepts arbitrary chunk boundaries and \n, \r\n or \r line endings.
/// Comment lines (": ...") and the retry field are consumed silently.
/// A leading UTF-8 BOM is skipped. A line longer than kMaxLineLength, or a
/// frame whose data grows past it, is dropped without being dispatched.
/// Thread safety: single owner (the stream worker thread).
class SseParser {
  public:
    using FrameCallback = std::function<void(EventFrame &&)>;

    static constexpr size_t kMaxLineLength = 1024 * 1024;

    /// Feed raw body bytes. Calls on_frame for every frame completed by this chunk.
    /// Returns the number of frames dispatched.
    size_t feed(std::string_view chunk, const FrameCallback &on_frame);

    /// Drop partial lines, the pending frame and the last-event-id.
    void reset();

    /// The id carried by the next dispatched frame, if any.
    [[nodiscard]] const std::optional<std::string> &last_event_id() const { return last_event_id_; }

    /// True once a complete comment or data/event/id/retry line was read.
    /// An HTML or JSON error body never sets it.
    [[nodiscard]] bool saw_valid_line() const { return saw_valid_line_; }

  private:
    bool skip_bom_byte(char c);
    bool process_line(std::string_view line, const FrameCallback &on_frame);
    void process_field(std::string_view field, std::string_view value);
    void drop_frame();

    std::string partial_line_;
    bool skip_next_lf_ = false;
    bool discarding_line_ = false;
    size_t bom_matched_ = 0;
    bool bom_done_ = false;

    std::string event_;
    std::string data_;
    bool has_data_ = false;
    bool frame_dropped_ = false; // ignore fields until the blank line
    std::optional<std::string> last_event_id_;
    bool saw_valid_line_ = false;
};

} // namespace sseview::protocol
