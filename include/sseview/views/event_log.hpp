#pragma once

#include "sseview/data/event_buffer.hpp"

#include <imgui.h>

#include <cstddef>
#include <string>

namespace sseview::views {

/// Kinds of records for filtering and coloring.
enum class RecordKind {
    Stream,
    Meta,
    SendResult,
    SendError,
};

RecordKind record_kind(const protocol::DisplayRecord &record);

/// "<event> • id:<id>", falling back to "message" for unnamed records.
std::string record_header(const protocol::DisplayRecord &record);

/// Strings verbatim, anything else as 2-space indented JSON.
std::string record_body(const protocol::DisplayRecord &record);

/// Renders the event buffer newest first, with kind toggles and a text filter.
class EventLogView {
  public:
    void render(const data::EventBuffer &records);
    void reset();

    // Exposed for testing the filter logic without an ImGui context.
    void set_kind_visible(RecordKind kind, bool visible);
    [[nodiscard]] bool kind_visible(RecordKind kind) const;

  private:
    void render_filter_bar();
    void render_record(const protocol::DisplayRecord &record, size_t row_index);
    [[nodiscard]] bool passes_filter(const protocol::DisplayRecord &record,
                                     const std::string &header, const std::string &body) const;
    static ImVec4 kind_color(RecordKind kind);

    bool show_stream_ = true;
    bool show_meta_ = true;
    bool show_results_ = true;
    bool show_errors_ = true;
    ImGuiTextFilter text_filter_;
};

} // namespace sseview::views
