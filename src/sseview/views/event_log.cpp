#include "sseview/views/event_log.hpp"

namespace sseview::views {

RecordKind record_kind(const protocol::DisplayRecord &record) {
    if (!record.event.has_value()) {
        return RecordKind::Stream;
    }
    const std::string &event = record.event.value();
    if (event == protocol::kMetaEvent) {
        return RecordKind::Meta;
    }
    if (event == protocol::kSendResultEvent) {
        return RecordKind::SendResult;
    }
    if (event == protocol::kSendErrorEvent) {
        return RecordKind::SendError;
    }
    return RecordKind::Stream;
}

std::string record_header(const protocol::DisplayRecord &record) {
    std::string header = record.event.value_or(std::string(protocol::kDefaultEventName));
    if (record.id.has_value() && !record.id->empty()) {
        header += " \xE2\x80\xA2 id:" + record.id.value();
    }
    return header;
}

std::string record_body(const protocol::DisplayRecord &record) {
    if (record.data.is_string()) {
        return record.data.get<std::string>();
    }
    return record.data.dump(2);
}

void EventLogView::render(const data::EventBuffer &records) {
    render_filter_bar();
    ImGui::Separator();

    ImGui::BeginChild("EventLogScroll", ImVec2(0, 0), ImGuiChildFlags_None,
                      ImGuiWindowFlags_HorizontalScrollbar);

    if (records.empty()) {
        ImGui::TextDisabled("No events yet");
        ImGui::EndChild();
        return;
    }

    size_t row = 0;
    for (const auto &record : records) {
        render_record(record, row++);
    }

    ImGui::EndChild();
}

void EventLogView::reset() {
    show_stream_ = true;
    show_meta_ = true;
    show_results_ = true;
    show_errors_ = true;
    text_filter_.Clear();
}

void EventLogView::set_kind_visible(RecordKind kind, bool visible) {
    switch (kind) {
    case RecordKind::Stream:
        show_stream_ = visible;
        break;
    case RecordKind::Meta:
        show_meta_ = visible;
        break;
    case RecordKind::SendResult:
        show_results_ = visible;
        break;
    case RecordKind::SendError:
        show_errors_ = visible;
        break;
    }
}

bool EventLogView::kind_visible(RecordKind kind) const {
    switch (kind) {
    case RecordKind::Stream:
        return show_stream_;
    case RecordKind::Meta:
        return show_meta_;
    case RecordKind::SendResult:
        return show_results_;
    case RecordKind::SendError:
        return show_errors_;
    default:
        return true;
    }
}

void EventLogView::render_filter_bar() {
    ImGui::Checkbox("Stream", &show_stream_);
    ImGui::SameLine();
    ImGui::Checkbox("Meta", &show_meta_);
    ImGui::SameLine();
    ImGui::Checkbox("Results", &show_results_);
    ImGui::SameLine();
    ImGui::Checkbox("Errors", &show_errors_);
    ImGui::SameLine();
    text_filter_.Draw("Filter##events", 220.0f);
}

void EventLogView::render_record(const protocol::DisplayRecord &record, size_t row_index) {
    const std::string header = record_header(record);
    const std::string body = record_body(record);
    if (!passes_filter(record, header, body)) {
        return;
    }

    ImGui::PushID(static_cast<int>(row_index));
    ImGui::TextColored(kind_color(record_kind(record)), "%s", header.c_str());
    ImGui::TextWrapped("%s", body.c_str());

    if (record.raw.has_value() && ImGui::IsItemHovered()) {
        ImGui::BeginTooltip();
        ImGui::TextUnformatted(record.raw->c_str());
        ImGui::EndTooltip();
    }

    if (ImGui::BeginPopupContextItem("record_context")) {
        if (ImGui::MenuItem("Copy data")) {
            ImGui::SetClipboardText(body.c_str());
        }
        if (record.raw.has_value() && ImGui::MenuItem("Copy raw payload")) {
            ImGui::SetClipboardText(record.raw->c_str());
        }
        ImGui::EndPopup();
    }

    ImGui::Separator();
    ImGui::PopID();
}

bool EventLogView::passes_filter(const protocol::DisplayRecord &record, const std::string &header,
                                 const std::string &body) const {
    if (!kind_visible(record_kind(record))) {
        return false;
    }

    if (text_filter_.IsActive()) {
        return text_filter_.PassFilter(header.c_str()) || text_filter_.PassFilter(body.c_str());
    }
    return true;
}

ImVec4 EventLogView::kind_color(RecordKind kind) {
    switch (kind) {
    case RecordKind::Stream:
        return ImVec4(0.35f, 0.85f, 1.0f, 1.0f);
    case RecordKind::SendResult:
        return ImVec4(0.40f, 1.0f, 0.40f, 1.0f);
    case RecordKind::SendError:
        return ImVec4(1.0f, 0.35f, 0.35f, 1.0f);
    case RecordKind::Meta:
    default:
        return ImVec4(0.70f, 0.70f, 0.70f, 1.0f);
    }
}

} // namespace sseview::views
