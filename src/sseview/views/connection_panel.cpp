#include "sseview/views/connection_panel.hpp"

#include <imgui.h>

#include <algorithm>
#include <cfloat>
#include <cstring>

namespace sseview::views {

void BroadcastDraft::set_text(std::string_view text) {
    size_t length = std::min(text.size(), buffer_.size() - 1);
    if (length < text.size()) {
        // Back up to the lead byte of a code point cut by the limit.
        while (length > 0 && (static_cast<unsigned char>(text[length]) & 0xC0) == 0x80) {
            --length;
        }
    }
    std::memcpy(buffer_.data(), text.data(), length);
    buffer_[length] = '\0';
}

void render_status_badge(bool connected, const std::string &status) {
    const ImVec4 color =
        connected ? ImVec4(0.0f, 0.8f, 0.0f, 1.0f) : ImVec4(0.6f, 0.6f, 0.6f, 1.0f);
    ImGui::TextColored(color, "%s", connected ? "connected" : "disconnected");
    ImGui::SameLine();
    ImGui::TextDisabled("|");
    ImGui::SameLine();
    ImGui::TextUnformatted(status.c_str());
}

std::optional<PanelAction> render_connection_panel(ConnectionPanelState &state) {
    std::optional<PanelAction> action;

    ImGui::TextDisabled("SSE URL");
    ImGui::TextUnformatted(state.stream_url.c_str());
    ImGui::TextDisabled("Token (query)");
    ImGui::TextUnformatted(state.token.empty() ? "-" : state.token.c_str());
    ImGui::Separator();

    if (ImGui::Button("Connect")) {
        action = PanelAction::Connect;
    }
    ImGui::SameLine();
    if (ImGui::Button("Disconnect")) {
        action = PanelAction::Disconnect;
    }
    ImGui::SameLine();
    if (ImGui::Checkbox("Auto-connect", &state.auto_connect)) {
        action = PanelAction::ToggleAutoConnect;
    }

    ImGui::TextDisabled("Reconnect attempts: %u", state.attempts);
    return action;
}

std::optional<PanelAction> render_broadcast_panel(BroadcastDraft &draft) {
    std::optional<PanelAction> action;

    ImGui::TextDisabled("Manual broadcast payload");
    ImGui::InputTextMultiline("##payload", draft.data(), draft.capacity(),
                              ImVec2(-FLT_MIN, ImGui::GetTextLineHeight() * 6));

    if (ImGui::Button("Send")) {
        action = PanelAction::Send;
    }
    ImGui::SameLine();
    if (ImGui::Button("Reset")) {
        draft.reset();
    }
    return action;
}

} // namespace sseview::views
