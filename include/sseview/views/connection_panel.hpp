#pragma once

#include <array>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

namespace sseview::views {

/// Initial contents of the broadcast editor.
inline constexpr std::string_view kDefaultBroadcastPayload = R"({ "msg": "hello from client" })";

/// Editable side-channel payload backed by a fixed ImGui text buffer.
class BroadcastDraft {
  public:
    static constexpr size_t kCapacity = 4096;

    BroadcastDraft() { reset(); }

    /// Restore kDefaultBroadcastPayload.
    void reset() { set_text(kDefaultBroadcastPayload); }

    /// Replace the contents; text longer than kCapacity - 1 is truncated at a
    /// UTF-8 code point boundary.
    void set_text(std::string_view text);

    [[nodiscard]] std::string text() const { return std::string(buffer_.data()); }

    char *data() { return buffer_.data(); }
    [[nodiscard]] size_t capacity() const { return buffer_.size(); }

  private:
    std::array<char, kCapacity> buffer_{};
};

/// What the connection panel shows; filled from the client each frame.
struct ConnectionPanelState {
    std::string stream_url;
    std::string token;
    uint32_t attempts = 0;
    bool auto_connect = true;
};

/// User action emitted by the connection and broadcast panels.
enum class PanelAction {
    Connect,
    Disconnect,
    ToggleAutoConnect,
    Send,
};

/// Status bar: connected/disconnected badge followed by the status text.
void render_status_badge(bool connected, const std::string &status);

/// URL, token, Connect/Disconnect, Auto-connect and the attempt counter.
std::optional<PanelAction> render_connection_panel(ConnectionPanelState &state);

/// Multi-line payload editor with Send and Reset.
std::optional<PanelAction> render_broadcast_panel(BroadcastDraft &draft);

} // namespace sseview::views
